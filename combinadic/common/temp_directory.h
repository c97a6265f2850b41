#pragma once

#include <string>

namespace combinadic {

/// Returns a directory location suitable for temporary files, such as the
/// listings written by tests of WriteCombinationsToFile().
/// The directory will be called ${parent}/combinadic_XXXXXX where each X is
/// replaced by a character from the portable filename character set.
/// The path ${parent} is defined as one of the following (in decreasing
/// priority):
///
///    - ${TEST_TMPDIR}
///    - ${TMPDIR}
///    - /tmp
///
/// If successful, this will always create a new directory. The caller may
/// delete it when done.
///
/// @return The path representing a newly created directory. There will be no
///         trailing `/`.
/// @throws std::exception if the directory cannot be created, or is not a
///         directory.
std::string temp_directory();

}  // namespace combinadic
