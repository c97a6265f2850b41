#include "combinadic/common/temp_directory.h"

#include <unistd.h>

#include <cstdlib>
#include <filesystem>

#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/combinadic_throw.h"

namespace combinadic {

std::string temp_directory() {
  const char* tmpdir = nullptr;
  (tmpdir = std::getenv("TEST_TMPDIR")) || (tmpdir = std::getenv("TMPDIR")) ||
      (tmpdir = "/tmp");

  std::filesystem::path path_template(tmpdir);
  path_template.append("combinadic_XXXXXX");

  std::string path_template_str = path_template.string();
  const char* dtemp = ::mkdtemp(&path_template_str[0]);
  COMBINADIC_THROW_UNLESS(dtemp != nullptr);

  const std::filesystem::path path(dtemp);
  COMBINADIC_THROW_UNLESS(std::filesystem::is_directory(path));
  std::string path_string = path.string();
  COMBINADIC_DEMAND(path_string.back() != '/');

  return path_string;
}

}  // namespace combinadic
