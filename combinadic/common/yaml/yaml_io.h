#pragma once

#include <optional>
#include <string>

#include "combinadic/common/yaml/yaml_read_archive.h"

namespace combinadic {
namespace yaml {
namespace internal {

template <typename Serializable>
Serializable LoadNode(YAML::Node node,
                      const std::optional<Serializable>& defaults,
                      std::optional<std::string> filename) {
  YamlReadArchive::Options options;
  // When defaults are given, fields absent from the YAML keep their values.
  options.allow_cpp_with_no_yaml = defaults.has_value();
  Serializable result = defaults.value_or(Serializable{});
  YamlReadArchive archive(std::move(node), options, std::move(filename));
  archive.Accept(&result);
  return result;
}

}  // namespace internal

/** Loads data from a YAML-formatted file.

@param filename Filename to be read from.
@param child_name (optional) If provided, loads data from given-named child of
  the document's root instead of the root itself.
@param defaults (optional) If provided, then the structure being read into
  will be initialized using this value instead of the default constructor,
  and any member fields that are not mentioned in the YAML will retain their
  default values.

@returns the loaded user data.
@throws std::exception if the file cannot be read or does not match the
  schema described by `Serializable::Serialize`.

@tparam Serializable must implement a Serialize function and be default
  constructible. */
template <typename Serializable>
Serializable LoadYamlFile(
    const std::string& filename,
    const std::optional<std::string>& child_name = std::nullopt,
    const std::optional<Serializable>& defaults = std::nullopt) {
  return internal::LoadNode<Serializable>(
      YamlReadArchive::LoadFileAsNode(filename, child_name), defaults,
      filename);
}

/** Loads data from a YAML-formatted string. The parameters have the same
meaning as for LoadYamlFile. */
template <typename Serializable>
Serializable LoadYamlString(
    const std::string& data,
    const std::optional<std::string>& child_name = std::nullopt,
    const std::optional<Serializable>& defaults = std::nullopt) {
  return internal::LoadNode<Serializable>(
      YamlReadArchive::LoadStringAsNode(data, child_name), defaults,
      std::nullopt);
}

}  // namespace yaml
}  // namespace combinadic
