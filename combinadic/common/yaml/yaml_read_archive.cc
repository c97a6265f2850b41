#include "combinadic/common/yaml/yaml_read_archive.h"

#include <sstream>
#include <stdexcept>

#include <fmt/ostream.h>
#include <fmt/ranges.h>

namespace combinadic {
namespace yaml {
namespace {

const char* GetTypeString(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined: return "Undefined";
    case YAML::NodeType::Null: return "Null";
    case YAML::NodeType::Scalar: return "Scalar";
    case YAML::NodeType::Sequence: return "Sequence";
    case YAML::NodeType::Map: return "Mapping";
  }
  COMBINADIC_UNREACHABLE();
}

const char* GetTypeString(YAML::NodeType::value type) {
  switch (type) {
    case YAML::NodeType::Undefined: return "Undefined";
    case YAML::NodeType::Null: return "Null";
    case YAML::NodeType::Scalar: return "Scalar";
    case YAML::NodeType::Sequence: return "Sequence";
    case YAML::NodeType::Map: return "Mapping";
  }
  COMBINADIC_UNREACHABLE();
}

YAML::Node SelectChild(const YAML::Node& root,
                       const std::optional<std::string>& child_name) {
  if (!child_name.has_value()) {
    return root;
  }
  const YAML::Node child_node = root[*child_name];
  if (!child_node) {
    throw std::runtime_error(fmt::format(
        "When loading YAML, there was no such top-level map entry '{}'",
        *child_name));
  }
  return child_node;
}

}  // namespace

YamlReadArchive::YamlReadArchive(YAML::Node root, const Options& options,
                                 std::optional<std::string> filename)
    : root_(std::move(root)),
      options_(options),
      filename_(std::move(filename)) {}

YAML::Node YamlReadArchive::LoadFileAsNode(
    const std::string& filename, const std::optional<std::string>& child_name) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(filename);
  } catch (const YAML::BadFile&) {
    throw std::runtime_error(
        fmt::format("When loading YAML, could not open '{}'", filename));
  } catch (const YAML::ParserException& e) {
    throw std::runtime_error(
        fmt::format("{}: YAML syntax error: {}", filename, e.what()));
  }
  return SelectChild(root, child_name);
}

YAML::Node YamlReadArchive::LoadStringAsNode(
    const std::string& data, const std::optional<std::string>& child_name) {
  YAML::Node root;
  try {
    root = YAML::Load(data);
  } catch (const YAML::ParserException& e) {
    throw std::runtime_error(
        fmt::format("<string>: YAML syntax error: {}", e.what()));
  }
  return SelectChild(root, child_name);
}

template <typename T>
void YamlReadArchive::ParseScalarImpl(const YAML::Node& scalar,
                                      const char* type_name, T* result) {
  COMBINADIC_DEMAND(result != nullptr);
  if constexpr (std::is_same_v<T, std::string>) {
    *result = scalar.Scalar();
  } else {
    // For the decode-able types, see yaml-cpp/node/convert.h.
    if (!YAML::convert<T>::decode(scalar, *result)) {
      ReportError(fmt::format("could not parse {} value", type_name));
    }
  }
}

void YamlReadArchive::ParseScalar(const YAML::Node& scalar, bool* result) {
  ParseScalarImpl<bool>(scalar, "bool", result);
}

void YamlReadArchive::ParseScalar(const YAML::Node& scalar, int32_t* result) {
  ParseScalarImpl<int32_t>(scalar, "int", result);
}

void YamlReadArchive::ParseScalar(const YAML::Node& scalar, int64_t* result) {
  ParseScalarImpl<int64_t>(scalar, "int64_t", result);
}

void YamlReadArchive::ParseScalar(const YAML::Node& scalar,
                                  std::string* result) {
  ParseScalarImpl<std::string>(scalar, "std::string", result);
}

std::optional<YAML::Node> YamlReadArchive::GetSubNode(
    const char* name, YAML::NodeType::value expected) const {
  const YAML::Node& root = root_;
  const YAML::Node result = root[name];
  if (!result) {
    if (!options_.allow_cpp_with_no_yaml) {
      ReportError("is missing");
    }
    return std::nullopt;
  }
  if (result.Type() != expected) {
    ReportError(fmt::format("has non-{} ({})", GetTypeString(expected),
                            GetTypeString(result)));
  }
  return result;
}

void YamlReadArchive::CheckRootIsMapping() const {
  // An empty document is accepted as an empty mapping only when every field
  // may keep its default value.
  if (root_.IsNull() && options_.allow_cpp_with_no_yaml) {
    return;
  }
  if (!root_.IsMap()) {
    throw std::runtime_error(fmt::format(
        "{}: YAML root node of type {} cannot be accepted as a mapping",
        filename_.value_or("<string>"), GetTypeString(root_)));
  }
}

void YamlReadArchive::CheckAllAccepted() const {
  if (options_.allow_yaml_with_no_cpp || !root_.IsMap()) {
    return;
  }
  for (const auto& key_value : root_) {
    const std::string key = key_value.first.as<std::string>();
    if (!visited_names_.contains(key)) {
      ReportError(fmt::format("key '{}' did not match any visited value", key));
    }
  }
}

void YamlReadArchive::ReportError(const std::string& note) const {
  std::ostringstream e;  // A buffer for the error message text.
  // Output the filename, if any archive in the chain knows it.
  const YamlReadArchive* top = this;
  while (top->parent_ != nullptr) {
    top = top->parent_;
  }
  fmt::print(e, "{}:", top->filename_.value_or("<string>"));
  // Output the nearby line and column number (1-based).
  if (root_.Mark().line >= 0 && root_.Mark().column >= 0) {
    fmt::print(e, "{}:{}:", root_.Mark().line + 1, root_.Mark().column + 1);
  }
  e << " ";
  this->PrintNodeSummary(e);
  fmt::print(e, " {} entry for {}", note,
             debug_visit_name_ != nullptr ? debug_visit_name_ : "<root>");
  // Describe its parents.
  for (auto* archive = parent_; archive; archive = archive->parent_) {
    fmt::print(e, " while accepting ");
    archive->PrintNodeSummary(e);
    if (archive->debug_visit_name_ != nullptr) {
      fmt::print(e, " while visiting {}", archive->debug_visit_name_);
    }
  }
  fmt::print(e, ".");
  throw std::runtime_error(e.str());
}

void YamlReadArchive::PrintNodeSummary(std::ostream& s) const {
  fmt::print(s, "YAML node of type {}", GetTypeString(root_));
  if (!root_.IsMap()) {
    return;
  }
  std::set<std::string> keys;
  for (const auto& key_value : root_) {
    keys.insert(key_value.first.as<std::string>());
  }
  fmt::print(s, " (with size {} and keys {{{}}})", keys.size(),
             fmt::join(keys, ", "));
}

}  // namespace yaml
}  // namespace combinadic
