#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include "combinadic/common/combinadic_assert.h"
#include "combinadic/common/combinadic_copyable.h"
#include "combinadic/common/combinadic_throw.h"
#include "combinadic/common/name_value.h"

namespace combinadic {
namespace yaml {

/// (Advanced) A helper class for loading YAML data into a C++ structure that
/// implements the Serialize / Archive pattern (see name_value.h). Most users
/// should call LoadYamlFile or LoadYamlString (see yaml_io.h) instead.
///
/// Supported field types are `bool`, `int`, `int64_t`, `std::string`,
/// `std::vector<T>`, `std::optional<T>`, and nested Serializable structs.
/// Any schema mismatch throws std::exception with a message that names the
/// offending key and its enclosing YAML mapping.
class YamlReadArchive final {
 public:
  COMBINADIC_NO_COPY_NO_MOVE_NO_ASSIGN(YamlReadArchive)

  /// Configuration for YamlReadArchive to govern when certain conditions are
  /// errors or not.
  struct Options {
    /// Allows yaml Maps to have extra key-value pairs that are not Visited by
    /// the Serializable being parsed into.
    bool allow_yaml_with_no_cpp{false};

    /// Allows Serializables to provide more key-value pairs than are present
    /// in the YAML data, leaving the default values intact.
    bool allow_cpp_with_no_yaml{false};
  };

  /// Creates an archive that reads from @p root. The optional @p filename is
  /// only used to decorate error messages.
  YamlReadArchive(YAML::Node root, const Options& options,
                  std::optional<std::string> filename = std::nullopt);

  /// Parses @p filename and returns its root node, or the given-named child
  /// of its root node.
  static YAML::Node LoadFileAsNode(const std::string& filename,
                                   const std::optional<std::string>& child_name);

  /// Parses @p data and returns its root node, or the given-named child of
  /// its root node.
  static YAML::Node LoadStringAsNode(
      const std::string& data, const std::optional<std::string>& child_name);

  /// Sets the contents `serializable` based on the YAML data associated with
  /// this archive.
  template <typename Serializable>
  void Accept(Serializable* serializable) {
    COMBINADIC_THROW_UNLESS(serializable != nullptr);
    CheckRootIsMapping();
    serializable->Serialize(this);
    CheckAllAccepted();
  }

  /// Sets the value pointed to by `nvp.value()` based on the YAML data
  /// associated with this archive.  Most users should call Accept, not Visit.
  template <typename NameValuePair>
  void Visit(const NameValuePair& nvp) {
    debug_visit_name_ = nvp.name();
    visited_names_.insert(nvp.name());
    // Use int32_t for the final argument to prefer the specialized overload.
    this->DoVisit(nvp, *nvp.value(), static_cast<int32_t>(0));
    debug_visit_name_ = nullptr;
  }

 private:
  // Internal-use constructor during recursion.  The parent must outlive this
  // object.
  YamlReadArchive(YAML::Node root, const YamlReadArchive* parent)
      : root_(std::move(root)),
        options_(parent->options_),
        parent_(parent) {
    COMBINADIC_DEMAND(parent != nullptr);
  }

  // This version applies when the type has a Serialize member function.
  template <typename NVP, typename T>
  auto DoVisit(const NVP& nvp, const T&, int32_t)
      -> decltype(nvp.value()->Serialize(
          static_cast<YamlReadArchive*>(nullptr))) {
    this->VisitSerializable(nvp);
  }

  template <typename NVP, typename T>
  void DoVisit(const NVP& nvp, const std::vector<T>&, int32_t) {
    this->VisitVector(nvp);
  }

  template <typename NVP, typename T>
  void DoVisit(const NVP& nvp, const std::optional<T>&, int32_t) {
    this->VisitOptional(nvp);
  }

  // For everything else, parse a scalar.
  template <typename NVP, typename T>
  void DoVisit(const NVP& nvp, const T&, int64_t) {
    this->VisitScalar(nvp);
  }

  template <typename NVP>
  void VisitSerializable(const NVP& nvp) {
    const std::optional<YAML::Node> sub_node =
        GetSubNode(nvp.name(), YAML::NodeType::Map);
    if (!sub_node.has_value()) { return; }
    YamlReadArchive sub_archive(*sub_node, this);
    sub_archive.Accept(nvp.value());
  }

  template <typename NVP>
  void VisitScalar(const NVP& nvp) {
    const std::optional<YAML::Node> sub_node =
        GetSubNode(nvp.name(), YAML::NodeType::Scalar);
    if (!sub_node.has_value()) { return; }
    ParseScalar(*sub_node, nvp.value());
  }

  template <typename NVP>
  void VisitOptional(const NVP& nvp) {
    const YAML::Node& root = root_;
    const YAML::Node sub_node = root[nvp.name()];
    if (!sub_node) {
      if (!options_.allow_cpp_with_no_yaml) {
        *nvp.value() = std::nullopt;
      }
      return;
    }
    if (sub_node.IsNull()) {
      *nvp.value() = std::nullopt;
      return;
    }
    using T = typename NVP::value_type::value_type;
    std::optional<T>& storage = *nvp.value();
    if (!storage) { storage = T{}; }
    const auto inner = MakeNameValue(nvp.name(), &storage.value());
    this->DoVisit(inner, storage.value(), static_cast<int32_t>(0));
  }

  template <typename NVP>
  void VisitVector(const NVP& nvp) {
    const std::optional<YAML::Node> sub_node =
        GetSubNode(nvp.name(), YAML::NodeType::Sequence);
    if (!sub_node.has_value()) { return; }
    auto&& storage = *nvp.value();
    storage.clear();
    storage.resize(sub_node->size());
    for (size_t i = 0; i < storage.size(); ++i) {
      const std::string key = fmt::format("{}[{}]", nvp.name(), i);
      // Each element is visited as the sole entry of a one-item mapping.
      YAML::Node item(YAML::NodeType::Map);
      item[key] = (*sub_node)[i];
      YamlReadArchive item_archive(item, this);
      item_archive.Visit(MakeNameValue(key.c_str(), &storage[i]));
    }
  }

  void ParseScalar(const YAML::Node& scalar, bool* result);
  void ParseScalar(const YAML::Node& scalar, int32_t* result);
  void ParseScalar(const YAML::Node& scalar, int64_t* result);
  void ParseScalar(const YAML::Node& scalar, std::string* result);

  template <typename T>
  void ParseScalarImpl(const YAML::Node& scalar, const char* type_name,
                       T* result);

  // Returns the child of root_ named `name`, after checking its type. When
  // the child is missing or has the wrong type, reports an error (or, for a
  // missing child with allow_cpp_with_no_yaml, returns nullopt quietly).
  std::optional<YAML::Node> GetSubNode(const char* name,
                                       YAML::NodeType::value expected) const;

  void CheckRootIsMapping() const;
  void CheckAllAccepted() const;
  [[noreturn]] void ReportError(const std::string& note) const;
  void PrintNodeSummary(std::ostream& s) const;

  YAML::Node root_;
  const Options options_;
  const std::optional<std::string> filename_;
  const YamlReadArchive* const parent_{};

  // The name of the field currently being visited, for error messages.
  const char* debug_visit_name_{};
  std::set<std::string> visited_names_;
};

}  // namespace yaml
}  // namespace combinadic
