#include "combinadic/common/yaml/yaml_io.h"

#include <cstdint>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "combinadic/common/name_value.h"
#include "combinadic/common/temp_directory.h"
#include "combinadic/common/test_utilities/expect_throws_message.h"

namespace combinadic {
namespace yaml {
namespace {

struct Label {
  template <typename Archive>
  void Serialize(Archive* a) {
    a->Visit(COMBINADIC_NVP(text));
  }

  std::string text;
};

struct Shape {
  template <typename Archive>
  void Serialize(Archive* a) {
    a->Visit(COMBINADIC_NVP(num_items));
    a->Visit(COMBINADIC_NVP(group_size));
    a->Visit(COMBINADIC_NVP(first_rank));
    a->Visit(COMBINADIC_NVP(wide));
    a->Visit(COMBINADIC_NVP(values));
    a->Visit(COMBINADIC_NVP(width));
    a->Visit(COMBINADIC_NVP(label));
    a->Visit(COMBINADIC_NVP(tags));
  }

  int num_items{13};
  int group_size{5};
  int64_t first_rank{0};
  bool wide{false};
  std::vector<int> values;
  std::optional<int> width;
  Label label;
  std::vector<Label> tags;
};

constexpr char kFullShape[] = R"""(
num_items: 66
group_size: 33
first_rank: 7219428434016265739
wide: true
values: [65, 64, 63]
width: 2
label:
  text: widest
tags:
  - text: a
  - text: b
)""";

GTEST_TEST(YamlIoTest, LoadString) {
  const Shape dut = LoadYamlString<Shape>(kFullShape);
  EXPECT_EQ(dut.num_items, 66);
  EXPECT_EQ(dut.group_size, 33);
  EXPECT_EQ(dut.first_rank, 7219428434016265739);
  EXPECT_TRUE(dut.wide);
  EXPECT_EQ(dut.values, std::vector<int>({65, 64, 63}));
  EXPECT_EQ(dut.width, 2);
  EXPECT_EQ(dut.label.text, "widest");
  ASSERT_EQ(dut.tags.size(), 2u);
  EXPECT_EQ(dut.tags[1].text, "b");
}

GTEST_TEST(YamlIoTest, LoadChild) {
  const Shape dut = LoadYamlString<Shape>(
      "shape: {num_items: 7, group_size: 3}\nother: 1\n", "shape",
      Shape{});
  EXPECT_EQ(dut.num_items, 7);
  EXPECT_EQ(dut.group_size, 3);

  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("shape: {}\n", "nope", Shape{}),
      "When loading YAML, there was no such top-level map entry 'nope'");
}

// With defaults, absent keys keep their values.
GTEST_TEST(YamlIoTest, Defaults) {
  Shape defaults;
  defaults.width = 4;
  defaults.values = {1, 0};
  const Shape dut = LoadYamlString<Shape>("group_size: 2\n", std::nullopt,
                                          defaults);
  EXPECT_EQ(dut.num_items, 13);
  EXPECT_EQ(dut.group_size, 2);
  EXPECT_EQ(dut.width, 4);
  EXPECT_EQ(dut.values, std::vector<int>({1, 0}));

  // An explicit null clears an optional.
  const Shape cleared = LoadYamlString<Shape>("width: null\n", std::nullopt,
                                              defaults);
  EXPECT_FALSE(cleared.width.has_value());

  // An empty document keeps every default.
  EXPECT_EQ(LoadYamlString<Shape>("", std::nullopt, defaults).width, 4);
}

GTEST_TEST(YamlIoTest, MissingKey) {
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("num_items: 3\n"),
      "<string>:.* YAML node of type Mapping \\(with size 1 and keys "
      "\\{num_items\\}\\) is missing entry for group_size.");
}

GTEST_TEST(YamlIoTest, ExtraKey) {
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("num_items: 3\nbogus: 1\n", std::nullopt,
                            Shape{}),
      ".*key 'bogus' did not match any visited value.*");
}

GTEST_TEST(YamlIoTest, WrongTypes) {
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("num_items: [1, 2]\n", std::nullopt, Shape{}),
      ".*has non-Scalar \\(Sequence\\) entry for num_items.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("num_items: many\n", std::nullopt, Shape{}),
      ".*could not parse int value entry for num_items.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("label: {text: [x]}\n", std::nullopt, Shape{}),
      ".*has non-Scalar \\(Sequence\\) entry for text while accepting .* "
      "while visiting label.");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("[1, 2]\n", std::nullopt, Shape{}),
      "<string>: YAML root node of type Sequence cannot be accepted as a "
      "mapping");
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlString<Shape>("num_items: [1, 2\n", std::nullopt, Shape{}),
      "<string>: YAML syntax error: .*");
}

GTEST_TEST(YamlIoTest, LoadFile) {
  const std::string filename = temp_directory() + "/shape.yaml";
  {
    std::ofstream out(filename);
    out << kFullShape;
  }
  const Shape dut = LoadYamlFile<Shape>(filename);
  EXPECT_EQ(dut.num_items, 66);
  EXPECT_EQ(dut.tags[0].text, "a");

  {
    std::ofstream out(filename);
    out << "num_items: 3\n";
  }
  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlFile<Shape>(filename),
      ".*/shape.yaml:.* is missing entry for group_size.");

  COMBINADIC_EXPECT_THROWS_MESSAGE(
      LoadYamlFile<Shape>("/no/such/shape.yaml"),
      "When loading YAML, could not open '/no/such/shape.yaml'");
}

}  // namespace
}  // namespace yaml
}  // namespace combinadic
