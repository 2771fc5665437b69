#include "config.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>

using Kugiri::ParagraphMode;
using Kugiri::SegmenterConfig;
using nlohmann::json;

namespace {

bool contains(const std::vector<std::string> &list, const std::string &item) {
  return std::find(list.begin(), list.end(), item) != list.end();
}

std::string writeTempFile(const std::string &name, const std::string &content) {
  std::string path = ::testing::TempDir() + name;
  std::ofstream out(path);
  out << content;
  return path;
}

} // namespace

TEST(ConfigTest, EmptyObjectKeepsDefaults) {
  SegmenterConfig config = Kugiri::config::fromJson(json::object());
  SegmenterConfig defaults;
  EXPECT_EQ(config.paragraphMode, ParagraphMode::LineBreak);
  EXPECT_EQ(config.abbreviations, defaults.abbreviations);
  EXPECT_EQ(config.quotePairs.size(), defaults.quotePairs.size());
  EXPECT_TRUE(config.singleLetterInitials);
  EXPECT_TRUE(config.fullWidthTerminators);
  EXPECT_EQ(config.maxLookback, 16u);
}

TEST(ConfigTest, ReadsEveryKey) {
  json opts = {{"paragraphMode", "blankLine"},
               {"extraAbbreviations", {"Gen", "Col"}},
               {"quotePairs", json::array({json::array({"‹", "›"})})},
               {"singleLetterInitials", false},
               {"fullWidthTerminators", false},
               {"maxLookback", 8}};
  SegmenterConfig config = Kugiri::config::fromJson(opts);

  EXPECT_EQ(config.paragraphMode, ParagraphMode::BlankLine);
  EXPECT_TRUE(contains(config.abbreviations, "Gen"));
  EXPECT_TRUE(contains(config.abbreviations, "Col"));
  EXPECT_TRUE(contains(config.abbreviations, "Dr"));
  ASSERT_EQ(config.quotePairs.size(), 1u);
  EXPECT_EQ(config.quotePairs[0].open, static_cast<char32_t>(0x2039));
  EXPECT_EQ(config.quotePairs[0].close, static_cast<char32_t>(0x203A));
  EXPECT_FALSE(config.singleLetterInitials);
  EXPECT_FALSE(config.fullWidthTerminators);
  EXPECT_EQ(config.maxLookback, 8u);
}

TEST(ConfigTest, AbbreviationsReplaceDefaults) {
  SegmenterConfig config =
      Kugiri::config::fromJson({{"abbreviations", {"Approx", 42}}});
  EXPECT_EQ(config.abbreviations, (std::vector<std::string>{"Approx"}));
}

TEST(ConfigTest, WrongTypesAreIgnored) {
  json opts = {{"paragraphMode", 3},
               {"abbreviations", "Dr"},
               {"quotePairs", json::array({json::array({"ab", "c"}),
                                           json::array({"(", ")"}), "x"})},
               {"singleLetterInitials", "yes"},
               {"maxLookback", -1},
               {"unknownKey", true}};
  SegmenterConfig config = Kugiri::config::fromJson(opts);
  SegmenterConfig defaults;

  EXPECT_EQ(config.paragraphMode, ParagraphMode::LineBreak);
  EXPECT_EQ(config.abbreviations, defaults.abbreviations);
  // 不正な組は捨て、正しい組だけ残す
  ASSERT_EQ(config.quotePairs.size(), 1u);
  EXPECT_EQ(config.quotePairs[0].open, static_cast<char32_t>('('));
  EXPECT_TRUE(config.singleLetterInitials);
  EXPECT_EQ(config.maxLookback, 16u);
}

TEST(ConfigTest, UnknownParagraphModeIsIgnored) {
  SegmenterConfig config;
  config.paragraphMode = ParagraphMode::BlankLine;
  Kugiri::config::applyOptions({{"paragraphMode", "sentence"}}, config);
  EXPECT_EQ(config.paragraphMode, ParagraphMode::BlankLine);
}

TEST(ConfigTest, NonObjectIsIgnored) {
  SegmenterConfig config;
  Kugiri::config::applyOptions(json::array({1, 2}), config);
  EXPECT_EQ(config.maxLookback, 16u);
}

TEST(ConfigTest, ParagraphModeNames) {
  ParagraphMode mode = ParagraphMode::LineBreak;
  EXPECT_TRUE(Kugiri::config::parseParagraphMode("blankLine", mode));
  EXPECT_EQ(mode, ParagraphMode::BlankLine);
  EXPECT_FALSE(Kugiri::config::parseParagraphMode("BlankLine", mode));
  EXPECT_EQ(mode, ParagraphMode::BlankLine);
  EXPECT_STREQ(Kugiri::config::paragraphModeName(ParagraphMode::LineBreak),
               "lineBreak");
}

TEST(ConfigTest, ToJsonCanBeReadBack) {
  SegmenterConfig config;
  config.paragraphMode = ParagraphMode::BlankLine;
  config.abbreviations = {"Gen"};
  config.quotePairs = {{0x300C, 0x300D}};
  config.maxLookback = 4;

  json dumped = Kugiri::config::toJson(config);
  EXPECT_EQ(dumped["paragraphMode"], "blankLine");
  EXPECT_EQ(dumped["quotePairs"][0][0], "「");

  SegmenterConfig restored = Kugiri::config::fromJson(dumped);
  EXPECT_EQ(restored.paragraphMode, ParagraphMode::BlankLine);
  EXPECT_EQ(restored.abbreviations, config.abbreviations);
  ASSERT_EQ(restored.quotePairs.size(), 1u);
  EXPECT_EQ(restored.quotePairs[0].close, static_cast<char32_t>(0x300D));
  EXPECT_EQ(restored.maxLookback, 4u);
}

TEST(ConfigTest, LoadConfigFile) {
  std::string path = writeTempFile(
      "kugiri_config_test.json",
      R"({"paragraphMode": "blankLine", "extraAbbreviations": ["Gen"]})");
  SegmenterConfig config = Kugiri::config::loadConfigFile(path);
  EXPECT_EQ(config.paragraphMode, ParagraphMode::BlankLine);
  EXPECT_TRUE(contains(config.abbreviations, "Gen"));
  std::remove(path.c_str());
}

TEST(ConfigTest, LoadConfigFileErrors) {
  EXPECT_THROW(Kugiri::config::loadConfigFile("/nonexistent/kugiri.json"),
               std::runtime_error);

  std::string path =
      writeTempFile("kugiri_config_broken.json", "{\"paragraphMode\": ");
  EXPECT_THROW(Kugiri::config::loadConfigFile(path), json::parse_error);
  std::remove(path.c_str());
}
