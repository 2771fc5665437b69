#include "config.hpp"
#include "text_processor.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>

using nlohmann::json;

namespace Kugiri {
namespace config {

namespace {

bool isDebugEnabled() {
  static const bool debug = (std::getenv("KUGIRI_DEBUG") != nullptr);
  return debug;
}

void ignored(const char *key) {
  if (isDebugEnabled()) {
    std::cerr << "[DEBUG] Ignoring config key with unexpected value: " << key
              << std::endl;
  }
}

std::vector<std::string> readStringArray(const json &value, const char *key) {
  std::vector<std::string> result;
  for (const auto &item : value) {
    if (item.is_string()) {
      result.push_back(item.get<std::string>());
    } else {
      ignored(key);
    }
  }
  return result;
}

// 引用符は1文字 (1コードポイント) の文字列として指定する
bool readQuoteMark(const json &value, char32_t &mark) {
  if (!value.is_string())
    return false;
  std::u32string cps =
      text::TextProcessor::toCodePoints(value.get<std::string>());
  if (cps.size() != 1)
    return false;
  mark = cps[0];
  return true;
}

} // namespace

void applyOptions(const json &opts, SegmenterConfig &config) {
  if (!opts.is_object())
    return;

  if (opts.contains("paragraphMode")) {
    ParagraphMode mode = config.paragraphMode;
    if (opts["paragraphMode"].is_string() &&
        parseParagraphMode(opts["paragraphMode"].get<std::string>(), mode)) {
      config.paragraphMode = mode;
    } else {
      ignored("paragraphMode");
    }
  }

  if (opts.contains("abbreviations")) {
    if (opts["abbreviations"].is_array()) {
      config.abbreviations =
          readStringArray(opts["abbreviations"], "abbreviations");
    } else {
      ignored("abbreviations");
    }
  }

  if (opts.contains("extraAbbreviations")) {
    if (opts["extraAbbreviations"].is_array()) {
      for (auto &abbreviation :
           readStringArray(opts["extraAbbreviations"], "extraAbbreviations")) {
        config.abbreviations.push_back(std::move(abbreviation));
      }
    } else {
      ignored("extraAbbreviations");
    }
  }

  if (opts.contains("quotePairs")) {
    if (opts["quotePairs"].is_array()) {
      std::vector<QuotePair> pairs;
      for (const auto &item : opts["quotePairs"]) {
        QuotePair pair{0, 0};
        if (item.is_array() && item.size() == 2 &&
            readQuoteMark(item[0], pair.open) &&
            readQuoteMark(item[1], pair.close)) {
          pairs.push_back(pair);
        } else {
          ignored("quotePairs");
        }
      }
      config.quotePairs = std::move(pairs);
    } else {
      ignored("quotePairs");
    }
  }

  if (opts.contains("singleLetterInitials")) {
    if (opts["singleLetterInitials"].is_boolean()) {
      config.singleLetterInitials = opts["singleLetterInitials"];
    } else {
      ignored("singleLetterInitials");
    }
  }

  if (opts.contains("fullWidthTerminators")) {
    if (opts["fullWidthTerminators"].is_boolean()) {
      config.fullWidthTerminators = opts["fullWidthTerminators"];
    } else {
      ignored("fullWidthTerminators");
    }
  }

  if (opts.contains("maxLookback")) {
    if (opts["maxLookback"].is_number_integer() &&
        opts["maxLookback"].get<long long>() > 0) {
      config.maxLookback = opts["maxLookback"].get<size_t>();
    } else {
      ignored("maxLookback");
    }
  }
}

SegmenterConfig fromJson(const json &opts) {
  SegmenterConfig config;
  applyOptions(opts, config);
  return config;
}

SegmenterConfig loadConfigFile(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("cannot open config file: " + path);
  }
  json opts = json::parse(file);
  return fromJson(opts);
}

json toJson(const SegmenterConfig &config) {
  json quotePairs = json::array();
  for (const auto &pair : config.quotePairs) {
    quotePairs.push_back({text::TextProcessor::encodeCodePoint(pair.open),
                          text::TextProcessor::encodeCodePoint(pair.close)});
  }

  return json{{"paragraphMode", paragraphModeName(config.paragraphMode)},
              {"abbreviations", config.abbreviations},
              {"quotePairs", quotePairs},
              {"singleLetterInitials", config.singleLetterInitials},
              {"fullWidthTerminators", config.fullWidthTerminators},
              {"maxLookback", config.maxLookback}};
}

const char *paragraphModeName(ParagraphMode mode) {
  switch (mode) {
  case ParagraphMode::BlankLine:
    return "blankLine";
  case ParagraphMode::LineBreak:
  default:
    return "lineBreak";
  }
}

bool parseParagraphMode(const std::string &name, ParagraphMode &mode) {
  if (name == "lineBreak") {
    mode = ParagraphMode::LineBreak;
    return true;
  }
  if (name == "blankLine") {
    mode = ParagraphMode::BlankLine;
    return true;
  }
  return false;
}

} // namespace config
} // namespace Kugiri
