#pragma once

#include "segmenter.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace Kugiri {
namespace config {

// Overlays the keys present in opts onto config. Keys with an unexpected type
// are ignored.
void applyOptions(const nlohmann::json &opts, SegmenterConfig &config);

SegmenterConfig fromJson(const nlohmann::json &opts);

// Throws std::runtime_error if the file cannot be opened and
// nlohmann::json::parse_error on malformed JSON
SegmenterConfig loadConfigFile(const std::string &path);

nlohmann::json toJson(const SegmenterConfig &config);

const char *paragraphModeName(ParagraphMode mode);

bool parseParagraphMode(const std::string &name, ParagraphMode &mode);

} // namespace config
} // namespace Kugiri
