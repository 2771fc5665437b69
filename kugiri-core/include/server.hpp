#pragma once

#include "segmenter.hpp"
#include <cstddef>
#include <istream>
#include <memory>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

using json = nlohmann::json;

struct Position {
  int line{0};
  int character{0};
};

// JSON-RPC 2.0 over stdio with LSP Content-Length framing
class SegmentServer {
public:
  SegmentServer(std::istream &in, std::ostream &out);
  void run();

  bool shutdownReceived() const { return shutdownReceived_; }

private:
  std::istream &in_;
  std::ostream &out_;

  // インメモリテキストストア: uri -> 全テキスト
  std::unordered_map<std::string, std::string> docs_;
  // 文境界キャッシュ: uri -> 文のリスト
  std::unordered_map<std::string, std::vector<Kugiri::SentenceUnit>>
      docSentences_;

  Kugiri::SegmenterConfig config_;

  std::unique_ptr<Kugiri::Segmenter> segmenter_;

  bool shutdownReceived_{false};
  bool exitReceived_{false};

  bool readMessage(std::string &jsonPayload);
  void reply(const json &msg);
  void notify(const std::string &method, const json &params);

  void handle(const json &req);

  json onInitialize(const json &id, const json &params);
  void onInitialized();
  void onDidOpen(const json &params);
  void onDidChange(const json &params);
  void onDidClose(const json &params);
  json onSegment(const json &id, const json &params);
  json onSegmentPages(const json &id, const json &params);
  json onDocumentSentences(const json &id, const json &params);

  const Kugiri::Segmenter &segmenter();
  void segmentAndPublish(const std::string &uri, const std::string &text);
  json buildSentences(const std::string &text,
                      const std::vector<Kugiri::SentenceUnit> &sentences) const;
};
