#include "server.hpp"
#include "config.hpp"
#include "importer.hpp"
#include "utf16.hpp"

#include <cstdlib>
#include <iostream>
#include <string>

using nlohmann::json;

static bool isDebugEnabled() {
  static const bool debug = (std::getenv("KUGIRI_DEBUG") != nullptr);
  return debug;
}

namespace {

json positionToJson(const Position &pos) {
  return json{{"line", pos.line}, {"character", pos.character}};
}

json nullResult(const json &id) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", nullptr}};
}

} // namespace

SegmentServer::SegmentServer(std::istream &in, std::ostream &out)
    : in_(in), out_(out) {}

bool SegmentServer::readMessage(std::string &jsonPayload) {
  // 最小限のヘッダー読み取り: Content-Length、空行、本文の順
  std::string line;
  size_t contentLength = 0;

  // 空行までヘッダーを読み取り
  while (std::getline(in_, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.rfind("Content-Length:", 0) == 0) {
      contentLength = static_cast<size_t>(std::stoul(line.substr(15)));
    }
    if (line.empty())
      break; // 空行はヘッダー終了を示す
  }

  // ヘッダーを読み取れないかコンテント長が見つからない場合は失敗
  if (!contentLength || !in_.good())
    return false;

  jsonPayload.resize(contentLength);
  in_.read(&jsonPayload[0], static_cast<std::streamsize>(contentLength));
  return in_.gcount() == static_cast<std::streamsize>(contentLength);
}

void SegmentServer::reply(const json &msg) {
  std::string payload = msg.dump();
  out_ << "Content-Length: " << payload.size() << "\r\n\r\n" << payload;
  out_.flush();
}

void SegmentServer::notify(const std::string &method, const json &params) {
  json msg = {{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
  reply(msg);
}

void SegmentServer::handle(const json &req) {
  try {
    if (!req.contains("method"))
      return;

    std::string method = req["method"];
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] dispatch: " << method << std::endl;
    }

    if (method == "initialize") {
      reply(onInitialize(req["id"], req.value("params", json::object())));
    } else if (method == "initialized") {
      onInitialized();
    } else if (method == "textDocument/didOpen") {
      onDidOpen(req.at("params"));
    } else if (method == "textDocument/didChange") {
      onDidChange(req.at("params"));
    } else if (method == "textDocument/didClose") {
      onDidClose(req.at("params"));
    } else if (method == "kugiri/segment") {
      reply(onSegment(req["id"], req.value("params", json::object())));
    } else if (method == "kugiri/segmentPages") {
      reply(onSegmentPages(req["id"], req.value("params", json::object())));
    } else if (method == "kugiri/documentSentences") {
      reply(onDocumentSentences(req["id"],
                                req.value("params", json::object())));
    } else if (method == "shutdown") {
      shutdownReceived_ = true;
      reply(nullResult(req["id"]));
    } else if (method == "exit") {
      exitReceived_ = true;
    } else if (req.contains("id")) {
      reply(json{{"jsonrpc", "2.0"},
                 {"id", req["id"]},
                 {"error",
                  {{"code", -32601},
                   {"message", "Method not found: " + method}}}});
    }
  } catch (const std::exception &e) {
    if (isDebugEnabled()) {
      std::cerr << "[DEBUG] request failed: " << e.what() << std::endl;
    }
    if (req.contains("id")) {
      json error = {{"jsonrpc", "2.0"},
                    {"id", req["id"]},
                    {"error", {{"code", -32603}, {"message", e.what()}}}};
      reply(error);
    }
  }
}

void SegmentServer::run() {
  std::string jsonPayload;
  while (!exitReceived_ && readMessage(jsonPayload)) {
    try {
      json req = json::parse(jsonPayload);
      handle(req);
    } catch (const json::parse_error &e) {
      if (isDebugEnabled()) {
        std::cerr << "[DEBUG] JSON parse error: " << e.what() << std::endl;
      }
    }
  }
}

json SegmentServer::onInitialize(const json &id, const json &params) {
  // initializationOptionsから設定を抽出
  if (params.contains("initializationOptions")) {
    Kugiri::config::applyOptions(params["initializationOptions"], config_);
  }
  // 設定が変わった可能性があるため作り直す
  segmenter_ = std::make_unique<Kugiri::Segmenter>(config_);

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result",
               {{"capabilities",
                 {{"textDocumentSync",
                   {{"openClose", true},
                    {"change", 2}, // Incremental
                    {"save", false}}},
                  {"segmentProvider", true},
                  {"paragraphModes", {"lineBreak", "blankLine"}}}},
                {"config", Kugiri::config::toJson(config_)}}}};
}

void SegmentServer::onInitialized() {
  // 初期化完了
}

const Kugiri::Segmenter &SegmentServer::segmenter() {
  if (!segmenter_) {
    segmenter_ = std::make_unique<Kugiri::Segmenter>(config_);
  }
  return *segmenter_;
}

void SegmentServer::onDidOpen(const json &params) {
  std::string uri = params["textDocument"]["uri"];
  std::string text = params["textDocument"]["text"];
  docs_[uri] = text;
  segmentAndPublish(uri, text);
}

void SegmentServer::onDidChange(const json &params) {
  std::string uri = params["textDocument"]["uri"];
  auto changes = params["contentChanges"];

  std::string &text = docs_[uri];

  // 変更は配列の順に適用する
  for (const auto &change : changes) {
    if (change.contains("range")) {
      // 範囲指定のインクリメンタル変更
      const auto &range = change["range"];
      int startLine = range["start"]["line"];
      int startChar = range["start"]["character"];
      int endLine = range["end"]["line"];
      int endChar = range["end"]["character"];

      size_t startOffset = computeByteOffset(text, startLine, startChar);
      size_t endOffset = computeByteOffset(text, endLine, endChar);
      if (endOffset < startOffset)
        endOffset = startOffset;

      std::string newText = change["text"];
      text.replace(startOffset, endOffset - startOffset, newText);
    } else {
      // ドキュメント全体の変更
      text = change["text"];
    }
  }

  segmentAndPublish(uri, text);
}

void SegmentServer::onDidClose(const json &params) {
  std::string uri = params["textDocument"]["uri"];
  docs_.erase(uri);
  docSentences_.erase(uri);
}

json SegmentServer::onSegment(const json &id, const json &params) {
  std::string text = params.at("text");
  auto sentences = segmenter().segment(text);
  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result", {{"sentences", buildSentences(text, sentences)}}}};
}

json SegmentServer::onSegmentPages(const json &id, const json &params) {
  std::vector<Kugiri::importer::PageText> pages;
  for (const auto &page : params.at("pages")) {
    Kugiri::importer::PageText entry;
    entry.pageNumber = page.value("pageNumber", 0);
    entry.text = page.at("text").get<std::string>();
    pages.push_back(std::move(entry));
  }

  json sentences = json::array();
  for (const auto &sentence :
       Kugiri::importer::segmentPages(segmenter(), pages)) {
    sentences.push_back({{"pageNumber", sentence.pageNumber},
                         {"index", sentence.index},
                         {"paragraphIndex", sentence.paragraphIndex},
                         {"text", sentence.text}});
  }

  return json{{"jsonrpc", "2.0"},
              {"id", id},
              {"result", {{"sentences", sentences}}}};
}

json SegmentServer::onDocumentSentences(const json &id, const json &params) {
  std::string uri = params.at("textDocument").at("uri");
  auto docIt = docs_.find(uri);
  auto cached = docSentences_.find(uri);
  if (docIt == docs_.end() || cached == docSentences_.end()) {
    return nullResult(id);
  }

  return json{
      {"jsonrpc", "2.0"},
      {"id", id},
      {"result",
       {{"sentences", buildSentences(docIt->second, cached->second)}}}};
}

void SegmentServer::segmentAndPublish(const std::string &uri,
                                      const std::string &text) {
  auto sentences = segmenter().segment(text);
  json payload = buildSentences(text, sentences);
  docSentences_[uri] = std::move(sentences);

  notify("kugiri/sentenceBoundaries", {{"uri", uri}, {"sentences", payload}});
}

json SegmentServer::buildSentences(
    const std::string &text,
    const std::vector<Kugiri::SentenceUnit> &sentences) const {
  json result = json::array();

  std::vector<size_t> lineStarts = computeLineStarts(text);
  for (const auto &sentence : sentences) {
    Position start = byteOffsetToPosition(text, lineStarts, sentence.start);
    Position end = byteOffsetToPosition(text, lineStarts, sentence.end);

    result.push_back(
        {{"text", sentence.text},
         {"order", sentence.order},
         {"paragraphIndex", sentence.paragraphIndex},
         {"startByte", sentence.start},
         {"endByte", sentence.end},
         {"range", {{"start", positionToJson(start)},
                    {"end", positionToJson(end)}}}});
  }

  return result;
}
