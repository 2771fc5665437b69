#include "server.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

namespace {

std::string frame(const json &msg) {
  std::string payload = msg.dump();
  return "Content-Length: " + std::to_string(payload.size()) + "\r\n\r\n" +
         payload;
}

json request(int id, const std::string &method, const json &params) {
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method},
              {"params", params}};
}

json notification(const std::string &method, const json &params) {
  return json{{"jsonrpc", "2.0"}, {"method", method}, {"params", params}};
}

std::vector<json> parseFrames(const std::string &output) {
  std::vector<json> messages;
  size_t pos = 0;
  const std::string header = "Content-Length: ";
  while ((pos = output.find(header, pos)) != std::string::npos) {
    size_t lengthEnd = output.find("\r\n\r\n", pos);
    size_t length = std::stoul(
        output.substr(pos + header.size(), lengthEnd - pos - header.size()));
    size_t bodyStart = lengthEnd + 4;
    messages.push_back(json::parse(output.substr(bodyStart, length)));
    pos = bodyStart + length;
  }
  return messages;
}

// Feeds the messages to a fresh server and returns everything it wrote
std::vector<json> exchange(const std::vector<json> &messages,
                           bool *shutdown = nullptr) {
  std::string input;
  for (const auto &msg : messages)
    input += frame(msg);

  std::istringstream in(input);
  std::ostringstream out;
  SegmentServer server(in, out);
  server.run();
  if (shutdown)
    *shutdown = server.shutdownReceived();
  return parseFrames(out.str());
}

const json *findResponse(const std::vector<json> &messages, int id) {
  for (const auto &msg : messages) {
    if (msg.contains("id") && msg["id"] == id)
      return &msg;
  }
  return nullptr;
}

} // namespace

TEST(SegmentServerTest, InitializeReportsCapabilitiesAndConfig) {
  auto out = exchange({request(
      1, "initialize",
      {{"initializationOptions", {{"paragraphMode", "blankLine"}}}})});

  const json *res = findResponse(out, 1);
  ASSERT_NE(res, nullptr);
  const json &result = (*res)["result"];
  EXPECT_EQ(result["capabilities"]["segmentProvider"], true);
  EXPECT_EQ(result["capabilities"]["textDocumentSync"]["change"], 2);
  EXPECT_EQ(result["config"]["paragraphMode"], "blankLine");
}

TEST(SegmentServerTest, SegmentReturnsOffsetsAndRanges) {
  auto out = exchange(
      {request(1, "kugiri/segment", {{"text", "Hi there. Bye.\nあ。"}})});

  const json *res = findResponse(out, 1);
  ASSERT_NE(res, nullptr);
  const json &sentences = (*res)["result"]["sentences"];
  ASSERT_EQ(sentences.size(), 3u);

  EXPECT_EQ(sentences[0]["text"], "Hi there.");
  EXPECT_EQ(sentences[0]["startByte"], 0);
  EXPECT_EQ(sentences[0]["endByte"], 9);
  EXPECT_EQ(sentences[1]["text"], "Bye.");
  EXPECT_EQ(sentences[1]["range"]["start"]["character"], 10);

  EXPECT_EQ(sentences[2]["text"], "あ。");
  EXPECT_EQ(sentences[2]["order"], 2);
  EXPECT_EQ(sentences[2]["paragraphIndex"], 1);
  EXPECT_EQ(sentences[2]["range"]["start"]["line"], 1);
  EXPECT_EQ(sentences[2]["range"]["start"]["character"], 0);
  EXPECT_EQ(sentences[2]["range"]["end"]["character"], 2);
}

TEST(SegmentServerTest, InitializationOptionsApplyToLaterRequests) {
  auto out = exchange(
      {request(1, "initialize",
               {{"initializationOptions",
                 {{"abbreviations", json::array({"Gen"})}}}}),
       request(2, "kugiri/segment", {{"text", "Gen. Lee met Dr. Who."}})});

  const json *res = findResponse(out, 2);
  ASSERT_NE(res, nullptr);
  const json &sentences = (*res)["result"]["sentences"];
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_EQ(sentences[0]["text"], "Gen. Lee met Dr.");
}

TEST(SegmentServerTest, SegmentPages) {
  json pages = json::array({{{"pageNumber", 1}, {"text", "One. Two."}},
                            {{"pageNumber", 2}, {"text", "Three."}}});
  auto out = exchange({request(1, "kugiri/segmentPages", {{"pages", pages}})});

  const json *res = findResponse(out, 1);
  ASSERT_NE(res, nullptr);
  const json &sentences = (*res)["result"]["sentences"];
  ASSERT_EQ(sentences.size(), 3u);
  EXPECT_EQ(sentences[1]["index"], 1);
  EXPECT_EQ(sentences[2]["pageNumber"], 2);
  EXPECT_EQ(sentences[2]["index"], 0);
  EXPECT_EQ(sentences[2]["text"], "Three.");
}

TEST(SegmentServerTest, DocumentLifecyclePublishesBoundaries) {
  const std::string uri = "file:///tmp/story.txt";
  auto out = exchange(
      {notification("textDocument/didOpen",
                    {{"textDocument",
                      {{"uri", uri}, {"version", 1}, {"text", "Hello world."}}}}),
       notification(
           "textDocument/didChange",
           {{"textDocument", {{"uri", uri}, {"version", 2}}},
            {"contentChanges",
             json::array({{{"range",
                            {{"start", {{"line", 0}, {"character", 6}}},
                             {"end", {{"line", 0}, {"character", 11}}}}},
                           {"text", "there. Bye"}}})}}),
       request(1, "kugiri/documentSentences", {{"textDocument", {{"uri", uri}}}}),
       notification("textDocument/didClose", {{"textDocument", {{"uri", uri}}}}),
       request(2, "kugiri/documentSentences",
               {{"textDocument", {{"uri", uri}}}})});

  std::vector<json> published;
  for (const auto &msg : out) {
    if (msg.value("method", "") == "kugiri/sentenceBoundaries")
      published.push_back(msg["params"]);
  }
  ASSERT_EQ(published.size(), 2u);
  EXPECT_EQ(published[0]["uri"], uri);
  EXPECT_EQ(published[0]["sentences"].size(), 1u);
  EXPECT_EQ(published[1]["sentences"].size(), 2u);

  const json *cached = findResponse(out, 1);
  ASSERT_NE(cached, nullptr);
  const json &sentences = (*cached)["result"]["sentences"];
  ASSERT_EQ(sentences.size(), 2u);
  EXPECT_EQ(sentences[0]["text"], "Hello there.");
  EXPECT_EQ(sentences[1]["text"], "Bye.");

  const json *closed = findResponse(out, 2);
  ASSERT_NE(closed, nullptr);
  EXPECT_TRUE((*closed)["result"].is_null());
}

TEST(SegmentServerTest, ErrorsAreReportedAsJsonRpcErrors) {
  auto out = exchange({request(1, "kugiri/unknown", json::object()),
                       request(2, "kugiri/segment", json::object())});

  const json *unknown = findResponse(out, 1);
  ASSERT_NE(unknown, nullptr);
  EXPECT_EQ((*unknown)["error"]["code"], -32601);

  // text が無いリクエストは内部エラー
  const json *missing = findResponse(out, 2);
  ASSERT_NE(missing, nullptr);
  EXPECT_EQ((*missing)["error"]["code"], -32603);
}

TEST(SegmentServerTest, MalformedPayloadIsSkipped) {
  std::string broken = "{not json";
  std::string input = "Content-Length: " + std::to_string(broken.size()) +
                      "\r\n\r\n" + broken +
                      frame(request(1, "kugiri/segment", {{"text", "Ok."}}));

  std::istringstream in(input);
  std::ostringstream out;
  SegmentServer server(in, out);
  server.run();

  auto messages = parseFrames(out.str());
  ASSERT_EQ(messages.size(), 1u);
  EXPECT_EQ(messages[0]["result"]["sentences"][0]["text"], "Ok.");
}

TEST(SegmentServerTest, ShutdownThenExitStopsTheLoop) {
  bool shutdown = false;
  auto out = exchange({request(1, "shutdown", nullptr),
                       notification("exit", nullptr),
                       request(2, "kugiri/segment", {{"text", "Late."}})},
                      &shutdown);

  EXPECT_TRUE(shutdown);
  ASSERT_EQ(out.size(), 1u);
  EXPECT_TRUE(out[0]["result"].is_null());
  EXPECT_EQ(findResponse(out, 2), nullptr);
}
