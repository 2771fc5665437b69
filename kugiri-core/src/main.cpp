#include "config.hpp"
#include "encoding_utils.hpp"
#include "segmenter.hpp"
#include "server.hpp"

#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace {

const char *kVersion = "0.1.0";

struct SegmentArgs {
  std::string configPath;
  std::string charset;
  std::string paragraphMode;
  std::string inputPath; // 空なら標準入力
};

void printUsage(std::ostream &os) {
  os << "Usage:\n"
     << "  kugiri [--stdio]\n"
     << "  kugiri segment [--config FILE] [--charset NAME]"
        " [--paragraph-mode lineBreak|blankLine] [FILE]\n"
     << "  kugiri --help | --version\n";
}

SegmentArgs parseSegmentArgs(int argc, char *argv[], int first) {
  SegmentArgs args;
  for (int i = first; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      args.configPath = argv[++i];
    } else if (arg == "--charset" && i + 1 < argc) {
      args.charset = argv[++i];
    } else if (arg == "--paragraph-mode" && i + 1 < argc) {
      args.paragraphMode = argv[++i];
    } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
      throw std::invalid_argument("unknown or incomplete option: " + arg);
    } else if (args.inputPath.empty()) {
      args.inputPath = arg;
    } else {
      throw std::invalid_argument("unexpected argument: " + arg);
    }
  }
  return args;
}

std::string readInput(const std::string &path) {
  if (path.empty() || path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw std::runtime_error("cannot open input file: " + path);
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

int runSegment(const SegmentArgs &args) {
  Kugiri::SegmenterConfig config;
  if (!args.configPath.empty()) {
    config = Kugiri::config::loadConfigFile(args.configPath);
  }
  if (!args.paragraphMode.empty() &&
      !Kugiri::config::parseParagraphMode(args.paragraphMode,
                                          config.paragraphMode)) {
    throw std::invalid_argument("unknown paragraph mode: " +
                                args.paragraphMode);
  }

  std::string text = readInput(args.inputPath);
  if (!args.charset.empty()) {
    text = Kugiri::encoding::systemToUtf8(text, args.charset);
  }

  Kugiri::Segmenter segmenter(std::move(config));
  for (const auto &sentence : segmenter.segment(text)) {
    nlohmann::json line = {{"order", sentence.order},
                           {"paragraphIndex", sentence.paragraphIndex},
                           {"text", sentence.text}};
    // 不正なUTF-8はU+FFFDに置き換えて出力
    std::cout << line.dump(-1, ' ', false,
                           nlohmann::json::error_handler_t::replace)
              << '\n';
  }
  std::cout.flush();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  std::ios::sync_with_stdio(false);

  try {
    std::string command = argc > 1 ? argv[1] : "--stdio";

    if (command == "--help" || command == "-h") {
      printUsage(std::cout);
      return 0;
    }
    if (command == "--version") {
      std::cout << "kugiri " << kVersion << std::endl;
      return 0;
    }
    if (command == "segment") {
      return runSegment(parseSegmentArgs(argc, argv, 2));
    }
    if (command == "--stdio") {
      SegmentServer server(std::cin, std::cout);
      server.run();
      // shutdown を受けずに終了した場合は異常終了扱い
      return server.shutdownReceived() ? 0 : 1;
    }

    std::cerr << "kugiri: unknown command: " << command << std::endl;
    printUsage(std::cerr);
    return 1;
  } catch (const std::exception &e) {
    std::cerr << "kugiri: " << e.what() << std::endl;
    return 1;
  }
}
