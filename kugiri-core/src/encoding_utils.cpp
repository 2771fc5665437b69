#include "encoding_utils.hpp"
#include <cerrno>
#include <cstring>
#include <iconv.h>
#include <memory>
#include <stdexcept>

namespace Kugiri {
namespace encoding {

namespace {

using IconvHandle = std::unique_ptr<void, decltype(&iconv_close)>;

IconvHandle openConverter(const std::string &fromCharset,
                          const std::string &toCharset) {
  iconv_t cd = iconv_open(toCharset.c_str(), fromCharset.c_str());
  if (cd == (iconv_t)-1) {
    throw std::runtime_error("unsupported conversion from " + fromCharset +
                             " to " + toCharset);
  }
  return IconvHandle(cd, &iconv_close);
}

} // namespace

std::string convertEncoding(const std::string &input,
                            const std::string &fromCharset,
                            const std::string &toCharset) {
  if (input.empty())
    return input;

  IconvHandle cd = openConverter(fromCharset, toCharset);

  // UTF-8への変換ではほとんどの場合2倍で足りる。足りなければ拡張する
  std::string result(input.size() * 2 + 16, '\0');
  size_t written = 0;

  char *inBuf = const_cast<char *>(input.data());
  size_t inBytesLeft = input.size();
  bool flushing = false;

  while (true) {
    char *outBuf = &result[written];
    size_t outBytesLeft = result.size() - written;

    // 入力を使い切ったらシフト状態をリセットする (ISO-2022-JP など)
    size_t rc = flushing
                    ? iconv(cd.get(), nullptr, nullptr, &outBuf, &outBytesLeft)
                    : iconv(cd.get(), &inBuf, &inBytesLeft, &outBuf,
                            &outBytesLeft);
    written = result.size() - outBytesLeft;

    if (rc == (size_t)-1) {
      int err = errno;
      if (err == E2BIG) {
        result.resize(result.size() * 2);
        continue;
      }
      size_t at = input.size() - inBytesLeft;
      throw std::runtime_error("cannot convert input from " + fromCharset +
                               " at byte " + std::to_string(at) + ": " +
                               std::strerror(err));
    }

    if (flushing)
      break;
    flushing = true;
  }

  result.resize(written);
  return result;
}

std::string systemToUtf8(const std::string &input,
                         const std::string &systemCharset) {
  if (systemCharset == "UTF-8" || systemCharset.empty()) {
    return input;
  }
  return convertEncoding(input, systemCharset, "UTF-8");
}

} // namespace encoding
} // namespace Kugiri
