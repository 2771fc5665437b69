#pragma once

#include <string>

namespace Kugiri {
namespace encoding {

// Throws std::runtime_error if the conversion is unsupported or the input is
// not valid in fromCharset
std::string convertEncoding(const std::string &input,
                            const std::string &fromCharset,
                            const std::string &toCharset = "UTF-8");

std::string systemToUtf8(const std::string &input,
                         const std::string &systemCharset);

} // namespace encoding
} // namespace Kugiri
