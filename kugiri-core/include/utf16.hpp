#pragma once

#include "server.hpp"

std::vector<size_t> computeLineStarts(const std::string &text);

Position byteOffsetToPosition(const std::string &text,
                              const std::vector<size_t> &lineStarts,
                              size_t offset);

size_t computeByteOffset(const std::string &text, int line, int character);
