#pragma once

#include <string>

#include "util/Expected.hpp"

namespace saltline {

namespace HexCodec {

/// Hex-encode raw bytes (lowercase unless upper is set)
std::string encode(const std::string& bytes, bool upper = false);

/// Decode hex in either case; odd length or non-hex characters are InvalidArgs
Expected<std::string> decode(const std::string& text);

}  // namespace HexCodec

}  // namespace saltline
