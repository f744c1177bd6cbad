#pragma once

#include <string>

namespace prdchat::text {

// Decode UTF-8 bytes to codepoints. Invalid sequences become U+FFFD.
std::u32string DecodeUtf8(const std::string& data);

std::string EncodeUtf8(char32_t codepoint);
std::string EncodeUtf8(const std::u32string& codepoints);

// Number of codepoints in a UTF-8 string.
std::size_t CodepointCount(const std::string& data);

} // namespace prdchat::text
