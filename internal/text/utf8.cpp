#include "internal/text/utf8.hpp"

#include <cstdint>

namespace prdchat::text {

std::u32string DecodeUtf8(const std::string& data) {
  std::u32string codepoints;
  codepoints.reserve(data.size());

  const auto* p   = reinterpret_cast<const uint8_t*>(data.data());
  const auto* end = p + data.size();

  while (p < end) {
    char32_t cp;

    if (*p < 0x80) {
      cp = *p++;
    } else if ((*p & 0xE0) == 0xC0 && p + 1 < end) {
      uint8_t b1 = *p++;
      uint8_t b2 = *p++;
      if ((b2 & 0xC0) != 0x80) {
        cp = 0xFFFD;
        p--;
      } else {
        cp = ((b1 & 0x1F) << 6) | (b2 & 0x3F);
        if (cp < 0x80) cp = 0xFFFD;
      }
    } else if ((*p & 0xF0) == 0xE0 && p + 2 < end) {
      uint8_t b1 = *p++;
      uint8_t b2 = *p++;
      uint8_t b3 = *p++;
      if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80) {
        cp = 0xFFFD;
        p -= 2;
      } else {
        cp = ((b1 & 0x0F) << 12) | ((b2 & 0x3F) << 6) | (b3 & 0x3F);
        if (cp < 0x800 || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
      }
    } else if ((*p & 0xF8) == 0xF0 && p + 3 < end) {
      uint8_t b1 = *p++;
      uint8_t b2 = *p++;
      uint8_t b3 = *p++;
      uint8_t b4 = *p++;
      if ((b2 & 0xC0) != 0x80 || (b3 & 0xC0) != 0x80 || (b4 & 0xC0) != 0x80) {
        cp = 0xFFFD;
        p -= 3;
      } else {
        cp = ((b1 & 0x07) << 18) | ((b2 & 0x3F) << 12) | ((b3 & 0x3F) << 6) | (b4 & 0x3F);
        if (cp < 0x10000 || cp > 0x10FFFF) cp = 0xFFFD;
      }
    } else {
      cp = 0xFFFD;
      ++p;
    }

    codepoints.push_back(cp);
  }

  return codepoints;
}

std::string EncodeUtf8(char32_t cp) {
  std::string out;
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp <= 0x10FFFF) {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out = EncodeUtf8(U'�');
  }
  return out;
}

std::string EncodeUtf8(const std::u32string& codepoints) {
  std::string out;
  out.reserve(codepoints.size());
  for (char32_t cp : codepoints) {
    out += EncodeUtf8(cp);
  }
  return out;
}

std::size_t CodepointCount(const std::string& data) {
  std::size_t count = 0;
  for (unsigned char c : data) {
    if ((c & 0xC0) != 0x80) ++count;
  }
  return count;
}

} // namespace prdchat::text
