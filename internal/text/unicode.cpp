#include "internal/text/unicode.hpp"

#include <cstddef>
#include <cstdint>

namespace prdchat::text {
namespace {

struct Range {
  char32_t start;
  char32_t end;
};

// Sorted, non-overlapping, BMP only. Letters (L*), numbers (Nd Nl) and marks (Mn Mc).
// Other numbers (No) such as superscripts and circled digits are excluded.
constexpr Range kWordRanges[] = {
    {0x0030, 0x0039}, {0x0041, 0x005A}, {0x0061, 0x007A}, {0x00AA, 0x00AA}, {0x00B5, 0x00B5}, {0x00BA, 0x00BA},
    {0x00C0, 0x00D6}, {0x00D8, 0x00F6}, {0x00F8, 0x02C1}, {0x02C6, 0x02D1}, {0x02E0, 0x02E4}, {0x02EC, 0x02EC},
    {0x02EE, 0x02EE}, {0x0300, 0x0374}, {0x0376, 0x0377}, {0x037A, 0x037D}, {0x037F, 0x037F}, {0x0386, 0x0386},
    {0x0388, 0x038A}, {0x038C, 0x038C}, {0x038E, 0x03A1}, {0x03A3, 0x03F5}, {0x03F7, 0x0481}, {0x0483, 0x0487},
    {0x048A, 0x052F}, {0x0531, 0x0556}, {0x0559, 0x0559}, {0x0560, 0x0588}, {0x0591, 0x05BD}, {0x05BF, 0x05BF},
    {0x05C1, 0x05C2}, {0x05C4, 0x05C5}, {0x05C7, 0x05C7}, {0x05D0, 0x05EA}, {0x05EF, 0x05F2}, {0x0610, 0x061A},
    {0x0620, 0x0669}, {0x066E, 0x06D3}, {0x06D5, 0x06DC}, {0x06DF, 0x06E8}, {0x06EA, 0x06FC}, {0x06FF, 0x06FF},
    {0x0900, 0x0963}, {0x0966, 0x096F}, {0x0971, 0x097F}, {0x0E01, 0x0E3A}, {0x0E40, 0x0E4E}, {0x0E50, 0x0E59},
    {0x1100, 0x11FF}, {0x1E00, 0x1F15}, {0x1F18, 0x1F1D}, {0x1F20, 0x1F45}, {0x1F48, 0x1F4D}, {0x1F50, 0x1F57},
    {0x1F59, 0x1F59}, {0x1F5B, 0x1F5B}, {0x1F5D, 0x1F5D}, {0x1F5F, 0x1F7D}, {0x1F80, 0x1FB4}, {0x1FB6, 0x1FBC},
    {0x2071, 0x2071}, {0x207F, 0x207F}, {0x2090, 0x209C}, {0x20D0, 0x20DC}, {0x2160, 0x2188}, {0x3005, 0x3007},
    {0x3021, 0x302F}, {0x3031, 0x3035}, {0x3038, 0x303C}, {0x3041, 0x3096}, {0x3099, 0x309A}, {0x309D, 0x309F},
    {0x30A1, 0x30FA}, {0x30FC, 0x30FF}, {0x3105, 0x312F}, {0x3131, 0x318E}, {0x31A0, 0x31BF}, {0x31F0, 0x31FF},
    {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA48C}, {0xAC00, 0xD7A3}, {0xF900, 0xFA6D}, {0xFB00, 0xFB06},
    {0xFF10, 0xFF19}, {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A}, {0xFF66, 0xFFBE},
};

constexpr std::size_t kWordRangeCount = sizeof(kWordRanges) / sizeof(kWordRanges[0]);

} // namespace

bool IsLetterNumberOrMark(char32_t cp) noexcept {
  std::size_t lo = 0, hi = kWordRangeCount;
  while (lo < hi) {
    std::size_t mid = lo + (hi - lo) / 2;
    if (cp > kWordRanges[mid].end) {
      lo = mid + 1;
    } else if (cp < kWordRanges[mid].start) {
      hi = mid;
    } else {
      return true;
    }
  }
  return false;
}

bool IsWhitespace(char32_t cp) noexcept {
  return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
         cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F || cp == 0x3000;
}

bool IsCjkIdeograph(char32_t cp) noexcept {
  return cp >= 0x4E00 && cp <= 0x9FFF;
}

bool IsAsciiLetter(char32_t cp) noexcept {
  return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
}

bool IsAsciiDigit(char32_t cp) noexcept {
  return cp >= U'0' && cp <= U'9';
}

char32_t ToLower(char32_t cp) noexcept {
  if (cp < 0x80) {
    return (cp >= U'A' && cp <= U'Z') ? cp + 0x20 : cp;
  }
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;

  // Latin Extended-A alternates upper/lower; the parity flips at U+0139 and U+0179.
  if ((cp >= 0x100 && cp <= 0x137) || (cp >= 0x14A && cp <= 0x177)) {
    return (cp % 2 == 0) ? cp + 1 : cp;
  }
  if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
    return (cp % 2 == 1) ? cp + 1 : cp;
  }
  if (cp == 0x178) return 0xFF;

  if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
  if (cp == 0x386) return 0x3AC;
  if (cp >= 0x388 && cp <= 0x38A) return cp + 37;
  if (cp == 0x38C) return 0x3CC;
  if (cp == 0x38E || cp == 0x38F) return cp + 63;

  if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
  if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;

  if (cp >= 0xFF21 && cp <= 0xFF3A) return cp + 0x20;
  return cp;
}

std::u32string ToLower(const std::u32string& s) {
  std::u32string out;
  out.reserve(s.size());
  for (char32_t cp : s) out.push_back(ToLower(cp));
  return out;
}

std::u32string NormalizeWhitespace(const std::u32string& s) {
  std::u32string out;
  out.reserve(s.size());
  bool pending_space = false;
  for (char32_t cp : s) {
    if (IsWhitespace(cp)) {
      pending_space = !out.empty();
      continue;
    }
    if (pending_space) {
      out.push_back(U' ');
      pending_space = false;
    }
    out.push_back(cp);
  }
  return out;
}

std::u32string Trim(const std::u32string& s) {
  std::size_t begin = 0;
  std::size_t end   = s.size();
  while (begin < end && IsWhitespace(s[begin])) ++begin;
  while (end > begin && IsWhitespace(s[end - 1])) --end;
  return s.substr(begin, end - begin);
}

} // namespace prdchat::text
