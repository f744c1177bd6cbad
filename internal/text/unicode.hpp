#pragma once

#include <string>

namespace prdchat::text {

/*
  Codepoint classification for slugging and keyword extraction.

  Covers the scripts PRD documents are written in (Latin, Greek,
  Cyrillic, CJK, kana, Hangul, Arabic, Hebrew, Devanagari, Thai,
  fullwidth forms); anything outside the table is treated as
  punctuation.
*/

// Letter (Lu Ll Lt Lm Lo), number (Nd Nl) or mark (Mn Mc) in the BMP.
// Supplementary-plane codepoints return false, matching slugs computed
// over UTF-16 code units by the document viewer.
bool IsLetterNumberOrMark(char32_t cp) noexcept;

bool IsWhitespace(char32_t cp) noexcept;

// CJK Unified Ideographs block, U+4E00..U+9FFF.
bool IsCjkIdeograph(char32_t cp) noexcept;

bool IsAsciiLetter(char32_t cp) noexcept;
bool IsAsciiDigit(char32_t cp) noexcept;

char32_t       ToLower(char32_t cp) noexcept;
std::u32string ToLower(const std::u32string& s);

// Collapses whitespace runs into one space and trims both ends.
std::u32string NormalizeWhitespace(const std::u32string& s);

std::u32string Trim(const std::u32string& s);

} // namespace prdchat::text
