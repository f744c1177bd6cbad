#include "internal/citation/citation_extractor.hpp"

#include <algorithm>
#include <cmath>
#include <optional>
#include <unordered_map>
#include <unordered_set>

#include "internal/markdown/slugger.hpp"
#include "internal/text/unicode.hpp"
#include "internal/text/utf8.hpp"

namespace prdchat::citation {

namespace {

constexpr std::size_t kMinRawParagraphChars   = 12;
constexpr std::size_t kMinCleanParagraphChars = 18;
constexpr std::size_t kMaxKeywordChars        = 24;
constexpr std::size_t kMaxKeywords            = 40;
constexpr std::size_t kExcerptChars           = 240;
constexpr std::size_t kExcerptLeadChars       = 40;
constexpr char32_t    kEllipsis               = U'…';

struct Candidate {
  const HeadingAnchor* heading = nullptr;
  std::u32string       clean;
};

struct Scored {
  const Candidate* candidate = nullptr;
  double           score     = 0;
};

bool IsWordChar(char32_t cp) {
  return cp == U'_' || text::IsLetterNumberOrMark(cp);
}

std::size_t SkipWhitespace(const std::u32string& s, std::size_t pos) {
  while (pos < s.size() && text::IsWhitespace(s[pos])) ++pos;
  return pos;
}

bool IsBlank(const std::u32string& s) {
  return SkipWhitespace(s, 0) == s.size();
}

std::vector<std::u32string> SplitLines(std::string_view markdown) {
  const auto decoded = text::DecodeUtf8(std::string(markdown));

  std::vector<std::u32string> lines;
  std::u32string              current;
  for (std::size_t i = 0; i < decoded.size(); ++i) {
    const char32_t cp = decoded[i];
    if (cp == U'\r' || cp == U'\n') {
      if (cp == U'\r' && i + 1 < decoded.size() && decoded[i + 1] == U'\n') ++i;
      lines.push_back(std::move(current));
      current.clear();
      continue;
    }
    current.push_back(cp);
  }
  lines.push_back(std::move(current));
  return lines;
}

std::u32string JoinLines(const std::vector<std::u32string>& lines, std::size_t begin, std::size_t end) {
  std::u32string out;
  for (std::size_t i = begin; i < end; ++i) {
    if (i > begin) out.push_back(U'\n');
    out += lines[i];
  }
  return out;
}

// Whole-line fence: optional indent, ``` or ~~~ run, optional word tag.
std::optional<std::u32string> MatchFenceLine(const std::u32string& line) {
  std::size_t pos = SkipWhitespace(line, 0);
  if (pos >= line.size() || (line[pos] != U'`' && line[pos] != U'~')) return std::nullopt;

  const char32_t fence_char = line[pos];
  std::size_t    run_end    = pos;
  while (run_end < line.size() && line[run_end] == fence_char) ++run_end;
  if (run_end - pos < 3) return std::nullopt;

  std::size_t rest = SkipWhitespace(line, run_end);
  while (rest < line.size() && IsWordChar(line[rest])) ++rest;
  rest = SkipWhitespace(line, rest);
  if (rest != line.size()) return std::nullopt;

  return line.substr(pos, run_end - pos);
}

// "#{1,6} title", optionally indented; returns level and raw title.
bool MatchHeadingLine(const std::u32string& line, int& level, std::u32string& title) {
  std::size_t pos    = SkipWhitespace(line, 0);
  std::size_t hashes = 0;
  while (pos + hashes < line.size() && line[pos + hashes] == U'#') ++hashes;
  if (hashes == 0 || hashes > 6) return false;

  const std::size_t after = pos + hashes;
  if (after >= line.size() || !text::IsWhitespace(line[after])) return false;

  title = text::Trim(line.substr(after));
  if (title.empty()) return false;
  level = static_cast<int>(hashes);
  return true;
}

// Drops a closing "### " suffix and collapses whitespace.
std::u32string NormalizeHeadingText(const std::u32string& raw) {
  std::u32string s   = raw;
  std::size_t    end = s.size();
  while (end > 0 && text::IsWhitespace(s[end - 1])) --end;
  std::size_t hash_start = end;
  while (hash_start > 0 && s[hash_start - 1] == U'#') --hash_start;
  if (hash_start < end && hash_start > 0 && text::IsWhitespace(s[hash_start - 1])) {
    s.erase(hash_start);
  }
  return text::NormalizeWhitespace(s);
}

std::vector<std::u32string> RemoveFencedBlocks(const std::vector<std::u32string>& lines) {
  std::vector<std::u32string> out;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line  = lines[i];
    std::size_t start = SkipWhitespace(line, 0);
    std::size_t run   = 0;
    if (start < line.size() && (line[start] == U'`' || line[start] == U'~')) {
      while (start + run < line.size() && line[start + run] == line[start]) ++run;
    }

    std::optional<std::size_t> close;
    // Longest opening run first, then shorter ones, earliest closing line wins.
    for (std::size_t len = run; len >= 3 && !close; --len) {
      const auto token = line.substr(start, len);
      for (std::size_t j = i + 1; j < lines.size(); ++j) {
        if (text::Trim(lines[j]) == token) {
          close = j;
          break;
        }
      }
    }

    if (close) {
      out.emplace_back();
      i = *close;
      continue;
    }
    out.push_back(line);
  }
  return out;
}

std::vector<std::u32string> SplitParagraphs(const std::vector<std::u32string>& body_lines) {
  const auto lines = RemoveFencedBlocks(body_lines);

  std::vector<std::u32string> paragraphs;
  std::size_t                 begin = 0;
  auto                        emit  = [&](std::size_t end) {
    if (end > begin) {
      auto paragraph = text::Trim(JoinLines(lines, begin, end));
      if (!paragraph.empty()) paragraphs.push_back(std::move(paragraph));
    }
  };
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IsBlank(lines[i])) {
      emit(i);
      begin = i + 1;
    }
  }
  emit(lines.size());
  return paragraphs;
}

std::u32string StripInlineCode(const std::u32string& s) {
  std::u32string out;
  std::size_t    i = 0;
  while (i < s.size()) {
    if (s[i] == U'`') {
      const auto close = s.find(U'`', i + 1);
      if (close != std::u32string::npos && close > i + 1) {
        out.append(s, i + 1, close - i - 1);
        i = close + 1;
        continue;
      }
    }
    out.push_back(s[i++]);
  }
  return out;
}

// [text](url) -> text; with image=true, ![alt](url) -> alt.
std::u32string StripBracketLinks(const std::u32string& s, bool image) {
  std::u32string out;
  std::size_t    i = 0;
  while (i < s.size()) {
    const std::size_t open = image ? i + 1 : i;
    const bool        head = image ? (s[i] == U'!' && open < s.size() && s[open] == U'[') : s[i] == U'[';
    if (head) {
      const auto close = s.find(U']', open + 1);
      const bool text_ok = close != std::u32string::npos && (image || close > open + 1);
      if (text_ok && close + 1 < s.size() && s[close + 1] == U'(') {
        const auto paren = s.find(U')', close + 2);
        if (paren != std::u32string::npos) {
          out.append(s, open + 1, close - open - 1);
          i = paren + 1;
          continue;
        }
      }
    }
    out.push_back(s[i++]);
  }
  return out;
}

enum class LinePrefix {
  kBlockquote,
  kListMarker,
  kHeadingMarker,
};

// Length of the matched prefix at the start of `line`, or 0.
std::size_t MatchPrefix(const std::u32string& line, LinePrefix kind) {
  std::size_t pos = SkipWhitespace(line, 0);
  switch (kind) {
    case LinePrefix::kBlockquote: {
      if (pos >= line.size() || line[pos] != U'>') return 0;
      while (pos < line.size() && line[pos] == U'>') ++pos;
      if (pos < line.size() && text::IsWhitespace(line[pos])) ++pos;
      return pos;
    }
    case LinePrefix::kListMarker: {
      if (pos >= line.size()) return 0;
      if (line[pos] == U'-' || line[pos] == U'*' || line[pos] == U'+') {
        ++pos;
      } else {
        std::size_t digits = 0;
        while (pos + digits < line.size() && text::IsAsciiDigit(line[pos + digits])) ++digits;
        if (digits == 0 || pos + digits >= line.size() || line[pos + digits] != U'.') return 0;
        pos += digits + 1;
      }
      break;
    }
    case LinePrefix::kHeadingMarker: {
      std::size_t hashes = 0;
      while (pos + hashes < line.size() && line[pos + hashes] == U'#') ++hashes;
      if (hashes == 0 || hashes > 6) return 0;
      pos += hashes;
      break;
    }
  }
  const std::size_t after = SkipWhitespace(line, pos);
  return after > pos ? after : 0;
}

std::u32string StripLinePrefixes(const std::u32string& s, LinePrefix kind) {
  std::u32string out;
  std::size_t    begin = 0;
  while (begin <= s.size()) {
    auto end = s.find(U'\n', begin);
    if (end == std::u32string::npos) end = s.size();
    const auto line = s.substr(begin, end - begin);
    out.append(line, MatchPrefix(line, kind));
    if (end == s.size()) break;
    out.push_back(U'\n');
    begin = end + 1;
  }
  return out;
}

std::u32string CleanToText(const std::u32string& markdown) {
  auto s = StripInlineCode(markdown);
  s      = StripBracketLinks(s, /*image=*/true);
  s      = StripBracketLinks(s, /*image=*/false);
  s.erase(std::remove_if(s.begin(), s.end(), [](char32_t cp) { return cp == U'*' || cp == U'_'; }), s.end());
  s = StripLinePrefixes(s, LinePrefix::kBlockquote);
  s = StripLinePrefixes(s, LinePrefix::kListMarker);
  s = StripLinePrefixes(s, LinePrefix::kHeadingMarker);
  std::replace(s.begin(), s.end(), U'|', U' ');
  return text::NormalizeWhitespace(s);
}

std::vector<HeadingAnchor> ExtractAnchors(const std::vector<std::u32string>& lines) {
  std::vector<HeadingAnchor> anchors;
  markdown::HeadingSlugger   slugger;

  std::optional<std::u32string> fence_token;
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto& line = lines[i];

    if (auto token = MatchFenceLine(line)) {
      if (!fence_token) {
        fence_token = std::move(token);
      } else if (line.compare(SkipWhitespace(line, 0), fence_token->size(), *fence_token) == 0) {
        fence_token.reset();
      }
      continue;
    }
    if (fence_token) continue;

    int            level = 0;
    std::u32string raw_title;
    if (!MatchHeadingLine(line, level, raw_title)) continue;

    const auto title = NormalizeHeadingText(raw_title);
    if (title.empty()) continue;

    const auto title_utf8 = text::EncodeUtf8(title);
    anchors.push_back(HeadingAnchor{level, title_utf8, slugger.Slug(title_utf8), i});
  }
  return anchors;
}

double ScoreCandidate(const Candidate& candidate, const std::u32string& heading_lower, const std::vector<Keyword>& keywords) {
  const auto& text_clean = candidate.clean;
  if (text_clean.empty()) return 0;

  const auto lower = text::ToLower(text_clean);
  double     score = 0;
  for (const auto& keyword : keywords) {
    if (lower.find(keyword.lower) != std::u32string::npos) {
      score += static_cast<double>(std::min<std::size_t>(6, keyword.text.size()));
    }
  }
  if (!heading_lower.empty()) {
    for (const auto& keyword : keywords) {
      if (heading_lower.find(keyword.lower) != std::u32string::npos) score += 2.0;
    }
  }

  if (text_clean.size() > 400) score *= 0.9;
  if (text_clean.size() > 900) score *= 0.85;
  return score;
}

std::u32string BuildExcerpt(const std::u32string& clean, const std::vector<Keyword>& keywords) {
  if (clean.empty()) return {};

  const auto  lower       = text::ToLower(clean);
  std::size_t best_index  = std::u32string::npos;
  int         best_weight = -1;
  for (const auto& keyword : keywords) {
    const auto index = lower.find(keyword.lower);
    if (index == std::u32string::npos) continue;
    const int weight = static_cast<int>(std::min<std::size_t>(10, keyword.text.size())) * 10 + std::min(5, keyword.count);
    if (best_index == std::u32string::npos || index < best_index || (index == best_index && weight > best_weight)) {
      best_index  = index;
      best_weight = weight;
    }
  }

  if (best_index == std::u32string::npos) {
    if (clean.size() <= kExcerptChars) return clean;
    return clean.substr(0, kExcerptChars) + kEllipsis;
  }

  const std::size_t start = best_index > kExcerptLeadChars ? best_index - kExcerptLeadChars : 0;
  const std::size_t end   = std::min(clean.size(), start + kExcerptChars);
  std::u32string    slice = clean.substr(start, end - start);
  if (start > 0) slice.insert(slice.begin(), kEllipsis);
  if (end < clean.size()) slice.push_back(kEllipsis);
  return slice;
}

} // namespace

std::vector<HeadingAnchor> ExtractHeadingAnchors(std::string_view markdown) {
  return ExtractAnchors(SplitLines(markdown));
}

std::vector<Keyword> ExtractKeywords(std::string_view answer_text) {
  const auto answer = text::NormalizeWhitespace(text::DecodeUtf8(std::string(answer_text)));

  std::vector<Keyword>                            entries;
  std::unordered_map<std::u32string, std::size_t> by_lower;
  auto                                            add = [&](std::u32string token) {
    token = text::Trim(token);
    if (token.size() < 2) return;
    if (token.size() > kMaxKeywordChars) token.resize(kMaxKeywordChars);
    auto lower       = text::ToLower(token);
    auto [it, fresh] = by_lower.try_emplace(lower, entries.size());
    if (fresh) {
      entries.push_back(Keyword{std::move(token), std::move(lower), 0});
    }
    entries[it->second].count += 1;
  };

  // CJK runs first, then Latin words and digit runs, preserving first-seen order.
  for (std::size_t i = 0; i < answer.size();) {
    std::size_t j = i;
    while (j < answer.size() && text::IsCjkIdeograph(answer[j])) ++j;
    if (j - i >= 2) add(answer.substr(i, j - i));
    i = (j == i) ? i + 1 : j;
  }
  for (std::size_t i = 0; i < answer.size();) {
    std::size_t j = i;
    if (text::IsAsciiLetter(answer[i])) {
      while (j < answer.size() && text::IsAsciiLetter(answer[j])) ++j;
      if (j - i >= 3) add(answer.substr(i, j - i));
    } else if (text::IsAsciiDigit(answer[i])) {
      while (j < answer.size() && text::IsAsciiDigit(answer[j])) ++j;
      if (j - i >= 2) add(answer.substr(i, j - i));
    }
    i = (j == i) ? i + 1 : j;
  }

  auto weight = [](const Keyword& k) { return k.count * static_cast<int>(std::min<std::size_t>(8, k.text.size())); };
  std::stable_sort(entries.begin(), entries.end(), [&](const Keyword& a, const Keyword& b) { return weight(a) > weight(b); });
  if (entries.size() > kMaxKeywords) entries.resize(kMaxKeywords);
  return entries;
}

std::string CleanMarkdownText(std::string_view paragraph) {
  return text::EncodeUtf8(CleanToText(text::DecodeUtf8(std::string(paragraph))));
}

CitationExtractor::CitationExtractor(int max_citations) : max_citations_(std::clamp(max_citations, 0, kMaxCitationsLimit)) {
}

std::vector<Citation> CitationExtractor::Extract(std::string_view document_markdown, std::string_view answer_text) const {
  std::vector<Citation> citations;
  if (max_citations_ == 0) return citations;
  if (IsBlank(text::DecodeUtf8(std::string(document_markdown)))) return citations;
  if (IsBlank(text::DecodeUtf8(std::string(answer_text)))) return citations;

  const auto lines   = SplitLines(document_markdown);
  const auto anchors = ExtractAnchors(lines);
  if (anchors.empty()) return citations;

  std::vector<Candidate> candidates;
  for (std::size_t h = 0; h < anchors.size(); ++h) {
    const std::size_t start = anchors[h].line_index + 1;
    const std::size_t end   = h + 1 < anchors.size() ? anchors[h + 1].line_index : lines.size();
    if (start >= lines.size() || end <= start) continue;

    const std::vector<std::u32string> body(lines.begin() + static_cast<std::ptrdiff_t>(start), lines.begin() + static_cast<std::ptrdiff_t>(end));
    for (const auto& paragraph : SplitParagraphs(body)) {
      if (paragraph.size() < kMinRawParagraphChars) continue;
      auto clean = CleanToText(paragraph);
      if (clean.size() < kMinCleanParagraphChars) continue;
      candidates.push_back(Candidate{&anchors[h], std::move(clean)});
    }
  }
  if (candidates.empty()) return citations;

  const auto keywords = ExtractKeywords(answer_text);
  if (keywords.empty()) return citations;

  std::unordered_map<const HeadingAnchor*, std::u32string> heading_lower;
  std::vector<Scored>                                      scored;
  for (const auto& candidate : candidates) {
    auto [it, fresh] = heading_lower.try_emplace(candidate.heading);
    if (fresh) it->second = text::ToLower(text::DecodeUtf8(candidate.heading->title));

    const double score = ScoreCandidate(candidate, it->second, keywords);
    if (score <= 0) continue;
    scored.push_back(Scored{&candidate, score});
  }
  if (scored.empty()) return citations;

  std::stable_sort(scored.begin(), scored.end(), [](const Scored& a, const Scored& b) { return a.score > b.score; });
  const std::size_t pool = std::min(scored.size(), static_cast<std::size_t>(max_citations_) * 3);

  std::unordered_set<std::string> seen;
  int                             rank = 1;
  for (std::size_t i = 0; i < pool && citations.size() < static_cast<std::size_t>(max_citations_); ++i) {
    const auto& entry   = scored[i];
    const auto  excerpt = BuildExcerpt(entry.candidate->clean, keywords);
    if (IsBlank(excerpt)) continue;

    const auto key = entry.candidate->heading->id + "::" + text::EncodeUtf8(text::NormalizeWhitespace(excerpt));
    if (!seen.insert(key).second) continue;

    Citation citation;
    citation.heading_title = entry.candidate->heading->title;
    citation.heading_id    = entry.candidate->heading->id;
    citation.excerpt       = text::EncodeUtf8(excerpt);
    citation.score         = std::nearbyint(entry.score * 10000.0) / 10000.0;
    citation.rank          = rank++;
    citations.push_back(std::move(citation));
  }
  return citations;
}

} // namespace prdchat::citation
