#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace prdchat::citation {

inline constexpr int kDefaultMaxCitations = 12;
inline constexpr int kMaxCitationsLimit   = 50;

struct Citation {
  std::string heading_title;
  std::string heading_id;
  std::string excerpt;
  double      score = 0; // rounded to 4 decimals
  int         rank  = 0; // 1-based
};

struct HeadingAnchor {
  int         level = 0;
  std::string title;
  std::string id;
  std::size_t line_index = 0;
};

struct Keyword {
  std::u32string text;  // first-seen casing, at most 24 codepoints
  std::u32string lower;
  int            count = 0;
};

/*
  Maps a finished answer back to excerpts of the source document.

  Headings are read straight from the raw markdown so heading ids match
  the viewer's anchors. Each heading's body is split into paragraphs,
  scored against keywords taken from the answer, and the best ones are
  returned as bounded excerpts. Never throws on content; an empty result
  means nothing traceable was found.
*/
class CitationExtractor {
 public:
  explicit CitationExtractor(int max_citations = kDefaultMaxCitations);

  std::vector<Citation> Extract(std::string_view document_markdown, std::string_view answer_text) const;

  int MaxCitations() const {
    return max_citations_;
  }

 private:
  int max_citations_;
};

// Headings outside fenced code, in document order, with collision-resolved ids.
std::vector<HeadingAnchor> ExtractHeadingAnchors(std::string_view markdown);

// CJK runs (>= 2) and Latin (>= 3) / digit (>= 2) runs, top 40 by count * min(len, 8).
std::vector<Keyword> ExtractKeywords(std::string_view answer_text);

// Markdown paragraph reduced to plain text with whitespace collapsed.
std::string CleanMarkdownText(std::string_view paragraph);

} // namespace prdchat::citation
