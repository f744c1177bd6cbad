#include "internal/citation/citation_extractor.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/markdown/slugger.hpp"

namespace {

using prdchat::citation::CitationExtractor;

const char* kDocument = R"(# Overview
The checkout flow lets shoppers pay with saved cards.

## Payments
Refunds are processed within five business days by the payments team.

```sql
# Not a heading
```

# Overview
Second overview paragraph about onboarding emails.
)";

void TestDuplicateHeadingsGetSuffixedIds() {
  const auto anchors = prdchat::citation::ExtractHeadingAnchors(kDocument);
  assert(anchors.size() == 3);
  assert(anchors[0].id == "overview" && anchors[0].level == 1);
  assert(anchors[1].id == "payments" && anchors[1].level == 2);
  assert(anchors[2].id == "overview-1" && anchors[2].title == "Overview");
}

void TestSlugger() {
  using prdchat::markdown::BaseSlug;
  assert(BaseSlug("Hello, World!") == "hello-world");
  assert(BaseSlug("  Release -- Plan  ") == "release-plan");
  assert(BaseSlug("snake_case stays") == "snake_case-stays");
  assert(BaseSlug("!!!").empty());

  prdchat::markdown::HeadingSlugger slugger;
  assert(slugger.Slug("!!!") == "section");
  assert(slugger.Slug("???") == "section-1");
  assert(slugger.Slug("Goals") == "goals");
  assert(slugger.Slug("Goals") == "goals-1");
  assert(slugger.Slug("goals") == "goals-2");
  slugger.Reset();
  assert(slugger.Slug("Goals") == "goals");
}

void TestClosingHashesAreDropped() {
  const auto anchors = prdchat::citation::ExtractHeadingAnchors("## Scope ##\n#NoSpace\n###    \n");
  assert(anchors.size() == 1);
  assert(anchors[0].title == "Scope");
  assert(anchors[0].id == "scope");
}

void TestExtractFindsMatchingParagraph() {
  CitationExtractor extractor;
  const auto        citations = extractor.Extract(kDocument, "Refunds take five business days.");

  assert(citations.size() == 1);
  assert(citations[0].heading_id == "payments");
  assert(citations[0].heading_title == "Payments");
  assert(citations[0].rank == 1);
  assert(citations[0].score == 20.0);
  assert(citations[0].excerpt == "Refunds are processed within five business days by the payments team.");
}

void TestExcerptIsWindowedAroundFirstKeyword() {
  std::string body(100, 'a');
  body += " budget ";
  body += std::string(400, 'b');
  const std::string document = "# Costs\n" + body + "\n";

  CitationExtractor extractor;
  const auto        citations = extractor.Extract(document, "What is the budget?");
  assert(citations.size() == 1);

  const auto& excerpt = citations[0].excerpt;
  assert(excerpt.rfind("…", 0) == 0);
  assert(excerpt.find("budget") != std::string::npos);
  assert(excerpt.size() >= 3 && excerpt.compare(excerpt.size() - 3, 3, "…") == 0);
}

void TestNothingTraceable() {
  CitationExtractor extractor;
  assert(extractor.Extract("", "anything here").empty());
  assert(extractor.Extract(kDocument, "   ").empty());
  assert(extractor.Extract("no headings but plenty of words about refunds", "refunds").empty());
  assert(extractor.Extract(kDocument, "zebra giraffe").empty());

  CitationExtractor disabled(0);
  assert(disabled.Extract(kDocument, "Refunds take five business days.").empty());
}

void TestMaxCitationsIsClamped() {
  assert(CitationExtractor(-3).MaxCitations() == 0);
  assert(CitationExtractor(100).MaxCitations() == 50);
  assert(CitationExtractor().MaxCitations() == 12);
}

void TestKeywords() {
  const auto keywords = prdchat::citation::ExtractKeywords("Payment payment PAYMENT flow 2024 x 7 支付系统");
  assert(keywords.size() == 4);
  assert(keywords[0].text == U"Payment");
  assert(keywords[0].count == 3);
  assert(keywords[1].text == U"支付系统");
  assert(keywords[2].text == U"flow");
  assert(keywords[3].text == U"2024");
}

void TestCleanMarkdownText() {
  assert(prdchat::citation::CleanMarkdownText("> **Bold** and `code` see [docs](http://x) | cell") == "Bold and code see docs cell");
  assert(prdchat::citation::CleanMarkdownText("- item with ![alt](img.png)") == "item with alt");
}

} // namespace

int main() {
  TestDuplicateHeadingsGetSuffixedIds();
  TestSlugger();
  TestClosingHashesAreDropped();
  TestExtractFindsMatchingParagraph();
  TestExcerptIsWindowedAroundFirstKeyword();
  TestNothingTraceable();
  TestMaxCitationsIsClamped();
  TestKeywords();
  TestCleanMarkdownText();

  std::cout << "prdchat_unit_citation_extractor: pass\n";
  return 0;
}
