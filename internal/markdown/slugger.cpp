#include "internal/markdown/slugger.hpp"

#include "internal/text/unicode.hpp"
#include "internal/text/utf8.hpp"

namespace prdchat::markdown {

std::string BaseSlug(std::string_view heading_text) {
  const auto lowered = text::ToLower(text::Trim(text::DecodeUtf8(std::string(heading_text))));

  std::u32string slug;
  slug.reserve(lowered.size());
  for (char32_t cp : lowered) {
    if (text::IsWhitespace(cp) || cp == U'-') {
      // collapse runs and drop leading hyphens as we go
      if (!slug.empty() && slug.back() != U'-') slug.push_back(U'-');
      continue;
    }
    if (cp == U'_' || text::IsLetterNumberOrMark(cp)) {
      slug.push_back(cp);
    }
  }
  while (!slug.empty() && slug.back() == U'-') slug.pop_back();

  return text::EncodeUtf8(slug);
}

std::string HeadingSlugger::Slug(std::string_view heading_text) {
  auto base = BaseSlug(heading_text);
  if (base.empty()) base = "section";

  auto [it, inserted] = seen_.try_emplace(base, 0);
  if (inserted) {
    return base;
  }
  it->second += 1;
  return base + "-" + std::to_string(it->second);
}

} // namespace prdchat::markdown
