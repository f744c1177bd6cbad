#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

namespace prdchat::markdown {

// Anchor slug for one heading text, without duplicate suffixing.
// Empty when nothing survives; HeadingSlugger substitutes "section".
std::string BaseSlug(std::string_view heading_text);

/*
  Order-sensitive heading slugger.

  The first heading with a given base slug gets the base itself; later
  ones get base-1, base-2, ... in document order. Must agree byte for
  byte with the anchors the document viewer renders, so one instance is
  used per document pass and headings are fed in document order.
*/
class HeadingSlugger {
 public:
  std::string Slug(std::string_view heading_text);

  void Reset() {
    seen_.clear();
  }

 private:
  std::unordered_map<std::string, int> seen_;
};

} // namespace prdchat::markdown
