#include "internal/markdown/block_tokenizer.hpp"

#include <utility>

#include "internal/text/unicode.hpp"
#include "internal/text/utf8.hpp"
#include "internal/util/uuid.hpp"

namespace prdchat::markdown {

namespace {

bool IsAsciiSpace(char c) {
  return c == ' ' || c == '\t' || c == '\v' || c == '\f' || c == '\r';
}

bool IsDigit(char c) {
  return c >= '0' && c <= '9';
}

// "<marker><space><at least one char>", marker ending at `pos`.
bool HasSpaceThenText(std::string_view line, std::size_t pos) {
  return pos < line.size() && IsAsciiSpace(line[pos]) && line.size() > pos + 1;
}

std::optional<std::string> FenceLanguage(std::string_view fence_line) {
  auto lang = text::EncodeUtf8(text::Trim(text::DecodeUtf8(std::string(fence_line.substr(3)))));
  if (lang.empty()) return std::nullopt;
  return lang;
}

BlockToken Start(const std::string& id, BlockKind kind, const std::optional<std::string>& language = std::nullopt) {
  return BlockToken{BlockTokenType::kStart, id, kind, {}, language};
}

BlockToken Delta(const std::string& id, BlockKind kind, std::string content, const std::optional<std::string>& language = std::nullopt) {
  return BlockToken{BlockTokenType::kDelta, id, kind, std::move(content), language};
}

BlockToken End(const std::string& id, BlockKind kind, const std::optional<std::string>& language = std::nullopt) {
  return BlockToken{BlockTokenType::kEnd, id, kind, {}, language};
}

} // namespace

const char* BlockKindName(BlockKind kind) {
  switch (kind) {
    case BlockKind::kParagraph:
      return "paragraph";
    case BlockKind::kHeading:
      return "heading";
    case BlockKind::kListItem:
      return "listItem";
    case BlockKind::kCodeBlock:
      return "codeBlock";
  }
  return "paragraph";
}

bool IsFenceLine(std::string_view line) {
  return line.substr(0, 3) == "```";
}

bool IsHeadingLine(std::string_view line) {
  std::size_t hashes = 0;
  while (hashes < line.size() && line[hashes] == '#') ++hashes;
  if (hashes == 0 || hashes > 6) return false;
  return HasSpaceThenText(line, hashes);
}

bool IsListItemLine(std::string_view line) {
  if (line.empty()) return false;
  if (line[0] == '-' || line[0] == '*' || line[0] == '+') {
    return HasSpaceThenText(line, 1);
  }

  std::size_t digits = 0;
  while (digits < line.size() && IsDigit(line[digits])) ++digits;
  if (digits == 0 || digits >= line.size() || line[digits] != '.') return false;
  return HasSpaceThenText(line, digits + 1);
}

bool IsBlankLine(std::string_view line) {
  for (char32_t cp : text::DecodeUtf8(std::string(line))) {
    if (!text::IsWhitespace(cp)) return false;
  }
  return true;
}

BlockTokenizer::BlockTokenizer() : BlockTokenizer(&util::NewId) {
}

BlockTokenizer::BlockTokenizer(IdGenerator id_generator) : next_id_(std::move(id_generator)) {
}

std::vector<BlockToken> BlockTokenizer::Push(std::string_view delta) {
  std::vector<BlockToken> out;
  if (delta.empty()) return out;

  line_buffer_.append(delta);

  std::size_t consumed = 0;
  for (auto nl = line_buffer_.find('\n', consumed); nl != std::string::npos; nl = line_buffer_.find('\n', consumed)) {
    std::string line = line_buffer_.substr(consumed, nl - consumed);
    consumed         = nl + 1;
    ProcessLine(std::move(line), out);
  }
  line_buffer_.erase(0, consumed);
  return out;
}

std::vector<BlockToken> BlockTokenizer::Flush() {
  std::vector<BlockToken> out;

  if (!line_buffer_.empty()) {
    std::string line;
    line.swap(line_buffer_);
    ProcessLine(std::move(line), out);
  }

  if (in_code_block_ && open_code_id_) {
    out.push_back(End(*open_code_id_, BlockKind::kCodeBlock, open_code_language_));
  }
  in_code_block_ = false;
  open_code_id_.reset();
  open_code_language_.reset();

  CloseParagraph(out);
  return out;
}

void BlockTokenizer::CloseParagraph(std::vector<BlockToken>& out) {
  if (open_paragraph_id_) {
    out.push_back(End(*open_paragraph_id_, BlockKind::kParagraph));
    open_paragraph_id_.reset();
  }
}

void BlockTokenizer::ProcessLine(std::string line, std::vector<BlockToken>& out) {
  while (!line.empty() && line.back() == '\r') line.pop_back();

  if (in_code_block_) {
    if (IsFenceLine(line)) {
      if (open_code_id_) out.push_back(End(*open_code_id_, BlockKind::kCodeBlock, open_code_language_));
      in_code_block_ = false;
      open_code_id_.reset();
      open_code_language_.reset();
      return;
    }
    if (!open_code_id_) {
      open_code_id_ = next_id_();
      out.push_back(Start(*open_code_id_, BlockKind::kCodeBlock, open_code_language_));
    }
    out.push_back(Delta(*open_code_id_, BlockKind::kCodeBlock, line + "\n", open_code_language_));
    return;
  }

  if (IsBlankLine(line)) {
    CloseParagraph(out);
    return;
  }

  const bool fence   = IsFenceLine(line);
  const bool heading = !fence && IsHeadingLine(line);
  const bool item    = !fence && !heading && IsListItemLine(line);
  if (fence || heading || item) {
    CloseParagraph(out);
  }

  if (fence) {
    in_code_block_      = true;
    open_code_language_ = FenceLanguage(line);
    open_code_id_       = next_id_();
    out.push_back(Start(*open_code_id_, BlockKind::kCodeBlock, open_code_language_));
    return;
  }

  if (heading || item) {
    const auto kind = heading ? BlockKind::kHeading : BlockKind::kListItem;
    const auto id   = next_id_();
    out.push_back(Start(id, kind));
    out.push_back(Delta(id, kind, line + "\n"));
    out.push_back(End(id, kind));
    return;
  }

  if (!open_paragraph_id_) {
    open_paragraph_id_ = next_id_();
    out.push_back(Start(*open_paragraph_id_, BlockKind::kParagraph));
  }
  out.push_back(Delta(*open_paragraph_id_, BlockKind::kParagraph, line + "\n"));
}

} // namespace prdchat::markdown
