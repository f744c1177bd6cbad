#include "internal/markdown/block_tokenizer.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace {

using prdchat::markdown::BlockKind;
using prdchat::markdown::BlockToken;
using prdchat::markdown::BlockTokenizer;
using prdchat::markdown::BlockTokenType;

BlockTokenizer MakeTokenizer() {
  auto counter = std::make_shared<int>(0);
  return BlockTokenizer([counter] { return "b" + std::to_string(++*counter); });
}

void Append(std::vector<BlockToken>& out, std::vector<BlockToken> tokens) {
  out.insert(out.end(), tokens.begin(), tokens.end());
}

std::string Concat(const std::vector<BlockToken>& tokens) {
  std::string joined;
  for (const auto& token : tokens) {
    if (token.type == BlockTokenType::kDelta) joined += token.content;
  }
  return joined;
}

void TestHeadingThenParagraph() {
  auto                    tokenizer = MakeTokenizer();
  std::vector<BlockToken> tokens;
  Append(tokens, tokenizer.Push("## Title\n"));
  Append(tokens, tokenizer.Push("Some text\nMore text\n\n"));

  assert(tokens.size() == 7);

  assert(tokens[0].type == BlockTokenType::kStart && tokens[0].kind == BlockKind::kHeading);
  assert(tokens[1].type == BlockTokenType::kDelta && tokens[1].content == "## Title\n");
  assert(tokens[2].type == BlockTokenType::kEnd && tokens[2].block_id == tokens[0].block_id);

  assert(tokens[3].type == BlockTokenType::kStart && tokens[3].kind == BlockKind::kParagraph);
  assert(tokens[4].content == "Some text\n");
  assert(tokens[5].content == "More text\n");
  assert(tokens[6].type == BlockTokenType::kEnd && tokens[6].block_id == tokens[3].block_id);
  assert(tokens[3].block_id != tokens[0].block_id);

  assert(tokenizer.Flush().empty());
}

void TestPartialLinesAreBuffered() {
  auto tokenizer = MakeTokenizer();
  assert(tokenizer.Push("# Hea").empty());
  assert(tokenizer.Push("ding").empty());

  auto tokens = tokenizer.Push(" one\n");
  assert(tokens.size() == 3);
  assert(tokens[0].kind == BlockKind::kHeading);
  assert(tokens[1].content == "# Heading one\n");
}

void TestListItemsAreSingleLineBlocks() {
  auto tokenizer = MakeTokenizer();
  auto tokens    = tokenizer.Push("intro\n- first\n12. second\n-not an item\n");

  assert(tokens[0].kind == BlockKind::kParagraph && tokens[0].type == BlockTokenType::kStart);
  assert(tokens[1].content == "intro\n");
  assert(tokens[2].type == BlockTokenType::kEnd);

  assert(tokens[3].kind == BlockKind::kListItem && tokens[4].content == "- first\n");
  assert(tokens[6].kind == BlockKind::kListItem && tokens[7].content == "12. second\n");

  assert(tokens[9].kind == BlockKind::kParagraph && tokens[9].type == BlockTokenType::kStart);
  assert(tokens[10].content == "-not an item\n");
  assert(tokens.size() == 11);

  auto tail = tokenizer.Flush();
  assert(tail.size() == 1 && tail[0].type == BlockTokenType::kEnd);
}

void TestFencedCodeKeepsMarkdownVerbatim() {
  auto tokenizer = MakeTokenizer();
  auto tokens    = tokenizer.Push("```cpp\n# not a heading\n\n- not an item\n```\n");

  assert(tokens.front().type == BlockTokenType::kStart);
  assert(tokens.front().kind == BlockKind::kCodeBlock);
  assert(tokens.front().language.value() == "cpp");

  std::vector<std::string> contents;
  for (const auto& token : tokens) {
    assert(token.kind == BlockKind::kCodeBlock);
    assert(token.language.value() == "cpp");
    if (token.type == BlockTokenType::kDelta) contents.push_back(token.content);
  }
  assert((contents == std::vector<std::string>{"# not a heading\n", "\n", "- not an item\n"}));
  assert(tokens.back().type == BlockTokenType::kEnd);
  assert(!tokenizer.InCodeBlock());
}

void TestFlushClosesOpenBlocks() {
  auto tokenizer = MakeTokenizer();
  auto tokens    = tokenizer.Push("```\nint x;\n");
  assert(tokenizer.InCodeBlock());
  assert(!tokens.front().language.has_value());

  auto tail = tokenizer.Flush();
  assert(tail.size() == 1);
  assert(tail[0].type == BlockTokenType::kEnd && tail[0].kind == BlockKind::kCodeBlock);

  auto paragraph = MakeTokenizer();
  assert(paragraph.Push("no trailing newline").empty());
  auto flushed = paragraph.Flush();
  assert(flushed.size() == 3);
  assert(flushed[1].content == "no trailing newline\n");
  assert(flushed[2].type == BlockTokenType::kEnd);
}

void TestNoCharactersAreLost() {
  const std::string answer = "# Plan\nFirst line\nsecond line\n\n* bullet\n```py\nprint(1)\n```\ntrailing words";

  // Feed in awkward chunk sizes, including splits inside lines.
  for (std::size_t chunk = 1; chunk <= 7; ++chunk) {
    auto                    tokenizer = MakeTokenizer();
    std::vector<BlockToken> tokens;
    for (std::size_t i = 0; i < answer.size(); i += chunk) {
      Append(tokens, tokenizer.Push(answer.substr(i, chunk)));
    }
    Append(tokens, tokenizer.Flush());

    assert(Concat(tokens) == "# Plan\nFirst line\nsecond line\n* bullet\nprint(1)\ntrailing words\n");

    int open = 0;
    for (const auto& token : tokens) {
      if (token.type == BlockTokenType::kStart) ++open;
      if (token.type == BlockTokenType::kEnd) --open;
      assert(open == 0 || open == 1);
    }
    assert(open == 0);
  }
}

void TestCarriageReturnsAreStripped() {
  auto tokenizer = MakeTokenizer();
  auto tokens    = tokenizer.Push("line one\r\n\r\n");
  assert(tokens.size() == 3);
  assert(tokens[1].content == "line one\n");
}

} // namespace

int main() {
  TestHeadingThenParagraph();
  TestPartialLinesAreBuffered();
  TestListItemsAreSingleLineBlocks();
  TestFencedCodeKeepsMarkdownVerbatim();
  TestFlushClosesOpenBlocks();
  TestNoCharactersAreLost();
  TestCarriageReturnsAreStripped();

  std::cout << "prdchat_unit_block_tokenizer: pass\n";
  return 0;
}
