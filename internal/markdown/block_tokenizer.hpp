#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace prdchat::markdown {

enum class BlockKind {
  kParagraph,
  kHeading,
  kListItem,
  kCodeBlock,
};

enum class BlockTokenType {
  kStart,
  kDelta,
  kEnd,
};

const char* BlockKindName(BlockKind kind);

/*
  One step of incremental rendering.

  content is set on kDelta only and always ends with '\n'. language is
  set on every event of a code block opened with a fence tag.
*/
struct BlockToken {
  BlockTokenType             type = BlockTokenType::kDelta;
  std::string                block_id;
  BlockKind                  kind = BlockKind::kParagraph;
  std::string                content;
  std::optional<std::string> language;
};

/*
  Splits a streamed markdown answer into renderable blocks.

  Input is buffered until a full line is available, so a line's kind is
  never decided on a partial token. Per line, in priority order:

    1. inside a ``` fence: every line is code; a fence line closes it
    2. blank line: closes the open paragraph
    3. heading / bullet / ordered item: closes the paragraph, then
       emits start, delta, end for the single line
    4. ``` line: opens a code block (text after the fence is the language)
    5. anything else: appended to the open paragraph, opening one if needed

  Fence lines and blank lines carry no content. Flush() processes the
  trailing partial line and closes whatever is still open. Not
  thread-safe; one tokenizer per streamed answer.
*/
class BlockTokenizer {
 public:
  using IdGenerator = std::function<std::string()>;

  BlockTokenizer();
  explicit BlockTokenizer(IdGenerator id_generator);

  std::vector<BlockToken> Push(std::string_view delta);
  std::vector<BlockToken> Flush();

  bool InCodeBlock() const {
    return in_code_block_;
  }

 private:
  void ProcessLine(std::string line, std::vector<BlockToken>& out);
  void CloseParagraph(std::vector<BlockToken>& out);

  IdGenerator                next_id_;
  std::string                line_buffer_;
  bool                       in_code_block_ = false;
  std::optional<std::string> open_paragraph_id_;
  std::optional<std::string> open_code_id_;
  std::optional<std::string> open_code_language_;
};

// Line classifiers, exposed for the citation extractor and tests.
bool IsFenceLine(std::string_view line);
bool IsHeadingLine(std::string_view line);
bool IsListItemLine(std::string_view line);
bool IsBlankLine(std::string_view line);

} // namespace prdchat::markdown
