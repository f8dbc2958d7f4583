#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <Marginalia/Range.hpp>
#include <Marginalia/Types.hpp>

namespace Marginalia {

// Offset <-> line/column conversion over an immutable snapshot of a document.
// Offsets are byte offsets; lines and columns are 1-indexed.
class LineMap {
public:
    explicit LineMap(std::string text);

    // Out-of-range offsets are clamped to the document.
    LineColumn offsetToLineColumn(int64_t offset) const;
    // Out-of-range lines and columns are clamped; column may address the position just past the line end.
    int64_t lineColumnToOffset(const LineColumn& pos) const;

    // Line text without its newline; empty for a line that does not exist.
    std::string getLine(int64_t lineNumber) const;
    int64_t getLineStart(int64_t lineNumber) const;
    int64_t getLineCount() const { return static_cast<int64_t>(lineStarts_.size()); }
    const std::string& getText() const { return text_; }
    const std::vector<int64_t>& lineStarts() const { return lineStarts_; }

private:
    std::string text_;
    std::vector<int64_t> lineStarts_;
};

// Single contiguous replacement turning one text into another.
struct TextEdit {
    int64_t offset = 0;
    int64_t deleteCount = 0;
    std::string insertText;

    int64_t insertLength() const { return static_cast<int64_t>(insertText.size()); }
};

// Minimal edit found by trimming the common prefix and suffix; nullopt when the texts are equal.
std::optional<TextEdit> computeTextEdit(const std::string& oldText, const std::string& newText);

// Where a caret at offset ends up after edit.
int64_t adjustOffset(int64_t offset, const TextEdit& edit);

// Locates needle near where it is expected: at the offset, then on its line, then up to two lines
// away, then anywhere in content.
std::optional<Range> findExactPosition(const std::string& content, const std::string& needle, int64_t approximateOffset, int64_t lineNumber);

} // namespace Marginalia
