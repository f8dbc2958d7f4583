#include <Marginalia/LineMap.hpp>
#include <algorithm>

namespace Marginalia {

LineMap::LineMap(std::string text) : text_(std::move(text)) {
    lineStarts_.push_back(0);
    for(size_t i = 0; i < text_.size(); ++i){
        if(text_[i] == '\n') lineStarts_.push_back(static_cast<int64_t>(i + 1));
    }
}

LineColumn LineMap::offsetToLineColumn(int64_t offset) const {
    const int64_t len = static_cast<int64_t>(text_.size());
    offset = std::max<int64_t>(0, std::min(offset, len));
    auto it = std::upper_bound(lineStarts_.begin(), lineStarts_.end(), offset);
    const size_t lineIndex = static_cast<size_t>(std::distance(lineStarts_.begin(), it)) - 1;
    return LineColumn{static_cast<int64_t>(lineIndex) + 1, offset - lineStarts_[lineIndex] + 1};
}

int64_t LineMap::lineColumnToOffset(const LineColumn& pos) const {
    const int64_t lineIndex = std::max<int64_t>(0, std::min(pos.line - 1, getLineCount() - 1));
    const int64_t lineStart = lineStarts_[static_cast<size_t>(lineIndex)];
    const int64_t lineEnd = lineIndex + 1 < getLineCount()
        ? lineStarts_[static_cast<size_t>(lineIndex + 1)] - 1
        : static_cast<int64_t>(text_.size());
    const int64_t lineLength = lineEnd - lineStart + 1;
    const int64_t column = std::max<int64_t>(1, std::min(pos.column, lineLength));
    return lineStart + column - 1;
}

std::string LineMap::getLine(int64_t lineNumber) const {
    const int64_t lineIndex = lineNumber - 1;
    if(lineIndex < 0 || lineIndex >= getLineCount()) return std::string();
    const int64_t start = lineStarts_[static_cast<size_t>(lineIndex)];
    const int64_t end = lineIndex + 1 < getLineCount()
        ? lineStarts_[static_cast<size_t>(lineIndex + 1)] - 1
        : static_cast<int64_t>(text_.size());
    return text_.substr(static_cast<size_t>(start), static_cast<size_t>(end - start));
}

int64_t LineMap::getLineStart(int64_t lineNumber) const {
    return lineColumnToOffset(LineColumn{lineNumber, 1});
}

std::optional<TextEdit> computeTextEdit(const std::string& oldText, const std::string& newText){
    if(oldText == newText) return std::nullopt;
    const size_t oldLen = oldText.size();
    const size_t newLen = newText.size();

    size_t prefix = 0;
    const size_t maxPrefix = std::min(oldLen, newLen);
    while(prefix < maxPrefix && oldText[prefix] == newText[prefix]) ++prefix;

    // suffix may not eat into the prefix
    size_t suffix = 0;
    const size_t maxSuffix = std::min(oldLen - prefix, newLen - prefix);
    while(suffix < maxSuffix && oldText[oldLen - 1 - suffix] == newText[newLen - 1 - suffix]) ++suffix;

    TextEdit edit;
    edit.offset = static_cast<int64_t>(prefix);
    edit.deleteCount = static_cast<int64_t>(oldLen - prefix - suffix);
    edit.insertText = newText.substr(prefix, newLen - suffix - prefix);
    return edit;
}

int64_t adjustOffset(int64_t offset, const TextEdit& edit){
    if(offset <= edit.offset) return offset;
    if(offset < edit.offset + edit.deleteCount) return edit.offset;
    return offset + edit.insertLength() - edit.deleteCount;
}

std::optional<Range> findExactPosition(const std::string& content, const std::string& needle, int64_t approximateOffset, int64_t lineNumber){
    const int64_t needleLen = static_cast<int64_t>(needle.size());
    if(approximateOffset >= 0 && approximateOffset + needleLen <= static_cast<int64_t>(content.size())){
        if(content.compare(static_cast<size_t>(approximateOffset), needle.size(), needle) == 0){
            return Range(approximateOffset, approximateOffset + needleLen);
        }
    }

    LineMap lineMap(content);
    auto searchLine = [&](int64_t line) -> std::optional<Range> {
        if(line < 1 || line > lineMap.getLineCount()) return std::nullopt;
        const size_t idx = lineMap.getLine(line).find(needle);
        if(idx == std::string::npos) return std::nullopt;
        const int64_t start = lineMap.getLineStart(line) + static_cast<int64_t>(idx);
        return Range(start, start + needleLen);
    };

    if(auto hit = searchLine(lineNumber)) return hit;
    for(int64_t delta = 1; delta <= 2; ++delta){
        if(auto hit = searchLine(lineNumber - delta)) return hit;
        if(auto hit = searchLine(lineNumber + delta)) return hit;
    }

    const size_t global = content.find(needle);
    if(global == std::string::npos) return std::nullopt;
    return Range(static_cast<int64_t>(global), static_cast<int64_t>(global) + needleLen);
}

} // namespace Marginalia
