#include "editcore/text/flat_text_store.h"
#include "editcore/text/position_codec.h"
#include "editcore/text/unicode.h"
#include "editcore/core/logging.h"

#include <algorithm>

namespace editcore::text {

TextError FlatTextStore::lineBytes(std::size_t line, ByteRange& out) const {
    if (line != 0) return TextError::InvalidBoundary;
    out = ByteRange{0, text_.size()};
    return TextError::Ok;
}

TextError FlatTextStore::lineBytesWithTerminator(std::size_t line, ByteRange& out) const {
    return lineBytes(line, out);
}

TextError FlatTextStore::graphemes(ByteRange range, GraphemeIterator& out) const {
    if (range.end < range.start) return TextError::InvalidRange;
    if (range.end > text_.size()) return TextError::InvalidBoundary;
    out = GraphemeIterator(std::make_unique<ContiguousChunkSource>(text_), range);
    return TextError::Ok;
}

bool FlatTextStore::isGraphemeBoundary(std::size_t offset) const {
    return unicode::isGraphemeBoundary(text_, offset);
}

TextError FlatTextStore::insert(std::size_t offset, std::string_view text, EditDelta& out) {
    if (offset > text_.size() || !isGraphemeBoundary(offset)) {
        EDITCORE_LOG_WARN("FlatTextStore::insert rejected offset %zu (len %zu)", offset, text_.size());
        return TextError::InvalidBoundary;
    }
    if (text.empty()) return TextError::EmptyOperation;

    text_.insert(offset, text.data(), text.size());

    out = EditDelta{};
    out.offset = offset;
    out.insertedBytes = text.size();
    out.line = 0;
    return TextError::Ok;
}

TextError FlatTextStore::remove(ByteRange range, std::string& removed, EditDelta& out) {
    const TextError err = checkRange(range);
    if (err != TextError::Ok) {
        if (err != TextError::EmptyOperation) {
            EDITCORE_LOG_WARN("FlatTextStore::remove rejected [%zu, %zu)", range.start, range.end);
        }
        return err;
    }

    removed.assign(text_, range.start, range.size());
    text_.erase(range.start, range.size());

    out = EditDelta{};
    out.offset = range.start;
    out.removedBytes = range.size();
    out.line = 0;
    return TextError::Ok;
}

TextError FlatTextStore::byteToPosition(std::size_t offset, TextPosition& out) const {
    if (offset > text_.size()) return TextError::InvalidBoundary;
    std::size_t column = 0;
    const TextError err = codec::byteToGraphemeIndex(text_, offset, column);
    if (err != TextError::Ok) return err;
    out = TextPosition{0, column};
    return TextError::Ok;
}

TextError FlatTextStore::positionToByte(TextPosition pos, std::size_t& out) const {
    if (pos.line != 0) return TextError::InvalidBoundary;
    return codec::graphemeIndexToByte(text_, pos.column, out);
}

std::string FlatTextStore::slice(ByteRange range) const {
    const std::size_t start = std::min(range.start, text_.size());
    const std::size_t end = std::min(std::max(range.end, start), text_.size());
    return text_.substr(start, end - start);
}

} // namespace editcore::text
