#include "editcore/text/text_store.h"
#include "editcore/text/flat_text_store.h"
#include "editcore/text/rope_text_store.h"

namespace editcore::text {

std::string TextStore::lineText(std::size_t line) const {
    ByteRange range;
    if (lineBytes(line, range) != TextError::Ok) return std::string();
    return slice(range);
}

std::size_t TextStore::lineWidth(std::size_t line) const {
    ByteRange range;
    if (lineBytes(line, range) != TextError::Ok) return 0;
    GraphemeIterator it;
    if (graphemes(range, it) != TextError::Ok) return 0;
    std::size_t count = 0;
    Grapheme g;
    while (it.next(g)) ++count;
    return count;
}

bool TextStore::hasFinalNewline() const {
    const std::size_t len = lenBytes();
    return len > 0 && slice(ByteRange{len - 1, len}) == "\n";
}

TextError TextStore::checkRange(ByteRange range) const {
    if (range.end < range.start) return TextError::InvalidRange;
    if (range.end > lenBytes()) return TextError::InvalidBoundary;
    if (!isGraphemeBoundary(range.start) || !isGraphemeBoundary(range.end)) {
        return TextError::InvalidBoundary;
    }
    if (range.empty()) return TextError::EmptyOperation;
    return TextError::Ok;
}

std::unique_ptr<TextStore> createTextStore(TextStoreKind kind) {
    if (kind == TextStoreKind::Flat) return std::make_unique<FlatTextStore>();
    return std::make_unique<RopeTextStore>();
}

std::unique_ptr<TextStore> createTextStore(std::size_t expectedSize, bool multiLine) {
    if (multiLine || expectedSize > kFlatStoreThreshold) {
        return createTextStore(TextStoreKind::Rope);
    }
    return createTextStore(TextStoreKind::Flat);
}

} // namespace editcore::text
