#include "editcore/text/rope_text_store.h"
#include "editcore/text/position_codec.h"
#include "editcore/core/logging.h"

#include <algorithm>

namespace editcore::text {

namespace {

// Chunk source driven by a rope cursor.
class RopeChunkSource final : public ChunkSource {
public:
    explicit RopeChunkSource(const Rope& rope) : rope_(rope), cursor_(rope) {}

    std::unique_ptr<ChunkSource> clone() const override {
        return std::make_unique<RopeChunkSource>(rope_);
    }
    void seek(std::size_t offset) override { cursor_.seek(offset); }
    std::string_view next() override { return cursor_.next(); }

private:
    const Rope& rope_;
    Rope::Cursor cursor_;
};

bool isAsciiPrintable(char c) {
    return c >= 0x20 && c < 0x7F;
}

} // namespace

// =============================================================================
// Lines
// =============================================================================

TextError RopeTextStore::lineBytesWithTerminator(std::size_t line, ByteRange& out) const {
    if (line >= lenLines()) return TextError::InvalidBoundary;
    out.start = rope_.lineStart(line);
    out.end = (line + 1 < lenLines()) ? rope_.lineStart(line + 1) : rope_.size();
    return TextError::Ok;
}

TextError RopeTextStore::lineBytes(std::size_t line, ByteRange& out) const {
    ByteRange full;
    const TextError err = lineBytesWithTerminator(line, full);
    if (err != TextError::Ok) return err;
    out = full;
    if (line + 1 < lenLines()) {
        std::size_t end = full.end - 1;  // '\n'
        if (end > full.start && rope_.byteAt(end - 1) == '\r') --end;
        out.end = end;
    }
    return TextError::Ok;
}

std::size_t RopeTextStore::lineOfOffset(std::size_t offset) const {
    return rope_.breaksBefore(std::min(offset, rope_.size()));
}

TextError RopeTextStore::graphemes(ByteRange range, GraphemeIterator& out) const {
    if (range.end < range.start) return TextError::InvalidRange;
    if (range.end > rope_.size()) return TextError::InvalidBoundary;
    out = GraphemeIterator(std::make_unique<RopeChunkSource>(rope_), range);
    return TextError::Ok;
}

// =============================================================================
// Boundaries
// =============================================================================

bool RopeTextStore::isGraphemeBoundary(std::size_t offset) const {
    const std::size_t len = rope_.size();
    if (offset > len) return false;
    if (offset == 0 || offset == len) return true;

    const char prev = rope_.byteAt(offset - 1);
    const char next = rope_.byteAt(offset);
    if ((static_cast<unsigned char>(next) & 0xC0) == 0x80) return false;
    if (prev == '\n') return true;
    if (prev == '\r') return next != '\n';
    if (isAsciiPrintable(prev) && static_cast<unsigned char>(next) < 0x80) return true;

    // Segment from the nearest known boundary before offset.
    ByteRange content;
    if (lineBytes(lineOfOffset(offset), content) != TextError::Ok) return false;
    if (offset > content.end) return false;
    GraphemeIterator it;
    if (graphemes(ByteRange{segmentStart(offset, content.start), content.end}, it) != TextError::Ok) {
        return false;
    }
    Grapheme g;
    while (it.next(g)) {
        if (g.bytes.end == offset) return true;
        if (g.bytes.end > offset) return false;
    }
    return offset == content.end;
}

std::size_t RopeTextStore::segmentStart(std::size_t offset, std::size_t floor) const {
    // An ASCII byte after printable ASCII always starts a cluster.
    std::size_t window = 256;
    std::size_t hi = offset;
    while (hi > floor) {
        const std::size_t lo = hi - std::min(window, hi - floor);
        const std::string bytes = rope_.slice(lo, std::min(hi + 1, rope_.size()) - lo);
        for (std::size_t k = bytes.size() - 1; k > 0; --k) {
            const std::size_t j = lo + k;
            if (j >= offset) continue;
            if (isAsciiPrintable(bytes[k - 1]) && static_cast<unsigned char>(bytes[k]) < 0x80) return j;
        }
        hi = lo;
        window *= 2;
    }
    return floor;
}

// =============================================================================
// Mutation
// =============================================================================

TextError RopeTextStore::insert(std::size_t offset, std::string_view text, EditDelta& out) {
    if (!isGraphemeBoundary(offset)) {
        EDITCORE_LOG_WARN("RopeTextStore::insert rejected offset %zu (len %zu)", offset, rope_.size());
        return TextError::InvalidBoundary;
    }
    if (text.empty()) return TextError::EmptyOperation;

    out = EditDelta{};
    out.offset = offset;
    out.insertedBytes = text.size();
    out.line = rope_.breaksBefore(offset);
    out.insertedBreaks = static_cast<std::size_t>(std::count(text.begin(), text.end(), '\n'));

    rope_.insert(offset, text);
    return TextError::Ok;
}

TextError RopeTextStore::remove(ByteRange range, std::string& removed, EditDelta& out) {
    const TextError err = checkRange(range);
    if (err != TextError::Ok) {
        if (err != TextError::EmptyOperation) {
            EDITCORE_LOG_WARN("RopeTextStore::remove rejected [%zu, %zu)", range.start, range.end);
        }
        return err;
    }

    out = EditDelta{};
    out.offset = range.start;
    out.removedBytes = range.size();
    out.line = rope_.breaksBefore(range.start);

    rope_.erase(range.start, range.size(), &removed);
    out.removedBreaks = static_cast<std::size_t>(std::count(removed.begin(), removed.end(), '\n'));
    return TextError::Ok;
}

// =============================================================================
// Positions
// =============================================================================

TextError RopeTextStore::byteToPosition(std::size_t offset, TextPosition& out) const {
    if (offset > rope_.size()) return TextError::InvalidBoundary;
    const std::size_t line = rope_.breaksBefore(offset);
    ByteRange content;
    TextError err = lineBytes(line, content);
    if (err != TextError::Ok) return err;
    if (offset > content.end) return TextError::InvalidBoundary;  // Inside "\r\n"

    GraphemeIterator it;
    err = graphemes(content, it);
    if (err != TextError::Ok) return err;
    std::size_t column = 0;
    err = codec::columnOfByte(it, offset, column);
    if (err != TextError::Ok) return err;
    out = TextPosition{line, column};
    return TextError::Ok;
}

TextError RopeTextStore::positionToByte(TextPosition pos, std::size_t& out) const {
    ByteRange content;
    TextError err = lineBytes(pos.line, content);
    if (err != TextError::Ok) return err;
    GraphemeIterator it;
    err = graphemes(content, it);
    if (err != TextError::Ok) return err;
    return codec::byteOfColumn(it, pos.column, out);
}

std::string RopeTextStore::slice(ByteRange range) const {
    const std::size_t start = std::min(range.start, rope_.size());
    const std::size_t end = std::min(std::max(range.end, start), rope_.size());
    return rope_.slice(start, end - start);
}

} // namespace editcore::text
