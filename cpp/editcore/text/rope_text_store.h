#ifndef EDITCORE_ROPE_TEXT_STORE_H
#define EDITCORE_ROPE_TEXT_STORE_H

#include "editcore/text/text_store.h"
#include "editcore/text/rope.h"

namespace editcore::text {

/**
 * RopeTextStore: multi-line document on a chunk rope.
 * Insert, remove, offset and line lookup are O(log n); boundary checks and
 * position conversion only segment the line they touch.
 */
class RopeTextStore final : public TextStore {
public:
    RopeTextStore() = default;
    explicit RopeTextStore(std::string_view text) : rope_(text) {}

    TextStoreKind kind() const override { return TextStoreKind::Rope; }
    bool isMultiLine() const override { return true; }

    std::size_t lenBytes() const override { return rope_.size(); }
    std::size_t lenLines() const override { return rope_.lineBreaks() + 1; }

    TextError lineBytes(std::size_t line, ByteRange& out) const override;
    TextError lineBytesWithTerminator(std::size_t line, ByteRange& out) const override;
    std::size_t lineOfOffset(std::size_t offset) const override;

    TextError graphemes(ByteRange range, GraphemeIterator& out) const override;

    TextError insert(std::size_t offset, std::string_view text, EditDelta& out) override;
    TextError remove(ByteRange range, std::string& removed, EditDelta& out) override;

    TextError byteToPosition(std::size_t offset, TextPosition& out) const override;
    TextError positionToByte(TextPosition pos, std::size_t& out) const override;

    bool isGraphemeBoundary(std::size_t offset) const override;

    std::string text() const override { return rope_.toString(); }
    std::string slice(ByteRange range) const override;
    void setText(std::string_view text) override { rope_.assign(text); }

    const Rope& rope() const { return rope_; }

private:
    std::size_t segmentStart(std::size_t offset, std::size_t floor) const;
    Rope rope_;
};

} // namespace editcore::text

#endif // EDITCORE_ROPE_TEXT_STORE_H
