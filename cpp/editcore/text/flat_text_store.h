#ifndef EDITCORE_FLAT_TEXT_STORE_H
#define EDITCORE_FLAT_TEXT_STORE_H

#include "editcore/text/text_store.h"
#include <string>

namespace editcore::text {

/**
 * FlatTextStore: contiguous buffer for short single-line inputs.
 * The whole content is line 0; '\n' is an ordinary grapheme.
 */
class FlatTextStore final : public TextStore {
public:
    FlatTextStore() = default;
    explicit FlatTextStore(std::string_view text) : text_(text) {}

    TextStoreKind kind() const override { return TextStoreKind::Flat; }
    bool isMultiLine() const override { return false; }

    std::size_t lenBytes() const override { return text_.size(); }
    std::size_t lenLines() const override { return 1; }

    TextError lineBytes(std::size_t line, ByteRange& out) const override;
    TextError lineBytesWithTerminator(std::size_t line, ByteRange& out) const override;
    std::size_t lineOfOffset(std::size_t) const override { return 0; }

    TextError graphemes(ByteRange range, GraphemeIterator& out) const override;

    TextError insert(std::size_t offset, std::string_view text, EditDelta& out) override;
    TextError remove(ByteRange range, std::string& removed, EditDelta& out) override;

    TextError byteToPosition(std::size_t offset, TextPosition& out) const override;
    TextError positionToByte(TextPosition pos, std::size_t& out) const override;

    bool isGraphemeBoundary(std::size_t offset) const override;

    std::string text() const override { return text_; }
    std::string slice(ByteRange range) const override;
    void setText(std::string_view text) override { text_.assign(text.data(), text.size()); }

private:
    std::string text_;
};

} // namespace editcore::text

#endif // EDITCORE_FLAT_TEXT_STORE_H
