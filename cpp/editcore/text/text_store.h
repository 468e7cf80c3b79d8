#ifndef EDITCORE_TEXT_STORE_H
#define EDITCORE_TEXT_STORE_H

#include "editcore/text/text_types.h"
#include "editcore/text/grapheme_iterator.h"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace editcore::text {

enum class TextStoreKind : std::uint8_t {
    Flat = 0,  // Single line, contiguous buffer
    Rope = 1,  // Multi-line, chunk tree
};

// Expected sizes up to this many bytes get a flat store.
constexpr std::size_t kFlatStoreThreshold = 4096;

/**
 * TextStore: owned UTF-8 document with grapheme-level editing.
 *
 * Responsibilities:
 * - Byte storage and line indexing
 * - Grapheme iteration over arbitrary byte ranges
 * - Boundary-checked insert/remove, each reported as an EditDelta
 * - Byte offset <-> (line, column) conversion
 *
 * Lines end at '\n'; "\r\n" is one grapheme and one terminator. Offsets that
 * fall inside a cluster (including between '\r' and '\n') are rejected with
 * TextError::InvalidBoundary. lenBytes() itself is a valid offset.
 */
class TextStore {
public:
    virtual ~TextStore() = default;

    virtual TextStoreKind kind() const = 0;
    /** True when '\n' starts a new line. */
    virtual bool isMultiLine() const = 0;

    virtual std::size_t lenBytes() const = 0;
    virtual std::size_t lenLines() const = 0;

    /**
     * Content bytes of a line, terminator excluded.
     * @return InvalidBoundary if line >= lenLines()
     */
    virtual TextError lineBytes(std::size_t line, ByteRange& out) const = 0;

    /** Bytes of a line including its terminator (if any). */
    virtual TextError lineBytesWithTerminator(std::size_t line, ByteRange& out) const = 0;

    /** Line that contains offset (0 <= offset <= lenBytes()). */
    virtual std::size_t lineOfOffset(std::size_t offset) const = 0;

    /**
     * Lazy cluster sequence over range. The iterator reads the store directly
     * and must not outlive the next mutation.
     */
    virtual TextError graphemes(ByteRange range, GraphemeIterator& out) const = 0;

    virtual TextError insert(std::size_t offset, std::string_view text, EditDelta& out) = 0;
    virtual TextError remove(ByteRange range, std::string& removed, EditDelta& out) = 0;

    virtual TextError byteToPosition(std::size_t offset, TextPosition& out) const = 0;
    virtual TextError positionToByte(TextPosition pos, std::size_t& out) const = 0;

    virtual bool isGraphemeBoundary(std::size_t offset) const = 0;

    virtual std::string text() const = 0;
    virtual std::string slice(ByteRange range) const = 0;
    /** Replace the whole content. */
    virtual void setText(std::string_view text) = 0;

    // ==========================================================================
    // Derived queries
    // ==========================================================================

    std::string lineText(std::size_t line) const;
    /** Grapheme count of a line (terminator excluded); 0 for an invalid line. */
    std::size_t lineWidth(std::size_t line) const;
    bool hasFinalNewline() const;

protected:
    /** Shared argument validation for remove(). */
    TextError checkRange(ByteRange range) const;
};

std::unique_ptr<TextStore> createTextStore(TextStoreKind kind);

/**
 * Pick a backend from an expected-size hint. The choice is final for the
 * lifetime of the store.
 */
std::unique_ptr<TextStore> createTextStore(std::size_t expectedSize, bool multiLine);

} // namespace editcore::text

#endif // EDITCORE_TEXT_STORE_H
