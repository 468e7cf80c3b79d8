#ifndef EDITCORE_TEXT_GRAPHEME_ITERATOR_H
#define EDITCORE_TEXT_GRAPHEME_ITERATOR_H

#include "editcore/text/text_types.h"
#include "editcore/text/unicode.h"
#include <memory>
#include <string>
#include <string_view>

namespace editcore::text {

/**
 * ChunkSource: sequential access to the bytes of a store as contiguous views.
 * Views stay valid until the store is mutated.
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual std::unique_ptr<ChunkSource> clone() const = 0;

    /** Position at an absolute byte offset. */
    virtual void seek(std::size_t offset) = 0;

    /** Next contiguous run of bytes from the current position; empty at end. */
    virtual std::string_view next() = 0;
};

/** Chunk source over a single contiguous buffer. */
class ContiguousChunkSource final : public ChunkSource {
public:
    explicit ContiguousChunkSource(std::string_view text) : text_(text) {}

    std::unique_ptr<ChunkSource> clone() const override {
        auto copy = std::make_unique<ContiguousChunkSource>(text_);
        copy->pos_ = pos_;
        return copy;
    }
    void seek(std::size_t offset) override { pos_ = offset < text_.size() ? offset : text_.size(); }
    std::string_view next() override {
        std::string_view view = text_.substr(pos_);
        pos_ = text_.size();
        return view;
    }

private:
    std::string_view text_;
    std::size_t pos_ = 0;
};

/**
 * GraphemeIterator: lazy, finite, restartable sequence of grapheme clusters
 * over a byte range of a store. Clusters never extend past the range end.
 *
 * Only a small window of bytes is buffered, so a cluster spanning two chunks
 * is still decoded correctly while iteration stays O(1) amortized per byte.
 */
class GraphemeIterator {
public:
    GraphemeIterator() = default;
    GraphemeIterator(std::unique_ptr<ChunkSource> source, ByteRange range);

    GraphemeIterator(const GraphemeIterator& other);
    GraphemeIterator& operator=(const GraphemeIterator& other);
    GraphemeIterator(GraphemeIterator&&) noexcept = default;
    GraphemeIterator& operator=(GraphemeIterator&&) noexcept = default;

    /** Produce the next cluster. Returns false once the range is exhausted. */
    bool next(Grapheme& out);

    /** Restart from the beginning of the range. */
    void reset();

    /**
     * Continue from an absolute byte offset inside the range without
     * segmenting the bytes before it. offset must be a cluster boundary.
     * @return False if offset lies outside the range
     */
    bool skipTo(std::size_t offset);

    /** Skip past the next '\n' (or to the range end) without segmenting. */
    void skipLine();

    std::size_t offset() const { return pos_; }
    const ByteRange& range() const { return range_; }
    bool done() const { return pos_ >= range_.end; }

private:
    bool fill(std::size_t need);
    std::size_t buffered() const { return bufferStart_ + buffer_.size() - pos_; }

    std::unique_ptr<ChunkSource> source_;
    ByteRange range_;
    std::size_t pos_ = 0;
    std::string buffer_;          // Bytes [bufferStart_, bufferStart_ + size)
    std::size_t bufferStart_ = 0;
    std::string_view pending_;    // Unbuffered remainder of the last chunk
    std::size_t fetchedEnd_ = 0;  // Absolute end of the bytes taken from source_
    bool sourceDone_ = true;
    unicode::GraphemeBreaker breaker_;
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_GRAPHEME_ITERATOR_H
