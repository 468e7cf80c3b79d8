#ifndef EDITCORE_TEXT_ROPE_H
#define EDITCORE_TEXT_ROPE_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace editcore::text {

/**
 * Rope: byte sequence stored as an implicit treap of text chunks.
 *
 * Nodes live in a pool (indices, free list). Every node caches its subtree
 * byte count and '\n' count, so offset lookup, line lookup, insert and erase
 * are O(log n). Chunks are never empty and hold at most kMaxChunkBytes.
 */
class Rope {
public:
    static constexpr std::size_t kMaxChunkBytes = 1024;
    static constexpr std::size_t kMinChunkBytes = 256;
    static constexpr std::uint32_t kNil = 0xFFFFFFFFu;

    Rope();
    explicit Rope(std::string_view text);

    void assign(std::string_view text);
    void clear();

    std::size_t size() const { return root_ == kNil ? 0 : nodes_[root_].bytes; }
    std::size_t lineBreaks() const { return root_ == kNil ? 0 : nodes_[root_].breaks; }
    std::size_t chunkCount() const { return root_ == kNil ? 0 : nodes_[root_].count; }

    char byteAt(std::size_t offset) const;

    /** Number of '\n' bytes in [0, offset). */
    std::size_t breaksBefore(std::size_t offset) const;

    /** Offset of the first byte of line (0 <= line <= lineBreaks()). */
    std::size_t lineStart(std::size_t line) const;

    void insert(std::size_t offset, std::string_view text);
    void erase(std::size_t offset, std::size_t len, std::string* removed);

    std::string slice(std::size_t offset, std::size_t len) const;
    std::string toString() const;

    /**
     * Cursor: sequential chunk reader. Remembers its path, so stepping to the
     * following chunk is O(1) amortized. Invalidated by any mutation.
     */
    class Cursor {
    public:
        explicit Cursor(const Rope& rope) : rope_(&rope) {}

        void seek(std::size_t offset);
        /** Bytes from the current position to the end of its chunk; advances. */
        std::string_view next();

    private:
        void descendLeft(std::uint32_t node);

        const Rope* rope_;
        std::vector<std::uint32_t> stack_;  // Ancestors still to visit
        std::uint32_t node_ = kNil;
        std::size_t inChunk_ = 0;
    };

private:
    struct Node {
        std::string text;
        std::uint32_t left = kNil;
        std::uint32_t right = kNil;
        std::uint32_t priority = 0;
        std::uint32_t ownBreaks = 0;
        std::uint32_t count = 1;
        std::size_t bytes = 0;
        std::size_t breaks = 0;
    };

    std::uint32_t allocate(std::string text);
    void release(std::uint32_t node);
    std::uint32_t nextPriority();

    std::size_t bytesOf(std::uint32_t n) const { return n == kNil ? 0 : nodes_[n].bytes; }
    std::size_t breaksOf(std::uint32_t n) const { return n == kNil ? 0 : nodes_[n].breaks; }
    std::uint32_t countOf(std::uint32_t n) const { return n == kNil ? 0 : nodes_[n].count; }
    void update(std::uint32_t n);

    std::uint32_t merge(std::uint32_t a, std::uint32_t b);
    /** Split so that `left` holds the first k chunks. */
    void split(std::uint32_t t, std::uint32_t k, std::uint32_t& left, std::uint32_t& right);

    /** Rank of the first chunk whose end is >= offset, and offset within it. */
    std::uint32_t locate(std::size_t offset, std::size_t& inChunk) const;

    std::uint32_t build(std::string_view text);
    std::uint32_t buildRange(const std::vector<std::uint32_t>& chunks, std::size_t lo, std::size_t hi);
    void siftDown(std::uint32_t n);

    /** Merge left + text + right, coalescing undersized chunks at the seams. */
    std::uint32_t join(std::uint32_t left, std::string text, std::uint32_t right);
    void collect(std::uint32_t t, std::string& out) const;
    void releaseTree(std::uint32_t t);

    std::vector<Node> nodes_;
    std::vector<std::uint32_t> free_;
    std::uint32_t root_ = kNil;
    std::uint32_t seed_ = 0x9E3779B9u;
};

} // namespace editcore::text

#endif // EDITCORE_TEXT_ROPE_H
