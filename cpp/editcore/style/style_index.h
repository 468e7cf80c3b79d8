#ifndef EDITCORE_STYLE_INDEX_H
#define EDITCORE_STYLE_INDEX_H

#include "editcore/text/text_types.h"
#include <cstdint>
#include <vector>

namespace editcore::style {

using text::ByteRange;
using text::EditDelta;

// Caller-supplied styling of a byte range.
struct StyleSpan {
    ByteRange range;
    std::uint32_t tag = 0;
    std::uint64_t sequence = 0;  // Application order; later wins

    bool operator==(const StyleSpan& o) const {
        return range == o.range && tag == o.tag && sequence == o.sequence;
    }
};

/**
 * StyleIndex: overlapping styled byte ranges kept in sync with edits.
 *
 * Implicit treap ordered by span start. Each node carries a pending shift for
 * its children and the maximum end of its subtree, so:
 * - overlap queries are O(log n + k)
 * - an insertion shifts the suffix lazily and touches only spans crossing
 *   the insertion point
 * - a deletion rewrites only spans starting inside it or crossing its start
 */
class StyleIndex {
public:
    StyleIndex();

    /** Add a span. Empty ranges and exact (range, tag) duplicates are ignored. */
    bool add(ByteRange range, std::uint32_t tag);

    /** Remove one span with exactly this range and tag. */
    bool remove(ByteRange range, std::uint32_t tag);

    /** Spans overlapping range, ordered by (start, sequence). */
    std::vector<StyleSpan> stylesIn(ByteRange range) const;

    /** Tags of spans containing offset, in application order. */
    std::vector<std::uint32_t> stylesAt(std::size_t offset) const;

    /** Spans overlapping or adjacent to range (start <= range.end && end >= range.start). */
    std::vector<StyleSpan> stylesTouching(ByteRange range) const;

    /** Every span, ordered by (start, sequence). */
    std::vector<StyleSpan> spans() const;

    /** Replace all spans; sequences are assigned in order. */
    void set(const std::vector<std::pair<ByteRange, std::uint32_t>>& spans);

    /** Re-insert a span keeping its sequence number. */
    void restore(const StyleSpan& span);
    /** Remove the span matching range, tag and sequence. */
    bool erase(const StyleSpan& span);

    /**
     * Shift spans by an edit. With extendAtEdit false an insertion leaves
     * spans ending exactly at the insertion point unchanged.
     */
    void applyDelta(const EditDelta& delta, bool extendAtEdit = true);
    void clear();

    std::size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

private:
    static constexpr std::uint32_t kNil = 0xFFFFFFFFu;

    struct Node {
        std::size_t start = 0;
        std::size_t end = 0;
        std::size_t maxEnd = 0;
        std::int64_t lazy = 0;  // Pending shift for both children
        std::uint32_t tag = 0;
        std::uint64_t sequence = 0;
        std::uint32_t left = kNil;
        std::uint32_t right = kNil;
        std::uint32_t priority = 0;
    };

    std::uint32_t allocate(const StyleSpan& span);
    void release(std::uint32_t n);
    std::uint32_t nextPriority();

    void shift(std::uint32_t n, std::int64_t delta);
    void push(std::uint32_t n);
    void pull(std::uint32_t n);

    std::uint32_t merge(std::uint32_t a, std::uint32_t b);
    /** left: start < key, right: start >= key. */
    void split(std::uint32_t t, std::size_t key, std::uint32_t& left, std::uint32_t& right);
    void insertNode(std::uint32_t n);
    /** Remove the first span at range with tag (and sequence, unless 0). */
    bool removeWhere(ByteRange range, std::uint32_t tag, std::uint64_t sequence);
    std::uint32_t rebuild(const std::vector<std::uint32_t>& ordered);

    void collect(std::uint32_t t, std::vector<std::uint32_t>& out);
    void extendEnds(std::uint32_t t, std::size_t offset, std::size_t len, bool inclusive);
    void clipEnds(std::uint32_t t, std::size_t a, std::size_t b);

    void applyInsert(std::size_t offset, std::size_t len, bool extendAtEdit);
    void applyRemove(std::size_t a, std::size_t b);

    // Const traversals carry the shifts of ancestors in acc.
    void queryOverlap(std::uint32_t t, std::int64_t acc, std::size_t a, std::size_t b,
                      bool touching, std::vector<StyleSpan>& out) const;
    bool findExact(std::uint32_t t, std::int64_t acc, ByteRange range, std::uint32_t tag) const;
    void queryAll(std::uint32_t t, std::int64_t acc, std::vector<StyleSpan>& out) const;

    std::vector<Node> nodes_;
    std::vector<std::uint32_t> free_;
    std::uint32_t root_ = kNil;
    std::size_t size_ = 0;
    std::uint64_t nextSequence_ = 1;
    std::uint32_t seed_ = 0x2545F491u;
};

} // namespace editcore::style

#endif // EDITCORE_STYLE_INDEX_H
