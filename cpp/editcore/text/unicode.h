#ifndef EDITCORE_TEXT_UNICODE_H
#define EDITCORE_TEXT_UNICODE_H

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace editcore::unicode {

constexpr std::uint32_t kSoftHyphen = 0x00AD;
constexpr std::uint32_t kZeroWidthSpace = 0x200B;
constexpr std::uint32_t kZeroWidthJoiner = 0x200D;
constexpr std::uint32_t kEmojiPresentation = 0xFE0F;

// Grapheme_Cluster_Break property, reduced to what the segmenter needs.
enum class GraphemeBreakClass : std::uint8_t {
    Other = 0,
    CR,
    LF,
    Control,
    Extend,
    ZWJ,
    RegionalIndicator,
    Prepend,
    SpacingMark,
    L,
    V,
    T,
    LV,
    LVT,
    ExtendedPictographic,
};

GraphemeBreakClass graphemeBreakClass(std::uint32_t cp);

/**
 * Incremental extended-grapheme-cluster segmenter.
 * Feed codepoints in order; isBoundaryBefore() reports whether a cluster
 * boundary precedes the codepoint just fed. Call reset() at each boundary
 * the caller commits to.
 */
class GraphemeBreaker {
public:
    bool isBoundaryBefore(std::uint32_t cp);
    void reset();

private:
    GraphemeBreakClass prev_ = GraphemeBreakClass::Other;
    bool hasPrev_ = false;
    std::uint32_t regionalRun_ = 0;
    // 0: none, 1: ExtPict Extend*, 2: ExtPict Extend* ZWJ
    std::uint8_t pictState_ = 0;
};

// =============================================================================
// Segmentation over a contiguous buffer
// =============================================================================

/** Byte offset of the boundary after the cluster starting at pos. */
std::size_t nextGraphemeBoundary(std::string_view text, std::size_t pos);
std::size_t graphemeCount(std::string_view text);
/** True when offset (0..size) falls between two clusters. */
bool isGraphemeBoundary(std::string_view text, std::size_t offset);

// =============================================================================
// Properties
// =============================================================================

/** Display columns of a single codepoint: 0, 1 or 2. */
std::uint32_t codepointWidth(std::uint32_t cp);
/** Display columns of one grapheme cluster. */
std::uint32_t graphemeWidth(std::string_view grapheme);

bool isWhitespace(std::uint32_t cp);
bool isWordChar(std::uint32_t cp);
bool isControl(std::uint32_t cp);

} // namespace editcore::unicode

#endif // EDITCORE_TEXT_UNICODE_H
