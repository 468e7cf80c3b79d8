#include "editcore/text/unicode.h"
#include "editcore/core/utf8.h"

#include <hb.h>
#include <algorithm>
#include <iterator>

namespace editcore::unicode {

namespace {

struct CodepointRange {
    std::uint32_t first;
    std::uint32_t last;
};

// Extended_Pictographic, coarse-grained.
constexpr CodepointRange kPictographic[] = {
    {0x00A9, 0x00A9}, {0x00AE, 0x00AE}, {0x203C, 0x203C}, {0x2049, 0x2049},
    {0x2122, 0x2122}, {0x2139, 0x2139}, {0x2194, 0x2199}, {0x21A9, 0x21AA},
    {0x231A, 0x231B}, {0x2328, 0x2328}, {0x23CF, 0x23CF}, {0x23E9, 0x23F3},
    {0x23F8, 0x23FA}, {0x24C2, 0x24C2}, {0x25AA, 0x25AB}, {0x25B6, 0x25B6},
    {0x25C0, 0x25C0}, {0x25FB, 0x25FE}, {0x2600, 0x27BF}, {0x2934, 0x2935},
    {0x2B05, 0x2B07}, {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50}, {0x2B55, 0x2B55},
    {0x3030, 0x3030}, {0x303D, 0x303D}, {0x3297, 0x3297}, {0x3299, 0x3299},
    {0x1F000, 0x1F0FF}, {0x1F10D, 0x1F10F}, {0x1F12F, 0x1F12F}, {0x1F16C, 0x1F171},
    {0x1F17E, 0x1F17F}, {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A}, {0x1F1AD, 0x1F1E5},
    {0x1F201, 0x1F20F}, {0x1F21A, 0x1F21A}, {0x1F22F, 0x1F22F}, {0x1F232, 0x1F23A},
    {0x1F23C, 0x1F23F}, {0x1F249, 0x1F3FA}, {0x1F400, 0x1F53D}, {0x1F546, 0x1F64F},
    {0x1F680, 0x1F6FF}, {0x1F774, 0x1F77F}, {0x1F7D5, 0x1F7FF}, {0x1F80C, 0x1F80F},
    {0x1F848, 0x1F84F}, {0x1F85A, 0x1F85F}, {0x1F888, 0x1F88F}, {0x1F8AE, 0x1F8FF},
    {0x1F90C, 0x1F93A}, {0x1F93C, 0x1F945}, {0x1F947, 0x1FAFF}, {0x1FC00, 0x1FFFD},
};

// East_Asian_Width W/F plus default-emoji-presentation blocks.
constexpr CodepointRange kWide[] = {
    {0x1100, 0x115F}, {0x231A, 0x231B}, {0x2329, 0x232A}, {0x23E9, 0x23EC},
    {0x23F0, 0x23F0}, {0x23F3, 0x23F3}, {0x25FD, 0x25FE}, {0x2614, 0x2615},
    {0x2648, 0x2653}, {0x267F, 0x267F}, {0x2693, 0x2693}, {0x26A1, 0x26A1},
    {0x26AA, 0x26AB}, {0x26BD, 0x26BE}, {0x26C4, 0x26C5}, {0x26CE, 0x26CE},
    {0x26D4, 0x26D4}, {0x26EA, 0x26EA}, {0x26F2, 0x26F3}, {0x26F5, 0x26F5},
    {0x26FA, 0x26FA}, {0x26FD, 0x26FD}, {0x2705, 0x2705}, {0x270A, 0x270B},
    {0x2728, 0x2728}, {0x274C, 0x274C}, {0x274E, 0x274E}, {0x2753, 0x2755},
    {0x2757, 0x2757}, {0x2795, 0x2797}, {0x27B0, 0x27B0}, {0x27BF, 0x27BF},
    {0x2B1B, 0x2B1C}, {0x2B50, 0x2B50}, {0x2B55, 0x2B55}, {0x2E80, 0x303E},
    {0x3041, 0x33FF}, {0x3400, 0x4DBF}, {0x4E00, 0x9FFF}, {0xA000, 0xA4CF},
    {0xA960, 0xA97F}, {0xAC00, 0xD7A3}, {0xF900, 0xFAFF}, {0xFE10, 0xFE19},
    {0xFE30, 0xFE6F}, {0xFF00, 0xFF60}, {0xFFE0, 0xFFE6}, {0x16FE0, 0x16FE4},
    {0x17000, 0x18AFF}, {0x1B000, 0x1B2FF}, {0x1F004, 0x1F004}, {0x1F0CF, 0x1F0CF},
    {0x1F18E, 0x1F18E}, {0x1F191, 0x1F19A}, {0x1F200, 0x1F251}, {0x1F300, 0x1F64F},
    {0x1F680, 0x1F6FF}, {0x1F7E0, 0x1F7EB}, {0x1F90C, 0x1F9FF}, {0x1FA70, 0x1FAFF},
    {0x20000, 0x2FFFD}, {0x30000, 0x3FFFD},
};

template <std::size_t N>
bool inTable(const CodepointRange (&table)[N], std::uint32_t cp) {
    if (cp < table[0].first || cp > table[N - 1].last) return false;
    const auto* it = std::upper_bound(
        std::begin(table), std::end(table), cp,
        [](std::uint32_t value, const CodepointRange& r) { return value < r.first; });
    if (it == std::begin(table)) return false;
    --it;
    return cp <= it->last;
}

hb_unicode_funcs_t* unicodeFuncs() {
    static hb_unicode_funcs_t* funcs = hb_unicode_funcs_get_default();
    return funcs;
}

hb_unicode_general_category_t generalCategory(std::uint32_t cp) {
    return hb_unicode_general_category(unicodeFuncs(), cp);
}

bool isPrependedConcatenationMark(std::uint32_t cp) {
    return (cp >= 0x0600 && cp <= 0x0605) || cp == 0x06DD || cp == 0x070F ||
           cp == 0x0890 || cp == 0x0891 || cp == 0x08E2 || cp == 0x110BD || cp == 0x110CD;
}

GraphemeBreakClass hangulClass(std::uint32_t cp) {
    if ((cp >= 0x1100 && cp <= 0x115F) || (cp >= 0xA960 && cp <= 0xA97C)) return GraphemeBreakClass::L;
    if ((cp >= 0x1160 && cp <= 0x11A7) || (cp >= 0xD7B0 && cp <= 0xD7C6)) return GraphemeBreakClass::V;
    if ((cp >= 0x11A8 && cp <= 0x11FF) || (cp >= 0xD7CB && cp <= 0xD7FB)) return GraphemeBreakClass::T;
    if (cp >= 0xAC00 && cp <= 0xD7A3) {
        return ((cp - 0xAC00) % 28 == 0) ? GraphemeBreakClass::LV : GraphemeBreakClass::LVT;
    }
    return GraphemeBreakClass::Other;
}

} // namespace

GraphemeBreakClass graphemeBreakClass(std::uint32_t cp) {
    if (cp == 0x0D) return GraphemeBreakClass::CR;
    if (cp == 0x0A) return GraphemeBreakClass::LF;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return GraphemeBreakClass::Control;
    if (cp < 0x7F) return GraphemeBreakClass::Other;

    if (cp == kZeroWidthJoiner) return GraphemeBreakClass::ZWJ;
    if (cp == 0x200C) return GraphemeBreakClass::Extend;
    if (cp >= 0x1F1E6 && cp <= 0x1F1FF) return GraphemeBreakClass::RegionalIndicator;
    if (cp >= 0x1F3FB && cp <= 0x1F3FF) return GraphemeBreakClass::Extend;
    if (cp >= 0xE0020 && cp <= 0xE007F) return GraphemeBreakClass::Extend;
    if (cp == 0xFF9E || cp == 0xFF9F) return GraphemeBreakClass::Extend;
    if (isPrependedConcatenationMark(cp)) return GraphemeBreakClass::Prepend;

    const GraphemeBreakClass hangul = hangulClass(cp);
    if (hangul != GraphemeBreakClass::Other) return hangul;

    if (inTable(kPictographic, cp)) return GraphemeBreakClass::ExtendedPictographic;

    switch (generalCategory(cp)) {
        case HB_UNICODE_GENERAL_CATEGORY_NON_SPACING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_ENCLOSING_MARK:
            return GraphemeBreakClass::Extend;
        case HB_UNICODE_GENERAL_CATEGORY_SPACING_MARK:
            return GraphemeBreakClass::SpacingMark;
        case HB_UNICODE_GENERAL_CATEGORY_CONTROL:
        case HB_UNICODE_GENERAL_CATEGORY_FORMAT:
        case HB_UNICODE_GENERAL_CATEGORY_LINE_SEPARATOR:
        case HB_UNICODE_GENERAL_CATEGORY_PARAGRAPH_SEPARATOR:
            return GraphemeBreakClass::Control;
        default:
            return GraphemeBreakClass::Other;
    }
}

// =============================================================================
// GraphemeBreaker
// =============================================================================

void GraphemeBreaker::reset() {
    prev_ = GraphemeBreakClass::Other;
    hasPrev_ = false;
    regionalRun_ = 0;
    pictState_ = 0;
}

bool GraphemeBreaker::isBoundaryBefore(std::uint32_t cp) {
    using C = GraphemeBreakClass;
    const C cls = graphemeBreakClass(cp);

    bool boundary = true;
    if (hasPrev_) {
        const C p = prev_;
        if (p == C::CR && cls == C::LF) {
            boundary = false;
        } else if (p == C::CR || p == C::LF || p == C::Control) {
            boundary = true;
        } else if (cls == C::CR || cls == C::LF || cls == C::Control) {
            boundary = true;
        } else if (p == C::L && (cls == C::L || cls == C::V || cls == C::LV || cls == C::LVT)) {
            boundary = false;
        } else if ((p == C::LV || p == C::V) && (cls == C::V || cls == C::T)) {
            boundary = false;
        } else if ((p == C::LVT || p == C::T) && cls == C::T) {
            boundary = false;
        } else if (cls == C::Extend || cls == C::ZWJ || cls == C::SpacingMark) {
            boundary = false;
        } else if (p == C::Prepend) {
            boundary = false;
        } else if (p == C::ZWJ && cls == C::ExtendedPictographic && pictState_ == 2) {
            boundary = false;
        } else if (p == C::RegionalIndicator && cls == C::RegionalIndicator) {
            boundary = (regionalRun_ % 2) == 0;
        }
    }

    if (cls == C::ExtendedPictographic) {
        pictState_ = 1;
    } else if (cls == C::Extend && pictState_ == 1) {
        pictState_ = 1;
    } else if (cls == C::ZWJ && pictState_ == 1) {
        pictState_ = 2;
    } else {
        pictState_ = 0;
    }
    regionalRun_ = (cls == C::RegionalIndicator) ? regionalRun_ + 1 : 0;
    prev_ = cls;
    hasPrev_ = true;
    return boundary;
}

// =============================================================================
// Segmentation
// =============================================================================

std::size_t nextGraphemeBoundary(std::string_view text, std::size_t pos) {
    if (pos >= text.size()) return text.size();
    GraphemeBreaker breaker;
    std::uint32_t len = 0;
    breaker.isBoundaryBefore(decodeUtf8Codepoint(text, pos, len));
    pos += len;
    while (pos < text.size()) {
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, len);
        if (breaker.isBoundaryBefore(cp)) break;
        pos += len;
    }
    return pos;
}

std::size_t graphemeCount(std::string_view text) {
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        pos = nextGraphemeBoundary(text, pos);
        ++count;
    }
    return count;
}

bool isGraphemeBoundary(std::string_view text, std::size_t offset) {
    if (offset == 0 || offset == text.size()) return true;
    if (offset > text.size()) return false;
    std::size_t pos = 0;
    while (pos < offset) {
        pos = nextGraphemeBoundary(text, pos);
    }
    return pos == offset;
}

// =============================================================================
// Properties
// =============================================================================

std::uint32_t codepointWidth(std::uint32_t cp) {
    if (cp >= 0x20 && cp < 0x7F) return 1;
    if (cp == 0) return 0;
    if (cp < 0x20 || (cp >= 0x7F && cp < 0xA0)) return 1;
    if ((cp >= 0x1160 && cp <= 0x11FF) || (cp >= 0xD7B0 && cp <= 0xD7FF)) return 0;
    if (cp == kZeroWidthSpace || cp == kZeroWidthJoiner || cp == 0x200C) return 0;

    switch (generalCategory(cp)) {
        case HB_UNICODE_GENERAL_CATEGORY_NON_SPACING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_ENCLOSING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_FORMAT:
            return cp == kSoftHyphen ? 1 : 0;
        default:
            break;
    }
    return inTable(kWide, cp) ? 2 : 1;
}

std::uint32_t graphemeWidth(std::string_view grapheme) {
    std::uint32_t len = 0;
    const std::uint32_t first = decodeUtf8Codepoint(grapheme, 0, len);
    if (len == 0) return 0;
    std::uint32_t width = codepointWidth(first);
    if (width == 2) return width;

    std::size_t pos = len;
    while (pos < grapheme.size()) {
        const std::uint32_t cp = decodeUtf8Codepoint(grapheme, pos, len);
        if (cp == kEmojiPresentation) return 2;
        if (first >= 0x1F1E6 && first <= 0x1F1FF && cp >= 0x1F1E6 && cp <= 0x1F1FF) return 2;
        if (width == 0) width = codepointWidth(cp);
        pos += len;
    }
    return width;
}

bool isWhitespace(std::uint32_t cp) {
    if (cp == ' ' || cp == '\t') return true;
    if (cp < 0x80) return false;
    return generalCategory(cp) == HB_UNICODE_GENERAL_CATEGORY_SPACE_SEPARATOR;
}

bool isWordChar(std::uint32_t cp) {
    if (cp < 0x80) {
        return (cp >= '0' && cp <= '9') || (cp >= 'a' && cp <= 'z') ||
               (cp >= 'A' && cp <= 'Z') || cp == '_';
    }
    switch (generalCategory(cp)) {
        case HB_UNICODE_GENERAL_CATEGORY_LOWERCASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_MODIFIER_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_OTHER_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_TITLECASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_UPPERCASE_LETTER:
        case HB_UNICODE_GENERAL_CATEGORY_SPACING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_ENCLOSING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_NON_SPACING_MARK:
        case HB_UNICODE_GENERAL_CATEGORY_DECIMAL_NUMBER:
        case HB_UNICODE_GENERAL_CATEGORY_LETTER_NUMBER:
        case HB_UNICODE_GENERAL_CATEGORY_OTHER_NUMBER:
        case HB_UNICODE_GENERAL_CATEGORY_CONNECT_PUNCTUATION:
            return true;
        default:
            return false;
    }
}

bool isControl(std::uint32_t cp) {
    return cp < 0x20 || cp == 0x7F;
}

} // namespace editcore::unicode
