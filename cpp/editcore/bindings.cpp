#ifdef EMSCRIPTEN
#include <emscripten/bind.h>
#include <emscripten/emscripten.h>
#include <emscripten/val.h>
#endif

#include "editcore/edit/text_edit_core.h"

#ifdef EMSCRIPTEN
using editcore::edit::ScreenRect;
using editcore::edit::ScrollOffset;
using editcore::edit::TextEditCore;
using editcore::text::Glyph;
using editcore::text::TextOutcome;
using editcore::text::TextPosition;
using editcore::text::TextRange;
using editcore::text::WrapMode;

namespace {

TextOutcome insertTextJs(TextEditCore& core, const std::string& text) {
    return core.insertText(text);
}

TextOutcome setTextJs(TextEditCore& core, const std::string& text) {
    return core.setText(text);
}

std::vector<Glyph> glyphsForRegionJs(TextEditCore& core, const ScreenRect& area, const ScrollOffset& scroll) {
    return core.glyphsForRegion(area, scroll);
}

TextPosition screenToPositionJs(TextEditCore& core, const ScreenRect& area, const ScrollOffset& scroll,
                                std::uint32_t x, std::uint32_t y) {
    TextPosition pos;
    if (core.screenToPosition(area, scroll, x, y, pos) != editcore::text::TextError::Ok) {
        return core.cursor();
    }
    return pos;
}

TextEditCore* createCore(bool multiLine, std::uint32_t expectedSize) {
    TextEditCore::Config config;
    config.multiLine = multiLine;
    config.expectedSize = expectedSize;
    return new TextEditCore(config);
}

} // namespace

EMSCRIPTEN_BINDINGS(editcore_module) {
    emscripten::enum_<TextOutcome>("TextOutcome")
        .value("Unchanged", TextOutcome::Unchanged)
        .value("Changed", TextOutcome::Changed)
        .value("TextChanged", TextOutcome::TextChanged);

    emscripten::enum_<WrapMode>("WrapMode")
        .value("None", WrapMode::None)
        .value("Hard", WrapMode::Hard)
        .value("Word", WrapMode::Word);

    emscripten::value_object<TextPosition>("TextPosition")
        .field("line", &TextPosition::line)
        .field("column", &TextPosition::column);

    emscripten::value_object<TextRange>("TextRange")
        .field("start", &TextRange::start)
        .field("end", &TextRange::end);

    emscripten::value_object<ScreenRect>("ScreenRect")
        .field("x", &ScreenRect::x)
        .field("y", &ScreenRect::y)
        .field("width", &ScreenRect::width)
        .field("height", &ScreenRect::height);

    emscripten::value_object<ScrollOffset>("ScrollOffset")
        .field("line", &ScrollOffset::line)
        .field("subRow", &ScrollOffset::subRow)
        .field("column", &ScrollOffset::column);

    emscripten::value_object<Glyph>("Glyph")
        .field("text", &Glyph::text)
        .field("screenWidth", &Glyph::screenWidth)
        .field("screenCol", &Glyph::screenCol)
        .field("screenRow", &Glyph::screenRow)
        .field("lineBreak", &Glyph::lineBreak)
        .field("softBreak", &Glyph::softBreak);

    emscripten::register_vector<Glyph>("GlyphVector");

    emscripten::class_<TextEditCore>("TextEditCore")
        .constructor<>()
        .constructor(&createCore, emscripten::allow_raw_pointers())
        .function("setText", &setTextJs)
        .function("text", &TextEditCore::text)
        .function("lineCount", &TextEditCore::lineCount)
        .function("insertText", &insertTextJs)
        .function("insertTab", &TextEditCore::insertTab)
        .function("insertNewline", &TextEditCore::insertNewline)
        .function("deleteSelection", &TextEditCore::deleteSelection)
        .function("deletePrevChar", &TextEditCore::deletePrevChar)
        .function("deleteNextChar", &TextEditCore::deleteNextChar)
        .function("deletePrevWord", &TextEditCore::deletePrevWord)
        .function("deleteNextWord", &TextEditCore::deleteNextWord)
        .function("setCursor", &TextEditCore::setCursor)
        .function("setSelection", &TextEditCore::setSelection)
        .function("selectAll", &TextEditCore::selectAll)
        .function("moveLeft", &TextEditCore::moveLeft)
        .function("moveRight", &TextEditCore::moveRight)
        .function("moveUp", &TextEditCore::moveUp)
        .function("moveDown", &TextEditCore::moveDown)
        .function("moveToLineStart", &TextEditCore::moveToLineStart)
        .function("moveToLineEnd", &TextEditCore::moveToLineEnd)
        .function("moveToPrevWord", &TextEditCore::moveToPrevWord)
        .function("moveToNextWord", &TextEditCore::moveToNextWord)
        .function("cursor", &TextEditCore::cursor)
        .function("anchor", &TextEditCore::anchor)
        .function("selection", &TextEditCore::selection)
        .function("selectedText", &TextEditCore::selectedText)
        .function("beginUndoSequence", &TextEditCore::beginUndoSequence)
        .function("endUndoSequence", &TextEditCore::endUndoSequence)
        .function("undo", &TextEditCore::undo)
        .function("redo", &TextEditCore::redo)
        .function("enableReplayLog", &TextEditCore::enableReplayLog)
        .function("hasReplayLog", &TextEditCore::hasReplayLog)
        .function("copyToClipboard", &TextEditCore::copyToClipboard)
        .function("cutToClipboard", &TextEditCore::cutToClipboard)
        .function("pasteFromClipboard", &TextEditCore::pasteFromClipboard)
        .function("setWrapMode", &TextEditCore::setWrapMode)
        .function("setTabWidth", &TextEditCore::setTabWidth)
        .function("setShowCtrl", &TextEditCore::setShowCtrl)
        .function("setWrapCtrl", &TextEditCore::setWrapCtrl)
        .function("glyphsForRegion", &glyphsForRegionJs)
        .function("screenToPosition", &screenToPositionJs)
        .function("screenRowCount", &TextEditCore::screenRowCount);
}
#endif
