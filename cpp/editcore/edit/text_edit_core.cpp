#include "editcore/edit/text_edit_core.h"
#include "editcore/text/position_codec.h"
#include "editcore/text/unicode.h"
#include "editcore/core/utf8.h"
#include "editcore/core/logging.h"
#include <algorithm>

namespace editcore::edit {

namespace codec = text::codec;

namespace {

enum class CharClass : std::uint8_t { Space, Word, Punct };

CharClass classify(const text::Grapheme& g) {
    std::uint32_t len = 0;
    const std::uint32_t cp = decodeUtf8Codepoint(g.text, 0, len);
    if (unicode::isWhitespace(cp)) return CharClass::Space;
    if (unicode::isWordChar(cp)) return CharClass::Word;
    return CharClass::Punct;
}

text::ShaperOptions shaperOptionsFor(const TextEditCore::Config& config) {
    text::ShaperOptions options;
    options.tabWidth = config.tabWidth;
    options.showCtrl = config.showCtrl;
    options.wrapCtrl = config.wrapCtrl;
    return options;
}

} // namespace

TextEditCore::TextEditCore() : TextEditCore(Config{}) {}

TextEditCore::TextEditCore(const Config& config)
    : config_(config),
      store_(text::createTextStore(config.expectedSize, config.multiLine)),
      undo_(config.undoLimit),
      shaper_(shaperOptionsFor(config)),
      metrics_(shaper_),
      clipboard_(&localClipboard_) {
    undo_.setUndoStyles(config_.undoStyles);
    if (config_.newline != "\n" && config_.newline != "\r\n" && config_.newline != "\r") {
        EDITCORE_LOG_WARN("unsupported newline sequence, using \\n");
        config_.newline = "\n";
    }
}

TextEditCore::~TextEditCore() = default;

// =============================================================================
// Internal helpers
// =============================================================================

TextOutcome TextEditCore::fail(TextError err) {
    lastError_ = err;
    if (err != TextError::Ok && err != TextError::EmptyOperation) {
        EDITCORE_LOG_DEBUG("edit rejected: %s", text::toString(err));
    }
    return TextOutcome::Unchanged;
}

void TextEditCore::propagate(const text::EditDelta& delta, bool extendStyles) {
    styles_.applyDelta(delta, extendStyles);
    metrics_.applyDelta(delta);

    auto adjust = [&delta](std::size_t& offset) {
        if (delta.removedBytes > 0) {
            if (offset >= delta.offset + delta.removedBytes) {
                offset -= delta.removedBytes;
            } else if (offset > delta.offset) {
                offset = delta.offset;
            }
        }
        if (delta.insertedBytes > 0 && offset >= delta.offset) {
            offset += delta.insertedBytes;
        }
    };
    adjust(cursor_);
    adjust(anchor_);
}

history::Selection TextEditCore::currentSelection() const {
    history::Selection sel;
    sel.anchor = anchor();
    sel.cursor = cursor();
    return sel;
}

void TextEditCore::restoreSelection(const history::Selection& selection) {
    std::size_t anchorOffset = 0;
    std::size_t cursorOffset = 0;
    if (store_->positionToByte(selection.anchor, anchorOffset) != TextError::Ok
        || store_->positionToByte(selection.cursor, cursorOffset) != TextError::Ok) {
        EDITCORE_LOG_WARN("stale selection in history, moving cursor to end");
        anchorOffset = cursorOffset = store_->lenBytes();
    }
    anchor_ = anchorOffset;
    cursor_ = cursorOffset;
    desiredColumn_.reset();
}

void TextEditCore::syncShaper() {
    shaper_.setOptions(shaperOptionsFor(config_));
}

void TextEditCore::syncMetrics(std::uint32_t viewportWidth) {
    metrics_.configure(config_.wrapMode, viewportWidth, shaper_.options());
}

bool TextEditCore::wrapping(std::uint32_t viewportWidth) const {
    return config_.wrapMode != WrapMode::None && viewportWidth > 0;
}

void TextEditCore::widenToClusters(ByteRange& range, std::string& text) const {
    const std::size_t len = store_->lenBytes();
    bool changed = true;
    while (changed) {
        changed = false;
        const std::size_t before =
            range.start > 0 ? codec::prevGraphemeBoundary(*store_, range.start) : range.start;
        const std::size_t after =
            range.end < len ? codec::nextGraphemeBoundary(*store_, range.end) : range.end;
        const std::string head = store_->slice({before, range.start});
        const std::string tail = store_->slice({range.end, after});
        const std::string joined = head + text + tail;

        bool widenHead = !head.empty() && !unicode::isGraphemeBoundary(joined, head.size());
        bool widenTail = !tail.empty() && !unicode::isGraphemeBoundary(joined, head.size() + text.size());
        // The insertion lands between head and tail once range is gone.
        if (!range.empty() && !text.empty() && !head.empty() && !tail.empty()
            && !unicode::isGraphemeBoundary(head + tail, head.size())) {
            widenHead = widenTail = true;
        }
        if (widenHead) {
            text.insert(0, head);
            range.start = before;
            changed = true;
        }
        if (widenTail) {
            text.append(tail);
            range.end = after;
            changed = true;
        }
    }
}

TextOutcome TextEditCore::replaceBytes(ByteRange range, std::string_view text,
                                       history::UndoOpKind removeKind, history::UndoOpKind insertKind) {
    std::string replacement(text.data(), text.size());
    ByteRange span = range;
    widenToClusters(span, replacement);

    std::size_t caret = range.start + text.size();
    if (span != range) {
        // A seam fused with its neighbour; replay whole clusters and keep the
        // cursor on a boundary of the merged text.
        removeKind = history::UndoOpKind::RemoveText;
        insertKind = history::UndoOpKind::InsertText;
        const std::size_t rel = caret - span.start;
        std::size_t snapped = 0;
        if (text.empty()) {
            for (std::size_t b = 0; b < replacement.size();) {
                const std::size_t next = unicode::nextGraphemeBoundary(replacement, b);
                if (next > rel) break;
                snapped = b = next;
            }
        } else {
            while (snapped < rel && snapped < replacement.size()) {
                snapped = unicode::nextGraphemeBoundary(replacement, snapped);
            }
        }
        caret = span.start + snapped;
        EDITCORE_LOG_DEBUG("edit widened to [%zu, %zu)", span.start, span.end);
    }

    const bool both = !span.empty() && !replacement.empty();
    if (both) undo_.beginGroup(currentSelection());
    TextOutcome result = TextOutcome::TextChanged;
    if (!span.empty()) {
        std::optional<std::size_t> removeCaret;
        if (replacement.empty()) removeCaret = caret;
        result = applyRemove(span, removeKind, removeCaret);
    }
    if (result == TextOutcome::TextChanged && !replacement.empty()) {
        result = applyInsert(span.start, replacement, insertKind, caret);
    }
    if (both) undo_.endGroup();
    return result;
}

TextOutcome TextEditCore::applyInsert(std::size_t offset, std::string_view text, history::UndoOpKind kind,
                                      std::optional<std::size_t> caret) {
    history::UndoRecord rec;
    rec.kind = kind;
    rec.selectionBefore = currentSelection();

    text::EditDelta delta;
    const TextError err = store_->insert(offset, text, delta);
    if (err != TextError::Ok) return fail(err);
    propagate(delta);

    if (caret) {
        cursor_ = anchor_ = *caret;
        desiredColumn_.reset();
    }

    rec.bytes = {offset, offset + text.size()};
    rec.text.assign(text.data(), text.size());
    rec.selectionAfter = currentSelection();
    undo_.record(std::move(rec));
    return TextOutcome::TextChanged;
}

TextOutcome TextEditCore::applyRemove(ByteRange range, history::UndoOpKind kind,
                                      std::optional<std::size_t> caret) {
    history::UndoRecord rec;
    rec.kind = kind;
    rec.selectionBefore = currentSelection();
    rec.stylesBefore = styles_.stylesTouching(range);

    text::EditDelta delta;
    const TextError err = store_->remove(range, rec.text, delta);
    if (err != TextError::Ok) return fail(err);
    propagate(delta);

    if (caret) {
        cursor_ = anchor_ = *caret;
        desiredColumn_.reset();
    }

    rec.bytes = range;
    rec.selectionAfter = currentSelection();
    undo_.record(std::move(rec));
    return TextOutcome::TextChanged;
}

// =============================================================================
// Content
// =============================================================================

TextOutcome TextEditCore::setText(std::string_view text) {
    lastError_ = TextError::Ok;
    store_->setText(text);
    styles_.clear();
    undo_.clear();
    undo_.logReplay(history::ReplayOp::SetText, std::string(text));
    metrics_.clear();
    cursor_ = anchor_ = 0;
    desiredColumn_.reset();
    return TextOutcome::TextChanged;
}

TextOutcome TextEditCore::clear() {
    lastError_ = TextError::Ok;
    if (store_->lenBytes() == 0 && styles_.empty()) return TextOutcome::Unchanged;
    return setText({});
}

// =============================================================================
// Editing
// =============================================================================

TextOutcome TextEditCore::insertText(std::string_view text) {
    return insertWithKind(text, history::UndoOpKind::InsertText);
}

TextOutcome TextEditCore::insertWithKind(std::string_view text, history::UndoOpKind kind) {
    lastError_ = TextError::Ok;
    if (text.empty()) return fail(TextError::EmptyOperation);
    if (hasSelection()) {
        return replaceBytes(selectionBytes(), text, history::UndoOpKind::RemoveText,
                            history::UndoOpKind::InsertText);
    }
    return replaceBytes({cursor_, cursor_}, text, history::UndoOpKind::RemoveText, kind);
}

TextOutcome TextEditCore::insertChar(std::uint32_t codepoint) {
    return insertWithKind(encodeUtf8(codepoint), history::UndoOpKind::InsertChar);
}

TextOutcome TextEditCore::insertTab() {
    if (!config_.expandTabs) return insertWithKind("\t", history::UndoOpKind::InsertChar);

    // Pad to the next tab stop of the unwrapped line.
    const std::size_t start = hasSelection() ? std::min(cursor_, anchor_) : cursor_;
    const std::size_t line = store_->lineOfOffset(start);
    std::vector<text::WrapSegment> segments;
    text::ScreenPosition pos;
    TextError err = shaper_.wrapSegments(*store_, line, WrapMode::None, 0, segments);
    if (err == TextError::Ok) {
        err = codec::byteToScreen(*store_, shaper_, line, segments, start, pos);
    }
    if (err != TextError::Ok) return fail(err);

    const std::uint32_t tabWidth = std::max<std::uint32_t>(config_.tabWidth, 1);
    const std::uint32_t pad = tabWidth - pos.column % tabWidth;
    return insertWithKind(std::string(pad, ' '), history::UndoOpKind::InsertChar);
}

TextOutcome TextEditCore::insertNewline() {
    lastError_ = TextError::Ok;
    if (!config_.multiLine) return TextOutcome::Unchanged;
    return insertText(config_.newline);
}

TextOutcome TextEditCore::deleteSelection() {
    lastError_ = TextError::Ok;
    if (!hasSelection()) return fail(TextError::EmptyOperation);
    return replaceBytes(selectionBytes(), {}, history::UndoOpKind::RemoveText,
                        history::UndoOpKind::InsertText);
}

TextOutcome TextEditCore::deletePrevChar() {
    if (hasSelection()) return deleteSelection();
    lastError_ = TextError::Ok;
    if (cursor_ == 0) return fail(TextError::EmptyOperation);
    return replaceBytes({codec::prevGraphemeBoundary(*store_, cursor_), cursor_}, {},
                        history::UndoOpKind::RemoveChar, history::UndoOpKind::InsertText);
}

TextOutcome TextEditCore::deleteNextChar() {
    if (hasSelection()) return deleteSelection();
    lastError_ = TextError::Ok;
    if (cursor_ >= store_->lenBytes()) return fail(TextError::EmptyOperation);
    return replaceBytes({cursor_, codec::nextGraphemeBoundary(*store_, cursor_)}, {},
                        history::UndoOpKind::RemoveChar, history::UndoOpKind::InsertText);
}

TextOutcome TextEditCore::deletePrevWord() {
    if (hasSelection()) return deleteSelection();
    lastError_ = TextError::Ok;
    if (cursor_ == 0) return fail(TextError::EmptyOperation);
    return replaceBytes({prevWordBoundary(cursor_), cursor_}, {},
                        history::UndoOpKind::RemoveText, history::UndoOpKind::InsertText);
}

TextOutcome TextEditCore::deleteNextWord() {
    if (hasSelection()) return deleteSelection();
    lastError_ = TextError::Ok;
    if (cursor_ >= store_->lenBytes()) return fail(TextError::EmptyOperation);
    return replaceBytes({cursor_, nextWordBoundary(cursor_)}, {},
                        history::UndoOpKind::RemoveText, history::UndoOpKind::InsertText);
}

// =============================================================================
// Word boundaries
// =============================================================================

std::size_t TextEditCore::prevWordBoundary(std::size_t offset) const {
    if (offset == 0) return 0;
    ByteRange content;
    if (store_->lineBytes(store_->lineOfOffset(offset), content) != TextError::Ok) return offset;
    // At a line start the previous "word" is the terminator.
    if (offset <= content.start) return codec::prevGraphemeBoundary(*store_, offset);

    text::GraphemeIterator it;
    if (store_->graphemes({content.start, offset}, it) != TextError::Ok) return offset;
    std::vector<std::size_t> starts;
    std::vector<CharClass> classes;
    text::Grapheme g;
    while (it.next(g)) {
        starts.push_back(g.bytes.start);
        classes.push_back(classify(g));
    }

    std::size_t i = starts.size();
    while (i > 0 && classes[i - 1] == CharClass::Space) --i;
    if (i > 0) {
        const CharClass run = classes[i - 1];
        while (i > 0 && classes[i - 1] == run) --i;
    }
    return i < starts.size() ? starts[i] : offset;
}

std::size_t TextEditCore::nextWordBoundary(std::size_t offset) const {
    const std::size_t len = store_->lenBytes();
    if (offset >= len) return len;
    ByteRange content;
    if (store_->lineBytes(store_->lineOfOffset(offset), content) != TextError::Ok) return offset;
    if (offset >= content.end) return codec::nextGraphemeBoundary(*store_, offset);

    text::GraphemeIterator it;
    if (store_->graphemes({offset, content.end}, it) != TextError::Ok) return offset;
    text::Grapheme g;
    bool haveRun = false;
    CharClass run = CharClass::Space;
    while (it.next(g)) {
        const CharClass cls = classify(g);
        if (!haveRun) {
            if (cls == CharClass::Space) continue;
            haveRun = true;
            run = cls;
        } else if (cls != run) {
            return g.bytes.start;
        }
    }
    return content.end;
}

// =============================================================================
// Cursor / Selection
// =============================================================================

TextOutcome TextEditCore::moveCursor(std::size_t offset, bool extendSelection, bool keepColumn) {
    lastError_ = TextError::Ok;
    if (!keepColumn) desiredColumn_.reset();
    const std::size_t newAnchor = extendSelection ? anchor_ : offset;
    if (offset == cursor_ && newAnchor == anchor_) return TextOutcome::Unchanged;
    cursor_ = offset;
    anchor_ = newAnchor;
    return TextOutcome::Changed;
}

TextOutcome TextEditCore::setCursor(TextPosition pos, bool extendSelection) {
    std::size_t offset = 0;
    const TextError err = store_->positionToByte(pos, offset);
    if (err != TextError::Ok) return fail(err);
    return moveCursor(offset, extendSelection);
}

TextOutcome TextEditCore::setCursorByte(std::size_t offset, bool extendSelection) {
    if (offset > store_->lenBytes() || !store_->isGraphemeBoundary(offset)) {
        return fail(TextError::InvalidBoundary);
    }
    return moveCursor(offset, extendSelection);
}

TextOutcome TextEditCore::setSelection(const TextRange& range) {
    ByteRange bytes;
    const TextError err = codec::rangeToBytes(*store_, range, bytes);
    if (err != TextError::Ok) return fail(err);
    lastError_ = TextError::Ok;
    desiredColumn_.reset();
    if (anchor_ == bytes.start && cursor_ == bytes.end) return TextOutcome::Unchanged;
    anchor_ = bytes.start;
    cursor_ = bytes.end;
    return TextOutcome::Changed;
}

TextOutcome TextEditCore::selectAll() {
    lastError_ = TextError::Ok;
    desiredColumn_.reset();
    const std::size_t len = store_->lenBytes();
    if (anchor_ == 0 && cursor_ == len) return TextOutcome::Unchanged;
    anchor_ = 0;
    cursor_ = len;
    return TextOutcome::Changed;
}

TextOutcome TextEditCore::moveLeft(bool extendSelection) {
    if (!extendSelection && hasSelection()) return moveCursor(std::min(cursor_, anchor_), false);
    return moveCursor(codec::prevGraphemeBoundary(*store_, cursor_), extendSelection);
}

TextOutcome TextEditCore::moveRight(bool extendSelection) {
    if (!extendSelection && hasSelection()) return moveCursor(std::max(cursor_, anchor_), false);
    return moveCursor(codec::nextGraphemeBoundary(*store_, cursor_), extendSelection);
}

TextOutcome TextEditCore::moveUp(bool extendSelection) {
    return moveVertical(false, extendSelection);
}

TextOutcome TextEditCore::moveDown(bool extendSelection) {
    return moveVertical(true, extendSelection);
}

TextOutcome TextEditCore::moveVertical(bool down, bool extendSelection) {
    syncMetrics(viewportWidth_);
    const std::size_t line = store_->lineOfOffset(cursor_);
    const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, line);
    if (!segments) return fail(TextError::InvalidBoundary);

    text::ScreenPosition pos;
    TextError err = codec::byteToScreen(*store_, shaper_, line, *segments, cursor_, pos);
    if (err != TextError::Ok) return fail(err);
    const std::uint32_t column = desiredColumn_.value_or(pos.column);

    std::size_t targetLine = line;
    std::size_t targetRow = 0;
    if (down) {
        if (pos.row + 1 < segments->size()) {
            targetRow = pos.row + 1;
        } else if (line + 1 < store_->lenLines()) {
            targetLine = line + 1;
        } else {
            return moveCursor(store_->lenBytes(), extendSelection);
        }
    } else {
        if (pos.row > 0) {
            targetRow = pos.row - 1;
        } else if (line > 0) {
            targetLine = line - 1;
            const std::vector<text::WrapSegment>* prev = metrics_.wrapSegments(*store_, targetLine);
            if (!prev) return fail(TextError::InvalidBoundary);
            targetRow = prev->size() - 1;
        } else {
            return moveCursor(0, extendSelection);
        }
    }

    const std::vector<text::WrapSegment>* targetSegments = metrics_.wrapSegments(*store_, targetLine);
    if (!targetSegments) return fail(TextError::InvalidBoundary);
    std::size_t offset = 0;
    err = codec::screenToByte(*store_, shaper_, targetLine, *targetSegments,
                              text::ScreenPosition{targetRow, column}, offset);
    if (err != TextError::Ok) return fail(err);

    const TextOutcome result = moveCursor(offset, extendSelection, true);
    desiredColumn_ = column;
    return result;
}

TextOutcome TextEditCore::moveToLineStart(bool extendSelection) {
    ByteRange content;
    const TextError err = store_->lineBytes(store_->lineOfOffset(cursor_), content);
    if (err != TextError::Ok) return fail(err);
    return moveCursor(content.start, extendSelection);
}

TextOutcome TextEditCore::moveToLineEnd(bool extendSelection) {
    ByteRange content;
    const TextError err = store_->lineBytes(store_->lineOfOffset(cursor_), content);
    if (err != TextError::Ok) return fail(err);
    return moveCursor(content.end, extendSelection);
}

TextOutcome TextEditCore::moveToPrevWord(bool extendSelection) {
    return moveCursor(prevWordBoundary(cursor_), extendSelection);
}

TextOutcome TextEditCore::moveToNextWord(bool extendSelection) {
    return moveCursor(nextWordBoundary(cursor_), extendSelection);
}

TextOutcome TextEditCore::moveToDocumentStart(bool extendSelection) {
    return moveCursor(0, extendSelection);
}

TextOutcome TextEditCore::moveToDocumentEnd(bool extendSelection) {
    return moveCursor(store_->lenBytes(), extendSelection);
}

TextPosition TextEditCore::cursor() const {
    TextPosition pos;
    if (store_->byteToPosition(cursor_, pos) != TextError::Ok) {
        EDITCORE_LOG_WARN("cursor offset %zu is not a boundary", cursor_);
    }
    return pos;
}

TextPosition TextEditCore::anchor() const {
    TextPosition pos;
    if (store_->byteToPosition(anchor_, pos) != TextError::Ok) {
        EDITCORE_LOG_WARN("anchor offset %zu is not a boundary", anchor_);
    }
    return pos;
}

ByteRange TextEditCore::selectionBytes() const {
    return {std::min(cursor_, anchor_), std::max(cursor_, anchor_)};
}

TextRange TextEditCore::selection() const {
    TextRange range;
    if (codec::bytesToRange(*store_, selectionBytes(), range) != TextError::Ok) {
        EDITCORE_LOG_WARN("selection is not on boundaries");
    }
    return range;
}

std::string TextEditCore::selectedText() const {
    if (!hasSelection()) return {};
    return store_->slice(selectionBytes());
}

// =============================================================================
// Undo
// =============================================================================

TextOutcome TextEditCore::undo() {
    lastError_ = TextError::Ok;
    textReplayed_ = false;
    const std::optional<history::Selection> sel = undo_.undo(*this);
    if (!sel) return TextOutcome::Unchanged;
    undo_.logReplay(history::ReplayOp::Undo);
    restoreSelection(*sel);
    return textReplayed_ ? TextOutcome::TextChanged : TextOutcome::Changed;
}

TextOutcome TextEditCore::redo() {
    lastError_ = TextError::Ok;
    textReplayed_ = false;
    const std::optional<history::Selection> sel = undo_.redo(*this);
    if (!sel) return TextOutcome::Unchanged;
    undo_.logReplay(history::ReplayOp::Redo);
    restoreSelection(*sel);
    return textReplayed_ ? TextOutcome::TextChanged : TextOutcome::Changed;
}

void TextEditCore::setUndoLimit(std::uint32_t limit) {
    config_.undoLimit = limit;
    undo_.setLimit(limit);
}

void TextEditCore::replayInsert(std::size_t offset, const std::string& text, bool extendStyles) {
    text::EditDelta delta;
    const TextError err = store_->insert(offset, text, delta);
    if (err != TextError::Ok) {
        EDITCORE_LOG_WARN("undo insert at %zu failed: %s", offset, text::toString(err));
        return;
    }
    propagate(delta, extendStyles);
    textReplayed_ = true;
}

void TextEditCore::replayRemove(ByteRange range) {
    std::string removed;
    text::EditDelta delta;
    const TextError err = store_->remove(range, removed, delta);
    if (err != TextError::Ok) {
        EDITCORE_LOG_WARN("undo remove [%zu, %zu) failed: %s", range.start, range.end,
                          text::toString(err));
        return;
    }
    propagate(delta);
    textReplayed_ = true;
}

void TextEditCore::replayStyles(ByteRange range, const std::vector<style::StyleSpan>& spans) {
    // Only the recorded spans go back to their old extent; spans added since stay.
    for (const style::StyleSpan& span : styles_.stylesTouching(range)) {
        const bool recorded = std::any_of(spans.begin(), spans.end(), [&span](const style::StyleSpan& s) {
            return s.sequence == span.sequence;
        });
        if (recorded) styles_.erase(span);
    }
    for (const style::StyleSpan& span : spans) {
        styles_.restore(span);
    }
}

void TextEditCore::replayAddStyle(ByteRange range, std::uint32_t tag) {
    styles_.add(range, tag);
}

void TextEditCore::replayRemoveStyle(ByteRange range, std::uint32_t tag) {
    styles_.remove(range, tag);
}

void TextEditCore::replaySetStyles(const std::vector<style::StyleSpan>& spans) {
    styles_.clear();
    for (const style::StyleSpan& span : spans) {
        styles_.restore(span);
    }
}

// =============================================================================
// Replay log
// =============================================================================

TextOutcome TextEditCore::replayEdit(const history::UndoRecord& record) {
    switch (record.kind) {
        case history::UndoOpKind::InsertText:
        case history::UndoOpKind::InsertChar:
            return applyInsert(record.bytes.start, record.text, record.kind, std::nullopt);
        case history::UndoOpKind::RemoveText:
        case history::UndoOpKind::RemoveChar:
            return applyRemove(record.bytes, record.kind, std::nullopt);
        case history::UndoOpKind::AddStyle:
            return addStyle(record.bytes, record.tag);
        case history::UndoOpKind::RemoveStyle:
            return removeStyle(record.bytes, record.tag);
        case history::UndoOpKind::SetStyles: {
            std::vector<std::pair<ByteRange, std::uint32_t>> spans;
            spans.reserve(record.stylesAfter.size());
            for (const style::StyleSpan& span : record.stylesAfter) {
                spans.emplace_back(span.range, span.tag);
            }
            return setStyles(spans);
        }
    }
    return TextOutcome::Unchanged;
}

TextOutcome TextEditCore::replayLog(const std::vector<history::ReplayEntry>& entries) {
    lastError_ = TextError::Ok;
    TextOutcome result = TextOutcome::Unchanged;
    auto merge = [&result](TextOutcome outcome) {
        if (outcome == TextOutcome::TextChanged) {
            result = outcome;
        } else if (outcome == TextOutcome::Changed && result == TextOutcome::Unchanged) {
            result = outcome;
        }
    };

    undo_.pauseReplayLog(true);
    std::size_t i = 0;
    while (i < entries.size()) {
        const history::ReplayEntry& entry = entries[i];
        if (entry.op != history::ReplayOp::Edit) {
            if (entry.op == history::ReplayOp::SetText) merge(setText(entry.text));
            else if (entry.op == history::ReplayOp::Undo) merge(undo());
            else merge(redo());
            ++i;
            continue;
        }

        // Edits sharing a sequence were one undo step at the source.
        std::size_t end = i;
        while (end < entries.size() && entries[end].op == history::ReplayOp::Edit
               && entries[end].sequence == entry.sequence) {
            ++end;
        }
        const bool grouped = end - i > 1;
        if (grouped) undo_.beginGroup(currentSelection());
        for (; i < end; ++i) {
            const TextOutcome outcome = replayEdit(entries[i].record);
            if (outcome == TextOutcome::Unchanged && lastError_ != TextError::Ok) {
                EDITCORE_LOG_WARN("replay log entry %u rejected: %s", entries[i].sequence,
                                  text::toString(lastError_));
            }
            merge(outcome);
        }
        if (grouped) undo_.endGroup();
    }
    undo_.pauseReplayLog(false);
    return result;
}

// =============================================================================
// Clipboard
// =============================================================================

void TextEditCore::setClipboard(Clipboard* clipboard) {
    clipboard_ = clipboard ? clipboard : &localClipboard_;
}

TextOutcome TextEditCore::copyToClipboard() {
    lastError_ = TextError::Ok;
    if (!hasSelection()) return fail(TextError::EmptyOperation);
    if (!clipboard_->setText(selectedText())) {
        EDITCORE_LOG_WARN("clipboard rejected %zu bytes", selectionBytes().size());
    }
    return TextOutcome::Unchanged;
}

TextOutcome TextEditCore::cutToClipboard() {
    lastError_ = TextError::Ok;
    if (!hasSelection()) return fail(TextError::EmptyOperation);
    if (!clipboard_->setText(selectedText())) {
        EDITCORE_LOG_WARN("clipboard rejected %zu bytes, keeping selection", selectionBytes().size());
        return TextOutcome::Unchanged;
    }
    return deleteSelection();
}

TextOutcome TextEditCore::pasteFromClipboard() {
    return insertText(clipboard_->text());
}

// =============================================================================
// Styles
// =============================================================================

TextOutcome TextEditCore::addStyle(ByteRange range, std::uint32_t tag) {
    lastError_ = TextError::Ok;
    if (range.end < range.start) return fail(TextError::InvalidRange);
    if (range.end > store_->lenBytes()) return fail(TextError::InvalidBoundary);
    if (range.empty()) return fail(TextError::EmptyOperation);
    if (!styles_.add(range, tag)) return TextOutcome::Unchanged;

    history::UndoRecord rec;
    rec.kind = history::UndoOpKind::AddStyle;
    rec.bytes = range;
    rec.tag = tag;
    rec.selectionBefore = rec.selectionAfter = currentSelection();
    undo_.record(std::move(rec));
    return TextOutcome::Changed;
}

TextOutcome TextEditCore::addStyle(const TextRange& range, std::uint32_t tag) {
    ByteRange bytes;
    const TextError err = codec::rangeToBytes(*store_, range, bytes);
    if (err != TextError::Ok) return fail(err);
    return addStyle(bytes, tag);
}

TextOutcome TextEditCore::removeStyle(ByteRange range, std::uint32_t tag) {
    lastError_ = TextError::Ok;
    if (range.end < range.start) return fail(TextError::InvalidRange);
    if (!styles_.remove(range, tag)) return TextOutcome::Unchanged;

    history::UndoRecord rec;
    rec.kind = history::UndoOpKind::RemoveStyle;
    rec.bytes = range;
    rec.tag = tag;
    rec.selectionBefore = rec.selectionAfter = currentSelection();
    undo_.record(std::move(rec));
    return TextOutcome::Changed;
}

TextOutcome TextEditCore::removeStyle(const TextRange& range, std::uint32_t tag) {
    ByteRange bytes;
    const TextError err = codec::rangeToBytes(*store_, range, bytes);
    if (err != TextError::Ok) return fail(err);
    return removeStyle(bytes, tag);
}

TextOutcome TextEditCore::setStyles(const std::vector<std::pair<ByteRange, std::uint32_t>>& spans) {
    lastError_ = TextError::Ok;
    const std::size_t len = store_->lenBytes();
    for (const auto& span : spans) {
        if (span.first.end < span.first.start) return fail(TextError::InvalidRange);
        if (span.first.end > len) return fail(TextError::InvalidBoundary);
    }

    history::UndoRecord rec;
    rec.kind = history::UndoOpKind::SetStyles;
    if (config_.undoStyles) rec.stylesBefore = styles_.spans();
    styles_.set(spans);
    rec.stylesAfter = styles_.spans();
    rec.selectionBefore = rec.selectionAfter = currentSelection();
    undo_.record(std::move(rec));
    return TextOutcome::Changed;
}

// =============================================================================
// Rendering configuration
// =============================================================================

void TextEditCore::setTabWidth(std::uint32_t width) {
    config_.tabWidth = width;
    syncShaper();
}

void TextEditCore::setShowCtrl(bool show) {
    config_.showCtrl = show;
    syncShaper();
}

void TextEditCore::setWrapCtrl(bool show) {
    config_.wrapCtrl = show;
    syncShaper();
}

// =============================================================================
// Rendering queries
// =============================================================================

std::vector<Glyph> TextEditCore::glyphsForRegion(const ScreenRect& area, const ScrollOffset& scroll) {
    viewportWidth_ = area.width;
    syncMetrics(area.width);
    const bool wrap = wrapping(area.width);
    const std::uint32_t layoutWidth = wrap ? area.width : 0;

    std::vector<Glyph> out;
    const std::size_t lines = metrics_.lineCount(*store_);
    std::size_t rowsLeft = area.height;
    std::size_t screenY = area.y;
    std::size_t subRow = scroll.subRow;

    for (std::size_t line = scroll.line; rowsLeft > 0 && line < lines; ++line, subRow = 0) {
        const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, line);
        if (!segments) break;
        if (subRow >= segments->size()) continue;

        text::GlyphIterator it;
        const TextError err = shaper_.glyphsForLine(*store_, line, *segments, layoutWidth, it);
        if (err != TextError::Ok) {
            EDITCORE_LOG_WARN("shaping line %zu failed: %s", line, text::toString(err));
            break;
        }
        it.seekSegment(subRow);
        if (!wrap && scroll.column > 0) it.skipToColumn(scroll.column);

        Glyph g;
        while (it.next(g)) {
            const std::size_t rowOffset = g.screenRow - subRow;
            if (rowOffset >= rowsLeft) break;
            if (!wrap) {
                if (g.screenCol < scroll.column) continue;
                const std::uint32_t x = g.screenCol - scroll.column;
                if (x >= area.width) break;
                g.screenCol = area.x + x;
            } else {
                g.screenCol += area.x;
            }
            g.screenRow = screenY + rowOffset;
            out.push_back(std::move(g));
        }

        const std::size_t used = std::min(segments->size() - subRow, rowsLeft);
        rowsLeft -= used;
        screenY += used;
    }
    return out;
}

TextError TextEditCore::screenToPosition(const ScreenRect& area, const ScrollOffset& scroll,
                                         std::uint32_t x, std::uint32_t y, TextPosition& out) {
    if (x < area.x || y < area.y || x - area.x >= area.width || y - area.y >= area.height) {
        return TextError::InvalidBoundary;
    }
    syncMetrics(area.width);
    const bool wrap = wrapping(area.width);

    std::size_t rowTarget = y - area.y;
    std::size_t subRow = scroll.subRow;
    const std::size_t lines = metrics_.lineCount(*store_);
    for (std::size_t line = scroll.line; line < lines; ++line, subRow = 0) {
        const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, line);
        if (!segments) return TextError::InvalidBoundary;
        const std::size_t available = segments->size() > subRow ? segments->size() - subRow : 0;
        if (rowTarget >= available) {
            rowTarget -= available;
            continue;
        }
        const std::uint32_t column = (x - area.x) + (wrap ? 0 : scroll.column);
        std::size_t offset = 0;
        const TextError err = codec::screenToByte(*store_, shaper_, line, *segments,
                                                  text::ScreenPosition{subRow + rowTarget, column}, offset);
        if (err != TextError::Ok) return err;
        return store_->byteToPosition(offset, out);
    }
    return store_->byteToPosition(store_->lenBytes(), out);
}

bool TextEditCore::positionToScreen(const ScreenRect& area, const ScrollOffset& scroll,
                                    TextPosition pos, ScreenCell& out) {
    std::size_t offset = 0;
    lastError_ = store_->positionToByte(pos, offset);
    if (lastError_ != TextError::Ok) return false;
    if (pos.line < scroll.line) return false;

    syncMetrics(area.width);
    const bool wrap = wrapping(area.width);

    std::size_t rows = 0;
    for (std::size_t line = scroll.line; line < pos.line; ++line) {
        const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, line);
        if (!segments) return false;
        const std::size_t skip = line == scroll.line ? scroll.subRow : 0;
        rows += segments->size() > skip ? segments->size() - skip : 0;
        if (rows >= area.height) return false;
    }

    const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, pos.line);
    if (!segments) return false;
    text::ScreenPosition sp;
    lastError_ = codec::byteToScreen(*store_, shaper_, pos.line, *segments, offset, sp);
    if (lastError_ != TextError::Ok) return false;

    const std::size_t skip = pos.line == scroll.line ? scroll.subRow : 0;
    if (sp.row < skip) return false;
    const std::size_t y = rows + sp.row - skip;
    if (y >= area.height) return false;

    std::uint32_t x = sp.column;
    if (!wrap) {
        if (x < scroll.column) return false;
        x -= scroll.column;
    }
    if (x > area.width) return false;

    out.x = area.x + x;
    out.y = area.y + static_cast<std::uint32_t>(y);
    return true;
}

std::size_t TextEditCore::screenRowCount(std::uint32_t viewportWidth) {
    syncMetrics(viewportWidth);
    std::size_t rows = 0;
    const std::size_t lines = metrics_.lineCount(*store_);
    for (std::size_t line = 0; line < lines; ++line) {
        const std::vector<text::WrapSegment>* segments = metrics_.wrapSegments(*store_, line);
        rows += segments ? segments->size() : 1;
    }
    return rows;
}

std::uint32_t TextEditCore::lineWidth(std::size_t line) {
    syncMetrics(viewportWidth_);
    std::uint32_t width = 0;
    lastError_ = metrics_.lineWidth(*store_, line, width);
    return width;
}

} // namespace editcore::edit
