#include <gtest/gtest.h>
#include "editcore/text/rope_text_store.h"
#include "editcore/text/rope.h"

#include <algorithm>
#include <random>
#include <string>

using namespace editcore::text;

class RopeTextStoreTest : public ::testing::Test {
protected:
    RopeTextStore store;

    static std::size_t countLines(const std::string& s) {
        return static_cast<std::size_t>(std::count(s.begin(), s.end(), '\n')) + 1;
    }
};

// =============================================================================
// Rope
// =============================================================================

TEST(RopeTest, LargeAssignSplitsIntoChunks) {
    std::string text;
    for (int i = 0; i < 2000; ++i) text += "line " + std::to_string(i) + "\n";
    Rope rope(text);
    EXPECT_EQ(rope.size(), text.size());
    EXPECT_EQ(rope.lineBreaks(), 2000u);
    EXPECT_GT(rope.chunkCount(), 1u);
    EXPECT_EQ(rope.toString(), text);
    EXPECT_EQ(rope.slice(100, 50), text.substr(100, 50));
    EXPECT_EQ(rope.lineStart(10), text.find("line 10\n"));
    EXPECT_EQ(rope.breaksBefore(text.size()), 2000u);
}

TEST(RopeTest, RandomEditsMatchString) {
    std::mt19937 rng(1234);
    std::string model;
    Rope rope;
    const std::string alphabet = "abc\nxyz \n0123";
    for (int step = 0; step < 3000; ++step) {
        const bool insert = model.empty() || (rng() % 3) != 0;
        if (insert) {
            const std::size_t at = rng() % (model.size() + 1);
            std::string piece;
            const std::size_t len = 1 + rng() % 300;
            for (std::size_t i = 0; i < len; ++i) piece.push_back(alphabet[rng() % alphabet.size()]);
            model.insert(at, piece);
            rope.insert(at, piece);
        } else {
            const std::size_t at = rng() % model.size();
            const std::size_t len = std::min<std::size_t>(1 + rng() % 400, model.size() - at);
            std::string removed;
            rope.erase(at, len, &removed);
            EXPECT_EQ(removed, model.substr(at, len));
            model.erase(at, len);
        }
        ASSERT_EQ(rope.size(), model.size());
    }
    EXPECT_EQ(rope.toString(), model);
    EXPECT_EQ(rope.lineBreaks(), static_cast<std::size_t>(std::count(model.begin(), model.end(), '\n')));

    Rope::Cursor cursor(rope);
    cursor.seek(model.size() / 2);
    std::string tail;
    for (std::string_view chunk = cursor.next(); !chunk.empty(); chunk = cursor.next()) {
        tail.append(chunk.data(), chunk.size());
    }
    EXPECT_EQ(tail, model.substr(model.size() / 2));
}

// =============================================================================
// RopeTextStore
// =============================================================================

TEST_F(RopeTextStoreTest, LinesAndTerminators) {
    store.setText("h\xC3\xA9llo\nw\xC3\xB6rld");
    EXPECT_EQ(store.kind(), TextStoreKind::Rope);
    EXPECT_TRUE(store.isMultiLine());
    EXPECT_EQ(store.lenLines(), 2u);
    EXPECT_EQ(store.lineText(0), "h\xC3\xA9llo");
    EXPECT_EQ(store.lineText(1), "w\xC3\xB6rld");
    EXPECT_EQ(store.lineWidth(0), 5u);
    EXPECT_EQ(store.lineOfOffset(6), 0u);
    EXPECT_EQ(store.lineOfOffset(7), 1u);

    ByteRange full;
    ASSERT_EQ(store.lineBytesWithTerminator(0, full), TextError::Ok);
    EXPECT_EQ(full, (ByteRange{0, 7}));
    EXPECT_FALSE(store.hasFinalNewline());
}

TEST_F(RopeTextStoreTest, CrLfLineBytes) {
    store.setText("ab\r\ncd\r\n");
    EXPECT_EQ(store.lenLines(), 3u);
    ByteRange line;
    ASSERT_EQ(store.lineBytes(0, line), TextError::Ok);
    EXPECT_EQ(line, (ByteRange{0, 2}));
    ASSERT_EQ(store.lineBytes(1, line), TextError::Ok);
    EXPECT_EQ(line, (ByteRange{4, 6}));
    ASSERT_EQ(store.lineBytes(2, line), TextError::Ok);
    EXPECT_EQ(line, (ByteRange{8, 8}));
    EXPECT_FALSE(store.isGraphemeBoundary(3));
    EXPECT_TRUE(store.isGraphemeBoundary(4));
    EXPECT_TRUE(store.hasFinalNewline());

    EditDelta delta;
    EXPECT_EQ(store.insert(3, "x", delta), TextError::InvalidBoundary);
    std::string removed;
    EXPECT_EQ(store.remove(ByteRange{2, 3}, removed, delta), TextError::InvalidBoundary);
}

TEST_F(RopeTextStoreTest, DeltaCountsLineBreaks) {
    store.setText("one\ntwo\nthree");
    EditDelta delta;
    ASSERT_EQ(store.insert(4, "a\nb\n", delta), TextError::Ok);
    EXPECT_EQ(delta.line, 1u);
    EXPECT_EQ(delta.insertedBreaks, 2u);
    EXPECT_TRUE(delta.changesLineCount());
    EXPECT_EQ(store.lenLines(), 5u);

    std::string removed;
    ASSERT_EQ(store.remove(ByteRange{3, 8}, removed, delta), TextError::Ok);
    EXPECT_EQ(removed, "\na\nb\n");
    EXPECT_EQ(delta.line, 0u);
    EXPECT_EQ(delta.removedBreaks, 3u);
    EXPECT_EQ(store.text(), "onetwo\nthree");

    ASSERT_EQ(store.insert(2, "N", delta), TextError::Ok);
    EXPECT_FALSE(delta.changesLineCount());
}

TEST_F(RopeTextStoreTest, LargeEditsAgreeWithString) {
    std::string model;
    for (int i = 0; i < 5000; ++i) model += "r\xC3\xB6w " + std::to_string(i) + "\n";
    store.setText(model);

    std::mt19937 rng(99);
    for (int step = 0; step < 500; ++step) {
        const std::size_t line = rng() % store.lenLines();
        ByteRange content;
        ASSERT_EQ(store.lineBytes(line, content), TextError::Ok);
        EditDelta delta;
        if (step % 2 == 0) {
            ASSERT_EQ(store.insert(content.start, "ins\n", delta), TextError::Ok);
            model.insert(content.start, "ins\n");
        } else if (content.size() > 0) {
            std::string removed;
            ASSERT_EQ(store.remove(content, removed, delta), TextError::Ok);
            model.erase(content.start, content.size());
        }
    }
    EXPECT_EQ(store.text(), model);
    EXPECT_EQ(store.lenLines(), countLines(model));

    TextPosition pos;
    ASSERT_EQ(store.byteToPosition(model.size(), pos), TextError::Ok);
    EXPECT_EQ(pos.line, store.lenLines() - 1);
}

TEST_F(RopeTextStoreTest, GraphemesAcrossChunks) {
    // Combining marks straddle many chunk seams.
    std::string text;
    for (int i = 0; i < 3000; ++i) text += "e\xCC\x81";
    store.setText(text);
    GraphemeIterator it;
    ASSERT_EQ(store.graphemes(ByteRange{0, store.lenBytes()}, it), TextError::Ok);
    std::size_t count = 0;
    Grapheme g;
    while (it.next(g)) {
        ASSERT_EQ(g.text, "e\xCC\x81");
        ++count;
    }
    EXPECT_EQ(count, 3000u);
    EXPECT_EQ(store.lineWidth(0), 3000u);
    EXPECT_FALSE(store.isGraphemeBoundary(1));
    EXPECT_TRUE(store.isGraphemeBoundary(3 * 1500));
}

TEST_F(RopeTextStoreTest, BoundariesDeepInsideLongLine) {
    std::string text;
    for (int i = 0; i < 2000; ++i) text += "ae\xCC\x81";
    const std::size_t base = text.size() + 2;
    text += "ab\xF0\x9F\x87\xAB\xF0\x9F\x87\xB7\xF0\x9F\x87\xA9\xF0\x9F\x87\xAA";
    store.setText(text);

    EXPECT_TRUE(store.isGraphemeBoundary(4 * 1200 + 1));
    EXPECT_FALSE(store.isGraphemeBoundary(4 * 1200 + 2));
    EXPECT_TRUE(store.isGraphemeBoundary(4 * 1200 + 4));
    // Regional indicators pair up counting from the last ASCII letter.
    EXPECT_TRUE(store.isGraphemeBoundary(base));
    EXPECT_FALSE(store.isGraphemeBoundary(base + 4));
    EXPECT_TRUE(store.isGraphemeBoundary(base + 8));
    EXPECT_FALSE(store.isGraphemeBoundary(base + 12));
    EXPECT_TRUE(store.isGraphemeBoundary(base + 16));
}

TEST_F(RopeTextStoreTest, SkipLineJumpsPastNewline) {
    store.setText("first line\nsecond");
    GraphemeIterator it;
    ASSERT_EQ(store.graphemes(ByteRange{0, store.lenBytes()}, it), TextError::Ok);
    it.skipLine();
    Grapheme g;
    ASSERT_TRUE(it.next(g));
    EXPECT_EQ(g.text, "s");
    EXPECT_EQ(g.bytes.start, 11u);

    it.skipLine();
    EXPECT_TRUE(it.done());
}
