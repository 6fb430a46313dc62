#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "docchunk/chunker.hpp"
#include "docchunk/text_extractor.hpp"
#include "docchunk/util.hpp"

using namespace docchunk;

namespace {

std::string numbered_words(int count) {
    std::string text;
    for (int i = 0; i < count; ++i) {
        if (i > 0) text += " ";
        text += "word" + std::to_string(i);
    }
    return text;
}

} // namespace

TEST(ChunkerTest, ShortTextIsOneChunk) {
    Chunker chunker{Config{}};
    std::string text = "Hello world, this is a short document about chunking.";
    auto chunks = chunker.chunk(text);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], text);
}

TEST(ChunkerTest, EmptyTextYieldsNoChunks) {
    Chunker chunker{Config{}};
    EXPECT_TRUE(chunker.chunk("").empty());
    EXPECT_TRUE(chunker.chunk("   \n\n  ").empty());
}

TEST(ChunkerTest, ChunksRespectSizeAndOverlapNeighbours) {
    Chunker chunker{Config{}};
    std::string text = numbered_words(200);
    auto records = chunker.chunk_with_pages(text, {}, 100, 30);

    ASSERT_GT(records.size(), 5u);
    EXPECT_EQ(records.front().char_start, 0u);
    EXPECT_EQ(records.back().char_end, text.size());
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_LE(utf8_length(records[i].text), 100u);
        EXPECT_EQ(records[i].text, text.substr(records[i].char_start, records[i].char_end - records[i].char_start));
        EXPECT_TRUE(records[i].pages.empty());
        if (i > 0) {
            EXPECT_GT(records[i].char_start, records[i - 1].char_start);
            EXPECT_LT(records[i].char_start, records[i - 1].char_end);
        }
    }
}

TEST(ChunkerTest, ZeroOverlapLeavesNoSharedText) {
    Chunker chunker{Config{}};
    std::string text = numbered_words(120);
    auto records = chunker.chunk_with_pages(text, {}, 80, 0);
    ASSERT_GT(records.size(), 2u);
    for (size_t i = 1; i < records.size(); ++i) {
        EXPECT_GE(records[i].char_start, records[i - 1].char_end);
    }
}

TEST(ChunkerTest, Deterministic) {
    Chunker chunker{Config{}};
    std::string text = "First paragraph about something.\n\nSecond paragraph. It has two sentences.\n" +
                       numbered_words(300);
    EXPECT_EQ(chunker.chunk(text, 120, 20), chunker.chunk(text, 120, 20));
}

TEST(ChunkerTest, DropsFragmentsAtOrBelowFloor) {
    Chunker chunker{Config{}};
    std::string para = "Second paragraph with enough text";
    auto chunks = chunker.chunk("abc\n\n" + para, 36, 0);
    ASSERT_EQ(chunks.size(), 1u);
    EXPECT_EQ(chunks[0], para);
}

TEST(ChunkerTest, LongWordFallsBackToCharacters) {
    Chunker chunker{Config{}};
    std::string text(60, 'a');
    auto chunks = chunker.chunk(text, 25, 0);
    // The trailing 10 characters fall under the 20 character floor.
    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_EQ(chunks[0], std::string(25, 'a'));
    EXPECT_EQ(chunks[1], std::string(25, 'a'));
}

TEST(ChunkerTest, RepeatedTextGetsDistinctSpans) {
    Chunker chunker{Config{}};
    std::string sentence = "The same sentence appears several times here.";
    std::string text = sentence + " " + sentence + " " + sentence + " " + sentence;
    auto records = chunker.chunk_with_pages(text, {}, 50, 0);

    ASSERT_GE(records.size(), 4u);
    for (size_t i = 0; i < records.size(); ++i) {
        EXPECT_EQ(records[i].text, text.substr(records[i].char_start, records[i].char_end - records[i].char_start));
        if (i > 0) EXPECT_GT(records[i].char_start, records[i - 1].char_start);
    }
}

TEST(ChunkerTest, ChunkSpanningTwoPagesListsBoth) {
    Chunker chunker{Config{}};
    std::string p1 = "Page one carries this sentence about photosynthesis and light.";
    std::string p2 = "Page two continues with chlorophyll and the Calvin cycle steps.";
    PagedText paged = TextExtractor::join_pages({p1, p2}, {false, false});

    auto whole = chunker.chunk_with_pages(paged.text, paged.pages, 200, 20);
    ASSERT_EQ(whole.size(), 1u);
    EXPECT_EQ(whole[0].pages, (std::vector<int>{1, 2}));

    auto split = chunker.chunk_with_pages(paged.text, paged.pages, 80, 20);
    ASSERT_EQ(split.size(), 2u);
    EXPECT_EQ(split[0].text, p1);
    EXPECT_EQ(split[0].pages, std::vector<int>{1});
    EXPECT_EQ(split[1].text, p2);
    EXPECT_EQ(split[1].pages, std::vector<int>{2});
}

TEST(ChunkerTest, PagesForSpanIsSortedAndUnique) {
    std::vector<PageRecord> pages(3);
    for (int i = 0; i < 3; ++i) {
        pages[i].page_number = 3 - i;
        pages[i].char_start = static_cast<size_t>(i) * 10;
        pages[i].char_end = static_cast<size_t>(i) * 10 + 8;
    }
    EXPECT_EQ(Chunker::pages_for_span(5, 25, pages), (std::vector<int>{1, 2, 3}));
    EXPECT_EQ(Chunker::pages_for_span(8, 10, pages), std::vector<int>{});
    EXPECT_EQ(Chunker::pages_for_span(0, 1, pages), std::vector<int>{3});
}

TEST(ChunkerTest, RejectsInvalidArguments) {
    Chunker chunker{Config{}};
    EXPECT_THROW(chunker.chunk("some text", 0, 0), std::invalid_argument);
    EXPECT_THROW(chunker.chunk("some text", 10, 11), std::invalid_argument);
    EXPECT_NO_THROW(chunker.chunk("some text", 10, 10));
}

TEST(ChunkerTest, CountsCodePointsNotBytes) {
    Chunker chunker{Config{}};
    std::string text;
    for (int i = 0; i < 40; ++i) text += "Tiếng Việt có dấu ";
    auto records = chunker.chunk_with_pages(text, {}, 30, 5);

    ASSERT_FALSE(records.empty());
    for (auto &r : records) {
        EXPECT_LE(utf8_length(r.text), 30u);
        EXPECT_EQ(sanitize_utf8(r.text), r.text);
        EXPECT_EQ(r.text, text.substr(r.char_start, r.char_end - r.char_start));
    }
}

TEST(ChunkerTest, DefaultsComeFromConfig) {
    Config cfg;
    cfg.chunk_size = 60;
    cfg.chunk_overlap = 10;
    Chunker chunker(cfg);
    std::string text = numbered_words(100);
    EXPECT_EQ(chunker.chunk(text), chunker.chunk(text, 60, 10));
}
