#include <gtest/gtest.h>

#include "docchunk/types.hpp"

using namespace docchunk;

TEST(TypesTest, FormatPageRange) {
    EXPECT_EQ(format_page_range({}), "");
    EXPECT_EQ(format_page_range({3}), "Page 3");
    EXPECT_EQ(format_page_range({2, 5, 3}), "2-5");
}

TEST(TypesTest, ChunkMetadataJsonOmitsAbsentPageFields) {
    ChunkMetadata meta;
    meta.filename = "a.txt";
    meta.file_type = "text/plain";
    meta.content_hash = "900150983cd24fb0d6963f7d28e17f72";
    meta.chunk_index = 2;
    meta.total_chunks = 5;

    json j = to_json(meta);
    EXPECT_EQ(j["file_hash"], "900150983cd24fb0d6963f7d28e17f72");
    EXPECT_EQ(j["chunk_index"], 2);
    EXPECT_EQ(j["total_chunks"], 5);
    EXPECT_FALSE(j.contains("pages"));
    EXPECT_FALSE(j.contains("page_range"));
    EXPECT_FALSE(j.contains("raw_metadata"));
}

TEST(TypesTest, ExtraFieldsNeverOverrideBaseKeys) {
    ChunkMetadata meta;
    meta.filename = "real.pdf";
    meta.chunk_index = 0;
    meta.extra["filename"] = "fake.pdf";
    meta.extra["chunk_index"] = 99;
    meta.extra["uploader"] = "alice";
    meta.raw_metadata = "free form note";

    json j = to_json(meta);
    EXPECT_EQ(j["filename"], "real.pdf");
    EXPECT_EQ(j["chunk_index"], 0);
    EXPECT_EQ(j["uploader"], "alice");
    EXPECT_EQ(j["raw_metadata"], "free form note");
}

TEST(TypesTest, TextbookBlockIsFlattened) {
    TextbookFields tb;
    tb.product_name = "Tin học 3 - Cánh Diều";
    tb.book_name = "Tin học 3";
    tb.publisher = "Cánh Diều";
    tb.book_full_name = "Tin học 3 - Cánh Diều";
    tb.parsed.subject = "Tin học";

    ChunkMetadata meta;
    meta.pages = std::vector<int>{4, 5};
    meta.page_range = "4-5";
    meta.char_start = 10;
    meta.char_end = 90;
    meta.textbook = tb;

    json j = to_json(meta);
    EXPECT_EQ(j["pages"], json::array({4, 5}));
    EXPECT_EQ(j["page_range"], "4-5");
    EXPECT_EQ(j["char_start"], 10);
    EXPECT_EQ(j["book_full_name"], "Tin học 3 - Cánh Diều");
    EXPECT_TRUE(j["grade"].is_null());
    EXPECT_EQ(j["filename_metadata"]["subject"], "Tin học");
}

TEST(TypesTest, PageRecordJson) {
    PageRecord page;
    page.page_number = 2;
    page.text = "hello";
    page.char_start = 7;
    page.char_end = 12;
    page.ocr_used = true;

    json j = to_json(page);
    EXPECT_EQ(j["page_number"], 2);
    EXPECT_EQ(j["char_end"], 12);
    EXPECT_EQ(j["ocr_used"], true);
}
