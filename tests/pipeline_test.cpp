#include <gtest/gtest.h>

#include <memory>

#include "docchunk/errors.hpp"
#include "docchunk/pipeline.hpp"
#include "docchunk/util.hpp"
#include "test_support.hpp"

using namespace docchunk;
using docchunk_test::FakeRecognizer;
using docchunk_test::make_pdf;
using docchunk_test::make_png;

namespace {

const std::string kLesson =
    "Bài 1. Máy tính và em. Máy tính giúp em học tập, giải trí và giao tiếp với bạn bè. "
    "Em cần ngồi đúng tư thế khi sử dụng máy tính.";

std::unique_ptr<DocumentPipeline> make_pipeline(Config cfg = Config{},
                                                std::vector<std::string> ocr = {"Recognized page text from scan"}) {
    return std::make_unique<DocumentPipeline>(cfg, std::make_unique<FakeRecognizer>(std::move(ocr)));
}

std::string long_text(int paragraphs) {
    std::string text;
    for (int p = 0; p < paragraphs; ++p) {
        if (p > 0) text += "\n\n";
        for (int s = 0; s < 8; ++s) {
            text += "Paragraph " + std::to_string(p) + " sentence " + std::to_string(s) +
                    " talks about document ingestion. ";
        }
    }
    return text;
}

} // namespace

TEST(PipelineTest, RejectsUnsupportedType) {
    auto pipeline = make_pipeline();
    EXPECT_THROW(pipeline->process_document("PK\x03\x04", "a.zip", "application/zip"), UnsupportedFileType);
    EXPECT_THROW(pipeline->extract_only("data", "a.bin", "application/octet-stream"), UnsupportedFileType);
}

TEST(PipelineTest, RejectsOversizedUpload) {
    Config cfg;
    cfg.max_file_size_mb = 0.0001;
    auto pipeline = make_pipeline(cfg);
    std::string bytes(200, 'x');
    EXPECT_THROW(pipeline->process_document(bytes, "big.txt", "text/plain"), SizeLimitExceeded);
    EXPECT_NO_THROW(pipeline->validate(std::string(50, 'x'), "small.txt", "text/plain"));
}

TEST(PipelineTest, BlankExtractionThrowsNoText) {
    auto pipeline = make_pipeline(Config{}, {""});
    EXPECT_THROW(pipeline->process_document("   \n\t  ", "blank.txt", "text/plain"), NoTextExtracted);
    EXPECT_THROW(pipeline->extract_only(make_png(40, 40), "blank.png", "image/png"), NoTextExtracted);
}

TEST(PipelineTest, InvalidConfigIsRejected) {
    Config cfg;
    cfg.chunk_overlap = cfg.chunk_size;
    EXPECT_THROW(make_pipeline(cfg), ConfigError);
}

TEST(PipelineTest, ExtractOnlyCountsCodePoints) {
    auto pipeline = make_pipeline();
    ExtractResult r = pipeline->extract_only(kLesson, "lesson.txt", "text/plain");
    EXPECT_EQ(r.text, kLesson);
    EXPECT_EQ(r.filename, "lesson.txt");
    EXPECT_EQ(r.file_type, "text/plain");
    EXPECT_EQ(r.char_count, utf8_length(kLesson));
    EXPECT_LT(r.char_count, kLesson.size());
}

TEST(PipelineTest, ProcessDocumentFillsMetadata) {
    Config cfg;
    cfg.chunk_size = 200;
    cfg.chunk_overlap = 40;
    auto pipeline = make_pipeline(cfg);
    std::string bytes = long_text(4);

    ProcessedDocument doc = pipeline->process_document(bytes, "notes.md", "text/markdown");
    ASSERT_GT(doc.chunks.size(), 1u);
    ASSERT_EQ(doc.metadata.size(), doc.chunks.size());
    EXPECT_EQ(doc.full_text, bytes);

    std::string hash = md5_hex(bytes);
    for (size_t i = 0; i < doc.metadata.size(); ++i) {
        const ChunkMetadata &m = doc.metadata[i];
        EXPECT_EQ(m.chunk_index, i);
        EXPECT_EQ(m.total_chunks, doc.chunks.size());
        EXPECT_EQ(m.filename, "notes.md");
        EXPECT_EQ(m.file_type, "text/markdown");
        EXPECT_EQ(m.content_hash, hash);
        EXPECT_FALSE(m.pages.has_value());
        EXPECT_FALSE(m.page_range.has_value());
        EXPECT_LE(utf8_length(doc.chunks[i]), 200u);
    }
}

TEST(PipelineTest, ExtraMetadataObjectBecomesFields) {
    auto pipeline = make_pipeline();
    ProcessedDocument doc = pipeline->process_document(kLesson, "lesson.txt", "text/plain",
                                                       std::string(R"({"course":"CS101","filename":"spoofed"})"));
    ASSERT_EQ(doc.metadata.size(), 1u);
    const ChunkMetadata &m = doc.metadata[0];
    EXPECT_EQ(m.extra.at("course"), "CS101");
    EXPECT_FALSE(m.raw_metadata.has_value());

    json j = to_json(m);
    EXPECT_EQ(j["course"], "CS101");
    EXPECT_EQ(j["filename"], "lesson.txt");
}

TEST(PipelineTest, NonObjectExtraMetadataIsKeptRaw) {
    auto pipeline = make_pipeline();
    ProcessedDocument doc =
        pipeline->process_document(kLesson, "lesson.txt", "text/plain", std::string("uploaded by admin"));
    ASSERT_EQ(doc.metadata.size(), 1u);
    EXPECT_TRUE(doc.metadata[0].extra.empty());
    ASSERT_TRUE(doc.metadata[0].raw_metadata.has_value());
    EXPECT_EQ(*doc.metadata[0].raw_metadata, "uploaded by admin");

    ParsedExtraMetadata array = parse_extra_metadata("[1, 2]");
    EXPECT_TRUE(array.fields.empty());
    ASSERT_TRUE(array.raw.has_value());
    EXPECT_EQ(*array.raw, "[1, 2]");
    EXPECT_EQ(parse_extra_metadata(R"({"k": 1})").fields.at("k"), 1);
}

TEST(PipelineTest, TextbookRequiresNameAndPublisher) {
    auto pipeline = make_pipeline();
    TextbookRequest req;
    req.book_name = "  ";
    req.publisher = "Cánh Diều";
    EXPECT_THROW(pipeline->process_textbook(kLesson, "SGK_TIN_CD_3.txt", "text/plain", req), std::invalid_argument);

    req.book_name = "Tin học 3";
    req.publisher = "";
    EXPECT_THROW(pipeline->process_textbook(kLesson, "SGK_TIN_CD_3.txt", "text/plain", req), std::invalid_argument);
}

TEST(PipelineTest, TextbookPlainTextHasSinglePage) {
    auto pipeline = make_pipeline();
    TextbookRequest req;
    req.book_name = "Tin học 3";
    req.publisher = "Cánh Diều";
    req.grade = "Lớp 3";

    TextbookDocument doc = pipeline->process_textbook(kLesson, "SGK_TIN_CD_3.txt", "text/plain", req);
    ASSERT_EQ(doc.pages.size(), 1u);
    ASSERT_EQ(doc.chunks.size(), 1u);
    EXPECT_EQ(doc.book_metadata.subject, "Tin học");

    const ChunkMetadata &m = doc.metadata[0];
    ASSERT_TRUE(m.pages.has_value());
    EXPECT_EQ(*m.pages, std::vector<int>{1});
    EXPECT_EQ(*m.page_range, "Page 1");
    EXPECT_EQ(*m.char_start, 0u);
    EXPECT_EQ(*m.char_end, kLesson.size());
    ASSERT_TRUE(m.textbook.has_value());
    EXPECT_EQ(m.textbook->book_full_name, "Tin học 3 - Cánh Diều - Lớp 3");
    EXPECT_EQ(m.textbook->product_name, "Tin học 3 - Cánh Diều - Lớp 3");
    EXPECT_EQ(m.textbook->parsed.full_name, "Sách giáo khoa Tin học Cánh Diều Lớp 3");

    json j = to_json(m);
    EXPECT_EQ(j["book_name"], "Tin học 3");
    EXPECT_EQ(j["filename_metadata"]["grade"], "Lớp 3");
    EXPECT_EQ(j["page_range"], "Page 1");
}

TEST(PipelineTest, TextbookProductNameOverridesFullName) {
    auto pipeline = make_pipeline();
    TextbookRequest req;
    req.book_name = "Toán 7";
    req.publisher = "Kết Nối Tri Thức";
    req.product_name = "Toán 7 bản mới";

    TextbookDocument doc = pipeline->process_textbook(kLesson, "lesson.txt", "text/plain", req);
    ASSERT_FALSE(doc.metadata.empty());
    EXPECT_EQ(doc.metadata[0].textbook->product_name, "Toán 7 bản mới");
    EXPECT_EQ(doc.metadata[0].textbook->book_full_name, "Toán 7 - Kết Nối Tri Thức");
    EXPECT_FALSE(doc.metadata[0].textbook->grade.has_value());
    EXPECT_EQ(doc.book_metadata.full_name, "lesson.txt");
}

TEST(PipelineTest, TextbookPdfTracksPages) {
    Config cfg;
    cfg.chunk_size = 100;
    cfg.chunk_overlap = 10;
    auto pipeline = make_pipeline(cfg, {"Recognized text of the scanned exercise page"});
    std::string pdf = make_pdf({
        "Lesson one explains how a computer helps students learn every day.",
        "",
        "Lesson two shows how to sit correctly in front of the computer screen.",
    });
    TextbookRequest req;
    req.book_name = "Tin học 3";
    req.publisher = "Cánh Diều";

    TextbookDocument doc = pipeline->process_textbook(pdf, "SGK_TIN_CD_3.pdf", "application/pdf", req);
    ASSERT_EQ(doc.pages.size(), 3u);
    EXPECT_TRUE(doc.pages[1].ocr_used);
    ASSERT_FALSE(doc.chunks.empty());

    for (size_t i = 0; i < doc.chunks.size(); ++i) {
        const ChunkRecord &c = doc.chunks[i];
        const ChunkMetadata &m = doc.metadata[i];
        EXPECT_EQ(doc.full_text.substr(c.char_start, c.char_end - c.char_start), c.text);
        EXPECT_FALSE(c.pages.empty());
        EXPECT_EQ(*m.pages, c.pages);
        EXPECT_EQ(*m.page_range, format_page_range(c.pages));
    }
    EXPECT_EQ(doc.chunks.front().pages.front(), 1);
    EXPECT_EQ(doc.chunks.back().pages.back(), 3);
}

TEST(PipelineTest, SubmitRunsOnPool) {
    auto pipeline = make_pipeline();
    WorkerPool pool(2, 4);

    auto ok = pipeline->submit_document(pool, kLesson, "lesson.txt", "text/plain");
    auto bad = pipeline->submit_document(pool, "data", "a.zip", "application/zip");
    TextbookRequest req;
    req.book_name = "Tin học 3";
    req.publisher = "Cánh Diều";
    auto book = pipeline->submit_textbook(pool, kLesson, "SGK_TIN_CD_3.txt", "text/plain", req);

    EXPECT_EQ(ok.get().chunks.size(), 1u);
    EXPECT_THROW(bad.get(), UnsupportedFileType);
    EXPECT_EQ(book.get().pages.size(), 1u);

    pool.shutdown();
    EXPECT_EQ(pool.get_stats().completed_tasks, 2u);
    EXPECT_EQ(pool.get_stats().failed_tasks, 1u);
}

TEST(PipelineTest, SubmitHonoursCancellation) {
    auto pipeline = make_pipeline();
    WorkerPool pool(1, 2);
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    auto fut = pipeline->submit_document(pool, kLesson, "lesson.txt", "text/plain", std::nullopt, token);
    EXPECT_THROW(fut.get(), Cancelled);
}
