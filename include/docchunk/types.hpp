#pragma once
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace docchunk {

using json = nlohmann::json;

// One page of a paginated source. Offsets are byte offsets into the document's
// full text, where pages are joined by kPageSeparator.
struct PageRecord {
    int page_number = 0;        // 1-based
    std::string text;
    size_t char_start = 0;
    size_t char_end = 0;
    bool ocr_used = false;
};

inline constexpr const char *kPageSeparator = "\n\n";
inline constexpr size_t kPageSeparatorLength = 2;

// A chunk of full text. text == full_text.substr(char_start, char_end - char_start).
struct ChunkRecord {
    std::string text;
    std::vector<int> pages;     // ascending, unique; empty without page context
    size_t char_start = 0;
    size_t char_end = 0;
};

struct BookMetadata {
    std::string book_type;
    std::string subject;
    std::string publisher;
    std::string grade;
    std::string full_name;
};

// Caller-supplied fields of a textbook upload.
struct TextbookRequest {
    std::string book_name;
    std::string publisher;
    std::optional<std::string> grade;
    std::optional<std::string> product_name;
};

// Typed textbook block attached to every chunk of a textbook upload.
struct TextbookFields {
    std::string product_name;
    std::string book_name;
    std::string publisher;
    std::optional<std::string> grade;
    std::string book_full_name;
    BookMetadata parsed;        // from the filename convention
};

// Caller-supplied keys that are not part of the promised record.
using ExtraFields = std::map<std::string, json>;

struct ChunkMetadata {
    std::string filename;
    std::string file_type;
    std::string content_hash;   // md5 hex of the raw upload
    size_t chunk_index = 0;
    size_t total_chunks = 0;

    // Present only when page context exists.
    std::optional<std::vector<int>> pages;
    std::optional<std::string> page_range;
    std::optional<size_t> char_start;
    std::optional<size_t> char_end;

    std::optional<TextbookFields> textbook;
    ExtraFields extra;
    std::optional<std::string> raw_metadata;
};

struct ExtractResult {
    std::string text;
    std::string filename;
    std::string file_type;
    size_t char_count = 0;      // code points
};

struct ProcessedDocument {
    std::string full_text;
    std::vector<std::string> chunks;
    std::vector<ChunkMetadata> metadata;
};

struct TextbookDocument {
    std::string full_text;
    std::vector<PageRecord> pages;
    std::vector<ChunkRecord> chunks;
    BookMetadata book_metadata;
    std::vector<ChunkMetadata> metadata;
};

struct CodeBlock {
    std::string language;
    std::string code;
};

// "<min>-<max>" for several pages, "Page <n>" for one, "" for none.
std::string format_page_range(const std::vector<int> &pages);

json to_json(const PageRecord &page);
json to_json(const ChunkRecord &chunk);
json to_json(const BookMetadata &meta);
json to_json(const TextbookFields &fields);
// Extra fields never override the keys of the base record.
json to_json(const ChunkMetadata &meta);

} // namespace docchunk
