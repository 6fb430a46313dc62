#include "docchunk/types.hpp"

#include <algorithm>

namespace docchunk {

std::string format_page_range(const std::vector<int> &pages) {
    if (pages.empty()) return "";
    if (pages.size() == 1) return "Page " + std::to_string(pages.front());
    auto mm = std::minmax_element(pages.begin(), pages.end());
    return std::to_string(*mm.first) + "-" + std::to_string(*mm.second);
}

json to_json(const PageRecord &page) {
    return {
        {"page_number", page.page_number},
        {"text", page.text},
        {"char_start", page.char_start},
        {"char_end", page.char_end},
        {"ocr_used", page.ocr_used}
    };
}

json to_json(const ChunkRecord &chunk) {
    return {
        {"text", chunk.text},
        {"pages", chunk.pages},
        {"char_start", chunk.char_start},
        {"char_end", chunk.char_end}
    };
}

json to_json(const BookMetadata &meta) {
    return {
        {"book_type", meta.book_type},
        {"subject", meta.subject},
        {"publisher", meta.publisher},
        {"grade", meta.grade},
        {"full_name", meta.full_name}
    };
}

json to_json(const TextbookFields &fields) {
    json j = {
        {"product_name", fields.product_name},
        {"book_name", fields.book_name},
        {"publisher", fields.publisher},
        {"book_full_name", fields.book_full_name},
        {"filename_metadata", to_json(fields.parsed)}
    };
    j["grade"] = fields.grade ? json(*fields.grade) : json(nullptr);
    return j;
}

json to_json(const ChunkMetadata &meta) {
    json j;
    j["filename"] = meta.filename;
    j["file_type"] = meta.file_type;
    j["file_hash"] = meta.content_hash;
    j["chunk_index"] = meta.chunk_index;
    j["total_chunks"] = meta.total_chunks;

    if (meta.pages) j["pages"] = *meta.pages;
    if (meta.page_range) j["page_range"] = *meta.page_range;
    if (meta.char_start) j["char_start"] = *meta.char_start;
    if (meta.char_end) j["char_end"] = *meta.char_end;

    if (meta.textbook) {
        json tb = to_json(*meta.textbook);
        for (auto &kv : tb.items()) j[kv.key()] = kv.value();
    }
    for (auto &kv : meta.extra) {
        if (!j.contains(kv.first)) j[kv.first] = kv.second;
    }
    if (meta.raw_metadata) j["raw_metadata"] = *meta.raw_metadata;
    return j;
}

} // namespace docchunk
