#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "docchunk/config.hpp"
#include "docchunk/types.hpp"

namespace docchunk {

// Recursive separator splitter: paragraph, line, sentence, word, character.
// Sizes are counted in code points; offsets in the returned records are bytes.
class Chunker {
public:
    explicit Chunker(const Config &cfg);

    std::vector<std::string> chunk(const std::string &text) const;
    std::vector<std::string> chunk(const std::string &text, size_t size, size_t overlap) const;

    std::vector<ChunkRecord> chunk_with_pages(const std::string &text,
                                              const std::vector<PageRecord> &pages) const;
    std::vector<ChunkRecord> chunk_with_pages(const std::string &text,
                                              const std::vector<PageRecord> &pages,
                                              size_t size, size_t overlap) const;

    // Page numbers whose [char_start, char_end) overlaps [start, end), ascending.
    static std::vector<int> pages_for_span(size_t start, size_t end, const std::vector<PageRecord> &pages);

    static const std::vector<std::string> &separators();

private:
    std::vector<ChunkRecord> split_spans(const std::string &text, size_t size, size_t overlap) const;

    size_t default_size_;
    size_t default_overlap_;
    size_t min_chunk_chars_;
};

} // namespace docchunk
