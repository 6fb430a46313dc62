#include "docchunk/chunker.hpp"

#include <algorithm>
#include <deque>
#include <stdexcept>

#include "docchunk/log.hpp"
#include "docchunk/util.hpp"

namespace docchunk {

static const char *kComponent = "Chunker";

namespace {

// A byte range of the source text together with its length in code points.
struct Piece {
    size_t start;
    size_t end;
    size_t len;
};

size_t code_points(const std::string &text, size_t start, size_t end) {
    size_t n = 0;
    for (size_t i = start; i < end; ++i) {
        if ((static_cast<unsigned char>(text[i]) & 0xC0) != 0x80) n++;
    }
    return n;
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Splits text[start, end) into pieces and merges them into chunk spans.
class RecursiveSplitter {
public:
    RecursiveSplitter(const std::string &text, size_t size, size_t overlap)
        : text_(text), size_(size), overlap_(overlap), seps_(Chunker::separators()) {}

    void split(size_t start, size_t end, size_t first_sep, std::vector<Piece> &out) const {
        // First separator present in the range wins; "" always matches.
        size_t chosen = seps_.size() - 1;
        for (size_t i = first_sep; i < seps_.size(); ++i) {
            if (seps_[i].empty() || find_in(seps_[i], start, end) != std::string::npos) {
                chosen = i;
                break;
            }
        }
        bool has_next = !seps_[chosen].empty() && chosen + 1 < seps_.size();

        std::vector<Piece> good;
        for (const Piece &p : pieces(start, end, seps_[chosen])) {
            if (p.len < size_) {
                good.push_back(p);
                continue;
            }
            if (!good.empty()) {
                merge(good, out);
                good.clear();
            }
            if (has_next) {
                split(p.start, p.end, chosen + 1, out);
            } else {
                out.push_back(p);
            }
        }
        if (!good.empty()) merge(good, out);
    }

private:
    size_t find_in(const std::string &sep, size_t start, size_t end) const {
        size_t pos = text_.find(sep, start);
        if (pos == std::string::npos || pos + sep.size() > end) return std::string::npos;
        return pos;
    }

    // The separator stays attached to the start of the piece that follows it.
    std::vector<Piece> pieces(size_t start, size_t end, const std::string &sep) const {
        std::vector<Piece> out;
        if (sep.empty()) {
            for (size_t i = start; i < end;) {
                size_t w = std::min(utf8_char_width(text_, i), end - i);
                out.push_back({i, i + w, 1});
                i += w;
            }
            return out;
        }

        size_t piece_start = start;
        size_t search = start;
        size_t occ;
        while ((occ = find_in(sep, search, end)) != std::string::npos) {
            if (occ > piece_start) out.push_back({piece_start, occ, code_points(text_, piece_start, occ)});
            piece_start = occ;
            search = occ + sep.size();
        }
        if (end > piece_start) out.push_back({piece_start, end, code_points(text_, piece_start, end)});
        return out;
    }

    void emit(const std::deque<Piece> &current, std::vector<Piece> &out) const {
        size_t s = current.front().start;
        size_t e = current.back().end;
        while (s < e && is_space(text_[s])) s++;
        while (e > s && is_space(text_[e - 1])) e--;
        if (s < e) out.push_back({s, e, code_points(text_, s, e)});
    }

    void merge(const std::vector<Piece> &splits, std::vector<Piece> &out) const {
        std::deque<Piece> current;
        size_t total = 0;
        for (const Piece &d : splits) {
            if (total + d.len > size_) {
                if (total > size_) {
                    log_debug(kComponent, "Created a chunk of size ", total,
                              ", which is longer than the specified ", size_);
                }
                if (!current.empty()) {
                    emit(current, out);
                    while (!current.empty() && (total > overlap_ || (total + d.len > size_ && total > 0))) {
                        total -= current.front().len;
                        current.pop_front();
                    }
                }
            }
            current.push_back(d);
            total += d.len;
        }
        if (!current.empty()) emit(current, out);
    }

    const std::string &text_;
    size_t size_;
    size_t overlap_;
    const std::vector<std::string> &seps_;
};

} // namespace

const std::vector<std::string> &Chunker::separators() {
    static const std::vector<std::string> seps = {"\n\n", "\n", ". ", " ", ""};
    return seps;
}

Chunker::Chunker(const Config &cfg)
    : default_size_(cfg.chunk_size),
      default_overlap_(cfg.chunk_overlap),
      min_chunk_chars_(cfg.min_chunk_chars) {}

std::vector<ChunkRecord> Chunker::split_spans(const std::string &text, size_t size, size_t overlap) const {
    if (size == 0) throw std::invalid_argument("chunk size must be positive");
    if (overlap > size) {
        throw std::invalid_argument("chunk overlap " + std::to_string(overlap) +
                                    " is larger than chunk size " + std::to_string(size));
    }

    std::vector<Piece> spans;
    if (!text.empty()) RecursiveSplitter(text, size, overlap).split(0, text.size(), 0, spans);

    std::vector<ChunkRecord> records;
    size_t skipped = 0;
    for (const Piece &p : spans) {
        // Spans are already trimmed.
        if (p.len <= min_chunk_chars_) {
            skipped++;
            continue;
        }
        ChunkRecord rec;
        rec.text = text.substr(p.start, p.end - p.start);
        rec.char_start = p.start;
        rec.char_end = p.end;
        records.push_back(std::move(rec));
    }
    if (skipped > 0) log_debug(kComponent, "Skipped ", skipped, " fragments of ", min_chunk_chars_, " chars or less");
    return records;
}

std::vector<std::string> Chunker::chunk(const std::string &text) const {
    return chunk(text, default_size_, default_overlap_);
}

std::vector<std::string> Chunker::chunk(const std::string &text, size_t size, size_t overlap) const {
    std::vector<std::string> out;
    for (auto &rec : split_spans(text, size, overlap)) out.push_back(std::move(rec.text));
    return out;
}

std::vector<ChunkRecord> Chunker::chunk_with_pages(const std::string &text,
                                                   const std::vector<PageRecord> &pages) const {
    return chunk_with_pages(text, pages, default_size_, default_overlap_);
}

std::vector<ChunkRecord> Chunker::chunk_with_pages(const std::string &text,
                                                   const std::vector<PageRecord> &pages,
                                                   size_t size, size_t overlap) const {
    std::vector<ChunkRecord> records = split_spans(text, size, overlap);
    for (auto &rec : records) rec.pages = pages_for_span(rec.char_start, rec.char_end, pages);
    return records;
}

std::vector<int> Chunker::pages_for_span(size_t start, size_t end, const std::vector<PageRecord> &pages) {
    std::vector<int> out;
    for (const auto &page : pages) {
        if (start < page.char_end && end > page.char_start) out.push_back(page.page_number);
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    return out;
}

} // namespace docchunk
