#pragma once
#include <string>
#include <vector>

#include "docchunk/cancellation.hpp"
#include "docchunk/config.hpp"
#include "docchunk/ocr_engine.hpp"
#include "docchunk/types.hpp"

namespace docchunk {

struct PagedText {
    std::string text;
    std::vector<PageRecord> pages;
};

class TextExtractor {
public:
    // ocr must outlive the extractor.
    TextExtractor(const Config &cfg, const OcrEngine &ocr);

    // Full text of a document of any supported MIME type.
    // Throws ExtractionFailure on malformed PDF or JSON.
    std::string extract(const std::string &bytes, const std::string &mime_type,
                        const CancellationToken *cancel = nullptr) const;

    // PDF only: per page native text with OCR fallback for sparse pages.
    PagedText extract_with_pages(const std::string &pdf_bytes,
                                 const CancellationToken *cancel = nullptr) const;

    // Any MIME type. Non-PDF content becomes one synthetic page.
    PagedText extract_with_pages(const std::string &bytes, const std::string &mime_type,
                                 const CancellationToken *cancel = nullptr) const;

    // OCR an image and clean the result (trimmed lines, no blank lines).
    std::string extract_from_image(const std::string &image_bytes) const;

    // Joins page texts with kPageSeparator and computes each record's offsets.
    static PagedText join_pages(const std::vector<std::string> &page_texts,
                                const std::vector<bool> &ocr_used);

    // Fenced ``` blocks of markdown text. Language is "unknown" when absent.
    static std::vector<CodeBlock> extract_code_blocks(const std::string &text);

    static bool is_plain_text_type(const std::string &mime_type);
    static bool is_image_type(const std::string &mime_type);

private:
    Config cfg_;
    const OcrEngine &ocr_;
};

} // namespace docchunk
