#include "docchunk/text_extractor.hpp"

#include <cctype>
#include <memory>
#include <stdexcept>

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>

#include "docchunk/errors.hpp"
#include "docchunk/log.hpp"
#include "docchunk/util.hpp"

namespace docchunk {

static const char *kComponent = "TextExtractor";

// ---------------- PDF helpers ----------------

static std::string page_native_text(const poppler::page &page) {
    poppler::byte_array utf8 = page.text().to_utf8();
    return sanitize_utf8(std::string(utf8.begin(), utf8.end()));
}

// Renders a page to a BGR raster at 72 * scale dpi.
static cv::Mat render_page(const poppler::page &page, double scale) {
    if (!poppler::page_renderer::can_render()) {
        throw std::runtime_error("poppler was built without a rendering backend");
    }
    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    double dpi = 72.0 * scale;
    poppler::image img = renderer.render_page(&page, dpi, dpi);
    if (!img.is_valid()) throw std::runtime_error("page rendering failed");

    // argb32 is stored as B,G,R,A bytes on little endian hosts.
    cv::Mat bgra(img.height(), img.width(), CV_8UC4,
                 const_cast<char *>(img.const_data()), img.bytes_per_row());
    cv::Mat bgr;
    cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
    return bgr;
}

// ---------------- Extractor ----------------

TextExtractor::TextExtractor(const Config &cfg, const OcrEngine &ocr) : cfg_(cfg), ocr_(ocr) {}

bool TextExtractor::is_plain_text_type(const std::string &mime_type) {
    return mime_type == "text/plain" || mime_type == "text/markdown" || mime_type == "text/x-python";
}

bool TextExtractor::is_image_type(const std::string &mime_type) {
    return starts_with(mime_type, "image/");
}

PagedText TextExtractor::join_pages(const std::vector<std::string> &page_texts,
                                    const std::vector<bool> &ocr_used) {
    PagedText out;
    out.pages.reserve(page_texts.size());
    for (size_t i = 0; i < page_texts.size(); ++i) {
        if (i > 0) out.text += kPageSeparator;
        PageRecord rec;
        rec.page_number = static_cast<int>(i + 1);
        rec.text = page_texts[i];
        rec.char_start = out.text.size();
        out.text += page_texts[i];
        rec.char_end = out.text.size();
        rec.ocr_used = i < ocr_used.size() && ocr_used[i];
        out.pages.push_back(std::move(rec));
    }
    return out;
}

std::string TextExtractor::extract_from_image(const std::string &image_bytes) const {
    return clean_ocr_text(ocr_.recognize(image_bytes, "auto"));
}

PagedText TextExtractor::extract_with_pages(const std::string &pdf_bytes,
                                            const CancellationToken *cancel) const {
    if (pdf_bytes.empty()) throw ExtractionFailure("malformed PDF", "empty input");

    // load_from_raw_data does not copy; pdf_bytes outlives doc.
    std::unique_ptr<poppler::document> doc(
        poppler::document::load_from_raw_data(pdf_bytes.data(), static_cast<int>(pdf_bytes.size())));
    if (!doc) throw ExtractionFailure("malformed PDF", "poppler could not open the document");
    if (doc->is_locked()) throw ExtractionFailure("malformed PDF", "document is password protected");

    int total_pages = doc->pages();
    log_info(kComponent, "Processing PDF with ", total_pages, " pages");

    std::vector<std::string> page_texts;
    std::vector<bool> ocr_used;
    int scanned_pages = 0;

    for (int i = 0; i < total_pages; ++i) {
        if (cancel && cancel->cancelled()) {
            throw Cancelled("PDF extraction cancelled before page " + std::to_string(i + 1));
        }

        std::unique_ptr<poppler::page> page(doc->create_page(i));
        std::string text;
        if (page) {
            text = page_native_text(*page);
        } else {
            log_warning(kComponent, "Page ", i + 1, "/", total_pages, ": could not be loaded");
        }

        bool scanned = utf8_length(trim_copy(text)) < cfg_.ocr_min_page_chars;
        if (scanned) {
            scanned_pages++;
            log_info(kComponent, "Page ", i + 1, "/", total_pages, ": Scanned page detected, using OCR");
            std::string ocr_text;
            if (page) {
                try {
                    ocr_text = clean_ocr_text(ocr_.recognize_image(render_page(*page, cfg_.pdf_render_scale), "auto"));
                } catch (const std::exception &e) {
                    log_error(kComponent, "Page ", i + 1, ": render for OCR failed: ", e.what());
                }
            }
            log_info(kComponent, "Page ", i + 1, "/", total_pages, ": OCR extracted ", utf8_length(ocr_text), " chars");
            text = ocr_text;
        } else {
            log_info(kComponent, "Page ", i + 1, "/", total_pages, ": Text extracted ", utf8_length(text), " chars");
        }

        page_texts.push_back(std::move(text));
        ocr_used.push_back(scanned);
    }

    PagedText out = join_pages(page_texts, ocr_used);
    log_info(kComponent, "PDF processed: ", total_pages - scanned_pages, " text pages, ",
             scanned_pages, " scanned pages, total ", utf8_length(out.text), " chars");
    return out;
}

PagedText TextExtractor::extract_with_pages(const std::string &bytes, const std::string &mime_type,
                                            const CancellationToken *cancel) const {
    if (mime_type == "application/pdf") return extract_with_pages(bytes, cancel);

    std::string text = extract(bytes, mime_type, cancel);
    return join_pages({text}, {is_image_type(mime_type)});
}

std::string TextExtractor::extract(const std::string &bytes, const std::string &mime_type,
                                   const CancellationToken *cancel) const {
    if (mime_type == "application/pdf") return extract_with_pages(bytes, cancel).text;

    if (cancel && cancel->cancelled()) throw Cancelled("extraction cancelled");

    if (is_image_type(mime_type)) return extract_from_image(bytes);

    if (mime_type == "application/json") {
        try {
            auto data = nlohmann::ordered_json::parse(bytes);
            return data.dump(2);
        } catch (const nlohmann::json::exception &e) {
            throw ExtractionFailure("invalid JSON", e.what());
        }
    }

    if (!is_plain_text_type(mime_type)) {
        log_debug(kComponent, "Decoding ", mime_type, " as UTF-8 text");
    }
    return sanitize_utf8(bytes);
}

std::vector<CodeBlock> TextExtractor::extract_code_blocks(const std::string &text) {
    std::vector<CodeBlock> blocks;
    const std::string fence = "```";
    size_t pos = 0;
    while ((pos = text.find(fence, pos)) != std::string::npos) {
        size_t p = pos + fence.size();
        size_t lang_start = p;
        while (p < text.size() && (std::isalnum(static_cast<unsigned char>(text[p])) || text[p] == '_')) p++;
        if (p >= text.size() || text[p] != '\n') {
            pos++;
            continue;
        }
        std::string lang = text.substr(lang_start, p - lang_start);
        size_t body = p + 1;
        size_t close = text.find(fence, body);
        if (close == std::string::npos) break;

        blocks.push_back({lang.empty() ? "unknown" : lang, trim_copy(text.substr(body, close - body))});
        pos = close + fence.size();
    }
    return blocks;
}

} // namespace docchunk
