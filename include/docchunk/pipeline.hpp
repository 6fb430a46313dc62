#pragma once
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "docchunk/cancellation.hpp"
#include "docchunk/chunker.hpp"
#include "docchunk/config.hpp"
#include "docchunk/metadata_parser.hpp"
#include "docchunk/ocr_engine.hpp"
#include "docchunk/text_extractor.hpp"
#include "docchunk/types.hpp"
#include "docchunk/worker_pool.hpp"

namespace docchunk {

// Typed view of caller-supplied extra metadata: a JSON object becomes extra
// fields, anything else is kept verbatim.
struct ParsedExtraMetadata {
    ExtraFields fields;
    std::optional<std::string> raw;
};
ParsedExtraMetadata parse_extra_metadata(const std::string &raw);

// Upload boundary: validation, extraction, chunking and per chunk metadata.
// Every operation is synchronous; the submit_* variants run on a WorkerPool.
class DocumentPipeline {
public:
    explicit DocumentPipeline(Config cfg);
    DocumentPipeline(Config cfg, std::unique_ptr<Recognizer> recognizer);

    DocumentPipeline(const DocumentPipeline &) = delete;
    DocumentPipeline &operator=(const DocumentPipeline &) = delete;

    // Throws UnsupportedFileType or SizeLimitExceeded.
    void validate(const std::string &bytes, const std::string &filename, const std::string &mime_type) const;

    // Text only, no chunking. Throws NoTextExtracted for blank output.
    ExtractResult extract_only(const std::string &bytes, const std::string &filename,
                               const std::string &mime_type,
                               const CancellationToken *cancel = nullptr) const;

    ProcessedDocument process_document(const std::string &bytes, const std::string &filename,
                                       const std::string &mime_type,
                                       const std::optional<std::string> &extra_metadata = std::nullopt,
                                       const CancellationToken *cancel = nullptr) const;

    // Page aware processing with textbook metadata. Throws std::invalid_argument
    // when book_name or publisher is blank.
    TextbookDocument process_textbook(const std::string &bytes, const std::string &filename,
                                      const std::string &mime_type, const TextbookRequest &request,
                                      const CancellationToken *cancel = nullptr) const;

    // Queued tasks hold a pointer to this pipeline; it must outlive every task
    // still pending in pool.
    std::future<ProcessedDocument> submit_document(WorkerPool &pool, std::string bytes, std::string filename,
                                                   std::string mime_type,
                                                   std::optional<std::string> extra_metadata = std::nullopt,
                                                   std::shared_ptr<CancellationToken> cancel = nullptr) const;

    std::future<TextbookDocument> submit_textbook(WorkerPool &pool, std::string bytes, std::string filename,
                                                  std::string mime_type, TextbookRequest request,
                                                  std::shared_ptr<CancellationToken> cancel = nullptr) const;

    const Config &config() const { return cfg_; }
    const TextExtractor &extractor() const { return extractor_; }
    const Chunker &chunker() const { return chunker_; }
    const MetadataParser &metadata_parser() const { return metadata_parser_; }

private:
    Config cfg_;
    OcrEngine ocr_;
    TextExtractor extractor_;
    Chunker chunker_;
    MetadataParser metadata_parser_;
};

} // namespace docchunk
