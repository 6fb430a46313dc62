#include "docchunk/pipeline.hpp"

#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "docchunk/errors.hpp"
#include "docchunk/log.hpp"
#include "docchunk/util.hpp"

namespace docchunk {

static const char *kComponent = "Pipeline";

static Config validated(Config cfg) {
    cfg.validate();
    return cfg;
}

static double size_mb(const std::string &bytes) {
    return static_cast<double>(bytes.size()) / (1024.0 * 1024.0);
}

static std::string format_mb(double mb) {
    std::ostringstream os;
    os << std::fixed << std::setprecision(2) << mb << "MB";
    return os.str();
}

static std::string describe(const std::string &filename, const std::string &bytes, const std::string &mime_type) {
    std::ostringstream os;
    os << filename << " (" << mime_type << ", " << bytes.size() << " bytes)";
    return os.str();
}

ParsedExtraMetadata parse_extra_metadata(const std::string &raw) {
    ParsedExtraMetadata out;
    json j = json::parse(raw, nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        out.raw = raw;
        return out;
    }
    for (auto &kv : j.items()) out.fields[kv.key()] = kv.value();
    return out;
}

DocumentPipeline::DocumentPipeline(Config cfg)
    : cfg_(validated(std::move(cfg))),
      ocr_(cfg_),
      extractor_(cfg_, ocr_),
      chunker_(cfg_) {}

DocumentPipeline::DocumentPipeline(Config cfg, std::unique_ptr<Recognizer> recognizer)
    : cfg_(validated(std::move(cfg))),
      ocr_(cfg_, std::move(recognizer)),
      extractor_(cfg_, ocr_),
      chunker_(cfg_) {}

void DocumentPipeline::validate(const std::string &bytes, const std::string &filename,
                                const std::string &mime_type) const {
    if (!cfg_.is_supported(mime_type)) {
        throw UnsupportedFileType("Unsupported file type: " + mime_type + " for " + filename);
    }
    double mb = size_mb(bytes);
    if (mb > cfg_.max_file_size_mb) {
        throw SizeLimitExceeded("File size " + format_mb(mb) + " exceeds limit of " +
                                format_mb(cfg_.max_file_size_mb) + " for " + filename);
    }
}

ExtractResult DocumentPipeline::extract_only(const std::string &bytes, const std::string &filename,
                                             const std::string &mime_type,
                                             const CancellationToken *cancel) const {
    validate(bytes, filename, mime_type);
    log_info(kComponent, "Extracting text from: ", filename, " (type: ", mime_type, ")");

    ExtractResult r;
    r.text = extractor_.extract(bytes, mime_type, cancel);
    if (trim_copy(r.text).empty()) {
        throw NoTextExtracted("No text could be extracted from " + describe(filename, bytes, mime_type));
    }
    r.filename = filename;
    r.file_type = mime_type;
    r.char_count = utf8_length(r.text);
    log_info(kComponent, "Extracted ", r.char_count, " characters from ", filename);
    return r;
}

ProcessedDocument DocumentPipeline::process_document(const std::string &bytes, const std::string &filename,
                                                     const std::string &mime_type,
                                                     const std::optional<std::string> &extra_metadata,
                                                     const CancellationToken *cancel) const {
    validate(bytes, filename, mime_type);
    log_info(kComponent, "Processing ", filename, " (", mime_type, ", ", format_mb(size_mb(bytes)), ")");

    ProcessedDocument doc;
    doc.full_text = extractor_.extract(bytes, mime_type, cancel);
    if (trim_copy(doc.full_text).empty()) {
        throw NoTextExtracted("No text could be extracted from " + describe(filename, bytes, mime_type));
    }
    log_info(kComponent, "Extracted ", utf8_length(doc.full_text), " characters");

    doc.chunks = chunker_.chunk(doc.full_text);
    if (doc.chunks.empty()) log_warning(kComponent, filename, ": every fragment was below the chunk floor");
    log_info(kComponent, "Created ", doc.chunks.size(), " chunks");

    ParsedExtraMetadata extra;
    if (extra_metadata && !extra_metadata->empty()) extra = parse_extra_metadata(*extra_metadata);

    std::string hash = md5_hex(bytes);
    for (size_t i = 0; i < doc.chunks.size(); ++i) {
        ChunkMetadata meta;
        meta.filename = filename;
        meta.file_type = mime_type;
        meta.content_hash = hash;
        meta.chunk_index = i;
        meta.total_chunks = doc.chunks.size();
        meta.extra = extra.fields;
        meta.raw_metadata = extra.raw;
        doc.metadata.push_back(std::move(meta));
    }
    return doc;
}

TextbookDocument DocumentPipeline::process_textbook(const std::string &bytes, const std::string &filename,
                                                    const std::string &mime_type, const TextbookRequest &request,
                                                    const CancellationToken *cancel) const {
    if (trim_copy(request.book_name).empty()) throw std::invalid_argument("Book name is required");
    if (trim_copy(request.publisher).empty()) throw std::invalid_argument("Publisher is required");

    if (!MetadataParser::follows_textbook_convention(filename)) {
        log_warning(kComponent, "Filename ", filename, " doesn't follow textbook convention");
    }
    validate(bytes, filename, mime_type);
    log_info(kComponent, "Processing textbook ", filename, " (", mime_type, ")");

    TextbookFields fields;
    fields.book_name = trim_copy(request.book_name);
    fields.publisher = trim_copy(request.publisher);
    if (request.grade && !trim_copy(*request.grade).empty()) fields.grade = trim_copy(*request.grade);
    fields.book_full_name = fields.book_name + " - " + fields.publisher;
    if (fields.grade) fields.book_full_name += " - " + *fields.grade;
    fields.product_name = (request.product_name && !request.product_name->empty())
                              ? *request.product_name
                              : fields.book_full_name;
    fields.parsed = metadata_parser_.parse(filename);

    TextbookDocument doc;
    doc.book_metadata = fields.parsed;

    PagedText paged = extractor_.extract_with_pages(bytes, mime_type, cancel);
    if (trim_copy(paged.text).empty()) {
        throw NoTextExtracted("No text could be extracted from " + describe(filename, bytes, mime_type));
    }
    doc.full_text = std::move(paged.text);
    doc.pages = std::move(paged.pages);
    log_info(kComponent, "Extracted ", utf8_length(doc.full_text), " characters from ", doc.pages.size(), " pages");

    doc.chunks = chunker_.chunk_with_pages(doc.full_text, doc.pages);
    log_info(kComponent, "Created ", doc.chunks.size(), " chunks with page information");

    std::string hash = md5_hex(bytes);
    for (size_t i = 0; i < doc.chunks.size(); ++i) {
        const ChunkRecord &chunk = doc.chunks[i];
        ChunkMetadata meta;
        meta.filename = filename;
        meta.file_type = mime_type;
        meta.content_hash = hash;
        meta.chunk_index = i;
        meta.total_chunks = doc.chunks.size();
        meta.pages = chunk.pages;
        meta.page_range = format_page_range(chunk.pages);
        meta.char_start = chunk.char_start;
        meta.char_end = chunk.char_end;
        meta.textbook = fields;
        doc.metadata.push_back(std::move(meta));
    }
    return doc;
}

std::future<ProcessedDocument> DocumentPipeline::submit_document(WorkerPool &pool, std::string bytes,
                                                                 std::string filename, std::string mime_type,
                                                                 std::optional<std::string> extra_metadata,
                                                                 std::shared_ptr<CancellationToken> cancel) const {
    return pool.submit([this, bytes = std::move(bytes), filename = std::move(filename),
                        mime_type = std::move(mime_type), extra = std::move(extra_metadata), cancel]() {
        return process_document(bytes, filename, mime_type, extra, cancel.get());
    });
}

std::future<TextbookDocument> DocumentPipeline::submit_textbook(WorkerPool &pool, std::string bytes,
                                                                std::string filename, std::string mime_type,
                                                                TextbookRequest request,
                                                                std::shared_ptr<CancellationToken> cancel) const {
    return pool.submit([this, bytes = std::move(bytes), filename = std::move(filename),
                        mime_type = std::move(mime_type), request = std::move(request), cancel]() {
        return process_textbook(bytes, filename, mime_type, request, cancel.get());
    });
}

} // namespace docchunk
