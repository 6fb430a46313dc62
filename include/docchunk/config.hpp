#pragma once
#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include "docchunk/log.hpp"

namespace docchunk {

// Read-only settings shared by every component. Build one with the helpers
// below, call validate(), then pass it by const reference.
struct Config {
    // Chunking
    size_t chunk_size = 800;
    size_t chunk_overlap = 150;
    size_t min_chunk_chars = 20;      // chunks with trimmed length <= this are dropped

    // Extraction / OCR
    size_t ocr_min_page_chars = 50;   // native page text below this is OCRed
    double pdf_render_scale = 2.0;    // magnification for scanned pages (72 dpi base)
    bool ocr_enhance = true;
    std::string tessdata_path;        // empty: tesseract's compiled-in default

    // Upload limits
    double max_file_size_mb = 100.0;
    std::vector<std::string> supported_file_types = {
        "application/pdf",
        "text/plain",
        "text/markdown",
        "image/png",
        "image/jpeg",
        "image/jpg",
        "text/x-python",
        "application/json",
    };

    // Worker pool
    size_t worker_threads = 4;
    size_t queue_capacity = 16;

    // Embedding collaborator
    std::string embedding_model = "text-embedding-3-small";
    int embedding_dimension = 1536;
    std::string openai_api_key;
    int http_timeout = 120;           // seconds

    LogLevel log_level = LogLevel::Info;

    bool is_supported(const std::string &mime_type) const;

    // Throws ConfigError on inconsistent values.
    void validate() const;
};

// Overlays keys present in a JSON object file onto cfg. Unknown keys are
// ignored with a warning; malformed files throw ConfigError.
void apply_config_file(Config &cfg, const std::string &path);

// Overlays DOCCHUNK_* / OPENAI_API_KEY / TESSDATA_PREFIX environment variables.
void apply_environment(Config &cfg);

// Overlays "--key=value" style flags (already split into key and value).
// Returns false for keys it does not know.
bool apply_flag(Config &cfg, const std::string &key, const std::string &value);

// defaults -> optional file -> environment. Flags are applied by the caller.
Config load_config(const std::string &config_file = std::string());

} // namespace docchunk
