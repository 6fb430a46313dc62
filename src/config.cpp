#include "docchunk/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <fstream>

#include <nlohmann/json.hpp>

#include "docchunk/errors.hpp"
#include "docchunk/util.hpp"

using json = nlohmann::json;

namespace docchunk {

bool Config::is_supported(const std::string &mime_type) const {
    return std::find(supported_file_types.begin(), supported_file_types.end(), mime_type)
           != supported_file_types.end();
}

void Config::validate() const {
    if (chunk_size == 0) throw ConfigError("chunk_size must be positive");
    if (chunk_overlap >= chunk_size)
        throw ConfigError("chunk_overlap (" + std::to_string(chunk_overlap) +
                          ") must be smaller than chunk_size (" + std::to_string(chunk_size) + ")");
    if (pdf_render_scale <= 0.0) throw ConfigError("pdf_render_scale must be positive");
    if (max_file_size_mb <= 0.0) throw ConfigError("max_file_size_mb must be positive");
    if (supported_file_types.empty()) throw ConfigError("supported_file_types is empty");
    if (worker_threads == 0) throw ConfigError("worker_threads must be at least 1");
    if (queue_capacity == 0) throw ConfigError("queue_capacity must be at least 1");
    if (embedding_dimension <= 0) throw ConfigError("embedding_dimension must be positive");
    if (http_timeout <= 0) throw ConfigError("http_timeout must be positive");
}

static size_t to_size(const std::string &key, const std::string &value) {
    try {
        size_t used = 0;
        long long v = std::stoll(value, &used);
        if (used != value.size() || v < 0) throw std::invalid_argument(value);
        return static_cast<size_t>(v);
    } catch (const std::exception &) {
        throw ConfigError("invalid value for " + key + ": '" + value + "'");
    }
}

static double to_double(const std::string &key, const std::string &value) {
    try {
        size_t used = 0;
        double v = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        return v;
    } catch (const std::exception &) {
        throw ConfigError("invalid value for " + key + ": '" + value + "'");
    }
}

static bool to_bool(const std::string &key, const std::string &value) {
    std::string v = to_lower(value);
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw ConfigError("invalid value for " + key + ": '" + value + "'");
}

bool apply_flag(Config &cfg, const std::string &key, const std::string &value) {
    if (key == "chunk-size" || key == "chunk_size") cfg.chunk_size = to_size(key, value);
    else if (key == "chunk-overlap" || key == "chunk_overlap") cfg.chunk_overlap = to_size(key, value);
    else if (key == "min-chunk-chars" || key == "min_chunk_chars") cfg.min_chunk_chars = to_size(key, value);
    else if (key == "ocr-min-page-chars" || key == "ocr_min_page_chars") cfg.ocr_min_page_chars = to_size(key, value);
    else if (key == "render-scale" || key == "pdf_render_scale") cfg.pdf_render_scale = to_double(key, value);
    else if (key == "enhance" || key == "ocr_enhance") cfg.ocr_enhance = to_bool(key, value);
    else if (key == "tessdata" || key == "tessdata_path") cfg.tessdata_path = value;
    else if (key == "max-mb" || key == "max_file_size_mb") cfg.max_file_size_mb = to_double(key, value);
    else if (key == "threads" || key == "worker_threads") cfg.worker_threads = to_size(key, value);
    else if (key == "queue" || key == "queue_capacity") cfg.queue_capacity = to_size(key, value);
    else if (key == "model" || key == "embedding_model") cfg.embedding_model = value;
    else if (key == "dimension" || key == "embedding_dimension") cfg.embedding_dimension = static_cast<int>(to_size(key, value));
    else if (key == "timeout" || key == "http_timeout") cfg.http_timeout = static_cast<int>(to_size(key, value));
    else if (key == "log-level" || key == "log_level") cfg.log_level = parse_log_level(value);
    else return false;
    return true;
}

void apply_config_file(Config &cfg, const std::string &path) {
    std::ifstream f(path);
    if (!f) throw ConfigError("cannot open config file " + path);

    json j;
    try {
        f >> j;
    } catch (const json::exception &e) {
        throw ConfigError("malformed config file " + path + ": " + e.what());
    }
    if (!j.is_object()) throw ConfigError("config file " + path + " must hold a JSON object");

    for (auto &kv : j.items()) {
        const std::string &key = kv.key();
        const json &val = kv.value();
        if (key == "supported_file_types") {
            if (!val.is_array()) throw ConfigError("supported_file_types must be an array");
            cfg.supported_file_types.clear();
            for (auto &t : val) {
                if (!t.is_string()) throw ConfigError("supported_file_types must hold strings");
                cfg.supported_file_types.push_back(t.get<std::string>());
            }
            continue;
        }
        if (key == "openai_api_key") {
            if (!val.is_string()) throw ConfigError("openai_api_key must be a string");
            cfg.openai_api_key = val.get<std::string>();
            continue;
        }
        std::string text;
        if (val.is_string()) text = val.get<std::string>();
        else if (val.is_boolean()) text = val.get<bool>() ? "true" : "false";
        else if (val.is_number_integer()) text = std::to_string(val.get<long long>());
        else if (val.is_number()) text = val.dump();
        else throw ConfigError("unsupported value type for " + key);

        if (!apply_flag(cfg, key, text)) {
            log_warning("Config", "ignoring unknown key '", key, "' in ", path);
        }
    }
}

static const char *env(const char *name) {
    const char *v = std::getenv(name);
    return (v && *v) ? v : nullptr;
}

void apply_environment(Config &cfg) {
    if (auto v = env("DOCCHUNK_CHUNK_SIZE")) cfg.chunk_size = to_size("DOCCHUNK_CHUNK_SIZE", v);
    if (auto v = env("DOCCHUNK_CHUNK_OVERLAP")) cfg.chunk_overlap = to_size("DOCCHUNK_CHUNK_OVERLAP", v);
    if (auto v = env("DOCCHUNK_MAX_FILE_SIZE_MB")) cfg.max_file_size_mb = to_double("DOCCHUNK_MAX_FILE_SIZE_MB", v);
    if (auto v = env("DOCCHUNK_WORKERS")) cfg.worker_threads = to_size("DOCCHUNK_WORKERS", v);
    if (auto v = env("DOCCHUNK_EMBEDDING_MODEL")) cfg.embedding_model = v;
    if (auto v = env("DOCCHUNK_LOG_LEVEL")) cfg.log_level = parse_log_level(v);
    if (auto v = env("TESSDATA_PREFIX")) cfg.tessdata_path = v;
    if (auto v = env("OPENAI_API_KEY")) cfg.openai_api_key = v;
}

Config load_config(const std::string &config_file) {
    Config cfg;
    if (!config_file.empty()) apply_config_file(cfg, config_file);
    apply_environment(cfg);
    return cfg;
}

} // namespace docchunk
