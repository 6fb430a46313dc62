// docchunk.cpp
// Command line front end for the document-to-chunk pipeline:
// bytes -> text / OCR -> page records -> chunks -> per chunk metadata -> JSONL.
//
// Usage:
// ./docchunk extract FILE [--mime=TYPE]
// ./docchunk ingest OUTPUT_JSONL INPUT... [--config=path.json] [--threads=N]
//    [--chunk-size=800] [--chunk-overlap=150] [--max-mb=100] [--tessdata=DIR]
//    [--metadata=JSON] [--textbook --book-name=S --publisher=S [--grade=S] [--product-name=S]]
//    [--embed] [--model=text-embedding-3-small] [--log-level=info]

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include "docchunk/config.hpp"
#include "docchunk/embedder.hpp"
#include "docchunk/errors.hpp"
#include "docchunk/log.hpp"
#include "docchunk/pipeline.hpp"
#include "docchunk/types.hpp"
#include "docchunk/util.hpp"
#include "docchunk/worker_pool.hpp"

namespace fs = std::filesystem;
using namespace docchunk;

static const char *USAGE =
    "Usage:\n"
    "  docchunk extract FILE [--mime=TYPE]\n"
    "  docchunk ingest OUTPUT_JSONL INPUT... [--config=path.json] [--threads=N] [--chunk-size=N]\n"
    "         [--chunk-overlap=N] [--max-mb=N] [--tessdata=DIR] [--metadata=JSON]\n"
    "         [--textbook --book-name=S --publisher=S [--grade=S] [--product-name=S]]\n"
    "         [--embed] [--model=NAME] [--log-level=LEVEL]\n";

static void die(const std::string &m) {
    std::cerr << "Error: " << m << std::endl;
    std::exit(1);
}

// ---------------- CLI ----------------
struct CliOptions {
    std::string command;
    std::string output_path;
    std::vector<std::string> inputs;
    std::string mime_override;
    std::string config_file;
    std::optional<std::string> extra_metadata;
    bool textbook = false;
    TextbookRequest textbook_request;
    bool embed = false;
    std::vector<std::pair<std::string, std::string>> config_flags;
};

static CliOptions parse_cli(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << USAGE;
        std::exit(1);
    }
    CliOptions o;
    o.command = argv[1];
    if (o.command != "extract" && o.command != "ingest") {
        std::cerr << USAGE;
        std::exit(1);
    }

    std::vector<std::string> positional;
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) != 0) {
            positional.push_back(a);
            continue;
        }
        std::string key = a.substr(2);
        std::string value;
        size_t eq = key.find('=');
        if (eq != std::string::npos) {
            value = key.substr(eq + 1);
            key = key.substr(0, eq);
        }

        if (key == "mime") o.mime_override = value;
        else if (key == "config") o.config_file = value;
        else if (key == "metadata") o.extra_metadata = value;
        else if (key == "textbook") o.textbook = true;
        else if (key == "book-name") o.textbook_request.book_name = value;
        else if (key == "publisher") o.textbook_request.publisher = value;
        else if (key == "grade") o.textbook_request.grade = value;
        else if (key == "product-name") o.textbook_request.product_name = value;
        else if (key == "embed") o.embed = true;
        else o.config_flags.emplace_back(key, value);
    }

    if (o.command == "extract") {
        if (positional.size() != 1) die("extract takes exactly one FILE");
        o.inputs = positional;
    } else {
        if (positional.size() < 2) die("ingest needs OUTPUT_JSONL and at least one INPUT");
        o.output_path = positional.front();
        o.inputs.assign(positional.begin() + 1, positional.end());
    }
    return o;
}

static std::string mime_for(const fs::path &p) {
    std::string e = to_lower(p.extension().string());
    if (e == ".pdf") return "application/pdf";
    if (e == ".txt") return "text/plain";
    if (e == ".md" || e == ".markdown") return "text/markdown";
    if (e == ".png") return "image/png";
    if (e == ".jpg" || e == ".jpeg") return "image/jpeg";
    if (e == ".py") return "text/x-python";
    if (e == ".json") return "application/json";
    return "application/octet-stream";
}

static std::vector<fs::path> collect_inputs(const std::vector<std::string> &args) {
    std::vector<fs::path> inputs;
    for (auto &a : args) {
        if (fs::is_directory(a)) {
            std::vector<fs::path> found;
            for (auto &entry : fs::directory_iterator(a)) {
                if (!entry.is_regular_file()) continue;
                if (mime_for(entry.path()) != "application/octet-stream") found.push_back(entry.path());
            }
            std::sort(found.begin(), found.end());
            inputs.insert(inputs.end(), found.begin(), found.end());
        } else {
            inputs.push_back(a);
        }
    }
    return inputs;
}

// ---------------- Output ----------------
static void attach_embeddings(Embedder *embedder, const std::vector<std::string> &texts, json &chunks) {
    if (!embedder || texts.empty()) return;
    auto vectors = embed_in_batches(*embedder, texts);
    for (size_t i = 0; i < vectors.size(); ++i) chunks[i]["embedding"] = vectors[i];
}

static json document_json(const ProcessedDocument &doc, const std::string &mime, Embedder *embedder) {
    json out;
    out["char_count"] = utf8_length(doc.full_text);
    out["chunks"] = json::array();
    for (size_t i = 0; i < doc.chunks.size(); ++i) {
        out["chunks"].push_back({{"text", doc.chunks[i]}, {"metadata", to_json(doc.metadata[i])}});
    }
    if (mime == "text/markdown") {
        json blocks = json::array();
        for (auto &b : TextExtractor::extract_code_blocks(doc.full_text)) {
            blocks.push_back({{"language", b.language}, {"code", b.code}});
        }
        out["code_blocks"] = blocks;
    }
    attach_embeddings(embedder, doc.chunks, out["chunks"]);
    return out;
}

static json textbook_json(const TextbookDocument &doc, Embedder *embedder) {
    json out;
    out["char_count"] = utf8_length(doc.full_text);
    out["book_metadata"] = to_json(doc.book_metadata);
    out["pages"] = json::array();
    for (auto &p : doc.pages) {
        json pj = to_json(p);
        pj.erase("text");
        out["pages"].push_back(pj);
    }
    out["chunks"] = json::array();
    std::vector<std::string> texts;
    for (size_t i = 0; i < doc.chunks.size(); ++i) {
        out["chunks"].push_back({{"text", doc.chunks[i].text}, {"metadata", to_json(doc.metadata[i])}});
        texts.push_back(doc.chunks[i].text);
    }
    attach_embeddings(embedder, texts, out["chunks"]);
    return out;
}

// ---------------- Commands ----------------
static int run_extract(const DocumentPipeline &pipeline, const CliOptions &o) {
    fs::path path = o.inputs.front();
    std::string mime = o.mime_override.empty() ? mime_for(path) : o.mime_override;
    try {
        std::string bytes = read_file(path.string());
        ExtractResult r = pipeline.extract_only(bytes, path.filename().string(), mime);
        json out = {
            {"text", r.text},
            {"filename", r.filename},
            {"file_type", r.file_type},
            {"char_count", r.char_count},
            {"status", "success"},
            {"message", "Successfully extracted " + std::to_string(r.char_count) + " characters"}
        };
        std::cout << out.dump(2) << std::endl;
        return 0;
    } catch (const std::exception &e) {
        std::cerr << "Text extraction failed: " << e.what() << std::endl;
        return 1;
    }
}

static int run_ingest(const DocumentPipeline &pipeline, const Config &cfg, const CliOptions &o) {
    std::vector<fs::path> inputs = collect_inputs(o.inputs);
    if (inputs.empty()) die("No supported documents found");

    std::unique_ptr<Embedder> embedder;
    if (o.embed) embedder = std::make_unique<OpenAIEmbedder>(cfg);

    std::ofstream jsonl(o.output_path, std::ios::out);
    if (!jsonl) die("Cannot open output path " + o.output_path);

    WorkerPool pool(cfg);

    // Submit everything first; submit() waits while the queue is full.
    std::vector<std::future<ProcessedDocument>> documents;
    std::vector<std::future<TextbookDocument>> textbooks;
    std::vector<std::string> mimes;
    std::vector<std::string> read_errors(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        std::string mime = o.mime_override.empty() ? mime_for(inputs[i]) : o.mime_override;
        mimes.push_back(mime);
        std::string bytes;
        try {
            bytes = read_file(inputs[i].string());
        } catch (const std::exception &e) {
            read_errors[i] = e.what();
        }
        std::string name = inputs[i].filename().string();
        if (o.textbook) {
            textbooks.push_back(pipeline.submit_textbook(pool, std::move(bytes), name, mime, o.textbook_request));
        } else {
            documents.push_back(pipeline.submit_document(pool, std::move(bytes), name, mime, o.extra_metadata));
        }
    }

    size_t ok_count = 0;
    size_t total_chunks = 0;
    for (size_t i = 0; i < inputs.size(); ++i) {
        json one;
        one["source"] = inputs[i].string();
        one["file_type"] = mimes[i];
        try {
            json data;
            if (o.textbook) {
                TextbookDocument doc = textbooks[i].get();
                if (!read_errors[i].empty()) throw Error(read_errors[i]);
                data = textbook_json(doc, embedder.get());
            } else {
                ProcessedDocument doc = documents[i].get();
                if (!read_errors[i].empty()) throw Error(read_errors[i]);
                data = document_json(doc, mimes[i], embedder.get());
            }
            total_chunks += data["chunks"].size();
            one["ok"] = true;
            one["data"] = std::move(data);
            ok_count++;
        } catch (const std::exception &e) {
            one["ok"] = false;
            one["error"] = read_errors[i].empty() ? e.what() : read_errors[i];
        }
        jsonl << one.dump() << "\n";
        jsonl.flush();
        std::cout << "[" << i + 1 << "/" << inputs.size() << "] " << inputs[i].filename().string()
                  << " -> " << (one["ok"].get<bool>() ? "OK" : "ERR") << "\n";
    }

    pool.shutdown();
    auto stats = pool.get_stats();

    json summary = {
        {"processed", inputs.size()},
        {"ok", ok_count},
        {"errors", inputs.size() - ok_count},
        {"chunks", total_chunks},
        {"failed_tasks", stats.failed_tasks}
    };
    std::cout << "Summary: " << summary.dump() << "\n";
    std::cout << "JSONL written: " << o.output_path << "\n";
    return 0;
}

// ---------------- Main ----------------
int main(int argc, char **argv) {
    CliOptions opts = parse_cli(argc, argv);

    Config cfg;
    try {
        cfg = load_config(opts.config_file);
        for (auto &kv : opts.config_flags) {
            if (!apply_flag(cfg, kv.first, kv.second)) die("Unknown flag: --" + kv.first);
        }
        cfg.validate();
    } catch (const ConfigError &e) {
        die(e.what());
    }
    set_log_level(cfg.log_level);

    curl_global_init(CURL_GLOBAL_ALL);
    int rc = 0;
    try {
        DocumentPipeline pipeline(cfg);
        rc = opts.command == "extract" ? run_extract(pipeline, opts) : run_ingest(pipeline, cfg, opts);
    } catch (const ConfigError &e) {
        curl_global_cleanup();
        die(e.what());
    }
    curl_global_cleanup();
    return rc;
}
