#include "docchunk/embedder.hpp"

#include <algorithm>
#include <memory>
#include <thread>

#include <curl/curl.h>

#include "docchunk/errors.hpp"
#include "docchunk/log.hpp"

using json = nlohmann::json;

namespace docchunk {

static const char *kComponent = "Embedder";

std::vector<std::vector<float>> embed_in_batches(Embedder &embedder, const std::vector<std::string> &texts,
                                                 size_t batch_size) {
    if (batch_size == 0) batch_size = 1;
    std::vector<std::vector<float>> all;
    all.reserve(texts.size());
    for (size_t i = 0; i < texts.size(); i += batch_size) {
        size_t end = std::min(texts.size(), i + batch_size);
        std::vector<std::string> batch(texts.begin() + i, texts.begin() + end);
        auto vecs = embedder.embed(batch);
        if (vecs.size() != batch.size()) {
            throw EmbeddingError(embedder.name() + " returned " + std::to_string(vecs.size()) +
                                 " vectors for " + std::to_string(batch.size()) + " texts");
        }
        for (auto &v : vecs) all.push_back(std::move(v));
    }
    log_info(kComponent, "Generated ", all.size(), " embeddings with ", embedder.name());
    return all;
}

void RateLimiter::wait() {
    std::unique_lock<std::mutex> lk(mu_);
    auto now = std::chrono::steady_clock::now();
    if (now < next_ok_) std::this_thread::sleep_until(next_ok_);
    next_ok_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(1000 / std::max(1, qps_));
}

// ---------------- OpenAI ----------------

static size_t curl_write_cb(void *contents, size_t size, size_t nmemb, void *userp) {
    static_cast<std::string *>(userp)->append(static_cast<char *>(contents), size * nmemb);
    return size * nmemb;
}

OpenAIEmbedder::OpenAIEmbedder(const Config &cfg, std::string endpoint)
    : api_key_(cfg.openai_api_key),
      model_(cfg.embedding_model),
      dimension_(cfg.embedding_dimension),
      timeout_(cfg.http_timeout),
      endpoint_(std::move(endpoint)) {
    if (api_key_.empty()) throw ConfigError("OpenAI API key is required (set OPENAI_API_KEY)");
    log_info(kComponent, "Initialized OpenAI embedder: ", model_, " (", dimension_, "D)");
}

json OpenAIEmbedder::post_json(const json &payload, long &http_code) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) throw EmbeddingError("curl init failed");

    std::string response;
    struct curl_slist *headers = nullptr;
    std::string auth = "Authorization: Bearer " + api_key_;
    headers = curl_slist_append(headers, auth.c_str());
    headers = curl_slist_append(headers, "Content-Type: application/json");
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> header_guard(headers, &curl_slist_free_all);

    std::string body = payload.dump();

    curl_easy_setopt(curl.get(), CURLOPT_URL, endpoint_.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(timeout_));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, curl_write_cb);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);

    CURLcode res = curl_easy_perform(curl.get());
    http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);

    if (res != CURLE_OK) throw EmbeddingError(std::string("curl failed: ") + curl_easy_strerror(res));

    try {
        return json::parse(response.empty() ? "{}" : response);
    } catch (const json::exception &e) {
        throw EmbeddingError(std::string("failed to parse embeddings response: ") + e.what());
    }
}

std::vector<std::vector<float>> OpenAIEmbedder::parse_response(const json &resp, size_t expected) {
    if (!resp.contains("data") || !resp["data"].is_array()) {
        throw EmbeddingError("embeddings response has no data array");
    }
    std::vector<std::vector<float>> out(expected);
    size_t seen = 0;
    for (auto &item : resp["data"]) {
        size_t idx = item.value("index", seen);
        if (idx >= expected || !item.contains("embedding")) {
            throw EmbeddingError("unexpected item in embeddings response");
        }
        out[idx] = item["embedding"].get<std::vector<float>>();
        seen++;
    }
    if (seen != expected) {
        throw EmbeddingError("expected " + std::to_string(expected) + " embeddings, got " + std::to_string(seen));
    }
    return out;
}

std::vector<std::vector<float>> OpenAIEmbedder::embed(const std::vector<std::string> &texts) {
    if (texts.empty()) return {};

    json req;
    req["model"] = model_;
    req["input"] = texts;

    long http_code = 0;
    json resp;
    int attempts = 0;
    const int max_attempts = 4;
    int backoff_ms = 400;
    while (attempts < max_attempts) {
        limiter_.wait();
        resp = post_json(req, http_code);
        if (http_code >= 500 || http_code == 429) {
            log_warning(kComponent, "OpenAI HTTP ", http_code, ", retrying in ", backoff_ms, "ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(5000, backoff_ms * 2);
            attempts++;
            continue;
        }
        break;
    }
    if (http_code >= 400 || http_code == 0) {
        throw EmbeddingError("OpenAI HTTP " + std::to_string(http_code) + ": " + resp.dump());
    }
    return parse_response(resp, texts.size());
}

} // namespace docchunk
