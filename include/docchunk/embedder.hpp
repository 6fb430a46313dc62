#pragma once
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "docchunk/config.hpp"

namespace docchunk {

// Produces vectors for text. The pipeline never sees a concrete provider.
class Embedder {
public:
    virtual ~Embedder() = default;

    // One vector per input, in input order.
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) = 0;
    virtual int dimension() const = 0;
    virtual std::string name() const = 0;
};

// Calls embedder.embed on consecutive slices of at most batch_size texts.
std::vector<std::vector<float>> embed_in_batches(Embedder &embedder, const std::vector<std::string> &texts,
                                                 size_t batch_size = 100);

// Client side spacing between requests.
class RateLimiter {
public:
    explicit RateLimiter(int qps = 3) : qps_(qps) {}
    void wait();

private:
    std::mutex mu_;
    std::chrono::steady_clock::time_point next_ok_ = std::chrono::steady_clock::now();
    int qps_;
};

// OpenAI /v1/embeddings over libcurl. curl_global_init must have been called.
class OpenAIEmbedder : public Embedder {
public:
    explicit OpenAIEmbedder(const Config &cfg,
                            std::string endpoint = "https://api.openai.com/v1/embeddings");

    std::vector<std::vector<float>> embed(const std::vector<std::string> &texts) override;
    int dimension() const override { return dimension_; }
    std::string name() const override { return model_; }

    // Parses an embeddings response body; throws EmbeddingError when malformed.
    static std::vector<std::vector<float>> parse_response(const nlohmann::json &resp, size_t expected);

private:
    nlohmann::json post_json(const nlohmann::json &payload, long &http_code);

    std::string api_key_;
    std::string model_;
    int dimension_;
    int timeout_;
    std::string endpoint_;
    RateLimiter limiter_;
};

} // namespace docchunk
