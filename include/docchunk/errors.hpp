#pragma once
#include <stdexcept>
#include <string>

namespace docchunk {

// Root of every error the pipeline raises on purpose.
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// MIME type outside the configured list. Raised before extraction starts.
class UnsupportedFileType : public Error {
public:
    using Error::Error;
};

// Upload larger than max_file_size_mb. Raised before extraction starts.
class SizeLimitExceeded : public Error {
public:
    using Error::Error;
};

// Extraction and OCR together produced only whitespace.
class NoTextExtracted : public Error {
public:
    using Error::Error;
};

// Decoding or structural parse failure (malformed PDF, invalid JSON).
class ExtractionFailure : public Error {
public:
    ExtractionFailure(const std::string &what, const std::string &cause)
        : Error(cause.empty() ? what : what + ": " + cause), cause_(cause) {}
    explicit ExtractionFailure(const std::string &what) : Error(what) {}

    const std::string &cause() const { return cause_; }

private:
    std::string cause_;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

// WorkerPool::try_submit found the queue at capacity.
class QueueFull : public Error {
public:
    using Error::Error;
};

// A CancellationToken was triggered while a document was being processed.
class Cancelled : public Error {
public:
    using Error::Error;
};

class EmbeddingError : public Error {
public:
    using Error::Error;
};

} // namespace docchunk
