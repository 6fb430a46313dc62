#pragma once
#include <memory>
#include <string>

#include <opencv2/core.hpp>

#include "docchunk/config.hpp"

namespace docchunk {

// One recognition pass over a BGR raster. Implementations may throw; the
// OcrEngine absorbs failures.
class Recognizer {
public:
    virtual ~Recognizer() = default;

    // bgr is CV_8UC3. languages is a tesseract language set such as "eng+vie".
    virtual std::string recognize(const cv::Mat &bgr, const std::string &languages) = 0;
};

// Tesseract backed recognizer. A fresh TessBaseAPI is created per call, so a
// single instance can be shared across worker threads.
class TesseractRecognizer : public Recognizer {
public:
    explicit TesseractRecognizer(std::string tessdata_path = std::string());

    std::string recognize(const cv::Mat &bgr, const std::string &languages) override;

private:
    std::string tessdata_path_;
};

class OcrEngine {
public:
    explicit OcrEngine(const Config &cfg);
    OcrEngine(const Config &cfg, std::unique_ptr<Recognizer> recognizer);

    // Decodes image bytes and recognizes them. Returns "" on any failure.
    std::string recognize(const std::string &image_bytes, const std::string &language_hint = "auto") const;

    // Same, for a raster that is already decoded (any depth / channel count).
    std::string recognize_image(const cv::Mat &image, const std::string &language_hint = "auto") const;

    // "vi" -> "vie", "en"/"code" -> "eng", anything else -> "eng+vie".
    static std::string languages_for_hint(const std::string &hint);

    // Trimmed length under 10, or more than half the tokens one character long.
    static bool is_poor_result(const std::string &text);

    // Decodes bytes and normalizes to 8-bit BGR. Throws std::runtime_error.
    static cv::Mat load_image(const std::string &image_bytes);
    static cv::Mat to_bgr(const cv::Mat &image);

    // Upscale small images, grayscale, denoise, CLAHE, Otsu. Returns BGR.
    static cv::Mat enhance_for_ocr(const cv::Mat &bgr);

private:
    // A pass whose recognizer throws yields "".
    std::string run_pass(const cv::Mat &bgr, const std::string &languages) const;

    bool enhance_;
    std::unique_ptr<Recognizer> recognizer_;
};

} // namespace docchunk
