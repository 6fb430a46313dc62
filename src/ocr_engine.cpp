#include "docchunk/ocr_engine.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

#include <leptonica/allheaders.h>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>
#include <tesseract/baseapi.h>

#include "docchunk/log.hpp"
#include "docchunk/util.hpp"

namespace docchunk {

static const char *kComponent = "OcrEngine";

// ---------------- Tesseract ----------------

namespace {
struct PixDeleter {
    void operator()(Pix *p) const { pixDestroy(&p); }
};
using PixPtr = std::unique_ptr<Pix, PixDeleter>;
} // namespace

TesseractRecognizer::TesseractRecognizer(std::string tessdata_path)
    : tessdata_path_(std::move(tessdata_path)) {}

std::string TesseractRecognizer::recognize(const cv::Mat &bgr, const std::string &languages) {
    // Hand the raster to tesseract through leptonica, as a PNG in memory.
    std::vector<uchar> png;
    if (!cv::imencode(".png", bgr, png)) throw std::runtime_error("could not encode raster for OCR");
    PixPtr pix(pixReadMem(png.data(), png.size()));
    if (!pix) throw std::runtime_error("leptonica could not read encoded raster");

    tesseract::TessBaseAPI tess;
    const char *datapath = tessdata_path_.empty() ? nullptr : tessdata_path_.c_str();
    if (tess.Init(datapath, languages.c_str(), tesseract::OEM_DEFAULT)) {
        throw std::runtime_error("tesseract init failed for languages '" + languages + "'");
    }
    tess.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    tess.SetVariable("preserve_interword_spaces", "1");
    tess.SetImage(pix.get());

    std::unique_ptr<char[]> out(tess.GetUTF8Text());
    std::string text = out ? std::string(out.get()) : std::string();
    tess.End();
    return trim_copy(text);
}

// ---------------- Engine ----------------

OcrEngine::OcrEngine(const Config &cfg)
    : OcrEngine(cfg, std::make_unique<TesseractRecognizer>(cfg.tessdata_path)) {}

OcrEngine::OcrEngine(const Config &cfg, std::unique_ptr<Recognizer> recognizer)
    : enhance_(cfg.ocr_enhance), recognizer_(std::move(recognizer)) {
    if (!recognizer_) throw std::invalid_argument("OcrEngine needs a recognizer");
}

std::string OcrEngine::languages_for_hint(const std::string &hint) {
    if (hint == "vi") return "vie";
    if (hint == "en" || hint == "code") return "eng";
    return "eng+vie";
}

bool OcrEngine::is_poor_result(const std::string &text) {
    std::string t = trim_copy(text);
    if (utf8_length(t) < 10) return true;

    auto words = split_whitespace(t);
    if (words.empty()) return true;
    size_t single = 0;
    for (auto &w : words) {
        if (utf8_length(w) == 1) single++;
    }
    return single * 2 > words.size();
}

cv::Mat OcrEngine::to_bgr(const cv::Mat &image) {
    if (image.empty()) throw std::runtime_error("empty raster");

    cv::Mat img = image;
    if (img.depth() != CV_8U) {
        log_debug(kComponent, "Converting raster depth ", img.depth(), " to 8-bit");
        double scale = img.depth() == CV_16U ? 1.0 / 257.0 : 1.0;
        cv::Mat eight;
        img.convertTo(eight, CV_8U, scale);
        img = eight;
    }

    cv::Mat bgr;
    switch (img.channels()) {
        case 3:
            return img;
        case 1:
            log_info(kComponent, "Converting image from grayscale to BGR");
            cv::cvtColor(img, bgr, cv::COLOR_GRAY2BGR);
            return bgr;
        case 4:
            log_info(kComponent, "Converting image from BGRA to BGR");
            cv::cvtColor(img, bgr, cv::COLOR_BGRA2BGR);
            return bgr;
        default:
            throw std::runtime_error("unsupported channel count " + std::to_string(img.channels()));
    }
}

cv::Mat OcrEngine::load_image(const std::string &image_bytes) {
    if (image_bytes.empty()) throw std::runtime_error("no image data");
    std::vector<uchar> buf(image_bytes.begin(), image_bytes.end());
    cv::Mat img = cv::imdecode(buf, cv::IMREAD_UNCHANGED);
    if (img.empty()) throw std::runtime_error("could not decode image");
    cv::Mat bgr = to_bgr(img);
    log_debug(kComponent, "Image loaded: ", bgr.cols, "x", bgr.rows);
    return bgr;
}

cv::Mat OcrEngine::enhance_for_ocr(const cv::Mat &bgr) {
    try {
        cv::Mat img = bgr;
        if (img.rows < 1000 || img.cols < 1000) {
            cv::Mat up;
            cv::resize(img, up, cv::Size(), 2.0, 2.0, cv::INTER_CUBIC);
            img = up;
        }

        cv::Mat gray;
        cv::cvtColor(img, gray, cv::COLOR_BGR2GRAY);

        cv::Mat den;
        cv::fastNlMeansDenoising(gray, den, 10.0f);

        cv::Mat contrast;
        cv::Ptr<cv::CLAHE> clahe = cv::createCLAHE(1.5, cv::Size(8, 8));
        clahe->apply(den, contrast);

        cv::Mat bw;
        cv::threshold(contrast, bw, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

        cv::Mat out;
        cv::cvtColor(bw, out, cv::COLOR_GRAY2BGR);
        return out;
    } catch (const cv::Exception &e) {
        log_warning(kComponent, "Image enhancement failed, using original: ", e.what());
        return bgr;
    }
}

std::string OcrEngine::run_pass(const cv::Mat &bgr, const std::string &languages) const {
    try {
        return trim_copy(recognizer_->recognize(bgr, languages));
    } catch (const std::exception &e) {
        log_error(kComponent, "Recognition pass failed: ", e.what());
        return "";
    }
}

std::string OcrEngine::recognize_image(const cv::Mat &image, const std::string &language_hint) const {
    try {
        cv::Mat bgr = to_bgr(image);
        std::string languages = languages_for_hint(language_hint);

        std::string text = run_pass(bgr, languages);

        if (enhance_ && is_poor_result(text)) {
            log_info(kComponent, "Poor OCR result, retrying with enhancement");
            std::string enhanced = run_pass(enhance_for_ocr(bgr), languages);
            if (utf8_length(enhanced) > utf8_length(text)) text = enhanced;
        }

        log_info(kComponent, "OCR extracted ", utf8_length(text), " characters");
        return text;
    } catch (const std::exception &e) {
        log_error(kComponent, "OCR failed: ", e.what());
        return "";
    }
}

std::string OcrEngine::recognize(const std::string &image_bytes, const std::string &language_hint) const {
    cv::Mat img;
    try {
        img = load_image(image_bytes);
    } catch (const std::exception &e) {
        log_error(kComponent, "Failed to load image: ", e.what());
        return "";
    }
    return recognize_image(img, language_hint);
}

} // namespace docchunk
