#include "docchunk/util.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>

namespace docchunk {

std::string trim_copy(const std::string &s) {
    size_t a = s.find_first_not_of(" \t\r\n\f\v");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n\f\v");
    return s.substr(a, b - a + 1);
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool starts_with(const std::string &s, const std::string &prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

size_t utf8_length(const std::string &s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) n++;
    }
    return n;
}

size_t utf8_char_width(const std::string &s, size_t pos) {
    unsigned char c = static_cast<unsigned char>(s[pos]);
    size_t width = 1;
    if (c >= 0xF0 && c <= 0xF4) width = 4;
    else if (c >= 0xE0) width = 3;
    else if (c >= 0xC2 && c <= 0xDF) width = 2;
    if (pos + width > s.size()) return 1;
    for (size_t i = 1; i < width; ++i) {
        if ((static_cast<unsigned char>(s[pos + i]) & 0xC0) != 0x80) return 1;
    }
    return width;
}

// Validates one sequence at bytes[i]; returns its width, or 0 if invalid.
static size_t valid_sequence_width(const std::string &bytes, size_t i) {
    unsigned char c = static_cast<unsigned char>(bytes[i]);
    if (c < 0x80) return 1;

    size_t width;
    unsigned char lo = 0x80, hi = 0xBF;   // bounds for the second byte
    if (c >= 0xC2 && c <= 0xDF) {
        width = 2;
    } else if (c >= 0xE0 && c <= 0xEF) {
        width = 3;
        if (c == 0xE0) lo = 0xA0;           // overlong
        if (c == 0xED) hi = 0x9F;           // surrogates
    } else if (c >= 0xF0 && c <= 0xF4) {
        width = 4;
        if (c == 0xF0) lo = 0x90;
        if (c == 0xF4) hi = 0x8F;
    } else {
        return 0;
    }
    if (i + width > bytes.size()) return 0;

    unsigned char c1 = static_cast<unsigned char>(bytes[i + 1]);
    if (c1 < lo || c1 > hi) return 0;
    for (size_t k = 2; k < width; ++k) {
        if ((static_cast<unsigned char>(bytes[i + k]) & 0xC0) != 0x80) return 0;
    }
    return width;
}

std::string sanitize_utf8(const std::string &bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t w = valid_sequence_width(bytes, i);
        if (w == 0) {
            i++;
            continue;
        }
        out.append(bytes, i, w);
        i += w;
    }
    return out;
}

std::string md5_hex(const std::string &bytes) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx ||
        EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest, &digest_len) != 1) {
        throw std::runtime_error("md5 digest failed");
    }

    static const char *hex = "0123456789abcdef";
    std::string out;
    out.reserve(digest_len * 2);
    for (unsigned int i = 0; i < digest_len; ++i) {
        out += hex[digest[i] >> 4];
        out += hex[digest[i] & 0x0F];
    }
    return out;
}

std::vector<std::string> split_whitespace(const std::string &s) {
    std::vector<std::string> words;
    std::istringstream iss(s);
    std::string w;
    while (iss >> w) words.push_back(w);
    return words;
}

std::string clean_ocr_text(const std::string &text) {
    std::istringstream iss(text);
    std::string line;
    std::string out;
    while (std::getline(iss, line)) {
        line = trim_copy(line);
        if (line.empty()) continue;
        if (!out.empty()) out += "\n";
        out += line;
    }
    return out;
}

std::string read_file(const std::string &path) {
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("cannot open " + path);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

} // namespace docchunk
