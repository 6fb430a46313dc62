#include "docchunk/metadata_parser.hpp"

#include <filesystem>
#include <unordered_map>
#include <vector>

#include "docchunk/log.hpp"
#include "docchunk/util.hpp"

namespace fs = std::filesystem;

namespace docchunk {

static const char *kComponent = "MetadataParser";

static std::string lookup(const std::unordered_map<std::string, std::string> &table, const std::string &code) {
    auto it = table.find(code);
    return it == table.end() ? code : it->second;
}

std::string MetadataParser::book_type_label(const std::string &code) {
    static const std::unordered_map<std::string, std::string> table = {
        {"SGK", "Sách giáo khoa"},
        {"SBT", "Sách bài tập"},
        {"STK", "Sách tham khảo"},
    };
    return lookup(table, code);
}

std::string MetadataParser::subject_label(const std::string &code) {
    static const std::unordered_map<std::string, std::string> table = {
        {"TIN", "Tin học"},
        {"TOAN", "Toán"},
        {"VAN", "Ngữ văn"},
        {"ANH", "Tiếng Anh"},
        {"LY", "Vật lý"},
        {"HOA", "Hóa học"},
        {"SINH", "Sinh học"},
        {"SU", "Lịch sử"},
        {"DIA", "Địa lý"},
        {"GDCD", "Giáo dục công dân"},
    };
    return lookup(table, code);
}

std::string MetadataParser::publisher_label(const std::string &code) {
    static const std::unordered_map<std::string, std::string> table = {
        {"CD", "Cánh Diều"},
        {"KN", "Kết Nối Tri Thức"},
        {"CT", "Chân Trời Sáng Tạo"},
        {"NXB", "Nhà xuất bản"},
    };
    return lookup(table, code);
}

bool MetadataParser::follows_textbook_convention(const std::string &filename) {
    std::string name = to_lower(fs::path(filename).filename().string());
    return starts_with(name, "sgk_") || starts_with(name, "sbt_") || starts_with(name, "stk_");
}

BookMetadata MetadataParser::parse(const std::string &filename) const {
    std::string base = fs::path(filename).filename().string();
    std::string stem = base.substr(0, base.find('.'));

    // Empty fields are kept: "A__B" has three parts, "A_" has two.
    std::vector<std::string> parts;
    size_t from = 0;
    while (true) {
        size_t sep = stem.find('_', from);
        parts.push_back(stem.substr(from, sep == std::string::npos ? std::string::npos : sep - from));
        if (sep == std::string::npos) break;
        from = sep + 1;
    }

    BookMetadata meta;
    if (parts.size() < 4) {
        log_warning(kComponent, "Could not parse textbook metadata from ", filename,
                    ": expected TYPE_SUBJECT_PUBLISHER_GRADE");
        meta.full_name = filename;
        return meta;
    }

    meta.book_type = book_type_label(parts[0]);
    meta.subject = subject_label(parts[1]);
    meta.publisher = publisher_label(parts[2]);
    meta.grade = "Lớp " + parts[3];
    meta.full_name = meta.book_type + " " + meta.subject + " " + meta.publisher + " " + meta.grade;

    log_info(kComponent, "Parsed textbook metadata: ", meta.full_name);
    return meta;
}

} // namespace docchunk
