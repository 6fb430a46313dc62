#pragma once
#include <string>

#include "docchunk/types.hpp"

namespace docchunk {

// Parses TYPE_SUBJECT_PUBLISHER_GRADE.ext textbook filenames.
class MetadataParser {
public:
    // Never throws. Names with fewer than four fields yield empty fields and
    // full_name == filename.
    BookMetadata parse(const std::string &filename) const;

    // Starts with SGK_, SBT_ or STK_ (any case).
    static bool follows_textbook_convention(const std::string &filename);

    static std::string book_type_label(const std::string &code);
    static std::string subject_label(const std::string &code);
    static std::string publisher_label(const std::string &code);
};

} // namespace docchunk
