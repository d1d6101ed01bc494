#pragma once
#include <string_view>

namespace SynPath {

struct ValidationError {
    enum class Code {
        None,
        IllegalCharacter,
        IllegalSegment
    };
    Code code;
};

inline constexpr char             IllegalCharacter = '\0';
inline constexpr std::string_view IllegalSegment   = ".";

// Scans the raw input; runs before splitting so the offending string is reported whole.
constexpr ValidationError validate_path_characters(std::string_view str) {
    for (char const c : str) {
        if (c == IllegalCharacter)
            return {ValidationError::Code::IllegalCharacter};
    }
    return {ValidationError::Code::None};
}

// Segments come out of the splitter, so they never hold a separator and are never empty.
constexpr ValidationError validate_segment(std::string_view segment) {
    if (segment == IllegalSegment)
        return {ValidationError::Code::IllegalSegment};
    return {ValidationError::Code::None};
}

constexpr const char* get_error_message(ValidationError::Code code) {
    switch (code) {
        case ValidationError::Code::IllegalCharacter:
            return "Path contains illegal characters";
        case ValidationError::Code::IllegalSegment:
            return "Path contains illegal segments";
        case ValidationError::Code::None:
            return nullptr;
    }
    return "Unknown error";
}

static_assert(validate_path_characters("/a/b").code == ValidationError::Code::None);
static_assert(validate_path_characters(std::string_view{"a\0b", 3}).code == ValidationError::Code::IllegalCharacter);
static_assert(validate_segment("..").code == ValidationError::Code::None);
static_assert(validate_segment(".").code == ValidationError::Code::IllegalSegment);

} // namespace SynPath
