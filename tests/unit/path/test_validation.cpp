#include <doctest/doctest.h>

#include "path/validation.hpp"

#include <string>
#include <string_view>

using namespace SynPath;

TEST_SUITE("path.validation") {

TEST_CASE("character scan") {
    CHECK(validate_path_characters("").code == ValidationError::Code::None);
    CHECK(validate_path_characters("/a/¡/..").code == ValidationError::Code::None);

    std::string const trailing{"abc\0", 4};
    CHECK(validate_path_characters(trailing).code == ValidationError::Code::IllegalCharacter);
    std::string const leading{"\0/a", 3};
    CHECK(validate_path_characters(leading).code == ValidationError::Code::IllegalCharacter);
}

TEST_CASE("segment check") {
    CHECK(validate_segment(".").code == ValidationError::Code::IllegalSegment);
    CHECK(validate_segment("..").code == ValidationError::Code::None);
    CHECK(validate_segment(".hidden").code == ValidationError::Code::None);
    CHECK(validate_segment("a.").code == ValidationError::Code::None);
}

TEST_CASE("error messages") {
    CHECK(get_error_message(ValidationError::Code::None) == nullptr);
    CHECK(std::string_view{get_error_message(ValidationError::Code::IllegalCharacter)} == "Path contains illegal characters");
    CHECK(std::string_view{get_error_message(ValidationError::Code::IllegalSegment)} == "Path contains illegal segments");
}

} // TEST_SUITE
