#pragma once
#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace SynPath {

struct Error {
    enum class Code {
        InvalidError = 0,
        UnknownError,
        NullInput,
        IllegalCharacter,
        IllegalSegment,
        InvalidRelativize,
        MalformedInput
    };

    Error(Code c, std::string m)
        : code(c), message(std::move(m)) {}

    Code                       code;
    std::optional<std::string> message;
};

template <typename T>
using Expected = std::expected<T, Error>;

[[nodiscard]] inline auto errorCodeToString(Error::Code code) -> std::string_view {
    switch (code) {
    case Error::Code::InvalidError:
        return "invalid_error";
    case Error::Code::UnknownError:
        return "unknown_error";
    case Error::Code::NullInput:
        return "null_input";
    case Error::Code::IllegalCharacter:
        return "illegal_character";
    case Error::Code::IllegalSegment:
        return "illegal_segment";
    case Error::Code::InvalidRelativize:
        return "invalid_relativize";
    case Error::Code::MalformedInput:
        return "malformed_input";
    }
    return "unknown_error";
}

[[nodiscard]] inline auto describeError(Error const& error) -> std::string {
    auto const label = errorCodeToString(error.code);
    if (error.message && !error.message->empty()) {
        std::string description;
        description.reserve(label.size() + 1 + error.message->size());
        description.append(label.data(), label.size());
        description.push_back(':');
        description.append(error.message->data(), error.message->size());
        return description;
    }
    return std::string{label};
}

} // namespace SynPath
