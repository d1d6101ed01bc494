#pragma once
#include "Path.hpp"

#include <array>
#include <cstddef>
#include <optional>
#include <span>
#include <string_view>

namespace SynPath::Paths {

namespace detail {

inline auto as_segment(std::nullptr_t) -> std::optional<std::string_view> {
    return std::nullopt;
}

inline auto as_segment(char const* segment) -> std::optional<std::string_view> {
    if (segment == nullptr)
        return std::nullopt;
    return std::string_view{segment};
}

inline auto as_segment(std::string_view segment) -> std::optional<std::string_view> {
    return segment;
}

auto join_segments(std::span<std::optional<std::string_view> const> segments) -> Expected<Path>;

} // namespace detail

/**
 * Joins the given segments with '/' and parses the result. Null and empty
 * segments are skipped, so the path is absolute iff the first non-empty
 * segment starts with '/'.
 */
template <typename... Segments>
auto get(Segments const&... segments) -> Expected<Path> {
    std::array<std::optional<std::string_view>, sizeof...(Segments)> const views{detail::as_segment(segments)...};
    return detail::join_segments(views);
}

/// Single segment: parsed as-is, a null pointer is rejected.
auto get(char const* segment) -> Expected<Path>;

/// Array form; a null array is rejected, null entries inside it are skipped.
auto fromArray(char const* const* segments, std::size_t count) -> Expected<Path>;

} // namespace SynPath::Paths
