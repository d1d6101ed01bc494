#include "Paths.hpp"

#include "log/TaggedLogger.hpp"

#include <string>
#include <vector>

namespace SynPath::Paths {

namespace detail {

auto join_segments(std::span<std::optional<std::string_view> const> segments) -> Expected<Path> {
    std::string joined;
    bool        first = true;
    for (auto const& segment : segments) {
        if (!segment || segment->empty())
            continue;
        if (!first)
            joined.push_back(Path::Separator);
        joined.append(*segment);
        first = false;
    }
    sp_log("Paths::get joined " + std::to_string(segments.size()) + " segments into '" + joined + "'", "Paths");
    return Path::parse(std::string_view{joined});
}

} // namespace detail

auto get(char const* segment) -> Expected<Path> {
    return Path::parse(segment);
}

auto fromArray(char const* const* segments, std::size_t count) -> Expected<Path> {
    if (segments == nullptr)
        return std::unexpected(Error{Error::Code::NullInput, "segments cannot be null"});

    std::vector<std::optional<std::string_view>> views;
    views.reserve(count);
    for (std::size_t idx = 0; idx < count; ++idx)
        views.push_back(detail::as_segment(segments[idx]));
    return detail::join_segments(views);
}

} // namespace SynPath::Paths
