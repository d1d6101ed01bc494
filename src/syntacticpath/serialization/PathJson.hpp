#pragma once

#include "core/Error.hpp"
#include "path/Path.hpp"

#include <nlohmann/json.hpp>

namespace SynPath {

// A path is encoded as the JSON string of its canonical form.
auto toJson(Path const& path) -> nlohmann::json;
auto fromJson(nlohmann::json const& json) -> Expected<Path>;

} // namespace SynPath

namespace nlohmann {

template <>
struct adl_serializer<SynPath::Path> {
    static void to_json(json& j, SynPath::Path const& path) {
        j = SynPath::toJson(path);
    }

    static auto from_json(json const& j) -> SynPath::Path {
        auto parsed = SynPath::fromJson(j);
        if (!parsed)
            throw json::other_error::create(501, SynPath::describeError(parsed.error()), &j);
        return std::move(*parsed);
    }
};

} // namespace nlohmann
