#include "PathJson.hpp"

#include "log/TaggedLogger.hpp"

#include <string>

namespace SynPath {

auto toJson(Path const& path) -> nlohmann::json {
    return nlohmann::json(path.toString());
}

auto fromJson(nlohmann::json const& json) -> Expected<Path> {
    if (!json.is_string()) {
        sp_log(std::string("fromJson: expected string, got ") + json.type_name(), "PathJson");
        return std::unexpected(Error{Error::Code::MalformedInput, std::string("Path must be a JSON string, got ") + json.type_name()});
    }
    return Path::parse(json.get_ref<std::string const&>());
}

} // namespace SynPath
