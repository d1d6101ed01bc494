#pragma once
#include "core/Error.hpp"

#include <compare>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace SynPath {

/**
 * Unix-style syntactic path, independent of any filesystem.
 *
 * A path is a sequence of segments separated by '/'. Segments are never empty
 * and never ".", but may be the backwards segment "..", which is only collapsed
 * by normalize(). A path is absolute iff its string form starts with '/' and a
 * folder iff it ends with '/'. The root "/" is an absolute folder, the empty
 * path "" a relative non-folder.
 *
 * Paths are immutable. Copies share one state block, which also caches the
 * normalized form.
 */
class Path {
public:
    static constexpr char             Separator        = '/';
    static constexpr std::string_view BackwardsSegment = "..";

    /// The empty relative path "".
    Path();

    [[nodiscard]] static auto parse(std::string_view path) -> Expected<Path>;
    [[nodiscard]] static auto parse(char const* path) -> Expected<Path>;
    [[nodiscard]] static auto root() -> Path const&;

    [[nodiscard]] auto getSegments() const -> std::vector<std::string> const&;
    [[nodiscard]] auto isAbsolute() const -> bool;
    [[nodiscard]] auto isFolder() const -> bool;
    [[nodiscard]] auto toString() const -> std::string const&;

    /// Collapses ".." against the preceding segment; ".." with nothing before it is dropped.
    [[nodiscard]] auto normalize() const -> Path;

    /// root() for absolute paths with at least one segment, otherwise nothing.
    [[nodiscard]] auto getRoot() const -> std::optional<Path>;
    /// Last segment of the normalized path. A single relative segment returns this path itself.
    [[nodiscard]] auto getFileName() const -> std::optional<Path>;
    /// Leading segments of the normalized path, as a folder.
    [[nodiscard]] auto getParent() const -> std::optional<Path>;

    /// Absolute other paths win; otherwise concatenates without normalizing. Folder-ness comes from other.
    [[nodiscard]] auto resolve(Path const& other) const -> Path;
    [[nodiscard]] auto resolve(std::string_view other) const -> Expected<Path>;

    /// Suffix of normalized other beyond normalized this, which must be a proper prefix of it.
    [[nodiscard]] auto relativize(Path const& other) const -> Expected<Path>;
    [[nodiscard]] auto relativize(std::string_view other) const -> Expected<Path>;

    [[nodiscard]] auto startsWithSegment(Path const& other) const -> bool;
    [[nodiscard]] auto endsWithSegment(Path const& other) const -> bool;

    [[nodiscard]] auto toAbsolutePath() const -> Path;

    [[nodiscard]] auto compareTo(Path const& other) const -> int;
    [[nodiscard]] auto sharesStateWith(Path const& other) const -> bool;

    auto operator==(Path const& other) const -> bool;
    auto operator<=>(Path const& other) const -> std::strong_ordering;

private:
    struct State;

    Path(std::vector<std::string> segments, bool isAbsolute, bool isFolder);
    explicit Path(std::shared_ptr<State const> state);

    std::shared_ptr<State const> state;
};

auto operator<<(std::ostream& os, Path const& path) -> std::ostream&;

} // namespace SynPath

namespace std {

template <>
struct hash<SynPath::Path> {
    std::size_t operator()(const SynPath::Path& path) const noexcept {
        return std::hash<std::string_view>{}(path.toString());
    }
};

} // namespace std
