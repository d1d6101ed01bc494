#include "Path.hpp"

#include "path/SegmentIterator.hpp"
#include "path/validation.hpp"

#include <algorithm>
#include <mutex>
#include <utility>

namespace SynPath {

struct Path::State {
    State(std::vector<std::string> segs, bool absolute, bool folder)
        : segments(std::move(segs)), isAbsolute(absolute), isFolder(folder) {
        this->isNormal       = std::find(this->segments.begin(), this->segments.end(), BackwardsSegment) == this->segments.end();
        this->representation = this->format();
    }

    auto format() const -> std::string {
        if (this->segments.empty())
            return this->isAbsolute ? std::string(1, Separator) : std::string{};

        std::string result;
        if (this->isAbsolute)
            result.push_back(Separator);
        for (std::size_t idx = 0; idx < this->segments.size(); ++idx) {
            if (idx > 0)
                result.push_back(Separator);
            result.append(this->segments[idx]);
        }
        if (this->isFolder)
            result.push_back(Separator);
        return result;
    }

    std::vector<std::string> segments;
    bool                     isAbsolute;
    bool                     isFolder;
    bool                     isNormal;
    std::string              representation;

    mutable std::once_flag               normalizedOnce;
    mutable std::shared_ptr<State const> normalized;
};

namespace {

auto format_segment_list(std::vector<std::string> const& segments) -> std::string {
    std::string result{"["};
    for (std::size_t idx = 0; idx < segments.size(); ++idx) {
        if (idx > 0)
            result.append(", ");
        result.append(segments[idx]);
    }
    result.push_back(']');
    return result;
}

auto make_relativize_error(std::string_view reason, Path const& left, Path const& right) -> Error {
    std::string message{reason};
    message.append(": {left=").append(left.toString()).append(", right=").append(right.toString()).append("}");
    return Error{Error::Code::InvalidRelativize, std::move(message)};
}

} // namespace

Path::Path() {
    static auto const empty = std::make_shared<State>(std::vector<std::string>{}, false, false);
    this->state             = empty;
}

Path::Path(std::vector<std::string> segments, bool isAbsolute, bool isFolder)
    : state(std::make_shared<State>(std::move(segments), isAbsolute, isFolder)) {}

Path::Path(std::shared_ptr<State const> state)
    : state(std::move(state)) {}

auto Path::parse(char const* path) -> Expected<Path> {
    if (path == nullptr)
        return std::unexpected(Error{Error::Code::NullInput, "path cannot be null"});
    return parse(std::string_view{path});
}

auto Path::parse(std::string_view path) -> Expected<Path> {
    if (auto const result = validate_path_characters(path); result.code != ValidationError::Code::None) {
        std::string message{get_error_message(result.code)};
        message.append(": {path=").append(path).append("}");
        return std::unexpected(Error{Error::Code::IllegalCharacter, std::move(message)});
    }

    std::vector<std::string> segments;
    for (SegmentIterator iter{path}; !iter.isAtEnd(); ++iter)
        segments.emplace_back(*iter);

    for (auto const& segment : segments) {
        if (auto const result = validate_segment(segment); result.code != ValidationError::Code::None) {
            std::string message{get_error_message(result.code)};
            message.append(": {segments=").append(format_segment_list(segments)).append("}");
            return std::unexpected(Error{Error::Code::IllegalSegment, std::move(message)});
        }
    }

    bool const absolute = path.starts_with(Separator);
    bool const folder   = path.ends_with(Separator);
    return Path{std::move(segments), absolute, folder};
}

auto Path::root() -> Path const& {
    static Path const instance{std::vector<std::string>{}, true, true};
    return instance;
}

auto Path::getSegments() const -> std::vector<std::string> const& {
    return this->state->segments;
}

auto Path::isAbsolute() const -> bool {
    return this->state->isAbsolute;
}

auto Path::isFolder() const -> bool {
    return this->state->isFolder;
}

auto Path::toString() const -> std::string const& {
    return this->state->representation;
}

auto Path::normalize() const -> Path {
    if (this->state->isNormal)
        return *this;

    std::call_once(this->state->normalizedOnce, [this] {
        std::vector<std::string> normal;
        normal.reserve(this->state->segments.size());
        for (auto const& segment : this->state->segments) {
            if (segment == BackwardsSegment) {
                if (!normal.empty())
                    normal.pop_back();
            } else {
                normal.push_back(segment);
            }
        }
        this->state->normalized = std::make_shared<State>(std::move(normal), this->state->isAbsolute, this->state->isFolder);
    });
    return Path{this->state->normalized};
}

auto Path::getRoot() const -> std::optional<Path> {
    if (!this->state->segments.empty() && this->state->isAbsolute)
        return root();
    return std::nullopt;
}

auto Path::getFileName() const -> std::optional<Path> {
    auto const  normal   = this->normalize();
    auto const& segments = normal.getSegments();

    if (segments.empty())
        return std::nullopt;

    if (segments.size() == 1 && !normal.isAbsolute())
        return *this;
    return Path{std::vector<std::string>{segments.back()}, false, false};
}

auto Path::getParent() const -> std::optional<Path> {
    auto const  normal   = this->normalize();
    auto const& segments = normal.getSegments();

    if (segments.empty())
        return std::nullopt;
    if (segments.size() == 1)
        return this->getRoot(); // nothing for relative paths
    return Path{std::vector<std::string>(segments.begin(), segments.end() - 1), normal.isAbsolute(), true};
}

auto Path::resolve(Path const& other) const -> Path {
    if (other.isAbsolute())
        return other;

    std::vector<std::string> segments;
    segments.reserve(this->state->segments.size() + other.state->segments.size());
    segments.insert(segments.end(), this->state->segments.begin(), this->state->segments.end());
    segments.insert(segments.end(), other.state->segments.begin(), other.state->segments.end());
    return Path{std::move(segments), this->state->isAbsolute, other.state->isFolder};
}

auto Path::resolve(std::string_view other) const -> Expected<Path> {
    auto parsed = parse(other);
    if (!parsed)
        return std::unexpected(parsed.error());
    return this->resolve(*parsed);
}

auto Path::relativize(Path const& other) const -> Expected<Path> {
    auto const left  = this->normalize();
    auto const right = other.normalize();

    if (left.isAbsolute() != right.isAbsolute())
        return std::unexpected(make_relativize_error("Cannot relativize absolute vs relative path", left, right));

    auto const& lhs = left.getSegments();
    auto const& rhs = right.getSegments();
    if (lhs.size() >= rhs.size() || !std::equal(lhs.begin(), lhs.end(), rhs.begin()))
        return std::unexpected(make_relativize_error("Relativize requires this path to be a proper prefix of the other path", left, right));

    if (lhs.empty() && !left.isAbsolute())
        return right;

    return Path{std::vector<std::string>(rhs.begin() + static_cast<std::ptrdiff_t>(lhs.size()), rhs.end()), false, right.isFolder()};
}

auto Path::relativize(std::string_view other) const -> Expected<Path> {
    auto parsed = parse(other);
    if (!parsed)
        return std::unexpected(parsed.error());
    return this->relativize(*parsed);
}

auto Path::startsWithSegment(Path const& other) const -> bool {
    auto const left  = this->normalize();
    auto const right = other.normalize();

    if (left.getSegments().size() < right.getSegments().size())
        return false;
    if (left.isAbsolute() != right.isAbsolute())
        return false;
    return left.toString().starts_with(right.toString());
}

auto Path::endsWithSegment(Path const& other) const -> bool {
    auto const left  = this->normalize();
    auto const right = other.normalize();

    auto const& lhs = left.getSegments();
    auto const& rhs = right.getSegments();

    if (lhs.size() < rhs.size())
        return false;

    if (lhs.size() == rhs.size()) {
        if (!left.isAbsolute() && right.isAbsolute())
            return false;
        return lhs == rhs;
    }

    // An absolute path can only match in full.
    if (right.isAbsolute())
        return false;
    return std::equal(rhs.begin(), rhs.end(), lhs.end() - static_cast<std::ptrdiff_t>(rhs.size()));
}

auto Path::toAbsolutePath() const -> Path {
    if (this->isAbsolute())
        return *this;
    return root().resolve(*this);
}

auto Path::compareTo(Path const& other) const -> int {
    return this->toString().compare(other.toString());
}

auto Path::sharesStateWith(Path const& other) const -> bool {
    return this->state == other.state;
}

auto Path::operator==(Path const& other) const -> bool {
    return this->toString() == other.toString();
}

auto Path::operator<=>(Path const& other) const -> std::strong_ordering {
    return this->toString() <=> other.toString();
}

auto operator<<(std::ostream& os, Path const& path) -> std::ostream& {
    return os << path.toString();
}

} // namespace SynPath
