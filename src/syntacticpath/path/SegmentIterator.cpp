#include "SegmentIterator.hpp"

#include "path/Path.hpp"

namespace SynPath {

SegmentIterator::SegmentIterator(std::string_view path) noexcept
    : path{path}, current{path.begin()}, segment_end{path.begin()} {
    findNextComponent();
}

auto SegmentIterator::findNextComponent() noexcept -> void {
    // Skip any leading separators
    while (current != path.end() && *current == Path::Separator) {
        ++current;
    }

    // Find end of component (next separator or end)
    segment_end = current;
    while (segment_end != path.end() && *segment_end != Path::Separator) {
        ++segment_end;
    }

    updateCurrentSegment();
}

auto SegmentIterator::operator*() const noexcept -> value_type {
    return current_segment;
}

auto SegmentIterator::operator->() const noexcept -> pointer {
    return &current_segment;
}

auto SegmentIterator::operator++() noexcept -> SegmentIterator& {
    if (!isAtEnd()) {
        current = segment_end;
        findNextComponent();
    }
    return *this;
}

auto SegmentIterator::operator++(int) noexcept -> SegmentIterator {
    SegmentIterator tmp = *this;
    ++*this;
    return tmp;
}

auto SegmentIterator::operator==(const SegmentIterator& other) const noexcept -> bool {
    return current == other.current;
}

auto SegmentIterator::isAtEnd() const noexcept -> bool {
    // current == segment_end means no component was found
    return current == path.end() || current == segment_end;
}

auto SegmentIterator::fullPath() const noexcept -> std::string_view {
    return path;
}

auto SegmentIterator::updateCurrentSegment() noexcept -> void {
    current_segment = path.substr(current - path.begin(), segment_end - current);
}

} // namespace SynPath
