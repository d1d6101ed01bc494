#pragma once
#include <cstddef>
#include <iterator>
#include <string_view>

namespace SynPath {

/**
 * Walks the segments of a raw path string. Runs of separators are skipped, so
 * "a//b/" yields "a" then "b" and "/" yields nothing.
 */
class SegmentIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type        = std::string_view;
    using difference_type   = std::ptrdiff_t;
    using pointer           = const value_type*;
    using reference         = const value_type&;
    using IteratorType      = std::string_view::const_iterator;

    explicit SegmentIterator(std::string_view path) noexcept;

    [[nodiscard]] auto operator*() const noexcept -> value_type;
    [[nodiscard]] auto operator->() const noexcept -> pointer;
    auto               operator++() noexcept -> SegmentIterator&;
    auto               operator++(int) noexcept -> SegmentIterator;
    [[nodiscard]] auto operator==(const SegmentIterator& other) const noexcept -> bool;

    [[nodiscard]] auto isAtEnd() const noexcept -> bool;
    [[nodiscard]] auto fullPath() const noexcept -> std::string_view;

private:
    auto findNextComponent() noexcept -> void;
    auto updateCurrentSegment() noexcept -> void;

    std::string_view path;            // The complete path we're iterating over
    std::string_view current_segment; // View of the current path component
    IteratorType     current;         // Iterator to start of current component
    IteratorType     segment_end;     // Iterator to end of current component
};

} // namespace SynPath
