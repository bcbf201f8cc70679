#pragma once

#include "types.hpp"
#include <string_view>

namespace scrape {

// ============================================================================
// Source positions - line/column tracking for diagnostics
// ============================================================================

// 1-based line and column. Columns count code points, not bytes.
struct SourcePosition {
    usize line{1};
    usize column{1};
    usize offset{0};

    [[nodiscard]] bool operator==(const SourcePosition& other) const = default;
};

struct SourceSpan {
    SourcePosition start;
    SourcePosition end;

    [[nodiscard]] static SourceSpan from_offsets(std::string_view source, usize begin, usize end);
    [[nodiscard]] static SourceSpan at(std::string_view source, usize offset);

    [[nodiscard]] usize length() const { return end.offset - start.offset; }
    [[nodiscard]] bool operator==(const SourceSpan& other) const = default;
};

// Offsets past the end clamp to the end of the source.
[[nodiscard]] SourcePosition position_at(std::string_view source, usize offset);

} // namespace scrape
