#include "scrape/core/source_span.hpp"
#include <algorithm>

namespace scrape {

SourcePosition position_at(std::string_view source, usize offset) {
    offset = std::min(offset, source.size());

    SourcePosition position{.line = 1, .column = 1, .offset = offset};
    for (usize i = 0; i < offset; ++i) {
        auto byte = static_cast<u8>(source[i]);
        if (byte == '\n') {
            ++position.line;
            position.column = 1;
        } else if ((byte & 0xC0) != 0x80) {
            ++position.column;
        }
    }
    return position;
}

SourceSpan SourceSpan::from_offsets(std::string_view source, usize begin, usize end) {
    if (end < begin) {
        std::swap(begin, end);
    }
    return SourceSpan{position_at(source, begin), position_at(source, end)};
}

SourceSpan SourceSpan::at(std::string_view source, usize offset) {
    auto position = position_at(source, offset);
    return SourceSpan{position, position};
}

} // namespace scrape
