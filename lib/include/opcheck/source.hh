//
// Source positions shared by symbols, operations and diagnostics
//

#pragma once
#include <cstddef>
#include <string>
#include <utility>

namespace opcheck {
    struct source_pos {
        source_pos() = default;

        source_pos(std::string file_, std::size_t line_, std::size_t column_)
            : file(std::move(file_)),
              line(line_),
              column(column_) {
        }

        std::string file;
        std::size_t line = 0;
        std::size_t column = 0;

        [[nodiscard]] bool valid() const { return line != 0; }
    };

    /// Region of source text a node or symbol was produced from.
    /// `end` is optional; a span with only `start` set points at a single location.
    struct source_span {
        source_pos start;
        source_pos end;

        [[nodiscard]] bool valid() const { return start.valid(); }
    };

    inline bool operator==(const source_pos& a, const source_pos& b) {
        return a.file == b.file && a.line == b.line && a.column == b.column;
    }

    inline bool operator==(const source_span& a, const source_span& b) {
        return a.start == b.start && a.end == b.end;
    }
}
