//
// Generic form tree produced by the snapshot grammar
//

#pragma once

#include <opcheck/source.hh>
#include <cstdint>
#include <string>
#include <vector>

namespace opcheck::snapshot {

    enum class form_kind {
        list,
        symbol,
        string,
        integer,
        location
    };

    struct form {
        form_kind kind = form_kind::list;
        source_pos pos;
        std::string text;         // symbol name or unescaped string value
        std::int64_t integer = 0; // integer value; line of a location
        std::int64_t column = 0;  // column of a location
        std::vector<form> items;  // list elements

        [[nodiscard]] bool is_symbol(const char* name) const {
            return kind == form_kind::symbol && text == name;
        }
    };

} // namespace opcheck::snapshot
