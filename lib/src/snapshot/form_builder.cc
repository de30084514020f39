/*
 * C++ side of the grammar bridge
 * Grammar actions run inside C frames, so nothing here may throw.
 */

#include <charconv>
#include <cstdint>
#include <exception>
#include <string>
#include <utility>
#include <vector>

#define OPCHECK_PARSER_CONTEXT_VISIBLE

#include "snapshot/form_builder.h"
#include "snapshot/form_holder.hh"
#include "snapshot/parser_context.h"

namespace {
    using opcheck::snapshot::form;
    using opcheck::snapshot::form_kind;

    opcheck::source_pos make_pos(parser_context_t* ctx, const token_value_t* tok) {
        return opcheck::source_pos{
            ctx->forms->file_name,
            static_cast<std::size_t>(tok->line),
            static_cast<std::size_t>(tok->column)
        };
    }

    std::vector<form>* as_list(snapshot_form_list_t* list) {
        return reinterpret_cast<std::vector<form>*>(list);
    }

    form* as_form(snapshot_form_t* f) {
        return reinterpret_cast<form*>(f);
    }

    bool parse_integer(const char* first, const char* last, std::int64_t& out) {
        auto [ptr, ec] = std::from_chars(first, last, out);
        return ec == std::errc{} && ptr == last;
    }

    /* Strip the quotes and resolve \" \\ \n \t escapes */
    bool unescape_string(const char* first, const char* last, std::string& out) {
        if (last - first < 2) {
            return false;
        }
        ++first;
        --last;

        out.reserve(static_cast<std::size_t>(last - first));
        for (const char* p = first; p < last; ++p) {
            if (*p != '\\') {
                out += *p;
                continue;
            }
            if (++p == last) {
                return false;
            }
            switch (*p) {
                case 'n': out += '\n'; break;
                case 't': out += '\t'; break;
                case '"': out += '"'; break;
                case '\\': out += '\\'; break;
                default: return false;
            }
        }
        return true;
    }

    /* "@line:column" */
    bool parse_location(const char* first, const char* last, std::int64_t& line, std::int64_t& column) {
        if (first == last || *first != '@') {
            return false;
        }
        ++first;

        const char* colon = first;
        while (colon < last && *colon != ':') {
            ++colon;
        }
        if (colon == last) {
            return false;
        }

        return parse_integer(first, colon, line) && parse_integer(colon + 1, last, column);
    }

    form* store(parser_context_t* ctx, form&& f) {
        ctx->forms->temp_forms.push_back(std::move(f));
        return &ctx->forms->temp_forms.back();
    }
}

snapshot_form_list_t* form_list_new(parser_context_t* ctx) {
    if (parser_has_error(ctx)) return nullptr;

    try {
        ctx->forms->temp_lists.emplace_back();
        return reinterpret_cast<snapshot_form_list_t*>(&ctx->forms->temp_lists.back());
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Cannot allocate form list: %s", e.what());
        return nullptr;
    }
}

snapshot_form_list_t* form_list_append(parser_context_t* ctx, snapshot_form_list_t* list, snapshot_form_t* item) {
    if (parser_has_error(ctx) || !list || !item) return list;

    try {
        as_list(list)->push_back(std::move(*as_form(item)));
        return list;
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Cannot append form: %s", e.what());
        return nullptr;
    }
}

snapshot_form_t* form_make_list(parser_context_t* ctx, const token_value_t* open, snapshot_form_list_t* items) {
    if (parser_has_error(ctx) || !open || !items) return nullptr;

    try {
        form f;
        f.kind = form_kind::list;
        f.pos = make_pos(ctx, open);
        f.items = std::move(*as_list(items));
        return reinterpret_cast<snapshot_form_t*>(store(ctx, std::move(f)));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Cannot build list form: %s", e.what());
        return nullptr;
    }
}

snapshot_form_t* form_make_atom(parser_context_t* ctx, enum parser_atom_kind kind, const token_value_t* tok) {
    if (parser_has_error(ctx) || !tok) return nullptr;

    try {
        form f;
        f.pos = make_pos(ctx, tok);

        switch (kind) {
            case PARSER_ATOM_SYMBOL:
                f.kind = form_kind::symbol;
                f.text.assign(tok->start, tok->end);
                break;

            case PARSER_ATOM_STRING:
                f.kind = form_kind::string;
                if (!unescape_string(tok->start, tok->end, f.text)) {
                    parser_set_error(ctx, PARSER_ERROR_INVALID_LITERAL, "Invalid escape sequence in string literal");
                    parser_set_error_position(ctx, tok->line, tok->column);
                    return nullptr;
                }
                break;

            case PARSER_ATOM_INTEGER:
                f.kind = form_kind::integer;
                if (!parse_integer(tok->start, tok->end, f.integer)) {
                    parser_set_error(ctx, PARSER_ERROR_INVALID_LITERAL, "Integer literal out of range: %.*s",
                                     static_cast<int>(tok->end - tok->start), tok->start);
                    parser_set_error_position(ctx, tok->line, tok->column);
                    return nullptr;
                }
                break;

            case PARSER_ATOM_LOCATION:
                f.kind = form_kind::location;
                if (!parse_location(tok->start, tok->end, f.integer, f.column)) {
                    parser_set_error(ctx, PARSER_ERROR_INVALID_LITERAL, "Invalid location: %.*s",
                                     static_cast<int>(tok->end - tok->start), tok->start);
                    parser_set_error_position(ctx, tok->line, tok->column);
                    return nullptr;
                }
                break;
        }

        return reinterpret_cast<snapshot_form_t*>(store(ctx, std::move(f)));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Cannot build atom: %s", e.what());
        return nullptr;
    }
}

void form_set_root(parser_context_t* ctx, snapshot_form_list_t* items) {
    if (parser_has_error(ctx) || !items) return;

    try {
        ctx->forms->root = std::move(*as_list(items));
    } catch (const std::exception& e) {
        parser_set_error(ctx, PARSER_ERROR_MEMORY, "Cannot store forms: %s", e.what());
    }
}
