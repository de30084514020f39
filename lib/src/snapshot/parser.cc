/*
 * Snapshot parser - C++ interface over the lemon grammar and re2c scanner
 */

#include <cstdlib>
#include <deque>
#include <new>
#include <stdexcept>
#include <string>
#include <utility>

#include <opcheck/snapshot.hh>

#define OPCHECK_PARSER_CONTEXT_VISIBLE
#include "snapshot/parser.hh"
#include "snapshot/form_builder.h"
#include "snapshot/form_holder.hh"
#include "snapshot/scanner_context.h"
#include "snapshot/parser_context.h"

/* Forward declarations for Lemon */
extern "C" {
void* ParseAlloc(void* (* allocProc)(size_t));
void Parse(void* parser, int token, token_value_t* value, parser_context_t* ctx);
void ParseFree(void* parser, void (* freeProc)(void*));
int parser_scan_token(scanner_context_t* ctx, parser_context_t* pctx, token_value_t* token);
}

namespace {
    /* Owns a zero-padded copy of the text so the re2c scanner can read past
     * the end without bounds checks. */
    class scanner {
        public:
            static constexpr std::size_t padding = 32;

            scanner(const std::string& text, const std::string& filename)
                : m_buffer(text),
                  m_filename(filename.empty() ? std::string("<input>") : filename) {
                m_buffer.append(padding, '\0');

                const char* first = m_buffer.data();
                m_ctx.input = first;
                m_ctx.cursor = first;
                m_ctx.marker = first;
                m_ctx.eof = first + text.size();
                m_ctx.limit = first + m_buffer.size();
                m_ctx.line = 1;
                m_ctx.column = 1;
                m_ctx.filename = m_filename.c_str();
            }

            scanner(const scanner&) = delete;
            scanner& operator =(const scanner&) = delete;

            int next(token_value_t* token, parser_context_t* pctx) {
                return parser_scan_token(&m_ctx, pctx, token);
            }

            scanner_context_t* context() {
                return &m_ctx;
            }

        private:
            std::string m_buffer;
            std::string m_filename;
            scanner_context_t m_ctx{};
    };

    class parser {
        public:
            parser()
                : m_parser(ParseAlloc(malloc)) {
                if (!m_parser) {
                    throw std::bad_alloc();
                }
            }

            ~parser() {
                ParseFree(m_parser, free);
            }

            parser(const parser&) = delete;
            parser& operator =(const parser&) = delete;

            void feed(int token_type, token_value_t* token, parser_context_t* ctx) {
                Parse(m_parser, token_type, token, ctx);
            }

        private:
            void* m_parser;
    };

    /* Tokens stay referenced by the parser stack until their rule is
     * reduced, so they live in a deque for the whole parse. */
    bool run(parser& grammar, scanner& lexer, parser_context_t& ctx) {
        std::deque<token_value_t> tokens;

        for (;;) {
            token_value_t* token = &tokens.emplace_back();
            const int token_type = lexer.next(token, &ctx);

            if (token_type < 0) {
                return false;
            }
            if (token_type == 0) {
                break;
            }

            grammar.feed(token_type, token, &ctx);
            if (parser_has_error(&ctx)) {
                return false;
            }
        }

        /* End of input is token 0 for lemon */
        grammar.feed(0, nullptr, &ctx);
        return !parser_has_error(&ctx);
    }
}

namespace opcheck::snapshot {

    std::vector<form> parse_forms(const std::string& text, const std::string& filename) {
        parser grammar;
        scanner lexer(text, filename);

        form_holder holder;
        holder.file_name = filename;

        parser_context ctx{};
        ctx.m_scanner = lexer.context();
        ctx.forms = &holder;

        if (!run(grammar, lexer, ctx)) {
            throw snapshot_error(ctx.error.message, filename, ctx.error.line, ctx.error.column);
        }

        return std::move(holder.root);
    }

} // namespace opcheck::snapshot
