//
// Parser context: error reporting for scanner, grammar and builder
//

#include <cstdarg>
#include <cstdio>

#define OPCHECK_PARSER_CONTEXT_VISIBLE
#include "snapshot/parser_context.h"
#include "gen/snapshot_parser.h"

void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...) {
    if (!ctx || ctx->error.code != PARSER_OK) return;

    ctx->error.code = code;
    ctx->error.line = ctx->m_scanner->line;
    ctx->error.column = ctx->m_scanner->column;

    va_list args;
    va_start(args, format);
    vsnprintf(ctx->error.message, sizeof(ctx->error.message), format, args);
    va_end(args);
}

void parser_set_error_position(parser_context_t* ctx, int line, int column) {
    if (!ctx) return;

    ctx->error.line = line;
    ctx->error.column = column;
}

int parser_has_error(const parser_context_t* ctx) {
    return ctx && ctx->error.code != PARSER_OK;
}

const char* parser_get_token_name(int token_code) {
    switch (token_code) {
        case 0: return "end of input";
        case TOKEN_LPAREN: return "'('";
        case TOKEN_RPAREN: return "')'";
        case TOKEN_SYMBOL: return "symbol";
        case TOKEN_STRING: return "string literal";
        case TOKEN_INTEGER: return "integer literal";
        case TOKEN_LOCATION: return "location";
        default: return "unknown token";
    }
}
