/*
 * Parser context - state threaded through the lemon parser, the re2c
 * scanner and the C++ form builder
 */

#pragma once
#include "snapshot/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

typedef struct parser_context parser_context_t;

enum parser_error_code {
    PARSER_OK = 0,
    PARSER_ERROR_SYNTAX = 1,
    PARSER_ERROR_MEMORY = 2,
    PARSER_ERROR_UNEXPECTED_CHARACTER = 3,
    PARSER_ERROR_INVALID_LITERAL = 4
};

/* Record the first error; later errors are ignored. Position defaults to the scanner position. */
#if defined(__GNUC__) || defined(__clang__)
__attribute__((format(printf, 3, 4)))
#endif
void parser_set_error(parser_context_t* ctx, enum parser_error_code code, const char* format, ...);

/* Move the recorded error to a token's position */
void parser_set_error_position(parser_context_t* ctx, int line, int column);

int parser_has_error(const parser_context_t* ctx);

/* Human-readable token name for syntax errors */
const char* parser_get_token_name(int token_code);

#ifdef __cplusplus
}
#endif


#if defined(OPCHECK_PARSER_CONTEXT_VISIBLE)
#include "snapshot/form_holder.hh"

typedef struct parser_error {
    enum parser_error_code code;
    char message[256];
    int line;
    int column;
} parser_error_t;

struct parser_context {
    parser_error_t error;
    form_holder* forms;
    scanner_context_t* m_scanner;
};
#endif
