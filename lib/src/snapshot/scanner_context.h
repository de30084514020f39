/*
 * Scanner state shared between the re2c scanner (C) and the reader (C++)
 */

#pragma once

typedef struct scanner_context {
    const char* input;
    const char* cursor;
    const char* limit;   /* End of buffer including the zero padding */
    const char* eof;     /* End of the actual text */
    const char* marker;  /* re2c backtracking position */
    int line;
    int column;
    const char* filename;
} scanner_context_t;

/* Token value: a slice of the input buffer plus where it started */
typedef struct token_value {
    const char* start;  /* First character */
    const char* end;    /* One past last character */
    int line;
    int column;
} token_value_t;
