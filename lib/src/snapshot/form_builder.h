/*
 * C bridge between the lemon grammar and the C++ form tree
 */

#ifndef OPCHECK_FORM_BUILDER_H
#define OPCHECK_FORM_BUILDER_H

#include "snapshot/parser_context.h"
#include "snapshot/scanner_context.h"

#ifdef __cplusplus
extern "C" {
#endif

enum parser_atom_kind {
    PARSER_ATOM_SYMBOL = 0,
    PARSER_ATOM_STRING = 1,
    PARSER_ATOM_INTEGER = 2,
    PARSER_ATOM_LOCATION = 3
};

/* Opaque handles; the grammar never looks inside */
typedef struct snapshot_form snapshot_form_t;
typedef struct snapshot_form_list snapshot_form_list_t;

snapshot_form_list_t* form_list_new(parser_context_t* ctx);
snapshot_form_list_t* form_list_append(parser_context_t* ctx, snapshot_form_list_t* list, snapshot_form_t* item);

snapshot_form_t* form_make_list(parser_context_t* ctx, const token_value_t* open, snapshot_form_list_t* items);
snapshot_form_t* form_make_atom(parser_context_t* ctx, enum parser_atom_kind kind, const token_value_t* tok);

void form_set_root(parser_context_t* ctx, snapshot_form_list_t* items);

#ifdef __cplusplus
}
#endif

#endif /* OPCHECK_FORM_BUILDER_H */
