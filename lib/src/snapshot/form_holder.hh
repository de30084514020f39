//
// Form holder - scaffolding for the grammar actions
//

#pragma once

#include "snapshot/form.hh"
#include <deque>
#include <string>
#include <vector>

struct form_holder {
    std::string file_name;

    /* Intermediate nodes. Deques keep addresses stable; grammar rules pass
     * pointers to their elements. Elements are moved out when a list closes. */
    std::deque<opcheck::snapshot::form> temp_forms;
    std::deque<std::vector<opcheck::snapshot::form>> temp_lists;

    /* Top-level forms, set once the whole input was reduced */
    std::vector<opcheck::snapshot::form> root;
};
