//
// Snapshot text to generic form tree
//

#pragma once

#include "snapshot/form.hh"
#include <string>
#include <vector>

namespace opcheck::snapshot {

    /// Parse snapshot text into its top-level forms.
    /// @throws snapshot_error on lexical or syntax errors
    std::vector<form> parse_forms(const std::string& text, const std::string& filename);

} // namespace opcheck::snapshot
