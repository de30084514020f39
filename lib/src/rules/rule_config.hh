//
// Build-time rule configuration
//
// OPCHECK_RULES_ENABLED_BY_DEFAULT is set by the build (CMake option of the
// same name). Packagings that ship the rules switched off define it to 0;
// users then opt in per rule through analysis_options::enabled_rules.
//

#pragma once

#ifndef OPCHECK_RULES_ENABLED_BY_DEFAULT
#define OPCHECK_RULES_ENABLED_BY_DEFAULT 1
#endif

namespace opcheck {
    inline constexpr bool rules_enabled_by_default = OPCHECK_RULES_ENABLED_BY_DEFAULT != 0;
}
