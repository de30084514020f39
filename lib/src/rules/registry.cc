//
// Builtin rule catalog
//

#include <opcheck/rules.hh>

namespace opcheck {

std::vector<std::unique_ptr<analyzer>> builtin_analyzers() {
    std::vector<std::unique_ptr<analyzer>> analyzers;
    analyzers.push_back(std::make_unique<certificate_validation_analyzer>());
    analyzers.push_back(std::make_unique<disposable_finalizer_analyzer>());
    return analyzers;
}

} // namespace opcheck
