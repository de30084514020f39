//
// Pre-order descendant iteration
//

#include <opcheck/traversal.hh>

namespace opcheck {

descendant_iterator::descendant_iterator(const operation* root, bool include_root) {
    if (!root) {
        return;
    }
    if (include_root) {
        stack_.push_back(root);
    } else {
        push_children(root);
    }
}

void descendant_iterator::push_children(const operation* op) {
    auto kids = children(*op);
    for (auto it = kids.rbegin(); it != kids.rend(); ++it) {
        stack_.push_back(*it);
    }
}

descendant_iterator& descendant_iterator::operator++() {
    const operation* current = stack_.back();
    stack_.pop_back();
    push_children(current);
    return *this;
}

descendant_iterator descendant_iterator::operator++(int) {
    descendant_iterator tmp = *this;
    ++*this;
    return tmp;
}

} // namespace opcheck
