//
// Operation tree traversal
//
// descendants(op) is a lazy pre-order range over the subtree below `op`.
// Each call to begin() starts an independent walk with its own stack, so a
// range can be iterated any number of times and from several threads.
//

#pragma once

#include "operation.hh"
#include <cstddef>
#include <iterator>
#include <utility>
#include <vector>

namespace opcheck {

class descendant_iterator {
public:
    using iterator_category = std::input_iterator_tag;
    using value_type = const operation*;
    using difference_type = std::ptrdiff_t;
    using pointer = const operation* const*;
    using reference = const operation*;

    descendant_iterator() = default;
    descendant_iterator(const operation* root, bool include_root);

    reference operator*() const { return stack_.back(); }

    descendant_iterator& operator++();
    descendant_iterator operator++(int);

    friend bool operator==(const descendant_iterator& a, const descendant_iterator& b) {
        if (a.stack_.empty() || b.stack_.empty()) {
            return a.stack_.empty() && b.stack_.empty();
        }
        return a.stack_.back() == b.stack_.back() && a.stack_.size() == b.stack_.size();
    }

private:
    void push_children(const operation* op);

    // top of the stack is the current node; children are pushed in reverse
    std::vector<const operation*> stack_;
};

class descendant_range {
public:
    descendant_range(const operation& root, bool include_root)
        : root_(&root),
          include_root_(include_root) {
    }

    [[nodiscard]] descendant_iterator begin() const { return descendant_iterator(root_, include_root_); }
    [[nodiscard]] descendant_iterator end() const { return {}; }

private:
    const operation* root_;
    bool include_root_;
};

/// Lazy filter dropping host-synthesized nodes. Relative order is kept and
/// the children of a dropped node are still produced.
template<typename Range>
class explicit_operations_range {
public:
    using base_iterator = decltype(std::declval<const Range&>().begin());

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = const operation*;
        using difference_type = std::ptrdiff_t;
        using pointer = const operation* const*;
        using reference = const operation*;

        iterator() = default;
        iterator(base_iterator it, base_iterator last)
            : it_(std::move(it)),
              last_(std::move(last)) {
            skip_implicit();
        }

        reference operator*() const { return *it_; }

        iterator& operator++() {
            ++it_;
            skip_implicit();
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++*this;
            return tmp;
        }

        friend bool operator==(const iterator& a, const iterator& b) { return a.it_ == b.it_; }

    private:
        void skip_implicit() {
            while (!(it_ == last_) && (*it_)->is_implicit) {
                ++it_;
            }
        }

        base_iterator it_;
        base_iterator last_;
    };

    explicit explicit_operations_range(Range range)
        : range_(std::move(range)) {
    }

    [[nodiscard]] iterator begin() const { return iterator(range_.begin(), range_.end()); }
    [[nodiscard]] iterator end() const { return iterator(range_.end(), range_.end()); }

private:
    Range range_;
};

/// All nodes below `op`, excluding `op` itself, in depth-first pre-order.
[[nodiscard]] inline descendant_range descendants(const operation& op) {
    return descendant_range(op, false);
}

/// `op` followed by descendants(op).
[[nodiscard]] inline descendant_range descendants_and_self(const operation& op) {
    return descendant_range(op, true);
}

template<typename Range>
[[nodiscard]] explicit_operations_range<Range> without_implicit(Range range) {
    return explicit_operations_range<Range>(std::move(range));
}

} // namespace opcheck
