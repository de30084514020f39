//
// Symbol helpers
//

#include <opcheck/symbols.hh>
#include <algorithm>

namespace opcheck {

std::string type_symbol::name() const {
    auto dot = metadata_name.rfind('.');
    return dot == std::string::npos ? metadata_name : metadata_name.substr(dot + 1);
}

namespace {
    void collect_interfaces(const type_symbol& type, std::vector<const type_symbol*>& out) {
        for (const type_symbol* iface : type.interfaces) {
            if (!iface) {
                continue;
            }
            if (std::find(out.begin(), out.end(), iface) != out.end()) {
                continue;
            }
            out.push_back(iface);
            // Interfaces inheriting other interfaces list them as their own interfaces
            collect_interfaces(*iface, out);
        }
    }
}

std::vector<const type_symbol*> all_interfaces(const type_symbol& type) {
    std::vector<const type_symbol*> result;

    // Bounded walk: a malformed snapshot may contain a base cycle
    std::vector<const type_symbol*> visited;
    for (const type_symbol* t = &type; t; t = t->base_type) {
        if (std::find(visited.begin(), visited.end(), t) != visited.end()) {
            break;
        }
        visited.push_back(t);
        collect_interfaces(*t, result);
    }

    return result;
}

const char* type_kind_name(type_kind kind) {
    switch (kind) {
        case type_kind::class_type: return "class";
        case type_kind::struct_type: return "struct";
        case type_kind::interface_type: return "interface";
        case type_kind::enum_type: return "enum";
        case type_kind::delegate_type: return "delegate";
    }
    return "unknown";
}

} // namespace opcheck
