#include <dslrun/scope.hpp>

namespace dslrun {

Scope Scope::child(const Bindings& overlay) const {
    Scope out{bindings_};
    for (const auto& [name, value] : overlay) {
        out.bindings_.insert_or_assign(name, value);
    }
    return out;
}

const Value* Scope::find(const std::string& name) const {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) return nullptr;
    return &it->second;
}

Maybe Scope::lookup(const std::string& name) const {
    if (const Value* v = find(name)) return *v;
    return std::nullopt;
}

void Scope::bind(const std::string& name, Value v) {
    bindings_.insert_or_assign(name, std::move(v));
}

} // namespace dslrun
