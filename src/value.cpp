#include <dslrun/value.hpp>

#include <fmt/format.h>

namespace dslrun {

bool operator==(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) return a.number() == b.number();
    if (a.is_sequence() && b.is_sequence()) return a.sequence() == b.sequence();
    return false;
}

std::string format_value(const Value& v) {
    if (v.is_number()) return fmt::format("{}", v.number());
    if (v.is_operation()) return "<operation>";

    std::string out = "[";
    const auto& s = v.sequence();
    for (std::size_t i = 0; i < s.size(); ++i) {
        if (i) out += ", ";
        out += format_value(s[i]);
    }
    out += "]";
    return out;
}

std::ostream& operator<<(std::ostream& os, const Value& v) {
    return os << format_value(v);
}

} // namespace dslrun
