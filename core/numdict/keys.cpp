#include "numdict/keys.hpp"
#include <cctype>
#include <sstream>

namespace workmem {

std::ostream& operator<<(std::ostream& os, const Feature& f) {
    os << f.dim;
    if (f.value) {
        os << ":";
        std::visit([&os](const auto& v) { os << v; }, *f.value);
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Chunk& c) {
    return os << c.id;
}

std::string toString(const Feature& f) {
    std::ostringstream oss;
    oss << f;
    return oss.str();
}

bool isPath(const std::string& s) {
    if (s.empty()) return false;
    size_t seg_len = 0;
    for (char ch : s) {
        if (ch == PATH_SEP) {
            if (seg_len == 0) return false;  // leading or doubled separator
            seg_len = 0;
            continue;
        }
        unsigned char u = static_cast<unsigned char>(ch);
        if (!std::isalnum(u) && ch != '_' && ch != '-') return false;
        seg_len++;
    }
    return seg_len > 0;  // no trailing separator
}

std::string withPrefix(const std::string& prefix, const std::string& dim) {
    if (prefix.empty()) return dim;
    return prefix + PATH_SEP + dim;
}

} // namespace workmem
