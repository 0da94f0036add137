#include "eligix/attributes.hpp"

#include <iomanip>
#include <sstream>

namespace eligix {

    std::string to_string(const AttributeValue &value) {
        return std::visit(
            [](const auto &v) -> std::string {
                using T = std::decay_t<decltype(v)>;
                if constexpr (std::is_same_v<T, std::monostate>) {
                    return "null";
                } else if constexpr (std::is_same_v<T, bool>) {
                    return v ? "true" : "false";
                } else if constexpr (std::is_same_v<T, std::int64_t>) {
                    return std::to_string(v);
                } else if constexpr (std::is_same_v<T, double>) {
                    std::ostringstream oss;
                    oss << std::setprecision(17) << v;
                    auto text = oss.str();
                    // keep doubles recognizable as doubles when read back
                    if (text.find_first_of(".eEn") == std::string::npos)
                        text += ".0";
                    return text;
                } else {
                    std::string out = "'";
                    for (char c : v) {
                        if (c == '\'' || c == '\\')
                            out += '\\';
                        out += c;
                    }
                    out += "'";
                    return out;
                }
            },
            value);
    }

    std::string type_name(const AttributeValue &value) {
        switch (value.index()) {
        case 0:
            return "null";
        case 1:
            return "bool";
        case 2:
            return "int";
        case 3:
            return "double";
        default:
            return "string";
        }
    }

} // namespace eligix
