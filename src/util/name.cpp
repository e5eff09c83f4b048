#include <verchain/name.hpp>
#include <cctype>

namespace verchain {

Status validate_name(const std::string& name) {
    if (name.empty()) {
        return VerchainError{VerchainError::InvalidArg, "empty component name"};
    }

    if (!std::isalpha(static_cast<unsigned char>(name[0]))) {
        return VerchainError{VerchainError::InvalidArg,
            "invalid component name '" + name + "'",
            "component names must start with a letter"};
    }

    for (size_t i = 1; i < name.size(); ++i) {
        char c = name[i];
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != '_' && c != '-') {
            return VerchainError{VerchainError::InvalidArg,
                "invalid character '" + std::string(1, c) +
                "' in component name '" + name + "'",
                "allowed: [a-zA-Z0-9_-]"};
        }
    }

    return ok_status();
}

std::vector<std::string> split_names(const std::string& list) {
    std::vector<std::string> names;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();

        size_t b = start;
        size_t e = comma;
        while (b < e && std::isspace(static_cast<unsigned char>(list[b]))) ++b;
        while (e > b && std::isspace(static_cast<unsigned char>(list[e - 1]))) --e;
        if (e > b) names.push_back(list.substr(b, e - b));

        start = comma + 1;
    }
    return names;
}

} // namespace verchain
