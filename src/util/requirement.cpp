#include <verchain/requirement.hpp>
#include <verchain/name.hpp>
#include <cctype>

namespace verchain {

static std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) {
        ++start;
    }
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) {
        --end;
    }
    return s.substr(start, end - start);
}

Result<Requirement> Requirement::parse(const std::string& text) {
    auto eq = text.find('=');
    if (eq == std::string::npos) {
        return VerchainError{VerchainError::Parse,
            "requirement '" + text + "' is missing '='",
            "requirements are written as \"name=version\""};
    }

    Requirement req;
    req.name = trim(text.substr(0, eq));
    req.version = trim(text.substr(eq + 1));

    if (req.name.empty()) {
        return VerchainError{VerchainError::Parse,
            "requirement '" + text + "' has an empty component name",
            "requirements are written as \"name=version\""};
    }
    if (req.version.empty()) {
        return VerchainError{VerchainError::Parse,
            "requirement '" + text + "' has an empty version",
            "requirements are written as \"name=version\""};
    }

    auto valid = validate_name(req.name);
    if (valid.is_err()) {
        auto err = std::move(valid).error();
        err.code = VerchainError::Parse;
        err.message = "requirement '" + text + "': " + err.message;
        return err;
    }

    return Result<Requirement>::ok(std::move(req));
}

std::string Requirement::to_string() const {
    return name + "=" + version;
}

bool Requirement::operator==(const Requirement& o) const {
    return name == o.name && version == o.version;
}

bool Requirement::operator!=(const Requirement& o) const {
    return !(*this == o);
}

} // namespace verchain
