#pragma once

#include <verchain/result.hpp>
#include <string>

namespace verchain {

// Exact pin on another component: "<name>=<version>"
struct Requirement {
    std::string name;
    std::string version;

    static Result<Requirement> parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const Requirement& o) const;
    bool operator!=(const Requirement& o) const;
};

} // namespace verchain
