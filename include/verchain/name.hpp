#pragma once

#include <verchain/result.hpp>
#include <string>
#include <vector>

namespace verchain {

// Component name: [a-zA-Z][a-zA-Z0-9_-]*
// Names are compared byte for byte; no normalization is applied.
Status validate_name(const std::string& name);

// "a,b,,c," -> {a, b, c}; whitespace around names is dropped
std::vector<std::string> split_names(const std::string& list);

} // namespace verchain
