#include <verchain/error.hpp>

namespace verchain {

const char* VerchainError::code_name(Code c) {
    switch (c) {
        case IO:                return "IO";
        case Parse:             return "Parse";
        case Manifest:          return "Manifest";
        case InvalidArg:        return "InvalidArg";
        case NotFound:          return "NotFound";
        case Duplicate:         return "Duplicate";
        case UnknownDependency: return "UnknownDependency";
        case VersionMismatch:   return "VersionMismatch";
        case Cycle:             return "Cycle";
    }
    return "Unknown";
}

// error[Code]: message
//   --> file:line
//   components: a, b
//   hint: ...
std::string VerchainError::format() const {
    std::string out = std::string("error[") + code_name(code) + "]: " + message;

    if (!file.empty()) {
        out += "\n  --> " + file;
        if (line > 0) out += ":" + std::to_string(line);
    }

    if (!names.empty()) {
        out += "\n  components: ";
        for (size_t i = 0; i < names.size(); ++i) {
            if (i > 0) out += ", ";
            out += names[i];
        }
    }

    if (!hint.empty()) out += "\n  hint: " + hint;
    return out;
}

} // namespace verchain
