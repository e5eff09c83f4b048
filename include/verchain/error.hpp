#pragma once

#include <string>
#include <vector>

namespace verchain {

struct VerchainError {
    enum Code {
        IO,
        Parse,
        Manifest,
        InvalidArg,
        NotFound,
        Duplicate,
        UnknownDependency,
        VersionMismatch,
        Cycle
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;
    // Components the error refers to: {requirer, dependency} for
    // UnknownDependency and VersionMismatch, the unresolved set for Cycle.
    std::vector<std::string> names;

    VerchainError() = default;
    VerchainError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    VerchainError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    VerchainError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    VerchainError& with_names(std::vector<std::string> n) {
        names = std::move(n);
        return *this;
    }

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace verchain
