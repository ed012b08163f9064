#pragma once

#include <string>

namespace locus {

struct LocusError {
    enum Code {
        IO,
        Parse,
        Config,
        NotFound,
        Forbidden,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    LocusError() = default;
    LocusError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    LocusError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace locus
