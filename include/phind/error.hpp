#pragma once

#include <string>

namespace phind {

struct PhindError {
    enum Code {
        IO,
        NotFound,
        Permission,
        Parse,
        Config,
        Pattern,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PhindError() = default;
    PhindError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    PhindError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    PhindError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace phind
