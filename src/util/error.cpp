#include <phind/error.hpp>

namespace phind {

const char* PhindError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case NotFound:   return "NotFound";
        case Permission: return "Permission";
        case Parse:      return "Parse";
        case Config:     return "Config";
        case Pattern:    return "Pattern";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string PhindError::format() const {
    std::string result = "error[";
    result += code_name(code);
    result += "]: ";
    result += message;

    if (!hint.empty()) {
        result += "\n  hint: ";
        result += hint;
    }

    if (!file.empty()) {
        result += "\n  --> ";
        result += file;
        if (line > 0) {
            result += ":";
            result += std::to_string(line);
        }
    }

    return result;
}

} // namespace phind
