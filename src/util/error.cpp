#include <nocomment/error.hpp>

namespace nocomment {

const char* NocommentError::code_name(Code c) {
    switch (c) {
        case IO:         return "IO";
        case Parse:      return "Parse";
        case Json:       return "Json";
        case Markdown:   return "Markdown";
        case Version:    return "Version";
        case Config:     return "Config";
        case InvalidArg: return "InvalidArg";
    }
    return "Unknown";
}

std::string NocommentError::format() const {
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

} // namespace nocomment
