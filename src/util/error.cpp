#include <tnid/error.hpp>

namespace tnid {

const char* TnidError::code_name(Code c) {
    switch (c) {
        case InvalidLength:    return "InvalidLength";
        case InvalidCharacter: return "InvalidCharacter";
        case MalformedString:  return "MalformedString";
        case MalformedUuid:    return "MalformedUuid";
        case UnknownVariant:   return "UnknownVariant";
        case WrongVariant:     return "WrongVariant";
        case InvalidKeyLength: return "InvalidKeyLength";
        case NameMismatch:     return "NameMismatch";
        case FilterExhausted:  return "FilterExhausted";
        case InvalidArg:       return "InvalidArg";
        case Config:           return "Config";
        case IO:               return "IO";
    }
    return "Unknown";
}

std::string TnidError::format() const {
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

} // namespace tnid
