#pragma once

#include <string>

namespace tnid {

struct TnidError {
    enum Code {
        InvalidLength,
        InvalidCharacter,
        MalformedString,
        MalformedUuid,
        UnknownVariant,
        WrongVariant,
        InvalidKeyLength,
        NameMismatch,
        FilterExhausted,
        InvalidArg,
        Config,
        IO
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    TnidError() = default;
    TnidError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    TnidError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    TnidError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace tnid
