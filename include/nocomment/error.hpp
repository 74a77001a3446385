#pragma once

#include <string>

namespace nocomment {

struct NocommentError {
    enum Code {
        IO,
        Parse,
        Json,
        Markdown,
        Version,
        Config,
        InvalidArg
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    NocommentError() = default;
    NocommentError(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    NocommentError(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    NocommentError(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace nocomment
