#pragma once

#include <string>

namespace uuid25 {

struct Uuid25Error {
    enum Code {
        Parse,
        Length,
        Config,
        IO
    };

    Code code;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    Uuid25Error() = default;
    Uuid25Error(Code c, std::string msg)
        : code(c), message(std::move(msg)) {}
    Uuid25Error(Code c, std::string msg, std::string h)
        : code(c), message(std::move(msg)), hint(std::move(h)) {}
    Uuid25Error(Code c, std::string msg, std::string h, std::string f, int l)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // Fixed-message errors. Parse errors deliberately carry no position or
    // format hint.
    static Uuid25Error parse_error();
    static Uuid25Error length_error();

    std::string format() const;
    static const char* code_name(Code c);
};

} // namespace uuid25
