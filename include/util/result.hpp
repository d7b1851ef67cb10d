#pragma once
#include <string>
#include <utility>

namespace filetar {

struct Result {
    bool ok{true};
    int err{0};
    std::string msg;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(int e, std::string m) {
        return {.ok = false, .err = e, .msg = std::move(m)};
    }

    // "<what> (ENOENT: No such file or directory)" carrying e as the code.
    static Result FromErrno(int e, const std::string& what);
};

// "ENOENT: No such file or directory"
std::string ErrnoText(int e);

// Symbolic errno name, nullptr for codes not listed.
const char* ErrnoName(int e);

} // namespace filetar
