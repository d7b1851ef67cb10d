#include "util/result.hpp"

#include <cerrno>
#include <cstring>

namespace filetar {

const char* ErrnoName(int e) {
    switch (e) {
        case EPERM:     return "EPERM";
        case ENOENT:    return "ENOENT";
        case EIO:       return "EIO";
        case EBADF:     return "EBADF";
        case ENOMEM:    return "ENOMEM";
        case EACCES:    return "EACCES";
        case EEXIST:    return "EEXIST";
        case ENOTDIR:   return "ENOTDIR";
        case EISDIR:    return "EISDIR";
        case EINVAL:    return "EINVAL";
        case ENOSPC:    return "ENOSPC";
        case EROFS:     return "EROFS";
        case ELOOP:     return "ELOOP";
        case ENAMETOOLONG: return "ENAMETOOLONG";
        case EALREADY:  return "EALREADY";
        case ECANCELED: return "ECANCELED";
        case EFBIG:     return "EFBIG";
        default:        return nullptr;
    }
}

std::string ErrnoText(int e) {
    const char* name = ErrnoName(e);
    std::string out = name ? std::string(name) : ("E" + std::to_string(e));
    out += ": ";
    out += std::strerror(e);
    return out;
}

Result Result::FromErrno(int e, const std::string& what) {
    return Fail(e, what + " (" + ErrnoText(e) + ")");
}

} // namespace filetar
