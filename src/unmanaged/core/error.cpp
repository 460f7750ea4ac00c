/**
 * @file error.cpp
 * @brief Names and formatting for Errc / Error.
 */
#include "unmanaged/core/error.hpp"

#include <cstdio>

namespace unmanaged {

std::string_view to_string(Errc code) noexcept {
    switch (code) {
        case Errc::NotLive:            return "NotLive";
        case Errc::AlreadyDisposed:    return "AlreadyDisposed";
        case Errc::DoubleRegistration: return "DoubleRegistration";
        case Errc::OutOfBounds:        return "OutOfBounds";
        case Errc::Misaligned:         return "Misaligned";
        case Errc::TypeMismatch:       return "TypeMismatch";
        case Errc::DuplicateKey:       return "DuplicateKey";
        case Errc::KeyNotFound:        return "KeyNotFound";
        case Errc::ZeroCapacity:       return "ZeroCapacity";
        case Errc::AllocationFailed:   return "AllocationFailed";
        case Errc::TypeTableFull:      return "TypeTableFull";
    }
    return "Unknown";
}

std::string format_site(const Site& site) {
    const char* file = site.file_name();
    if (file == nullptr || *file == '\0') return {};
    std::string out(file);
    out += ':';
    out += std::to_string(site.line());
    const char* fn = site.function_name();
    if (fn != nullptr && *fn != '\0') {
        out += " (";
        out += fn;
        out += ')';
    }
    return out;
}

std::string describe(const Error& e) {
    char addr[32];
    std::snprintf(addr, sizeof(addr), "0x%llx", static_cast<unsigned long long>(e.address));

    std::string out(to_string(e.code));
    if (e.address != 0) {
        out += " at ";
        out += addr;
    }
    const std::string where = format_site(e.site);
    if (!where.empty()) {
        switch (e.code) {
            case Errc::AlreadyDisposed:    out += ", disposed at "; break;
            case Errc::DoubleRegistration: out += ", first registered at "; break;
            default:                       out += ", site "; break;
        }
        out += where;
    }
    return out;
}

} // namespace unmanaged
