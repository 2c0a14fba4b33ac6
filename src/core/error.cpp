// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:                 return "NONE";
        case ErrorCode::PARSE_ERROR:          return "PARSE_ERROR";
        case ErrorCode::PARSE_BAD_FORMAT:     return "PARSE_BAD_FORMAT";
        case ErrorCode::VALIDATION_ERROR:     return "VALIDATION_ERROR";
        case ErrorCode::VALIDATION_RANGE:     return "VALIDATION_RANGE";
        case ErrorCode::STORAGE_ERROR:        return "STORAGE_ERROR";
        case ErrorCode::STORAGE_NOT_FOUND:    return "STORAGE_NOT_FOUND";
        case ErrorCode::STORAGE_CORRUPT:      return "STORAGE_CORRUPT";
        case ErrorCode::STORAGE_OPEN:         return "STORAGE_OPEN";
        case ErrorCode::STORAGE_READ:         return "STORAGE_READ";
        case ErrorCode::STORAGE_WRITE:        return "STORAGE_WRITE";
        case ErrorCode::STORAGE_LOCKED:       return "STORAGE_LOCKED";
        case ErrorCode::ESTIMATE_UNAVAILABLE: return "ESTIMATE_UNAVAILABLE";
        case ErrorCode::INTERNAL_ERROR:       return "INTERNAL_ERROR";
    }
    return "UNKNOWN";
}

Error Error::with_context(std::string_view what) const {
    std::string msg(what);
    if (!message_.empty()) {
        msg += ": ";
        msg += message_;
    }
    return Error(code_, std::move(msg), location_);
}

std::string Error::format() const {
    if (is_ok()) return "no error";

    std::ostringstream oss;
    oss << error_code_name(code_) << '(' << static_cast<uint16_t>(code_) << ')';
    if (!message_.empty()) {
        oss << ": " << message_;
    }
    if (const char* file = location_.file_name(); file && file[0] != '\0') {
        oss << " [" << file << ':' << location_.line() << ']';
    }
    return oss.str();
}

} // namespace core
