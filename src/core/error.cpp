// Copyright (c) 2025-2026 The Sandguard Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/error.h"

#include <sstream>

namespace core {

// ---------------------------------------------------------------------------
// error_code_name: human-readable label for every ErrorCode variant
// ---------------------------------------------------------------------------
std::string_view error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::NONE:             return "NONE";

        // Parsing
        case ErrorCode::PARSE_OVERFLOW:   return "PARSE_OVERFLOW";
        case ErrorCode::PARSE_BAD_FORMAT: return "PARSE_BAD_FORMAT";

        // Pool configuration
        case ErrorCode::CONFIG_INVALID_FEE_RANGE:
            return "CONFIG_INVALID_FEE_RANGE";
        case ErrorCode::CONFIG_INVALID_THRESHOLD_ORDER:
            return "CONFIG_INVALID_THRESHOLD_ORDER";
        case ErrorCode::CONFIG_FEE_OUT_OF_BOUNDS:
            return "CONFIG_FEE_OUT_OF_BOUNDS";

        // I/O
        case ErrorCode::IO_ERROR:         return "IO_ERROR";
    }

    return "UNKNOWN";
}

// ---------------------------------------------------------------------------
// Error::format: build a diagnostic string including source location
// ---------------------------------------------------------------------------
std::string Error::format() const {
    if (code_ == ErrorCode::NONE) {
        return "no error";
    }

    std::ostringstream oss;
    oss << error_code_name(code_)
        << '(' << static_cast<uint16_t>(code_) << ')';

    if (!message_.empty()) {
        oss << ": " << message_;
    }

    const char* file = location_.file_name();
    if (file && file[0] != '\0') {
        oss << " [" << file
            << ':' << location_.line()
            << ':' << location_.column() << ']';
    }

    return oss.str();
}

} // namespace core
