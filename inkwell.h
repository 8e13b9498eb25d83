#pragma once

// ============================================================================
// Inkwell Core Header
// ============================================================================
// Common includes for every .cpp file in the memory core:
// - Global debug flag
// - Logging facilities
// - Standard library headers used throughout the codebase
// ============================================================================

#include <string>
#include <iostream>
#include <vector>
#include <memory>
#include <chrono>

#include "logger.h"
#include "debug.h"

// ============================================================================
// Common Utilities
// ============================================================================

namespace inkwell {
    constexpr const char* VERSION = "0.3.0";

    /// @brief Shorten text for log lines and context previews
    inline std::string preview(const std::string& text, size_t max_len = 60) {
        std::string flat = text;
        for (char& c : flat) {
            if (c == '\n' || c == '\r' || c == '\t') c = ' ';
        }
        if (flat.length() <= max_len) {
            return flat;
        }
        return flat.substr(0, max_len) + "...";
    }
}
