#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), CAMPUSSIM_ASSERT is never compiled out.
 * Use for internal invariants that indicate bugs if violated, never for
 * validating operation arguments (those are reported as FAILURE results).
 *
 * Example:
 *   CAMPUSSIM_ASSERT(index_.size() == locations_.size(),
 *                    "Location index must mirror location list");
 */
#define CAMPUSSIM_ASSERT(condition, message)                                                \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
