#pragma once

#include "spdlog/spdlog.h"
#include <cstdlib>

/**
 * Runtime assertion that works in both debug and release builds.
 *
 * Unlike standard assert(), AGENTEVO_ASSERT is never compiled out.
 * Use for internal invariants that indicate bugs if violated, never for bad
 * host input (that is reported through Result).
 *
 * Example:
 *   AGENTEVO_ASSERT(!population.empty(), "Tournament needs a non-empty population");
 */
#define AGENTEVO_ASSERT(condition, message)                                                 \
    do {                                                                                    \
        if (!(condition)) {                                                                 \
            spdlog::critical("ASSERTION FAILED: {} at {}:{}", message, __FILE__, __LINE__); \
            spdlog::critical("  Condition: {}", #condition);                                \
            std::abort();                                                                   \
        }                                                                                   \
    } while (0)
