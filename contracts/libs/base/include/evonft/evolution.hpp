#pragma once
#include <algorithm>
#include <cstdint>
#include <vector>
#include "evonft/consts.hpp"
#include "evonft/errors.hpp"

namespace evonft {

enum class evolution_kind: uint8_t {
    NONE    = 0,    // always level 0
    LINEAR  = 1,    // one level per step_seconds, capped at max_level
    TIERED  = 2     // one level per threshold reached
};

/**
 * Maps a staked duration to an evolution level. Swappable at runtime by the
 * contract admin, evaluated on every read.
 */
struct evolution_strategy {
    evolution_kind          kind            = evolution_kind::NONE;
    uint32_t                step_seconds    = 0;
    uint32_t                max_level       = 0;    // 0: uncapped
    std::vector<uint32_t>   thresholds;             // strictly ascending seconds

    err validate() const {
        switch (kind) {
            case evolution_kind::NONE:
                return err::NONE;
            case evolution_kind::LINEAR:
                return step_seconds > 0 ? err::NONE : err::PARAM_ERROR;
            case evolution_kind::TIERED:
                if (thresholds.empty() || thresholds.size() > MAX_EVOLVE_TIERS)
                    return err::PARAM_ERROR;
                for (size_t i = 1; i < thresholds.size(); i++) {
                    if (thresholds[i] <= thresholds[i - 1]) return err::PARAM_ERROR;
                }
                return err::NONE;
        }
        return err::PARAM_ERROR;
    }

    uint64_t compute(uint32_t duration) const {
        switch (kind) {
            case evolution_kind::LINEAR: {
                if (step_seconds == 0) return 0;
                uint64_t level = duration / step_seconds;
                return max_level > 0 ? std::min<uint64_t>(level, max_level) : level;
            }
            case evolution_kind::TIERED:
                return std::upper_bound(thresholds.begin(), thresholds.end(), duration) - thresholds.begin();
            case evolution_kind::NONE:
                break;
        }
        return 0;
    }
};

inline bool is_valid_evolution_kind(uint8_t raw) {
    return raw <= (uint8_t)evolution_kind::TIERED;
}

} // namespace evonft
