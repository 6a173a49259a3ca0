#pragma once
#include <cstdint>
#include "evonft/stake_ledger.hpp"

namespace evonft {

enum class accrual_policy: uint8_t {
    NONE        = 0,    // feature disabled, always 0
    CURRENT     = 1,    // since the latest stake event
    ALIVE       = 2,    // since the first ever stake
    CUMULATIVE  = 3     // closed periods plus the open one
};

inline bool is_valid_policy(uint8_t raw) {
    return raw <= (uint8_t)accrual_policy::CUMULATIVE;
}

/**
 * Staked duration of a record under the given policy.
 *
 * A never-staked record gives 0. CUMULATIVE adds the open period only while
 * the token is manually staked, so an unstaked token reports exactly its
 * closed periods.
 */
inline uint32_t stake_duration(const stake_record& rec, accrual_policy policy, uint32_t now) {
    switch (policy) {
        case accrual_policy::CURRENT:
            if (!rec.has_staked) return 0;
            return elapsed(rec.last_staked_at, now);
        case accrual_policy::ALIVE:
            if (!rec.has_staked) return 0;
            return elapsed(rec.first_staked_at, now);
        case accrual_policy::CUMULATIVE: {
            uint64_t total = rec.accumulated;
            if (rec.is_staked)
                total += elapsed(rec.last_staked_at, now);
            return total > UINT32_MAX ? UINT32_MAX : (uint32_t)total;
        }
        case accrual_policy::NONE:
            break;
    }
    return 0;
}

} // namespace evonft
