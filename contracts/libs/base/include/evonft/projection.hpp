#pragma once
#include <cstdint>
#include <string>
#include "evonft/accrual.hpp"
#include "evonft/evolution.hpp"
#include "evonft/token_uri.hpp"

namespace evonft {

// evolution level of a token: its staked duration under `policy`, mapped by `strategy`
inline uint64_t evolution_level(const stake_record& rec, accrual_policy policy,
                                const evolution_strategy& strategy, uint32_t now) {
    return strategy.compute(stake_duration(rec, policy, now));
}

/**
 * Token URI as the contract serves it. With the NONE policy tokens do not
 * evolve and the URI is `<base><id>`, otherwise `<base><level>/<id>`.
 */
inline std::string token_uri_of(const std::string& base, const stake_record& rec, accrual_policy policy,
                                const evolution_strategy& strategy, uint64_t id, uint32_t now) {
    if (policy == accrual_policy::NONE)
        return token_uri(base, id);

    return token_uri(base, evolution_level(rec, policy, strategy, now), id);
}

} // namespace evonft
