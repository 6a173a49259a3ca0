#pragma once
#include <cstdint>
#include <vector>
#include "evonft/errors.hpp"

namespace evonft {

/**
 * Staking parameters, fixed once the contract is initialized.
 * Every duration is in seconds, zero disables the behaviour.
 */
struct stake_config {
    uint32_t    min_staking_seconds     = 0;    // minimum manual stake before unstake
    uint32_t    auto_stake_on_mint      = 0;    // auto-stake window opened by mint
    uint32_t    auto_stake_on_transfer  = 0;    // auto-stake window opened by transfer
};

/**
 * Per-token staking record. A default record is a token that was never staked.
 * `accumulated` only covers closed periods, the open one is
 * `now - last_staked_at` while `is_staked`.
 */
struct stake_record {
    bool        is_staked               = false;
    bool        has_staked              = false;// first_staked_at is set
    uint32_t    first_staked_at         = 0;
    uint32_t    last_staked_at          = 0;    // start of the latest manual period
    uint32_t    accumulated             = 0;    // sum of closed manual periods
};

/**
 * Ownership-ledger slot of a token, the part the staking engine reads.
 */
struct token_state {
    uint64_t    id                      = 0;
    uint64_t    owner                   = 0;    // raw account name value
    uint32_t    minted_at               = 0;
    uint32_t    held_since              = 0;    // mint or last transfer
    bool        auto_stake_on_mint      = false;// written once at mint
    bool        auto_stake_on_transfer  = false;// set by the last transfer
};

inline uint32_t elapsed(uint32_t since, uint32_t now) {
    return now > since ? now - since : 0;
}

inline bool window_covers(uint32_t opened_at, uint32_t window, uint32_t now) {
    return (uint64_t)opened_at + window > now;
}

inline uint32_t saturating_add(uint32_t a, uint32_t b) {
    return a > UINT32_MAX - b ? UINT32_MAX : a + b;
}

/**
 * Stake/unstake state machine. Validates first and only then touches the
 * record, so a failed call leaves everything as it was.
 */
class stake_engine {
public:
    explicit stake_engine(const stake_config& conf): _conf(conf) {}

    const stake_config& config() const { return _conf; }

    token_state mint_token(uint64_t id, uint64_t owner, uint32_t now) const {
        token_state tok;
        tok.id                      = id;
        tok.owner                   = owner;
        tok.minted_at               = now;
        tok.held_since              = now;
        tok.auto_stake_on_mint      = _conf.auto_stake_on_mint > 0;
        tok.auto_stake_on_transfer  = false;
        return tok;
    }

    bool in_auto_window(const token_state& tok, uint32_t now) const {
        if (tok.auto_stake_on_mint && window_covers(tok.minted_at, _conf.auto_stake_on_mint, now))
            return true;
        if (tok.auto_stake_on_transfer && window_covers(tok.held_since, _conf.auto_stake_on_transfer, now))
            return true;
        return false;
    }

    bool is_staked(const stake_record& rec, const token_state& tok, uint32_t now) const {
        return rec.is_staked || in_auto_window(tok, now);
    }

    // Automatic staking never makes a token unstakeable, it just expires.
    bool can_unstake(const stake_record& rec, uint32_t now) const {
        return rec.is_staked && elapsed(rec.last_staked_at, now) >= _conf.min_staking_seconds;
    }

    err stake(stake_record& rec, const token_state& tok, uint64_t caller, uint32_t now) const {
        if (tok.owner != caller)            return err::NOT_OWNER;
        if (is_staked(rec, tok, now))       return err::ALREADY_STAKED;

        if (!rec.has_staked) {
            rec.has_staked      = true;
            rec.first_staked_at = now;
        }
        rec.last_staked_at  = now;
        rec.is_staked       = true;
        return err::NONE;
    }

    err unstake(stake_record& rec, const token_state& tok, uint64_t caller, uint32_t now) const {
        if (tok.owner != caller)            return err::NOT_OWNER;
        if (!can_unstake(rec, now))         return err::NOT_UNSTAKEABLE;

        rec.accumulated     = saturating_add(rec.accumulated, elapsed(rec.last_staked_at, now));
        rec.is_staked       = false;
        return err::NONE;
    }

    err check_transferable(const stake_record& rec, const token_state& tok, uint64_t from, uint32_t now) const {
        if (tok.owner != from)              return err::NOT_OWNER;
        if (is_staked(rec, tok, now))       return err::TOKEN_STAKED;
        return err::NONE;
    }

    // Moves ownership only; the stake record carries over unchanged.
    err transfer(token_state& tok, const stake_record& rec, uint64_t from, uint64_t to, uint32_t now) const {
        auto res = check_transferable(rec, tok, from, now);
        if (res != err::NONE) return res;

        tok.owner                   = to;
        tok.held_since              = now;
        tok.auto_stake_on_transfer  = _conf.auto_stake_on_transfer > 0;
        return err::NONE;
    }

    /**
     * Moves a range of tokens as one unit: every token is checked first and
     * the first failure is returned with no token touched.
     */
    err transfer_range(std::vector<token_state>& toks, const std::vector<stake_record>& recs,
                       uint64_t from, uint64_t to, uint32_t now) const {
        if (toks.empty() || toks.size() != recs.size()) return err::PARAM_ERROR;

        for (size_t i = 0; i < toks.size(); i++) {
            auto res = check_transferable(recs[i], toks[i], from, now);
            if (res != err::NONE) return res;
        }
        for (size_t i = 0; i < toks.size(); i++) {
            auto res = transfer(toks[i], recs[i], from, to, now);
            if (res != err::NONE) return res;
        }
        return err::NONE;
    }

private:
    stake_config _conf;
};

} // namespace evonft
