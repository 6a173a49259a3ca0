#pragma once

#include <eosio/asset.hpp>
#include <eosio/eosio.hpp>
#include <eosio/permission.hpp>
#include <eosio/action.hpp>

#include <evonft/errors.hpp>
#include <evonft/projection.hpp>
#include <evonft/utils.hpp>
#include "stakenftdb.hpp"

#define CHECKC(exp, code, msg) \
   { if (!(exp)) eosio::check(false, string("[[") + to_string((int)code) + string("]] ") + msg); }

namespace evonft {

using namespace eosio;
using namespace std;

namespace stake_event {
    static constexpr eosio::name stake      = "stake"_n;
    static constexpr eosio::name unstake    = "unstake"_n;
};

/**
 * Contract: stake.nft
 *   - NFT ledger (mint / transfer) with per-token staking time accounting
 *   - tokens are staked and unstaked by their owner; a staked token cannot move
 *   - optional auto-stake windows opened on mint and on transfer
 *   - staked duration drives an evolution level and the token URI
 */
class [[eosio::contract("stake.nft")]] stakenft : public contract {
public:
    using contract::contract;

    stakenft(name receiver, name code, datastream<const char*> ds)
    : contract(receiver, code, ds),
      _global(get_self(), get_self().value)
    {
        _gstate = _global.exists() ? _global.get() : global_t{};
    }

    /**
     * One-time initialization, the staking parameters are fixed afterwards
     * @param admin          admin account (mint, setevolve)
     * @param base_uri       metadata base, empty disables token URIs
     * @param mint_price     listed price per token
     * @param max_supply     0 means unlimited
     * @param min_staking_seconds     minimum manual stake before unstake
     * @param auto_stake_on_mint      auto-stake window after mint, 0 disables
     * @param auto_stake_on_transfer  auto-stake window after transfer, 0 disables
     * @param evolve_policy  accrual_policy feeding evolution and URIs
     */
    ACTION init(const name& admin,
                const string& base_uri,
                const asset& mint_price,
                const uint64_t& max_supply,
                const uint32_t& min_staking_seconds,
                const uint32_t& auto_stake_on_mint,
                const uint32_t& auto_stake_on_transfer,
                const uint8_t& evolve_policy);

    /**
     * Replace the evolution strategy
     * @param kind  see evolution_kind: 0 none, 1 linear, 2 tiered
     */
    ACTION setevolve(const uint8_t& kind,
                     const uint32_t& step_seconds,
                     const uint32_t& max_level,
                     const vector<uint32_t>& thresholds);

    ACTION mint(const name& to, const uint32_t& count);

    ACTION transfer(const name& from, const name& to, const vector<uint64_t>& token_ids, const string& memo);

    ACTION stake(const name& owner, const uint64_t& token_id);

    ACTION unstake(const name& owner, const uint64_t& token_id);

    ACTION stakelog(const name& owner, const uint64_t& token_id, const name& event,
                    const uint32_t& duration, const uint32_t& accumulated, const time_point_sec& at);

    // ========== read-only queries ==========
    [[eosio::action, eosio::read_only]] name ownerof(const uint64_t& token_id);
    [[eosio::action, eosio::read_only]] bool isstaked(const uint64_t& token_id);
    [[eosio::action, eosio::read_only]] bool canunstake(const uint64_t& token_id);
    [[eosio::action, eosio::read_only]] uint32_t stakedur(const uint64_t& token_id, const uint8_t& policy);
    [[eosio::action, eosio::read_only]] uint64_t evolution(const uint64_t& token_id);
    [[eosio::action, eosio::read_only]] string tokenuri(const uint64_t& token_id);

    using stakelog_action   = eosio::action_wrapper<"stakelog"_n, &stakenft::stakelog>;

private:
    void _check_initialized() const;
    stake_engine _engine() const { return stake_engine(_gstate.stake_conf()); }

    nft_t _get_nft(const uint64_t& token_id) const;
    stake_record _get_stake(const uint64_t& token_id) const;
    void _set_stake(const uint64_t& token_id, const stake_record& rec);

    uint64_t _evolution_of(const stake_record& rec, const uint32_t& now) const;

    void _log_stake(const name& owner, const uint64_t& token_id, const name& event,
                    const uint32_t& duration, const stake_record& rec, const uint32_t& now);

    static uint32_t _now();

private:
    global_singleton       _global;
    global_t               _gstate;
};

} // namespace evonft
