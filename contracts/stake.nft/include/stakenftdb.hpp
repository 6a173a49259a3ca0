#pragma once

#include <eosio/eosio.hpp>
#include <eosio/asset.hpp>
#include <eosio/singleton.hpp>
#include <eosio/system.hpp>
#include <eosio/time.hpp>

#include <evonft/consts.hpp>
#include <evonft/stake_ledger.hpp>
#include <evonft/accrual.hpp>
#include <evonft/evolution.hpp>

namespace evonft {

using namespace eosio;
using namespace std;

static constexpr eosio::name active_perm{"active"_n};

#define TBL struct [[eosio::table, eosio::contract("stake.nft")]]
#define NTBL(name) struct [[eosio::table(name), eosio::contract("stake.nft")]]

/**
 * Evolution strategy, replaceable by the admin
 */
struct evolve_conf_t {
    uint8_t             kind            = 0;            // see evolution_kind
    uint32_t            step_seconds    = 0;
    uint32_t            max_level       = 0;
    vector<uint32_t>    thresholds;

    evolution_strategy to_strategy() const {
        evolution_strategy s;
        s.kind          = (evolution_kind)kind;
        s.step_seconds  = step_seconds;
        s.max_level     = max_level;
        s.thresholds    = thresholds;
        return s;
    }

    EOSLIB_SERIALIZE( evolve_conf_t, (kind)(step_seconds)(max_level)(thresholds) )
};

/**
 * Global config: immutable after init, except evolve
 */
NTBL("global") global_t {
    bool                initialized             = false;
    name                admin;
    string              base_uri;                               // empty: no metadata
    asset               mint_price;                             // informational
    uint64_t            max_supply              = 0;            // 0: unlimited
    uint64_t            next_token_id           = 1;
    uint32_t            min_staking_seconds     = 0;
    uint32_t            auto_stake_on_mint      = 0;
    uint32_t            auto_stake_on_transfer  = 0;
    uint8_t             evolve_policy           = 0;            // see accrual_policy
    evolve_conf_t       evolve;

    stake_config stake_conf() const {
        stake_config c;
        c.min_staking_seconds       = min_staking_seconds;
        c.auto_stake_on_mint        = auto_stake_on_mint;
        c.auto_stake_on_transfer    = auto_stake_on_transfer;
        return c;
    }

    EOSLIB_SERIALIZE( global_t, (initialized)(admin)(base_uri)(mint_price)(max_supply)(next_token_id)
                                (min_staking_seconds)(auto_stake_on_mint)(auto_stake_on_transfer)
                                (evolve_policy)(evolve) )
};
typedef eosio::singleton< "global"_n, global_t > global_singleton;

//Scope: _self
TBL nft_t {
    uint64_t            id;                                     // PK
    name                owner;
    time_point_sec      minted_at;
    time_point_sec      held_since;                             // mint or last transfer
    bool                auto_stake_on_mint      = false;
    bool                auto_stake_on_transfer  = false;

    nft_t() {}
    nft_t(const uint64_t& i): id(i) {}

    uint64_t primary_key() const { return id; }
    uint128_t by_owner() const { return (uint128_t)owner.value << 64 | (uint128_t)id; }

    token_state to_state() const {
        token_state t;
        t.id                        = id;
        t.owner                     = owner.value;
        t.minted_at                 = minted_at.sec_since_epoch();
        t.held_since                = held_since.sec_since_epoch();
        t.auto_stake_on_mint        = auto_stake_on_mint;
        t.auto_stake_on_transfer    = auto_stake_on_transfer;
        return t;
    }

    void from_state(const token_state& t) {
        owner                       = name(t.owner);
        minted_at                   = time_point_sec(t.minted_at);
        held_since                  = time_point_sec(t.held_since);
        auto_stake_on_mint          = t.auto_stake_on_mint;
        auto_stake_on_transfer      = t.auto_stake_on_transfer;
    }

    typedef eosio::multi_index<"nfts"_n, nft_t,
        indexed_by<"byowner"_n, const_mem_fun<nft_t, uint128_t, &nft_t::by_owner> >
    > idx_t;

    EOSLIB_SERIALIZE( nft_t, (id)(owner)(minted_at)(held_since)(auto_stake_on_mint)(auto_stake_on_transfer) )
};

//Scope: _self
//Note: created on first stake, kept across transfers
TBL stake_t {
    uint64_t            token_id;                               // PK
    bool                is_staked               = false;
    bool                has_staked              = false;        // first_staked_at is valid
    time_point_sec      first_staked_at;
    time_point_sec      last_staked_at;
    uint32_t            accumulated             = 0;            // seconds, closed periods only

    stake_t() {}
    stake_t(const uint64_t& tid): token_id(tid) {}

    uint64_t primary_key() const { return token_id; }

    stake_record to_record() const {
        stake_record r;
        r.is_staked                 = is_staked;
        r.has_staked                = has_staked;
        r.first_staked_at           = first_staked_at.sec_since_epoch();
        r.last_staked_at            = last_staked_at.sec_since_epoch();
        r.accumulated               = accumulated;
        return r;
    }

    void from_record(const stake_record& r) {
        is_staked                   = r.is_staked;
        has_staked                  = r.has_staked;
        first_staked_at             = time_point_sec(r.first_staked_at);
        last_staked_at              = time_point_sec(r.last_staked_at);
        accumulated                 = r.accumulated;
    }

    typedef eosio::multi_index<"stakes"_n, stake_t> idx_t;

    EOSLIB_SERIALIZE( stake_t, (token_id)(is_staked)(has_staked)(first_staked_at)(last_staked_at)(accumulated) )
};

} // namespace evonft
