#include "stakenft.hpp"
#include <stakenft_version.hpp>

namespace evonft {

#define CHECKE(exp) \
   { auto _res = (exp); CHECKC(_res == err::NONE, _res, err_msg(_res)); }

uint32_t stakenft::_now() {
    return current_time_point().sec_since_epoch();
}

void stakenft::_check_initialized() const {
    CHECKC(_gstate.initialized, err::NOT_INITIALIZED, "contract not initialized");
}

nft_t stakenft::_get_nft(const uint64_t& token_id) const {
    nft_t::idx_t nfts(get_self(), get_self().value);
    auto itr = nfts.find(token_id);
    CHECKC(itr != nfts.end(), err::TOKEN_NOT_FOUND, "token does not exist: " + std::to_string(token_id));
    return *itr;
}

stake_record stakenft::_get_stake(const uint64_t& token_id) const {
    stake_t::idx_t stakes(get_self(), get_self().value);
    auto itr = stakes.find(token_id);
    if (itr == stakes.end()) return stake_record{};
    return itr->to_record();
}

void stakenft::_set_stake(const uint64_t& token_id, const stake_record& rec) {
    stake_t::idx_t stakes(get_self(), get_self().value);
    auto itr = stakes.find(token_id);
    if (itr == stakes.end()) {
        stakes.emplace(get_self(), [&](auto& s) {
            s.token_id = token_id;
            s.from_record(rec);
        });
    } else {
        stakes.modify(itr, same_payer, [&](auto& s) {
            s.from_record(rec);
        });
    }
}

uint64_t stakenft::_evolution_of(const stake_record& rec, const uint32_t& now) const {
    return evolution_level(rec, (accrual_policy)_gstate.evolve_policy, _gstate.evolve.to_strategy(), now);
}

void stakenft::_log_stake(const name& owner, const uint64_t& token_id, const name& event,
                          const uint32_t& duration, const stake_record& rec, const uint32_t& now) {
    stakelog_action act{ get_self(), { {get_self(), active_perm} } };
    act.send(owner, token_id, event, duration, rec.accumulated, time_point_sec(now));
}

void stakenft::init(const name& admin,
                    const string& base_uri,
                    const asset& mint_price,
                    const uint64_t& max_supply,
                    const uint32_t& min_staking_seconds,
                    const uint32_t& auto_stake_on_mint,
                    const uint32_t& auto_stake_on_transfer,
                    const uint8_t& evolve_policy) {
    require_auth(get_self());
    CHECKC(!_gstate.initialized,                err::ALREADY_INITIALIZED, "contract already initialized");
    CHECKC(is_account(admin),                   err::ACCOUNT_INVALID, "invalid admin account");
    CHECKC(base_uri.size() <= MAX_URI_SIZE,     err::PARAM_ERROR, "base uri too long");
    CHECKC(mint_price.is_valid(),               err::INVALID_FORMAT, "invalid mint price");
    CHECKC(mint_price.amount >= 0,              err::PARAM_ERROR, "mint price must not be negative");
    CHECKC(is_valid_policy(evolve_policy),      err::PARAM_ERROR, "invalid evolve policy");

    _gstate.initialized             = true;
    _gstate.admin                   = admin;
    _gstate.base_uri                = base_uri;
    _gstate.mint_price              = mint_price;
    _gstate.max_supply              = max_supply;
    _gstate.next_token_id           = 1;
    _gstate.min_staking_seconds     = min_staking_seconds;
    _gstate.auto_stake_on_mint      = auto_stake_on_mint;
    _gstate.auto_stake_on_transfer  = auto_stake_on_transfer;
    _gstate.evolve_policy           = evolve_policy;
    _gstate.evolve                  = evolve_conf_t{};
    _global.set(_gstate, get_self());
}

void stakenft::setevolve(const uint8_t& kind,
                         const uint32_t& step_seconds,
                         const uint32_t& max_level,
                         const vector<uint32_t>& thresholds) {
    _check_initialized();
    require_auth(_gstate.admin);
    CHECKC(is_valid_evolution_kind(kind), err::PARAM_ERROR, "invalid evolution kind");

    evolve_conf_t conf;
    conf.kind           = kind;
    conf.step_seconds   = step_seconds;
    conf.max_level      = max_level;
    conf.thresholds     = thresholds;
    CHECKE(conf.to_strategy().validate());

    _gstate.evolve = conf;
    _global.set(_gstate, get_self());
}

void stakenft::mint(const name& to, const uint32_t& count) {
    _check_initialized();
    require_auth(_gstate.admin);
    CHECKC(is_account(to),                      err::ACCOUNT_INVALID, "invalid receiver account");
    CHECKC(count > 0,                           err::NOT_POSITIVE, "mint count must be positive");
    CHECKC(count <= MAX_MINT_BATCH,             err::PARAM_ERROR, "mint count exceeds batch limit");

    uint64_t minted = _gstate.next_token_id - 1;
    CHECKC(_gstate.max_supply == 0 || minted + count <= _gstate.max_supply,
           err::SUPPLY_EXCEEDED, "max supply exceeded");

    auto now    = _now();
    auto engine = _engine();
    nft_t::idx_t nfts(get_self(), get_self().value);
    for (uint32_t i = 0; i < count; i++) {
        auto tok = engine.mint_token(_gstate.next_token_id++, to.value, now);
        nfts.emplace(get_self(), [&](auto& n) {
            n.id = tok.id;
            n.from_state(tok);
        });
    }
    _global.set(_gstate, get_self());

    TRACE_L("mint: ", to, " count: ", count, " next id: ", _gstate.next_token_id);
    require_recipient(to);
}

void stakenft::transfer(const name& from, const name& to, const vector<uint64_t>& token_ids, const string& memo) {
    _check_initialized();
    require_auth(from);
    CHECKC(from != to,                                  err::ACCOUNT_INVALID, "cannot transfer to self");
    CHECKC(is_account(to),                              err::ACCOUNT_INVALID, "invalid receiver account");
    CHECKC(!token_ids.empty(),                          err::PARAM_ERROR, "empty token list");
    CHECKC(token_ids.size() <= MAX_TRANSFER_BATCH,      err::PARAM_ERROR, "token list exceeds batch limit");
    CHECKC(!has_duplicates(token_ids),                  err::DUPLICATE_TOKEN, "duplicate token id");
    CHECKC(memo.size() <= MAX_MEMO_SIZE,                err::PARAM_ERROR, "memo has more than 256 bytes");

    auto now    = _now();
    auto engine = _engine();

    vector<token_state> moved;
    vector<stake_record> recs;
    moved.reserve(token_ids.size());
    recs.reserve(token_ids.size());
    for (auto& id : token_ids) {
        moved.push_back(_get_nft(id).to_state());
        recs.push_back(_get_stake(id));
    }
    // no row is written unless every token can move
    CHECKE(engine.transfer_range(moved, recs, from.value, to.value, now));

    nft_t::idx_t nfts(get_self(), get_self().value);
    for (auto& tok : moved) {
        auto itr = nfts.find(tok.id);
        nfts.modify(itr, same_payer, [&](auto& n) {
            n.from_state(tok);
        });
    }

    require_recipient(from);
    require_recipient(to);
}

void stakenft::stake(const name& owner, const uint64_t& token_id) {
    _check_initialized();
    require_auth(owner);

    auto now = _now();
    auto tok = _get_nft(token_id).to_state();
    auto rec = _get_stake(token_id);

    CHECKE(_engine().stake(rec, tok, owner.value, now));
    _set_stake(token_id, rec);

    TRACE_L("stake: ", token_id, " owner: ", owner, " at: ", now);
    _log_stake(owner, token_id, stake_event::stake, 0, rec, now);
}

void stakenft::unstake(const name& owner, const uint64_t& token_id) {
    _check_initialized();
    require_auth(owner);

    auto now = _now();
    auto tok = _get_nft(token_id).to_state();
    auto rec = _get_stake(token_id);
    auto period = elapsed(rec.last_staked_at, now);

    CHECKE(_engine().unstake(rec, tok, owner.value, now));
    _set_stake(token_id, rec);

    TRACE_L("unstake: ", token_id, " owner: ", owner, " period: ", period, " accumulated: ", rec.accumulated);
    _log_stake(owner, token_id, stake_event::unstake, period, rec, now);
}

void stakenft::stakelog(const name& owner, const uint64_t& token_id, const name& event,
                        const uint32_t& duration, const uint32_t& accumulated, const time_point_sec& at) {
    require_auth(get_self());
    require_recipient(owner);
}

name stakenft::ownerof(const uint64_t& token_id) {
    _check_initialized();
    return _get_nft(token_id).owner;
}

bool stakenft::isstaked(const uint64_t& token_id) {
    _check_initialized();
    auto tok = _get_nft(token_id).to_state();
    return _engine().is_staked(_get_stake(token_id), tok, _now());
}

bool stakenft::canunstake(const uint64_t& token_id) {
    _check_initialized();
    _get_nft(token_id);
    return _engine().can_unstake(_get_stake(token_id), _now());
}

uint32_t stakenft::stakedur(const uint64_t& token_id, const uint8_t& policy) {
    _check_initialized();
    CHECKC(is_valid_policy(policy), err::PARAM_ERROR, "invalid accrual policy");
    _get_nft(token_id);
    return stake_duration(_get_stake(token_id), (accrual_policy)policy, _now());
}

uint64_t stakenft::evolution(const uint64_t& token_id) {
    _check_initialized();
    _get_nft(token_id);
    return _evolution_of(_get_stake(token_id), _now());
}

string stakenft::tokenuri(const uint64_t& token_id) {
    _check_initialized();
    _get_nft(token_id);
    return token_uri_of(_gstate.base_uri, _get_stake(token_id), (accrual_policy)_gstate.evolve_policy,
                        _gstate.evolve.to_strategy(), token_id, _now());
}

} // namespace evonft
