#pragma once

#include <algorithm>
#include <vector>
#include <eosio/eosio.hpp>

#ifdef EVONFT_TRACE
    #define TRACE(...) eosio::print(__VA_ARGS__)
#else
    #define TRACE(...)
#endif

#define TRACE_L(...) TRACE(__VA_ARGS__, "\n")

namespace evonft {

inline bool has_duplicates(std::vector<uint64_t> ids) {
    std::sort(ids.begin(), ids.end());
    return std::adjacent_find(ids.begin(), ids.end()) != ids.end();
}

}
