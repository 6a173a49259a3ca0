#pragma once
#include <cstdint>

namespace evonft {

static constexpr uint32_t MINUTE_SECONDS        = 60;
static constexpr uint32_t HOUR_SECONDS          = 3600;
static constexpr uint32_t DAY_SECONDS           = 24 * 3600;

static constexpr uint32_t MAX_MINT_BATCH        = 100;      // tokens per mint action
static constexpr uint32_t MAX_TRANSFER_BATCH    = 100;      // tokens per transfer action
static constexpr uint32_t MAX_URI_SIZE          = 256;
static constexpr uint32_t MAX_MEMO_SIZE         = 256;
static constexpr uint32_t MAX_EVOLVE_TIERS      = 32;

}
