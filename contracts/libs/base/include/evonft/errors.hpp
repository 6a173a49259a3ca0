#pragma once
#include <cstdint>

namespace evonft {

enum class err: uint8_t {
   NONE                  = 0,
   INVALID_FORMAT        = 1,
   PARAM_ERROR           = 2,
   NOT_POSITIVE          = 3,
   ACCOUNT_INVALID       = 4,
   NO_AUTH               = 5,
   NOT_INITIALIZED       = 6,
   ALREADY_INITIALIZED   = 7,
   TOKEN_NOT_FOUND       = 8,
   NOT_OWNER             = 9,
   ALREADY_STAKED        = 10,
   NOT_UNSTAKEABLE       = 11,
   TOKEN_STAKED          = 12,
   SUPPLY_EXCEEDED       = 13,
   DUPLICATE_TOKEN       = 14
};

inline const char* err_msg(err code) {
    switch (code) {
        case err::NONE:                 return "ok";
        case err::INVALID_FORMAT:       return "invalid format";
        case err::PARAM_ERROR:          return "invalid parameter";
        case err::NOT_POSITIVE:         return "must be positive";
        case err::ACCOUNT_INVALID:      return "account invalid";
        case err::NO_AUTH:              return "missing required auth";
        case err::NOT_INITIALIZED:      return "contract not initialized";
        case err::ALREADY_INITIALIZED:  return "contract already initialized";
        case err::TOKEN_NOT_FOUND:      return "token does not exist";
        case err::NOT_OWNER:            return "caller is not the token owner";
        case err::ALREADY_STAKED:       return "token already staked";
        case err::NOT_UNSTAKEABLE:      return "token not unstakeable";
        case err::TOKEN_STAKED:         return "token is staked";
        case err::SUPPLY_EXCEEDED:      return "max supply exceeded";
        case err::DUPLICATE_TOKEN:      return "duplicate token id";
    }
    return "unknown error";
}

} // namespace evonft
