#pragma once
#include <cstdint>
#include <string>

namespace evonft {

// <base><id>, or empty when no base is configured
inline std::string token_uri(const std::string& base, uint64_t id) {
    if (base.empty()) return std::string();
    return base + std::to_string(id);
}

// <base><evolution>/<id>, or empty when no base is configured
inline std::string token_uri(const std::string& base, uint64_t evolution, uint64_t id) {
    if (base.empty()) return std::string();
    return base + std::to_string(evolution) + "/" + std::to_string(id);
}

} // namespace evonft
