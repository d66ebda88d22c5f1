#pragma once

#include <courier/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: mint policy.
// Bridge workflow: who may originate a fresh cross-chain mint request.
namespace courier::schema {

enum class mint_policy : uint8_t {
  open = 0,
  owner_only = 1,
};

inline constexpr auto kMintPolicyMappings = std::array{
    std::pair<std::string_view, mint_policy>{"open", mint_policy::open},
    std::pair<std::string_view, mint_policy>{"owner_only",
                                             mint_policy::owner_only},
};

template <>
inline std::optional<mint_policy> try_from_string<mint_policy>(
    const std::string_view value) {
  return from_string(value, kMintPolicyMappings);
}

inline constexpr std::string_view to_string(const mint_policy value) {
  return to_string(value, kMintPolicyMappings).value_or("unknown");
}

}  // namespace courier::schema
