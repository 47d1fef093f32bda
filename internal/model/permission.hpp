#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace lieko::model {

// Ordered: each tier includes the ones below it.
enum class PermissionTier : std::uint8_t {
  kNone  = 0,
  kRead  = 1,
  kWrite = 2,
  kFull  = 3,
};

constexpr std::string_view ToString(PermissionTier tier) {
  switch (tier) {
    case PermissionTier::kRead:
      return "read";
    case PermissionTier::kWrite:
      return "write";
    case PermissionTier::kFull:
      return "full";
    case PermissionTier::kNone:
    default:
      return "none";
  }
}

constexpr std::optional<PermissionTier> ParsePermissionTier(std::string_view value) {
  if (value == "read") return PermissionTier::kRead;
  if (value == "write") return PermissionTier::kWrite;
  if (value == "full") return PermissionTier::kFull;
  return std::nullopt;
}

constexpr bool Covers(PermissionTier granted, PermissionTier required) {
  return static_cast<std::uint8_t>(granted) >= static_cast<std::uint8_t>(required);
}

} // namespace lieko::model
