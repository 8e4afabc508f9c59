#pragma once

#include "toolshield/common/result.hpp"

#include <string>
#include <vector>

namespace toolshield::trust {

/// Ordered from most to least trustworthy; Untrusted is the floor.
enum class TrustLevel { Trusted, Caution, Untrusted };

[[nodiscard]] std::string trust_level_to_string(TrustLevel level);
[[nodiscard]] common::Result<TrustLevel> trust_level_from_string(const std::string &value);

/// True when `a` carries strictly less trust than `b`.
[[nodiscard]] bool is_less_trusted(TrustLevel a, TrustLevel b);

/// Trust after a layer reported `new_warnings`. No warnings keeps `prior`; any warning moves
/// one step down (Trusted -> Caution -> Untrusted) and never above the floor. Every
/// combinator that sanitizes or validates goes through this function.
[[nodiscard]] TrustLevel downgrade(TrustLevel prior, const std::vector<std::string> &new_warnings);

} // namespace toolshield::trust
