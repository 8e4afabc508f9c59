#include "toolshield/trust/trust_level.hpp"

#include "toolshield/common/fs.hpp"

namespace toolshield::trust {

namespace {

int rank(const TrustLevel level) {
  switch (level) {
  case TrustLevel::Trusted:
    return 2;
  case TrustLevel::Caution:
    return 1;
  case TrustLevel::Untrusted:
    return 0;
  }
  return 0;
}

} // namespace

std::string trust_level_to_string(const TrustLevel level) {
  switch (level) {
  case TrustLevel::Trusted:
    return "trusted";
  case TrustLevel::Caution:
    return "caution";
  case TrustLevel::Untrusted:
    return "untrusted";
  }
  return "untrusted";
}

common::Result<TrustLevel> trust_level_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "trusted") {
    return common::Result<TrustLevel>::success(TrustLevel::Trusted);
  }
  if (normalized == "caution") {
    return common::Result<TrustLevel>::success(TrustLevel::Caution);
  }
  if (normalized == "untrusted") {
    return common::Result<TrustLevel>::success(TrustLevel::Untrusted);
  }
  return common::Result<TrustLevel>::failure("unknown trust level: " + value);
}

bool is_less_trusted(const TrustLevel a, const TrustLevel b) { return rank(a) < rank(b); }

TrustLevel downgrade(const TrustLevel prior, const std::vector<std::string> &new_warnings) {
  if (new_warnings.empty()) {
    return prior;
  }
  if (prior == TrustLevel::Trusted) {
    return TrustLevel::Caution;
  }
  return TrustLevel::Untrusted;
}

} // namespace toolshield::trust
