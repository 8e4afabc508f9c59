#include "toolshield/trust/envelope.hpp"

#include "toolshield/common/json_util.hpp"

#include <cmath>
#include <sstream>
#include <type_traits>

namespace toolshield::trust {

const std::string DEFAULT_UNTRUSTED_WARNING = "data from untrusted source";

std::string Payload::to_json() const {
  return std::visit(
      [](auto &&value) -> std::string {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
          return value ? "true" : "false";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(value);
        } else if constexpr (std::is_same_v<T, double>) {
          if (!std::isfinite(value)) {
            return "null";
          }
          std::ostringstream out;
          out.precision(17);
          out << value;
          return out.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
          return common::json_quote(value);
        } else {
          return value.json.empty() ? std::string("null") : value.json;
        }
      },
      value_);
}

Envelope::Envelope(Payload data, const TrustLevel trust_level, std::vector<std::string> warnings)
    : data_(std::move(data)), trust_level_(trust_level), warnings_(std::move(warnings)) {
  if (trust_level_ == TrustLevel::Untrusted && warnings_.empty()) {
    warnings_.push_back(DEFAULT_UNTRUSTED_WARNING);
  }
}

std::string Envelope::to_json() const {
  return "{\"data\":" + data_.to_json() + ",\"trust_level\":" +
         common::json_quote(trust_level_to_string(trust_level_)) +
         ",\"warnings\":" + common::json_string_array(warnings_) + "}";
}

Envelope finalize(ToolOutcome outcome) {
  if (auto *envelope = std::get_if<Envelope>(&outcome); envelope != nullptr) {
    return std::move(*envelope);
  }
  return Envelope(std::move(std::get<Payload>(outcome)), TrustLevel::Untrusted);
}

} // namespace toolshield::trust
