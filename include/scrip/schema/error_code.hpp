#pragma once

#include <array>
#include <cstdint>
#include <string_view>
#include <utility>

namespace scrip::schema {

/// Result codes shared by every engine operation; `ok` is the only success.
enum class error_code : uint32_t {
  ok = 0,
  unauthorized = 1,
  already_claimed = 2,
  invalid_signature_format = 3,
  signature_recovery_failed = 4,
  admin_required = 5,
  amount_mismatch = 6,
  empty_certificate_list = 7,
  duplicate_certificate = 8,
  credit_failed = 9,
};

inline constexpr auto kErrorCodeNames =
    std::array<std::pair<std::string_view, error_code>, 10>{{
        {"ok", error_code::ok},
        {"unauthorized", error_code::unauthorized},
        {"already_claimed", error_code::already_claimed},
        {"invalid_signature_format", error_code::invalid_signature_format},
        {"signature_recovery_failed", error_code::signature_recovery_failed},
        {"admin_required", error_code::admin_required},
        {"amount_mismatch", error_code::amount_mismatch},
        {"empty_certificate_list", error_code::empty_certificate_list},
        {"duplicate_certificate", error_code::duplicate_certificate},
        {"credit_failed", error_code::credit_failed},
    }};

constexpr std::string_view to_string(const error_code value) {
  for (const auto& [name, code] : kErrorCodeNames) {
    if (code == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace scrip::schema
