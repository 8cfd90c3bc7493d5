#pragma once

#include <scrip/schema/error_code.hpp>
#include <scrip/schema/event.hpp>
#include <scrip/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scrip::schema {

/// Outcome of an engine entry point. `code == error_code::ok` is success;
/// otherwise `log` names the error and `info` carries detail.
struct operation_result final {
  error_code code{error_code::ok};
  std::string log;
  std::string info;
  std::string codespace;
  amount_t amount{};
  std::optional<certificate_id_t> certificate_id;
  std::vector<event_t> events;

  bool ok() const { return code == error_code::ok; }
};

}  // namespace scrip::schema
