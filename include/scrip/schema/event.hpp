#pragma once

#include <scrip/schema/event_attribute.hpp>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// Schema type: event.
// Observability stream: certificate type creation, single redemption and
// condensed redemption. Events are informational; claim state is the source
// of truth.
namespace scrip::schema {

inline constexpr std::string_view kCertificateTypeCreatedEvent{
    "certificate_type_created"};
inline constexpr std::string_view kCertificateRedeemedEvent{
    "certificate_redeemed"};
inline constexpr std::string_view kCondensedRedeemedEvent{
    "condensed_redeemed"};

template <uint16_t Version>
struct event;

template <>
struct event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  std::string type;
  std::vector<event_attribute_t> attributes;
};

using event_t = event<1>;

}  // namespace scrip::schema
