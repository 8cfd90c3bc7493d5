#pragma once

#include <scrip/schema/certificate_state.hpp>
#include <scrip/schema/primitives.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace scrip::registry {

/// In-memory arena of certificate types addressed by id.
///
/// Amount and metadata are fixed by the first insert; later inserts for the
/// same id only add delegates. Nothing is ever removed.
class certificate_registry final {
 public:
  /// Insert a new type or extend the delegate set of an existing one.
  /// Returns true when `certificate_id` was not known before.
  bool upsert(const scrip::schema::certificate_id_t& certificate_id,
              const scrip::schema::amount_t& amount,
              const std::string& metadata,
              const std::vector<scrip::schema::address_t>& delegates);

  /// Load a persisted definition verbatim.
  void restore(const scrip::schema::certificate_state_t& state);

  bool contains(const scrip::schema::certificate_id_t& certificate_id) const;

  std::optional<scrip::schema::certificate_state_t> find(
      const scrip::schema::certificate_id_t& certificate_id) const;

  std::optional<scrip::schema::amount_t> amount(
      const scrip::schema::certificate_id_t& certificate_id) const;

  std::optional<std::string> metadata(
      const scrip::schema::certificate_id_t& certificate_id) const;

  /// False for unknown ids.
  bool is_delegate(const scrip::schema::certificate_id_t& certificate_id,
                   const scrip::schema::address_t& identity) const;

  std::size_t size() const;

 private:
  struct entry final {
    scrip::schema::amount_t amount{};
    std::string metadata;
    std::set<scrip::schema::address_t> delegates;
  };

  std::map<scrip::schema::certificate_id_t, entry> certificates_;
};

}  // namespace scrip::registry
