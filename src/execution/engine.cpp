#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <algorithm>
#include <array>
#include <iterator>
#include <scrip/crypto/signature.hpp>
#include <scrip/execution/engine.hpp>
#include <scrip/identity/hasher.hpp>
#include <scrip/schema/key/engine_keys.hpp>
#include <set>
#include <utility>

using namespace scrip::schema;

namespace {

constexpr auto kAdminCodespace = std::string_view{"scrip.admin"};
constexpr auto kRedeemCodespace = std::string_view{"scrip.redeem"};
constexpr auto kCondensedCodespace = std::string_view{"scrip.redeem_condensed"};

operation_result make_error_result(const error_code code,
                                   std::string info,
                                   const std::string_view codespace) {
  return operation_result{.code = code,
                          .log = std::string{to_string(code)},
                          .info = std::move(info),
                          .codespace = std::string{codespace}};
}

template <std::size_t N>
std::string join_hex(const std::vector<std::array<uint8_t, N>>& values) {
  auto joined = std::string{};
  for (const auto& value : values) {
    if (!joined.empty()) {
      joined.push_back(',');
    }
    joined += to_hex(value);
  }
  return joined;
}

template <typename T>
bytes_t encode_value(
    scrip::schema::encoding::encoder<
        scrip::schema::encoding::scale_encoder_tag>& encoder,
    const T& value) {
  return encoder.encode(value);
}

}  // namespace

namespace scrip::execution {

engine::engine(
    scrip::schema::encoding::encoder<
        scrip::schema::encoding::scale_encoder_tag>& encoder,
    scrip::storage::storage<scrip::storage::rocksdb_storage_tag>& storage,
    engine_options options)
    : encoder_{encoder}, storage_{storage}, options_{std::move(options)} {
  auto lock = std::scoped_lock{mutex_};
  admin_gate_ = [admin = options_.admin](const address_t& caller) {
    return caller == admin;
  };
  load_persisted_state();
  spdlog::info(
      "Redemption engine ready for service {} with {} certificate type(s), "
      "{} claim(s), next event {}",
      to_hex(options_.service), certificates_.size(), claims_.size(),
      next_event_sequence_);
  if (options_.trust_condensed_amount) {
    spdlog::warn(
        "Condensed redemptions will trust the signed combined amount");
  }
}

operation_result engine::create_certificate_type(
    const address_t& caller,
    const amount_t& amount,
    const std::vector<address_t>& delegates,
    const std::string& metadata) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_admin(caller, kAdminCodespace); !denied.ok()) {
    return denied;
  }

  auto certificate_id = scrip::identity::compute_certificate_id(
      amount, options_.service, delegates, metadata);
  auto created = certificates_.upsert(certificate_id, amount, metadata,
                                      delegates);
  auto state = certificates_.find(certificate_id);
  if (!state) {
    scrip::common::critical("certificate {} missing after upsert",
                            to_hex(certificate_id));
  }
  // A re-create keeps the original amount and metadata.
  auto writes = scrip::storage::write_set{};
  writes.puts.emplace_back(
      scrip::schema::key::make_certificate_key(encoder_, certificate_id),
      encode_value(encoder_, *state));
  auto event = stage_event(
      kCertificateTypeCreatedEvent,
      {event_attribute_t{.key = "certificate_id",
                         .value = to_hex(certificate_id),
                         .index = true},
       event_attribute_t{.key = "amount", .value = to_string(state->amount)},
       event_attribute_t{.key = "delegates", .value = join_hex(delegates)}},
      writes);
  storage_.write(writes);

  if (created) {
    spdlog::info("Created certificate type {} amount {} with {} delegate(s)",
                 to_hex(certificate_id), to_string(amount), delegates.size());
  } else {
    spdlog::info("Extended certificate type {} to {} delegate(s)",
                 to_hex(certificate_id), state->delegates.size());
  }

  auto result = operation_result{};
  result.amount = state->amount;
  result.certificate_id = certificate_id;
  result.events.push_back(std::move(event));
  return result;
}

operation_result engine::add_condenser_delegate(const address_t& caller,
                                                const address_t& identity) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_admin(caller, kAdminCodespace); !denied.ok()) {
    return denied;
  }
  if (condensers_.add(identity)) {
    storage_.put(encoder_,
                 make_bytes_view(scrip::schema::key::make_condenser_key(
                     encoder_, identity)),
                 identity);
    spdlog::info("Added condenser delegate {}", to_hex(identity));
  }
  return operation_result{};
}

operation_result engine::remove_condenser_delegate(const address_t& caller,
                                                   const address_t& identity) {
  auto lock = std::scoped_lock{mutex_};
  if (auto denied = require_admin(caller, kAdminCodespace); !denied.ok()) {
    return denied;
  }
  if (condensers_.remove(identity)) {
    storage_.erase(make_bytes_view(
        scrip::schema::key::make_condenser_key(encoder_, identity)));
    spdlog::info("Removed condenser delegate {}", to_hex(identity));
  }
  return operation_result{};
}

operation_result engine::redeem(const address_t& caller,
                                const bytes_view_t& signature,
                                const certificate_id_t& certificate_id) {
  auto lock = std::unique_lock{mutex_};
  auto redemption_hash = scrip::identity::compute_redemption_hash(
      certificate_id, options_.service, caller);
  auto error = error_code::ok;
  auto signer =
      scrip::crypto::recover_signer(redemption_hash, signature, error);
  if (!signer) {
    spdlog::warn("Rejecting redemption of {} by {}: {}", to_hex(certificate_id),
                 to_hex(caller), to_string(error));
    return make_error_result(error, "signature could not be recovered",
                             kRedeemCodespace);
  }
  if (!certificates_.is_delegate(certificate_id, *signer)) {
    spdlog::warn("Rejecting redemption of {} by {}: {} is not a delegate",
                 to_hex(certificate_id), to_hex(caller), to_hex(*signer));
    return make_error_result(error_code::unauthorized,
                             "signer is not a delegate of the certificate",
                             kRedeemCodespace);
  }
  if (claims_.is_claimed(certificate_id, caller)) {
    return make_error_result(error_code::already_claimed,
                             "certificate already redeemed by holder",
                             kRedeemCodespace);
  }

  auto amount = certificates_.amount(certificate_id);
  if (!amount) {
    scrip::common::critical("delegate registered for unknown certificate {}",
                            to_hex(certificate_id));
  }

  auto writes = scrip::storage::write_set{};
  claims_.claim(certificate_id, caller);
  stage_claim(certificate_id, caller, writes);
  storage_.write(writes);

  auto ids = std::vector<certificate_id_t>{certificate_id};
  auto result = settle(
      lock, caller, *amount, ids, kCertificateRedeemedEvent,
      {event_attribute_t{
           .key = "holder", .value = to_hex(caller), .index = true},
       event_attribute_t{.key = "amount", .value = to_string(*amount)},
       event_attribute_t{.key = "certificate_id",
                         .value = to_hex(certificate_id),
                         .index = true}},
      kRedeemCodespace);
  result.certificate_id = certificate_id;
  return result;
}

operation_result engine::redeem_condensed(
    const address_t& caller,
    const bytes_view_t& signature,
    const amount_t& combined_amount,
    const std::vector<certificate_id_t>& certificate_ids) {
  auto lock = std::unique_lock{mutex_};
  if (certificate_ids.empty()) {
    return make_error_result(error_code::empty_certificate_list,
                             "condensed redemption needs at least one id",
                             kCondensedCodespace);
  }
  auto unique_ids = std::set<certificate_id_t>{};
  for (const auto& certificate_id : certificate_ids) {
    if (!unique_ids.insert(certificate_id).second) {
      return make_error_result(
          error_code::duplicate_certificate,
          "certificate id listed twice: " + to_hex(certificate_id),
          kCondensedCodespace);
    }
  }

  auto ids_hash = scrip::identity::compute_condensed_ids_hash(certificate_ids);
  auto redemption_hash = scrip::identity::compute_condensed_redemption_hash(
      ids_hash, combined_amount, caller, options_.service);
  auto error = error_code::ok;
  auto signer =
      scrip::crypto::recover_signer(redemption_hash, signature, error);
  if (!signer) {
    spdlog::warn("Rejecting condensed redemption by {}: {}", to_hex(caller),
                 to_string(error));
    return make_error_result(error, "signature could not be recovered",
                             kCondensedCodespace);
  }
  if (!condensers_.contains(*signer)) {
    spdlog::warn("Rejecting condensed redemption by {}: {} is not a condenser",
                 to_hex(caller), to_hex(*signer));
    return make_error_result(error_code::unauthorized,
                             "signer is not a condenser delegate",
                             kCondensedCodespace);
  }

  if (!options_.trust_condensed_amount) {
    // Unregistered ids contribute nothing to the expected total.
    auto expected = boost::multiprecision::cpp_int{};
    for (const auto& certificate_id : certificate_ids) {
      if (auto amount = certificates_.amount(certificate_id)) {
        expected += boost::multiprecision::cpp_int{*amount};
      }
    }
    if (expected != boost::multiprecision::cpp_int{combined_amount}) {
      return make_error_result(
          error_code::amount_mismatch,
          "combined amount " + to_string(combined_amount) +
              " does not match registered total " + expected.str(),
          kCondensedCodespace);
    }
  }

  if (auto claimed = claims_.first_claimed(certificate_ids, caller)) {
    return make_error_result(
        error_code::already_claimed,
        "certificate already redeemed by holder: " + to_hex(*claimed),
        kCondensedCodespace);
  }

  auto writes = scrip::storage::write_set{};
  claims_.claim_all(certificate_ids, caller);
  for (const auto& certificate_id : certificate_ids) {
    stage_claim(certificate_id, caller, writes);
  }
  storage_.write(writes);

  return settle(
      lock, caller, combined_amount, certificate_ids, kCondensedRedeemedEvent,
      {event_attribute_t{
           .key = "holder", .value = to_hex(caller), .index = true},
       event_attribute_t{.key = "amount", .value = to_string(combined_amount)},
       event_attribute_t{.key = "certificate_ids",
                         .value = join_hex(certificate_ids)}},
      kCondensedCodespace);
}

std::optional<certificate_state_t> engine::certificate(
    const certificate_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return certificates_.find(certificate_id);
}

std::optional<amount_t> engine::certificate_amount(
    const certificate_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return certificates_.amount(certificate_id);
}

std::optional<std::string> engine::certificate_metadata(
    const certificate_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return certificates_.metadata(certificate_id);
}

bool engine::certificate_exists(const certificate_id_t& certificate_id) const {
  auto lock = std::scoped_lock{mutex_};
  return certificates_.contains(certificate_id);
}

bool engine::is_delegate(const certificate_id_t& certificate_id,
                         const address_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  return certificates_.is_delegate(certificate_id, identity);
}

bool engine::is_claimed(const certificate_id_t& certificate_id,
                        const address_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  return claims_.is_claimed(certificate_id, holder);
}

bool engine::is_condenser_delegate(const address_t& identity) const {
  auto lock = std::scoped_lock{mutex_};
  return condensers_.contains(identity);
}

std::vector<address_t> engine::condenser_delegates() const {
  auto lock = std::scoped_lock{mutex_};
  return condensers_.list();
}

std::vector<event_t> engine::events(const uint64_t from,
                                     const uint64_t to) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<event_t>{};
  if (from > to) {
    return out;
  }
  auto prefix = scrip::schema::key::make_prefix_key(
      encoder_, scrip::schema::key::kEventPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(prefix))) {
    auto sequence =
        scrip::schema::key::parse_event_key(encoder_, make_bytes_view(key));
    if (!sequence) {
      scrip::common::critical("malformed event key {}", to_hex(key));
    }
    if (*sequence < from || *sequence > to) {
      continue;
    }
    out.push_back(encoder_.decode<event_t>(make_bytes_view(value)));
  }
  // Keys hold little-endian sequence numbers, so scan order is not numeric.
  std::ranges::sort(out, {}, &event_t::sequence);
  return out;
}

const engine_options& engine::options() const {
  return options_;
}

void engine::set_credit(credit_fn_t credit) {
  auto lock = std::scoped_lock{mutex_};
  credit_ = std::move(credit);
}

void engine::set_admin_gate(admin_gate_t admin_gate) {
  auto lock = std::scoped_lock{mutex_};
  admin_gate_ = std::move(admin_gate);
}

operation_result engine::require_admin(const address_t& caller,
                                       const std::string_view codespace) const {
  if (admin_gate_ && admin_gate_(caller)) {
    return operation_result{};
  }
  spdlog::warn("Rejecting admin operation from {}", to_hex(caller));
  return make_error_result(error_code::admin_required,
                           "caller is not an administrator", codespace);
}

operation_result engine::settle(
    std::unique_lock<std::mutex>& lock,
    const address_t& holder,
    const amount_t& amount,
    const std::vector<certificate_id_t>& certificate_ids,
    const std::string_view event_type,
    std::vector<event_attribute_t> attributes,
    const std::string_view codespace) {
  auto credit = credit_;
  lock.unlock();

  auto credited = false;
  auto failure = std::string{"credit capability refused"};
  if (!credit) {
    failure = "no credit capability installed";
  } else {
    try {
      credited = credit(holder, amount);
    } catch (const std::exception& ex) {
      failure = ex.what();
    } catch (...) {
      lock.lock();
      release_claims(holder, certificate_ids);
      spdlog::error("Credit of {} to {} threw, released {} claim(s)",
                    to_string(amount), to_hex(holder),
                    certificate_ids.size());
      throw;
    }
  }

  lock.lock();
  if (!credited) {
    release_claims(holder, certificate_ids);
    spdlog::error("Credit of {} to {} failed, released {} claim(s): {}",
                  to_string(amount), to_hex(holder), certificate_ids.size(),
                  failure);
    return make_error_result(error_code::credit_failed, failure, codespace);
  }

  auto writes = scrip::storage::write_set{};
  auto event = stage_event(event_type, std::move(attributes), writes);
  storage_.write(writes);
  spdlog::info("Credited {} to {} for {} certificate(s)", to_string(amount),
               to_hex(holder), certificate_ids.size());

  auto result = operation_result{};
  result.amount = amount;
  result.events.push_back(std::move(event));
  return result;
}

event_t engine::stage_event(const std::string_view type,
                            std::vector<event_attribute_t> attributes,
                            scrip::storage::write_set& writes) {
  auto event = event_t{.sequence = next_event_sequence_,
                       .type = std::string{type},
                       .attributes = std::move(attributes)};
  ++next_event_sequence_;
  writes.puts.emplace_back(
      scrip::schema::key::make_event_key(encoder_, event.sequence),
      encode_value(encoder_, event));
  writes.puts.emplace_back(
      scrip::schema::key::make_event_sequence_key(encoder_),
      encode_value(encoder_, next_event_sequence_));
  return event;
}

void engine::release_claims(
    const address_t& holder,
    const std::vector<certificate_id_t>& certificate_ids) {
  auto writes = scrip::storage::write_set{};
  for (const auto& certificate_id : certificate_ids) {
    claims_.release(certificate_id, holder);
    writes.deletes.push_back(
        scrip::schema::key::make_claim_key(encoder_, certificate_id, holder));
  }
  storage_.write(writes);
}

void engine::stage_claim(const certificate_id_t& certificate_id,
                         const address_t& holder,
                         scrip::storage::write_set& writes) {
  writes.puts.emplace_back(
      scrip::schema::key::make_claim_key(encoder_, certificate_id, holder),
      encode_value(encoder_, claim_record_t{.certificate_id = certificate_id,
                                            .holder = holder}));
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  auto certificate_prefix = scrip::schema::key::make_prefix_key(
      encoder_, scrip::schema::key::kCertificateKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(certificate_prefix))) {
    certificates_.restore(
        encoder_.decode<certificate_state_t>(make_bytes_view(value)));
  }

  auto claim_prefix = scrip::schema::key::make_prefix_key(
      encoder_, scrip::schema::key::kClaimKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(claim_prefix))) {
    claims_.restore(encoder_.decode<claim_record_t>(make_bytes_view(value)));
  }

  auto condenser_prefix = scrip::schema::key::make_prefix_key(
      encoder_, scrip::schema::key::kCondenserKeyPrefix);
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(condenser_prefix))) {
    condensers_.add(encoder_.decode<address_t>(make_bytes_view(value)));
  }

  auto sequence = storage_.get<uint64_t>(
      encoder_,
      make_bytes_view(scrip::schema::key::make_event_sequence_key(encoder_)));
  if (sequence) {
    next_event_sequence_ = *sequence;
  }
}

}  // namespace scrip::execution
