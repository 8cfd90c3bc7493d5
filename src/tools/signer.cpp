#include <boost/program_options.hpp>
#include <scrip/common/critical.hpp>
#include <scrip/crypto/signature.hpp>
#include <scrip/identity/hasher.hpp>
#include <scrip/schema/primitives.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;

scrip::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    scrip::common::critical("missing required argument --{}", name);
  }
  auto address = scrip::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    scrip::common::critical("--{} must be a 20-byte hex address", name);
  }
  return *address;
}

scrip::schema::hash32_t get_hash32(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    scrip::common::critical("missing required argument --{}", name);
  }
  auto hash = scrip::schema::try_make_hash32(vm[name].as<std::string>());
  if (!hash) {
    scrip::common::critical("--{} must be 32 bytes of hex", name);
  }
  return *hash;
}

scrip::schema::private_key_t get_private_key(const po::variables_map& vm) {
  return get_hash32(vm, "private-key");
}

scrip::schema::amount_t get_amount(const po::variables_map& vm) {
  if (!vm.contains("amount")) {
    scrip::common::critical("missing required argument --amount");
  }
  auto amount = scrip::schema::try_make_amount(vm["amount"].as<std::string>());
  if (!amount) {
    scrip::common::critical("--amount must be an unsigned 256-bit integer");
  }
  return *amount;
}

std::vector<scrip::schema::address_t> get_delegates(
    const po::variables_map& vm) {
  auto out = std::vector<scrip::schema::address_t>{};
  if (!vm.contains("delegate")) {
    return out;
  }
  for (const auto& value : vm["delegate"].as<std::vector<std::string>>()) {
    auto address = scrip::schema::try_make_address(value);
    if (!address) {
      scrip::common::critical("delegate '{}' is not a 20-byte hex address",
                              value);
    }
    out.push_back(*address);
  }
  return out;
}

std::vector<scrip::schema::certificate_id_t> get_certificate_ids(
    const po::variables_map& vm) {
  auto out = std::vector<scrip::schema::certificate_id_t>{};
  if (!vm.contains("certificate-ids")) {
    scrip::common::critical("missing required argument --certificate-ids");
  }
  for (const auto& value :
       vm["certificate-ids"].as<std::vector<std::string>>()) {
    auto id = scrip::schema::try_make_hash32(value);
    if (!id) {
      scrip::common::critical("certificate id '{}' is not 32 bytes of hex",
                              value);
    }
    out.push_back(*id);
  }
  return out;
}

scrip::schema::hash32_t condensed_hash(const po::variables_map& vm) {
  auto ids = get_certificate_ids(vm);
  return scrip::identity::compute_condensed_redemption_hash(
      scrip::identity::compute_condensed_ids_hash(ids), get_amount(vm),
      get_address(vm, "holder"), get_address(vm, "service"));
}

void print_signature(const scrip::schema::private_key_t& private_key,
                     const scrip::schema::hash32_t& message_hash) {
  auto signature = scrip::crypto::sign(private_key, message_hash);
  if (!signature) {
    scrip::common::critical("signing failed");
  }
  std::cout << scrip::schema::to_hex(*signature) << '\n';
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  scrip_signer keygen\n"
            << "  scrip_signer address --private-key K\n"
            << "  scrip_signer certificate-id --service S --amount N "
               "[--delegate D...] [--metadata M]\n"
            << "  scrip_signer redemption-hash --service S --certificate-id C "
               "--holder H\n"
            << "  scrip_signer condensed-hash --service S --amount N "
               "--certificate-ids C... --holder H\n"
            << "  scrip_signer sign-redemption --private-key K --service S "
               "--certificate-id C --holder H\n"
            << "  scrip_signer sign-condensed --private-key K --service S "
               "--amount N --certificate-ids C... --holder H\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"scrip_signer options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "keygen|address|certificate-id|redemption-hash|condensed-hash|"
      "sign-redemption|sign-condensed")(
      "private-key", po::value<std::string>(), "32-byte secp256k1 key hex")(
      "service", po::value<std::string>(), "20-byte service identity hex")(
      "amount", po::value<std::string>(), "decimal or 0x-hex amount")(
      "delegate", po::value<std::vector<std::string>>()->multitoken(),
      "delegate addresses hex")("metadata",
                                po::value<std::string>()->default_value(""),
                                "certificate metadata")(
      "certificate-id", po::value<std::string>(), "certificate id hex")(
      "certificate-ids", po::value<std::vector<std::string>>()->multitoken(),
      "ordered certificate ids hex")("holder", po::value<std::string>(),
                                     "holder address hex");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "keygen") {
    auto private_key = scrip::crypto::generate_private_key();
    if (!private_key) {
      scrip::common::critical("key generation failed");
    }
    auto address = scrip::crypto::derive_address(*private_key);
    if (!address) {
      scrip::common::critical("generated key has no public key");
    }
    std::cout << "private_key=" << scrip::schema::to_hex(*private_key) << '\n'
              << "address=" << scrip::schema::to_hex(*address) << '\n';
    return 0;
  }

  if (command == "address") {
    auto address = scrip::crypto::derive_address(get_private_key(vm));
    if (!address) {
      scrip::common::critical("--private-key is not a valid secp256k1 scalar");
    }
    std::cout << scrip::schema::to_hex(*address) << '\n';
    return 0;
  }

  if (command == "certificate-id") {
    auto certificate_id = scrip::identity::compute_certificate_id(
        get_amount(vm), get_address(vm, "service"), get_delegates(vm),
        vm["metadata"].as<std::string>());
    std::cout << scrip::schema::to_hex(certificate_id) << '\n';
    return 0;
  }

  if (command == "redemption-hash") {
    auto hash = scrip::identity::compute_redemption_hash(
        get_hash32(vm, "certificate-id"), get_address(vm, "service"),
        get_address(vm, "holder"));
    std::cout << scrip::schema::to_hex(hash) << '\n';
    return 0;
  }

  if (command == "condensed-hash") {
    std::cout << scrip::schema::to_hex(condensed_hash(vm)) << '\n';
    return 0;
  }

  if (command == "sign-redemption") {
    print_signature(get_private_key(vm),
                    scrip::identity::compute_redemption_hash(
                        get_hash32(vm, "certificate-id"),
                        get_address(vm, "service"), get_address(vm, "holder")));
    return 0;
  }

  if (command == "sign-condensed") {
    print_signature(get_private_key(vm), condensed_hash(vm));
    return 0;
  }

  scrip::common::critical(
      "command must be keygen|address|certificate-id|redemption-hash|"
      "condensed-hash|sign-redemption|sign-condensed");
}
