#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/multiprecision/cpp_int.hpp>
#include <boost/program_options.hpp>
#include <scrip/common/critical.hpp>
#include <scrip/execution/engine.hpp>
#include <scrip/schema/encoding/scale/encoder.hpp>
#include <scrip/schema/key/engine_keys.hpp>
#include <scrip/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t = scrip::schema::encoding::encoder<
    scrip::schema::encoding::scale_encoder_tag>;
using storage_t = scrip::storage::storage<scrip::storage::rocksdb_storage_tag>;
namespace po = boost::program_options;

// Local stand-in for the external fungible-asset ledger.
inline constexpr std::string_view kBalanceKeyPrefix{"EXT|BALANCE|"};

void setup_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output; diagnostics go to stderr.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "scrip", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

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

std::vector<scrip::schema::address_t> get_addresses(const po::variables_map& vm,
                                                    const std::string& name) {
  auto out = std::vector<scrip::schema::address_t>{};
  if (!vm.contains(name)) {
    return out;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto address = scrip::schema::try_make_address(value);
    if (!address) {
      scrip::common::critical("--{} value '{}' is not a 20-byte hex address",
                              name, value);
    }
    out.push_back(*address);
  }
  return out;
}

scrip::schema::certificate_id_t get_certificate_id(const po::variables_map& vm,
                                                   const std::string& name) {
  if (!vm.contains(name)) {
    scrip::common::critical("missing required argument --{}", name);
  }
  auto id = scrip::schema::try_make_hash32(vm[name].as<std::string>());
  if (!id) {
    scrip::common::critical("--{} must be a 32-byte hex id", name);
  }
  return *id;
}

std::vector<scrip::schema::certificate_id_t> get_certificate_ids(
    const po::variables_map& vm,
    const std::string& name) {
  auto out = std::vector<scrip::schema::certificate_id_t>{};
  if (!vm.contains(name)) {
    return out;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto id = scrip::schema::try_make_hash32(value);
    if (!id) {
      scrip::common::critical("--{} value '{}' is not a 32-byte hex id", name,
                              value);
    }
    out.push_back(*id);
  }
  return out;
}

scrip::schema::amount_t get_amount(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    scrip::common::critical("missing required argument --{}", name);
  }
  auto amount = scrip::schema::try_make_amount(vm[name].as<std::string>());
  if (!amount) {
    scrip::common::critical("--{} must be an unsigned 256-bit integer", name);
  }
  return *amount;
}

scrip::schema::bytes_t get_signature(const po::variables_map& vm) {
  if (!vm.contains("signature")) {
    scrip::common::critical("missing required argument --signature");
  }
  auto bytes = scrip::schema::try_from_hex(vm["signature"].as<std::string>());
  if (!bytes) {
    scrip::common::critical("--signature must be hex");
  }
  return *bytes;
}

scrip::schema::bytes_t make_balance_key(encoder_t& encoder,
                                        const scrip::schema::address_t& holder) {
  return scrip::schema::key::make_prefixed_key(encoder, kBalanceKeyPrefix,
                                               holder);
}

scrip::schema::amount_t balance_of(storage_t& storage,
                                   encoder_t& encoder,
                                   const scrip::schema::address_t& holder) {
  auto key = make_balance_key(encoder, holder);
  return storage
      .get<scrip::schema::amount_t>(encoder,
                                    scrip::schema::make_bytes_view(key))
      .value_or(scrip::schema::amount_t{});
}

scrip::execution::credit_fn_t make_local_credit(storage_t& storage,
                                                encoder_t& encoder) {
  return [&storage, &encoder](const scrip::schema::address_t& holder,
                              const scrip::schema::amount_t& amount) {
    auto total = boost::multiprecision::cpp_int{
                     balance_of(storage, encoder, holder)} +
                 boost::multiprecision::cpp_int{amount};
    if (total > boost::multiprecision::cpp_int{
                    std::numeric_limits<scrip::schema::amount_t>::max()}) {
      spdlog::error("Balance of {} would overflow",
                    scrip::schema::to_hex(holder));
      return false;
    }
    auto key = make_balance_key(encoder, holder);
    storage.put(encoder, scrip::schema::make_bytes_view(key),
                scrip::schema::amount_t{total});
    return true;
  };
}

int report(const scrip::schema::operation_result& result) {
  if (!result.ok()) {
    std::cerr << "error: " << result.log << " (" << result.info << ")\n";
    return static_cast<int>(result.code);
  }
  for (const auto& event : result.events) {
    spdlog::debug("event {} {}", event.sequence, event.type);
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  scrip create --caller A --amount N --delegate D... "
               "[--metadata M]\n"
            << "  scrip add-condenser|remove-condenser --caller A --address K\n"
            << "  scrip redeem --caller H --signature S --certificate-id C\n"
            << "  scrip redeem-condensed --caller H --signature S --amount N "
               "--certificate-ids C...\n"
            << "  scrip certificate --certificate-id C\n"
            << "  scrip is-claimed --certificate-id C --holder H\n"
            << "  scrip is-delegate --certificate-id C --address D\n"
            << "  scrip is-condenser --address K\n"
            << "  scrip balance --holder H\n"
            << "  scrip events [--from N] [--to N]\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto trust_condensed_amount = false;

  auto options = po::options_description{"scrip options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "create|add-condenser|remove-condenser|redeem|redeem-condensed|"
      "certificate|is-claimed|is-delegate|is-condenser|balance|events")(
      "config,c", po::value<std::string>(&config_path),
      "INI config file; command line values take precedence")(
      "db-path", po::value<std::string>(&db_path)->default_value("scrip-data"),
      "RocksDB state directory")("service", po::value<std::string>(),
                                 "20-byte service identity hex")(
      "admin", po::value<std::string>(), "20-byte administrator address hex")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value(""),
      "also log to this file")(
      "trust-condensed-amount",
      po::bool_switch(&trust_condensed_amount),
      "accept the signed combined amount without checking registered amounts")(
      "caller", po::value<std::string>(), "caller address hex")(
      "amount", po::value<std::string>(), "decimal or 0x-hex amount")(
      "delegate", po::value<std::vector<std::string>>()->multitoken(),
      "delegate addresses hex")(
      "metadata", po::value<std::string>()->default_value(""),
      "certificate metadata")("signature", po::value<std::string>(),
                              "65-byte recoverable signature hex")(
      "certificate-id", po::value<std::string>(), "certificate id hex")(
      "certificate-ids", po::value<std::vector<std::string>>()->multitoken(),
      "ordered certificate ids hex")("address", po::value<std::string>(),
                                     "delegate or condenser address hex")(
      "holder", po::value<std::string>(), "holder address hex")(
      "from", po::value<uint64_t>()->default_value(1), "first event sequence")(
      "to",
      po::value<uint64_t>()->default_value(std::numeric_limits<uint64_t>::max()),
      "last event sequence");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      po::store(po::parse_config_file(vm["config"].as<std::string>().c_str(),
                                      options),
                vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << "error: " << ex.what() << '\n';
    return 1;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  setup_logging(log_level, log_file);

  auto engine_options = scrip::execution::engine_options{
      .service = get_address(vm, "service"),
      .admin = vm.contains("admin") ? get_address(vm, "admin")
                                    : scrip::schema::address_t{},
      .trust_condensed_amount = trust_condensed_amount};

  auto encoder = encoder_t{};
  auto storage = scrip::storage::make_storage<
      scrip::storage::rocksdb_storage_tag>(db_path);
  auto engine = scrip::execution::engine{encoder, storage, engine_options};
  engine.set_credit(make_local_credit(storage, encoder));

  auto status = 0;
  if (command == "create") {
    auto result = engine.create_certificate_type(
        get_address(vm, "caller"), get_amount(vm, "amount"),
        get_addresses(vm, "delegate"), vm["metadata"].as<std::string>());
    status = report(result);
    if (result.ok()) {
      std::cout << scrip::schema::to_hex(*result.certificate_id) << '\n';
    }
  } else if (command == "add-condenser") {
    status = report(engine.add_condenser_delegate(get_address(vm, "caller"),
                                                  get_address(vm, "address")));
  } else if (command == "remove-condenser") {
    status = report(engine.remove_condenser_delegate(
        get_address(vm, "caller"), get_address(vm, "address")));
  } else if (command == "redeem") {
    auto signature = get_signature(vm);
    auto result = engine.redeem(get_address(vm, "caller"),
                                scrip::schema::make_bytes_view(signature),
                                get_certificate_id(vm, "certificate-id"));
    status = report(result);
    if (result.ok()) {
      std::cout << scrip::schema::to_string(result.amount) << '\n';
    }
  } else if (command == "redeem-condensed") {
    auto signature = get_signature(vm);
    auto result = engine.redeem_condensed(
        get_address(vm, "caller"), scrip::schema::make_bytes_view(signature),
        get_amount(vm, "amount"), get_certificate_ids(vm, "certificate-ids"));
    status = report(result);
    if (result.ok()) {
      std::cout << scrip::schema::to_string(result.amount) << '\n';
    }
  } else if (command == "certificate") {
    auto certificate =
        engine.certificate(get_certificate_id(vm, "certificate-id"));
    if (!certificate) {
      std::cerr << "error: unknown certificate\n";
      status = 1;
    } else {
      std::cout << "certificate_id="
                << scrip::schema::to_hex(certificate->certificate_id) << '\n'
                << "amount=" << scrip::schema::to_string(certificate->amount)
                << '\n'
                << "metadata=" << certificate->metadata << '\n';
      for (const auto& delegate : certificate->delegates) {
        std::cout << "delegate=" << scrip::schema::to_hex(delegate) << '\n';
      }
    }
  } else if (command == "is-claimed") {
    std::cout << std::boolalpha
              << engine.is_claimed(get_certificate_id(vm, "certificate-id"),
                                   get_address(vm, "holder"))
              << '\n';
  } else if (command == "is-delegate") {
    std::cout << std::boolalpha
              << engine.is_delegate(get_certificate_id(vm, "certificate-id"),
                                    get_address(vm, "address"))
              << '\n';
  } else if (command == "is-condenser") {
    std::cout << std::boolalpha
              << engine.is_condenser_delegate(get_address(vm, "address"))
              << '\n';
  } else if (command == "balance") {
    std::cout << scrip::schema::to_string(
                     balance_of(storage, encoder, get_address(vm, "holder")))
              << '\n';
  } else if (command == "events") {
    for (const auto& event : engine.events(vm["from"].as<uint64_t>(),
                                           vm["to"].as<uint64_t>())) {
      std::cout << event.sequence << ' ' << event.type;
      for (const auto& attribute : event.attributes) {
        std::cout << ' ' << attribute.key << '=' << attribute.value;
      }
      std::cout << '\n';
    }
  } else {
    scrip::common::critical("unknown command '{}'", command);
  }

  spdlog::shutdown();
  return status;
}
