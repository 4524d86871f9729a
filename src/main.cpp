#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <mandate/enforcer/registry.hpp>
#include <mandate/schema/delegation.hpp>
#include <mandate/schema/encoding/scale/encoder.hpp>
#include <mandate/state/store.hpp>
#include <mandate/storage/rocksdb/storage.hpp>
#include <iostream>
#include <string>

namespace {

int list_enforcers(const mandate::enforcer::registry& enforcers) {
  for (const auto& [name, address] : enforcers.list()) {
    std::cout << mandate::schema::to_hex(address) << " " << name << std::endl;
  }
  return 0;
}

int check_terms(const mandate::enforcer::registry& enforcers,
                const std::string& name,
                const std::string& terms_hex) {
  auto address = enforcers.address_of(name);
  if (!address) {
    spdlog::error("Unknown enforcer '{}'", name);
    return 1;
  }
  auto terms = mandate::schema::try_from_hex(terms_hex);
  if (!terms) {
    spdlog::error("Terms are not valid hex");
    return 1;
  }
  auto result = enforcers.find(*address)->check_terms(*terms);
  if (result.code != 0) {
    std::cout << "rejected: " << result.log << std::endl;
    return 2;
  }
  std::cout << "ok" << std::endl;
  return 0;
}

int hash_delegation(const std::string& delegation_hex,
                    const std::string& manager_hex) {
  auto raw = mandate::schema::try_from_hex(delegation_hex);
  if (!raw) {
    spdlog::error("Delegation is not valid hex");
    return 1;
  }
  auto encoder = mandate::schema::encoding::scale_encoder_t{};
  auto delegation =
      encoder.try_decode<mandate::schema::delegation_t>(*raw);
  if (!delegation) {
    spdlog::error("Failed to decode delegation");
    return 1;
  }
  auto hash = mandate::schema::hash_delegation(*delegation);
  std::cout << "hash:      " << mandate::schema::to_hex(hash) << std::endl;
  std::cout << "delegator: " << mandate::schema::to_hex(delegation->delegator)
            << std::endl;
  std::cout << "delegate:  " << mandate::schema::to_hex(delegation->delegate)
            << std::endl;
  std::cout << "caveats:   " << delegation->caveats.size() << std::endl;
  if (!manager_hex.empty()) {
    auto manager = mandate::schema::try_make_address(manager_hex);
    if (!manager) {
      spdlog::error("Manager is not a valid address");
      return 1;
    }
    std::cout << "digest:    "
              << mandate::schema::to_hex(
                     mandate::schema::make_signing_digest(*manager, hash))
              << std::endl;
  }
  return 0;
}

int dump_state(const std::string& state_path) {
  auto storage =
      mandate::storage::make_storage<mandate::storage::rocksdb_storage_tag>(
          state_path);
  auto store = mandate::state::store{};
  auto sequence = store.load_from(storage);
  if (!sequence) {
    std::cout << "no committed state at " << state_path << std::endl;
    return 0;
  }
  std::cout << "sequence:   " << *sequence << std::endl;
  std::cout << "state root: " << mandate::schema::to_hex(store.state_root())
            << std::endl;
  for (const auto& [key, value] : store.list_by_prefix(
           mandate::schema::make_bytes_view(mandate::state::kKeyspacePrefix))) {
    std::cout << mandate::schema::to_hex(key) << " "
              << mandate::schema::to_hex(value) << std::endl;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("mandate.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "main", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::info);

  auto state_path = std::string{};
  auto enforcer_name = std::string{};
  auto terms_hex = std::string{};
  auto delegation_hex = std::string{};
  auto manager_hex = std::string{};

  auto vm = boost::program_options::variables_map{};
  auto description = boost::program_options::options_description{"Mandate"};
  description.add_options()("help,h", "Show the help message")(
      "state-path,s",
      boost::program_options::value<std::string>(&state_path)
          ->default_value("mandate.db"),
      "RocksDB directory holding persisted redemption state")(
      "list-enforcers,l", "List built-in enforcers and their addresses")(
      "check-terms,c",
      boost::program_options::value<std::string>(&enforcer_name),
      "Decode --terms with the named enforcer")(
      "terms,t", boost::program_options::value<std::string>(&terms_hex),
      "Hex encoded caveat terms")(
      "hash-delegation,d",
      boost::program_options::value<std::string>(&delegation_hex),
      "Hash a hex encoded SCALE delegation")(
      "manager,m", boost::program_options::value<std::string>(&manager_hex),
      "Manager address used for the signing digest")(
      "dump-state", "Print the persisted keyspace and checkpoint")(
      "verbose,v", "Enable verbose output");
  boost::program_options::store(
      boost::program_options::parse_command_line(argc, argv, description), vm);
  boost::program_options::notify(vm);

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    spdlog::shutdown();
    return 0;
  }

  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  auto enforcers = mandate::enforcer::make_default_registry();
  auto status = 0;
  if (vm.contains("list-enforcers")) {
    status = list_enforcers(enforcers);
  } else if (vm.contains("check-terms")) {
    status = check_terms(enforcers, enforcer_name, terms_hex);
  } else if (vm.contains("hash-delegation")) {
    status = hash_delegation(delegation_hex, manager_hex);
  } else if (vm.contains("dump-state")) {
    status = dump_state(state_path);
  } else {
    std::cout << description << std::endl;
  }

  spdlog::shutdown();
  return status;
}
