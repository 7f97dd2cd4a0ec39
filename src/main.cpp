#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <tentacle/execution/engine.hpp>
#include <tentacle/schema/lock_error_code.hpp>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;
using tentacle::schema::address_t;

address_t get_address(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    return address_t{};
  }
  auto address =
      tentacle::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    throw po::validation_error{po::validation_error::invalid_option_value,
                               name};
  }
  return *address;
}

tentacle::schema::claim_type_id_t get_claim_type_id(const po::variables_map& vm,
                                                    const std::string& name) {
  auto value = vm[name].as<unsigned>();
  if (value >= tentacle::schema::kClaimTypeCount) {
    throw po::validation_error{po::validation_error::invalid_option_value,
                               name};
  }
  return static_cast<tentacle::schema::claim_type_id_t>(value);
}

// The command line only configures and inspects; it never drives the hooks,
// so the authority is known by identity alone.
tentacle::execution::staking_authority_t offline_authority(
    const address_t& identity) {
  auto unreachable = [](std::string_view what) {
    return std::runtime_error{std::string{what} +
                              " is not available from the command line"};
  };
  return tentacle::execution::staking_authority_t{
      .identity = identity,
      .staking_token_balance =
          [=](tentacle::schema::position_id_t) -> tentacle::schema::amount_t {
        throw unreachable("stakingTokenBalance");
      },
      .lock_manager = [=](tentacle::schema::position_id_t) -> address_t {
        throw unreachable("lockManager");
      },
      .is_approved_or_owner = [=](const address_t&,
                                  tentacle::schema::position_id_t) -> bool {
        throw unreachable("isApprovedOrOwner");
      }};
}

void print_result(const tentacle::schema::call_result_t& result) {
  if (result.ok()) {
    std::cout << "ok";
    if (!result.info.empty()) {
      std::cout << ": " << result.info;
    }
    std::cout << std::endl;
    return;
  }
  std::cout << "error "
            << tentacle::schema::code_name<tentacle::schema::lock_error_code>(
                   result.code)
            << " (" << result.code << "): " << result.log;
  if (!result.info.empty()) {
    std::cout << " [" << result.info << "]";
  }
  std::cout << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto db_path = std::string{};
  auto log_file = std::string{};

  auto vm = po::variables_map{};
  auto description = po::options_description{"Tentacle lock manager"};
  description.add_options()("help,h", "Show the help message")(
      "db,d", po::value<std::string>(&db_path)->default_value("tentacle-db"),
      "RocksDB directory")(
      "log-file", po::value<std::string>(&log_file)->default_value("tentacle.log"),
      "Log file path")("verbose,v", "Enable debug logging")(
      "self", po::value<std::string>(), "Address of this lock manager")(
      "authority", po::value<std::string>(), "Staking authority address")(
      "admin", po::value<std::string>(),
      "Administrator address allowed to configure claim types")(
      "caller", po::value<std::string>(),
      "Caller address for --configure (defaults to --admin)")(
      "configure", po::value<unsigned>(), "Configure claim type <id>")(
      "derivative", po::value<std::string>(),
      "Derivative contract address for --configure")(
      "default-helper", po::value<std::string>(),
      "Default helper address for --configure")(
      "has-default-helper", "Enable the default helper")(
      "force-default", "Always use the default helper")(
      "revert-on-override",
      "Reject overrides that differ from a forced default")(
      "show-claim-type", po::value<unsigned>(), "Print claim type <id>")(
      "show-position", po::value<tentacle::schema::position_id_t>(),
      "Print outstanding claims for position <id>")(
      "info", "Print the committed checkpoint");

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);
  auto logger = std::make_shared<spdlog::async_logger>(
      "tentacle", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_level(vm.contains("verbose") ? spdlog::level::debug
                                           : spdlog::level::info);

  std::cout << std::boolalpha;
  auto exit_code = 0;
  try {
    auto options = tentacle::execution::engine_options{
        .self = get_address(vm, "self"),
        .administrator = get_address(vm, "admin")};
    auto encoder = tentacle::execution::engine::encoder_t{};
    auto storage = tentacle::storage::make_storage<
        tentacle::storage::rocksdb_storage_tag>(db_path);
    auto directory = tentacle::execution::contract_directory{};
    auto engine = tentacle::execution::engine{
        encoder, storage, offline_authority(get_address(vm, "authority")),
        directory, options};

    if (vm.contains("configure")) {
      auto config = tentacle::schema::claim_type_config_t{
          .has_default_helper = vm.contains("has-default-helper"),
          .force_default = vm.contains("force-default"),
          .revert_if_default_forced_and_overridden =
              vm.contains("revert-on-override"),
          .derivative_contract = get_address(vm, "derivative")};
      auto default_helper = std::optional<address_t>{};
      if (vm.contains("default-helper")) {
        default_helper = get_address(vm, "default-helper");
      }
      auto caller = vm.contains("caller") ? get_address(vm, "caller")
                                          : options.administrator;
      auto result = engine.configure(caller, get_claim_type_id(vm, "configure"),
                                     config, default_helper);
      print_result(result);
      if (!result.ok()) {
        exit_code = 1;
      }
    }

    if (vm.contains("show-claim-type")) {
      auto id = get_claim_type_id(vm, "show-claim-type");
      auto config = engine.claim_type(id);
      auto helper = engine.default_helper(id);
      std::cout << "claim type " << static_cast<unsigned>(id) << ": ";
      if (!tentacle::schema::is_configured(config)) {
        std::cout << "not configured" << std::endl;
      } else {
        std::cout << "derivative="
                  << tentacle::schema::to_string(config.derivative_contract)
                  << " default_helper="
                  << (helper ? tentacle::schema::to_string(*helper) : "none")
                  << " has_default_helper=" << config.has_default_helper
                  << " force_default=" << config.force_default
                  << " revert_on_override="
                  << config.revert_if_default_forced_and_overridden
                  << std::endl;
      }
    }

    if (vm.contains("show-position")) {
      auto position_id = vm["show-position"].as<tentacle::schema::position_id_t>();
      auto bitmap = engine.outstanding(position_id);
      std::cout << "position " << position_id << ": outstanding [";
      auto first = true;
      for (const auto id : tentacle::schema::set_bits(bitmap)) {
        std::cout << (first ? "" : ",") << static_cast<unsigned>(id);
        first = false;
      }
      std::cout << "] unlocked="
                << engine.is_unlocked(get_address(vm, "authority"), position_id)
                << std::endl;
    }

    if (vm.contains("info")) {
      auto committed = engine.info();
      std::cout << "sequence=" << committed.sequence << " state_root="
                << tentacle::schema::to_hex(tentacle::schema::bytes_view_t{
                       committed.state_root.data(), committed.state_root.size()})
                << std::endl;
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl;
    exit_code = 2;
  }

  spdlog::shutdown();
  return exit_code;
}
