#include <tender/common/logging.hpp>
#include <tender/config/options.hpp>

namespace po = boost::program_options;

namespace tender::config {

po::options_description make_options_description() {
  auto defaults = options_t{};
  auto description = po::options_description{"Tender"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(), "INI file with default values")(
      "db-path", po::value<std::string>()->default_value(defaults.db_path),
      "RocksDB directory")(
      "domain-name",
      po::value<std::string>()->default_value(defaults.domain_name),
      "Signing domain name")(
      "domain-version",
      po::value<std::string>()->default_value(defaults.domain_version),
      "Signing domain version")(
      "chain-id", po::value<uint64_t>()->default_value(defaults.chain_id),
      "Chain id bound into every signature")(
      "verifying-contract",
      po::value<std::string>()->default_value(
          tender::schema::to_string(defaults.verifying_contract)),
      "Verifying contract address, also the settlement spender")(
      "log-level", po::value<std::string>()->default_value(defaults.log_level),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>()->default_value(defaults.log_file),
      "Also write logs to this file");
  return description;
}

std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       const po::options_description& extra,
                                       po::variables_map& vm,
                                       std::string& error) {
  auto description = make_options_description();
  description.add(extra);

  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    if (vm.contains("config")) {
      auto path = vm["config"].as<std::string>();
      po::store(po::parse_config_file(path.c_str(), description, true), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    error = ex.what();
    return std::nullopt;
  }

  auto options = options_t{};
  options.db_path = vm["db-path"].as<std::string>();
  options.domain_name = vm["domain-name"].as<std::string>();
  options.domain_version = vm["domain-version"].as<std::string>();
  options.chain_id = vm["chain-id"].as<uint64_t>();
  options.log_level = vm["log-level"].as<std::string>();
  options.log_file = vm["log-file"].as<std::string>();

  auto contract = tender::schema::try_make_address(
      vm["verifying-contract"].as<std::string>());
  if (!contract) {
    error = "verifying-contract must be a 20-byte hex address";
    return std::nullopt;
  }
  options.verifying_contract = *contract;

  if (!tender::common::try_parse_log_level(options.log_level)) {
    error = "unknown log level '" + options.log_level + "'";
    return std::nullopt;
  }
  return options;
}

std::optional<options_t> parse_options(int argc,
                                       const char* const argv[],
                                       std::string& error) {
  auto vm = po::variables_map{};
  return parse_options(argc, argv, po::options_description{}, vm, error);
}

}  // namespace tender::config
