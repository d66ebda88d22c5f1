#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <courier/bridge/bridge_config.hpp>
#include <fstream>
#include <string>

using namespace courier::schema;

namespace {

namespace po = boost::program_options;

outcome_t<address_t> parse_address(const po::variables_map& vm,
                                   const std::string& name) {
  if (!vm.contains(name)) {
    return make_error(bridge_error_code::invalid_configuration,
                      "missing required option '" + name + "'");
  }
  auto address = try_make_address(vm[name].as<std::string>());
  if (!address.has_value()) {
    return make_error(bridge_error_code::invalid_configuration,
                      "option '" + name + "' is not a 20-byte hex address");
  }
  return *address;
}

}  // namespace

namespace courier::bridge {

status_t validate_bridge_config(const bridge_config& config) {
  if (is_zero(config.self_address)) {
    return make_error(bridge_error_code::invalid_configuration,
                      "bridge address must be set");
  }
  if (is_zero(config.router)) {
    return make_error(bridge_error_code::invalid_configuration,
                      "router address must be set");
  }
  if (is_zero(config.fee_token)) {
    return make_error(bridge_error_code::invalid_configuration,
                      "fee token address must be set");
  }
  if (config.gas_limit == 0) {
    return make_error(bridge_error_code::invalid_configuration,
                      "gas limit must be positive");
  }
  if (config.origination_policy == mint_policy::owner_only &&
      is_zero(config.owner)) {
    return make_error(bridge_error_code::invalid_configuration,
                      "owner_only mint policy requires an owner");
  }
  return ok_t{};
}

outcome_t<node_config> load_node_config(std::istream& input) {
  auto description = po::options_description{"Courier"};
  description.add_options()("bridge.self_address", po::value<std::string>(),
                            "Address of this bridge contract")(
      "bridge.owner", po::value<std::string>(), "Bridge owner account")(
      "bridge.router", po::value<std::string>(),
      "Relay router address")("bridge.fee_token", po::value<std::string>(),
                              "Fee token address")(
      "bridge.chain_selector", po::value<uint64_t>(),
      "Selector of the chain hosting this bridge")(
      "bridge.gas_limit", po::value<uint64_t>()->default_value(kDefaultGasLimit),
      "Destination gas limit per message")(
      "bridge.mint_policy", po::value<std::string>()->default_value("open"),
      "Origination policy: open | owner_only")(
      "logging.level", po::value<std::string>()->default_value("info"),
      "spdlog level name")("logging.file", po::value<std::string>(),
                           "Optional log file");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_config_file(input, description), vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    return make_error(bridge_error_code::invalid_configuration, ex.what());
  }

  auto config = node_config{};
  auto self_address = parse_address(vm, "bridge.self_address");
  if (!succeeded(self_address)) {
    return error_of(self_address);
  }
  auto router = parse_address(vm, "bridge.router");
  if (!succeeded(router)) {
    return error_of(router);
  }
  auto fee_token = parse_address(vm, "bridge.fee_token");
  if (!succeeded(fee_token)) {
    return error_of(fee_token);
  }
  config.bridge.self_address = value_of(self_address);
  config.bridge.router = value_of(router);
  config.bridge.fee_token = value_of(fee_token);

  if (vm.contains("bridge.owner")) {
    auto owner = parse_address(vm, "bridge.owner");
    if (!succeeded(owner)) {
      return error_of(owner);
    }
    config.bridge.owner = value_of(owner);
  }
  if (!vm.contains("bridge.chain_selector")) {
    return make_error(bridge_error_code::invalid_configuration,
                      "missing required option 'bridge.chain_selector'");
  }
  config.bridge.chain_selector = vm["bridge.chain_selector"].as<uint64_t>();
  config.bridge.gas_limit = vm["bridge.gas_limit"].as<uint64_t>();

  auto policy = try_from_string<mint_policy>(
      vm["bridge.mint_policy"].as<std::string>());
  if (!policy.has_value()) {
    return make_error(bridge_error_code::invalid_configuration,
                      "unknown mint policy '" +
                          vm["bridge.mint_policy"].as<std::string>() +
                          "' (expected " +
                          describe_names(kMintPolicyMappings) + ")");
  }
  config.bridge.origination_policy = *policy;

  config.logging.level = vm["logging.level"].as<std::string>();
  if (vm.contains("logging.file")) {
    config.logging.file = vm["logging.file"].as<std::string>();
  }

  auto valid = validate_bridge_config(config.bridge);
  if (!succeeded(valid)) {
    return error_of(valid);
  }
  return config;
}

outcome_t<node_config> load_node_config_file(const std::string_view path) {
  auto input = std::ifstream{std::string{path}};
  if (!input) {
    spdlog::error("Unable to open configuration file '{}'", path);
    return make_error(bridge_error_code::invalid_configuration,
                      "unable to open configuration file '" +
                          std::string{path} + "'");
  }
  return load_node_config(input);
}

}  // namespace courier::bridge
