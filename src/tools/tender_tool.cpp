#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <tender/common/logging.hpp>
#include <tender/config/options.hpp>
#include <tender/crypto/domain.hpp>
#include <tender/crypto/recover.hpp>
#include <tender/crypto/typed_data.hpp>
#include <tender/schema/bid.hpp>
#include <tender/schema/encoding/scale/encoder.hpp>
#include <tender/state/event_journal.hpp>
#include <tender/state/nonce_ledger.hpp>
#include <tender/state/offer_store.hpp>
#include <tender/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

namespace po = boost::program_options;

constexpr auto kUsage = std::string_view{
    "usage: tender_tool <command> [options]\n"
    "commands: domain-separator, bid-digest, sign-bid, recover, address,\n"
    "          nonce, offer, events\n"
    "nonce, offer and events only read --db-path; the database is written by\n"
    "the service that embeds the settlement engine.\n"};

int usage_error(const std::string_view message) {
  std::cerr << "error: " << message << "\n" << kUsage;
  return 1;
}

po::options_description make_tool_options() {
  auto description = po::options_description{"Command"};
  description.add_options()("offer-id", po::value<uint64_t>(), "Offer id")(
      "bid-id", po::value<uint64_t>()->default_value(0), "Bid id")(
      "signer", po::value<std::string>(), "Signer address")(
      "bidder", po::value<std::string>(), "Bidder address")(
      "bid-token", po::value<std::string>(), "Payment token address")(
      "offer-token", po::value<std::string>(), "Offered token address")(
      "bid-amount", po::value<std::string>(), "Offer token base units")(
      "sell-amount", po::value<std::string>(), "Bid token base units")(
      "nonce", po::value<uint64_t>()->default_value(0), "Signer nonce")(
      "private-key", po::value<std::string>(), "32-byte hex private key")(
      "digest", po::value<std::string>(), "32-byte hex digest")(
      "signature", po::value<std::string>(), "65-byte hex signature")(
      "address", po::value<std::string>(), "Address to look up")(
      "from", po::value<uint64_t>()->default_value(1), "First journal entry")(
      "to", po::value<uint64_t>()->default_value(UINT64_MAX),
      "Last journal entry");
  return description;
}

std::optional<tender::schema::address_t> get_address(
    const po::variables_map& vm,
    const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return tender::schema::try_make_address(vm[name].as<std::string>());
}

std::optional<tender::schema::amount_t> get_amount(const po::variables_map& vm,
                                                   const std::string& name) {
  if (!vm.contains(name)) {
    return std::nullopt;
  }
  return tender::schema::try_make_amount(vm[name].as<std::string>());
}

std::optional<tender::schema::bid_t> build_bid(const po::variables_map& vm,
                                               std::string& error) {
  auto signer = get_address(vm, "signer");
  auto bidder = get_address(vm, "bidder");
  auto bid_token = get_address(vm, "bid-token");
  auto offer_token = get_address(vm, "offer-token");
  auto bid_amount = get_amount(vm, "bid-amount");
  auto sell_amount = get_amount(vm, "sell-amount");
  if (!vm.contains("offer-id")) {
    error = "--offer-id is required";
    return std::nullopt;
  }
  if (!signer || !bidder || !bid_token || !offer_token) {
    error = "--signer, --bidder, --bid-token and --offer-token must be "
            "20-byte hex addresses";
    return std::nullopt;
  }
  if (!bid_amount || !sell_amount) {
    error = "--bid-amount and --sell-amount must be 256-bit numbers";
    return std::nullopt;
  }

  auto bid = tender::schema::bid_t{};
  bid.offer_id = vm["offer-id"].as<uint64_t>();
  bid.bid_id = vm["bid-id"].as<uint64_t>();
  bid.signer_address = *signer;
  bid.bidder_address = *bidder;
  bid.bid_token = *bid_token;
  bid.offer_token = *offer_token;
  bid.bid_amount = *bid_amount;
  bid.sell_amount = *sell_amount;
  return bid;
}

std::optional<tender::schema::private_key_t> get_private_key(
    const po::variables_map& vm) {
  if (!vm.contains("private-key")) {
    return std::nullopt;
  }
  return tender::schema::try_make_private_key(
      vm["private-key"].as<std::string>());
}

int run_query(const tender::config::options_t& options,
              const std::string& command,
              const po::variables_map& vm) {
  using storage_t = tender::storage::rocksdb_storage_t;
  auto encoder = tender::schema::encoding::scale_encoder_t{};
  auto storage =
      tender::storage::make_storage<tender::storage::rocksdb_storage_tag>(
          options.db_path);
  auto journal = tender::state::event_journal<storage_t>{encoder, storage};

  if (command == "nonce") {
    auto address = get_address(vm, "address");
    if (!address) {
      return usage_error("--address must be a 20-byte hex address");
    }
    auto nonces = tender::state::nonce_ledger<storage_t>{encoder, storage};
    std::cout << nonces.current(*address) << std::endl;
    return 0;
  }

  if (command == "offer") {
    if (!vm.contains("offer-id")) {
      return usage_error("--offer-id is required");
    }
    auto offer_id = vm["offer-id"].as<uint64_t>();
    auto offers =
        tender::state::offer_store<storage_t>{encoder, storage, journal};
    auto details = offers.get(offer_id);
    if (!details) {
      std::cerr << "offer " << offer_id << " not found" << std::endl;
      return 1;
    }
    std::cout << "seller: " << tender::schema::to_string(details->seller)
              << "\noffer_token: "
              << tender::schema::to_string(details->offer_token)
              << "\nbid_token: "
              << tender::schema::to_string(details->bid_token)
              << "\nmin_price: " << details->min_price.str()
              << "\nmin_bid_size: " << details->min_bid_size.str()
              << "\ntotal_size: " << details->total_size.str()
              << "\noffer_token_decimals: "
              << static_cast<int>(details->offer_token_decimals) << std::endl;
    return 0;
  }

  // events
  auto entries =
      journal.events(vm["from"].as<uint64_t>(), vm["to"].as<uint64_t>());
  for (const auto& entry : entries) {
    std::cout << entry.sequence << " " << entry.event.type;
    for (const auto& attribute : entry.event.attributes) {
      std::cout << " " << attribute.key << "=" << attribute.value;
    }
    std::cout << "\n";
  }
  std::cout << "root " << tender::schema::to_string(journal.root())
            << std::endl;
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::cerr << kUsage;
    return 1;
  }
  auto command = std::string{argv[1]};

  // The command takes the program-name slot so option parsing starts after
  // it.
  auto vm = po::variables_map{};
  auto error = std::string{};
  auto options = tender::config::parse_options(argc - 1, argv + 1,
                                               make_tool_options(), vm, error);
  if (!options) {
    return usage_error(error);
  }
  if (command == "help" || vm.contains("help")) {
    std::cout << kUsage << tender::config::make_options_description()
              << make_tool_options() << std::endl;
    return 0;
  }

  tender::common::configure_logging(
      *tender::common::try_parse_log_level(options->log_level),
      options->log_file);

  auto domain = tender::crypto::domain_context{
      options->domain_name, options->domain_version, options->chain_id,
      options->verifying_contract};
  auto status = 0;

  if (command == "domain-separator") {
    std::cout << tender::schema::to_string(domain.separator()) << std::endl;
  } else if (command == "bid-digest" || command == "sign-bid") {
    auto bid = build_bid(vm, error);
    if (!bid) {
      status = usage_error(error);
    } else {
      auto digest = tender::crypto::digest_for_bid(domain, *bid,
                                                   vm["nonce"].as<uint64_t>());
      if (command == "bid-digest") {
        std::cout << tender::schema::to_string(digest) << std::endl;
      } else if (auto key = get_private_key(vm); !key) {
        status = usage_error("--private-key must be 32 bytes of hex");
      } else if (auto signature = tender::crypto::sign_digest(*key, digest);
                 !signature) {
        std::cerr << "signing failed" << std::endl;
        status = 1;
      } else {
        std::cout << "0x" << tender::schema::to_hex(*signature) << std::endl;
      }
    }
  } else if (command == "recover") {
    auto digest = vm.contains("digest") ? tender::schema::try_make_hash32(
                                              vm["digest"].as<std::string>())
                                        : std::nullopt;
    auto signature = vm.contains("signature")
                         ? tender::schema::try_make_signature(
                               vm["signature"].as<std::string>())
                         : std::nullopt;
    if (!digest || !signature) {
      status = usage_error("--digest and --signature are required hex values");
    } else if (auto signer = tender::crypto::recover_signer(*digest, *signature);
               !signer) {
      std::cerr << "signature does not recover" << std::endl;
      status = 1;
    } else {
      std::cout << tender::schema::to_string(*signer) << std::endl;
    }
  } else if (command == "address") {
    auto key = get_private_key(vm);
    auto address = key ? tender::crypto::address_of(*key) : std::nullopt;
    if (!address) {
      status = usage_error("--private-key must be a valid 32-byte secret");
    } else {
      std::cout << tender::schema::to_string(*address) << std::endl;
    }
  } else if (command == "nonce" || command == "offer" || command == "events") {
    status = run_query(*options, command, vm);
  } else {
    status = usage_error("unknown command '" + command + "'");
  }

  spdlog::shutdown();
  return status;
}
