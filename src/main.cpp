#include <spdlog/async.h>
#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <couponguard/crypto/sign.hpp>
#include <couponguard/execution/engine.hpp>
#include <couponguard/execution/signer.hpp>
#include <couponguard/execution/verifier.hpp>
#include <couponguard/storage/rocksdb/storage.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;

using namespace couponguard::schema;

namespace {

struct cli_options final {
  std::string command;
  std::string db_path;
  std::string secret_hex;
  std::string ed25519_seed_hex;
  uint64_t max_token_age_hours{24};
  uint32_t consume_retries{8};
  bool verbose{};

  std::string token;
  std::string coupon_code;
  std::string name;
  std::string campaign_status{"ACTIVE"};
  uint64_t campaign_id{};
  uint64_t coupon_id{};
  uint64_t station_id{};
  std::string dispenser_id;
  std::string fuel_type;
  int64_t purchase_amount{-1};
  int64_t discount_amount{-1};
  uint32_t discount_basis_points{};
  int64_t minimum_purchase{-1};
  uint32_t max_uses{};
  uint32_t raffle_tickets{1};
  uint64_t valid_days{30};
  uint64_t ttl_minutes{15};
  std::vector<std::string> fuel_types;
  std::vector<uint64_t> stations;
};

void install_logger(const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(
      "couponguard.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "couponguard", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

std::optional<signing_key_t> load_signing_key(const cli_options& options) {
  if (!options.ed25519_seed_hex.empty()) {
    auto seed = try_from_hex(options.ed25519_seed_hex);
    auto key = ed25519_private_key_t{};
    if (!seed || seed->size() != key.seed.size()) {
      spdlog::error("ed25519-seed-hex must be {} bytes of hex", key.seed.size());
      return std::nullopt;
    }
    std::copy(std::begin(*seed), std::end(*seed), std::begin(key.seed));
    return key;
  }
  if (!options.secret_hex.empty()) {
    auto secret = try_from_hex(options.secret_hex);
    if (!secret || secret->empty()) {
      spdlog::error("secret-hex is not valid hex");
      return std::nullopt;
    }
    return hmac_secret_t{.secret = std::move(*secret)};
  }
  return std::nullopt;
}

redemption_context_t make_context(const cli_options& options) {
  auto context = redemption_context_t{};
  if (options.station_id != 0) {
    context.station_id = options.station_id;
  }
  if (!options.fuel_type.empty()) {
    context.fuel_type = options.fuel_type;
  }
  if (options.purchase_amount >= 0) {
    context.purchase_amount = options.purchase_amount;
  }
  return context;
}

void print_outcome(const validation_outcome_t& outcome) {
  fmt::print("valid={} can_be_used={} found={} authenticated={}\n",
             outcome.is_valid, outcome.can_be_used, outcome.found,
             outcome.authenticated);
  if (outcome.coupon) {
    fmt::print("coupon {} '{}' status={} uses={}\n", outcome.coupon->coupon_id,
               outcome.coupon->coupon_code, to_string(outcome.coupon->status),
               outcome.coupon->current_uses);
  }
  for (const auto& violation : outcome.violations) {
    fmt::print("  [{}] {}\n", to_string(violation.code), violation.message);
  }
}

void print_transition(const transition_result_t& result) {
  if (result.success) {
    fmt::print("ok: coupon {} is {}\n", result.coupon->coupon_id,
               to_string(result.coupon->status));
    return;
  }
  fmt::print("failed: error {}\n",
             static_cast<uint32_t>(result.error.value_or(
                 transition_error_code::invalid_transition)));
}

int run(const cli_options& options) {
  auto signing_key = load_signing_key(options);

  if (options.command == "station-token" ||
      options.command == "verify-station-token") {
    if (!signing_key ||
        !std::holds_alternative<ed25519_private_key_t>(*signing_key)) {
      spdlog::error("station tokens need --ed25519-seed-hex");
      return 1;
    }
    const auto& key = std::get<ed25519_private_key_t>(*signing_key);
    auto now = couponguard::execution::system_time_source()();
    if (options.command == "station-token") {
      auto token = couponguard::execution::signer::sign_station_token(
          options.station_id, options.dispenser_id, now,
          now + options.ttl_minutes * 60 * kMillisecondsPerSecond, key);
      if (!token) {
        spdlog::error("could not sign station token");
        return 1;
      }
      fmt::print("{}\n", *token);
      return 0;
    }
    auto public_key = couponguard::crypto::public_key_of(key);
    if (!public_key) {
      return 1;
    }
    auto verification = couponguard::execution::verifier::verify_station_token(
        options.token, *public_key, now);
    fmt::print("status={}\n", static_cast<int>(verification.status));
    return verification.status == station_token_status_t::valid ? 0 : 2;
  }

  auto storage =
      couponguard::storage::make_storage<couponguard::storage::rocksdb_storage_tag>(
          options.db_path);
  auto signing_keys = couponguard::execution::signing_key_provider_t{};
  auto verification_keys = couponguard::execution::verification_key_provider_t{};
  if (signing_key) {
    signing_keys =
        couponguard::execution::make_global_signing_key_provider(*signing_key);
    verification_keys =
        couponguard::execution::make_derived_verification_key_provider(
            signing_keys);
  } else {
    spdlog::warn("No key configured; signatures will not verify");
  }

  auto engine_options = couponguard::execution::engine_options{
      .max_token_age = options.max_token_age_hours * kMillisecondsPerHour,
      .consume_retry_limit = options.consume_retries};
  auto engine = couponguard::execution::engine{
      storage, signing_keys, verification_keys,
      couponguard::execution::system_time_source(), engine_options};
  auto now = couponguard::execution::system_time_source()();

  if (options.command == "campaign-put") {
    auto status = try_from_string<campaign_status_t>(options.campaign_status);
    if (!status) {
      spdlog::error("Unknown campaign status '{}'", options.campaign_status);
      return 1;
    }
    auto campaign = campaign_state_t{
        .campaign_id = options.campaign_id,
        .name = options.name,
        .status = *status,
        .start_date = now,
        .end_date = now + options.valid_days * kMillisecondsPerDay,
        .raffle_tickets_per_coupon = options.raffle_tickets};
    if ((options.discount_amount != -1 && options.discount_amount <= 0) ||
        options.discount_basis_points > kMaxBasisPoints) {
      spdlog::error("Discount must be a positive amount or at most {} bp",
                    kMaxBasisPoints);
      return 1;
    }
    if (options.discount_amount > 0) {
      campaign.default_discount =
          fixed_amount_discount_t{.amount = options.discount_amount};
    } else if (options.discount_basis_points > 0) {
      campaign.default_discount =
          percentage_discount_t{.basis_points = options.discount_basis_points};
    }
    if (auto existing = engine.repository().find_campaign(options.campaign_id)) {
      campaign.generated_coupons = existing->generated_coupons;
      campaign.used_coupons = existing->used_coupons;
    }
    engine.repository().save_campaign(campaign);
    fmt::print("campaign {} saved\n", campaign.campaign_id);
    return 0;
  }

  if (options.command == "issue") {
    auto request = issue_request_t{
        .campaign_id = options.campaign_id,
        .valid_from = now,
        .valid_until = now + options.valid_days * kMillisecondsPerDay,
        .applicable_fuel_types = options.fuel_types,
        .applicable_stations = options.stations};
    if (!options.coupon_code.empty()) {
      request.coupon_code = options.coupon_code;
    }
    if (options.minimum_purchase >= 0) {
      request.minimum_purchase_amount = options.minimum_purchase;
    }
    if (options.max_uses > 0) {
      request.max_uses = options.max_uses;
    }
    auto result = engine.issue_coupon(request);
    if (!result.success) {
      fmt::print("failed: error {}\n",
                 static_cast<uint32_t>(result.error.value_or(
                     issue_error_code::signing_failed)));
      return 1;
    }
    fmt::print("coupon {} code={}\n{}\nsignature={}\n",
               result.coupon->coupon_id, result.coupon->coupon_code,
               result.coupon->token, result.coupon->token_signature);
    return 0;
  }

  if (options.command == "validate") {
    auto outcome =
        options.token.empty()
            ? engine.validate_by_coupon_code(options.coupon_code,
                                             make_context(options))
            : engine.validate_for_redemption(options.token,
                                             make_context(options));
    print_outcome(outcome);
    return outcome.is_valid ? 0 : 2;
  }

  if (options.command == "pre-validate") {
    auto result = engine.pre_validate(options.token);
    fmt::print("exists={} active={} expired={} discount='{}'\n", result.exists,
               result.is_active, result.is_expired,
               result.discount_info.value_or(""));
    return result.exists ? 0 : 2;
  }

  if (options.command == "consume") {
    auto result = engine.consume_use(options.coupon_id);
    fmt::print("success={} attempts={}\n", result.success, result.attempts);
    for (const auto& violation : result.violations) {
      fmt::print("  [{}] {}\n", to_string(violation.code), violation.message);
    }
    return result.success ? 0 : 2;
  }

  if (options.command == "stats") {
    auto stats = engine.usage_stats(options.coupon_id);
    if (!stats) {
      fmt::print("coupon {} not found\n", options.coupon_id);
      return 2;
    }
    fmt::print("uses={} rate={:.1f}% max_reached={}\n", stats->current_uses,
               stats->usage_rate, stats->is_max_uses_reached);
    return 0;
  }

  if (options.command == "activate") {
    auto result = engine.activate(options.coupon_id);
    print_transition(result);
    return result.success ? 0 : 2;
  }
  if (options.command == "deactivate") {
    auto result = engine.deactivate(options.coupon_id);
    print_transition(result);
    return result.success ? 0 : 2;
  }
  if (options.command == "cancel") {
    auto result = engine.cancel(options.coupon_id);
    print_transition(result);
    return result.success ? 0 : 2;
  }

  if (options.command == "expire") {
    fmt::print("expired {} coupon(s)\n", engine.expire_overdue());
    return 0;
  }

  if (options.command == "audit") {
    auto failed = 0;
    for (const auto& report : engine.audit_all()) {
      if (report.is_intact) {
        continue;
      }
      ++failed;
      fmt::print("coupon {}:\n", report.coupon_id);
      for (auto issue : report.issues) {
        fmt::print("  {}\n", to_string(issue));
      }
    }
    return failed == 0 ? 0 : 2;
  }

  spdlog::error("Unknown command '{}'", options.command);
  return 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto options = cli_options{};
  auto config_path = std::string{};

  auto vm = po::variables_map{};
  auto general = po::options_description{"Couponguard"};
  general.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with any of the configuration options")(
      "command", po::value<std::string>(&options.command),
      "campaign-put | issue | validate | pre-validate | consume | stats | "
      "activate | deactivate | cancel | expire | audit | station-token | "
      "verify-station-token");

  auto config = po::options_description{"Configuration"};
  config.add_options()(
      "db-path", po::value<std::string>(&options.db_path)
                     ->default_value("couponguard.db"),
      "RocksDB directory")("secret-hex",
                           po::value<std::string>(&options.secret_hex),
                           "HMAC-SHA256 secret, hex")(
      "ed25519-seed-hex", po::value<std::string>(&options.ed25519_seed_hex),
      "Ed25519 private key seed, 32 bytes hex; wins over secret-hex")(
      "max-token-age-hours",
      po::value<uint64_t>(&options.max_token_age_hours)->default_value(24),
      "Reject tokens issued longer ago than this")(
      "consume-retries",
      po::value<uint32_t>(&options.consume_retries)->default_value(8),
      "Optimistic attempts per consumption")(
      "verbose,v", po::bool_switch(&options.verbose), "Enable debug logging");

  auto arguments = po::options_description{"Command arguments"};
  arguments.add_options()("token,t", po::value<std::string>(&options.token),
                          "Coupon or station token")(
      "code", po::value<std::string>(&options.coupon_code), "Coupon code")(
      "name", po::value<std::string>(&options.name), "Campaign name")(
      "campaign-status", po::value<std::string>(&options.campaign_status),
      "DRAFT | ACTIVE | PAUSED | COMPLETED | CANCELLED")(
      "campaign", po::value<uint64_t>(&options.campaign_id), "Campaign id")(
      "coupon", po::value<uint64_t>(&options.coupon_id), "Coupon id")(
      "station", po::value<uint64_t>(&options.station_id), "Station id")(
      "dispenser", po::value<std::string>(&options.dispenser_id),
      "Dispenser id")("fuel", po::value<std::string>(&options.fuel_type),
                      "Fuel type of the redemption")(
      "amount", po::value<int64_t>(&options.purchase_amount),
      "Purchase amount in cents")(
      "discount-amount", po::value<int64_t>(&options.discount_amount),
      "Campaign fixed discount in cents")(
      "discount-bp", po::value<uint32_t>(&options.discount_basis_points),
      "Campaign percentage discount in basis points")(
      "minimum", po::value<int64_t>(&options.minimum_purchase),
      "Minimum purchase in cents")(
      "max-uses", po::value<uint32_t>(&options.max_uses), "Maximum uses")(
      "raffle-tickets", po::value<uint32_t>(&options.raffle_tickets),
      "Raffle tickets per coupon")(
      "valid-days", po::value<uint64_t>(&options.valid_days),
      "Validity from now, in days")(
      "ttl-minutes", po::value<uint64_t>(&options.ttl_minutes),
      "Station token lifetime")(
      "fuel-types", po::value<std::vector<std::string>>(&options.fuel_types)
                        ->multitoken(),
      "Applicable fuel types")(
      "stations",
      po::value<std::vector<uint64_t>>(&options.stations)->multitoken(),
      "Applicable station ids");

  auto all = po::options_description{};
  all.add(general).add(config).add(arguments);
  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(all)
                  .positional(positional)
                  .run(),
              vm);
    if (vm.contains("config")) {
      auto file = std::ifstream{vm["config"].as<std::string>()};
      if (!file) {
        std::cerr << "cannot open config file" << std::endl;
        return 1;
      }
      po::store(po::parse_config_file(file, config), vm);
    }
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << std::endl << all << std::endl;
    return 1;
  }

  if (vm.contains("help") || options.command.empty()) {
    std::cout << all << std::endl;
    return 0;
  }

  install_logger(options.verbose);
  auto status = run(options);
  spdlog::shutdown();
  return status;
}
