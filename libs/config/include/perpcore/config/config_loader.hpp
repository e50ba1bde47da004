#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "perpcore/common/params.hpp"
#include "perpcore/common/types.hpp"

namespace perpcore {
namespace config {

struct ExchangeConfig {
  common::ExchangeParams params{};
  common::AccountId treasury_account{1};
  bool paused{false};
};

struct OracleConfig {
  common::Timestamp max_price_age{60};  // seconds; 0 disables staleness checks
  std::vector<common::AccountId> publishers{1};  // accounts allowed to post prices
};

struct CustodyConfig {
  std::vector<common::AssetId> supported_assets{1};
};

struct IngressConfig {
  std::size_t queue_depth{1 << 12};
};

struct KeeperConfig {
  common::AccountId account{2};  // receives liquidation fees
};

struct PersistenceConfig {
  std::filesystem::path journal_path{"/var/lib/perpcore/commands.journal"};
  std::size_t journal_flush_threshold{128};
};

struct TelemetryConfig {
  bool enabled{true};
};

// Prices are integers in common::kPriceScale units.
struct InstrumentConfig {
  common::InstrumentId id{1};
  std::string symbol{"ETH-PERP"};
  common::AssetId collateral_asset{1};
  std::int64_t mark_price{3'000 * common::kPriceScale};
  std::int64_t index_price{3'000 * common::kPriceScale};
};

// Command-signing key of one account, hex encoded.
struct AccountConfig {
  common::AccountId id{0};
  std::string public_key{};
};

struct EngineConfig {
  ExchangeConfig exchange;
  OracleConfig oracle;
  CustodyConfig custody;
  IngressConfig ingress;
  KeeperConfig keeper;
  PersistenceConfig persistence;
  TelemetryConfig telemetry;
  std::vector<InstrumentConfig> instruments;
  std::vector<AccountConfig> accounts;
};

struct ValidationError {
  std::string field;
  std::string message;
};

struct LoadResult {
  bool success{false};
  EngineConfig config;
  std::vector<ValidationError> errors;
  std::string raw_error;
};

class ConfigLoader {
 public:
  static LoadResult load(const std::filesystem::path& path);
  static LoadResult load_from_string(std::string_view toml_content);
  static std::vector<ValidationError> validate(const EngineConfig& config);
  static std::string generate_default();
};

}  // namespace config
}  // namespace perpcore
