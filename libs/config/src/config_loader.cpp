#include "perpcore/config/config_loader.hpp"

#define TOML_EXCEPTIONS 0
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <unordered_set>

namespace perpcore {
namespace config {

namespace {

std::int64_t get_int_or(const toml::table& tbl, std::string_view key, std::int64_t default_val) {
  if (auto val = tbl[key].value<std::int64_t>()) {
    return *val;
  }
  return default_val;
}

bool get_bool_or(const toml::table& tbl, std::string_view key, bool default_val) {
  if (auto val = tbl[key].value<bool>()) {
    return *val;
  }
  return default_val;
}

std::string get_str_or(const toml::table& tbl, std::string_view key, std::string_view default_val) {
  if (auto val = tbl[key].value<std::string_view>()) {
    return std::string(*val);
  }
  return std::string(default_val);
}

ExchangeConfig parse_exchange(const toml::table& root) {
  ExchangeConfig cfg;
  if (auto* exchange = root["exchange"].as_table()) {
    auto& p = cfg.params;
    p.funding_interval = get_int_or(*exchange, "funding_interval", p.funding_interval);
    p.funding_rate_factor = get_int_or(*exchange, "funding_rate_factor", p.funding_rate_factor);
    p.maintenance_margin_bps = static_cast<std::int32_t>(get_int_or(*exchange, "maintenance_margin_bps", p.maintenance_margin_bps));
    p.liquidation_fee_bps = static_cast<std::int32_t>(get_int_or(*exchange, "liquidation_fee_bps", p.liquidation_fee_bps));
    p.taker_fee_bps = static_cast<std::int32_t>(get_int_or(*exchange, "taker_fee_bps", p.taker_fee_bps));
    p.maker_fee_bps = static_cast<std::int32_t>(get_int_or(*exchange, "maker_fee_bps", p.maker_fee_bps));
    p.max_leverage = get_int_or(*exchange, "max_leverage", p.max_leverage);
    p.price_snapshot_max_age = get_int_or(*exchange, "price_snapshot_max_age", p.price_snapshot_max_age);
    p.one_position_per_instrument = get_bool_or(*exchange, "one_position_per_instrument", p.one_position_per_instrument);
    cfg.treasury_account = static_cast<common::AccountId>(get_int_or(*exchange, "treasury_account", static_cast<std::int64_t>(cfg.treasury_account)));
    cfg.paused = get_bool_or(*exchange, "paused", cfg.paused);
  }
  return cfg;
}

OracleConfig parse_oracle(const toml::table& root) {
  OracleConfig cfg;
  if (auto* oracle = root["oracle"].as_table()) {
    cfg.max_price_age = get_int_or(*oracle, "max_price_age", cfg.max_price_age);
    if (auto* publishers = (*oracle)["publishers"].as_array()) {
      cfg.publishers.clear();
      for (const auto& elem : *publishers) {
        if (auto val = elem.value<std::int64_t>()) {
          cfg.publishers.push_back(static_cast<common::AccountId>(*val));
        }
      }
    }
  }
  return cfg;
}

CustodyConfig parse_custody(const toml::table& root) {
  CustodyConfig cfg;
  if (auto* custody = root["custody"].as_table()) {
    if (auto* assets = (*custody)["supported_assets"].as_array()) {
      cfg.supported_assets.clear();
      for (const auto& elem : *assets) {
        if (auto val = elem.value<std::int64_t>()) {
          cfg.supported_assets.push_back(static_cast<common::AssetId>(*val));
        }
      }
    }
  }
  return cfg;
}

IngressConfig parse_ingress(const toml::table& root) {
  IngressConfig cfg;
  if (auto* ingress = root["ingress"].as_table()) {
    cfg.queue_depth = static_cast<std::size_t>(get_int_or(*ingress, "queue_depth", static_cast<std::int64_t>(cfg.queue_depth)));
  }
  return cfg;
}

KeeperConfig parse_keeper(const toml::table& root) {
  KeeperConfig cfg;
  if (auto* keeper = root["keeper"].as_table()) {
    cfg.account = static_cast<common::AccountId>(get_int_or(*keeper, "account", static_cast<std::int64_t>(cfg.account)));
  }
  return cfg;
}

PersistenceConfig parse_persistence(const toml::table& root) {
  PersistenceConfig cfg;
  if (auto* persistence = root["persistence"].as_table()) {
    cfg.journal_path = get_str_or(*persistence, "journal_path", cfg.journal_path.string());
    cfg.journal_flush_threshold = static_cast<std::size_t>(
        get_int_or(*persistence, "journal_flush_threshold", static_cast<std::int64_t>(cfg.journal_flush_threshold)));
  }
  return cfg;
}

TelemetryConfig parse_telemetry(const toml::table& root) {
  TelemetryConfig cfg;
  if (auto* telemetry = root["telemetry"].as_table()) {
    cfg.enabled = get_bool_or(*telemetry, "enabled", cfg.enabled);
  }
  return cfg;
}

std::vector<InstrumentConfig> parse_instruments(const toml::table& root) {
  std::vector<InstrumentConfig> instruments;
  if (auto* arr = root["instruments"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* tbl = elem.as_table()) {
        InstrumentConfig instrument;
        instrument.id = static_cast<common::InstrumentId>(get_int_or(*tbl, "id", instrument.id));
        instrument.symbol = get_str_or(*tbl, "symbol", instrument.symbol);
        instrument.collateral_asset = static_cast<common::AssetId>(get_int_or(*tbl, "collateral_asset", instrument.collateral_asset));
        instrument.mark_price = get_int_or(*tbl, "mark_price", instrument.mark_price);
        instrument.index_price = get_int_or(*tbl, "index_price", instrument.index_price);
        instruments.push_back(std::move(instrument));
      }
    }
  }

  if (instruments.empty()) {
    instruments.push_back(InstrumentConfig{});
  }

  return instruments;
}

std::vector<AccountConfig> parse_accounts(const toml::table& root) {
  std::vector<AccountConfig> accounts;
  if (auto* arr = root["accounts"].as_array()) {
    for (const auto& elem : *arr) {
      if (auto* tbl = elem.as_table()) {
        AccountConfig account;
        account.id = static_cast<common::AccountId>(get_int_or(*tbl, "id", 0));
        account.public_key = get_str_or(*tbl, "public_key", "");
        accounts.push_back(std::move(account));
      }
    }
  }
  return accounts;
}

EngineConfig parse_config(const toml::table& root) {
  EngineConfig cfg;
  cfg.exchange = parse_exchange(root);
  cfg.oracle = parse_oracle(root);
  cfg.custody = parse_custody(root);
  cfg.ingress = parse_ingress(root);
  cfg.keeper = parse_keeper(root);
  cfg.persistence = parse_persistence(root);
  cfg.telemetry = parse_telemetry(root);
  cfg.instruments = parse_instruments(root);
  cfg.accounts = parse_accounts(root);
  return cfg;
}

}  // namespace

LoadResult ConfigLoader::load(const std::filesystem::path& path) {
  LoadResult result;

  if (!std::filesystem::exists(path)) {
    result.raw_error = "Config file not found: " + path.string();
    return result;
  }

  auto parse_result = toml::parse_file(path.string());
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

LoadResult ConfigLoader::load_from_string(std::string_view toml_content) {
  LoadResult result;

  auto parse_result = toml::parse(toml_content);
  if (!parse_result) {
    std::ostringstream oss;
    oss << parse_result.error();
    result.raw_error = oss.str();
    return result;
  }

  result.config = parse_config(parse_result.table());
  result.errors = validate(result.config);
  result.success = result.errors.empty();
  return result;
}

std::vector<ValidationError> ConfigLoader::validate(const EngineConfig& config) {
  std::vector<ValidationError> errors;
  const auto& p = config.exchange.params;

  if (p.funding_interval <= 0) {
    errors.push_back({"exchange.funding_interval", "must be positive"});
  }
  if (p.funding_rate_factor < 0) {
    errors.push_back({"exchange.funding_rate_factor", "must not be negative"});
  }
  if (p.maintenance_margin_bps <= 0 || p.maintenance_margin_bps >= common::kBasisPointDenominator) {
    errors.push_back({"exchange.maintenance_margin_bps", "must be in (0, 10000)"});
  }
  if (p.liquidation_fee_bps < 0 || p.liquidation_fee_bps > common::kBasisPointDenominator) {
    errors.push_back({"exchange.liquidation_fee_bps", "must be in [0, 10000]"});
  }
  if (p.taker_fee_bps < 0 || p.taker_fee_bps > common::kBasisPointDenominator) {
    errors.push_back({"exchange.taker_fee_bps", "must be in [0, 10000]"});
  }
  if (p.maker_fee_bps < 0 || p.maker_fee_bps > common::kBasisPointDenominator) {
    errors.push_back({"exchange.maker_fee_bps", "must be in [0, 10000]"});
  }
  if (p.max_leverage <= 0) {
    errors.push_back({"exchange.max_leverage", "must be positive"});
  }
  if (p.price_snapshot_max_age < 0) {
    errors.push_back({"exchange.price_snapshot_max_age", "must not be negative"});
  }
  if (config.exchange.treasury_account == 0) {
    errors.push_back({"exchange.treasury_account", "must be non-zero"});
  }

  if (config.oracle.max_price_age < 0) {
    errors.push_back({"oracle.max_price_age", "must not be negative"});
  }

  for (const auto publisher : config.oracle.publishers) {
    if (publisher == 0) {
      errors.push_back({"oracle.publishers", "publisher account must be non-zero"});
    }
  }

  if (config.custody.supported_assets.empty()) {
    errors.push_back({"custody.supported_assets", "at least one asset is required"});
  }

  const auto depth = config.ingress.queue_depth;
  if (depth < 2 || (depth & (depth - 1)) != 0) {
    errors.push_back({"ingress.queue_depth", "must be a power of two >= 2"});
  }

  if (config.keeper.account == 0) {
    errors.push_back({"keeper.account", "must be non-zero"});
  }

  if (config.persistence.journal_path.empty()) {
    errors.push_back({"persistence.journal_path", "journal_path cannot be empty"});
  }

  std::unordered_set<common::InstrumentId> seen;
  for (std::size_t i = 0; i < config.instruments.size(); ++i) {
    const auto& instrument = config.instruments[i];
    std::string prefix = "instruments[" + std::to_string(i) + "]";

    if (!seen.insert(instrument.id).second) {
      errors.push_back({prefix + ".id", "duplicate instrument id"});
    }

    if (instrument.symbol.empty()) {
      errors.push_back({prefix + ".symbol", "symbol cannot be empty"});
    }

    const auto& assets = config.custody.supported_assets;
    if (std::find(assets.begin(), assets.end(), instrument.collateral_asset) == assets.end()) {
      errors.push_back({prefix + ".collateral_asset", "not listed in custody.supported_assets"});
    }

    if (instrument.mark_price <= 0) {
      errors.push_back({prefix + ".mark_price", "must be positive"});
    }

    if (instrument.index_price <= 0) {
      errors.push_back({prefix + ".index_price", "must be positive"});
    }
  }

  std::unordered_set<common::AccountId> accounts;
  for (std::size_t i = 0; i < config.accounts.size(); ++i) {
    const auto& account = config.accounts[i];
    std::string prefix = "accounts[" + std::to_string(i) + "]";

    if (account.id == 0) {
      errors.push_back({prefix + ".id", "account id must be non-zero"});
    } else if (!accounts.insert(account.id).second) {
      errors.push_back({prefix + ".id", "duplicate account id"});
    }

    const bool hex = std::all_of(account.public_key.begin(), account.public_key.end(),
                                 [](unsigned char c) { return std::isxdigit(c) != 0; });
    if (account.public_key.size() != 64 || !hex) {
      errors.push_back({prefix + ".public_key", "must be 64 hex characters (ed25519)"});
    }
  }

  return errors;
}

std::string ConfigLoader::generate_default() {
  return R"(# PerpCore Configuration
# Generated default configuration. Prices are integers with 8 implied decimals.

[exchange]
funding_interval = 3600         # seconds
funding_rate_factor = 1000
maintenance_margin_bps = 200    # 2%
liquidation_fee_bps = 100       # 1%
taker_fee_bps = 0
maker_fee_bps = 0
max_leverage = 50
price_snapshot_max_age = 30     # seconds
one_position_per_instrument = false
treasury_account = 1
paused = false

[oracle]
max_price_age = 60  # seconds, 0 disables
publishers = [1]

[custody]
supported_assets = [1]

[ingress]
queue_depth = 4096

[keeper]
account = 2

[persistence]
journal_path = "/var/lib/perpcore/commands.journal"
journal_flush_threshold = 128

[telemetry]
enabled = true

[[instruments]]
id = 1
symbol = "ETH-PERP"
collateral_asset = 1
mark_price = 300000000000   # 3000.00000000
index_price = 300000000000

# Command-signing keys, one table per account:
# [[accounts]]
# id = 1001
# public_key = "<64 hex chars>"
)";
}

}  // namespace config
}  // namespace perpcore
