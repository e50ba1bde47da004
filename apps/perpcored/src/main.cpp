#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "perpcore/auth/key_registry.hpp"
#include "perpcore/common/time_utils.hpp"
#include "perpcore/config/config_loader.hpp"
#include "perpcore/custody/collateral_vault.hpp"
#include "perpcore/engine/command_processor.hpp"
#include "perpcore/ingest/frame.hpp"
#include "perpcore/ingest/ingress_pipeline.hpp"
#include "perpcore/keeper/keeper.hpp"
#include "perpcore/ledger/event_log.hpp"
#include "perpcore/ledger/position_ledger.hpp"
#include "perpcore/oracle/price_oracle.hpp"
#include "perpcore/replay/replay_driver.hpp"
#include "perpcore/telemetry/telemetry_sink.hpp"
#include "perpcore/wal/journal.hpp"

namespace {

struct Arguments {
  std::filesystem::path config_path{};
  std::optional<std::filesystem::path> journal_path{};
  std::optional<std::filesystem::path> inbox_path{};
  bool show_help{false};
  bool valid{true};
};

void print_usage(const char* program) {
  std::cerr << "Usage: " << program << " [config_file] [--journal path] [--inbox path]\n"
            << "  config_file: Path to TOML configuration file\n"
            << "               If not specified, uses ./perpcore.toml or generates defaults\n"
            << "  --journal:   Command journal to replay and append to (overrides the config)\n"
            << "  --inbox:     File of signed command frames to admit after replay\n";
}

Arguments parse_arguments(int argc, char* argv[]) {
  Arguments args;
  for (int i = 1; i < argc; ++i) {
    const std::string_view arg{argv[i]};
    if (arg == "--help" || arg == "-h") {
      args.show_help = true;
    } else if (arg == "--journal" || arg == "--inbox") {
      if (i + 1 >= argc) {
        args.valid = false;
        break;
      }
      (arg == "--journal" ? args.journal_path : args.inbox_path) = std::filesystem::path{argv[++i]};
    } else if (args.config_path.empty()) {
      args.config_path = std::filesystem::path{arg};
    } else {
      args.valid = false;
    }
  }
  return args;
}

std::filesystem::path find_config_path() {
  const char* home = std::getenv("HOME");
  const std::filesystem::path default_paths[] = {
      "./perpcore.toml",
      "/etc/perpcore/perpcore.toml",
      std::filesystem::path{home ? home : ""} / ".config/perpcore/perpcore.toml",
  };

  for (const auto& path : default_paths) {
    if (!path.empty() && std::filesystem::exists(path)) {
      return path;
    }
  }

  return {};
}

std::optional<perpcore::config::EngineConfig> load_config(std::filesystem::path config_path) {
  using namespace perpcore;

  if (config_path.empty()) {
    config_path = find_config_path();
  }

  if (config_path.empty()) {
    std::cout << "No config file found, using defaults\n";
    auto result = config::ConfigLoader::load_from_string(config::ConfigLoader::generate_default());
    if (!result.success) {
      std::cerr << "Failed to load default config: " << result.raw_error << "\n";
      return std::nullopt;
    }
    return std::move(result.config);
  }

  std::cout << "Loading config from: " << config_path << "\n";
  auto result = config::ConfigLoader::load(config_path);
  if (!result.success) {
    if (!result.raw_error.empty()) {
      std::cerr << "Parse error: " << result.raw_error << "\n";
    }
    for (const auto& err : result.errors) {
      std::cerr << "Validation error [" << err.field << "]: " << err.message << "\n";
    }
    return std::nullopt;
  }
  return std::move(result.config);
}

void report_rejection(std::string_view stage, const perpcore::ingest::Frame& frame, const perpcore::engine::Ack& ack) {
  std::cerr << stage << ": " << perpcore::ingest::to_string(frame.header.kind) << " from account "
            << frame.header.caller << " nonce " << frame.header.nonce << " rejected: "
            << perpcore::ledger::to_string(ack.status) << " (" << ack.reject_code << ")\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  using namespace perpcore;

  const Arguments args = parse_arguments(argc, argv);
  if (args.show_help || !args.valid) {
    print_usage(argv[0]);
    return args.valid ? 0 : 1;
  }

  auto loaded = load_config(args.config_path);
  if (!loaded) {
    return 1;
  }
  config::EngineConfig cfg = std::move(*loaded);
  const std::filesystem::path journal_path = args.journal_path.value_or(cfg.persistence.journal_path);

  std::cout << "Config loaded successfully\n";
  std::cout << "  Instruments: " << cfg.instruments.size() << "\n";
  std::cout << "  Journal path: " << journal_path << "\n";

  // State is a function of the config and the journal alone: genesis happens at
  // time 0 and every journalled frame carries its own execution time.
  common::ManualClock clock{0};

  custody::CollateralVault vault;
  for (const auto asset : cfg.custody.supported_assets) {
    vault.add_supported_asset(asset);
  }
  auto custody = vault.bind_exchange();

  oracle::PriceOracle oracle{clock, cfg.oracle.max_price_age};

  ledger::EventLog events;
  events.subscribe([](const ledger::LedgerEvent& event) {
    if (event.flagged) {
      std::cerr << "SHORTFALL: position " << event.position_id << " instrument " << event.instrument
                << " account " << event.account << " amount " << event.shortfall << "\n";
    }
  });

  telemetry::TelemetrySink telemetry;

  ledger::PositionLedger ledger{*custody,
                                oracle,
                                clock,
                                ledger::PositionLedger::Options{
                                    .params = cfg.exchange.params,
                                    .treasury = cfg.exchange.treasury_account,
                                    .start_paused = cfg.exchange.paused,
                                },
                                &events,
                                cfg.telemetry.enabled ? &telemetry : nullptr};

  for (const auto& instrument : cfg.instruments) {
    std::cout << "  Onboarding instrument " << instrument.id << " (" << instrument.symbol << ")\n";
    oracle.add_instrument(instrument.id, instrument.mark_price, instrument.index_price);
    vault.set_collateral_asset(instrument.id, instrument.collateral_asset);
    if (const auto status = ledger.add_instrument(instrument.id); status != ledger::Status::kOk) {
      std::cerr << "Failed to onboard instrument " << instrument.id << ": " << ledger::to_string(status) << "\n";
      return 1;
    }
  }

  auth::KeyRegistry keys;
  for (const auto& account : cfg.accounts) {
    const auto key = auth::public_key_from_hex(account.public_key);
    if (!key) {
      std::cerr << "Invalid public key for account " << account.id << "\n";
      return 1;
    }
    keys.register_account(account.id, *key);
  }
  std::cout << "  Auth: " << keys.account_count() << " registered accounts\n";

  engine::CommandProcessor::Options processor_options;
  processor_options.price_publishers.insert(cfg.oracle.publishers.begin(), cfg.oracle.publishers.end());

  // Replayed frames seed the nonce table, so a frame already in the journal is
  // refused if it is submitted again.
  ingest::IngressPipeline ingress{keys, ingest::IngressPipeline::Config{.queue_depth = cfg.ingress.queue_depth}};

  {
    engine::CommandProcessor replayer{ledger, oracle, vault, clock, processor_options};
    replay::Driver driver{replayer};
    driver.set_nonce_tracker(&ingress);
    driver.set_ack_handler([](std::uint64_t sequence, const ingest::Frame& frame, const engine::Ack& ack) {
      if (!ack.ok()) {
        std::cerr << "journal record " << sequence << " diverged\n";
        report_rejection("replay", frame, ack);
      }
    });
    const auto stats = driver.execute(journal_path);
    std::cout << "Replayed " << stats.records << " journal records (" << stats.applied << " applied, "
              << stats.rejected << " rejected)\n";
  }

  if (!journal_path.parent_path().empty()) {
    std::filesystem::create_directories(journal_path.parent_path());
  }
  wal::Writer journal{journal_path, cfg.persistence.journal_flush_threshold};
  engine::CommandProcessor processor{ledger, oracle, vault, clock, processor_options, &journal};

  if (args.inbox_path) {
    wal::Reader inbox{*args.inbox_path};
    wal::Record record;

    auto drain = [&] {
      while (auto frame = ingress.next()) {
        const auto ack = processor.execute(*frame);
        if (!ack.ok()) {
          report_rejection("inbox", *frame, ack);
        }
      }
    };

    while (inbox.next(record)) {
      ingest::Frame frame;
      try {
        frame = ingest::deserialize(record.payload);
      } catch (const std::runtime_error& e) {
        std::cerr << "inbox record " << record.header.sequence << " malformed: " << e.what() << "\n";
        continue;
      }
      auto verdict = ingress.submit(frame);
      if (verdict == ingest::IngressPipeline::Verdict::kQueueFull) {
        // the nonce is not consumed, so the frame can be resubmitted once drained
        drain();
        verdict = ingress.submit(std::move(frame));
      }
      if (verdict != ingest::IngressPipeline::Verdict::kAccepted) {
        std::cerr << "inbox record " << record.header.sequence << " refused: " << ingest::to_string(verdict) << "\n";
      }
    }
    drain();

    const auto& stats = ingress.stats();
    std::cout << "Inbox: " << stats.accepted << " admitted, "
              << stats.rejected_unknown_account + stats.rejected_signature + stats.rejected_replay << " refused\n";
  }

  // Maintenance runs at wall-clock time, never behind the last journalled
  // frame. Its actions are journaled like inbox commands.
  keeper::Keeper keeper{ledger, processor, cfg.keeper.account, ingress.last_nonce(cfg.keeper.account).value_or(0) + 1};
  const auto pass = keeper.run_once(std::max(clock.now(), common::SystemClock{}.now()));
  journal.sync();

  std::cout << "Keeper: funding " << ledger::to_string(pass.sweep_status) << ", " << pass.rates_updated
            << " rates updated; " << pass.liquidated << " of " << pass.scanned << " positions liquidated (fees "
            << pass.fees_earned << ")\n";
  if (pass.failed > 0) {
    std::cerr << "Keeper: " << pass.failed << " liquidations rejected\n";
  }

  std::cout << "perpcored state summary\n";
  std::cout << "  Open positions: " << ledger.position_count() << "\n";
  std::cout << "  Events: " << events.size() << " (" << events.flagged().size() << " flagged)\n";
  for (const auto instrument : ledger.supported_instruments()) {
    const auto shortfall = ledger.total_shortfall(instrument);
    if (shortfall > 0) {
      std::cerr << "  Instrument " << instrument << " shortfall: " << shortfall << "\n";
    }
  }
  if (cfg.telemetry.enabled) {
    for (const auto& counter : telemetry.counters()) {
      std::cout << "  " << telemetry::to_string(counter.metric) << ": " << counter.value << "\n";
    }
    for (const auto& summary : telemetry.drain_latency()) {
      std::cout << "  " << telemetry::to_string(summary.operation) << " latency: n=" << summary.count
                << " mean=" << summary.mean_ns << "ns p99=" << summary.p99_ns << "ns max=" << summary.max_ns
                << "ns\n";
    }
  }

  return 0;
}
