#include "test_persistence.hpp"

#include <cassert>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <limits>
#include <span>
#include <stdexcept>
#include <vector>

#include "perpcore/auth/key_registry.hpp"
#include "perpcore/engine/command_processor.hpp"
#include "perpcore/ingest/frame.hpp"
#include "perpcore/ingest/ingress_pipeline.hpp"
#include "perpcore/keeper/keeper.hpp"
#include "perpcore/replay/replay_driver.hpp"
#include "perpcore/wal/journal.hpp"
#include "test_support.hpp"

namespace perpcore::tests {

namespace {

namespace fs = std::filesystem;
namespace cmd = ingest::commands;

constexpr common::AccountId kPublisher = 50;

fs::path fresh_dir(const char* name) {
  const auto dir = fs::temp_directory_path() / "perpcore_tests" / name;
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

std::vector<std::byte> int_payload(std::int32_t value) {
  std::vector<std::byte> payload(sizeof(value));
  std::memcpy(payload.data(), &value, sizeof(value));
  return payload;
}

std::int32_t payload_int(const wal::Record& record) {
  std::int32_t value = 0;
  assert(record.payload.size() == sizeof(value));
  std::memcpy(&value, record.payload.data(), sizeof(value));
  return value;
}

engine::CommandProcessor::Options publishers() {
  return engine::CommandProcessor::Options{.price_publishers = {kPublisher}};
}

cmd::OpenPosition open_command(common::AccountId owner, common::Side side) {
  return cmd::OpenPosition{
      .owner = owner,
      .instrument = kEth,
      .side = side,
      .collateral = units(1000),
      .size = units(1),
      .leverage = 3,
      .max_funding_rate = 1'000'000'000,
      .expected_price = units(3000),
      .slippage_tolerance_bps = 100,
  };
}

}  // namespace

void test_journal_roundtrip() {
  const auto path = fresh_dir("journal") / "commands.journal";

  {
    wal::Writer writer(path, 16);
    assert(writer.append(int_payload(10)) == 1);
    assert(writer.append(int_payload(-5)) == 2);
    assert(writer.append(int_payload(7)) == 3);
    writer.sync();
  }

  // Reopening continues the sequence; the destructor flushes the tail.
  {
    wal::Writer writer(path, 1 << 16);
    assert(writer.next_sequence() == 4);
    assert(writer.append(int_payload(99)) == 4);
  }

  wal::Reader reader(path);
  wal::Record record;
  std::vector<std::int32_t> values;
  std::uint64_t expected_sequence = 1;
  while (reader.next(record)) {
    assert(record.header.sequence == expected_sequence++);
    values.push_back(payload_int(record));
  }
  assert((values == std::vector<std::int32_t>{10, -5, 7, 99}));

  reader.seek_sequence(3);
  assert(reader.next(record));
  assert(record.header.sequence == 3);
  assert(payload_int(record) == 7);

  reader.seek_sequence(10);
  assert(!reader.next(record));
}

void test_journal_corruption() {
  const auto path = fresh_dir("corrupt") / "commands.journal";
  {
    wal::Writer writer(path, 0);
    writer.append(int_payload(1234));
    writer.flush();
  }

  // flip the last payload byte
  {
    std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
    file.seekp(-1, std::ios::end);
    file.put('\x7f');
  }

  wal::Reader reader(path);
  wal::Record record;
  bool threw = false;
  try {
    static_cast<void>(reader.next(record));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  bool open_failed = false;
  try {
    wal::Reader missing(path.parent_path() / "missing.journal");
  } catch (const std::runtime_error&) {
    open_failed = true;
  }
  assert(open_failed);
}

void test_command_processor_acks() {
  TestExchange ex;
  engine::CommandProcessor processor{ex.ledger, ex.oracle, ex.vault, ex.clock, publishers()};
  const auth::CommandSigner signer;

  auto deposit = processor.execute(ingest::make_frame(kAlice, 1, 100, cmd::Deposit{.asset = kUsd, .amount = units(5000)}, signer));
  assert(deposit.ok());
  assert(deposit.value == units(5000));
  assert(ex.clock.now() == 100);

  // the clock never moves backwards
  static_cast<void>(processor.execute(ingest::make_frame(kAlice, 2, 50, cmd::UpdateFundingRates{}, signer)));
  assert(ex.clock.now() == 100);

  assert(processor.execute(ingest::make_frame(kAlice, 3, 100, cmd::Deposit{.asset = kUsd, .amount = 0}, signer)).status ==
         ledger::Status::kInvalidAmount);
  assert(processor.execute(ingest::make_frame(kAlice, 4, 100, cmd::Withdraw{.asset = kUsd, .amount = units(6000)}, signer))
             .status == ledger::Status::kInsufficientFunds);
  const auto withdraw =
      processor.execute(ingest::make_frame(kAlice, 5, 100, cmd::Withdraw{.asset = kUsd, .amount = units(1000)}, signer));
  assert(withdraw.ok());
  assert(withdraw.value == units(4000));

  const auto opened = processor.execute(ingest::make_frame(kAlice, 6, 100, open_command(kAlice, common::Side::kLong), signer));
  assert(opened.ok());
  const auto id = static_cast<common::PositionId>(opened.value);
  assert(ex.ledger.get_position(id).has_value());

  auto reckless = open_command(kAlice, common::Side::kLong);
  reckless.leverage = 100;
  const auto refused = processor.execute(ingest::make_frame(kAlice, 7, 100, reckless, signer));
  assert(refused.status == ledger::Status::kLeverageTooHigh);
  assert(refused.reject_code == ledger::reject_code(ledger::Status::kLeverageTooHigh));
  assert(refused.value == 0);

  // truncated payload
  auto malformed = ingest::make_frame(kAlice, 8, 100, cmd::ClosePosition{.position_id = id, .size = units(1)}, signer);
  malformed.payload.resize(4);
  assert(processor.execute(malformed).status == ledger::Status::kMalformedCommand);

  const cmd::PriceUpdate update{.instrument = kEth, .mark_price = units(3100), .index_price = units(3050)};
  assert(processor.execute(ingest::make_frame(kAlice, 9, 100, update, signer)).status == ledger::Status::kUnauthorized);
  const auto published = processor.execute(ingest::make_frame(kPublisher, 1, 100, update, signer));
  assert(published.ok());
  assert(published.value == units(3100));
  assert(ex.oracle.price(kEth).price == units(3100));

  auto unknown = update;
  unknown.instrument = 42;
  assert(processor.execute(ingest::make_frame(kPublisher, 2, 100, unknown, signer)).status ==
         ledger::Status::kUnsupportedInstrument);
  auto zero = update;
  zero.mark_price = 0;
  assert(processor.execute(ingest::make_frame(kPublisher, 3, 100, zero, signer)).status == ledger::Status::kInvalidPrice);

  // amounts beyond fixed-point range
  const auto huge = processor.execute(ingest::make_frame(
      kAlice, 10, 100, cmd::IncreasePosition{.position_id = id, .collateral = 1, .size = std::numeric_limits<std::int64_t>::max()}, signer));
  assert(huge.status == ledger::Status::kArithmeticOverflow);

  assert(processor.execute(ingest::make_frame(kAlice, 11, 100, cmd::AuthorizeAgent{.agent = kBob}, signer)).ok());
  assert(ex.ledger.is_authorized(kAlice, kBob));
  assert(processor.execute(ingest::make_frame(kAlice, 12, 100, cmd::RevokeAgent{.agent = kBob}, signer)).ok());
  assert(processor.execute(ingest::make_frame(kAlice, 13, 100, cmd::RevokeAgent{.agent = kBob}, signer)).status ==
         ledger::Status::kUnauthorized);

  const auto closed = processor.execute(ingest::make_frame(kAlice, 14, 100, cmd::ClosePosition{.position_id = id, .size = units(1)}, signer));
  assert(closed.ok());
  assert(closed.value > 0);
  assert(ex.ledger.position_count() == 0);

  // a rejected frame leaves the clock where it was
  assert(processor.execute(ingest::make_frame(kAlice, 15, 10'000, cmd::ClosePosition{.position_id = id, .size = units(1)}, signer))
             .status == ledger::Status::kPositionNotFound);
  assert(ex.clock.now() == 100);

  assert(processor.executed() == 8);
  assert(processor.rejected() == 10);
}

void test_replay_rebuilds_state() {
  const auto path = fresh_dir("replay") / "commands.journal";
  const auth::CommandSigner signer;

  TestExchange live;
  std::uint64_t journalled = 0;
  {
    wal::Writer journal(path, 256);
    engine::CommandProcessor processor{live.ledger, live.oracle, live.vault, live.clock, publishers(), &journal};

    auto run = [&](common::AccountId caller, std::uint64_t nonce, common::Timestamp ts, const auto& command) {
      const auto ack = processor.execute(ingest::make_frame(caller, nonce, ts, command, signer));
      if (ack.ok()) {
        ++journalled;
      }
      return ack;
    };

    assert(run(kAlice, 1, 0, cmd::Deposit{.asset = kUsd, .amount = units(5000)}).ok());
    assert(run(kBob, 1, 0, cmd::Deposit{.asset = kUsd, .amount = units(5000)}).ok());
    assert(run(kAlice, 2, 10, open_command(kAlice, common::Side::kLong)).ok());
    assert(run(kBob, 2, 10, open_command(kBob, common::Side::kShort)).ok());
    // rejected frames stay out of the journal
    assert(!run(kBob, 3, 10, cmd::Withdraw{.asset = kUsd, .amount = units(9000)}).ok());
    // Nor may they move the clock. Replay never sees this frame, so a clock
    // left at 36'000 would make the funding below diverge.
    assert(!run(kBob, 4, 36'000, cmd::ClosePosition{.position_id = 999, .size = units(1)}).ok());
    assert(live.clock.now() == 10);
    assert(run(kPublisher, 1, 3'600, cmd::PriceUpdate{.instrument = kEth, .mark_price = units(3100), .index_price = units(3000)}).ok());
    assert(run(kKeeper, 1, 3'600, cmd::UpdateFundingRates{}).ok());
    assert(run(kKeeper, 2, 7'200, cmd::ApplyFunding{.position_id = 1}).ok());
    assert(run(kAlice, 3, 7'200, cmd::DecreasePosition{.position_id = 1, .size = units(1) / 2}).ok());
    journal.sync();
    assert(journal.next_sequence() == journalled + 1);
  }

  TestExchange rebuilt;
  engine::CommandProcessor processor{rebuilt.ledger, rebuilt.oracle, rebuilt.vault, rebuilt.clock, publishers()};
  replay::Driver driver{processor};
  std::uint64_t acked = 0;
  driver.set_ack_handler([&](std::uint64_t sequence, const ingest::Frame&, const engine::Ack& ack) {
    assert(sequence == acked + 1);
    assert(ack.ok());
    ++acked;
  });

  const auto stats = driver.execute(path);
  assert(stats.records == journalled);
  assert(stats.applied == journalled);
  assert(stats.rejected == 0);
  assert(stats.last_sequence == journalled);
  assert(acked == journalled);

  assert(live.clock.now() == 7'200);
  assert(rebuilt.clock.now() == live.clock.now());
  assert(rebuilt.ledger.funding_state(kEth)->last_funding_update_time == live.ledger.funding_state(kEth)->last_funding_update_time);
  assert(rebuilt.ledger.open_position_ids() == live.ledger.open_position_ids());
  for (const auto id : live.ledger.open_position_ids()) {
    const auto expected = live.ledger.get_position(id);
    const auto actual = rebuilt.ledger.get_position(id);
    assert(expected && actual);
    assert(actual->owner == expected->owner);
    assert(actual->size == expected->size);
    assert(actual->collateral == expected->collateral);
    assert(actual->entry_price == expected->entry_price);
    assert(actual->last_funding_time == expected->last_funding_time);
    assert(actual->accumulated_funding == expected->accumulated_funding);
  }
  for (const auto account : {kAlice, kBob, kTreasury}) {
    assert(rebuilt.balance(account) == live.balance(account));
  }
  assert(rebuilt.ledger.funding_state(kEth)->global_funding_rate == live.ledger.funding_state(kEth)->global_funding_rate);
  assert(rebuilt.oracle.price(kEth).price == units(3100));

  // replay from a later sequence skips the deposits
  TestExchange partial;
  engine::CommandProcessor partial_processor{partial.ledger, partial.oracle, partial.vault, partial.clock, publishers()};
  replay::Driver partial_driver{partial_processor};
  const auto tail = partial_driver.execute(path, 3);
  // opens fail without deposits; the price and rate updates still apply
  assert(tail.records == journalled - 2);
  assert(tail.applied == 2);
  assert(tail.rejected == 4);
  assert(partial.ledger.position_count() == 0);

  const auto none = partial_driver.execute(path.parent_path() / "absent.journal");
  assert(none.records == 0);
}

void test_restart_refuses_journaled_nonces() {
  using Verdict = ingest::IngressPipeline::Verdict;

  const auto path = fresh_dir("restart") / "commands.journal";
  const auth::CommandSigner signer;
  auth::KeyRegistry keys;
  keys.register_account(kAlice, signer.public_key());

  const std::vector<ingest::Frame> frames{
      ingest::make_frame(kAlice, 1, 0, cmd::Deposit{.asset = kUsd, .amount = units(5000)}, signer),
      ingest::make_frame(kAlice, 2, 10, open_command(kAlice, common::Side::kLong), signer),
  };

  TestExchange live;
  {
    wal::Writer journal(path, 256);
    engine::CommandProcessor processor{live.ledger, live.oracle, live.vault, live.clock, publishers(), &journal};
    ingest::IngressPipeline ingress{keys};
    for (const auto& frame : frames) {
      assert(ingress.submit(frame) == Verdict::kAccepted);
    }
    while (auto frame = ingress.next()) {
      assert(processor.execute(*frame).ok());
    }
    journal.sync();
  }
  assert(live.balance(kAlice) == units(4000));

  // Second process: fresh ingress, nonces recovered from the journal.
  TestExchange rebuilt;
  engine::CommandProcessor processor{rebuilt.ledger, rebuilt.oracle, rebuilt.vault, rebuilt.clock, publishers()};
  ingest::IngressPipeline ingress{keys};
  assert(!ingress.last_nonce(kAlice).has_value());
  replay::Driver driver{processor};
  driver.set_nonce_tracker(&ingress);
  assert(driver.execute(path).applied == 2);
  assert(ingress.last_nonce(kAlice) == 2u);

  for (const auto& frame : frames) {
    assert(ingress.submit(frame) == Verdict::kReplayed);
  }
  assert(ingress.pending() == 0);
  assert(ingress.stats().rejected_replay == 2);
  assert(rebuilt.balance(kAlice) == live.balance(kAlice));
  assert(rebuilt.ledger.position_count() == 1);

  assert(ingress.submit(ingest::make_frame(kAlice, 3, 20, cmd::Withdraw{.asset = kUsd, .amount = units(1000)}, signer)) ==
         Verdict::kAccepted);
}

void test_keeper_actions_are_journaled() {
  const auto path = fresh_dir("keeper") / "commands.journal";
  const auth::CommandSigner signer;

  TestExchange live;
  {
    wal::Writer journal(path, 256);
    engine::CommandProcessor processor{live.ledger, live.oracle, live.vault, live.clock, publishers(), &journal};
    assert(processor.execute(ingest::make_frame(kAlice, 1, 0, cmd::Deposit{.asset = kUsd, .amount = units(5000)}, signer)).ok());
    assert(processor.execute(ingest::make_frame(kAlice, 2, 10, open_command(kAlice, common::Side::kLong), signer)).ok());
    const cmd::PriceUpdate crash{.instrument = kEth, .mark_price = units(2030), .index_price = units(3000)};
    assert(processor.execute(ingest::make_frame(kPublisher, 1, 3'600, crash, signer)).ok());

    keeper::Keeper keeper{live.ledger, processor, kKeeper, 1};
    const auto report = keeper.run_once(3'600);
    assert(report.rates_updated == 1);
    assert(report.liquidated == 1);
    journal.sync();
    // deposit, open, price, sweep, liquidation
    assert(journal.next_sequence() == 6);
  }
  assert(live.ledger.position_count() == 0);
  assert(live.balance(kKeeper) == 2'030'000'000);

  TestExchange rebuilt;
  engine::CommandProcessor processor{rebuilt.ledger, rebuilt.oracle, rebuilt.vault, rebuilt.clock, publishers()};
  replay::Driver driver{processor};
  const auto stats = driver.execute(path);
  assert(stats.records == 5);
  assert(stats.applied == 5);
  assert(stats.rejected == 0);

  assert(rebuilt.ledger.position_count() == 0);
  assert(rebuilt.clock.now() == live.clock.now());
  for (const auto account : {kAlice, kKeeper, kTreasury}) {
    assert(rebuilt.balance(account) == live.balance(account));
  }
  const auto expected = live.ledger.funding_state(kEth);
  const auto actual = rebuilt.ledger.funding_state(kEth);
  assert(actual->global_funding_rate == expected->global_funding_rate);
  assert(actual->last_funding_update_time == expected->last_funding_update_time);
  assert(rebuilt.ledger.total_shortfall(kEth) == live.ledger.total_shortfall(kEth));
}

}  // namespace perpcore::tests
