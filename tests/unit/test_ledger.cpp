#include "test_ledger.hpp"

#include <cassert>
#include <vector>

#include "perpcore/ledger/ledger_types.hpp"
#include "test_support.hpp"

namespace perpcore::tests {

using ledger::Status;

void test_status_taxonomy() {
  assert(ledger::classify(Status::kOk) == ledger::ErrorClass::kNone);
  assert(ledger::classify(Status::kInvalidAmount) == ledger::ErrorClass::kValidation);
  assert(ledger::classify(Status::kMalformedCommand) == ledger::ErrorClass::kValidation);
  assert(ledger::classify(Status::kNotLiquidatable) == ledger::ErrorClass::kPrecondition);
  assert(ledger::classify(Status::kUnsupportedAsset) == ledger::ErrorClass::kInsufficientFunds);

  assert(ledger::reject_code(Status::kOk) == 0);
  assert(ledger::reject_code(Status::kInvalidAccount) == 3100);
  assert(ledger::reject_code(Status::kInvalidAmount) == 3101);
  assert(ledger::reject_code(Status::kPaused) == 3200);
  assert(ledger::reject_code(Status::kInsufficientFunds) == 3300);
  assert(ledger::to_string(Status::kSlippageExceeded) == "slippage_exceeded");
}

void test_open_and_close_scenario() {
  TestExchange exchange;
  exchange.fund(kAlice, units(10'000));

  const auto opened = exchange.ledger.open(
      kAlice, TestExchange::request(kAlice, common::Side::kLong, units(1000), units(1), 3));
  assert(opened.ok());
  assert(opened.position_id == 1);
  assert(opened.entry_price == units(3000));
  assert(opened.notional == units(3000));
  assert(exchange.balance(kAlice) == units(9000));
  assert(exchange.vault.pool_balance(kUsd) == units(1000));

  const auto position = exchange.ledger.get_position(opened.position_id);
  assert(position.has_value());
  assert(position->owner == kAlice);
  assert(position->collateral == units(1000));
  assert(position->leverage == 3);
  assert(exchange.ledger.positions_for(kAlice).size() == 1);

  exchange.set_price(units(3300));
  const auto closed = exchange.ledger.close(kAlice, opened.position_id, units(1));
  assert(closed.ok());
  assert(closed.position_closed);
  assert(closed.realized_pnl == units(300));
  assert(closed.collateral_returned == units(1000));
  assert(closed.payout == units(1300));
  assert(closed.shortfall == 0);
  // payout - shortfall == collateral_returned + pnl
  assert(closed.payout - closed.shortfall == closed.collateral_returned + closed.realized_pnl);
  assert(exchange.balance(kAlice) == units(10'300));
  assert(exchange.vault.pool_balance(kUsd) == -units(300));
  assert(!exchange.ledger.get_position(opened.position_id).has_value());
  assert(exchange.ledger.positions_for(kAlice).empty());

  // Ids are never reused.
  const auto reopened = exchange.ledger.open(
      kAlice, TestExchange::request(kAlice, common::Side::kLong, units(1100), units(1), 3));
  assert(reopened.ok());
  assert(reopened.position_id == 2);

  // A loss beyond the collateral pays nothing and is recorded as shortfall.
  exchange.set_price(units(2000));
  const auto lost = exchange.ledger.close(kAlice, reopened.position_id, units(1));
  assert(lost.ok());
  assert(lost.payout == 0);
  assert(lost.realized_pnl == -units(1300));
  assert(lost.shortfall == units(200));
  assert(exchange.ledger.total_shortfall(kEth) == units(200));
  assert(exchange.events.flagged().size() == 1);
}

void test_open_validation() {
  TestExchange exchange{common::ExchangeParams{}, 60};
  exchange.fund(kAlice, units(10'000));
  auto& ledger = exchange.ledger;

  auto req = TestExchange::request(kAlice, common::Side::kLong, units(1000), units(1), 3);

  auto bad = req;
  bad.owner = 0;
  assert(ledger.open(kAlice, bad).status == Status::kInvalidAccount);
  assert(ledger.open(0, req).status == Status::kInvalidAccount);

  bad = req;
  bad.collateral = 0;
  assert(ledger.open(kAlice, bad).status == Status::kInvalidAmount);

  bad = req;
  bad.size = 0;
  assert(ledger.open(kAlice, bad).status == Status::kInvalidAmount);

  bad = req;
  bad.leverage = 0;
  assert(ledger.open(kAlice, bad).status == Status::kInvalidLeverage);

  bad = req;
  bad.leverage = 51;
  assert(ledger.open(kAlice, bad).status == Status::kLeverageTooHigh);

  bad = req;
  bad.collateral = units(999);
  assert(ledger.open(kAlice, bad).status == Status::kInsufficientMargin);

  bad = req;
  bad.instrument = 9;
  assert(ledger.open(kAlice, bad).status == Status::kUnsupportedInstrument);

  // Slippage: 3000 against an expected 2900 is ~3.4%.
  bad = req;
  bad.expected_price = units(2900);
  bad.slippage_tolerance_bps = 100;
  assert(ledger.open(kAlice, bad).status == Status::kSlippageExceeded);
  bad.slippage_tolerance_bps = 500;
  assert(ledger.open(kAlice, bad).ok());

  // Not enough balance for the collateral.
  assert(ledger.open(kBob, TestExchange::request(kBob, common::Side::kLong, units(1000), units(1), 3)).status ==
         Status::kInsufficientFunds);

  // Instrument known to the ledger and oracle but with no collateral asset.
  exchange.oracle.add_instrument(2, units(100), units(100));
  assert(ledger.add_instrument(2) == Status::kOk);
  assert(ledger.add_instrument(2) == Status::kInstrumentExists);
  bad = req;
  bad.instrument = 2;
  bad.expected_price = units(100);
  assert(ledger.open(kAlice, bad).status == Status::kAssetNotConfigured);

  // Price older than the oracle's max age.
  exchange.clock.set(61);
  assert(ledger.open(kAlice, req).status == Status::kPriceStale);
  exchange.set_price(units(3000));
  assert(ledger.open(kAlice, req).ok());

  assert(ledger.position_count() == 2);
  assert(exchange.telemetry.value(telemetry::Metric::kPositionsOpened) == 2);
  assert(exchange.telemetry.value(telemetry::Metric::kRejected) == 12);
}

void test_open_policies() {
  common::ExchangeParams params;
  params.one_position_per_instrument = true;
  params.taker_fee_bps = 10;
  params.funding_rate_factor = 1000;
  TestExchange exchange{params};
  exchange.fund(kAlice, units(10'000));

  const auto req = TestExchange::request(kAlice, common::Side::kShort, units(1000), units(1), 3);
  const auto first = exchange.ledger.open(kAlice, req);
  assert(first.ok());
  assert(first.fee == units(3));
  assert(exchange.balance(kAlice) == units(10'000) - units(1003));
  assert(exchange.balance(kTreasury) == units(3));
  assert(exchange.telemetry.value(telemetry::Metric::kTradingFees) == units(3));

  assert(exchange.ledger.open(kAlice, req).status == Status::kDuplicatePosition);

  // Global rate above the caller's bound.
  exchange.fund(kBob, units(10'000));
  exchange.clock.set(3600);
  exchange.set_price(units(3300), units(3000));
  assert(exchange.ledger.update_funding_rates().report.updated == 1);
  auto bob_req = TestExchange::request(kBob, common::Side::kLong, units(1100), units(1), 3);
  bob_req.expected_price = units(3300);
  bob_req.max_funding_rate = 50;
  assert(exchange.ledger.open(kBob, bob_req).status == Status::kFundingRateExceeded);
  bob_req.max_funding_rate = 100;
  assert(exchange.ledger.open(kBob, bob_req).ok());

  // Parameters are validated as a whole.
  common::ExchangeParams broken = params;
  broken.maintenance_margin_bps = 0;
  assert(exchange.ledger.set_params(broken) == Status::kInvalidParams);
  broken = params;
  broken.one_position_per_instrument = false;
  assert(exchange.ledger.set_params(broken) == Status::kOk);
  auto second = TestExchange::request(kAlice, common::Side::kShort, units(1100), units(1), 3);
  second.expected_price = units(3300);
  assert(exchange.ledger.open(kAlice, second).ok());
  assert(exchange.ledger.positions_for(kAlice).size() == 2);
}

void test_increase_and_decrease() {
  TestExchange exchange;
  exchange.fund(kAlice, units(10'000));
  const auto id = exchange.open_reference_long();
  exchange.set_price(units(3300));

  // Added notional 3300 at the position's 3x needs 1100.
  assert(exchange.ledger.increase(kAlice, id, units(1099), units(1)).status == Status::kInsufficientMargin);
  assert(exchange.ledger.increase(kAlice, id, 0, units(1)).status == Status::kInvalidAmount);
  assert(exchange.ledger.increase(kBob, id, units(1100), units(1)).status == Status::kUnauthorized);

  const auto increased = exchange.ledger.increase(kAlice, id, units(1100), units(1));
  assert(increased.ok());
  assert(increased.size == units(2));
  assert(increased.collateral == units(2100));
  assert(increased.entry_price == units(3150));
  assert(exchange.balance(kAlice) == units(10'000) - units(2100));

  const auto event = exchange.events.events_since(exchange.events.last_sequence() - 1).front();
  assert(event.kind == ledger::EventKind::kPositionIncreased);
  assert(event.price == units(3300));
  assert(event.entry_price == units(3150));
  assert(event.size == units(1));
  assert(event.collateral == units(1100));
  assert(event.amount == 0);

  // Decrease is strictly partial.
  assert(exchange.ledger.decrease(kAlice, id, units(2)).status == Status::kInvalidSize);
  assert(exchange.ledger.decrease(kAlice, id, 0).status == Status::kInvalidSize);
  assert(exchange.ledger.close(kAlice, id, units(3)).status == Status::kInvalidSize);

  const auto decreased = exchange.ledger.decrease(kAlice, id, units(1));
  assert(decreased.ok());
  assert(!decreased.position_closed);
  assert(decreased.collateral_returned == units(1050));
  assert(decreased.realized_pnl == units(150));
  assert(decreased.payout == units(1200));
  assert(decreased.remaining_size == units(1));

  const auto position = exchange.ledger.get_position(id);
  assert(position->size == units(1));
  assert(position->collateral == units(1050));
  assert(position->entry_price == units(3150));

  const auto closed = exchange.ledger.close(kAlice, id, units(1));
  assert(closed.ok());
  assert(closed.payout == units(1200));
  assert(exchange.balance(kAlice) == units(10'300));
  assert(exchange.ledger.close(kAlice, id, units(1)).status == Status::kPositionNotFound);
}

void test_failed_custody_is_atomic() {
  TestExchange exchange;
  exchange.fund(kAlice, units(10'000));

  exchange.custody.fail_debits = true;
  const auto refused = exchange.ledger.open(
      kAlice, TestExchange::request(kAlice, common::Side::kLong, units(1000), units(1), 3));
  assert(refused.status == Status::kUnsupportedAsset);
  assert(ledger::classify(refused.status) == ledger::ErrorClass::kInsufficientFunds);
  assert(exchange.ledger.position_count() == 0);
  assert(exchange.balance(kAlice) == units(10'000));
  exchange.custody.fail_debits = false;

  const auto id = exchange.open_reference_long();
  const auto before = *exchange.ledger.get_position(id);
  const auto events_before = exchange.events.size();

  // Payout refused: the position stays exactly as it was.
  exchange.set_price(units(3300));
  exchange.custody.fail_credit_to = kAlice;
  assert(exchange.ledger.close(kAlice, id, units(1)).status == Status::kUnsupportedAsset);
  assert(exchange.ledger.decrease(kAlice, id, units(1) / 2).status == Status::kUnsupportedAsset);
  const auto after = *exchange.ledger.get_position(id);
  assert(after.size == before.size);
  assert(after.collateral == before.collateral);
  assert(exchange.vault.pool_balance(kUsd) == units(1000));
  assert(exchange.events.size() == events_before);

  // Liquidation: the keeper's fee is reversed when the owner's payout fails.
  exchange.set_price(units(2030));
  const auto keeper_before = exchange.balance(kKeeper);
  assert(exchange.ledger.liquidate(kKeeper, id).status == Status::kUnsupportedAsset);
  assert(exchange.balance(kKeeper) == keeper_before);
  assert(exchange.ledger.get_position(id).has_value());

  // Fee on open refused by the treasury: collateral debit reversed.
  exchange.custody.fail_credit_to = kTreasury;
  common::ExchangeParams params;
  params.taker_fee_bps = 10;
  assert(exchange.ledger.set_params(params) == Status::kOk);
  const auto balance_before = exchange.balance(kAlice);
  auto req = TestExchange::request(kAlice, common::Side::kLong, units(1000), units(1), 3);
  req.expected_price = units(2030);
  assert(exchange.ledger.open(kAlice, req).status == Status::kUnsupportedAsset);
  assert(exchange.balance(kAlice) == balance_before);
  assert(exchange.ledger.position_count() == 1);
}

void test_agents_and_pause() {
  TestExchange exchange;
  exchange.fund(kAlice, units(10'000));
  auto req = TestExchange::request(kAlice, common::Side::kLong, units(1000), units(1), 3);

  assert(exchange.ledger.open(kBob, req).status == Status::kUnauthorized);
  assert(exchange.ledger.authorize_agent(kAlice, kBob) == Status::kOk);
  assert(exchange.ledger.authorize_agent(kAlice, kAlice) == Status::kInvalidAccount);
  assert(exchange.ledger.is_authorized(kAlice, kBob));

  const auto opened = exchange.ledger.open(kBob, req);
  assert(opened.ok());
  // Collateral comes from the owner, not the agent.
  assert(exchange.balance(kAlice) == units(9000));
  assert(exchange.ledger.get_position(opened.position_id)->owner == kAlice);

  assert(exchange.ledger.revoke_agent(kAlice, kBob) == Status::kOk);
  assert(exchange.ledger.revoke_agent(kAlice, kBob) == Status::kUnauthorized);
  assert(exchange.ledger.close(kBob, opened.position_id, units(1)).status == Status::kUnauthorized);

  exchange.ledger.pause();
  assert(exchange.ledger.is_paused());
  assert(exchange.ledger.open(kAlice, req).status == Status::kPaused);
  assert(exchange.ledger.close(kAlice, opened.position_id, units(1)).status == Status::kPaused);
  assert(exchange.ledger.apply_funding(opened.position_id).status == Status::kPaused);
  assert(exchange.ledger.update_funding_rates().status == Status::kPaused);
  assert(exchange.ledger.liquidate(kKeeper, opened.position_id).status == Status::kPaused);
  // Reads still work.
  assert(exchange.ledger.get_position(opened.position_id).has_value());

  exchange.ledger.unpause();
  assert(exchange.ledger.close(kAlice, opened.position_id, units(1)).ok());
}

void test_event_log() {
  TestExchange exchange;
  std::vector<ledger::EventKind> seen;
  exchange.events.subscribe([&](const ledger::LedgerEvent& event) { seen.push_back(event.kind); });

  exchange.fund(kAlice, units(10'000));
  const auto id = exchange.open_reference_long();
  exchange.set_price(units(3300));
  assert(exchange.ledger.close(kAlice, id, units(1)).ok());
  exchange.ledger.pause();
  exchange.ledger.pause();  // already paused: no event

  assert(seen.size() == 3);
  assert(seen[0] == ledger::EventKind::kPositionOpened);
  assert(seen[1] == ledger::EventKind::kPositionClosed);
  assert(seen[2] == ledger::EventKind::kPaused);

  // kInstrumentAdded from the fixture comes first.
  const auto all = exchange.events.events_since(0);
  assert(all.size() == 4);
  assert(all.front().sequence == 1);
  assert(all.front().kind == ledger::EventKind::kInstrumentAdded);
  assert(exchange.events.last_sequence() == 4);

  const auto tail = exchange.events.events_since(2, 1);
  assert(tail.size() == 1);
  assert(tail[0].sequence == 3);
  assert(tail[0].kind == ledger::EventKind::kPositionClosed);
  assert(tail[0].position_id == id);
  assert(tail[0].pnl == units(300));
  assert(tail[0].amount == units(1300));
}

void test_event_subscribers_reenter_ledger() {
  TestExchange exchange;
  exchange.fund(kAlice, units(10'000));
  exchange.fund(kBob, units(10'000));

  // Subscribers run after the operation has released its locks, so they may
  // read the ledger and open positions on the same instrument.
  std::vector<common::Position> seen;
  common::PositionId nested = 0;
  exchange.events.subscribe([&](const ledger::LedgerEvent& event) {
    if (event.kind != ledger::EventKind::kPositionOpened) {
      return;
    }
    assert(exchange.ledger.funding_state(event.instrument).has_value());
    assert(exchange.ledger.liquidation_report(event.position_id).ok());
    const auto position = exchange.ledger.get_position(event.position_id);
    assert(position.has_value());
    seen.push_back(*position);
    if (event.account == kAlice) {
      const auto hedge = exchange.ledger.open(
          kBob, TestExchange::request(kBob, common::Side::kShort, units(1000), units(1), 3));
      assert(hedge.ok());
      nested = hedge.position_id;
    }
  });

  const auto id = exchange.open_reference_long();
  assert(seen.size() == 2);
  assert(seen[0].id == id);
  assert(seen[0].collateral == units(1000));
  assert(seen[1].id == nested);
  assert(seen[1].owner == kBob);
  assert(exchange.ledger.position_count() == 2);
  assert(exchange.balance(kBob) == units(9000));
}

}  // namespace perpcore::tests
