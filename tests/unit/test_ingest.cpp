#include "test_ingest.hpp"

#include <cassert>
#include <span>
#include <stdexcept>

#include "perpcore/auth/key_registry.hpp"
#include "perpcore/ingest/commands.hpp"
#include "perpcore/ingest/frame.hpp"
#include "perpcore/ingest/ingress_pipeline.hpp"

namespace perpcore::tests {

namespace cmd = ingest::commands;

void test_command_codec() {
  const cmd::OpenPosition open{
      .owner = 9,
      .instrument = 1,
      .side = common::Side::kShort,
      .collateral = 1'000,
      .size = 5,
      .leverage = 3,
      .max_funding_rate = 100,
      .expected_price = 3'000,
      .slippage_tolerance_bps = 50,
  };
  const auto payload = cmd::encode(open);
  assert(payload.size() == 8 + 4 + 1 + 6 * 8);
  // little-endian owner
  assert(payload[0] == std::byte{9});
  assert(payload[1] == std::byte{0});

  const auto decoded = cmd::decode_open_position(payload);
  assert(decoded.owner == 9);
  assert(decoded.side == common::Side::kShort);
  assert(decoded.slippage_tolerance_bps == 50);

  bool threw = false;
  try {
    static_cast<void>(cmd::decode_open_position(std::span<const std::byte>(payload).first(payload.size() - 1)));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto bad_side = payload;
  bad_side[12] = std::byte{7};
  threw = false;
  try {
    static_cast<void>(cmd::decode_open_position(bad_side));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  const auto price = cmd::decode_price_update(cmd::encode(cmd::PriceUpdate{.instrument = 2, .mark_price = -5, .index_price = 7}));
  assert(price.instrument == 2);
  assert(price.mark_price == -5);
  assert(cmd::encode(cmd::UpdateFundingRates{}).empty());
  static_assert(cmd::kind_of<cmd::Deposit> == ingest::CommandKind::kDeposit);
}

void test_frame_signing() {
  const auth::CommandSigner signer;
  const auto frame = ingest::make_frame(7, 1, 3'600, cmd::ClosePosition{.position_id = 4, .size = 10}, signer);
  assert(frame.header.kind == ingest::CommandKind::kClosePosition);

  const auto wire = ingest::serialize(frame);
  assert(wire.size() == ingest::kHeaderSize + 4 + frame.payload.size() + auth::kSignatureSize);

  const auto parsed = ingest::deserialize(wire);
  assert(parsed.header.caller == 7);
  assert(parsed.header.nonce == 1);
  assert(parsed.header.timestamp == 3'600);
  assert(parsed.signature == frame.signature);
  assert(cmd::decode_close_position(parsed.payload).position_id == 4);
  assert(auth::verify(signer.public_key(), ingest::signing_bytes(parsed.header, parsed.payload), parsed.signature));

  // Any change to the signed bytes breaks the signature.
  auto tampered = parsed;
  tampered.header.timestamp += 1;
  assert(!auth::verify(signer.public_key(), ingest::signing_bytes(tampered.header, tampered.payload), tampered.signature));

  // configuration hex form
  const auto hex = auth::to_hex(signer.public_key());
  assert(hex.size() == 64);
  assert(auth::public_key_from_hex(hex) == signer.public_key());
  assert(!auth::public_key_from_hex("abc").has_value());

  bool threw = false;
  try {
    static_cast<void>(ingest::deserialize(std::span<const std::byte>(wire).first(wire.size() - 1)));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto unknown_kind = wire;
  unknown_kind[24] = std::byte{0xFF};
  threw = false;
  try {
    static_cast<void>(ingest::deserialize(unknown_kind));
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void test_ingress_pipeline() {
  using Verdict = ingest::IngressPipeline::Verdict;

  const auth::CommandSigner alice;
  const auth::CommandSigner mallory;
  auth::KeyRegistry keys;
  keys.register_account(1, alice.public_key());
  assert(keys.has_account(1));
  assert(keys.account_count() == 1);

  ingest::IngressPipeline pipeline{keys};

  const cmd::Deposit deposit{.asset = 1, .amount = 100};
  assert(pipeline.submit(ingest::make_frame(1, 1, 0, deposit, alice)) == Verdict::kAccepted);
  assert(pipeline.submit(ingest::make_frame(2, 1, 0, deposit, mallory)) == Verdict::kUnknownAccount);
  assert(pipeline.submit(ingest::make_frame(1, 2, 0, deposit, mallory)) == Verdict::kBadSignature);
  // replayed and stale nonces
  assert(pipeline.submit(ingest::make_frame(1, 1, 0, deposit, alice)) == Verdict::kReplayed);
  assert(pipeline.submit(ingest::make_frame(1, 5, 0, deposit, alice)) == Verdict::kAccepted);
  assert(pipeline.submit(ingest::make_frame(1, 3, 0, deposit, alice)) == Verdict::kReplayed);

  const auto& stats = pipeline.stats();
  assert(stats.accepted == 2);
  assert(stats.rejected_unknown_account == 1);
  assert(stats.rejected_signature == 1);
  assert(stats.rejected_replay == 2);
  assert(pipeline.pending() == 2);

  auto first = pipeline.next();
  assert(first.has_value());
  assert(first->header.nonce == 1);
  assert(cmd::decode_deposit(first->payload).amount == 100);
  assert(pipeline.next()->header.nonce == 5);
  assert(!pipeline.next().has_value());

  keys.unregister_account(1);
  assert(pipeline.submit(ingest::make_frame(1, 6, 0, deposit, alice)) == Verdict::kUnknownAccount);
  assert(ingest::to_string(Verdict::kReplayed) == "replayed");
}

void test_ingress_queue_full() {
  using Verdict = ingest::IngressPipeline::Verdict;

  const auth::CommandSigner signer;
  auth::KeyRegistry keys;
  keys.register_account(1, signer.public_key());
  ingest::IngressPipeline pipeline{keys, ingest::IngressPipeline::Config{.queue_depth = 2}};

  assert(pipeline.submit(ingest::make_frame(1, 1, 0, cmd::UpdateFundingRates{}, signer)) == Verdict::kAccepted);
  assert(pipeline.submit(ingest::make_frame(1, 2, 0, cmd::UpdateFundingRates{}, signer)) == Verdict::kQueueFull);
  // A frame refused for capacity does not burn its nonce.
  static_cast<void>(pipeline.next());
  assert(pipeline.submit(ingest::make_frame(1, 2, 0, cmd::UpdateFundingRates{}, signer)) == Verdict::kAccepted);
  assert(pipeline.stats().rejected_queue_full == 1);
}

void test_ingress_observed_nonces() {
  using Verdict = ingest::IngressPipeline::Verdict;

  const auth::CommandSigner signer;
  auth::KeyRegistry keys;
  keys.register_account(1, signer.public_key());
  ingest::IngressPipeline pipeline{keys};

  assert(!pipeline.last_nonce(1).has_value());
  pipeline.observe(1, 7);
  assert(pipeline.last_nonce(1) == 7u);
  // observing an older nonce never lowers the mark
  pipeline.observe(1, 3);
  assert(pipeline.last_nonce(1) == 7u);

  assert(pipeline.submit(ingest::make_frame(1, 7, 0, cmd::UpdateFundingRates{}, signer)) == Verdict::kReplayed);
  assert(pipeline.submit(ingest::make_frame(1, 8, 0, cmd::UpdateFundingRates{}, signer)) == Verdict::kAccepted);
  assert(pipeline.last_nonce(1) == 8u);

  // nonce 0 is replay-protected once observed
  pipeline.observe(2, 0);
  assert(pipeline.last_nonce(2) == 0u);
  assert(pipeline.stats().accepted == 1);
}

}  // namespace perpcore::tests
