#include "perpcore/ingest/ingress_pipeline.hpp"

#include <utility>

namespace perpcore {
namespace ingest {

IngressPipeline::IngressPipeline(const auth::KeyRegistry& keys)
    : IngressPipeline(keys, Config{}) {}

IngressPipeline::IngressPipeline(const auth::KeyRegistry& keys, Config config)
    : keys_(keys),
      config_(config),
      arena_(1 << 16),
      last_nonce_(&arena_),
      queue_(std::make_unique<common::SpscRing<Frame>>(config.queue_depth)) {}

IngressPipeline::Verdict IngressPipeline::submit(Frame frame) {
  const auto key = keys_.public_key(frame.header.caller);
  if (!key) {
    ++stats_.rejected_unknown_account;
    return Verdict::kUnknownAccount;
  }

  if (!auth::verify(*key, signing_bytes(frame.header, frame.payload), frame.signature)) {
    ++stats_.rejected_signature;
    return Verdict::kBadSignature;
  }

  const common::AccountId caller = frame.header.caller;
  const std::uint64_t nonce = frame.header.nonce;
  if (auto it = last_nonce_.find(caller); it != last_nonce_.end() && nonce <= it->second) {
    ++stats_.rejected_replay;
    return Verdict::kReplayed;
  }

  if (!queue_->try_push(std::move(frame))) {
    ++stats_.rejected_queue_full;
    return Verdict::kQueueFull;
  }

  last_nonce_[caller] = nonce;
  ++stats_.accepted;
  return Verdict::kAccepted;
}

void IngressPipeline::observe(common::AccountId caller, std::uint64_t nonce) {
  auto [it, inserted] = last_nonce_.try_emplace(caller, nonce);
  if (!inserted && nonce > it->second) {
    it->second = nonce;
  }
}

std::optional<std::uint64_t> IngressPipeline::last_nonce(common::AccountId caller) const {
  if (auto it = last_nonce_.find(caller); it != last_nonce_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<Frame> IngressPipeline::next() {
  return queue_->try_pop();
}

void IngressPipeline::reset_stats() {
  stats_ = {};
}

std::string_view to_string(IngressPipeline::Verdict verdict) noexcept {
  switch (verdict) {
    case IngressPipeline::Verdict::kAccepted:
      return "accepted";
    case IngressPipeline::Verdict::kUnknownAccount:
      return "unknown_account";
    case IngressPipeline::Verdict::kBadSignature:
      return "bad_signature";
    case IngressPipeline::Verdict::kReplayed:
      return "replayed";
    case IngressPipeline::Verdict::kQueueFull:
      return "queue_full";
  }
  return "unknown";
}

}  // namespace ingest
}  // namespace perpcore
