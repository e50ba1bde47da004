#pragma once

#include <cstdint>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string_view>
#include <unordered_map>

#include "perpcore/auth/key_registry.hpp"
#include "perpcore/common/spsc_ring.hpp"
#include "perpcore/ingest/frame.hpp"

namespace perpcore {
namespace ingest {

// Admission for signed command frames. A frame is queued only if its caller
// is registered, its signature verifies and its nonce is above the caller's
// last accepted nonce. One producer thread submits, one consumer drains.
class IngressPipeline {
 public:
  struct Config {
    std::size_t queue_depth{1 << 12};
  };

  enum class Verdict : std::uint8_t {
    kAccepted,
    kUnknownAccount,
    kBadSignature,
    kReplayed,
    kQueueFull,
  };

  struct Stats {
    std::uint64_t accepted{0};
    std::uint64_t rejected_unknown_account{0};
    std::uint64_t rejected_signature{0};
    std::uint64_t rejected_replay{0};
    std::uint64_t rejected_queue_full{0};
  };

  explicit IngressPipeline(const auth::KeyRegistry& keys);
  explicit IngressPipeline(const auth::KeyRegistry& keys, Config config);

  Verdict submit(Frame frame);
  [[nodiscard]] std::optional<Frame> next();

  // Raises the caller's last accepted nonce to at least `nonce`. Used to carry
  // replay protection across restarts for frames already in the journal.
  // Producer thread only.
  void observe(common::AccountId caller, std::uint64_t nonce);
  [[nodiscard]] std::optional<std::uint64_t> last_nonce(common::AccountId caller) const;

  [[nodiscard]] std::size_t pending() const noexcept { return queue_->size(); }
  [[nodiscard]] const Stats& stats() const noexcept { return stats_; }
  void reset_stats();

 private:
  const auth::KeyRegistry& keys_;
  Config config_;
  Stats stats_{};

  std::pmr::monotonic_buffer_resource arena_;
  std::pmr::unordered_map<common::AccountId, std::uint64_t> last_nonce_;
  std::unique_ptr<common::SpscRing<Frame>> queue_;
};

[[nodiscard]] std::string_view to_string(IngressPipeline::Verdict verdict) noexcept;

}  // namespace ingest
}  // namespace perpcore
