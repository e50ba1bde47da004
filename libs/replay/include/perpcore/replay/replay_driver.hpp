#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>

#include "perpcore/engine/command_processor.hpp"
#include "perpcore/ingest/frame.hpp"
#include "perpcore/ingest/ingress_pipeline.hpp"
#include "perpcore/wal/journal.hpp"

namespace perpcore {
namespace replay {

struct ReplayStats {
  std::uint64_t records{0};
  std::uint64_t applied{0};
  std::uint64_t rejected{0};  // journalled frames that no longer apply; indicates divergence
  std::uint64_t last_sequence{0};
};

// Rebuilds state by feeding a command journal through a CommandProcessor. The
// processor must not itself journal, or replayed frames would be appended
// again.
class Driver {
 public:
  using AckHandler = std::function<void(std::uint64_t, const ingest::Frame&, const engine::Ack&)>;

  explicit Driver(engine::CommandProcessor& processor) : processor_(processor) {}

  void set_ack_handler(AckHandler handler);
  // Every replayed frame's (caller, nonce) is reported to `ingress`, so frames
  // already in the journal are refused as replays when submitted again.
  void set_nonce_tracker(ingest::IngressPipeline* ingress) { nonce_tracker_ = ingress; }
  // A missing journal file is an empty journal.
  ReplayStats execute(const std::filesystem::path& journal_path, std::uint64_t from_sequence = 1);

 private:
  engine::CommandProcessor& processor_;
  AckHandler ack_handler_{};
  ingest::IngressPipeline* nonce_tracker_{nullptr};
};

}  // namespace replay
}  // namespace perpcore
