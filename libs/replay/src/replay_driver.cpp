#include "perpcore/replay/replay_driver.hpp"

#include <utility>

namespace perpcore {
namespace replay {

void Driver::set_ack_handler(AckHandler handler) {
  ack_handler_ = std::move(handler);
}

ReplayStats Driver::execute(const std::filesystem::path& journal_path, std::uint64_t from_sequence) {
  ReplayStats stats;
  if (!std::filesystem::exists(journal_path)) {
    return stats;
  }

  wal::Reader reader(journal_path);
  if (from_sequence > 1) {
    reader.seek_sequence(from_sequence);
  }

  wal::Record record;
  while (reader.next(record)) {
    ++stats.records;
    stats.last_sequence = record.header.sequence;

    const ingest::Frame frame = ingest::deserialize(record.payload);
    if (nonce_tracker_) {
      nonce_tracker_->observe(frame.header.caller, frame.header.nonce);
    }
    const engine::Ack ack = processor_.execute(frame);
    if (ack.ok()) {
      ++stats.applied;
    } else {
      ++stats.rejected;
    }
    if (ack_handler_) {
      ack_handler_(record.header.sequence, frame, ack);
    }
  }
  return stats;
}

}  // namespace replay
}  // namespace perpcore
