#pragma once

#include <cstdint>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "perpcore/common/types.hpp"

namespace perpcore {
namespace funding {

struct FundingState {
  std::int64_t global_funding_rate{0};  // bps per funding interval
  common::Timestamp last_funding_update_time{0};
};

// Supported instruments in a dense, append-only list with an id -> slot index.
// Each slot's mutex serializes every position operation on that instrument
// with funding-rate updates for it.
class InstrumentTable {
 public:
  struct Slot {
    explicit Slot(common::InstrumentId instrument_id, common::Timestamp onboarded_at)
        : id(instrument_id), funding{0, onboarded_at} {}

    const common::InstrumentId id;
    std::mutex mutex;
    FundingState funding;  // guarded by mutex
  };

  InstrumentTable();
  InstrumentTable(const InstrumentTable&) = delete;
  InstrumentTable& operator=(const InstrumentTable&) = delete;

  // Returns false if the instrument is already present.
  bool add(common::InstrumentId instrument, common::Timestamp now);

  // Slots are never removed, so returned pointers stay valid for the table's lifetime.
  [[nodiscard]] Slot* find(common::InstrumentId instrument) const;
  [[nodiscard]] bool contains(common::InstrumentId instrument) const;
  [[nodiscard]] std::vector<Slot*> slots() const;
  [[nodiscard]] std::vector<common::InstrumentId> ids() const;
  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::pmr::monotonic_buffer_resource arena_;
  std::vector<std::unique_ptr<Slot>> slots_;
  std::pmr::unordered_map<common::InstrumentId, std::size_t> index_;
};

}  // namespace funding
}  // namespace perpcore
