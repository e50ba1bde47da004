#include "perpcore/funding/instrument_table.hpp"

namespace perpcore {
namespace funding {

InstrumentTable::InstrumentTable()
    : arena_(1 << 14),
      index_(&arena_) {}

bool InstrumentTable::add(common::InstrumentId instrument, common::Timestamp now) {
  std::unique_lock lock(mutex_);
  if (index_.contains(instrument)) {
    return false;
  }
  slots_.push_back(std::make_unique<Slot>(instrument, now));
  index_.emplace(instrument, slots_.size() - 1);
  return true;
}

InstrumentTable::Slot* InstrumentTable::find(common::InstrumentId instrument) const {
  std::shared_lock lock(mutex_);
  auto it = index_.find(instrument);
  if (it == index_.end()) {
    return nullptr;
  }
  return slots_[it->second].get();
}

bool InstrumentTable::contains(common::InstrumentId instrument) const {
  std::shared_lock lock(mutex_);
  return index_.contains(instrument);
}

std::vector<InstrumentTable::Slot*> InstrumentTable::slots() const {
  std::shared_lock lock(mutex_);
  std::vector<Slot*> out;
  out.reserve(slots_.size());
  for (const auto& slot : slots_) {
    out.push_back(slot.get());
  }
  return out;
}

std::vector<common::InstrumentId> InstrumentTable::ids() const {
  std::shared_lock lock(mutex_);
  std::vector<common::InstrumentId> out;
  out.reserve(slots_.size());
  for (const auto& slot : slots_) {
    out.push_back(slot->id);
  }
  return out;
}

std::size_t InstrumentTable::size() const {
  std::shared_lock lock(mutex_);
  return slots_.size();
}

}  // namespace funding
}  // namespace perpcore
