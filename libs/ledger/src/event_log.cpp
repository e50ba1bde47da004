#include "perpcore/ledger/event_log.hpp"

#include <utility>

namespace perpcore {
namespace ledger {

std::string_view to_string(EventKind kind) noexcept {
  switch (kind) {
    case EventKind::kPositionOpened:
      return "position_opened";
    case EventKind::kPositionIncreased:
      return "position_increased";
    case EventKind::kPositionDecreased:
      return "position_decreased";
    case EventKind::kPositionClosed:
      return "position_closed";
    case EventKind::kPositionLiquidated:
      return "position_liquidated";
    case EventKind::kFundingSettled:
      return "funding_settled";
    case EventKind::kFundingRateUpdated:
      return "funding_rate_updated";
    case EventKind::kShortfallRecorded:
      return "shortfall_recorded";
    case EventKind::kInstrumentAdded:
      return "instrument_added";
    case EventKind::kParamsUpdated:
      return "params_updated";
    case EventKind::kPaused:
      return "paused";
    case EventKind::kUnpaused:
      return "unpaused";
    case EventKind::kAgentAuthorized:
      return "agent_authorized";
    case EventKind::kAgentRevoked:
      return "agent_revoked";
  }
  return "unknown";
}

LedgerEvent EventLog::append(LedgerEvent event) {
  std::scoped_lock lock(mutex_);
  event.sequence = next_sequence_++;
  events_.push_back(event);
  return event;
}

void EventLog::publish(const LedgerEvent& event) const {
  std::vector<Subscriber> subscribers;
  {
    std::scoped_lock lock(mutex_);
    subscribers = subscribers_;
  }
  for (const auto& subscriber : subscribers) {
    subscriber(event);
  }
}

std::uint64_t EventLog::push(LedgerEvent event) {
  const LedgerEvent stored = append(std::move(event));
  publish(stored);
  return stored.sequence;
}

void EventLog::subscribe(Subscriber subscriber) {
  std::scoped_lock lock(mutex_);
  subscribers_.push_back(std::move(subscriber));
}

std::vector<LedgerEvent> EventLog::events_since(std::uint64_t since_sequence, std::size_t limit) const {
  std::scoped_lock lock(mutex_);
  std::vector<LedgerEvent> result;
  for (const auto& event : events_) {
    if (event.sequence <= since_sequence) {
      continue;
    }
    if (result.size() >= limit) {
      break;
    }
    result.push_back(event);
  }
  return result;
}

std::vector<LedgerEvent> EventLog::flagged() const {
  std::scoped_lock lock(mutex_);
  std::vector<LedgerEvent> result;
  for (const auto& event : events_) {
    if (event.flagged) {
      result.push_back(event);
    }
  }
  return result;
}

std::uint64_t EventLog::last_sequence() const {
  std::scoped_lock lock(mutex_);
  return next_sequence_ - 1;
}

std::size_t EventLog::size() const {
  std::scoped_lock lock(mutex_);
  return events_.size();
}

}  // namespace ledger
}  // namespace perpcore
