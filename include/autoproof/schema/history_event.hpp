#pragma once

#include <autoproof/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <string_view>

// Schema type: history event.
// Registry workflow: one row of a part's append-only audit log, addressed by
// (part_id, index) with index starting at 1.
namespace autoproof::schema {

inline constexpr std::string_view kHistoryEventRegistered{"registered"};
inline constexpr std::string_view kHistoryEventTransferred{"transferred"};
inline constexpr std::string_view kHistoryEventBurned{"burned"};
inline constexpr std::string_view kHistoryEventStatusUpdatedPrefix{
    "status-updated-"};

inline std::string make_status_updated_event(const std::string_view status) {
  auto event = std::string{kHistoryEventStatusUpdatedPrefix};
  event.append(status);
  return event;
}

template <uint16_t Version>
struct history_event;

template <>
struct history_event<1> final {
  uint16_t version{1};
  std::string event;
  timestamp_milliseconds_t timestamp{};
  principal_t actor;

  bool operator==(const history_event<1>&) const = default;
};

using history_event_t = history_event<1>;

}  // namespace autoproof::schema
