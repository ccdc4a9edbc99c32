#pragma once

#include <tandem/schema/enum_string.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// One kind per counted protocol step; the registry keeps one counter each.
namespace tandem::schema {

enum class audit_event_type_t : uint16_t {
  shared_account_created = 0,
  claimer_added = 1,
  claimer_removed = 2,
  capability_claimed = 3,
  authority_acquired = 4,
};

inline constexpr std::size_t kAuditEventTypeCount = 5;

inline constexpr auto kAuditEventTypeMappings = std::array{
    std::pair<std::string_view, audit_event_type_t>{
        "shared_account_created", audit_event_type_t::shared_account_created},
    std::pair<std::string_view, audit_event_type_t>{
        "claimer_added", audit_event_type_t::claimer_added},
    std::pair<std::string_view, audit_event_type_t>{
        "claimer_removed", audit_event_type_t::claimer_removed},
    std::pair<std::string_view, audit_event_type_t>{
        "capability_claimed", audit_event_type_t::capability_claimed},
    std::pair<std::string_view, audit_event_type_t>{
        "authority_acquired", audit_event_type_t::authority_acquired},
};

template <>
struct enum_names<audit_event_type_t> {
  static constexpr const auto& kMappings = kAuditEventTypeMappings;
};

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return enum_name(value);
}

}  // namespace tandem::schema
