#pragma once

#include <tandem/schema/audit_event_type.hpp>
#include <tandem/schema/primitives.hpp>
#include <optional>

// Schema type: audit event record.
// Append-only protocol history. `sequence` is the per-kind counter value
// before the append, so the n-th record of a kind has sequence n - 1.
namespace tandem::schema {

template <uint16_t Version>
struct audit_event_record;

template <>
struct audit_event_record<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  audit_event_type_t type{};
  account_id_t actor{};
  account_id_t target{};
  std::optional<account_id_t> subject;  // claimer for allow-list events
};

using audit_event_record_t = audit_event_record<1>;

}  // namespace tandem::schema
