#pragma once

#include <tandem/schema/audit_event_type.hpp>
#include <tandem/schema/primitives.hpp>
#include <cstdint>
#include <string_view>

// Schema key type: engine keys.
// One prefix per record type, suffixed by the owning identity, so each
// identity holds at most one record of each type.
namespace tandem::schema::key {

inline constexpr std::string_view kModuleKey{"SYS|STATE|MODULE"};
inline constexpr std::string_view kAccountKeyPrefix{"SYS|STATE|ACCOUNT|"};
inline constexpr std::string_view kRegistryKeyPrefix{"SYS|STATE|REGISTRY|"};
inline constexpr std::string_view kSharedAccountKeyPrefix{
    "SYS|STATE|SHARED_ACCOUNT|"};
inline constexpr std::string_view kManagementKeyPrefix{
    "SYS|STATE|MANAGEMENT|"};
inline constexpr std::string_view kCapabilityKeyPrefix{
    "SYS|STATE|CAPABILITY|"};
inline constexpr std::string_view kAuditEventPrefix{"SYS|EVENT|AUDIT|"};

tandem::schema::bytes_t make_module_key();
tandem::schema::bytes_t make_account_key(const account_id_t& account);
tandem::schema::bytes_t make_registry_key(const account_id_t& module);
tandem::schema::bytes_t make_shared_account_key(const account_id_t& account);
tandem::schema::bytes_t make_management_key(const account_id_t& account);
tandem::schema::bytes_t make_capability_key(const account_id_t& holder);

/// Prefix covering every audit record of one kind, in sequence order.
tandem::schema::bytes_t make_audit_event_prefix(audit_event_type_t type);
tandem::schema::bytes_t make_audit_event_key(audit_event_type_t type,
                                             uint64_t sequence);

}  // namespace tandem::schema::key
