#include <tandem/schema/key/builder.hpp>
#include <tandem/schema/key/engine_keys.hpp>

using namespace tandem::schema;

namespace tandem::schema::key {

namespace {

bytes_t make_identity_key(const std::string_view prefix,
                          const account_id_t& account) {
  return builder{prefix}.write(account).take();
}

}  // namespace

bytes_t make_module_key() {
  return make_bytes(kModuleKey);
}

bytes_t make_account_key(const account_id_t& account) {
  return make_identity_key(kAccountKeyPrefix, account);
}

bytes_t make_registry_key(const account_id_t& module) {
  return make_identity_key(kRegistryKeyPrefix, module);
}

bytes_t make_shared_account_key(const account_id_t& account) {
  return make_identity_key(kSharedAccountKeyPrefix, account);
}

bytes_t make_management_key(const account_id_t& account) {
  return make_identity_key(kManagementKeyPrefix, account);
}

bytes_t make_capability_key(const account_id_t& holder) {
  return make_identity_key(kCapabilityKeyPrefix, holder);
}

bytes_t make_audit_event_prefix(const audit_event_type_t type) {
  return builder{kAuditEventPrefix}.write(static_cast<uint16_t>(type)).take();
}

bytes_t make_audit_event_key(const audit_event_type_t type,
                             const uint64_t sequence) {
  auto b = builder{kAuditEventPrefix};
  b.write(static_cast<uint16_t>(type));
  b.write(sequence);
  return b.take();
}

}  // namespace tandem::schema::key
