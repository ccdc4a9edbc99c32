#pragma once

#include <tandem/execution/address_deriver.hpp>
#include <tandem/execution/delegated_authority.hpp>
#include <tandem/schema/audit_event_record.hpp>
#include <tandem/schema/audit_event_type.hpp>
#include <tandem/schema/encoding/scale/codec.hpp>
#include <tandem/schema/management_state.hpp>
#include <tandem/schema/operation_result.hpp>
#include <tandem/schema/primitives.hpp>
#include <tandem/schema/registry_state.hpp>
#include <tandem/schema/shared_account_state.hpp>
#include <tandem/storage/rocksdb/storage.hpp>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace tandem::execution {

/// Result of an operation that yields a value on success.
///
/// `value` is engaged iff `result.ok()`.
template <typename T>
struct operation_outcome final {
  tandem::schema::operation_result_t result;
  std::optional<T> value;

  bool ok() const { return result.ok(); }
};

/// Shared-account capability state machine.
///
/// Owns the registry, shared-account factory, allow-list manager, credential
/// issuer and authority redeemer. Every operation runs under one lock and
/// commits all of its writes in a single storage batch, or none on failure.
class engine final {
 public:
  using encoder_t = tandem::schema::encoding::scale_encoder_t;
  using storage_t =
      tandem::storage::storage<tandem::storage::rocksdb_storage_tag>;

  /// Seed the installer's identity is combined with to derive the module
  /// identity holding the registry.
  static constexpr std::string_view kRegistrySeed{"tandem::registry"};

  explicit engine(encoder_t& encoder,
                  storage_t& storage,
                  address_deriver_t deriver = default_address_deriver());

  engine(const engine&) = delete;
  engine& operator=(const engine&) = delete;

  /// Create the module registry at `derive(installer, kRegistrySeed)`.
  ///
  /// Fails with `already_initialized` when a registry exists.
  tandem::schema::operation_result_t initialize(
      const tandem::schema::account_id_t& installer);

  /// Create the shared account `derive(creator, seed)` administered by
  /// `creator`, with an empty allow-list.
  operation_outcome<tandem::schema::account_id_t> create_shared_account(
      const tandem::schema::account_id_t& creator,
      const tandem::schema::bytes_view_t& seed);

  /// Append `claimer` to the allow-list of `target`. Admin only.
  tandem::schema::operation_result_t add_claimer(
      const tandem::schema::account_id_t& admin,
      const tandem::schema::account_id_t& target,
      const tandem::schema::account_id_t& claimer);

  /// Remove `claimer` from the allow-list of `target`, keeping the order of
  /// the remaining entries. Admin only.
  tandem::schema::operation_result_t remove_claimer(
      const tandem::schema::account_id_t& admin,
      const tandem::schema::account_id_t& target,
      const tandem::schema::account_id_t& claimer);

  /// Trade allow-list membership of `target` for a capability held by
  /// `claimer`. A principal holds at most one capability across all shared
  /// accounts.
  tandem::schema::operation_result_t claim_capability(
      const tandem::schema::account_id_t& claimer,
      const tandem::schema::account_id_t& target);

  /// Consume the capability held by `acquirer` and return authority over
  /// `target`. A capability for a different target is left untouched.
  operation_outcome<delegated_authority> acquire_authority(
      const tandem::schema::account_id_t& acquirer,
      const tandem::schema::account_id_t& target);

  /// Module identity, once initialized.
  std::optional<tandem::schema::account_id_t> module_account() const;
  std::optional<tandem::schema::registry_state_t> registry() const;
  /// Per-kind audit counters; all zero before initialization.
  tandem::schema::audit_counters_t audit_counters() const;
  std::vector<tandem::schema::audit_event_record_t> audit_events(
      tandem::schema::audit_event_type_t type) const;

  std::optional<tandem::schema::management_state_t> management(
      const tandem::schema::account_id_t& target) const;
  std::optional<tandem::schema::shared_account_state_t> shared_account(
      const tandem::schema::account_id_t& target) const;
  /// Target of the capability currently held by `holder`, if any.
  std::optional<tandem::schema::account_id_t> capability_target(
      const tandem::schema::account_id_t& holder) const;
  bool account_exists(const tandem::schema::account_id_t& account) const;

 private:
  /// Registry record of the initialized module, or std::nullopt before
  /// `initialize`. Caller holds `mutex_`.
  std::optional<tandem::schema::registry_state_t> load_registry() const;

  /// Read the module pointer written by `initialize`.
  void load_persisted_state();

  mutable std::mutex mutex_;
  encoder_t& encoder_;
  storage_t& storage_;
  address_deriver_t deriver_;
  std::optional<tandem::schema::account_id_t> module_account_;
};

}  // namespace tandem::execution
