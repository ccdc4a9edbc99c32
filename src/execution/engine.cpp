#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <string>
#include <tandem/blake3/hash.hpp>
#include <tandem/execution/engine.hpp>
#include <tandem/schema/key/builder.hpp>
#include <tandem/schema/key/engine_keys.hpp>
#include <utility>

using namespace tandem::schema;

namespace {

using encoder_t = tandem::execution::engine::encoder_t;
using scale_tag_t = tandem::schema::encoding::scale_encoder_tag;

inline constexpr auto kAuthorityProofDomain =
    std::string_view{"TANDEM|AUTHORITY|"};

// Present at every identity that exists in the store.
inline const auto kAccountMarker = bytes_t{0x01};

/// Writes staged by one operation, committed together once every guard has
/// passed.
struct unit_of_work final {
  encoder_t& encoder;
  tandem::storage::write_set_t writes;

  template <typename T>
  void put(const bytes_t& key, const T& value) {
    writes.push_back(tandem::storage::write_entry{
        .key = key,
        .value = tandem::schema::encoding::record_codec<T, scale_tag_t>::encode(
            encoder, value)});
  }

  void put_raw(const bytes_t& key, bytes_t value) {
    writes.push_back(
        tandem::storage::write_entry{.key = key, .value = std::move(value)});
  }

  void erase(const bytes_t& key) {
    writes.push_back(
        tandem::storage::write_entry{.key = key, .value = std::nullopt});
  }
};

operation_result_t make_rejection(const std::string_view codespace,
                                  const error_code code,
                                  const std::string_view log) {
  auto result = operation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{log};
  result.info = std::string{to_string(code)};
  result.codespace = std::string{codespace};
  spdlog::debug("{} rejected with {}: {}", codespace, result.info, log);
  return result;
}

operation_result_t make_accepted(const std::string_view codespace,
                                 const std::string_view info) {
  auto result = operation_result_t{};
  result.info = std::string{info};
  result.codespace = std::string{codespace};
  return result;
}

operation_event_attribute_t make_attribute(std::string key,
                                           const account_id_t& value) {
  return operation_event_attribute_t{
      .key = std::move(key), .value = to_hex(value), .index = true};
}

/// Stage one audit record of `type` and the registry with its counter
/// bumped. The record's sequence is the counter value before the bump.
operation_event_t append_audit(unit_of_work& unit,
                               const account_id_t& module,
                               registry_state_t& registry,
                               const audit_event_type_t type,
                               const account_id_t& actor,
                               const account_id_t& target,
                               const std::optional<account_id_t>& subject) {
  auto& counter = registry.counters[static_cast<std::size_t>(type)];
  auto record = audit_event_record_t{.sequence = counter,
                                     .type = type,
                                     .actor = actor,
                                     .target = target,
                                     .subject = subject};
  unit.put(key::make_audit_event_key(type, record.sequence), record);
  ++counter;
  unit.put(key::make_registry_key(module), registry);

  auto event = operation_event_t{};
  event.type = std::string{to_string(type)};
  event.attributes.push_back(make_attribute("actor", actor));
  event.attributes.push_back(make_attribute("target", target));
  if (subject) {
    event.attributes.push_back(make_attribute("subject", *subject));
  }
  event.attributes.push_back(operation_event_attribute_t{
      .key = "sequence", .value = std::to_string(record.sequence)});
  return event;
}

hash32_t make_authority_proof(const authority_source_t& source,
                              const account_id_t& acquirer,
                              const uint64_t redeem_sequence) {
  auto material = key::builder{};
  material.write(kAuthorityProofDomain);
  material.write(source.account);
  material.write(acquirer);
  material.write(redeem_sequence);
  return tandem::blake3::hash(material.view());
}

}  // namespace

namespace tandem::execution {

engine::engine(encoder_t& encoder, storage_t& storage, address_deriver_t deriver)
    : encoder_{encoder}, storage_{storage}, deriver_{std::move(deriver)} {
  auto lock = std::scoped_lock{mutex_};
  if (!deriver_) {
    tandem::common::critical("engine requires an address deriver");
  }
  load_persisted_state();
  if (module_account_) {
    spdlog::info("Shared-account engine ready with module {}",
                 to_hex(*module_account_));
  } else {
    spdlog::info("Shared-account engine ready; module not initialized");
  }
}

operation_result_t engine::initialize(const account_id_t& installer) {
  constexpr auto kCodespace = std::string_view{"tandem.initialize"};
  auto lock = std::scoped_lock{mutex_};

  auto module = deriver_(installer, make_bytes_view(kRegistrySeed));
  auto registry_key = key::make_registry_key(module);
  if (module_account_ || storage_.contains(registry_key)) {
    return make_rejection(kCodespace, error_code::already_initialized,
                          "registry already exists");
  }

  auto registry = registry_state_t{};
  registry.authority_source.account = module;

  auto unit = unit_of_work{.encoder = encoder_};
  unit.put(registry_key, registry);
  unit.put_raw(key::make_account_key(module), kAccountMarker);
  unit.put_raw(key::make_module_key(), bytes_t{module.begin(), module.end()});
  storage_.apply(unit.writes);

  module_account_ = module;
  spdlog::info("Registry initialized at {} by installer {}", to_hex(module),
               to_hex(installer));
  return make_accepted(kCodespace, "registry initialized");
}

operation_outcome<account_id_t> engine::create_shared_account(
    const account_id_t& creator,
    const bytes_view_t& seed) {
  constexpr auto kCodespace = std::string_view{"tandem.create_shared_account"};
  auto lock = std::scoped_lock{mutex_};
  auto outcome = operation_outcome<account_id_t>{};

  auto registry = load_registry();
  if (!registry) {
    outcome.result = make_rejection(kCodespace, error_code::not_initialized,
                                    "module is not initialized");
    return outcome;
  }

  auto target = deriver_(creator, seed);
  auto account_key = key::make_account_key(target);
  if (storage_.contains(account_key)) {
    outcome.result = make_rejection(kCodespace, error_code::already_exists,
                                    "identity already exists at derived id");
    return outcome;
  }

  auto shared = shared_account_state_t{};
  shared.authority_source.account = target;
  auto management = management_state_t{};
  management.admin = creator;

  auto unit = unit_of_work{.encoder = encoder_};
  unit.put_raw(account_key, kAccountMarker);
  unit.put(key::make_shared_account_key(target), shared);
  unit.put(key::make_management_key(target), management);
  auto event = append_audit(unit, *module_account_, *registry,
                            audit_event_type_t::shared_account_created,
                            creator, target, std::nullopt);
  storage_.apply(unit.writes);

  spdlog::info("Shared account {} created by {}", to_hex(target),
               to_hex(creator));
  outcome.result = make_accepted(kCodespace, "shared account created");
  outcome.result.events.push_back(std::move(event));
  outcome.value = target;
  return outcome;
}

operation_result_t engine::add_claimer(const account_id_t& admin,
                                       const account_id_t& target,
                                       const account_id_t& claimer) {
  constexpr auto kCodespace = std::string_view{"tandem.add_claimer"};
  auto lock = std::scoped_lock{mutex_};

  auto registry = load_registry();
  if (!registry) {
    return make_rejection(kCodespace, error_code::not_initialized,
                          "module is not initialized");
  }

  auto management_key = key::make_management_key(target);
  auto management =
      storage_.get<management_state_t>(encoder_, management_key);
  if (!management) {
    return make_rejection(kCodespace, error_code::not_found,
                          "target has no management record");
  }
  if (management->admin != admin) {
    return make_rejection(kCodespace, error_code::not_admin,
                          "caller is not the shared account admin");
  }
  if (std::ranges::find(management->unclaimed, claimer) !=
      std::end(management->unclaimed)) {
    return make_rejection(kCodespace, error_code::already_listed,
                          "claimer is already allow-listed");
  }

  management->unclaimed.push_back(claimer);

  auto unit = unit_of_work{.encoder = encoder_};
  unit.put(management_key, *management);
  auto event =
      append_audit(unit, *module_account_, *registry,
                   audit_event_type_t::claimer_added, admin, target, claimer);
  storage_.apply(unit.writes);

  spdlog::info("Claimer {} allow-listed on {}", to_hex(claimer),
               to_hex(target));
  auto result = make_accepted(kCodespace, "claimer added");
  result.events.push_back(std::move(event));
  return result;
}

operation_result_t engine::remove_claimer(const account_id_t& admin,
                                          const account_id_t& target,
                                          const account_id_t& claimer) {
  constexpr auto kCodespace = std::string_view{"tandem.remove_claimer"};
  auto lock = std::scoped_lock{mutex_};

  auto registry = load_registry();
  if (!registry) {
    return make_rejection(kCodespace, error_code::not_initialized,
                          "module is not initialized");
  }

  auto management_key = key::make_management_key(target);
  auto management =
      storage_.get<management_state_t>(encoder_, management_key);
  if (!management) {
    return make_rejection(kCodespace, error_code::not_found,
                          "target has no management record");
  }
  if (management->admin != admin) {
    return make_rejection(kCodespace, error_code::not_admin,
                          "caller is not the shared account admin");
  }
  auto listed = std::ranges::find(management->unclaimed, claimer);
  if (listed == std::end(management->unclaimed)) {
    return make_rejection(kCodespace, error_code::not_listed,
                          "claimer is not allow-listed");
  }

  // Order of the remaining claimers is observable; no swap-remove.
  management->unclaimed.erase(listed);

  auto unit = unit_of_work{.encoder = encoder_};
  unit.put(management_key, *management);
  auto event =
      append_audit(unit, *module_account_, *registry,
                   audit_event_type_t::claimer_removed, admin, target, claimer);
  storage_.apply(unit.writes);

  spdlog::info("Claimer {} removed from {}", to_hex(claimer), to_hex(target));
  auto result = make_accepted(kCodespace, "claimer removed");
  result.events.push_back(std::move(event));
  return result;
}

operation_result_t engine::claim_capability(const account_id_t& claimer,
                                            const account_id_t& target) {
  constexpr auto kCodespace = std::string_view{"tandem.claim_capability"};
  auto lock = std::scoped_lock{mutex_};

  auto registry = load_registry();
  if (!registry) {
    return make_rejection(kCodespace, error_code::not_initialized,
                          "module is not initialized");
  }

  auto management_key = key::make_management_key(target);
  auto management =
      storage_.get<management_state_t>(encoder_, management_key);
  if (!management) {
    return make_rejection(kCodespace, error_code::not_found,
                          "target has no management record");
  }
  auto listed = std::ranges::find(management->unclaimed, claimer);
  if (listed == std::end(management->unclaimed)) {
    return make_rejection(kCodespace, error_code::not_listed,
                          "claimer is not allow-listed");
  }
  auto capability_key = key::make_capability_key(claimer);
  if (storage_.contains(capability_key)) {
    return make_rejection(kCodespace, error_code::already_holding_capability,
                          "claimer already holds a capability");
  }

  management->unclaimed.erase(listed);

  auto unit = unit_of_work{.encoder = encoder_};
  unit.put(management_key, *management);
  unit.put(capability_key, capability_state_t{target});
  auto event = append_audit(unit, *module_account_, *registry,
                            audit_event_type_t::capability_claimed, claimer,
                            target, std::nullopt);
  storage_.apply(unit.writes);

  spdlog::info("Capability for {} claimed by {}", to_hex(target),
               to_hex(claimer));
  auto result = make_accepted(kCodespace, "capability claimed");
  result.events.push_back(std::move(event));
  return result;
}

operation_outcome<delegated_authority> engine::acquire_authority(
    const account_id_t& acquirer,
    const account_id_t& target) {
  constexpr auto kCodespace = std::string_view{"tandem.acquire_authority"};
  auto lock = std::scoped_lock{mutex_};
  auto outcome = operation_outcome<delegated_authority>{};

  auto registry = load_registry();
  if (!registry) {
    outcome.result = make_rejection(kCodespace, error_code::not_initialized,
                                    "module is not initialized");
    return outcome;
  }

  auto capability_key = key::make_capability_key(acquirer);
  auto capability =
      storage_.get<capability_state_t>(encoder_, capability_key);
  if (!capability) {
    outcome.result = make_rejection(kCodespace, error_code::no_capability,
                                    "acquirer holds no capability");
    return outcome;
  }
  if (capability->target != target) {
    outcome.result = make_rejection(kCodespace, error_code::wrong_target,
                                    "capability is for a different target");
    return outcome;
  }
  auto shared = storage_.get<shared_account_state_t>(
      encoder_, key::make_shared_account_key(target));
  if (!shared) {
    outcome.result = make_rejection(kCodespace, error_code::not_found,
                                    "target is not a shared account");
    return outcome;
  }

  auto consumed = std::move(*capability);
  capability.reset();

  auto proof = make_authority_proof(
      shared->authority_source, acquirer,
      registry->counter(audit_event_type_t::authority_acquired));

  auto unit = unit_of_work{.encoder = encoder_};
  unit.erase(capability_key);
  auto event = append_audit(unit, *module_account_, *registry,
                            audit_event_type_t::authority_acquired, acquirer,
                            consumed.target, std::nullopt);
  storage_.apply(unit.writes);

  spdlog::info("Authority over {} acquired by {}", to_hex(target),
               to_hex(acquirer));
  outcome.result = make_accepted(kCodespace, "authority acquired");
  outcome.result.events.push_back(std::move(event));
  outcome.value.emplace(shared->authority_source.account, proof);
  return outcome;
}

std::optional<account_id_t> engine::module_account() const {
  auto lock = std::scoped_lock{mutex_};
  return module_account_;
}

std::optional<registry_state_t> engine::registry() const {
  auto lock = std::scoped_lock{mutex_};
  return load_registry();
}

audit_counters_t engine::audit_counters() const {
  auto lock = std::scoped_lock{mutex_};
  auto registry = load_registry();
  if (!registry) {
    return audit_counters_t{};
  }
  return registry->counters;
}

std::vector<audit_event_record_t> engine::audit_events(
    const audit_event_type_t type) const {
  auto lock = std::scoped_lock{mutex_};
  auto prefix = key::make_audit_event_prefix(type);
  auto rows = storage_.list_by_prefix(prefix);

  auto events = std::vector<audit_event_record_t>{};
  events.reserve(rows.size());
  for (const auto& [row_key, row_value] : rows) {
    auto decoded = encoding::record_codec<audit_event_record_t, scale_tag_t>::
        decode(encoder_, bytes_view_t{row_value.data(), row_value.size()});
    if (!decoded) {
      tandem::common::critical("undecodable audit record", to_hex(row_key));
    }
    events.push_back(std::move(*decoded));
  }
  return events;
}

std::optional<management_state_t> engine::management(
    const account_id_t& target) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<management_state_t>(encoder_,
                                          key::make_management_key(target));
}

std::optional<shared_account_state_t> engine::shared_account(
    const account_id_t& target) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.get<shared_account_state_t>(
      encoder_, key::make_shared_account_key(target));
}

std::optional<account_id_t> engine::capability_target(
    const account_id_t& holder) const {
  auto lock = std::scoped_lock{mutex_};
  auto capability = storage_.get<capability_state_t>(
      encoder_, key::make_capability_key(holder));
  if (!capability) {
    return std::nullopt;
  }
  return capability->target;
}

bool engine::account_exists(const account_id_t& account) const {
  auto lock = std::scoped_lock{mutex_};
  return storage_.contains(key::make_account_key(account));
}

std::optional<registry_state_t> engine::load_registry() const {
  if (!module_account_) {
    return std::nullopt;
  }
  auto registry = storage_.get<registry_state_t>(
      encoder_, key::make_registry_key(*module_account_));
  if (!registry) {
    tandem::common::critical("module pointer references a missing registry");
  }
  return registry;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted module pointer");
  auto pointer = storage_.get(key::make_module_key());
  if (!pointer) {
    module_account_.reset();
    return;
  }
  module_account_ = try_make_hash32(make_bytes_view(*pointer));
  if (!module_account_) {
    tandem::common::critical("module pointer is not a 32-byte identity");
  }
}

}  // namespace tandem::execution
