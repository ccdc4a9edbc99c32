#include <tandem/schema/encoding/scale/registry_state.hpp>

#include <cstddef>
#include <tuple>

namespace tandem::schema::encoding {

namespace {

// version, authority source (version, account), then the five counters in
// audit_event_type_t order.
using registry_wire_t = std::tuple<uint16_t,
                                   uint16_t,
                                   account_id_t,
                                   uint64_t,
                                   uint64_t,
                                   uint64_t,
                                   uint64_t,
                                   uint64_t>;

static_assert(kAuditEventTypeCount == 5);

}  // namespace

bytes_t record_codec<registry_state_t, scale_encoder_tag>::encode(
    scale_encoder_t& encoder,
    const registry_state_t& value) {
  return encoder.encode(registry_wire_t{
      value.version, value.authority_source.version,
      value.authority_source.account, value.counters[0], value.counters[1],
      value.counters[2], value.counters[3], value.counters[4]});
}

std::optional<registry_state_t>
record_codec<registry_state_t, scale_encoder_tag>::decode(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto decoded = encoder.try_decode_record<1, registry_wire_t>(bytes);
  if (!decoded || std::get<1>(*decoded) != 1) {
    return std::nullopt;
  }
  auto state = registry_state_t{};
  state.authority_source.account = std::get<2>(*decoded);
  state.counters = {std::get<3>(*decoded), std::get<4>(*decoded),
                    std::get<5>(*decoded), std::get<6>(*decoded),
                    std::get<7>(*decoded)};
  return state;
}

}  // namespace tandem::schema::encoding
