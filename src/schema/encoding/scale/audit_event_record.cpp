#include <tandem/schema/encoding/scale/audit_event_record.hpp>

#include <tuple>

namespace tandem::schema::encoding {

namespace {

using audit_wire_t = std::tuple<uint16_t,
                                uint64_t,
                                uint16_t,
                                account_id_t,
                                account_id_t,
                                std::optional<account_id_t>>;

}  // namespace

bytes_t record_codec<audit_event_record_t, scale_encoder_tag>::encode(
    scale_encoder_t& encoder,
    const audit_event_record_t& value) {
  return encoder.encode(audit_wire_t{
      value.version, value.sequence, static_cast<uint16_t>(value.type),
      value.actor, value.target, value.subject});
}

std::optional<audit_event_record_t>
record_codec<audit_event_record_t, scale_encoder_tag>::decode(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto decoded = encoder.try_decode_record<1, audit_wire_t>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto type = try_from_underlying<audit_event_type_t>(std::get<2>(*decoded));
  if (!type) {
    return std::nullopt;
  }
  return audit_event_record_t{.version = 1,
                              .sequence = std::get<1>(*decoded),
                              .type = *type,
                              .actor = std::get<3>(*decoded),
                              .target = std::get<4>(*decoded),
                              .subject = std::get<5>(*decoded)};
}

}  // namespace tandem::schema::encoding
