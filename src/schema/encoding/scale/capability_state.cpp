#include <tandem/schema/encoding/scale/capability_state.hpp>

#include <tuple>

namespace tandem::schema::encoding {

bytes_t record_codec<capability_state_t, scale_encoder_tag>::encode(
    scale_encoder_t& encoder,
    const capability_state_t& value) {
  return encoder.encode(std::tuple{value.version, value.target});
}

std::optional<capability_state_t>
record_codec<capability_state_t, scale_encoder_tag>::decode(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto decoded =
      encoder.try_decode_record<1, std::tuple<uint16_t, account_id_t>>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return std::optional<capability_state_t>{std::in_place,
                                           std::get<1>(*decoded)};
}

}  // namespace tandem::schema::encoding
