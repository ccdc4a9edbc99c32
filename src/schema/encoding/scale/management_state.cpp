#include <tandem/schema/encoding/scale/management_state.hpp>

#include <tuple>
#include <utility>
#include <vector>

namespace tandem::schema::encoding {

bytes_t record_codec<management_state_t, scale_encoder_tag>::encode(
    scale_encoder_t& encoder,
    const management_state_t& value) {
  return encoder.encode(
      std::tuple{value.version, value.admin, value.unclaimed});
}

std::optional<management_state_t>
record_codec<management_state_t, scale_encoder_tag>::decode(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto decoded = encoder.try_decode_record<
      1, std::tuple<uint16_t, account_id_t, std::vector<account_id_t>>>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  auto state = management_state_t{};
  state.admin = std::get<1>(*decoded);
  state.unclaimed = std::move(std::get<2>(*decoded));
  return state;
}

}  // namespace tandem::schema::encoding
