#include <tandem/schema/encoding/scale/shared_account_state.hpp>

#include <tuple>

namespace tandem::schema::encoding {

bytes_t record_codec<shared_account_state_t, scale_encoder_tag>::encode(
    scale_encoder_t& encoder,
    const shared_account_state_t& value) {
  return encoder.encode(std::tuple{value.version,
                                   value.authority_source.version,
                                   value.authority_source.account});
}

std::optional<shared_account_state_t>
record_codec<shared_account_state_t, scale_encoder_tag>::decode(
    scale_encoder_t& encoder,
    const bytes_view_t& bytes) {
  auto decoded = encoder.try_decode_record<
      1, std::tuple<uint16_t, uint16_t, account_id_t>>(bytes);
  // The embedded authority source carries its own version.
  if (!decoded || std::get<1>(*decoded) != 1) {
    return std::nullopt;
  }
  auto state = shared_account_state_t{};
  state.authority_source.account = std::get<2>(*decoded);
  return state;
}

}  // namespace tandem::schema::encoding
