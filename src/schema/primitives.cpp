#include <boost/algorithm/hex.hpp>
#include <tandem/schema/primitives.hpp>

#include <algorithm>
#include <iterator>

namespace tandem::schema {

bytes_t make_bytes(const std::string& text) {
  return bytes_t{std::begin(text), std::end(text)};
}

bytes_t make_bytes(const std::string_view& text) {
  return bytes_t{std::begin(text), std::end(text)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string_view& text) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(text.data()),
                      text.size()};
}

bytes_view_t make_bytes_view(const hash32_t& hash) {
  return bytes_view_t{hash.data(), hash.size()};
}

std::optional<hash32_t> try_make_hash32(const bytes_view_t& bytes) {
  auto hash = hash32_t{};
  if (bytes.size() != hash.size()) {
    return std::nullopt;
  }
  std::ranges::copy(bytes, std::begin(hash));
  return hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_hash32(make_bytes_view(*decoded));
}

hash32_t make_zero_hash() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  auto out = std::string{};
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex_lower(std::begin(bytes), std::end(bytes),
                              std::back_inserter(out));
  return out;
}

std::string to_hex(const hash32_t& hash) {
  return to_hex(make_bytes_view(hash));
}

std::optional<bytes_t> try_from_hex(std::string_view hex) {
  if (hex.starts_with("0x") || hex.starts_with("0X")) {
    hex.remove_prefix(2);
  }
  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  try {
    boost::algorithm::unhex(std::begin(hex), std::end(hex),
                            std::back_inserter(decoded));
  } catch (const boost::algorithm::hex_decode_error&) {
    return std::nullopt;
  }
  return decoded;
}

}  // namespace tandem::schema
