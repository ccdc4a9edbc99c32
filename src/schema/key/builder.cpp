#include <boost/endian/conversion.hpp>
#include <tandem/schema/key/builder.hpp>

#include <iterator>
#include <utility>

namespace tandem::schema::key {

namespace {

template <typename T>
void append_big_endian(bytes_t& out, const T value) {
  auto ordered = boost::endian::native_to_big(value);
  auto first = reinterpret_cast<const uint8_t*>(&ordered);
  out.insert(std::end(out), first, first + sizeof(T));
}

}  // namespace

builder::builder(const std::string_view prefix) {
  write(prefix);
}

builder& builder::write(const std::string_view text) {
  data_.insert(std::end(data_), std::begin(text), std::end(text));
  return *this;
}

builder& builder::write(const bytes_view_t& bytes) {
  data_.insert(std::end(data_), std::begin(bytes), std::end(bytes));
  return *this;
}

builder& builder::write(const hash32_t& hash) {
  return write(make_bytes_view(hash));
}

builder& builder::write(const uint8_t value) {
  data_.push_back(value);
  return *this;
}

builder& builder::write(const uint16_t value) {
  append_big_endian(data_, value);
  return *this;
}

builder& builder::write(const uint64_t value) {
  append_big_endian(data_, value);
  return *this;
}

bytes_view_t builder::view() const {
  return bytes_view_t{data_};
}

bytes_t builder::take() {
  return std::move(data_);
}

}  // namespace tandem::schema::key
