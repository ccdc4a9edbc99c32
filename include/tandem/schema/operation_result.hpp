#pragma once

#include <tandem/schema/error_code.hpp>
#include <tandem/schema/operation_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tandem::schema {

template <uint16_t Version>
struct operation_result;

template <>
struct operation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<operation_event_t> events;

  bool ok() const { return code == 0; }
  error_code error() const { return static_cast<error_code>(code); }
};

using operation_result_t = operation_result<1>;

}  // namespace tandem::schema
