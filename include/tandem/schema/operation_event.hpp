#pragma once

#include <tandem/schema/operation_event_attribute.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace tandem::schema {

template <uint16_t Version>
struct operation_event;

template <>
struct operation_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<operation_event_attribute_t> attributes;
};

using operation_event_t = operation_event<1>;

}  // namespace tandem::schema
