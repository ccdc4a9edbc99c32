#pragma once

#include <tandem/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: error code.
// Protocol failure taxonomy: stable numeric codes returned in
// operation_result_t. Zero is success.
namespace tandem::schema {

enum class error_code : uint32_t {
  ok = 0,
  already_initialized = 1,
  already_exists = 2,
  not_found = 3,
  not_admin = 4,
  already_listed = 5,
  not_listed = 6,
  already_holding_capability = 7,
  no_capability = 8,
  wrong_target = 9,
  not_initialized = 10,
};

inline constexpr auto kErrorCodeMappings = std::array{
    std::pair<std::string_view, error_code>{"ok", error_code::ok},
    std::pair<std::string_view, error_code>{"already_initialized",
                                            error_code::already_initialized},
    std::pair<std::string_view, error_code>{"already_exists",
                                            error_code::already_exists},
    std::pair<std::string_view, error_code>{"not_found", error_code::not_found},
    std::pair<std::string_view, error_code>{"not_admin", error_code::not_admin},
    std::pair<std::string_view, error_code>{"already_listed",
                                            error_code::already_listed},
    std::pair<std::string_view, error_code>{"not_listed",
                                            error_code::not_listed},
    std::pair<std::string_view, error_code>{
        "already_holding_capability", error_code::already_holding_capability},
    std::pair<std::string_view, error_code>{"no_capability",
                                            error_code::no_capability},
    std::pair<std::string_view, error_code>{"wrong_target",
                                            error_code::wrong_target},
    std::pair<std::string_view, error_code>{"not_initialized",
                                            error_code::not_initialized},
};

template <>
struct enum_names<error_code> {
  static constexpr const auto& kMappings = kErrorCodeMappings;
};

inline constexpr std::string_view to_string(const error_code value) {
  return enum_name(value);
}

}  // namespace tandem::schema
