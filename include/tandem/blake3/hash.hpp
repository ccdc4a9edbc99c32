#pragma once
#include <tandem/schema/primitives.hpp>
#include <initializer_list>

namespace tandem::blake3 {

tandem::schema::hash32_t hash(const tandem::schema::bytes_view_t& bytes);

/// Hash of the concatenation of `parts`, without materialising it.
tandem::schema::hash32_t hash(
    std::initializer_list<tandem::schema::bytes_view_t> parts);

}  // namespace tandem::blake3
