#ifndef SHARED_STRUCTURE_HPP
#define SHARED_STRUCTURE_HPP

#include <cstdint>

constexpr uint64_t GIB = 1024ULL * 1024 * 1024;
constexpr uint64_t MIN_GSI_SIZE = GIB;

// Default lpmake layout
constexpr uint32_t LP_METADATA_SIZE = 65536;
constexpr uint32_t LP_METADATA_SLOTS = 2;

#endif // SHARED_STRUCTURE_HPP
