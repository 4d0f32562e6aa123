#pragma once

#include <cstddef>
#include <cstdint>

/**
 * On-disk layout of the tcpping sample log.
 * Shared by the decoder (reading records) and the CSV serializer (sentinel policy)
 * so both sides agree on one definition.
 */

namespace Stabping {
namespace record {

// ============================================================================
// Record layout
// ============================================================================

// Three little-endian int32 fields: timestamp, address index, value.
static constexpr size_t FIELD_SIZE = sizeof(int32_t);
static constexpr size_t FIELDS_PER_RECORD = 3;
static constexpr size_t RECORD_SIZE = FIELD_SIZE * FIELDS_PER_RECORD;

static constexpr size_t TIMESTAMP_OFFSET = 0;
static constexpr size_t ADDRESS_INDEX_OFFSET = 4;
static constexpr size_t VALUE_OFFSET = 8;

static_assert(RECORD_SIZE == 12, "Sample record must be exactly 12 bytes");

// ============================================================================
// Sentinel values stored in the value field
// ============================================================================

// Probe was attempted and every attempt failed.
static constexpr int32_t SENTINEL_ERROR = -2100000000;
// No probe was attempted for this slot.
static constexpr int32_t SENTINEL_NODATA = -2000000000;

inline constexpr bool IsSentinel(int32_t value) {
    return value == SENTINEL_ERROR || value == SENTINEL_NODATA;
}

// ============================================================================
// Timestamp domain
// ============================================================================

static constexpr int64_t MIN_TIMESTAMP = 0;
static constexpr int64_t MAX_TIMESTAMP = 2147483647;  // 2^31 - 1

/**
 * @brief Read a little-endian int32 regardless of host byte order
 * @param p Pointer to 4 bytes
 */
inline int32_t LoadLE32(const uint8_t* p) {
    const uint32_t u = static_cast<uint32_t>(p[0]) |
                       (static_cast<uint32_t>(p[1]) << 8) |
                       (static_cast<uint32_t>(p[2]) << 16) |
                       (static_cast<uint32_t>(p[3]) << 24);
    return static_cast<int32_t>(u);
}

/**
 * @brief Number of whole records contained in a buffer of the given length
 */
inline constexpr size_t WholeRecords(size_t length) {
    return length / RECORD_SIZE;
}

/**
 * @brief Bytes left over after the last whole record (0 for a well-formed log)
 */
inline constexpr size_t TrailingBytes(size_t length) {
    return length % RECORD_SIZE;
}

}  // namespace record
}  // namespace Stabping
