#pragma once

#include <vecstore/core/types.h>

#include <sqlite3.h>
#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace vecstore::vector {

/// Name of the scalar SQL function used by the brute-force search path.
inline constexpr const char* kL2DistanceFunction = "vecstore_l2_distance";

/**
 * @brief Euclidean (L2) distance between two vectors of equal length
 */
float l2Distance(std::span<const float> a, std::span<const float> b);

/**
 * @brief Encode a vector as a fixed-width little-endian float32 buffer
 */
std::vector<std::byte> encodeVector(std::span<const float> values);

/**
 * @brief Decode a little-endian float32 buffer
 *
 * @param expectedDim When set, the decoded width must match it
 * @return IntegrityError when the buffer size is not a multiple of four bytes or does not
 *         match expectedDim
 */
Result<std::vector<float>> decodeVector(std::span<const std::byte> blob,
                                        std::optional<size_t> expectedDim = std::nullopt);

/**
 * @brief Register vecstore_l2_distance(blob, blob) on a connection
 *
 * The function returns NULL when either argument is NULL and raises an SQL error when the two
 * buffers differ in width.
 */
Result<void> registerDistanceFunctions(sqlite3* db);

} // namespace vecstore::vector
