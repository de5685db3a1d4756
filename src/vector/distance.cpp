#include <vecstore/vector/distance.h>

#include <algorithm>
#include <bit>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>

namespace vecstore::vector {

namespace {

inline float loadLE(const std::byte* p) {
    uint32_t bits;
    std::memcpy(&bits, p, sizeof(bits));
    if constexpr (std::endian::native == std::endian::big) {
        bits = ((bits & 0x000000ffu) << 24) | ((bits & 0x0000ff00u) << 8) |
               ((bits & 0x00ff0000u) >> 8) | ((bits & 0xff000000u) >> 24);
    }
    return std::bit_cast<float>(bits);
}

inline void storeLE(float v, std::byte* p) {
    auto bits = std::bit_cast<uint32_t>(v);
    if constexpr (std::endian::native == std::endian::big) {
        bits = ((bits & 0x000000ffu) << 24) | ((bits & 0x0000ff00u) << 8) |
               ((bits & 0x00ff0000u) >> 8) | ((bits & 0xff000000u) >> 24);
    }
    std::memcpy(p, &bits, sizeof(bits));
}

void l2DistanceSqlFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 || sqlite3_value_type(argv[0]) == SQLITE_NULL ||
        sqlite3_value_type(argv[1]) == SQLITE_NULL) {
        sqlite3_result_null(ctx);
        return;
    }

    const auto* a = static_cast<const std::byte*>(sqlite3_value_blob(argv[0]));
    const int aBytes = sqlite3_value_bytes(argv[0]);
    const auto* b = static_cast<const std::byte*>(sqlite3_value_blob(argv[1]));
    const int bBytes = sqlite3_value_bytes(argv[1]);

    if (aBytes != bBytes || aBytes % static_cast<int>(sizeof(float)) != 0) {
        sqlite3_result_error(ctx, "vecstore_l2_distance: vector width mismatch", -1);
        return;
    }

    double sum = 0.0;
    const size_t n = static_cast<size_t>(aBytes) / sizeof(float);
    for (size_t i = 0; i < n; ++i) {
        double d = static_cast<double>(loadLE(a + i * sizeof(float))) -
                   static_cast<double>(loadLE(b + i * sizeof(float)));
        sum += d * d;
    }
    sqlite3_result_double(ctx, std::sqrt(sum));
}

} // namespace

float l2Distance(std::span<const float> a, std::span<const float> b) {
    const size_t n = std::min(a.size(), b.size());
    double sum = 0.0;
    for (size_t i = 0; i < n; ++i) {
        double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
        sum += d * d;
    }
    return static_cast<float>(std::sqrt(sum));
}

std::vector<std::byte> encodeVector(std::span<const float> values) {
    std::vector<std::byte> blob(values.size() * sizeof(float));
    for (size_t i = 0; i < values.size(); ++i) {
        storeLE(values[i], blob.data() + i * sizeof(float));
    }
    return blob;
}

Result<std::vector<float>> decodeVector(std::span<const std::byte> blob,
                                        std::optional<size_t> expectedDim) {
    if (blob.size() % sizeof(float) != 0) {
        return Error{ErrorCode::IntegrityError,
                     "Corrupt vector buffer: " + std::to_string(blob.size()) +
                         " bytes is not a whole number of floats"};
    }
    const size_t n = blob.size() / sizeof(float);
    if (expectedDim && *expectedDim != n) {
        return Error{ErrorCode::IntegrityError, "Corrupt vector buffer: expected " +
                                                    std::to_string(*expectedDim) +
                                                    " values, found " + std::to_string(n)};
    }

    std::vector<float> out(n);
    for (size_t i = 0; i < n; ++i) {
        out[i] = loadLE(blob.data() + i * sizeof(float));
    }
    return out;
}

Result<void> registerDistanceFunctions(sqlite3* db) {
    if (!db) {
        return Error{ErrorCode::InvalidState, "Database not open"};
    }
    int rc = sqlite3_create_function_v2(db, kL2DistanceFunction, 2,
                                        SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                        &l2DistanceSqlFunction, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        return Error{ErrorCode::DatabaseError,
                     std::string("Failed to register distance function: ") + sqlite3_errmsg(db)};
    }
    return {};
}

} // namespace vecstore::vector
