#pragma once

#include <vecstore/core/types.h>
#include <vecstore/vector/index_types.h>
#include <vecstore/vector/vector_backend.h>

#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace vecstore::vector {

/**
 * @brief Identity of one logical index within the pool
 */
struct PoolKey {
    std::string modelName;
    size_t dimension = 0;
    std::optional<int64_t> documentId;
    std::filesystem::path basePath;

    /// doc_<id>_<model>_<dim>_<pathHash> or model_<model>_<dim>_<pathHash>
    std::string toString() const;

    static PoolKey forDocument(int64_t documentId, std::string modelName, size_t dimension,
                               std::filesystem::path basePath);
    static PoolKey forModel(std::string modelName, size_t dimension,
                            std::filesystem::path basePath);
};

/**
 * @brief Key string helpers
 */
class PoolKeyGenerator {
public:
    static std::string documentKey(int64_t documentId, const std::string& modelName,
                                   size_t dimension, const std::filesystem::path& basePath);
    static std::string modelKey(const std::string& modelName, size_t dimension,
                                const std::filesystem::path& basePath);

    /// 32-bit rolling hash of the path in base 36; "default" for an empty path
    static std::string hashPath(const std::filesystem::path& path);
};

/**
 * @brief What the factory needs to build and open a backend for a key
 */
struct InstanceFactoryConfig {
    VectorBackendType type = VectorBackendType::SqliteVec;
    std::filesystem::path basePath;
    IndexConfig index;
    BackendOptions options;
    bool create_if_missing = true; ///< createIndex() when true, loadIndex() otherwise
};

using BackendFactory = std::function<Result<std::shared_ptr<IVectorIndexBackend>>(
    const InstanceFactoryConfig&)>;

/**
 * @brief Keyed cache of live backend instances
 *
 * At most one instance exists per key. Concurrent first requests for the same key wait for a
 * single construction (single-flight); a failed construction is not cached. When maxSize is
 * non-zero the least recently used entry is dropped on overflow; in-memory backends are never
 * dropped that way since they hold the only copy of their vectors. Dropped instances are closed
 * once the last borrower releases them.
 */
class InstancePool {
public:
    struct Stats {
        size_t size = 0;
        size_t max_size = 0;
        size_t hits = 0;
        size_t misses = 0;
        size_t evictions = 0;
        std::vector<std::string> keys;
    };

    /**
     * @param maxSize 0 for unbounded
     * @param factory Builds an initialized, opened backend; defaults to defaultFactory()
     */
    explicit InstancePool(size_t maxSize = 0, BackendFactory factory = {});
    ~InstancePool();

    InstancePool(const InstancePool&) = delete;
    InstancePool& operator=(const InstancePool&) = delete;

    Result<std::shared_ptr<IVectorIndexBackend>> getInstance(const PoolKey& key,
                                                             const InstanceFactoryConfig& config);

    /// Drop one entry; returns false when the key was not cached
    bool clearInstance(const PoolKey& key);
    bool clearInstance(const std::string& key);
    void clearAll();

    bool hasInstance(const PoolKey& key) const;
    std::vector<std::string> keys() const;
    size_t size() const;
    Stats stats() const;

    /**
     * @brief createVectorIndexBackend + initialize + createIndex/loadIndex
     */
    static Result<std::shared_ptr<IVectorIndexBackend>>
    defaultFactory(const InstanceFactoryConfig& config);

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace vecstore::vector
