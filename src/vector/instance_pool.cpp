#include <spdlog/spdlog.h>
#include <vecstore/profiling.h>
#include <vecstore/vector/instance_pool.h>

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <future>
#include <mutex>
#include <unordered_map>

namespace vecstore::vector {

using BackendPtr = std::shared_ptr<IVectorIndexBackend>;

// PoolKey / PoolKeyGenerator

std::string PoolKeyGenerator::hashPath(const std::filesystem::path& path) {
    const std::string s = path.string();
    if (s.empty()) {
        return "default";
    }
    uint32_t hash = 0;
    for (unsigned char c : s) {
        hash = (hash << 5) - hash + c;
    }
    int64_t magnitude = std::llabs(static_cast<int64_t>(static_cast<int32_t>(hash)));

    static constexpr char kDigits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (magnitude == 0) {
        return "0";
    }
    std::string out;
    while (magnitude > 0) {
        out.push_back(kDigits[magnitude % 36]);
        magnitude /= 36;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::string PoolKeyGenerator::documentKey(int64_t documentId, const std::string& modelName,
                                          size_t dimension,
                                          const std::filesystem::path& basePath) {
    return "doc_" + std::to_string(documentId) + "_" + modelName + "_" +
           std::to_string(dimension) + "_" + hashPath(basePath);
}

std::string PoolKeyGenerator::modelKey(const std::string& modelName, size_t dimension,
                                       const std::filesystem::path& basePath) {
    return "model_" + modelName + "_" + std::to_string(dimension) + "_" + hashPath(basePath);
}

std::string PoolKey::toString() const {
    return documentId ? PoolKeyGenerator::documentKey(*documentId, modelName, dimension, basePath)
                      : PoolKeyGenerator::modelKey(modelName, dimension, basePath);
}

PoolKey PoolKey::forDocument(int64_t documentId, std::string modelName, size_t dimension,
                             std::filesystem::path basePath) {
    return PoolKey{std::move(modelName), dimension, documentId, std::move(basePath)};
}

PoolKey PoolKey::forModel(std::string modelName, size_t dimension,
                          std::filesystem::path basePath) {
    return PoolKey{std::move(modelName), dimension, std::nullopt, std::move(basePath)};
}

// InstancePool::Impl

class InstancePool::Impl {
public:
    using FactoryResult = Result<BackendPtr>;

    Impl(size_t maxSize, BackendFactory factory)
        : maxSize_(maxSize), factory_(factory ? std::move(factory) : &InstancePool::defaultFactory) {}

    FactoryResult getInstance(const std::string& key, const InstanceFactoryConfig& config) {
        VECSTORE_ZONE_SCOPED_N("InstancePool::getInstance");

        std::shared_future<FactoryResult> pending;
        std::shared_ptr<std::promise<FactoryResult>> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it != entries_.end()) {
                it->second.lastAccess = std::chrono::steady_clock::now();
                ++hits_;
                return it->second.instance;
            }

            auto inflight = pending_.find(key);
            if (inflight != pending_.end()) {
                pending = inflight->second;
                ++hits_;
            } else {
                ++misses_;
                promise = std::make_shared<std::promise<FactoryResult>>();
                pending_.emplace(key, promise->get_future().share());
            }
        }

        if (!promise) {
            spdlog::debug("Waiting for in-flight construction of pool entry {}", key);
            return pending.get();
        }

        FactoryResult built = Error{ErrorCode::InternalError, "Backend factory did not run"};
        try {
            built = factory_(config);
            if (built && !built.value()) {
                built = Error{ErrorCode::InternalError, "Backend factory returned null"};
            }
        } catch (const std::exception& e) {
            built = Error{ErrorCode::InternalError,
                          std::string("Backend factory threw: ") + e.what()};
        } catch (...) {
            // Waiters block on the shared future; it must always receive a value
            built = Error{ErrorCode::InternalError,
                          "Backend factory threw a non-standard exception"};
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(key);
            if (built) {
                // In-memory indices hold the only copy of their vectors
                bool evictable = config.type != VectorBackendType::InMemory;
                entries_[key] =
                    Entry{built.value(), std::chrono::steady_clock::now(), evictable};
                spdlog::info("Pool entry created: {} ({} live)", key, entries_.size());
                evictOverflowLocked(key);
            } else {
                spdlog::debug("Pool entry {} not created: {}", key, built.error().message);
            }
        }

        promise->set_value(built);
        return built;
    }

    bool clear(const std::string& key) {
        BackendPtr dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return false;
            }
            dropped = std::move(it->second.instance);
            entries_.erase(it);
        }
        spdlog::info("Pool entry evicted: {}", key);
        return true;
    }

    void clearAll() {
        std::unordered_map<std::string, Entry> dropped;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dropped.swap(entries_);
        }
        if (!dropped.empty()) {
            spdlog::info("Pool cleared ({} entries)", dropped.size());
        }
    }

    bool has(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.count(key) > 0;
    }

    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return keysLocked();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    Stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        Stats s;
        s.size = entries_.size();
        s.max_size = maxSize_;
        s.hits = hits_;
        s.misses = misses_;
        s.evictions = evictions_;
        s.keys = keysLocked();
        return s;
    }

private:
    struct Entry {
        BackendPtr instance;
        std::chrono::steady_clock::time_point lastAccess;
        bool evictable = true;
    };

    std::vector<std::string> keysLocked() const {
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (const auto& [k, _] : entries_) {
            out.push_back(k);
        }
        std::sort(out.begin(), out.end());
        return out;
    }

    void evictOverflowLocked(const std::string& keep) {
        if (maxSize_ == 0) {
            return;
        }
        while (entries_.size() > maxSize_) {
            auto victim = entries_.end();
            for (auto it = entries_.begin(); it != entries_.end(); ++it) {
                if (it->first == keep || !it->second.evictable)
                    continue;
                if (victim == entries_.end() || it->second.lastAccess < victim->second.lastAccess) {
                    victim = it;
                }
            }
            if (victim == entries_.end()) {
                return;
            }
            spdlog::info("Pool full ({}), evicting least recently used entry {}", maxSize_,
                         victim->first);
            entries_.erase(victim);
            ++evictions_;
        }
    }

    size_t maxSize_;
    BackendFactory factory_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    std::unordered_map<std::string, std::shared_future<FactoryResult>> pending_;
    size_t hits_ = 0;
    size_t misses_ = 0;
    size_t evictions_ = 0;
};

// InstancePool

InstancePool::InstancePool(size_t maxSize, BackendFactory factory)
    : pImpl(std::make_unique<Impl>(maxSize, std::move(factory))) {}

InstancePool::~InstancePool() = default;

Result<std::shared_ptr<IVectorIndexBackend>>
InstancePool::getInstance(const PoolKey& key, const InstanceFactoryConfig& config) {
    return pImpl->getInstance(key.toString(), config);
}

bool InstancePool::clearInstance(const PoolKey& key) {
    return pImpl->clear(key.toString());
}

bool InstancePool::clearInstance(const std::string& key) {
    return pImpl->clear(key);
}

void InstancePool::clearAll() {
    pImpl->clearAll();
}

bool InstancePool::hasInstance(const PoolKey& key) const {
    return pImpl->has(key.toString());
}

std::vector<std::string> InstancePool::keys() const {
    return pImpl->keys();
}

size_t InstancePool::size() const {
    return pImpl->size();
}

InstancePool::Stats InstancePool::stats() const {
    return pImpl->stats();
}

Result<std::shared_ptr<IVectorIndexBackend>>
InstancePool::defaultFactory(const InstanceFactoryConfig& config) {
    std::shared_ptr<IVectorIndexBackend> backend =
        createVectorIndexBackend(config.type, config.basePath, config.options);

    auto init = backend->initialize();
    if (!init)
        return init.error();

    if (config.create_if_missing) {
        auto created = backend->createIndex(config.index);
        if (!created)
            return created.error();
    } else {
        auto loaded = backend->loadIndex(config.index);
        if (!loaded)
            return loaded.error();
    }
    return backend;
}

} // namespace vecstore::vector
