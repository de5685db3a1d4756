#pragma once

#include <vecstore/core/types.h>

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace vecstore::config {

/**
 * Configuration for the embedding store.
 *
 * Defaults are usable as-is; a TOML-style file ([vector_store] section) and VECSTORE_*
 * environment variables may override them.
 */
struct VectorStoreConfig {
    std::filesystem::path base_path = "data/vector_index"; // models/ and documents/ live here
    std::string backend = "sqlite-vec";                    // "sqlite-vec" or "memory"
    bool enable_accelerated = true;                        // register and detect vec0
    std::string default_index_type = "flat";
    bool mirror_to_model_index = true; // document writes also feed the corpus-wide index
    size_t max_pool_size = 0;          // 0 = unbounded
    std::chrono::milliseconds busy_timeout{5000};
    std::string log_level = "info";

    static Result<VectorStoreConfig> loadFromFile(const std::filesystem::path& path);

    void applyEnvironmentOverrides();

    Result<void> validate() const;
};

} // namespace vecstore::config
