#include <spdlog/spdlog.h>
#include <vecstore/config/config_helpers.h>
#include <vecstore/config/vector_store_config.h>

#include <cstdlib>
#include <system_error>

namespace vecstore::config {

namespace {

constexpr const char* kSection = "vector_store";

Result<size_t> parseSize(const std::string& key, const std::string& raw) {
    if (raw.empty() || raw.front() == '-') {
        return Error{ErrorCode::ValidationError, "Invalid value for " + key + ": '" + raw + "'"};
    }
    try {
        size_t consumed = 0;
        unsigned long long v = std::stoull(raw, &consumed);
        if (consumed != raw.size()) {
            return Error{ErrorCode::ValidationError,
                         "Invalid value for " + key + ": '" + raw + "'"};
        }
        return static_cast<size_t>(v);
    } catch (const std::exception&) {
        return Error{ErrorCode::ValidationError, "Invalid value for " + key + ": '" + raw + "'"};
    }
}

Result<bool> parseFlag(const std::string& key, const std::string& raw) {
    auto v = parse_bool(raw);
    if (!v) {
        return Error{ErrorCode::ValidationError,
                     "Invalid boolean for " + key + ": '" + raw + "'"};
    }
    return *v;
}

} // namespace

Result<VectorStoreConfig> VectorStoreConfig::loadFromFile(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return Error{ErrorCode::NotFound, "Config file not found: " + path.string()};
    }

    VectorStoreConfig cfg;
    auto values = parse_config_section(path, kSection);

    for (const auto& [key, raw] : values) {
        if (key == "base_path") {
            cfg.base_path = expand_tilde(raw);
        } else if (key == "backend") {
            cfg.backend = raw;
        } else if (key == "enable_accelerated") {
            auto v = parseFlag(key, raw);
            if (!v)
                return v.error();
            cfg.enable_accelerated = v.value();
        } else if (key == "default_index_type") {
            cfg.default_index_type = raw;
        } else if (key == "mirror_to_model_index") {
            auto v = parseFlag(key, raw);
            if (!v)
                return v.error();
            cfg.mirror_to_model_index = v.value();
        } else if (key == "max_pool_size") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            cfg.max_pool_size = v.value();
        } else if (key == "busy_timeout_ms") {
            auto v = parseSize(key, raw);
            if (!v)
                return v.error();
            cfg.busy_timeout = std::chrono::milliseconds(v.value());
        } else if (key == "log_level") {
            cfg.log_level = raw;
        } else {
            spdlog::warn("Ignoring unknown [{}] key '{}' in {}", kSection, key, path.string());
        }
    }

    spdlog::debug("Loaded vector store config from {}", path.string());
    return cfg;
}

void VectorStoreConfig::applyEnvironmentOverrides() {
    if (const char* env = std::getenv("VECSTORE_BASE_PATH"); env && *env) {
        base_path = expand_tilde(env);
    }
    if (const char* env = std::getenv("VECSTORE_BACKEND"); env && *env) {
        backend = env;
    }
    if (const char* env = std::getenv("VECSTORE_DISABLE_ACCELERATED"); env && *env) {
        if (auto v = parse_bool(env); v && *v) {
            enable_accelerated = false;
        }
    }
    if (const char* env = std::getenv("VECSTORE_LOG_LEVEL"); env && *env) {
        log_level = env;
    }
    if (const char* env = std::getenv("VECSTORE_MAX_POOL_SIZE"); env && *env) {
        auto v = parseSize("VECSTORE_MAX_POOL_SIZE", env);
        if (v) {
            max_pool_size = v.value();
        } else {
            spdlog::warn("{}", v.error().message);
        }
    }
}

Result<void> VectorStoreConfig::validate() const {
    if (base_path.empty()) {
        return Error{ErrorCode::ValidationError, "base_path must not be empty"};
    }
    if (backend != "sqlite-vec" && backend != "memory") {
        return Error{ErrorCode::ValidationError, "Unsupported backend: " + backend};
    }
    if (backend == "memory" && max_pool_size > 0) {
        return Error{ErrorCode::ValidationError,
                     "max_pool_size must be 0 with the memory backend (evicted indices lose "
                     "their vectors)"};
    }
    if (busy_timeout.count() <= 0) {
        return Error{ErrorCode::ValidationError, "busy_timeout_ms must be positive"};
    }
    return {};
}

} // namespace vecstore::config
