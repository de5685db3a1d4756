#include <spdlog/spdlog.h>
#include <vecstore/vector/in_memory_backend.h>
#include <vecstore/vector/sqlite_vec_backend.h>
#include <vecstore/vector/vector_backend.h>

namespace vecstore::vector {

const char* backendTypeToString(VectorBackendType type) {
    switch (type) {
        case VectorBackendType::SqliteVec:
            return "sqlite-vec";
        case VectorBackendType::InMemory:
            return "memory";
    }
    return "unknown";
}

Result<VectorBackendType> parseBackendType(const std::string& name) {
    if (name == "sqlite-vec" || name == "sqlite_vec" || name == "sqlite") {
        return VectorBackendType::SqliteVec;
    }
    if (name == "memory" || name == "in-memory" || name == "inmemory") {
        return VectorBackendType::InMemory;
    }
    return Error{ErrorCode::InvalidArgument, "Unknown vector backend: " + name};
}

const char* indexFileExtension(VectorBackendType type) {
    return type == VectorBackendType::InMemory ? "mem" : "db";
}

std::unique_ptr<IVectorIndexBackend>
createVectorIndexBackend(VectorBackendType type, const std::filesystem::path& basePath,
                         const BackendOptions& options) {
    switch (type) {
        case VectorBackendType::SqliteVec:
            return std::make_unique<SqliteVecBackend>(basePath, options);
        case VectorBackendType::InMemory:
            return std::make_unique<InMemoryBackend>(basePath);
    }
    spdlog::warn("Unknown backend type {}, using sqlite-vec", static_cast<int>(type));
    return std::make_unique<SqliteVecBackend>(basePath, options);
}

} // namespace vecstore::vector
