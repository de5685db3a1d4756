#pragma once

#include <vecstore/vector/vector_backend.h>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace vecstore::vector {

/**
 * @brief Escape a model name for use in a file name
 *
 * [A-Za-z0-9.-] are kept, every other byte is written as ~XX (upper-case hex). The mapping is
 * reversible with unescapeModelName().
 */
std::string escapeModelName(std::string_view modelName);
std::optional<std::string> unescapeModelName(std::string_view escaped);

/**
 * @brief Components recovered from an index file name
 */
struct IndexFileName {
    std::optional<int64_t> documentId;
    std::string modelName;
    size_t dimension = 0;
};

/**
 * @brief Parse index_<model>_<dim>.<ext> or index_doc_<id>_<model>_<dim>.<ext>
 */
std::optional<IndexFileName> parseIndexFileName(std::string_view fileName, std::string_view ext);

/**
 * @brief Location of an index file below basePath (see AbstractVectorIndexBackend)
 */
std::filesystem::path indexFilePath(const std::filesystem::path& basePath, std::string_view ext,
                                    const std::string& modelName, size_t dimension,
                                    std::optional<int64_t> documentId = std::nullopt);

/**
 * @brief Remove an index file together with its -wal and -shm companions; missing files are
 *        ignored
 */
Result<void> removeIndexFiles(const std::filesystem::path& indexFile);

/**
 * @brief Shared path naming and validation for backends
 *
 * Layout below basePath:
 *   models/index_<model>_<dim>.<ext>
 *   documents/index_doc_<documentId>_<model>_<dim>.<ext>
 */
class AbstractVectorIndexBackend : public IVectorIndexBackend {
public:
    explicit AbstractVectorIndexBackend(std::filesystem::path basePath);

    bool documentIndexExists(int64_t documentId) const override;
    const IndexConfig& config() const override { return config_; }

    [[nodiscard]] const std::filesystem::path& basePath() const { return basePath_; }

    std::filesystem::path modelIndexPath(const std::string& modelName, size_t dimension) const;
    std::filesystem::path documentIndexPath(int64_t documentId, const std::string& modelName,
                                            size_t dimension) const;
    std::filesystem::path indexPathFor(const IndexConfig& config) const;

protected:
    /// File extension without the dot
    virtual std::string fileExtension() const = 0;

    static Result<void> ensureIndexDirectory(const std::filesystem::path& indexFile);
    static Result<void> validateDimensions(std::span<const float> vector, size_t expected);
    static Result<void> validateConfig(const IndexConfig& config);

    std::filesystem::path basePath_;
    IndexConfig config_;
};

} // namespace vecstore::vector
