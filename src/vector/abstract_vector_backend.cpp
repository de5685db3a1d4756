#include <spdlog/spdlog.h>
#include <vecstore/vector/abstract_vector_backend.h>

#include <charconv>
#include <cmath>
#include <cstdio>
#include <system_error>

namespace vecstore::vector {

namespace {

bool keepInFileName(unsigned char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '.' || c == '-';
}

int hexValue(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    return -1;
}

template <typename T> std::optional<T> parseNumber(std::string_view s) {
    T value{};
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc{} || ptr != s.data() + s.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::string escapeModelName(std::string_view modelName) {
    std::string out;
    out.reserve(modelName.size());
    for (unsigned char c : modelName) {
        if (keepInFileName(c)) {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "~%02X", c);
            out.append(buf, 3);
        }
    }
    return out;
}

std::optional<std::string> unescapeModelName(std::string_view escaped) {
    std::string out;
    out.reserve(escaped.size());
    for (size_t i = 0; i < escaped.size(); ++i) {
        char c = escaped[i];
        if (c != '~') {
            if (!keepInFileName(static_cast<unsigned char>(c)))
                return std::nullopt;
            out.push_back(c);
            continue;
        }
        if (i + 2 >= escaped.size())
            return std::nullopt;
        int hi = hexValue(escaped[i + 1]);
        int lo = hexValue(escaped[i + 2]);
        if (hi < 0 || lo < 0)
            return std::nullopt;
        out.push_back(static_cast<char>((hi << 4) | lo));
        i += 2;
    }
    return out;
}

std::optional<IndexFileName> parseIndexFileName(std::string_view fileName, std::string_view ext) {
    constexpr std::string_view kPrefix = "index_";
    constexpr std::string_view kDocPrefix = "doc_";

    std::string suffix = "." + std::string(ext);
    if (fileName.size() <= kPrefix.size() + suffix.size() || !fileName.starts_with(kPrefix) ||
        !fileName.ends_with(suffix)) {
        return std::nullopt;
    }
    std::string_view body = fileName.substr(kPrefix.size());
    body.remove_suffix(suffix.size());

    IndexFileName parsed;
    if (body.starts_with(kDocPrefix)) {
        body.remove_prefix(kDocPrefix.size());
        auto sep = body.find('_');
        if (sep == std::string_view::npos)
            return std::nullopt;
        auto docId = parseNumber<int64_t>(body.substr(0, sep));
        if (!docId)
            return std::nullopt;
        parsed.documentId = *docId;
        body.remove_prefix(sep + 1);
    }

    // The escaped model never contains '_', so the last '_' separates the dimension
    auto last = body.rfind('_');
    if (last == std::string_view::npos || last == 0)
        return std::nullopt;
    auto dim = parseNumber<size_t>(body.substr(last + 1));
    auto model = unescapeModelName(body.substr(0, last));
    if (!dim || *dim == 0 || !model)
        return std::nullopt;

    parsed.modelName = std::move(*model);
    parsed.dimension = *dim;
    return parsed;
}

std::filesystem::path indexFilePath(const std::filesystem::path& basePath, std::string_view ext,
                                    const std::string& modelName, size_t dimension,
                                    std::optional<int64_t> documentId) {
    std::string suffix =
        escapeModelName(modelName) + "_" + std::to_string(dimension) + "." + std::string(ext);
    if (documentId) {
        return basePath / "documents" / ("index_doc_" + std::to_string(*documentId) + "_" + suffix);
    }
    return basePath / "models" / ("index_" + suffix);
}

Result<void> removeIndexFiles(const std::filesystem::path& indexFile) {
    for (const char* suffix : {"", "-wal", "-shm"}) {
        std::filesystem::path file(indexFile.string() + suffix);
        std::error_code ec;
        std::filesystem::remove(file, ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Failed to remove " + file.string() + ": " + ec.message()};
        }
    }
    return {};
}

AbstractVectorIndexBackend::AbstractVectorIndexBackend(std::filesystem::path basePath)
    : basePath_(std::move(basePath)) {}

std::filesystem::path AbstractVectorIndexBackend::modelIndexPath(const std::string& modelName,
                                                                 size_t dimension) const {
    return indexFilePath(basePath_, fileExtension(), modelName, dimension);
}

std::filesystem::path AbstractVectorIndexBackend::documentIndexPath(int64_t documentId,
                                                                    const std::string& modelName,
                                                                    size_t dimension) const {
    return indexFilePath(basePath_, fileExtension(), modelName, dimension, documentId);
}

std::filesystem::path AbstractVectorIndexBackend::indexPathFor(const IndexConfig& config) const {
    return indexFilePath(basePath_, fileExtension(), config.modelName, config.dimension,
                         config.documentId);
}

bool AbstractVectorIndexBackend::documentIndexExists(int64_t documentId) const {
    if (config_.modelName.empty() || config_.dimension == 0) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::exists(
        documentIndexPath(documentId, config_.modelName, config_.dimension), ec);
}

Result<void> AbstractVectorIndexBackend::ensureIndexDirectory(const std::filesystem::path& indexFile) {
    auto dir = indexFile.parent_path();
    if (dir.empty()) {
        return {};
    }
    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::IOError,
                     "Failed to create index directory " + dir.string() + ": " + ec.message()};
    }
    return {};
}

Result<void> AbstractVectorIndexBackend::validateDimensions(std::span<const float> vector,
                                                            size_t expected) {
    if (vector.empty()) {
        return Error{ErrorCode::ValidationError, "Vector must not be empty"};
    }
    if (vector.size() != expected) {
        return Error{ErrorCode::ValidationError,
                     "Dimension mismatch: expected " + std::to_string(expected) + ", got " +
                         std::to_string(vector.size())};
    }
    for (float v : vector) {
        if (!std::isfinite(v)) {
            return Error{ErrorCode::ValidationError, "Vector contains a non-finite value"};
        }
    }
    return {};
}

Result<void> AbstractVectorIndexBackend::validateConfig(const IndexConfig& config) {
    if (config.modelName.empty()) {
        return Error{ErrorCode::ValidationError, "Model name must not be empty"};
    }
    if (config.dimension == 0) {
        return Error{ErrorCode::ValidationError, "Dimension must be positive"};
    }
    if (config.indexType.empty()) {
        return Error{ErrorCode::ValidationError, "Index type must not be empty"};
    }
    return {};
}

} // namespace vecstore::vector
