#include <vecstore/vector/table_identifier.h>

#include <algorithm>
#include <cstdio>

namespace vecstore::vector {

namespace {

constexpr size_t kMaxModelComponent = 48;

uint64_t fnv1a(std::string_view data) {
    uint64_t hash = 14695981039346656037ull;
    for (unsigned char c : data) {
        hash ^= c;
        hash *= 1099511628211ull;
    }
    return hash;
}

bool isIdentChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '-';
}

} // namespace

bool TableIdentifier::isValid(std::string_view name) {
    if (name.empty() || name.size() > kMaxLength) {
        return false;
    }
    for (char c : name) {
        if (!isIdentChar(c)) {
            return false;
        }
    }
    return true;
}

Result<TableIdentifier> TableIdentifier::create(std::string_view name) {
    if (!isValid(name)) {
        return Error{ErrorCode::ValidationError,
                     "Invalid table identifier '" + std::string(name) +
                         "': only [A-Za-z0-9_-] allowed, max " + std::to_string(kMaxLength) +
                         " characters"};
    }
    return TableIdentifier(std::string(name));
}

TableIdentifier TableIdentifier::forIndex(std::string_view modelName, size_t dimension,
                                          std::optional<int64_t> documentId) {
    std::string sanitized;
    sanitized.reserve(std::min(modelName.size(), kMaxModelComponent));
    for (char c : modelName) {
        if (sanitized.size() >= kMaxModelComponent)
            break;
        bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        sanitized.push_back(alnum ? c : '_');
    }
    if (sanitized.empty()) {
        sanitized = "model";
    }

    std::string key = std::string(modelName) + '\x1f' + std::to_string(dimension);
    if (documentId) {
        key += '\x1f' + std::to_string(*documentId);
    }
    char hashHex[17];
    std::snprintf(hashHex, sizeof(hashHex), "%016llx",
                  static_cast<unsigned long long>(fnv1a(key)));

    std::string name = "vec_";
    if (documentId) {
        // '-' is a legal identifier character, negative ids stay representable
        name += "doc_" + std::to_string(*documentId) + "_";
    }
    name += sanitized + "_" + std::to_string(dimension) + "_" + std::string(hashHex, 12);
    return TableIdentifier(std::move(name));
}

Result<TableIdentifier> TableIdentifier::withSuffix(std::string_view suffix) const {
    return create(name_ + std::string(suffix));
}

} // namespace vecstore::vector
