#pragma once

#include <vecstore/core/types.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vecstore::vector {

/**
 * @brief Validated SQL table name for a vector index
 *
 * Table names are interpolated into DDL, which cannot take bound parameters, so an instance can
 * only be obtained through create() (which rejects anything outside [A-Za-z0-9_-]) or
 * forIndex() (which derives a conforming name).
 */
class TableIdentifier {
public:
    static constexpr size_t kMaxLength = 128;

    /**
     * @brief Validate an existing name
     * @return ValidationError when the name is empty, too long or contains other characters
     */
    static Result<TableIdentifier> create(std::string_view name);

    /**
     * @brief Deterministic name for (model, dimension[, document])
     *
     * Format: vec_[doc_<id>_]<sanitized model>_<dim>_<hash>, where hash is taken over the raw
     * key so that models differing only in punctuation still map to distinct tables.
     */
    static TableIdentifier forIndex(std::string_view modelName, size_t dimension,
                                    std::optional<int64_t> documentId = std::nullopt);

    static bool isValid(std::string_view name);

    [[nodiscard]] const std::string& str() const { return name_; }

    /// Double-quoted form for use in SQL text
    [[nodiscard]] std::string quoted() const { return "\"" + name_ + "\""; }

    /// Identifier with a suffix appended (e.g. "_legacy"); the result is re-validated
    Result<TableIdentifier> withSuffix(std::string_view suffix) const;

    bool operator==(const TableIdentifier& other) const { return name_ == other.name_; }
    bool operator!=(const TableIdentifier& other) const { return name_ != other.name_; }

private:
    explicit TableIdentifier(std::string name) : name_(std::move(name)) {}

    std::string name_;
};

} // namespace vecstore::vector
