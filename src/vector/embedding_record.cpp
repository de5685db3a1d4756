#include <vecstore/vector/embedding_record.h>
#include <vecstore/vector/vector_record_store.h>

namespace vecstore::vector {

namespace {

Result<double> requireNumber(const nlohmann::json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_number()) {
        return Error{ErrorCode::ValidationError, std::string("'") + field + "' must be a number"};
    }
    return it->get<double>();
}

} // namespace

Result<EmbeddingRecord> EmbeddingRecord::fromJson(const nlohmann::json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::ValidationError, "Embedding record must be a JSON object"};
    }

    EmbeddingRecord rec;

    auto chunk = requireNumber(j, "chunkId");
    if (!chunk)
        return chunk.error();
    auto chunkId = normalizeChunkId(chunk.value());
    if (!chunkId)
        return chunkId.error();
    rec.chunkId = chunkId.value();

    auto doc = j.find("documentId");
    if (doc == j.end() || !doc->is_number_integer()) {
        return Error{ErrorCode::ValidationError, "'documentId' must be an integer"};
    }
    rec.documentId = doc->get<int64_t>();

    auto model = j.find("model");
    if (model == j.end() || !model->is_string() || model->get<std::string>().empty()) {
        return Error{ErrorCode::ValidationError, "'model' must be a non-empty string"};
    }
    rec.model = model->get<std::string>();

    auto emb = j.find("embedding");
    if (emb == j.end() || !emb->is_array() || emb->empty()) {
        return Error{ErrorCode::ValidationError, "'embedding' must be a non-empty array"};
    }
    rec.embedding.reserve(emb->size());
    for (const auto& v : *emb) {
        if (!v.is_number()) {
            return Error{ErrorCode::ValidationError, "'embedding' must contain only numbers"};
        }
        rec.embedding.push_back(v.get<float>());
    }

    if (auto dims = j.find("dimensions"); dims != j.end() && !dims->is_null()) {
        if (!dims->is_number_unsigned() || dims->get<uint64_t>() == 0) {
            return Error{ErrorCode::ValidationError, "'dimensions' must be a positive integer"};
        }
        rec.dimensions = dims->get<size_t>();
    } else {
        rec.dimensions = rec.embedding.size();
    }

    if (auto content = j.find("content"); content != j.end() && content->is_string()) {
        rec.content = content->get<std::string>();
    }
    if (auto meta = j.find("metadata"); meta != j.end()) {
        rec.metadata = *meta;
    }
    return rec;
}

nlohmann::json EmbeddingRecord::toJson() const {
    nlohmann::json j;
    j["chunkId"] = chunkId;
    j["documentId"] = documentId;
    j["content"] = content;
    j["embedding"] = embedding;
    j["model"] = model;
    j["dimensions"] = dimensions;
    if (!metadata.is_null()) {
        j["metadata"] = metadata;
    }
    return j;
}

} // namespace vecstore::vector
