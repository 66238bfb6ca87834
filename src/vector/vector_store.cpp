#include "vector/vector_store.hpp"
#include "vector/faiss_vector_store.hpp"
#include <algorithm>
#include <stdexcept>

namespace workspace_rag {

using json = nlohmann::json;

json EmbeddingsMetadata::to_json() const {
    return json{
        {"artifact_id", artifact_id},
        {"artifact_type", artifact_type},
        {"parent_id", parent_id},
        {"chunk_id", chunk_id},
        {"chunk_index", chunk_index},
        {"chunk_size", chunk_size},
        {"chunk_overlap", chunk_overlap},
        {"embedding_model", embedding_model},
        {"created_at", created_at},
        {"updated_at", updated_at}
    };
}

EmbeddingsMetadata EmbeddingsMetadata::from_json(const json& j) {
    EmbeddingsMetadata m;
    auto str = [&](const char* key) {
        return (j.contains(key) && j[key].is_string()) ? j[key].get<std::string>() : std::string();
    };
    m.artifact_id = str("artifact_id");
    m.artifact_type = str("artifact_type");
    m.parent_id = str("parent_id");
    m.chunk_id = str("chunk_id");
    m.chunk_index = j.value("chunk_index", -1);
    m.chunk_size = j.value("chunk_size", 0);
    m.chunk_overlap = j.value("chunk_overlap", 0);
    m.embedding_model = str("embedding_model");
    m.created_at = j.value("created_at", int64_t{0});
    m.updated_at = j.value("updated_at", int64_t{0});
    return m;
}

bool EmbeddingsMetadata::matches(const json& filter) const {
    if (!filter.is_object() || filter.empty()) return true;
    json fields = to_json();
    for (auto it = filter.begin(); it != filter.end(); ++it) {
        auto field = fields.find(it.key());
        if (field == fields.end()) return false;
        if (it.value().is_array()) {
            const auto& options = it.value();
            if (std::find(options.begin(), options.end(), *field) == options.end()) return false;
        } else if (*field != it.value()) {
            return false;
        }
    }
    return true;
}

json EmbeddingsResult::to_json(bool include_embedding) const {
    json j = {
        {"id", id},
        {"content", content},
        {"metadata", metadata.to_json()}
    };
    if (include_embedding) j["embedding"] = embedding;
    if (score) j["score"] = *score;
    return j;
}

EmbeddingsResult EmbeddingsResult::from_json(const json& j) {
    EmbeddingsResult r;
    r.id = j.at("id").get<std::string>();
    if (j.contains("embedding")) r.embedding = j["embedding"].get<std::vector<float>>();
    r.content = j.value("content", "");
    if (j.contains("metadata")) r.metadata = EmbeddingsMetadata::from_json(j["metadata"]);
    if (j.contains("score") && j["score"].is_number()) r.score = j["score"].get<double>();
    return r;
}

double similarity_from_cosine_distance(double distance) {
    return std::clamp(1.0 - distance / 2.0, 0.0, 1.0);
}

std::shared_ptr<VectorDB> make_vector_db(const VectorDBConfig& config, int dimension) {
    config.validate();
    if (config.provider == "faiss") {
        return std::make_shared<FaissVectorStore>(dimension, config.data_path);
    }
    throw std::invalid_argument("Unsupported vector db provider: " + config.provider);
}

} // namespace workspace_rag
