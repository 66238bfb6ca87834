#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "workspace_config.hpp"

namespace workspace_rag {

// Identity fields carried with every stored vector. chunk_index is -1 for
// whole-artifact embeddings.
struct EmbeddingsMetadata {
    std::string artifact_id;
    std::string artifact_type;
    std::string parent_id;
    std::string chunk_id;
    int chunk_index = -1;
    int chunk_size = 0;
    int chunk_overlap = 0;
    std::string embedding_model;
    int64_t created_at = 0;
    int64_t updated_at = 0;

    bool is_chunk() const { return !chunk_id.empty() && chunk_index >= 0; }

    // Every filter key must equal the stored field; an array value matches
    // any of its members.
    bool matches(const nlohmann::json& filter) const;

    nlohmann::json to_json() const;
    static EmbeddingsMetadata from_json(const nlohmann::json& j);
};

struct EmbeddingsResult {
    std::string id;
    std::vector<float> embedding;
    std::string content;
    EmbeddingsMetadata metadata;
    std::optional<double> score;

    nlohmann::json to_json(bool include_embedding = true) const;
    static EmbeddingsResult from_json(const nlohmann::json& j);
};

struct EmbeddingsResults {
    std::vector<EmbeddingsResult> docs;
    int64_t retrieved_at = 0;
};

// Cosine distance in [0, 2] to similarity in [0, 1]; 0 -> 1.0, 2 -> 0.0.
double similarity_from_cosine_distance(double distance);

class VectorDB {
public:
    virtual ~VectorDB() = default;

    // Throws std::invalid_argument when an id already exists.
    virtual void insert(const std::string& collection, const std::vector<EmbeddingsResult>& items) = 0;
    virtual void upsert(const std::string& collection, const std::vector<EmbeddingsResult>& items) = 0;

    // Results below `threshold` are dropped; at most `limit` are returned,
    // best first. std::nullopt when the collection does not exist.
    virtual std::optional<EmbeddingsResults> search(const std::string& collection,
                                                    const std::vector<std::vector<float>>& query_vectors,
                                                    const nlohmann::json& filter,
                                                    double threshold,
                                                    int limit) = 0;

    virtual std::optional<EmbeddingsResults> query(const std::string& collection,
                                                   const nlohmann::json& filter,
                                                   int limit) = 0;
    virtual std::optional<EmbeddingsResults> get(const std::string& collection) = 0;

    // By ids, else by filter; with neither the whole collection is dropped.
    virtual void remove(const std::string& collection,
                        const std::vector<std::string>& ids,
                        const nlohmann::json& filter = nlohmann::json::object()) = 0;

    virtual void reset() = 0;
    virtual bool has_collection(const std::string& collection) const = 0;
    virtual void delete_collection(const std::string& collection) = 0;
};

// faiss. Throws std::invalid_argument for unknown providers.
std::shared_ptr<VectorDB> make_vector_db(const VectorDBConfig& config, int dimension);

} // namespace workspace_rag
