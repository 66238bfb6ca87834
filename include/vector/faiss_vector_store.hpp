#pragma once

#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "vector/vector_store.hpp"

namespace workspace_rag {

// One exact inner-product index per collection over L2-normalized vectors,
// so inner product is cosine similarity and distance is 1 - ip.
// With a data path every mutation persists the collection as
// {data_path}/{collection}/faiss.index + metadata.json.
class FaissVectorStore : public VectorDB {
public:
    explicit FaissVectorStore(int dimension, std::string data_path = "");
    ~FaissVectorStore() override;

    void insert(const std::string& collection, const std::vector<EmbeddingsResult>& items) override;
    void upsert(const std::string& collection, const std::vector<EmbeddingsResult>& items) override;

    std::optional<EmbeddingsResults> search(const std::string& collection,
                                            const std::vector<std::vector<float>>& query_vectors,
                                            const nlohmann::json& filter,
                                            double threshold,
                                            int limit) override;
    std::optional<EmbeddingsResults> query(const std::string& collection,
                                           const nlohmann::json& filter,
                                           int limit) override;
    std::optional<EmbeddingsResults> get(const std::string& collection) override;

    void remove(const std::string& collection,
                const std::vector<std::string>& ids,
                const nlohmann::json& filter = nlohmann::json::object()) override;

    void reset() override;
    bool has_collection(const std::string& collection) const override;
    void delete_collection(const std::string& collection) override;

    size_t count(const std::string& collection) const;
    int dimension() const { return dimension_; }

private:
    struct Collection;

    Collection& ensure_collection(const std::string& name);
    void add_records(const std::string& name, Collection& c, const std::vector<EmbeddingsResult>& items, bool replace);
    void remove_labels(Collection& c, const std::vector<int64_t>& labels);
    std::vector<float> normalized(const std::vector<float>& v) const;
    void persist(const std::string& name, const Collection& c) const;
    void load_all();

    int dimension_;
    std::string data_path_;
    std::unordered_map<std::string, std::unique_ptr<Collection>> collections_;
    mutable std::shared_mutex mutex_;
};

} // namespace workspace_rag
