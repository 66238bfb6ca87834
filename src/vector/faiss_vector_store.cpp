#include "vector/faiss_vector_store.hpp"
#include <faiss/IndexFlat.h>
#include <faiss/IndexIDMap.h>
#include <faiss/impl/FaissException.h>
#include <faiss/impl/IDSelector.h>
#include <faiss/index_io.h>
#include <faiss/utils/distances.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <stdexcept>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace workspace_rag {

struct FaissVectorStore::Collection {
    std::unique_ptr<faiss::Index> index;
    std::unordered_map<int64_t, EmbeddingsResult> records;
    std::unordered_map<std::string, int64_t> labels;  // record id -> faiss label
    int64_t next_label = 0;
};

namespace {

std::unique_ptr<faiss::Index> make_index(int dimension) {
    auto* map = new faiss::IndexIDMap2(new faiss::IndexFlatIP(dimension));
    map->own_fields = true;
    return std::unique_ptr<faiss::Index>(map);
}

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Records in insertion order for deterministic listings.
std::vector<const EmbeddingsResult*> ordered_records(const std::unordered_map<int64_t, EmbeddingsResult>& records) {
    std::map<int64_t, const EmbeddingsResult*> by_label;
    for (const auto& [label, record] : records) by_label[label] = &record;
    std::vector<const EmbeddingsResult*> out;
    out.reserve(by_label.size());
    for (const auto& [label, record] : by_label) out.push_back(record);
    return out;
}

} // namespace

FaissVectorStore::FaissVectorStore(int dimension, std::string data_path)
    : dimension_(dimension), data_path_(std::move(data_path)) {
    if (dimension_ <= 0) throw std::invalid_argument("FaissVectorStore dimension must be positive");
    if (!data_path_.empty()) load_all();
}

FaissVectorStore::~FaissVectorStore() {
}

FaissVectorStore::Collection& FaissVectorStore::ensure_collection(const std::string& name) {
    auto it = collections_.find(name);
    if (it != collections_.end()) return *it->second;

    auto c = std::make_unique<Collection>();
    c->index = make_index(dimension_);
    auto& ref = *c;
    collections_[name] = std::move(c);
    spdlog::info("📚 Created vector collection {}", name);
    return ref;
}

std::vector<float> FaissVectorStore::normalized(const std::vector<float>& v) const {
    if (static_cast<int>(v.size()) != dimension_) {
        throw std::invalid_argument("Vector dimension " + std::to_string(v.size()) +
                                    " does not match store dimension " + std::to_string(dimension_));
    }
    std::vector<float> copy = v;
    faiss::fvec_renorm_L2(dimension_, 1, copy.data());
    return copy;
}

void FaissVectorStore::remove_labels(Collection& c, const std::vector<int64_t>& labels) {
    if (labels.empty()) return;
    std::vector<faiss::idx_t> ids(labels.begin(), labels.end());
    faiss::IDSelectorBatch selector(ids.size(), ids.data());
    c.index->remove_ids(selector);
    for (auto label : labels) {
        auto it = c.records.find(label);
        if (it == c.records.end()) continue;
        c.labels.erase(it->second.id);
        c.records.erase(it);
    }
}

void FaissVectorStore::add_records(const std::string& name, Collection& c,
                                   const std::vector<EmbeddingsResult>& items, bool replace) {
    if (items.empty()) return;

    std::vector<float> flat;
    flat.reserve(items.size() * dimension_);
    std::unordered_set<std::string> batch_ids;
    std::vector<int64_t> replaced;

    for (const auto& item : items) {
        if (!batch_ids.insert(item.id).second) {
            throw std::invalid_argument("Duplicate id in batch: " + item.id);
        }
        auto existing = c.labels.find(item.id);
        if (existing != c.labels.end()) {
            if (!replace) throw std::invalid_argument("Id already exists in " + name + ": " + item.id);
            replaced.push_back(existing->second);
        }
        auto v = normalized(item.embedding);
        flat.insert(flat.end(), v.begin(), v.end());
    }

    try {
        remove_labels(c, replaced);

        std::vector<faiss::idx_t> new_labels;
        new_labels.reserve(items.size());
        for (size_t i = 0; i < items.size(); ++i) new_labels.push_back(c.next_label++);

        c.index->add_with_ids(static_cast<faiss::idx_t>(items.size()), flat.data(), new_labels.data());

        for (size_t i = 0; i < items.size(); ++i) {
            EmbeddingsResult record = items[i];
            record.score.reset();
            c.labels[record.id] = new_labels[i];
            c.records.emplace(new_labels[i], std::move(record));
        }
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS add to {} failed: {}", name, e.what());
        throw std::runtime_error(std::string("FAISS add failed: ") + e.what());
    }

    spdlog::info("✅ {} {} vectors in {}. Total: {}", replace ? "Upserted" : "Inserted",
                 items.size(), name, c.index->ntotal);
    persist(name, c);
}

void FaissVectorStore::insert(const std::string& collection, const std::vector<EmbeddingsResult>& items) {
    std::unique_lock lock(mutex_);
    add_records(collection, ensure_collection(collection), items, false);
}

void FaissVectorStore::upsert(const std::string& collection, const std::vector<EmbeddingsResult>& items) {
    std::unique_lock lock(mutex_);
    add_records(collection, ensure_collection(collection), items, true);
}

std::optional<EmbeddingsResults> FaissVectorStore::search(const std::string& collection,
                                                          const std::vector<std::vector<float>>& query_vectors,
                                                          const json& filter,
                                                          double threshold,
                                                          int limit) {
    std::shared_lock lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) {
        spdlog::warn("⚠️ Vector collection {} not found", collection);
        return std::nullopt;
    }
    const Collection& c = *it->second;

    EmbeddingsResults results;
    results.retrieved_at = unix_now();
    if (c.index->ntotal == 0 || limit <= 0) return results;

    // Filters are applied after the scan, so scan everything when filtering.
    bool filtered = filter.is_object() && !filter.empty();
    faiss::idx_t k = filtered ? c.index->ntotal : std::min<faiss::idx_t>(limit, c.index->ntotal);

    std::unordered_map<std::string, EmbeddingsResult> best;
    std::vector<float> scores(k);
    std::vector<faiss::idx_t> labels(k);

    for (const auto& query_vector : query_vectors) {
        auto q = normalized(query_vector);
        try {
            c.index->search(1, q.data(), k, scores.data(), labels.data());
        } catch (const faiss::FaissException& e) {
            spdlog::error("❌ FAISS search in {} failed: {}", collection, e.what());
            throw std::runtime_error(std::string("FAISS search failed: ") + e.what());
        }

        for (faiss::idx_t i = 0; i < k; ++i) {
            if (labels[i] == -1) continue;
            double similarity = similarity_from_cosine_distance(1.0 - scores[i]);
            if (similarity < threshold) continue;

            auto rec = c.records.find(labels[i]);
            if (rec == c.records.end()) continue;
            if (!rec->second.metadata.matches(filter)) continue;

            auto prev = best.find(rec->second.id);
            if (prev != best.end() && prev->second.score.value_or(0.0) >= similarity) continue;
            EmbeddingsResult hit = rec->second;
            hit.score = similarity;
            best[hit.id] = std::move(hit);
        }
    }

    for (auto& [id, hit] : best) results.docs.push_back(std::move(hit));
    std::sort(results.docs.begin(), results.docs.end(), [](const auto& a, const auto& b) {
        return a.score.value_or(0.0) > b.score.value_or(0.0);
    });
    if (results.docs.size() > static_cast<size_t>(limit)) results.docs.resize(limit);

    spdlog::debug("🔍 {} hits in {} above {:.2f}", results.docs.size(), collection, threshold);
    return results;
}

std::optional<EmbeddingsResults> FaissVectorStore::query(const std::string& collection,
                                                         const json& filter,
                                                         int limit) {
    std::shared_lock lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) return std::nullopt;

    EmbeddingsResults results;
    results.retrieved_at = unix_now();
    for (const auto* record : ordered_records(it->second->records)) {
        if (!record->metadata.matches(filter)) continue;
        results.docs.push_back(*record);
        if (limit > 0 && results.docs.size() >= static_cast<size_t>(limit)) break;
    }
    return results;
}

std::optional<EmbeddingsResults> FaissVectorStore::get(const std::string& collection) {
    return query(collection, json::object(), 0);
}

void FaissVectorStore::remove(const std::string& collection,
                              const std::vector<std::string>& ids,
                              const json& filter) {
    bool has_filter = filter.is_object() && !filter.empty();
    if (ids.empty() && !has_filter) {
        delete_collection(collection);
        return;
    }

    std::unique_lock lock(mutex_);
    auto it = collections_.find(collection);
    if (it == collections_.end()) return;
    Collection& c = *it->second;

    std::vector<int64_t> labels;
    if (!ids.empty()) {
        for (const auto& id : ids) {
            auto label = c.labels.find(id);
            if (label != c.labels.end()) labels.push_back(label->second);
        }
    } else {
        for (const auto& [label, record] : c.records) {
            if (record.metadata.matches(filter)) labels.push_back(label);
        }
    }

    try {
        remove_labels(c, labels);
    } catch (const faiss::FaissException& e) {
        spdlog::error("❌ FAISS remove from {} failed: {}", collection, e.what());
        throw std::runtime_error(std::string("FAISS remove failed: ") + e.what());
    }
    spdlog::info("🗑️ Removed {} vectors from {}", labels.size(), collection);
    persist(collection, c);
}

void FaissVectorStore::reset() {
    std::unique_lock lock(mutex_);
    collections_.clear();
    if (!data_path_.empty() && fs::exists(data_path_)) {
        for (const auto& entry : fs::directory_iterator(data_path_)) {
            if (entry.is_directory()) fs::remove_all(entry.path());
        }
    }
    spdlog::warn("🧹 Vector store reset");
}

bool FaissVectorStore::has_collection(const std::string& collection) const {
    std::shared_lock lock(mutex_);
    return collections_.count(collection) > 0;
}

void FaissVectorStore::delete_collection(const std::string& collection) {
    std::unique_lock lock(mutex_);
    if (collections_.erase(collection) == 0) return;
    if (!data_path_.empty()) fs::remove_all(fs::path(data_path_) / collection);
    spdlog::info("🗑️ Deleted vector collection {}", collection);
}

size_t FaissVectorStore::count(const std::string& collection) const {
    std::shared_lock lock(mutex_);
    auto it = collections_.find(collection);
    return it == collections_.end() ? 0 : it->second->records.size();
}

void FaissVectorStore::persist(const std::string& name, const Collection& c) const {
    if (data_path_.empty()) return;

    fs::path dir = fs::path(data_path_) / name;
    fs::create_directories(dir);

    faiss::write_index(c.index.get(), (dir / "faiss.index").string().c_str());

    json records = json::array();
    for (const auto& [label, record] : c.records) {
        records.push_back({{"label", label}, {"record", record.to_json()}});
    }
    json metadata = {{"next_label", c.next_label}, {"records", records}};

    std::ofstream meta_file(dir / "metadata.json");
    meta_file << metadata.dump();
    if (!meta_file) throw std::runtime_error("Failed to write " + (dir / "metadata.json").string());
}

void FaissVectorStore::load_all() {
    if (!fs::exists(data_path_)) return;

    for (const auto& entry : fs::directory_iterator(data_path_)) {
        if (!entry.is_directory()) continue;
        fs::path index_path = entry.path() / "faiss.index";
        fs::path meta_path = entry.path() / "metadata.json";
        if (!fs::exists(index_path) || !fs::exists(meta_path)) continue;

        std::string name = entry.path().filename().string();
        try {
            auto c = std::make_unique<Collection>();
            c->index.reset(faiss::read_index(index_path.string().c_str()));
            if (c->index->d != dimension_) {
                throw std::runtime_error("dimension " + std::to_string(c->index->d) +
                                         " != " + std::to_string(dimension_));
            }

            std::ifstream meta_file(meta_path);
            json metadata = json::parse(meta_file);
            c->next_label = metadata.value("next_label", int64_t{0});
            for (const auto& item : metadata["records"]) {
                int64_t label = item.at("label").get<int64_t>();
                auto record = EmbeddingsResult::from_json(item.at("record"));
                c->labels[record.id] = label;
                c->records.emplace(label, std::move(record));
            }
            spdlog::info("✅ Loaded FAISS collection {} with {} vectors from {}", name, c->index->ntotal, entry.path().string());
            collections_[name] = std::move(c);
        } catch (const std::exception& e) {
            spdlog::error("❌ Failed to load vector collection {}: {}", name, e.what());
            throw std::runtime_error("Failed to load vector collection " + name + ": " + e.what());
        }
    }
}

} // namespace workspace_rag
