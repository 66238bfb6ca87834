#pragma once

#include <atomic>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>
#include "artifact.hpp"
#include "embedding/embedding_service.hpp"
#include "workspace_config.hpp"

namespace workspace_rag::testing {

// Fresh directory under the system temp dir, removed on scope exit.
class TempDir {
public:
    TempDir() : path_(std::filesystem::temp_directory_path() / ("workspace_rag_test_" + generate_uuid())) {
        std::filesystem::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

inline void write_file(const std::filesystem::path& path, const std::string& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << data;
}

inline std::vector<std::string> files_in(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    if (!std::filesystem::is_directory(dir)) return names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    return names;
}

// Keyword-count embeddings over a fixed vocabulary. The last dimension is a
// small constant so no vector is all zeros. Text containing "FAIL" throws.
class KeywordEmbeddings : public Embeddings {
public:
    static const std::vector<std::string>& vocabulary() {
        static const std::vector<std::string> words = {"apple", "banana", "cherry", "durian"};
        return words;
    }

    static EmbeddingsConfig make_config() {
        EmbeddingsConfig config;
        config.enabled = true;
        config.provider = "keyword";
        config.model_name = "keyword-test";
        config.dimensions = static_cast<int>(vocabulary().size()) + 1;
        config.max_concurrent = 2;
        return config;
    }

    KeywordEmbeddings() : Embeddings(make_config()) {}
    ~KeywordEmbeddings() override = default;

    std::vector<float> embed_query(const std::string& text) override {
        ++calls_;
        if (text.find("FAIL") != std::string::npos) throw std::runtime_error("embedding backend unavailable");

        std::vector<float> v(vocabulary().size() + 1, 0.0f);
        std::string word;
        auto flush = [&]() {
            for (size_t i = 0; i < vocabulary().size(); ++i) {
                if (word == vocabulary()[i]) v[i] += 1.0f;
            }
            word.clear();
        };
        for (char c : text) {
            if (std::isalpha(static_cast<unsigned char>(c))) {
                word += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
            } else {
                flush();
            }
        }
        flush();
        v.back() = 0.01f;
        return v;
    }

    int calls() const { return calls_.load(); }

private:
    std::atomic<int> calls_{0};
};

} // namespace workspace_rag::testing
