#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace workspace_rag {

class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void put(const std::string& key, const std::string& data) = 0;
    virtual bool exists(const std::string& key) = 0;
    virtual void remove(const std::string& key) = 0;
    // Every key starting with `prefix`, at any depth.
    virtual std::vector<std::string> list(const std::string& prefix) = 0;
};

class MemoryObjectStore : public ObjectStore {
public:
    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& data) override;
    bool exists(const std::string& key) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix) override;

    size_t size() const;

private:
    std::map<std::string, std::string> objects_;
    mutable std::mutex mutex_;
};

// S3-compatible path-style REST client: {endpoint}/{bucket}/{key}.
// Authenticates with a bearer token when one is configured.
class HttpObjectStore : public ObjectStore {
public:
    HttpObjectStore(std::string endpoint, std::string bucket, std::string access_token = "",
                    int timeout_seconds = 30);

    std::optional<std::string> get(const std::string& key) override;
    void put(const std::string& key, const std::string& data) override;
    bool exists(const std::string& key) override;
    void remove(const std::string& key) override;
    std::vector<std::string> list(const std::string& prefix) override;

private:
    std::string object_url(const std::string& key) const;

    std::string endpoint_;
    std::string bucket_;
    std::string access_token_;
    int timeout_ms_;
};

} // namespace workspace_rag
