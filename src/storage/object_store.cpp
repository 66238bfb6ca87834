#include "storage/object_store.hpp"
#include <regex>
#include <string>
#include <utility>
#include <stdexcept>
#include <cpr/cpr.h>
#include <spdlog/spdlog.h>
#include "http_retry.hpp"

namespace workspace_rag {

// --- MemoryObjectStore ---

std::optional<std::string> MemoryObjectStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = objects_.find(key);
    if (it == objects_.end()) return std::nullopt;
    return it->second;
}

void MemoryObjectStore::put(const std::string& key, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_[key] = data;
}

bool MemoryObjectStore::exists(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.count(key) > 0;
}

void MemoryObjectStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    objects_.erase(key);
}

std::vector<std::string> MemoryObjectStore::list(const std::string& prefix) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> keys;
    for (auto it = objects_.lower_bound(prefix); it != objects_.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) break;
        keys.push_back(it->first);
    }
    return keys;
}

size_t MemoryObjectStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return objects_.size();
}

// --- HttpObjectStore ---

HttpObjectStore::HttpObjectStore(std::string endpoint, std::string bucket, std::string access_token,
                                 int timeout_seconds)
    : endpoint_(std::move(endpoint)),
      bucket_(std::move(bucket)),
      access_token_(std::move(access_token)),
      timeout_ms_(timeout_seconds * 1000) {
    if (endpoint_.empty()) throw std::invalid_argument("Object store endpoint is required");
    if (bucket_.empty()) throw std::invalid_argument("Object store bucket is required");
    while (!endpoint_.empty() && endpoint_.back() == '/') endpoint_.pop_back();
    spdlog::info("🪣 Object store: {}/{}", endpoint_, bucket_);
}

namespace {

// Percent-encodes each path segment; '/' separators are kept.
std::string encode_key_path(const std::string& key) {
    std::string encoded;
    size_t start = 0;
    while (true) {
        size_t slash = key.find('/', start);
        auto segment = cpr::util::urlEncode(key.substr(start, slash == std::string::npos ? std::string::npos
                                                                                          : slash - start));
        encoded.append(segment.data(), segment.size());
        if (slash == std::string::npos) break;
        encoded += '/';
        start = slash + 1;
    }
    return encoded;
}

// ListObjectsV2 escapes keys as XML text.
std::string decode_xml_text(const std::string& text) {
    static const std::pair<const char*, char> entities[] = {
        {"&amp;", '&'}, {"&lt;", '<'}, {"&gt;", '>'}, {"&quot;", '"'}, {"&apos;", '\''}};
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size();) {
        bool replaced = false;
        if (text[i] == '&') {
            for (const auto& [entity, ch] : entities) {
                if (text.compare(i, std::char_traits<char>::length(entity), entity) == 0) {
                    out += ch;
                    i += std::char_traits<char>::length(entity);
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced) out += text[i++];
    }
    return out;
}

cpr::Header auth_header(const std::string& token) {
    cpr::Header header;
    if (!token.empty()) header["Authorization"] = "Bearer " + token;
    return header;
}

[[noreturn]] void fail(const char* op, const std::string& key, const cpr::Response& r) {
    spdlog::error("❌ Object store {} {} failed [{}]: {} {}", op, key, r.status_code, r.error.message, r.text);
    throw std::runtime_error(std::string("Object store ") + op + " failed for " + key +
                             " (status " + std::to_string(r.status_code) + ")");
}

} // namespace

std::string HttpObjectStore::object_url(const std::string& key) const {
    return endpoint_ + "/" + bucket_ + "/" + encode_key_path(key);
}

std::optional<std::string> HttpObjectStore::get(const std::string& key) {
    auto r = perform_request_with_retry([&]() {
        return cpr::Get(cpr::Url{object_url(key)}, auth_header(access_token_), cpr::Timeout{timeout_ms_});
    }, "Object GET");

    if (r.status_code == 404) return std::nullopt;
    if (!is_success(r)) fail("GET", key, r);
    return r.text;
}

void HttpObjectStore::put(const std::string& key, const std::string& data) {
    auto header = auth_header(access_token_);
    header["Content-Type"] = "application/octet-stream";
    auto r = perform_request_with_retry([&]() {
        return cpr::Put(cpr::Url{object_url(key)}, cpr::Body{data}, header, cpr::Timeout{timeout_ms_});
    }, "Object PUT");

    if (!is_success(r)) fail("PUT", key, r);
}

bool HttpObjectStore::exists(const std::string& key) {
    auto r = perform_request_with_retry([&]() {
        return cpr::Head(cpr::Url{object_url(key)}, auth_header(access_token_), cpr::Timeout{timeout_ms_});
    }, "Object HEAD");

    if (r.status_code == 404) return false;
    if (!is_success(r)) fail("HEAD", key, r);
    return true;
}

void HttpObjectStore::remove(const std::string& key) {
    auto r = perform_request_with_retry([&]() {
        return cpr::Delete(cpr::Url{object_url(key)}, auth_header(access_token_), cpr::Timeout{timeout_ms_});
    }, "Object DELETE");

    if (r.status_code == 404) return;
    if (!is_success(r)) fail("DELETE", key, r);
}

std::vector<std::string> HttpObjectStore::list(const std::string& prefix) {
    static const std::regex key_re("<Key>([^<]*)</Key>");
    static const std::regex token_re("<NextContinuationToken>([^<]*)</NextContinuationToken>");

    std::vector<std::string> keys;
    std::string continuation;
    while (true) {
        cpr::Parameters params{{"list-type", "2"}, {"prefix", prefix}};
        if (!continuation.empty()) params.Add({"continuation-token", continuation});

        auto r = perform_request_with_retry([&]() {
            return cpr::Get(cpr::Url{endpoint_ + "/" + bucket_}, params,
                            auth_header(access_token_), cpr::Timeout{timeout_ms_});
        }, "Object LIST");
        if (!is_success(r)) fail("LIST", prefix, r);

        for (std::sregex_iterator it(r.text.begin(), r.text.end(), key_re), end; it != end; ++it) {
            keys.push_back(decode_xml_text((*it)[1].str()));
        }

        std::smatch m;
        if (r.text.find("<IsTruncated>true</IsTruncated>") == std::string::npos ||
            !std::regex_search(r.text, m, token_re)) {
            break;
        }
        continuation = decode_xml_text(m[1].str());
    }
    return keys;
}

} // namespace workspace_rag
