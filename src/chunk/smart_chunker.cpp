#include "chunk/text_chunkers.hpp"
#include <algorithm>
#include <cctype>
#include <limits>
#include <regex>

namespace workspace_rag {

namespace {

std::string rtrim(const std::string& s) {
    auto end = s.find_last_not_of(" \t\r\n");
    return end == std::string::npos ? "" : s.substr(0, end + 1);
}

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    return rtrim(s.substr(begin));
}

std::vector<std::string> split_keep_empty(const std::string& text, const std::string& separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.push_back(text);
        return parts;
    }
    size_t start = 0;
    while (true) {
        size_t pos = text.find(separator, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

// Collapse 3+ newlines, right-trim lines, drop leading and trailing blank lines.
std::vector<std::string> normalized_lines(const std::string& text) {
    static const std::regex excess_newlines("\n{3,}");
    std::string collapsed = std::regex_replace(text, excess_newlines, "\n\n");

    std::vector<std::string> lines;
    for (auto& line : split_keep_empty(collapsed, "\n")) lines.push_back(rtrim(line));

    auto first = std::find_if(lines.begin(), lines.end(), [](const std::string& l) { return !trim(l).empty(); });
    lines.erase(lines.begin(), first);
    while (!lines.empty() && trim(lines.back()).empty()) lines.pop_back();
    return lines;
}

size_t total_size(const std::vector<std::string>& lines) {
    size_t total = 0;
    for (const auto& l : lines) total += l.size();
    return total;
}

} // namespace

bool SmartChunker::is_good_split_point(const std::string& line) {
    static const std::regex header("^#{1,6}\\s");
    static const std::regex list_item("^\\s*[-*+]\\s");

    std::string stripped = trim(line);
    if (stripped.empty()) return true;

    char last = stripped.back();
    if (last == '.' || last == '!' || last == '?') return true;
    if (std::regex_search(stripped, header)) return true;
    if (std::regex_search(stripped, list_item) && last != ',') return true;
    return false;
}

std::string SmartChunker::clean_content(const std::string& content) {
    if (content.empty()) return content;
    auto lines = normalized_lines(content);
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

std::string SmartChunker::clean_chunk(const std::string& chunk) {
    if (chunk.empty()) return chunk;

    std::string out;
    bool prev_empty = false;
    bool first = true;
    for (const auto& line : normalized_lines(chunk)) {
        bool empty = trim(line).empty();
        if (empty && prev_empty) continue;
        if (!first) out += '\n';
        out += empty ? std::string() : line;
        first = false;
        prev_empty = empty;
    }
    return out;
}

std::string SmartChunker::join_lines(const std::vector<std::string>& lines) const {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += config_.chunk_separator;
        out += lines[i];
    }
    return out;
}

size_t SmartChunker::find_best_split_point(const std::vector<std::string>& lines, size_t target_size) const {
    size_t current = 0;
    size_t best_split = 0;
    size_t min_diff = std::numeric_limits<size_t>::max();

    for (size_t i = 0; i < lines.size(); ++i) {
        size_t line_size = lines[i].size();
        if (current + line_size > target_size) {
            size_t diff = target_size - current;
            if (diff < min_diff) {
                min_diff = diff;
                best_split = i;
            }
            break;
        }
        current += line_size;
        if (is_good_split_point(lines[i])) {
            size_t diff = target_size - current;
            if (diff < min_diff) {
                min_diff = diff;
                best_split = i + 1;
            }
        }
    }
    return std::max<size_t>(1, best_split);
}

std::vector<std::string> SmartChunker::overlap_lines(const std::vector<std::string>& lines) const {
    const size_t overlap = static_cast<size_t>(config_.chunk_overlap);
    std::vector<std::string> out;
    if (lines.empty() || overlap == 0) return out;

    size_t current = 0;
    for (auto it = lines.rbegin(); it != lines.rend(); ++it) {
        if (current + it->size() > overlap) break;
        out.insert(out.begin(), *it);
        current += it->size();
    }
    // Always make progress: never carry the whole emitted chunk forward.
    if (out.size() == lines.size()) out.erase(out.begin());
    return out;
}

std::vector<std::string> SmartChunker::split_text(const std::string& text) const {
    std::string content = clean_content(text);
    if (content.empty()) return {};

    const size_t chunk_size = static_cast<size_t>(config_.chunk_size);
    std::vector<std::string> pieces;
    std::vector<std::string> current;
    size_t current_size = 0;

    for (auto& line : split_keep_empty(content, config_.chunk_separator)) {
        if (current_size + line.size() > chunk_size && !current.empty()) {
            size_t split = total_size(current) <= chunk_size
                ? current.size()
                : find_best_split_point(current, chunk_size);

            std::vector<std::string> emitted(current.begin(), current.begin() + static_cast<std::ptrdiff_t>(split));
            std::vector<std::string> remainder(current.begin() + static_cast<std::ptrdiff_t>(split), current.end());
            pieces.push_back(join_lines(emitted));

            current = overlap_lines(emitted);
            current.insert(current.end(), remainder.begin(), remainder.end());
            current.push_back(std::move(line));
            current_size = total_size(current);
        } else {
            current_size += line.size();
            current.push_back(std::move(line));
        }
    }
    if (!current.empty()) pieces.push_back(join_lines(current));

    std::vector<std::string> cleaned;
    for (const auto& piece : pieces) {
        auto c = clean_chunk(piece);
        if (!c.empty()) cleaned.push_back(std::move(c));
    }
    return cleaned;
}

std::vector<Chunk> SmartChunker::chunk(const Artifact& artifact) const {
    if (artifact.content().empty()) return {};
    return create_chunks(split_text(artifact.content()), artifact);
}

} // namespace workspace_rag
