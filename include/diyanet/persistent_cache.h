#pragma once

#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "diyanet/data_structures.h"

namespace diyanet {

// File-backed store with two sections: raw page bodies keyed by canonical URL,
// and the country directory keyed by case-folded name. Loaded once on
// construction, written back by flush() and on destruction. Not safe to share
// between processes.
class PersistentCache {
public:
    // An empty path keeps everything in memory.
    explicit PersistentCache(std::string path);
    ~PersistentCache();

    PersistentCache(const PersistentCache&) = delete;
    PersistentCache& operator=(const PersistentCache&) = delete;

    std::optional<std::string> get_page(const std::string& url) const;
    void put_page(const std::string& url, const std::string& body);
    void erase_page(const std::string& url);
    size_t page_count() const { return pages_.size(); }

    bool has_countries() const { return countries_.has_value(); }
    // Ascending idx order
    std::vector<Country> countries() const;
    void set_countries(std::map<std::string, Country> countries);

    // Throws CacheError when the file cannot be written.
    void flush();

    const std::string& path() const { return path_; }

private:
    void load();

    std::string path_;
    std::unordered_map<std::string, std::string> pages_;
    std::optional<std::map<std::string, Country>> countries_;
    bool dirty_;
};

} // namespace diyanet
