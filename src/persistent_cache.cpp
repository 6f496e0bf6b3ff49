#include "diyanet/persistent_cache.h"
#include "diyanet/compression.h"
#include "diyanet/constants.h"
#include "diyanet/errors.h"
#include "diyanet/logger.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace diyanet {

PersistentCache::PersistentCache(std::string path) : path_(std::move(path)), dirty_(false) {
    load();
}

PersistentCache::~PersistentCache() {
    try {
        flush();
    } catch (const std::exception& e) {
        Logger::instance().errorf("Could not write cache %s: %s", path_.c_str(), e.what());
    }
}

void PersistentCache::load() {
    if (path_.empty() || !fs::exists(path_)) {
        return;
    }

    auto& logger = Logger::instance();
    std::ifstream in(path_, std::ios::binary);
    if (!in) {
        logger.warningf("Cannot open cache %s, starting empty", path_.c_str());
        return;
    }
    std::vector<uint8_t> frame((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    try {
        json j = json::parse(decompress_data(frame));

        if (!j.contains("version") || j["version"].get<int>() != CACHE_FORMAT_VERSION) {
            logger.warningf("Cache %s has an unknown format, starting empty", path_.c_str());
            return;
        }

        std::unordered_map<std::string, std::string> pages;
        for (const auto& item : j.at("page").items()) {
            pages[item.key()] = item.value().get<std::string>();
        }

        std::optional<std::map<std::string, Country>> countries;
        if (j.contains("countries")) {
            countries.emplace();
            for (const auto& item : j["countries"].items()) {
                const auto& c = item.value();
                (*countries)[item.key()] = Country(c.at("name").get<std::string>(), c.at("idx").get<int>());
            }
        }

        pages_ = std::move(pages);
        countries_ = std::move(countries);
        logger.debugf("Loaded %zu cached pages from %s", pages_.size(), path_.c_str());
    } catch (const CacheError& e) {
        logger.warningf("Cache %s is corrupt (%s), starting empty", path_.c_str(), e.what());
    } catch (const json::exception& e) {
        logger.warningf("Cache %s is corrupt (%s), starting empty", path_.c_str(), e.what());
    }
}

std::optional<std::string> PersistentCache::get_page(const std::string& url) const {
    auto it = pages_.find(url);
    if (it == pages_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void PersistentCache::put_page(const std::string& url, const std::string& body) {
    pages_[url] = body;
    dirty_ = true;
}

void PersistentCache::erase_page(const std::string& url) {
    if (pages_.erase(url) > 0) {
        dirty_ = true;
    }
}

std::vector<Country> PersistentCache::countries() const {
    std::vector<Country> result;
    if (!countries_) {
        return result;
    }
    for (const auto& entry : *countries_) {
        result.push_back(entry.second);
    }
    std::stable_sort(result.begin(), result.end(),
                     [](const Country& a, const Country& b) { return a.idx < b.idx; });
    return result;
}

void PersistentCache::set_countries(std::map<std::string, Country> countries) {
    countries_ = std::move(countries);
    dirty_ = true;
}

void PersistentCache::flush() {
    if (!dirty_ || path_.empty()) {
        return;
    }

    json j;
    j["version"] = CACHE_FORMAT_VERSION;
    j["page"] = json::object();
    for (const auto& page : pages_) {
        j["page"][page.first] = page.second;
    }
    if (countries_) {
        j["countries"] = json::object();
        for (const auto& entry : *countries_) {
            j["countries"][entry.first] = {{"name", entry.second.name}, {"idx", entry.second.idx}};
        }
    }

    std::vector<uint8_t> frame = compress_data(j.dump());

    // write beside the target, then swap it in
    const std::string tmp_path = path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw CacheError("Cannot open " + tmp_path + " for writing");
        }
        out.write(reinterpret_cast<const char*>(frame.data()), static_cast<std::streamsize>(frame.size()));
        if (!out) {
            throw CacheError("Failed writing " + tmp_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp_path, path_, ec);
    if (ec) {
        throw CacheError("Cannot replace " + path_ + ": " + ec.message());
    }

    dirty_ = false;
    Logger::instance().debugf("Wrote %zu cached pages to %s", pages_.size(), path_.c_str());
}

} // namespace diyanet
