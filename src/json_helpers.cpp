#include "diyanet/json_helpers.h"
#include "diyanet/logger.h"

#include <stdexcept>

#include <nlohmann/json.hpp>
using json = nlohmann::json;

namespace diyanet {

namespace {

// Ids come back as numbers, but some deployments quote them.
int get_id(const json& item, const char* key) {
    const json& value = item.at(key);
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        size_t used = 0;
        int id = std::stoi(text, &used);
        if (used != text.size()) {
            throw std::invalid_argument(std::string("trailing characters in ") + key + ": '" + text + "'");
        }
        return id;
    }
    return value.get<int>();
}

} // namespace

bool extract_state_list(const std::string& json_str, const Country& country, std::vector<State>& states) {
    try {
        json j = json::parse(json_str);

        if (!j.contains("StateList") || !j["StateList"].is_array()) {
            return false;
        }

        states.clear();
        for (const auto& item : j["StateList"]) {
            states.emplace_back(item.at("SehirAdiEn").get<std::string>(), get_id(item, "SehirID"), country);
        }
        return true;
    } catch (const json::exception& e) {
        Logger::instance().debugf("State list JSON rejected: %s", e.what());
        return false;
    } catch (const std::logic_error& e) {
        Logger::instance().debugf("State id rejected: %s", e.what());
        return false;
    }
}

bool extract_region_list(const std::string& json_str, const State& state, std::vector<Region>& regions) {
    try {
        json j = json::parse(json_str);

        if (!j.contains("StateRegionList") || !j["StateRegionList"].is_array()) {
            return false;
        }

        regions.clear();
        for (const auto& item : j["StateRegionList"]) {
            regions.emplace_back(item.at("IlceAdiEn").get<std::string>(),
                                 get_id(item, "IlceID"),
                                 item.at("IlceUrl").get<std::string>(),
                                 state.country,
                                 state);
        }
        return true;
    } catch (const json::exception& e) {
        Logger::instance().debugf("Region list JSON rejected: %s", e.what());
        return false;
    } catch (const std::logic_error& e) {
        Logger::instance().debugf("Region id rejected: %s", e.what());
        return false;
    }
}

} // namespace diyanet
