#pragma once

#include <string>

#include "fake_http_client.h"

namespace diyanet {
namespace testing {

// A small copy of the site: two countries, two states of Turkey, two regions of Istanbul
inline const std::string BASE = "https://example.test";
inline const std::string HOME_URL = BASE + "/tr-TR/home";
inline const std::string STATES_URL = BASE + "/tr-TR/home/GetRegList?ChangeType=country&CountryId=2";
inline const std::string REGIONS_URL = BASE + "/tr-TR/home/GetRegList?ChangeType=state&CountryId=2&StateId=539";
inline const std::string REGION_PATH = "/tr-TR/9541/kadikoy-icin-namaz-vakti";
inline const std::string REGION_URL = BASE + REGION_PATH;

inline const char* const HOME_PAGE =
    "<html><body>"
    "<select class=\"form-control country-select\" name=\"country\">"
    "<option value=\"\">Ülke Seçiniz</option>"
    "<option value=\"13\">ALMANYA</option>"
    "<option value=\"2\">TURKEY</option>"
    "</select>"
    "<select class=\"state-select\"><option value=\"539\">ISTANBUL</option></select>"
    "</body></html>";

inline const char* const STATES_JSON =
    R"({"StateList":[{"SehirAdiEn":"ANKARA","SehirID":506},{"SehirAdiEn":"ISTANBUL","SehirID":539}]})";

inline const char* const REGIONS_JSON =
    R"({"StateRegionList":[{"IlceAdiEn":"KADIKOY","IlceID":9541,"IlceUrl":"/tr-TR/9541/kadikoy-icin-namaz-vakti"},)"
    R"({"IlceAdiEn":"USKUDAR","IlceID":9542,"IlceUrl":"/tr-TR/9542/uskudar-icin-namaz-vakti"}]})";

inline std::string cell(const std::string& title, const std::string& time) {
    return "<div class=\"tpt-cell\"><div class=\"tpt-title\">" + title +
           "</div><div class=\"tpt-time\">" + time + "</div></div>";
}

inline std::string region_page(const std::string& isha = "19:02") {
    return "<div class=\"today-pray-times\">" +
           cell("İmsak", "05:12") + cell("Güneş", "06:37") + cell("Öğle", "12:58") +
           cell("İkindi", "16:21") + cell("Akşam", "19:09") + cell("Yatsı", isha) +
           "</div>";
}

inline void install_canned_site(FakeHttpClient& http, const std::string& base = BASE) {
    http.set_response(base + "/tr-TR/home", HOME_PAGE);
    http.set_response(base + "/tr-TR/home/GetRegList?ChangeType=country&CountryId=2", STATES_JSON);
    http.set_response(base + "/tr-TR/home/GetRegList?ChangeType=state&CountryId=2&StateId=539", REGIONS_JSON);
    http.set_response(base + REGION_PATH, region_page());
}

} // namespace testing
} // namespace diyanet
