#pragma once

#include <string>
#include <utility>

namespace diyanet {

// Name as published by the site; idx is the site's own identifier.
struct GeographicUnit {
    std::string name;
    int idx = 0;
};

struct Country : GeographicUnit {
    Country() = default;
    Country(std::string name_, int idx_) : GeographicUnit{std::move(name_), idx_} {}

    std::string to_string() const;
};

struct State : GeographicUnit {
    Country country;

    State() = default;
    State(std::string name_, int idx_, Country country_)
        : GeographicUnit{std::move(name_), idx_}, country(std::move(country_)) {}

    std::string to_string() const;
};

// url is a site-relative path to the region's own prayer-time page
struct Region : GeographicUnit {
    std::string url;
    Country country;
    State state;

    Region() = default;
    Region(std::string name_, int idx_, std::string url_, Country country_, State state_)
        : GeographicUnit{std::move(name_), idx_}, url(std::move(url_)),
          country(std::move(country_)), state(std::move(state_)) {}

    std::string to_string() const;
};

bool operator==(const Country& a, const Country& b);
bool operator!=(const Country& a, const Country& b);
bool operator==(const State& a, const State& b);
bool operator!=(const State& a, const State& b);
bool operator==(const Region& a, const Region& b);
bool operator!=(const Region& a, const Region& b);

struct TimeOfDay {
    int hour = 0;
    int minute = 0;

    std::string to_string() const; // "HH:MM"
};

bool operator==(const TimeOfDay& a, const TimeOfDay& b);
bool operator!=(const TimeOfDay& a, const TimeOfDay& b);

struct PrayerTimes {
    TimeOfDay fajr;
    TimeOfDay sunrise;
    TimeOfDay dhuhr;
    TimeOfDay asr;
    TimeOfDay maghrib;
    TimeOfDay isha;

    std::string to_string() const;
};

} // namespace diyanet
