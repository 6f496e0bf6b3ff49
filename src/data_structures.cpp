#include "diyanet/data_structures.h"

#include <cstdio>

namespace diyanet {

std::string Country::to_string() const {
    return "{ name: " + name + ", idx: " + std::to_string(idx) + " }";
}

std::string State::to_string() const {
    std::string result;
    result += "{ name: " + name + ", ";
    result += "  idx: " + std::to_string(idx) + ", ";
    result += "  country: " + country.name + " }";
    return result;
}

std::string Region::to_string() const {
    std::string result;
    result += "{ name: " + name + ", ";
    result += "  idx: " + std::to_string(idx) + ", ";
    result += "  url: " + url + ", ";
    result += "  country: " + country.name + ", ";
    result += "  state: " + state.name + " }";
    return result;
}

bool operator==(const Country& a, const Country& b) {
    return a.idx == b.idx && a.name == b.name;
}

bool operator!=(const Country& a, const Country& b) {
    return !(a == b);
}

bool operator==(const State& a, const State& b) {
    return a.idx == b.idx && a.name == b.name && a.country == b.country;
}

bool operator!=(const State& a, const State& b) {
    return !(a == b);
}

bool operator==(const Region& a, const Region& b) {
    return a.idx == b.idx && a.name == b.name && a.url == b.url &&
           a.country == b.country && a.state == b.state;
}

bool operator!=(const Region& a, const Region& b) {
    return !(a == b);
}

std::string TimeOfDay::to_string() const {
    char buf[8];
    snprintf(buf, sizeof(buf), "%02d:%02d", hour, minute);
    return std::string{buf};
}

bool operator==(const TimeOfDay& a, const TimeOfDay& b) {
    return a.hour == b.hour && a.minute == b.minute;
}

bool operator!=(const TimeOfDay& a, const TimeOfDay& b) {
    return !(a == b);
}

std::string PrayerTimes::to_string() const {
    std::string result;
    result += "{ fajr: " + fajr.to_string() + ", ";
    result += "  sunrise: " + sunrise.to_string() + ", ";
    result += "  dhuhr: " + dhuhr.to_string() + ", ";
    result += "  asr: " + asr.to_string() + ", ";
    result += "  maghrib: " + maghrib.to_string() + ", ";
    result += "  isha: " + isha.to_string() + " }";
    return result;
}

} // namespace diyanet
