#include "diyanet/extractors.h"
#include "diyanet/string_utils.h"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>

namespace diyanet {

namespace {

bool parse_int(const std::string& text, int& out) {
    std::string s = trim(text);
    if (s.empty()) return false;
    errno = 0;
    char* end = nullptr;
    long value = std::strtol(s.c_str(), &end, 10);
    if (errno != 0 || *end != '\0' || value < INT_MIN || value > INT_MAX) {
        return false;
    }
    out = static_cast<int>(value);
    return true;
}

} // namespace

// -------------------------------------------------------------------------------------
// OptionListExtractor
// -------------------------------------------------------------------------------------

OptionListExtractor::OptionListExtractor(std::string identifier)
    : identifier_(std::move(identifier)), recording_(false) {}

void OptionListExtractor::on_start_tag(const std::string& tag, const Attributes& attrs) {
    last_tag_ = tag;
    if (tag == "select") {
        const std::string* cls = find_attribute(attrs, "class");
        if (cls && cls->find(identifier_) != std::string::npos) {
            recording_ = true;
        }
    } else if (recording_ && tag == "option") {
        const std::string* value = find_attribute(attrs, "value");
        int idx = 0;
        if (value && parse_int(*value, idx)) {
            options_.push_back({std::nullopt, idx});
        }
    }
}

void OptionListExtractor::on_text(const std::string& text) {
    if (recording_ && last_tag_ == "option" && !options_.empty() && !options_.back().label) {
        options_.back().label = casefold(trim(text));
    }
}

void OptionListExtractor::on_end_tag(const std::string& tag) {
    if (tag == "select" && recording_) {
        recording_ = false;
        std::stable_sort(options_.begin(), options_.end(),
                         [](const PendingOption& a, const PendingOption& b) { return a.idx < b.idx; });
    }
}

std::vector<OptionEntry> OptionListExtractor::options() const {
    std::vector<OptionEntry> result;
    result.reserve(options_.size());
    for (const auto& option : options_) {
        result.push_back({option.label.value_or(""), option.idx});
    }
    return result;
}

std::vector<OptionEntry> extract_options(const std::string& html, const std::string& identifier) {
    OptionListExtractor extractor(identifier);
    tokenize_html(html, extractor);
    return extractor.options();
}

// -------------------------------------------------------------------------------------
// PrayerTimeExtractor
// -------------------------------------------------------------------------------------

PrayerTimeExtractor::PrayerTimeExtractor() : state_(RecordState::NONE) {}

void PrayerTimeExtractor::on_start_tag(const std::string& tag, const Attributes& attrs) {
    if (tag != "div") return;
    const std::string* cls = find_attribute(attrs, "class");
    if (!cls) return;
    if (*cls == "tpt-title") {
        state_ = RecordState::NAME;
    } else if (*cls == "tpt-time") {
        state_ = RecordState::VALUE;
    }
}

void PrayerTimeExtractor::on_text(const std::string& text) {
    if (state_ == RecordState::NONE || is_blank(text)) return;

    if (state_ == RecordState::NAME) {
        if (!times_.empty() && !times_.back().value) {
            // a second name before any value: the pending label is unreliable
            times_.pop_back();
        } else {
            times_.push_back({trim(text), std::nullopt});
        }
        return;
    }

    if (times_.empty()) return;
    if (!times_.back().value) {
        times_.back().value = text;
    } else {
        // never overwrite a completed pair
        times_.pop_back();
    }
}

void PrayerTimeExtractor::on_end_tag(const std::string& /*tag*/) {
    state_ = RecordState::NONE;
}

std::vector<TimeEntry> PrayerTimeExtractor::times() const {
    std::vector<TimeEntry> result;
    for (const auto& entry : times_) {
        if (entry.value) {
            result.push_back({entry.label, *entry.value});
        }
    }
    return result;
}

std::vector<TimeEntry> extract_prayer_times(const std::string& html) {
    PrayerTimeExtractor extractor;
    tokenize_html(html, extractor);
    return extractor.times();
}

} // namespace diyanet
