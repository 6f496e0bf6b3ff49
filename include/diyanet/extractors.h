#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "diyanet/html_tokenizer.h"

namespace diyanet {

struct OptionEntry {
    std::string label; // case-folded
    int idx;
};

// Collects the options of every <select> whose class attribute contains the
// identifier. Options are kept sorted by idx once their select closes.
class OptionListExtractor : public MarkupHandler {
public:
    explicit OptionListExtractor(std::string identifier);

    void on_start_tag(const std::string& tag, const Attributes& attrs) override;
    void on_text(const std::string& text) override;
    void on_end_tag(const std::string& tag) override;

    std::vector<OptionEntry> options() const;

private:
    struct PendingOption {
        std::optional<std::string> label;
        int idx;
    };

    std::string identifier_;
    bool recording_;
    std::string last_tag_;
    std::vector<PendingOption> options_;
};

std::vector<OptionEntry> extract_options(const std::string& html, const std::string& identifier);

struct TimeEntry {
    std::string label;
    std::string value;
};

// Pairs up <div class="tpt-title"> and <div class="tpt-time"> texts.
class PrayerTimeExtractor : public MarkupHandler {
public:
    PrayerTimeExtractor();

    void on_start_tag(const std::string& tag, const Attributes& attrs) override;
    void on_text(const std::string& text) override;
    void on_end_tag(const std::string& tag) override;

    // Completed (label, value) pairs in document order
    std::vector<TimeEntry> times() const;

private:
    enum class RecordState {
        NONE,
        NAME,
        VALUE
    };

    struct PendingTime {
        std::string label;
        std::optional<std::string> value;
    };

    RecordState state_;
    std::vector<PendingTime> times_;
};

std::vector<TimeEntry> extract_prayer_times(const std::string& html);

} // namespace diyanet
