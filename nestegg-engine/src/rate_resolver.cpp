#include "rate_resolver.hpp"
#include "errors.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace nestegg {

// ============================================================================
// RateInterval Implementation
// ============================================================================

RateInterval::RateInterval() : start_year(0), end_year(std::nullopt), rate(0) {}

RateInterval::RateInterval(int start, std::optional<int> end, const Decimal& r)
    : start_year(start), end_year(end), rate(r) {}

bool RateInterval::contains(int year) const {
    return start_year <= year && (!end_year || year <= *end_year);
}

bool RateInterval::operator==(const RateInterval& other) const {
    return start_year == other.start_year &&
           end_year == other.end_year &&
           rate == other.rate;
}

// ============================================================================
// GrowthConfig Implementation
// ============================================================================

GrowthConfig::GrowthConfig() : type_(GrowthType::Default), rate_(0) {}

GrowthConfig GrowthConfig::default_rate() {
    return GrowthConfig();
}

GrowthConfig GrowthConfig::fixed(const Decimal& rate) {
    GrowthConfig config;
    config.type_ = GrowthType::Override;
    config.rate_ = rate;
    return config;
}

GrowthConfig GrowthConfig::stepwise(std::vector<RateInterval> intervals, const std::string& entity) {
    validate_intervals(intervals, entity);

    GrowthConfig config;
    config.type_ = GrowthType::Stepwise;
    config.intervals_ = std::move(intervals);
    return config;
}

Decimal GrowthConfig::effective_rate(int year, const Decimal& default_rate) const {
    switch (type_) {
        case GrowthType::Override:
            return rate_;
        case GrowthType::Stepwise: {
            const RateInterval* interval = interval_for(year);
            return interval ? interval->rate : default_rate;
        }
        case GrowthType::Default:
        default:
            return default_rate;
    }
}

const RateInterval* GrowthConfig::interval_for(int year) const {
    // Intervals are sorted and disjoint, so the first interval that has not
    // ended before `year` is the only candidate
    auto it = std::find_if(intervals_.begin(), intervals_.end(), [year](const RateInterval& i) {
        return !i.end_year || *i.end_year >= year;
    });
    if (it == intervals_.end() || !it->contains(year)) {
        return nullptr;
    }
    return &(*it);
}

bool GrowthConfig::operator==(const GrowthConfig& other) const {
    return type_ == other.type_ &&
           rate_ == other.rate_ &&
           intervals_ == other.intervals_;
}

// ============================================================================
// Free functions
// ============================================================================

Decimal effective_rate(const GrowthConfig& config, int year, const Decimal& default_rate) {
    return config.effective_rate(year, default_rate);
}

void validate_intervals(const std::vector<RateInterval>& intervals, const std::string& entity) {
    for (size_t i = 0; i < intervals.size(); ++i) {
        const RateInterval& current = intervals[i];

        if (current.end_year && *current.end_year < current.start_year) {
            throw OverlappingIntervals(entity,
                "interval " + std::to_string(current.start_year) + "-" +
                std::to_string(*current.end_year) + " ends before it starts");
        }

        if (i == 0) {
            continue;
        }

        const RateInterval& previous = intervals[i - 1];
        if (!previous.end_year) {
            throw OverlappingIntervals(entity,
                "open-ended interval starting " + std::to_string(previous.start_year) +
                " is followed by interval starting " + std::to_string(current.start_year));
        }
        if (current.start_year <= *previous.end_year) {
            throw OverlappingIntervals(entity,
                "interval " + std::to_string(previous.start_year) + "-" +
                std::to_string(*previous.end_year) + " overlaps or follows interval starting " +
                std::to_string(current.start_year));
        }
    }
}

std::string growth_type_to_string(GrowthType type) {
    switch (type) {
        case GrowthType::Default: return "DEFAULT";
        case GrowthType::Override: return "OVERRIDE";
        case GrowthType::Stepwise: return "STEPWISE";
        default: return "UNKNOWN";
    }
}

GrowthType parse_growth_type(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEFAULT") return GrowthType::Default;
    if (upper == "OVERRIDE") return GrowthType::Override;
    if (upper == "STEPWISE") return GrowthType::Stepwise;
    throw std::invalid_argument("Unknown growth type: '" + text + "'");
}

} // namespace nestegg
