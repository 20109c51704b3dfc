#ifndef NESTEGG_RATE_RESOLVER_HPP
#define NESTEGG_RATE_RESOLVER_HPP

#include "decimal.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nestegg {

enum class GrowthType : uint8_t {
    Default = 0,    // follow the plan/scenario default growth rate
    Override = 1,   // one fixed rate for every year
    Stepwise = 2    // time-bounded rates, gaps fall back to the default
};

// One stepwise period. end_year == nullopt means open-ended (through the
// projection's end year).
struct RateInterval {
    int start_year;
    std::optional<int> end_year;
    Decimal rate;

    RateInterval();
    RateInterval(int start, std::optional<int> end, const Decimal& r);

    bool contains(int year) const;
    bool operator==(const RateInterval& other) const;
};

// Growth treatment for one entity. Stepwise configs are validated when they
// are built, so an existing GrowthConfig is always well formed.
class GrowthConfig {
public:
    GrowthConfig();  // DEFAULT

    static GrowthConfig default_rate();
    static GrowthConfig fixed(const Decimal& rate);

    // Throws OverlappingIntervals if intervals overlap, are out of order, or
    // an interval ends before it starts. `entity` is used for error context.
    static GrowthConfig stepwise(std::vector<RateInterval> intervals,
                                 const std::string& entity = "growth config");

    GrowthType type() const { return type_; }
    const Decimal& fixed_rate() const { return rate_; }
    const std::vector<RateInterval>& intervals() const { return intervals_; }

    // Rate for `year`:
    //   DEFAULT  -> default_rate
    //   OVERRIDE -> the fixed rate
    //   STEPWISE -> rate of the interval containing year, else default_rate
    Decimal effective_rate(int year, const Decimal& default_rate) const;

    // The interval covering `year`, or nullptr (stepwise configs only)
    const RateInterval* interval_for(int year) const;

    bool operator==(const GrowthConfig& other) const;
    bool operator!=(const GrowthConfig& other) const { return !(*this == other); }

private:
    GrowthType type_;
    Decimal rate_;
    std::vector<RateInterval> intervals_;
};

// Free-function form used by the transition step
Decimal effective_rate(const GrowthConfig& config, int year, const Decimal& default_rate);

// Chronological, pairwise disjoint, start <= end. Throws OverlappingIntervals.
void validate_intervals(const std::vector<RateInterval>& intervals, const std::string& entity);

std::string growth_type_to_string(GrowthType type);
GrowthType parse_growth_type(const std::string& text);  // throws std::invalid_argument

} // namespace nestegg

#endif // NESTEGG_RATE_RESOLVER_HPP
