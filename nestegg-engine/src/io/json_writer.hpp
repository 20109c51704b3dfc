#ifndef NESTEGG_IO_JSON_WRITER_HPP
#define NESTEGG_IO_JSON_WRITER_HPP

#include <ostream>
#include <string>
#include "../comparison.hpp"

namespace nestegg {
namespace io {

// Write ComparisonResult to JSON format
// One series per run (base first) with its yearly rows and, for scenarios,
// per-year deltas against the base. Money is written with two decimals.
void write_comparison_json(std::ostream& os, const ComparisonResult& result,
                           bool pretty_print = true);

// Write ComparisonResult to JSON file
void write_comparison_json(const std::string& filepath, const ComparisonResult& result,
                           bool pretty_print = true);

// JSON string literal, quotes included
std::string json_quote(const std::string& text);

} // namespace io
} // namespace nestegg

#endif // NESTEGG_IO_JSON_WRITER_HPP
