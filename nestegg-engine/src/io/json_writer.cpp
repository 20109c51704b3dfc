#include "json_writer.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace nestegg {
namespace io {

std::string json_quote(const std::string& text) {
    std::ostringstream oss;
    oss << '"';
    for (char c : text) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec;
                } else {
                    oss << c;
                }
        }
    }
    oss << '"';
    return oss.str();
}

namespace {

// Indentation helpers for the hand-written layout
struct Layout {
    bool pretty;
    std::string newline() const { return pretty ? "\n" : ""; }
    std::string space() const { return pretty ? " " : ""; }
    std::string indent(int depth) const { return pretty ? std::string(static_cast<size_t>(depth) * 2, ' ') : ""; }
};

void write_snapshot(std::ostream& os, const YearlySnapshot& y, bool detailed, const Layout& l, int depth) {
    const std::string nl = l.newline();
    const std::string sp = l.space();
    const std::string in = l.indent(depth + 1);

    os << l.indent(depth) << "{" << nl;
    os << in << "\"year\":" << sp << y.year << "," << nl;
    os << in << "\"age\":" << sp << y.reference_age << "," << nl;
    os << in << "\"nest_egg\":" << sp << format_money(y.nest_egg) << "," << nl;
    os << in << "\"net_worth\":" << sp << format_money(y.net_worth);

    if (detailed) {
        const YearActivity& a = y.activity;
        os << "," << nl;
        os << in << "\"total_assets\":" << sp << format_money(y.total_assets) << "," << nl;
        os << in << "\"total_liabilities\":" << sp << format_money(y.total_liabilities) << "," << nl;
        os << in << "\"cash\":" << sp << format_money(y.cash) << "," << nl;
        os << in << "\"inflows\":" << sp << format_money(a.inflows) << "," << nl;
        os << in << "\"outflows\":" << sp << format_money(a.outflows) << "," << nl;
        os << in << "\"retirement_income\":" << sp << format_money(a.retirement_income) << "," << nl;
        os << in << "\"retirement_spending\":" << sp << format_money(a.retirement_spending) << "," << nl;
        os << in << "\"growth\":" << sp << format_money(a.growth) << "," << nl;
        os << in << "\"liability_interest\":" << sp << format_money(a.liability_interest) << "," << nl;
        os << in << "\"categories\":" << sp << "{";
        bool first = true;
        for (const auto& [category, total] : y.category_totals) {
            os << (first ? "" : ",") << nl << l.indent(depth + 2)
               << json_quote(category) << ":" << sp << format_money(total);
            first = false;
        }
        if (!first) os << nl << in;
        os << "}";
    }

    os << nl << l.indent(depth) << "}";
}

void write_series(std::ostream& os, const ScenarioSeries& s, bool detailed, const Layout& l, int depth) {
    const std::string nl = l.newline();
    const std::string sp = l.space();
    const std::string in = l.indent(depth + 1);

    os << l.indent(depth) << "{" << nl;
    os << in << "\"name\":" << sp << json_quote(s.name) << "," << nl;
    os << in << "\"scenario_id\":" << sp << s.scenario_id << "," << nl;
    os << in << "\"is_base\":" << sp << (s.is_base ? "true" : "false") << "," << nl;
    os << in << "\"failed\":" << sp << (s.failed ? "true" : "false") << "," << nl;
    if (s.failed) {
        os << in << "\"error\":" << sp << json_quote(s.error) << "," << nl;
    } else {
        os << in << "\"retirement_year\":" << sp << s.projection.window.retirement_year << "," << nl;
    }
    os << in << "\"overrides\":" << sp << "{\"total\":" << sp << s.overrides.total
       << "," << sp << "\"removals\":" << sp << s.overrides.removals << "}," << nl;

    os << in << "\"years\":" << sp << "[";
    for (size_t i = 0; i < s.projection.years.size(); ++i) {
        os << (i > 0 ? "," : "") << nl;
        write_snapshot(os, s.projection.years[i], detailed, l, depth + 2);
    }
    if (!s.projection.years.empty()) os << nl << in;
    os << "]," << nl;

    os << in << "\"deltas\":" << sp << "[";
    for (size_t i = 0; i < s.deltas.size(); ++i) {
        const YearDelta& d = s.deltas[i];
        os << (i > 0 ? "," : "") << nl << l.indent(depth + 2)
           << "{\"year\":" << sp << d.year
           << "," << sp << "\"nest_egg\":" << sp << format_money(d.nest_egg)
           << "," << sp << "\"net_worth\":" << sp << format_money(d.net_worth) << "}";
    }
    if (!s.deltas.empty()) os << nl << in;
    os << "]" << nl;

    os << l.indent(depth) << "}";
}

} // anonymous namespace

void write_comparison_json(std::ostream& os, const ComparisonResult& result,
                           bool pretty_print) {
    const Layout l{pretty_print};
    const std::string nl = l.newline();
    const std::string sp = l.space();
    const std::string in = l.indent(1);

    os << "{" << nl;
    os << in << "\"plan\":" << sp << json_quote(result.plan_name) << "," << nl;

    // Window
    os << in << "\"window\":" << sp << "{" << nl;
    os << l.indent(2) << "\"start_year\":" << sp << result.window.start_year << "," << nl;
    os << l.indent(2) << "\"retirement_year\":" << sp << result.window.retirement_year << "," << nl;
    os << l.indent(2) << "\"end_year\":" << sp << result.window.end_year << nl;
    os << in << "}," << nl;

    // Execution metrics
    // Formatted apart so the caller's stream keeps its own flags
    std::ostringstream elapsed;
    elapsed << std::fixed << std::setprecision(2) << result.execution_time_ms;
    os << in << "\"execution_time_ms\":" << sp << elapsed.str() << "," << nl;
    os << in << "\"scenarios_failed\":" << sp << result.scenarios_failed << "," << nl;

    // Series
    os << in << "\"series\":" << sp << "[";
    for (size_t i = 0; i < result.series.size(); ++i) {
        os << (i > 0 ? "," : "") << nl;
        write_series(os, result.series[i], result.detailed, l, 2);
    }
    if (!result.series.empty()) os << nl << in;
    os << "]" << nl;

    os << "}" << nl;
}

void write_comparison_json(const std::string& filepath, const ComparisonResult& result,
                           bool pretty_print) {
    std::ofstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open output file: " + filepath);
    }
    write_comparison_json(file, result, pretty_print);
}

} // namespace io
} // namespace nestegg
