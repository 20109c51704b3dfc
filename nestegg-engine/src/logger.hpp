/**
 * @file logger.hpp
 * @brief Structured logging for the projection engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing, or plain text
 * - Context tracking (plan, scenario, window)
 * - Run metrics (years projected, execution time)
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef NESTEGG_LOGGER_HPP
#define NESTEGG_LOGGER_HPP

#include "comparison.hpp"
#include "plan.hpp"
#include "projection.hpp"
#include "scenario.hpp"
#include "time_resolver.hpp"
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace nestegg {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Per-scenario detail (override summaries, resolved windows)
    INFO,    ///< Run milestones (plan loaded, projection and comparison complete)
    WARN,    ///< Non-fatal issues (a scenario failed with continue-on-error)
    ERROR    ///< Failures
};

/**
 * @brief Convert log level to string
 */
std::string level_to_string(LogLevel level);

/**
 * @brief Parse log level from string (case-insensitive)
 *
 * @throws std::invalid_argument for an unknown level
 */
LogLevel string_to_level(const std::string& level_str);

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs (appended)
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("nestegg.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Safe to call from the parallel scenario loop: emission is serialized.
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   config.enable_file = true;
 *   config.log_file_path = "nestegg.log";
 *
 *   Logger& logger = Logger::get_instance();
 *   logger.configure(config);
 *   logger.log_plan_loaded(plan, scenarios.size());
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     *
     * Reopens the log file when file output is enabled.
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a plan document read from disk
     */
    void log_plan_loaded(const Plan& plan, size_t scenario_count, const std::string& source);

    /**
     * @brief Log the projection window of one run
     */
    void log_window_resolved(const std::string& label, const ProjectionWindow& window);

    /**
     * @brief Log a scenario's override layer after resolution
     */
    void log_scenario_resolved(const Scenario& scenario, const OverrideSummary& summary,
                               size_t effective_entities);

    void log_projection_complete(const ProjectionResult& result);

    void log_comparison_complete(const ComparisonResult& result);

    void log_warning(const std::string& warning_message,
                     const std::map<std::string, std::string>& context = {});

    void log_error(const std::string& error_message,
                   const std::map<std::string, std::string>& context = {});

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);
    LogLevel get_min_level() const;

    const LoggerConfig& config() const { return config_; }

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;
    mutable std::mutex mutex_;

    // Helper methods
    void log(LogLevel level, const std::string& message, const std::map<std::string, std::string>& fields);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace nestegg

#endif // NESTEGG_LOGGER_HPP
