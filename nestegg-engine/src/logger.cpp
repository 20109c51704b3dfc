/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace nestegg {

std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

LogLevel string_to_level(const std::string& level_str) {
    std::string upper = level_str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    throw std::invalid_argument("Unknown log level: '" + level_str + "'");
}

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log_plan_loaded(const Plan& plan, size_t scenario_count, const std::string& source) {
    const EntityCollections& entities = plan.base_facts.entities;

    std::map<std::string, std::string> fields;
    fields["event"] = "plan_loaded";
    fields["plan_id"] = std::to_string(plan.plan_id);
    fields["plan_name"] = plan.name;
    fields["source"] = source;
    fields["plan_creation_year"] = std::to_string(plan.plan_creation_year);
    fields["reference_person"] = person_to_string(plan.reference_person);
    fields["assets"] = std::to_string(entities.assets.size());
    fields["liabilities"] = std::to_string(entities.liabilities.size());
    fields["flows"] = std::to_string(entities.flows.size());
    fields["income_streams"] = std::to_string(entities.income_streams.size());
    fields["scenarios"] = std::to_string(scenario_count);

    log(LogLevel::INFO, "Plan loaded", fields);
}

void Logger::log_window_resolved(const std::string& label, const ProjectionWindow& window) {
    std::map<std::string, std::string> fields;
    fields["event"] = "window_resolved";
    fields["run"] = label;
    fields["start_year"] = std::to_string(window.start_year);
    fields["retirement_year"] = std::to_string(window.retirement_year);
    fields["end_year"] = std::to_string(window.end_year);
    fields["years"] = std::to_string(window.num_years());

    log(LogLevel::DEBUG, "Projection window resolved", fields);
}

void Logger::log_scenario_resolved(const Scenario& scenario, const OverrideSummary& summary,
                                   size_t effective_entities) {
    std::map<std::string, std::string> fields;
    fields["event"] = "scenario_resolved";
    fields["scenario_id"] = std::to_string(scenario.scenario_id);
    fields["scenario"] = scenario.name;
    fields["overrides"] = std::to_string(summary.total);
    fields["removals"] = std::to_string(summary.removals);
    for (const auto& [target, count] : summary.by_target) {
        fields["overrides." + override_target_to_string(target)] = std::to_string(count);
    }
    fields["effective_entities"] = std::to_string(effective_entities);
    fields["annual_retirement_spending"] = format_money(scenario.annual_retirement_spending);

    log(LogLevel::DEBUG, "Scenario resolved", fields);
}

void Logger::log_projection_complete(const ProjectionResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "projection_complete";
    fields["run"] = result.label;
    fields["years"] = std::to_string(result.years.size());
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);
    if (!result.years.empty()) {
        fields["final_year"] = std::to_string(result.final_year().year);
        fields["final_nest_egg"] = format_money(result.final_year().nest_egg);
        fields["final_net_worth"] = format_money(result.final_year().net_worth);
    }

    log(LogLevel::INFO, "Projection complete", fields);
}

void Logger::log_comparison_complete(const ComparisonResult& result) {
    std::map<std::string, std::string> fields;
    fields["event"] = "comparison_complete";
    fields["plan_name"] = result.plan_name;
    fields["series"] = std::to_string(result.series.size());
    fields["scenarios_failed"] = std::to_string(result.scenarios_failed);
    fields["start_year"] = std::to_string(result.window.start_year);
    fields["end_year"] = std::to_string(result.window.end_year);
    fields["execution_time_ms"] = std::to_string(result.execution_time_ms);

    log(result.scenarios_failed > 0 ? LogLevel::WARN : LogLevel::INFO, "Comparison complete", fields);
}

void Logger::log_warning(const std::string& warning_message,
                         const std::map<std::string, std::string>& context) {
    std::map<std::string, std::string> fields = context;
    fields["event"] = "warning";
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, fields);
}

void Logger::log_error(const std::string& error_message,
                       const std::map<std::string, std::string>& context) {
    std::map<std::string, std::string> fields = context;
    fields["event"] = "error";
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Engine error", fields);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    const std::map<std::string, std::string>& fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        std::map<std::string, std::string> json_fields = fields;
        json_fields["timestamp"] = get_timestamp();
        json_fields["level"] = level_to_string(level);
        json_fields["message"] = message;
        output = format_json(json_fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace nestegg
