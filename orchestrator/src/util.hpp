#pragma once
#include <chrono>
#include <string>
#include <vector>

namespace util {

// Environment variable helpers
std::string get_env_var(const std::string& name, const std::string& default_value = "");

// String utilities
std::vector<std::string> split_string(const std::string& str, char delimiter);
std::string trim(const std::string& str);
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);
bool starts_with(const std::string& str, const std::string& prefix);
bool ends_with(const std::string& str, const std::string& suffix);
std::string join(const std::vector<std::string>& parts, const std::string& separator);

// Time utilities
std::string format_timestamp(const std::chrono::system_clock::time_point& tp);

// Validation utilities
double safe_parse_double(const std::string& str, double default_value = 0.0);
bool parse_number(const std::string& str, double& out);

// Random utilities
std::string generate_uuid();
double random_jitter(double base_value, double jitter_factor = 0.1);

// Network utilities
bool is_network_error(int http_status);

} // namespace util
