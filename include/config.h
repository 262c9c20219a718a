#ifndef ARGUS_CONFIG_H
#define ARGUS_CONFIG_H

#include <cstddef>
#include <string>
#include <map>
#include "progress.h"

namespace argus {

/**
 * Global configuration
 */
struct Config {
    // Database settings. Empty paths are derived from data_dir.
    std::string data_dir;       // Base directory for databases
    std::string city_db;        // GeoLite2 City database
    std::string asn_db;         // GeoLite2 ASN database
    std::string proxy_db;       // IP2Proxy LITE CSV (optional)
    std::string org_dir;        // Attribution dataset directory

    // Lookup settings
    bool reverse_dns;           // Resolve domains by reverse DNS
    size_t rdns_timeout_ms;     // Per-address reverse DNS timeout
    std::string sort_by;        // Default sort key

    // Output settings
    std::string output_format;  // Export format for -o: json or csv
    bool show_progress;         // Draw the progress bar

    // Config file path
    std::string config_file_path;

    // Default constructor with sensible defaults
    Config();

    std::string city_db_path() const;
    std::string asn_db_path() const;
    std::string proxy_db_path() const;
    std::string org_dir_path() const;
};

/**
 * Load configuration from default locations
 * Priority: CLI flags > Environment vars > Config file > Defaults
 * @param reporter Receives warnings about unusable settings
 * @return Config object with merged settings
 */
Config load_config(Reporter& reporter);

/**
 * Load configuration from specific file
 * @param config_path Path to configuration file
 * @param reporter Receives warnings about unusable settings
 * @return Config object; defaults where the file is silent or unreadable
 */
Config load_config_from_file(const std::string& config_path, Reporter& reporter);

/**
 * Apply ARGUS_DATA_DIR and ARGUS_ORG_DIR
 */
void apply_environment(Config& config);

/**
 * Create default config directory if it doesn't exist
 * @return Path to config directory (~/.argus/)
 */
std::string create_config_directory(Reporter& reporter);

/**
 * Create example config file if it doesn't exist
 * @param config_path Path where to create the example config
 * @return True if created successfully or already exists
 */
bool create_example_config(const std::string& config_path);

/**
 * Get path to config file (~/.argus/settings.conf)
 * @return Config file path
 */
std::string get_config_file_path();

/**
 * Get path to config directory (~/.argus/)
 * @return Config directory path
 */
std::string get_config_directory();

/**
 * Parse INI format configuration file
 * @param filepath Path to INI file
 * @param reporter Receives a warning per malformed line
 * @return Map of sections to key-value pairs
 * @throws std::runtime_error if the file cannot be opened
 */
std::map<std::string, std::map<std::string, std::string>> parse_ini_file(
    const std::string& filepath,
    Reporter& reporter
);

/**
 * Parse boolean value from string
 * @param value String value ("true", "false", "1", "0", "yes", "no")
 * @return Boolean value
 */
bool parse_bool(const std::string& value);

/**
 * Trim whitespace from string
 * @param str String to trim
 * @return Trimmed string
 */
std::string trim(const std::string& str);

/**
 * Expand home directory (~) in path
 * @param path Path potentially containing ~
 * @return Expanded path
 */
std::string expand_home_dir(const std::string& path);

} // namespace argus

#endif // ARGUS_CONFIG_H
