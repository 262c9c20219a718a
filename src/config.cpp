#include "config.h"
#include <fstream>
#include <algorithm>
#include <stdexcept>
#include <cstdlib>
#include <sys/stat.h>
#include <unistd.h>
#include <pwd.h>

namespace argus {

namespace {

std::string home_directory() {
    const char* home = getenv("HOME");
    if (!home) {
        struct passwd* pw = getpwuid(getuid());
        home = pw ? pw->pw_dir : "/tmp";
    }
    return home;
}

std::string strip_inline_comment(const std::string& value) {
    size_t hash = value.find(" #");
    if (hash == std::string::npos) {
        return value;
    }
    return trim(value.substr(0, hash));
}

} // namespace

// Default constructor with sensible defaults
Config::Config() {
    data_dir = get_config_directory();

    reverse_dns = false;   // Opt-in, it is the only network call
    rdns_timeout_ms = 1000;
    sort_by = "asn_org";

    output_format = "json";
    show_progress = true;

    config_file_path = get_config_file_path();
}

std::string Config::city_db_path() const {
    return city_db.empty() ? data_dir + "/GeoLite2-City.mmdb" : city_db;
}

std::string Config::asn_db_path() const {
    return asn_db.empty() ? data_dir + "/GeoLite2-ASN.mmdb" : asn_db;
}

std::string Config::proxy_db_path() const {
    return proxy_db.empty() ? data_dir + "/IP2PROXY-LITE.CSV" : proxy_db;
}

std::string Config::org_dir_path() const {
    return org_dir.empty() ? data_dir + "/org" : org_dir;
}

std::string get_config_directory() {
    return home_directory() + "/.argus";
}

std::string get_config_file_path() {
    return get_config_directory() + "/settings.conf";
}

std::string create_config_directory(Reporter& reporter) {
    std::string config_dir = get_config_directory();

    // Check if directory exists
    struct stat st;
    if (stat(config_dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode)) {
        return config_dir;  // Already exists
    }

    // Create directory with 0700 permissions (owner only)
    if (mkdir(config_dir.c_str(), 0700) != 0) {
        reporter.warning("Failed to create config directory: " + config_dir);
    }

    return config_dir;
}

bool create_example_config(const std::string& config_path) {
    // Check if config already exists
    struct stat st;
    if (stat(config_path.c_str(), &st) == 0) {
        return true;  // Already exists
    }

    std::ofstream file(config_path);
    if (!file.is_open()) {
        return false;
    }

    file << "# Argus Configuration\n";
    file << "# This file was automatically created. Uncomment a setting to change it.\n\n";
    file << "[databases]\n";
    file << "# Database locations; unset paths are looked up inside data_dir\n";
    file << "# data_dir = ~/.argus\n";
    file << "# city_db = ~/.argus/GeoLite2-City.mmdb\n";
    file << "# asn_db = ~/.argus/GeoLite2-ASN.mmdb\n";
    file << "# proxy_db = ~/.argus/IP2PROXY-LITE.CSV      # Optional\n";
    file << "# org_dir = ~/.argus/org                     # Attribution datasets\n\n";
    file << "[lookup]\n";
    file << "# reverse_dns = false          # Resolve domains by reverse DNS (--rdns)\n";
    file << "# rdns_timeout_ms = 1000       # Give up on a reverse lookup after this long\n";
    file << "# sort_by = asn_org            # Default for --sort-by\n\n";
    file << "[output]\n";
    file << "# format = json                # Default for --format (json or csv)\n";
    file << "# show_progress = true         # Progress bar for multi-address lookups\n";

    file.close();
    if (!file) {
        return false;
    }

    // Set permissions to 0600 (owner read/write only)
    return chmod(config_path.c_str(), 0600) == 0;
}

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

bool parse_bool(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    return (lower == "true" || lower == "1" || lower == "yes" || lower == "on");
}

std::string expand_home_dir(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }

    if (path.length() == 1 || path[1] == '/') {
        return home_directory() + path.substr(1);
    }

    return path;  // ~username not supported, return as-is
}

std::map<std::string, std::map<std::string, std::string>> parse_ini_file(
    const std::string& filepath,
    Reporter& reporter
) {
    std::map<std::string, std::map<std::string, std::string>> result;
    std::ifstream file(filepath);

    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath);
    }

    std::string current_section;
    std::string line;
    size_t line_num = 0;

    while (std::getline(file, line)) {
        line_num++;

        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line[line.length()-1] == ']') {
            current_section = line.substr(1, line.length()-2);
            continue;
        }

        // Parse key = value
        size_t equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            reporter.warning("Invalid line " + std::to_string(line_num) +
                             " in config file: " + line);
            continue;
        }

        std::string key = trim(line.substr(0, equals_pos));
        std::string value = strip_inline_comment(trim(line.substr(equals_pos + 1)));

        if (current_section.empty()) {
            reporter.warning("Key outside of section at line " + std::to_string(line_num));
            continue;
        }

        result[current_section][key] = value;
    }

    return result;
}

Config load_config_from_file(const std::string& config_path, Reporter& reporter) {
    Config config;  // Start with defaults
    config.config_file_path = config_path;

    std::map<std::string, std::map<std::string, std::string>> ini_data;
    try {
        ini_data = parse_ini_file(config_path, reporter);
    } catch (const std::exception& e) {
        reporter.warning(std::string("Error parsing config file: ") + e.what());
        return config;
    }

    // Parse [databases] section
    if (ini_data.count("databases")) {
        auto& databases = ini_data["databases"];
        if (databases.count("data_dir")) {
            config.data_dir = expand_home_dir(databases["data_dir"]);
        }
        if (databases.count("city_db")) {
            config.city_db = expand_home_dir(databases["city_db"]);
        }
        if (databases.count("asn_db")) {
            config.asn_db = expand_home_dir(databases["asn_db"]);
        }
        if (databases.count("proxy_db")) {
            config.proxy_db = expand_home_dir(databases["proxy_db"]);
        }
        if (databases.count("org_dir")) {
            config.org_dir = expand_home_dir(databases["org_dir"]);
        }
    }

    // Parse [lookup] section
    if (ini_data.count("lookup")) {
        auto& lookup = ini_data["lookup"];
        if (lookup.count("reverse_dns")) {
            config.reverse_dns = parse_bool(lookup["reverse_dns"]);
        }
        if (lookup.count("rdns_timeout_ms")) {
            try {
                config.rdns_timeout_ms = std::stoul(lookup["rdns_timeout_ms"]);
                if (config.rdns_timeout_ms == 0) config.rdns_timeout_ms = 1;
            } catch (const std::exception&) {
                reporter.warning("Ignoring invalid rdns_timeout_ms: " + lookup["rdns_timeout_ms"]);
            }
        }
        if (lookup.count("sort_by")) {
            config.sort_by = lookup["sort_by"];
        }
    }

    // Parse [output] section
    if (ini_data.count("output")) {
        auto& output = ini_data["output"];
        if (output.count("format")) {
            config.output_format = output["format"];
        }
        if (output.count("show_progress")) {
            config.show_progress = parse_bool(output["show_progress"]);
        }
    }

    return config;
}

void apply_environment(Config& config) {
    if (const char* env_data_dir = std::getenv("ARGUS_DATA_DIR")) {
        config.data_dir = expand_home_dir(env_data_dir);
    }
    if (const char* env_org_dir = std::getenv("ARGUS_ORG_DIR")) {
        config.org_dir = expand_home_dir(env_org_dir);
    }
}

Config load_config(Reporter& reporter) {
    Config config;  // Start with defaults

    // Ensure config directory exists
    create_config_directory(reporter);

    std::string config_path = get_config_file_path();

    struct stat st;
    if (stat(config_path.c_str(), &st) == 0) {
        config = load_config_from_file(config_path, reporter);
    } else if (create_example_config(config_path)) {
        reporter.info("Created example config at: " + config_path);
    } else {
        reporter.warning("Failed to create example config: " + config_path);
    }

    // Override with environment variables
    apply_environment(config);

    return config;
}

} // namespace argus
