#include <iostream>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>
#include <chrono>
#include <cctype>
#include "argus.h"
#include "address.h"
#include "attribution.h"
#include "config.h"
#include "enrichment.h"
#include "errors.h"
#include "progress.h"
#include "results.h"
#include "sources.h"

namespace {

void print_usage(const char* program_name) {
    std::cout << "\n";
    std::cout << "  Argus v" << argus::get_version() << "\n";
    std::cout << "  Offline IP address enrichment\n";
    std::cout << "\n";
    std::cout << "Usage: " << program_name << " lookup [OPTIONS] [ADDRESS|CIDR]\n\n";
    std::cout << "Input:\n";
    std::cout << "  ADDRESS|CIDR               Single IPv4 address or CIDR block (max 1024 hosts)\n";
    std::cout << "  -f, --file FILE            Extract addresses from FILE (.gz/.bz2/.xz ok, repeatable)\n\n";
    std::cout << "Output:\n";
    std::cout << "  --json                     Print results as JSON instead of a table\n";
    std::cout << "  --format json|csv          Format for -o (default from config)\n";
    std::cout << "  -o, --output PATH          Also write results to PATH ('-' picks a timestamped name)\n";
    std::cout << "  --sort-by KEY              ip, domain, city, region, country, iso_code,\n";
    std::cout << "                             asn, asn_org, platform, org_id (default asn_org)\n";
    std::cout << "  --no-progress              Do not draw the progress bar\n\n";
    std::cout << "Filters (repeatable):\n";
    std::cout << "  -xc, --exclude-country CC  Exclude a country by ISO code (two letters)\n";
    std::cout << "  --exclude-country-name N   Exclude a country by name\n";
    std::cout << "  -xct, --exclude-city CITY  Exclude a city\n";
    std::cout << "  -xa, --exclude-asn ASN     Exclude an ASN\n";
    std::cout << "  -xo, --exclude-org TEXT    Exclude ASN organizations containing TEXT\n";
    std::cout << "  --exclude-org-managed      Exclude org-managed addresses\n";
    std::cout << "  --exclude-not-org-managed  Exclude addresses that are not org-managed\n";
    std::cout << "  -xp, --exclude-platform P  Exclude a platform\n";
    std::cout << "  -xoi, --exclude-org-id ID  Exclude an organization id\n\n";
    std::cout << "Lookup:\n";
    std::cout << "  --rdns                     Resolve domains by reverse DNS\n\n";
    std::cout << "  --help                     Display this help message\n";
    std::cout << "  --version                  Display version information\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " lookup 8.8.8.8\n";
    std::cout << "  " << program_name << " lookup 8.8.8.0/24 -xc US --sort-by asn\n";
    std::cout << "  " << program_name << " lookup -f /var/log/auth.log.gz --exclude-org-managed\n";
    std::cout << "  " << program_name << " lookup -f hosts.txt -o - --format csv\n\n";
    std::cout << "Configuration:\n";
    std::cout << "  Config file: ~/.argus/settings.conf\n";
    std::cout << "  Databases:   ~/.argus/ (override with ARGUS_DATA_DIR)\n";
    std::cout << "  Datasets:    ~/.argus/org/ (override with ARGUS_ORG_DIR)\n";
}

void print_version() {
    std::cout << "Argus v" << argus::get_version() << "\n";
}

std::string validate_country_code(const std::string& code) {
    if (code.size() != 2 ||
        !std::isalpha(static_cast<unsigned char>(code[0])) ||
        !std::isalpha(static_cast<unsigned char>(code[1]))) {
        throw argus::ValidationError("Invalid country code '" + code + "' (expected two letters)");
    }
    return code;
}

uint32_t parse_asn(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos || text.size() > 10) {
        throw argus::ValidationError("Invalid ASN '" + text + "' (expected 0 to 4294967295)");
    }
    unsigned long long value = std::stoull(text);
    if (value > 4294967295ull) {
        throw argus::ValidationError("Invalid ASN '" + text + "' (expected 0 to 4294967295)");
    }
    return static_cast<uint32_t>(value);
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h") {
        print_usage(argv[0]);
        return 0;
    }
    if (command == "--version" || command == "-v") {
        print_version();
        return 0;
    }
    if (command != "lookup") {
        std::cerr << "Error: Unknown command '" << command << "'\n";
        std::cerr << "Use --help for usage information\n";
        return 1;
    }

    argus::ConsoleReporter setup_reporter(std::cerr, false);
    argus::Config config = argus::load_config(setup_reporter);

    // Parse command line arguments (CLI overrides config)
    std::string target;
    std::vector<std::string> files;
    std::string format_name = config.output_format;
    std::string sort_name = config.sort_by;
    std::string output_path;
    bool write_output = false;
    bool output_json = false;
    bool reverse_dns = config.reverse_dns;
    bool show_progress = config.show_progress;
    argus::FilterOptions filter_options;

    try {
        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            // Options that take a value
            auto next_value = [&]() -> std::string {
                if (i + 1 >= argc) {
                    throw argus::ValidationError("Option '" + arg + "' requires a value");
                }
                return argv[++i];
            };

            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--version" || arg == "-v") {
                print_version();
                return 0;
            } else if (arg == "-f" || arg == "--file") {
                files.push_back(next_value());
            } else if (arg == "--format") {
                format_name = next_value();
            } else if (arg == "-o" || arg == "--output") {
                output_path = next_value();
                if (output_path == "-") output_path.clear();
                write_output = true;
            } else if (arg == "--sort-by") {
                sort_name = next_value();
            } else if (arg == "-xc" || arg == "--exclude-country") {
                filter_options.iso_codes.push_back(validate_country_code(next_value()));
            } else if (arg == "--exclude-country-name") {
                filter_options.countries.push_back(next_value());
            } else if (arg == "-xct" || arg == "--exclude-city") {
                filter_options.cities.push_back(next_value());
            } else if (arg == "-xa" || arg == "--exclude-asn") {
                filter_options.asns.push_back(parse_asn(next_value()));
            } else if (arg == "-xo" || arg == "--exclude-org") {
                filter_options.orgs.push_back(next_value());
            } else if (arg == "--exclude-org-managed") {
                filter_options.exclude_org_managed = true;
            } else if (arg == "--exclude-not-org-managed") {
                filter_options.exclude_not_org_managed = true;
            } else if (arg == "-xp" || arg == "--exclude-platform") {
                filter_options.platforms.push_back(next_value());
            } else if (arg == "-xoi" || arg == "--exclude-org-id") {
                filter_options.org_ids.push_back(next_value());
            } else if (arg == "--rdns") {
                reverse_dns = true;
            } else if (arg == "--json") {
                output_json = true;
            } else if (arg == "--no-progress") {
                show_progress = false;
            } else if (arg[0] == '-') {
                std::cerr << "Error: Unknown option '" << arg << "'\n";
                std::cerr << "Use --help for usage information\n";
                return 1;
            } else {
                if (!target.empty()) {
                    std::cerr << "Error: Multiple addresses specified\n";
                    std::cerr << "Use --help for usage information\n";
                    return 1;
                }
                target = arg;
            }
        }

        // Validate everything before touching any database
        if (!target.empty()) {
            argus::validate_target(target);
        }
        argus::SortKey sort_key = argus::parse_sort_key(sort_name);
        argus::OutputFormat format = argus::parse_output_format(format_name);
        argus::FilterCriteria criteria(filter_options);

        if (target.empty() && files.empty()) {
            std::cout << "No IP or file provided. Use --help for usage information.\n";
            return 0;
        }

        auto start_time = std::chrono::steady_clock::now();

        const auto& cache = argus::get_regex_cache();
        auto addresses = argus::collect_addresses(target, files, cache, setup_reporter);

        if (addresses.empty()) {
            std::cout << "No IP addresses found\n";
            return 0;
        }

        argus::ConsoleReporter reporter(std::cerr, show_progress);

        argus::AttributionStore store;
        store.load(config.org_dir_path(), reporter);

        argus::SourcePaths paths;
        paths.city_db = config.city_db_path();
        paths.asn_db = config.asn_db_path();
        paths.proxy_db = config.proxy_db_path();

        std::vector<argus::EnrichedRecord> records;
        {
            argus::SourceSet sources(paths, reporter);
            argus::Enricher enricher(sources.geo(), sources.asn(), sources.proxy(), store, reporter);
            if (reverse_dns) {
                enricher.set_domain_resolver(
                    argus::make_rdns_resolver(std::chrono::milliseconds(config.rdns_timeout_ms)));
            }
            records = enricher.enrich(addresses);
        }

        auto kept = argus::filter_records(records, criteria);
        auto sorted = argus::sort_records(kept, sort_key);

        if (output_json) {
            std::cout << argus::format_json(sorted) << "\n";
        } else {
            argus::print_records(sorted, std::cout);
        }

        if (write_output) {
            std::string written = argus::write_results(sorted, output_path, format);
            reporter.info("Results written to " + written);
        }

        double elapsed = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time).count();
        argus::ProcessingStats stats = argus::compute_stats(records, sorted.size(), elapsed);

        std::ostringstream summary;
        summary << std::fixed << std::setprecision(2)
                << "Processed " << stats.total_ips << " IP(s) in " << stats.processing_time << "s";
        reporter.info(summary.str());
        if (stats.filtered_ips > 0) {
            reporter.info("Filtered out " + std::to_string(stats.filtered_ips) + " IP(s)");
        }

        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
