#ifndef ARGUS_H
#define ARGUS_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace argus {

/**
 * Everything known about one input address after enrichment.
 * When error is set every other field stays at its default.
 */
struct EnrichedRecord {
    std::string address;
    std::optional<std::string> domain;

    // Geolocation
    std::optional<std::string> city;
    std::optional<std::string> region;
    std::optional<std::string> country;
    std::optional<std::string> iso_code;
    std::optional<std::string> postal;

    // Network ownership
    std::optional<uint32_t> asn;
    std::optional<std::string> asn_org;

    // Proxy source
    std::optional<std::string> proxy_type;
    std::optional<std::string> isp;
    std::optional<std::string> usage_type;

    // Attribution
    bool org_managed = false;
    std::optional<std::string> org_id;
    std::optional<std::string> platform;

    std::optional<std::string> error;

    bool has_error() const { return error.has_value(); }
};

/**
 * Counters for one run
 */
struct ProcessingStats {
    size_t total_ips;
    size_t successful_lookups;
    size_t failed_lookups;
    size_t filtered_ips;
    double processing_time;  // Seconds

    ProcessingStats() : total_ips(0), successful_lookups(0), failed_lookups(0),
                        filtered_ips(0), processing_time(0.0) {}

    /**
     * Percentage of addresses enriched without error
     */
    double success_rate() const;

    /**
     * Percentage of successful lookups removed by the filter
     */
    double filter_rate() const;
};

/**
 * Tally a batch: successes and failures from the enriched records,
 * filtered count from the size difference after filtering
 */
ProcessingStats compute_stats(const std::vector<EnrichedRecord>& enriched,
                              size_t kept, double seconds);

/**
 * Export formats for -o
 */
enum class OutputFormat { Json, Csv };

/**
 * Parse "json" or "csv"
 * @throws ValidationError for anything else
 */
OutputFormat parse_output_format(const std::string& name);

/**
 * Get version string
 */
std::string get_version();

/**
 * Print records as a table, one row per address
 * @param records Records to show
 * @param out Destination stream
 */
void print_table(const std::vector<EnrichedRecord>& records, std::ostream& out);

/**
 * Print a single record as a detail panel
 */
void print_panel(const EnrichedRecord& record, std::ostream& out);

/**
 * Print one record as a panel, several as a table
 */
void print_records(const std::vector<EnrichedRecord>& records, std::ostream& out);

/**
 * Serialize records as a JSON array; absent values become null
 */
std::string format_json(const std::vector<EnrichedRecord>& records);

/**
 * Serialize records as CSV with a header row; every value is quoted
 * and absent values are empty
 */
std::string format_csv(const std::vector<EnrichedRecord>& records);

/**
 * File name for an unnamed export: argus_results_YYYYMMDD_HHMMSS.<ext>
 */
std::string default_output_path(OutputFormat format);

/**
 * Write records to a file
 * @param records Records to write
 * @param path Destination; empty picks default_output_path()
 * @param format Export format
 * @return The path written
 * @throws std::runtime_error if the file cannot be written
 */
std::string write_results(const std::vector<EnrichedRecord>& records,
                          const std::string& path, OutputFormat format);

} // namespace argus

#endif // ARGUS_H
