#include "argus.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace argus {

std::string get_version() {
    return "1.0.0";
}

double ProcessingStats::success_rate() const {
    if (total_ips == 0) return 0.0;
    return static_cast<double>(successful_lookups) / total_ips * 100.0;
}

double ProcessingStats::filter_rate() const {
    if (successful_lookups == 0) return 0.0;
    return static_cast<double>(filtered_ips) / successful_lookups * 100.0;
}

ProcessingStats compute_stats(const std::vector<EnrichedRecord>& enriched,
                              size_t kept, double seconds) {
    ProcessingStats stats;
    stats.total_ips = enriched.size();
    for (const auto& record : enriched) {
        if (record.has_error()) {
            stats.failed_lookups++;
        } else {
            stats.successful_lookups++;
        }
    }
    stats.filtered_ips = enriched.size() > kept ? enriched.size() - kept : 0;
    stats.processing_time = seconds;
    return stats;
}

OutputFormat parse_output_format(const std::string& name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "csv") return OutputFormat::Csv;
    throw ValidationError("Invalid output format '" + name + "' (expected json or csv)");
}

// ============================================================================
// Console output
// ============================================================================

namespace {

std::string org_cell(const EnrichedRecord& record) {
    if (!record.org_managed) return "-";

    std::string cell = "yes";
    if (record.org_id) cell += " " + *record.org_id;
    if (record.platform) cell += " (" + *record.platform + ")";
    return cell;
}

std::string proxy_cell(const EnrichedRecord& record) {
    std::string cell;
    if (record.proxy_type) cell = *record.proxy_type;
    if (record.usage_type) {
        if (!cell.empty()) cell += " ";
        cell += "(" + *record.usage_type + ")";
    }
    return cell.empty() ? "-" : cell;
}

std::string asn_text(const EnrichedRecord& record) {
    std::string text;
    if (record.asn) text = "AS" + std::to_string(*record.asn);
    if (record.asn_org) {
        if (!text.empty()) text += " ";
        text += "(" + *record.asn_org + ")";
    }
    return text;
}

std::string network_cell(const EnrichedRecord& record) {
    std::string cell;
    if (record.domain) cell = *record.domain;
    std::string asn = asn_text(record);
    if (!asn.empty()) {
        if (!cell.empty()) cell += " ";
        cell += asn;
    }
    return cell.empty() ? "-" : cell;
}

std::string location_cell(const EnrichedRecord& record) {
    std::string cell;
    if (record.city) cell = *record.city;
    if (record.country) {
        if (!cell.empty()) cell += ", ";
        cell += *record.country;
    }
    return cell.empty() ? "-" : cell;
}

} // namespace

void print_table(const std::vector<EnrichedRecord>& records, std::ostream& out) {
    if (records.empty()) {
        out << "No IP addresses to display.\n";
        return;
    }

    struct Row {
        std::string ip, org, proxy, network, location;
    };

    std::vector<Row> rows;
    rows.reserve(records.size());
    for (const auto& record : records) {
        if (record.has_error()) {
            rows.push_back({record.address, "", "", "ERROR: " + *record.error, ""});
        } else {
            rows.push_back({record.address, org_cell(record), proxy_cell(record),
                            network_cell(record), location_cell(record)});
        }
    }

    // Calculate column widths
    size_t ip_width = 10;       // Minimum for "IP Address"
    size_t org_width = 8;       // Minimum for "Org Info"
    size_t proxy_width = 5;     // Minimum for "Proxy"
    size_t network_width = 7;   // Minimum for "Network"
    size_t location_width = 8;  // Minimum for "Location"

    for (const auto& row : rows) {
        ip_width = std::max(ip_width, row.ip.length());
        org_width = std::max(org_width, row.org.length());
        proxy_width = std::max(proxy_width, row.proxy.length());
        network_width = std::max(network_width, row.network.length());
        location_width = std::max(location_width, row.location.length());
    }

    size_t separator_width = ip_width + org_width + proxy_width + network_width + location_width + 16;
    std::string separator(separator_width, '-');

    out << separator << "\n";
    out << "| " << std::left << std::setw(ip_width) << "IP Address"
        << " | " << std::setw(org_width) << "Org Info"
        << " | " << std::setw(proxy_width) << "Proxy"
        << " | " << std::setw(network_width) << "Network"
        << " | " << std::setw(location_width) << "Location"
        << " |\n";
    out << separator << "\n";

    for (const auto& row : rows) {
        out << "| " << std::left << std::setw(ip_width) << row.ip
            << " | " << std::setw(org_width) << row.org
            << " | " << std::setw(proxy_width) << row.proxy
            << " | " << std::setw(network_width) << row.network
            << " | " << std::setw(location_width) << row.location
            << " |\n";
    }
    out << separator << "\n";
}

void print_panel(const EnrichedRecord& record, std::ostream& out) {
    std::vector<std::string> lines;

    if (record.has_error()) {
        lines.push_back("ERROR: " + *record.error);
    } else {
        if (record.org_managed) {
            std::string org = "yes, " + record.org_id.value_or("Unknown");
            if (record.platform) org += " (" + *record.platform + ")";
            lines.push_back("Org Managed: " + org);
        }
        std::string location = location_cell(record);
        if (location != "-") {
            lines.push_back("Location:    " + location);
        }
        if (record.region) {
            lines.push_back("Region:      " + *record.region);
        }
        std::string asn = asn_text(record);
        if (!asn.empty()) {
            lines.push_back("ASN:         " + asn);
        }
        if (record.domain) {
            lines.push_back("Domain:      " + *record.domain);
        }
        std::string proxy = proxy_cell(record);
        if (proxy != "-") {
            lines.push_back("Proxy:       " + proxy);
        }
        if (record.isp) {
            lines.push_back("ISP:         " + *record.isp);
        }
        if (lines.empty()) {
            lines.push_back("No additional information available");
        }
    }

    size_t width = record.address.length() + 2;
    for (const auto& line : lines) {
        width = std::max(width, line.length());
    }

    std::string title = " " + record.address + " ";
    out << "+-" << title << std::string(width - title.length(), '-') << "-+\n";
    for (const auto& line : lines) {
        out << "| " << std::left << std::setw(width) << line << " |\n";
    }
    out << "+" << std::string(width + 2, '-') << "+\n";
}

void print_records(const std::vector<EnrichedRecord>& records, std::ostream& out) {
    if (records.size() == 1) {
        print_panel(records.front(), out);
    } else {
        print_table(records, out);
    }
}

// ============================================================================
// Export
// ============================================================================

namespace {

nlohmann::json optional_json(const std::optional<std::string>& value) {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

std::string optional_text(const std::optional<std::string>& value) {
    return value.value_or("");
}

std::string csv_quote(const std::string& value) {
    std::string quoted = "\"";
    for (char c : value) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

} // namespace

std::string format_json(const std::vector<EnrichedRecord>& records) {
    nlohmann::json array = nlohmann::json::array();

    for (const auto& record : records) {
        nlohmann::json item;
        item["ip"] = record.address;
        item["org_managed"] = record.org_managed;
        item["org_id"] = optional_json(record.org_id);
        item["platform"] = optional_json(record.platform);
        item["proxy_type"] = optional_json(record.proxy_type);
        item["domain"] = optional_json(record.domain);
        item["city"] = optional_json(record.city);
        item["region"] = optional_json(record.region);
        item["country"] = optional_json(record.country);
        item["iso_code"] = optional_json(record.iso_code);
        item["postal"] = optional_json(record.postal);
        item["isp"] = optional_json(record.isp);
        item["usage_type"] = optional_json(record.usage_type);
        item["asn"] = record.asn ? nlohmann::json(*record.asn) : nlohmann::json(nullptr);
        item["asn_org"] = optional_json(record.asn_org);
        item["error"] = optional_json(record.error);
        array.push_back(std::move(item));
    }

    return array.dump(2);
}

std::string format_csv(const std::vector<EnrichedRecord>& records) {
    std::ostringstream out;
    out << "ip,org_managed,org_id,platform,proxy_type,domain,city,region,country,"
           "iso_code,isp,usage_type,asn,asn_org,error\n";

    for (const auto& record : records) {
        std::vector<std::string> values = {
            record.address,
            record.org_managed ? "true" : "false",
            optional_text(record.org_id),
            optional_text(record.platform),
            optional_text(record.proxy_type),
            optional_text(record.domain),
            optional_text(record.city),
            optional_text(record.region),
            optional_text(record.country),
            optional_text(record.iso_code),
            optional_text(record.isp),
            optional_text(record.usage_type),
            record.asn ? std::to_string(*record.asn) : "",
            optional_text(record.asn_org),
            optional_text(record.error),
        };

        for (size_t i = 0; i < values.size(); ++i) {
            if (i > 0) out << ",";
            out << csv_quote(values[i]);
        }
        out << "\n";
    }

    return out.str();
}

std::string default_output_path(OutputFormat format) {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y%m%d_%H%M%S", &local);

    return std::string("argus_results_") + stamp + (format == OutputFormat::Csv ? ".csv" : ".json");
}

std::string write_results(const std::vector<EnrichedRecord>& records,
                          const std::string& path, OutputFormat format) {
    std::string file_path = path.empty() ? default_output_path(format) : path;

    std::ofstream file(file_path, std::ios::trunc);
    if (!file) {
        throw std::runtime_error("Cannot open output file: " + file_path);
    }

    if (format == OutputFormat::Csv) {
        file << format_csv(records);
    } else {
        file << format_json(records) << "\n";
    }

    if (!file) {
        throw std::runtime_error("Failed to write output file: " + file_path);
    }
    return file_path;
}

} // namespace argus
