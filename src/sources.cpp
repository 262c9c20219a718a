#include "sources.h"
#include "address.h"
#include "compression.h"
#include "errors.h"
#include <maxminddb.h>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <sys/stat.h>

namespace argus {

const char* const PROXY_UNKNOWN = "-";

bool ProxyRecord::is_known() const {
    return country_short != PROXY_UNKNOWN;
}

// ============================================================================
// MaxMindReader
// ============================================================================

namespace {

std::optional<std::string> string_at(MMDB_entry_s* entry, const char* const* path) {
    MMDB_entry_data_s data;
    if (MMDB_aget_value(entry, &data, path) != MMDB_SUCCESS) {
        return std::nullopt;
    }
    if (!data.has_data || data.type != MMDB_DATA_TYPE_UTF8_STRING || data.data_size == 0) {
        return std::nullopt;
    }
    return std::string(data.utf8_string, data.data_size);
}

std::optional<std::string> most_specific_subdivision(MMDB_entry_s* entry) {
    MMDB_entry_data_s data;
    const char* const list_path[] = {"subdivisions", nullptr};
    if (MMDB_aget_value(entry, &data, list_path) != MMDB_SUCCESS ||
        !data.has_data || data.type != MMDB_DATA_TYPE_ARRAY || data.data_size == 0) {
        return std::nullopt;
    }

    std::string last = std::to_string(data.data_size - 1);
    const char* const name_path[] = {"subdivisions", last.c_str(), "names", "en", nullptr};
    return string_at(entry, name_path);
}

} // namespace

class MaxMindReader::Impl {
public:
    MMDB_s mmdb;
    std::string path;

    explicit Impl(const std::string& db_path) : path(db_path) {
        int status = MMDB_open(db_path.c_str(), MMDB_MODE_MMAP, &mmdb);
        if (status != MMDB_SUCCESS) {
            throw DatabaseError("Failed to open MaxMind database " + db_path + ": " +
                                MMDB_strerror(status));
        }
    }

    ~Impl() {
        MMDB_close(&mmdb);
    }

    MMDB_lookup_result_s lookup(const std::string& address) {
        int gai_error = 0;
        int mmdb_error = MMDB_SUCCESS;
        MMDB_lookup_result_s result = MMDB_lookup_string(&mmdb, address.c_str(), &gai_error, &mmdb_error);

        if (gai_error != 0) {
            throw InvalidAddressError(address);
        }
        if (mmdb_error != MMDB_SUCCESS) {
            throw DatabaseError(std::string("MaxMind lookup failed: ") + MMDB_strerror(mmdb_error));
        }
        if (!result.found_entry) {
            throw AddressNotFoundError(address);
        }
        return result;
    }
};

MaxMindReader::MaxMindReader(const std::string& path)
    : pImpl(std::make_unique<Impl>(path)) {}

MaxMindReader::~MaxMindReader() = default;

GeoFacts MaxMindReader::city(const std::string& address) {
    MMDB_lookup_result_s result = pImpl->lookup(address);

    static const char* const city_path[] = {"city", "names", "en", nullptr};
    static const char* const country_path[] = {"country", "names", "en", nullptr};
    static const char* const iso_path[] = {"country", "iso_code", nullptr};
    static const char* const postal_path[] = {"postal", "code", nullptr};

    GeoFacts facts;
    facts.city = string_at(&result.entry, city_path);
    facts.region = most_specific_subdivision(&result.entry);
    facts.country = string_at(&result.entry, country_path);
    facts.iso_code = string_at(&result.entry, iso_path);
    facts.postal = string_at(&result.entry, postal_path);
    return facts;
}

AsnFacts MaxMindReader::asn(const std::string& address) {
    MMDB_lookup_result_s result = pImpl->lookup(address);

    static const char* const number_path[] = {"autonomous_system_number", nullptr};
    static const char* const org_path[] = {"autonomous_system_organization", nullptr};

    AsnFacts facts;

    MMDB_entry_data_s data;
    if (MMDB_aget_value(&result.entry, &data, number_path) == MMDB_SUCCESS && data.has_data) {
        uint32_t number = 0;
        if (data.type == MMDB_DATA_TYPE_UINT32) {
            number = data.uint32;
        } else if (data.type == MMDB_DATA_TYPE_UINT16) {
            number = data.uint16;
        }
        // AS0 is reserved and means "no ASN"
        if (number != 0) {
            facts.number = number;
        }
    }

    facts.organization = string_at(&result.entry, org_path);
    return facts;
}

const std::string& MaxMindReader::path() const {
    return pImpl->path;
}

// ============================================================================
// CsvProxyReader
// ============================================================================

std::vector<std::string> split_csv_line(const std::string& line) {
    std::vector<std::string> fields;
    std::string field;
    bool in_quotes = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (in_quotes) {
            if (c == '"' && i + 1 < line.size() && line[i + 1] == '"') {
                field += '"';
                ++i;
            } else if (c == '"') {
                in_quotes = false;
            } else {
                field += c;
            }
        } else if (c == '"') {
            in_quotes = true;
        } else if (c == ',') {
            fields.push_back(field);
            field.clear();
        } else {
            field += c;
        }
    }
    fields.push_back(field);
    return fields;
}

namespace {

bool parse_address_number(const std::string& text, uint32_t& value) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    errno = 0;
    unsigned long long parsed = std::strtoull(text.c_str(), nullptr, 10);
    if (errno != 0 || parsed > 0xFFFFFFFFull) {
        return false;
    }
    value = static_cast<uint32_t>(parsed);
    return true;
}

std::string known_or_marker(const std::string& value) {
    return value.empty() ? PROXY_UNKNOWN : value;
}

} // namespace

CsvProxyReader::CsvProxyReader(const std::string& path) {
    try {
        auto reader = create_reader(path);

        std::string line;
        while (reader->getline(line)) {
            auto fields = split_csv_line(line);
            if (fields.size() < 4) {
                continue;
            }

            // The header row and IPv6 rows fail here
            Range range;
            if (!parse_address_number(fields[0], range.from) ||
                !parse_address_number(fields[1], range.to) ||
                range.to < range.from) {
                continue;
            }

            ProxyRecord& record = range.record;
            if (fields.size() == 4) {
                // PX1: ip_from, ip_to, country_code, country_name
                record.country_short = known_or_marker(fields[2]);
            } else {
                // PX2+: ip_from, ip_to, proxy_type, country_code, country_name,
                // region, city, isp, domain, usage_type, ...
                record.proxy_type = known_or_marker(fields[2]);
                record.country_short = known_or_marker(fields[3]);
                if (fields.size() > 7) record.isp = known_or_marker(fields[7]);
                if (fields.size() > 8) record.domain = known_or_marker(fields[8]);
                if (fields.size() > 9) record.usage_type = known_or_marker(fields[9]);
            }

            ranges_.push_back(std::move(range));
        }
    } catch (const DatabaseError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw DatabaseError("Failed to read proxy database " + path + ": " + e.what());
    }

    if (ranges_.empty()) {
        throw DatabaseError("No usable rows in proxy database: " + path);
    }

    std::sort(ranges_.begin(), ranges_.end(),
              [](const Range& a, const Range& b) { return a.from < b.from; });
}

ProxyRecord CsvProxyReader::get_all(const std::string& address) {
    uint32_t value;
    if (!parse_ipv4(address, value)) {
        throw InvalidAddressError(address);
    }

    auto it = std::upper_bound(ranges_.begin(), ranges_.end(), value,
                               [](uint32_t v, const Range& range) { return v < range.from; });
    if (it == ranges_.begin()) {
        return ProxyRecord();
    }
    --it;
    if (value > it->to) {
        return ProxyRecord();
    }
    return it->record;
}

size_t CsvProxyReader::size() const {
    return ranges_.size();
}

// ============================================================================
// SourceSet
// ============================================================================

SourceSet::SourceSet(const SourcePaths& paths, Reporter& reporter)
    : city_(std::make_unique<MaxMindReader>(paths.city_db)),
      asn_(std::make_unique<MaxMindReader>(paths.asn_db)) {
    if (paths.proxy_db.empty()) {
        return;
    }

    struct stat st;
    if (stat(paths.proxy_db.c_str(), &st) != 0) {
        return;  // Proxy data is optional
    }

    try {
        proxy_ = std::make_unique<CsvProxyReader>(paths.proxy_db);
    } catch (const DatabaseError& e) {
        reporter.warning(std::string("Proxy data unavailable: ") + e.what());
    }
}

GeoReader& SourceSet::geo() {
    return *city_;
}

AsnReader& SourceSet::asn() {
    return *asn_;
}

ProxyReader* SourceSet::proxy() {
    return proxy_.get();
}

} // namespace argus
