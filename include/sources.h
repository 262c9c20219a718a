#ifndef ARGUS_SOURCES_H
#define ARGUS_SOURCES_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "progress.h"

namespace argus {

/**
 * Marker the proxy database uses for "no value"
 */
extern const char* const PROXY_UNKNOWN;

/**
 * Geolocation facts for one address (City database)
 */
struct GeoFacts {
    std::optional<std::string> city;
    std::optional<std::string> region;     // Most specific subdivision
    std::optional<std::string> country;
    std::optional<std::string> iso_code;
    std::optional<std::string> postal;
};

/**
 * Network ownership facts for one address (ASN database)
 */
struct AsnFacts {
    std::optional<uint32_t> number;
    std::optional<std::string> organization;
};

/**
 * Raw proxy database record. Every field holds PROXY_UNKNOWN when the
 * database has nothing for it; country_short == PROXY_UNKNOWN means the
 * address itself is unknown.
 */
struct ProxyRecord {
    std::string country_short = PROXY_UNKNOWN;
    std::string proxy_type = PROXY_UNKNOWN;
    std::string isp = PROXY_UNKNOWN;
    std::string domain = PROXY_UNKNOWN;
    std::string usage_type = PROXY_UNKNOWN;

    bool is_known() const;
};

/**
 * Geolocation source
 */
class GeoReader {
public:
    virtual ~GeoReader() = default;

    /**
     * @throws AddressNotFoundError, InvalidAddressError, DatabaseError
     */
    virtual GeoFacts city(const std::string& address) = 0;
};

/**
 * ASN source
 */
class AsnReader {
public:
    virtual ~AsnReader() = default;

    /**
     * @throws AddressNotFoundError, InvalidAddressError, DatabaseError
     */
    virtual AsnFacts asn(const std::string& address) = 0;
};

/**
 * Proxy/anonymizer source
 */
class ProxyReader {
public:
    virtual ~ProxyReader() = default;

    /**
     * @return Record for the address; all-unknown when the address is not covered
     * @throws InvalidAddressError on malformed input
     */
    virtual ProxyRecord get_all(const std::string& address) = 0;
};

/**
 * MaxMind .mmdb reader (GeoLite2/GeoIP2 City and ASN editions).
 * The database is memory-mapped for the lifetime of the object.
 */
class MaxMindReader : public GeoReader, public AsnReader {
public:
    /**
     * @throws DatabaseError if the database cannot be opened
     */
    explicit MaxMindReader(const std::string& path);
    ~MaxMindReader() override;

    MaxMindReader(const MaxMindReader&) = delete;
    MaxMindReader& operator=(const MaxMindReader&) = delete;

    GeoFacts city(const std::string& address) override;
    AsnFacts asn(const std::string& address) override;

    const std::string& path() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * IP2Proxy LITE CSV database (PX1 to PX11 layouts, optionally compressed),
 * held in memory as a sorted range table.
 */
class CsvProxyReader : public ProxyReader {
public:
    /**
     * @throws DatabaseError if the file is unreadable or has no usable rows
     */
    explicit CsvProxyReader(const std::string& path);

    ProxyRecord get_all(const std::string& address) override;

    size_t size() const;

private:
    struct Range {
        uint32_t from;
        uint32_t to;
        ProxyRecord record;
    };

    std::vector<Range> ranges_;
};

/**
 * Split one CSV line into fields, honouring double quotes
 */
std::vector<std::string> split_csv_line(const std::string& line);

/**
 * Database locations for one batch
 */
struct SourcePaths {
    std::string city_db;
    std::string asn_db;
    std::string proxy_db;   // Optional; empty or missing disables proxy data
};

/**
 * Source readers held open for one batch and released together
 */
class SourceSet {
public:
    /**
     * Open the City and ASN databases (required) and the proxy database (optional)
     * @throws DatabaseError if City or ASN cannot be opened
     */
    SourceSet(const SourcePaths& paths, Reporter& reporter);

    GeoReader& geo();
    AsnReader& asn();

    /**
     * @return Proxy reader, or nullptr when no proxy database is available
     */
    ProxyReader* proxy();

private:
    std::unique_ptr<MaxMindReader> city_;
    std::unique_ptr<MaxMindReader> asn_;
    std::unique_ptr<ProxyReader> proxy_;
};

} // namespace argus

#endif // ARGUS_SOURCES_H
