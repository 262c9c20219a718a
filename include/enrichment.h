#ifndef ARGUS_ENRICHMENT_H
#define ARGUS_ENRICHMENT_H

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "argus.h"
#include "attribution.h"
#include "progress.h"
#include "sources.h"

namespace argus {

// Fixed record error strings
extern const char* const ERROR_NOT_FOUND;
extern const char* const ERROR_INVALID_ADDRESS;

/**
 * Resolves an address to the domain shown on its record.
 * Returns nothing when no name is known.
 */
using DomainResolver = std::function<std::optional<std::string>(const std::string&)>;

/**
 * Perform reverse DNS lookup on an IP address
 * @param ip_address IP address to lookup
 * @return Hostname or empty string if lookup fails
 */
std::string reverse_dns_lookup(const std::string& ip_address);

/**
 * Blocking address-to-hostname lookup; empty string when there is no name
 */
using HostnameLookup = std::function<std::string(const std::string&)>;

// Upper bound on lookup threads still running, abandoned ones included
extern const size_t MAX_PENDING_RDNS_LOOKUPS;

/**
 * Number of lookup threads that have not finished yet
 */
size_t pending_rdns_lookups();

/**
 * Reverse DNS bounded by a timeout. The lookup runs on its own thread;
 * when the timeout expires the thread is abandoned and nothing is returned.
 * While MAX_PENDING_RDNS_LOOKUPS threads are still running, or when no
 * thread can be started, the lookup is skipped.
 * @param ip_address IP address to lookup
 * @param timeout Maximum time to wait
 * @return Hostname, or nothing on failure, timeout or skip
 */
std::optional<std::string> resolve_domain(const std::string& ip_address,
                                          std::chrono::milliseconds timeout);

/**
 * Same as above with a caller-supplied lookup in place of getnameinfo
 */
std::optional<std::string> resolve_domain(const std::string& ip_address,
                                          std::chrono::milliseconds timeout,
                                          const HostnameLookup& lookup);

/**
 * Reduce a hostname to its registrable root (www.example.co.uk -> example.co.uk)
 * @param hostname Fully qualified hostname, trailing dot allowed
 * @return Apex domain; hostnames with fewer labels are returned as-is
 */
std::string apex_domain(const std::string& hostname);

/**
 * Resolver that performs time-bounded reverse DNS and returns the apex domain
 */
DomainResolver make_rdns_resolver(std::chrono::milliseconds timeout);

/**
 * Builds one EnrichedRecord per address from the source readers and the
 * attribution store. Readers are borrowed; the caller keeps them open for
 * the whole batch.
 */
class Enricher {
public:
    /**
     * @param geo City database reader
     * @param asn ASN database reader
     * @param proxy Proxy reader, or nullptr when proxy data is unavailable
     * @param store Loaded attribution datasets (may be empty)
     * @param reporter Receives progress and warnings
     */
    Enricher(GeoReader& geo, AsnReader& asn, ProxyReader* proxy,
             const AttributionStore& store, Reporter& reporter);

    /**
     * Enable domain resolution for addresses the proxy source has no domain for.
     * A resolver that throws leaves the domain empty and raises a warning.
     */
    void set_domain_resolver(DomainResolver resolver);

    /**
     * Enrich one address. Geolocation and ASN failures are recorded on the
     * record's error field, never thrown.
     */
    EnrichedRecord enrich_one(const std::string& address);

    /**
     * Enrich a batch in input order, one record per address.
     * A failure on one address never stops the batch.
     */
    std::vector<EnrichedRecord> enrich(const std::vector<std::string>& addresses);

private:
    void merge_proxy(const std::string& address, EnrichedRecord& record);

    GeoReader& geo_;
    AsnReader& asn_;
    ProxyReader* proxy_;
    const AttributionStore& store_;
    Reporter& reporter_;
    DomainResolver resolver_;
};

} // namespace argus

#endif // ARGUS_ENRICHMENT_H
