#include "enrichment.h"
#include "errors.h"
#include <atomic>
#include <future>
#include <memory>
#include <system_error>
#include <thread>
#include <cstring>
#include <sys/socket.h>
#include <netdb.h>
#include <arpa/inet.h>

namespace argus {

const char* const ERROR_NOT_FOUND = "address not found in database";
const char* const ERROR_INVALID_ADDRESS = "invalid address format";

const size_t MAX_PENDING_RDNS_LOOKUPS = 16;

namespace {

std::atomic<size_t> pending_lookups(0);

} // namespace

// ============================================================================
// Reverse DNS
// ============================================================================

std::string reverse_dns_lookup(const std::string& ip_address) {
    struct sockaddr_in sa;
    char host[NI_MAXHOST];

    memset(&sa, 0, sizeof(sa));
    sa.sin_family = AF_INET;

    if (inet_pton(AF_INET, ip_address.c_str(), &sa.sin_addr) != 1) {
        return "";
    }

    // NI_NAMEREQD: fail rather than hand back the numeric form
    if (getnameinfo(reinterpret_cast<struct sockaddr*>(&sa), sizeof(sa),
                    host, sizeof(host), nullptr, 0, NI_NAMEREQD) != 0) {
        return "";
    }

    return std::string(host);
}

size_t pending_rdns_lookups() {
    return pending_lookups.load();
}

std::optional<std::string> resolve_domain(const std::string& ip_address,
                                          std::chrono::milliseconds timeout) {
    return resolve_domain(ip_address, timeout, reverse_dns_lookup);
}

std::optional<std::string> resolve_domain(const std::string& ip_address,
                                          std::chrono::milliseconds timeout,
                                          const HostnameLookup& lookup) {
    // Too many lookups stuck on a slow resolver: skip instead of piling up threads
    if (pending_lookups.fetch_add(1) >= MAX_PENDING_RDNS_LOOKUPS) {
        pending_lookups.fetch_sub(1);
        return std::nullopt;
    }

    // Shared with the worker so an abandoned lookup still has somewhere to write
    auto slot = std::make_shared<std::promise<std::string>>();
    std::future<std::string> result = slot->get_future();

    try {
        std::thread worker([slot, ip_address, lookup]() {
            try {
                slot->set_value(lookup(ip_address));
            } catch (const std::exception&) {
                slot->set_value("");
            }
            pending_lookups.fetch_sub(1);
        });
        worker.detach();
    } catch (const std::system_error&) {
        pending_lookups.fetch_sub(1);
        return std::nullopt;
    }

    if (result.wait_for(timeout) != std::future_status::ready) {
        return std::nullopt;
    }

    std::string hostname = result.get();
    if (hostname.empty() || hostname == ip_address) {
        return std::nullopt;
    }
    return hostname;
}

std::string apex_domain(const std::string& hostname) {
    std::string name = hostname;
    if (!name.empty() && name.back() == '.') {
        name.pop_back();
    }

    std::vector<std::string> labels;
    size_t start = 0;
    while (start <= name.size()) {
        size_t dot = name.find('.', start);
        if (dot == std::string::npos) {
            labels.push_back(name.substr(start));
            break;
        }
        labels.push_back(name.substr(start, dot - start));
        start = dot + 1;
    }

    if (labels.size() <= 2) {
        return name;
    }

    size_t keep = 2;
    const std::string& tld = labels[labels.size() - 1];
    const std::string& second = labels[labels.size() - 2];
    static const char* const public_second_levels[] = {
        "co", "com", "net", "org", "gov", "ac", "edu"
    };
    if (tld.size() == 2) {
        for (const char* level : public_second_levels) {
            if (second == level) {
                keep = 3;
                break;
            }
        }
    }

    if (labels.size() <= keep) {
        return name;
    }

    std::string apex;
    for (size_t i = labels.size() - keep; i < labels.size(); ++i) {
        if (!apex.empty()) apex += ".";
        apex += labels[i];
    }
    return apex;
}

DomainResolver make_rdns_resolver(std::chrono::milliseconds timeout) {
    return [timeout](const std::string& address) -> std::optional<std::string> {
        auto hostname = resolve_domain(address, timeout);
        if (!hostname) {
            return std::nullopt;
        }
        return apex_domain(*hostname);
    };
}

// ============================================================================
// Enricher
// ============================================================================

namespace {

std::optional<std::string> unless_unknown(const std::string& value) {
    if (value == PROXY_UNKNOWN) {
        return std::nullopt;
    }
    return value;
}

EnrichedRecord error_record(const std::string& address, const std::string& error) {
    EnrichedRecord record;
    record.address = address;
    record.error = error;
    return record;
}

} // namespace

Enricher::Enricher(GeoReader& geo, AsnReader& asn, ProxyReader* proxy,
                   const AttributionStore& store, Reporter& reporter)
    : geo_(geo), asn_(asn), proxy_(proxy), store_(store), reporter_(reporter) {}

void Enricher::set_domain_resolver(DomainResolver resolver) {
    resolver_ = std::move(resolver);
}

void Enricher::merge_proxy(const std::string& address, EnrichedRecord& record) {
    ProxyRecord proxy;
    try {
        proxy = proxy_->get_all(address);
    } catch (const std::exception& e) {
        reporter_.warning("Proxy lookup failed for " + address + ": " + e.what());
        return;
    }

    if (!proxy.is_known()) {
        return;
    }

    record.proxy_type = unless_unknown(proxy.proxy_type);
    record.domain = unless_unknown(proxy.domain);
    record.isp = unless_unknown(proxy.isp);
    record.usage_type = unless_unknown(proxy.usage_type);
}

EnrichedRecord Enricher::enrich_one(const std::string& address) {
    GeoFacts geo;
    AsnFacts asn;
    try {
        geo = geo_.city(address);
        asn = asn_.asn(address);
    } catch (const AddressNotFoundError&) {
        return error_record(address, ERROR_NOT_FOUND);
    } catch (const InvalidAddressError&) {
        return error_record(address, ERROR_INVALID_ADDRESS);
    } catch (const std::exception& e) {
        return error_record(address, e.what());
    }

    EnrichedRecord record;
    record.address = address;
    record.city = geo.city;
    record.region = geo.region;
    record.country = geo.country;
    record.iso_code = geo.iso_code;
    record.postal = geo.postal;
    record.asn = asn.number;
    record.asn_org = asn.organization;

    if (proxy_) {
        merge_proxy(address, record);
    }

    if (!record.domain && resolver_) {
        try {
            record.domain = resolver_(address);
        } catch (const std::exception& e) {
            reporter_.warning("Reverse DNS failed for " + address + ": " + e.what());
        }
    }

    if (store_.has_data()) {
        auto hit = store_.lookup(address);
        if (hit) {
            record.org_managed = true;
            record.org_id = hit->org_id;
            record.platform = hit->platform;
        }
    }

    return record;
}

std::vector<EnrichedRecord> Enricher::enrich(const std::vector<std::string>& addresses) {
    std::vector<EnrichedRecord> records;
    records.reserve(addresses.size());

    size_t done = 0;
    for (const auto& address : addresses) {
        try {
            records.push_back(enrich_one(address));
        } catch (const std::exception& e) {
            // Attribution failure; the address still gets a record
            records.push_back(error_record(address, e.what()));
        }
        reporter_.progress(++done, addresses.size(), address);
    }

    reporter_.finish();
    return records;
}

} // namespace argus
