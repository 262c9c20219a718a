#ifndef ARGUS_RESULTS_H
#define ARGUS_RESULTS_H

#include <cstdint>
#include <set>
#include <string>
#include <vector>
#include "argus.h"

namespace argus {

/**
 * Raw exclusion values as given on the command line
 */
struct FilterOptions {
    std::vector<std::string> countries;   // Country names
    std::vector<std::string> iso_codes;   // Two-letter country codes
    std::vector<std::string> cities;
    std::vector<uint32_t> asns;
    std::vector<std::string> orgs;
    bool exclude_org_managed = false;
    bool exclude_not_org_managed = false;
    std::vector<std::string> platforms;
    std::vector<std::string> org_ids;
};

/**
 * Normalized exclusion rules. A record is excluded when any rule matches;
 * records with an error are never excluded and absent fields never match.
 */
class FilterCriteria {
public:
    FilterCriteria() = default;

    /**
     * Normalize once: countries and ISO codes upper case, text values lower case
     */
    explicit FilterCriteria(const FilterOptions& options);

    bool excludes(const EnrichedRecord& record) const;

    /**
     * Whether any rule is configured
     */
    bool empty() const;

private:
    std::set<std::string> countries_;
    std::set<std::string> iso_codes_;
    std::set<std::string> cities_;
    std::set<uint32_t> asns_;
    std::vector<std::string> orgs_;  // Substrings
    bool exclude_org_managed_ = false;
    bool exclude_not_org_managed_ = false;
    std::set<std::string> platforms_;
    std::set<std::string> org_ids_;
};

/**
 * Drop excluded records, keeping the order of the rest
 */
std::vector<EnrichedRecord> filter_records(const std::vector<EnrichedRecord>& records,
                                           const FilterCriteria& criteria);

/**
 * Record fields results can be ordered by
 */
enum class SortKey {
    Address,
    Domain,
    City,
    Region,
    Country,
    IsoCode,
    Asn,
    AsnOrg,
    Platform,
    OrgId
};

/**
 * Parse a sort key name (ip, domain, city, region, country, iso_code,
 * asn, asn_org, platform, org_id)
 * @throws ValidationError for unknown names
 */
SortKey parse_sort_key(const std::string& name);

std::string sort_key_name(SortKey key);

/**
 * Stable ascending sort on a copy of the records. Records missing the
 * field go last in their original order. ASN compares numerically,
 * everything else as case-sensitive strings.
 */
std::vector<EnrichedRecord> sort_records(const std::vector<EnrichedRecord>& records, SortKey key);

} // namespace argus

#endif // ARGUS_RESULTS_H
