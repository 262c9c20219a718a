#include "results.h"
#include "errors.h"
#include <algorithm>
#include <cctype>
#include <optional>

namespace argus {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return value;
}

bool matches(const std::set<std::string>& excluded, const std::optional<std::string>& value,
             std::string (*normalize)(std::string)) {
    return !excluded.empty() && value && excluded.count(normalize(*value)) > 0;
}

} // namespace

// ============================================================================
// Filtering
// ============================================================================

FilterCriteria::FilterCriteria(const FilterOptions& options)
    : asns_(options.asns.begin(), options.asns.end()),
      exclude_org_managed_(options.exclude_org_managed),
      exclude_not_org_managed_(options.exclude_not_org_managed) {
    for (const auto& country : options.countries) countries_.insert(to_upper(country));
    for (const auto& code : options.iso_codes) iso_codes_.insert(to_upper(code));
    for (const auto& city : options.cities) cities_.insert(to_lower(city));
    for (const auto& org : options.orgs) orgs_.push_back(to_lower(org));
    for (const auto& platform : options.platforms) platforms_.insert(to_lower(platform));
    for (const auto& org_id : options.org_ids) org_ids_.insert(to_lower(org_id));
}

bool FilterCriteria::excludes(const EnrichedRecord& record) const {
    if (record.has_error()) {
        return false;
    }

    if (matches(countries_, record.country, to_upper)) {
        return true;
    }
    if (matches(iso_codes_, record.iso_code, to_upper)) {
        return true;
    }
    if (matches(cities_, record.city, to_lower)) {
        return true;
    }

    if (record.asn && asns_.count(*record.asn) > 0) {
        return true;
    }
    if (!orgs_.empty() && record.asn_org) {
        std::string org = to_lower(*record.asn_org);
        for (const auto& excluded : orgs_) {
            if (org.find(excluded) != std::string::npos) {
                return true;
            }
        }
    }

    if (exclude_org_managed_ && record.org_managed) {
        return true;
    }
    if (exclude_not_org_managed_ && !record.org_managed) {
        return true;
    }

    return matches(platforms_, record.platform, to_lower) ||
           matches(org_ids_, record.org_id, to_lower);
}

bool FilterCriteria::empty() const {
    return countries_.empty() && iso_codes_.empty() && cities_.empty() && asns_.empty() && orgs_.empty() &&
           !exclude_org_managed_ && !exclude_not_org_managed_ &&
           platforms_.empty() && org_ids_.empty();
}

std::vector<EnrichedRecord> filter_records(const std::vector<EnrichedRecord>& records,
                                           const FilterCriteria& criteria) {
    std::vector<EnrichedRecord> kept;
    kept.reserve(records.size());
    for (const auto& record : records) {
        if (!criteria.excludes(record)) {
            kept.push_back(record);
        }
    }
    return kept;
}

// ============================================================================
// Sorting
// ============================================================================

namespace {

struct SortKeyName {
    SortKey key;
    const char* name;
};

const SortKeyName SORT_KEYS[] = {
    {SortKey::Address, "ip"},
    {SortKey::Domain, "domain"},
    {SortKey::City, "city"},
    {SortKey::Region, "region"},
    {SortKey::Country, "country"},
    {SortKey::IsoCode, "iso_code"},
    {SortKey::Asn, "asn"},
    {SortKey::AsnOrg, "asn_org"},
    {SortKey::Platform, "platform"},
    {SortKey::OrgId, "org_id"},
};

std::optional<std::string> text_field(const EnrichedRecord& record, SortKey key) {
    switch (key) {
        case SortKey::Address:  return record.address;
        case SortKey::Domain:   return record.domain;
        case SortKey::City:     return record.city;
        case SortKey::Region:   return record.region;
        case SortKey::Country:  return record.country;
        case SortKey::IsoCode:  return record.iso_code;
        case SortKey::AsnOrg:   return record.asn_org;
        case SortKey::Platform: return record.platform;
        case SortKey::OrgId:    return record.org_id;
        case SortKey::Asn:      break;
    }
    return std::nullopt;
}

// Absent values order after present ones
template <typename T>
bool absent_last_less(const std::optional<T>& a, const std::optional<T>& b) {
    if (!a) return false;
    if (!b) return true;
    return *a < *b;
}

} // namespace

SortKey parse_sort_key(const std::string& name) {
    for (const auto& entry : SORT_KEYS) {
        if (name == entry.name) {
            return entry.key;
        }
    }

    std::string valid;
    for (const auto& entry : SORT_KEYS) {
        if (!valid.empty()) valid += ", ";
        valid += entry.name;
    }
    throw ValidationError("Invalid sort key '" + name + "' (expected one of: " + valid + ")");
}

std::string sort_key_name(SortKey key) {
    for (const auto& entry : SORT_KEYS) {
        if (entry.key == key) {
            return entry.name;
        }
    }
    return "";
}

std::vector<EnrichedRecord> sort_records(const std::vector<EnrichedRecord>& records, SortKey key) {
    std::vector<EnrichedRecord> sorted = records;

    if (key == SortKey::Asn) {
        std::stable_sort(sorted.begin(), sorted.end(),
                         [](const EnrichedRecord& a, const EnrichedRecord& b) {
                             return absent_last_less(a.asn, b.asn);
                         });
    } else {
        std::stable_sort(sorted.begin(), sorted.end(),
                         [key](const EnrichedRecord& a, const EnrichedRecord& b) {
                             return absent_last_less(text_field(a, key), text_field(b, key));
                         });
    }

    return sorted;
}

} // namespace argus
