#include "address.h"
#include "compression.h"
#include "errors.h"
#include <set>
#include <arpa/inet.h>

namespace argus {

// RegexCache implementation
RegexCache::RegexCache() {
    ipv4_pattern = std::regex(
        R"(\b(?:(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\.){3}(?:25[0-5]|2[0-4][0-9]|[01]?[0-9][0-9]?)\b)"
    );

    cidr_pattern = std::regex(R"(^([^/]*)/([0-9]*)$)");
}

const RegexCache& get_regex_cache() {
    static RegexCache cache;
    return cache;
}

namespace {

struct Block {
    uint32_t network;
    int prefix;
};

// Ranges that are never globally routable
const Block NON_GLOBAL_BLOCKS[] = {
    {0x00000000, 8},   // 0.0.0.0/8 "this network"
    {0x0A000000, 8},   // 10.0.0.0/8 private
    {0x64400000, 10},  // 100.64.0.0/10 shared address space (CGNAT)
    {0x7F000000, 8},   // 127.0.0.0/8 loopback
    {0xA9FE0000, 16},  // 169.254.0.0/16 link-local
    {0xAC100000, 12},  // 172.16.0.0/12 private
    {0xC0000000, 24},  // 192.0.0.0/24 IETF protocol assignments
    {0xC0000200, 24},  // 192.0.2.0/24 TEST-NET-1
    {0xC0A80000, 16},  // 192.168.0.0/16 private
    {0xC6120000, 15},  // 198.18.0.0/15 benchmarking
    {0xC6336400, 24},  // 198.51.100.0/24 TEST-NET-2
    {0xCB007100, 24},  // 203.0.113.0/24 TEST-NET-3
    {0xE0000000, 4},   // 224.0.0.0/4 multicast
    {0xF0000000, 4},   // 240.0.0.0/4 reserved, includes broadcast
};

uint32_t prefix_mask(int prefix) {
    return prefix == 0 ? 0u : (0xFFFFFFFFu << (32 - prefix));
}

void parse_cidr(const std::string& block, uint32_t& address, int& prefix) {
    std::smatch match;
    if (!std::regex_match(block, match, get_regex_cache().cidr_pattern)) {
        throw ValidationError("Invalid CIDR block: " + block);
    }

    std::string address_part = match[1].str();
    std::string prefix_part = match[2].str();

    if (!parse_ipv4(address_part, address)) {
        throw ValidationError("Invalid IP address in CIDR: " + address_part);
    }
    if (prefix_part.empty() || prefix_part.size() > 2 || std::stoi(prefix_part) > 32) {
        throw ValidationError("Invalid CIDR prefix: " + prefix_part);
    }
    prefix = std::stoi(prefix_part);
}

void scan_text(const std::string& text, const RegexCache& cache, std::set<uint32_t>& found) {
    auto begin = std::sregex_iterator(text.begin(), text.end(), cache.ipv4_pattern);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        uint32_t value;
        if (parse_ipv4(it->str(), value) && is_global_ip(value)) {
            found.insert(value);
        }
    }
}

std::vector<std::string> to_strings(const std::set<uint32_t>& values) {
    std::vector<std::string> result;
    result.reserve(values.size());
    for (uint32_t value : values) {
        result.push_back(format_ipv4(value));
    }
    return result;
}

} // namespace

bool parse_ipv4(const std::string& text, uint32_t& value) {
    struct in_addr addr;
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) {
        return false;
    }
    value = ntohl(addr.s_addr);
    return true;
}

std::string format_ipv4(uint32_t value) {
    return std::to_string((value >> 24) & 0xFF) + "." +
           std::to_string((value >> 16) & 0xFF) + "." +
           std::to_string((value >> 8) & 0xFF) + "." +
           std::to_string(value & 0xFF);
}

bool is_ipv4(const std::string& ip) {
    uint32_t value;
    return parse_ipv4(ip, value);
}

bool is_global_ip(uint32_t value) {
    for (const auto& block : NON_GLOBAL_BLOCKS) {
        if ((value & prefix_mask(block.prefix)) == block.network) {
            return false;
        }
    }
    return true;
}

bool is_global_ip(const std::string& ip) {
    uint32_t value;
    return parse_ipv4(ip, value) && is_global_ip(value);
}

bool is_cidr(const std::string& arg) {
    return arg.find('/') != std::string::npos;
}

std::string validate_address(const std::string& ip) {
    if (ip.empty()) {
        throw ValidationError("IP address cannot be empty");
    }
    if (!is_ipv4(ip)) {
        throw ValidationError("Invalid IP address: " + ip);
    }
    return ip;
}

void validate_target(const std::string& target) {
    if (is_cidr(target)) {
        uint32_t address;
        int prefix;
        parse_cidr(target, address, prefix);
    } else {
        validate_address(target);
    }
}

uint64_t cidr_host_count(int prefix_length) {
    uint64_t total = uint64_t(1) << (32 - prefix_length);
    return prefix_length >= 31 ? total : total - 2;
}

std::vector<std::string> expand_cidr(const std::string& block) {
    uint32_t address;
    int prefix;
    parse_cidr(block, address, prefix);

    uint64_t hosts = cidr_host_count(prefix);
    if (hosts > MAX_CIDR_HOSTS) {
        throw ValidationError("CIDR block " + block + " contains " + std::to_string(hosts) +
                              " host addresses, exceeding the limit of " +
                              std::to_string(MAX_CIDR_HOSTS));
    }

    uint32_t mask = prefix_mask(prefix);
    uint64_t first = address & mask;
    uint64_t last = first | (~mask & 0xFFFFFFFFu);
    if (prefix < 31) {
        first += 1;
        last -= 1;
    }

    std::vector<std::string> result;
    result.reserve(static_cast<size_t>(hosts));
    for (uint64_t value = first; value <= last; ++value) {
        if (is_global_ip(static_cast<uint32_t>(value))) {
            result.push_back(format_ipv4(static_cast<uint32_t>(value)));
        }
    }
    return result;
}

std::vector<std::string> extract_ip_addresses(const std::string& text, const RegexCache& cache) {
    std::set<uint32_t> found;
    scan_text(text, cache, found);
    return to_strings(found);
}

std::vector<std::string> extract_ip_addresses_from_file(const std::string& filename, const RegexCache& cache) {
    auto reader = create_reader(filename);

    std::set<uint32_t> found;
    std::string line;
    while (reader->getline(line)) {
        scan_text(line, cache, found);
    }
    return to_strings(found);
}

std::vector<std::string> collect_addresses(const std::string& target,
                                           const std::vector<std::string>& files,
                                           const RegexCache& cache,
                                           Reporter& reporter) {
    std::vector<std::string> addresses;
    std::set<std::string> seen;

    auto add = [&](const std::string& ip) {
        if (seen.insert(ip).second) {
            addresses.push_back(ip);
        }
    };

    if (!target.empty()) {
        if (is_cidr(target)) {
            auto hosts = expand_cidr(target);
            reporter.info("Expanded CIDR block " + target + " into " +
                          std::to_string(hosts.size()) + " IP(s)");
            for (const auto& ip : hosts) {
                add(ip);
            }
        } else {
            add(validate_address(target));
        }
    }

    for (const auto& file : files) {
        for (const auto& ip : extract_ip_addresses_from_file(file, cache)) {
            add(ip);
        }
    }

    return addresses;
}

} // namespace argus
