#ifndef ARGUS_ADDRESS_H
#define ARGUS_ADDRESS_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "progress.h"
#include "regex_cache.h"

namespace argus {

/**
 * Largest number of host addresses a single CIDR argument may expand to
 */
constexpr size_t MAX_CIDR_HOSTS = 1024;

/**
 * Parse a dotted-quad IPv4 address
 * @param text Candidate address
 * @param value Output, address in host byte order
 * @return true if text is a well-formed IPv4 address
 */
bool parse_ipv4(const std::string& text, uint32_t& value);

/**
 * Format a host byte order IPv4 address as dotted-quad
 */
std::string format_ipv4(uint32_t value);

/**
 * Check if a string is a well-formed IPv4 address
 */
bool is_ipv4(const std::string& ip);

/**
 * Check whether an address is globally routable.
 * Private, loopback, link-local, shared (CGNAT), documentation, benchmarking,
 * multicast and reserved ranges are not.
 * @param value Address in host byte order
 */
bool is_global_ip(uint32_t value);

/**
 * String overload; malformed input is never global
 */
bool is_global_ip(const std::string& ip);

/**
 * Check if an argument uses address/prefix notation
 */
bool is_cidr(const std::string& arg);

/**
 * Validate a single address argument
 * @param ip Address to validate
 * @return The address, unchanged
 * @throws ValidationError if the address is malformed
 */
std::string validate_address(const std::string& ip);

/**
 * Validate a single address or CIDR argument without expanding it
 * @throws ValidationError naming the bad part (address or prefix)
 */
void validate_target(const std::string& target);

/**
 * Count host addresses in a block: network and broadcast are excluded
 * unless the prefix is /31 or /32.
 */
uint64_t cidr_host_count(int prefix_length);

/**
 * Expand a CIDR block into its globally routable host addresses, ascending.
 * Host bits set in the address part are masked off (8.8.8.5/24 == 8.8.8.0/24).
 * @param block CIDR block, e.g. "8.8.8.0/24"
 * @return Host addresses in ascending order
 * @throws ValidationError on malformed blocks or more than MAX_CIDR_HOSTS hosts
 */
std::vector<std::string> expand_cidr(const std::string& block);

/**
 * Extract globally routable IPv4 addresses from arbitrary text
 * @param text Text to scan
 * @param cache Pre-compiled regex patterns
 * @return Unique addresses, ascending numerically
 */
std::vector<std::string> extract_ip_addresses(const std::string& text, const RegexCache& cache);

/**
 * Extract addresses from a file (plain, .gz, .bz2 or .xz)
 * @return Unique addresses, ascending numerically
 * @throws std::runtime_error if the file cannot be opened or decompressed
 */
std::vector<std::string> extract_ip_addresses_from_file(const std::string& filename, const RegexCache& cache);

/**
 * Build the candidate address list for one run
 * @param target Single address, CIDR block, or empty
 * @param files Input files to extract addresses from
 * @param cache Pre-compiled regex patterns
 * @param reporter Told how many addresses a CIDR target expanded to
 * @return Deduplicated addresses: the target (or its expansion) first, then file addresses
 * @throws ValidationError on a malformed or oversize target
 */
std::vector<std::string> collect_addresses(const std::string& target,
                                           const std::vector<std::string>& files,
                                           const RegexCache& cache,
                                           Reporter& reporter);

} // namespace argus

#endif // ARGUS_ADDRESS_H
