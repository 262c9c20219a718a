#ifndef ARGUS_REGEX_CACHE_H
#define ARGUS_REGEX_CACHE_H

#include <regex>

namespace argus {

/**
 * Pre-compiled regex patterns shared by all address extraction calls.
 * Compiling once avoids paying the std::regex construction cost per line.
 */
struct RegexCache {
    // Address-shaped substrings inside free text (octets 0-255, word bounded)
    std::regex ipv4_pattern;

    // Address/prefix notation, anchored, with capture groups for both halves
    std::regex cidr_pattern;

    RegexCache();
};

/**
 * Get the process-wide regex cache (initialised on first use, thread-safe)
 */
const RegexCache& get_regex_cache();

} // namespace argus

#endif // ARGUS_REGEX_CACHE_H
