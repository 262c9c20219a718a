#ifndef ARGUS_ERRORS_H
#define ARGUS_ERRORS_H

#include <stdexcept>
#include <string>

namespace argus {

/**
 * Raised for malformed caller input: addresses, CIDR blocks, sort keys,
 * filter values. The message always names the offending value.
 */
class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Raised when a source database or attribution dataset cannot be opened or read
 */
class DatabaseError : public std::runtime_error {
public:
    explicit DatabaseError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * Raised by source readers when the address has no entry in the database
 */
class AddressNotFoundError : public std::runtime_error {
public:
    explicit AddressNotFoundError(const std::string& address)
        : std::runtime_error("Address not found: " + address) {}
};

/**
 * Raised by source readers when the address cannot be parsed
 */
class InvalidAddressError : public std::runtime_error {
public:
    explicit InvalidAddressError(const std::string& address)
        : std::runtime_error("Invalid address: " + address) {}
};

} // namespace argus

#endif // ARGUS_ERRORS_H
