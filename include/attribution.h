#ifndef ARGUS_ATTRIBUTION_H
#define ARGUS_ATTRIBUTION_H

#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "progress.h"

namespace argus {

/**
 * An attribution hit: the address belongs to a tracked organization
 */
struct Attribution {
    std::optional<std::string> org_id;
    std::optional<std::string> platform;
};

/**
 * One row of an attribution dataset
 */
struct AttributionRow {
    std::string address;
    std::optional<std::string> org_id;
    std::optional<std::string> platform;
};

/**
 * A named, read-only attribution dataset. Lookups are exact matches on the
 * literal address string; no prefix or CIDR matching.
 */
class AttributionDataset {
public:
    virtual ~AttributionDataset() = default;

    /**
     * Dataset name (file stem, e.g. "aws" for aws.bin)
     */
    virtual const std::string& name() const = 0;

    /**
     * Look up an address
     * @return The attribution if the dataset holds the address
     */
    virtual std::optional<Attribution> lookup(const std::string& address) const = 0;
};

/**
 * Row+index encoding: an ordered row list plus per-field indexes mapping a
 * field value to the row positions holding it. Serialized as JSON, optionally gzip.
 *
 * When one value maps to several rows, the lowest row position wins.
 */
class IndexedDataset : public AttributionDataset {
public:
    using Index = std::unordered_map<std::string, std::vector<size_t>>;

    /**
     * Build a dataset from rows; indexes for address, org_id and platform are derived
     */
    IndexedDataset(std::string name, std::vector<AttributionRow> rows);

    /**
     * Deserialize a blob (JSON, already decompressed)
     * @throws std::runtime_error on malformed content
     */
    static std::unique_ptr<IndexedDataset> parse(std::string name, const std::string& blob);

    /**
     * Load a dataset file, gzip-compressed or not
     * @throws std::runtime_error if the file is unreadable or malformed
     */
    static std::unique_ptr<IndexedDataset> load(const std::string& path);

    /**
     * Serialize rows and indexes to a file
     * @param path Destination file
     * @param compress Write gzip instead of plain JSON
     * @throws std::runtime_error on write failure
     */
    void save(const std::string& path, bool compress) const;

    const std::string& name() const override;
    std::optional<Attribution> lookup(const std::string& address) const override;

    const std::vector<AttributionRow>& rows() const;

    /**
     * Row positions holding a value in an indexed field, ascending
     * @return Empty if the field is not indexed or the value is absent
     */
    std::vector<size_t> find(const std::string& field, const std::string& value) const;

private:
    void build_index(const std::string& field);

    std::string name_;
    std::vector<AttributionRow> rows_;
    std::map<std::string, Index> indexes_;
};

/**
 * Relational encoding: a SQLite file with a table
 * attribution(address TEXT, org_id TEXT, platform TEXT)
 */
class SqliteDataset : public AttributionDataset {
public:
    /**
     * Open a dataset read-only and verify its schema
     * @throws DatabaseError if the file cannot be opened or has no attribution table
     */
    SqliteDataset(std::string name, const std::string& path);
    ~SqliteDataset() override;

    SqliteDataset(const SqliteDataset&) = delete;
    SqliteDataset& operator=(const SqliteDataset&) = delete;

    const std::string& name() const override;

    /**
     * @throws DatabaseError if the query fails
     */
    std::optional<Attribution> lookup(const std::string& address) const override;

private:
    class Impl;
    std::string name_;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Open a dataset file, choosing the encoding by extension
 * (.db/.sqlite/.sqlite3 relational, anything else row+index)
 * @throws std::runtime_error if the file cannot be loaded
 */
std::unique_ptr<AttributionDataset> open_dataset(const std::string& path);

/**
 * All attribution datasets for one run, consulted in load order.
 * The first dataset reporting a hit wins.
 */
class AttributionStore {
public:
    /**
     * Load every dataset file in a directory, in ascending file name order.
     * A file that fails to load is reported and skipped.
     * @param directory Directory to scan
     * @param reporter Receives a warning per skipped file
     * @return true if at least one dataset loaded
     */
    bool load(const std::string& directory, Reporter& reporter);

    /**
     * Append an already opened dataset (lowest priority so far)
     */
    void add(std::unique_ptr<AttributionDataset> dataset);

    /**
     * Whether any dataset is available. When false, attribution is skipped.
     */
    bool has_data() const;

    size_t size() const;

    /**
     * Look up an address across datasets in load order
     * @return First hit, or nothing if no dataset holds the address
     */
    std::optional<Attribution> lookup(const std::string& address) const;

private:
    std::vector<std::unique_ptr<AttributionDataset>> datasets_;
};

/**
 * Check whether a file name looks like an attribution dataset
 */
bool is_dataset_file(const std::string& filename);

} // namespace argus

#endif // ARGUS_ATTRIBUTION_H
