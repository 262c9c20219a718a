#include "attribution.h"
#include "compression.h"
#include "errors.h"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <algorithm>
#include <fstream>
#include <glob.h>
#include <sys/stat.h>

namespace argus {

namespace {

const char* const ADDRESS_FIELD = "address";
const char* const ORG_ID_FIELD = "org_id";
const char* const PLATFORM_FIELD = "platform";

// Older dataset generations used different column names
std::string canonical_field(const std::string& field) {
    if (field == "ip") return ADDRESS_FIELD;
    if (field == "cfa_id") return ORG_ID_FIELD;
    return field;
}

std::optional<std::string> field_text(const nlohmann::json& row,
                                      std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = row.find(key);
        if (it == row.end() || it->is_null()) {
            continue;
        }
        if (it->is_string()) {
            return it->get<std::string>();
        }
        return it->dump();  // numeric ids
    }
    return std::nullopt;
}

const std::optional<std::string>* row_field(const AttributionRow& row, const std::string& field) {
    if (field == ORG_ID_FIELD) return &row.org_id;
    if (field == PLATFORM_FIELD) return &row.platform;
    return nullptr;
}

std::string dataset_name(const std::string& path) {
    size_t slash = path.find_last_of('/');
    std::string base = (slash == std::string::npos) ? path : path.substr(slash + 1);
    size_t dot = base.find('.');
    return dot == std::string::npos ? base : base.substr(0, dot);
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool is_relational_file(const std::string& path) {
    return ends_with(path, ".db") || ends_with(path, ".sqlite") || ends_with(path, ".sqlite3");
}

bool is_regular_file(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

bool is_dataset_file(const std::string& filename) {
    static const char* const extensions[] = {
        ".bin", ".bin.gz", ".json", ".json.gz", ".db", ".sqlite", ".sqlite3"
    };
    for (const char* ext : extensions) {
        if (ends_with(filename, ext)) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// IndexedDataset
// ============================================================================

IndexedDataset::IndexedDataset(std::string name, std::vector<AttributionRow> rows)
    : name_(std::move(name)), rows_(std::move(rows)) {
    build_index(ADDRESS_FIELD);
    build_index(ORG_ID_FIELD);
    build_index(PLATFORM_FIELD);
}

void IndexedDataset::build_index(const std::string& field) {
    Index& index = indexes_[field];
    index.clear();

    for (size_t i = 0; i < rows_.size(); ++i) {
        if (field == ADDRESS_FIELD) {
            if (!rows_[i].address.empty()) {
                index[rows_[i].address].push_back(i);
            }
        } else if (const auto* value = row_field(rows_[i], field)) {
            if (*value) {
                index[**value].push_back(i);
            }
        }
    }
}

std::unique_ptr<IndexedDataset> IndexedDataset::parse(std::string name, const std::string& blob) {
    std::vector<AttributionRow> rows;
    std::map<std::string, Index> indexes;

    try {
        nlohmann::json doc = nlohmann::json::parse(blob);

        if (!doc.is_object() || !doc.contains("rows") || !doc["rows"].is_array()) {
            throw DatabaseError("dataset has no rows array");
        }

        for (const auto& item : doc["rows"]) {
            if (!item.is_object()) {
                throw DatabaseError("dataset row is not an object");
            }
            AttributionRow row;
            row.address = field_text(item, {"address", "ip"}).value_or("");
            row.org_id = field_text(item, {"org_id", "cfa_id"});
            row.platform = field_text(item, {"platform"});
            rows.push_back(std::move(row));
        }

        if (doc.contains("indexes") && doc["indexes"].is_object()) {
            for (const auto& [field, values] : doc["indexes"].items()) {
                if (!values.is_object()) {
                    continue;
                }

                Index& index = indexes[canonical_field(field)];
                for (const auto& [value, positions] : values.items()) {
                    std::vector<size_t> valid;
                    auto accept = [&](const nlohmann::json& position) {
                        if (position.is_number_unsigned() ||
                            (position.is_number_integer() && position.get<long long>() >= 0)) {
                            size_t p = position.get<size_t>();
                            if (p < rows.size()) {
                                valid.push_back(p);
                            }
                        }
                    };

                    if (positions.is_array()) {
                        for (const auto& position : positions) {
                            accept(position);
                        }
                    } else {
                        accept(positions);
                    }

                    if (!valid.empty()) {
                        std::sort(valid.begin(), valid.end());
                        valid.erase(std::unique(valid.begin(), valid.end()), valid.end());
                        index[value] = std::move(valid);
                    }
                }
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw DatabaseError(std::string("malformed dataset: ") + e.what());
    }

    // Indexes stored in the blob take precedence over the derived ones
    auto dataset = std::make_unique<IndexedDataset>(std::move(name), std::move(rows));
    for (auto& entry : indexes) {
        dataset->indexes_[entry.first] = std::move(entry.second);
    }
    return dataset;
}

std::unique_ptr<IndexedDataset> IndexedDataset::load(const std::string& path) {
    // Compressed first, plain blob if the data is not gzip
    std::string blob = gunzip_or_passthrough(read_file(path));
    return parse(dataset_name(path), blob);
}

void IndexedDataset::save(const std::string& path, bool compress) const {
    nlohmann::json doc;

    doc["rows"] = nlohmann::json::array();
    for (const auto& row : rows_) {
        nlohmann::json item;
        item[ADDRESS_FIELD] = row.address;
        item[ORG_ID_FIELD] = row.org_id ? nlohmann::json(*row.org_id) : nlohmann::json(nullptr);
        item[PLATFORM_FIELD] = row.platform ? nlohmann::json(*row.platform) : nlohmann::json(nullptr);
        doc["rows"].push_back(item);
    }

    doc["indexes"] = nlohmann::json::object();
    for (const auto& [field, index] : indexes_) {
        nlohmann::json values = nlohmann::json::object();
        for (const auto& [value, positions] : index) {
            values[value] = positions.size() == 1 ? nlohmann::json(positions.front())
                                                  : nlohmann::json(positions);
        }
        doc["indexes"][field] = values;
    }

    std::string data = doc.dump();
    if (compress) {
        data = gzip(data);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw std::runtime_error("Failed to open dataset for writing: " + path);
    }
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write dataset: " + path);
    }
}

const std::string& IndexedDataset::name() const {
    return name_;
}

std::optional<Attribution> IndexedDataset::lookup(const std::string& address) const {
    auto positions = find(ADDRESS_FIELD, address);
    if (positions.empty()) {
        return std::nullopt;
    }

    const AttributionRow& row = rows_[positions.front()];
    return Attribution{row.org_id, row.platform};
}

const std::vector<AttributionRow>& IndexedDataset::rows() const {
    return rows_;
}

std::vector<size_t> IndexedDataset::find(const std::string& field, const std::string& value) const {
    auto index = indexes_.find(canonical_field(field));
    if (index == indexes_.end()) {
        return {};
    }
    auto hit = index->second.find(value);
    if (hit == index->second.end()) {
        return {};
    }
    return hit->second;
}

// ============================================================================
// SqliteDataset
// ============================================================================

namespace {

const char* const LOOKUP_SQL =
    "SELECT org_id, platform FROM attribution WHERE address = ?1 ORDER BY rowid LIMIT 1";

// Finalizes the statement on every exit path
struct Statement {
    sqlite3_stmt* stmt = nullptr;
    ~Statement() { sqlite3_finalize(stmt); }
};

std::optional<std::string> column_text(sqlite3_stmt* stmt, int idx) {
    if (sqlite3_column_type(stmt, idx) == SQLITE_NULL) {
        return std::nullopt;
    }
    const unsigned char* text = sqlite3_column_text(stmt, idx);
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt, idx)));
}

} // namespace

class SqliteDataset::Impl {
public:
    sqlite3* db;

    explicit Impl(const std::string& path) : db(nullptr) {
        if (!is_regular_file(path)) {
            throw DatabaseError("No such dataset file: " + path);
        }
        if (sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READONLY, nullptr) != SQLITE_OK) {
            std::string message = db ? sqlite3_errmsg(db) : "out of memory";
            sqlite3_close(db);
            throw DatabaseError("Failed to open " + path + ": " + message);
        }

        // Preparing once checks both the file format and the schema
        Statement check;
        if (sqlite3_prepare_v2(db, LOOKUP_SQL, -1, &check.stmt, nullptr) != SQLITE_OK) {
            std::string message = sqlite3_errmsg(db);
            sqlite3_close(db);
            throw DatabaseError("Invalid attribution database " + path + ": " + message);
        }
    }

    ~Impl() {
        sqlite3_close(db);
    }
};

SqliteDataset::SqliteDataset(std::string name, const std::string& path)
    : name_(std::move(name)), pImpl(std::make_unique<Impl>(path)) {}

SqliteDataset::~SqliteDataset() = default;

const std::string& SqliteDataset::name() const {
    return name_;
}

std::optional<Attribution> SqliteDataset::lookup(const std::string& address) const {
    Statement query;
    if (sqlite3_prepare_v2(pImpl->db, LOOKUP_SQL, -1, &query.stmt, nullptr) != SQLITE_OK) {
        throw DatabaseError(std::string("Attribution query failed: ") + sqlite3_errmsg(pImpl->db));
    }
    sqlite3_bind_text(query.stmt, 1, address.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(query.stmt);
    if (rc == SQLITE_DONE) {
        return std::nullopt;
    }
    if (rc != SQLITE_ROW) {
        throw DatabaseError(std::string("Attribution query failed: ") + sqlite3_errmsg(pImpl->db));
    }

    return Attribution{column_text(query.stmt, 0), column_text(query.stmt, 1)};
}

// ============================================================================
// AttributionStore
// ============================================================================

std::unique_ptr<AttributionDataset> open_dataset(const std::string& path) {
    if (is_relational_file(path)) {
        return std::make_unique<SqliteDataset>(dataset_name(path), path);
    }
    return IndexedDataset::load(path);
}

bool AttributionStore::load(const std::string& directory, Reporter& reporter) {
    std::string pattern = directory + "/*";

    glob_t glob_result;
    int rc = glob(pattern.c_str(), 0, nullptr, &glob_result);
    if (rc != 0) {
        if (rc != GLOB_NOMATCH) {
            reporter.warning("Cannot read attribution directory: " + directory);
        }
        globfree(&glob_result);
        return false;
    }

    // glob() returns paths sorted, which fixes the load order
    std::vector<std::string> paths;
    for (size_t i = 0; i < glob_result.gl_pathc; ++i) {
        paths.push_back(glob_result.gl_pathv[i]);
    }
    globfree(&glob_result);

    size_t loaded = 0;
    for (const auto& path : paths) {
        if (!is_dataset_file(path) || !is_regular_file(path)) {
            continue;
        }

        try {
            add(open_dataset(path));
            loaded++;
        } catch (const std::exception& e) {
            reporter.warning("Skipping attribution dataset " + path + ": " + e.what());
        }
    }

    if (loaded > 0) {
        reporter.info("Loaded " + std::to_string(loaded) + " attribution dataset(s)");
    }
    return loaded > 0;
}

void AttributionStore::add(std::unique_ptr<AttributionDataset> dataset) {
    datasets_.push_back(std::move(dataset));
}

bool AttributionStore::has_data() const {
    return !datasets_.empty();
}

size_t AttributionStore::size() const {
    return datasets_.size();
}

std::optional<Attribution> AttributionStore::lookup(const std::string& address) const {
    for (const auto& dataset : datasets_) {
        if (auto hit = dataset->lookup(address)) {
            return hit;
        }
    }
    return std::nullopt;
}

} // namespace argus
