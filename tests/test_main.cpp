#include <iostream>
#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>
#include <map>
#include <set>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <algorithm>
#include <functional>
#include <system_error>
#include <chrono>
#include <future>
#include <thread>
#include <unistd.h>
#include <sys/stat.h>
#include <bzlib.h>
#include <lzma.h>
#include <sqlite3.h>
#include <nlohmann/json.hpp>
#include "argus.h"
#include "address.h"
#include "attribution.h"
#include "compression.h"
#include "config.h"
#include "enrichment.h"
#include "errors.h"
#include "progress.h"
#include "results.h"
#include "sources.h"

// ============================================================================
// Fixtures
// ============================================================================

static std::string scratch_dir;

static std::string scratch_path(const std::string& name) {
    return scratch_dir + "/" + name;
}

static void write_file(const std::string& path, const std::string& data) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(data.data(), static_cast<std::streamsize>(data.size()));
    assert(out.good());
}

static std::string bzip2_compress(const std::string& data) {
    unsigned int size = static_cast<unsigned int>(data.size() + data.size() / 100 + 600);
    std::string out(size, '\0');
    int rc = BZ2_bzBuffToBuffCompress(&out[0], &size, const_cast<char*>(data.data()),
                                      static_cast<unsigned int>(data.size()), 9, 0, 0);
    assert(rc == BZ_OK);
    out.resize(size);
    return out;
}

static std::string xz_compress(const std::string& data) {
    std::string out(lzma_stream_buffer_bound(data.size()), '\0');
    size_t pos = 0;
    lzma_ret rc = lzma_easy_buffer_encode(6, LZMA_CHECK_CRC64, nullptr,
                                          reinterpret_cast<const uint8_t*>(data.data()), data.size(),
                                          reinterpret_cast<uint8_t*>(&out[0]), &pos, out.size());
    assert(rc == LZMA_OK);
    out.resize(pos);
    return out;
}

static void write_sqlite_dataset(const std::string& path, const std::string& sql) {
    sqlite3* db = nullptr;
    int rc = sqlite3_open(path.c_str(), &db);
    assert(rc == SQLITE_OK);
    rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, nullptr);
    assert(rc == SQLITE_OK);
    sqlite3_close(db);
}

// Collects events so tests can check what was reported
class RecordingReporter : public argus::Reporter {
public:
    std::vector<std::string> infos;
    std::vector<std::string> warnings;
    size_t progress_calls = 0;
    size_t last_done = 0;
    bool finished = false;

    void info(const std::string& message) override { infos.push_back(message); }
    void warning(const std::string& message) override { warnings.push_back(message); }
    void progress(size_t done, size_t, const std::string&) override {
        progress_calls++;
        last_done = done;
    }
    void finish() override { finished = true; }
};

class FakeGeoReader : public argus::GeoReader {
public:
    std::map<std::string, argus::GeoFacts> entries;
    std::set<std::string> broken;  // Raise a generic failure

    argus::GeoFacts city(const std::string& address) override {
        if (!argus::is_ipv4(address)) throw argus::InvalidAddressError(address);
        if (broken.count(address)) throw std::runtime_error("database read failed");
        auto it = entries.find(address);
        if (it == entries.end()) throw argus::AddressNotFoundError(address);
        return it->second;
    }
};

class FakeAsnReader : public argus::AsnReader {
public:
    std::map<std::string, argus::AsnFacts> entries;

    argus::AsnFacts asn(const std::string& address) override {
        auto it = entries.find(address);
        return it == entries.end() ? argus::AsnFacts() : it->second;
    }
};

class FakeProxyReader : public argus::ProxyReader {
public:
    std::map<std::string, argus::ProxyRecord> entries;
    bool fail = false;

    argus::ProxyRecord get_all(const std::string& address) override {
        if (fail) throw std::runtime_error("proxy database unavailable");
        auto it = entries.find(address);
        return it == entries.end() ? argus::ProxyRecord() : it->second;
    }
};

static argus::GeoFacts geo_facts(const std::string& city, const std::string& country,
                                 const std::string& iso) {
    argus::GeoFacts facts;
    facts.city = city;
    facts.country = country;
    facts.iso_code = iso;
    return facts;
}

static argus::AsnFacts asn_facts(uint32_t number, const std::string& org) {
    argus::AsnFacts facts;
    facts.number = number;
    facts.organization = org;
    return facts;
}

static argus::EnrichedRecord make_record(const std::string& address) {
    argus::EnrichedRecord record;
    record.address = address;
    return record;
}

// ============================================================================
// Address input
// ============================================================================

void test_validate_address() {
    std::cout << "Testing address validation...\n";

    assert(argus::validate_address("8.8.8.8") == "8.8.8.8");

    bool caught = false;
    try {
        argus::validate_address("999.1.1.1");
    } catch (const argus::ValidationError& e) {
        caught = std::string(e.what()).find("999.1.1.1") != std::string::npos;
    }
    assert(caught);

    caught = false;
    try {
        argus::validate_target("8.8.8.0/33");
    } catch (const argus::ValidationError&) {
        caught = true;
    }
    assert(caught);

    caught = false;
    try {
        argus::validate_target("8.8.8/24");
    } catch (const argus::ValidationError&) {
        caught = true;
    }
    assert(caught);

    // A single private address is passed through as given
    const auto& cache = argus::get_regex_cache();
    argus::NullReporter silent;
    auto addresses = argus::collect_addresses("10.0.0.1", {}, cache, silent);
    assert(addresses.size() == 1);
    assert(addresses[0] == "10.0.0.1");

    std::cout << "  ✓ All address validation tests passed\n";
}

void test_expand_cidr() {
    std::cout << "Testing CIDR expansion...\n";

    auto hosts = argus::expand_cidr("8.8.8.0/24");
    assert(hosts.size() == 254);
    assert(hosts.front() == "8.8.8.1");
    assert(hosts.back() == "8.8.8.254");

    // Host bits are masked off
    assert(argus::expand_cidr("8.8.8.77/24") == hosts);

    hosts = argus::expand_cidr("8.8.8.8/32");
    assert(hosts.size() == 1);
    assert(hosts[0] == "8.8.8.8");

    hosts = argus::expand_cidr("8.8.8.8/31");
    assert(hosts.size() == 2);
    assert(hosts[0] == "8.8.8.8");
    assert(hosts[1] == "8.8.8.9");

    // /22 holds 1022 hosts, inside the limit
    assert(argus::expand_cidr("1.1.0.0/22").size() == 1022);

    bool caught = false;
    try {
        argus::expand_cidr("8.8.0.0/21");
    } catch (const argus::ValidationError& e) {
        std::string message = e.what();
        caught = message.find("1024") != std::string::npos &&
                 message.find("8.8.0.0/21") != std::string::npos;
    }
    assert(caught);

    // Private blocks expand to nothing
    assert(argus::expand_cidr("10.0.0.0/30").empty());
    assert(argus::expand_cidr("192.168.1.0/24").empty());

    assert(argus::cidr_host_count(24) == 254);
    assert(argus::cidr_host_count(31) == 2);
    assert(argus::cidr_host_count(32) == 1);

    std::cout << "  ✓ All CIDR expansion tests passed\n";
}

void test_global_addresses() {
    std::cout << "Testing global address detection...\n";

    assert(argus::is_global_ip("8.8.8.8"));
    assert(argus::is_global_ip("100.1.1.1"));
    assert(!argus::is_global_ip("10.1.2.3"));
    assert(!argus::is_global_ip("172.16.0.1"));
    assert(!argus::is_global_ip("192.168.0.1"));
    assert(!argus::is_global_ip("127.0.0.1"));
    assert(!argus::is_global_ip("169.254.1.1"));
    assert(!argus::is_global_ip("100.64.0.1"));
    assert(!argus::is_global_ip("224.0.0.1"));
    assert(!argus::is_global_ip("255.255.255.255"));
    assert(!argus::is_global_ip("0.0.0.0"));
    assert(!argus::is_global_ip("not an address"));

    std::cout << "  ✓ All global address tests passed\n";
}

void test_extract_addresses() {
    std::cout << "Testing address extraction from text...\n";

    const auto& cache = argus::get_regex_cache();

    auto ips = argus::extract_ip_addresses(
        "9.9.9.9 then 8.8.8.8 and 100.1.1.1, again 8.8.8.8", cache);
    assert(ips.size() == 3);
    assert(ips[0] == "8.8.8.8");
    assert(ips[1] == "9.9.9.9");
    assert(ips[2] == "100.1.1.1");

    ips = argus::extract_ip_addresses("internal 10.0.0.1 and 192.168.1.10 only", cache);
    assert(ips.empty());

    ips = argus::extract_ip_addresses("Invalid: 256.1.1.1 and 1.2.3.999", cache);
    assert(ips.empty());

    ips = argus::extract_ip_addresses("No IP addresses here", cache);
    assert(ips.empty());

    std::cout << "  ✓ All extraction tests passed\n";
}

void test_collect_addresses() {
    std::cout << "Testing candidate collection...\n";

    const auto& cache = argus::get_regex_cache();

    std::string path = scratch_path("hosts.log.gz");
    write_file(path, argus::gzip("seen 1.1.1.1\nseen 8.8.8.8\nlocal 10.0.0.5\n"));

    RecordingReporter reporter;
    auto addresses = argus::collect_addresses("8.8.8.8", {path}, cache, reporter);
    assert(addresses.size() == 2);
    assert(addresses[0] == "8.8.8.8");
    assert(addresses[1] == "1.1.1.1");

    assert(reporter.infos.empty());

    addresses = argus::collect_addresses("8.8.8.8/31", {path}, cache, reporter);
    assert(addresses.size() == 3);
    assert(reporter.infos.size() == 1);
    assert(reporter.infos[0] == "Expanded CIDR block 8.8.8.8/31 into 2 IP(s)");
    assert(addresses[0] == "8.8.8.8");
    assert(addresses[1] == "8.8.8.9");
    assert(addresses[2] == "1.1.1.1");

    bool caught = false;
    try {
        argus::collect_addresses("", {scratch_path("missing.log")}, cache, reporter);
    } catch (const std::runtime_error&) {
        caught = true;
    }
    assert(caught);

    std::cout << "  ✓ All candidate collection tests passed\n";
}

// ============================================================================
// Compression
// ============================================================================

void test_detect_compression() {
    std::cout << "Testing compression detection...\n";

    assert(argus::detect_compression("test.log") == argus::CompressionType::NONE);
    assert(!argus::is_compressed("test.log"));
    assert(argus::detect_compression("test.log.gz") == argus::CompressionType::GZIP);
    assert(argus::detect_compression("test.GZ") == argus::CompressionType::GZIP);
    assert(argus::detect_compression("test.log.bz2") == argus::CompressionType::BZIP2);
    assert(argus::detect_compression("test.log.xz") == argus::CompressionType::XZ);
    assert(argus::is_compressed("test.XZ"));

    std::cout << "  ✓ All compression detection tests passed\n";
}

void test_compressed_readers() {
    std::cout << "Testing compressed line readers...\n";

    const auto& cache = argus::get_regex_cache();
    std::string content = "first 8.8.8.8\r\nsecond 1.1.1.1\nthird 9.9.9.9 and 8.8.4.4";

    write_file(scratch_path("input.log"), content);
    write_file(scratch_path("input.log.gz"), argus::gzip(content));
    write_file(scratch_path("input.log.bz2"), bzip2_compress(content));
    write_file(scratch_path("input.log.xz"), xz_compress(content));

    auto reference = argus::extract_ip_addresses_from_file(scratch_path("input.log"), cache);
    assert(reference.size() == 4);
    assert(reference[0] == "1.1.1.1");

    assert(argus::extract_ip_addresses_from_file(scratch_path("input.log.gz"), cache) == reference);
    assert(argus::extract_ip_addresses_from_file(scratch_path("input.log.bz2"), cache) == reference);
    assert(argus::extract_ip_addresses_from_file(scratch_path("input.log.xz"), cache) == reference);

    // Lines come back without their terminators
    auto reader = argus::create_reader(scratch_path("input.log.bz2"));
    std::string line;
    assert(reader->getline(line));
    assert(line == "first 8.8.8.8");
    assert(reader->getline(line));
    assert(line == "second 1.1.1.1");
    assert(reader->getline(line));
    assert(line == "third 9.9.9.9 and 8.8.4.4");
    assert(!reader->getline(line));

    assert(argus::gunzip(argus::gzip(content)) == content);
    assert(argus::gunzip_or_passthrough("plain text") == "plain text");

    bool caught = false;
    try {
        argus::create_reader(scratch_path("nonexistent.log.xz"));
    } catch (const std::runtime_error&) {
        caught = true;
    }
    assert(caught);

    std::cout << "  ✓ All compressed reader tests passed\n";
}

// ============================================================================
// Attribution
// ============================================================================

void test_indexed_dataset() {
    std::cout << "Testing row+index datasets...\n";

    std::vector<argus::AttributionRow> rows = {
        {"52.1.1.1", std::string("acme"), std::string("aws")},
        {"34.1.1.1", std::string("globex"), std::nullopt},
        {"52.1.1.1", std::string("shadow"), std::string("gcp")},
    };
    argus::IndexedDataset dataset("cloud", rows);

    auto hit = dataset.lookup("52.1.1.1");
    assert(hit);
    assert(hit->org_id == std::string("acme"));  // Lowest row wins
    assert(hit->platform == std::string("aws"));

    hit = dataset.lookup("34.1.1.1");
    assert(hit);
    assert(!hit->platform);

    assert(!dataset.lookup("52.1.1.2"));
    assert(!dataset.lookup("52.1.1"));  // Exact match only
    assert(dataset.find("platform", "aws").size() == 1);
    assert(dataset.find("address", "52.1.1.1").size() == 2);

    // Plain and compressed encodings answer identically
    dataset.save(scratch_path("cloud.json"), false);
    dataset.save(scratch_path("cloud.json.gz"), true);
    auto plain = argus::IndexedDataset::load(scratch_path("cloud.json"));
    auto packed = argus::IndexedDataset::load(scratch_path("cloud.json.gz"));
    assert(plain->name() == "cloud");
    assert(packed->rows().size() == 3);
    for (const auto& address : {"52.1.1.1", "34.1.1.1", "8.8.8.8"}) {
        auto a = plain->lookup(address);
        auto b = packed->lookup(address);
        assert(a.has_value() == b.has_value());
        if (a) {
            assert(a->org_id == b->org_id);
            assert(a->platform == b->platform);
        }
    }

    // Older generations: ip/cfa_id naming, single or list positions
    auto legacy = argus::IndexedDataset::parse("legacy",
        R"({"rows": [{"ip": "3.3.3.3", "cfa_id": "old", "platform": "azure"},
                     {"ip": "4.4.4.4", "cfa_id": "first", "platform": null},
                     {"ip": "4.4.4.4", "cfa_id": "second", "platform": null}],
            "indexes": {"ip": {"3.3.3.3": 0, "4.4.4.4": [2, 1]}}})");
    hit = legacy->lookup("3.3.3.3");
    assert(hit && hit->org_id == std::string("old") && hit->platform == std::string("azure"));
    hit = legacy->lookup("4.4.4.4");
    assert(hit && hit->org_id == std::string("first"));
    assert(legacy->find("address", "4.4.4.4") == (std::vector<size_t>{1, 2}));
    assert(legacy->find("platform", "azure") == (std::vector<size_t>{0}));  // Derived from rows

    // Without indexes the address index is rebuilt from rows
    auto bare = argus::IndexedDataset::parse("bare",
        R"({"rows": [{"address": "5.5.5.5", "org_id": 42, "platform": "oci"}]})");
    hit = bare->lookup("5.5.5.5");
    assert(hit && hit->org_id == std::string("42"));

    bool caught = false;
    try {
        argus::IndexedDataset::parse("broken", "{\"rows\": 7}");
    } catch (const argus::DatabaseError&) {
        caught = true;
    }
    assert(caught);

    std::cout << "  ✓ All row+index dataset tests passed\n";
}

void test_sqlite_dataset() {
    std::cout << "Testing relational datasets...\n";

    std::string path = scratch_path("relational.db");
    write_sqlite_dataset(path,
        "CREATE TABLE attribution (address TEXT, org_id TEXT, platform TEXT);"
        "INSERT INTO attribution VALUES ('20.1.1.1', 'contoso', 'azure');"
        "INSERT INTO attribution VALUES ('20.1.1.1', 'later', 'gcp');"
        "INSERT INTO attribution VALUES ('20.2.2.2', 'fabrikam', NULL);");

    argus::SqliteDataset dataset("relational", path);
    auto hit = dataset.lookup("20.1.1.1");
    assert(hit);
    assert(hit->org_id == std::string("contoso"));  // Lowest rowid wins
    assert(hit->platform == std::string("azure"));

    hit = dataset.lookup("20.2.2.2");
    assert(hit && !hit->platform);
    assert(!dataset.lookup("20.3.3.3"));

    // Wrong schema is rejected when opening
    std::string wrong = scratch_path("wrong.sqlite");
    write_sqlite_dataset(wrong, "CREATE TABLE other (x TEXT);");
    bool caught = false;
    try {
        argus::SqliteDataset bad("wrong", wrong);
    } catch (const argus::DatabaseError&) {
        caught = true;
    }
    assert(caught);
    std::remove(wrong.c_str());

    std::cout << "  ✓ All relational dataset tests passed\n";
}

void test_attribution_store() {
    std::cout << "Testing attribution store loading...\n";

    std::string dir = scratch_path("org");
    assert(mkdir(dir.c_str(), 0700) == 0);

    argus::IndexedDataset first("a", {{"52.1.1.1", std::string("from-a"), std::string("aws")}});
    first.save(dir + "/a.json", false);

    argus::IndexedDataset second("b", {
        {"52.1.1.1", std::string("from-b"), std::string("aws")},
        {"35.1.1.1", std::string("from-b"), std::string("gcp")},
    });
    second.save(dir + "/b.json.gz", true);

    write_file(dir + "/c.bin", "this is not a dataset");
    write_sqlite_dataset(dir + "/d.db",
        "CREATE TABLE attribution (address TEXT, org_id TEXT, platform TEXT);"
        "INSERT INTO attribution VALUES ('40.1.1.1', 'from-d', 'azure');");
    write_file(dir + "/notes.txt", "ignored");

    RecordingReporter reporter;
    argus::AttributionStore store;
    assert(store.load(dir, reporter));
    assert(store.has_data());
    assert(store.size() == 3);
    assert(reporter.warnings.size() == 1);
    assert(reporter.warnings[0].find("c.bin") != std::string::npos);

    // First dataset in load order wins
    auto hit = store.lookup("52.1.1.1");
    assert(hit && hit->org_id == std::string("from-a"));
    hit = store.lookup("35.1.1.1");
    assert(hit && hit->platform == std::string("gcp"));
    hit = store.lookup("40.1.1.1");
    assert(hit && hit->org_id == std::string("from-d"));
    assert(!store.lookup("8.8.8.8"));

    // Nothing to load is not an error
    RecordingReporter quiet;
    argus::AttributionStore empty;
    assert(!empty.load(scratch_path("no-such-dir"), quiet));
    assert(!empty.has_data());
    assert(quiet.warnings.empty());

    assert(argus::is_dataset_file("x.bin"));
    assert(argus::is_dataset_file("x.sqlite3"));
    assert(!argus::is_dataset_file("x.txt"));

    std::cout << "  ✓ All attribution store tests passed\n";
}

// ============================================================================
// Source readers
// ============================================================================

void test_csv_proxy_reader() {
    std::cout << "Testing proxy CSV reader...\n";

    std::string csv =
        "\"ip_from\",\"ip_to\",\"proxy_type\",\"country_code\",\"country_name\",\"region\",\"city\",\"isp\",\"domain\",\"usage_type\"\n"
        "\"134744064\",\"134744319\",\"DCH\",\"US\",\"United States of America\",\"California\",\"Mountain View\",\"Google LLC\",\"-\",\"-\"\n"
        "\"16843008\",\"16843263\",\"VPN\",\"AU\",\"Australia\",\"Queensland\",\"Brisbane\",\"Example, Inc.\",\"example.net\",\"DCH\"\n";
    std::string path = scratch_path("IP2PROXY-LITE-PX10.CSV.gz");
    write_file(path, argus::gzip(csv));

    argus::CsvProxyReader reader(path);
    assert(reader.size() == 2);

    auto record = reader.get_all("1.1.1.1");
    assert(record.is_known());
    assert(record.proxy_type == "VPN");
    assert(record.isp == "Example, Inc.");
    assert(record.domain == "example.net");
    assert(record.usage_type == "DCH");

    record = reader.get_all("8.8.8.8");
    assert(record.is_known());
    assert(record.domain == argus::PROXY_UNKNOWN);

    // Outside every range: all fields are the unknown marker
    record = reader.get_all("9.9.9.9");
    assert(!record.is_known());
    assert(record.proxy_type == argus::PROXY_UNKNOWN);
    assert(record.isp == argus::PROXY_UNKNOWN);

    bool caught = false;
    try {
        reader.get_all("not-an-ip");
    } catch (const argus::InvalidAddressError&) {
        caught = true;
    }
    assert(caught);

    auto fields = argus::split_csv_line("\"a\",\"b, c\",\"say \"\"hi\"\"\",d");
    assert(fields.size() == 4);
    assert(fields[1] == "b, c");
    assert(fields[2] == "say \"hi\"");
    assert(fields[3] == "d");

    write_file(scratch_path("empty.csv"), "\"ip_from\",\"ip_to\",\"country_code\",\"country_name\"\n");
    caught = false;
    try {
        argus::CsvProxyReader empty(scratch_path("empty.csv"));
    } catch (const argus::DatabaseError&) {
        caught = true;
    }
    assert(caught);

    std::cout << "  ✓ All proxy CSV reader tests passed\n";
}

void test_source_set() {
    std::cout << "Testing source set opening...\n";

    bool caught = false;
    try {
        argus::MaxMindReader reader(scratch_path("missing.mmdb"));
    } catch (const argus::DatabaseError&) {
        caught = true;
    }
    assert(caught);

    argus::SourcePaths paths;
    paths.city_db = scratch_path("missing-city.mmdb");
    paths.asn_db = scratch_path("missing-asn.mmdb");
    RecordingReporter reporter;

    caught = false;
    try {
        argus::SourceSet sources(paths, reporter);
    } catch (const argus::DatabaseError&) {
        caught = true;
    }
    assert(caught);

    std::cout << "  ✓ All source set tests passed\n";
}

// ============================================================================
// Enrichment
// ============================================================================

void test_apex_domain() {
    std::cout << "Testing apex domain reduction...\n";

    assert(argus::apex_domain("www.example.com") == "example.com");
    assert(argus::apex_domain("a.b.example.com.") == "example.com");
    assert(argus::apex_domain("mail.example.co.uk") == "example.co.uk");
    assert(argus::apex_domain("host.shop.com.au") == "shop.com.au");
    assert(argus::apex_domain("host.example.de") == "example.de");
    assert(argus::apex_domain("example.com") == "example.com");
    assert(argus::apex_domain("dns.google") == "dns.google");
    assert(argus::apex_domain("localhost") == "localhost");

    // Numeric-only answers are refused; an unparsable address resolves to nothing
    assert(argus::reverse_dns_lookup("not-an-ip").empty());
    assert(!argus::resolve_domain("not-an-ip", std::chrono::milliseconds(500)));

    std::cout << "  ✓ All apex domain tests passed\n";
}

void test_enrich_record() {
    std::cout << "Testing record merging...\n";

    FakeGeoReader geo;
    FakeAsnReader asn;
    FakeProxyReader proxy;
    RecordingReporter reporter;

    argus::GeoFacts google = geo_facts("Mountain View", "United States", "US");
    google.region = "California";
    google.postal = "94043";
    geo.entries["8.8.8.8"] = google;
    geo.entries["1.1.1.1"] = geo_facts("Brisbane", "Australia", "AU");
    geo.entries["52.1.1.1"] = geo_facts("Ashburn", "United States", "US");
    geo.broken.insert("6.6.6.6");
    asn.entries["8.8.8.8"] = asn_facts(15169, "GOOGLE");
    asn.entries["1.1.1.1"] = asn_facts(13335, "CLOUDFLARENET");

    argus::ProxyRecord dch;
    dch.country_short = "US";
    dch.proxy_type = "DCH";
    dch.isp = "Google LLC";
    dch.domain = "google.com";
    proxy.entries["8.8.8.8"] = dch;

    // Unknown address marker: other fields must be ignored
    argus::ProxyRecord unknown;
    unknown.proxy_type = "VPN";
    proxy.entries["1.1.1.1"] = unknown;

    argus::AttributionStore store;
    store.add(std::make_unique<argus::IndexedDataset>("cloud", std::vector<argus::AttributionRow>{
        {"52.1.1.1", std::string("acme"), std::string("aws")},
        {"7.7.7.7", std::string("ghost"), std::string("aws")},
    }));

    argus::Enricher enricher(geo, asn, &proxy, store, reporter);

    auto record = enricher.enrich_one("8.8.8.8");
    assert(!record.has_error());
    assert(record.city == std::string("Mountain View"));
    assert(record.region == std::string("California"));
    assert(record.iso_code == std::string("US"));
    assert(record.postal == std::string("94043"));
    assert(record.asn == 15169u);
    assert(record.asn_org == std::string("GOOGLE"));
    assert(record.proxy_type == std::string("DCH"));
    assert(record.isp == std::string("Google LLC"));
    assert(record.domain == std::string("google.com"));
    assert(!record.usage_type);  // "-" is absent
    assert(!record.org_managed);
    assert(!record.org_id && !record.platform);

    record = enricher.enrich_one("1.1.1.1");
    assert(!record.has_error());
    assert(!record.proxy_type);
    assert(!record.domain);

    record = enricher.enrich_one("52.1.1.1");
    assert(record.org_managed);
    assert(record.org_id == std::string("acme"));
    assert(record.platform == std::string("aws"));
    assert(!record.asn);

    // Lookup failures land on the record and nothing else is filled in
    record = enricher.enrich_one("7.7.7.7");
    assert(record.error == std::string("address not found in database"));
    assert(!record.org_managed);
    assert(!record.city && !record.asn && !record.org_id);

    record = enricher.enrich_one("not-an-ip");
    assert(record.error == std::string("invalid address format"));

    record = enricher.enrich_one("6.6.6.6");
    assert(record.error == std::string("database read failed"));

    std::cout << "  ✓ All record merging tests passed\n";
}

void test_enrich_batch() {
    std::cout << "Testing batch enrichment...\n";

    FakeGeoReader geo;
    FakeAsnReader asn;
    FakeProxyReader proxy;
    RecordingReporter reporter;
    argus::AttributionStore store;

    geo.entries["8.8.8.8"] = geo_facts("Mountain View", "United States", "US");
    geo.entries["9.9.9.9"] = geo_facts("Zurich", "Switzerland", "CH");
    proxy.fail = true;

    argus::Enricher enricher(geo, asn, &proxy, store, reporter);

    std::vector<std::string> resolved;
    enricher.set_domain_resolver([&](const std::string& address) -> std::optional<std::string> {
        resolved.push_back(address);
        return std::string("resolved.example");
    });

    auto records = enricher.enrich({"9.9.9.9", "5.5.5.5", "8.8.8.8"});
    assert(records.size() == 3);
    assert(records[0].address == "9.9.9.9");
    assert(records[1].address == "5.5.5.5");
    assert(records[1].has_error());
    assert(records[2].address == "8.8.8.8");
    assert(records[2].domain == std::string("resolved.example"));

    // Failed addresses are never resolved
    assert(resolved.size() == 2);

    // Proxy failure is reported, not fatal
    assert(reporter.warnings.size() == 2);
    assert(reporter.progress_calls == 3);
    assert(reporter.last_done == 3);
    assert(reporter.finished);

    // Without proxy data the merger still works
    argus::Enricher bare(geo, asn, nullptr, store, reporter);
    assert(!bare.enrich_one("8.8.8.8").proxy_type);

    // A resolver that cannot start a lookup costs the domain, nothing more
    asn.entries["9.9.9.9"] = asn_facts(3303, "SWISSCOM");
    RecordingReporter quiet;
    argus::Enricher unlucky(geo, asn, nullptr, store, quiet);
    unlucky.set_domain_resolver([](const std::string&) -> std::optional<std::string> {
        throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
    });
    records = unlucky.enrich({"9.9.9.9"});
    assert(records.size() == 1);
    assert(!records[0].has_error());
    assert(records[0].city == std::string("Zurich"));
    assert(records[0].asn == 3303u);
    assert(!records[0].domain);
    assert(quiet.warnings.size() == 1);
    assert(quiet.warnings[0].find("9.9.9.9") != std::string::npos);

    std::cout << "  ✓ All batch enrichment tests passed\n";
}

static void wait_for_idle_lookups() {
    while (argus::pending_rdns_lookups() > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void test_rdns_worker_limit() {
    std::cout << "Testing reverse DNS worker limit...\n";

    wait_for_idle_lookups();

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    argus::HostnameLookup stuck = [gate](const std::string&) {
        gate.wait();
        return std::string("late.example");
    };
    argus::HostnameLookup instant = [](const std::string&) {
        return std::string("host.example");
    };

    // Timed-out lookups keep their threads until the resolver answers
    for (size_t i = 0; i < argus::MAX_PENDING_RDNS_LOOKUPS; ++i) {
        assert(!argus::resolve_domain("8.8.8.8", std::chrono::milliseconds(1), stuck));
    }
    assert(argus::pending_rdns_lookups() == argus::MAX_PENDING_RDNS_LOOKUPS);

    // At the limit nothing new is started
    assert(!argus::resolve_domain("8.8.8.8", std::chrono::seconds(5), instant));
    assert(argus::pending_rdns_lookups() == argus::MAX_PENDING_RDNS_LOOKUPS);

    release.set_value();
    wait_for_idle_lookups();

    auto hostname = argus::resolve_domain("8.8.8.8", std::chrono::seconds(5), instant);
    assert(hostname == std::string("host.example"));

    // A lookup that throws yields nothing
    argus::HostnameLookup failing = [](const std::string&) -> std::string {
        throw std::runtime_error("resolver gone");
    };
    assert(!argus::resolve_domain("8.8.8.8", std::chrono::seconds(5), failing));
    wait_for_idle_lookups();

    std::cout << "  ✓ All reverse DNS worker limit tests passed\n";
}

// ============================================================================
// Filtering and sorting
// ============================================================================

static std::vector<argus::EnrichedRecord> sample_records() {
    std::vector<argus::EnrichedRecord> records;

    auto google = make_record("8.8.8.8");
    google.city = "Mountain View";
    google.country = "United States";
    google.iso_code = "US";
    google.asn = 15169;
    google.asn_org = "GOOGLE";
    records.push_back(google);

    auto cloudflare = make_record("1.1.1.1");
    cloudflare.city = "Brisbane";
    cloudflare.country = "Australia";
    cloudflare.iso_code = "AU";
    cloudflare.asn = 13335;
    cloudflare.asn_org = "CLOUDFLARENET";
    records.push_back(cloudflare);

    auto managed = make_record("52.1.1.1");
    managed.city = "Ashburn";
    managed.country = "United States";
    managed.iso_code = "US";
    managed.asn = 16509;
    managed.asn_org = "AMAZON-02";
    managed.org_managed = true;
    managed.org_id = "ACME";
    managed.platform = "AWS";
    records.push_back(managed);

    records.push_back(make_record("9.9.9.9"));  // Nothing known

    auto failed = make_record("5.5.5.5");
    failed.error = "address not found in database";
    records.push_back(failed);

    return records;
}

static std::vector<std::string> addresses_of(const std::vector<argus::EnrichedRecord>& records) {
    std::vector<std::string> addresses;
    for (const auto& record : records) {
        addresses.push_back(record.address);
    }
    return addresses;
}

void test_filter_records() {
    std::cout << "Testing result filtering...\n";

    auto records = sample_records();
    using List = std::vector<std::string>;

    argus::FilterOptions options;
    assert(argus::FilterCriteria(options).empty());
    assert(argus::filter_records(records, argus::FilterCriteria(options)).size() == records.size());

    options.countries = {"united states"};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"1.1.1.1", "9.9.9.9", "5.5.5.5"}));

    // A country rule looks at the name only, never the ISO code
    options.countries = {"us"};
    assert(argus::filter_records(records, argus::FilterCriteria(options)).size() == records.size());

    options = argus::FilterOptions();
    options.iso_codes = {"us"};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"1.1.1.1", "9.9.9.9", "5.5.5.5"}));

    // Code known, name absent: a country rule cannot exclude it
    auto code_only = make_record("8.8.4.4");
    code_only.iso_code = "US";
    options = argus::FilterOptions();
    options.countries = {"US"};
    assert(!argus::FilterCriteria(options).excludes(code_only));

    options = argus::FilterOptions();
    options.cities = {"BRISBANE"};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"8.8.8.8", "52.1.1.1", "9.9.9.9", "5.5.5.5"}));

    options = argus::FilterOptions();
    options.asns = {15169, 16509};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"1.1.1.1", "9.9.9.9", "5.5.5.5"}));

    options = argus::FilterOptions();
    options.orgs = {"flare"};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"8.8.8.8", "52.1.1.1", "9.9.9.9", "5.5.5.5"}));

    options = argus::FilterOptions();
    options.exclude_org_managed = true;
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"8.8.8.8", "1.1.1.1", "9.9.9.9", "5.5.5.5"}));

    // Error records survive even the widest exclusion
    options = argus::FilterOptions();
    options.exclude_not_org_managed = true;
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"52.1.1.1", "5.5.5.5"}));

    options = argus::FilterOptions();
    options.platforms = {"aws"};
    assert(addresses_of(argus::filter_records(records, argus::FilterCriteria(options))) ==
           (List{"8.8.8.8", "1.1.1.1", "9.9.9.9", "5.5.5.5"}));

    options = argus::FilterOptions();
    options.org_ids = {"acme"};
    assert(argus::filter_records(records, argus::FilterCriteria(options)).size() == 4);

    // Absent fields never match
    argus::FilterCriteria everything([] {
        argus::FilterOptions all;
        all.countries = {"US", "AU"};
        all.cities = {"ashburn"};
        all.orgs = {"o"};
        return all;
    }());
    assert(!everything.excludes(records[3]));
    assert(!everything.excludes(records[4]));

    std::cout << "  ✓ All filtering tests passed\n";
}

void test_filter_monotonic() {
    std::cout << "Testing that stacked exclusions only shrink results...\n";

    auto records = sample_records();

    std::vector<std::function<void(argus::FilterOptions&)>> steps = {
        [](argus::FilterOptions& o) { o.countries.push_back("Australia"); },
        [](argus::FilterOptions& o) { o.iso_codes.push_back("ZZ"); },
        [](argus::FilterOptions& o) { o.cities.push_back("mountain view"); },
        [](argus::FilterOptions& o) { o.asns.push_back(13335); },
        [](argus::FilterOptions& o) { o.orgs.push_back("amazon"); },
        [](argus::FilterOptions& o) { o.platforms.push_back("gcp"); },
        [](argus::FilterOptions& o) { o.org_ids.push_back("globex"); },
        [](argus::FilterOptions& o) { o.exclude_org_managed = true; },
        [](argus::FilterOptions& o) { o.exclude_not_org_managed = true; },
    };

    argus::FilterOptions options;
    size_t previous = argus::filter_records(records, argus::FilterCriteria(options)).size();
    for (const auto& step : steps) {
        step(options);
        auto kept = argus::filter_records(records, argus::FilterCriteria(options));
        assert(kept.size() <= previous);
        previous = kept.size();

        auto addresses = addresses_of(kept);
        assert(std::find(addresses.begin(), addresses.end(), "5.5.5.5") != addresses.end());
    }

    // Every axis configured at once leaves only the error record
    auto kept = argus::filter_records(records, argus::FilterCriteria(options));
    assert(kept.size() == 1);
    assert(kept[0].address == "5.5.5.5");
    assert(kept[0].has_error());

    std::cout << "  ✓ All stacked exclusion tests passed\n";
}

void test_sort_records() {
    std::cout << "Testing result sorting...\n";

    using List = std::vector<std::string>;

    std::vector<argus::EnrichedRecord> records;
    records.push_back(make_record("9.9.9.9"));
    records.push_back(make_record("8.8.8.8"));
    records.back().asn = 15169;
    records.back().asn_org = "GOOGLE";
    records.push_back(make_record("1.1.1.1"));
    records.back().asn = 13335;
    records.back().asn_org = "CLOUDFLARENET";
    records.push_back(make_record("4.4.4.4"));
    records.push_back(make_record("2.2.2.2"));
    records.back().asn = 13335;
    records.back().asn_org = "cloudflare";

    auto sorted = argus::sort_records(records, argus::SortKey::Asn);
    assert(addresses_of(sorted) == (List{"1.1.1.1", "2.2.2.2", "8.8.8.8", "9.9.9.9", "4.4.4.4"}));

    // Sorting again changes nothing
    assert(addresses_of(argus::sort_records(sorted, argus::SortKey::Asn)) == addresses_of(sorted));

    // Case-sensitive: upper case sorts before lower case
    sorted = argus::sort_records(records, argus::SortKey::AsnOrg);
    assert(addresses_of(sorted) == (List{"1.1.1.1", "8.8.8.8", "2.2.2.2", "9.9.9.9", "4.4.4.4"}));

    // Input left untouched
    assert(records[0].address == "9.9.9.9");

    // Every record missing the field keeps input order
    sorted = argus::sort_records(records, argus::SortKey::City);
    assert(addresses_of(sorted) == addresses_of(records));

    assert(argus::parse_sort_key("asn_org") == argus::SortKey::AsnOrg);
    assert(argus::parse_sort_key("ip") == argus::SortKey::Address);
    assert(argus::sort_key_name(argus::SortKey::IsoCode) == "iso_code");

    bool caught = false;
    try {
        argus::parse_sort_key("bogus");
    } catch (const argus::ValidationError& e) {
        caught = std::string(e.what()).find("bogus") != std::string::npos;
    }
    assert(caught);

    std::cout << "  ✓ All sorting tests passed\n";
}

// ============================================================================
// Output
// ============================================================================

void test_output_formats() {
    std::cout << "Testing output formats...\n";

    auto records = sample_records();
    records[0].isp = "Say \"hi\"";

    std::string csv = argus::format_csv(records);
    std::string header = "ip,org_managed,org_id,platform,proxy_type,domain,city,region,country,"
                         "iso_code,isp,usage_type,asn,asn_org,error\n";
    assert(csv.compare(0, header.size(), header) == 0);
    assert(csv.find("\"8.8.8.8\",\"false\",\"\",\"\",\"\",\"\",\"Mountain View\",\"\","
                    "\"United States\",\"US\",\"Say \"\"hi\"\"\",\"\",\"15169\",\"GOOGLE\",\"\"\n")
           != std::string::npos);
    assert(csv.find("\"address not found in database\"") != std::string::npos);

    auto parsed = nlohmann::json::parse(argus::format_json(records));
    assert(parsed.is_array());
    assert(parsed.size() == records.size());
    assert(parsed[0]["ip"] == "8.8.8.8");
    assert(parsed[0]["asn"] == 15169);
    assert(parsed[0]["org_managed"] == false);
    assert(parsed[0]["domain"].is_null());
    assert(parsed[2]["platform"] == "AWS");
    assert(parsed[4]["error"] == "address not found in database");

    std::string path = scratch_path("results.csv");
    assert(argus::write_results(records, path, argus::OutputFormat::Csv) == path);
    assert(argus::read_file(path) == csv);

    std::string generated = argus::default_output_path(argus::OutputFormat::Csv);
    assert(generated.compare(0, 14, "argus_results_") == 0);
    assert(generated.size() == 14 + 15 + 4);
    assert(generated.compare(generated.size() - 4, 4, ".csv") == 0);

    assert(argus::parse_output_format("csv") == argus::OutputFormat::Csv);
    bool caught = false;
    try {
        argus::parse_output_format("xml");
    } catch (const argus::ValidationError&) {
        caught = true;
    }
    assert(caught);

    std::ostringstream table;
    argus::print_records(records, table);
    assert(table.str().find("ERROR: address not found in database") != std::string::npos);
    assert(table.str().find("AS15169 (GOOGLE)") != std::string::npos);

    std::ostringstream panel;
    argus::print_records({records[2]}, panel);
    assert(panel.str().find("Org Managed: yes, ACME (AWS)") != std::string::npos);

    std::cout << "  ✓ All output format tests passed\n";
}

void test_processing_stats() {
    std::cout << "Testing processing statistics...\n";

    auto records = sample_records();
    auto stats = argus::compute_stats(records, 3, 1.5);
    assert(stats.total_ips == 5);
    assert(stats.successful_lookups == 4);
    assert(stats.failed_lookups == 1);
    assert(stats.filtered_ips == 2);
    assert(stats.success_rate() == 80.0);
    assert(stats.filter_rate() == 50.0);

    argus::ProcessingStats empty;
    assert(empty.success_rate() == 0.0);
    assert(empty.filter_rate() == 0.0);

    std::cout << "  ✓ All processing statistics tests passed\n";
}

// ============================================================================
// Configuration
// ============================================================================

void test_config() {
    std::cout << "Testing configuration loading...\n";

    assert(argus::trim("  value \t") == "value");
    assert(argus::parse_bool("Yes"));
    assert(argus::parse_bool("on"));
    assert(!argus::parse_bool("off"));

    std::string path = scratch_path("settings.conf");
    write_file(path,
        "# comment\n"
        "[databases]\n"
        "data_dir = /srv/geo\n"
        "asn_db = /opt/asn.mmdb   # custom\n"
        "\n"
        "[lookup]\n"
        "reverse_dns = true\n"
        "rdns_timeout_ms = not-a-number\n"
        "sort_by = asn\n"
        "garbage line\n"
        "\n"
        "[output]\n"
        "format = csv\n"
        "show_progress = false\n");

    RecordingReporter reporter;
    argus::Config config = argus::load_config_from_file(path, reporter);
    assert(config.data_dir == "/srv/geo");
    assert(config.city_db_path() == "/srv/geo/GeoLite2-City.mmdb");
    assert(config.asn_db_path() == "/opt/asn.mmdb");
    assert(config.proxy_db_path() == "/srv/geo/IP2PROXY-LITE.CSV");
    assert(config.org_dir_path() == "/srv/geo/org");
    assert(config.reverse_dns);
    assert(config.rdns_timeout_ms == 1000);
    assert(config.sort_by == "asn");
    assert(config.output_format == "csv");
    assert(!config.show_progress);
    assert(reporter.warnings.size() == 2);

    // Environment beats the file
    setenv("ARGUS_DATA_DIR", "/env/data", 1);
    setenv("ARGUS_ORG_DIR", "/env/org", 1);
    argus::apply_environment(config);
    unsetenv("ARGUS_DATA_DIR");
    unsetenv("ARGUS_ORG_DIR");
    assert(config.city_db_path() == "/env/data/GeoLite2-City.mmdb");
    assert(config.org_dir_path() == "/env/org");

    // Unreadable file degrades to defaults
    RecordingReporter missing;
    argus::Config defaults = argus::load_config_from_file(scratch_path("none.conf"), missing);
    assert(!defaults.reverse_dns);
    assert(defaults.sort_by == "asn_org");
    assert(defaults.output_format == "json");
    assert(missing.warnings.size() == 1);

    std::string example = scratch_path("example.conf");
    assert(argus::create_example_config(example));
    struct stat st;
    assert(stat(example.c_str(), &st) == 0);
    assert((st.st_mode & 0777) == 0600);
    RecordingReporter clean;
    argus::Config from_example = argus::load_config_from_file(example, clean);
    assert(clean.warnings.empty());
    assert(from_example.sort_by == "asn_org");

    setenv("HOME", "/home/tester", 1);
    assert(argus::expand_home_dir("~/data") == "/home/tester/data");
    assert(argus::expand_home_dir("/abs") == "/abs");

    std::cout << "  ✓ All configuration tests passed\n";
}

void test_version() {
    std::cout << "Testing version...\n";

    std::string version = argus::get_version();
    assert(!version.empty());
    assert(version == "1.0.0");

    std::cout << "  ✓ Version test passed\n";
}

int main() {
    std::cout << "Running Argus tests...\n\n";

    char dir_template[] = "/tmp/argus_tests_XXXXXX";
    if (!mkdtemp(dir_template)) {
        std::cerr << "✗ Cannot create scratch directory\n";
        return 1;
    }
    scratch_dir = dir_template;

    try {
        test_validate_address();
        test_expand_cidr();
        test_global_addresses();
        test_extract_addresses();
        test_collect_addresses();
        test_detect_compression();
        test_compressed_readers();
        test_indexed_dataset();
        test_sqlite_dataset();
        test_attribution_store();
        test_csv_proxy_reader();
        test_source_set();
        test_apex_domain();
        test_enrich_record();
        test_enrich_batch();
        test_rdns_worker_limit();
        test_filter_records();
        test_filter_monotonic();
        test_sort_records();
        test_output_formats();
        test_processing_stats();
        test_config();
        test_version();

        std::cout << "\n✓ All tests passed successfully!\n";
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "\n✗ Test failed: " << e.what() << "\n";
        return 1;
    }
}
