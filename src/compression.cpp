#include "compression.h"
#include <algorithm>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <zlib.h>
#include <bzlib.h>
#include <lzma.h>

namespace argus {

// ============================================================================
// Compression Detection
// ============================================================================

static bool has_extension(const std::string& filename, const std::string& ext) {
    if (filename.size() < ext.size()) {
        return false;
    }
    std::string tail = filename.substr(filename.size() - ext.size());
    std::transform(tail.begin(), tail.end(), tail.begin(), ::tolower);
    return tail == ext;
}

CompressionType detect_compression(const std::string& filename) {
    if (has_extension(filename, ".gz")) {
        return CompressionType::GZIP;
    }
    if (has_extension(filename, ".bz2")) {
        return CompressionType::BZIP2;
    }
    if (has_extension(filename, ".xz")) {
        return CompressionType::XZ;
    }
    return CompressionType::NONE;
}

bool is_compressed(const std::string& filename) {
    return detect_compression(filename) != CompressionType::NONE;
}

// ============================================================================
// In-memory buffers
// ============================================================================

std::string read_file(const std::string& filename) {
    std::ifstream file(filename, std::ios::binary);
    if (!file.is_open()) {
        throw std::runtime_error("Failed to open file: " + filename);
    }
    std::ostringstream contents;
    contents << file.rdbuf();
    return contents.str();
}

std::string gunzip(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    // 16 + MAX_WBITS: expect a gzip header, reject raw zlib/deflate
    if (inflateInit2(&stream, 16 + MAX_WBITS) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip decoder");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string output;
    char buffer[65536];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);

        ret = inflate(&stream, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            std::string message = stream.msg ? stream.msg : std::to_string(ret);
            inflateEnd(&stream);
            throw std::runtime_error("Gzip decompression error: " + message);
        }

        size_t produced = sizeof(buffer) - stream.avail_out;
        output.append(buffer, produced);

        if (ret == Z_OK && stream.avail_in == 0 && produced == 0) {
            inflateEnd(&stream);
            throw std::runtime_error("Gzip decompression error: truncated stream");
        }
    }

    inflateEnd(&stream);
    return output;
}

std::string gzip(const std::string& data) {
    z_stream stream;
    std::memset(&stream, 0, sizeof(stream));

    if (deflateInit2(&stream, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 16 + MAX_WBITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("Failed to initialize gzip encoder");
    }

    stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    stream.avail_in = static_cast<uInt>(data.size());

    std::string output;
    char buffer[65536];
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        stream.next_out = reinterpret_cast<Bytef*>(buffer);
        stream.avail_out = sizeof(buffer);

        ret = deflate(&stream, Z_FINISH);
        if (ret == Z_STREAM_ERROR) {
            deflateEnd(&stream);
            throw std::runtime_error("Gzip compression error");
        }
        output.append(buffer, sizeof(buffer) - stream.avail_out);
    }

    deflateEnd(&stream);
    return output;
}

std::string gunzip_or_passthrough(const std::string& data) {
    try {
        return gunzip(data);
    } catch (const std::runtime_error&) {
        return data;
    }
}

// ============================================================================
// ChunkedLineReader
// ============================================================================

bool ChunkedLineReader::getline(std::string& line) {
    line.clear();

    while (true) {
        size_t newline = pending_.find('\n', pending_pos_);
        if (newline != std::string::npos) {
            line.append(pending_, pending_pos_, newline - pending_pos_);
            pending_pos_ = newline + 1;
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return true;
        }

        // No newline buffered: keep the partial line and pull more data
        line.append(pending_, pending_pos_, std::string::npos);
        pending_.clear();
        pending_pos_ = 0;

        if (at_eof_) {
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return !line.empty();
        }

        pending_.resize(CHUNK_SIZE);
        size_t bytes = read_chunk(&pending_[0], CHUNK_SIZE);
        pending_.resize(bytes);
        if (bytes == 0) {
            at_eof_ = true;
        }
    }
}

bool ChunkedLineReader::eof() const {
    return at_eof_ && pending_pos_ >= pending_.size();
}

// ============================================================================
// RegularFileReader Implementation
// ============================================================================

class RegularFileReader::Impl {
public:
    FILE* file;

    explicit Impl(const std::string& filename) : file(fopen(filename.c_str(), "rb")) {
        if (file == nullptr) {
            throw std::runtime_error("Failed to open file: " + filename);
        }
    }

    ~Impl() {
        fclose(file);
    }
};

RegularFileReader::RegularFileReader(const std::string& filename)
    : pImpl(std::make_unique<Impl>(filename)) {}

RegularFileReader::~RegularFileReader() = default;

size_t RegularFileReader::read_chunk(char* buffer, size_t capacity) {
    size_t bytes = fread(buffer, 1, capacity, pImpl->file);
    if (bytes == 0 && ferror(pImpl->file)) {
        throw std::runtime_error("Read error");
    }
    return bytes;
}

// ============================================================================
// GzipReader Implementation
// ============================================================================

class GzipReader::Impl {
public:
    gzFile file;

    explicit Impl(const std::string& filename) : file(gzopen(filename.c_str(), "rb")) {
        if (file == nullptr) {
            throw std::runtime_error("Failed to open gzip file: " + filename);
        }
        gzbuffer(file, 65536);
    }

    ~Impl() {
        gzclose(file);
    }
};

GzipReader::GzipReader(const std::string& filename)
    : pImpl(std::make_unique<Impl>(filename)) {}

GzipReader::~GzipReader() = default;

size_t GzipReader::read_chunk(char* buffer, size_t capacity) {
    int bytes = gzread(pImpl->file, buffer, static_cast<unsigned>(capacity));
    if (bytes < 0) {
        int errnum;
        const char* message = gzerror(pImpl->file, &errnum);
        throw std::runtime_error(std::string("Gzip decompression error: ") + message);
    }
    return static_cast<size_t>(bytes);
}

// ============================================================================
// Bzip2Reader Implementation
// ============================================================================

class Bzip2Reader::Impl {
public:
    FILE* raw_file;
    BZFILE* file;
    bool stream_ended;

    explicit Impl(const std::string& filename)
        : raw_file(fopen(filename.c_str(), "rb")), file(nullptr), stream_ended(false) {
        if (raw_file == nullptr) {
            throw std::runtime_error("Failed to open bzip2 file: " + filename);
        }

        int bzerror;
        file = BZ2_bzReadOpen(&bzerror, raw_file, 0, 0, nullptr, 0);
        if (file == nullptr || bzerror != BZ_OK) {
            fclose(raw_file);
            throw std::runtime_error("Failed to initialize bzip2 reader: " + std::to_string(bzerror));
        }
    }

    ~Impl() {
        int bzerror;
        BZ2_bzReadClose(&bzerror, file);
        fclose(raw_file);
    }
};

Bzip2Reader::Bzip2Reader(const std::string& filename)
    : pImpl(std::make_unique<Impl>(filename)) {}

Bzip2Reader::~Bzip2Reader() = default;

size_t Bzip2Reader::read_chunk(char* buffer, size_t capacity) {
    if (pImpl->stream_ended) {
        return 0;
    }

    int bzerror;
    int bytes = BZ2_bzRead(&bzerror, pImpl->file, buffer, static_cast<int>(capacity));
    if (bzerror == BZ_STREAM_END) {
        pImpl->stream_ended = true;
    } else if (bzerror != BZ_OK) {
        throw std::runtime_error("Bzip2 decompression error: " + std::to_string(bzerror));
    }
    return bytes > 0 ? static_cast<size_t>(bytes) : 0;
}

// ============================================================================
// XzReader Implementation
// ============================================================================

class XzReader::Impl {
public:
    FILE* file;
    lzma_stream stream;
    uint8_t in_buffer[65536];
    bool stream_ended;

    explicit Impl(const std::string& filename)
        : file(fopen(filename.c_str(), "rb")), stream(LZMA_STREAM_INIT), stream_ended(false) {
        if (file == nullptr) {
            throw std::runtime_error("Failed to open XZ file: " + filename);
        }

        lzma_ret ret = lzma_stream_decoder(&stream, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            fclose(file);
            throw std::runtime_error("Failed to initialize XZ decoder: " + std::to_string(ret));
        }
    }

    ~Impl() {
        lzma_end(&stream);
        fclose(file);
    }
};

XzReader::XzReader(const std::string& filename)
    : pImpl(std::make_unique<Impl>(filename)) {}

XzReader::~XzReader() = default;

size_t XzReader::read_chunk(char* buffer, size_t capacity) {
    auto& stream = pImpl->stream;
    stream.next_out = reinterpret_cast<uint8_t*>(buffer);
    stream.avail_out = capacity;

    while (!pImpl->stream_ended && stream.avail_out == capacity) {
        lzma_action action = LZMA_RUN;
        if (stream.avail_in == 0) {
            size_t bytes = fread(pImpl->in_buffer, 1, sizeof(pImpl->in_buffer), pImpl->file);
            if (bytes == 0 && ferror(pImpl->file)) {
                throw std::runtime_error("XZ read error");
            }
            stream.next_in = pImpl->in_buffer;
            stream.avail_in = bytes;
            if (bytes == 0) {
                action = LZMA_FINISH;
            }
        }

        lzma_ret ret = lzma_code(&stream, action);
        if (ret == LZMA_STREAM_END) {
            pImpl->stream_ended = true;
        } else if (ret != LZMA_OK) {
            throw std::runtime_error("XZ decompression error: " + std::to_string(ret));
        }
    }

    return capacity - stream.avail_out;
}

// ============================================================================
// Factory Function
// ============================================================================

std::unique_ptr<LineReader> create_reader(const std::string& filename) {
    switch (detect_compression(filename)) {
        case CompressionType::GZIP:
            return std::make_unique<GzipReader>(filename);

        case CompressionType::BZIP2:
            return std::make_unique<Bzip2Reader>(filename);

        case CompressionType::XZ:
            return std::make_unique<XzReader>(filename);

        case CompressionType::NONE:
        default:
            return std::make_unique<RegularFileReader>(filename);
    }
}

} // namespace argus
