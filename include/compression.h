#ifndef ARGUS_COMPRESSION_H
#define ARGUS_COMPRESSION_H

#include <string>
#include <memory>
#include <cstddef>

namespace argus {

/**
 * Supported compression types, detected by file extension
 */
enum class CompressionType {
    NONE,    // Regular uncompressed file
    GZIP,    // .gz files (zlib)
    BZIP2,   // .bz2 files (libbz2)
    XZ       // .xz files (liblzma)
};

/**
 * Detect compression type from filename extension (case-insensitive)
 * @param filename Path to the file
 * @return CompressionType based on extension (.gz, .bz2, .xz)
 */
CompressionType detect_compression(const std::string& filename);

/**
 * Check if a file is compressed (any format)
 */
bool is_compressed(const std::string& filename);

/**
 * Read a whole file into memory as raw bytes
 * @throws std::runtime_error if the file cannot be opened
 */
std::string read_file(const std::string& filename);

/**
 * Decompress a gzip buffer held in memory
 * @param data Compressed bytes
 * @return Decompressed bytes
 * @throws std::runtime_error if data is not a valid gzip stream
 */
std::string gunzip(const std::string& data);

/**
 * Compress a buffer to a gzip stream
 * @throws std::runtime_error on zlib failure
 */
std::string gzip(const std::string& data);

/**
 * Decompress data if it is gzip, otherwise return it unchanged
 */
std::string gunzip_or_passthrough(const std::string& data);

/**
 * Abstract interface for reading lines from files (compressed or not)
 */
class LineReader {
public:
    virtual ~LineReader() = default;

    /**
     * Read next line from the file
     * @param line Output string to store the line (without newline or trailing \r)
     * @return true if line was read successfully, false on EOF
     * @throws std::runtime_error on decompression errors
     */
    virtual bool getline(std::string& line) = 0;

    /**
     * Check if end of file reached
     */
    virtual bool eof() const = 0;
};

/**
 * Splits a stream of decompressed chunks into lines.
 * Subclasses only supply raw bytes through read_chunk().
 */
class ChunkedLineReader : public LineReader {
public:
    bool getline(std::string& line) override;
    bool eof() const override;

protected:
    /**
     * Fill buffer with up to capacity bytes
     * @return Bytes written, 0 at end of stream
     * @throws std::runtime_error on read or decompression errors
     */
    virtual size_t read_chunk(char* buffer, size_t capacity) = 0;

private:
    static constexpr size_t CHUNK_SIZE = 65536;
    std::string pending_;
    size_t pending_pos_ = 0;
    bool at_eof_ = false;
};

/**
 * LineReader for regular uncompressed files
 */
class RegularFileReader : public ChunkedLineReader {
public:
    explicit RegularFileReader(const std::string& filename);
    ~RegularFileReader() override;

protected:
    size_t read_chunk(char* buffer, size_t capacity) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * LineReader for gzip-compressed files (.gz), via zlib
 */
class GzipReader : public ChunkedLineReader {
public:
    explicit GzipReader(const std::string& filename);
    ~GzipReader() override;

protected:
    size_t read_chunk(char* buffer, size_t capacity) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * LineReader for bzip2-compressed files (.bz2), via libbz2
 */
class Bzip2Reader : public ChunkedLineReader {
public:
    explicit Bzip2Reader(const std::string& filename);
    ~Bzip2Reader() override;

protected:
    size_t read_chunk(char* buffer, size_t capacity) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * LineReader for XZ-compressed files (.xz), via liblzma
 */
class XzReader : public ChunkedLineReader {
public:
    explicit XzReader(const std::string& filename);
    ~XzReader() override;

protected:
    size_t read_chunk(char* buffer, size_t capacity) override;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

/**
 * Factory function to create appropriate LineReader for a file
 * Automatically detects compression type from extension
 * @param filename Path to the file
 * @return Unique pointer to LineReader instance
 * @throws std::runtime_error if file cannot be opened
 */
std::unique_ptr<LineReader> create_reader(const std::string& filename);

} // namespace argus

#endif // ARGUS_COMPRESSION_H
