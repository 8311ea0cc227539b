// Minimal blocking byte-stream interfaces used by the protocol and the
// session backends, plus adapters for the standard iostreams.
#pragma once
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <utility>

namespace scpbridge {

class ByteReader {
public:
    virtual ~ByteReader() = default;

    // Reads up to len bytes. Returns false on failure (err filled); "got"
    // may still hold bytes delivered before the failure. got == 0 with a
    // true result means end of stream.
    virtual bool read(char *buf, std::size_t len, std::size_t &got,
                      std::string &err) = 0;
};

class ByteWriter {
public:
    virtual ~ByteWriter() = default;

    // Writes all len bytes or fails.
    virtual bool write(const char *buf, std::size_t len, std::string &err) = 0;

    // Signals end of stream to the other side. No-op for local sinks.
    virtual void close() {}
};

class IstreamReader : public ByteReader {
public:
    explicit IstreamReader(std::istream &in) : in_(in) {}
    bool read(char *buf, std::size_t len, std::size_t &got,
              std::string &err) override;

private:
    std::istream &in_;
};

class OstreamWriter : public ByteWriter {
public:
    explicit OstreamWriter(std::ostream &out) : out_(out) {}
    bool write(const char *buf, std::size_t len, std::string &err) override;

private:
    std::ostream &out_;
};

class StringReader : public ByteReader {
public:
    explicit StringReader(std::string data) : data_(std::move(data)) {}
    bool read(char *buf, std::size_t len, std::size_t &got,
              std::string &err) override;

private:
    std::string data_;
    std::size_t pos_ = 0;
};

// Copies exactly n bytes from src to dst. Ending early is an error.
bool copyN(ByteWriter &dst, ByteReader &src, std::uint64_t n,
           std::uint64_t &copied, std::string &err);

// Reads src until end of stream.
bool readAll(ByteReader &src, std::string &out, std::string &err);

// Reads up to and excluding '\n'. End of stream before the newline fails.
bool readLine(ByteReader &src, std::string &line, std::string &err);

} // namespace scpbridge
