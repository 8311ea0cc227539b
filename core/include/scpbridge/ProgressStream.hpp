// Byte-count decorators that report the fraction of a payload transferred.
// They forward every chunk untouched; only the counter is added.
#pragma once
#include "ByteStream.hpp"
#include "ScpTypes.hpp"

#include <cstdint>

namespace scpbridge {

// Per-transfer progress state. Owned by the call that created it.
class ProgressTracker {
public:
    ProgressTracker(std::uint64_t total, ProgressCB cb)
        : total_(total), cb_(std::move(cb)) {}

    void credit(std::uint64_t n);

    std::uint64_t total() const { return total_; }
    std::uint64_t transferred() const { return transferred_; }

private:
    std::uint64_t total_ = 0;
    std::uint64_t transferred_ = 0;
    ProgressCB cb_;
};

class ProgressReader : public ByteReader {
public:
    ProgressReader(ByteReader &inner, ProgressTracker &tracker)
        : inner_(inner), tracker_(tracker) {}

    bool read(char *buf, std::size_t len, std::size_t &got,
              std::string &err) override;

private:
    ByteReader &inner_;
    ProgressTracker &tracker_;
};

class ProgressWriter : public ByteWriter {
public:
    ProgressWriter(ByteWriter &inner, ProgressTracker &tracker)
        : inner_(inner), tracker_(tracker) {}

    bool write(const char *buf, std::size_t len, std::string &err) override;
    void close() override { inner_.close(); }

private:
    ByteWriter &inner_;
    ProgressTracker &tracker_;
};

} // namespace scpbridge
