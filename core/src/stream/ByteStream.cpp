#include "scpbridge/ByteStream.hpp"

#include <algorithm>
#include <cstring>
#include <istream>
#include <ostream>
#include <vector>

namespace scpbridge {

namespace {
constexpr std::size_t kCopyChunk = 32 * 1024;
}

bool IstreamReader::read(char *buf, std::size_t len, std::size_t &got,
                         std::string &err) {
    got = 0;
    if (len == 0)
        return true;
    if (in_.eof())
        return true;
    in_.read(buf, static_cast<std::streamsize>(len));
    got = static_cast<std::size_t>(in_.gcount());
    if (in_.bad()) {
        err = "local read failed";
        return false;
    }
    // A short read sets failbit together with eofbit; that is end of stream.
    if (in_.fail() && !in_.eof()) {
        err = "local read failed";
        return false;
    }
    return true;
}

bool OstreamWriter::write(const char *buf, std::size_t len, std::string &err) {
    out_.write(buf, static_cast<std::streamsize>(len));
    if (!out_) {
        err = "local write failed";
        return false;
    }
    return true;
}

bool StringReader::read(char *buf, std::size_t len, std::size_t &got,
                        std::string &err) {
    (void)err;
    got = std::min(len, data_.size() - pos_);
    if (got > 0) {
        std::memcpy(buf, data_.data() + pos_, got);
        pos_ += got;
    }
    return true;
}

bool copyN(ByteWriter &dst, ByteReader &src, std::uint64_t n,
           std::uint64_t &copied, std::string &err) {
    copied = 0;
    std::vector<char> buf(static_cast<std::size_t>(
        std::min<std::uint64_t>(n > 0 ? n : 1, kCopyChunk)));
    while (copied < n) {
        const std::size_t want = static_cast<std::size_t>(
            std::min<std::uint64_t>(n - copied, buf.size()));
        std::size_t got = 0;
        const bool ok = src.read(buf.data(), want, got, err);
        if (got > 0) {
            if (!dst.write(buf.data(), got, err))
                return false;
            copied += got;
        }
        if (!ok)
            return false;
        if (got == 0) {
            err = "unexpected end of stream after " + std::to_string(copied) +
                  " of " + std::to_string(n) + " bytes";
            return false;
        }
    }
    return true;
}

bool readAll(ByteReader &src, std::string &out, std::string &err) {
    out.clear();
    std::vector<char> buf(kCopyChunk);
    for (;;) {
        std::size_t got = 0;
        const bool ok = src.read(buf.data(), buf.size(), got, err);
        out.append(buf.data(), got);
        if (!ok)
            return false;
        if (got == 0)
            return true;
    }
}

bool readLine(ByteReader &src, std::string &line, std::string &err) {
    line.clear();
    // Byte at a time: anything past the newline belongs to the next step.
    char c = 0;
    for (;;) {
        std::size_t got = 0;
        if (!src.read(&c, 1, got, err))
            return false;
        if (got == 0) {
            err = "unexpected end of stream while reading control line";
            return false;
        }
        if (c == '\n')
            return true;
        line.push_back(c);
    }
}

} // namespace scpbridge
