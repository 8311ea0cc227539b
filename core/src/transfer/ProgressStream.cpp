#include "scpbridge/ProgressStream.hpp"

namespace scpbridge {

void ProgressTracker::credit(std::uint64_t n) {
    if (n == 0)
        return;
    transferred_ += n;
    if (total_ > 0 && cb_)
        cb_(static_cast<double>(transferred_) / static_cast<double>(total_));
}

bool ProgressReader::read(char *buf, std::size_t len, std::size_t &got,
                          std::string &err) {
    const bool ok = inner_.read(buf, len, got, err);
    tracker_.credit(got);
    return ok;
}

bool ProgressWriter::write(const char *buf, std::size_t len, std::string &err) {
    // A failed write is not credited: the sink did not take the bytes.
    if (!inner_.write(buf, len, err))
        return false;
    tracker_.credit(len);
    return true;
}

} // namespace scpbridge
