// SCP control-line codec.
#include "scpbridge/ScpProtocol.hpp"

#include <cstdio>
#include <limits>
#include <utility>
#include <vector>

namespace scpbridge {

namespace {

constexpr char kSuccess = '\0';
constexpr char kWarning = '\1';
constexpr char kFailure = '\2';

bool parseDecimal(const std::string &tok, std::uint64_t &out) {
    if (tok.empty())
        return false;
    std::uint64_t v = 0;
    for (char c : tok) {
        if (c < '0' || c > '9')
            return false;
        const std::uint64_t d = static_cast<std::uint64_t>(c - '0');
        if (v > (std::numeric_limits<std::uint64_t>::max() - d) / 10)
            return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

bool parseOctal(const std::string &tok, std::uint32_t &out) {
    if (tok.empty() || tok.size() > 6)
        return false;
    std::uint32_t v = 0;
    for (char c : tok) {
        if (c < '0' || c > '7')
            return false;
        v = v * 8 + static_cast<std::uint32_t>(c - '0');
    }
    if (v > 07777)
        return false;
    out = v;
    return true;
}

// Splits on single spaces. With maxParts > 0 the last part keeps the
// remainder of the text, spaces included.
std::vector<std::string> splitSpaces(const std::string &s, std::size_t maxParts) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        if (maxParts > 0 && parts.size() + 1 == maxParts) {
            parts.push_back(s.substr(start));
            break;
        }
        const std::size_t sp = s.find(' ', start);
        if (sp == std::string::npos) {
            parts.push_back(s.substr(start));
            break;
        }
        parts.push_back(s.substr(start, sp - start));
        start = sp + 1;
    }
    return parts;
}

} // namespace

const char *errorKindName(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Transport:
        return "Transport";
    case ErrorKind::Protocol:
        return "Protocol";
    case ErrorKind::Format:
        return "Format";
    case ErrorKind::Cancellation:
        return "Cancellation";
    case ErrorKind::Process:
        return "Process";
    }
    return "Unknown";
}

Response::Response(char code, std::string message)
    : code_(code), message_(std::move(message)) {
    switch (code) {
    case kSuccess:
        type_ = ResponseType::Success;
        break;
    case kWarning:
        type_ = ResponseType::Warning;
        break;
    case kFailure:
        type_ = ResponseType::Failure;
        break;
    default:
        type_ = ResponseType::NonProtocol;
        break;
    }
}

bool Response::parse(ByteReader &in, Response &out, std::string &err) {
    char code = 0;
    std::size_t got = 0;
    if (!in.read(&code, 1, got, err))
        return false;
    if (got == 0) {
        err = "unexpected end of stream while waiting for response";
        return false;
    }
    if (code == kSuccess) {
        out = Response(code, std::string());
        return true;
    }
    std::string message;
    if (!readLine(in, message, err))
        return false;
    out = Response(code, std::move(message));
    return true;
}

std::string Response::line() const {
    std::string s;
    s.reserve(message_.size() + 1);
    s.push_back(code_);
    s += message_;
    return s;
}

bool ack(ByteWriter &out, std::string &err) {
    const char zero = '\0';
    return out.write(&zero, 1, err);
}

bool checkResponse(ByteReader &in, TransferError &err,
                   const WarningCB &warning_cb) {
    Response res;
    std::string ioErr;
    if (!Response::parse(in, res, ioErr)) {
        err.set(ErrorKind::Transport, ioErr);
        return false;
    }
    if (res.isFailure()) {
        err.set(ErrorKind::Protocol, res.message());
        return false;
    }
    if (res.isWarning() && warning_cb)
        warning_cb(res.message());
    return true;
}

bool parseFileInfos(const std::string &line, FileInfos &out, TransferError &err) {
    if (line.empty() || line[0] != 'C') {
        err.set(ErrorKind::Format, "expected file header, got \"" + line + "\"");
        return false;
    }
    const auto parts = splitSpaces(line.substr(1), 3);
    if (parts.size() < 3 || parts[2].empty()) {
        err.set(ErrorKind::Format, "file header is missing fields: \"" + line + "\"");
        return false;
    }
    std::uint32_t mode = 0;
    if (!parseOctal(parts[0], mode)) {
        err.set(ErrorKind::Format, "invalid file mode \"" + parts[0] + "\"");
        return false;
    }
    std::uint64_t size = 0;
    if (!parseDecimal(parts[1], size)) {
        err.set(ErrorKind::Format, "invalid file size \"" + parts[1] + "\"");
        return false;
    }
    const std::string &name = parts[2];
    if (name.find('/') != std::string::npos || name == "." || name == "..") {
        err.set(ErrorKind::Format, "unexpected file name \"" + name + "\"");
        return false;
    }
    out.message = line;
    out.permissions = mode;
    out.size = size;
    out.name = name;
    return true;
}

bool parseFileTime(const std::string &line, FileInfos &out, TransferError &err) {
    if (line.empty() || line[0] != 'T') {
        err.set(ErrorKind::Format, "expected time line, got \"" + line + "\"");
        return false;
    }
    const auto parts = splitSpaces(line.substr(1), 0);
    if (parts.size() != 4) {
        err.set(ErrorKind::Format, "time line must have 4 fields: \"" + line + "\"");
        return false;
    }
    std::uint64_t values[4] = {0, 0, 0, 0};
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (!parseDecimal(parts[i], values[i]) ||
            values[i] > static_cast<std::uint64_t>(
                            std::numeric_limits<std::int64_t>::max())) {
            err.set(ErrorKind::Format, "invalid time field \"" + parts[i] + "\"");
            return false;
        }
    }
    out.mtime = static_cast<std::int64_t>(values[0]);
    out.atime = static_cast<std::int64_t>(values[2]);
    return true;
}

bool parsePermissions(const std::string &text, std::uint32_t &mode,
                      TransferError &err) {
    if (!parseOctal(text, mode)) {
        err.set(ErrorKind::Format, "invalid permissions \"" + text + "\"");
        return false;
    }
    return true;
}

std::string encodeFileHeader(std::uint32_t mode, std::uint64_t size,
                             const std::string &name) {
    char modeStr[16];
    std::snprintf(modeStr, sizeof(modeStr), "%04o", static_cast<unsigned>(mode & 07777));
    return std::string("C") + modeStr + " " + std::to_string(size) + " " + name + "\n";
}

std::string encodeFileTime(std::int64_t mtime, std::int64_t atime) {
    return "T" + std::to_string(mtime) + " 0 " + std::to_string(atime) + " 0\n";
}

std::string remoteBaseName(const std::string &path) {
    if (path.empty())
        return ".";
    std::size_t end = path.size();
    while (end > 0 && path[end - 1] == '/')
        --end;
    if (end == 0)
        return "/";
    const std::size_t slash = path.rfind('/', end - 1);
    const std::size_t start = (slash == std::string::npos) ? 0 : slash + 1;
    return path.substr(start, end - start);
}

std::string shellQuote(const std::string &path) {
    std::string out;
    out.reserve(path.size() + 2);
    out.push_back('\'');
    for (char c : path) {
        if (c == '\'')
            out += "'\\''";
        else
            out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

std::string buildCommand(const std::string &remoteBinary, CommandMode mode,
                         const std::string &remotePath) {
    const char *flags = "";
    switch (mode) {
    case CommandMode::Upload:
        flags = " -qt ";
        break;
    case CommandMode::Download:
        flags = " -f ";
        break;
    case CommandMode::DownloadPreserve:
        flags = " -f -p ";
        break;
    }
    return remoteBinary + flags + shellQuote(remotePath);
}

} // namespace scpbridge
