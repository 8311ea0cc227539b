// SCP control-line codec: status responses, "C" file headers, "T" time
// lines and the remote command lines that start each side of a transfer.
#pragma once
#include "ByteStream.hpp"
#include "ScpTypes.hpp"

#include <cstdint>
#include <string>

namespace scpbridge {

enum class ResponseType {
    Success,    // 0x00
    Warning,    // 0x01, non-fatal
    Failure,    // 0x02, fatal
    NonProtocol // any other leading byte ("C...", "T...", stray text)
};

class Response {
public:
    Response() = default;
    Response(char code, std::string message);

    // Reads one response from the peer. 0x00 is returned without consuming
    // anything else; other codes consume the rest of the line.
    static bool parse(ByteReader &in, Response &out, std::string &err);

    ResponseType type() const { return type_; }
    char code() const { return code_; }
    const std::string &message() const { return message_; }

    // Full line for metadata parsing: code byte followed by the message.
    std::string line() const;

    bool isSuccess() const { return type_ == ResponseType::Success; }
    bool isWarning() const { return type_ == ResponseType::Warning; }
    // Fatality depends on the status byte only, an empty message still fails.
    bool isFailure() const { return type_ == ResponseType::Failure; }
    bool isNonProtocol() const { return type_ == ResponseType::NonProtocol; }

private:
    ResponseType type_ = ResponseType::Success;
    char code_ = '\0';
    std::string message_;
};

enum class CommandMode { Upload, Download, DownloadPreserve };

// Writes the single 0x00 acknowledgement byte.
bool ack(ByteWriter &out, std::string &err);

// Reads one response and turns a Failure into a Protocol error carrying the
// peer text verbatim. Warnings go to warning_cb and do not fail.
bool checkResponse(ByteReader &in, TransferError &err,
                   const WarningCB &warning_cb = {});

// "C<mode-octal> <size> <name>"
bool parseFileInfos(const std::string &line, FileInfos &out, TransferError &err);

// "T<mtime> <unused> <atime> <unused>"
bool parseFileTime(const std::string &line, FileInfos &out, TransferError &err);

// Octal permission text such as "0644".
bool parsePermissions(const std::string &text, std::uint32_t &mode,
                      TransferError &err);

std::string encodeFileHeader(std::uint32_t mode, std::uint64_t size,
                             const std::string &name);
std::string encodeFileTime(std::int64_t mtime, std::int64_t atime);

// Last element of a remote path; "." for an empty path.
std::string remoteBaseName(const std::string &path);

// POSIX single-quote quoting for the remote shell. Quoting does not make
// arbitrary paths safe to hand to a remote shell: callers decide which
// paths they accept.
std::string shellQuote(const std::string &path);

std::string buildCommand(const std::string &remoteBinary, CommandMode mode,
                         const std::string &remotePath);

} // namespace scpbridge
