// Basic types shared between the transfer engine, session backends and CLI.
// Keeping these structures simple makes them easy to pass across threads.
#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scpbridge {

// Kind of failure that ended a transfer.
enum class ErrorKind {
    None,
    Transport,    // stream read/write failure, short source or sink
    Protocol,     // peer sent a Failure response (message is the peer text)
    Format,       // unparseable header/time line or permissions
    Cancellation, // token cancelled or deadline exceeded
    Process       // remote command failed to start or exited non-zero
};

const char *errorKindName(ErrorKind kind);

struct TransferError {
    ErrorKind kind = ErrorKind::None;
    std::string message;

    bool isSet() const { return kind != ErrorKind::None; }
    void set(ErrorKind k, std::string msg) {
        kind = k;
        message = std::move(msg);
    }
    void clear() {
        kind = ErrorKind::None;
        message.clear();
    }
};

// Metadata of a transferred file, built from a "C" header and, in preserve
// mode, merged with the preceding "T" line.
struct FileInfos {
    std::string   message;          // raw header text as received
    std::string   name;             // base name, never contains '/'
    std::uint64_t size = 0;         // bytes
    std::uint32_t permissions = 0;  // POSIX permission bits
    std::optional<std::int64_t> mtime; // epoch (seconds)
    std::optional<std::int64_t> atime; // epoch (seconds)

    // Copies the timestamps of a parsed time line into this header.
    void update(const FileInfos &times) {
        mtime = times.mtime;
        atime = times.atime;
    }
};

// Fraction transferred, 0..1. Only invoked when the total size is known.
using ProgressCB = std::function<void(double)>;

// Receives the text of non-fatal 0x01 responses from the peer.
using WarningCB = std::function<void(const std::string &)>;

struct ClientOptions {
    // Path or name of the scp binary on the remote host.
    std::string remote_binary = "scp";
    // Upper bound for a single transfer call; zero disables it. Combined with
    // the caller's token, whichever fires first.
    std::chrono::milliseconds timeout{0};
    WarningCB warning_cb;
};

// known_hosts validation policy for the server host key.
enum class KnownHostsPolicy {
    Strict,     // Requires exact match with known_hosts.
    AcceptNew,  // TOFU: accept and save new hosts; reject key changes.
    Off         // No verification (not recommended).
};

// Callback to answer keyboard-interactive prompts.
// Must return true and fill "responses" with one entry per prompt if the user provided input.
// If it returns false, the backend uses a heuristic (username/password) as a fallback.
using KbdIntPromptsCB = std::function<bool(const std::string &name,
                                           const std::string &instruction,
                                           const std::vector<std::string> &prompts,
                                           std::vector<std::string> &responses)>;

struct SessionOptions {
    std::string host;
    std::uint16_t port = 22;
    std::string username;

    std::optional<std::string> password;
    std::optional<std::string> private_key_path;
    std::optional<std::string> private_key_passphrase;

    // SSH security
    std::optional<std::string> known_hosts_path; // default: ~/.ssh/known_hosts
    KnownHostsPolicy known_hosts_policy = KnownHostsPolicy::Strict;

    // Host key confirmation (TOFU) when known_hosts lacks an entry.
    // Return true to accept and save, false to reject.
    std::function<bool(const std::string &host,
                       std::uint16_t port,
                       const std::string &algorithm,
                       const std::string &fingerprint)> hostkey_confirm_cb;

    // Custom handling for keyboard-interactive (e.g., OTP/2FA). Optional.
    KbdIntPromptsCB keyboard_interactive_cb;
};

} // namespace scpbridge
