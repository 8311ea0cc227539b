// Abstract remote command execution. Concrete backends (e.g. libssh2, the
// in-memory mock) implement this API so the transfer engine stays decoupled
// from how the authenticated channel was established.
#pragma once
#include "ByteStream.hpp"

#include <memory>
#include <string>

namespace scpbridge {

// One remote command on an authenticated connection. Used for exactly one
// transfer; its streams are owned by that transfer while it runs.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Start the remote command (already quoted as needed).
    virtual bool start(const std::string &command, std::string &err) = 0;

    // Remote standard input. close() sends EOF.
    virtual ByteWriter &input() = 0;

    // Remote standard output.
    virtual ByteReader &output() = 0;

    // Block until the remote process exits. A non-zero exit status is an error.
    virtual bool wait(std::string &err) = 0;

    // Tear the session down. Pending reads, writes and wait() return with an
    // error. Safe to call more than once and from any thread.
    virtual void close() = 0;
};

class SessionProvider {
public:
    virtual ~SessionProvider() = default;

    // Open a new command session on the underlying connection.
    virtual std::shared_ptr<RemoteSession> newSession(std::string &err) = 0;
};

} // namespace scpbridge
