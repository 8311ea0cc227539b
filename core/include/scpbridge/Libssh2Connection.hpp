// SessionProvider implementation using libssh2.
// Encapsulates the TCP socket and the SSH session; every transfer gets its
// own exec channel on it.
#pragma once
#include "RemoteSession.hpp"
#include "ScpTypes.hpp"

#include <cstdint>
#include <memory>
#include <string>

// Forward declarations of libssh2 internal types (with leading underscore)
struct _LIBSSH2_SESSION;

namespace scpbridge {

struct Libssh2IoState;

class Libssh2Connection : public SessionProvider {
public:
    Libssh2Connection();
    ~Libssh2Connection() override;

    Libssh2Connection(const Libssh2Connection &) = delete;
    Libssh2Connection &operator=(const Libssh2Connection &) = delete;

    bool connect(const SessionOptions &opt, std::string &err);
    // Sessions handed out by newSession() that are still alive afterwards
    // fail every call and no longer touch libssh2.
    void disconnect();
    bool isConnected() const { return connected_; }

    std::shared_ptr<RemoteSession> newSession(std::string &err) override;

private:
    bool connected_ = false;
    int sock_ = -1;
    _LIBSSH2_SESSION *session_ = nullptr;
    // Shared with the exec channels of this connection.
    std::shared_ptr<Libssh2IoState> io_;

    // TCP connection + SSH handshake, host key check and authentication.
    bool tcpConnect(const std::string &host, std::uint16_t port, std::string &err);
    bool sshHandshakeAuth(const SessionOptions &opt, std::string &err);
    bool verifyHostKey(const SessionOptions &opt, std::string &err);
    bool authenticate(const SessionOptions &opt, std::string &err);
};

} // namespace scpbridge
