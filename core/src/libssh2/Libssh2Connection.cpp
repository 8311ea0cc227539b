// libssh2 backend: manages the TCP socket, the SSH session and one exec
// channel per transfer. Includes keepalive and known_hosts validation.
#include "scpbridge/Libssh2Connection.hpp"
#include <libssh2.h>

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace scpbridge {

// Global libssh2 initialization (once per process)
static std::once_flag g_libssh2_once;

// Context for keyboard-interactive: answers with username/password by prompt
struct KbdIntCtx {
    const char *user;
    const char *pass;
    const KbdIntPromptsCB *cb; // optional prompt callback
};

static char *dupResponse(const std::string &s, unsigned int &len) {
    len = 0;
    if (s.empty())
        return nullptr;
    char *buf = static_cast<char *>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    len = static_cast<unsigned int>(s.size());
    return buf;
}

// Keyboard-interactive callback: let the caller answer, else fall back to a
// username/password heuristic on the prompt text.
static void kbint_password_callback(const char *name, int name_len,
                                    const char *instruction, int instruction_len,
                                    int num_prompts,
                                    const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                                    LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                                    void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);

    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> ptxts;
        ptxts.reserve(static_cast<size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char *pt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
            ptxts.emplace_back(pt);
        }
        std::vector<std::string> answers;
        std::string nm = (name && name_len > 0) ? std::string(name, static_cast<size_t>(name_len)) : std::string();
        std::string ins = (instruction && instruction_len > 0)
                              ? std::string(instruction, static_cast<size_t>(instruction_len))
                              : std::string();
        if ((*(ctx->cb))(nm, ins, ptxts, answers) &&
            static_cast<int>(answers.size()) >= num_prompts) {
            for (int i = 0; i < num_prompts; ++i)
                responses[i].text = dupResponse(answers[static_cast<size_t>(i)], responses[i].length);
            return;
        }
        // the callback could not answer: fall back to the heuristic
    }
    const std::string user = ctx->user ? ctx->user : "";
    const std::string pass = ctx->pass ? ctx->pass : "";
    for (int i = 0; i < num_prompts; ++i) {
        std::string prompt = (prompts && prompts[i].text)
                                 ? std::string(reinterpret_cast<const char *>(prompts[i].text),
                                               prompts[i].length)
                                 : std::string();
        for (char &c : prompt) {
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        }
        const bool wantUser = prompt.find("user") != std::string::npos ||
                              prompt.find("name") != std::string::npos;
        responses[i].text = dupResponse(wantUser ? user : pass, responses[i].length);
    }
}

static std::string lastSessionError(LIBSSH2_SESSION *s) {
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(s, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, static_cast<size_t>(len)) : std::string();
}

// Wait until the socket is ready in the direction libssh2 is blocked on.
static void waitSocket(int sock, int directions) {
    struct pollfd pfd{};
    pfd.fd = sock;
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND)
        pfd.events |= POLLIN;
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND)
        pfd.events |= POLLOUT;
    if (pfd.events == 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        return;
    }
    // Short timeout so a concurrent close() is noticed quickly.
    (void)::poll(&pfd, 1, 50);
}

// libssh2 sessions are not thread-safe: every call on a connection and its
// channels holds mtx. live drops to false once the session is freed.
struct Libssh2IoState {
    std::mutex mtx;
    bool live = false;
};

namespace {

// One remote command on an exec channel. The connection runs in non-blocking
// mode; calls are retried on EAGAIN with the connection mutex released while
// waiting on the socket, so the protocol unit and the exit waiter interleave.
class Libssh2ExecSession : public RemoteSession {
public:
    Libssh2ExecSession(LIBSSH2_SESSION *session, int sock,
                       std::shared_ptr<Libssh2IoState> io)
        : session_(session), sock_(sock), io_(std::move(io)),
          input_(*this), output_(*this) {}

    ~Libssh2ExecSession() override {
        close();
        if (!channel_)
            return;
        long rc = 0;
        // Bounded: a dead socket must not hang the destructor.
        for (int i = 0; i < 100; ++i) {
            int dir = 0;
            {
                std::lock_guard<std::mutex> lk(io_->mtx);
                // libssh2_session_free already released the channel.
                if (!io_->live)
                    break;
                rc = libssh2_channel_free(channel_);
                dir = libssh2_session_block_directions(session_);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN)
                break;
            waitSocket(sock_, dir);
        }
        channel_ = nullptr;
    }

    bool start(const std::string &command, std::string &err) override {
        long rc = 0;
        if (!retry([this]() -> long {
                    channel_ = libssh2_channel_open_session(session_);
                    if (channel_)
                        return 0;
                    return libssh2_session_last_errno(session_);
                }, rc, err))
            return false;
        if (rc != 0) {
            err = "channel open failed: " + lastSessionError(session_);
            return false;
        }
        // Remote stderr is not part of the protocol stream.
        if (!retry([this]() -> long {
                    return libssh2_channel_handle_extended_data2(
                        channel_, LIBSSH2_CHANNEL_EXTENDED_DATA_IGNORE);
                }, rc, err))
            return false;
        if (!retry([this, &command]() -> long {
                    return libssh2_channel_exec(channel_, command.c_str());
                }, rc, err))
            return false;
        if (rc != 0) {
            err = "channel exec failed: " + lastSessionError(session_);
            return false;
        }
        return true;
    }

    ByteWriter &input() override { return input_; }
    ByteReader &output() override { return output_; }

    bool wait(std::string &err) override {
        if (!channel_) {
            err = "session not started";
            return false;
        }
        long rc = 0;
        if (!retry([this]() -> long { return libssh2_channel_wait_eof(channel_); }, rc, err))
            return false;
        if (rc != 0) {
            err = "waiting for remote EOF failed: " + lastSessionError(session_);
            return false;
        }
        if (!retry([this]() -> long { return libssh2_channel_wait_closed(channel_); }, rc, err))
            return false;
        if (rc != 0) {
            err = "waiting for remote close failed: " + lastSessionError(session_);
            return false;
        }

        std::lock_guard<std::mutex> lk(io_->mtx);
        if (!io_->live) {
            err = "connection closed";
            return false;
        }
        char *sig = nullptr;
        size_t sigLen = 0;
        libssh2_channel_get_exit_signal(channel_, &sig, &sigLen, nullptr, nullptr,
                                        nullptr, nullptr);
        if (sig) {
            err = "remote command killed by signal " + std::string(sig, sigLen);
            libssh2_free(session_, sig);
            return false;
        }
        const int status = libssh2_channel_get_exit_status(channel_);
        if (status != 0) {
            err = "remote command exited with status " + std::to_string(status);
            return false;
        }
        return true;
    }

    void close() override {
        if (closed_.exchange(true))
            return;
        std::lock_guard<std::mutex> lk(io_->mtx);
        if (channel_ && io_->live)
            (void)libssh2_channel_close(channel_);
    }

private:
    class Writer : public ByteWriter {
    public:
        explicit Writer(Libssh2ExecSession &s) : s_(s) {}

        bool write(const char *buf, std::size_t len, std::string &err) override {
            while (len > 0) {
                long rc = 0;
                if (!s_.retry([this, buf, len]() -> long {
                            return static_cast<long>(libssh2_channel_write(s_.channel_, buf, len));
                        }, rc, err))
                    return false;
                if (rc < 0) {
                    err = "remote write failed: " + lastSessionError(s_.session_);
                    return false;
                }
                buf += rc;
                len -= static_cast<std::size_t>(rc);
            }
            return true;
        }

        void close() override {
            long rc = 0;
            std::string err;
            (void)s_.retry([this]() -> long { return libssh2_channel_send_eof(s_.channel_); },
                           rc, err);
        }

    private:
        Libssh2ExecSession &s_;
    };

    class Reader : public ByteReader {
    public:
        explicit Reader(Libssh2ExecSession &s) : s_(s) {}

        bool read(char *buf, std::size_t len, std::size_t &got,
                  std::string &err) override {
            got = 0;
            long rc = 0;
            if (!s_.retry([this, buf, len]() -> long {
                        const long n = static_cast<long>(libssh2_channel_read(s_.channel_, buf, len));
                        // Zero without EOF means nothing buffered yet.
                        if (n == 0 && !libssh2_channel_eof(s_.channel_))
                            return LIBSSH2_ERROR_EAGAIN;
                        return n;
                    }, rc, err))
                return false;
            if (rc < 0) {
                err = "remote read failed: " + lastSessionError(s_.session_);
                return false;
            }
            got = static_cast<std::size_t>(rc);
            return true;
        }

    private:
        Libssh2ExecSession &s_;
    };

    // Runs fn under the connection mutex until it stops returning EAGAIN.
    // Returns false once the session has been closed.
    bool retry(const std::function<long()> &fn, long &rc, std::string &err) {
        for (;;) {
            int dir = 0;
            {
                std::lock_guard<std::mutex> lk(io_->mtx);
                if (closed_.load()) {
                    err = "session closed";
                    return false;
                }
                if (!io_->live) {
                    err = "connection closed";
                    return false;
                }
                rc = fn();
                dir = libssh2_session_block_directions(session_);
            }
            if (rc != LIBSSH2_ERROR_EAGAIN)
                return true;
            waitSocket(sock_, dir);
        }
    }

    LIBSSH2_SESSION *session_ = nullptr;
    int sock_ = -1;
    std::shared_ptr<Libssh2IoState> io_;
    LIBSSH2_CHANNEL *channel_ = nullptr;
    std::atomic<bool> closed_{false};
    Writer input_;
    Reader output_;
};

} // namespace

Libssh2Connection::Libssh2Connection() : io_(std::make_shared<Libssh2IoState>()) {
    std::call_once(g_libssh2_once, []() { (void)libssh2_init(0); });
}

Libssh2Connection::~Libssh2Connection() {
    disconnect();
}

bool Libssh2Connection::tcpConnect(const std::string &host, std::uint16_t port,
                                   std::string &err) {
    struct addrinfo hints{};
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    char portStr[16];
    std::snprintf(portStr, sizeof(portStr), "%u", static_cast<unsigned>(port));

    struct addrinfo *res = nullptr;
    int gai = getaddrinfo(host.c_str(), portStr, &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // TCP keepalive so half-dead peers are noticed during long transfers
        int opt = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &opt, sizeof(opt));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to host/port.";
    return false;
}

bool Libssh2Connection::verifyHostKey(const SessionOptions &opt, std::string &err) {
    if (opt.known_hosts_policy == KnownHostsPolicy::Off)
        return true;

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt.known_hosts_path.has_value()) {
        khPath = *opt.known_hosts_path;
    } else {
        const char *home = std::getenv("HOME");
        if (home)
            khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = (libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0);
    if (!khLoaded && opt.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts not available or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not get host key";
        return false;
    }

    int alg = 0;
    std::string algName;
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHRSA;
        algName = "RSA";
        break;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        alg = LIBSSH2_KNOWNHOST_KEY_SSHDSS;
        algName = "DSA";
        break;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
        algName = "ECDSA-256";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
        algName = "ECDSA-384";
        break;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        alg = LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
        algName = "ECDSA-521";
        break;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        alg = LIBSSH2_KNOWNHOST_KEY_ED25519;
        algName = "ED25519";
        break;
#endif
    default:
        algName = "UNKNOWN";
        break;
    }

    const int typemask_plain = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
    const int typemask_hash = LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;

    struct libssh2_knownhost *host = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_plain, &host);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt.host.c_str(), opt.port,
                                         hostkey, keylen, typemask_hash, &host);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (opt.known_hosts_policy == KnownHostsPolicy::AcceptNew &&
        check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND) {
        // TOFU: ask for confirmation when a callback exists
        std::string fpStr;
        const unsigned char *h = reinterpret_cast<const unsigned char *>(
            libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256));
        if (h) {
            std::ostringstream oss;
            oss << "SHA256:";
            for (int i = 0; i < 32; ++i) {
                if (i)
                    oss << ':';
                char b[4];
                std::snprintf(b, sizeof(b), "%02X", static_cast<unsigned>(h[i]));
                oss << b;
            }
            fpStr = oss.str();
        }
        const bool confirmed =
            opt.hostkey_confirm_cb && opt.hostkey_confirm_cb(opt.host, opt.port, algName, fpStr);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path not defined";
            return false;
        }
        const int addMask = LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg;
        const int addrc = libssh2_knownhost_addc(nh, opt.host.c_str(), nullptr,
                                                 hostkey, keylen,
                                                 nullptr, 0, addMask, nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add/write host in known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        return true;
    }

    libssh2_knownhost_free(nh);
    // A key mismatch always fails; an unknown host fails unless AcceptNew handled it above.
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Unknown host in known_hosts";
    return false;
}

bool Libssh2Connection::authenticate(const SessionOptions &opt, std::string &err) {
    // 1) Explicit private key first.
    if (opt.private_key_path.has_value()) {
        const char *passphrase =
            opt.private_key_passphrase ? opt.private_key_passphrase->c_str() : nullptr;
        const int rc = libssh2_userauth_publickey_fromfile(session_,
                                                           opt.username.c_str(),
                                                           nullptr, // derived from the private key
                                                           opt.private_key_path->c_str(),
                                                           passphrase);
        if (rc != 0) {
            err = "Key authentication failed: " + lastSessionError(session_);
            return false;
        }
        return true;
    }

    std::string authlist;
    auto hasMethod = [&](const char *m) {
        return !authlist.empty() && authlist.find(m) != std::string::npos;
    };
    auto loadAuthList = [&]() {
        if (!authlist.empty())
            return;
        char *methods = libssh2_userauth_list(session_, opt.username.c_str(),
                                              static_cast<unsigned>(opt.username.size()));
        authlist = methods ? std::string(methods) : std::string();
    };

    // 2) Password, then keyboard-interactive with the same secret.
    if (opt.password.has_value()) {
        int rc_pw = libssh2_userauth_password(session_, opt.username.c_str(),
                                              opt.password->c_str());
        if (rc_pw == 0)
            return true;
        if (rc_pw == LIBSSH2_ERROR_SOCKET_DISCONNECT ||
            rc_pw == LIBSSH2_ERROR_SOCKET_SEND ||
            rc_pw == LIBSSH2_ERROR_SOCKET_RECV) {
            err = "Server closed the connection after password attempt";
            return false;
        }
        loadAuthList();
        if (hasMethod("keyboard-interactive")) {
            KbdIntCtx ctx{opt.username.c_str(), opt.password->c_str(),
                          &opt.keyboard_interactive_cb};
            void **abs = libssh2_session_abstract(session_);
            if (abs)
                *abs = &ctx;
            const int rc_kbd = libssh2_userauth_keyboard_interactive(
                session_, opt.username.c_str(), kbint_password_callback);
            if (abs)
                *abs = nullptr;
            if (rc_kbd == 0)
                return true;
        }
    }

    // 3) ssh-agent as a last resort, with a conservative identity limit.
    loadAuthList();
    if (hasMethod("publickey")) {
        bool authed = false;
        LIBSSH2_AGENT *agent = libssh2_agent_init(session_);
        if (agent && libssh2_agent_connect(agent) == 0 &&
            libssh2_agent_list_identities(agent) == 0) {
            struct libssh2_agent_publickey *identity = nullptr;
            struct libssh2_agent_publickey *prev = nullptr;
            int tries = 0;
            const int kMaxAgentTries = 3;
            while (tries < kMaxAgentTries &&
                   libssh2_agent_get_identity(agent, &identity, prev) == 0) {
                prev = identity;
                ++tries;
                if (libssh2_agent_userauth(agent, opt.username.c_str(), identity) == 0) {
                    authed = true;
                    break;
                }
            }
        }
        if (agent) {
            libssh2_agent_disconnect(agent);
            libssh2_agent_free(agent);
        }
        if (authed)
            return true;
    }

    const std::string lastErr = lastSessionError(session_);
    err = std::string("Authentication failed") +
          (authlist.empty() ? std::string() : (" (methods: " + authlist + ")")) +
          (lastErr.empty() ? std::string() : (": " + lastErr));
    return false;
}

bool Libssh2Connection::sshHandshakeAuth(const SessionOptions &opt, std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }

    // Blocking mode and a bounded timeout during handshake and auth
    libssh2_session_set_blocking(session_, 1);
    libssh2_session_set_timeout(session_, 20000); // 20s

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError(session_);
        return false;
    }

    // SSH keepalive: ask libssh2 to send messages every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);

    if (!verifyHostKey(opt, err))
        return false;
    if (!authenticate(opt, err))
        return false;

    // Exec channels interleave a reader and an exit waiter on this session.
    libssh2_session_set_blocking(session_, 0);
    return true;
}

bool Libssh2Connection::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty() || opt.username.empty()) {
        err = "Host and username are required";
        return false;
    }
    if (!tcpConnect(opt.host, opt.port, err))
        return false;
    if (!sshHandshakeAuth(opt, err)) {
        disconnect();
        return false;
    }
    {
        std::lock_guard<std::mutex> lk(io_->mtx);
        io_->live = true;
    }
    connected_ = true;
    return true;
}

void Libssh2Connection::disconnect() {
    if (session_) {
        std::lock_guard<std::mutex> lk(io_->mtx);
        io_->live = false;
        libssh2_session_set_blocking(session_, 1);
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        std::lock_guard<std::mutex> lk(io_->mtx);
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

std::shared_ptr<RemoteSession> Libssh2Connection::newSession(std::string &err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return nullptr;
    }
    return std::make_shared<Libssh2ExecSession>(session_, sock_, io_);
}

} // namespace scpbridge
