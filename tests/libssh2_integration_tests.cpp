// Integration tests for the libssh2 session provider against a real SSH
// server with scp installed. The test is skipped (exit code 77) unless the
// required SCPBRIDGE_IT_* env vars exist.
#include "scpbridge/Libssh2Connection.hpp"
#include "scpbridge/ScpClient.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

constexpr int kSkipExitCode = 77;

struct TestContext {
    int failures = 0;

    void check(bool cond, const std::string &msg) {
        if (!cond) {
            ++failures;
            std::cerr << "[FAIL] " << msg << "\n";
        }
    }
};

std::optional<std::string> envValue(const char *key) {
    const char *raw = std::getenv(key);
    if (!raw || !*raw)
        return std::nullopt;
    return std::string(raw);
}

std::string uniqueToken() {
    const auto now =
        std::chrono::steady_clock::now().time_since_epoch().count();
    return std::to_string(static_cast<long long>(now));
}

std::string joinRemotePath(const std::string &base, const std::string &name) {
    if (base.empty())
        return std::string("/") + name;
    if (base.back() == '/')
        return base + name;
    return base + "/" + name;
}

bool readFile(const fs::path &p, std::string &out) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open())
        return false;
    out.assign(std::istreambuf_iterator<char>(in),
               std::istreambuf_iterator<char>());
    return true;
}

bool parsePort(const std::optional<std::string> &raw, std::uint16_t &out) {
    if (!raw.has_value()) {
        out = 22;
        return true;
    }
    try {
        const int n = std::stoi(*raw);
        if (n < 1 || n > 65535)
            return false;
        out = static_cast<std::uint16_t>(n);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

} // namespace

int main() {
    const auto host = envValue("SCPBRIDGE_IT_SSH_HOST");
    const auto user = envValue("SCPBRIDGE_IT_SSH_USER");
    const auto pass = envValue("SCPBRIDGE_IT_SSH_PASS");
    const auto keyPath = envValue("SCPBRIDGE_IT_SSH_KEY");
    const auto keyPassphrase = envValue("SCPBRIDGE_IT_SSH_KEY_PASSPHRASE");
    const std::string remoteBase =
        envValue("SCPBRIDGE_IT_REMOTE_BASE").value_or("/tmp");

    if (!host.has_value() || !user.has_value() ||
        (!pass.has_value() && !keyPath.has_value())) {
        std::cout << "[SKIP] scpbridge_libssh2_integration_tests requires env vars: "
                  << "SCPBRIDGE_IT_SSH_HOST, SCPBRIDGE_IT_SSH_USER and one "
                     "auth method "
                  << "(SCPBRIDGE_IT_SSH_PASS or SCPBRIDGE_IT_SSH_KEY)\n";
        return kSkipExitCode;
    }
    if (keyPath.has_value() && !fs::exists(*keyPath)) {
        std::cerr << "[FAIL] SCPBRIDGE_IT_SSH_KEY does not exist: " << *keyPath
                  << "\n";
        return EXIT_FAILURE;
    }

    std::uint16_t port = 22;
    if (!parsePort(envValue("SCPBRIDGE_IT_SSH_PORT"), port)) {
        std::cerr << "[FAIL] SCPBRIDGE_IT_SSH_PORT is invalid\n";
        return EXIT_FAILURE;
    }

    TestContext t;
    scpbridge::SessionOptions opt;
    opt.host = *host;
    opt.port = port;
    opt.username = *user;
    if (pass.has_value())
        opt.password = *pass;
    if (keyPath.has_value()) {
        opt.private_key_path = *keyPath;
        if (keyPassphrase.has_value())
            opt.private_key_passphrase = *keyPassphrase;
    }
    opt.known_hosts_policy = scpbridge::KnownHostsPolicy::Off;

    const std::string token = uniqueToken();
    const std::string remoteFile =
        joinRemotePath(remoteBase, "scpbridge-it-" + token + ".txt");
    const std::string remoteMissing =
        joinRemotePath(remoteBase, "scpbridge-it-" + token + "-missing.txt");

    const fs::path localTmpRoot =
        fs::temp_directory_path() / ("scpbridge-it-" + token);
    std::error_code ec;
    fs::create_directories(localTmpRoot, ec);
    if (ec) {
        std::cerr << "[FAIL] could not create temp dir: " << ec.message()
                  << "\n";
        return EXIT_FAILURE;
    }

    const fs::path localSrc = localTmpRoot / "payload.txt";
    const fs::path localDst = localTmpRoot / "payload-downloaded.txt";
    const std::string payload = "scpbridge integration payload\nline-2\n";
    {
        std::ofstream out(localSrc, std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "[FAIL] could not create source file\n";
            fs::remove_all(localTmpRoot, ec);
            return EXIT_FAILURE;
        }
        out << payload;
    }

    auto conn = std::make_shared<scpbridge::Libssh2Connection>();
    std::string connErr;
    const bool connected = conn->connect(opt, connErr);
    t.check(connected, std::string("connect should succeed: ") + connErr);

    scpbridge::ClientOptions copt;
    copt.timeout = std::chrono::seconds(60);
    scpbridge::ScpClient client(conn, copt);
    scpbridge::CancelToken cancel;
    scpbridge::TransferError err;

    if (t.failures == 0) {
        t.check(client.copyFromFile(cancel, localSrc.string(), remoteFile, "0640", err),
                "upload should succeed: " + err.message);
    }
    if (t.failures == 0) {
        std::ostringstream sink;
        err.clear();
        t.check(client.copyFromRemote(cancel, sink, remoteFile, err),
                "download should succeed: " + err.message);
        t.check(sink.str() == payload,
                "downloaded content should match uploaded payload");
    }
    if (t.failures == 0) {
        scpbridge::FileInfos infos;
        err.clear();
        t.check(client.copyFromRemoteToFile(cancel, localDst.string(), remoteFile,
                                            true, infos, err),
                "preserve download should succeed: " + err.message);
        std::string downloaded;
        t.check(readFile(localDst, downloaded) && downloaded == payload,
                "preserved file content should match");
        t.check(infos.size == payload.size(), "preserved size should match");
        t.check(infos.permissions == 0640, "preserved permissions should match");
        t.check(infos.mtime.has_value() && infos.atime.has_value(),
                "preserve download should return times");
    }
    if (t.failures == 0) {
        std::ostringstream sink;
        err.clear();
        t.check(!client.copyFromRemote(cancel, sink, remoteMissing, err),
                "download of a missing file should fail");
        // OpenSSH reports it as 0x01 followed by exit status 1, others as 0x02.
        t.check(err.isSet(), "missing file should leave an error");
    }
    if (t.failures == 0) {
        // Zero-length overwrite leaves the least behind; scp cannot delete.
        std::istringstream empty("");
        err.clear();
        t.check(client.copyFile(cancel, empty, remoteFile, "0600", err),
                "zero-size upload should succeed: " + err.message);
    }

    conn->disconnect();
    fs::remove_all(localTmpRoot, ec);

    if (t.failures != 0) {
        std::cerr << "[FAILURES] " << t.failures << "\n";
        return EXIT_FAILURE;
    }
    std::cout << "[OK] scpbridge_libssh2_integration_tests\n";
    return EXIT_SUCCESS;
}
