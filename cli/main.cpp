// scpbridge command-line front-end: connects over libssh2 and runs one
// single-file SCP transfer, then prints the resulting metadata.
#include "CliConfig.hpp"
#include "scpbridge/Libssh2Connection.hpp"
#include "scpbridge/RuntimeLogging.hpp"
#include "scpbridge/ScpClient.hpp"

#include <QCoreApplication>
#include <QLoggingCategory>
#include <QString>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

Q_LOGGING_CATEGORY(ocCli, "scpbridge.cli")

static volatile std::sig_atomic_t g_interrupted = 0;

static void onSignal(int) {
    g_interrupted = 1;
}

static QString logPath(const QString &path) {
    return QString::fromStdString(scpbridge::redactForLog(path.toStdString()));
}

static bool confirmHostKey(const std::string &host, std::uint16_t port,
                           const std::string &algorithm,
                           const std::string &fingerprint) {
    std::cerr << "The authenticity of host '" << host << ":" << port
              << "' can't be established.\n"
              << algorithm << " key fingerprint is " << fingerprint << ".\n"
              << "Add it to known_hosts and continue? [y/N] " << std::flush;
    std::string answer;
    if (!std::getline(std::cin, answer))
        return false;
    return answer == "y" || answer == "Y" || answer == "yes";
}

static void printProgress(double fraction) {
    std::fprintf(stderr, "\r%5.1f%%", fraction * 100.0);
    if (fraction >= 1.0)
        std::fputc('\n', stderr);
    std::fflush(stderr);
}

static void printInfos(const scpbridge::FileInfos &infos) {
    std::printf("name:        %s\n", infos.name.c_str());
    std::printf("size:        %llu\n", static_cast<unsigned long long>(infos.size));
    std::printf("permissions: %04o\n", static_cast<unsigned>(infos.permissions));
    if (infos.mtime)
        std::printf("mtime:       %lld\n", static_cast<long long>(*infos.mtime));
    if (infos.atime)
        std::printf("atime:       %lld\n", static_cast<long long>(*infos.atime));
}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("scpbridge");
    QCoreApplication::setOrganizationName("scpbridge");

    CliConfig cfg;
    QString cfgErr;
    if (!loadCliConfig(QCoreApplication::arguments(), cfg, cfgErr)) {
        std::fprintf(stderr, "scpbridge: %s\n", qPrintable(cfgErr));
        return 2;
    }
    if (cfg.showHelp) {
        std::fputs(qPrintable(cfg.helpText), stdout);
        return 0;
    }

    cfg.session.hostkey_confirm_cb = confirmHostKey;
    cfg.client.warning_cb = [](const std::string &msg) {
        qCWarning(ocCli) << "remote warning:" << QString::fromStdString(msg);
    };

    auto conn = std::make_shared<scpbridge::Libssh2Connection>();
    std::string connErr;
    qCInfo(ocCli) << "connecting"
                  << "host=" << QString::fromStdString(scpbridge::redactForLog(cfg.session.host))
                  << "port=" << cfg.session.port;
    if (!conn->connect(cfg.session, connErr)) {
        qCWarning(ocCli) << "connect failed:" << QString::fromStdString(connErr);
        std::fprintf(stderr, "scpbridge: %s\n", connErr.c_str());
        return 1;
    }
    saveCliDefaults(cfg);

    // Ctrl-C cancels the running transfer; the watcher turns the signal
    // flag into a token cancel outside of signal context.
    scpbridge::CancelToken token;
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    std::atomic<bool> done{false};
    std::thread watcher([&token, &done]() {
        while (!done.load()) {
            if (g_interrupted) {
                token.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    scpbridge::ScpClient client(conn, cfg.client);
    scpbridge::TransferError err;
    scpbridge::ProgressCB progress;
    if (cfg.progress)
        progress = printProgress;

    bool ok = false;
    scpbridge::FileInfos infos;
    const auto started = std::chrono::steady_clock::now();
    if (cfg.command == CliConfig::Command::Put) {
        qCInfo(ocCli) << "upload begin"
                      << "local=" << logPath(cfg.source)
                      << "remote=" << logPath(cfg.destination);
        ok = client.copyFromFile(token, cfg.source.toStdString(),
                                 cfg.destination.toStdString(),
                                 cfg.mode.toStdString(), err, progress);
    } else {
        qCInfo(ocCli) << "download begin"
                      << "remote=" << logPath(cfg.source)
                      << "local=" << logPath(cfg.destination)
                      << "preserve=" << cfg.preserve;
        ok = client.copyFromRemoteToFile(token, cfg.destination.toStdString(),
                                         cfg.source.toStdString(), cfg.preserve,
                                         infos, err, progress);
    }
    const auto elapsedMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                               std::chrono::steady_clock::now() - started)
                               .count();

    done = true;
    watcher.join();
    conn->disconnect();

    if (!ok) {
        qCWarning(ocCli) << "transfer failed"
                         << "kind=" << scpbridge::errorKindName(err.kind)
                         << "elapsedMs=" << elapsedMs;
        std::fprintf(stderr, "scpbridge: %s error: %s\n",
                     scpbridge::errorKindName(err.kind), err.message.c_str());
        return err.kind == scpbridge::ErrorKind::Cancellation ? 130 : 1;
    }
    qCInfo(ocCli) << "transfer finished" << "elapsedMs=" << elapsedMs;
    if (cfg.command == CliConfig::Command::Get)
        printInfos(infos);
    return 0;
}
