#include "CliConfig.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QSettings>
#include <QtGlobal>

#include <chrono>

static bool policyFromString(const QString &raw, scpbridge::KnownHostsPolicy &out) {
    const QString v = raw.trimmed().toLower();
    if (v == "strict") {
        out = scpbridge::KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew") {
        out = scpbridge::KnownHostsPolicy::AcceptNew;
    } else if (v == "off" || v == "none") {
        out = scpbridge::KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

static QString policyToString(scpbridge::KnownHostsPolicy p) {
    switch (p) {
    case scpbridge::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case scpbridge::KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case scpbridge::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    }
    return QStringLiteral("strict");
}

bool loadCliConfig(const QStringList &args, CliConfig &cfg, QString &err) {
    QSettings s("scpbridge", "scpbridge");

    QCommandLineParser parser;
    parser.setApplicationDescription(
        "Copy a single file to or from a remote host over SCP.");
    parser.addHelpOption();
    parser.addPositionalArgument("command", "put or get");
    parser.addPositionalArgument("source", "put: local file, get: remote file");
    parser.addPositionalArgument("destination", "put: remote file, get: local file");

    const QCommandLineOption hostOpt("host", "Remote host.", "host");
    const QCommandLineOption portOpt("port", "SSH port.", "port");
    const QCommandLineOption userOpt("user", "SSH user name.", "user");
    const QCommandLineOption passwordEnvOpt(
        "password-env", "Read the password from this environment variable.", "var");
    const QCommandLineOption identityOpt("identity", "Private key file.", "path");
    const QCommandLineOption knownHostsOpt("known-hosts", "known_hosts file.", "path");
    const QCommandLineOption policyOpt(
        "host-key-policy", "strict, accept-new or off.", "policy");
    const QCommandLineOption modeOpt(
        "mode", "Octal permissions of the uploaded file (default 0644).", "octal");
    const QCommandLineOption preserveOpt(
        "preserve", "Keep remote permissions and times on download.");
    const QCommandLineOption binaryOpt(
        "remote-binary", "scp binary on the remote host.", "path");
    const QCommandLineOption timeoutOpt(
        "timeout", "Abort the transfer after this many seconds (0: none).", "seconds");
    const QCommandLineOption progressOpt("progress", "Print transfer progress.");
    parser.addOptions({hostOpt, portOpt, userOpt, passwordEnvOpt, identityOpt,
                       knownHostsOpt, policyOpt, modeOpt, preserveOpt, binaryOpt,
                       timeoutOpt, progressOpt});

    if (!parser.parse(args)) {
        err = parser.errorText();
        return false;
    }
    if (parser.isSet("help")) {
        cfg.showHelp = true;
        cfg.helpText = parser.helpText();
        return true;
    }

    const QStringList pos = parser.positionalArguments();
    if (pos.size() != 3) {
        err = QStringLiteral("expected: put <local> <remote> | get <remote> <local>");
        return false;
    }
    const QString cmd = pos.at(0).toLower();
    if (cmd == "put") {
        cfg.command = CliConfig::Command::Put;
    } else if (cmd == "get") {
        cfg.command = CliConfig::Command::Get;
    } else {
        err = QStringLiteral("unknown command: %1").arg(pos.at(0));
        return false;
    }
    cfg.source = pos.at(1);
    cfg.destination = pos.at(2);

    // Persisted defaults first, flags override.
    cfg.session.host = s.value("Connection/host").toString().toStdString();
    int port = s.value("Connection/port", 22).toInt();
    cfg.session.username = s.value("Connection/user").toString().toStdString();
    QString policy = s.value("Security/hostKeyPolicy", "strict").toString();
    const QString khPath = s.value("Security/knownHostsPath").toString();
    if (!khPath.isEmpty())
        cfg.session.known_hosts_path = khPath.toStdString();
    QString binary = s.value("Transfer/remoteBinary", "scp").toString();
    int timeoutSec = s.value("Transfer/timeoutSec", 0).toInt();

    if (parser.isSet(hostOpt))
        cfg.session.host = parser.value(hostOpt).toStdString();
    if (parser.isSet(userOpt))
        cfg.session.username = parser.value(userOpt).toStdString();
    if (parser.isSet(portOpt)) {
        bool ok = false;
        port = parser.value(portOpt).toInt(&ok);
        if (!ok) {
            err = QStringLiteral("invalid port: %1").arg(parser.value(portOpt));
            return false;
        }
    }
    if (port <= 0 || port > 65535) {
        err = QStringLiteral("port out of range: %1").arg(port);
        return false;
    }
    cfg.session.port = static_cast<std::uint16_t>(port);

    if (parser.isSet(policyOpt))
        policy = parser.value(policyOpt);
    if (!policyFromString(policy, cfg.session.known_hosts_policy)) {
        err = QStringLiteral("invalid host key policy: %1").arg(policy);
        return false;
    }
    if (parser.isSet(knownHostsOpt))
        cfg.session.known_hosts_path = parser.value(knownHostsOpt).toStdString();
    if (parser.isSet(identityOpt))
        cfg.session.private_key_path = parser.value(identityOpt).toStdString();
    if (parser.isSet(passwordEnvOpt)) {
        const QString var = parser.value(passwordEnvOpt);
        const QByteArray pw = qgetenv(var.toLocal8Bit().constData());
        if (pw.isEmpty()) {
            err = QStringLiteral("environment variable %1 is empty or unset").arg(var);
            return false;
        }
        cfg.session.password = pw.toStdString();
    }

    if (parser.isSet(binaryOpt))
        binary = parser.value(binaryOpt);
    if (binary.trimmed().isEmpty()) {
        err = QStringLiteral("remote binary must not be empty");
        return false;
    }
    cfg.client.remote_binary = binary.toStdString();

    if (parser.isSet(timeoutOpt)) {
        bool ok = false;
        timeoutSec = parser.value(timeoutOpt).toInt(&ok);
        if (!ok || timeoutSec < 0) {
            err = QStringLiteral("invalid timeout: %1").arg(parser.value(timeoutOpt));
            return false;
        }
    }
    cfg.client.timeout = std::chrono::seconds(timeoutSec);

    if (parser.isSet(modeOpt))
        cfg.mode = parser.value(modeOpt);
    cfg.preserve = parser.isSet(preserveOpt);
    cfg.progress = parser.isSet(progressOpt);

    if (cfg.session.host.empty() || cfg.session.username.empty()) {
        err = QStringLiteral("--host and --user are required");
        return false;
    }
    return true;
}

void saveCliDefaults(const CliConfig &cfg) {
    QSettings s("scpbridge", "scpbridge");
    s.setValue("Connection/host", QString::fromStdString(cfg.session.host));
    s.setValue("Connection/port", static_cast<int>(cfg.session.port));
    s.setValue("Connection/user", QString::fromStdString(cfg.session.username));
    s.setValue("Security/hostKeyPolicy", policyToString(cfg.session.known_hosts_policy));
    s.setValue("Transfer/remoteBinary", QString::fromStdString(cfg.client.remote_binary));
}
