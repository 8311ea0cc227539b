// Command-line configuration: persisted defaults from QSettings overridden
// by flags parsed with QCommandLineParser.
#pragma once
#include "scpbridge/ScpTypes.hpp"

#include <QString>
#include <QStringList>

struct CliConfig {
    enum class Command { Put, Get };

    Command command = Command::Put;
    QString source;      // local path for put, remote path for get
    QString destination; // remote path for put, local path for get

    scpbridge::SessionOptions session;
    scpbridge::ClientOptions client;

    QString mode = QStringLiteral("0644"); // put only
    bool preserve = false;                 // get only
    bool progress = false;
    bool showHelp = false;
    QString helpText;
};

// Fills cfg from the settings store and args. Returns false with err set
// when the arguments are invalid.
bool loadCliConfig(const QStringList &args, CliConfig &cfg, QString &err);

// Writes the connection defaults that were used, so later runs pick them up.
void saveCliDefaults(const CliConfig &cfg);
