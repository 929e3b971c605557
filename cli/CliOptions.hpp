// Inputs of one scpsend invocation: command line, persisted defaults and the
// small parsing helpers shared with the interactive prompts.
#pragma once
#include "scpsend/SessionTypes.hpp"

#include <QString>
#include <QStringList>
#include <optional>

class QSettings;

namespace scpsendcli {

enum ExitCode {
    ExitOk = 0,
    ExitUsage = 1,
    ExitLocalFile = 2,
    ExitConnection = 3,
    ExitAuth = 4,
    ExitTransfer = 5
};

struct UploadRequest {
    QString localPath;
    QString host;
    std::optional<quint16> port;
    QString username;
    QString remotePath;

    QStringList identities;  // empty = the default ~/.ssh keys
    bool allowPassword = true;
    QString knownHostsPath;  // empty = ~/.ssh/known_hosts
    scpsend::KnownHostsPolicy hostKeyPolicy = scpsend::KnownHostsPolicy::AcceptNew;
    int chunkSizeKiB = int(scpsend::kDefaultChunkSize / 1024);
    bool quiet = false;
    bool verbose = false;
};

// "[user@]host[:path]"; IPv6 hosts may be bracketed ("[::1]:path").
bool parseDestination(const QString &spec, QString &user, QString &host,
                      QString &path, QString &err);

// Empty input keeps the default; invalid input is reported through err.
bool parsePort(const QString &raw, quint16 &out, QString &err);

bool parseHostKeyPolicy(const QString &raw, scpsend::KnownHostsPolicy &out);
QString hostKeyPolicyName(scpsend::KnownHostsPolicy p);

// /home/<user>/<basename of local file>
QString defaultRemotePath(const QString &username, const QString &localPath);

// One-line description for debug logs. Local path, host and username are
// redacted unless sensitive logging is enabled.
QString requestSummary(const UploadRequest &req);

// Settings under QSettings("scpsend", "scpsend") seed the request before the
// command line is applied.
void applySettings(QSettings &s, UploadRequest &req);

// Returns false with err set on invalid usage. helpRequested is set when the
// caller should print help and exit successfully.
bool parseCommandLine(const QStringList &args, UploadRequest &req,
                      QString &err, bool &helpRequested, QString &helpText);

} // namespace scpsendcli
