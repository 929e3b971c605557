#include "CliOptions.hpp"
#include "scpsend/Log.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFileInfo>
#include <QSettings>

namespace scpsendcli {

bool parseDestination(const QString &spec, QString &user, QString &host,
                      QString &path, QString &err) {
    QString rest = spec.trimmed();
    if (rest.isEmpty()) {
        err = QCoreApplication::translate("cli", "Destination is empty");
        return false;
    }

    const int at = rest.indexOf('@');
    if (at == 0) {
        err = QCoreApplication::translate("cli", "Missing user before '@'");
        return false;
    }
    if (at > 0) {
        user = rest.left(at);
        rest = rest.mid(at + 1);
    }

    if (rest.startsWith('[')) {
        const int close = rest.indexOf(']');
        if (close < 0) {
            err = QCoreApplication::translate("cli", "Unterminated '[' in host");
            return false;
        }
        host = rest.mid(1, close - 1);
        rest = rest.mid(close + 1);
        if (rest.startsWith(':'))
            path = rest.mid(1);
        else if (!rest.isEmpty()) {
            err = QCoreApplication::translate("cli", "Unexpected text after ']'");
            return false;
        }
    } else {
        const int colon = rest.indexOf(':');
        if (colon >= 0) {
            host = rest.left(colon);
            path = rest.mid(colon + 1);
        } else {
            host = rest;
        }
    }

    if (host.isEmpty()) {
        err = QCoreApplication::translate("cli", "Host is empty");
        return false;
    }
    return true;
}

bool parsePort(const QString &raw, quint16 &out, QString &err) {
    const QString t = raw.trimmed();
    if (t.isEmpty())
        return true;
    bool ok = false;
    const int n = t.toInt(&ok);
    if (!ok || n < 1 || n > 65535) {
        err = QCoreApplication::translate("cli", "Invalid port number: %1").arg(t);
        return false;
    }
    out = static_cast<quint16>(n);
    return true;
}

bool parseHostKeyPolicy(const QString &raw, scpsend::KnownHostsPolicy &out) {
    const QString v = raw.trimmed().toLower();
    if (v == "strict") {
        out = scpsend::KnownHostsPolicy::Strict;
    } else if (v == "accept-new" || v == "acceptnew" || v == "tofu") {
        out = scpsend::KnownHostsPolicy::AcceptNew;
    } else if (v == "off" || v == "no") {
        out = scpsend::KnownHostsPolicy::Off;
    } else {
        return false;
    }
    return true;
}

QString hostKeyPolicyName(scpsend::KnownHostsPolicy p) {
    switch (p) {
    case scpsend::KnownHostsPolicy::Strict:
        return QStringLiteral("strict");
    case scpsend::KnownHostsPolicy::AcceptNew:
        return QStringLiteral("accept-new");
    case scpsend::KnownHostsPolicy::Off:
        return QStringLiteral("off");
    }
    return QStringLiteral("strict");
}

QString defaultRemotePath(const QString &username, const QString &localPath) {
    return QStringLiteral("/home/%1/%2").arg(username, QFileInfo(localPath).fileName());
}

QString requestSummary(const UploadRequest &req) {
    auto hide = [](const QString &v) {
        return QString::fromStdString(scpsend::redacted(v.toStdString()));
    };
    return QStringLiteral("upload %1 to %2@%3:%4 remote %5 policy %6")
        .arg(hide(req.localPath), hide(req.username), hide(req.host))
        .arg(req.port ? int(*req.port) : int(scpsend::kDefaultPort))
        .arg(hide(req.remotePath), hostKeyPolicyName(req.hostKeyPolicy));
}

void applySettings(QSettings &s, UploadRequest &req) {
    const int port = s.value("Connection/port", 0).toInt();
    if (port > 0 && port <= 65535)
        req.port = static_cast<quint16>(port);
    req.username = s.value("Connection/username", req.username).toString();

    scpsend::KnownHostsPolicy p = req.hostKeyPolicy;
    if (parseHostKeyPolicy(s.value("Security/knownHostsPolicy", hostKeyPolicyName(p)).toString(), p))
        req.hostKeyPolicy = p;
    req.knownHostsPath = s.value("Security/knownHostsPath", req.knownHostsPath).toString();

    const int kib = s.value("Transfer/chunkSizeKiB", req.chunkSizeKiB).toInt();
    if (kib > 0)
        req.chunkSizeKiB = kib;
    req.identities = s.value("Auth/identityFiles", req.identities).toStringList();
    req.allowPassword = s.value("Auth/allowPassword", req.allowPassword).toBool();
}

bool parseCommandLine(const QStringList &args, UploadRequest &req,
                      QString &err, bool &helpRequested, QString &helpText) {
    helpRequested = false;

    QCommandLineParser parser;
    parser.setApplicationDescription(QCoreApplication::translate(
        "cli", "Upload one file to a remote host over SCP."));
    parser.addHelpOption();
    parser.addPositionalArgument("source", QCoreApplication::translate("cli", "Local file to upload."), "[source]");
    parser.addPositionalArgument("destination",
                                 QCoreApplication::translate("cli", "[user@]host[:remote-path]"),
                                 "[destination]");

    QCommandLineOption portOpt({"P", "port"}, QCoreApplication::translate("cli", "SSH port (default 22)."), "port");
    QCommandLineOption userOpt({"l", "user"}, QCoreApplication::translate("cli", "Remote username."), "user");
    QCommandLineOption identityOpt({"i", "identity"},
                                   QCoreApplication::translate("cli", "Private key to try; repeatable. Replaces the default keys."),
                                   "file");
    QCommandLineOption noPasswordOpt("no-password",
                                     QCoreApplication::translate("cli", "Never fall back to password authentication."));
    QCommandLineOption knownHostsOpt("known-hosts", QCoreApplication::translate("cli", "known_hosts file."), "file");
    QCommandLineOption policyOpt("host-key-policy",
                                 QCoreApplication::translate("cli", "strict, accept-new or off."), "policy");
    QCommandLineOption chunkOpt("chunk-size", QCoreApplication::translate("cli", "Chunk size in KiB."), "kib");
    QCommandLineOption quietOpt({"q", "quiet"}, QCoreApplication::translate("cli", "No progress output."));
    QCommandLineOption verboseOpt({"v", "verbose"}, QCoreApplication::translate("cli", "Debug logging."));
    parser.addOptions({portOpt, userOpt, identityOpt, noPasswordOpt, knownHostsOpt,
                       policyOpt, chunkOpt, quietOpt, verboseOpt});

    helpText = parser.helpText();
    if (!parser.parse(args)) {
        err = parser.errorText();
        return false;
    }
    if (parser.isSet("help")) {
        helpRequested = true;
        return true;
    }

    const QStringList pos = parser.positionalArguments();
    if (pos.size() > 2) {
        err = QCoreApplication::translate("cli", "Too many arguments");
        return false;
    }
    if (pos.size() >= 1)
        req.localPath = pos.at(0);
    if (pos.size() == 2) {
        QString user, host, path;
        if (!parseDestination(pos.at(1), user, host, path, err))
            return false;
        if (!user.isEmpty())
            req.username = user;
        req.host = host;
        if (!path.isEmpty())
            req.remotePath = path;
    }

    if (parser.isSet(portOpt)) {
        quint16 port = scpsend::kDefaultPort;
        if (!parsePort(parser.value(portOpt), port, err))
            return false;
        req.port = port;
    }
    if (parser.isSet(userOpt))
        req.username = parser.value(userOpt);
    if (parser.isSet(identityOpt))
        req.identities = parser.values(identityOpt);
    if (parser.isSet(noPasswordOpt))
        req.allowPassword = false;
    if (parser.isSet(knownHostsOpt))
        req.knownHostsPath = parser.value(knownHostsOpt);
    if (parser.isSet(policyOpt) &&
        !parseHostKeyPolicy(parser.value(policyOpt), req.hostKeyPolicy)) {
        err = QCoreApplication::translate("cli", "Unknown host key policy: %1").arg(parser.value(policyOpt));
        return false;
    }
    if (parser.isSet(chunkOpt)) {
        bool ok = false;
        const int kib = parser.value(chunkOpt).toInt(&ok);
        if (!ok || kib < 1 || kib > 16 * 1024) {
            err = QCoreApplication::translate("cli", "Invalid chunk size: %1").arg(parser.value(chunkOpt));
            return false;
        }
        req.chunkSizeKiB = kib;
    }
    req.quiet = parser.isSet(quietOpt);
    req.verbose = parser.isSet(verboseOpt);
    return true;
}

} // namespace scpsendcli
