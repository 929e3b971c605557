// Application entry point: gather the upload request, connect, negotiate
// authentication, stream the file and map the result to an exit code.
#include "CliOptions.hpp"
#include "ConsolePrompter.hpp"
#include "ProgressRenderer.hpp"
#include "scpsend/AuthNegotiator.hpp"
#include "scpsend/Credentials.hpp"
#include "scpsend/Libssh2Transport.hpp"
#include "scpsend/TransferEngine.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QSettings>
#include <QTextStream>

#include <memory>
#include <vector>

Q_LOGGING_CATEGORY(scCli, "scpsend.cli")
Q_LOGGING_CATEGORY(scAuth, "scpsend.auth")
Q_LOGGING_CATEGORY(scXfer, "scpsend.transfer")

using namespace scpsendcli;

namespace {

// Fills whatever the command line and settings left open. Returns an exit
// code other than ExitOk when input could not be completed.
int completeRequest(UploadRequest &req, ConsolePrompter &prompter, QTextStream &err) {
    if (req.localPath.isEmpty()) {
        auto v = prompter.ask(QCoreApplication::translate("cli", "Local file path"));
        if (!v || v->isEmpty())
            return ExitUsage;
        req.localPath = *v;
    }
    const QFileInfo fi(req.localPath);
    if (!fi.exists() || !fi.isFile()) {
        err << QCoreApplication::translate("cli", "Local file does not exist: %1").arg(req.localPath) << "\n";
        return ExitLocalFile;
    }

    if (req.host.isEmpty()) {
        auto v = prompter.ask(QCoreApplication::translate("cli", "Remote host (e.g. example.com or 192.168.1.100)"));
        if (!v || v->isEmpty())
            return ExitUsage;
        req.host = *v;
    }

    if (!req.port.has_value()) {
        auto v = prompter.ask(QCoreApplication::translate("cli", "Port"),
                              QString::number(scpsend::kDefaultPort));
        if (!v)
            return ExitUsage;
        quint16 port = scpsend::kDefaultPort;
        QString perr;
        if (!parsePort(*v, port, perr)) {
            err << perr << QCoreApplication::translate("cli", ", using default %1").arg(scpsend::kDefaultPort) << "\n";
            port = scpsend::kDefaultPort;
        }
        req.port = port;
    }

    if (req.username.isEmpty()) {
        auto v = prompter.ask(QCoreApplication::translate("cli", "Username"),
                              qEnvironmentVariable("USER"));
        if (!v || v->isEmpty())
            return ExitUsage;
        req.username = *v;
    }

    if (req.remotePath.isEmpty()) {
        const QString def = defaultRemotePath(req.username, req.localPath);
        auto v = prompter.ask(QCoreApplication::translate("cli", "Remote path"), def);
        if (!v)
            return ExitUsage;
        req.remotePath = v->isEmpty() ? def : *v;
    }
    return ExitOk;
}

std::vector<scpsend::Credential> buildCredentials(const UploadRequest &req) {
    if (req.identities.isEmpty())
        return scpsend::defaultCredentials(QDir::homePath().toStdString(), req.allowPassword);
    std::vector<scpsend::Credential> out;
    for (const QString &p : req.identities)
        out.push_back(scpsend::Credential::keyFile(QDir::cleanPath(p).toStdString()));
    if (req.allowPassword)
        out.push_back(scpsend::Credential::passwordAuth());
    return out;
}

} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("scpsend");
    QCoreApplication::setOrganizationName("scpsend");

    QTextStream out(stderr);

    UploadRequest req;
    {
        QSettings s("scpsend", "scpsend");
        applySettings(s, req);
    }
    QString perr;
    QString help;
    bool helpRequested = false;
    if (!parseCommandLine(app.arguments(), req, perr, helpRequested, help)) {
        out << perr << "\n\n" << help;
        return ExitUsage;
    }
    if (helpRequested) {
        QTextStream(stdout) << help;
        return ExitOk;
    }
    if (req.verbose) {
        QLoggingCategory::setFilterRules(QStringLiteral("scpsend.*.debug=true"));
        qputenv("SCPSEND_LOG", "1");
    }

    ConsolePrompter prompter;
    if (!req.quiet) {
        out << "=====================================\n"
            << QCoreApplication::translate("cli", "Interactive SCP file transfer") << "\n"
            << "=====================================\n" << Qt::flush;
    }

    const int inputRc = completeRequest(req, prompter, out);
    if (inputRc != ExitOk)
        return inputRc;
    qCDebug(scCli).noquote() << requestSummary(req);

    scpsend::TransferPlan plan;
    std::string planErr;
    if (!scpsend::TransferPlan::open(req.localPath.toStdString(), req.remotePath.toStdString(),
                                     plan, planErr)) {
        out << QString::fromStdString(planErr) << "\n";
        return ExitLocalFile;
    }

    scpsend::SessionOptions opt;
    opt.host = req.host.toStdString();
    opt.port = *req.port;
    opt.known_hosts_policy = req.hostKeyPolicy;
    if (!req.knownHostsPath.isEmpty())
        opt.known_hosts_path = QDir::cleanPath(req.knownHostsPath).toStdString();
    opt.hostkey_confirm_cb = [&prompter, &out](const std::string &host, std::uint16_t port,
                                               const std::string &algorithm,
                                               const std::string &fingerprint) {
        out << QCoreApplication::translate("cli", "The authenticity of host '%1:%2' can't be established.")
                   .arg(QString::fromStdString(host))
                   .arg(port)
            << "\n"
            << QCoreApplication::translate("cli", "%1 key fingerprint is %2.")
                   .arg(QString::fromStdString(algorithm), QString::fromStdString(fingerprint))
            << "\n" << Qt::flush;
        return prompter.confirm(QCoreApplication::translate("cli", "Continue connecting and save the key?"));
    };
    opt.keyboard_interactive_cb = [&prompter](const std::string &name,
                                              const std::string &instruction,
                                              const std::vector<std::string> &prompts,
                                              std::vector<std::string> &responses) {
        qCDebug(scAuth) << "keyboard-interactive prompts:" << prompts.size();
        return prompter.answerPrompts(name, instruction, prompts, responses);
    };

    if (!req.quiet)
        out << QCoreApplication::translate("cli", "Connecting to remote host...") << "\n" << Qt::flush;
    std::unique_ptr<scpsend::Transport> transport = std::make_unique<scpsend::Libssh2Transport>();
    std::string connErr;
    if (!transport->connect(opt, connErr)) {
        out << QCoreApplication::translate("cli", "Connection failed: %1").arg(QString::fromStdString(connErr)) << "\n";
        return ExitConnection;
    }

    scpsend::AuthNegotiator negotiator;
    negotiator.setAttemptObserver([&out, &req](const std::string &label) {
        qCDebug(scAuth) << "attempt" << QString::fromStdString(label);
        if (!req.quiet)
            out << QCoreApplication::translate("cli", "Trying %1").arg(QString::fromStdString(label)) << "\n" << Qt::flush;
    });
    negotiator.setPassphrasePrompt([&prompter](const std::string &keyPath) {
        return prompter.askSecret(QCoreApplication::translate("cli", "Passphrase for key %1")
                                      .arg(QString::fromStdString(keyPath)));
    });
    negotiator.setPasswordPrompt([&prompter, &req](const std::string &username) {
        return prompter.askSecret(QCoreApplication::translate("cli", "Password for %1@%2")
                                      .arg(QString::fromStdString(username), req.host));
    });

    scpsend::AuthError authErr;
    std::unique_ptr<scpsend::AuthenticatedSession> session =
        negotiator.negotiate(transport, req.username.toStdString(), buildCredentials(req), authErr);
    if (!session) {
        qCWarning(scAuth) << "negotiation ended in state"
                          << scpsend::negotiatorStateName(negotiator.state())
                          << "after" << negotiator.attempts() << "attempt(s)";
        out << QString::fromStdString(authErr.describe()) << "\n";
        return ExitAuth;
    }
    if (!req.quiet) {
        out << QCoreApplication::translate("cli", "Authenticated with %1")
                   .arg(QString::fromStdString(session->method()))
            << "\n"
            << QCoreApplication::translate("cli", "Starting file transfer...") << "\n" << Qt::flush;
    }

    scpsend::TransferEngine engine(static_cast<std::size_t>(req.chunkSizeKiB) * 1024);
    ProgressRenderer renderer;
    scpsend::ProgressCB progress;
    if (!req.quiet)
        progress = [&renderer](const scpsend::ProgressSample &s) { renderer.report(s); };

    scpsend::TransferError xferErr;
    const bool ok = engine.transfer(*session, plan, progress, xferErr);
    if (!req.quiet)
        renderer.finish();
    session->transport().disconnect();
    if (!ok) {
        qCWarning(scXfer) << "transfer failed:" << scpsend::transferErrorName(xferErr.kind)
                          << "write calls" << engine.writeCalls();
        out << QCoreApplication::translate("cli", "Transfer failed: %1")
                   .arg(QString::fromStdString(xferErr.describe()))
            << "\n";
        return ExitTransfer;
    }

    if (!req.quiet)
        out << QCoreApplication::translate("cli", "File transfer completed successfully!") << "\n";
    return ExitOk;
}
