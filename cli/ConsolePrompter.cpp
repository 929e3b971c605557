#include "ConsolePrompter.hpp"

#include <cstdio>
#include <termios.h>
#include <unistd.h>

namespace scpsendcli {

namespace {

// Disables terminal echo for its lifetime.
class EchoGuard {
public:
    explicit EchoGuard(int fd) : fd_(fd) {
        if (::tcgetattr(fd_, &saved_) != 0)
            return;
        termios t = saved_;
        t.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        active_ = ::tcsetattr(fd_, TCSAFLUSH, &t) == 0;
    }
    ~EchoGuard() {
        if (active_)
            ::tcsetattr(fd_, TCSAFLUSH, &saved_);
    }

private:
    int fd_;
    termios saved_{};
    bool active_ = false;
};

void secureClear(QString &s) {
    for (int i = 0, n = s.size(); i < n; ++i)
        s[i] = QChar(u'\0');
    s.clear();
}

} // namespace

ConsolePrompter::ConsolePrompter(std::FILE *in, std::FILE *out)
    : in_(in, QIODevice::ReadOnly), out_(out, QIODevice::WriteOnly),
      inFd_(::fileno(in)), interactive_(::isatty(inFd_) == 1) {}

std::optional<QString> ConsolePrompter::readLine() {
    QString line;
    if (!in_.readLineInto(&line))
        return std::nullopt;
    return line;
}

std::optional<QString> ConsolePrompter::ask(const QString &prompt,
                                            const QString &defaultValue) {
    out_ << prompt;
    if (!defaultValue.isEmpty())
        out_ << " [" << defaultValue << "]";
    out_ << ": " << Qt::flush;
    auto line = readLine();
    if (!line)
        return std::nullopt;
    const QString v = line->trimmed();
    return v.isEmpty() ? defaultValue : v;
}

std::optional<std::string> ConsolePrompter::askSecret(const QString &prompt) {
    out_ << prompt << ": " << Qt::flush;
    std::optional<QString> line;
    {
        std::optional<EchoGuard> guard;
        if (interactive_)
            guard.emplace(inFd_);
        line = readLine();
    }
    if (interactive_)
        out_ << "\n" << Qt::flush;
    if (!line || line->isEmpty())
        return std::nullopt;
    std::string secret = line->toStdString();
    secureClear(*line);
    return secret;
}

bool ConsolePrompter::confirm(const QString &prompt, bool defaultYes) {
    out_ << prompt << (defaultYes ? " [Y/n]: " : " [y/N]: ") << Qt::flush;
    auto line = readLine();
    if (!line)
        return false;
    const QString v = line->trimmed().toLower();
    if (v.isEmpty())
        return defaultYes;
    return v == "y" || v == "yes";
}

bool ConsolePrompter::answerPrompts(const std::string &name, const std::string &instruction,
                                    const std::vector<std::string> &prompts,
                                    std::vector<std::string> &responses) {
    responses.clear();
    if (!name.empty())
        out_ << QString::fromStdString(name) << "\n";
    if (!instruction.empty())
        out_ << QString::fromStdString(instruction) << "\n";
    for (const std::string &p : prompts) {
        QString text = QString::fromStdString(p).trimmed();
        if (text.endsWith(':'))
            text.chop(1);
        auto answer = askSecret(text);
        if (!answer) {
            responses.clear();
            return false;
        }
        responses.push_back(std::move(*answer));
    }
    return true;
}

} // namespace scpsendcli
