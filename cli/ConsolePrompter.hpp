// Terminal input: plain questions with defaults, secrets with echo disabled,
// yes/no confirmations.
#pragma once
#include <QString>
#include <QTextStream>
#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace scpsendcli {

class ConsolePrompter {
public:
    // Reads from in, writes prompts to out.
    explicit ConsolePrompter(std::FILE *in = stdin, std::FILE *out = stderr);

    // Empty answer returns defaultValue. nullopt on end of input.
    std::optional<QString> ask(const QString &prompt,
                               const QString &defaultValue = QString());
    // Reads one line without echo when stdin is a terminal. nullopt on end of
    // input or when the user enters nothing.
    std::optional<std::string> askSecret(const QString &prompt);
    bool confirm(const QString &prompt, bool defaultYes = false);

    // Keyboard-interactive round (OTP, 2FA): prints name and instruction,
    // then asks every prompt as a secret. False if any answer is missing.
    bool answerPrompts(const std::string &name, const std::string &instruction,
                       const std::vector<std::string> &prompts,
                       std::vector<std::string> &responses);

    bool interactive() const { return interactive_; }

private:
    std::optional<QString> readLine();

    QTextStream in_;
    QTextStream out_;
    int inFd_;
    bool interactive_ = false;
};

} // namespace scpsendcli
