#pragma once
#include "Transport.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace scpsend {

// Scriptable in-memory transport for tests: decides auth replies from a small
// table and records every uploaded byte.
class MockTransport : public Transport {
public:
    struct KeyBehavior {
        bool accepted = true;
        // Set when the key is encrypted: only this passphrase decodes it.
        std::optional<std::string> passphrase;
    };

    // What the fake remote saw for one upload.
    struct Upload {
        std::string path;
        std::uint64_t declared_size = 0;
        std::uint32_t mode = 0;
        std::string data;
        bool closed = false;
    };

    bool connect(const SessionOptions &opt, std::string &err) override;
    void disconnect() override;
    bool isConnected() const override { return connected_; }

    std::vector<std::string> offeredMethods(const std::string &username) override;
    bool isAuthenticated() const override { return authenticated_; }

    AuthReply authByKey(const std::string &username,
                        const std::string &private_key_path,
                        const std::optional<std::string> &passphrase) override;
    AuthReply authByPassword(const std::string &username,
                             const std::string &password) override;

    std::unique_ptr<WriteChannel> openWriteChannel(const std::string &remote_path,
                                                   std::uint64_t size,
                                                   std::uint32_t mode,
                                                   std::int64_t mtime,
                                                   std::int64_t atime,
                                                   std::string &err) override;

    // Script
    void setOfferedMethods(std::vector<std::string> m) { methods_ = std::move(m); }
    void setNoneAccepted(bool v) { noneAccepted_ = v; }
    void setKey(const std::string &path, KeyBehavior b) { keys_[path] = std::move(b); }
    void setPassword(std::optional<std::string> pw) { password_ = std::move(pw); }
    void setDisconnectOnReject(bool v) { disconnectOnReject_ = v; }
    void setMaxBytesPerWrite(std::size_t n) { maxBytesPerWrite_ = n; }
    void setFailWriteAtOffset(std::optional<std::uint64_t> off) { failWriteAt_ = off; }
    void setFailOpen(bool v) { failOpen_ = v; }
    void setFailClose(bool v) { failClose_ = v; }

    // Observations
    int keyAttempts() const { return keyAttempts_; }
    int passwordAttempts() const { return passwordAttempts_; }
    int authAttempts() const { return keyAttempts_ + passwordAttempts_; }
    // Key paths / "password" in the order they reached the "server".
    const std::vector<std::string> &attemptLog() const { return attemptLog_; }
    std::uint64_t writeCalls() const;
    const Upload *lastUpload() const { return uploads_.empty() ? nullptr : uploads_.back().get(); }

private:
    class Channel;
    AuthReply rejected(const char *msg);

    bool connected_ = false;
    bool authenticated_ = false;

    std::vector<std::string> methods_;
    bool noneAccepted_ = false;
    std::map<std::string, KeyBehavior> keys_;
    std::optional<std::string> password_;
    bool disconnectOnReject_ = false;

    std::size_t maxBytesPerWrite_ = 0; // 0 = unlimited
    std::optional<std::uint64_t> failWriteAt_;
    bool failOpen_ = false;
    bool failClose_ = false;

    int keyAttempts_ = 0;
    int passwordAttempts_ = 0;
    std::vector<std::string> attemptLog_;
    std::shared_ptr<std::uint64_t> writeCalls_ = std::make_shared<std::uint64_t>(0);
    std::vector<std::shared_ptr<Upload>> uploads_;
};

} // namespace scpsend
