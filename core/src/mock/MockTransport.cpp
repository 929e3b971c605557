#include "scpsend/MockTransport.hpp"

#include <algorithm>
#include <memory>

namespace scpsend {

class MockTransport::Channel : public WriteChannel {
public:
    Channel(std::shared_ptr<Upload> up, std::shared_ptr<std::uint64_t> calls,
            std::size_t maxPerWrite, std::optional<std::uint64_t> failAt,
            bool failClose)
        : up_(std::move(up)), calls_(std::move(calls)),
          maxPerWrite_(maxPerWrite), failAt_(failAt), failClose_(failClose) {}

    long write(const char *data, std::size_t len) override {
        ++*calls_;
        if (up_->closed) {
            lastErr_ = "channel closed";
            return -1;
        }
        const std::uint64_t off = up_->data.size();
        if (failAt_ && off >= *failAt_) {
            lastErr_ = "simulated write failure";
            return -1;
        }
        std::size_t n = len;
        if (maxPerWrite_ > 0)
            n = std::min(n, maxPerWrite_);
        if (failAt_)
            n = static_cast<std::size_t>(std::min<std::uint64_t>(n, *failAt_ - off));
        // SCP sink refuses bytes past the declared size.
        if (off + n > up_->declared_size) {
            lastErr_ = "write past declared size";
            return -1;
        }
        up_->data.append(data, n);
        return static_cast<long>(n);
    }

    bool close(std::string &err) override {
        if (failClose_) {
            err = "simulated close failure";
            return false;
        }
        if (up_->data.size() != up_->declared_size) {
            err = "remote received " + std::to_string(up_->data.size()) +
                  " of " + std::to_string(up_->declared_size) + " bytes";
            return false;
        }
        up_->closed = true;
        return true;
    }

    std::string lastError() const override { return lastErr_; }

private:
    std::shared_ptr<Upload> up_;
    std::shared_ptr<std::uint64_t> calls_;
    std::size_t maxPerWrite_;
    std::optional<std::uint64_t> failAt_;
    bool failClose_;
    std::string lastErr_;
};

bool MockTransport::connect(const SessionOptions &opt, std::string &err) {
    if (opt.host.empty()) {
        err = "Host is required";
        return false;
    }
    connected_ = true;
    authenticated_ = noneAccepted_;
    return true;
}

void MockTransport::disconnect() {
    connected_ = false;
    authenticated_ = false;
}

std::vector<std::string> MockTransport::offeredMethods(const std::string &) {
    if (!connected_)
        return {};
    return methods_;
}

AuthReply MockTransport::rejected(const char *msg) {
    if (disconnectOnReject_) {
        connected_ = false;
        return AuthReply{AuthReply::Status::Disconnected, "server closed the connection"};
    }
    return AuthReply{AuthReply::Status::Rejected, msg};
}

AuthReply MockTransport::authByKey(const std::string &,
                                   const std::string &private_key_path,
                                   const std::optional<std::string> &passphrase) {
    ++keyAttempts_;
    attemptLog_.push_back(private_key_path);
    if (!connected_)
        return AuthReply{AuthReply::Status::Disconnected, "not connected"};

    auto it = keys_.find(private_key_path);
    if (it == keys_.end())
        return rejected("public key not authorized");
    const KeyBehavior &k = it->second;
    if (k.passphrase && (!passphrase || *passphrase != *k.passphrase))
        return AuthReply{AuthReply::Status::KeyLocked,
                         "wrong passphrase or encrypted key"};
    if (!k.accepted)
        return rejected("public key not authorized");
    authenticated_ = true;
    return AuthReply{AuthReply::Status::Accepted, {}};
}

AuthReply MockTransport::authByPassword(const std::string &,
                                        const std::string &password) {
    ++passwordAttempts_;
    attemptLog_.push_back("password");
    if (!connected_)
        return AuthReply{AuthReply::Status::Disconnected, "not connected"};
    if (!password_ || *password_ != password)
        return rejected("password refused");
    authenticated_ = true;
    return AuthReply{AuthReply::Status::Accepted, {}};
}

std::unique_ptr<WriteChannel> MockTransport::openWriteChannel(const std::string &remote_path,
                                                              std::uint64_t size,
                                                              std::uint32_t mode,
                                                              std::int64_t,
                                                              std::int64_t,
                                                              std::string &err) {
    if (!connected_ || !authenticated_) {
        err = "Not connected";
        return nullptr;
    }
    if (failOpen_) {
        err = "scp: " + remote_path + ": Permission denied";
        return nullptr;
    }
    auto up = std::make_shared<Upload>();
    up->path = remote_path;
    up->declared_size = size;
    up->mode = mode;
    uploads_.push_back(up);
    return std::make_unique<Channel>(up, writeCalls_, maxBytesPerWrite_, failWriteAt_, failClose_);
}

std::uint64_t MockTransport::writeCalls() const {
    return *writeCalls_;
}

} // namespace scpsend
