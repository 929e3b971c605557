// libssh2 backend: owns the TCP socket and the SSH session, verifies the host
// key against known_hosts, runs single authentication exchanges and opens SCP
// send channels.
#include "scpsend/Libssh2Transport.hpp"
#include "scpsend/Log.hpp"
#include <libssh2.h>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

// POSIX sockets
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

namespace scpsend {

// Global libssh2 initialization (once per process)
static bool g_libssh2_inited = false;

namespace {

// Runs a libssh2 call until it stops returning EAGAIN.
template <typename Fn>
auto retryOnEagain(Fn fn) -> decltype(fn()) {
    for (;;) {
        auto rc = fn();
        if (rc != LIBSSH2_ERROR_EAGAIN)
            return rc;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}

char *dupForLibssh2(const std::string &s) {
    char *buf = static_cast<char *>(std::malloc(s.size() + 1));
    if (!buf)
        return nullptr;
    std::memcpy(buf, s.data(), s.size());
    buf[s.size()] = '\0';
    return buf;
}

// keyboard-interactive context: answers with the password unless the CLI
// callback handles the prompts itself.
struct KbdIntCtx {
    const std::string *user;
    const std::string *pass;
    const KbdIntPromptsCB *cb;
};

void kbint_password_callback(const char *name, int name_len,
                             const char *instruction, int instruction_len,
                             int num_prompts,
                             const LIBSSH2_USERAUTH_KBDINT_PROMPT *prompts,
                             LIBSSH2_USERAUTH_KBDINT_RESPONSE *responses,
                             void **abstract) {
    if (!abstract || !*abstract)
        return;
    const KbdIntCtx *ctx = static_cast<const KbdIntCtx *>(*abstract);

    std::vector<std::string> answers;
    bool answered = false;
    if (ctx->cb && *(ctx->cb) && num_prompts > 0) {
        std::vector<std::string> texts;
        texts.reserve(static_cast<std::size_t>(num_prompts));
        for (int i = 0; i < num_prompts; ++i) {
            const char *pt = (prompts && prompts[i].text)
                                 ? reinterpret_cast<const char *>(prompts[i].text)
                                 : "";
            texts.emplace_back(pt, prompts ? prompts[i].length : 0);
        }
        const std::string nm = (name && name_len > 0) ? std::string(name, (size_t)name_len) : std::string();
        const std::string ins = (instruction && instruction_len > 0)
                                    ? std::string(instruction, (size_t)instruction_len)
                                    : std::string();
        answered = (*(ctx->cb))(nm, ins, texts, answers) &&
                   (int)answers.size() >= num_prompts;
    }

    for (int i = 0; i < num_prompts; ++i) {
        const std::string &a = answered ? answers[(size_t)i] : *ctx->pass;
        responses[i].text = nullptr;
        responses[i].length = 0;
        if (a.empty())
            continue;
        char *buf = dupForLibssh2(a);
        if (!buf)
            continue;
        responses[i].text = buf;
        responses[i].length = (unsigned int)a.size();
    }
}

const char *hostKeyAlgorithmName(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return "RSA";
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return "DSA";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return "ECDSA-256";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return "ECDSA-384";
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return "ECDSA-521";
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return "ED25519";
    default:
        return "UNKNOWN";
    }
}

int knownHostKeyMask(int keytype) {
    switch (keytype) {
    case LIBSSH2_HOSTKEY_TYPE_RSA:
        return LIBSSH2_KNOWNHOST_KEY_SSHRSA;
    case LIBSSH2_HOSTKEY_TYPE_DSS:
        return LIBSSH2_KNOWNHOST_KEY_SSHDSS;
#ifdef LIBSSH2_KNOWNHOST_KEY_ECDSA_256
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_256:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_256;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_384:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_384;
    case LIBSSH2_HOSTKEY_TYPE_ECDSA_521:
        return LIBSSH2_KNOWNHOST_KEY_ECDSA_521;
#endif
#ifdef LIBSSH2_KNOWNHOST_KEY_ED25519
    case LIBSSH2_HOSTKEY_TYPE_ED25519:
        return LIBSSH2_KNOWNHOST_KEY_ED25519;
#endif
    default:
        return 0;
    }
}

std::string hostKeyFingerprint(LIBSSH2_SESSION *session) {
#ifdef LIBSSH2_HOSTKEY_HASH_SHA256
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA256;
    const int hashLen = 32;
    const char *prefix = "SHA256:";
#else
    const int hashType = LIBSSH2_HOSTKEY_HASH_SHA1;
    const int hashLen = 20;
    const char *prefix = "SHA1:";
#endif
    const unsigned char *h =
        reinterpret_cast<const unsigned char *>(libssh2_hostkey_hash(session, hashType));
    if (!h)
        return {};
    std::ostringstream oss;
    oss << prefix;
    for (int i = 0; i < hashLen; ++i) {
        if (i)
            oss << ':';
        char b[4];
        std::snprintf(b, sizeof(b), "%02X", (unsigned)h[i]);
        oss << b;
    }
    return oss.str();
}

// SCP sink channel. Frees the libssh2 channel on destruction.
class Libssh2ScpChannel : public WriteChannel {
public:
    Libssh2ScpChannel(LIBSSH2_SESSION *session, LIBSSH2_CHANNEL *channel)
        : session_(session), channel_(channel) {}

    ~Libssh2ScpChannel() override {
        if (channel_)
            libssh2_channel_free(channel_);
    }

    long write(const char *data, std::size_t len) override {
        const ssize_t w = retryOnEagain([&] {
            return libssh2_channel_write(channel_, data, len);
        });
        if (w < 0) {
            lastErr_ = sessionError();
            return -1;
        }
        if (w == 0) {
            lastErr_ = "channel accepted no data";
            return -1;
        }
        return static_cast<long>(w);
    }

    bool close(std::string &err) override {
        if (retryOnEagain([&] { return libssh2_channel_send_eof(channel_); }) != 0) {
            err = "send EOF failed: " + sessionError();
            return false;
        }
        if (retryOnEagain([&] { return libssh2_channel_wait_eof(channel_); }) != 0) {
            err = "waiting for remote EOF failed: " + sessionError();
            return false;
        }
        if (retryOnEagain([&] { return libssh2_channel_close(channel_); }) != 0) {
            err = "channel close failed: " + sessionError();
            return false;
        }
        if (retryOnEagain([&] { return libssh2_channel_wait_closed(channel_); }) != 0) {
            err = "waiting for channel close failed: " + sessionError();
            return false;
        }
        const int status = libssh2_channel_get_exit_status(channel_);
        if (status != 0) {
            err = "remote scp exited with status " + std::to_string(status);
            return false;
        }
        return true;
    }

    std::string lastError() const override { return lastErr_; }

private:
    std::string sessionError() const {
        char *msg = nullptr;
        int len = 0;
        (void)libssh2_session_last_error(session_, &msg, &len, 0);
        return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string("unknown error");
    }

    LIBSSH2_SESSION *session_;
    LIBSSH2_CHANNEL *channel_;
    std::string lastErr_;
};

} // namespace

Libssh2Transport::Libssh2Transport() {
    if (!g_libssh2_inited) {
        if (libssh2_init(0) != 0)
            SCPSEND_LOGE("libssh2_init failed");
        g_libssh2_inited = true;
    }
}

Libssh2Transport::~Libssh2Transport() {
    disconnect();
}

bool Libssh2Transport::tcpConnect(const std::string &host, std::uint16_t port, std::string &err) {
    struct addrinfo hints {};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    const std::string portStr = std::to_string(static_cast<unsigned>(port));
    struct addrinfo *res = nullptr;
    const int gai = getaddrinfo(host.c_str(), portStr.c_str(), &hints, &res);
    if (gai != 0) {
        err = std::string("getaddrinfo: ") + gai_strerror(gai);
        return false;
    }

    for (auto rp = res; rp != nullptr; rp = rp->ai_next) {
        int s = ::socket(rp->ai_family, rp->ai_socktype, rp->ai_protocol);
        if (s == -1)
            continue;
        // TCP keepalive; read/write timeouts are left to libssh2.
        int on = 1;
        ::setsockopt(s, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
#ifdef __APPLE__
        int idle = 60;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPALIVE, &idle, sizeof(idle));
#elif defined(__linux__)
        int idle = 60, intvl = 10, cnt = 3;
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPINTVL, &intvl, sizeof(intvl));
        ::setsockopt(s, IPPROTO_TCP, TCP_KEEPCNT, &cnt, sizeof(cnt));
#endif
        if (::connect(s, rp->ai_addr, rp->ai_addrlen) == 0) {
            sock_ = s;
            freeaddrinfo(res);
            return true;
        }
        ::close(s);
    }
    freeaddrinfo(res);
    err = "Could not connect to " + host + ":" + portStr;
    return false;
}

bool Libssh2Transport::sshHandshake(std::string &err) {
    session_ = libssh2_session_init();
    if (!session_) {
        err = "libssh2_session_init failed";
        return false;
    }
    // Blocking mode; EAGAIN only shows up when the timeout trips.
    libssh2_session_set_blocking(session_, 1);
    if (opt_.timeout_ms > 0)
        libssh2_session_set_timeout(session_, opt_.timeout_ms);

    if (libssh2_session_handshake(session_, sock_) != 0) {
        err = "SSH handshake failed: " + lastSessionError();
        return false;
    }
    // SSH keepalive every 30s if the peer allows it
    libssh2_keepalive_config(session_, 1, 30);
    return verifyHostKey(err);
}

bool Libssh2Transport::verifyHostKey(std::string &err) {
    if (opt_.known_hosts_policy == KnownHostsPolicy::Off) {
        SCPSEND_LOGI("host key verification disabled");
        return true;
    }

    LIBSSH2_KNOWNHOSTS *nh = libssh2_knownhost_init(session_);
    if (!nh) {
        err = "Could not initialize known_hosts";
        return false;
    }

    std::string khPath;
    if (opt_.known_hosts_path.has_value()) {
        khPath = *opt_.known_hosts_path;
    } else if (const char *home = std::getenv("HOME")) {
        khPath = std::string(home) + "/.ssh/known_hosts";
    }

    bool khLoaded = false;
    if (!khPath.empty())
        khLoaded = libssh2_knownhost_readfile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) >= 0;
    if (!khLoaded && opt_.known_hosts_policy == KnownHostsPolicy::Strict) {
        libssh2_knownhost_free(nh);
        err = "known_hosts missing or unreadable (strict policy)";
        return false;
    }

    size_t keylen = 0;
    int keytype = 0;
    const char *hostkey = libssh2_session_hostkey(session_, &keylen, &keytype);
    if (!hostkey || keylen == 0) {
        libssh2_knownhost_free(nh);
        err = "Could not obtain host key";
        return false;
    }

    const int alg = knownHostKeyMask(keytype);
    struct libssh2_knownhost *found = nullptr;
    int check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &found);
    if (check != LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        check = libssh2_knownhost_checkp(nh, opt_.host.c_str(), opt_.port, hostkey, keylen,
                                         LIBSSH2_KNOWNHOST_TYPE_SHA1 | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                         &found);
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_MATCH) {
        libssh2_knownhost_free(nh);
        return true;
    }

    if (check == LIBSSH2_KNOWNHOST_CHECK_NOTFOUND &&
        opt_.known_hosts_policy == KnownHostsPolicy::AcceptNew) {
        const std::string fp = hostKeyFingerprint(session_);
        const bool confirmed = opt_.hostkey_confirm_cb &&
                               opt_.hostkey_confirm_cb(opt_.host, opt_.port,
                                                       hostKeyAlgorithmName(keytype), fp);
        if (!confirmed) {
            libssh2_knownhost_free(nh);
            err = "Unknown host: fingerprint not confirmed";
            return false;
        }
        if (khPath.empty()) {
            libssh2_knownhost_free(nh);
            err = "known_hosts path is not defined";
            return false;
        }
        const int addrc = libssh2_knownhost_addc(nh, opt_.host.c_str(), nullptr, hostkey, keylen,
                                                 nullptr, 0,
                                                 LIBSSH2_KNOWNHOST_TYPE_PLAIN | LIBSSH2_KNOWNHOST_KEYENC_RAW | alg,
                                                 nullptr);
        if (addrc != 0 ||
            libssh2_knownhost_writefile(nh, khPath.c_str(), LIBSSH2_KNOWNHOST_FILE_OPENSSH) != 0) {
            libssh2_knownhost_free(nh);
            err = "Could not add host to known_hosts";
            return false;
        }
        libssh2_knownhost_free(nh);
        SCPSEND_LOGI("host key for %s stored in known_hosts", redacted(opt_.host).c_str());
        return true;
    }

    libssh2_knownhost_free(nh);
    err = (check == LIBSSH2_KNOWNHOST_CHECK_MISMATCH)
              ? "Host key does not match known_hosts"
              : "Host not found in known_hosts";
    return false;
}

bool Libssh2Transport::connect(const SessionOptions &opt, std::string &err) {
    if (connected_) {
        err = "Already connected";
        return false;
    }
    if (opt.host.empty()) {
        err = "Host is required";
        return false;
    }
    opt_ = opt;
    authlist_.clear();
    if (!tcpConnect(opt.host, opt.port, err))
        return false;
    if (!sshHandshake(err)) {
        disconnect();
        return false;
    }
    connected_ = true;
    SCPSEND_LOGI("connected to %s:%u", redacted(opt.host).c_str(), (unsigned)opt.port);
    return true;
}

void Libssh2Transport::disconnect() {
    if (session_) {
        libssh2_session_disconnect(session_, "bye");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != -1) {
        ::close(sock_);
        sock_ = -1;
    }
    connected_ = false;
}

std::string Libssh2Transport::lastSessionError() const {
    if (!session_)
        return {};
    char *msg = nullptr;
    int len = 0;
    (void)libssh2_session_last_error(session_, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, (size_t)len) : std::string();
}

std::vector<std::string> Libssh2Transport::offeredMethods(const std::string &username) {
    if (!connected_ || !session_)
        return {};
    if (authlist_.empty()) {
        // NULL with no error means the "none" method already authenticated us.
        const char *methods = nullptr;
        for (;;) {
            methods = libssh2_userauth_list(session_, username.c_str(),
                                            (unsigned)username.size());
            if (methods || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN)
                break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        authlist_ = methods ? std::string(methods) : std::string();
    }
    std::vector<std::string> out;
    std::stringstream ss(authlist_);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            out.push_back(item);
    }
    SCPSEND_LOGD("server offers: %s", authlist_.c_str());
    return out;
}

bool Libssh2Transport::isAuthenticated() const {
    return session_ && libssh2_userauth_authenticated(session_) == 1;
}

AuthReply Libssh2Transport::replyFor(int rc) const {
    if (rc == 0)
        return AuthReply{AuthReply::Status::Accepted, {}};
    std::string msg = lastSessionError();
    switch (rc) {
    case LIBSSH2_ERROR_SOCKET_DISCONNECT:
    case LIBSSH2_ERROR_SOCKET_SEND:
    case LIBSSH2_ERROR_SOCKET_RECV:
    case LIBSSH2_ERROR_TIMEOUT:
        return AuthReply{AuthReply::Status::Disconnected, msg};
    case LIBSSH2_ERROR_FILE:
#ifdef LIBSSH2_ERROR_KEYFILE_AUTH_FAILED
    case LIBSSH2_ERROR_KEYFILE_AUTH_FAILED:
#endif
        // libssh2 reports encrypted keys and wrong passphrases the same way.
        return AuthReply{AuthReply::Status::KeyLocked, msg};
    case LIBSSH2_ERROR_METHOD_NOT_SUPPORTED:
    case LIBSSH2_ERROR_ALLOC:
        return AuthReply{AuthReply::Status::KeyUnusable, msg};
    default:
        return AuthReply{AuthReply::Status::Rejected, msg};
    }
}

AuthReply Libssh2Transport::authByKey(const std::string &username,
                                      const std::string &private_key_path,
                                      const std::optional<std::string> &passphrase) {
    if (!connected_ || !session_)
        return AuthReply{AuthReply::Status::Disconnected, "not connected"};
    const int rc = retryOnEagain([&] {
        return libssh2_userauth_publickey_fromfile(session_, username.c_str(),
                                                   nullptr, // public key derived from the private one
                                                   private_key_path.c_str(),
                                                   passphrase ? passphrase->c_str() : nullptr);
    });
    return replyFor(rc);
}

AuthReply Libssh2Transport::authByPassword(const std::string &username,
                                           const std::string &password) {
    if (!connected_ || !session_)
        return AuthReply{AuthReply::Status::Disconnected, "not connected"};

    auto hasMethod = [this](const char *m) {
        return authlist_.find(m) != std::string::npos;
    };

    int rc = LIBSSH2_ERROR_METHOD_NOT_SUPPORTED;
    if (authlist_.empty() || hasMethod("password")) {
        rc = retryOnEagain([&] {
            return libssh2_userauth_password(session_, username.c_str(), password.c_str());
        });
        AuthReply r = replyFor(rc);
        if (r.ok() || r.status == AuthReply::Status::Disconnected)
            return r;
    }

    // Servers that only offer keyboard-interactive (PAM) get the same password.
    if (hasMethod("keyboard-interactive")) {
        KbdIntCtx ctx{&username, &password, &opt_.keyboard_interactive_cb};
        void **abs = libssh2_session_abstract(session_);
        if (abs)
            *abs = &ctx;
        rc = retryOnEagain([&] {
            return libssh2_userauth_keyboard_interactive(session_, username.c_str(),
                                                         kbint_password_callback);
        });
        if (abs)
            *abs = nullptr;
    }
    return replyFor(rc);
}

std::unique_ptr<WriteChannel> Libssh2Transport::openWriteChannel(const std::string &remote_path,
                                                                 std::uint64_t size,
                                                                 std::uint32_t mode,
                                                                 std::int64_t mtime,
                                                                 std::int64_t atime,
                                                                 std::string &err) {
    if (!connected_ || !session_) {
        err = "Not connected";
        return nullptr;
    }
    LIBSSH2_CHANNEL *ch = nullptr;
    for (;;) {
        ch = libssh2_scp_send64(session_, remote_path.c_str(), (int)(mode & 0777),
                                (libssh2_int64_t)size, (time_t)mtime, (time_t)atime);
        if (ch || libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN)
            break;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    if (!ch) {
        err = "Could not open remote file " + remote_path;
        const std::string detail = lastSessionError();
        if (!detail.empty())
            err += ": " + detail;
        return nullptr;
    }
    return std::make_unique<Libssh2ScpChannel>(session_, ch);
}

} // namespace scpsend
