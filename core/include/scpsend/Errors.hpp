// Typed errors surfaced by the core. Each carries enough context (outcome
// list, byte offset) for the CLI to print a precise message.
#pragma once
#include "Credentials.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace scpsend {

struct AuthError {
    enum class Kind { None, AllMethodsFailed };

    Kind kind = Kind::None;
    std::vector<AuthOutcome> outcomes; // in attempt order

    bool isError() const { return kind != Kind::None; }
    std::string describe() const;
};

struct TransferError {
    enum class Kind {
        None,
        ChannelOpenFailed,
        LocalReadFailed,
        RemoteWriteFailed,
        SizeMismatch,
        RemoteCloseFailed
    };

    Kind kind = Kind::None;
    std::uint64_t offset = 0;   // LocalReadFailed / RemoteWriteFailed
    std::uint64_t expected = 0; // SizeMismatch
    std::uint64_t actual = 0;   // SizeMismatch
    std::string detail;         // backend message, if any

    bool isError() const { return kind != Kind::None; }
    std::string describe() const;
};

const char *transferErrorName(TransferError::Kind k);

} // namespace scpsend
