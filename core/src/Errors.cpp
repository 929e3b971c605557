#include "scpsend/Errors.hpp"

#include <sstream>

namespace scpsend {

std::string AuthError::describe() const {
    if (kind == Kind::None)
        return {};
    std::ostringstream oss;
    oss << "Authentication failed: all methods exhausted";
    if (outcomes.empty()) {
        oss << " (no credentials to try)";
        return oss.str();
    }
    for (const auto &o : outcomes) {
        oss << "\n  " << o.label << ": " << outcomeKindName(o.kind);
        if (!o.reason.empty())
            oss << " (" << o.reason << ")";
    }
    return oss.str();
}

const char *transferErrorName(TransferError::Kind k) {
    switch (k) {
    case TransferError::Kind::None:
        return "None";
    case TransferError::Kind::ChannelOpenFailed:
        return "ChannelOpenFailed";
    case TransferError::Kind::LocalReadFailed:
        return "LocalReadFailed";
    case TransferError::Kind::RemoteWriteFailed:
        return "RemoteWriteFailed";
    case TransferError::Kind::SizeMismatch:
        return "SizeMismatch";
    case TransferError::Kind::RemoteCloseFailed:
        return "RemoteCloseFailed";
    }
    return "Unknown";
}

std::string TransferError::describe() const {
    std::ostringstream oss;
    switch (kind) {
    case Kind::None:
        return {};
    case Kind::ChannelOpenFailed:
        oss << "Could not open remote file for writing";
        break;
    case Kind::LocalReadFailed:
        oss << "Local read failed at byte " << offset;
        break;
    case Kind::RemoteWriteFailed:
        oss << "Remote write failed at byte " << offset;
        break;
    case Kind::SizeMismatch:
        oss << "Local file changed during transfer: expected " << expected
            << " bytes, read " << actual;
        break;
    case Kind::RemoteCloseFailed:
        oss << "Remote side did not confirm the upload";
        break;
    }
    if (!detail.empty())
        oss << ": " << detail;
    return oss.str();
}

} // namespace scpsend
