#pragma once

#include <stdexcept>
#include <string>

namespace rs::transport {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ConnectError : Error {
    enum class Kind { Unreachable, Refused, TimedOut, Other };

    ConnectError(const Kind kind, const std::string& what) : Error(what), kind(kind) {}

    Kind kind;
};

// Bad credentials
struct AuthError : Error {
    using Error::Error;
};

// Remote directory missing or forbidden
struct PathError : Error {
    using Error::Error;
};

// Listing or file transfer failed on an established session
struct TransferError : Error {
    using Error::Error;
};

inline std::string to_string(const ConnectError::Kind kind) {
    switch (kind) {
    case ConnectError::Kind::Unreachable: return "unreachable";
    case ConnectError::Kind::Refused: return "refused";
    case ConnectError::Kind::TimedOut: return "timed out";
    case ConnectError::Kind::Other: return "failed";
    }
    return "failed";
}

}
