#pragma once

#include <stdexcept>
#include <string>

namespace craftgate {

// Malformed varint, truncated frame, unexpected packet id, bad address length.
struct ProtocolError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

// start() on a running instance, occupied port, exhausted port range.
struct LifecycleError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ResolveError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct StoreError : public std::runtime_error {
    using std::runtime_error::runtime_error;
};

struct ListenerInUseError : public StoreError {
    using StoreError::StoreError;
};

} // namespace craftgate
