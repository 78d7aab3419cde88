#pragma once
#include <stdexcept>
#include <string>

namespace soulwire {

// Provider failures. Transient ones are retried by the step loop, fatal
// ones end the turn immediately.
class TransientProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class FatalProviderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// No handler registered for a requested tool name. Fatal to the step.
class HubError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Undecodable line on an inbound wire channel.
class ProtocolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Durable log append failed. Fatal to the engine.
class LogWriteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Another writer still owns the session directory.
class SessionBusyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace soulwire
