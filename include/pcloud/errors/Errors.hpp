#pragma once

#include <stdexcept>
#include <string>

namespace pcloud::errors {

// Root of everything the library throws on purpose.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Malformed local input, detected before any network I/O.
struct ConfigurationError : Error {
    using Error::Error;
};

class AuthenticationError : public Error {
public:
    AuthenticationError(int code, std::string reason);

    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const std::string& reason() const { return reason_; }

private:
    int code_;
    std::string reason_;
};

class TransportError : public Error {
public:
    explicit TransportError(const std::string& what, bool timedOut = false, bool cancelled = false);

    [[nodiscard]] bool timedOut() const { return timedOut_; }
    [[nodiscard]] bool cancelled() const { return cancelled_; }

private:
    bool timedOut_;
    bool cancelled_;
};

// Non-zero pCloud result code, or an HTTP error without a JSON body (code is then the HTTP status).
class ServerError : public Error {
public:
    ServerError(int code, std::string message);

    [[nodiscard]] int code() const { return code_; }
    [[nodiscard]] const std::string& message() const { return message_; }

private:
    int code_;
    std::string message_;
};

class IntegrityError : public Error {
public:
    IntegrityError(std::string algorithm, std::string expected, std::string computed);
    explicit IntegrityError(const std::string& what);

    [[nodiscard]] const std::string& algorithm() const { return algorithm_; }
    [[nodiscard]] const std::string& expected() const { return expected_; }
    [[nodiscard]] const std::string& computed() const { return computed_; }

private:
    std::string algorithm_, expected_, computed_;
};

}
