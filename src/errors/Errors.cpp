#include "pcloud/errors/Errors.hpp"

#include <fmt/format.h>

using namespace pcloud::errors;

AuthenticationError::AuthenticationError(const int code, std::string reason)
    : Error(fmt::format("authentication failed ({}): {}", code, reason)),
      code_(code), reason_(std::move(reason)) {}

TransportError::TransportError(const std::string& what, const bool timedOut, const bool cancelled)
    : Error(what), timedOut_(timedOut), cancelled_(cancelled) {}

ServerError::ServerError(const int code, std::string message)
    : Error(fmt::format("pCloud error {}: {}", code, message)),
      code_(code), message_(std::move(message)) {}

IntegrityError::IntegrityError(std::string algorithm, std::string expected, std::string computed)
    : Error(fmt::format("{} checksum mismatch: expected {}, computed {}", algorithm, expected, computed)),
      algorithm_(std::move(algorithm)), expected_(std::move(expected)), computed_(std::move(computed)) {}

IntegrityError::IntegrityError(const std::string& what) : Error(what) {}
