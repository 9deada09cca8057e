/**
 * @file Errors.hpp
 * @brief Exception types raised by the single-instance coordination layer.
 *
 * Path resolution failures are not represented here: an unresolvable
 * mailbox entry is dropped and logged, never thrown.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace markflow::core {

/**
 * @brief The owning process could not get ready to serve.
 *
 * Raised when no bindable port is found, when a bind fails after a
 * successful probe, or when the instance lock file cannot be opened.
 * A bind race is recoverable and retried by the owner lifecycle.
 */
class StartupError : public std::runtime_error {
public:
    explicit StartupError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief The mailbox lock could not be acquired within the enqueue bound.
 */
class MailboxTimeoutError : public std::runtime_error {
public:
    explicit MailboxTimeoutError(const std::string& message) : std::runtime_error(message) {}
};

/**
 * @brief A recoverable I/O hiccup inside the mailbox drain path.
 *
 * Caught by the mailbox monitor and retried on a later tick.
 */
class TransientIoError : public std::runtime_error {
public:
    explicit TransientIoError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace markflow::core
