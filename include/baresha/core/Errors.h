/**
 * @file Errors.h
 * @brief Exception hierarchy used across the job engine
 *
 * @copyright Copyright (c) 2024 Baresha Project
 * @license GPL-3.0-or-later
 */

#pragma once

#include "baresha/core/Types.h"

#include <optional>
#include <stdexcept>

#include <QString>

namespace Baresha {

/**
 * @brief Base class for every error raised by the core
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const QString& message)
        : std::runtime_error(message.toStdString())
        , m_kind(kind)
        , m_message(message)
    {}

    [[nodiscard]] ErrorKind kind() const noexcept { return m_kind; }
    [[nodiscard]] const QString& message() const noexcept { return m_message; }

private:
    ErrorKind m_kind;
    QString m_message;
};

class InvalidUrlError : public Error {
public:
    explicit InvalidUrlError(const QString& message)
        : Error(ErrorKind::InvalidUrl, message) {}
};

class InvalidStateError : public Error {
public:
    explicit InvalidStateError(const QString& message)
        : Error(ErrorKind::InvalidState, message) {}
};

class RateLimitConfigError : public Error {
public:
    explicit RateLimitConfigError(const QString& message)
        : Error(ErrorKind::RateLimitConfig, message) {}
};

/**
 * @brief Engine could not retrieve metadata for a URL
 */
class ResolveError : public Error {
public:
    ResolveError(ErrorCause cause, const QString& message)
        : Error(ErrorKind::Resolve, message)
        , m_cause(cause)
    {}

    [[nodiscard]] ErrorCause cause() const noexcept { return m_cause; }

private:
    ErrorCause m_cause;
};

/**
 * @brief Engine failed mid-transfer
 *
 * Carries the last acknowledged checkpoint when the engine left a partial
 * file that a later retry can continue from.
 */
class TransferError : public Error {
public:
    TransferError(ErrorCause cause, const QString& message,
                  std::optional<ResumeToken> token = std::nullopt)
        : Error(ErrorKind::Transfer, message)
        , m_cause(cause)
        , m_token(std::move(token))
    {}

    [[nodiscard]] ErrorCause cause() const noexcept { return m_cause; }
    [[nodiscard]] const std::optional<ResumeToken>& resumeToken() const noexcept { return m_token; }

private:
    ErrorCause m_cause;
    std::optional<ResumeToken> m_token;
};

} // namespace Baresha
