/**
 * @file StoreErrors.hpp
 * @brief Exception types raised by the project store.
 */

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace novelstore::domain {

enum class ErrorKind {
    NotFound,
    InvalidArgument,
    IO,
    Parse
};

/**
 * @class StoreError
 * @brief Base of every failure the store reports.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}

    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/** @brief A chapter, volume or version id is unknown. */
class NotFoundError : public StoreError {
public:
    explicit NotFoundError(const std::string& message)
        : StoreError(ErrorKind::NotFound, message) {}
};

/** @brief Caller passed ids that break a structural rule. */
class InvalidArgumentError : public StoreError {
public:
    InvalidArgumentError(const std::string& message, std::string offendingId)
        : StoreError(ErrorKind::InvalidArgument, message), m_offendingId(std::move(offendingId)) {}

    const std::string& offendingId() const { return m_offendingId; }

private:
    std::string m_offendingId;
};

/**
 * @class IoError
 * @brief Filesystem failure, tagged with the path and the operation attempted.
 */
class IoError : public StoreError {
public:
    IoError(std::string operation, std::filesystem::path path, const std::string& detail)
        : StoreError(ErrorKind::IO, operation + " failed for '" + path.string() + "': " + detail),
          m_operation(std::move(operation)),
          m_path(std::move(path)) {}

    const std::string& operation() const { return m_operation; }
    const std::filesystem::path& path() const { return m_path; }

private:
    std::string m_operation;
    std::filesystem::path m_path;
};

/**
 * @class ParseError
 * @brief A metadata or snapshot document could not be deserialized.
 */
class ParseError : public StoreError {
public:
    enum class Reason {
        Missing,    ///< The file does not exist.
        Malformed   ///< The file exists but its content is not what we expect.
    };

    ParseError(Reason reason, std::filesystem::path path, const std::string& detail)
        : StoreError(ErrorKind::Parse,
                     std::string(reason == Reason::Missing ? "missing" : "malformed") +
                         " document '" + path.string() + "': " + detail),
          m_reason(reason),
          m_path(std::move(path)) {}

    Reason reason() const { return m_reason; }
    const std::filesystem::path& path() const { return m_path; }

private:
    Reason m_reason;
    std::filesystem::path m_path;
};

} // namespace novelstore::domain
