#pragma once

#include <stdexcept>
#include <string>

namespace taskheader {

// Raised before any network traffic when the remote tracker is not set up
// (no repository attached, no API key).
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// Any failed remote call: transport failure, timeout, non-200 status or a
// GraphQL error payload. Callers treat all of these alike.
class RemoteCallError : public std::runtime_error {
public:
    explicit RemoteCallError(const std::string &message, int httpStatus = 0)
        : std::runtime_error(message)
        , m_httpStatus(httpStatus)
    {
    }

    int httpStatus() const { return m_httpStatus; }

private:
    int m_httpStatus;
};

} // namespace taskheader
