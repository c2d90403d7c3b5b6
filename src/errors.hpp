#pragma once
#include <stdexcept>
#include <string>

namespace kindling {

// Caller misuse of a controller (double start, join before start, bad path).
// Thrown synchronously; no background state is touched.
class UsageError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

class AlreadyStartedError : public UsageError {
public:
    explicit AlreadyStartedError(const std::string& what_arg)
        : UsageError(what_arg + " already started") {}
};

class NotStartedError : public UsageError {
public:
    explicit NotStartedError(const std::string& what_arg)
        : UsageError(what_arg + " not started") {}
};

class FileNotFoundError : public UsageError {
public:
    explicit FileNotFoundError(const std::string& path)
        : UsageError("File not found: " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Failed request against the chat backend
class ConnectionError : public std::runtime_error {
public:
    ConnectionError(const std::string& what_arg, long status_code = 0)
        : std::runtime_error(what_arg), status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

class AuthenticationError : public ConnectionError {
public:
    explicit AuthenticationError(const std::string& url)
        : ConnectionError("Access denied while trying to access " + url, 401) {}
};

} // namespace kindling
