#pragma once

#include <stdexcept>
#include <string>

namespace shinglescan {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A nominated source could not be read as text at all.
class SourceUnavailableError : public Error {
public:
    SourceUnavailableError(const std::string& id, const std::string& reason)
        : Error("source unavailable: " + id + ": " + reason), id_(id), reason_(reason) {}

    const std::string& id() const { return id_; }
    const std::string& reason() const { return reason_; }

private:
    std::string id_;
    std::string reason_;
};

using InvalidSourceError = SourceUnavailableError;

// A document with no shingles for the chosen n cannot be compared.
class DegenerateDocumentError : public Error {
public:
    explicit DegenerateDocumentError(const std::string& id)
        : Error("too short to compare: " + id), id_(id) {}

    const std::string& id() const { return id_; }

private:
    std::string id_;
};

class InvalidParameterError : public Error {
public:
    InvalidParameterError(const std::string& parameter, const std::string& reason)
        : Error("invalid parameter '" + parameter + "': " + reason), parameter_(parameter) {}

    const std::string& parameter() const { return parameter_; }

private:
    std::string parameter_;
};

// Raised by directory discovery, e.g. for a broken symlink.
class SourceDiscoveryError : public Error {
public:
    SourceDiscoveryError(const std::string& path, const std::string& reason)
        : Error(reason + ": " + path), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace shinglescan
