#pragma once

#include <stdexcept>
#include <string>

namespace rangeget {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rejected job parameters, raised before any network activity.
class ConfigurationError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Content length discovery failed.
class ProbeError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// A single range could not be fetched or stored.
class FetchError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

// Reported by DownloadCoordinator::run when any range failed.
class ConnectionError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class MergeError : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace rangeget
