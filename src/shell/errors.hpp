#pragma once

#include <stdexcept>
#include <string>

namespace streamshell {

// Background service could not be launched. Fatal at startup.
class SpawnError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The main window could not be found. Violates the single-window invariant.
class WindowLookupError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// An update check failed. Recoverable, reported as a reason string.
class UpdateCheckError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// The background service could not be stopped. Logged during shutdown only.
class TerminationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace streamshell
