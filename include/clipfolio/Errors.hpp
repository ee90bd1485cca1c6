#pragma once
// Exception hierarchy shared by all components

#include <stdexcept>
#include <string>

namespace clipfolio {

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Application could not start (context, storage, plugin setup, window)
class StartupError : public Error {
public:
    using Error::Error;
};

class StorageError : public Error {
public:
    using Error::Error;
};

// Backup document rejected; store left untouched
class ImportError : public Error {
public:
    using Error::Error;
};

// Unknown command, missing permission or bad arguments
class CommandError : public Error {
public:
    using Error::Error;
};

// Path outside the filesystem scope
class ScopeError : public Error {
public:
    using Error::Error;
};

} // namespace clipfolio
