#pragma once

#include <stdexcept>
#include <string>
#include <utility>

class PmsException : public std::runtime_error {
public:
    explicit PmsException(const std::string& message)
        : std::runtime_error(message) {}
};

// Requested or dependency package is absent from the repository index.
class UnknownPackage : public PmsException {
public:
    explicit UnknownPackage(const std::string& message)
        : PmsException(message) {}
};

// No available version of a dependency meets its constraint.
class UnsatisfiableDependency : public PmsException {
public:
    explicit UnsatisfiableDependency(const std::string& message)
        : PmsException(message) {}
};

class CircularDependency : public PmsException {
public:
    CircularDependency(std::string package, const std::string& message)
        : PmsException(message), package_(std::move(package)) {}

    const std::string& package() const { return package_; }

private:
    std::string package_;
};

class InvalidStatus : public PmsException {
public:
    explicit InvalidStatus(const std::string& message)
        : PmsException(message) {}
};

class NotInstalled : public PmsException {
public:
    explicit NotInstalled(const std::string& message)
        : PmsException(message) {}
};

// The operator declined a confirmation prompt.
class OperationCancelled : public PmsException {
public:
    explicit OperationCancelled(const std::string& message)
        : PmsException(message) {}
};

class InvalidMetadata : public PmsException {
public:
    explicit InvalidMetadata(const std::string& message)
        : PmsException(message) {}
};
