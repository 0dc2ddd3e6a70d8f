#ifndef ERRORS_HPP
#define ERRORS_HPP

#include <stdexcept>
#include <string>

class ValidationError : public std::runtime_error {
public:
    explicit ValidationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a conflict strategy declines to place a file.
 * Never fatal for a batch: the caller records the file as skipped.
 */
class ConflictUnresolvable : public std::runtime_error {
public:
    enum class Reason {
        Skipped,
        Duplicate,
        DestinationLarger,
        DestinationNewer,
        RenameExhausted
    };

    ConflictUnresolvable(Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

class OperationError : public std::runtime_error {
public:
    explicit OperationError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

#endif
