#ifndef FLUXGUARD_EXCEPTIONS_H
#define FLUXGUARD_EXCEPTIONS_H

#include <stdexcept>
#include <string>

namespace FluxGuard {

class FluxGuardException : public std::runtime_error {
public:
    explicit FluxGuardException(const std::string& message) : std::runtime_error(message) {}
};

class IOException : public FluxGuardException {
public:
    explicit IOException(const std::string& message) : FluxGuardException("IO Error: " + message) {}
};

class DatasetException : public FluxGuardException {
public:
    explicit DatasetException(const std::string& message) : FluxGuardException("Dataset Error: " + message) {}
};

class ConfigurationException : public FluxGuardException {
public:
    explicit ConfigurationException(const std::string& message) : FluxGuardException("Configuration Error: " + message) {}
};

// Raised for a single rule; callers record it instead of aborting the rule set.
class EvaluationException : public FluxGuardException {
public:
    explicit EvaluationException(const std::string& message) : FluxGuardException(message) {}
};

} // namespace FluxGuard

#endif // FLUXGUARD_EXCEPTIONS_H
