#ifndef COMMPLAN_CORE_ERRORS_HPP
#define COMMPLAN_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace commplan {

/**
 * @brief Base of every error raised by the engine
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& msg) : std::runtime_error(msg) {}
};

/// Missing timing data, invalid mission configuration, malformed input files
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& msg) : Error(msg) {}
};

/// Non-finite coordinates or altitude handed to the geometry layer
class GeometryInputError : public Error {
public:
    explicit GeometryInputError(const std::string& msg) : Error(msg) {}
};

/// Malformed coverage dataset. Caught at load time; coverage degrades to none.
class CoverageDataError : public Error {
public:
    explicit CoverageDataError(const std::string& msg) : Error(msg) {}
};

/// Wraps any failure raised while building a mission timeline
class TimelineComputationError : public Error {
public:
    explicit TimelineComputationError(const std::string& msg) : Error(msg) {}
};

} // namespace commplan

#endif // COMMPLAN_CORE_ERRORS_HPP
