#ifndef CONVERTER_ERRORS_HPP
#define CONVERTER_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <vector>

#include "converter/ConversionPlan.hpp"

// Storage read/write failure. Never retried.
class IOError : public std::runtime_error {
public:
    explicit IOError(const std::string& what) : std::runtime_error(what) {}
};

// Structural violation found while decoding an 8SVX container.
class MalformedContainer : public std::runtime_error {
public:
    explicit MalformedContainer(const std::string& what) : std::runtime_error(what) {}
};

// Options rejected by the plan builder or the config mapping.
class InvalidConfig : public std::runtime_error {
public:
    explicit InvalidConfig(const std::string& what) : std::runtime_error(what) {}
};

// Failure reported by an audio engine; keeps the plan it was running.
class EngineFailure : public std::runtime_error {
public:
    EngineFailure(const std::string& what, ConversionPlan plan);

    const ConversionPlan& Plan() const { return plan_; }

private:
    ConversionPlan plan_;
};

#endif // CONVERTER_ERRORS_HPP
