#include "converter/Errors.hpp"

#include <utility>

EngineFailure::EngineFailure(const std::string& what, ConversionPlan plan)
    : std::runtime_error(what + " [plan: " + DescribePlan(plan) + "]"),
      plan_(std::move(plan)) {}
