/**
 * @file budget_policy.cpp
 * @brief BudgetPolicy implementation.
 */

#include "limits/budget_policy.hpp"

#include <algorithm>
#include <optional>
#include <string>

namespace runbox {

namespace {

/// Returns the error message on a floor breach, otherwise writes the field.
std::optional<std::string> resolve_field(const char* name,
                                         const std::optional<uint64_t>& requested,
                                         uint64_t fallback,
                                         uint64_t floor,
                                         uint64_t cap,
                                         uint64_t& out) {
    if (!requested) {
        out = fallback;
        return std::nullopt;
    }
    if (*requested < floor) {
        return std::string{name} + " " + std::to_string(*requested)
             + " is below the minimum of " + std::to_string(floor);
    }
    out = std::min(*requested, cap);
    return std::nullopt;
}

}  // anonymous namespace

BudgetPolicy::BudgetPolicy(LimitsConfig limits) : limits_(limits) {}

Result<ResourceBudget> BudgetPolicy::resolve(const PartialBudget& override_budget) const {
    const auto& def = limits_.defaults;
    const auto& lo = limits_.min;
    const auto& hi = limits_.max;
    ResourceBudget budget;

    std::optional<std::string> err;
    if ((err = resolve_field("cpuTimeMs", override_budget.cpu_time_ms,
                             def.cpu_time_ms, lo.cpu_time_ms, hi.cpu_time_ms,
                             budget.cpu_time_ms))
        || (err = resolve_field("wallTimeMs", override_budget.wall_time_ms,
                                def.wall_time_ms, lo.wall_time_ms, hi.wall_time_ms,
                                budget.wall_time_ms))
        || (err = resolve_field("memoryBytes", override_budget.memory_bytes,
                                def.memory_bytes, lo.memory_bytes, hi.memory_bytes,
                                budget.memory_bytes))
        || (err = resolve_field("maxOutputBytes", override_budget.max_output_bytes,
                                def.max_output_bytes, lo.max_output_bytes, hi.max_output_bytes,
                                budget.max_output_bytes))
        || (err = resolve_field("maxProcesses", override_budget.max_processes,
                                def.max_processes, lo.max_processes, hi.max_processes,
                                budget.max_processes))) {
        return Error{ErrorCode::InvalidBudget, *err};
    }

    return budget;
}

}  // namespace runbox
