/**
 * @file budget_policy.hpp
 * @brief Resolution of caller overrides into an enforceable ResourceBudget.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/types.hpp"

namespace runbox {

/**
 * @brief Applies defaults, hard caps and floors to a budget override.
 *
 * Unset fields take the configured default. Fields above the cap are clamped
 * to it. A field below the floor makes the whole request invalid.
 */
class BudgetPolicy {
public:
    explicit BudgetPolicy(LimitsConfig limits);

    [[nodiscard]] Result<ResourceBudget> resolve(const PartialBudget& override_budget) const;

    [[nodiscard]] const ResourceBudget& defaults() const noexcept { return limits_.defaults; }
    [[nodiscard]] const ResourceBudget& caps() const noexcept { return limits_.max; }
    [[nodiscard]] const ResourceBudget& floors() const noexcept { return limits_.min; }

private:
    LimitsConfig limits_;
};

}  // namespace runbox
