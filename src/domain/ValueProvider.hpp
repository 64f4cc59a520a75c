/**
 * @file ValueProvider.hpp
 * @brief Capability interface that yields one metric's value for a given day.
 */

#pragma once
#include <optional>
#include <functional>
#include <utility>
#include "CalendarDay.hpp"

namespace metriclens::domain {

/**
 * @class ValueProvider
 * @brief Abstract read access to a metric's daily observations.
 *
 * Implemented by the health, phone-usage and journal stores. Must be pure with
 * respect to the day for the duration of one engine run.
 */
class ValueProvider {
public:
    virtual ~ValueProvider() = default;

    /**
     * @brief Observation for the given day.
     * @return nullopt when nothing was recorded (a normal outcome).
     * @throws ProviderUnavailableError when the backing store cannot be read.
     */
    virtual std::optional<double> valueFor(const CalendarDay& day) const = 0;
};

/**
 * @class FunctionValueProvider
 * @brief Adapts a plain callable to the ValueProvider interface.
 */
class FunctionValueProvider : public ValueProvider {
public:
    using Function = std::function<std::optional<double>(const CalendarDay&)>;

    explicit FunctionValueProvider(Function fn) : m_fn(std::move(fn)) {}

    std::optional<double> valueFor(const CalendarDay& day) const override {
        return m_fn ? m_fn(day) : std::nullopt;
    }

private:
    Function m_fn;
};

} // namespace metriclens::domain
