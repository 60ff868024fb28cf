/*
  This file is part of the Open Porous Media project (OPM).

  OPM is free software: you can redistribute it and/or modify
  it under the terms of the GNU General Public License as published by
  the Free Software Foundation, either version 3 of the License, or
  (at your option) any later version.

  OPM is distributed in the hope that it will be useful,
  but WITHOUT ANY WARRANTY; without even the implied warranty of
  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
  GNU General Public License for more details.

  You should have received a copy of the GNU General Public License
  along with OPM.  If not, see <http://www.gnu.org/licenses/>.
*/

#include <config.h>

#include <scal/satfunc/Monotonicity.hpp>

#include <scal/common/Constants.hpp>
#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace {

    // Size of one unit in the last printed place, 10^-digits.
    double lastPlaceUnit(const int digits)
    {
        return std::pow(10.0, -digits);
    }

    bool anyOf(const std::vector<bool>& flags)
    {
        return std::find(flags.begin(), flags.end(), true) != flags.end();
    }

    double maxAbsValue(const std::vector<double>& column)
    {
        auto m = 0.0;
        for (const auto& x : column) {
            m = std::max(m, std::abs(x));
        }

        return m;
    }

    // Whether or not the column, printed with 'digits' decimals, goes
    // against the direction 'sign' by more than one unit in the last
    // printed place.  Compared in integer units of the last place since
    // a one-unit gap is not exactly representable as a double.
    bool violatesMonotonicity(const std::vector<double>& column,
                              const int                  digits,
                              const int                  sign)
    {
        const auto scale = std::pow(10.0, digits);
        const auto units = [digits, scale](const double x)
        {
            return std::llround(Scal::roundToDecimals(x, digits) * scale);
        };

        for (std::size_t i = 1; i < column.size(); ++i) {
            if (std::isnan(column[i - 1]) || std::isnan(column[i])) {
                continue;
            }

            const auto di = units(column[i]) - units(column[i - 1]);
            if ((sign > 0) ? (di < -1) : (di > 1)) {
                return true;
            }
        }

        return false;
    }

    std::vector<double>
    fixColumn(std::vector<double>           values,
              const std::string&            column,
              const Scal::MonotonicitySpec& spec,
              const int                     digits,
              Scal::DeferredLogger&         deferredLogger)
    {
        const auto accuracy = lastPlaceUnit(digits) - Scal::EPSILON;

        if (spec.allowzero.value_or(false) && (maxAbsValue(values) < accuracy)) {
            // All-zero column is exempt from strict monotonicity.
            return values;
        }

        const auto increment = spec.sign * lastPlaceUnit(digits) - Scal::EPSILON;
        const auto maxIterations = 2 * values.size();

        auto toFix = Scal::rowsToBeFixed(values, spec, digits);
        auto iterations = std::size_t{0};
        while (anyOf(toFix)) {
            if (++iterations > maxIterations) {
                OPM_THROW_NOLOG(Scal::ConvergenceError,
                                fmt::format("Too many iterations ({}) for "
                                            "monotonicity fix of column '{}'",
                                            iterations - 1, column));
            }

            for (std::size_t i = 0; i < values.size(); ++i) {
                if (toFix[i]) {
                    values[i] += increment;
                }
            }

            // Restore non-strict monotonicity and limits after each pass.
            values = Scal::clipAccumulate(values, spec);

            toFix = Scal::rowsToBeFixed(values, spec, digits);
        }

        // The iteration count does not necessarily match the number of
        // modified rows.
        if (static_cast<double>(iterations) > 0.05 * static_cast<double>(values.size())) {
            deferredLogger.warning("Monotonicity",
                                   fmt::format("Needed {} iterations on column "
                                               "'{}' of length {}", iterations,
                                               column, values.size()));
        }

        if (violatesMonotonicity(values, digits, spec.sign)) {
            OPM_THROW_NOLOG(Scal::ValidationError,
                            fmt::format("Not possible to make column '{}' "
                                        "monotonically {}", column,
                                        (spec.sign > 0) ? "increasing" : "decreasing"));
        }

        return values;
    }

} // Anonymous namespace

namespace Scal {

void checkLimits(const std::vector<double>& column,
                 const MonotonicitySpec&    spec,
                 const std::string&         colname)
{
    if (column.empty()) {
        return;
    }

    if (spec.upper.has_value()) {
        const auto upper = *spec.upper;
        if (std::any_of(column.begin(), column.end(),
                        [upper](const double x) { return x > upper; }))
        {
            OPM_THROW_NOLOG(RangeError,
                            fmt::format("Values larger than upper limit {} "
                                        "in column '{}'", upper, colname));
        }
    }

    if (spec.lower.has_value()) {
        const auto lower = *spec.lower;
        if (std::any_of(column.begin(), column.end(),
                        [lower](const double x) { return x < lower; }))
        {
            OPM_THROW_NOLOG(RangeError,
                            fmt::format("Values smaller than lower limit {} "
                                        "in column '{}'", lower, colname));
        }
    }
}

void checkAlmostMonotone(const std::vector<double>& column,
                         const int                  digits,
                         const int                  sign)
{
    const auto allowance = lastPlaceUnit(digits - 1);

    for (const auto& di : diff(column)) {
        if (std::isnan(di)) {
            continue;
        }

        if ((sign > 0) && (di < -allowance)) {
            OPM_THROW_NOLOG(MonotonicityError,
                            fmt::format("Series is not almost monotonically increasing "
                                        "(difference {} below -{})", di, allowance));
        }

        if ((sign < 0) && (di > allowance)) {
            OPM_THROW_NOLOG(MonotonicityError,
                            fmt::format("Series is not almost monotonically decreasing "
                                        "(difference {} above {})", di, allowance));
        }
    }
}

std::vector<double>
clipAccumulate(const std::vector<double>& column,
               const MonotonicitySpec&    spec)
{
    auto result = column;

    for (std::size_t i = 1; i < result.size(); ++i) {
        result[i] = (spec.sign > 0)
            ? std::max(result[i - 1], result[i])
            : std::min(result[i - 1], result[i]);
    }

    for (auto& x : result) {
        if (spec.lower.has_value()) {
            x = std::max(x, *spec.lower);
        }

        if (spec.upper.has_value()) {
            x = std::min(x, *spec.upper);
        }
    }

    return result;
}

std::vector<bool>
rowsToBeFixed(const std::vector<double>& column,
              const MonotonicitySpec&    spec,
              const int                  digits)
{
    // Subtracting EPSILON is critical to avoid being greedy.
    const auto accuracy = lastPlaceUnit(digits) - EPSILON;

    auto rounded = column;
    std::transform(rounded.begin(), rounded.end(), rounded.begin(),
                   [digits](const double x) { return roundToDecimals(x, digits + 1); });

    const auto d = diff(rounded);

    auto toFix = std::vector<bool>(column.size(), false);
    for (std::size_t i = 0; i < column.size(); ++i) {
        toFix[i] = (spec.sign > 0) ? (d[i] < accuracy) : (d[i] > -accuracy);

        // Constants are allowed at the limits.
        if (spec.upper.has_value()) {
            toFix[i] = toFix[i] && (column[i] < *spec.upper - accuracy);
        }

        if (spec.lower.has_value()) {
            toFix[i] = toFix[i] && (column[i] > *spec.lower + accuracy);
        }
    }

    return toFix;
}

SaturationTable
makeMonotone(const SaturationTable&    table,
             const MonotonicityConfig& config,
             const int                 digits,
             DeferredLogger&           deferredLogger)
{
    validateMonotonicity(config, table.columnNames());

    // One decimal finer than the end result, to avoid representation
    // errors.
    auto result = table.rounded(digits + 1);

    // Bail on clearly erroneous data before modifying anything.
    for (const auto& [column, spec] : config) {
        checkAlmostMonotone(result.column(column), digits, spec.sign);
        checkLimits(result.column(column), spec, column);
    }

    for (const auto& [column, spec] : config) {
        result.setColumn(column, fixColumn(result.column(column), column,
                                           spec, digits, deferredLogger));
    }

    return result;
}

} // namespace Scal
