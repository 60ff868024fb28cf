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

#include <scal/satfunc/TableQueries.hpp>

#include <scal/common/Constants.hpp>
#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>
#include <scal/satfunc/SaturationTable.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace {

    bool anyNaN(const std::vector<double>& v)
    {
        return std::any_of(v.begin(), v.end(),
                           [](const double x) { return std::isnan(x); });
    }

    // Tolerance for detecting the onset of non-zero deviation from the
    // linear part.  Scaled by the magnitude of y so that long tables of
    // large values do not drown in floating point noise.
    double linearityTolerance(const std::vector<double>& y)
    {
        auto ymax = 1.0;
        for (const auto& yi : y) {
            ymax = std::max(ymax, std::abs(yi));
        }

        return Scal::EPSILON * ymax;
    }

} // Anonymous namespace

namespace Scal {

double crosspoint(const SaturationTable& table,
                  const std::string&     satcol,
                  const std::string&     kr1col,
                  const std::string&     kr2col,
                  DeferredLogger&        deferredLogger)
{
    const auto& s   = table.column(satcol);
    const auto& kr1 = table.column(kr1col);
    const auto& kr2 = table.column(kr2col);

    if (anyNaN(s) || anyNaN(kr1) || anyNaN(kr2)) {
        deferredLogger.warning("Crosspoint",
                               fmt::format("Could not compute crosspoint of "
                                           "{} and {}: missing values", kr1col, kr2col));
        return -1.0;
    }

    auto krdiff = std::vector<double>(s.size());
    std::transform(kr1.begin(), kr1.end(), kr2.begin(), krdiff.begin(),
                   [](const double a, const double b) { return a - b; });

    for (std::size_t i = 0; i + 1 < krdiff.size(); ++i) {
        const auto d0 = krdiff[i];
        const auto d1 = krdiff[i + 1];

        if (d0 == 0.0) {
            return s[i];
        }

        if ((d0 < 0.0) != (d1 < 0.0)) {
            return s[i] + (s[i + 1] - s[i]) * (0.0 - d0) / (d1 - d0);
        }
    }

    if (! krdiff.empty() && (krdiff.back() == 0.0)) {
        return s.back();
    }

    deferredLogger.warning("Crosspoint",
                           fmt::format("Could not compute crosspoint of {} and "
                                       "{}: curves do not intersect", kr1col, kr2col));
    return -1.0;
}

double estimateDiffJumpPoint(const SaturationTable& table,
                             const std::string&     xcol,
                             const std::string&     ycol,
                             const JumpSide         side)
{
    if ((xcol.empty() || ycol.empty()) && (table.numColumns() < 2)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("Table with {} column(s) has no default "
                                    "x and y columns", table.numColumns()));
    }

    const auto& x = table.column(xcol.empty() ? table.columnNames()[0] : xcol);
    const auto& y = table.column(ycol.empty() ? table.columnNames()[1] : ycol);

    const auto n = x.size();
    if (n < 2) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("Linear domain estimation needs at least "
                                    "two rows, got {}", n));
    }

    // Derivative.  The first becomes undefined, extrapolate from the
    // second row.
    auto deriv = std::vector<double>(n);
    for (std::size_t i = 1; i < n; ++i) {
        deriv[i] = (y[i] - y[i - 1]) / (x[i] - x[i - 1]);
    }
    deriv[0] = deriv[1];

    // Linear continuation of the first or the last segment.
    const auto ref = (side == JumpSide::Left) ? std::size_t{0} : n - 1;
    const auto slope = deriv[ref];

    auto cumdev = std::vector<double>(n);
    auto sum = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
        const auto linear = (x[i] - x[ref])*slope + y[ref];
        sum += std::abs(y[i] - linear);
        cumdev[i] = sum;
    }

    const auto tol = linearityTolerance(y);

    if (side == JumpSide::Right) {
        // The linear part does not add to the cumulative deviation.  Its
        // first point is the second row attaining the maximum.
        const auto maxcum = cumdev.back();

        auto found = std::size_t{0};
        for (std::size_t i = 0; i < n; ++i) {
            if ((std::abs(cumdev[i] - maxcum) < tol) && (++found == 2)) {
                return x[i];
            }
        }

        return x.back();
    }

    auto last = std::size_t{0};
    auto count = std::size_t{0};
    for (std::size_t i = 0; i < n; ++i) {
        if (cumdev[i] < tol) {
            last = i;
            ++count;
        }
    }

    if (count == 1) {
        // Only the anchor point itself.  Accept the first row after a
        // vanishing cumulative deviation.
        for (std::size_t i = 1; i < n; ++i) {
            if (cumdev[i - 1] < tol) {
                last = i;
            }
        }
    }

    return x[last];
}

} // namespace Scal
