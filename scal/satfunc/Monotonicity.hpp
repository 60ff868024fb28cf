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

#ifndef SCAL_MONOTONICITY_HPP
#define SCAL_MONOTONICITY_HPP

#include <scal/satfunc/MonotonicityConfig.hpp>
#include <scal/satfunc/SaturationTable.hpp>

#include <string>
#include <vector>

namespace Scal {

class DeferredLogger;

/// Verify that no value of 'column' lies strictly above spec.upper or
/// strictly below spec.lower.  Values equal to a limit are accepted.
///
/// Throws RangeError on violation.
void checkLimits(const std::vector<double>& column,
                 const MonotonicitySpec&    spec,
                 const std::string&         colname = "");

/// Reject columns that are too far from monotone for a correction to be
/// meaningful.  A column is accepted if no successive difference goes
/// against the direction 'sign' by more than 10^-(digits - 1).  Missing
/// values (NaN) are ignored.
///
/// Throws MonotonicityError otherwise.
void checkAlmostMonotone(const std::vector<double>& column,
                         int                        digits,
                         int                        sign);

/// Non-strictly monotone version of 'column'.  Running maximum
/// (spec.sign > 0) or minimum (spec.sign < 0) of the input, clipped to
/// whichever of spec.lower and spec.upper are present.
std::vector<double>
clipAccumulate(const std::vector<double>& column,
               const MonotonicitySpec&    spec);

/// Rows that must be modified in order for 'column' to be strictly
/// monotone at 'digits' decimals.  Successive differences are evaluated
/// at one extra decimal.  Rows within the requested accuracy of a
/// declared limit are never flagged.
std::vector<bool>
rowsToBeFixed(const std::vector<double>& column,
              const MonotonicitySpec&    spec,
              int                        digits);

/// Make table columns strictly monotone when printed with 'digits'
/// decimals.
///
/// The input table is rounded to digits + 1 decimals and the columns
/// named in 'config' are then adjusted, in configuration order, until
/// every successive difference is at least 10^-digits in the requested
/// direction.  Non-strict monotonicity is permitted only at declared
/// limits, and all-zero columns are left alone if allowzero is set.
///
/// Values at or near the limits, in the notation of two digits:
///
///   <value>                          <orig>    <fixed>
///   <lower limit>                     0.00      0.00
///   <values smaller than accuracy>    0.0002    0.00
///   <accuracy limit>                  0.01      0.01
///   <potential constants>             0.010001  0.02
///   <allow ups/downs below accuracy>  0.0100001 0.03
///                                     0.01      0.04
///   <upper limit minus accuracy>      0.99      0.99
///   <values too close to upper limit> 0.999     1.00
///   <overshooting values>             1.0001    1.00
///   <upper limit>                     1.00      1.00
///
/// \param[in] table Input table.  Not modified.
///
/// \param[in] config Per-column monotonicity requirements.
///
/// \param[in] digits Number of decimals to guarantee strict
///    monotonicity for.
///
/// \param[in,out] deferredLogger Receives a warning if the correction
///    needs a comparatively large number of iterations.
///
/// \return Rounded copy of 'table' with corrected columns.
///
/// Throws ConfigurationError, MonotonicityError or RangeError on bad
/// input, ConvergenceError if a column is not fixed within 2 * numRows()
/// passes and ValidationError if a corrected column still fails the
/// final check.  Nothing is returned in these cases.
SaturationTable
makeMonotone(const SaturationTable&    table,
             const MonotonicityConfig& config,
             int                       digits,
             DeferredLogger&           deferredLogger);

} // namespace Scal

#endif // SCAL_MONOTONICITY_HPP
