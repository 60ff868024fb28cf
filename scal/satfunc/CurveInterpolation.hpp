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

#ifndef SCAL_CURVE_INTERPOLATION_HPP
#define SCAL_CURVE_INTERPOLATION_HPP

#include <scal/satfunc/GasOil.hpp>
#include <scal/satfunc/WaterOil.hpp>

#include <optional>
#include <string>
#include <variant>

namespace Scal {

class DeferredLogger;

/// Either of the two-phase curve set types.
using SatfuncCurve = std::variant<WaterOil, GasOil>;

/// Interpolate between two water-oil curve sets.
///
/// Saturation end points and end point relative permeabilities are
/// interpolated individually, whereas the nonlinear parts of krw and
/// krow are interpolated on their normalised saturation domains.
/// Capillary pressure is interpolated on saturations normalised by
/// the smallest and largest saturation of each table.
///
/// \param[in] low Curve set returned for parameter = 0.
///
/// \param[in] high Curve set returned for parameter = 1.
///
/// \param[in] parameter Interpolation parameter in [0,1].  No
///    extrapolation.
///
/// \param[in,out] deferredLogger Diagnostics from constructing the
///    result.
///
/// \param[in] h Saturation step size of the result.
///
/// \param[in] tag Tag of the result.  Derived from the tags of 'low'
///    and 'high' if unset.  Pass an empty string for no tag.
///
/// \return New curve set.  Inputs are not modified.
///
/// Throws CurveArgumentError if 'parameter' is outside [0,1].
WaterOil interpolateWaterOil(const WaterOil&                   low,
                             const WaterOil&                   high,
                             double                            parameter,
                             DeferredLogger&                   deferredLogger,
                             double                            h = 0.01,
                             const std::optional<std::string>& tag = std::nullopt);

/// Interpolate between two gas-oil curve sets.  Counterpart to
/// interpolateWaterOil().
GasOil interpolateGasOil(const GasOil&                     low,
                         const GasOil&                     high,
                         double                            parameter,
                         DeferredLogger&                   deferredLogger,
                         double                            h = 0.01,
                         const std::optional<std::string>& tag = std::nullopt);

/// Interpolate between two curve sets of the same type.
///
/// Throws CurveArgumentError if 'low' and 'high' are of different
/// types.
SatfuncCurve interpolate(const SatfuncCurve&               low,
                         const SatfuncCurve&               high,
                         double                            parameter,
                         DeferredLogger&                   deferredLogger,
                         double                            h = 0.01,
                         const std::optional<std::string>& tag = std::nullopt);

/// Tag of an interpolated curve set.  Returns 'tag' if set, otherwise
/// a description of the interpolation built from the input tags.
std::string interpolateTags(const std::string&                lowTag,
                            const std::string&                highTag,
                            double                            parameter,
                            const std::optional<std::string>& tag);

} // namespace Scal

#endif // SCAL_CURVE_INTERPOLATION_HPP
