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

#ifndef SCAL_CURVE_NORMALIZATION_HPP
#define SCAL_CURVE_NORMALIZATION_HPP

#include <functional>
#include <string>
#include <vector>

namespace Scal {

class GasOil;
class SaturationTable;
class WaterOil;

/// Function of a normalised saturation in [0,1].
using NormalizedFunction = std::function<double(double)>;

/// Relative permeability functions on the normalised nonlinear domain
/// of a curve set.
struct NormalizedRelperm
{
    /// Relperm of the displacing phase (krw or krg) as a function of
    /// normalised water or gas saturation.
    NormalizedFunction kr;

    /// Relperm of oil (krow or krog) as a function of normalised oil
    /// saturation.
    NormalizedFunction kro;
};

/// krw and krow restricted to their nonlinear parts, with a normalised
/// argument.
///
/// The krw domain [swcr, 1 - sorw] maps to [0,1].  The krow domain maps
/// oil saturation [sorw, 1 - swl] to [0,1], i.e., normalised oil
/// saturation one corresponds to sw = swl.  Normalisation is computed
/// from the raw saturations and the end points of 'curve', never from
/// any normalised columns in its table.  Outside the tabulated
/// saturation range the functions are constant, equal to the table's
/// end point values.
///
/// The functions hold copies of the table data and remain valid after
/// 'curve' is destroyed.
NormalizedRelperm normalizeNonlinearPart(const WaterOil& curve);

/// krg and krog restricted to their nonlinear parts.  The krg domain
/// [sgcr, 1 - swl - sorg] and the krog domain (oil saturation)
/// [swl + sorg, 1] map to [0,1].
NormalizedRelperm normalizeNonlinearPart(const GasOil& curve);

/// Capillary pressure as a function of saturation normalised by the
/// smallest and largest saturation in 'table'.
///
/// Returns the zero function if the table has no "pc" column.  Values
/// outside [0,1] are clamped to pc at the nearest tabulated saturation.
NormalizedFunction normalizePc(const SaturationTable& table,
                               const std::string&     satColumn);

/// Capillary pressure of a curve set.  'Curve' must provide table()
/// and saturationColumn().
template <class Curve>
NormalizedFunction normalizePc(const Curve& curve)
{
    return normalizePc(curve.table(), curve.saturationColumn());
}

/// Evaluate function at each of a sequence of arguments.
std::vector<double> evaluate(const NormalizedFunction&  f,
                             const std::vector<double>& x);

} // namespace Scal

#endif // SCAL_CURVE_NORMALIZATION_HPP
