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

#ifndef SCAL_CONSTANTS_HPP
#define SCAL_CONSTANTS_HPP

namespace Scal {

/// Tolerance used throughout the saturation function code.  Keeps the
/// monotonicity correction from flagging values that are already
/// distinct at the requested precision.
constexpr double EPSILON = 1.0e-8;

/// Saturation values closer than 1/SWINTEGERS are considered equal when
/// building saturation grids.
constexpr long SWINTEGERS = 10000000;

} // namespace Scal

#endif // SCAL_CONSTANTS_HPP
