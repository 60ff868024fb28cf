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

#ifndef SCAL_TABLE_QUERIES_HPP
#define SCAL_TABLE_QUERIES_HPP

#include <string>

namespace Scal {

class DeferredLogger;
class SaturationTable;

/// Saturation value at which the columns 'kr1col' and 'kr2col' are
/// equal, found by linear interpolation of their difference to zero as
/// a function of 'satcol'.
///
/// Returns -1 and issues a warning through 'deferredLogger' if there is
/// no such crossing, e.g., when one curve lies entirely above the other
/// or when the relevant columns contain missing values.
double crosspoint(const SaturationTable& table,
                  const std::string&     satcol,
                  const std::string&     kr1col,
                  const std::string&     kr2col,
                  DeferredLogger&        deferredLogger);

/// End of table from which to look for a linear domain.
enum class JumpSide { Left, Right };

/// Estimate the x value at which y stops being linear in x, or where y
/// shifts from one linear domain to another in a piecewise linear
/// function.
///
/// With x = sw, y = krw and side Right this estimates 1 - sorw.  With
/// side Left it estimates swcr.
///
/// \param[in] table Tabulated x and y values, sorted on x with no
///    repeated x values.  At least two rows.
///
/// \param[in] xcol Name of x column.  First column if empty.
///
/// \param[in] ycol Name of y column.  Second column if empty.
///
/// \param[in] side Which end of the table to measure linearity from.
///
/// \return Estimated end point of the linear domain adjacent to 'side'.
///
/// Throws CurveArgumentError if the table has fewer than two rows or
/// if default columns are requested from a table with fewer than two
/// columns.
double estimateDiffJumpPoint(const SaturationTable& table,
                             const std::string&     xcol = "",
                             const std::string&     ycol = "",
                             JumpSide               side = JumpSide::Right);

} // namespace Scal

#endif // SCAL_TABLE_QUERIES_HPP
