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

#ifndef SCAL_SATURATION_GRID_HPP
#define SCAL_SATURATION_GRID_HPP

#include <vector>

namespace Scal {

/// Sorted saturation grid for curve construction.
///
/// Grid comprises the points start, start + step, ... below 'end', the
/// 'extraPoints', and 'end' itself.  Points closer than 1/SWINTEGERS
/// are merged, after which each of the 'pinnedPoints' replaces the
/// nearest grid point exactly.  Pinned points are processed in order,
/// followed by the end point.
std::vector<double>
makeSaturationGrid(double                     start,
                   double                     step,
                   double                     end,
                   const std::vector<double>& extraPoints,
                   const std::vector<double>& pinnedPoints);

} // namespace Scal

#endif // SCAL_SATURATION_GRID_HPP
