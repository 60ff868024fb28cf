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

#include <scal/satfunc/SaturationGrid.hpp>

#include <scal/common/Constants.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace {

    long long satInteger(const double s)
    {
        return std::llround(s * Scal::SWINTEGERS);
    }

    void pinNearest(std::vector<double>& grid, const double point)
    {
        auto nearest = grid.begin();
        for (auto i = grid.begin(); i != grid.end(); ++i) {
            if (std::abs(*i - point) < std::abs(*nearest - point)) {
                nearest = i;
            }
        }

        *nearest = point;
    }

} // Anonymous namespace

namespace Scal {

std::vector<double>
makeSaturationGrid(const double               start,
                   const double               step,
                   const double               end,
                   const std::vector<double>& extraPoints,
                   const std::vector<double>& pinnedPoints)
{
    auto grid = extraPoints;

    for (auto k = std::size_t{0}; start + k*step < end; ++k) {
        grid.push_back(start + k*step);
    }

    grid.push_back(end);

    std::sort(grid.begin(), grid.end());

    // Remove points that are too close to each other, keeping the first.
    grid.erase(std::unique(grid.begin(), grid.end(),
                           [](const double a, const double b)
                           { return satInteger(a) == satInteger(b); }),
               grid.end());

    // Critical points might have been merged into a nearby grid point.
    for (const auto& point : pinnedPoints) {
        pinNearest(grid, point);
    }

    pinNearest(grid, end);

    return grid;
}

} // namespace Scal
