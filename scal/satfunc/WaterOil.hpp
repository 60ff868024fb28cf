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

#ifndef SCAL_WATER_OIL_HPP
#define SCAL_WATER_OIL_HPP

#include <scal/satfunc/SaturationTable.hpp>

#include <optional>
#include <string>

namespace Scal {

class DeferredLogger;

/// Saturation end points of a water-oil curve set.
struct WaterOilEndpoints
{
    double swirr{0.0};  ///< Irreducible water saturation (pc normalisation)
    double swl{0.0};    ///< Connate water saturation
    double swcr{0.0};   ///< Critical water saturation
    double sorw{0.0};   ///< Residual oil saturation
};

/// Tabulated water-oil saturation functions (krw, krow and pc) on a
/// water saturation grid.
///
/// The object holds the grid and its normalised saturations (columns
/// sw, swn, son and swnpc).  The krw, krow and pc columns are supplied
/// by the caller, e.g., by interpolating between two other curve sets.
class WaterOil
{
public:
    /// Build saturation grid from 'swl' to one with step size 'h'.
    ///
    /// Inconsistent end points are adjusted, with a warning, as
    /// follows: swl < swirr is raised to swirr, swcr < swl is raised to
    /// swl, and h is at least 1/SWINTEGERS.
    ///
    /// Throws CurveArgumentError if any end point is outside [0,1], if
    /// h is not positive, or if swl or swcr is not below 1 - sorw.
    WaterOil(const WaterOilEndpoints& endpoints,
             double                   h,
             DeferredLogger&          deferredLogger,
             const std::string&       tag = "");

    double swirr() const { return this->swirr_; }
    double swl()   const { return this->swl_; }
    double swcr()  const { return this->swcr_; }
    double sorw()  const { return this->sorw_; }
    double h()     const { return this->h_; }

    const std::string& tag() const { return this->tag_; }
    void setTag(const std::string& tag) { this->tag_ = tag; }

    /// Name of the independent saturation column.
    static std::string saturationColumn() { return "sw"; }

    const SaturationTable& table() const { return this->table_; }

    /// Mutable table access for populating relperm and pc columns.
    /// The grid columns must not be modified.
    SaturationTable& table() { return this->table_; }

    /// Impose linear krw outside the nonlinear domain [swcr, 1 - sorw].
    ///
    /// krw is zero for sw <= swcr.  Above 1 - sorw it is linear from
    /// krwend to krwmax at sw = 1 if krwmax is given and sorw > 0,
    /// and constant krwend otherwise.  Requires an existing krw column.
    void setEndpointsLinearpartKrw(double krwend,
                                   std::optional<double> krwmax = std::nullopt);

    /// Impose krow = 0 for sw >= 1 - sorw and krow = kroend at swl.
    /// Requires an existing krow column.
    void setEndpointsLinearpartKrow(double kroend);

    /// Estimate sorw from the linear right-hand part of a relperm column.
    double estimateSorw(const std::string& curve = "krw") const;

    /// Estimate swcr from the linear left-hand part of a relperm column.
    double estimateSwcr(const std::string& curve = "krw") const;

    /// Water saturation at which krw equals krow, -1 if none.
    double crosspoint(DeferredLogger& deferredLogger) const;

    /// Eclipse SWOF keyword (sw, krw, krow, pc) with strictly monotone
    /// relperm columns.  Missing pc is written as zero.
    std::string swof(DeferredLogger& deferredLogger,
                     bool header = true,
                     bool dataincommentrow = true) const;

private:
    double swirr_{0.0};
    double swl_{0.0};
    double swcr_{0.0};
    double sorw_{0.0};
    double h_{0.01};
    std::string tag_{};

    SaturationTable table_{};
};

} // namespace Scal

#endif // SCAL_WATER_OIL_HPP
