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

#ifndef SCAL_GAS_OIL_HPP
#define SCAL_GAS_OIL_HPP

#include <scal/satfunc/SaturationTable.hpp>

#include <optional>
#include <string>

namespace Scal {

class DeferredLogger;

/// Saturation end points of a gas-oil curve set.
struct GasOilEndpoints
{
    double swirr{0.0};  ///< Irreducible water saturation
    double swl{0.0};    ///< Connate water saturation
    double sgcr{0.0};   ///< Critical gas saturation
    double sorg{0.0};   ///< Residual oil saturation in presence of gas
};

/// Tabulated gas-oil saturation functions (krg, krog and pc) on a gas
/// saturation grid from zero to 1 - swl.
///
/// Grid columns are sg, sl, sgn and son.  The krg, krog and pc columns
/// are supplied by the caller.
class GasOil
{
public:
    /// Build saturation grid with step size 'h'.
    ///
    /// Throws CurveArgumentError if any end point is outside [0,1], if
    /// h is not positive, if swl + sorg >= 1 or if sgcr is not below
    /// 1 - swl - sorg.  Step sizes below 1/SWINTEGERS are raised, with a
    /// warning.
    GasOil(const GasOilEndpoints& endpoints,
           double                 h,
           DeferredLogger&        deferredLogger,
           const std::string&     tag = "");

    double swirr() const { return this->swirr_; }
    double swl()   const { return this->swl_; }
    double sgcr()  const { return this->sgcr_; }
    double sorg()  const { return this->sorg_; }
    double h()     const { return this->h_; }

    const std::string& tag() const { return this->tag_; }
    void setTag(const std::string& tag) { this->tag_ = tag; }

    static std::string saturationColumn() { return "sg"; }

    const SaturationTable& table() const { return this->table_; }
    SaturationTable& table() { return this->table_; }

    /// krg is zero for sg <= sgcr.  Above 1 - swl - sorg it is linear
    /// from krgend to krgmax at sg = 1 - swl if krgmax is given and
    /// sorg > 0, and constant krgend otherwise.
    void setEndpointsLinearpartKrg(double krgend,
                                   std::optional<double> krgmax = std::nullopt);

    /// krog is zero for sg >= 1 - swl - sorg and kroend at sg = 0.
    void setEndpointsLinearpartKrog(double kroend);

    double estimateSorg(const std::string& curve = "krog") const;
    double estimateSgcr(const std::string& curve = "krg") const;

    /// Gas saturation at which krg equals krog, -1 if none.
    double crosspoint(DeferredLogger& deferredLogger) const;

    /// Eclipse SGOF keyword (sg, krg, krog, pc).
    std::string sgof(DeferredLogger& deferredLogger,
                     bool header = true,
                     bool dataincommentrow = true) const;

private:
    double swirr_{0.0};
    double swl_{0.0};
    double sgcr_{0.0};
    double sorg_{0.0};
    double h_{0.01};
    std::string tag_{};

    SaturationTable table_{};
};

} // namespace Scal

#endif // SCAL_GAS_OIL_HPP
