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

#include <scal/satfunc/CurveInterpolation.hpp>

#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>
#include <scal/satfunc/CurveNormalization.hpp>
#include <scal/satfunc/SaturationTable.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <limits>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace {

    void checkParameter(const double parameter)
    {
        if (! ((parameter >= 0.0) && (parameter <= 1.0))) {
            OPM_THROW_NOLOG(Scal::CurveArgumentError,
                            fmt::format("Interpolation parameter {} is outside "
                                        "of [0,1]", parameter));
        }
    }

    class WeightedValue
    {
    public:
        explicit WeightedValue(const double parameter)
            : t_(parameter)
        {}

        double operator()(const double a, const double b) const
        {
            return a*(1.0 - this->t_) + b*this->t_;
        }

        std::vector<double>
        operator()(const Scal::NormalizedFunction& f1,
                   const Scal::NormalizedFunction& f2,
                   const std::vector<double>&      x) const
        {
            const auto y1 = Scal::evaluate(f1, x);
            const auto y2 = Scal::evaluate(f2, x);

            auto y = std::vector<double>(x.size());
            std::transform(y1.begin(), y1.end(), y2.begin(), y.begin(), *this);

            return y;
        }

    private:
        double t_;
    };

    double maxValue(const std::vector<double>& v)
    {
        auto m = -std::numeric_limits<double>::infinity();
        for (const auto& x : v) {
            if (! std::isnan(x)) {
                m = std::max(m, x);
            }
        }

        return m;
    }

    // Saturation normalised by the table's own saturation range.  Any
    // inherited normalisation refers to different end points.
    std::vector<double> pcAbscissa(const std::vector<double>& s)
    {
        const auto [minS, maxS] = std::minmax_element(s.begin(), s.end());
        const auto range = *maxS - *minS;

        auto sn = std::vector<double>(s.size());
        std::transform(s.begin(), s.end(), sn.begin(),
                       [lo = *minS, range](const double x) { return (x - lo) / range; });

        return sn;
    }

} // Anonymous namespace

namespace Scal {

WaterOil interpolateWaterOil(const WaterOil&                   low,
                             const WaterOil&                   high,
                             const double                      parameter,
                             DeferredLogger&                   deferredLogger,
                             const double                      h,
                             const std::optional<std::string>& tag)
{
    checkParameter(parameter);

    const auto rp1 = normalizeNonlinearPart(low);
    const auto rp2 = normalizeNonlinearPart(high);
    const auto pc1 = normalizePc(low);
    const auto pc2 = normalizePc(high);

    const auto weighted = WeightedValue { parameter };

    auto endpoints = WaterOilEndpoints{};
    endpoints.swirr = weighted(low.swirr(), high.swirr());
    endpoints.swl   = weighted(low.swl(),   high.swl());
    endpoints.swcr  = weighted(low.swcr(),  high.swcr());
    endpoints.sorw  = weighted(low.sorw(),  high.sorw());

    const auto krwmax = weighted(maxValue(low.table().column("krw")),
                                 maxValue(high.table().column("krw")));
    const auto krwend = weighted(rp1.kr(1.0), rp2.kr(1.0));
    const auto kroend = weighted(rp1.kro(1.0), rp2.kro(1.0));

    auto result = WaterOil { endpoints, h, deferredLogger };

    auto& table = result.table();
    const auto swn = table.column("swn");
    const auto son = table.column("son");
    table.setColumn("krw",  weighted(rp1.kr,  rp2.kr,  swn));
    table.setColumn("krow", weighted(rp1.kro, rp2.kro, son));

    result.setEndpointsLinearpartKrw(krwend, krwmax);
    result.setEndpointsLinearpartKrow(kroend);

    const auto swnpc = pcAbscissa(table.column("sw"));
    table.setColumn("swn_pc_intp", swnpc);
    table.setColumn("pc", weighted(pc1, pc2, swnpc));

    result.setTag(interpolateTags(low.tag(), high.tag(), parameter, tag));

    return result;
}

GasOil interpolateGasOil(const GasOil&                     low,
                         const GasOil&                     high,
                         const double                      parameter,
                         DeferredLogger&                   deferredLogger,
                         const double                      h,
                         const std::optional<std::string>& tag)
{
    checkParameter(parameter);

    const auto rp1 = normalizeNonlinearPart(low);
    const auto rp2 = normalizeNonlinearPart(high);
    const auto pc1 = normalizePc(low);
    const auto pc2 = normalizePc(high);

    const auto weighted = WeightedValue { parameter };

    auto endpoints = GasOilEndpoints{};
    endpoints.swirr = weighted(low.swirr(), high.swirr());
    endpoints.swl   = weighted(low.swl(),   high.swl());
    endpoints.sgcr  = weighted(low.sgcr(),  high.sgcr());
    endpoints.sorg  = weighted(low.sorg(),  high.sorg());

    const auto krgmax = weighted(maxValue(low.table().column("krg")),
                                 maxValue(high.table().column("krg")));
    const auto krgend = weighted(rp1.kr(1.0), rp2.kr(1.0));
    const auto kroend = weighted(rp1.kro(1.0), rp2.kro(1.0));

    auto result = GasOil { endpoints, h, deferredLogger };

    auto& table = result.table();
    const auto sgn = table.column("sgn");
    const auto son = table.column("son");
    table.setColumn("krg",  weighted(rp1.kr,  rp2.kr,  sgn));
    table.setColumn("krog", weighted(rp1.kro, rp2.kro, son));

    const auto sgnpc = pcAbscissa(table.column("sg"));
    table.setColumn("sgn_pc_intp", sgnpc);
    table.setColumn("pc", weighted(pc1, pc2, sgnpc));

    result.setEndpointsLinearpartKrog(kroend);
    result.setEndpointsLinearpartKrg(krgend, krgmax);

    result.setTag(interpolateTags(low.tag(), high.tag(), parameter, tag));

    return result;
}

SatfuncCurve interpolate(const SatfuncCurve&               low,
                         const SatfuncCurve&               high,
                         const double                      parameter,
                         DeferredLogger&                   deferredLogger,
                         const double                      h,
                         const std::optional<std::string>& tag)
{
    if (low.index() != high.index()) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        "Cannot interpolate between water-oil "
                        "and gas-oil curve sets");
    }

    if (const auto* wo = std::get_if<WaterOil>(&low); wo != nullptr) {
        return interpolateWaterOil(*wo, std::get<WaterOil>(high),
                                   parameter, deferredLogger, h, tag);
    }

    return interpolateGasOil(std::get<GasOil>(low), std::get<GasOil>(high),
                             parameter, deferredLogger, h, tag);
}

std::string interpolateTags(const std::string&                lowTag,
                            const std::string&                highTag,
                            const double                      parameter,
                            const std::optional<std::string>& tag)
{
    if (tag.has_value()) {
        return *tag;
    }

    if (lowTag != highTag) {
        return fmt::format("Interpolated to {} between {} and {}",
                           parameter, lowTag, highTag);
    }

    if (lowTag.empty()) {
        return fmt::format("Interpolated to {}", parameter);
    }

    return fmt::format("Interpolated to {} in {}", parameter, lowTag);
}

} // namespace Scal
