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

#include <scal/satfunc/CurveNormalization.hpp>

#include <scal/common/Exceptions.hpp>
#include <scal/satfunc/GasOil.hpp>
#include <scal/satfunc/SaturationTable.hpp>
#include <scal/satfunc/WaterOil.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <opm/material/common/Tabulated1DFunction.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <string>
#include <vector>

namespace {

    /// Piecewise linear function with constant extrapolation at both
    /// ends.
    class ClampedLinearFunction
    {
    public:
        ClampedLinearFunction(const std::vector<double>& x,
                              const std::vector<double>& y,
                              const std::string&         what)
        {
            auto xs = std::vector<double>{};
            auto ys = std::vector<double>{};
            for (std::size_t i = 0; i < x.size(); ++i) {
                if (! std::isnan(x[i]) && ! std::isnan(y[i])) {
                    xs.push_back(x[i]);
                    ys.push_back(y[i]);
                }
            }

            if (xs.empty()) {
                OPM_THROW_NOLOG(Scal::CurveArgumentError,
                                fmt::format("No data to interpolate {}", what));
            }

            if (xs.size() == 1) {
                // Tabulated1DFunction needs two sampling points.
                xs.push_back(xs.front());
                ys.push_back(ys.front());
                xs.back() += 1.0;
            }

            this->func_.setXYContainers(xs, ys, /* sortInputs = */ true);
        }

        double operator()(const double x) const
        {
            if (! (x > this->func_.xMin())) {
                return this->func_.valueAt(0);
            }

            if (! (x < this->func_.xMax())) {
                return this->func_.valueAt(this->func_.numSamples() - 1);
            }

            return this->func_.eval(x, /* extrapolate = */ true);
        }

    private:
        Opm::Tabulated1DFunction<double> func_{};
    };

    std::vector<double> complement(const std::vector<double>& s)
    {
        auto c = std::vector<double>(s.size());
        std::transform(s.begin(), s.end(), c.begin(),
                       [](const double x) { return 1.0 - x; });

        return c;
    }

    /// Normalised argument 'xn' maps to low + xn*(high - low).
    Scal::NormalizedFunction
    normalizedInterpolant(const std::vector<double>& x,
                          const std::vector<double>& y,
                          const double               low,
                          const double               high,
                          const std::string&         what)
    {
        const auto f = ClampedLinearFunction { x, y, what };
        const auto range = high - low;

        return [f, low, range](const double xn)
        {
            return f(low + xn*range);
        };
    }

} // Anonymous namespace

namespace Scal {

NormalizedRelperm normalizeNonlinearPart(const WaterOil& curve)
{
    const auto& sw = curve.table().column("sw");

    // The table might contain normalised saturations, but we do not rely
    // on them being present or correct.
    return {
        normalizedInterpolant(sw, curve.table().column("krw"),
                              curve.swcr(), 1.0 - curve.sorw(), "krw"),

        normalizedInterpolant(complement(sw), curve.table().column("krow"),
                              curve.sorw(), 1.0 - curve.swl(), "krow"),
    };
}

NormalizedRelperm normalizeNonlinearPart(const GasOil& curve)
{
    const auto& sg = curve.table().column("sg");

    return {
        normalizedInterpolant(sg, curve.table().column("krg"),
                              curve.sgcr(), 1.0 - curve.swl() - curve.sorg(), "krg"),

        normalizedInterpolant(complement(sg), curve.table().column("krog"),
                              curve.swl() + curve.sorg(), 1.0, "krog"),
    };
}

NormalizedFunction normalizePc(const SaturationTable& table,
                               const std::string&     satColumn)
{
    if (! table.hasColumn("pc")) {
        return [](const double) { return 0.0; };
    }

    const auto& s = table.column(satColumn);
    if (s.empty()) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("Cannot normalise pc on empty {} column", satColumn));
    }

    const auto [minS, maxS] = std::minmax_element(s.begin(), s.end());

    return normalizedInterpolant(s, table.column("pc"), *minS, *maxS, "pc");
}

std::vector<double> evaluate(const NormalizedFunction&  f,
                             const std::vector<double>& x)
{
    auto y = std::vector<double>(x.size());
    std::transform(x.begin(), x.end(), y.begin(), f);

    return y;
}

} // namespace Scal
