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

#include <scal/satfunc/WaterOil.hpp>

#include <scal/common/Constants.hpp>
#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>
#include <scal/satfunc/MonotonicityConfig.hpp>
#include <scal/satfunc/SaturationGrid.hpp>
#include <scal/satfunc/TableFormatter.hpp>
#include <scal/satfunc/TableQueries.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <fmt/format.h>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

    void checkUnitInterval(const double value, const char* name)
    {
        if (! ((value >= 0.0) && (value <= 1.0))) {
            OPM_THROW_NOLOG(Scal::CurveArgumentError,
                            fmt::format("{} = {} is outside of [0,1]", name, value));
        }
    }

    std::vector<double>
    normalised(const std::vector<double>& s, const double offset,
               const double sign, const double range)
    {
        auto n = std::vector<double>(s.size());
        for (std::size_t i = 0; i < s.size(); ++i) {
            n[i] = (offset + sign*s[i]) / range;
        }

        return n;
    }

} // Anonymous namespace

namespace Scal {

WaterOil::WaterOil(const WaterOilEndpoints& endpoints,
                   const double             h,
                   DeferredLogger&          deferredLogger,
                   const std::string&       tag)
    : swirr_(endpoints.swirr)
    , swl_  (endpoints.swl)
    , swcr_ (endpoints.swcr)
    , sorw_ (endpoints.sorw)
    , h_    (h)
    , tag_  (tag)
{
    checkUnitInterval(this->swirr_, "swirr");
    checkUnitInterval(this->swl_, "swl");
    checkUnitInterval(this->swcr_, "swcr");
    checkUnitInterval(this->sorw_, "sorw");

    if (! (this->h_ > 0.0)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("Saturation step size h = {} must be positive", h));
    }

    const auto hMin = 1.0 / SWINTEGERS;
    if (this->h_ < hMin) {
        deferredLogger.warning("WaterOil",
                               fmt::format("Step size h = {} too small, using {}",
                                           this->h_, hMin));
        this->h_ = hMin;
    }

    if (this->swl_ < this->swirr_) {
        deferredLogger.warning("WaterOil",
                               fmt::format("swl = {} below swirr = {}, using swl = swirr",
                                           this->swl_, this->swirr_));
        this->swl_ = this->swirr_;
    }

    if (this->swcr_ < this->swl_) {
        deferredLogger.warning("WaterOil",
                               fmt::format("swcr = {} below swl = {}, using swcr = swl",
                                           this->swcr_, this->swl_));
        this->swcr_ = this->swl_;
    }

    if (! (this->swl_ < 1.0 - this->sorw_)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("swl = {} must be below 1 - sorw = {}",
                                    this->swl_, 1.0 - this->sorw_));
    }

    if (! (this->swcr_ < 1.0 - this->sorw_)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("swcr = {} must be below 1 - sorw = {}",
                                    this->swcr_, 1.0 - this->sorw_));
    }

    const auto sw = makeSaturationGrid(this->swl_, this->h_, 1.0,
                                       { this->swcr_, 1.0 - this->sorw_ },
                                       { 1.0 - this->sorw_, this->swcr_ });

    this->table_.setColumn("sw", sw);
    this->table_.setColumn("swn", normalised(sw, -this->swcr_, 1.0,
                                             1.0 - this->swcr_ - this->sorw_));
    this->table_.setColumn("son", normalised(sw, 1.0 - this->sorw_, -1.0,
                                             1.0 - this->sorw_ - this->swl_));
    this->table_.setColumn("swnpc", normalised(sw, -this->swirr_, 1.0,
                                               1.0 - this->swirr_));
}

void WaterOil::setEndpointsLinearpartKrw(const double krwend,
                                         const std::optional<double> krwmax)
{
    const auto& sw = this->table_.column("sw");
    auto krw = this->table_.column("krw");

    const auto sorwPoint = 1.0 - this->sorw_;

    for (std::size_t i = 0; i < sw.size(); ++i) {
        if (sw[i] <= this->swcr_) {
            krw[i] = 0.0;
        }
        else if (this->sorw_ > EPSILON) {
            if (sw[i] >= sorwPoint - EPSILON) {
                krw[i] = krwmax.has_value()
                    ? krwend + (sw[i] - sorwPoint) / this->sorw_ * (*krwmax - krwend)
                    : krwend;
            }
        }
        else if (sw[i] >= 1.0 - EPSILON) {
            krw[i] = krwend;
        }
    }

    this->table_.setColumn("krw", std::move(krw));
}

void WaterOil::setEndpointsLinearpartKrow(const double kroend)
{
    const auto& sw = this->table_.column("sw");
    auto krow = this->table_.column("krow");

    for (std::size_t i = 0; i < sw.size(); ++i) {
        if (sw[i] >= 1.0 - this->sorw_ - EPSILON) {
            krow[i] = 0.0;
        }
        else if (sw[i] <= this->swl_ + EPSILON) {
            krow[i] = kroend;
        }
    }

    this->table_.setColumn("krow", std::move(krow));
}

double WaterOil::estimateSorw(const std::string& curve) const
{
    return 1.0 - estimateDiffJumpPoint(this->table_, "sw", curve, JumpSide::Right);
}

double WaterOil::estimateSwcr(const std::string& curve) const
{
    return estimateDiffJumpPoint(this->table_, "sw", curve, JumpSide::Left);
}

double WaterOil::crosspoint(DeferredLogger& deferredLogger) const
{
    return Scal::crosspoint(this->table_, "sw", "krw", "krow", deferredLogger);
}

std::string WaterOil::swof(DeferredLogger& deferredLogger,
                           const bool      header,
                           const bool      dataincommentrow) const
{
    auto swof = this->table_.select({ "sw", "krw", "krow" });
    swof.setColumn("pc", this->table_.hasColumn("pc")
                   ? this->table_.column("pc")
                   : std::vector<double>(this->table_.numRows(), 0.0));

    auto text = std::string { header ? "SWOF\n" : "" };
    text += formatComment(this->tag_);

    if (dataincommentrow) {
        text += fmt::format("-- swirr={:g} swl={:g} swcr={:g} sorw={:g}\n",
                            this->swirr_, this->swl_, this->swcr_, this->sorw_);
        text += fmt::format("-- krw = krow @ sw={:1.5f}\n",
                            this->crosspoint(deferredLogger));
    }

    text += fmt::format("-- {:<7}{:<10}{:<10}{:<10}\n", "SW", "KRW", "KROW", "PC");

    const auto monotonicity = MonotonicityConfig {
        { "krw",  MonotonicitySpec { +1, 0.0, 1.0, std::nullopt } },
        { "krow", MonotonicitySpec { -1, 0.0, 1.0, std::nullopt } },
        { "pc",   MonotonicitySpec { -1, std::nullopt, std::nullopt, true } },
    };

    text += formatTable(swof, monotonicity, deferredLogger);
    text += "/\n";

    return text;
}

} // namespace Scal
