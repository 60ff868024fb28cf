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

#include <scal/satfunc/GasOil.hpp>

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

namespace Scal {

GasOil::GasOil(const GasOilEndpoints& endpoints,
               const double           h,
               DeferredLogger&        deferredLogger,
               const std::string&     tag)
    : swirr_(endpoints.swirr)
    , swl_  (endpoints.swl)
    , sgcr_ (endpoints.sgcr)
    , sorg_ (endpoints.sorg)
    , h_    (h)
    , tag_  (tag)
{
    for (const auto& [name, value] : { std::pair { "swirr", this->swirr_ },
                                       std::pair { "swl",   this->swl_   },
                                       std::pair { "sgcr",  this->sgcr_  },
                                       std::pair { "sorg",  this->sorg_  } })
    {
        if (! ((value >= 0.0) && (value <= 1.0))) {
            OPM_THROW_NOLOG(CurveArgumentError,
                            fmt::format("{} = {} is outside of [0,1]", name, value));
        }
    }

    if (! (this->h_ > 0.0)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("Saturation step size h = {} must be positive", h));
    }

    const auto hMin = 1.0 / SWINTEGERS;
    if (this->h_ < hMin) {
        deferredLogger.warning("GasOil",
                               fmt::format("Step size h = {} too small, using {}",
                                           this->h_, hMin));
        this->h_ = hMin;
    }

    const auto sgMax = 1.0 - this->swl_;
    const auto sgEnd = sgMax - this->sorg_;

    if (! (sgEnd > 0.0)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("swl + sorg = {} must be below one",
                                    this->swl_ + this->sorg_));
    }

    if (! (this->sgcr_ < sgEnd)) {
        OPM_THROW_NOLOG(CurveArgumentError,
                        fmt::format("sgcr = {} must be below 1 - swl - sorg = {}",
                                    this->sgcr_, sgEnd));
    }

    const auto sg = makeSaturationGrid(this->sgcr_, this->h_, sgMax,
                                       { 0.0, sgEnd },
                                       { sgEnd, this->sgcr_ });

    auto sl  = std::vector<double>(sg.size());
    auto sgn = std::vector<double>(sg.size());
    auto son = std::vector<double>(sg.size());
    for (std::size_t i = 0; i < sg.size(); ++i) {
        sl[i]  = 1.0 - sg[i];
        sgn[i] = (sg[i] - this->sgcr_) / (sgEnd - this->sgcr_);
        son[i] = (sgEnd - sg[i]) / sgEnd;
    }

    this->table_.setColumn("sg", sg);
    this->table_.setColumn("sl", std::move(sl));
    this->table_.setColumn("sgn", std::move(sgn));
    this->table_.setColumn("son", std::move(son));
}

void GasOil::setEndpointsLinearpartKrg(const double krgend,
                                       const std::optional<double> krgmax)
{
    const auto& sg = this->table_.column("sg");
    auto krg = this->table_.column("krg");

    const auto sgMax = 1.0 - this->swl_;
    const auto sgEnd = sgMax - this->sorg_;

    for (std::size_t i = 0; i < sg.size(); ++i) {
        if (sg[i] <= this->sgcr_) {
            krg[i] = 0.0;
        }
        else if (this->sorg_ > EPSILON) {
            if (sg[i] >= sgEnd - EPSILON) {
                krg[i] = krgmax.has_value()
                    ? krgend + (sg[i] - sgEnd) / this->sorg_ * (*krgmax - krgend)
                    : krgend;
            }
        }
        else if (sg[i] >= sgMax - EPSILON) {
            krg[i] = krgend;
        }
    }

    this->table_.setColumn("krg", std::move(krg));
}

void GasOil::setEndpointsLinearpartKrog(const double kroend)
{
    const auto& sg = this->table_.column("sg");
    auto krog = this->table_.column("krog");

    const auto sgEnd = 1.0 - this->swl_ - this->sorg_;

    for (std::size_t i = 0; i < sg.size(); ++i) {
        if (sg[i] >= sgEnd - EPSILON) {
            krog[i] = 0.0;
        }
        else if (sg[i] <= EPSILON) {
            krog[i] = kroend;
        }
    }

    this->table_.setColumn("krog", std::move(krog));
}

double GasOil::estimateSorg(const std::string& curve) const
{
    return 1.0 - this->swl_
        - estimateDiffJumpPoint(this->table_, "sg", curve, JumpSide::Right);
}

double GasOil::estimateSgcr(const std::string& curve) const
{
    return estimateDiffJumpPoint(this->table_, "sg", curve, JumpSide::Left);
}

double GasOil::crosspoint(DeferredLogger& deferredLogger) const
{
    return Scal::crosspoint(this->table_, "sg", "krg", "krog", deferredLogger);
}

std::string GasOil::sgof(DeferredLogger& deferredLogger,
                         const bool      header,
                         const bool      dataincommentrow) const
{
    auto sgof = this->table_.select({ "sg", "krg", "krog" });
    sgof.setColumn("pc", this->table_.hasColumn("pc")
                   ? this->table_.column("pc")
                   : std::vector<double>(this->table_.numRows(), 0.0));

    auto text = std::string { header ? "SGOF\n" : "" };
    text += formatComment(this->tag_);

    if (dataincommentrow) {
        text += fmt::format("-- swirr={:g} sgcr={:g} swl={:g} sorg={:g}\n",
                            this->swirr_, this->sgcr_, this->swl_, this->sorg_);
        text += fmt::format("-- krg = krog @ sg={:1.5f}\n",
                            this->crosspoint(deferredLogger));
    }

    text += fmt::format("-- {:<7}{:<10}{:<10}{:<10}\n", "SG", "KRG", "KROG", "PC");

    const auto monotonicity = MonotonicityConfig {
        { "krg",  MonotonicitySpec { +1, 0.0, 1.0, std::nullopt } },
        { "krog", MonotonicitySpec { -1, 0.0, 1.0, std::nullopt } },
        { "pc",   MonotonicitySpec { +1, std::nullopt, std::nullopt, true } },
    };

    text += formatTable(sgof, monotonicity, deferredLogger);
    text += "/\n";

    return text;
}

} // namespace Scal
