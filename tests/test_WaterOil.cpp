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

#define BOOST_TEST_MODULE Water_Oil

#include <boost/test/unit_test.hpp>

#include <scal/satfunc/WaterOil.hpp>

#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>

#include <opm/common/OpmLog/LogUtil.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    Scal::WaterOilEndpoints endpoints(const double swl, const double swcr, const double sorw)
    {
        auto ep = Scal::WaterOilEndpoints{};
        ep.swl = swl;
        ep.swcr = swcr;
        ep.sorw = sorw;

        return ep;
    }

    std::vector<double> corey(const std::vector<double>& sn, const double n)
    {
        auto kr = std::vector<double>(sn.size());
        std::transform(sn.begin(), sn.end(), kr.begin(), [n](const double x)
        {
            return std::pow(std::clamp(x, 0.0, 1.0), n);
        });

        return kr;
    }

    Scal::WaterOil makeWaterOil(const Scal::WaterOilEndpoints& ep,
                                const double                   nw,
                                const double                   now,
                                Scal::DeferredLogger&          logger,
                                const std::string&             tag = "")
    {
        auto wo = Scal::WaterOil { ep, 0.1, logger, tag };

        auto& table = wo.table();
        table.setColumn("krw", corey(table.column("swn"), nw));
        table.setColumn("krow", corey(table.column("son"), now));

        wo.setEndpointsLinearpartKrw(1.0);
        wo.setEndpointsLinearpartKrow(1.0);

        return wo;
    }

    std::vector<std::string> dataLines(const std::string& text)
    {
        auto lines = std::vector<std::string>{};

        auto input = std::istringstream { text };
        for (auto line = std::string{}; std::getline(input, line); ) {
            if (line.empty() || (line.rfind("--", 0) == 0) ||
                (line == "SWOF") || (line == "/"))
            {
                continue;
            }

            lines.push_back(line);
        }

        return lines;
    }

} // Anonymous namespace

BOOST_AUTO_TEST_SUITE(Construction)

BOOST_AUTO_TEST_CASE(Saturation_Grid)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = Scal::WaterOil { endpoints(0.1, 0.2, 0.3), 0.1, logger };

    const auto& table = wo.table();
    const auto& sw = table.column("sw");

    BOOST_CHECK_EQUAL(table.numRows(), std::size_t{10});
    BOOST_CHECK_EQUAL(sw.front(), 0.1);
    BOOST_CHECK_EQUAL(sw.back(), 1.0);
    BOOST_CHECK_MESSAGE(std::find(sw.begin(), sw.end(), 0.2) != sw.end(), "swcr must be a grid point");
    BOOST_CHECK_MESSAGE(std::find(sw.begin(), sw.end(), 0.7) != sw.end(), "1 - sorw must be a grid point");

    BOOST_CHECK_MESSAGE(table.hasColumn("swn"), "Table must have normalised water saturation");
    BOOST_CHECK_MESSAGE(table.hasColumn("son"), "Table must have normalised oil saturation");
    BOOST_CHECK_MESSAGE(table.hasColumn("swnpc"), "Table must have pc normalised saturation");

    BOOST_CHECK_MESSAGE(logger.messages().empty(), "No diagnostics expected");
}

BOOST_AUTO_TEST_CASE(Normalised_Saturations)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = Scal::WaterOil { endpoints(0.1, 0.2, 0.3), 0.1, logger };

    const auto& swn = wo.table().column("swn");
    const auto& son = wo.table().column("son");

    // sw = 0.2 (swcr) and sw = 0.7 (1 - sorw) are rows 1 and 6.
    BOOST_CHECK_SMALL(swn[1], 1.0e-12);
    BOOST_CHECK_CLOSE(swn[6], 1.0, 1.0e-8);
    BOOST_CHECK_CLOSE(son[0], 1.0, 1.0e-8);
    BOOST_CHECK_SMALL(son[6], 1.0e-12);
}

BOOST_AUTO_TEST_CASE(Adjusted_Endpoints)
{
    auto ep = endpoints(0.05, 0.0, 0.2);
    ep.swirr = 0.1;

    auto logger = Scal::DeferredLogger{};
    const auto wo = Scal::WaterOil { ep, 0.1, logger };

    BOOST_CHECK_CLOSE(wo.swl(), 0.1, 1.0e-8);
    BOOST_CHECK_CLOSE(wo.swcr(), 0.1, 1.0e-8);
    BOOST_CHECK_EQUAL(logger.count(Opm::Log::MessageType::Warning), std::size_t{2});
    BOOST_CHECK_EQUAL(logger.messages().front().tag, std::string { "WaterOil" });
}

BOOST_AUTO_TEST_CASE(Tiny_Step_Size)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = Scal::WaterOil { endpoints(0.99999, 0.99999, 0.0), 1.0e-9, logger };

    BOOST_CHECK_CLOSE(wo.h(), 1.0e-7, 1.0e-8);
    BOOST_CHECK_EQUAL(logger.count(Opm::Log::MessageType::Warning), std::size_t{1});
}

BOOST_AUTO_TEST_CASE(Invalid_Endpoints)
{
    auto logger = Scal::DeferredLogger{};

    BOOST_CHECK_THROW(Scal::WaterOil(endpoints(-0.1, 0.0, 0.0), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::WaterOil(endpoints(0.0, 0.0, 1.1), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::WaterOil(endpoints(0.65, 0.65, 0.4), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::WaterOil(endpoints(0.1, 0.75, 0.3), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::WaterOil(endpoints(0.0, 0.0, 0.0), 0.0, logger),
                      Scal::CurveArgumentError);
}

BOOST_AUTO_TEST_SUITE_END() // Construction

// ===========================================================================

BOOST_AUTO_TEST_SUITE(Curves)

BOOST_AUTO_TEST_CASE(Linear_Part_Krw)
{
    auto logger = Scal::DeferredLogger{};
    auto wo = makeWaterOil(endpoints(0.1, 0.2, 0.3), 2.0, 2.0, logger);

    wo.setEndpointsLinearpartKrw(0.6, 1.0);

    const auto& krw = wo.table().column("krw");

    // Zero up to swcr, then linear from krwend at 1 - sorw to krwmax at 1.
    BOOST_CHECK_SMALL(krw[1], 1.0e-12);
    BOOST_CHECK_CLOSE(krw[6], 0.6, 1.0e-6);
    BOOST_CHECK_CLOSE(krw[9], 1.0, 1.0e-6);
    BOOST_CHECK_CLOSE(krw[7], 0.6 + 0.4/3.0, 1.0e-6);
}

BOOST_AUTO_TEST_CASE(Linear_Part_Krow)
{
    auto logger = Scal::DeferredLogger{};
    auto wo = makeWaterOil(endpoints(0.1, 0.2, 0.3), 2.0, 2.0, logger);

    wo.setEndpointsLinearpartKrow(0.8);

    const auto& krow = wo.table().column("krow");

    BOOST_CHECK_CLOSE(krow[0], 0.8, 1.0e-8);
    for (std::size_t i = 6; i < krow.size(); ++i) {
        BOOST_CHECK_SMALL(krow[i], 1.0e-12);
    }
}

BOOST_AUTO_TEST_CASE(Estimated_Endpoints)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = makeWaterOil(endpoints(0.1, 0.2, 0.3), 2.0, 2.0, logger);

    BOOST_CHECK_CLOSE(wo.estimateSorw(), 0.3, 1.0e-6);
    BOOST_CHECK_CLOSE(wo.estimateSwcr(), 0.2, 1.0e-6);
}

BOOST_AUTO_TEST_CASE(Crosspoint)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = makeWaterOil(endpoints(0.0, 0.0, 0.0), 2.0, 2.0, logger);

    BOOST_CHECK_CLOSE(wo.crosspoint(logger), 0.5, 1.0e-6);
}

BOOST_AUTO_TEST_SUITE_END() // Curves

// ===========================================================================

BOOST_AUTO_TEST_SUITE(Swof)

BOOST_AUTO_TEST_CASE(Keyword_Text)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = makeWaterOil(endpoints(0.1, 0.2, 0.3), 2.0, 2.0, logger, "SATNUM 1");

    const auto swof = wo.swof(logger);

    BOOST_CHECK_EQUAL(swof.rfind("SWOF\n-- SATNUM 1\n", 0), std::size_t{0});
    BOOST_CHECK_MESSAGE(swof.find("-- swirr=0 swl=0.1 swcr=0.2 sorw=0.3\n") != std::string::npos,
                        "Endpoint comment line missing");
    BOOST_CHECK_MESSAGE(swof.find("-- krw = krow @ sw=") != std::string::npos,
                        "Crosspoint comment line missing");
    BOOST_CHECK_EQUAL(swof.substr(swof.size() - 2), std::string { "/\n" });

    const auto lines = dataLines(swof);
    BOOST_REQUIRE_EQUAL(lines.size(), wo.table().numRows());
    BOOST_CHECK_EQUAL(lines.front(), std::string { "0.1000000 0.0000000 1.0000000 0.0000000" });
    BOOST_CHECK_EQUAL(lines.back(), std::string { "1.0000000 1.0000000 0.0000000 0.0000000" });
}

BOOST_AUTO_TEST_CASE(Without_Header)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = makeWaterOil(endpoints(0.1, 0.2, 0.3), 2.0, 2.0, logger);

    const auto swof = wo.swof(logger, false, false);

    BOOST_CHECK_EQUAL(swof.rfind("-- \n", 0), std::size_t{0});
    BOOST_CHECK_MESSAGE(swof.find("swirr=") == std::string::npos,
                        "Endpoint comment line must be omitted");
    BOOST_CHECK_EQUAL(dataLines(swof).size(), wo.table().numRows());
}

BOOST_AUTO_TEST_CASE(Missing_Relperm)
{
    auto logger = Scal::DeferredLogger{};
    const auto wo = Scal::WaterOil { endpoints(0.1, 0.2, 0.3), 0.1, logger };

    BOOST_CHECK_THROW(wo.swof(logger), std::invalid_argument);
}

BOOST_AUTO_TEST_SUITE_END() // Swof
