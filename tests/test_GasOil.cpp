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

#define BOOST_TEST_MODULE Gas_Oil

#include <boost/test/unit_test.hpp>

#include <scal/satfunc/GasOil.hpp>

#include <scal/common/DeferredLogger.hpp>
#include <scal/common/Exceptions.hpp>

#include <opm/common/OpmLog/LogUtil.hpp>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace {

    Scal::GasOilEndpoints endpoints(const double swl, const double sgcr, const double sorg)
    {
        auto ep = Scal::GasOilEndpoints{};
        ep.swl = swl;
        ep.sgcr = sgcr;
        ep.sorg = sorg;

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

    Scal::GasOil makeGasOil(const Scal::GasOilEndpoints& ep,
                            const double                 ng,
                            const double                 nog,
                            Scal::DeferredLogger&        logger)
    {
        auto go = Scal::GasOil { ep, 0.1, logger };

        auto& table = go.table();
        table.setColumn("krg", corey(table.column("sgn"), ng));
        table.setColumn("krog", corey(table.column("son"), nog));

        go.setEndpointsLinearpartKrg(1.0);
        go.setEndpointsLinearpartKrog(1.0);

        return go;
    }

    std::vector<std::string> dataLines(const std::string& text)
    {
        auto lines = std::vector<std::string>{};

        auto input = std::istringstream { text };
        for (auto line = std::string{}; std::getline(input, line); ) {
            if (line.empty() || (line.rfind("--", 0) == 0) ||
                (line == "SGOF") || (line == "/"))
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
    const auto go = Scal::GasOil { endpoints(0.1, 0.05, 0.1), 0.1, logger };

    const auto& table = go.table();
    const auto& sg = table.column("sg");

    BOOST_CHECK_EQUAL(table.numRows(), std::size_t{12});
    BOOST_CHECK_EQUAL(sg.front(), 0.0);
    BOOST_CHECK_EQUAL(sg[1], 0.05);
    BOOST_CHECK_CLOSE(sg.back(), 0.9, 1.0e-8);

    // sg = 1 - swl - sorg
    BOOST_CHECK_CLOSE(sg[9], 0.8, 1.0e-8);

    const auto& sl = table.column("sl");
    for (std::size_t i = 0; i < sg.size(); ++i) {
        BOOST_CHECK_CLOSE(sl[i] + sg[i], 1.0, 1.0e-8);
    }
}

BOOST_AUTO_TEST_CASE(Normalised_Saturations)
{
    auto logger = Scal::DeferredLogger{};
    const auto go = Scal::GasOil { endpoints(0.1, 0.05, 0.1), 0.1, logger };

    const auto& sgn = go.table().column("sgn");
    const auto& son = go.table().column("son");

    BOOST_CHECK_SMALL(sgn[1], 1.0e-12);
    BOOST_CHECK_CLOSE(sgn[9], 1.0, 1.0e-8);
    BOOST_CHECK_CLOSE(son[0], 1.0, 1.0e-8);
    BOOST_CHECK_SMALL(son[9], 1.0e-12);
}

BOOST_AUTO_TEST_CASE(Invalid_Endpoints)
{
    auto logger = Scal::DeferredLogger{};

    BOOST_CHECK_THROW(Scal::GasOil(endpoints(0.1, 1.5, 0.1), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::GasOil(endpoints(0.6, 0.0, 0.5), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::GasOil(endpoints(0.1, 0.85, 0.1), 0.1, logger),
                      Scal::CurveArgumentError);

    BOOST_CHECK_THROW(Scal::GasOil(endpoints(0.1, 0.0, 0.1), -0.1, logger),
                      Scal::CurveArgumentError);
}

BOOST_AUTO_TEST_SUITE_END() // Construction

// ===========================================================================

BOOST_AUTO_TEST_SUITE(Curves)

BOOST_AUTO_TEST_CASE(Linear_Part_Krg)
{
    auto logger = Scal::DeferredLogger{};
    auto go = makeGasOil(endpoints(0.1, 0.05, 0.1), 2.0, 2.0, logger);

    go.setEndpointsLinearpartKrg(0.7, 0.9);

    const auto& krg = go.table().column("krg");

    BOOST_CHECK_SMALL(krg[0], 1.0e-12);
    BOOST_CHECK_SMALL(krg[1], 1.0e-12);
    BOOST_CHECK_CLOSE(krg[9], 0.7, 1.0e-6);
    BOOST_CHECK_CLOSE(krg[10], 0.8, 1.0e-6);
    BOOST_CHECK_CLOSE(krg[11], 0.9, 1.0e-6);
}

BOOST_AUTO_TEST_CASE(Linear_Part_Krog)
{
    auto logger = Scal::DeferredLogger{};
    auto go = makeGasOil(endpoints(0.1, 0.05, 0.1), 2.0, 2.0, logger);

    go.setEndpointsLinearpartKrog(0.9);

    const auto& krog = go.table().column("krog");

    BOOST_CHECK_CLOSE(krog[0], 0.9, 1.0e-8);
    for (std::size_t i = 9; i < krog.size(); ++i) {
        BOOST_CHECK_SMALL(krog[i], 1.0e-12);
    }
}

BOOST_AUTO_TEST_CASE(Estimated_Endpoints)
{
    auto logger = Scal::DeferredLogger{};
    const auto go = makeGasOil(endpoints(0.1, 0.05, 0.1), 2.0, 2.0, logger);

    BOOST_CHECK_CLOSE(go.estimateSorg(), 0.1, 1.0e-6);
    BOOST_CHECK_CLOSE(go.estimateSorg("krg"), 0.1, 1.0e-6);
    BOOST_CHECK_CLOSE(go.estimateSgcr(), 0.05, 1.0e-6);
}

BOOST_AUTO_TEST_CASE(Crosspoint)
{
    auto logger = Scal::DeferredLogger{};
    const auto go = makeGasOil(endpoints(0.0, 0.0, 0.0), 2.0, 2.0, logger);

    BOOST_CHECK_CLOSE(go.crosspoint(logger), 0.5, 1.0e-6);
    BOOST_CHECK_MESSAGE(logger.messages().empty(), "No diagnostics expected");
}

BOOST_AUTO_TEST_SUITE_END() // Curves

// ===========================================================================

BOOST_AUTO_TEST_SUITE(Sgof)

BOOST_AUTO_TEST_CASE(Keyword_Text)
{
    auto logger = Scal::DeferredLogger{};
    auto go = makeGasOil(endpoints(0.1, 0.05, 0.1), 2.0, 2.0, logger);
    go.setTag("Low case");

    const auto sgof = go.sgof(logger);

    BOOST_CHECK_EQUAL(sgof.rfind("SGOF\n-- Low case\n", 0), std::size_t{0});
    BOOST_CHECK_MESSAGE(sgof.find("-- swirr=0 sgcr=0.05 swl=0.1 sorg=0.1\n") != std::string::npos,
                        "Endpoint comment line missing");
    BOOST_CHECK_MESSAGE(sgof.find("-- krg = krog @ sg=") != std::string::npos,
                        "Crosspoint comment line missing");
    BOOST_CHECK_EQUAL(sgof.substr(sgof.size() - 2), std::string { "/\n" });

    const auto lines = dataLines(sgof);
    BOOST_REQUIRE_EQUAL(lines.size(), go.table().numRows());
    BOOST_CHECK_EQUAL(lines.front(), std::string { "0.0000000 0.0000000 1.0000000 0.0000000" });
    BOOST_CHECK_EQUAL(lines.back(), std::string { "0.9000000 1.0000000 0.0000000 0.0000000" });
}

BOOST_AUTO_TEST_CASE(With_Capillary_Pressure)
{
    auto logger = Scal::DeferredLogger{};
    auto go = makeGasOil(endpoints(0.1, 0.05, 0.1), 2.0, 2.0, logger);

    const auto& sg = go.table().column("sg");
    auto pc = std::vector<double>(sg.size());
    std::transform(sg.begin(), sg.end(), pc.begin(),
                   [](const double s) { return 2.0 * s; });
    go.table().setColumn("pc", pc);

    const auto lines = dataLines(go.sgof(logger, false, false));
    BOOST_REQUIRE_EQUAL(lines.size(), go.table().numRows());
    BOOST_CHECK_EQUAL(lines.back(), std::string { "0.9000000 1.0000000 0.0000000 1.8000000" });
}

BOOST_AUTO_TEST_SUITE_END() // Sgof
