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

#define BOOST_TEST_MODULE Property_Tree

#include <boost/test/unit_test.hpp>

#include <scal/common/PropertyTree.hpp>

#include <cstddef>
#include <sstream>
#include <string>
#include <vector>

namespace {

    Scal::PropertyTree parse(const std::string& json)
    {
        auto input = std::istringstream { json };

        return Scal::PropertyTree { input };
    }

} // Anonymous namespace

BOOST_AUTO_TEST_CASE(Put_Get)
{
    auto t = Scal::PropertyTree{};

    t.put("digits", 7);
    t.put("krw.upper", 1.0);
    t.put("pc.allowzero", true);
    t.put("tag", std::string { "SATNUM 1" });

    BOOST_CHECK_EQUAL(t.get<int>("digits"), 7);
    BOOST_CHECK_CLOSE(t.get<double>("krw.upper"), 1.0, 1.0e-8);
    BOOST_CHECK_EQUAL(t.get<bool>("pc.allowzero"), true);
    BOOST_CHECK_EQUAL(t.get<std::string>("tag"), std::string { "SATNUM 1" });

    BOOST_CHECK_EQUAL(t.get<int>("roundlevel", 9), 9);
}

BOOST_AUTO_TEST_CASE(Read_Json)
{
    const auto t = parse(R"({
  "krw": { "sign": 1, "upper": 1 },
  "pc":  { "sign": -1 }
})");

    const auto keys = t.get_child_keys();
    const auto expect = std::vector<std::string> { "krw", "pc" };
    BOOST_CHECK_EQUAL_COLLECTIONS(keys.begin(), keys.end(), expect.begin(), expect.end());

    BOOST_CHECK_MESSAGE(t.has_child("krw"), "Tree must have child 'krw'");
    BOOST_CHECK_MESSAGE(! t.has_child("krow"), "Tree must not have child 'krow'");

    const auto krw = t.get_child("krw");
    BOOST_CHECK_EQUAL(krw.get<int>("sign"), 1);
    BOOST_CHECK_EQUAL(t.get<int>("pc.sign"), -1);
}

BOOST_AUTO_TEST_CASE(Optional_Child)
{
    const auto t = parse(R"({ "krw": { "sign": 1 } })");

    const auto krw = t.get_child_optional("krw");
    BOOST_REQUIRE_MESSAGE(krw.has_value(), "Child 'krw' must exist");
    BOOST_CHECK_EQUAL(krw->get<int>("sign"), 1);

    BOOST_CHECK_MESSAGE(! t.get_child_optional("krog").has_value(),
                        "Child 'krog' must not exist");
}

BOOST_AUTO_TEST_CASE(Copy_Is_Independent)
{
    auto t1 = Scal::PropertyTree{};
    t1.put("sign", 1);

    auto t2 = t1;
    t2.put("sign", -1);

    BOOST_CHECK_EQUAL(t1.get<int>("sign"), 1);
    BOOST_CHECK_EQUAL(t2.get<int>("sign"), -1);
}

BOOST_AUTO_TEST_CASE(Write_Json)
{
    auto t = Scal::PropertyTree{};
    t.put("krow.sign", -1);
    t.put("krow.lower", 0.0);

    auto output = std::ostringstream{};
    t.write_json(output, false);

    const auto t2 = parse(output.str());
    BOOST_CHECK_EQUAL(t2.get<int>("krow.sign"), -1);
    BOOST_CHECK_CLOSE(t2.get<double>("krow.lower"), 0.0, 1.0e-8);
}
