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

#include <scal/satfunc/TableFormatter.hpp>

#include <scal/common/DeferredLogger.hpp>
#include <scal/satfunc/Monotonicity.hpp>
#include <scal/satfunc/MonotonicityConfig.hpp>
#include <scal/satfunc/SaturationTable.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <cmath>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace {

    std::string_view trim(std::string_view s)
    {
        constexpr auto ws = std::string_view { " \t\n\r\f\v" };

        const auto begin = s.find_first_not_of(ws);
        if (begin == std::string_view::npos) {
            return {};
        }

        const auto end = s.find_last_not_of(ws);

        return s.substr(begin, end - begin + 1);
    }

    void formatValue(const double value, const int digits, std::string& line)
    {
        if (std::isnan(value)) {
            return;
        }

        fmt::format_to(std::back_inserter(line), "{:.{}f}", value, digits);
    }

} // Anonymous namespace

namespace Scal {

std::string formatTable(const SaturationTable& table,
                        const TableFormat&     format)
{
    const auto rounded = table.rounded(format.roundlevel);

    auto text = std::string{};

    if (format.header) {
        text += fmt::format("{}\n", fmt::join(rounded.columnNames(), " "));
    }

    auto columns = std::vector<const SaturationTable::Column*>{};
    for (const auto& name : rounded.columnNames()) {
        columns.push_back(&rounded.column(name));
    }

    for (std::size_t row = 0; row < rounded.numRows(); ++row) {
        auto line = std::string{};

        for (std::size_t col = 0; col < columns.size(); ++col) {
            if (col > 0) {
                line += ' ';
            }

            formatValue((*columns[col])[row], format.digits, line);
        }

        text += line;
        text += '\n';
    }

    return text;
}

std::string formatTable(const SaturationTable&    table,
                        const MonotonicityConfig& monotonicity,
                        DeferredLogger&           deferredLogger,
                        const TableFormat&        format)
{
    if (monotonicity.empty()) {
        return formatTable(table, format);
    }

    return formatTable(makeMonotone(table, monotonicity,
                                    format.digits, deferredLogger),
                       format);
}

std::string formatComment(const std::string& multiline,
                          const std::string& prefix)
{
    if (trim(multiline).empty()) {
        // Indicate that there is a placeholder for something.
        return prefix + '\n';
    }

    auto lines = std::vector<std::string>{};

    auto input = std::istringstream { multiline };
    for (auto line = std::string{}; std::getline(input, line); ) {
        lines.push_back(prefix + std::string { trim(line) });
    }

    const auto joined = fmt::format("{}", fmt::join(lines, "\n"));

    return std::string { trim(joined) } + '\n';
}

} // namespace Scal
