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

#include <scal/satfunc/SaturationTable.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace Scal {

SaturationTable::SaturationTable(std::initializer_list<std::pair<std::string, Column>> columns)
{
    for (const auto& [name, values] : columns) {
        this->setColumn(name, values);
    }
}

bool SaturationTable::hasColumn(const std::string& name) const
{
    return std::find(this->names_.begin(), this->names_.end(), name)
        != this->names_.end();
}

const SaturationTable::Column&
SaturationTable::column(const std::string& name) const
{
    return this->columns_[this->columnIndex(name)];
}

void SaturationTable::setColumn(const std::string& name, Column values)
{
    if (! this->names_.empty() && (values.size() != this->numRows_)) {
        throw std::invalid_argument {
            fmt::format("Column '{}' has {} values, but table has {} rows",
                        name, values.size(), this->numRows_)
        };
    }

    this->numRows_ = values.size();

    auto pos = std::find(this->names_.begin(), this->names_.end(), name);
    if (pos == this->names_.end()) {
        this->names_.push_back(name);
        this->columns_.push_back(std::move(values));
    }
    else {
        this->columns_[std::distance(this->names_.begin(), pos)] = std::move(values);
    }
}

SaturationTable
SaturationTable::select(const std::vector<std::string>& names) const
{
    auto result = SaturationTable{};

    for (const auto& name : names) {
        result.setColumn(name, this->column(name));
    }

    return result;
}

SaturationTable SaturationTable::rounded(const int decimals) const
{
    auto result = *this;

    for (auto& column : result.columns_) {
        std::transform(column.begin(), column.end(), column.begin(),
                       [decimals](const double x)
                       { return roundToDecimals(x, decimals); });
    }

    return result;
}

bool SaturationTable::operator==(const SaturationTable& that) const
{
    return (this->names_ == that.names_)
        && (this->columns_ == that.columns_)
        && (this->numRows_ == that.numRows_);
}

std::size_t SaturationTable::columnIndex(const std::string& name) const
{
    auto pos = std::find(this->names_.begin(), this->names_.end(), name);
    if (pos == this->names_.end()) {
        throw std::invalid_argument {
            fmt::format("No such column '{}' in saturation table", name)
        };
    }

    return std::distance(this->names_.begin(), pos);
}

// ---------------------------------------------------------------------------

double roundToDecimals(const double value, const int decimals)
{
    if (! std::isfinite(value)) {
        return value;
    }

    const auto scale = std::pow(10.0, decimals);

    // Default rounding mode rounds halfway cases to even.
    return std::nearbyint(value * scale) / scale;
}

std::vector<double> diff(const std::vector<double>& column)
{
    auto d = std::vector<double>(column.size(), std::numeric_limits<double>::quiet_NaN());

    for (std::size_t i = 1; i < column.size(); ++i) {
        d[i] = column[i] - column[i - 1];
    }

    return d;
}

} // namespace Scal
