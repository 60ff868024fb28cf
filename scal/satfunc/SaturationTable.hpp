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

#ifndef SCAL_SATURATION_TABLE_HPP
#define SCAL_SATURATION_TABLE_HPP

#include <cstddef>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace Scal {

/// Ordered collection of named, equally sized columns of floating point
/// values.  Rows are typically sorted by a saturation column.  Missing
/// values are represented as NaN.
///
/// Tables have value semantics.  Transformations such as rounding or
/// column selection return new tables and leave the source untouched.
class SaturationTable
{
public:
    using Column = std::vector<double>;

    SaturationTable() = default;

    /// Build table from a sequence of (name, values) pairs.  All value
    /// vectors must have the same size.
    SaturationTable(std::initializer_list<std::pair<std::string, Column>> columns);

    std::size_t numRows() const
    {
        return this->numRows_;
    }

    std::size_t numColumns() const
    {
        return this->names_.size();
    }

    bool empty() const
    {
        return this->numRows_ == 0;
    }

    bool hasColumn(const std::string& name) const;

    /// Column names in insertion order.
    const std::vector<std::string>& columnNames() const
    {
        return this->names_;
    }

    /// Values of named column.  Throws std::invalid_argument if the
    /// column does not exist.
    const Column& column(const std::string& name) const;

    /// Insert new column at the end, or replace the values of an existing
    /// column.  The number of values must match numRows() unless the
    /// table has no columns.
    void setColumn(const std::string& name, Column values);

    /// Copy of this table restricted to the named columns, in the order
    /// given.
    SaturationTable select(const std::vector<std::string>& names) const;

    /// Copy of this table with every value rounded to 'decimals' places.
    SaturationTable rounded(int decimals) const;

    bool operator==(const SaturationTable& that) const;

private:
    std::vector<std::string> names_{};
    std::vector<Column> columns_{};
    std::size_t numRows_{0};

    std::size_t columnIndex(const std::string& name) const;
};

/// Round value to 'decimals' decimal places, ties to even.
double roundToDecimals(double value, int decimals);

/// Lagged difference of a column.  Element zero is NaN.
std::vector<double> diff(const std::vector<double>& column);

} // namespace Scal

#endif // SCAL_SATURATION_TABLE_HPP
