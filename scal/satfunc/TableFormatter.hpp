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

#ifndef SCAL_TABLE_FORMATTER_HPP
#define SCAL_TABLE_FORMATTER_HPP

#include <string>

namespace Scal {

class DeferredLogger;
class MonotonicityConfig;
class SaturationTable;

/// Text rendering options for saturation tables.
struct TableFormat
{
    /// Number of decimals printed for every value.
    int digits{7};

    /// Number of decimals to round to prior to printing.  Should be at
    /// least digits + 1.
    int roundlevel{9};

    /// Whether or not to emit a line of column names.
    bool header{false};
};

/// Render table as whitespace separated text with fixed precision.  No
/// row index, missing values as empty fields, and one trailing newline
/// per row.
std::string formatTable(const SaturationTable& table,
                        const TableFormat&     format = TableFormat{});

/// Render table after enforcing strict monotonicity, at format.digits
/// decimals, for the columns named in 'monotonicity'.
///
/// Explicit rounding is necessary to avoid monotonicity errors from
/// truncation when the table is read back by a simulator.  See
/// makeMonotone() for the correction and for the exceptions it may
/// throw.
std::string formatTable(const SaturationTable&    table,
                        const MonotonicityConfig& monotonicity,
                        DeferredLogger&           deferredLogger,
                        const TableFormat&        format = TableFormat{});

/// Prefix every line of 'multiline' with comment characters.  Each line
/// is trimmed and the result always ends with a newline.  Blank input
/// yields a single placeholder comment line.
std::string formatComment(const std::string& multiline,
                          const std::string& prefix = "-- ");

} // namespace Scal

#endif // SCAL_TABLE_FORMATTER_HPP
