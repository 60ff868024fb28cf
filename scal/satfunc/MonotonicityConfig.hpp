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

#ifndef SCAL_MONOTONICITY_CONFIG_HPP
#define SCAL_MONOTONICITY_CONFIG_HPP

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace Scal {

class PropertyTree;

/// Monotonicity requirements for a single table column.
struct MonotonicitySpec
{
    /// Direction.  +1 for increasing, -1 for decreasing.
    int sign{1};

    /// Optional limits.  Values may equal, but not pass, a limit and
    /// non-strict monotonicity is permitted at the limits.
    std::optional<double> lower{};
    std::optional<double> upper{};

    /// Exempt all-zero columns from strict monotonicity.
    std::optional<bool> allowzero{};

    bool operator==(const MonotonicitySpec& that) const
    {
        return (this->sign == that.sign)
            && (this->lower == that.lower)
            && (this->upper == that.upper)
            && (this->allowzero == that.allowzero);
    }
};

/// Ordered mapping from column names to monotonicity requirements.
/// Columns are processed in insertion order.
class MonotonicityConfig
{
public:
    using Entry = std::pair<std::string, MonotonicitySpec>;
    using const_iterator = std::vector<Entry>::const_iterator;

    MonotonicityConfig() = default;

    /// Convenience constructor.  Equivalent to calling add() for each
    /// entry in turn.
    MonotonicityConfig(std::initializer_list<Entry> entries);

    /// Build configuration from a property tree in which each child is
    /// a column name mapping to an object with the optional keys
    /// "sign", "upper", "lower", and "allowzero".  Throws
    /// ConfigurationError on unknown keys, missing or invalid sign,
    /// non-numeric limits, or non-boolean allowzero.
    static MonotonicityConfig fromPropertyTree(const PropertyTree& tree);

    /// Append requirements for a column.  Throws ConfigurationError if
    /// the sign is not +1 or -1, if lower > upper, or if the column is
    /// already configured.
    MonotonicityConfig& add(const std::string& column, const MonotonicitySpec& spec);

    bool empty() const { return this->entries_.empty(); }
    std::size_t size() const { return this->entries_.size(); }

    bool contains(const std::string& column) const;

    /// Requirements for a configured column.  Throws ConfigurationError
    /// if the column is not configured.
    const MonotonicitySpec& spec(const std::string& column) const;

    const_iterator begin() const { return this->entries_.begin(); }
    const_iterator end() const { return this->entries_.end(); }

private:
    std::vector<Entry> entries_{};
};

/// Verify that every configured column exists among 'columnNames'.
/// Throws ConfigurationError otherwise.
void validateMonotonicity(const MonotonicityConfig& config,
                          const std::vector<std::string>& columnNames);

} // namespace Scal

#endif // SCAL_MONOTONICITY_CONFIG_HPP
