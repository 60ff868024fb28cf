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

#include <scal/satfunc/MonotonicityConfig.hpp>

#include <scal/common/Exceptions.hpp>
#include <scal/common/PropertyTree.hpp>

#include <opm/common/ErrorMacros.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    bool isValidKey(const std::string& key)
    {
        static const auto validKeys = std::array<std::string, 4> {
            "sign", "upper", "lower", "allowzero",
        };

        return std::find(validKeys.begin(), validKeys.end(), key) != validKeys.end();
    }

    template <typename T>
    std::optional<T> optionalValue(const Scal::PropertyTree& columnTree,
                                   const std::string&        column,
                                   const std::string&        key)
    {
        if (! columnTree.has_child(key)) {
            return std::nullopt;
        }

        try {
            return columnTree.get<T>(key);
        }
        catch (const std::runtime_error&) {
            OPM_THROW_NOLOG(Scal::ConfigurationError,
                            fmt::format("Monotonicity {} for column '{}' is not valid: '{}'",
                                        key, column, columnTree.get<std::string>(key)));
        }
    }

    int parseSign(const double signValue, const std::string& column)
    {
        if (signValue == 1.0) {
            return 1;
        }

        if (signValue == -1.0) {
            return -1;
        }

        OPM_THROW_NOLOG(Scal::ConfigurationError,
                        fmt::format("Monotonicity sign must be -1 or +1, "
                                    "not {} (column '{}')", signValue, column));
    }

} // Anonymous namespace

namespace Scal {

MonotonicityConfig::MonotonicityConfig(std::initializer_list<Entry> entries)
{
    for (const auto& [column, spec] : entries) {
        this->add(column, spec);
    }
}

MonotonicityConfig
MonotonicityConfig::fromPropertyTree(const PropertyTree& tree)
{
    auto config = MonotonicityConfig{};

    for (const auto& column : tree.get_child_keys()) {
        const auto columnTree = tree.get_child(column);

        for (const auto& key : columnTree.get_child_keys()) {
            if (! isValidKey(key)) {
                OPM_THROW_NOLOG(ConfigurationError,
                                fmt::format("Unknown key '{}' in monotonicity "
                                            "setting for column '{}'", key, column));
            }
        }

        const auto sign = optionalValue<double>(columnTree, column, "sign");
        if (! sign.has_value()) {
            OPM_THROW_NOLOG(ConfigurationError,
                            fmt::format("Monotonicity sign not specified for '{}'", column));
        }

        auto spec = MonotonicitySpec{};
        spec.sign = parseSign(*sign, column);
        spec.lower = optionalValue<double>(columnTree, column, "lower");
        spec.upper = optionalValue<double>(columnTree, column, "upper");
        spec.allowzero = optionalValue<bool>(columnTree, column, "allowzero");

        config.add(column, spec);
    }

    return config;
}

MonotonicityConfig&
MonotonicityConfig::add(const std::string& column, const MonotonicitySpec& spec)
{
    if ((spec.sign != 1) && (spec.sign != -1)) {
        OPM_THROW_NOLOG(ConfigurationError,
                        fmt::format("Monotonicity sign must be -1 or +1, "
                                    "not {} (column '{}')", spec.sign, column));
    }

    const auto nonFinite = [](const std::optional<double>& limit)
    {
        return limit.has_value() && ! std::isfinite(*limit);
    };

    if (nonFinite(spec.lower) || nonFinite(spec.upper)) {
        OPM_THROW_NOLOG(ConfigurationError,
                        fmt::format("Monotonicity limits for column '{}' "
                                    "must be finite", column));
    }

    if (spec.lower.has_value() && spec.upper.has_value() &&
        (*spec.lower > *spec.upper))
    {
        OPM_THROW_NOLOG(ConfigurationError,
                        fmt::format("Lower monotonicity limit {} exceeds "
                                    "upper limit {} for column '{}'",
                                    *spec.lower, *spec.upper, column));
    }

    if (this->contains(column)) {
        OPM_THROW_NOLOG(ConfigurationError,
                        fmt::format("Duplicate monotonicity setting "
                                    "for column '{}'", column));
    }

    this->entries_.emplace_back(column, spec);

    return *this;
}

bool MonotonicityConfig::contains(const std::string& column) const
{
    return std::any_of(this->entries_.begin(), this->entries_.end(),
                       [&column](const Entry& e) { return e.first == column; });
}

const MonotonicitySpec&
MonotonicityConfig::spec(const std::string& column) const
{
    auto pos = std::find_if(this->entries_.begin(), this->entries_.end(),
                            [&column](const Entry& e) { return e.first == column; });

    if (pos == this->entries_.end()) {
        OPM_THROW_NOLOG(ConfigurationError,
                        fmt::format("No monotonicity setting for column '{}'", column));
    }

    return pos->second;
}

void validateMonotonicity(const MonotonicityConfig&       config,
                          const std::vector<std::string>& columnNames)
{
    for (const auto& entry : config) {
        if (std::find(columnNames.begin(), columnNames.end(), entry.first) == columnNames.end()) {
            OPM_THROW_NOLOG(ConfigurationError,
                            fmt::format("Column '{}' does not exist in table", entry.first));
        }
    }
}

} // namespace Scal
