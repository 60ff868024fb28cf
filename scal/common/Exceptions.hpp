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
/*!
 * \file
 * \brief Exception classes raised by the saturation function engine.
 */
#ifndef SCAL_EXCEPTIONS_HPP
#define SCAL_EXCEPTIONS_HPP

#include <opm/common/Exceptions.hpp>

#include <stdexcept>
#include <string>

namespace Scal {

/// Malformed monotonicity settings (unknown keys, missing or invalid
/// sign, inconsistent bounds, non-existent column).
class ConfigurationError : public std::invalid_argument
{
public:
    explicit ConfigurationError(const std::string& message)
        : std::invalid_argument(message)
    {}
};

/// A value lies strictly outside of a declared lower or upper limit.
class RangeError : public std::range_error
{
public:
    explicit RangeError(const std::string& message)
        : std::range_error(message)
    {}
};

/// Input column too far from monotone for a correction to be meaningful.
class MonotonicityError : public Opm::NumericalProblem
{
public:
    explicit MonotonicityError(const std::string& message)
        : Opm::NumericalProblem(message)
    {}
};

/// Iteration budget of the monotonicity correction exceeded.
class ConvergenceError : public Opm::TooManyIterations
{
public:
    explicit ConvergenceError(const std::string& message)
        : Opm::TooManyIterations(message)
    {}
};

/// Post-correction verification failed.
class ValidationError : public Opm::NumericalProblem
{
public:
    explicit ValidationError(const std::string& message)
        : Opm::NumericalProblem(message)
    {}
};

/// Caller error when handing curves to the normalisation and
/// interpolation routines: mismatched curve types, interpolation
/// parameter outside [0,1], or inconsistent saturation endpoints.
class CurveArgumentError : public std::invalid_argument
{
public:
    explicit CurveArgumentError(const std::string& message)
        : std::invalid_argument(message)
    {}
};

} // namespace Scal

#endif // SCAL_EXCEPTIONS_HPP
