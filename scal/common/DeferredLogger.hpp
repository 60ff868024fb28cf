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


#ifndef SCAL_DEFERREDLOGGER_HEADER_INCLUDED
#define SCAL_DEFERREDLOGGER_HEADER_INCLUDED

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Scal
{

    /// Collects diagnostics emitted by the saturation function routines.
    ///
    /// The routines never write to the global Opm::OpmLog directly.
    /// Callers inject a DeferredLogger, inspect the collected messages
    /// if they wish, and forward them with logMessages() when
    /// appropriate.
    class DeferredLogger
    {
    public:
        struct Message
        {
            std::int64_t flag;
            std::string tag;
            std::string text;
        };

        void info(const std::string& tag, const std::string& message);
        void warning(const std::string& tag, const std::string& message);
        void error(const std::string& tag, const std::string& message);
        void debug(const std::string& tag, const std::string& message);
        void note(const std::string& tag, const std::string& message);

        void info(const std::string& message);
        void warning(const std::string& message);
        void error(const std::string& message);
        void debug(const std::string& message);
        void note(const std::string& message);

        /// Messages collected since construction or since the last
        /// call to logMessages() or clear().
        const std::vector<Message>& messages() const
        {
            return messages_;
        }

        /// Number of collected messages carrying a given flag.
        std::size_t count(std::int64_t flag) const;

        /// Forward all collected messages to Opm::OpmLog and clear.
        void logMessages();

        void clear();

    private:
        std::vector<Message> messages_;
    };

} // namespace Scal

#endif // SCAL_DEFERREDLOGGER_HEADER_INCLUDED
