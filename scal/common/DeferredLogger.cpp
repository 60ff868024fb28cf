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

#include <scal/common/DeferredLogger.hpp>

#include <opm/common/OpmLog/LogUtil.hpp>
#include <opm/common/OpmLog/OpmLog.hpp>

#include <algorithm>

namespace Scal
{

    void DeferredLogger::info(const std::string& tag, const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Info, tag, message});
    }

    void DeferredLogger::warning(const std::string& tag, const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Warning, tag, message});
    }

    void DeferredLogger::error(const std::string& tag, const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Error, tag, message});
    }

    void DeferredLogger::debug(const std::string& tag, const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Debug, tag, message});
    }

    void DeferredLogger::note(const std::string& tag, const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Note, tag, message});
    }

    void DeferredLogger::info(const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Info, "", message});
    }

    void DeferredLogger::warning(const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Warning, "", message});
    }

    void DeferredLogger::error(const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Error, "", message});
    }

    void DeferredLogger::debug(const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Debug, "", message});
    }

    void DeferredLogger::note(const std::string& message)
    {
        messages_.push_back({Opm::Log::MessageType::Note, "", message});
    }

    std::size_t DeferredLogger::count(const std::int64_t flag) const
    {
        return std::count_if(messages_.begin(), messages_.end(),
                             [flag](const Message& m) { return m.flag == flag; });
    }

    void DeferredLogger::logMessages()
    {
        for (const auto& m : messages_) {
            if (m.tag.empty()) {
                Opm::OpmLog::addMessage(m.flag, m.text);
            }
            else {
                Opm::OpmLog::addTaggedMessage(m.flag, m.tag, m.text);
            }
        }
        messages_.clear();
    }

    void DeferredLogger::clear()
    {
        messages_.clear();
    }

} // namespace Scal
