/*
Copyright 2015-2021 Velko Hristov
This file is part of McdToolKit.
SPDX-License-Identifier: LGPL-3.0+

McdToolKit is free software: you can redistribute it and/or modify
it under the terms of the GNU Lesser General Public License as published by
the Free Software Foundation, either version 3 of the License, or
(at your option) any later version.

McdToolKit is distributed in the hope that it will be useful,
but WITHOUT ANY WARRANTY; without even the implied warranty of
MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
GNU Lesser General Public License for more details.

You should have received a copy of the GNU Lesser General Public License
along with McdToolKit.  If not, see <http://www.gnu.org/licenses/>.
*/

#include "api_data.h"

#include <cassert>
#include <cctype>
#include <iomanip>
#include <algorithm>
#include <sstream>
#include "date/date.h"

#include "exception.h"
#include "logger.h"

namespace mcd { namespace api {

    using namespace mcd::impl;

    namespace v1 {

        static constexpr const char* entity_type_names[] {
            "unknown",
            "event",
            "analog",
            "segment",
            "neural"
        };

        static constexpr const EntityType entity_types[] {
            EntityType::Unknown,
            EntityType::Event,
            EntityType::Analog,
            EntityType::Segment,
            EntityType::Neural
        };


        auto EntityTypeName(EntityType x) -> std::string {
            const auto code{ EntityTypeCode(x) };
            assert(0 <= code && code < 5);
            return entity_type_names[code];
        }

        auto EntityTypeFromName(const std::string& x) -> EntityType {
            std::string lower{ x };
            std::transform(begin(lower), end(lower), begin(lower), [](unsigned char c) -> char { return static_cast<char>(std::tolower(c)); });

            constexpr const size_t size{ sizeof(entity_type_names) / sizeof(entity_type_names[0]) };
            static_assert(size == sizeof(entity_types) / sizeof(entity_types[0]));

            const auto first{ entity_type_names };
            const auto last{ entity_type_names + size };
            const auto i{ std::find(first, last, lower) };
            if (i == last) {
                std::ostringstream oss;
                oss << "[EntityTypeFromName, api_data] invalid entity type '" << x << "', expected one of";
                for (const auto& name : entity_type_names) {
                    oss << " '" << name << "'";
                }
                const auto e{ oss.str() };
                mcd_log_error(e);
                throw McdInvalidArgument{ e };
            }

            return entity_types[std::distance(first, i)];
        }

        auto EntityTypeFromCode(int64_t x) -> EntityType {
            if (x < 0 || 4 < x) {
                return EntityType::Unknown;
            }
            return entity_types[x];
        }

        auto EntityTypeCode(EntityType x) -> int64_t {
            return static_cast<int64_t>(x);
        }

        auto operator<<(std::ostream& os, EntityType x) -> std::ostream& {
            os << EntityTypeName(x);
            return os;
        }


        auto operator<<(std::ostream& os, EventValueType x) -> std::ostream& {
            switch(x) {
                case EventValueType::Text: os << "text"; break;
                case EventValueType::Csv: os << "csv"; break;
                case EventValueType::Byte: os << "byte"; break;
                case EventValueType::Word: os << "word"; break;
                case EventValueType::Dword: os << "dword"; break;
            }
            return os;
        }

        auto IsNumeric(EventValueType x) -> bool {
            return x == EventValueType::Byte || x == EventValueType::Word || x == EventValueType::Dword;
        }


        CalendarTime::CalendarTime()
        : Year{ 0 }
        , Month{ 0 }
        , DayOfWeek{ 0 }
        , Day{ 0 }
        , Hour{ 0 }
        , Minute{ 0 }
        , Second{ 0 }
        , Millisecond{ 0 } {
        }

        auto operator<<(std::ostream& os, const CalendarTime& x) -> std::ostream& {
            os << std::setfill('0')
               << std::setw(4) << x.Year << "-"
               << std::setw(2) << x.Month << "-"
               << std::setw(2) << x.Day << " "
               << std::setw(2) << x.Hour << ":"
               << std::setw(2) << x.Minute << ":"
               << std::setw(2) << x.Second << "."
               << std::setw(3) << x.Millisecond
               << std::setfill(' ');
            return os;
        }


        static
        auto invalid_calendar(const CalendarTime& x, const char* reason) -> std::string {
            std::ostringstream oss;
            oss << "[calendar2timepoint, api_data] " << reason << " " << x;
            return oss.str();
        }

        auto calendar2timepoint(const CalendarTime& x) -> std::chrono::system_clock::time_point {
            using namespace std::chrono;

            const date::year_month_day ymd{ date::year{ static_cast<int>(x.Year) }, date::month{ x.Month }, date::day{ x.Day } };
            if (!ymd.ok()) {
                const auto e{ invalid_calendar(x, "invalid date") };
                mcd_log_error(e);
                throw McdData{ e };
            }

            if (23 < x.Hour || 59 < x.Minute || 60 < x.Second || 999 < x.Millisecond) {
                const auto e{ invalid_calendar(x, "invalid time of day") };
                mcd_log_error(e);
                throw McdData{ e };
            }

            const system_clock::time_point day{ date::sys_days{ ymd } };
            return day + hours{ x.Hour } + minutes{ x.Minute } + seconds{ x.Second } + milliseconds{ x.Millisecond };
        }


        auto print(std::ostream& oss, std::chrono::system_clock::time_point x) -> std::ostream& {
            using namespace std::chrono;

            const auto x_ms{ floor<milliseconds>(x.time_since_epoch()) };
            const auto x_days{ floor<date::days>(x_ms) };
            const date::year_month_day ymd{ date::sys_days{ x_days } };
            oss << ymd << " ";

            milliseconds reminder{ x_ms - x_days };
            const hours h{ floor<hours>(reminder) };
            reminder -= h;
            oss << std::setfill('0') << std::setw(2) << h.count() << ":";

            const minutes m{ floor<minutes>(reminder) };
            reminder -= m;
            oss << std::setfill('0') << std::setw(2) << m.count() << ":";

            const seconds s{ floor<seconds>(reminder) };
            reminder -= s;
            oss << std::setfill('0') << std::setw(2) << s.count() << ".";

            assert(reminder < 1s);
            oss << std::setfill('0') << std::setw(3) << reminder.count() << std::setfill(' ');
            return oss;
        }


        FileInfo::FileInfo()
        : EntityCount{ 0 }
        , TimeStampResolution{ 0 }
        , TimeSpan{ 0 } {
        }

        auto operator<<(std::ostream& os, const FileInfo& x) -> std::ostream& {
            os << "type " << x.FileType
               << ", entities " << x.EntityCount
               << ", time span " << x.TimeSpan << "s"
               << ", resolution " << x.TimeStampResolution << "s"
               << ", application " << x.AppName
               << ", created " << x.Created;
            if (!x.Comment.empty()) {
                os << ", comment [" << x.Comment << "]";
            }
            return os;
        }


        LibraryInfo::LibraryInfo()
        : LibraryMajor{ 0 }
        , LibraryMinor{ 0 }
        , ApiMajor{ 0 }
        , ApiMinor{ 0 }
        , Flags{ 0 }
        , MaxFiles{ 0 } {
        }

        auto operator<<(std::ostream& os, const LibraryInfo& x) -> std::ostream& {
            os << x.Description << " " << x.LibraryMajor << "." << x.LibraryMinor
               << " (neuroshare " << x.ApiMajor << "." << x.ApiMinor << ")"
               << ", " << x.Creator;
            for (const auto& t : x.FileTypes) {
                os << ", " << t.Description << " [" << t.Extension << "]";
            }
            return os;
        }


        EntitySummary::EntitySummary()
        : Id{ 0 }
        , Type{ EntityType::Unknown }
        , TypeName{ EntityTypeName(EntityType::Unknown) }
        , ItemCount{ 0 } {
        }

        EntitySummary::EntitySummary(int64_t id, const std::string& label, EntityType type, int64_t items)
        : Id{ id }
        , Label{ label }
        , Type{ type }
        , TypeName{ EntityTypeName(type) }
        , ItemCount{ items } {
        }

        auto operator<<(std::ostream& os, const EntitySummary& x) -> std::ostream& {
            os << x.Id << " " << x.TypeName << " '" << x.Label << "' " << x.ItemCount;
            return os;
        }


        FilterSettings::FilterSettings()
        : HighFreqCorner{ 0 }
        , HighFreqOrder{ 0 }
        , LowFreqCorner{ 0 }
        , LowFreqOrder{ 0 } {
        }

        Location::Location()
        : X{ 0 }
        , Y{ 0 }
        , Z{ 0 }
        , User{ 0 } {
        }


        AnalogInfo::AnalogInfo()
        : SampleRate{ 0 }
        , MinValue{ 0 }
        , MaxValue{ 0 }
        , Resolution{ 0 } {
        }

        auto operator<<(std::ostream& os, const AnalogInfo& x) -> std::ostream& {
            os << x.SampleRate << "Hz [" << x.MinValue << ", " << x.MaxValue << "] " << x.Units
               << ", resolution " << x.Resolution;
            return os;
        }


        EventInfo::EventInfo()
        : ValueType{ EventValueType::Dword }
        , MinDataLength{ 0 }
        , MaxDataLength{ 0 } {
        }

        auto operator<<(std::ostream& os, const EventInfo& x) -> std::ostream& {
            os << x.ValueType << " [" << x.MinDataLength << ", " << x.MaxDataLength << "] bytes";
            if (!x.CsvDescription.empty()) {
                os << ", " << x.CsvDescription;
            }
            return os;
        }


        SegmentSourceInfo::SegmentSourceInfo()
        : MinValue{ 0 }
        , MaxValue{ 0 }
        , Resolution{ 0 }
        , SubSampleShift{ 0 } {
        }

        SegmentInfo::SegmentInfo()
        : SourceCount{ 0 }
        , MinSampleCount{ 0 }
        , MaxSampleCount{ 0 }
        , SampleRate{ 0 } {
        }

        auto operator<<(std::ostream& os, const SegmentInfo& x) -> std::ostream& {
            os << x.SourceCount << " source(s), [" << x.MinSampleCount << ", " << x.MaxSampleCount << "] samples, "
               << x.SampleRate << "Hz " << x.Units;
            return os;
        }


        NeuralInfo::NeuralInfo()
        : SourceEntityId{ 0 }
        , SourceUnitId{ 0 } {
        }

        auto operator<<(std::ostream& os, const NeuralInfo& x) -> std::ostream& {
            os << "source entity " << x.SourceEntityId << ", unit " << x.SourceUnitId;
            return os;
        }


        EntityDetail::EntityDetail(const EntitySummary& entity, const EntityMetadata& detail)
        : Entity{ entity }
        , Detail{ detail } {
        }

        auto operator<<(std::ostream& os, const EntityDetail& x) -> std::ostream& {
            os << x.Entity;
            std::visit([&os](const auto& detail) -> void {
                using T = std::decay_t<decltype(detail)>;
                if constexpr (!std::is_same_v<T, std::monostate>) {
                    os << ": " << detail;
                }
            }, x.Detail);
            return os;
        }


        AnalogRecord::AnalogRecord()
        : ContinuousCount{ 0 }
        , SampleRate{ 0 } {
        }

        EventRecord::EventRecord()
        : ValueType{ EventValueType::Dword } {
        }

        SegmentRecord::SegmentRecord()
        : SampleCount{ 0 }
        , SourceCount{ 0 }
        , Timestamp{ 0 }
        , UnitId{ 0 }
        , SampleRate{ 0 } {
        }

        auto SegmentRecord::At(int64_t sample, int64_t source) const -> double {
            if (sample < 0 || SampleCount <= sample || source < 0 || SourceCount <= source) {
                std::ostringstream oss;
                oss << "[SegmentRecord::At, api_data] invalid position " << sample << ", " << source
                    << " in " << SampleCount << "x" << SourceCount;
                const auto e{ oss.str() };
                mcd_log_error(e);
                throw McdOutOfRange{ e };
            }

            return Data[static_cast<size_t>(sample * SourceCount + source)];
        }

    } /* namespace v1 */


} /* namespace api */ } /* namespace mcd */
