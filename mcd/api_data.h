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

#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <chrono>
#include <variant>
#include <ostream>


namespace mcd { namespace api {

namespace v1 {

    // count sentinel for the range accessors: read up to the last item
    static constexpr const int64_t AllItems{ -1 };


    enum class EntityType { Unknown = 0, Event = 1, Analog = 2, Segment = 3, Neural = 4 };
    auto operator<<(std::ostream&, EntityType) -> std::ostream&;

    // "unknown", "event", "analog", "segment", "neural"
    auto EntityTypeName(EntityType) -> std::string;
    // case insensitive, throws McdInvalidArgument
    auto EntityTypeFromName(const std::string&) -> EntityType;
    // codes outside of [0, 4] are Unknown
    auto EntityTypeFromCode(int64_t) -> EntityType;
    auto EntityTypeCode(EntityType) -> int64_t;


    // the payload type of an event entity
    enum class EventValueType { Text, Csv, Byte, Word, Dword };
    auto operator<<(std::ostream&, EventValueType) -> std::ostream&;
    auto IsNumeric(EventValueType) -> bool;


    // search direction for McdReader::IndexByTime
    enum class TimeSearch { Before = -1, Closest = 0, After = 1 };


    struct CalendarTime
    {
        uint32_t Year;
        uint32_t Month;     // 1 - 12
        uint32_t DayOfWeek; // 0 = Sunday
        uint32_t Day;       // 1 - 31
        uint32_t Hour;
        uint32_t Minute;
        uint32_t Second;
        uint32_t Millisecond;

        CalendarTime();
        CalendarTime(const CalendarTime&) = default;
        CalendarTime(CalendarTime&&) = default;
        auto operator=(const CalendarTime&) -> CalendarTime& = default;
        auto operator=(CalendarTime&&) -> CalendarTime& = default;
        ~CalendarTime() = default;

        friend auto operator==(const CalendarTime&, const CalendarTime&) -> bool = default;
        friend auto operator!=(const CalendarTime&, const CalendarTime&) -> bool = default;
    };
    auto operator<<(std::ostream&, const CalendarTime&) -> std::ostream&;
    // utc implied. throws McdData if the fields do not form a valid date
    auto calendar2timepoint(const CalendarTime&) -> std::chrono::system_clock::time_point;
    auto print(std::ostream&, std::chrono::system_clock::time_point) -> std::ostream&;


    struct FileInfo
    {
        std::string FileType;
        int64_t EntityCount;
        double TimeStampResolution; // seconds
        double TimeSpan; // seconds
        std::string AppName;
        std::string Comment;
        CalendarTime Created;

        FileInfo();
        FileInfo(const FileInfo&) = default;
        FileInfo(FileInfo&&) = default;
        auto operator=(const FileInfo&) -> FileInfo& = default;
        auto operator=(FileInfo&&) -> FileInfo& = default;
        ~FileInfo() = default;

        friend auto operator==(const FileInfo&, const FileInfo&) -> bool = default;
        friend auto operator!=(const FileInfo&, const FileInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const FileInfo&) -> std::ostream&;


    struct FileDescription
    {
        std::string Description;
        std::string Extension;
        std::string MacCodes;
        std::string MagicCode;

        friend auto operator==(const FileDescription&, const FileDescription&) -> bool = default;
        friend auto operator!=(const FileDescription&, const FileDescription&) -> bool = default;
    };


    struct LibraryInfo
    {
        std::string Description;
        std::string Creator;
        uint32_t LibraryMajor;
        uint32_t LibraryMinor;
        uint32_t ApiMajor;
        uint32_t ApiMinor;
        CalendarTime Built; // year, month and day only
        uint32_t Flags;
        uint32_t MaxFiles;
        std::vector<FileDescription> FileTypes;

        LibraryInfo();
        LibraryInfo(const LibraryInfo&) = default;
        LibraryInfo(LibraryInfo&&) = default;
        auto operator=(const LibraryInfo&) -> LibraryInfo& = default;
        auto operator=(LibraryInfo&&) -> LibraryInfo& = default;
        ~LibraryInfo() = default;

        friend auto operator==(const LibraryInfo&, const LibraryInfo&) -> bool = default;
        friend auto operator!=(const LibraryInfo&, const LibraryInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const LibraryInfo&) -> std::ostream&;


    struct EntitySummary
    {
        int64_t Id;
        std::string Label;
        EntityType Type;
        std::string TypeName;
        int64_t ItemCount; // samples, events, segments or spikes depending on Type

        EntitySummary();
        EntitySummary(int64_t id, const std::string& label, EntityType type, int64_t items);
        EntitySummary(const EntitySummary&) = default;
        EntitySummary(EntitySummary&&) = default;
        auto operator=(const EntitySummary&) -> EntitySummary& = default;
        auto operator=(EntitySummary&&) -> EntitySummary& = default;
        ~EntitySummary() = default;

        friend auto operator==(const EntitySummary&, const EntitySummary&) -> bool = default;
        friend auto operator!=(const EntitySummary&, const EntitySummary&) -> bool = default;
    };
    auto operator<<(std::ostream&, const EntitySummary&) -> std::ostream&;


    struct FilterSettings
    {
        double HighFreqCorner; // Hz
        uint32_t HighFreqOrder;
        std::string HighFilterType;
        double LowFreqCorner; // Hz
        uint32_t LowFreqOrder;
        std::string LowFilterType;

        FilterSettings();
        friend auto operator==(const FilterSettings&, const FilterSettings&) -> bool = default;
        friend auto operator!=(const FilterSettings&, const FilterSettings&) -> bool = default;
    };


    struct Location
    {
        double X;
        double Y;
        double Z;
        double User;

        Location();
        friend auto operator==(const Location&, const Location&) -> bool = default;
        friend auto operator!=(const Location&, const Location&) -> bool = default;
    };


    struct AnalogInfo
    {
        double SampleRate; // Hz
        double MinValue;
        double MaxValue;
        std::string Units;
        double Resolution;
        Location Position;
        FilterSettings Filter;
        std::string ProbeInfo;

        AnalogInfo();
        AnalogInfo(const AnalogInfo&) = default;
        AnalogInfo(AnalogInfo&&) = default;
        auto operator=(const AnalogInfo&) -> AnalogInfo& = default;
        auto operator=(AnalogInfo&&) -> AnalogInfo& = default;
        ~AnalogInfo() = default;

        friend auto operator==(const AnalogInfo&, const AnalogInfo&) -> bool = default;
        friend auto operator!=(const AnalogInfo&, const AnalogInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const AnalogInfo&) -> std::ostream&;


    struct EventInfo
    {
        EventValueType ValueType;
        uint32_t MinDataLength; // bytes
        uint32_t MaxDataLength; // bytes
        std::string CsvDescription;

        EventInfo();
        friend auto operator==(const EventInfo&, const EventInfo&) -> bool = default;
        friend auto operator!=(const EventInfo&, const EventInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const EventInfo&) -> std::ostream&;


    struct SegmentSourceInfo
    {
        double MinValue;
        double MaxValue;
        double Resolution;
        double SubSampleShift;
        Location Position;
        FilterSettings Filter;
        std::string ProbeInfo;

        SegmentSourceInfo();
        friend auto operator==(const SegmentSourceInfo&, const SegmentSourceInfo&) -> bool = default;
        friend auto operator!=(const SegmentSourceInfo&, const SegmentSourceInfo&) -> bool = default;
    };


    struct SegmentInfo
    {
        int64_t SourceCount;
        int64_t MinSampleCount;
        int64_t MaxSampleCount;
        double SampleRate; // Hz
        std::string Units;
        std::vector<SegmentSourceInfo> Sources; // SourceCount elements

        SegmentInfo();
        SegmentInfo(const SegmentInfo&) = default;
        SegmentInfo(SegmentInfo&&) = default;
        auto operator=(const SegmentInfo&) -> SegmentInfo& = default;
        auto operator=(SegmentInfo&&) -> SegmentInfo& = default;
        ~SegmentInfo() = default;

        friend auto operator==(const SegmentInfo&, const SegmentInfo&) -> bool = default;
        friend auto operator!=(const SegmentInfo&, const SegmentInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const SegmentInfo&) -> std::ostream&;


    struct NeuralInfo
    {
        int64_t SourceEntityId;
        uint32_t SourceUnitId;
        std::string ProbeInfo;

        NeuralInfo();
        friend auto operator==(const NeuralInfo&, const NeuralInfo&) -> bool = default;
        friend auto operator!=(const NeuralInfo&, const NeuralInfo&) -> bool = default;
    };
    auto operator<<(std::ostream&, const NeuralInfo&) -> std::ostream&;


    // std::monostate for entities of unknown type
    using EntityMetadata = std::variant<std::monostate, EventInfo, AnalogInfo, SegmentInfo, NeuralInfo>;

    struct EntityDetail
    {
        EntitySummary Entity;
        EntityMetadata Detail;

        EntityDetail() = default;
        EntityDetail(const EntitySummary&, const EntityMetadata&);
        EntityDetail(const EntityDetail&) = default;
        EntityDetail(EntityDetail&&) = default;
        auto operator=(const EntityDetail&) -> EntityDetail& = default;
        auto operator=(EntityDetail&&) -> EntityDetail& = default;
        ~EntityDetail() = default;

        friend auto operator==(const EntityDetail&, const EntityDetail&) -> bool = default;
        friend auto operator!=(const EntityDetail&, const EntityDetail&) -> bool = default;
    };
    auto operator<<(std::ostream&, const EntityDetail&) -> std::ostream&;


    struct AnalogRecord
    {
        std::string Label;
        std::vector<double> Data;
        std::vector<double> Timestamps; // seconds, one per element in Data
        int64_t ContinuousCount; // samples before the first gap in the recording
        double SampleRate; // Hz
        std::string Units;
        AnalogInfo Channel;

        AnalogRecord();
        AnalogRecord(const AnalogRecord&) = default;
        AnalogRecord(AnalogRecord&&) = default;
        auto operator=(const AnalogRecord&) -> AnalogRecord& = default;
        auto operator=(AnalogRecord&&) -> AnalogRecord& = default;
        ~AnalogRecord() = default;

        friend auto operator==(const AnalogRecord&, const AnalogRecord&) -> bool = default;
        friend auto operator!=(const AnalogRecord&, const AnalogRecord&) -> bool = default;
    };


    // numeric for byte, word and dword events; text for text and csv events
    using EventValues = std::variant<std::vector<double>, std::vector<std::string>>;

    struct EventRecord
    {
        std::string Label;
        EventValueType ValueType;
        std::vector<double> Timestamps; // seconds
        EventValues Values; // one per element in Timestamps

        EventRecord();
        EventRecord(const EventRecord&) = default;
        EventRecord(EventRecord&&) = default;
        auto operator=(const EventRecord&) -> EventRecord& = default;
        auto operator=(EventRecord&&) -> EventRecord& = default;
        ~EventRecord() = default;

        friend auto operator==(const EventRecord&, const EventRecord&) -> bool = default;
        friend auto operator!=(const EventRecord&, const EventRecord&) -> bool = default;
    };


    struct SegmentRecord
    {
        std::string Label;
        /*
        row major: one row per sample, one column per source.
        vector<double> Data {
            11, 12, // sample 1: sources 1 and 2
            21, 22, // sample 2: sources 1 and 2
            31, 32  // sample 3: sources 1 and 2
        } */
        std::vector<double> Data;
        int64_t SampleCount;
        int64_t SourceCount;
        double Timestamp; // seconds
        uint32_t UnitId; // 0: unclassified
        double SampleRate; // Hz

        SegmentRecord();
        SegmentRecord(const SegmentRecord&) = default;
        SegmentRecord(SegmentRecord&&) = default;
        auto operator=(const SegmentRecord&) -> SegmentRecord& = default;
        auto operator=(SegmentRecord&&) -> SegmentRecord& = default;
        ~SegmentRecord() = default;

        auto At(int64_t sample, int64_t source) const -> double;

        friend auto operator==(const SegmentRecord&, const SegmentRecord&) -> bool = default;
        friend auto operator!=(const SegmentRecord&, const SegmentRecord&) -> bool = default;
    };

    using SegmentSeries = std::vector<SegmentRecord>;


    struct NeuralRecord
    {
        std::string Label;
        std::vector<double> Timestamps; // seconds

        NeuralRecord() = default;
        NeuralRecord(const NeuralRecord&) = default;
        NeuralRecord(NeuralRecord&&) = default;
        auto operator=(const NeuralRecord&) -> NeuralRecord& = default;
        auto operator=(NeuralRecord&&) -> NeuralRecord& = default;
        ~NeuralRecord() = default;

        friend auto operator==(const NeuralRecord&, const NeuralRecord&) -> bool = default;
        friend auto operator!=(const NeuralRecord&, const NeuralRecord&) -> bool = default;
    };


    // the complete content of one entity, selected by the entity type
    using DataRecord = std::variant<AnalogRecord, EventRecord, SegmentSeries, NeuralRecord>;

} /* namespace v1 */

} /* namespace api*/ } /* namespace mcd */
