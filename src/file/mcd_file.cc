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

#include "file/mcd_file.h"

#include <algorithm>
#include <cstring>
#include <sstream>

#include "arithmetic.h"
#include "exception.h"
#include "logger.h"
#include "native/locate.h"


namespace mcd { namespace impl {

    using namespace mcd::api::v1;

    auto check_source(const std::filesystem::path& fname) -> void {
        std::error_code ec;
        if (std::filesystem::exists(fname, ec)) {
            return;
        }

        std::ostringstream oss;
        oss << "[check_source, mcd_file] " << fname.string() << " does not exist";
        const auto e{ oss.str() };
        mcd_log_error(e);
        throw McdNotFound{ e };
    }


    auto open_native_library(const std::optional<std::filesystem::path>& requested) -> std::shared_ptr<native_library> {
        const auto p{ current_platform() };
        const auto found{ locate_library(requested, default_search_directories(), p) };
        if (found) {
            prefix_library_search_path(found->parent_path());
            return load_library(*found);
        }

        const auto names{ library_names(p) };
        mcd_log_warning("[open_native_library, mcd_file] native library not found in the search directories, trying the dynamic loader with " + names.front());
        return load_library(names.front());
    }


    static
    auto entity_text(int64_t id) -> std::string {
        std::ostringstream oss;
        oss << "entity " << id;
        return oss.str();
    }

    static
    auto entity_text(int64_t id, int64_t index) -> std::string {
        std::ostringstream oss;
        oss << "entity " << id << ", index " << index;
        return oss.str();
    }


    static
    auto file_info2api(const ns_file_info& x) -> FileInfo {
        FileInfo result;
        result.FileType = field2string(x.file_type);
        result.EntityCount = x.entity_count;
        result.TimeStampResolution = x.time_stamp_resolution;
        result.TimeSpan = x.time_span;
        result.AppName = field2string(x.app_name);
        result.Comment = field2string(x.file_comment);
        result.Created.Year = x.time_year;
        result.Created.Month = x.time_month;
        result.Created.DayOfWeek = x.time_day_of_week;
        result.Created.Day = x.time_day;
        result.Created.Hour = x.time_hour;
        result.Created.Minute = x.time_min;
        result.Created.Second = x.time_sec;
        result.Created.Millisecond = x.time_millisec;
        return result;
    }

    template<typename T>
    static
    auto filter2api(const T& x) -> FilterSettings {
        FilterSettings result;
        result.HighFreqCorner = x.high_freq_corner;
        result.HighFreqOrder = x.high_freq_order;
        result.HighFilterType = field2string(x.high_filter_type);
        result.LowFreqCorner = x.low_freq_corner;
        result.LowFreqOrder = x.low_freq_order;
        result.LowFilterType = field2string(x.low_filter_type);
        return result;
    }

    template<typename T>
    static
    auto location2api(const T& x) -> Location {
        Location result;
        result.X = x.location_x;
        result.Y = x.location_y;
        result.Z = x.location_z;
        result.User = x.location_user;
        return result;
    }

    static
    auto event_type2api(uint32_t x, int64_t id) -> EventValueType {
        switch (x) {
            case ns_event_text: return EventValueType::Text;
            case ns_event_csv: return EventValueType::Csv;
            case ns_event_byte: return EventValueType::Byte;
            case ns_event_word: return EventValueType::Word;
            case ns_event_dword: return EventValueType::Dword;
        }

        std::ostringstream oss;
        oss << "[EntityInfo, mcd_file] " << entity_text(id) << ": unknown event type " << x;
        const auto e{ oss.str() };
        mcd_log_error(e);
        throw McdData{ e };
    }


    mcd_file::mcd_file(const std::filesystem::path& name, std::shared_ptr<native_library> library)
    : lib{ std::move(library) }
    , fname{ name } {
        check_source(fname);

        if (!lib) {
            const std::string e{ "[mcd_file, mcd_file] no native library" };
            mcd_log_error(e);
            throw McdOpenError{ e };
        }

        uint32_t h{ 0 };
        const auto opened{ lib->open_file(fname.string().c_str(), &h) };
        if (opened != ns_ok) {
            std::ostringstream oss;
            oss << "[mcd_file, mcd_file] " << lib->location() << " can not open " << fname.string() << ": " << result_name(opened);
            const auto native_msg{ last_error(*lib) };
            if (!native_msg.empty()) {
                oss << " (" << native_msg << ")";
            }
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOpenError{ e };
        }
        handle = h;

        ns_file_info x{};
        const auto described{ lib->get_file_info(h, &x, sizeof(x)) };
        if (described != ns_ok) {
            std::ostringstream oss;
            oss << "[mcd_file, mcd_file] " << fname.string() << ": can not read the file info: " << result_name(described);
            const auto native_msg{ last_error(*lib) };
            if (!native_msg.empty()) {
                oss << " (" << native_msg << ")";
            }
            const auto e{ oss.str() };
            close();
            mcd_log_error(e);
            throw McdOpenError{ e };
        }
        file_info = file_info2api(x);

        mcd_log_info("[mcd_file, mcd_file] opened " + fname.string());
    }

    mcd_file::~mcd_file() {
        close();
    }

    auto mcd_file::close() -> void {
        if (!handle) {
            return;
        }

        const auto h{ *handle };
        handle.reset();
        entities.clear();

        const auto closed{ lib->close_file(h) };
        if (closed != ns_ok) {
            mcd_log_warning("[close, mcd_file] " + fname.string() + ": " + result_name(closed));
        }
    }

    auto mcd_file::is_open() const -> bool {
        return handle.has_value();
    }

    auto mcd_file::file_name() const -> std::filesystem::path {
        return fname;
    }

    auto mcd_file::library_location() const -> std::string {
        return lib->location();
    }

    auto mcd_file::file_handle(const std::string& func) const -> uint32_t {
        if (!handle) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << fname.string() << " is closed";
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdNotOpen{ e };
        }

        return *handle;
    }


    auto mcd_file::info() const -> FileInfo {
        file_handle("Info");
        return file_info;
    }

    auto mcd_file::library_info() const -> LibraryInfo {
        file_handle("Library");

        ns_library_info x{};
        check(*lib, lib->get_library_info(&x, sizeof(x)), "Library", lib->location());

        LibraryInfo result;
        result.Description = field2string(x.description);
        result.Creator = field2string(x.creator);
        result.LibraryMajor = x.lib_version_major;
        result.LibraryMinor = x.lib_version_minor;
        result.ApiMajor = x.api_version_major;
        result.ApiMinor = x.api_version_minor;
        result.Built.Year = x.time_year;
        result.Built.Month = x.time_month;
        result.Built.Day = x.time_day;
        result.Flags = x.flags;
        result.MaxFiles = x.max_files;

        const auto descriptions{ std::min(x.file_desc_count, ns_max_file_descriptions) };
        for (uint32_t i{ 0 }; i < descriptions; ++i) {
            const auto& d{ x.file_desc[i] };
            result.FileTypes.push_back({ field2string(d.description), field2string(d.extension), field2string(d.mac_codes), field2string(d.magic_code) });
        }
        return result;
    }

    auto mcd_file::entity_count() const -> int64_t {
        file_handle("Entities");
        return file_info.EntityCount;
    }


    auto mcd_file::load_entity(uint32_t file, uint32_t id) const -> entity_record {
        const std::string func{ "EntityInfo" };
        const auto what{ entity_text(id) };

        ns_entity_info x{};
        check(*lib, lib->get_entity_info(file, id, &x, sizeof(x)), func, what);

        const auto type{ EntityTypeFromCode(x.entity_type) };
        entity_record result;
        result.summary = EntitySummary{ id, field2string(x.entity_label), type, x.item_count };

        switch (type) {
            case EntityType::Event: {
                ns_event_info y{};
                check(*lib, lib->get_event_info(file, id, &y, sizeof(y)), func, what);

                EventInfo z;
                z.ValueType = event_type2api(y.event_type, id);
                z.MinDataLength = y.min_data_length;
                z.MaxDataLength = y.max_data_length;
                z.CsvDescription = field2string(y.csv_desc);
                result.detail = z;
                break;
            }
            case EntityType::Analog: {
                ns_analog_info y{};
                check(*lib, lib->get_analog_info(file, id, &y, sizeof(y)), func, what);

                AnalogInfo z;
                z.SampleRate = y.sample_rate;
                z.MinValue = y.min_val;
                z.MaxValue = y.max_val;
                z.Units = field2string(y.units);
                z.Resolution = y.resolution;
                z.Position = location2api(y);
                z.Filter = filter2api(y);
                z.ProbeInfo = field2string(y.probe_info);
                result.detail = z;
                break;
            }
            case EntityType::Segment: {
                ns_segment_info y{};
                check(*lib, lib->get_segment_info(file, id, &y, sizeof(y)), func, what);

                SegmentInfo z;
                z.SourceCount = y.source_count;
                z.MinSampleCount = y.min_sample_count;
                z.MaxSampleCount = y.max_sample_count;
                z.SampleRate = y.sample_rate;
                z.Units = field2string(y.units);
                for (uint32_t source{ 0 }; source < y.source_count; ++source) {
                    ns_segsource_info s{};
                    check(*lib, lib->get_segment_source_info(file, id, source, &s, sizeof(s)), func, entity_text(id, source));

                    SegmentSourceInfo w;
                    w.MinValue = s.min_val;
                    w.MaxValue = s.max_val;
                    w.Resolution = s.resolution;
                    w.SubSampleShift = s.sub_sample_shift;
                    w.Position = location2api(s);
                    w.Filter = filter2api(s);
                    w.ProbeInfo = field2string(s.probe_info);
                    z.Sources.push_back(w);
                }
                result.detail = z;
                break;
            }
            case EntityType::Neural: {
                ns_neural_info y{};
                check(*lib, lib->get_neural_info(file, id, &y, sizeof(y)), func, what);

                NeuralInfo z;
                z.SourceEntityId = y.source_entity_id;
                z.SourceUnitId = y.source_unit_id;
                z.ProbeInfo = field2string(y.probe_info);
                result.detail = z;
                break;
            }
            case EntityType::Unknown:
                break;
        }

        return result;
    }

    auto mcd_file::entity(int64_t id) const -> const entity_record& {
        const auto file{ file_handle("EntityInfo") };

        if (id < 0 || file_info.EntityCount <= id) {
            std::ostringstream oss;
            oss << "[EntityInfo, mcd_file] invalid entity id " << id << ", " << fname.string() << " contains " << file_info.EntityCount << " entities";
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdNotFound{ e };
        }

        const auto key{ cast(id, uint32_t{}, ok{}) };
        auto i{ entities.find(key) };
        if (i == end(entities)) {
            i = entities.emplace(key, load_entity(file, key)).first;
        }
        return i->second;
    }

    auto mcd_file::typed_entity(int64_t id, EntityType type, const std::string& func) const -> const entity_record& {
        const auto& x{ entity(id) };
        if (x.summary.Type != type) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << entity_text(id) << " '" << x.summary.Label << "' is " << x.summary.Type << ", expected " << type;
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdTypeMismatch{ e };
        }

        return x;
    }


    struct item_range
    {
        int64_t first;
        int64_t length;
    };

    // negative count: up to the end. count past the end: clamped.
    // start 0 is accepted for an empty entity.
    static
    auto clamp_range(const EntitySummary& x, int64_t start, int64_t count, const std::string& func) -> item_range {
        const auto items{ x.ItemCount };
        const bool empty_entity{ items == 0 && start == 0 };
        if (start < 0 || (!empty_entity && items <= start)) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << entity_text(x.Id) << " '" << x.Label << "': start index " << start << ", available " << items;
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOutOfRange{ e };
        }

        const auto available{ items - start };
        const auto length{ count < 0 ? available : std::min(count, available) };
        return { start, length };
    }


    // absolute time in seconds of the samples [first, first + length)
    static
    auto sample_times(native_library& lib, uint32_t file, uint32_t id, item_range range, double sample_rate, const std::string& func) -> std::vector<double> {
        std::vector<double> result(as_sizet(range.length));

        const auto first{ cast(range.first, uint32_t{}, ok{}) };
        double t0{ 0 };
        check(lib, lib.get_time_by_index(file, id, first, &t0), func, entity_text(id, range.first));

        if (0 < sample_rate) {
            for (size_t i{ 0 }; i < result.size(); ++i) {
                result[i] = t0 + static_cast<double>(i) / sample_rate;
            }
            return result;
        }

        mcd_log_warning("[" + func + ", mcd_file] " + entity_text(id) + ": no sample rate, reading the time of every sample");
        for (size_t i{ 0 }; i < result.size(); ++i) {
            const auto index{ cast(range.first + static_cast<int64_t>(i), uint32_t{}, ok{}) };
            check(lib, lib.get_time_by_index(file, id, index, &result[i]), func, entity_text(id, index));
        }
        return result;
    }


    auto mcd_file::analog(int64_t id, int64_t start, int64_t count) const -> AnalogRecord {
        const std::string func{ "AnalogData" };
        const auto file{ file_handle(func) };
        const auto& x{ typed_entity(id, EntityType::Analog, func) };
        const auto& info{ std::get<AnalogInfo>(x.detail) };
        const auto range{ clamp_range(x.summary, start, count, func) };

        AnalogRecord result;
        result.Label = x.summary.Label;
        result.SampleRate = info.SampleRate;
        result.Units = info.Units;
        result.Channel = info;
        if (range.length == 0) {
            return result;
        }

        const auto id32{ cast(id, uint32_t{}, ok{}) };
        std::vector<double> data(as_sizet(range.length));
        uint32_t continuous{ 0 };
        check(*lib, lib->get_analog_data(file, id32, cast(range.first, uint32_t{}, ok{}), cast(range.length, uint32_t{}, ok{}), &continuous, data.data()), func, entity_text(id, range.first));

        result.Data = std::move(data);
        result.ContinuousCount = continuous;
        result.Timestamps = sample_times(*lib, file, id32, range, info.SampleRate, func);
        return result;
    }


    static
    auto event_number(EventValueType type, const std::vector<char>& buffer) -> double {
        switch (type) {
            case EventValueType::Byte: {
                uint8_t x;
                std::memcpy(&x, buffer.data(), sizeof(x));
                return x;
            }
            case EventValueType::Word: {
                uint16_t x;
                std::memcpy(&x, buffer.data(), sizeof(x));
                return x;
            }
            case EventValueType::Dword: {
                uint32_t x;
                std::memcpy(&x, buffer.data(), sizeof(x));
                return x;
            }
            case EventValueType::Text:
            case EventValueType::Csv:
                break;
        }

        const std::string e{ "[EventData, mcd_file] textual event read as a number" };
        mcd_log_critical(e);
        throw McdBug{ e };
    }

    // the reported size may include the terminating zero or be 0 if unknown
    static
    auto event_text(const std::vector<char>& buffer, uint32_t reported, uint32_t capacity) -> std::string {
        const auto length{ (reported == 0 || capacity < reported) ? capacity : reported };
        const auto first{ begin(buffer) };
        const auto last{ std::find(first, first + length, '\0') };
        return std::string(first, last);
    }

    auto mcd_file::events(int64_t id) const -> EventRecord {
        const std::string func{ "EventData" };
        const auto file{ file_handle(func) };
        const auto& x{ typed_entity(id, EntityType::Event, func) };
        const auto& info{ std::get<EventInfo>(x.detail) };

        EventRecord result;
        result.Label = x.summary.Label;
        result.ValueType = info.ValueType;

        const auto id32{ cast(id, uint32_t{}, ok{}) };
        const auto items{ cast(x.summary.ItemCount, uint32_t{}, guarded{}) };
        const auto numeric{ IsNumeric(info.ValueType) };
        const uint32_t capacity{ std::max(info.MaxDataLength, uint32_t{ 4 }) };
        std::vector<char> buffer(size_t{ capacity } + 1);

        std::vector<double> numbers;
        std::vector<std::string> texts;
        result.Timestamps.reserve(items);
        for (uint32_t i{ 0 }; i < items; ++i) {
            std::fill(begin(buffer), end(buffer), '\0');
            double timestamp{ 0 };
            uint32_t size{ 0 };
            check(*lib, lib->get_event_data(file, id32, i, &timestamp, buffer.data(), capacity, &size), func, entity_text(id, i));

            result.Timestamps.push_back(timestamp);
            if (numeric) {
                numbers.push_back(event_number(info.ValueType, buffer));
            }
            else {
                texts.push_back(event_text(buffer, size, capacity));
            }
        }

        if (numeric) {
            result.Values = std::move(numbers);
        }
        else {
            result.Values = std::move(texts);
        }
        return result;
    }


    auto mcd_file::segment(int64_t id, int64_t index) const -> SegmentRecord {
        const std::string func{ "SegmentData" };
        const auto file{ file_handle(func) };
        const auto& x{ typed_entity(id, EntityType::Segment, func) };
        const auto& info{ std::get<SegmentInfo>(x.detail) };

        if (index < 0 || x.summary.ItemCount <= index) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << entity_text(id) << " '" << x.summary.Label << "': segment index " << index << ", available " << x.summary.ItemCount;
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOutOfRange{ e };
        }

        const auto sources{ std::max(info.SourceCount, int64_t{ 1 }) };
        const auto capacity{ multiply(as_sizet(info.MaxSampleCount), as_sizet(sources), ok{}) };
        const auto bytes{ cast(multiply(capacity, sizeof(double), ok{}), uint32_t{}, ok{}) };
        std::vector<double> data(capacity);

        double timestamp{ 0 };
        uint32_t samples{ 0 };
        uint32_t unit{ 0 };
        check(*lib, lib->get_segment_data(file, cast(id, uint32_t{}, ok{}), cast(index, int32_t{}, ok{}), &timestamp, data.data(), bytes, &samples, &unit), func, entity_text(id, index));

        const auto used{ multiply(size_t{ samples }, as_sizet(sources), ok{}) };
        if (capacity < used) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << entity_text(id, index) << ": " << samples << " samples reported, at most " << info.MaxSampleCount << " expected";
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdData{ e };
        }
        data.resize(used);

        SegmentRecord result;
        result.Label = x.summary.Label;
        result.Data = std::move(data);
        result.SampleCount = samples;
        result.SourceCount = sources;
        result.Timestamp = timestamp;
        result.UnitId = unit;
        result.SampleRate = info.SampleRate;
        return result;
    }


    auto mcd_file::neural(int64_t id, int64_t start, int64_t count) const -> NeuralRecord {
        const std::string func{ "NeuralData" };
        const auto file{ file_handle(func) };
        const auto& x{ typed_entity(id, EntityType::Neural, func) };
        const auto range{ clamp_range(x.summary, start, count, func) };

        NeuralRecord result;
        result.Label = x.summary.Label;
        if (range.length == 0) {
            return result;
        }

        std::vector<double> timestamps(as_sizet(range.length));
        check(*lib, lib->get_neural_data(file, cast(id, uint32_t{}, ok{}), cast(range.first, uint32_t{}, ok{}), cast(range.length, uint32_t{}, ok{}), timestamps.data()), func, entity_text(id, range.first));
        result.Timestamps = std::move(timestamps);
        return result;
    }


    auto mcd_file::time_by_index(int64_t id, int64_t index) const -> double {
        const std::string func{ "TimeByIndex" };
        const auto file{ file_handle(func) };
        const auto& x{ entity(id) };

        if (index < 0 || x.summary.ItemCount <= index) {
            std::ostringstream oss;
            oss << "[" << func << ", mcd_file] " << entity_text(id) << ": index " << index << ", available " << x.summary.ItemCount;
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOutOfRange{ e };
        }

        double result{ 0 };
        check(*lib, lib->get_time_by_index(file, cast(id, uint32_t{}, ok{}), cast(index, uint32_t{}, ok{}), &result), func, entity_text(id, index));
        return result;
    }

    auto mcd_file::index_by_time(int64_t id, double seconds, TimeSearch direction) const -> int64_t {
        const std::string func{ "IndexByTime" };
        const auto file{ file_handle(func) };
        entity(id);

        uint32_t result{ 0 };
        check(*lib, lib->get_index_by_time(file, cast(id, uint32_t{}, ok{}), seconds, static_cast<int32_t>(direction), &result), func, entity_text(id));
        return result;
    }

} /* namespace impl */ } /* namespace mcd */
