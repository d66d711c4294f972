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

#include "test/util.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <numeric>


namespace mcd { namespace impl { namespace test {

    template<size_t N>
    static
    auto copy_field(char (&dst)[N], const std::string& x) -> void {
        const size_t n{ std::min(x.size(), N - 1) };
        std::memcpy(dst, x.data(), n);
        dst[n] = 0;
    }


    auto fake_entity::item_count() const -> uint32_t {
        switch (type) {
            case ns_entity_event: return static_cast<uint32_t>(event_times.size());
            case ns_entity_analog: return static_cast<uint32_t>(samples.size());
            case ns_entity_segment: return static_cast<uint32_t>(segments.size());
            case ns_entity_neural: return static_cast<uint32_t>(spikes.size());
        }
        return 0;
    }


    fake_library::fake_library(const fake_recording& x)
    : recording{ x }
    , next_handle{ 1 }
    , reject_open{ false } {
    }

    auto fake_library::total_calls() const -> int {
        return std::accumulate(begin(calls), end(calls), 0, [](int sum, const auto& x) -> int { return sum + x.second; });
    }

    auto fake_library::open_count() const -> size_t {
        return open_handles.size();
    }

    auto fake_library::fail(ns_result x, const std::string& msg) -> ns_result {
        last_message = msg;
        return x;
    }

    // type ns_entity_unknown: any type
    auto fake_library::lookup(const char* func, uint32_t file, uint32_t entity, uint32_t type, const fake_entity*& x) -> ns_result {
        ++calls[func];

        if (open_handles.count(file) == 0) {
            return fail(ns_badfile, std::string{ func } + ": invalid file handle");
        }

        if (recording.entities.size() <= entity) {
            return fail(ns_badentity, std::string{ func } + ": invalid entity id");
        }

        x = &recording.entities[entity];
        if (type != ns_entity_unknown && x->type != type) {
            return fail(ns_typeerror, std::string{ func } + ": " + x->label + " has a different type");
        }

        return ns_ok;
    }


    auto fake_library::get_library_info(ns_library_info* x, uint32_t) -> ns_result {
        ++calls["ns_GetLibraryInfo"];

        *x = ns_library_info{};
        x->lib_version_major = 1;
        x->lib_version_minor = 7;
        x->api_version_major = 1;
        x->api_version_minor = 3;
        copy_field(x->description, "fake neuroshare library");
        copy_field(x->creator, "McdToolKit tests");
        x->time_year = 2021;
        x->time_month = 3;
        x->time_day = 4;
        x->flags = 0;
        x->max_files = 64;
        x->file_desc_count = 1;
        copy_field(x->file_desc[0].description, "MC_Rack data file");
        copy_field(x->file_desc[0].extension, "mcd");
        copy_field(x->file_desc[0].magic_code, "MCSSTRM");
        return ns_ok;
    }

    auto fake_library::open_file(const char* file_name, uint32_t* file) -> ns_result {
        ++calls["ns_OpenFile"];

        if (reject_open) {
            return fail(ns_fileerror, std::string{ "not an mcd file: " } + file_name);
        }

        const auto handle{ next_handle++ };
        open_handles.insert(handle);
        *file = handle;
        return ns_ok;
    }

    auto fake_library::get_file_info(uint32_t file, ns_file_info* x, uint32_t) -> ns_result {
        ++calls["ns_GetFileInfo"];

        if (open_handles.count(file) == 0) {
            return fail(ns_badfile, "ns_GetFileInfo: invalid file handle");
        }

        *x = ns_file_info{};
        copy_field(x->file_type, recording.file_type);
        x->entity_count = static_cast<uint32_t>(recording.entities.size());
        x->time_stamp_resolution = recording.time_stamp_resolution;
        x->time_span = recording.time_span;
        copy_field(x->app_name, recording.app_name);
        x->time_year = 2020;
        x->time_month = 11;
        x->time_day_of_week = 2;
        x->time_day = 17;
        x->time_hour = 14;
        x->time_min = 32;
        x->time_sec = 5;
        x->time_millisec = 250;
        copy_field(x->file_comment, recording.comment);
        return ns_ok;
    }

    auto fake_library::close_file(uint32_t file) -> ns_result {
        ++calls["ns_CloseFile"];

        if (open_handles.erase(file) == 0) {
            return fail(ns_badfile, "ns_CloseFile: invalid file handle");
        }
        return ns_ok;
    }

    auto fake_library::get_entity_info(uint32_t file, uint32_t entity, ns_entity_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetEntityInfo", file, entity, ns_entity_unknown, e) };
        if (r != ns_ok) {
            return r;
        }

        *x = ns_entity_info{};
        copy_field(x->entity_label, e->label);
        x->entity_type = e->type;
        x->item_count = e->item_count();
        return ns_ok;
    }

    auto fake_library::get_event_info(uint32_t file, uint32_t entity, ns_event_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetEventInfo", file, entity, ns_entity_event, e) };
        if (r != ns_ok) {
            return r;
        }

        *x = ns_event_info{};
        x->event_type = e->event_type;
        switch (e->event_type) {
            case ns_event_byte: x->min_data_length = x->max_data_length = 1; break;
            case ns_event_word: x->min_data_length = x->max_data_length = 2; break;
            case ns_event_dword: x->min_data_length = x->max_data_length = 4; break;
            default: {
                size_t longest{ 0 };
                for (const auto& text : e->event_texts) {
                    longest = std::max(longest, text.size());
                }
                x->min_data_length = 1;
                x->max_data_length = static_cast<uint32_t>(longest + 1);
                if (e->event_type == ns_event_csv) {
                    copy_field(x->csv_desc, "code,description");
                }
            }
        }
        return ns_ok;
    }

    template<typename T>
    static
    auto write_number(uint32_t x, void* data, uint32_t data_size, uint32_t* data_ret_size) -> bool {
        if (data_size < sizeof(T)) {
            return false;
        }

        const T y{ static_cast<T>(x) };
        std::memcpy(data, &y, sizeof(T));
        *data_ret_size = sizeof(T);
        return true;
    }

    auto fake_library::get_event_data(uint32_t file, uint32_t entity, uint32_t index, double* timestamp, void* data, uint32_t data_size, uint32_t* data_ret_size) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetEventData", file, entity, ns_entity_event, e) };
        if (r != ns_ok) {
            return r;
        }
        if (e->broken) {
            return fail(ns_fileerror, "ns_GetEventData: read error");
        }
        if (e->event_times.size() <= index) {
            return fail(ns_badindex, "ns_GetEventData: invalid index");
        }

        *timestamp = e->event_times[index];
        bool written{ false };
        switch (e->event_type) {
            case ns_event_byte: written = write_number<uint8_t>(e->event_numbers[index], data, data_size, data_ret_size); break;
            case ns_event_word: written = write_number<uint16_t>(e->event_numbers[index], data, data_size, data_ret_size); break;
            case ns_event_dword: written = write_number<uint32_t>(e->event_numbers[index], data, data_size, data_ret_size); break;
            default: {
                const auto& text{ e->event_texts[index] };
                if (data_size < text.size() + 1) {
                    break;
                }
                std::memcpy(data, text.data(), text.size());
                static_cast<char*>(data)[text.size()] = 0;
                *data_ret_size = static_cast<uint32_t>(text.size() + 1);
                written = true;
            }
        }

        if (!written) {
            return fail(ns_liberror, "ns_GetEventData: buffer too small");
        }
        return ns_ok;
    }

    auto fake_library::get_analog_info(uint32_t file, uint32_t entity, ns_analog_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetAnalogInfo", file, entity, ns_entity_analog, e) };
        if (r != ns_ok) {
            return r;
        }

        *x = ns_analog_info{};
        x->sample_rate = e->sample_rate;
        if (!e->samples.empty()) {
            x->min_val = *std::min_element(begin(e->samples), end(e->samples));
            x->max_val = *std::max_element(begin(e->samples), end(e->samples));
        }
        copy_field(x->units, e->units);
        x->resolution = 0.25;
        x->location_x = 1;
        x->location_y = 2;
        x->high_freq_corner = 1;
        x->high_freq_order = 2;
        copy_field(x->high_filter_type, "Butterworth");
        x->low_freq_corner = 3000;
        x->low_freq_order = 2;
        copy_field(x->low_filter_type, "Butterworth");
        copy_field(x->probe_info, "MEA 60");
        return ns_ok;
    }

    auto fake_library::get_analog_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, uint32_t* cont_count, double* data) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetAnalogData", file, entity, ns_entity_analog, e) };
        if (r != ns_ok) {
            return r;
        }
        if (e->broken) {
            return fail(ns_fileerror, "ns_GetAnalogData: read error");
        }
        if (e->samples.size() < size_t{ start_index } + index_count) {
            return fail(ns_badindex, "ns_GetAnalogData: invalid range");
        }

        const auto first{ begin(e->samples) + start_index };
        std::copy(first, first + index_count, data);
        *cont_count = index_count;
        return ns_ok;
    }

    auto fake_library::get_segment_info(uint32_t file, uint32_t entity, ns_segment_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetSegmentInfo", file, entity, ns_entity_segment, e) };
        if (r != ns_ok) {
            return r;
        }

        *x = ns_segment_info{};
        x->source_count = e->source_count;
        x->min_sample_count = e->max_sample_count;
        x->max_sample_count = e->max_sample_count;
        x->sample_rate = e->sample_rate;
        copy_field(x->units, e->units);
        return ns_ok;
    }

    auto fake_library::get_segment_source_info(uint32_t file, uint32_t entity, uint32_t source, ns_segsource_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetSegmentSourceInfo", file, entity, ns_entity_segment, e) };
        if (r != ns_ok) {
            return r;
        }
        if (e->source_count <= source) {
            return fail(ns_badsource, "ns_GetSegmentSourceInfo: invalid source");
        }

        *x = ns_segsource_info{};
        x->min_val = -100;
        x->max_val = 100;
        x->resolution = 0.5;
        x->location_x = source;
        copy_field(x->probe_info, "electrode " + std::to_string(source));
        return ns_ok;
    }

    auto fake_library::get_segment_data(uint32_t file, uint32_t entity, int32_t index, double* timestamp, double* data, uint32_t data_buffer_size, uint32_t* sample_count, uint32_t* unit_id) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetSegmentData", file, entity, ns_entity_segment, e) };
        if (r != ns_ok) {
            return r;
        }
        if (e->broken) {
            return fail(ns_fileerror, "ns_GetSegmentData: read error");
        }
        if (index < 0 || e->segments.size() <= static_cast<size_t>(index)) {
            return fail(ns_badindex, "ns_GetSegmentData: invalid index");
        }

        const auto& s{ e->segments[static_cast<size_t>(index)] };
        if (data_buffer_size < s.data.size() * sizeof(double)) {
            return fail(ns_liberror, "ns_GetSegmentData: buffer too small");
        }

        std::copy(begin(s.data), end(s.data), data);
        *timestamp = s.timestamp;
        *sample_count = static_cast<uint32_t>(s.data.size() / e->source_count);
        *unit_id = s.unit_id;
        return ns_ok;
    }

    auto fake_library::get_neural_info(uint32_t file, uint32_t entity, ns_neural_info* x, uint32_t) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetNeuralInfo", file, entity, ns_entity_neural, e) };
        if (r != ns_ok) {
            return r;
        }

        *x = ns_neural_info{};
        x->source_entity_id = 4;
        x->source_unit_id = 1;
        copy_field(x->probe_info, "sorted");
        return ns_ok;
    }

    auto fake_library::get_neural_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, double* data) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetNeuralData", file, entity, ns_entity_neural, e) };
        if (r != ns_ok) {
            return r;
        }
        if (e->broken) {
            return fail(ns_fileerror, "ns_GetNeuralData: read error");
        }
        if (e->spikes.size() < size_t{ start_index } + index_count) {
            return fail(ns_badindex, "ns_GetNeuralData: invalid range");
        }

        const auto first{ begin(e->spikes) + start_index };
        std::copy(first, first + index_count, data);
        return ns_ok;
    }

    static
    auto item_times(const fake_entity& e) -> std::vector<double> {
        switch (e.type) {
            case ns_entity_event: return e.event_times;
            case ns_entity_neural: return e.spikes;
            case ns_entity_segment: {
                std::vector<double> result;
                for (const auto& s : e.segments) {
                    result.push_back(s.timestamp);
                }
                return result;
            }
            case ns_entity_analog: {
                std::vector<double> result(e.samples.size());
                for (size_t i{ 0 }; i < result.size(); ++i) {
                    result[i] = e.start_time + static_cast<double>(i) / e.sample_rate;
                }
                return result;
            }
        }
        return {};
    }

    auto fake_library::get_time_by_index(uint32_t file, uint32_t entity, uint32_t index, double* time) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetTimeByIndex", file, entity, ns_entity_unknown, e) };
        if (r != ns_ok) {
            return r;
        }

        const auto times{ item_times(*e) };
        if (times.size() <= index) {
            return fail(ns_badindex, "ns_GetTimeByIndex: invalid index");
        }

        *time = times[index];
        return ns_ok;
    }

    auto fake_library::get_index_by_time(uint32_t file, uint32_t entity, double time, int32_t flag, uint32_t* index) -> ns_result {
        const fake_entity* e{ nullptr };
        const auto r{ lookup("ns_GetIndexByTime", file, entity, ns_entity_unknown, e) };
        if (r != ns_ok) {
            return r;
        }

        const auto times{ item_times(*e) };
        if (times.empty()) {
            return fail(ns_badindex, "ns_GetIndexByTime: no items");
        }

        if (flag == ns_before_time) {
            const auto i{ std::upper_bound(begin(times), end(times), time) };
            if (i == begin(times)) {
                return fail(ns_badindex, "ns_GetIndexByTime: no item before");
            }
            *index = static_cast<uint32_t>(std::distance(begin(times), i) - 1);
            return ns_ok;
        }

        if (flag == ns_after_time) {
            const auto i{ std::lower_bound(begin(times), end(times), time) };
            if (i == end(times)) {
                return fail(ns_badindex, "ns_GetIndexByTime: no item after");
            }
            *index = static_cast<uint32_t>(std::distance(begin(times), i));
            return ns_ok;
        }

        size_t closest{ 0 };
        for (size_t i{ 1 }; i < times.size(); ++i) {
            if (std::fabs(times[i] - time) < std::fabs(times[closest] - time)) {
                closest = i;
            }
        }
        *index = static_cast<uint32_t>(closest);
        return ns_ok;
    }

    auto fake_library::get_last_error_msg(char* msg, uint32_t size) -> ns_result {
        if (size == 0) {
            return ns_liberror;
        }

        const size_t n{ std::min(last_message.size(), size_t{ size } - 1) };
        std::memcpy(msg, last_message.data(), n);
        msg[n] = 0;
        return ns_ok;
    }

    auto fake_library::location() const -> std::string {
        return "fake";
    }


    static
    auto analog(const std::string& label, size_t samples, double rate, const std::string& units, double start) -> fake_entity {
        fake_entity x;
        x.label = label;
        x.type = ns_entity_analog;
        x.sample_rate = rate;
        x.units = units;
        x.start_time = start;
        x.samples.resize(samples);
        return x;
    }

    auto analog_and_events() -> fake_recording {
        fake_recording result;
        result.comment = "two entities";

        auto ch1{ analog("Ch1", 1000, 1000, "uV", 0) };
        for (size_t i{ 0 }; i < ch1.samples.size(); ++i) {
            ch1.samples[i] = static_cast<double>(i) * 0.5;
        }
        result.entities.push_back(ch1);

        fake_entity trigger;
        trigger.label = "Trigger";
        trigger.type = ns_entity_event;
        trigger.event_type = ns_event_dword;
        trigger.event_times = { 0.1, 0.2, 0.3, 0.4, 0.5 };
        trigger.event_numbers = { 1, 2, 3, 4, 5 };
        result.entities.push_back(trigger);
        return result;
    }

    auto full_recording() -> fake_recording {
        fake_recording result;
        result.comment = "synthetic recording";
        result.time_span = 2.5;

        auto ch1{ analog("Ch1", 100, 1000, "uV", 0.5) };
        for (size_t i{ 0 }; i < ch1.samples.size(); ++i) {
            ch1.samples[i] = (static_cast<double>(i) - 50) * 0.25;
        }
        result.entities.push_back(ch1);

        auto ch2{ analog("Ch/2", 50, 500, "mV", 0) };
        for (size_t i{ 0 }; i < ch2.samples.size(); ++i) {
            ch2.samples[i] = static_cast<double>(i) * 2;
        }
        result.entities.push_back(ch2);

        fake_entity trigger;
        trigger.label = "Trigger";
        trigger.type = ns_entity_event;
        trigger.event_type = ns_event_dword;
        trigger.event_times = { 0.05, 0.15, 0.25, 0.35, 0.45 };
        trigger.event_numbers = { 10, 20, 30, 40, 50 };
        result.entities.push_back(trigger);

        fake_entity comment;
        comment.label = "Comment";
        comment.type = ns_entity_event;
        comment.event_type = ns_event_text;
        comment.event_times = { 0.1, 0.6, 0.9 };
        comment.event_texts = { "start", "stimulus on", "stop" };
        result.entities.push_back(comment);

        fake_entity spikes;
        spikes.label = "Spikes 1";
        spikes.type = ns_entity_segment;
        spikes.sample_rate = 25000;
        spikes.units = "uV";
        spikes.source_count = 2;
        spikes.max_sample_count = 4;
        for (uint32_t k{ 0 }; k < 5; ++k) {
            fake_segment s;
            s.timestamp = 0.1 * (k + 1);
            s.unit_id = k % 3;
            for (uint32_t sample{ 0 }; sample < 4; ++sample) {
                for (uint32_t source{ 0 }; source < 2; ++source) {
                    s.data.push_back(k * 100.0 + sample * 10.0 + source);
                }
            }
            spikes.segments.push_back(s);
        }
        result.entities.push_back(spikes);

        fake_entity units;
        units.label = "Units 1";
        units.type = ns_entity_neural;
        units.spikes = { 0.01, 0.02, 0.05, 0.08, 0.13, 0.21, 0.34 };
        result.entities.push_back(units);

        auto broken{ analog("Broken", 10, 1000, "uV", 0) };
        broken.broken = true;
        result.entities.push_back(broken);

        fake_entity mystery;
        mystery.label = "Mystery";
        mystery.type = ns_entity_unknown;
        result.entities.push_back(mystery);
        return result;
    }


    temporary_file::temporary_file(const std::filesystem::path& x)
    : name{ x } {
        std::ofstream ofs{ name, std::ios::binary };
        ofs << "MCSSTRM";
    }

    temporary_file::~temporary_file() {
        std::error_code ec;
        std::filesystem::remove(name, ec);
    }

    auto temporary_file::path() const -> std::filesystem::path {
        return name;
    }

} /* namespace test */ } /* namespace impl */ } /* namespace mcd */
