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
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

#include "native/neuroshare.h"


namespace mcd { namespace impl { namespace test {

    struct fake_segment
    {
        double timestamp;
        uint32_t unit_id;
        std::vector<double> data; // row major: samples x sources
    };

    // one entity of a synthetic recording. only the members of the given type are used.
    struct fake_entity
    {
        std::string label;
        uint32_t type{ ns_entity_unknown };

        // ns_entity_analog
        double sample_rate{ 0 };
        std::string units;
        double start_time{ 0 };
        std::vector<double> samples;

        // ns_entity_event
        uint32_t event_type{ ns_event_dword };
        std::vector<double> event_times;
        std::vector<uint32_t> event_numbers;
        std::vector<std::string> event_texts;

        // ns_entity_segment
        uint32_t source_count{ 1 };
        uint32_t max_sample_count{ 0 };
        std::vector<fake_segment> segments;

        // ns_entity_neural
        std::vector<double> spikes;

        // every data request fails with ns_fileerror
        bool broken{ false };

        auto item_count() const -> uint32_t;
    };

    struct fake_recording
    {
        std::string file_type{ "MCD" };
        std::string app_name{ "MC_Rack" };
        std::string comment;
        double time_stamp_resolution{ 4e-5 };
        double time_span{ 1 };
        std::vector<fake_entity> entities;
    };


    // in-memory neuroshare library serving one synthetic recording
    class fake_library : public native_library
    {
        fake_recording recording;
        std::set<uint32_t> open_handles;
        uint32_t next_handle;
        std::string last_message;

    public:
        // number of calls per entry point
        std::map<std::string, int> calls;
        // ns_OpenFile fails with ns_fileerror
        bool reject_open;

        explicit fake_library(const fake_recording&);
        virtual ~fake_library() = default;

        auto total_calls() const -> int;
        auto open_count() const -> size_t;

        virtual auto get_library_info(ns_library_info*, uint32_t size) -> ns_result override;
        virtual auto open_file(const char* file_name, uint32_t* file) -> ns_result override;
        virtual auto get_file_info(uint32_t file, ns_file_info*, uint32_t size) -> ns_result override;
        virtual auto close_file(uint32_t file) -> ns_result override;
        virtual auto get_entity_info(uint32_t file, uint32_t entity, ns_entity_info*, uint32_t size) -> ns_result override;
        virtual auto get_event_info(uint32_t file, uint32_t entity, ns_event_info*, uint32_t size) -> ns_result override;
        virtual auto get_event_data(uint32_t file, uint32_t entity, uint32_t index, double* timestamp, void* data, uint32_t data_size, uint32_t* data_ret_size) -> ns_result override;
        virtual auto get_analog_info(uint32_t file, uint32_t entity, ns_analog_info*, uint32_t size) -> ns_result override;
        virtual auto get_analog_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, uint32_t* cont_count, double* data) -> ns_result override;
        virtual auto get_segment_info(uint32_t file, uint32_t entity, ns_segment_info*, uint32_t size) -> ns_result override;
        virtual auto get_segment_source_info(uint32_t file, uint32_t entity, uint32_t source, ns_segsource_info*, uint32_t size) -> ns_result override;
        virtual auto get_segment_data(uint32_t file, uint32_t entity, int32_t index, double* timestamp, double* data, uint32_t data_buffer_size, uint32_t* sample_count, uint32_t* unit_id) -> ns_result override;
        virtual auto get_neural_info(uint32_t file, uint32_t entity, ns_neural_info*, uint32_t size) -> ns_result override;
        virtual auto get_neural_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, double* data) -> ns_result override;
        virtual auto get_time_by_index(uint32_t file, uint32_t entity, uint32_t index, double* time) -> ns_result override;
        virtual auto get_index_by_time(uint32_t file, uint32_t entity, double time, int32_t flag, uint32_t* index) -> ns_result override;
        virtual auto get_last_error_msg(char* msg, uint32_t size) -> ns_result override;
        virtual auto location() const -> std::string override;

    private:
        auto fail(ns_result, const std::string&) -> ns_result;
        auto lookup(const char* func, uint32_t file, uint32_t entity, uint32_t type, const fake_entity*& x) -> ns_result;
    };


    /*
    entity 0: analog "Ch1", 1000 samples, 1000 Hz, uV, starts at 0s
    entity 1: dword events "Trigger", 5 events at 0.1, 0.2, 0.3, 0.4 and 0.5s
    */
    auto analog_and_events() -> fake_recording;

    /*
    entity 0: analog "Ch1", 100 samples, 1000 Hz, uV, starts at 0.5s
    entity 1: analog "Ch/2", 50 samples, 500 Hz, mV
    entity 2: dword events "Trigger", 5 events
    entity 3: text events "Comment", 3 events
    entity 4: segment "Spikes 1", 2 sources, 5 segments of 4 samples
    entity 5: neural "Units 1", 7 spikes
    entity 6: analog "Broken", 10 samples, every read fails
    entity 7: unknown "Mystery"
    */
    auto full_recording() -> fake_recording;


    // creates an empty file, removes it on destruction
    class temporary_file
    {
        std::filesystem::path name;

    public:
        explicit temporary_file(const std::filesystem::path&);
        temporary_file(const temporary_file&) = delete;
        auto operator=(const temporary_file&) -> temporary_file& = delete;
        ~temporary_file();

        auto path() const -> std::filesystem::path;
    };

} /* namespace test */ } /* namespace impl */ } /* namespace mcd */
