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
#include <memory>
#include <string>

/*
Neuroshare API 1.3 as exported by nsMCDLibrary.
The structures below mirror the layouts the native library writes into.
Only the types and the calling convention are declared here: the functions
are resolved at run time by load_library.
*/

#if defined(_WIN32)
#define MCD_NS_CALL __cdecl
#else
#define MCD_NS_CALL
#endif

namespace mcd { namespace impl {

    using ns_result = int32_t;

    constexpr const ns_result ns_ok{ 0 };
    constexpr const ns_result ns_liberror{ -1 };   // library error
    constexpr const ns_result ns_typeerror{ -2 };  // entity type mismatch
    constexpr const ns_result ns_fileerror{ -3 };  // file access or read error
    constexpr const ns_result ns_badfile{ -4 };    // invalid file handle
    constexpr const ns_result ns_badentity{ -5 };  // invalid or inappropriate entity id
    constexpr const ns_result ns_badsource{ -6 };  // invalid source id
    constexpr const ns_result ns_badindex{ -7 };   // invalid entity index

    auto result_name(ns_result) -> std::string;


    constexpr const uint32_t ns_entity_unknown{ 0 };
    constexpr const uint32_t ns_entity_event{ 1 };
    constexpr const uint32_t ns_entity_analog{ 2 };
    constexpr const uint32_t ns_entity_segment{ 3 };
    constexpr const uint32_t ns_entity_neural{ 4 };

    constexpr const uint32_t ns_event_text{ 0 };
    constexpr const uint32_t ns_event_csv{ 1 };
    constexpr const uint32_t ns_event_byte{ 2 };
    constexpr const uint32_t ns_event_word{ 3 };
    constexpr const uint32_t ns_event_dword{ 4 };

    constexpr const int32_t ns_before_time{ -1 };
    constexpr const int32_t ns_closest_time{ 0 };
    constexpr const int32_t ns_after_time{ 1 };

    constexpr const uint32_t ns_max_file_descriptions{ 16 };


    struct ns_filedesc
    {
        char description[32];
        char extension[8];
        char mac_codes[8];
        char magic_code[16];
    };

    struct ns_library_info
    {
        uint32_t lib_version_major;
        uint32_t lib_version_minor;
        uint32_t api_version_major;
        uint32_t api_version_minor;
        char description[64];
        char creator[64];
        uint32_t time_year;
        uint32_t time_month;
        uint32_t time_day;
        uint32_t flags;
        uint32_t max_files;
        uint32_t file_desc_count;
        ns_filedesc file_desc[ns_max_file_descriptions];
    };

    struct ns_file_info
    {
        char file_type[32];
        uint32_t entity_count;
        double time_stamp_resolution;
        double time_span;
        char app_name[64];
        uint32_t time_year;
        uint32_t time_month;
        uint32_t time_day_of_week;
        uint32_t time_day;
        uint32_t time_hour;
        uint32_t time_min;
        uint32_t time_sec;
        uint32_t time_millisec;
        char file_comment[256];
    };

    struct ns_entity_info
    {
        char entity_label[32];
        uint32_t entity_type;
        uint32_t item_count;
    };

    struct ns_event_info
    {
        uint32_t event_type;
        uint32_t min_data_length;
        uint32_t max_data_length;
        char csv_desc[128];
    };

    struct ns_analog_info
    {
        double sample_rate;
        double min_val;
        double max_val;
        char units[16];
        double resolution;
        double location_x;
        double location_y;
        double location_z;
        double location_user;
        double high_freq_corner;
        uint32_t high_freq_order;
        char high_filter_type[16];
        double low_freq_corner;
        uint32_t low_freq_order;
        char low_filter_type[16];
        char probe_info[128];
    };

    struct ns_segment_info
    {
        uint32_t source_count;
        uint32_t min_sample_count;
        uint32_t max_sample_count;
        double sample_rate;
        char units[32];
    };

    struct ns_segsource_info
    {
        double min_val;
        double max_val;
        double resolution;
        double sub_sample_shift;
        double location_x;
        double location_y;
        double location_z;
        double location_user;
        double high_freq_corner;
        uint32_t high_freq_order;
        char high_filter_type[16];
        double low_freq_corner;
        uint32_t low_freq_order;
        char low_filter_type[16];
        char probe_info[128];
    };

    struct ns_neural_info
    {
        uint32_t source_entity_id;
        uint32_t source_unit_id;
        char probe_info[128];
    };


    // fixed size, possibly not zero terminated character field -> std::string
    template<size_t N>
    auto field2string(const char (&x)[N]) -> std::string {
        size_t length{ 0 };
        while (length < N && x[length] != 0) {
            ++length;
        }
        return std::string(x, x + length);
    }


    /*
    one virtual member per Neuroshare entry point.
    the arguments and the return values are those of the C functions:
    every member returns ns_ok or one of the negative error codes, results are
    delivered through the pointer arguments.
    */
    struct native_library
    {
        virtual ~native_library() = default;

        virtual auto get_library_info(ns_library_info*, uint32_t size) -> ns_result = 0;
        virtual auto open_file(const char* file_name, uint32_t* file) -> ns_result = 0;
        virtual auto get_file_info(uint32_t file, ns_file_info*, uint32_t size) -> ns_result = 0;
        virtual auto close_file(uint32_t file) -> ns_result = 0;

        virtual auto get_entity_info(uint32_t file, uint32_t entity, ns_entity_info*, uint32_t size) -> ns_result = 0;

        virtual auto get_event_info(uint32_t file, uint32_t entity, ns_event_info*, uint32_t size) -> ns_result = 0;
        virtual auto get_event_data(uint32_t file, uint32_t entity, uint32_t index, double* timestamp, void* data, uint32_t data_size, uint32_t* data_ret_size) -> ns_result = 0;

        virtual auto get_analog_info(uint32_t file, uint32_t entity, ns_analog_info*, uint32_t size) -> ns_result = 0;
        virtual auto get_analog_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, uint32_t* cont_count, double* data) -> ns_result = 0;

        virtual auto get_segment_info(uint32_t file, uint32_t entity, ns_segment_info*, uint32_t size) -> ns_result = 0;
        virtual auto get_segment_source_info(uint32_t file, uint32_t entity, uint32_t source, ns_segsource_info*, uint32_t size) -> ns_result = 0;
        // data: sample major, data_buffer_size in bytes
        virtual auto get_segment_data(uint32_t file, uint32_t entity, int32_t index, double* timestamp, double* data, uint32_t data_buffer_size, uint32_t* sample_count, uint32_t* unit_id) -> ns_result = 0;

        virtual auto get_neural_info(uint32_t file, uint32_t entity, ns_neural_info*, uint32_t size) -> ns_result = 0;
        virtual auto get_neural_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, double* data) -> ns_result = 0;

        virtual auto get_time_by_index(uint32_t file, uint32_t entity, uint32_t index, double* time) -> ns_result = 0;
        virtual auto get_index_by_time(uint32_t file, uint32_t entity, double time, int32_t flag, uint32_t* index) -> ns_result = 0;

        virtual auto get_last_error_msg(char* msg, uint32_t size) -> ns_result = 0;

        // path or file name the library was loaded from
        virtual auto location() const -> std::string = 0;
    };


    // loads the shared library and resolves all entry points.
    // throws McdOpenError with the message of the dynamic loader.
    auto load_library(const std::filesystem::path&) -> std::shared_ptr<native_library>;


    // the text of ns_GetLastErrorMsg, empty if the library has nothing to say
    auto last_error(native_library&) -> std::string;

    /*
    translates a non-zero result into an exception.
    ns_badentity -> McdNotFound
    ns_badindex, ns_badsource -> McdOutOfRange
    ns_typeerror -> McdTypeMismatch
    ns_badfile -> McdNotOpen
    ns_liberror, ns_fileerror and unknown codes -> McdData
    func names the public operation, what describes the failed request.
    */
    auto check(native_library&, ns_result, const std::string& func, const std::string& what) -> void;

} /* namespace impl */ } /* namespace mcd */
