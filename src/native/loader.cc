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

#include "native/neuroshare.h"

#include <sstream>
#include <type_traits>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <dlfcn.h>
#endif

#include "exception.h"
#include "logger.h"


namespace mcd { namespace impl {

    using namespace mcd::api::v1;

    extern "C" {
        typedef ns_result (MCD_NS_CALL *fn_get_library_info)(ns_library_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_open_file)(const char*, uint32_t*);
        typedef ns_result (MCD_NS_CALL *fn_get_file_info)(uint32_t, ns_file_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_close_file)(uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_entity_info)(uint32_t, uint32_t, ns_entity_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_event_info)(uint32_t, uint32_t, ns_event_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_event_data)(uint32_t, uint32_t, uint32_t, double*, void*, uint32_t, uint32_t*);
        typedef ns_result (MCD_NS_CALL *fn_get_analog_info)(uint32_t, uint32_t, ns_analog_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_analog_data)(uint32_t, uint32_t, uint32_t, uint32_t, uint32_t*, double*);
        typedef ns_result (MCD_NS_CALL *fn_get_segment_info)(uint32_t, uint32_t, ns_segment_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_segment_source_info)(uint32_t, uint32_t, uint32_t, ns_segsource_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_segment_data)(uint32_t, uint32_t, int32_t, double*, double*, uint32_t, uint32_t*, uint32_t*);
        typedef ns_result (MCD_NS_CALL *fn_get_neural_info)(uint32_t, uint32_t, ns_neural_info*, uint32_t);
        typedef ns_result (MCD_NS_CALL *fn_get_neural_data)(uint32_t, uint32_t, uint32_t, uint32_t, double*);
        typedef ns_result (MCD_NS_CALL *fn_get_time_by_index)(uint32_t, uint32_t, uint32_t, double*);
        typedef ns_result (MCD_NS_CALL *fn_get_index_by_time)(uint32_t, uint32_t, double, int32_t, uint32_t*);
        typedef ns_result (MCD_NS_CALL *fn_get_last_error_msg)(char*, uint32_t);
    }


#ifdef _WIN32
    using module_handle = HMODULE;

    static
    auto loader_error() -> std::string {
        const DWORD code{ GetLastError() };
        LPSTR buffer{ nullptr };
        const DWORD size{ FormatMessageA(FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS
                                        , nullptr, code, 0, reinterpret_cast<LPSTR>(&buffer), 0, nullptr) };
        if (size == 0 || buffer == nullptr) {
            std::ostringstream oss;
            oss << "error " << code;
            return oss.str();
        }

        std::string result(buffer, buffer + size);
        LocalFree(buffer);
        while (!result.empty() && (result.back() == '\n' || result.back() == '\r')) {
            result.pop_back();
        }
        return result;
    }

    static
    auto open_module(const std::filesystem::path& x) -> module_handle {
        return LoadLibraryW(x.c_str());
    }

    static
    auto find_symbol(module_handle x, const char* name) -> void* {
        return reinterpret_cast<void*>(GetProcAddress(x, name));
    }

    struct close_module
    {
        auto operator()(HMODULE x) const -> void {
            FreeLibrary(x);
        }
    };
#else
    using module_handle = void*;

    static
    auto loader_error() -> std::string {
        const char* msg{ dlerror() };
        return msg ? std::string{ msg } : std::string{ "unknown dynamic loader error" };
    }

    static
    auto open_module(const std::filesystem::path& x) -> module_handle {
        return dlopen(x.string().c_str(), RTLD_NOW | RTLD_LOCAL);
    }

    static
    auto find_symbol(module_handle x, const char* name) -> void* {
        return dlsym(x, name);
    }

    struct close_module
    {
        auto operator()(void* x) const -> void {
            dlclose(x);
        }
    };
#endif

    using module_ptr = std::unique_ptr<std::remove_pointer_t<module_handle>, close_module>;


    template<typename F>
    static
    auto resolve(const module_ptr& handle, const char* name, const std::filesystem::path& location) -> F {
        void* symbol{ find_symbol(handle.get(), name) };
        if (!symbol) {
            std::ostringstream oss;
            oss << "[load_library, loader] " << location.string() << ": missing symbol " << name << ": " << loader_error();
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOpenError{ e };
        }

        return reinterpret_cast<F>(symbol);
    }


    class shared_library : public native_library
    {
        module_ptr handle;
        std::string path;

        fn_get_library_info ns_get_library_info;
        fn_open_file ns_open_file;
        fn_get_file_info ns_get_file_info;
        fn_close_file ns_close_file;
        fn_get_entity_info ns_get_entity_info;
        fn_get_event_info ns_get_event_info;
        fn_get_event_data ns_get_event_data;
        fn_get_analog_info ns_get_analog_info;
        fn_get_analog_data ns_get_analog_data;
        fn_get_segment_info ns_get_segment_info;
        fn_get_segment_source_info ns_get_segment_source_info;
        fn_get_segment_data ns_get_segment_data;
        fn_get_neural_info ns_get_neural_info;
        fn_get_neural_data ns_get_neural_data;
        fn_get_time_by_index ns_get_time_by_index;
        fn_get_index_by_time ns_get_index_by_time;
        fn_get_last_error_msg ns_get_last_error_msg;

    public:

        shared_library(module_ptr m, const std::filesystem::path& location)
        : handle{ std::move(m) }
        , path{ location.string() }
        , ns_get_library_info{ resolve<fn_get_library_info>(handle, "ns_GetLibraryInfo", location) }
        , ns_open_file{ resolve<fn_open_file>(handle, "ns_OpenFile", location) }
        , ns_get_file_info{ resolve<fn_get_file_info>(handle, "ns_GetFileInfo", location) }
        , ns_close_file{ resolve<fn_close_file>(handle, "ns_CloseFile", location) }
        , ns_get_entity_info{ resolve<fn_get_entity_info>(handle, "ns_GetEntityInfo", location) }
        , ns_get_event_info{ resolve<fn_get_event_info>(handle, "ns_GetEventInfo", location) }
        , ns_get_event_data{ resolve<fn_get_event_data>(handle, "ns_GetEventData", location) }
        , ns_get_analog_info{ resolve<fn_get_analog_info>(handle, "ns_GetAnalogInfo", location) }
        , ns_get_analog_data{ resolve<fn_get_analog_data>(handle, "ns_GetAnalogData", location) }
        , ns_get_segment_info{ resolve<fn_get_segment_info>(handle, "ns_GetSegmentInfo", location) }
        , ns_get_segment_source_info{ resolve<fn_get_segment_source_info>(handle, "ns_GetSegmentSourceInfo", location) }
        , ns_get_segment_data{ resolve<fn_get_segment_data>(handle, "ns_GetSegmentData", location) }
        , ns_get_neural_info{ resolve<fn_get_neural_info>(handle, "ns_GetNeuralInfo", location) }
        , ns_get_neural_data{ resolve<fn_get_neural_data>(handle, "ns_GetNeuralData", location) }
        , ns_get_time_by_index{ resolve<fn_get_time_by_index>(handle, "ns_GetTimeByIndex", location) }
        , ns_get_index_by_time{ resolve<fn_get_index_by_time>(handle, "ns_GetIndexByTime", location) }
        , ns_get_last_error_msg{ resolve<fn_get_last_error_msg>(handle, "ns_GetLastErrorMsg", location) } {
        }

        shared_library(const shared_library&) = delete;
        auto operator=(const shared_library&) -> shared_library& = delete;
        virtual ~shared_library() = default;

        virtual auto get_library_info(ns_library_info* x, uint32_t size) -> ns_result override {
            return ns_get_library_info(x, size);
        }

        virtual auto open_file(const char* file_name, uint32_t* file) -> ns_result override {
            return ns_open_file(file_name, file);
        }

        virtual auto get_file_info(uint32_t file, ns_file_info* x, uint32_t size) -> ns_result override {
            return ns_get_file_info(file, x, size);
        }

        virtual auto close_file(uint32_t file) -> ns_result override {
            return ns_close_file(file);
        }

        virtual auto get_entity_info(uint32_t file, uint32_t entity, ns_entity_info* x, uint32_t size) -> ns_result override {
            return ns_get_entity_info(file, entity, x, size);
        }

        virtual auto get_event_info(uint32_t file, uint32_t entity, ns_event_info* x, uint32_t size) -> ns_result override {
            return ns_get_event_info(file, entity, x, size);
        }

        virtual auto get_event_data(uint32_t file, uint32_t entity, uint32_t index, double* timestamp, void* data, uint32_t data_size, uint32_t* data_ret_size) -> ns_result override {
            return ns_get_event_data(file, entity, index, timestamp, data, data_size, data_ret_size);
        }

        virtual auto get_analog_info(uint32_t file, uint32_t entity, ns_analog_info* x, uint32_t size) -> ns_result override {
            return ns_get_analog_info(file, entity, x, size);
        }

        virtual auto get_analog_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, uint32_t* cont_count, double* data) -> ns_result override {
            return ns_get_analog_data(file, entity, start_index, index_count, cont_count, data);
        }

        virtual auto get_segment_info(uint32_t file, uint32_t entity, ns_segment_info* x, uint32_t size) -> ns_result override {
            return ns_get_segment_info(file, entity, x, size);
        }

        virtual auto get_segment_source_info(uint32_t file, uint32_t entity, uint32_t source, ns_segsource_info* x, uint32_t size) -> ns_result override {
            return ns_get_segment_source_info(file, entity, source, x, size);
        }

        virtual auto get_segment_data(uint32_t file, uint32_t entity, int32_t index, double* timestamp, double* data, uint32_t data_buffer_size, uint32_t* sample_count, uint32_t* unit_id) -> ns_result override {
            return ns_get_segment_data(file, entity, index, timestamp, data, data_buffer_size, sample_count, unit_id);
        }

        virtual auto get_neural_info(uint32_t file, uint32_t entity, ns_neural_info* x, uint32_t size) -> ns_result override {
            return ns_get_neural_info(file, entity, x, size);
        }

        virtual auto get_neural_data(uint32_t file, uint32_t entity, uint32_t start_index, uint32_t index_count, double* data) -> ns_result override {
            return ns_get_neural_data(file, entity, start_index, index_count, data);
        }

        virtual auto get_time_by_index(uint32_t file, uint32_t entity, uint32_t index, double* time) -> ns_result override {
            return ns_get_time_by_index(file, entity, index, time);
        }

        virtual auto get_index_by_time(uint32_t file, uint32_t entity, double time, int32_t flag, uint32_t* index) -> ns_result override {
            return ns_get_index_by_time(file, entity, time, flag, index);
        }

        virtual auto get_last_error_msg(char* msg, uint32_t size) -> ns_result override {
            return ns_get_last_error_msg(msg, size);
        }

        virtual auto location() const -> std::string override {
            return path;
        }
    };


    auto load_library(const std::filesystem::path& x) -> std::shared_ptr<native_library> {
        module_ptr handle{ open_module(x) };
        if (!handle) {
            std::ostringstream oss;
            oss << "[load_library, loader] " << x.string() << ": " << loader_error();
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdOpenError{ e };
        }

        auto result{ std::make_shared<shared_library>(std::move(handle), x) };
        mcd_log_info("[load_library, loader] loaded " + x.string());
        return result;
    }

} /* namespace impl */ } /* namespace mcd */
