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
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "api_data.h"
#include "native/neuroshare.h"


namespace mcd { namespace impl {

    // throws McdNotFound if the file does not exist
    auto check_source(const std::filesystem::path&) -> void;

    // resolves the location through locate_library and loads the native library.
    // the bare platform name is handed to the dynamic loader if nothing is found.
    auto open_native_library(const std::optional<std::filesystem::path>& requested) -> std::shared_ptr<native_library>;


    struct entity_record
    {
        api::v1::EntitySummary summary;
        api::v1::EntityMetadata detail;
    };


    // an open .mcd file.
    // entity metadata is fetched from the native library once per entity and cached.
    class mcd_file
    {
        std::shared_ptr<native_library> lib;
        std::filesystem::path fname;
        std::optional<uint32_t> handle;
        api::v1::FileInfo file_info;
        mutable std::map<uint32_t, entity_record> entities;

    public:

        // throws McdNotFound if fname does not exist, McdOpenError if the native library rejects it
        mcd_file(const std::filesystem::path& fname, std::shared_ptr<native_library>);
        mcd_file(const mcd_file&) = delete;
        mcd_file(mcd_file&&) = delete;
        auto operator=(const mcd_file&) -> mcd_file& = delete;
        auto operator=(mcd_file&&) -> mcd_file& = delete;
        ~mcd_file();

        auto close() -> void;
        auto is_open() const -> bool;
        auto file_name() const -> std::filesystem::path;
        auto library_location() const -> std::string;

        auto info() const -> api::v1::FileInfo;
        auto library_info() const -> api::v1::LibraryInfo;

        auto entity_count() const -> int64_t;
        auto entity(int64_t id) const -> const entity_record&;

        // start/count semantics: negative count reads to the end, a count past the end is clamped
        auto analog(int64_t id, int64_t start, int64_t count) const -> api::v1::AnalogRecord;
        auto events(int64_t id) const -> api::v1::EventRecord;
        auto segment(int64_t id, int64_t index) const -> api::v1::SegmentRecord;
        auto neural(int64_t id, int64_t start, int64_t count) const -> api::v1::NeuralRecord;

        auto time_by_index(int64_t id, int64_t index) const -> double;
        auto index_by_time(int64_t id, double seconds, api::v1::TimeSearch) const -> int64_t;

    private:

        auto file_handle(const std::string& func) const -> uint32_t;
        auto typed_entity(int64_t id, api::v1::EntityType, const std::string& func) const -> const entity_record&;
        auto load_entity(uint32_t file, uint32_t id) const -> entity_record;
    };

} /* namespace impl */ } /* namespace mcd */
