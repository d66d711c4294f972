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
#include <vector>

#include "exception.h"
#include "api_data.h"


namespace mcd { namespace impl {
    struct native_library;
} /* namespace impl */ } /* namespace mcd */


namespace mcd { namespace api {
    namespace v1 {

        /*
        read access to a Multi Channel Systems .mcd recording through the native neuroshare library.
        entity ids are zero based and stable while the reader is open.
        every member function throws McdNotOpen after Close.
        */
        struct McdReader
        {
            // searches the native library in the default locations
            explicit McdReader(const std::filesystem::path& fname);
            // library: the native library file or a directory containing it
            McdReader(const std::filesystem::path& fname, const std::filesystem::path& library);
            McdReader(const std::filesystem::path& fname, std::shared_ptr<mcd::impl::native_library> library);
            McdReader(const McdReader&) = delete;
            McdReader(McdReader&&);
            auto operator=(const McdReader&) -> McdReader& = delete;
            auto operator=(McdReader&&) -> McdReader&;
            ~McdReader();

            auto Info() const -> FileInfo;
            auto Library() const -> LibraryInfo;

            // one element per entity, in id order
            auto Entities() const -> std::vector<EntitySummary>;
            auto EntitiesByType(EntityType) const -> std::vector<EntitySummary>;
            auto EntitiesByType(int64_t code) const -> std::vector<EntitySummary>;
            // "unknown", "event", "analog", "segment" or "neural", case insensitive
            auto EntitiesByType(const std::string& name) const -> std::vector<EntitySummary>;

            // throws McdNotFound for ids outside of [0, entity count)
            auto EntityInfo(int64_t id) const -> EntityDetail;

            /*
            samples [start, start + count) of an analog entity.
            count AllItems (any negative value) reads to the end, a count past the end is clamped.
            throws McdOutOfRange if start is past the end.
            */
            auto AnalogData(int64_t id, int64_t start = 0, int64_t count = AllItems) const -> AnalogRecord;

            // all events of an event entity
            auto EventData(int64_t id) const -> EventRecord;

            // throws McdOutOfRange for index outside of [0, item count)
            auto SegmentData(int64_t id, int64_t index) const -> SegmentRecord;
            auto AllSegments(int64_t id) const -> SegmentSeries;

            // spike times, same range semantics as AnalogData
            auto NeuralData(int64_t id, int64_t start = 0, int64_t count = AllItems) const -> NeuralRecord;

            // the complete entity. throws McdTypeMismatch for entities of unknown type
            auto Read(int64_t id) const -> DataRecord;

            auto TimeByIndex(int64_t id, int64_t index) const -> double;
            auto IndexByTime(int64_t id, double seconds, TimeSearch direction = TimeSearch::Closest) const -> int64_t;

            // releases the native file handle. idempotent
            auto Close() -> void;
            auto IsOpen() const -> bool;

            auto FileName() const -> std::filesystem::path;
            auto LibraryLocation() const -> std::string;

        private:
            struct impl;
            std::unique_ptr<impl> p;

            auto self(const char* func) const -> impl&;
            friend auto swap(McdReader&, McdReader&) -> void;
        };

    } /* namespace v1 */
} /* namespace api */ } /* namespace mcd */
