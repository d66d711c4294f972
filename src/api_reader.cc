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

#include "api_reader.h"

#include <algorithm>
#include <sstream>

#include "arithmetic.h"
#include "file/mcd_file.h"
#include "logger.h"


namespace mcd { namespace api {
    namespace v1 {

        using namespace mcd::impl;


        struct McdReader::impl
        {
            mcd_file file;

            impl(const std::filesystem::path& fname, std::shared_ptr<native_library> lib)
            : file{ fname, std::move(lib) } {
            }
        };


        // the source is checked before the native library is loaded
        static
        auto load_for(const std::filesystem::path& fname, const std::optional<std::filesystem::path>& library) -> std::shared_ptr<native_library> {
            check_source(fname);
            return open_native_library(library);
        }

        McdReader::McdReader(const std::filesystem::path& fname)
        : p{ new impl{ fname, load_for(fname, std::nullopt) } } {
        }

        McdReader::McdReader(const std::filesystem::path& fname, const std::filesystem::path& library)
        : p{ new impl{ fname, load_for(fname, library) } } {
        }

        McdReader::McdReader(const std::filesystem::path& fname, std::shared_ptr<native_library> library)
        : p{ new impl{ fname, std::move(library) } } {
        }

        McdReader::McdReader(McdReader&& x)
        : p{ std::move(x.p) } {
        }

        auto McdReader::operator=(McdReader&& x) -> McdReader& {
            McdReader y{ std::move(x) };
            swap(*this, y);
            return *this;
        }

        McdReader::~McdReader() {
        }

        auto swap(McdReader& x, McdReader& y) -> void {
            using namespace std;
            swap(x.p, y.p);
        }

        auto McdReader::self(const char* func) const -> impl& {
            if (!p) {
                std::ostringstream oss;
                oss << "[" << func << ", api_reader] moved from reader";
                const auto e{ oss.str() };
                mcd_log_error(e);
                throw McdNotOpen{ e };
            }

            return *p;
        }


        auto McdReader::Info() const -> FileInfo {
            return self("Info").file.info();
        }

        auto McdReader::Library() const -> LibraryInfo {
            return self("Library").file.library_info();
        }

        auto McdReader::Entities() const -> std::vector<EntitySummary> {
            const auto& file{ self("Entities").file };
            const auto size{ file.entity_count() };

            std::vector<EntitySummary> result;
            result.reserve(as_sizet(size));
            for (int64_t id{ 0 }; id < size; ++id) {
                result.push_back(file.entity(id).summary);
            }
            return result;
        }

        auto McdReader::EntitiesByType(EntityType type) const -> std::vector<EntitySummary> {
            auto result{ Entities() };
            const auto last{ std::remove_if(begin(result), end(result), [type](const EntitySummary& x) -> bool { return x.Type != type; }) };
            result.erase(last, end(result));
            return result;
        }

        auto McdReader::EntitiesByType(int64_t code) const -> std::vector<EntitySummary> {
            auto result{ Entities() };
            const auto last{ std::remove_if(begin(result), end(result), [code](const EntitySummary& x) -> bool { return EntityTypeCode(x.Type) != code; }) };
            result.erase(last, end(result));
            return result;
        }

        auto McdReader::EntitiesByType(const std::string& name) const -> std::vector<EntitySummary> {
            return EntitiesByType(EntityTypeFromName(name));
        }

        auto McdReader::EntityInfo(int64_t id) const -> EntityDetail {
            const auto& x{ self("EntityInfo").file.entity(id) };
            return EntityDetail{ x.summary, x.detail };
        }

        auto McdReader::AnalogData(int64_t id, int64_t start, int64_t count) const -> AnalogRecord {
            return self("AnalogData").file.analog(id, start, count);
        }

        auto McdReader::EventData(int64_t id) const -> EventRecord {
            return self("EventData").file.events(id);
        }

        auto McdReader::SegmentData(int64_t id, int64_t index) const -> SegmentRecord {
            return self("SegmentData").file.segment(id, index);
        }

        auto McdReader::AllSegments(int64_t id) const -> SegmentSeries {
            const auto& file{ self("AllSegments").file };
            const auto items{ file.entity(id).summary.ItemCount };

            SegmentSeries result;
            result.reserve(as_sizet(items));
            for (int64_t i{ 0 }; i < items; ++i) {
                result.push_back(file.segment(id, i));
            }

            if (static_cast<int64_t>(result.size()) != items) {
                std::ostringstream oss;
                oss << "[AllSegments, api_reader] entity " << id << ": " << result.size() << " segments read, " << items << " expected";
                const auto e{ oss.str() };
                mcd_log_critical(e);
                throw McdBug{ e };
            }
            return result;
        }

        auto McdReader::NeuralData(int64_t id, int64_t start, int64_t count) const -> NeuralRecord {
            return self("NeuralData").file.neural(id, start, count);
        }

        auto McdReader::Read(int64_t id) const -> DataRecord {
            const auto& x{ self("Read").file.entity(id) };

            switch (x.summary.Type) {
                case EntityType::Analog: return AnalogData(id);
                case EntityType::Event: return EventData(id);
                case EntityType::Segment: return AllSegments(id);
                case EntityType::Neural: return NeuralData(id);
                case EntityType::Unknown: break;
            }

            std::ostringstream oss;
            oss << "[Read, api_reader] entity " << id << " '" << x.summary.Label << "' has unknown type";
            const auto e{ oss.str() };
            mcd_log_error(e);
            throw McdTypeMismatch{ e };
        }

        auto McdReader::TimeByIndex(int64_t id, int64_t index) const -> double {
            return self("TimeByIndex").file.time_by_index(id, index);
        }

        auto McdReader::IndexByTime(int64_t id, double seconds, TimeSearch direction) const -> int64_t {
            return self("IndexByTime").file.index_by_time(id, seconds, direction);
        }

        auto McdReader::Close() -> void {
            if (!p) {
                return;
            }
            p->file.close();
        }

        auto McdReader::IsOpen() const -> bool {
            return p && p->file.is_open();
        }

        auto McdReader::FileName() const -> std::filesystem::path {
            return self("FileName").file.file_name();
        }

        auto McdReader::LibraryLocation() const -> std::string {
            return self("LibraryLocation").file.library_location();
        }

    } /* namespace v1 */
} /* namespace api */ } /* namespace mcd */
