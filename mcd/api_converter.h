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
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "exception.h"
#include "api_data.h"


namespace mcd { namespace impl {
    struct native_library;
} /* namespace impl */ } /* namespace mcd */


namespace mcd { namespace api {
    namespace v1 {

        // (current entity, total entities, message)
        using ProgressCallback = std::function<void(int64_t, int64_t, const std::string&)>;

        struct ConversionFailure
        {
            int64_t Id;
            std::string Label;
            std::string Reason;

            friend auto operator==(const ConversionFailure&, const ConversionFailure&) -> bool = default;
            friend auto operator!=(const ConversionFailure&, const ConversionFailure&) -> bool = default;
        };

        struct ConversionSummary
        {
            int64_t Converted;
            std::vector<ConversionFailure> Failed;

            ConversionSummary();
            friend auto operator==(const ConversionSummary&, const ConversionSummary&) -> bool = default;
            friend auto operator!=(const ConversionSummary&, const ConversionSummary&) -> bool = default;
        };
        auto operator<<(std::ostream&, const ConversionSummary&) -> std::ostream&;


        /*
        exports a whole .mcd recording into an HDF5 file:
            /                       file_type, entity_count, time_stamp_resolution, time_span, app_name, comment
            /analog/<label>         data, timestamps; sample_rate, units
            /events/<label>         timestamps, values (numeric events only)
            /segments/<label>/segment_0000   data (samples x sources); timestamp, unit_id
            /neural/<label>         timestamps
        '/' in labels is replaced by '_'.
        a failure while converting one entity is logged as a warning, recorded in the summary
        and the conversion continues with the next entity.
        */
        struct Hdf5Converter
        {
            Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination);
            Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination, const std::filesystem::path& library);
            Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination, std::shared_ptr<mcd::impl::native_library> library);

            // progress: called with (i, total, "Converting <label>") before entity i
            // and with (total, total, "done") at the end
            auto Convert(ProgressCallback progress = nullptr) const -> ConversionSummary;

        private:
            std::filesystem::path source;
            std::filesystem::path destination;
            std::optional<std::filesystem::path> library_location;
            std::shared_ptr<mcd::impl::native_library> library;
        };

        // throws McdDependencyMissing if the library was built without HDF5 support
        auto ConvertToHdf5(const std::filesystem::path& source, const std::filesystem::path& destination, ProgressCallback progress = nullptr, const std::optional<std::filesystem::path>& library = std::nullopt) -> ConversionSummary;

        // '/' -> '_'
        auto Hdf5Name(const std::string& label) -> std::string;

    } /* namespace v1 */
} /* namespace api */ } /* namespace mcd */
