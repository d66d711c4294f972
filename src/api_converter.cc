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

#include "api_converter.h"

#include <algorithm>
#include <cstdio>
#include <sstream>

#include "api_reader.h"
#include "arithmetic.h"
#include "container/hdf5.h"
#include "logger.h"


namespace mcd { namespace api {
    namespace v1 {

        using namespace mcd::impl;


        ConversionSummary::ConversionSummary()
        : Converted{ 0 } {
        }

        auto operator<<(std::ostream& os, const ConversionSummary& x) -> std::ostream& {
            os << x.Converted << " entities converted, " << x.Failed.size() << " failed";
            for (const auto& f : x.Failed) {
                os << "\n" << f.Id << " '" << f.Label << "': " << f.Reason;
            }
            return os;
        }

        auto Hdf5Name(const std::string& label) -> std::string {
            std::string result{ label };
            std::replace(begin(result), end(result), '/', '_');
            return result;
        }


        static
        auto segment_name(size_t i) -> std::string {
            char buffer[32]{};
            std::snprintf(buffer, sizeof(buffer), "segment_%04zu", i);
            return buffer;
        }

        static
        auto write_file_info(hdf5_group& root, const FileInfo& x) -> void {
            root.string_attribute("file_type", x.FileType);
            root.int64_attribute("entity_count", x.EntityCount);
            root.double_attribute("time_stamp_resolution", x.TimeStampResolution);
            root.double_attribute("time_span", x.TimeSpan);
            root.string_attribute("app_name", x.AppName);
            root.string_attribute("comment", x.Comment);
        }

        static
        auto write_analog(hdf5_group& parent, const std::string& name, const AnalogRecord& x) -> void {
            auto group{ parent.create_group(name) };
            group.write_dataset("data", x.Data);
            group.write_dataset("timestamps", x.Timestamps);
            group.double_attribute("sample_rate", x.SampleRate);
            group.string_attribute("units", x.Units);
        }

        static
        auto write_events(hdf5_group& parent, const std::string& name, const EventRecord& x) -> void {
            auto group{ parent.create_group(name) };
            group.write_dataset("timestamps", x.Timestamps);

            // textual values are not exported
            if (std::holds_alternative<std::vector<double>>(x.Values)) {
                group.write_dataset("values", std::get<std::vector<double>>(x.Values));
            }
        }

        static
        auto write_segments(hdf5_group& parent, const std::string& name, const SegmentSeries& xs) -> void {
            auto group{ parent.create_group(name) };
            for (size_t i{ 0 }; i < xs.size(); ++i) {
                const auto& x{ xs[i] };
                auto segment{ group.create_group(segment_name(i)) };
                segment.write_dataset("data", x.Data, as_sizet(x.SampleCount), as_sizet(x.SourceCount));
                segment.double_attribute("timestamp", x.Timestamp);
                segment.int64_attribute("unit_id", x.UnitId);
            }
        }

        static
        auto write_neural(hdf5_group& parent, const std::string& name, const NeuralRecord& x) -> void {
            auto group{ parent.create_group(name) };
            group.write_dataset("timestamps", x.Timestamps);
        }


        static
        auto open_reader(const std::filesystem::path& source, const std::optional<std::filesystem::path>& location, const std::shared_ptr<native_library>& library) -> McdReader {
            if (library) {
                return McdReader{ source, library };
            }
            if (location) {
                return McdReader{ source, *location };
            }
            return McdReader{ source };
        }


        Hdf5Converter::Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination)
        : source{ source }
        , destination{ destination } {
        }

        Hdf5Converter::Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination, const std::filesystem::path& library)
        : source{ source }
        , destination{ destination }
        , library_location{ library } {
        }

        Hdf5Converter::Hdf5Converter(const std::filesystem::path& source, const std::filesystem::path& destination, std::shared_ptr<native_library> library)
        : source{ source }
        , destination{ destination }
        , library{ std::move(library) } {
        }

        auto Hdf5Converter::Convert(ProgressCallback progress) const -> ConversionSummary {
            if (!hdf5_available()) {
                const std::string e{ "[Convert, api_converter] McdToolKit was built without HDF5 support (MCD_HDF5=OFF)" };
                mcd_log_error(e);
                throw McdDependencyMissing{ e };
            }

            McdReader reader{ open_reader(source, library_location, library) };
            hdf5_file output{ destination };
            auto root{ output.root() };

            write_file_info(root, reader.Info());
            auto events{ root.create_group("events") };
            auto analog{ root.create_group("analog") };
            auto segments{ root.create_group("segments") };
            auto neural{ root.create_group("neural") };

            const auto entities{ reader.Entities() };
            const auto total{ static_cast<int64_t>(entities.size()) };
            mcd_log_info("[Convert, api_converter] " + source.string() + " -> " + destination.string() + ", " + std::to_string(total) + " entities");

            ConversionSummary summary;
            for (int64_t i{ 0 }; i < total; ++i) {
                const auto& entity{ entities[static_cast<size_t>(i)] };
                if (progress) {
                    progress(i, total, "Converting " + entity.Label);
                }

                const auto name{ Hdf5Name(entity.Label) };
                try {
                    switch (entity.Type) {
                        case EntityType::Event:
                            write_events(events, name, reader.EventData(entity.Id));
                            break;
                        case EntityType::Analog:
                            write_analog(analog, name, reader.AnalogData(entity.Id));
                            break;
                        case EntityType::Segment:
                            write_segments(segments, name, reader.AllSegments(entity.Id));
                            break;
                        case EntityType::Neural:
                            write_neural(neural, name, reader.NeuralData(entity.Id));
                            break;
                        case EntityType::Unknown:
                            mcd_log_info("[Convert, api_converter] skipping entity " + std::to_string(entity.Id) + " '" + entity.Label + "' of unknown type");
                            continue;
                    }
                    ++summary.Converted;
                }
                catch (const std::exception& x) {
                    std::ostringstream oss;
                    oss << "[Convert, api_converter] failed to convert entity " << entity.Id << " '" << name << "': " << x.what();
                    mcd_log_warning(oss.str());
                    summary.Failed.push_back({ entity.Id, entity.Label, x.what() });
                }
            }

            if (progress) {
                progress(total, total, "done");
            }

            output.close();
            reader.Close();
            return summary;
        }


        auto ConvertToHdf5(const std::filesystem::path& source, const std::filesystem::path& destination, ProgressCallback progress, const std::optional<std::filesystem::path>& library) -> ConversionSummary {
            if (library) {
                return Hdf5Converter{ source, destination, *library }.Convert(progress);
            }
            return Hdf5Converter{ source, destination }.Convert(progress);
        }

    } /* namespace v1 */
} /* namespace api */ } /* namespace mcd */
