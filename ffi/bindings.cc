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


#include <sstream>
#include <variant>

#include "pybind11/pybind11.h"
#include "pybind11/functional.h"
#include "pybind11/stl.h"
#include <pybind11/numpy.h>

#include "ffi/bindings.h"
#include "mcd.h"
#include "arithmetic.h"

namespace {

    namespace py = pybind11;
    namespace v1 = mcd::api::v1;

    template<typename T>
    static
    auto repr(T x) -> std::string {
        std::ostringstream oss;
        oss << "(" << x << ")";
        return oss.str();
    }

    struct mcdpy_version
    {
        uint32_t major;
        uint32_t minor;
        uint32_t patch;
        uint32_t build;

        mcdpy_version()
        : major{ MCD_MAJOR }
        , minor{ MCD_MINOR }
        , patch{ MCD_PATCH }
        , build{ MCD_BUILD } {
        }
    };

    auto operator<<(std::ostream& os, const mcdpy_version& x) -> std::ostream& {
        os << x.major << "."  << x.minor << "."  << x.patch << "."  << x.build;
        return os;
    }


    template<typename T>
    auto to_array(const std::vector<T>& xs) -> py::array_t<T> {
        py::array_t<T> ys(static_cast<py::ssize_t>(xs.size()));
        std::copy(begin(xs), end(xs), ys.mutable_data());
        return ys;
    }

    // xs: row major rows x columns
    template<typename T>
    auto to_row_major(const std::vector<T>& xs, int64_t rows, int64_t columns) -> py::array_t<T> {
        if (xs.size() != mcd::impl::multiply(mcd::impl::as_sizet(rows), mcd::impl::as_sizet(columns), mcd::impl::guarded{})) {
            std::ostringstream oss;
            oss << "[to_row_major, mcdpy] " << xs.size() << " elements, " << rows << "x" << columns << " expected";
            throw v1::McdBug{ oss.str() };
        }

        py::array_t<T> ys({ static_cast<py::ssize_t>(rows), static_cast<py::ssize_t>(columns) });
        std::copy(begin(xs), end(xs), ys.mutable_data());
        return ys;
    }


    static
    auto analog2dict(const v1::AnalogRecord& x) -> py::dict {
        py::dict result;
        result["label"] = x.Label;
        result["data"] = to_array(x.Data);
        result["timestamps"] = to_array(x.Timestamps);
        result["sample_rate"] = x.SampleRate;
        result["units"] = x.Units;
        result["continuous_count"] = x.ContinuousCount;
        return result;
    }

    static
    auto events2dict(const v1::EventRecord& x) -> py::dict {
        py::dict result;
        result["label"] = x.Label;
        result["value_type"] = x.ValueType;
        result["timestamps"] = to_array(x.Timestamps);
        if (std::holds_alternative<std::vector<double>>(x.Values)) {
            result["values"] = to_array(std::get<std::vector<double>>(x.Values));
        }
        else {
            result["values"] = std::get<std::vector<std::string>>(x.Values);
        }
        return result;
    }

    static
    auto segment2dict(const v1::SegmentRecord& x) -> py::dict {
        py::dict result;
        result["label"] = x.Label;
        result["data"] = to_row_major(x.Data, x.SampleCount, x.SourceCount);
        result["timestamp"] = x.Timestamp;
        result["unit_id"] = x.UnitId;
        result["sample_rate"] = x.SampleRate;
        return result;
    }

    static
    auto neural2dict(const v1::NeuralRecord& x) -> py::dict {
        py::dict result;
        result["label"] = x.Label;
        result["timestamps"] = to_array(x.Timestamps);
        return result;
    }


    static
    auto segments2list(const v1::SegmentSeries& xs) -> py::list {
        py::list result;
        for (const auto& x : xs) {
            result.append(segment2dict(x));
        }
        return result;
    }

    struct record2python
    {
        auto operator()(const v1::AnalogRecord& x) const -> py::object { return analog2dict(x); }
        auto operator()(const v1::EventRecord& x) const -> py::object { return events2dict(x); }
        auto operator()(const v1::SegmentSeries& x) const -> py::object { return segments2list(x); }
        auto operator()(const v1::NeuralRecord& x) const -> py::object { return neural2dict(x); }
    };

    // None for entities of unknown type
    struct metadata2python
    {
        auto operator()(const std::monostate&) const -> py::object { return py::none(); }

        template<typename T>
        auto operator()(const T& x) const -> py::object { return py::cast(x); }
    };


    static
    auto open_reader(const std::string& fname, const std::optional<std::string>& library) -> v1::McdReader {
        if (library) {
            return v1::McdReader{ fname, std::filesystem::path{ *library } };
        }
        return v1::McdReader{ fname };
    }

    struct reader_py
    {
        v1::McdReader reader;

        reader_py(const std::string& fname, const std::optional<std::string>& library)
        : reader{ open_reader(fname, library) } {
        }

        auto segments(int64_t id) const -> py::list {
            return segments2list(reader.AllSegments(id));
        }

        auto read(int64_t id) const -> py::object {
            return std::visit(record2python{}, reader.Read(id));
        }
    };


    static
    auto convert(const std::string& source, const std::string& destination, v1::ProgressCallback progress, const std::optional<std::string>& library) -> v1::ConversionSummary {
        std::optional<std::filesystem::path> location;
        if (library) {
            location = *library;
        }
        return v1::ConvertToHdf5(source, destination, progress, location);
    }

} // anonymous namespace


namespace mcd { namespace ffi {

auto define_module(pybind11::module_& m) -> void {

    auto& base{ py::register_exception<v1::McdException>(m, "McdException", PyExc_RuntimeError) };
    py::register_exception<v1::McdNotFound>(m, "McdNotFound", base.ptr());
    py::register_exception<v1::McdOpenError>(m, "McdOpenError", base.ptr());
    py::register_exception<v1::McdNotOpen>(m, "McdNotOpen", base.ptr());
    py::register_exception<v1::McdInvalidArgument>(m, "McdInvalidArgument", base.ptr());
    py::register_exception<v1::McdTypeMismatch>(m, "McdTypeMismatch", base.ptr());
    py::register_exception<v1::McdOutOfRange>(m, "McdOutOfRange", base.ptr());
    py::register_exception<v1::McdDependencyMissing>(m, "McdDependencyMissing", base.ptr());
    py::register_exception<v1::McdData>(m, "McdData", base.ptr());
    py::register_exception<v1::McdBug>(m, "McdBug", base.ptr());

    py::enum_<v1::EntityType>(m, "entity_type", py::module_local())
        .value("unknown", v1::EntityType::Unknown)
        .value("event", v1::EntityType::Event)
        .value("analog", v1::EntityType::Analog)
        .value("segment", v1::EntityType::Segment)
        .value("neural", v1::EntityType::Neural);

    py::enum_<v1::EventValueType>(m, "event_value_type", py::module_local())
        .value("text", v1::EventValueType::Text)
        .value("csv", v1::EventValueType::Csv)
        .value("byte", v1::EventValueType::Byte)
        .value("word", v1::EventValueType::Word)
        .value("dword", v1::EventValueType::Dword);

    py::enum_<v1::TimeSearch>(m, "time_search", py::module_local())
        .value("before", v1::TimeSearch::Before)
        .value("closest", v1::TimeSearch::Closest)
        .value("after", v1::TimeSearch::After);

    py::class_<v1::CalendarTime> ct(m, "calendar_time", py::module_local());
    ct.def_readonly("year", &v1::CalendarTime::Year)
      .def_readonly("month", &v1::CalendarTime::Month)
      .def_readonly("day_of_week", &v1::CalendarTime::DayOfWeek)
      .def_readonly("day", &v1::CalendarTime::Day)
      .def_readonly("hour", &v1::CalendarTime::Hour)
      .def_readonly("minute", &v1::CalendarTime::Minute)
      .def_readonly("second", &v1::CalendarTime::Second)
      .def_readonly("millisecond", &v1::CalendarTime::Millisecond)
      .def("__repr__", [](const v1::CalendarTime& x) { return repr(x); });

    py::class_<v1::FileInfo> fi(m, "file_info", py::module_local());
    fi.def_readonly("file_type", &v1::FileInfo::FileType)
      .def_readonly("entity_count", &v1::FileInfo::EntityCount)
      .def_readonly("time_stamp_resolution", &v1::FileInfo::TimeStampResolution)
      .def_readonly("time_span", &v1::FileInfo::TimeSpan)
      .def_readonly("app_name", &v1::FileInfo::AppName)
      .def_readonly("comment", &v1::FileInfo::Comment)
      .def_readonly("created", &v1::FileInfo::Created)
      .def("__repr__", [](const v1::FileInfo& x) { return repr(x); });

    py::class_<v1::EntitySummary> es(m, "entity", py::module_local());
    es.def_readonly("id", &v1::EntitySummary::Id)
      .def_readonly("label", &v1::EntitySummary::Label)
      .def_readonly("type", &v1::EntitySummary::Type)
      .def_readonly("type_name", &v1::EntitySummary::TypeName)
      .def_readonly("item_count", &v1::EntitySummary::ItemCount)
      .def("__repr__", [](const v1::EntitySummary& x) { return repr(x); });

    py::class_<v1::FileDescription> fd(m, "file_description", py::module_local());
    fd.def_readonly("description", &v1::FileDescription::Description)
      .def_readonly("extension", &v1::FileDescription::Extension)
      .def_readonly("mac_codes", &v1::FileDescription::MacCodes)
      .def_readonly("magic_code", &v1::FileDescription::MagicCode);

    py::class_<v1::LibraryInfo> li(m, "library_info", py::module_local());
    li.def_readonly("description", &v1::LibraryInfo::Description)
      .def_readonly("creator", &v1::LibraryInfo::Creator)
      .def_readonly("library_major", &v1::LibraryInfo::LibraryMajor)
      .def_readonly("library_minor", &v1::LibraryInfo::LibraryMinor)
      .def_readonly("api_major", &v1::LibraryInfo::ApiMajor)
      .def_readonly("api_minor", &v1::LibraryInfo::ApiMinor)
      .def_readonly("built", &v1::LibraryInfo::Built)
      .def_readonly("flags", &v1::LibraryInfo::Flags)
      .def_readonly("max_files", &v1::LibraryInfo::MaxFiles)
      .def_readonly("file_types", &v1::LibraryInfo::FileTypes)
      .def("__repr__", [](const v1::LibraryInfo& x) { return repr(x); });

    py::class_<v1::FilterSettings> flt(m, "filter_settings", py::module_local());
    flt.def_readonly("high_freq_corner", &v1::FilterSettings::HighFreqCorner)
       .def_readonly("high_freq_order", &v1::FilterSettings::HighFreqOrder)
       .def_readonly("high_filter_type", &v1::FilterSettings::HighFilterType)
       .def_readonly("low_freq_corner", &v1::FilterSettings::LowFreqCorner)
       .def_readonly("low_freq_order", &v1::FilterSettings::LowFreqOrder)
       .def_readonly("low_filter_type", &v1::FilterSettings::LowFilterType);

    py::class_<v1::Location> loc(m, "location", py::module_local());
    loc.def_readonly("x", &v1::Location::X)
       .def_readonly("y", &v1::Location::Y)
       .def_readonly("z", &v1::Location::Z)
       .def_readonly("user", &v1::Location::User);

    py::class_<v1::AnalogInfo> ai(m, "analog_info", py::module_local());
    ai.def_readonly("sample_rate", &v1::AnalogInfo::SampleRate)
      .def_readonly("min_value", &v1::AnalogInfo::MinValue)
      .def_readonly("max_value", &v1::AnalogInfo::MaxValue)
      .def_readonly("units", &v1::AnalogInfo::Units)
      .def_readonly("resolution", &v1::AnalogInfo::Resolution)
      .def_readonly("location", &v1::AnalogInfo::Position)
      .def_readonly("filter", &v1::AnalogInfo::Filter)
      .def_readonly("probe_info", &v1::AnalogInfo::ProbeInfo)
      .def("__repr__", [](const v1::AnalogInfo& x) { return repr(x); });

    py::class_<v1::EventInfo> ei(m, "event_info", py::module_local());
    ei.def_readonly("value_type", &v1::EventInfo::ValueType)
      .def_readonly("min_data_length", &v1::EventInfo::MinDataLength)
      .def_readonly("max_data_length", &v1::EventInfo::MaxDataLength)
      .def_readonly("csv_description", &v1::EventInfo::CsvDescription)
      .def("__repr__", [](const v1::EventInfo& x) { return repr(x); });

    py::class_<v1::SegmentSourceInfo> ssi(m, "segment_source_info", py::module_local());
    ssi.def_readonly("min_value", &v1::SegmentSourceInfo::MinValue)
       .def_readonly("max_value", &v1::SegmentSourceInfo::MaxValue)
       .def_readonly("resolution", &v1::SegmentSourceInfo::Resolution)
       .def_readonly("sub_sample_shift", &v1::SegmentSourceInfo::SubSampleShift)
       .def_readonly("location", &v1::SegmentSourceInfo::Position)
       .def_readonly("filter", &v1::SegmentSourceInfo::Filter)
       .def_readonly("probe_info", &v1::SegmentSourceInfo::ProbeInfo);

    py::class_<v1::SegmentInfo> si(m, "segment_info", py::module_local());
    si.def_readonly("source_count", &v1::SegmentInfo::SourceCount)
      .def_readonly("min_sample_count", &v1::SegmentInfo::MinSampleCount)
      .def_readonly("max_sample_count", &v1::SegmentInfo::MaxSampleCount)
      .def_readonly("sample_rate", &v1::SegmentInfo::SampleRate)
      .def_readonly("units", &v1::SegmentInfo::Units)
      .def_readonly("sources", &v1::SegmentInfo::Sources)
      .def("__repr__", [](const v1::SegmentInfo& x) { return repr(x); });

    py::class_<v1::NeuralInfo> ni(m, "neural_info", py::module_local());
    ni.def_readonly("source_entity_id", &v1::NeuralInfo::SourceEntityId)
      .def_readonly("source_unit_id", &v1::NeuralInfo::SourceUnitId)
      .def_readonly("probe_info", &v1::NeuralInfo::ProbeInfo)
      .def("__repr__", [](const v1::NeuralInfo& x) { return repr(x); });

    py::class_<v1::EntityDetail> ed(m, "entity_detail", py::module_local());
    ed.def_readonly("entity", &v1::EntityDetail::Entity)
      .def_property_readonly("detail", [](const v1::EntityDetail& x) { return std::visit(metadata2python{}, x.Detail); })
      .def("__repr__", [](const v1::EntityDetail& x) { return repr(x); });

    py::class_<v1::ConversionSummary> cs(m, "conversion_summary", py::module_local());
    cs.def_readonly("converted", &v1::ConversionSummary::Converted)
      .def_property_readonly("failed", [](const v1::ConversionSummary& x) -> std::vector<std::tuple<int64_t, std::string, std::string>> {
          std::vector<std::tuple<int64_t, std::string, std::string>> result;
          for (const auto& f : x.Failed) {
              result.emplace_back(f.Id, f.Label, f.Reason);
          }
          return result;
      })
      .def("__repr__", [](const v1::ConversionSummary& x) { return repr(x); });

    py::class_<reader_py> r(m, "Reader", py::module_local());
    r.def(py::init<const std::string&, const std::optional<std::string>&>(), py::arg("fname"), py::arg("library") = std::nullopt)
     .def_property_readonly("info", [](const reader_py& self) { return self.reader.Info(); })
     .def_property_readonly("library", [](const reader_py& self) { return self.reader.Library(); })
     .def_property_readonly("library_location", [](const reader_py& self) { return self.reader.LibraryLocation(); })
     .def_property_readonly("is_open", [](const reader_py& self) { return self.reader.IsOpen(); })
     .def("entities", [](const reader_py& self) { return self.reader.Entities(); })
     .def("entities_by_type", [](const reader_py& self, const std::string& x) { return self.reader.EntitiesByType(x); })
     .def("entities_by_type", [](const reader_py& self, int64_t x) { return self.reader.EntitiesByType(x); })
     .def("entity_info", [](const reader_py& self, int64_t id) { return self.reader.EntityInfo(id); })
     .def("read", &reader_py::read)
     .def("analog_data", [](const reader_py& self, int64_t id, int64_t start, int64_t count) { return analog2dict(self.reader.AnalogData(id, start, count)); }
         , py::arg("id"), py::arg("start") = 0, py::arg("count") = v1::AllItems)
     .def("event_data", [](const reader_py& self, int64_t id) { return events2dict(self.reader.EventData(id)); })
     .def("segment_data", [](const reader_py& self, int64_t id, int64_t index) { return segment2dict(self.reader.SegmentData(id, index)); })
     .def("all_segments", &reader_py::segments)
     .def("neural_data", [](const reader_py& self, int64_t id, int64_t start, int64_t count) { return neural2dict(self.reader.NeuralData(id, start, count)); }
         , py::arg("id"), py::arg("start") = 0, py::arg("count") = v1::AllItems)
     .def("time_by_index", [](const reader_py& self, int64_t id, int64_t index) { return self.reader.TimeByIndex(id, index); })
     .def("index_by_time", [](const reader_py& self, int64_t id, double seconds, v1::TimeSearch x) { return self.reader.IndexByTime(id, seconds, x); }
         , py::arg("id"), py::arg("seconds"), py::arg("direction") = v1::TimeSearch::Closest)
     .def("close", [](reader_py& self) { self.reader.Close(); })
     .def("__enter__", [](reader_py& self) -> reader_py& { return self; }, py::return_value_policy::reference)
     .def("__exit__", [](reader_py& self, py::object, py::object, py::object) { self.reader.Close(); });

    m.def("convert", &convert, py::arg("source"), py::arg("destination"), py::arg("progress") = nullptr, py::arg("library") = std::nullopt);
    m.def("entity_type_name", &v1::EntityTypeName);
    m.def("hdf5_name", &v1::Hdf5Name);

    std::ostringstream version;
    version << mcdpy_version{};
    m.attr("__version__") = version.str();
}

} /* namespace ffi */ } /* namespace mcd */
