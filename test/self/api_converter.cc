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


#define CATCH_CONFIG_MAIN  // This tells Catch to provide a main() - only do this in one cpp file
#include <catch2/catch.hpp>

#include <sstream>
#include <tuple>

#include "H5Cpp.h"

#include "test/util.h"
#include "mcd.h"

namespace mcd { namespace impl { namespace test {

using namespace mcd::api::v1;
namespace fs = std::filesystem;


auto exists(const H5::H5File& file, const std::string& path) -> bool {
    return H5Lexists(file.getId(), path.c_str(), H5P_DEFAULT) > 0;
}

auto read_doubles(H5::H5File& file, const std::string& path) -> std::vector<double> {
    H5::DataSet dataset{ file.openDataSet(path) };
    const auto points{ dataset.getSpace().getSimpleExtentNpoints() };
    std::vector<double> result(static_cast<size_t>(points));
    if (!result.empty()) {
        dataset.read(result.data(), H5::PredType::NATIVE_DOUBLE);
    }
    return result;
}

auto dimensions(H5::H5File& file, const std::string& path) -> std::vector<hsize_t> {
    H5::DataSet dataset{ file.openDataSet(path) };
    const auto space{ dataset.getSpace() };
    std::vector<hsize_t> result(static_cast<size_t>(space.getSimpleExtentNdims()));
    space.getSimpleExtentDims(result.data());
    return result;
}

auto string_attribute(H5::H5Object& x, const std::string& name) -> std::string {
    H5::Attribute attribute{ x.openAttribute(name) };
    H5std_string result;
    attribute.read(attribute.getStrType(), result);
    return result;
}

auto int64_attribute(H5::H5Object& x, const std::string& name) -> int64_t {
    H5::Attribute attribute{ x.openAttribute(name) };
    int64_t result{ 0 };
    attribute.read(H5::PredType::NATIVE_INT64, &result);
    return result;
}

auto double_attribute(H5::H5Object& x, const std::string& name) -> double {
    H5::Attribute attribute{ x.openAttribute(name) };
    double result{ 0 };
    attribute.read(H5::PredType::NATIVE_DOUBLE, &result);
    return result;
}


TEST_CASE("hdf5 names", "[correct]") {
    REQUIRE(Hdf5Name("Ch1") == "Ch1");
    REQUIRE(Hdf5Name("Ch/2") == "Ch_2");
    REQUIRE(Hdf5Name("a/b/c") == "a_b_c");
    REQUIRE(Hdf5Name("Spikes 1") == "Spikes 1");
}

TEST_CASE("convert a recording", "[consistency] [write]") {
    temporary_file source{ "convert.mcd" };
    const fs::path destination{ "convert.h5" };
    auto lib{ std::make_shared<fake_library>(full_recording()) };

    std::vector<std::tuple<int64_t, int64_t, std::string>> progress;
    const auto record{ [&progress](int64_t i, int64_t total, const std::string& msg) -> void { progress.emplace_back(i, total, msg); } };

    const auto summary{ Hdf5Converter{ source.path(), destination, lib }.Convert(record) };
    REQUIRE(lib->open_count() == 0);

    SECTION("summary") {
        REQUIRE(summary.Converted == 6);
        REQUIRE(summary.Failed.size() == 1);
        REQUIRE(summary.Failed[0].Id == 6);
        REQUIRE(summary.Failed[0].Label == "Broken");
        REQUIRE(summary.Failed[0].Reason.find("read error") != std::string::npos);
    }

    SECTION("progress") {
        REQUIRE(progress.size() == 9);
        REQUIRE(progress.front() == std::make_tuple(int64_t{ 0 }, int64_t{ 8 }, std::string{ "Converting Ch1" }));
        REQUIRE(progress[4] == std::make_tuple(int64_t{ 4 }, int64_t{ 8 }, std::string{ "Converting Spikes 1" }));
        REQUIRE(progress[7] == std::make_tuple(int64_t{ 7 }, int64_t{ 8 }, std::string{ "Converting Mystery" }));
        REQUIRE(progress.back() == std::make_tuple(int64_t{ 8 }, int64_t{ 8 }, std::string{ "done" }));
    }

    SECTION("content") {
        H5::H5File file{ destination.string(), H5F_ACC_RDONLY };
        H5::Group root{ file.openGroup("/") };
        REQUIRE(string_attribute(root, "file_type") == "MCD");
        REQUIRE(int64_attribute(root, "entity_count") == 8);
        REQUIRE(double_attribute(root, "time_span") == Approx(2.5));
        REQUIRE(double_attribute(root, "time_stamp_resolution") == Approx(4e-5));
        REQUIRE(string_attribute(root, "app_name") == "MC_Rack");
        REQUIRE(string_attribute(root, "comment") == "synthetic recording");

        for (const std::string group : { "/analog", "/events", "/segments", "/neural" }) {
            REQUIRE(exists(file, group));
        }

        // analog
        const auto ch1{ read_doubles(file, "/analog/Ch1/data") };
        REQUIRE(ch1.size() == 100);
        REQUIRE(ch1[0] == Approx(-12.5));
        const auto ch1_times{ read_doubles(file, "/analog/Ch1/timestamps") };
        REQUIRE(ch1_times.size() == 100);
        REQUIRE(ch1_times[0] == Approx(0.5));
        H5::Group ch1_group{ file.openGroup("/analog/Ch1") };
        REQUIRE(double_attribute(ch1_group, "sample_rate") == Approx(1000));
        REQUIRE(string_attribute(ch1_group, "units") == "uV");

        REQUIRE(exists(file, "/analog/Ch_2"));
        REQUIRE(read_doubles(file, "/analog/Ch_2/data").size() == 50);
        REQUIRE(!exists(file, "/analog/Broken"));

        // events
        REQUIRE(read_doubles(file, "/events/Trigger/values") == std::vector<double>{ 10, 20, 30, 40, 50 });
        REQUIRE(read_doubles(file, "/events/Trigger/timestamps").size() == 5);
        REQUIRE(read_doubles(file, "/events/Comment/timestamps").size() == 3);
        REQUIRE(!exists(file, "/events/Comment/values"));

        // segments
        REQUIRE(exists(file, "/segments/Spikes 1/segment_0000"));
        REQUIRE(exists(file, "/segments/Spikes 1/segment_0004"));
        REQUIRE(!exists(file, "/segments/Spikes 1/segment_0005"));
        REQUIRE(dimensions(file, "/segments/Spikes 1/segment_0001/data") == std::vector<hsize_t>{ 4, 2 });
        const auto segment{ read_doubles(file, "/segments/Spikes 1/segment_0001/data") };
        REQUIRE(segment[5] == Approx(121));
        H5::Group segment_group{ file.openGroup("/segments/Spikes 1/segment_0001") };
        REQUIRE(int64_attribute(segment_group, "unit_id") == 1);
        REQUIRE(double_attribute(segment_group, "timestamp") == Approx(0.2));

        // neural
        REQUIRE(read_doubles(file, "/neural/Units 1/timestamps").size() == 7);

        // every value as read through the native library
        McdReader reader{ source.path(), lib };
        const auto analog{ reader.AnalogData(0) };
        REQUIRE(read_doubles(file, "/analog/Ch1/data") == analog.Data);
        REQUIRE(read_doubles(file, "/analog/Ch1/timestamps") == analog.Timestamps);
        const auto analog2{ reader.AnalogData(1) };
        REQUIRE(read_doubles(file, "/analog/Ch_2/data") == analog2.Data);
        REQUIRE(read_doubles(file, "/analog/Ch_2/timestamps") == analog2.Timestamps);
        REQUIRE(read_doubles(file, "/events/Trigger/timestamps") == reader.EventData(2).Timestamps);
        REQUIRE(read_doubles(file, "/events/Comment/timestamps") == reader.EventData(3).Timestamps);
        REQUIRE(read_doubles(file, "/segments/Spikes 1/segment_0003/data") == reader.SegmentData(4, 3).Data);
        REQUIRE(read_doubles(file, "/neural/Units 1/timestamps") == reader.NeuralData(5).Timestamps);

        // unknown entities are skipped
        REQUIRE(!exists(file, "/analog/Mystery"));
    }

    fs::remove(destination);
}

TEST_CASE("summary text", "[correct]") {
    ConversionSummary x;
    x.Converted = 3;
    x.Failed.push_back({ 6, "Broken", "read error" });

    std::ostringstream oss;
    oss << x;
    REQUIRE(oss.str() == "3 entities converted, 1 failed\n6 'Broken': read error");
}

TEST_CASE("missing source", "[correct]") {
    auto lib{ std::make_shared<fake_library>(full_recording()) };
    REQUIRE_THROWS_AS(Hdf5Converter("missing.mcd", "missing.h5", lib).Convert(), McdNotFound);
    REQUIRE(lib->total_calls() == 0);
    REQUIRE(!fs::exists("missing.h5"));

    REQUIRE_THROWS_AS(ConvertToHdf5("missing.mcd", "missing.h5"), McdNotFound);
}

TEST_CASE("destination can not be created", "[correct]") {
    temporary_file source{ "unwritable.mcd" };
    auto lib{ std::make_shared<fake_library>(full_recording()) };

    REQUIRE_THROWS_AS(Hdf5Converter(source.path(), fs::path{ "no_such_directory" } / "out.h5", lib).Convert(), McdOpenError);
    REQUIRE(lib->open_count() == 0);
}

} /* namespace test */ } /* namespace impl */ } /* namespace mcd */
