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


#include <iostream>
#include "mcd.h"

auto print_analog(const mcd::McdReader& reader, int64_t id) -> void {
    // the first 10 samples
    const auto x{ reader.AnalogData(id, 0, 10) };
    std::cout << x.Label << " [" << x.Units << ", " << x.SampleRate << " Hz]\n";
    for (size_t i{ 0 }; i < x.Data.size(); ++i) {
        std::cout << "  " << x.Timestamps[i] << "s " << x.Data[i] << "\n";
    }
}

auto print_events(const mcd::McdReader& reader, int64_t id) -> void {
    const auto x{ reader.EventData(id) };
    std::cout << x.Label << " [" << x.ValueType << "] " << x.Timestamps.size() << " events\n";

    if (std::holds_alternative<std::vector<std::string>>(x.Values)) {
        const auto& texts{ std::get<std::vector<std::string>>(x.Values) };
        for (size_t i{ 0 }; i < texts.size(); ++i) {
            std::cout << "  " << x.Timestamps[i] << "s " << texts[i] << "\n";
        }
        return;
    }

    const auto& numbers{ std::get<std::vector<double>>(x.Values) };
    for (size_t i{ 0 }; i < numbers.size(); ++i) {
        std::cout << "  " << x.Timestamps[i] << "s " << numbers[i] << "\n";
    }
}

auto print_segment(const mcd::McdReader& reader, int64_t id) -> void {
    if (reader.EntityInfo(id).Entity.ItemCount == 0) {
        return;
    }

    // samples x sources
    const auto x{ reader.SegmentData(id, 0) };
    std::cout << x.Label << " segment 0 at " << x.Timestamp << "s, unit " << x.UnitId << "\n";
    for (int64_t sample{ 0 }; sample < x.SampleCount; ++sample) {
        std::cout << " ";
        for (int64_t source{ 0 }; source < x.SourceCount; ++source) {
            std::cout << " " << x.At(sample, source);
        }
        std::cout << "\n";
    }
}

auto main(int argc, char* argv[]) -> int {
    try {
        const std::filesystem::path fname{ argc < 2 ? "example.mcd" : argv[1] };
        std::cout << "reading " << fname << "\n";
        std::cout << "mcd " << MCD_MAJOR << "." << MCD_MINOR << "." << MCD_PATCH << "." << MCD_BUILD << "\n";

        mcd::McdReader reader{ fname };
        std::cout << reader.Info() << "\n";

        for (const auto& x : reader.EntitiesByType(mcd::EntityType::Analog)) {
            print_analog(reader, x.Id);
        }
        for (const auto& x : reader.EntitiesByType("event")) {
            print_events(reader, x.Id);
        }
        for (const auto& x : reader.EntitiesByType(mcd::EntityType::Segment)) {
            print_segment(reader, x.Id);
        }

        for (const auto& x : reader.EntitiesByType(mcd::EntityType::Neural)) {
            const auto spikes{ reader.NeuralData(x.Id) };
            std::cout << spikes.Label << " " << spikes.Timestamps.size() << " spikes\n";
        }

        reader.Close();
    }
    catch(const mcd::McdNotFound& x) {
        std::cerr << x.what() << "\n";
        return 1;
    }
    catch(const mcd::McdOpenError& x) {
        std::cerr << x.what() << "\n";
        return 1;
    }
    catch(const std::exception& x) {
        std::cerr << x.what() << "\n";
        return 1;
    }

    return 0;
}
