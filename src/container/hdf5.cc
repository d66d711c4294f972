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

#include "container/hdf5.h"

#include <optional>
#include <sstream>

#include "H5Cpp.h"

#include "arithmetic.h"
#include "exception.h"
#include "logger.h"


namespace mcd { namespace impl {

    using namespace mcd::api::v1;

    auto hdf5_available() -> bool {
        return true;
    }


    static
    auto hdf5_error(const std::string& func, const std::string& what, const H5::Exception& x) -> std::string {
        std::ostringstream oss;
        oss << "[" << func << ", hdf5] " << what << ": " << x.getDetailMsg();
        return oss.str();
    }

    // H5::Exception is not derived from std::exception
    template<typename F>
    static
    auto translate(const std::string& func, const std::string& what, F f) -> decltype(f()) {
        try {
            return f();
        }
        catch (const H5::Exception& x) {
            const auto e{ hdf5_error(func, what, x) };
            mcd_log_error(e);
            throw McdData{ e };
        }
    }

    static
    auto utf8_string_type() -> H5::StrType {
        H5::StrType result{ H5::PredType::C_S1, H5T_VARIABLE };
        result.setCset(H5T_CSET_UTF8);
        return result;
    }


    struct hdf5_group::impl
    {
        H5::Group group;
        std::string path;
    };

    hdf5_group::hdf5_group(std::shared_ptr<impl> x)
    : p{ std::move(x) } {
    }

    auto hdf5_group::create_group(const std::string& name) -> hdf5_group {
        const auto child{ p->path == "/" ? "/" + name : p->path + "/" + name };
        return translate("create_group", child, [&]() -> hdf5_group {
            return hdf5_group{ std::make_shared<impl>(impl{ p->group.createGroup(name), child }) };
        });
    }

    auto hdf5_group::write_dataset(const std::string& name, const std::vector<double>& xs) -> void {
        translate("write_dataset", p->path + "/" + name, [&]() -> void {
            const hsize_t dims[]{ xs.size() };
            H5::DataSpace space{ 1, dims };
            H5::DataSet dataset{ p->group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space) };
            if (!xs.empty()) {
                dataset.write(xs.data(), H5::PredType::NATIVE_DOUBLE);
            }
        });
    }

    auto hdf5_group::write_dataset(const std::string& name, const std::vector<double>& xs, size_t rows, size_t columns) -> void {
        if (multiply(rows, columns, guarded{}) != xs.size()) {
            std::ostringstream oss;
            oss << "[write_dataset, hdf5] " << p->path << "/" << name << ": " << xs.size() << " elements, " << rows << "x" << columns << " expected";
            const auto e{ oss.str() };
            mcd_log_critical(e);
            throw McdBug{ e };
        }

        translate("write_dataset", p->path + "/" + name, [&]() -> void {
            const hsize_t dims[]{ rows, columns };
            H5::DataSpace space{ 2, dims };
            H5::DataSet dataset{ p->group.createDataSet(name, H5::PredType::NATIVE_DOUBLE, space) };
            if (!xs.empty()) {
                dataset.write(xs.data(), H5::PredType::NATIVE_DOUBLE);
            }
        });
    }

    auto hdf5_group::double_attribute(const std::string& name, double x) -> void {
        translate("double_attribute", p->path + "@" + name, [&]() -> void {
            H5::Attribute attribute{ p->group.createAttribute(name, H5::PredType::NATIVE_DOUBLE, H5::DataSpace{ H5S_SCALAR }) };
            attribute.write(H5::PredType::NATIVE_DOUBLE, &x);
        });
    }

    auto hdf5_group::int64_attribute(const std::string& name, int64_t x) -> void {
        translate("int64_attribute", p->path + "@" + name, [&]() -> void {
            H5::Attribute attribute{ p->group.createAttribute(name, H5::PredType::NATIVE_INT64, H5::DataSpace{ H5S_SCALAR }) };
            attribute.write(H5::PredType::NATIVE_INT64, &x);
        });
    }

    auto hdf5_group::string_attribute(const std::string& name, const std::string& x) -> void {
        translate("string_attribute", p->path + "@" + name, [&]() -> void {
            const auto type{ utf8_string_type() };
            H5::Attribute attribute{ p->group.createAttribute(name, type, H5::DataSpace{ H5S_SCALAR }) };
            attribute.write(type, H5std_string{ x });
        });
    }


    struct hdf5_file::impl
    {
        std::optional<H5::H5File> file;
        std::string name;
    };

    hdf5_file::hdf5_file(const std::filesystem::path& fname)
    : p{ std::make_unique<impl>() } {
        H5::Exception::dontPrint();

        p->name = fname.string();
        try {
            p->file.emplace(p->name, H5F_ACC_TRUNC);
        }
        catch (const H5::Exception& x) {
            const auto e{ hdf5_error("hdf5_file", p->name, x) };
            mcd_log_error(e);
            throw McdOpenError{ e };
        }
    }

    hdf5_file::~hdf5_file() {
        try {
            close();
        }
        catch (const McdData& x) {
            mcd_log_warning(x.what());
        }
    }

    auto hdf5_file::root() -> hdf5_group {
        if (!p->file) {
            const std::string e{ "[root, hdf5] " + p->name + " is closed" };
            mcd_log_critical(e);
            throw McdBug{ e };
        }

        return translate("root", p->name, [&]() -> hdf5_group {
            return hdf5_group{ std::make_shared<hdf5_group::impl>(hdf5_group::impl{ p->file->openGroup("/"), "/" }) };
        });
    }

    auto hdf5_file::close() -> void {
        if (!p->file) {
            return;
        }

        translate("close", p->name, [&]() -> void {
            p->file->flush(H5F_SCOPE_GLOBAL);
        });
        p->file.reset();
    }

} /* namespace impl */ } /* namespace mcd */
