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

#include "exception.h"
#include "logger.h"


namespace mcd { namespace impl {

    using namespace mcd::api::v1;

    auto result_name(ns_result x) -> std::string {
        switch (x) {
            case ns_ok: return "ns_OK";
            case ns_liberror: return "ns_LIBERROR";
            case ns_typeerror: return "ns_TYPEERROR";
            case ns_fileerror: return "ns_FILEERROR";
            case ns_badfile: return "ns_BADFILE";
            case ns_badentity: return "ns_BADENTITY";
            case ns_badsource: return "ns_BADSOURCE";
            case ns_badindex: return "ns_BADINDEX";
        }

        std::ostringstream oss;
        oss << "ns_UNKNOWN(" << x << ")";
        return oss.str();
    }


    auto last_error(native_library& lib) -> std::string {
        char buffer[256]{};
        if (lib.get_last_error_msg(buffer, sizeof(buffer)) != ns_ok) {
            return {};
        }
        return field2string(buffer);
    }


    template<typename E>
    [[noreturn]] static
    auto fail(const std::string& e) -> void {
        mcd_log_error(e);
        throw E{ e };
    }

    auto check(native_library& lib, ns_result x, const std::string& func, const std::string& what) -> void {
        if (x == ns_ok) {
            return;
        }

        std::ostringstream oss;
        oss << "[" << func << ", neuroshare] " << what << ": " << result_name(x);
        const auto native_msg{ last_error(lib) };
        if (!native_msg.empty()) {
            oss << " (" << native_msg << ")";
        }
        const auto e{ oss.str() };

        switch (x) {
            case ns_badentity: fail<McdNotFound>(e);
            case ns_badindex:
            case ns_badsource: fail<McdOutOfRange>(e);
            case ns_typeerror: fail<McdTypeMismatch>(e);
            case ns_badfile: fail<McdNotOpen>(e);
            default: fail<McdData>(e);
        }
    }

} /* namespace impl */ } /* namespace mcd */
