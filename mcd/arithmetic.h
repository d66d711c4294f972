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
#include <limits>
#include <optional>
#include <sstream>
#include <string>
#include <type_traits>

#include "exception.h"
#include "logger.h"


namespace mcd { namespace impl {

    // the public interface counts in int64_t, the native interface in uint32_t/int32_t.
    // every conversion between the two goes through cast(x, T{}, guard).

    template<typename S, typename D>
    constexpr
    auto maybe_cast(S s, D) -> std::optional<D> {
        static_assert(std::is_integral<S>::value);
        static_assert(std::is_integral<D>::value);

        if constexpr (std::is_signed<S>::value && std::is_unsigned<D>::value) {
            if (s < 0) {
                return std::nullopt;
            }
            if (static_cast<uintmax_t>(s) > static_cast<uintmax_t>(std::numeric_limits<D>::max())) {
                return std::nullopt;
            }
        }
        else if constexpr (std::is_unsigned<S>::value && std::is_signed<D>::value) {
            if (static_cast<uintmax_t>(s) > static_cast<uintmax_t>(std::numeric_limits<D>::max())) {
                return std::nullopt;
            }
        }
        else if constexpr (std::is_signed<S>::value) {
            if (static_cast<intmax_t>(s) < static_cast<intmax_t>(std::numeric_limits<D>::min())) {
                return std::nullopt;
            }
            if (static_cast<intmax_t>(s) > static_cast<intmax_t>(std::numeric_limits<D>::max())) {
                return std::nullopt;
            }
        }
        else {
            if (static_cast<uintmax_t>(s) > static_cast<uintmax_t>(std::numeric_limits<D>::max())) {
                return std::nullopt;
            }
        }

        return static_cast<D>(s);
    }


    template<typename Source, typename Dest>
    auto invalid_cast(Source a, Dest) -> std::string {
        constexpr const auto min_b{ std::numeric_limits<Dest>::min() };
        constexpr const auto max_b{ std::numeric_limits<Dest>::max() };

        std::ostringstream oss;
        oss << "[invalid cast, arithmetic] " << +a << " to [" << +min_b << ",  " << +max_b << "]";
        return oss.str();
    }

    template<typename T>
    auto invalid_multiplication(T a, T b) -> std::string {
        std::ostringstream oss;
        oss << "[invalid multiplication, arithmetic] " << +a << " * " << +b;
        return oss.str();
    }

    template<typename T>
    constexpr
    auto maybe_multiply(T a, T b) -> std::optional<T> {
        static_assert(std::is_unsigned<T>::value);

        if (a != 0 && std::numeric_limits<T>::max() / a < b) {
            return std::nullopt;
        }
        return static_cast<T>(a * b);
    }


    // the value comes from this library: failure is a bug
    struct guarded
    {
        template<typename T, typename U>
        auto cast(T x, U type_tag) const -> U {
            const auto maybe_y{ maybe_cast(x, type_tag) };
            if (!maybe_y) {
                const auto e{ invalid_cast(x, type_tag) };
                mcd_log_critical(e);
                throw api::v1::McdBug{ e };
            }

            return *maybe_y;
        }

        template<typename T>
        auto mul(T a, T b) const -> T {
            const auto maybe_y{ maybe_multiply(a, b) };
            if (!maybe_y) {
                const auto e{ invalid_multiplication(a, b) };
                mcd_log_critical(e);
                throw api::v1::McdBug{ e };
            }

            return *maybe_y;
        }
    };


    // the value comes from the client or from the native library
    struct ok
    {
        template<typename T, typename U>
        auto cast(T x, U type_tag) const -> U {
            const auto maybe_y{ maybe_cast(x, type_tag) };
            if (!maybe_y) {
                const auto e{ invalid_cast(x, type_tag) };
                mcd_log_error(e);
                throw api::v1::McdOutOfRange{ e };
            }

            return *maybe_y;
        }

        template<typename T>
        auto mul(T a, T b) const -> T {
            const auto maybe_y{ maybe_multiply(a, b) };
            if (!maybe_y) {
                const auto e{ invalid_multiplication(a, b) };
                mcd_log_error(e);
                throw api::v1::McdOutOfRange{ e };
            }

            return *maybe_y;
        }
    };


    template<typename T, typename U, typename Guard>
    constexpr
    auto cast(T a, U b, Guard guard) -> U {
        return guard.cast(a, b);
    }

    template<typename T, typename Guard>
    constexpr
    auto multiply(T a, T b, Guard guard) -> T {
        return guard.mul(a, b);
    }

    auto as_sizet(int64_t) -> size_t;

} /* namespace impl */ } /* namespace mcd */
