// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_SERIALIZATION_FORMAT_H_
#define DAGPOOL_SRC_SERIALIZATION_FORMAT_H_

#include "serializer.hpp"
#include "util/common/buffer.hpp"
#include "util/common/config.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <map>
#include <set>
#include <variant>
#include <vector>

namespace dagpool {
    /// \brief Serializes a raw byte buffer.
    ///
    /// Writes the size of the buffer as a 64-bit uint, followed by the actual
    /// buffer data.
    ///
    /// \see \ref dagpool::operator>>(serializer&, buffer&)
    auto operator<<(serializer& ser, const buffer& b) -> serializer&;

    /// \brief Deserializes a raw byte buffer.
    auto operator>>(serializer& deser, buffer& b) -> serializer&;

    /// \brief Serializes the integral argument.
    ///
    /// Copies `sizeof(T)` bytes from `t` following machine endianness.
    ///
    /// \tparam T the integral type of the value to serialize
    /// \param t the value to serialize
    template<typename T>
    auto operator<<(serializer& s, T t) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        s.write(&t, sizeof(t));
        return s;
    }

    /// \brief Deserializes the integral argument.
    /// \see \ref dagpool::operator<<(serializer&, T)
    template<typename T>
    auto operator>>(serializer& s, T& t) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        s.read(&t, sizeof(t));
        return s;
    }

    /// Serializes the array of integral values in-order.
    /// \tparam T the underlying integral type
    /// \tparam len the length of the array to be serialized
    template<typename T, size_t len>
    auto operator<<(serializer& packet, const std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.write(arr.data(), sizeof(T) * len);
        return packet;
    }

    /// Deserializes the array of integral values in-order.
    template<typename T, size_t len>
    auto operator>>(serializer& packet, std::array<T, len>& arr) ->
        typename std::enable_if_t<std::is_integral_v<T>, serializer&> {
        packet.read(arr.data(), sizeof(T) * len);
        return packet;
    }

    /// Serializes a pair of values: first, then second.
    template<typename A, typename B>
    auto operator<<(serializer& ser, const std::pair<A, B>& p) -> serializer& {
        ser << p.first << p.second;
        return ser;
    }

    /// Deserializes a pair of values.
    template<typename A, typename B>
    auto operator>>(serializer& deser, std::pair<A, B>& p) -> serializer& {
        auto a = A();
        if(!(deser >> a)) {
            return deser;
        }

        auto b = B();
        if(!(deser >> b)) {
            return deser;
        }

        p = {std::move(a), std::move(b)};
        return deser;
    }

    /// Serializes the count of elements in the vector, and then each element
    /// in-order.
    template<typename T>
    auto operator<<(serializer& packet, const std::vector<T>& vec)
        -> serializer& {
        const auto len = static_cast<uint64_t>(vec.size());
        packet << len;
        for(const auto& elem : vec) {
            packet << elem;
        }
        return packet;
    }

    /// Deserializes a vector of elements. Reserves memory in bounded steps
    /// so a corrupt length prefix cannot force a huge allocation.
    template<typename T>
    auto operator>>(serializer& packet, std::vector<T>& vec) -> serializer& {
        static_assert(sizeof(T) <= config::maximum_reservation,
                      "Vector element size too large");

        uint64_t len{};
        if(!(packet >> len)) {
            return packet;
        }

        uint64_t allocated = 0;
        while(allocated < len) {
            allocated = std::min(
                len,
                allocated + config::maximum_reservation / sizeof(T));
            vec.reserve(allocated);
            while(vec.size() < allocated) {
                T val{};
                if(!(packet >> val)) {
                    return packet;
                }
                vec.push_back(std::move(val));
            }
        }

        vec.shrink_to_fit();
        return packet;
    }

    /// Serializes the count of key-value pairs, and then each key and value
    /// in key order.
    template<typename K, typename V, typename... Ts>
    auto operator<<(serializer& ser, const std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = static_cast<uint64_t>(map.size());
        ser << len;
        for(const auto& it : map) {
            ser << it.first;
            ser << it.second;
        }
        return ser;
    }

    /// Deserializes a map of key-value pairs.
    template<typename K, typename V, typename... Ts>
    auto operator>>(serializer& deser, std::map<K, V, Ts...>& map)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }

        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            if(!(deser >> key)) {
                return deser;
            }

            auto val = V();
            if(!(deser >> val)) {
                return deser;
            }

            map.emplace(std::move(key), std::move(val));
        }

        return deser;
    }

    /// Serializes the count of items, and then each item in order.
    template<typename K, typename... Ts>
    auto operator<<(serializer& ser, const std::set<K, Ts...>& set)
        -> serializer& {
        auto len = static_cast<uint64_t>(set.size());
        ser << len;
        for(const auto& key : set) {
            ser << key;
        }
        return ser;
    }

    /// Deserializes a set of items.
    template<typename K, typename... Ts>
    auto operator>>(serializer& deser, std::set<K, Ts...>& set)
        -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }

        for(uint64_t i = 0; i < len; i++) {
            auto key = K();
            if(!(deser >> key)) {
                return deser;
            }
            set.emplace(std::move(key));
        }
        return deser;
    }

    /// Serializes the variant index of the value, and then the value itself.
    template<typename... Ts>
    auto operator<<(serializer& ser, const std::variant<Ts...>& var)
        -> serializer& {
        using S = uint8_t;
        static_assert(
            std::variant_size_v<std::remove_reference_t<decltype(var)>> < std::
                numeric_limits<S>::max());
        auto idx = static_cast<S>(var.index());
        ser << idx;
        std::visit(
            [&](auto&& arg) {
                ser << arg;
            },
            var);
        return ser;
    }

    /// Deserializes a variant whose alternatives are default-constructible.
    /// An index outside the variant's alternatives invalidates the
    /// serializer.
    template<typename... Ts>
    auto operator>>(serializer& deser, std::variant<Ts...>& var)
        -> std::enable_if_t<(std::is_default_constructible_v<Ts> && ...),
                            serializer&> {
        using T = typename std::variant<Ts...>;
        using S = uint8_t;
        static_assert(std::variant_size_v<T> < std::numeric_limits<S>::max());
        S idx{};
        if(!(deser >> idx)) {
            return deser;
        }
        auto var_idx = static_cast<size_t>(idx);
        if(var_idx >= std::variant_size_v<T>) {
            deser.invalidate();
            return deser;
        }
        static constexpr auto make = std::array{+[]() {
            return T{std::in_place_type<Ts>};
        }...};
        var = make[var_idx]();
        std::visit(
            [&](auto&& arg) {
                deser >> arg;
            },
            var);
        return deser;
    }
}

#endif // DAGPOOL_SRC_SERIALIZATION_FORMAT_H_
