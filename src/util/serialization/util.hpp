// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_SERIALIZATION_UTIL_H_
#define DAGPOOL_SRC_SERIALIZATION_UTIL_H_

#include "buffer_serializer.hpp"
#include "size_serializer.hpp"

#include <memory>
#include <optional>

namespace dagpool {
    /// Calculates the serialized size in bytes of the given object when
    /// serialized using \ref serializer. \see \ref size_serializer.
    /// \tparam T type of object.
    /// \param obj object to serialize.
    /// \return serialized size in bytes.
    template<typename T>
    auto serialized_size(const T& obj) -> size_t {
        auto ser = size_serializer();
        ser << obj;
        return ser.size();
    }

    /// Serialize object into dagpool::buffer using a
    /// dagpool::buffer_serializer.
    /// \tparam T type of object to serialize.
    /// \return a serialized buffer of the object.
    template<typename T>
    auto make_buffer(const T& obj) -> buffer {
        auto pkt = buffer();
        auto ser = buffer_serializer(pkt);
        ser << obj;
        return pkt;
    }

    /// Serialize object into std::shared_ptr<dagpool::buffer> using a
    /// dagpool::buffer_serializer.
    template<typename T>
    auto make_shared_buffer(const T& obj) -> std::shared_ptr<buffer> {
        auto buf = std::make_shared<buffer>();
        auto ser = buffer_serializer(*buf);
        ser << obj;
        return buf;
    }

    /// Deserialize object of given type from a dagpool::buffer. Trailing
    /// bytes after the object are treated as a failure.
    /// \tparam T type of object to deserialize from the buffer.
    /// \param buf buffer from which to deserialize the object.
    /// \return deserialized object, or std::nullopt if the deserialization
    ///         failed.
    template<typename T>
    auto from_buffer(buffer& buf) -> std::optional<T> {
        auto deser = buffer_serializer(buf);
        T ret{};
        if(!(deser >> ret) || !deser.end_of_buffer()) {
            return std::nullopt;
        }
        return ret;
    }
}

#endif // DAGPOOL_SRC_SERIALIZATION_UTIL_H_
