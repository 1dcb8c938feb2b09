// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef DAGPOOL_SRC_SERIALIZATION_SIZE_SERIALIZER_H_
#define DAGPOOL_SRC_SERIALIZATION_SIZE_SERIALIZER_H_

#include "serializer.hpp"

namespace dagpool {
    /// Counts the bytes a sequence of objects would occupy once serialized,
    /// without writing them anywhere. Used by the proposer to account for
    /// the payload size of pending batch digests. Reading always fails.
    class size_serializer final : public serializer {
      public:
        size_serializer() = default;

        /// Serialization always succeeds for size serializer.
        /// \return true.
        explicit operator bool() const final;

        void advance_cursor(size_t len) final;

        /// Resets the size counter to zero.
        void reset() final;

        /// No-op; size counting cannot fail.
        void invalidate() final;

        /// \return false.
        [[nodiscard]] auto end_of_buffer() const -> bool final;

        /// Increases the size counter by the given number of bytes.
        /// \return true.
        auto write(const void* data, size_t len) -> bool final;

        /// \return false.
        auto read(void* data, size_t len) -> bool final;

        /// Returns the number of bytes accumulated so far.
        [[nodiscard]] auto size() const -> size_t;

      private:
        size_t m_cursor{};
    };
}

#endif // DAGPOOL_SRC_SERIALIZATION_SIZE_SERIALIZER_H_
