// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

namespace dagpool {
    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        ser << static_cast<uint64_t>(b.size());
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        uint64_t sz{};
        if(!(deser >> sz)) {
            return deser;
        }

        b.clear();
        uint64_t read = 0;
        while(read < sz) {
            auto chunk = std::min(sz - read,
                                  static_cast<uint64_t>(
                                      config::maximum_reservation));
            auto prev = b.size();
            b.extend(chunk);
            if(!deser.read(b.data_at(prev), chunk)) {
                return deser;
            }
            read += chunk;
        }

        return deser;
    }
}
