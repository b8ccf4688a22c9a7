// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "util/common/config.hpp"

#include <algorithm>

namespace erc {
    auto operator<<(serializer& ser, const buffer& b) -> serializer& {
        const auto len = static_cast<uint64_t>(b.size());
        ser << len;
        ser.write(b.data(), b.size());
        return ser;
    }

    auto operator>>(serializer& deser, buffer& b) -> serializer& {
        auto len = uint64_t();
        if(!(deser >> len)) {
            return deser;
        }

        b.clear();
        // Allocate at most maximum_reservation bytes ahead of the data read.
        while(b.size() < len) {
            const auto remaining = len - b.size();
            const auto chunk = static_cast<size_t>(
                std::min(remaining, config::maximum_reservation));
            const auto offset = b.size();
            b.extend(chunk);
            if(!deser.read(b.data_at(offset), chunk)) {
                return deser;
            }
        }

        return deser;
    }

    auto operator<<(serializer& ser, const std::string& s) -> serializer& {
        const auto len = static_cast<uint64_t>(s.size());
        ser << len;
        ser.write(s.data(), s.size());
        return ser;
    }

    auto operator>>(serializer& deser, std::string& s) -> serializer& {
        auto buf = buffer();
        if(!(deser >> buf)) {
            return deser;
        }
        if(buf.empty()) {
            s.clear();
        } else {
            s.assign(buf.c_str(), buf.size());
        }
        return deser;
    }
}
