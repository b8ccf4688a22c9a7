// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "math.hpp"
#include "util/common/hash.hpp"

namespace erc {
    auto uint256be_from_hex(const std::string& hex)
        -> std::optional<evmc::uint256be> {
        auto maybe_bytes = erc::buffer::from_hex_prefixed(hex);
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }
        auto ret = evmc::uint256be();
        auto& bytes = maybe_bytes.value();
        if(bytes.size() > sizeof(ret)) {
            return std::nullopt;
        }
        if(bytes.empty()) {
            return ret;
        }
        std::memcpy(&ret.bytes[sizeof(ret) - bytes.size()],
                    bytes.data(),
                    bytes.size());
        return ret;
    }

    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be> {
        if(str.rfind("0x", 0) == 0) {
            if(str.size() == 2) {
                return std::nullopt;
            }
            return uint256be_from_hex(str);
        }
        return from_decimal(str);
    }

    auto eth_addr(const secp256k1_pubkey& pk,
                  const std::shared_ptr<secp256k1_context>& ctx)
        -> evmc::address {
        static constexpr int uncompressed_pubkey_len = 65;
        auto pubkey_serialized
            = std::array<unsigned char, uncompressed_pubkey_len>();
        auto pubkey_size = pubkey_serialized.size();
        [[maybe_unused]] const auto ser_ret
            = ::secp256k1_ec_pubkey_serialize(ctx.get(),
                                              pubkey_serialized.data(),
                                              &pubkey_size,
                                              &pk,
                                              SECP256K1_EC_UNCOMPRESSED);

        // The address is the low 20 bytes of the hash of the key without its
        // 0x04 prefix byte.
        auto addr_hash = erc::keccak_data(pubkey_serialized.data() + 1,
                                          uncompressed_pubkey_len - 1);
        auto addr = evmc::address();
        constexpr auto addr_offset = addr_hash.size() - sizeof(addr.bytes);
        std::memcpy(addr.bytes,
                    addr_hash.data() + addr_offset,
                    sizeof(addr.bytes));
        return addr;
    }

    auto eth_addr(const privkey_t& key,
                  const std::shared_ptr<secp256k1_context>& ctx)
        -> std::optional<evmc::address> {
        auto pk = secp256k1_pubkey();
        if(::secp256k1_ec_pubkey_create(ctx.get(), &pk, key.data()) != 1) {
            return std::nullopt;
        }
        return eth_addr(pk, ctx);
    }

    auto make_secp_context() -> std::shared_ptr<secp256k1_context> {
        return std::shared_ptr<secp256k1_context>(
            secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                     | SECP256K1_CONTEXT_VERIFY),
            &secp256k1_context_destroy);
    }
}
