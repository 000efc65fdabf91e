/**
 * @file random.hpp
 * @brief Credential generation from the OpenSSL CSPRNG.
 *
 * Session IDs, PINs and peer-id suffixes are drawn with RAND_bytes and
 * mapped onto their alphabet by rejection sampling, so every symbol is
 * equally likely.
 */
#pragma once
#include "remotectl/core/util/error_types.hpp"
#include <openssl/rand.h>
#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace remotectl {

    /**
     * @brief Fill @p buf with cryptographically secure random bytes.
     * @throws RemotePeerError (ServerError) when the CSPRNG is unavailable
     */
    template <size_t N>
    inline void randomFill(std::array<uint8_t, N>& buf)
    {
        if (RAND_bytes(buf.data(), static_cast<int>(N)) != 1)
            throw RemotePeerError(PeerErr::ServerError, "Secure random generator unavailable");
    }

    /**
     * @brief Uniform integer in [0, bound).
     * @throws RemotePeerError (ServerError) when the CSPRNG is unavailable
     */
    inline uint32_t randomBelow(uint32_t bound)
    {
        if (bound <= 1) return 0;
        // largest multiple of bound that fits; draws at or above it are retried
        const uint64_t range = uint64_t{ 1 } << 32;
        const uint64_t limit = range - (range % bound);
        for (;;) {
            std::array<uint8_t, 4> b{};
            randomFill(b);
            uint64_t v = uint64_t{ b[0] } | (uint64_t{ b[1] } << 8)
                       | (uint64_t{ b[2] } << 16) | (uint64_t{ b[3] } << 24);
            if (v < limit) return static_cast<uint32_t>(v % bound);
        }
    }

    inline std::string randomString(std::string_view alphabet, size_t length)
    {
        std::string out;
        out.reserve(length);
        for (size_t i = 0; i < length; ++i)
            out.push_back(alphabet[randomBelow(static_cast<uint32_t>(alphabet.size()))]);
        return out;
    }

    /// 8 characters from [A-Z0-9].
    inline std::string generateSessionId()
    {
        return randomString("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789", 8);
    }

    /// 6 decimal digits, leading zeros allowed.
    inline std::string generatePin()
    {
        return randomString("0123456789", 6);
    }

}
