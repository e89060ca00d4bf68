// SOLSAFE - Secure Random Number Generation Implementation
// Copyright (c) 2024 SOLSAFE Developers
// MIT License

#include "solsafe/core/random.h"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <stdexcept>
#include <string>

namespace solsafe {

void GetRandBytes(Byte* buf, size_t len) {
    // RAND_bytes takes an int length
    while (len > 0) {
        int chunk = len > static_cast<size_t>(INT_MAX) ? INT_MAX : static_cast<int>(len);
        if (RAND_bytes(buf, chunk) != 1) {
            unsigned long err = ERR_get_error();
            char reason[256] = {0};
            ERR_error_string_n(err, reason, sizeof(reason));
            throw std::runtime_error(std::string("RAND_bytes failed: ") + reason);
        }
        buf += chunk;
        len -= static_cast<size_t>(chunk);
    }
}

} // namespace solsafe
