/*
 * Copyright 2025 Conduit Contributors
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

// Conduit Crypto Helpers - Implementation

#include "crypto.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <stdexcept>
#include <vector>

namespace conduit::core {

std::string sha256(std::string_view input) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digest_len = 0;

    if (EVP_Digest(input.data(), input.size(), digest, &digest_len, EVP_sha256(), nullptr) != 1) {
        throw std::runtime_error("EVP_Digest(sha256) failed");
    }

    return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::string base64_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    // 4 output chars per 3 input bytes, plus NUL written by EVP_EncodeBlock
    std::vector<unsigned char> buffer(4 * ((input.size() + 2) / 3) + 1);
    int written = EVP_EncodeBlock(buffer.data(), reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));

    return std::string(reinterpret_cast<const char*>(buffer.data()), static_cast<size_t>(written));
}

std::string random_hex(size_t num_bytes) {
    std::vector<unsigned char> bytes(num_bytes);
    if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    static constexpr char kHex[] = "0123456789abcdef";
    std::string out;
    out.reserve(num_bytes * 2);
    for (unsigned char b : bytes) {
        out += kHex[b >> 4];
        out += kHex[b & 0x0F];
    }
    return out;
}

}  // namespace conduit::core
