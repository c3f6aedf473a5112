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

// Conduit Crypto Helpers - Header
// Digest and encoding helpers over OpenSSL

#pragma once

#include <string>
#include <string_view>

namespace conduit::core {

/// SHA-256 digest (32 raw bytes)
[[nodiscard]] std::string sha256(std::string_view input);

/// Standard base64 with padding (RFC 4648 section 4)
[[nodiscard]] std::string base64_encode(std::string_view input);

/// Random bytes from the OpenSSL CSPRNG, hex encoded (2 chars per byte)
[[nodiscard]] std::string random_hex(size_t num_bytes);

}  // namespace conduit::core
