/*
 * Copyright 2025 Warden Contributors
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


// Warden Base64 - Header
// RFC 4648 base64 and base64url codecs backed by OpenSSL

#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace warden::core {

/// Base64url encode without padding (RFC 4648 §5)
[[nodiscard]] std::string base64url_encode(std::string_view input);

/// Base64url decode; padding is optional. Returns nullopt on invalid input.
[[nodiscard]] std::optional<std::string> base64url_decode(std::string_view input);

/// Standard padded base64 encode
[[nodiscard]] std::string base64_encode(std::string_view input);

/// Strict standard base64 decode: length must be a multiple of 4 and
/// padding may only appear at the end
[[nodiscard]] std::optional<std::string> base64_decode(std::string_view input);

}  // namespace warden::core
