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


// Warden Base64 - Implementation

#include "base64.hpp"

#include <algorithm>
#include <vector>

#include <openssl/evp.h>

namespace warden::core {

namespace {

bool is_base64_char(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') ||
           c == '+' || c == '/';
}

// Decode a canonical padded base64 string (already validated)
std::optional<std::string> decode_block(std::string_view input) {
    if (input.empty()) {
        return std::string{};
    }

    std::vector<unsigned char> buffer(input.size() / 4 * 3 + 1);
    int decoded = EVP_DecodeBlock(buffer.data(),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    if (decoded < 0) {
        return std::nullopt;
    }

    // EVP_DecodeBlock counts padding bytes as zero output
    size_t padding = 0;
    if (input.back() == '=') {
        padding++;
        if (input[input.size() - 2] == '=') {
            padding++;
        }
    }

    return std::string(reinterpret_cast<const char*>(buffer.data()),
                       static_cast<size_t>(decoded) - padding);
}

}  // namespace

std::string base64_encode(std::string_view input) {
    if (input.empty()) {
        return "";
    }

    std::string result(4 * ((input.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()),
                                  reinterpret_cast<const unsigned char*>(input.data()),
                                  static_cast<int>(input.size()));
    result.resize(static_cast<size_t>(written));
    return result;
}

std::string base64url_encode(std::string_view input) {
    std::string result = base64_encode(input);

    // Replace '+' with '-', '/' with '_', remove '='
    std::replace(result.begin(), result.end(), '+', '-');
    std::replace(result.begin(), result.end(), '/', '_');
    result.erase(std::remove(result.begin(), result.end(), '='), result.end());

    return result;
}

std::optional<std::string> base64_decode(std::string_view input) {
    if (input.size() % 4 != 0) {
        return std::nullopt;
    }

    size_t data_end = input.find('=');
    if (data_end == std::string_view::npos) {
        data_end = input.size();
    }
    if (input.size() - data_end > 2) {
        return std::nullopt;
    }

    for (size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        if (i < data_end ? !is_base64_char(c) : c != '=') {
            return std::nullopt;
        }
    }

    return decode_block(input);
}

std::optional<std::string> base64url_decode(std::string_view input) {
    // Strip optional trailing padding
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
    }

    if (input.size() % 4 == 1) {
        return std::nullopt;
    }

    // Convert base64url to standard base64
    std::string base64(input);
    for (char& c : base64) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (!is_base64_char(c)) {
            return std::nullopt;
        }
    }

    base64.append((4 - (base64.size() % 4)) % 4, '=');
    return decode_block(base64);
}

}  // namespace warden::core
