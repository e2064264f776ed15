/*
 * Copyright 2026 Switchback Contributors
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

// Switchback Compression Codec - Header
// Gzip and Zstd decoders used to make upstream bodies readable

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// Forward declarations for compression library types
struct z_stream_s;
typedef struct z_stream_s z_stream;
struct ZSTD_DCtx_s;
typedef struct ZSTD_DCtx_s ZSTD_DCtx;

namespace switchback::core {

/// Content encodings understood by the codec
enum class CompressionEncoding : uint8_t { NONE = 0, GZIP = 1, ZSTD = 2 };

/// Convert encoding enum to string (Content-Encoding value)
[[nodiscard]] constexpr const char* encoding_to_string(CompressionEncoding encoding) noexcept {
    switch (encoding) {
        case CompressionEncoding::GZIP:
            return "gzip";
        case CompressionEncoding::ZSTD:
            return "zstd";
        default:
            return "";
    }
}

/// Case-insensitive string equality check for encoding names
[[nodiscard]] constexpr bool encoding_equals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        char ca = (a[i] >= 'A' && a[i] <= 'Z') ? (a[i] + 32) : a[i];
        char cb = (b[i] >= 'A' && b[i] <= 'Z') ? (b[i] + 32) : b[i];
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

/// Parse a Content-Encoding header value
[[nodiscard]] constexpr CompressionEncoding encoding_from_string(
    std::string_view encoding) noexcept {
    if (encoding_equals(encoding, "gzip")) {
        return CompressionEncoding::GZIP;
    } else if (encoding_equals(encoding, "zstd")) {
        return CompressionEncoding::ZSTD;
    } else {
        return CompressionEncoding::NONE;
    }
}

/// Gzip magic bytes (1f 8b)
inline constexpr unsigned char GZIP_MAGIC[2] = {0x1f, 0x8b};

/// Zstandard frame magic bytes (28 b5 2f fd)
inline constexpr unsigned char ZSTD_MAGIC[4] = {0x28, 0xb5, 0x2f, 0xfd};

/// Detect a compressed payload from its leading bytes
[[nodiscard]] CompressionEncoding sniff_encoding(std::string_view data) noexcept;

/// Decode outcome
enum class DecodeStatus : uint8_t {
    OK,       // Complete stream decoded
    PARTIAL,  // Input ended mid-stream after producing output
    FAILED    // Corrupt input, or nothing could be decoded
};

struct DecodeResult {
    DecodeStatus status = DecodeStatus::FAILED;
    std::string data;
};

/// Gzip/zlib decompression context (reusable)
class GzipDecoder {
public:
    GzipDecoder();
    ~GzipDecoder();

    // Non-copyable, non-movable
    GzipDecoder(const GzipDecoder&) = delete;
    GzipDecoder& operator=(const GzipDecoder&) = delete;
    GzipDecoder(GzipDecoder&&) = delete;
    GzipDecoder& operator=(GzipDecoder&&) = delete;

    /// Inflate a complete buffer (concatenated gzip members are joined)
    [[nodiscard]] DecodeResult decode(std::string_view input);

    [[nodiscard]] bool initialized() const noexcept { return initialized_; }

private:
    z_stream* stream_;
    bool initialized_;
};

/// Zstandard decompression context (reusable)
class ZstdDecoder {
public:
    ZstdDecoder();
    ~ZstdDecoder();

    // Non-copyable, non-movable
    ZstdDecoder(const ZstdDecoder&) = delete;
    ZstdDecoder& operator=(const ZstdDecoder&) = delete;
    ZstdDecoder(ZstdDecoder&&) = delete;
    ZstdDecoder& operator=(ZstdDecoder&&) = delete;

    /// Decompress a complete buffer (multiple frames are joined)
    [[nodiscard]] DecodeResult decode(std::string_view input);

    [[nodiscard]] bool initialized() const noexcept { return dctx_ != nullptr; }

private:
    ZSTD_DCtx* dctx_;
};

/// Make an upstream body readable.
///
/// A declared gzip or zstd Content-Encoding is decoded; a stream that breaks
/// off yields the bytes decoded so far, and a stream that cannot be decoded
/// at all yields the raw bytes. With no declared encoding, payloads starting
/// with the gzip or zstd magic are decoded when possible. Never fails.
[[nodiscard]] std::string read_body(std::string_view content_encoding, std::string_view raw);

}  // namespace switchback::core
