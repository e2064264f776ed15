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

// Switchback Compression Codec - Implementation

#include "compression.hpp"

#include <zlib.h>
#include <zstd.h>

#include <algorithm>
#include <cstring>
#include <vector>

#include "logging.hpp"

namespace switchback::core {

namespace {

constexpr size_t CHUNK_SIZE = 16384;  // 16KB output chunks

DecodeResult finish(std::string&& output, bool complete) {
    DecodeResult result;
    if (complete) {
        result.status = DecodeStatus::OK;
    } else {
        result.status = output.empty() ? DecodeStatus::FAILED : DecodeStatus::PARTIAL;
    }
    result.data = std::move(output);
    return result;
}

// Data errors and checksum mismatches discard whatever was produced
DecodeResult corrupt() {
    return DecodeResult{DecodeStatus::FAILED, {}};
}

}  // namespace

CompressionEncoding sniff_encoding(std::string_view data) noexcept {
    const auto* bytes = reinterpret_cast<const unsigned char*>(data.data());
    if (data.size() >= sizeof(GZIP_MAGIC) &&
        std::memcmp(bytes, GZIP_MAGIC, sizeof(GZIP_MAGIC)) == 0) {
        return CompressionEncoding::GZIP;
    }
    if (data.size() >= sizeof(ZSTD_MAGIC) &&
        std::memcmp(bytes, ZSTD_MAGIC, sizeof(ZSTD_MAGIC)) == 0) {
        return CompressionEncoding::ZSTD;
    }
    return CompressionEncoding::NONE;
}

// ============================================================================
// GzipDecoder Implementation
// ============================================================================

GzipDecoder::GzipDecoder() : stream_(new z_stream{}), initialized_(false) {
    stream_->zalloc = Z_NULL;
    stream_->zfree = Z_NULL;
    stream_->opaque = Z_NULL;

    // windowBits=15+32: accept both gzip and zlib headers
    int ret = inflateInit2(stream_, 15 + 32);
    initialized_ = (ret == Z_OK);
}

GzipDecoder::~GzipDecoder() {
    if (initialized_ && stream_) {
        inflateEnd(stream_);
    }
    delete stream_;
}

DecodeResult GzipDecoder::decode(std::string_view input) {
    std::string output;
    if (!initialized_ || input.empty()) {
        return finish(std::move(output), false);
    }

    inflateReset(stream_);

    std::vector<unsigned char> chunk(CHUNK_SIZE);
    stream_->next_in = reinterpret_cast<Bytef*>(const_cast<char*>(input.data()));
    stream_->avail_in = static_cast<uInt>(input.size());

    bool stream_end = false;
    while (true) {
        stream_->next_out = chunk.data();
        stream_->avail_out = static_cast<uInt>(chunk.size());

        int ret = inflate(stream_, Z_NO_FLUSH);
        size_t have = chunk.size() - stream_->avail_out;
        output.append(reinterpret_cast<const char*>(chunk.data()), have);

        if (ret == Z_STREAM_END) {
            stream_end = true;
            if (stream_->avail_in == 0) {
                break;
            }
            // Another gzip member follows
            inflateReset(stream_);
            stream_end = false;
            continue;
        }
        if (ret == Z_BUF_ERROR) {
            break;  // Truncated input
        }
        if (ret != Z_OK) {
            return corrupt();  // Z_DATA_ERROR, Z_NEED_DICT or Z_MEM_ERROR
        }
        if (stream_->avail_in == 0 && have == 0) {
            break;  // Input exhausted mid-stream
        }
    }

    return finish(std::move(output), stream_end);
}

// ============================================================================
// ZstdDecoder Implementation
// ============================================================================

ZstdDecoder::ZstdDecoder() : dctx_(ZSTD_createDCtx()) {}

ZstdDecoder::~ZstdDecoder() {
    if (dctx_) {
        ZSTD_freeDCtx(dctx_);
    }
}

DecodeResult ZstdDecoder::decode(std::string_view input) {
    std::string output;
    if (!dctx_ || input.empty()) {
        return finish(std::move(output), false);
    }

    ZSTD_DCtx_reset(dctx_, ZSTD_reset_session_only);

    std::vector<char> chunk(std::max(CHUNK_SIZE, ZSTD_DStreamOutSize()));
    ZSTD_inBuffer in = {input.data(), input.size(), 0};

    // 0 means the last frame was fully decoded and flushed
    size_t last_ret = 1;
    while (in.pos < in.size || last_ret != 0) {
        ZSTD_outBuffer out = {chunk.data(), chunk.size(), 0};
        size_t ret = ZSTD_decompressStream(dctx_, &out, &in);
        if (ZSTD_isError(ret)) {
            return corrupt();
        }
        output.append(chunk.data(), out.pos);
        last_ret = ret;

        // No input left and no output produced: frame is truncated
        if (in.pos == in.size && out.pos < out.size && ret != 0) {
            break;
        }
    }

    return finish(std::move(output), last_ret == 0);
}

// ============================================================================
// Body reading
// ============================================================================

static DecodeResult decode_with(CompressionEncoding encoding, std::string_view raw) {
    if (encoding == CompressionEncoding::GZIP) {
        GzipDecoder decoder;
        return decoder.decode(raw);
    }
    ZstdDecoder decoder;
    return decoder.decode(raw);
}

std::string read_body(std::string_view content_encoding, std::string_view raw) {
    auto* logger = logging::get_logger();

    CompressionEncoding declared = encoding_from_string(content_encoding);
    if (declared != CompressionEncoding::NONE) {
        DecodeResult result = decode_with(declared, raw);
        switch (result.status) {
            case DecodeStatus::OK:
                return std::move(result.data);
            case DecodeStatus::PARTIAL:
                LOG_WARNING(logger, "{} body broke off after {} decoded bytes, keeping partial data",
                            encoding_to_string(declared), result.data.size());
                return std::move(result.data);
            case DecodeStatus::FAILED:
                LOG_WARNING(logger, "{} body could not be decoded, returning {} raw bytes",
                            encoding_to_string(declared), raw.size());
                return std::string{raw};
        }
    }

    // Only sniff when nothing was declared
    if (!content_encoding.empty()) {
        return std::string{raw};
    }

    CompressionEncoding sniffed = sniff_encoding(raw);
    if (sniffed == CompressionEncoding::NONE) {
        return std::string{raw};
    }

    DecodeResult result = decode_with(sniffed, raw);
    if (result.status != DecodeStatus::OK) {
        LOG_DEBUG(logger, "undeclared {} payload did not decode, returning raw bytes",
                  encoding_to_string(sniffed));
        return std::string{raw};
    }

    LOG_DEBUG(logger, "decoded undeclared {} payload: {} -> {} bytes",
              encoding_to_string(sniffed), raw.size(), result.data.size());
    return std::move(result.data);
}

}  // namespace switchback::core
