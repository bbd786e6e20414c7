// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <QImage>

namespace scrawl {
namespace ui {
    namespace raster {

        // 8 bit RGBA PNG in memory. Throws std::runtime_error on failure.
        std::vector<uint8_t> encode_png(const QImage &image);

        // RFC 2397 "data:image/png;base64,..." form of encoded bytes
        std::string png_data_url(const std::vector<uint8_t> &png_bytes);

        void write_file(const std::vector<uint8_t> &bytes, const std::string &path);

    } // namespace raster
} // namespace ui
} // namespace scrawl
