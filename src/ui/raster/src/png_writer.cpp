// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <stdexcept>

#include <QBuffer>
#include <QByteArray>
#include <QImageWriter>

#include <fmt/format.h>

#include "scrawl/ui/raster/png_writer.hpp"

using namespace scrawl::ui::raster;

std::vector<uint8_t> scrawl::ui::raster::encode_png(const QImage &image) {

    if (image.isNull())
        throw std::runtime_error("Cannot encode an empty image");

    QByteArray bytes;
    QBuffer buffer(&bytes);
    buffer.open(QIODevice::WriteOnly);

    QImageWriter writer(&buffer, "PNG");
    if (!writer.write(image.convertToFormat(QImage::Format_ARGB32)))
        throw std::runtime_error(
            fmt::format("PNG encoding failed: {}", writer.errorString().toStdString()));

    return std::vector<uint8_t>(bytes.begin(), bytes.end());
}

std::string scrawl::ui::raster::png_data_url(const std::vector<uint8_t> &bytes) {

    const auto encoded =
        QByteArray(reinterpret_cast<const char *>(bytes.data()), qsizetype(bytes.size()))
            .toBase64();
    return "data:image/png;base64," + encoded.toStdString();
}

void scrawl::ui::raster::write_file(const std::vector<uint8_t> &bytes, const std::string &path) {

    std::ofstream o(path, std::ios::binary | std::ios::trunc);
    if (!o.is_open())
        throw std::runtime_error(fmt::format("Failed to open \"{}\" for writing", path));
    o.write(reinterpret_cast<const char *>(bytes.data()), std::streamsize(bytes.size()));
    if (!o.good())
        throw std::runtime_error(fmt::format("Failed to write \"{}\"", path));
}
