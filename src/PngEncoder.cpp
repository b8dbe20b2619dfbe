#define STB_IMAGE_WRITE_IMPLEMENTATION
#include <stb_image_write.h>

#include <fstream>
#include <stdexcept>
#include <vector>
#include <cstdint>
#include "Bitmap.hpp"
#include "PngEncoder.hpp"

namespace
{
    void appendChunk(void* context, void* data, int size)
    {
        auto* out = static_cast<std::string*>(context);
        out->append(static_cast<const char*>(data), static_cast<std::size_t>(size));
    }
}

std::string PngEncoder::encode(Bitmap const& bitmap)
{
    std::vector<std::uint8_t> gray;
    gray.reserve(bitmap.data().size());
    for (auto px : bitmap.data())
        gray.push_back(px ? 255 : 0);

    std::string out;
    int ok = stbi_write_png_to_func(appendChunk, &out,
                                    bitmap.getWidth(), bitmap.getHeight(), 1,
                                    gray.data(), bitmap.getWidth());
    if (!ok)
        throw std::runtime_error("PNG encoding failed");

    return out;
}

void PngEncoder::writeFile(Bitmap const& bitmap, std::string const& path)
{
    std::string png = encode(bitmap);

    std::ofstream file(path, std::ios::binary);
    if (!file.is_open())
        throw std::runtime_error("Could not open " + path + " for writing");

    file.write(png.data(), static_cast<std::streamsize>(png.size()));
    if (!file.good())
        throw std::runtime_error("Failed writing " + path);
}
