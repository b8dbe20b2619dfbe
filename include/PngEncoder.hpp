#pragma once
#include <string>

class Bitmap;

class PngEncoder
{
public:
    // 8-bit grayscale PNG, black 0 and white 255.
    static std::string encode(Bitmap const& bitmap);
    static void writeFile(Bitmap const& bitmap, std::string const& path);
};
