#pragma once
#include <string>

namespace tlc {

struct Canvas {
    int width = 0;
    int height = 0;

    bool valid() const { return width > 0 && height > 0; }
    double ratio() const { return height > 0 ? static_cast<double>(width) / static_cast<double>(height) : 0.0; }
    bool is_portrait() const { return ratio() < 1.0; }
    bool is_landscape() const { return ratio() > 1.0; }
    std::string to_string() const { return std::to_string(width) + "x" + std::to_string(height); }

    bool operator==(const Canvas& o) const { return width == o.width && height == o.height; }
    bool operator!=(const Canvas& o) const { return !(*this == o); }
};

struct CropRect {
    int width = 0;
    int height = 0;
    int x = 0;
    int y = 0;
};

} // namespace tlc
