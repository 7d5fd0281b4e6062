#include <png.h>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>

#include "prism/error.hpp"
#include "prism/image.hpp"

namespace prism {

namespace {
int to_byte(double c) {
    return static_cast<int>(std::lround(std::clamp(c, 0.0, 1.0) * 255));
}
}

Image::Image() {}

Image::Image(int w, int h) {
    set_size(w, h);
}

void Image::set_size(int w, int h) {
    this->width = w;
    this->height = h;
    data.assign(static_cast<std::size_t>(w) * h, glm::dvec3(0.0));
}

Tuple Image::get(int x, int y) const {
    if (x < 0 || x >= height || y < 0 || y >= width) throw precondition_error("pixel out of range");
    return Tuple(data[x * width + y], TupleKind::Color);
}

void Image::set(int x, int y, const Tuple &color) {
    if (!color.is_color()) throw precondition_error("pixels hold colors only");
    if (x < 0 || x >= height || y < 0 || y >= width) throw precondition_error("pixel out of range");
    data[x * width + y] = color.v;
}

bool Image::dumppng(const std::string &filename) const {
    FILE *fp = fopen(filename.c_str(), "wb");
    if (!fp) {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }
    png_structp png = png_create_write_struct(PNG_LIBPNG_VER_STRING, NULL, NULL, NULL);
    png_infop info = png ? png_create_info_struct(png) : NULL;
    if (!png || !info) {
        std::cerr << "Cannot create PNG structures for " << filename << std::endl;
        png_destroy_write_struct(&png, info ? &info : (png_infopp)NULL);
        fclose(fp);
        return false;
    }
    // one RGB row, reused for every scanline
    std::vector<png_byte> scanline(static_cast<std::size_t>(width) * 3);
    if (setjmp(png_jmpbuf(png))) {
        std::cerr << "Error while encoding " << filename << std::endl;
        png_destroy_write_struct(&png, &info);
        fclose(fp);
        return false;
    }
    png_init_io(png, fp);
    png_set_IHDR(png, info, width, height, 8, PNG_COLOR_TYPE_RGB, PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_BASE, PNG_FILTER_TYPE_BASE);
    png_write_info(png, info);
    for (int x = 0; x < height; x++) {
        png_byte *out = scanline.data();
        for (int y = 0; y < width; y++)
            for (int c = 0; c < 3; ++c) *out++ = static_cast<png_byte>(to_byte(data[x * width + y][c]));
        png_write_row(png, scanline.data());
    }
    png_write_end(png, NULL);
    png_destroy_write_struct(&png, &info);
    fclose(fp);
    return true;
}

// Plain P3; no line longer than 70 characters.
void Image::writeppm(std::ostream &os) const {
    os << "P3\n" << width << " " << height << "\n255\n";
    for (int x = 0; x < height; x++) {
        std::string line;
        for (int y = 0; y < width; y++) {
            const glm::dvec3 &color = data[x * width + y];
            for (int c = 0; c < 3; ++c) {
                std::string value = std::to_string(to_byte(color[c]));
                if (!line.empty() && line.size() + 1 + value.size() > 70) {
                    os << line << "\n";
                    line.clear();
                }
                line += line.empty() ? value : " " + value;
            }
        }
        os << line << "\n";
    }
}

bool Image::dumpppm(const std::string &filename) const {
    std::ofstream fout(filename);
    if (!fout) {
        std::cerr << "Cannot open file for writing: " << filename << std::endl;
        return false;
    }
    writeppm(fout);
    return static_cast<bool>(fout);
}

}
