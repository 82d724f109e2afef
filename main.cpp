#include "ttraster/ttraster.hpp"
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

using namespace ttraster;

static void usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " <font-file> <char|U+XXXX|decimal> [pixel-height] [font-index]" << std::endl;
}

// "A" -> 'A', "U+00C5" -> 0xC5, "65" -> 65
static bool parse_codepoint(const std::string& s, int& out) {
    if (s.empty()) return false;
    char* end = nullptr;
    if (s.size() > 2 && (s[0] == 'U' || s[0] == 'u') && s[1] == '+') {
        const long v = std::strtol(s.c_str() + 2, &end, 16);
        if (*end != '\0' || v < 0 || v > 0x10FFFF) return false;
        out = static_cast<int>(v);
        return true;
    }
    if (s.size() == 1) {
        out = static_cast<unsigned char>(s[0]);
        return true;
    }
    const long v = std::strtol(s.c_str(), &end, 10);
    if (*end != '\0' || v < 0 || v > 0x10FFFF) return false;
    out = static_cast<int>(v);
    return true;
}

int main(int argc, char** argv) {
    if (argc < 3) {
        usage(argv[0]);
        return 2;
    }
    const char* font_path = argv[1];

    int codepoint = 0;
    if (!parse_codepoint(argv[2], codepoint)) {
        std::cerr << "Couldn't parse codepoint: " << argv[2] << std::endl;
        return 2;
    }
    const float pixel_height = argc > 3 ? static_cast<float>(std::atof(argv[3])) : 20.0f;
    const int font_index = argc > 4 ? std::atoi(argv[4]) : 0;
    if (pixel_height <= 0.0f) {
        std::cerr << "Pixel height must be positive." << std::endl;
        return 2;
    }

    // 1. Load font file
    std::ifstream ifs(font_path, std::ios::binary | std::ios::ate);
    if (!ifs) {
        std::cerr << "Couldn't open font file: " << font_path << std::endl;
        return 1;
    }

    std::streamsize size = ifs.tellg();
    ifs.seekg(0, std::ios::beg);
    std::vector<uint8_t> font_buffer(static_cast<size_t>(size > 0 ? size : 0));
    if (!ifs.read(reinterpret_cast<char*>(font_buffer.data()), size)) {
        std::cerr << "Error while reading font file." << std::endl;
        return 1;
    }

    // 2. Init font
    const int offset = FontView::GetFontOffsetForIndex(font_buffer.data(), font_buffer.size(), font_index);
    if (offset < 0) {
        std::cerr << "No font #" << font_index << " in " << font_path << std::endl;
        return 1;
    }
    FontView font;
    Error err = font.ReadBytes(font_buffer.data(), font_buffer.size(), offset);
    if (err != Error::None) {
        std::cerr << "Error while font initialization: " << ErrorString(err) << std::endl;
        return 1;
    }

    const VMetrics vm = font.GetFontVMetrics();
    const Box fb = font.GetFontBoundingBox();
    std::cout << "font:        " << font_path << " (#" << font_index << ")\n"
              << "glyphs:      " << font.NumGlyphs() << "\n"
              << "units/em:    " << font.UnitsPerEm() << "\n"
              << "ascent:      " << vm.ascent << "  descent: " << vm.descent
              << "  line gap: " << vm.line_gap << "\n"
              << "bbox:        " << fb.x0 << " " << fb.y0 << " " << fb.x1 << " " << fb.y1 << "\n";

    // 3. Glyph
    int glyph = 0;
    err = font.TryFindGlyphIndex(codepoint, glyph);
    if (err != Error::None) {
        std::cerr << "Couldn't map codepoint: " << ErrorString(err) << std::endl;
        return 1;
    }
    GlyphHorMetrics hm{};
    err = font.GetGlyphHorMetrics(glyph, hm);
    if (err != Error::None) {
        std::cerr << "Couldn't read horizontal metrics: " << ErrorString(err) << std::endl;
        return 1;
    }

    const float scale = font.ScaleForPixelHeight(pixel_height);
    CoverageBitmap bitmap;
    err = font.RasterizeGlyph(glyph, 0.0f, scale, 0.0f, 0.0f, bitmap);
    if (err != Error::None) {
        std::cerr << "Couldn't rasterize glyph " << glyph << ": " << ErrorString(err) << std::endl;
        return 1;
    }

    std::cout << "codepoint:   U+" << std::hex << codepoint << std::dec << " -> glyph " << glyph << "\n"
              << "advance:     " << hm.advance << "  lsb: " << hm.lsb << "\n"
              << "scale:       " << scale << " (" << pixel_height << "px)\n"
              << "bitmap:      " << bitmap.w << "x" << bitmap.h
              << " at (" << bitmap.x_off << ", " << bitmap.y_off << ")\n\n";

    // 4. Print bitmap
    static const char ramp[] = " .:ioVM@";
    for (int y = 0; y < bitmap.h; ++y) {
        std::string row;
        for (int x = 0; x < bitmap.w; ++x)
            row.push_back(ramp[bitmap.At(x, y) >> 5]);
        std::cout << row << '\n';
    }
    return 0;
}
