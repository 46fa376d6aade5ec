#include "export.hpp"

#include <png.h>
#include <cctype>
#include <cstdio>
#include <cstring>

#include <vector>

#ifdef HAVE_JXL
#include <jxl/encode.h>
#include <jxl/color_encoding.h>
#endif

// ---------------------------------------------------------------------------
// PNG export
//
// Pixel layout: each uint32_t stores 0xAA BB GG RR.
// On a little-endian machine the bytes in memory are [R, G, B, A], which is
// exactly what PNG_COLOR_TYPE_RGBA expects, no conversion needed.
// ---------------------------------------------------------------------------
std::string export_png(const char* path, const RasterBuffer& buf,
                       const std::string& description)
{
    if (buf.width <= 0 || buf.height <= 0 ||
        buf.pixels.size() != static_cast<size_t>(buf.width) * buf.height)
        return "Empty or inconsistent raster buffer";

    // Built before setjmp: a longjmp must not skip a destructor.
    std::vector<char> val_description(description.begin(), description.end());
    val_description.push_back('\0');

    FILE* fp = std::fopen(path, "wb");
    if (!fp)
        return std::string("Cannot open file for writing: ") + path;

    png_structp png = png_create_write_struct(
        PNG_LIBPNG_VER_STRING, nullptr, nullptr, nullptr);
    if (!png) {
        std::fclose(fp);
        return "png_create_write_struct failed";
    }

    png_infop info = png_create_info_struct(png);
    if (!info) {
        png_destroy_write_struct(&png, nullptr);
        std::fclose(fp);
        return "png_create_info_struct failed";
    }

    if (setjmp(png_jmpbuf(png))) {
        png_destroy_write_struct(&png, &info);
        std::fclose(fp);
        return "PNG write error (libpng longjmp)";
    }

    png_init_io(png, fp);
    png_set_IHDR(png, info,
                 static_cast<png_uint_32>(buf.width),
                 static_cast<png_uint_32>(buf.height),
                 8, PNG_COLOR_TYPE_RGBA,
                 PNG_INTERLACE_NONE,
                 PNG_COMPRESSION_TYPE_DEFAULT,
                 PNG_FILTER_TYPE_DEFAULT);

    // png_set_text copies keys and values.
    char key_software[]    = "Software";
    char key_description[] = "Description";
    char val_software[]    = "mandelzoom";

    png_text text[2];
    std::memset(text, 0, sizeof(text));
    text[0].compression = PNG_TEXT_COMPRESSION_NONE;
    text[0].key         = key_software;
    text[0].text        = val_software;
    text[1].compression = PNG_TEXT_COMPRESSION_NONE;
    text[1].key         = key_description;
    text[1].text        = val_description.data();
    png_set_text(png, info, text, description.empty() ? 1 : 2);

    png_write_info(png, info);

    for (int y = 0; y < buf.height; ++y) {
        const png_const_bytep row = reinterpret_cast<png_const_bytep>(
            buf.pixels.data() + static_cast<size_t>(y) * buf.width);
        png_write_row(png, row);
    }

    png_write_end(png, nullptr);
    png_destroy_write_struct(&png, &info);
    if (std::fclose(fp) != 0)
        return std::string("Error closing file: ") + path;
    return {};  // success
}

// ---------------------------------------------------------------------------
// JPEG XL export (lossless RGBA, 8-bit)
// ---------------------------------------------------------------------------
#ifdef HAVE_JXL
std::string export_jxl(const char* path, const RasterBuffer& buf)
{
    if (buf.width <= 0 || buf.height <= 0)
        return "Empty raster buffer";

    JxlEncoder* enc = JxlEncoderCreate(nullptr);
    if (!enc) return "JxlEncoderCreate failed";

    JxlBasicInfo bi;
    JxlEncoderInitBasicInfo(&bi);
    bi.xsize                     = static_cast<uint32_t>(buf.width);
    bi.ysize                     = static_cast<uint32_t>(buf.height);
    bi.bits_per_sample           = 8;
    bi.exponent_bits_per_sample  = 0;
    bi.alpha_bits                = 8;
    bi.alpha_exponent_bits       = 0;
    bi.num_color_channels        = 3;
    bi.num_extra_channels        = 1;
    bi.uses_original_profile     = JXL_TRUE;

    if (JxlEncoderSetBasicInfo(enc, &bi) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetBasicInfo failed";
    }

    JxlExtraChannelInfo eci;
    JxlEncoderInitExtraChannelInfo(JXL_CHANNEL_ALPHA, &eci);
    eci.bits_per_sample          = 8;
    eci.exponent_bits_per_sample = 0;
    if (JxlEncoderSetExtraChannelInfo(enc, 0, &eci) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetExtraChannelInfo failed";
    }

    JxlColorEncoding color;
    JxlColorEncodingSetToSRGB(&color, /*is_gray=*/JXL_FALSE);
    if (JxlEncoderSetColorEncoding(enc, &color) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetColorEncoding failed";
    }

    JxlEncoderFrameSettings* opts = JxlEncoderFrameSettingsCreate(enc, nullptr);
    if (JxlEncoderSetFrameLossless(opts, JXL_TRUE) != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderSetFrameLossless failed";
    }

    JxlPixelFormat fmt = {4, JXL_TYPE_UINT8, JXL_NATIVE_ENDIAN, 0};
    const size_t data_size = static_cast<size_t>(buf.width) * buf.height * 4;
    if (JxlEncoderAddImageFrame(opts, &fmt, buf.pixels.data(), data_size)
            != JXL_ENC_SUCCESS) {
        JxlEncoderDestroy(enc);
        return "JxlEncoderAddImageFrame failed";
    }
    JxlEncoderCloseInput(enc);

    std::vector<uint8_t> output(65536);
    uint8_t* next_out  = output.data();
    size_t   avail_out = output.size();
    JxlEncoderStatus status;
    while ((status = JxlEncoderProcessOutput(enc, &next_out, &avail_out))
               == JXL_ENC_NEED_MORE_OUTPUT) {
        const size_t used = next_out - output.data();
        output.resize(output.size() * 2);
        next_out  = output.data() + used;
        avail_out = output.size() - used;
    }
    JxlEncoderDestroy(enc);

    if (status != JXL_ENC_SUCCESS)
        return "JxlEncoderProcessOutput failed";

    output.resize(static_cast<size_t>(next_out - output.data()));

    FILE* fp = std::fopen(path, "wb");
    if (!fp) return std::string("Cannot open file for writing: ") + path;
    const size_t written = std::fwrite(output.data(), 1, output.size(), fp);
    const bool   closed  = std::fclose(fp) == 0;
    if (written != output.size() || !closed)
        return std::string("Short write to ") + path;
    return {};  // success
}
#endif  // HAVE_JXL

static bool has_extension(const std::string& path, const char* ext)
{
    const size_t n = std::strlen(ext);
    if (path.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        const char c = static_cast<char>(std::tolower(
            static_cast<unsigned char>(path[path.size() - n + i])));
        if (c != ext[i]) return false;
    }
    return true;
}

std::string export_image(const std::string& path, const RasterBuffer& buf,
                         const std::string& description)
{
    if (has_extension(path, ".jxl")) {
#ifdef HAVE_JXL
        return export_jxl(path.c_str(), buf);
#else
        return "JPEG XL support not compiled in: " + path;
#endif
    }
    return export_png(path.c_str(), buf, description);
}

std::string describe_request(const RenderRequest& req)
{
    char line[256];
    std::snprintf(line, sizeof(line),
                  "center=(%.17g, %.17g) zoom=%.6g iter=%d bound=%g palette=%s scale=%s",
                  req.viewport.center_re, req.viewport.center_im,
                  zoom_level(req.viewport), req.max_iter, req.bound,
                  req.palette.name(), color_scale_name(req.mapping.scale));
    return line;
}
