#pragma once

#include "renderer.hpp"

#include <string>

// Encoders return an empty string on success, or an error message on failure.
// The buffer is only read; a failed export leaves it untouched.
// `description` (optional) goes into a PNG tEXt chunk next to "Software".
std::string export_png(const char* path, const RasterBuffer& buf,
                       const std::string& description = std::string());

#ifdef HAVE_JXL
std::string export_jxl(const char* path, const RasterBuffer& buf);
#endif

// Picks the encoder from the file extension (.png, .jxl). JPEG XL output
// carries no description.
std::string export_image(const std::string& path, const RasterBuffer& buf,
                         const std::string& description = std::string());

// One-line summary of a request, e.g.
// "center=(-0.5, 0) zoom=1 iter=256 bound=2 palette=classic scale=cyclic".
std::string describe_request(const RenderRequest& req);

// True when compiled with JPEG XL support.
inline bool jxl_available()
{
#ifdef HAVE_JXL
    return true;
#else
    return false;
#endif
}
