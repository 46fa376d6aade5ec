#include "export.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <string>

static std::string temp_path(const char* name)
{
    return ::testing::TempDir() + name;
}

static long file_size(const std::string& path)
{
    FILE* fp = std::fopen(path.c_str(), "rb");
    if (!fp) return -1;
    std::fseek(fp, 0, SEEK_END);
    const long n = std::ftell(fp);
    std::fclose(fp);
    return n;
}

TEST(Export, WritesPngWithSignature)
{
    RasterBuffer buf;
    buf.resize(16, 8);
    for (int y = 0; y < buf.height; ++y)
        for (int x = 0; x < buf.width; ++x)
            buf.row(y)[x] = pack_rgb(static_cast<uint8_t>(x * 16), static_cast<uint8_t>(y * 32), 7);

    const std::string path = temp_path("mandelzoom_export_test.png");
    ASSERT_EQ(export_image(path, buf), "");
    EXPECT_GT(file_size(path), 8);

    FILE* fp = std::fopen(path.c_str(), "rb");
    ASSERT_NE(fp, nullptr);
    unsigned char sig[8] = {};
    ASSERT_EQ(std::fread(sig, 1, 8, fp), 8u);
    std::fclose(fp);
    const unsigned char png_sig[8] = {0x89, 'P', 'N', 'G', '\r', '\n', 0x1A, '\n'};
    for (int i = 0; i < 8; ++i)
        EXPECT_EQ(sig[i], png_sig[i]);
    std::remove(path.c_str());
}

TEST(Export, UnwritablePathReportsError)
{
    RasterBuffer buf;
    buf.resize(4, 4);
    const std::string msg = export_image("/nonexistent-dir/sub/out.png", buf);
    EXPECT_NE(msg, "");
    EXPECT_EQ(buf.width, 4);
    EXPECT_EQ(buf.pixels.size(), 16u);
}

TEST(Export, EmptyBufferReportsError)
{
    RasterBuffer buf;
    EXPECT_NE(export_image(temp_path("mandelzoom_empty.png"), buf), "");
}

TEST(Export, JxlWithoutSupportReportsError)
{
    if (jxl_available())
        GTEST_SKIP() << "built with JPEG XL support";
    RasterBuffer buf;
    buf.resize(4, 4);
    EXPECT_NE(export_image(temp_path("mandelzoom_test.jxl"), buf), "");
}

TEST(Export, PngCarriesRenderDescription)
{
    RenderRequest req;
    req.viewport = default_viewport(8, 8);
    req.max_iter = 321;
    const std::string desc = describe_request(req);
    EXPECT_NE(desc.find("iter=321"), std::string::npos);
    EXPECT_NE(desc.find("palette=classic"), std::string::npos);
    EXPECT_NE(desc.find("zoom=1 "), std::string::npos);

    RasterBuffer buf;
    buf.resize(8, 8);
    const std::string path = temp_path("mandelzoom_described.png");
    ASSERT_EQ(export_image(path, buf, desc), "");

    // tEXt chunks are stored uncompressed.
    std::string contents;
    FILE* fp = std::fopen(path.c_str(), "rb");
    ASSERT_NE(fp, nullptr);
    char chunk[4096];
    size_t n;
    while ((n = std::fread(chunk, 1, sizeof(chunk), fp)) > 0)
        contents.append(chunk, n);
    std::fclose(fp);
    std::remove(path.c_str());

    EXPECT_NE(contents.find("Software"), std::string::npos);
    EXPECT_NE(contents.find("mandelzoom"), std::string::npos);
    EXPECT_NE(contents.find(desc), std::string::npos);
}
