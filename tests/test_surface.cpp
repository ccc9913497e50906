#include <gtest/gtest.h>
#include "surface.h"

TEST(Surface, InitClearsToZero)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 4, 3));
    EXPECT_EQ(surface.width, 4u);
    EXPECT_EQ(surface.height, 3u);
    for (Uint32 i = 0; i < 12; ++i)
        EXPECT_EQ(surface.pixels[i], 0u);
    UtilSurface::Release(&surface);
    EXPECT_TRUE(surface.pixels == NULL);
}

TEST(Surface, ClearFillsEveryPixel)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 3, 2));
    UtilSurface::Clear(&surface, 0xff0000ffu);
    for (Uint32 i = 0; i < 6; ++i)
        EXPECT_EQ(surface.pixels[i], 0xff0000ffu);
    UtilSurface::Release(&surface);
}

TEST(Surface, SetPixelIsRowMajor)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 3, 2));
    UtilSurface::SetPixel(&surface, 1, 1, 0x01020304u);
    EXPECT_EQ(surface.pixels[1 * 3 + 1], 0x01020304u);

    Uint32 color = 0;
    EXPECT_TRUE(UtilSurface::GetPixel(&surface, 1, 1, &color));
    EXPECT_EQ(color, 0x01020304u);
    UtilSurface::Release(&surface);
}

TEST(Surface, OutOfRangeAccessIsIgnored)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 2, 2));
    UtilSurface::SetPixel(&surface, -1, 0, 7u);
    UtilSurface::SetPixel(&surface, 0, -1, 7u);
    UtilSurface::SetPixel(&surface, 2, 0, 7u);
    UtilSurface::SetPixel(&surface, 0, 2, 7u);
    for (Uint32 i = 0; i < 4; ++i)
        EXPECT_EQ(surface.pixels[i], 0u);

    Uint32 color = 42;
    EXPECT_FALSE(UtilSurface::GetPixel(&surface, 2, 1, &color));
    EXPECT_FALSE(UtilSurface::GetPixel(&surface, -1, 1, &color));
    EXPECT_EQ(color, 42u);
    UtilSurface::Release(&surface);
}

TEST(Surface, EmptySurfaceClipsEverything)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 0, 5));
    EXPECT_EQ(surface.width, 0u);
    UtilSurface::SetPixel(&surface, 0, 0, 1u);
    UtilSurface::Clear(&surface, 1u);
    UtilSurface::Release(&surface);
}

TEST(Surface, ResizeReallocates)
{
    Surface surface = {};
    ASSERT_TRUE(UtilSurface::Init(&surface, 2, 2));
    ASSERT_TRUE(UtilSurface::Resize(&surface, 5, 4));
    EXPECT_EQ(surface.width, 5u);
    EXPECT_EQ(surface.height, 4u);
    UtilSurface::SetPixel(&surface, 4, 3, 9u);
    EXPECT_EQ(surface.pixels[3 * 5 + 4], 9u);
    UtilSurface::Release(&surface);
}
