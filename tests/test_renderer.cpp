#include <gtest/gtest.h>
#include "renderer.h"
#include "color.h"

class RendererTest : public ::testing::Test
{
protected:
    void SetUp()
    {
        context = RenderContext();
        ASSERT_TRUE(Renderer::Init(&context, 64, 48));
    }

    void TearDown()
    {
        Renderer::Release(&context);
    }

    RenderContext context;
};

TEST_F(RendererTest, RenderDrawsOverTheClearColor)
{
    Renderer::Render(&context, 0.0f);

    Uint32 covered = 0;
    for (Uint32 i = 0; i < 64 * 48; ++i)
        covered += context.surface.pixels[i] != context.clearColor;
    EXPECT_GT(covered, 0u);

    // The textured quad sits in the middle of the frame
    Uint32 center = context.surface.pixels[24 * 64 + 32];
    Uint32 light = UtilColor::Pack(UtilColor::MakeColor(220, 220, 220));
    Uint32 dark = UtilColor::Pack(UtilColor::MakeColor(40, 40, 40));
    EXPECT_TRUE(center == light || center == dark);
}

TEST_F(RendererTest, ReversedQuadNeedsDoubleSided)
{
    context.quadShading = SOLID_SHADING;
    context.reverseWinding = true;
    Renderer::Render(&context, 0.0f);
    EXPECT_EQ(context.surface.pixels[24 * 64 + 32], context.clearColor);

    context.doubleSided = true;
    Renderer::Render(&context, 0.0f);
    EXPECT_NE(context.surface.pixels[24 * 64 + 32], context.clearColor);
}

TEST_F(RendererTest, RenderFollowsWindowSize)
{
    context.width = 32;
    context.height = 16;
    Renderer::Render(&context, 0.0f);
    EXPECT_EQ(context.surface.width, 32u);
    EXPECT_EQ(context.surface.height, 16u);
}

TEST_F(RendererTest, UpdateAdvancesTheQuad)
{
    Renderer::Update(&context, 0.1);
    EXPECT_GT(context.quadAngle, context.previousAngle);
}

TEST(Renderer, ShadingCycle)
{
    EXPECT_EQ(Renderer::NextShading(SOLID_SHADING), VERTEX_COLOR_SHADING);
    EXPECT_EQ(Renderer::NextShading(VERTEX_COLOR_SHADING), TEXTURED_SHADING);
    EXPECT_EQ(Renderer::NextShading(TEXTURED_SHADING), SOLID_SHADING);
}
