#include <assert.h>
#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include "texture.h"

using glm::vec2;
using glm::clamp;

bool UtilTexture::Init(Texture *texture, const Uint32 *pixels, size_t pixelCount, Uint32 width, Uint32 height)
{
    texture->data = NULL;
    texture->width = 0;
    texture->height = 0;

    assert(width > 0 && height > 0 && "Texture dimensions must be positive");
    assert(pixelCount == size_t(width) * size_t(height) && "Texel count must match width * height");
    assert(pixels != NULL);
    if (width == 0 || height == 0 || pixelCount != size_t(width) * size_t(height) || pixels == NULL)
        return false;

    texture->data = (Uint32*)malloc(pixelCount * sizeof(Uint32));
    if (texture->data == NULL)
    {
        printf("Could not allocate a %ux%u texture!\n", width, height);
        return false;
    }
    memcpy(texture->data, pixels, pixelCount * sizeof(Uint32));
    texture->width = width;
    texture->height = height;
    return true;
}

bool UtilTexture::MakeCheckerboard(Texture *texture, Uint32 width, Uint32 height, Uint32 cellSize, Uint32 colorA, Uint32 colorB)
{
    if (cellSize == 0)
        cellSize = 1;

    size_t count = size_t(width) * size_t(height);
    Uint32 *pixels = (Uint32*)malloc((count ? count : 1) * sizeof(Uint32));
    if (pixels == NULL)
    {
        printf("Could not allocate checkerboard texels!\n");
        return false;
    }

    for (Uint32 j = 0; j < height; ++j)
    {
        Uint32 *P = &pixels[size_t(j) * width];
        for (Uint32 i = 0; i < width; ++i)
        {
            bool even = (((i / cellSize) ^ (j / cellSize)) & 1) == 0;
            *P++ = even ? colorA : colorB;
        }
    }

    bool result = Init(texture, pixels, count, width, height);
    free(pixels);
    return result;
}

void UtilTexture::Release(Texture *texture)
{
    free(texture->data);
    texture->data = NULL;
    texture->width = 0;
    texture->height = 0;
}

Uint32 UtilTexture::Fetch(const Texture *texture, Uint32 x, Uint32 y)
{
    if (x >= texture->width)
        x = texture->width - 1;
    if (y >= texture->height)
        y = texture->height - 1;
    return texture->data[size_t(y) * texture->width + x];
}

Uint32 UtilTexture::SampleNearest(const Texture *texture, vec2 uv)
{
    float u = clamp(uv.x, 0.0f, 1.0f);
    float v = clamp(uv.y, 0.0f, 1.0f);
    if (u != u)
        u = 0.0f;
    if (v != v)
        v = 0.0f;

    float w = float(texture->width - 1);
    float h = float(texture->height - 1);
    Uint32 tx = Uint32(clamp(floorf(u * w + 0.5f), 0.0f, w));
    Uint32 ty = Uint32(clamp(floorf(v * h + 0.5f), 0.0f, h));
    return Fetch(texture, tx, ty);
}
