#ifndef TEXTURE_H
#define TEXTURE_H

#include <stddef.h>
#include <glm/glm.hpp>
#include <SDL2/SDL.h>

// Row-major packed RGBA texels (see color.h), UV origin at the top-left
struct Texture
{
    Uint32 *data;
    Uint32 width;
    Uint32 height;
};

namespace UtilTexture
{
    // pixelCount must equal width * height, both dimensions positive
    bool Init(Texture *texture, const Uint32 *pixels, size_t pixelCount, Uint32 width, Uint32 height);
    bool MakeCheckerboard(Texture *texture, Uint32 width, Uint32 height, Uint32 cellSize, Uint32 colorA, Uint32 colorB);
    void Release(Texture *texture);

    Uint32 Fetch(const Texture *texture, Uint32 x, Uint32 y);
    Uint32 SampleNearest(const Texture *texture, glm::vec2 uv);
}

#endif
