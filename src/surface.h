#ifndef SURFACE_H
#define SURFACE_H

#include <SDL2/SDL.h>

// Row-major packed pixels, origin top-left, y grows downward
struct Surface
{
    Uint32 *pixels;
    Uint32 width;
    Uint32 height;
};

namespace UtilSurface
{
    bool Init(Surface *surface, Uint32 width, Uint32 height);
    bool Resize(Surface *surface, Uint32 newWidth, Uint32 newHeight);
    void Release(Surface *surface);
    void Clear(Surface *surface, Uint32 color);

    // Out of range coordinates are ignored
    void SetPixel(Surface *surface, Sint32 x, Sint32 y, Uint32 color);
    bool GetPixel(const Surface *surface, Sint32 x, Sint32 y, Uint32 *outColor);
}

#endif
