#include <stdio.h>
#include <stdlib.h>
#include <algorithm>
#include "surface.h"

bool UtilSurface::Init(Surface *surface, Uint32 width, Uint32 height)
{
    surface->pixels = NULL;
    surface->width = 0;
    surface->height = 0;

    size_t count = size_t(width) * size_t(height);
    if (count == 0)
        return true;

    surface->pixels = (Uint32*)calloc(count, sizeof(Uint32));
    if (surface->pixels == NULL)
    {
        printf("Could not allocate a %ux%u surface!\n", width, height);
        return false;
    }

    surface->width = width;
    surface->height = height;
    return true;
}

bool UtilSurface::Resize(Surface *surface, Uint32 newWidth, Uint32 newHeight)
{
    Release(surface);
    return Init(surface, newWidth, newHeight);
}

void UtilSurface::Release(Surface *surface)
{
    free(surface->pixels);
    surface->pixels = NULL;
    surface->width = 0;
    surface->height = 0;
}

void UtilSurface::Clear(Surface *surface, Uint32 color)
{
    size_t count = size_t(surface->width) * size_t(surface->height);
    std::fill(surface->pixels, surface->pixels + count, color);
}

void UtilSurface::SetPixel(Surface *surface, Sint32 x, Sint32 y, Uint32 color)
{
    if (x < 0 || y < 0 || Uint32(x) >= surface->width || Uint32(y) >= surface->height)
        return;

    surface->pixels[size_t(y) * surface->width + x] = color;
}

bool UtilSurface::GetPixel(const Surface *surface, Sint32 x, Sint32 y, Uint32 *outColor)
{
    if (x < 0 || y < 0 || Uint32(x) >= surface->width || Uint32(y) >= surface->height)
        return false;

    *outColor = surface->pixels[size_t(y) * surface->width + x];
    return true;
}
