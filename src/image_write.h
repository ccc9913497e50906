#ifndef IMAGE_WRITE_H
#define IMAGE_WRITE_H

#include <ostream>
#include <SDL2/SDL.h>
#include "surface.h"

// Encoders take packed [r,g,b,a] pixels, row-major, top-down. Alpha is dropped.
namespace ImageWrite
{
    // Binary PPM (P6)
    bool WritePPMToStream(const Uint32 *pixels, Uint32 width, Uint32 height, std::ostream &out);
    // 24-bit uncompressed BMP stored top-down (negative height)
    bool WriteBMPToStream(const Uint32 *pixels, Uint32 width, Uint32 height, std::ostream &out);

    bool WritePPM(const Surface *surface, const char *path);
    bool WriteBMP(const Surface *surface, const char *path);
}

#endif
