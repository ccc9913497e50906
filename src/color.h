#ifndef COLOR_H
#define COLOR_H

#include <glm/glm.hpp>
#include <SDL2/SDL.h>

// Pixels are packed RGBA8 in little-endian byte order [r, g, b, a],
// the same layout for surfaces, textures and image encoders.
struct Color
{
    Uint8 r;
    Uint8 g;
    Uint8 b;
    Uint8 a;
};

namespace UtilColor
{
    Color MakeColor(Uint8 r, Uint8 g, Uint8 b, Uint8 a = 255);
    Uint32 Pack(Color color);
    Color Unpack(Uint32 packed);
    Uint32 Opaque(Uint32 packed);

    // Channels are clamped to [0, 1] and rounded to nearest, alpha is 255
    Uint32 Vec3ColorToUint32(glm::vec3 color);
    glm::vec3 Uint32ToVec3(Uint32 packed);
}

#endif
