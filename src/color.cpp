#include <math.h>
#include "color.h"

using glm::vec3;
using glm::clamp;

Color UtilColor::MakeColor(Uint8 r, Uint8 g, Uint8 b, Uint8 a)
{
    Color color = {};
    color.r = r;
    color.g = g;
    color.b = b;
    color.a = a;
    return color;
}

Uint32 UtilColor::Pack(Color color)
{
    return Uint32(color.a) << 24 | Uint32(color.b) << 16 | Uint32(color.g) << 8 | Uint32(color.r);
}

Color UtilColor::Unpack(Uint32 packed)
{
    Color color = {};
    color.r = Uint8(packed & 0xff);
    color.g = Uint8((packed >> 8) & 0xff);
    color.b = Uint8((packed >> 16) & 0xff);
    color.a = Uint8((packed >> 24) & 0xff);
    return color;
}

Uint32 UtilColor::Opaque(Uint32 packed)
{
    return packed | 0xff000000u;
}

static Uint8 ChannelToUint8(float c)
{
    // NaN fails both comparisons inside clamp, treat it as black
    if (c != c)
        return 0;
    return Uint8(floorf(clamp(c, 0.0f, 1.0f) * 255.0f + 0.5f));
}

Uint32 UtilColor::Vec3ColorToUint32(vec3 col)
{
    Uint8 a8 = 255;
    Uint8 r8 = ChannelToUint8(col.r);
    Uint8 g8 = ChannelToUint8(col.g);
    Uint8 b8 = ChannelToUint8(col.b);

    Uint32 col32 = Uint32(a8) << 24 | Uint32(b8) << 16 | Uint32(g8) << 8 | Uint32(r8);
    return col32;
}

vec3 UtilColor::Uint32ToVec3(Uint32 packed)
{
    Color color = Unpack(packed);
    return vec3(color.r / 255.0f, color.g / 255.0f, color.b / 255.0f);
}
