#include <math.h>
#include <algorithm>
#include <cmath>
#include <utility>
#include "rasterizer.h"
#include "color.h"

using glm::vec2;
using glm::vec3;
using std::min;
using std::max;

/*  Edge function of point p against the directed edge a->b.
    In y-down raster space a positive result means p lies to the right of the edge when looking from a to b,
    so a triangle wound clockwise on screen has all three values positive inside. */
float Rasterization::EdgeFunction(vec2 a, vec2 b, vec2 p)
{
    return (b.x - a.x) * (p.y - a.y) - (b.y - a.y) * (p.x - a.x);
}

// Twice the signed area of the triangle
float Rasterization::SignedArea(vec2 v0, vec2 v1, vec2 v2)
{
    return EdgeFunction(v0, v1, v2);
}

// Top edge: horizontal with the interior below it. Left edge: going up, interior on its right.
bool Rasterization::IsTopLeft(vec2 a, vec2 b)
{
    float dx = b.x - a.x;
    float dy = b.y - a.y;
    return dy < 0.0f || (dy == 0.0f && dx > 0.0f);
}

// Evaluates the edge with its endpoints in a fixed order, so two triangles sharing the edge
// get exactly negated values and a tie can never be claimed by both or by neither
static float SharedEdgeFunction(vec2 a, vec2 b, vec2 p)
{
    if (a.x > b.x || (a.x == b.x && a.y > b.y))
        return -Rasterization::EdgeFunction(b, a, p);
    return Rasterization::EdgeFunction(a, b, p);
}

EdgeWeights Rasterization::ComputeEdgeWeights(vec2 v0, vec2 v1, vec2 v2, vec2 p)
{
    EdgeWeights weights = {};
    weights.w0 = SharedEdgeFunction(v1, v2, p);
    weights.w1 = SharedEdgeFunction(v2, v0, p);
    weights.w2 = SharedEdgeFunction(v0, v1, p);
    return weights;
}

bool Rasterization::ComputeBoundingBox(vec2 v0, vec2 v1, vec2 v2, Uint32 width, Uint32 height, BoundingBox *box)
{
    if (width == 0 || height == 0)
        return false;

    float minX = floorf(min(v0.x, min(v1.x, v2.x)));
    float minY = floorf(min(v0.y, min(v1.y, v2.y)));
    float maxX = ceilf(max(v0.x, max(v1.x, v2.x))) - 1.0f;
    float maxY = ceilf(max(v0.y, max(v1.y, v2.y))) - 1.0f;

    // Rejects NaN as well
    if (!(maxX >= 0.0f && maxY >= 0.0f && minX <= float(width - 1) && minY <= float(height - 1)))
        return false;

    box->minX = Sint32(max(minX, 0.0f));
    box->minY = Sint32(max(minY, 0.0f));
    box->maxX = Sint32(min(maxX, float(width - 1)));
    box->maxY = Sint32(min(maxY, float(height - 1)));

    return box->minX <= box->maxX && box->minY <= box->maxY;
}

Shader Rasterization::MakeSolidShader(Uint32 color)
{
    Shader shader = {};
    shader.mode = SOLID_SHADING;
    shader.color = color;
    return shader;
}

Shader Rasterization::MakeVertexColorShader()
{
    Shader shader = {};
    shader.mode = VERTEX_COLOR_SHADING;
    return shader;
}

Shader Rasterization::MakeTextureShader(const Texture *texture)
{
    Shader shader = {};
    shader.mode = TEXTURED_SHADING;
    shader.texture = texture;
    return shader;
}

const char* Rasterization::ShadingToString(int mode)
{
    switch (mode)
    {
    case SOLID_SHADING:
        return "Solid";
    case VERTEX_COLOR_SHADING:
        return "Vertex color";
    case TEXTURED_SHADING:
        return "Textured";
    default:
        return NULL;
    }
}

/// Fragment shaders. Each one receives weights already normalized by the triangle area.
struct SolidShade
{
    Uint32 color;

    Uint32 operator()(const EdgeWeights &) const
    {
        return color;
    }
};

struct VertexColorShade
{
    vec3 c0, c1, c2;

    Uint32 operator()(const EdgeWeights &w) const
    {
        return UtilColor::Vec3ColorToUint32(w.w0 * c0 + w.w1 * c1 + w.w2 * c2);
    }
};

struct TextureShade
{
    const Texture *texture;
    vec2 uv0, uv1, uv2;

    Uint32 operator()(const EdgeWeights &w) const
    {
        vec2 uv = w.w0 * uv0 + w.w1 * uv1 + w.w2 * uv2;
        // Texel alpha is ignored
        return UtilColor::Opaque(UtilTexture::SampleNearest(texture, uv));
    }
};

// Expects a positively wound, non degenerate triangle
template <typename Shade>
static void RasterizeTriangle(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, float triangleArea, const Shade &shade)
{
    const vec2 p0 = vec2(v0.position.x, v0.position.y);
    const vec2 p1 = vec2(v1.position.x, v1.position.y);
    const vec2 p2 = vec2(v2.position.x, v2.position.y);

    BoundingBox box;
    if (!Rasterization::ComputeBoundingBox(p0, p1, p2, surface->width, surface->height, &box))
        return;

    // Classified per edge, winding decides which of them are top or left
    const bool topLeft0 = Rasterization::IsTopLeft(p1, p2);
    const bool topLeft1 = Rasterization::IsTopLeft(p2, p0);
    const bool topLeft2 = Rasterization::IsTopLeft(p0, p1);

    const float recArea = 1.0f / triangleArea;
    const Uint32 width = surface->width;

    Uint32 *frameBuffer = surface->pixels + size_t(box.minY) * width;

    for (Sint32 y = box.minY; y <= box.maxY; ++y)
    {
        for (Sint32 x = box.minX; x <= box.maxX; ++x)
        {
            // Sample at the pixel center
            vec2 p = vec2(float(x) + 0.5f, float(y) + 0.5f);
            EdgeWeights area = Rasterization::ComputeEdgeWeights(p0, p1, p2, p);

            // Zero counts as inside only on top and left edges so shared edges are drawn once
            bool inside0 = topLeft0 ? area.w0 >= 0.0f : area.w0 > 0.0f;
            bool inside1 = topLeft1 ? area.w1 >= 0.0f : area.w1 > 0.0f;
            bool inside2 = topLeft2 ? area.w2 >= 0.0f : area.w2 > 0.0f;

            if (inside0 && inside1 && inside2)
            {
                // Barycentric coordinates
                EdgeWeights w = {};
                w.w0 = area.w0 * recArea;
                w.w1 = area.w1 * recArea;
                w.w2 = area.w2 * recArea;

                frameBuffer[x] = shade(w);
            }
        }
        frameBuffer += width;
    }
}

static bool IsFinite(const Vertex &v)
{
    return std::isfinite(v.position.x) && std::isfinite(v.position.y);
}

void Rasterization::DrawTriangle(Surface *surface, const Vertex &v0, const Vertex &in1, const Vertex &in2, const Shader *shader, Uint32 flags)
{
    if (surface->pixels == NULL || surface->width == 0 || surface->height == 0)
        return;
    if (!IsFinite(v0) || !IsFinite(in1) || !IsFinite(in2))
        return;

    float triangleArea = SignedArea(vec2(v0.position.x, v0.position.y),
                                    vec2(in1.position.x, in1.position.y),
                                    vec2(in2.position.x, in2.position.y));

    // Degenerate, or too large to represent
    if (!(fabsf(triangleArea) > DEGENERATE_AREA_EPSILON) || !std::isfinite(triangleArea))
        return;

    const Vertex *v1 = &in1;
    const Vertex *v2 = &in2;
    if (triangleArea < 0.0f)
    {
        // Reversed winding is back facing unless drawn double sided
        if (!(flags & DOUBLE_SIDED_BIT))
            return;
        std::swap(v1, v2);
        triangleArea = -triangleArea;
    }

    switch (shader->mode)
    {
    case SOLID_SHADING:
    {
        SolidShade shade = { shader->color };
        RasterizeTriangle(surface, v0, *v1, *v2, triangleArea, shade);
        break;
    }
    case VERTEX_COLOR_SHADING:
    {
        VertexColorShade shade = { v0.color, v1->color, v2->color };
        RasterizeTriangle(surface, v0, *v1, *v2, triangleArea, shade);
        break;
    }
    case TEXTURED_SHADING:
    {
        const Texture *texture = shader->texture;
        if (texture == NULL || texture->data == NULL || texture->width == 0 || texture->height == 0)
            return;
        TextureShade shade = { texture, v0.textureCoords, v1->textureCoords, v2->textureCoords };
        RasterizeTriangle(surface, v0, *v1, *v2, triangleArea, shade);
        break;
    }
    default:
        break;
    }
}

void Rasterization::DrawTriangleSolid(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, Uint32 color)
{
    Shader shader = MakeSolidShader(color);
    DrawTriangle(surface, v0, v1, v2, &shader);
}

void Rasterization::DrawTriangleVertexColor(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2)
{
    Shader shader = MakeVertexColorShader();
    DrawTriangle(surface, v0, v1, v2, &shader);
}

void Rasterization::DrawTriangleTextured(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, const Texture *texture)
{
    Shader shader = MakeTextureShader(texture);
    DrawTriangle(surface, v0, v1, v2, &shader);
}

void Rasterization::DrawTriangleMesh(Surface *surface, const Mesh *mesh, const Shader *shader, Uint32 flags)
{
    // A trailing partial triangle is ignored
    for (Uint32 i = 0; i + 2 < mesh->vertexCount; i += 3)
    {
        DrawTriangle(surface, mesh->vertices[i], mesh->vertices[i + 1], mesh->vertices[i + 2], shader, flags);
    }
}
