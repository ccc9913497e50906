#ifndef RASTERIZER_H
#define RASTERIZER_H

#include <glm/glm.hpp>
#include <SDL2/SDL.h>
#include "mesh.h"
#include "surface.h"
#include "texture.h"

#define SOLID_SHADING 1
#define VERTEX_COLOR_SHADING 2
#define TEXTURED_SHADING 3

// Draw flags
#define DOUBLE_SIDED_BIT 1

// Triangles whose doubled area is within this bound are not drawn
#define DEGENERATE_AREA_EPSILON 1e-6f

struct Shader
{
    int mode;
    Uint32 color;               // SOLID_SHADING
    const Texture *texture;     // TEXTURED_SHADING, borrowed for the draw call
};

// Edge function values of a sample point, w0 belongs to v0 (edge v1->v2) and so on
struct EdgeWeights
{
    float w0;
    float w1;
    float w2;
};

// Inclusive pixel bounds
struct BoundingBox
{
    Sint32 minX;
    Sint32 minY;
    Sint32 maxX;
    Sint32 maxY;
};

namespace Rasterization
{
    float EdgeFunction(glm::vec2 a, glm::vec2 b, glm::vec2 p);
    float SignedArea(glm::vec2 v0, glm::vec2 v1, glm::vec2 v2);
    bool IsTopLeft(glm::vec2 a, glm::vec2 b);
    EdgeWeights ComputeEdgeWeights(glm::vec2 v0, glm::vec2 v1, glm::vec2 v2, glm::vec2 p);
    bool ComputeBoundingBox(glm::vec2 v0, glm::vec2 v1, glm::vec2 v2, Uint32 width, Uint32 height, BoundingBox *box);

    Shader MakeSolidShader(Uint32 color);
    Shader MakeVertexColorShader();
    Shader MakeTextureShader(const Texture *texture);
    const char* ShadingToString(int mode);

    void DrawTriangle(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, const Shader *shader, Uint32 flags = 0);
    void DrawTriangleSolid(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, Uint32 color);
    void DrawTriangleVertexColor(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2);
    void DrawTriangleTextured(Surface *surface, const Vertex &v0, const Vertex &v1, const Vertex &v2, const Texture *texture);
    void DrawTriangleMesh(Surface *surface, const Mesh *mesh, const Shader *shader, Uint32 flags = 0);
}

#endif
