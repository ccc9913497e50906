#ifndef MESH_H
#define MESH_H

#include <glm/glm.hpp>
#include <SDL2/SDL.h>

struct Vertex
{
    glm::vec3 position;         // Screen space, x and y in pixels. z is carried but not used.
    glm::vec2 textureCoords;
    glm::vec3 color;
};

// Triangle list, three consecutive vertices per triangle
struct Mesh
{
    Vertex *vertices;
    Uint32 vertexCount;
    Uint32 capacity;
};

namespace UtilMesh
{
    Vertex MakeVertex(glm::vec3 position, glm::vec2 textureCoords, glm::vec3 color);
    Vertex MakeVertex(glm::vec3 position);

    bool Init(Mesh *mesh, Uint32 triangleCapacity);
    bool AddTriangle(Mesh *mesh, const Vertex &v0, const Vertex &v1, const Vertex &v2);
    void ReverseWinding(Mesh *mesh);
    Uint32 TriangleCount(const Mesh *mesh);
    void Release(Mesh *mesh);

    Mesh MakeQuad(glm::vec2 center, float halfSize, float angle);
    Mesh MakeGrid(glm::vec2 origin, float cellSize, Uint32 columns, Uint32 rows, glm::vec3 color);
}

#endif
