#include <math.h>
#include <stdio.h>
#include <stdlib.h>
#include "mesh.h"

using glm::vec2;
using glm::vec3;
using glm::mat2;

Vertex UtilMesh::MakeVertex(vec3 position, vec2 textureCoords, vec3 color)
{
	Vertex v = {};
	v.position = position;
	v.textureCoords = textureCoords;
	v.color = color;
	return v;
}

Vertex UtilMesh::MakeVertex(vec3 position)
{
	return MakeVertex(position, vec2(0.0f, 0.0f), vec3(1.0f, 1.0f, 1.0f));
}

bool UtilMesh::Init(Mesh *mesh, Uint32 triangleCapacity)
{
	mesh->vertexCount = 0;
	mesh->capacity = 0;
	mesh->vertices = NULL;
	if (triangleCapacity == 0)
		return true;

	mesh->vertices = (Vertex*)malloc(size_t(triangleCapacity) * 3 * sizeof(Vertex));
	if (mesh->vertices == NULL)
	{
		printf("Could not allocate a mesh of %u triangles!\n", triangleCapacity);
		return false;
	}
	mesh->capacity = triangleCapacity * 3;
	return true;
}

bool UtilMesh::AddTriangle(Mesh *mesh, const Vertex &v0, const Vertex &v1, const Vertex &v2)
{
	if (mesh->vertexCount + 3 > mesh->capacity)
	{
		printf("Mesh is full (%u vertices), triangle dropped\n", mesh->capacity);
		return false;
	}

	mesh->vertices[mesh->vertexCount++] = v0;
	mesh->vertices[mesh->vertexCount++] = v1;
	mesh->vertices[mesh->vertexCount++] = v2;
	return true;
}

void UtilMesh::ReverseWinding(Mesh *mesh)
{
	for (Uint32 i = 0; i + 2 < mesh->vertexCount; i += 3)
	{
		Vertex tmp = mesh->vertices[i + 1];
		mesh->vertices[i + 1] = mesh->vertices[i + 2];
		mesh->vertices[i + 2] = tmp;
	}
}

Uint32 UtilMesh::TriangleCount(const Mesh *mesh)
{
	return mesh->vertexCount / 3;
}

void UtilMesh::Release(Mesh *mesh)
{
	free(mesh->vertices);
	mesh->vertices = NULL;
	mesh->vertexCount = 0;
	mesh->capacity = 0;
}

// Corners are red (top-left), green (top-right), blue (bottom-right) and white (bottom-left).
// Both triangles share the top-left to bottom-right diagonal and wind clockwise on screen.
Mesh UtilMesh::MakeQuad(vec2 center, float halfSize, float angle)
{
	const vec2 corners[4] =
	{
		vec2(-halfSize, -halfSize),
		vec2(halfSize, -halfSize),
		vec2(halfSize, halfSize),
		vec2(-halfSize, halfSize),
	};
	const vec2 uvs[4] = { vec2(0, 0), vec2(1, 0), vec2(1, 1), vec2(0, 1) };
	const vec3 colors[4] = { vec3(1, 0, 0), vec3(0, 1, 0), vec3(0, 0, 1), vec3(1, 1, 1) };

	float c = cosf(angle);
	float s = sinf(angle);
	mat2 rotation = mat2(c, s, -s, c);

	Vertex v[4];
	for (Uint32 i = 0; i < 4; ++i)
	{
		vec2 p = center + rotation * corners[i];
		v[i] = MakeVertex(vec3(p.x, p.y, 0.0f), uvs[i], colors[i]);
	}

	Mesh mesh = {};
	if (!Init(&mesh, 2))
		return mesh;

	AddTriangle(&mesh, v[0], v[1], v[2]);
	AddTriangle(&mesh, v[0], v[2], v[3]);
	return mesh;
}

// Axis aligned cells, every cell split along the same diagonal so neighbours share edges
Mesh UtilMesh::MakeGrid(vec2 origin, float cellSize, Uint32 columns, Uint32 rows, vec3 color)
{
	Mesh mesh = {};
	if (!Init(&mesh, columns * rows * 2))
		return mesh;

	for (Uint32 row = 0; row < rows; ++row)
	{
		for (Uint32 col = 0; col < columns; ++col)
		{
			float x0 = origin.x + col * cellSize;
			float y0 = origin.y + row * cellSize;
			float x1 = x0 + cellSize;
			float y1 = y0 + cellSize;

			vec2 uv0 = vec2(float(col) / columns, float(row) / rows);
			vec2 uv1 = vec2(float(col + 1) / columns, float(row + 1) / rows);

			Vertex tl = MakeVertex(vec3(x0, y0, 0.0f), vec2(uv0.x, uv0.y), color);
			Vertex tr = MakeVertex(vec3(x1, y0, 0.0f), vec2(uv1.x, uv0.y), color);
			Vertex br = MakeVertex(vec3(x1, y1, 0.0f), vec2(uv1.x, uv1.y), color);
			Vertex bl = MakeVertex(vec3(x0, y1, 0.0f), vec2(uv0.x, uv1.y), color);

			AddTriangle(&mesh, tl, tr, br);
			AddTriangle(&mesh, tl, br, bl);
		}
	}

	return mesh;
}
