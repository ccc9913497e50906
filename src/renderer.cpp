#include <stdio.h>
#include "renderer.h"
#include "color.h"

#define CHECKER_SIZE 64
#define CHECKER_CELL 8
#define QUAD_HALF_SIZE 0.22f
#define TWO_PI 6.28318530717958647692f

using glm::vec2;
using glm::vec3;

int Renderer::NextShading(int shading)
{
	switch (shading)
	{
	case SOLID_SHADING:
		return VERTEX_COLOR_SHADING;
	case VERTEX_COLOR_SHADING:
		return TEXTURED_SHADING;
	case TEXTURED_SHADING:
	default:
		return SOLID_SHADING;
	}
}

bool Renderer::Init(RenderContext *context, Uint32 width, Uint32 height)
{
	context->width = width;
	context->height = height;
	context->clearColor = UtilColor::Pack(UtilColor::MakeColor(20, 30, 50));
	context->quadShading = TEXTURED_SHADING;
	context->doubleSided = false;
	context->reverseWinding = false;
	context->quadAngle = 0.0f;
	context->previousAngle = 0.0f;
	context->rotationSpeed = 0.5f;

	if (!UtilSurface::Init(&context->surface, width, height))
		return false;

	Uint32 light = UtilColor::Pack(UtilColor::MakeColor(220, 220, 220));
	Uint32 dark = UtilColor::Pack(UtilColor::MakeColor(40, 40, 40));
	if (!UtilTexture::MakeCheckerboard(&context->checkerTexture, CHECKER_SIZE, CHECKER_SIZE, CHECKER_CELL, light, dark))
	{
		UtilSurface::Release(&context->surface);
		return false;
	}

	return true;
}

// Fixed step
void Renderer::Update(RenderContext *context, double dt)
{
	context->previousAngle = context->quadAngle;
	context->quadAngle += context->rotationSpeed * TWO_PI * float(dt);
	if (context->quadAngle > TWO_PI)
	{
		context->quadAngle -= TWO_PI;
		context->previousAngle -= TWO_PI;
	}
}

static void UpdateContext(RenderContext *context)
{
	if (context->width != int(context->surface.width) || context->height != int(context->surface.height))
	{
		if (!UtilSurface::Resize(&context->surface, context->width, context->height))
			printf("Surface resize to %dx%d failed\n", context->width, context->height);
	}
}

static void RenderTriangles(RenderContext *context)
{
	float w = float(context->width);
	float h = float(context->height);
	Surface *surface = &context->surface;

	// Solid triangle, left
	Vertex s0 = UtilMesh::MakeVertex(vec3(0.05f * w, 0.10f * h, 0.0f));
	Vertex s1 = UtilMesh::MakeVertex(vec3(0.30f * w, 0.15f * h, 0.0f));
	Vertex s2 = UtilMesh::MakeVertex(vec3(0.10f * w, 0.80f * h, 0.0f));
	Rasterization::DrawTriangleSolid(surface, s0, s1, s2, UtilColor::Pack(UtilColor::MakeColor(220, 80, 80)));

	// Vertex colored triangle, right
	Vertex c0 = UtilMesh::MakeVertex(vec3(0.70f * w, 0.15f * h, 0.0f), vec2(0, 0), vec3(1.0f, 0.0f, 0.0f));
	Vertex c1 = UtilMesh::MakeVertex(vec3(0.95f * w, 0.85f * h, 0.0f), vec2(0, 0), vec3(0.0f, 1.0f, 0.0f));
	Vertex c2 = UtilMesh::MakeVertex(vec3(0.65f * w, 0.85f * h, 0.0f), vec2(0, 0), vec3(0.0f, 0.0f, 1.0f));
	Rasterization::DrawTriangleVertexColor(surface, c0, c1, c2);
}

static void RenderQuad(RenderContext *context, float alpha)
{
	float angle = context->previousAngle + (context->quadAngle - context->previousAngle) * alpha;
	float size = float(context->width < context->height ? context->width : context->height);
	vec2 center = vec2(context->width * 0.5f, context->height * 0.5f);

	Mesh quad = UtilMesh::MakeQuad(center, size * QUAD_HALF_SIZE, angle);
	if (context->reverseWinding)
		UtilMesh::ReverseWinding(&quad);

	Shader shader = {};
	switch (context->quadShading)
	{
	case SOLID_SHADING:
		shader = Rasterization::MakeSolidShader(UtilColor::Pack(UtilColor::MakeColor(80, 160, 200)));
		break;
	case VERTEX_COLOR_SHADING:
		shader = Rasterization::MakeVertexColorShader();
		break;
	default:
		shader = Rasterization::MakeTextureShader(&context->checkerTexture);
		break;
	}

	Uint32 flags = context->doubleSided ? DOUBLE_SIDED_BIT : 0;
	Rasterization::DrawTriangleMesh(&context->surface, &quad, &shader, flags);
	UtilMesh::Release(&quad);
}

void Renderer::Render(RenderContext *context, float alpha)
{
	UpdateContext(context);

	UtilSurface::Clear(&context->surface, context->clearColor);
	RenderTriangles(context);
	RenderQuad(context, alpha);
}

void Renderer::Release(RenderContext *context)
{
	UtilTexture::Release(&context->checkerTexture);
	UtilSurface::Release(&context->surface);
}
