#ifndef RENDERER_H
#define RENDERER_H

#include <SDL2/SDL.h>
#include <glm/glm.hpp>
#include "rasterizer.h"
#include "surface.h"
#include "texture.h"
#include "mesh.h"

struct RenderContext
{
	Surface surface;
	int width;
	int height;
	Uint32 clearColor;

	Texture checkerTexture;

	// User input
	int quadShading;
	bool doubleSided;
	bool reverseWinding;

	// Quad animation, previousAngle is kept for interpolating between fixed steps
	float quadAngle;
	float previousAngle;
	float rotationSpeed;
};

namespace Renderer
{
	bool Init(RenderContext *context, Uint32 width, Uint32 height);
	void Update(RenderContext *context, double dt);
	void Render(RenderContext *context, float alpha);
	void Release(RenderContext *context);
	int NextShading(int shading);
}
#endif
