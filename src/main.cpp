#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sstream>
#include <string>

#include "renderer.h"
#include "fixed_loop.h"
#include "image_write.h"

#define SCREEN_WIDTH 960
#define SCREEN_HEIGHT 540
#define UPDATE_HZ 60
#define FONT_SIZE 18
#define DEFAULT_FONT_PATH "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf"

bool gIsRunning = true;
SDL_Window* gWindow = NULL;
unsigned gWindowID = 0;
TTF_Font* gFont = NULL;

// The HUD is optional, the demo runs without it when no font can be loaded
bool InitFonts()
{
    if (TTF_Init() == -1)
    {
        printf("SDL could not initialize SDL TTF! TTF_Error: %s\n", TTF_GetError());
        return false;
    }

    const char *fontPath = getenv("RASTER2D_FONT");
    if (fontPath == NULL)
        fontPath = DEFAULT_FONT_PATH;

    gFont = TTF_OpenFont(fontPath, FONT_SIZE);
    if (gFont == NULL)
    {
        printf("Could not load font %s, HUD disabled: %s\n", fontPath, TTF_GetError());
        return false;
    }

    return true;
}

bool Init()
{
    if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER | SDL_INIT_EVENTS) < 0)
    {
        printf("SDL could not initialize! SDL_Error: %s\n", SDL_GetError());
        return false;
    }

    gWindow = SDL_CreateWindow("raster2d", SDL_WINDOWPOS_UNDEFINED, SDL_WINDOWPOS_UNDEFINED, SCREEN_WIDTH, SCREEN_HEIGHT, SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
    if (gWindow == NULL)
    {
        printf("Window could not be created! SDL_Error: %s\n", SDL_GetError());
        return false;
    }

    gWindowID = SDL_GetWindowID(gWindow);

    InitFonts();
    return true;
}

void RenderText(const char *text, SDL_Color color, SDL_Rect textRect, SDL_Surface *destSurface)
{
    if (gFont == NULL)
        return;

    SDL_Surface *textSurface = TTF_RenderText_Solid(gFont, text, color);
    if (textSurface == NULL)
        return;
    SDL_BlitSurface(textSurface, NULL, destSurface, &textRect);
    SDL_FreeSurface(textSurface);
}

void RenderScreen(RenderContext *context)
{
    Surface *surface = &context->surface;
    if (surface->pixels == NULL)
        return;

    // Packed pixels are [r, g, b, a] in memory
    SDL_Surface *pixelSurface = SDL_CreateRGBSurfaceFrom(surface->pixels,
                                                         surface->width,
                                                         surface->height,
                                                         8 * 4,                  // depth in bits (BitsPerByte * BytesPerPixel)
                                                         surface->width * 4,     // pitch (row length * BytesPerPixel)
                                                         0x000000ff,             // red mask
                                                         0x0000ff00,             // green mask
                                                         0x00ff0000,             // blue mask
                                                         0);                     // alpha mask
    if (pixelSurface == NULL)
    {
        printf("Could not wrap the frame! SDL_Error: %s\n", SDL_GetError());
        return;
    }

    SDL_Color color = SDL_Color{ 200, 200, 200, 255 };
    SDL_Rect textRect = {};
    textRect.x = 8;
    textRect.y = 4;

    std::stringstream ss;
    ss << "Quad shading: " << Rasterization::ShadingToString(context->quadShading) << " (1)";
    RenderText(ss.str().c_str(), color, textRect, pixelSurface);

    textRect.y += FONT_SIZE + 6;
    std::stringstream ss2;
    ss2 << "Double sided: " << (context->doubleSided ? "on" : "off") << " (8)  Reversed: " << (context->reverseWinding ? "yes" : "no") << " (R)";
    RenderText(ss2.str().c_str(), color, textRect, pixelSurface);

    textRect.y += FONT_SIZE + 6;
    RenderText("Save: (P) frame.ppm  (B) frame.bmp", color, textRect, pixelSurface);

    // Blit (copy) it to the window
    SDL_BlitSurface(pixelSurface, NULL, SDL_GetWindowSurface(gWindow), NULL);

    SDL_FreeSurface(pixelSurface);
}

void onWindowResized(int w, int h, RenderContext *context)
{
    if (w > 50 && h > 50)
    {
        context->width = w;
        context->height = h;
    }
}

void onKeyDown(SDL_Keycode key, RenderContext *context)
{
    switch (key)
    {
        case SDLK_ESCAPE: gIsRunning = false; return;
        case SDLK_1:
            context->quadShading = Renderer::NextShading(context->quadShading);
            break;
        case SDLK_8:
            context->doubleSided = !context->doubleSided;
            break;
        case SDLK_r:
            context->reverseWinding = !context->reverseWinding;
            break;
        case SDLK_p:
            if (ImageWrite::WritePPM(&context->surface, "frame.ppm"))
                printf("Saved frame.ppm\n");
            break;
        case SDLK_b:
            if (ImageWrite::WriteBMP(&context->surface, "frame.bmp"))
                printf("Saved frame.bmp\n");
            break;
        default:
            break;
    }
}

// Renders a number of fixed steps without a window and writes every frame as PPM
int RunHeadless(int frames, const char *outDir)
{
    RenderContext context = {};
    if (!Renderer::Init(&context, SCREEN_WIDTH / 2, SCREEN_HEIGHT / 2))
        return -1;

    FixedLoop loop = {};
    LoopControl::Init(&loop, UPDATE_HZ);

    int result = 0;
    for (int i = 0; i < frames; ++i)
    {
        Renderer::Update(&context, loop.fixedDt);
        Renderer::Render(&context, 0.0f);

        char name[32];
        snprintf(name, sizeof(name), "frame%04d.ppm", i);
        std::string path = std::string(outDir) + "/" + name;
        if (!ImageWrite::WritePPM(&context.surface, path.c_str()))
        {
            result = -1;
            break;
        }
    }

    if (result == 0)
        printf("Wrote %d frames to %s\n", frames, outDir);

    Renderer::Release(&context);
    return result;
}

int main(int argc, char *argv[])
{
    if (argc >= 2 && strcmp(argv[1], "--headless") == 0)
    {
        int frames = argc >= 3 ? atoi(argv[2]) : 60;
        const char *outDir = argc >= 4 ? argv[3] : ".";
        return RunHeadless(frames, outDir);
    }

    if (!Init())
        return -1;

    RenderContext context = {};
    if (!Renderer::Init(&context, SCREEN_WIDTH, SCREEN_HEIGHT))
    {
        SDL_DestroyWindow(gWindow);
        SDL_Quit();
        return -1;
    }

    FixedLoop loop = {};
    LoopControl::Init(&loop, UPDATE_HZ);

    Uint64 performanceFrequency = SDL_GetPerformanceFrequency();
    Uint64 currentTime = SDL_GetPerformanceCounter();
    Uint64 previousTime = 0;

    SDL_Event event;

    while (gIsRunning)
    {
        while (SDL_PollEvent(&event) != 0)
        {
            switch (event.type)
            {
                case SDL_KEYDOWN:
                    onKeyDown(event.key.keysym.sym, &context);
                    break;
                case SDL_QUIT:
                    gIsRunning = false;
                    break;
                case SDL_WINDOWEVENT:
                    if (event.window.windowID == gWindowID && event.window.event == SDL_WINDOWEVENT_RESIZED)
                        onWindowResized(event.window.data1, event.window.data2, &context);
                    break;
                default:
                    break;
            }
        }

        previousTime = currentTime;
        currentTime = SDL_GetPerformanceCounter();
        double dt = (currentTime - previousTime) / double(performanceFrequency);

        float alpha = 0.0f;
        Uint32 updates = LoopControl::Advance(&loop, dt, &alpha);
        for (Uint32 i = 0; i < updates; ++i)
            Renderer::Update(&context, loop.fixedDt);

        Renderer::Render(&context, alpha);

        RenderScreen(&context);
        SDL_UpdateWindowSurface(gWindow);
    }

    Renderer::Release(&context);
    if (gFont)
        TTF_CloseFont(gFont);
    TTF_Quit();
    SDL_DestroyWindow(gWindow);
    gWindow = NULL;
    SDL_Quit();

    return 0;
}
