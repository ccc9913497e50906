#include "fixed_loop.h"

void LoopControl::Init(FixedLoop *loop, Uint32 hz)
{
    if (hz == 0)
        hz = 60;

    loop->fixedDt = 1.0 / double(hz);
    loop->maxFrameDt = 0.25;
    loop->maxUpdatesPerFrame = 5;
    loop->accumulator = 0.0;
    loop->frameIndex = 0;
}

void LoopControl::SetLimits(FixedLoop *loop, double maxFrameDt, Uint32 maxUpdatesPerFrame)
{
    loop->maxFrameDt = maxFrameDt;
    loop->maxUpdatesPerFrame = maxUpdatesPerFrame;
}

Uint32 LoopControl::Advance(FixedLoop *loop, double frameDt, float *alpha)
{
    if (!(frameDt > 0.0))
        frameDt = 0.0;
    if (frameDt > loop->maxFrameDt)
        frameDt = loop->maxFrameDt;

    loop->accumulator += frameDt;

    Uint32 updates = 0;
    while (loop->fixedDt > 0.0 && loop->accumulator >= loop->fixedDt && updates < loop->maxUpdatesPerFrame)
    {
        loop->accumulator -= loop->fixedDt;
        ++updates;
    }

    // Spiral of death: drop the backlog
    if (updates >= loop->maxUpdatesPerFrame)
        loop->accumulator = 0.0;

    float a = 0.0f;
    if (loop->fixedDt > 0.0)
    {
        a = float(loop->accumulator / loop->fixedDt);
        if (a < 0.0f)
            a = 0.0f;
        if (a > 0.999999f)
            a = 0.999999f;
    }
    if (alpha)
        *alpha = a;

    loop->frameIndex++;
    return updates;
}
