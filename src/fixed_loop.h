#ifndef FIXED_LOOP_H
#define FIXED_LOOP_H

#include <SDL2/SDL.h>

// Fixed timestep accumulator. Times are in seconds.
struct FixedLoop
{
    double fixedDt;
    double maxFrameDt;
    Uint32 maxUpdatesPerFrame;
    double accumulator;
    Uint64 frameIndex;
};

namespace LoopControl
{
    void Init(FixedLoop *loop, Uint32 hz);
    void SetLimits(FixedLoop *loop, double maxFrameDt, Uint32 maxUpdatesPerFrame);

    // Returns how many fixed updates to run for a frame that took frameDt,
    // alpha receives the leftover fraction of a step in [0, 1)
    Uint32 Advance(FixedLoop *loop, double frameDt, float *alpha);
}

#endif
