#pragma once

#include <cstddef>

namespace netaudio
{

// Per-cycle audio work run on the pipewire realtime thread. Implementations
// must finish in bounded time without locking, allocating or blocking.
class Processor
{
public:
   enum Control { CONTINUE, QUIT };

   virtual ~Processor() { }

   // left and right are the planar channel buffers for this cycle, already
   // filled for capture and waiting to be filled for playback. Returning QUIT
   // asks the host to stop calling this processor.
   virtual Control Process(float* left, size_t left_samples, float* right, size_t right_samples) = 0;
};

}
