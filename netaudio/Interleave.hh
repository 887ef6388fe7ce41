#pragma once

#include <cstddef>

namespace netaudio
{

// Arrange two channels of `frames` samples each into L,R,L,R,... order.
inline void Interleave(const float* left, const float* right, size_t frames, float* out)
{
   for (size_t i = 0; i < frames; ++i)
   {
      out[2 * i] = left[i];
      out[2 * i + 1] = right[i];
   }
}

// Split `frames` interleaved L,R pairs back into two channels.
inline void Deinterleave(const float* in, size_t frames, float* left, float* right)
{
   for (size_t i = 0; i < frames; ++i)
   {
      left[i] = in[2 * i];
      right[i] = in[2 * i + 1];
   }
}

}
