#pragma once

#include "AudioPacket.hh"
#include "Diagnostic.hh"
#include "Processor.hh"
#include "RingBuffer.hh"

#include <vector>

namespace netaudio
{

// Capture side of the sender. Interleaves each cycle into the ring, or drops
// the whole cycle if the network thread has fallen behind. Every cycle that
// does not fail outright is followed by a Ready message, which is what paces
// the network thread.
class SendProcessor final: public Processor
{
public:
   SendProcessor(RingWriter ring, DiagnosticSender diagnostics, size_t max_samples = MAX_CYCLE_SAMPLES);

   virtual Control Process(float* left, size_t left_samples, float* right, size_t right_samples) override;

private:
   RingWriter m_ring;
   DiagnosticSender m_diagnostics;
   std::vector<float> m_scratch; // Sized once, never grows.
};

}
