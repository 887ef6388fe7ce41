#pragma once

#include "AudioPacket.hh"
#include "Diagnostic.hh"
#include "Processor.hh"
#include "RingBuffer.hh"

#include <vector>

namespace netaudio
{

// Playback side of the receiver. Fills each cycle from the ring, or plays
// silence for the whole cycle if not enough has arrived yet.
class ReceiveProcessor final: public Processor
{
public:
   ReceiveProcessor(RingReader ring, DiagnosticSender diagnostics, size_t max_samples = MAX_CYCLE_SAMPLES);

   virtual Control Process(float* left, size_t left_samples, float* right, size_t right_samples) override;

private:
   RingReader m_ring;
   DiagnosticSender m_diagnostics;
   std::vector<float> m_scratch; // Sized once, never grows.
};

}
