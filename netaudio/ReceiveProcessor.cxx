#include "ReceiveProcessor.hh"

#include "Interleave.hh"

#include <algorithm>

using namespace netaudio;


ReceiveProcessor::ReceiveProcessor(RingReader ring, DiagnosticSender diagnostics, size_t max_samples):
   m_ring{std::move(ring)},
   m_diagnostics{std::move(diagnostics)},
   m_scratch(max_samples)
{
}


Processor::Control ReceiveProcessor::Process(float* left, size_t left_samples, float* right, size_t right_samples)
{
   size_t samples = left_samples + right_samples;
   if (samples > m_scratch.size() || left_samples != right_samples)
   {
      m_diagnostics.Send(diag::InvalidBufferLengths{});
      return QUIT;
   }

   size_t required = samples * sizeof(float);
   size_t available = m_ring.ReadableBytes();
   if (available < required)
   {
      // Leave whatever did arrive in the ring for the next cycle.
      std::fill_n(left, left_samples, 0.0f);
      std::fill_n(right, right_samples, 0.0f);
      m_diagnostics.Send(diag::Underrun{required, available});
      return CONTINUE;
   }

   m_ring.ReadExact((uint8_t*)m_scratch.data(), required);
   Deinterleave(m_scratch.data(), left_samples, left, right);
   return CONTINUE;
}
