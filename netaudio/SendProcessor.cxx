#include "SendProcessor.hh"

#include "Interleave.hh"

using namespace netaudio;


SendProcessor::SendProcessor(RingWriter ring, DiagnosticSender diagnostics, size_t max_samples):
   m_ring{std::move(ring)},
   m_diagnostics{std::move(diagnostics)},
   m_scratch(max_samples)
{
}


Processor::Control SendProcessor::Process(float* left, size_t left_samples, float* right, size_t right_samples)
{
   // Pipewire may change the quantum at runtime, so check every cycle.
   size_t samples = left_samples + right_samples;
   if (samples > m_scratch.size() || left_samples != right_samples)
   {
      m_diagnostics.Send(diag::InvalidBufferLengths{});
      return QUIT;
   }

   size_t required = samples * sizeof(float);
   size_t available = m_ring.WritableBytes();
   if (available < required)
   {
      // Drop the entire cycle rather than splitting a frame.
      m_diagnostics.Send(diag::Overrun{required, available});
   }
   else
   {
      Interleave(left, right, left_samples, m_scratch.data());
      m_ring.Write((const uint8_t*)m_scratch.data(), required);
   }

   m_diagnostics.Send(diag::Ready{});
   return CONTINUE;
}
