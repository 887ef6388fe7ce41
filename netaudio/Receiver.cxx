#include "Receiver.hh"

#include "AudioPacket.hh"

#include <glib.h>

using namespace netaudio;


Receiver::Receiver(RingWriter ring, DiagnosticReceiver diagnostics, std::shared_ptr<DatagramSocket> socket):
   m_ring{std::move(ring)},
   m_diagnostics{std::move(diagnostics)},
   m_socket{std::move(socket)}
{
}


void Receiver::Run()
{
   while (true)
      RunOnce();
}


void Receiver::RunOnce()
{
   while (auto message = m_diagnostics.TryReceive())
      LogDiagnostic(*message);

   AudioPacket packet;
   size_t received = m_socket->Receive(packet.data, sizeof(packet.data));
   if (received != AudioPacket::SIZE_BYTES)
   {
      g_warning("invalid packet size, expected %zu, got %zu, dropping",
                AudioPacket::SIZE_BYTES, received);
      ++m_invalid_packets;
      return;
   }

   size_t available = m_ring.WritableBytes();
   if (available < AudioPacket::SIZE_BYTES)
   {
      g_warning("overrun, expected to write %zu bytes, %zu available",
                AudioPacket::SIZE_BYTES, available);
      ++m_ring_dropped;
      return;
   }

   m_ring.Write(packet.data, sizeof(packet.data));
   ++m_packets_queued;
}
