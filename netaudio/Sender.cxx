#include "Sender.hh"

#include "AudioPacket.hh"

using namespace netaudio;


Sender::Sender(RingReader ring, DiagnosticReceiver diagnostics, std::shared_ptr<DatagramSocket> socket):
   m_ring{std::move(ring)},
   m_diagnostics{std::move(diagnostics)},
   m_socket{std::move(socket)}
{
}


void Sender::Run()
{
   while (true)
      RunOnce();
}


void Sender::RunOnce()
{
   auto message = m_diagnostics.Receive();

   // If the capture side has gone away, keep draining whatever it left.
   if (!message || std::holds_alternative<diag::Ready>(*message))
      Flush();
   else
      LogDiagnostic(*message);
}


void Sender::Flush()
{
   AudioPacket packet;
   while (m_ring.ReadableBytes() >= AudioPacket::SIZE_BYTES)
   {
      m_ring.ReadExact(packet.data, sizeof(packet.data));
      m_socket->Send(packet.data, sizeof(packet.data));
      ++m_packets_sent;
   }
}
