#pragma once

#include "DatagramSocket.hh"
#include "Diagnostic.hh"
#include "RingBuffer.hh"

#include <memory>

namespace netaudio
{

// Network thread of the receiver. Logs whatever the playback side reported,
// then waits for one datagram and queues it for playback. Packets of the
// wrong size, or that don't fit in the ring, are dropped.
class Receiver final
{
public:
   Receiver(RingWriter ring, DiagnosticReceiver diagnostics, std::shared_ptr<DatagramSocket> socket);

   // Loop forever. Only leaves by throwing, when the socket fails.
   [[noreturn]] void Run();

   // Drain pending diagnostics, then receive and handle a single datagram.
   void RunOnce();

   size_t PacketsQueued() const { return m_packets_queued; }
   size_t InvalidPackets() const { return m_invalid_packets; }
   size_t RingDropped() const { return m_ring_dropped; }

private:
   RingWriter m_ring;
   DiagnosticReceiver m_diagnostics;
   std::shared_ptr<DatagramSocket> m_socket;

   size_t m_packets_queued = 0;
   size_t m_invalid_packets = 0;
   size_t m_ring_dropped = 0;
};

}
