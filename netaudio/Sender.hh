#pragma once

#include "DatagramSocket.hh"
#include "Diagnostic.hh"
#include "RingBuffer.hh"

#include <memory>

namespace netaudio
{

// Network thread of the sender. Sleeps on the diagnostic channel, and each
// time a capture cycle reports Ready, ships every complete packet in the ring
// to the peer. A partial packet stays in the ring until the next cycle
// completes it.
class Sender final
{
public:
   Sender(RingReader ring, DiagnosticReceiver diagnostics, std::shared_ptr<DatagramSocket> socket);

   // Loop forever. Only leaves by throwing, when the socket fails.
   [[noreturn]] void Run();

   // Wait for and handle a single diagnostic message.
   void RunOnce();

   size_t PacketsSent() const { return m_packets_sent; }

private:
   void Flush();

   RingReader m_ring;
   DiagnosticReceiver m_diagnostics;
   std::shared_ptr<DatagramSocket> m_socket;

   size_t m_packets_sent = 0;
};

}
