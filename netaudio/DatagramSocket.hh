#pragma once

#include <cstddef>
#include <cstdint>

namespace netaudio
{

// Abstract datagram transport used by the network threads, so that the
// loops can run against something other than a real socket.
class DatagramSocket
{
public:
   virtual ~DatagramSocket() { }

   // Send one datagram to the connected peer. Throws std::system_error.
   virtual void Send(const uint8_t* data, size_t len) = 0;

   // Block until one datagram arrives, copying at most len bytes of it.
   // Returns the real length of the datagram, which may be larger than len.
   // Throws std::system_error.
   virtual size_t Receive(uint8_t* data, size_t len) = 0;
};

}
