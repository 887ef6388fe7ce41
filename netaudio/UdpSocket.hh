#pragma once

#include "DatagramSocket.hh"
#include "SocketAddress.hh"

namespace netaudio
{

class UdpSocket final: public DatagramSocket
{
public:
   // Throws std::system_error if the socket can't be created or bound.
   explicit UdpSocket(const SocketAddress& bind_address);
   virtual ~UdpSocket() override;

   UdpSocket(const UdpSocket&) = delete;
   UdpSocket& operator=(const UdpSocket&) = delete;

   // Fix the destination for Send(). Throws std::system_error.
   void Connect(const SocketAddress& peer);

   virtual void Send(const uint8_t* data, size_t len) override;
   virtual size_t Receive(uint8_t* data, size_t len) override;

private:
   int m_sock = -1;
};

}
