#include "UdpSocket.hh"

#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

using namespace netaudio;


UdpSocket::UdpSocket(const SocketAddress& bind_address)
{
   m_sock = socket(bind_address.Family(), SOCK_DGRAM | SOCK_CLOEXEC, 0);
   if (m_sock < 0)
      throw std::system_error(errno, std::generic_category(), "unable to create socket");

   if (bind(m_sock, bind_address.Get(), bind_address.Length()) < 0)
   {
      int err = errno;
      close(m_sock);
      throw std::system_error(err, std::generic_category(), "unable to bind to address " + bind_address.ToString());
   }
}


UdpSocket::~UdpSocket()
{
   if (m_sock >= 0)
      close(m_sock);
}


void UdpSocket::Connect(const SocketAddress& peer)
{
   if (connect(m_sock, peer.Get(), peer.Length()) < 0)
      throw std::system_error(errno, std::generic_category(), "unable to connect to " + peer.ToString());
}


void UdpSocket::Send(const uint8_t* data, size_t len)
{
   while (send(m_sock, data, len, 0) < 0)
   {
      if (errno != EINTR)
         throw std::system_error(errno, std::generic_category(), "unable to send data");
   }
}


size_t UdpSocket::Receive(uint8_t* data, size_t len)
{
   while (true)
   {
      // MSG_TRUNC reports the full datagram length, so an oversized packet
      // can be told apart from one that fits exactly.
      ssize_t received = recv(m_sock, data, len, MSG_TRUNC);
      if (received >= 0)
         return received;
      if (errno != EINTR)
         throw std::system_error(errno, std::generic_category(), "unable to receive data");
   }
}
