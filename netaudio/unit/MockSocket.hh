#pragma once

#include "../DatagramSocket.hh"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <deque>
#include <system_error>
#include <vector>


namespace netaudio
{

// Records everything sent, and hands out queued datagrams on Receive(). An
// empty queue, or a Fail() call, makes the next operation throw like a dead
// socket would.
class MockSocket: public DatagramSocket
{
public:
   virtual void Send(const uint8_t* data, size_t len) override
   {
      if (m_fail)
         throw std::system_error(ECONNREFUSED, std::generic_category(), "unable to send data");
      m_sent.emplace_back(data, data + len);
   }

   virtual size_t Receive(uint8_t* data, size_t len) override
   {
      if (m_fail || m_incoming.empty())
         throw std::system_error(EBADF, std::generic_category(), "unable to receive data");
      auto datagram = std::move(m_incoming.front());
      m_incoming.pop_front();
      memcpy(data, datagram.data(), std::min(len, datagram.size()));
      return datagram.size();
   }

   void Queue(std::vector<uint8_t> datagram) { m_incoming.push_back(std::move(datagram)); }
   void Fail() { m_fail = true; }

   const std::vector<std::vector<uint8_t>>& Sent() const { return m_sent; }

private:
   bool m_fail = false;
   std::deque<std::vector<uint8_t>> m_incoming;
   std::vector<std::vector<uint8_t>> m_sent;
};

}
