#pragma once

#include <netinet/in.h>
#include <sys/socket.h>

#include <cstdint>
#include <optional>
#include <string>

namespace netaudio
{

// Numeric IPv4 or IPv6 address with a port, written as "1.2.3.4:5000" or
// "[::1]:5000". Host names are not resolved.
class SocketAddress final
{
public:
   static std::optional<SocketAddress> Parse(const std::string& s);

   const struct sockaddr* Get() const { return (const struct sockaddr*)&m_addr; }
   socklen_t Length() const { return m_len; }
   int Family() const { return m_addr.ss_family; }
   uint16_t Port() const;
   std::string ToString() const;

private:
   SocketAddress() {}

   struct sockaddr_storage m_addr{};
   socklen_t m_len = 0;
};

}
