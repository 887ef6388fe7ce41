#include "SocketAddress.hh"

#include <arpa/inet.h>

#include <cstring>

using namespace netaudio;

namespace
{
   bool ParsePort(const std::string& s, uint16_t* port)
   {
      if (s.empty() || s.size() > 5)
         return false;
      unsigned long value = 0;
      for (char c: s)
      {
         if (c < '0' || c > '9')
            return false;
         value = value * 10 + (c - '0');
      }
      if (value > 65535)
         return false;
      *port = value;
      return true;
   }
}


std::optional<SocketAddress> SocketAddress::Parse(const std::string& s)
{
   SocketAddress ret;
   std::string host;
   std::string port_str;
   bool v6 = false;

   if (!s.empty() && s.front() == '[')
   {
      auto close = s.find("]:");
      if (close == std::string::npos)
         return std::nullopt;
      host = s.substr(1, close - 1);
      port_str = s.substr(close + 2);
      v6 = true;
   }
   else
   {
      auto colon = s.rfind(':');
      if (colon == std::string::npos)
         return std::nullopt;
      host = s.substr(0, colon);
      port_str = s.substr(colon + 1);
      // An unbracketed IPv6 address can't be split from its port.
      if (host.find(':') != std::string::npos)
         return std::nullopt;
   }

   uint16_t port;
   if (!ParsePort(port_str, &port))
      return std::nullopt;

   if (v6)
   {
      auto* addr = (struct sockaddr_in6*)&ret.m_addr;
      if (inet_pton(AF_INET6, host.c_str(), &addr->sin6_addr) != 1)
         return std::nullopt;
      addr->sin6_family = AF_INET6;
      addr->sin6_port = htons(port);
      ret.m_len = sizeof(struct sockaddr_in6);
   }
   else
   {
      auto* addr = (struct sockaddr_in*)&ret.m_addr;
      if (inet_pton(AF_INET, host.c_str(), &addr->sin_addr) != 1)
         return std::nullopt;
      addr->sin_family = AF_INET;
      addr->sin_port = htons(port);
      ret.m_len = sizeof(struct sockaddr_in);
   }
   return ret;
}


uint16_t SocketAddress::Port() const
{
   if (m_addr.ss_family == AF_INET6)
      return ntohs(((const struct sockaddr_in6*)&m_addr)->sin6_port);
   return ntohs(((const struct sockaddr_in*)&m_addr)->sin_port);
}


std::string SocketAddress::ToString() const
{
   char buffer[INET6_ADDRSTRLEN] = {};
   if (m_addr.ss_family == AF_INET6)
   {
      inet_ntop(AF_INET6, &((const struct sockaddr_in6*)&m_addr)->sin6_addr, buffer, sizeof(buffer));
      return std::string("[") + buffer + "]:" + std::to_string(Port());
   }
   inet_ntop(AF_INET, &((const struct sockaddr_in*)&m_addr)->sin_addr, buffer, sizeof(buffer));
   return std::string(buffer) + ":" + std::to_string(Port());
}
