#pragma once

#include "SocketAddress.hh"

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>


namespace netaudio
{

// Keep track of configuration options. Can be read from command line or
// a config file.
class Config final
{
public:
   static void Read(std::istream& in);
   // Parse the command line, printing usage and exiting on any error.
   static void ReadArgs(int argc, char** argv);
   // Same as ReadArgs(), but throws std::runtime_error instead of exiting.
   static void ParseArgs(int argc, char** argv);
   [[noreturn]] static void HelpAndExit(const std::string& error);
   // Restore every setting to its default.
   static void Reset();

   static const std::optional<SocketAddress>& BindAddress() { return s_bind_address; }
   static const std::optional<SocketAddress>& SendAddress() { return s_send_address; }
   static bool IsSender() { return s_send_address.has_value(); }
   static size_t RingSize() { return s_ring_size; }
   static uint32_t Rate() { return s_rate; }
   static const std::string& NodeName() { return s_node_name; }
   static bool Verbose() { return s_verbose; }

private:
   static void ParseConfigItem(const std::string& key, const std::string& value);
   static bool IsFlag(const std::string& key);

   static std::string s_prog_name;
   static std::optional<SocketAddress> s_bind_address;
   static std::optional<SocketAddress> s_send_address;
   static size_t s_ring_size;
   static uint32_t s_rate;
   static std::string s_node_name;
   static bool s_verbose;
};

}
