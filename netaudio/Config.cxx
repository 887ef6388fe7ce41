#include "Config.hh"

#include "AudioPacket.hh"

#include <glib.h>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>


using namespace netaudio;

// Default values defined here.
std::string Config::s_prog_name = "netaudio";
std::optional<SocketAddress> Config::s_bind_address;
std::optional<SocketAddress> Config::s_send_address;
size_t Config::s_ring_size = DEFAULT_RING_SIZE;
uint32_t Config::s_rate = DEFAULT_RATE;
std::string Config::s_node_name = "netaudio";
bool Config::s_verbose = false;


void Config::Reset()
{
   s_bind_address.reset();
   s_send_address.reset();
   s_ring_size = DEFAULT_RING_SIZE;
   s_rate = DEFAULT_RATE;
   s_node_name = "netaudio";
   s_verbose = false;
}


void Config::Read(std::istream& in)
{
   std::string line;
   size_t line_number = 0;
   while (std::getline(in, line))
   {
      ++line_number;
      if (line.empty() || line.front() == '#')
         continue;

      // Space separate key value. Key cannot have spaces, value can.
      auto space_pos = line.find(' ');
      auto key = line.substr(0, space_pos);
      auto value = space_pos == std::string::npos ? "" : line.substr(space_pos + 1);
      if (value.empty() && IsFlag(key))
         value = "true";

      try
      {
         ParseConfigItem(key, value);
      }
      catch (const std::runtime_error& e)
      {
         g_warning("config line #%zu: %s", line_number, e.what());
      }
   }
}


void Config::ReadArgs(int argc, char** argv)
{
   try
   {
      ParseArgs(argc, argv);
   }
   catch (const std::runtime_error& e)
   {
      HelpAndExit(e.what());
   }
}


void Config::ParseArgs(int argc, char** argv)
{
   if (argc > 0)
      s_prog_name = argv[0];

   size_t positional = 0;
   for (int i = 1; i < argc; ++i)
   {
      if (0 == strcmp(argv[i], "--help"))
      {
         HelpAndExit("");
      }
      else if (0 == strncmp(argv[i], "--", 2))
      {
         std::string key = argv[i] + 2;
         std::string value;
         if (IsFlag(key))
         {
            value = "true";
         }
         else
         {
            if (i + 1 >= argc)
               throw std::runtime_error("Argument required for --" + key);
            value = argv[++i];
         }

         if (key == "config")
         {
            std::ifstream in(value);
            if (!in)
               throw std::runtime_error("Unable to read " + value);
            Read(in);
         }
         else
         {
            ParseConfigItem(key, value);
         }
      }
      else
      {
         switch (positional++)
         {
         case 0:  ParseConfigItem("bind_addr", argv[i]); break;
         case 1:  ParseConfigItem("send_addr", argv[i]); break;
         default: throw std::runtime_error(std::string("Unexpected argument: ") + argv[i]);
         }
      }
   }

   if (!s_bind_address)
      throw std::runtime_error("Missing <bind_addr>");
}


void Config::HelpAndExit(const std::string& error)
{
   if (!error.empty())
      std::cerr << error << '\n';

   std::cerr << "Streams stereo audio between pipewire and a remote peer over UDP.\n"
             << "USAGE: " << s_prog_name << " [options] <bind_addr> [<send_addr>]\n"
             << "\n"
             << "Addresses are numeric, as in 0.0.0.0:5000 or [::1]:5000. With only\n"
             << "<bind_addr>, audio received on it is played back. With <send_addr> as\n"
             << "well, audio played into the netaudio sink is sent to it.\n"
             << "\n"
             << "Options:\n"
             << "  --ring_size          Bytes buffered between pipewire and the network.\n"
             << "                       [Default: " << DEFAULT_RING_SIZE << "]\n"
             << "  --rate               Sample rate to request from pipewire. Must match\n"
             << "                       on both ends. [Default: " << DEFAULT_RATE << "]\n"
             << "  --node_name          Name of the pipewire node. [Default: netaudio]\n"
             << "  --config             Read \"key value\" lines from a file. Keys are the\n"
             << "                       option names, plus bind_addr and send_addr.\n"
             << "  --verbose            Show debug messages.\n"
             << "  --help               Shows this message\n";

   std::exit(EXIT_FAILURE);
}


bool Config::IsFlag(const std::string& key)
{
   return key == "verbose";
}


void Config::ParseConfigItem(const std::string& key, const std::string& value)
{
   auto ReadBool = [&]()
   {
      if (!value.empty())
      {
         switch (value.front())
         {
         case 't':
         case 'T':
         case 'y':
         case 'Y':
         case '1':
            return true;
         }
      }
      return false;
   };
   auto ReadString = [&]()
   {
      if (value.empty())
         throw std::runtime_error("Argument required for " + key);
      return value;
   };
   auto ReadInt = [&](long min, long max)
   {
      std::string s = ReadString();
      long ret;
      size_t end = 0;
      try
      {
         ret = std::stol(s, &end);
      }
      catch (const std::logic_error&)
      {
         throw std::runtime_error("Invalid argument specified for '" + key + "'.");
      }
      if (end != s.size())
         throw std::runtime_error("Invalid argument specified for '" + key + "'.");
      if (ret < min || ret > max)
         throw std::runtime_error(key + " must be in the range " + std::to_string(min) + " to " +std::to_string(max));
      return ret;
   };
   auto ReadAddress = [&]()
   {
      auto addr = SocketAddress::Parse(ReadString());
      if (!addr)
         throw std::runtime_error("Invalid address for " + key + ": '" + value + "'");
      return addr;
   };

   if (key == "bind_addr")
      s_bind_address = ReadAddress();
   else if (key == "send_addr")
      s_send_address = ReadAddress();
   else if (key == "ring_size")
      s_ring_size = ReadInt(AudioPacket::SIZE_BYTES, 16 * 1024 * 1024);
   else if (key == "rate")
      s_rate = ReadInt(8000, 384000);
   else if (key == "node_name")
      s_node_name = ReadString();
   else if (key == "verbose")
      s_verbose = ReadBool();
   else
      throw std::runtime_error("Unknown key " + key);
}
