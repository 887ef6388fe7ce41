#include "unit_test.hh"

#include "../Config.hh"
#include "../Log.hh"
#include "../SocketAddress.hh"

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace netaudio;


class test_SocketAddress
{
public:
   void test_IPv4()
   {
      auto addr = SocketAddress::Parse("127.0.0.1:5000");
      ASSERT_TRUE(addr.has_value());
      ASSERT_EQ(addr->Family(), AF_INET);
      ASSERT_EQ(addr->Port(), 5000);
      ASSERT_EQ(addr->Length(), sizeof(struct sockaddr_in));
      ASSERT_EQ(addr->ToString(), "127.0.0.1:5000");

      addr = SocketAddress::Parse("0.0.0.0:0");
      ASSERT_TRUE(addr.has_value());
      ASSERT_EQ(addr->Port(), 0);
   }

   void test_IPv6()
   {
      auto addr = SocketAddress::Parse("[::1]:65535");
      ASSERT_TRUE(addr.has_value());
      ASSERT_EQ(addr->Family(), AF_INET6);
      ASSERT_EQ(addr->Port(), 65535);
      ASSERT_EQ(addr->ToString(), "[::1]:65535");

      ASSERT_TRUE(SocketAddress::Parse("[fe80::1:2]:9"));
   }

   void test_Invalid()
   {
      const char* bad[] = {
         "",
         "127.0.0.1",
         "127.0.0.1:",
         "127.0.0.1:65536",
         "127.0.0.1:-1",
         "127.0.0.1:5x",
         "localhost:5000",
         "300.1.1.1:5000",
         "::1:5000",
         "[::1]",
         "[::1]5000",
         "[127.0.0.1]:5000",
         ":5000",
      };
      for (auto* s: bad)
         ASSERT_TRUE(!SocketAddress::Parse(s)) << "accepted '" << s << "'";
   }
};


class test_Config
{
public:
   test_Config() { Config::Reset(); }

   static void Parse(std::vector<std::string> args)
   {
      args.insert(args.begin(), "netaudio");
      std::vector<char*> argv;
      for (auto& a: args)
         argv.push_back(a.data());
      Config::ParseArgs(argv.size(), argv.data());
   }

   static bool Rejects(std::vector<std::string> args)
   {
      try
      {
         Parse(args);
      }
      catch (const std::runtime_error&)
      {
         return true;
      }
      return false;
   }

   void test_Receiver()
   {
      Parse({"0.0.0.0:5000"});
      ASSERT_TRUE(Config::BindAddress().has_value());
      ASSERT_EQ(Config::BindAddress()->Port(), 5000);
      ASSERT_TRUE(!Config::IsSender());
      ASSERT_EQ(Config::RingSize(), 16384u);
      ASSERT_EQ(Config::Rate(), 48000u);
      ASSERT_EQ(Config::NodeName(), "netaudio");
      ASSERT_TRUE(!Config::Verbose());
   }

   void test_Sender()
   {
      Parse({"0.0.0.0:5001", "[::1]:5000"});
      ASSERT_TRUE(Config::IsSender());
      ASSERT_EQ(Config::BindAddress()->ToString(), "0.0.0.0:5001");
      ASSERT_EQ(Config::SendAddress()->ToString(), "[::1]:5000");
   }

   void test_Options()
   {
      Parse({"--ring_size", "9600", "--verbose", "0.0.0.0:5000", "--rate", "44100", "--node_name", "studio"});
      ASSERT_EQ(Config::RingSize(), 9600u);
      ASSERT_EQ(Config::Rate(), 44100u);
      ASSERT_EQ(Config::NodeName(), "studio");
      ASSERT_TRUE(Config::Verbose());
      // --verbose must not have swallowed the address.
      ASSERT_TRUE(Config::BindAddress().has_value());
      ASSERT_TRUE(!Config::IsSender());
   }

   void test_Rejected()
   {
      ASSERT_TRUE(Rejects({})) << "no arguments";
      ASSERT_TRUE(Rejects({"nonsense"}));
      ASSERT_TRUE(Rejects({"0.0.0.0:5000", "nonsense"})) << "bad send address";
      ASSERT_TRUE(Rejects({"0.0.0.0:5000", "1.2.3.4:5", "1.2.3.4:6"})) << "too many addresses";
      ASSERT_TRUE(Rejects({"--ring_size", "100", "0.0.0.0:5000"})) << "ring smaller than a packet";
      ASSERT_TRUE(Rejects({"--ring_size", "12abc", "0.0.0.0:5000"}));
      ASSERT_TRUE(Rejects({"--rate", "0", "0.0.0.0:5000"}));
      ASSERT_TRUE(Rejects({"0.0.0.0:5000", "--rate"})) << "missing option value";
      ASSERT_TRUE(Rejects({"--bogus", "1", "0.0.0.0:5000"}));
      ASSERT_TRUE(Rejects({"--config", "/nonexistent/netaudio.conf", "0.0.0.0:5000"}));
   }

   void test_Read()
   {
      std::istringstream in(
         "# comment\n"
         "\n"
         "bind_addr 10.0.0.2:7000\n"
         "send_addr 10.0.0.3:7000\n"
         "ring_size 4800\n"
         "unknown_key 5\n"
         "rate nope\n"
         "verbose\n");
      Config::Read(in);
      ASSERT_EQ(Config::BindAddress()->ToString(), "10.0.0.2:7000");
      ASSERT_TRUE(Config::IsSender());
      ASSERT_EQ(Config::RingSize(), 4800u);
      ASSERT_EQ(Config::Rate(), 48000u) << "bad lines are skipped";
      ASSERT_TRUE(Config::Verbose());
   }
};


class test_Log
{
public:
   void test_Format()
   {
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_WARNING, "overrun"), "[WARNING] overrun");
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_CRITICAL, "unable to send data"), "[ERROR] unable to send data");
      ASSERT_EQ(FormatLogLine((GLogLevelFlags)(G_LOG_LEVEL_ERROR | G_LOG_FLAG_FATAL), "x"), "[ERROR] x");
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_INFO, "pipewire sample rate: 48000 Hz"), "[INFO] pipewire sample rate: 48000 Hz");
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_MESSAGE, "m"), "[INFO] m");
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_DEBUG, "d"), "[DEBUG] d");
      ASSERT_EQ(FormatLogLine(G_LOG_LEVEL_DEBUG, nullptr), "[DEBUG] ");
   }
};


int main()
{
   test_SocketAddress().test_IPv4();
   test_SocketAddress().test_IPv6();
   test_SocketAddress().test_Invalid();

   test_Config().test_Receiver();
   test_Config().test_Sender();
   test_Config().test_Options();
   test_Config().test_Rejected();
   test_Config().test_Read();

   test_Log().test_Format();

   return 0;
}
