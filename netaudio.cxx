#include "netaudio/Config.hh"
#include "netaudio/Diagnostic.hh"
#include "netaudio/Log.hh"
#include "netaudio/ReceiveProcessor.hh"
#include "netaudio/Receiver.hh"
#include "netaudio/RingBuffer.hh"
#include "netaudio/SendProcessor.hh"
#include "netaudio/Sender.hh"
#include "netaudio/UdpSocket.hh"
#include "pw/Stream.hh"
#include "pw/Thread.hh"

#include <glib.h>

#include <cstdlib>
#include <exception>
#include <memory>

using namespace netaudio;


// Capture from the pipewire sink and stream it to the peer. Never returns.
[[noreturn]] void RunSender(const SocketAddress& bind_addr, const SocketAddress& send_addr)
{
   auto socket = std::make_shared<UdpSocket>(bind_addr);
   socket->Connect(send_addr);

   auto ring = RingBuffer::Create(Config::RingSize());
   auto channel = DiagnosticChannel::Create();
   auto processor = std::make_shared<SendProcessor>(std::move(ring.second), std::move(channel.first));

   pw::Stream stream(Config::NodeName(), pw::Stream::CAPTURE, Config::Rate(), processor);
   g_debug("sending from %s to %s", bind_addr.ToString().c_str(), send_addr.ToString().c_str());

   Sender(std::move(ring.first), std::move(channel.second), socket).Run();
}


// Play whatever arrives on bind_addr. Never returns.
[[noreturn]] void RunReceiver(const SocketAddress& bind_addr)
{
   auto socket = std::make_shared<UdpSocket>(bind_addr);

   auto ring = RingBuffer::Create(Config::RingSize());
   auto channel = DiagnosticChannel::Create();
   auto processor = std::make_shared<ReceiveProcessor>(std::move(ring.first), std::move(channel.first));

   pw::Stream stream(Config::NodeName(), pw::Stream::PLAYBACK, Config::Rate(), processor);
   g_debug("receiving on %s", bind_addr.ToString().c_str());

   Receiver(std::move(ring.second), std::move(channel.second), socket).Run();
}


int main(int argc, char** argv)
{
   InstallLogHandler();
   Config::ReadArgs(argc, argv);
   SetVerbose(Config::Verbose());

   try
   {
      // Keep the pipewire connection open for as long as the streams live.
      auto thread = pw::Thread::Get();

      if (Config::IsSender())
         RunSender(*Config::BindAddress(), *Config::SendAddress());
      else
         RunReceiver(*Config::BindAddress());
   }
   catch (const std::exception& e)
   {
      g_critical("%s", e.what());
   }
   return EXIT_FAILURE;
}
