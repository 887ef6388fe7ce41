#pragma once

#include "../netaudio/Processor.hh"

#include <spa/param/audio/raw.h>
#include <spa/utils/hook.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

struct spa_hook;
struct spa_loop;
struct spa_pod;
struct pw_buffer;
struct pw_core;
struct pw_stream;

namespace pw
{

class Thread;

// Wrap a pipewire stream object carrying planar float stereo. A CAPTURE
// stream shows up as a sink that applications can play into; a PLAYBACK
// stream is an output stream connected to the default device. Either way,
// the processor is called from pipewire's realtime thread once per cycle.
class Stream
{
public:
   enum Direction { CAPTURE, PLAYBACK };

   // Throws std::runtime_error if the stream can't be created or connected.
   Stream(const std::string& name,
      Direction direction,
      uint32_t rate,                                    // Requested sample rate.
      std::shared_ptr<netaudio::Processor> processor    // Called every cycle.
   );
   ~Stream();

   Stream(const Stream&) = delete;
   Stream& operator=(const Stream&) = delete;

   // Sample rate agreed with pipewire, or 0 until the format is negotiated.
   uint32_t Rate() const { return m_rate; }

private:
   void Process();
   void ProcessCapture(struct pw_buffer* b);
   void ProcessPlayback(struct pw_buffer* b);
   void ParamChanged(uint32_t id, const struct spa_pod* param);
   void RequestStop();
   static int DeactivateInvoke(struct spa_loop* loop, bool async, uint32_t seq, const void* data, size_t size, void* d);

   std::shared_ptr<Thread> m_thread;

   struct spa_audio_info_raw m_info{};

   struct pw_stream* m_stream = nullptr;
   struct spa_hook m_stream_listener{};

   Direction m_direction;
   std::shared_ptr<netaudio::Processor> m_processor;

   std::atomic<bool> m_stopped{false};
   std::atomic<uint32_t> m_rate{0};
};

}
