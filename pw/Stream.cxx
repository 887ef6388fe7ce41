#include "Stream.hh"
#include "Thread.hh"

#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>

#include <glib.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace pw;

namespace {
   const char* state_str(enum pw_stream_state state)
   {
      switch (state)
      {
      case PW_STREAM_STATE_UNCONNECTED: return "UNCONNECTED";
      case PW_STREAM_STATE_CONNECTING:  return "CONNECTING";
      case PW_STREAM_STATE_PAUSED:      return "PAUSED";
      case PW_STREAM_STATE_STREAMING:   return "STREAMING";
      default:                          return "ERROR";
      }
   }
}


Stream::Stream(
   const std::string& name,
   Direction direction,
   uint32_t rate,
   std::shared_ptr<netaudio::Processor> processor):
      m_thread{Thread::Get()},
      m_direction{direction},
      m_processor{std::move(processor)}
{
   auto lock = m_thread->Lock();
   // Stream objects will create nodes that will auto-convert to the given
   // format. One plane per channel, so each plane acts as a port.
   m_info.format = SPA_AUDIO_FORMAT_F32P;
   m_info.channels = 2;
   m_info.position[0] = SPA_AUDIO_CHANNEL_FL;
   m_info.position[1] = SPA_AUDIO_CHANNEL_FR;
   m_info.rate = rate;

   m_stream = pw_stream_new(m_thread->Core(), name.c_str(),
      pw_properties_new(
         PW_KEY_NODE_NAME, name.c_str(),
         PW_KEY_NODE_DESCRIPTION, direction == CAPTURE ? "Network Audio Sender" : "Network Audio Receiver",
         PW_KEY_MEDIA_TYPE, "Audio",
         PW_KEY_MEDIA_CATEGORY, direction == CAPTURE ? "Capture" : "Playback",
         PW_KEY_MEDIA_CLASS, direction == CAPTURE ? "Audio/Sink" : "Stream/Output/Audio",
      nullptr)
   );
   if (m_stream == nullptr)
      throw std::runtime_error("unable to register pipewire stream");

   // These events are called from the thread loop, except for process.
   static pw_stream_events stream_events {
      .version = PW_VERSION_STREAM_EVENTS,
      .destroy = [](void* d) {
         // When this gets called, m_stream has already been free()d.
         auto* self = (Stream*)d;
         spa_hook_remove(&self->m_stream_listener);
         self->m_stream = nullptr;
      },
      .state_changed = [](void* d, enum pw_stream_state old, enum pw_stream_state state, const char* error) {
         if (state == PW_STREAM_STATE_ERROR)
            g_warning("pipewire stream error: %s", error ? error : "unknown");
         else
            g_debug("stream state %s -> %s", state_str(old), state_str(state));
      },
      .param_changed = [](void* d, uint32_t id, const struct spa_pod* param) {
         ((Stream*)d)->ParamChanged(id, param);
      },
      .process = [](void* d) { ((Stream*)d)->Process(); }, // Called from the realtime thread.
   };

   pw_stream_add_listener(m_stream, &m_stream_listener, &stream_events, this);

   spa_pod_builder format_builder;
   uint8_t format_buffer[1024];
   spa_pod_builder_init(&format_builder, format_buffer, sizeof(format_buffer));
   std::vector<const struct spa_pod *> params{
      spa_format_audio_raw_build(&format_builder, SPA_PARAM_EnumFormat, &m_info)
   };

   int flags = PW_STREAM_FLAG_AUTOCONNECT
             | PW_STREAM_FLAG_MAP_BUFFERS
             | PW_STREAM_FLAG_RT_PROCESS; // Call process directly on pipewire's realtime thread.
   enum spa_direction dir = direction == CAPTURE ? SPA_DIRECTION_INPUT : SPA_DIRECTION_OUTPUT;
   int res = pw_stream_connect(m_stream, dir, PW_ID_ANY, (pw_stream_flags)flags, params.data(), params.size());
   if (res < 0)
   {
      if (m_stream)
         pw_stream_destroy(m_stream);
      throw std::runtime_error(std::string("unable to connect pipewire stream: ") + strerror(-res));
   }
}

Stream::~Stream()
{
   if (m_stream)
   {
      auto lock = m_thread->Lock();
      pw_stream_destroy(m_stream);
   }
}


void Stream::ParamChanged(uint32_t id, const struct spa_pod* param)
{
   // Called from the thread loop, lock already held.
   if (param == nullptr || id != SPA_PARAM_Format)
      return;

   struct spa_audio_info_raw info{};
   if (spa_format_audio_raw_parse(param, &info) < 0)
   {
      g_warning("unable to parse negotiated stream format");
      return;
   }
   m_rate = info.rate;
   g_info("pipewire sample rate: %u Hz", info.rate);
}


void Stream::Process()
{
   // Called from pipewire's realtime thread. Nothing in here may block,
   // lock or allocate.
   struct pw_buffer* b;
   while ((b = pw_stream_dequeue_buffer(m_stream)))
   {
      if (m_direction == CAPTURE)
         ProcessCapture(b);
      else
         ProcessPlayback(b);

      // Place the buffer back so that it can be reused.
      pw_stream_queue_buffer(m_stream, b);
   }
}


void Stream::ProcessCapture(struct pw_buffer* b)
{
   auto* buf = b->buffer;
   if (m_stopped || buf->n_datas < 2 || !buf->datas[0].data || !buf->datas[1].data)
      return;

   auto& l = buf->datas[0];
   auto loffs = std::min(l.chunk->offset, l.maxsize);
   auto lsize = std::min(l.chunk->size, l.maxsize - loffs);
   auto& r = buf->datas[1];
   auto roffs = std::min(r.chunk->offset, r.maxsize);
   auto rsize = std::min(r.chunk->size, r.maxsize - roffs);

   // Mismatched lengths are passed through, the processor decides what to
   // do with them.
   auto ret = m_processor->Process(
      SPA_PTROFF(l.data, loffs, float), lsize / sizeof(float),
      SPA_PTROFF(r.data, roffs, float), rsize / sizeof(float));
   if (ret == netaudio::Processor::QUIT)
      RequestStop();
}


void Stream::ProcessPlayback(struct pw_buffer* b)
{
   auto* buf = b->buffer;
   if (buf->n_datas < 2 || !buf->datas[0].data || !buf->datas[1].data)
      return;

   auto& l = buf->datas[0];
   auto& r = buf->datas[1];
   size_t lsamples = l.maxsize / sizeof(float);
   size_t rsamples = r.maxsize / sizeof(float);
   // requested is the number of frames the graph wants this cycle.
   if (b->requested)
   {
      lsamples = std::min<size_t>(lsamples, b->requested);
      rsamples = std::min<size_t>(rsamples, b->requested);
   }

   if (m_stopped)
   {
      memset(l.data, 0, lsamples * sizeof(float));
      memset(r.data, 0, rsamples * sizeof(float));
   }
   else if (m_processor->Process((float*)l.data, lsamples, (float*)r.data, rsamples) == netaudio::Processor::QUIT)
   {
      memset(l.data, 0, lsamples * sizeof(float));
      memset(r.data, 0, rsamples * sizeof(float));
      RequestStop();
   }

   l.chunk->offset = 0;
   l.chunk->stride = sizeof(float);
   l.chunk->size = lsamples * sizeof(float);
   r.chunk->offset = 0;
   r.chunk->stride = sizeof(float);
   r.chunk->size = rsamples * sizeof(float);
}


void Stream::RequestStop()
{
   // Realtime thread. Deactivating the stream has to happen on the main
   // thread loop, so post it there without waiting.
   if (m_stopped.exchange(true))
      return;
   // If this can't be queued the node stays in the graph, but m_stopped
   // already keeps the processor from being called again.
   int res = pw_loop_invoke(m_thread->Loop(), DeactivateInvoke, 0, nullptr, 0, false, this);
   (void)res;
}


int Stream::DeactivateInvoke(struct spa_loop*, bool, uint32_t, const void*, size_t, void* d)
{
   // Runs on the thread loop, lock already held.
   auto* self = (Stream*)d;
   if (self->m_stream)
      pw_stream_set_active(self->m_stream, false);
   g_debug("stream deactivated");
   return 0;
}
