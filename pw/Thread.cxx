#include "Thread.hh"

#include <pipewire/pipewire.h>

#include <stdexcept>
#include <utility>

using namespace pw;

namespace
{
   // Name the daemon shows for this client.
   constexpr const char* CLIENT_NAME = "netaudio";
}

Thread* Thread::s_instance = nullptr;
int Thread::s_ref = 0;

std::shared_ptr<Thread> Thread::Get()
{
   if (!s_instance)
      s_instance = new Thread;
   ++s_ref;
   return std::shared_ptr<Thread>(s_instance, [](Thread*) { Deref(); });
}

void Thread::Deref()
{
   --s_ref;
   if (s_ref <= 0)
   {
      if (s_instance)
      {
         delete s_instance;
         s_instance = nullptr;
      }
      s_ref = 0;
   }
}


Thread::Thread()
{
   pw_init(nullptr, nullptr);
   m_init_guard.reset((void*)nullptr, [](void*) { pw_deinit(); });
   m_thread_loop.reset(pw_thread_loop_new("netaudio pw thread", nullptr), pw_thread_loop_destroy);
   if (!m_thread_loop)
      throw std::runtime_error("unable to create pipewire thread loop");
   m_context.reset(
      pw_context_new(
         pw_thread_loop_get_loop(m_thread_loop.get()),
         pw_properties_new(PW_KEY_APP_NAME, CLIENT_NAME, nullptr),
         0),
      pw_context_destroy);
   if (!m_context)
      throw std::runtime_error("unable to create pipewire context");
   m_core.reset(pw_context_connect(m_context.get(), nullptr, 0), pw_core_disconnect);
   if (!m_core)
      throw std::runtime_error("unable to connect to pipewire");
   Start();
}


Thread::~Thread()
{
   Stop(); // Ok if thread is already stopped.
}


void Thread::Start()
{
   if (pw_thread_loop_start(m_thread_loop.get()) < 0)
      throw std::runtime_error("unable to start pipewire thread loop");
}


void Thread::Stop()
{
   pw_thread_loop_stop(m_thread_loop.get());
}


struct pw_loop* Thread::Loop()
{
   return pw_thread_loop_get_loop(m_thread_loop.get());
}


Thread::LoopLock Thread::Lock()
{
   return LoopLock(m_thread_loop);
}


Thread::LoopLock::LoopLock(const std::shared_ptr<struct pw_thread_loop>& tl)
{
   m_thread = Get();
   m_thread_loop = tl.get();
   pw_thread_loop_lock(tl.get());
}


Thread::LoopLock::LoopLock(LoopLock&& o):
   m_thread{std::move(o.m_thread)}
{
   std::swap(m_thread_loop, o.m_thread_loop);
}


Thread::LoopLock::~LoopLock()
{
   if (m_thread_loop)
      pw_thread_loop_unlock(m_thread_loop);
}
