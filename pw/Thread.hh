#pragma once

#include <memory>

struct pw_thread_loop;
struct pw_context;
struct pw_core;
struct pw_loop;

namespace pw
{

// Wrap a pipewire thread loop and the connection to the pipewire daemon.
// Shared by every stream in the process.
class Thread final
{
public:
   // Connects on first use. Throws std::runtime_error if the daemon can't be
   // reached.
   static std::shared_ptr<Thread> Get();

   struct pw_core* Core() { return m_core.get(); }

   // The loop run by the thread. Other threads may post work to it with
   // pw_loop_invoke().
   struct pw_loop* Loop();

   class LoopLock
   {
   public:
      LoopLock(const std::shared_ptr<struct pw_thread_loop>& tl);
      LoopLock(LoopLock&& l);
      LoopLock(const LoopLock& l) = delete;
      ~LoopLock();

   private:
      std::shared_ptr<Thread> m_thread; // So that we don't delete the thread while a lock is held.
      pw_thread_loop* m_thread_loop = nullptr;
   };
   LoopLock Lock();

protected:
   Thread();
   ~Thread();

   static void Deref();

   void Start();
   void Stop();

private:
   std::shared_ptr<void> m_init_guard;
   std::shared_ptr<struct pw_thread_loop> m_thread_loop;
   std::shared_ptr<struct pw_context> m_context;
   std::shared_ptr<struct pw_core> m_core;

   static Thread* s_instance;
   static int s_ref;
};


}
