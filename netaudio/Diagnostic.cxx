#include "Diagnostic.hh"

#include <glib.h>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <system_error>

using namespace netaudio;

namespace
{
   size_t RoundUpPowerOfTwo(size_t n)
   {
      size_t ret = 2;
      while (ret < n)
         ret <<= 1;
      return ret;
   }
}


void netaudio::LogDiagnostic(const DiagnosticMessage& message)
{
   if (std::holds_alternative<diag::InvalidBufferLengths>(message))
   {
      g_warning("invalid buffer lengths");
   }
   else if (auto* underrun = std::get_if<diag::Underrun>(&message))
   {
      g_warning("underrun, expected to read %zu bytes, %zu available",
                underrun->expected, underrun->available);
   }
   else if (auto* overrun = std::get_if<diag::Overrun>(&message))
   {
      g_warning("overrun, expected to write %zu bytes, %zu available",
                overrun->expected, overrun->available);
   }
}


std::pair<DiagnosticSender, DiagnosticReceiver> DiagnosticChannel::Create(size_t slots)
{
   std::shared_ptr<DiagnosticChannel> channel(new DiagnosticChannel(slots));
   return std::make_pair(DiagnosticSender(channel), DiagnosticReceiver(channel));
}


DiagnosticChannel::DiagnosticChannel(size_t slots):
   m_mask{RoundUpPowerOfTwo(slots) - 1},
   m_slots{new Slot[m_mask + 1]}
{
   for (size_t i = 0; i <= m_mask; ++i)
      m_slots[i].seq.store(i, std::memory_order_relaxed);

   // Non-blocking, so that a sender can never stall on a saturated counter.
   m_event_fd = eventfd(0, EFD_CLOEXEC | EFD_NONBLOCK);
   if (m_event_fd < 0)
      throw std::system_error(errno, std::generic_category(), "unable to create diagnostic channel");
}


DiagnosticChannel::~DiagnosticChannel()
{
   if (m_event_fd >= 0)
      close(m_event_fd);
}


// Each slot's sequence number says whose turn it is: seq == pos means free
// for the producer claiming pos, seq == pos + 1 means filled and waiting for
// the consumer.
bool DiagnosticChannel::TryPush(const DiagnosticMessage& message)
{
   Slot* slot;
   size_t pos = m_tail.load(std::memory_order_relaxed);
   while (true)
   {
      slot = &m_slots[pos & m_mask];
      size_t seq = slot->seq.load(std::memory_order_acquire);
      intptr_t diff = (intptr_t)seq - (intptr_t)pos;
      if (diff == 0)
      {
         if (m_tail.compare_exchange_weak(pos, pos + 1, std::memory_order_relaxed))
            break;
      }
      else if (diff < 0)
      {
         return false; // Full.
      }
      else
      {
         pos = m_tail.load(std::memory_order_relaxed);
      }
   }
   slot->message = message;
   slot->seq.store(pos + 1, std::memory_order_release);
   return true;
}


bool DiagnosticChannel::TryPop(DiagnosticMessage& message)
{
   Slot& slot = m_slots[m_head & m_mask];
   size_t seq = slot.seq.load(std::memory_order_acquire);
   if (seq != m_head + 1)
      return false;
   message = slot.message;
   slot.seq.store(m_head + m_mask + 1, std::memory_order_release);
   ++m_head;
   return true;
}


void DiagnosticChannel::Signal()
{
   uint64_t one = 1;
   // Only fails when the counter is saturated, which still wakes the reader.
   ssize_t res = write(m_event_fd, &one, sizeof(one));
   (void)res;
}


DiagnosticSender::DiagnosticSender(std::shared_ptr<DiagnosticChannel> channel):
   m_channel{std::move(channel)}
{
   m_channel->m_senders.fetch_add(1, std::memory_order_relaxed);
}


DiagnosticSender::DiagnosticSender(const DiagnosticSender& o):
   m_channel{o.m_channel}
{
   m_channel->m_senders.fetch_add(1, std::memory_order_relaxed);
}


DiagnosticSender::DiagnosticSender(DiagnosticSender&& o) noexcept:
   m_channel{std::move(o.m_channel)}
{
}


DiagnosticSender::~DiagnosticSender()
{
   // Wake the receiver so that it notices the channel closed.
   if (m_channel && m_channel->m_senders.fetch_sub(1, std::memory_order_acq_rel) == 1)
      m_channel->Signal();
}


bool DiagnosticSender::Send(const DiagnosticMessage& message)
{
   if (!m_channel->m_receiver_alive.load(std::memory_order_relaxed))
      return false;
   if (!m_channel->TryPush(message))
      return false;
   m_channel->Signal();
   return true;
}


DiagnosticReceiver::~DiagnosticReceiver()
{
   if (m_channel)
      m_channel->m_receiver_alive.store(false, std::memory_order_relaxed);
}


std::optional<DiagnosticMessage> DiagnosticReceiver::TryReceive()
{
   DiagnosticMessage message;
   if (m_channel->TryPop(message))
      return message;
   return std::nullopt;
}


std::optional<DiagnosticMessage> DiagnosticReceiver::Receive()
{
   DiagnosticChannel& c = *m_channel;
   DiagnosticMessage message;
   while (true)
   {
      if (c.TryPop(message))
         return message;

      if (c.m_senders.load(std::memory_order_acquire) == 0)
      {
         // A sender may have pushed right before it went away.
         if (c.TryPop(message))
            return message;
         return std::nullopt;
      }

      struct pollfd pfd{c.m_event_fd, POLLIN, 0};
      if (poll(&pfd, 1, -1) < 0)
      {
         if (errno == EINTR)
            continue;
         throw std::system_error(errno, std::generic_category(), "unable to wait for diagnostics");
      }

      uint64_t count;
      if (read(c.m_event_fd, &count, sizeof(count)) < 0 && errno != EAGAIN)
         throw std::system_error(errno, std::generic_category(), "unable to read diagnostics");
   }
}
