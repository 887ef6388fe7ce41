#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>
#include <variant>

namespace netaudio
{

// Outcome of the most recent realtime callback, reported to the network
// thread. Never carries audio.
namespace diag
{
   // Left and right differ in length, or the cycle is larger than the
   // scratch buffer. The callback has asked pipewire to stop calling it.
   struct InvalidBufferLengths {};
   // Playback wanted `expected` bytes but the ring only had `available`.
   struct Underrun { size_t expected; size_t available; };
   // Capture produced `expected` bytes but the ring only had room for
   // `available`.
   struct Overrun { size_t expected; size_t available; };
   // A capture cycle finished, the ring may hold new packets.
   struct Ready {};
}

typedef std::variant<diag::InvalidBufferLengths, diag::Underrun, diag::Overrun, diag::Ready> DiagnosticMessage;

// Write a diagnostic to the log. Ready is silent. Not realtime safe.
void LogDiagnostic(const DiagnosticMessage& message);


class DiagnosticSender;
class DiagnosticReceiver;

// Many-producer, single-consumer message queue from the realtime thread to
// the network thread. Slots are allocated up front so that Send() never
// allocates, locks or blocks. The receiver sleeps on an eventfd which the
// senders poke after every message.
class DiagnosticChannel final
{
public:
   static constexpr size_t DEFAULT_SLOTS = 1024;

   // slots is rounded up to a power of two. Throws std::system_error if the
   // eventfd cannot be created.
   static std::pair<DiagnosticSender, DiagnosticReceiver> Create(size_t slots = DEFAULT_SLOTS);

   ~DiagnosticChannel();

   DiagnosticChannel(const DiagnosticChannel&) = delete;
   DiagnosticChannel& operator=(const DiagnosticChannel&) = delete;

private:
   friend class DiagnosticSender;
   friend class DiagnosticReceiver;

   explicit DiagnosticChannel(size_t slots);

   bool TryPush(const DiagnosticMessage& message);
   bool TryPop(DiagnosticMessage& message);
   void Signal();

   struct Slot
   {
      std::atomic<size_t> seq;
      DiagnosticMessage message;
   };

   const size_t m_mask;
   std::unique_ptr<Slot[]> m_slots;
   int m_event_fd = -1;

   std::atomic<size_t> m_senders{0};
   std::atomic<bool> m_receiver_alive{true};

   uint8_t m_padding0[64];
   std::atomic<size_t> m_tail{};  // Producers claim slots here.
   uint8_t m_padding1[64 - sizeof(std::atomic<size_t>)];
   size_t m_head = 0;             // Only touched by the receiver.
   uint8_t m_padding2[64 - sizeof(size_t)];
};


// Producing end. Copies share the channel; the channel closes when the last
// copy goes away.
class DiagnosticSender final
{
public:
   DiagnosticSender(const DiagnosticSender& o);
   DiagnosticSender(DiagnosticSender&& o) noexcept;
   DiagnosticSender& operator=(const DiagnosticSender&) = delete;
   DiagnosticSender& operator=(DiagnosticSender&&) = delete;
   ~DiagnosticSender();

   // Best effort. Returns false if the receiver is gone or the channel is
   // full, in which case the message is dropped. Realtime safe.
   bool Send(const DiagnosticMessage& message);

private:
   friend class DiagnosticChannel;
   explicit DiagnosticSender(std::shared_ptr<DiagnosticChannel> channel);

   std::shared_ptr<DiagnosticChannel> m_channel;
};


// Consuming end. Only one exists per channel.
class DiagnosticReceiver final
{
public:
   DiagnosticReceiver(DiagnosticReceiver&&) = default;
   DiagnosticReceiver(const DiagnosticReceiver&) = delete;
   DiagnosticReceiver& operator=(const DiagnosticReceiver&) = delete;
   ~DiagnosticReceiver();

   // Next pending message, or nothing if the queue is empty right now.
   std::optional<DiagnosticMessage> TryReceive();

   // Wait for the next message. Returns nothing once every sender is gone and
   // the queue has been drained.
   std::optional<DiagnosticMessage> Receive();

private:
   friend class DiagnosticChannel;
   explicit DiagnosticReceiver(std::shared_ptr<DiagnosticChannel> channel): m_channel{std::move(channel)} {}

   std::shared_ptr<DiagnosticChannel> m_channel;
};

}
