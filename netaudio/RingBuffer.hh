#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <utility>

namespace netaudio
{

class RingReader;
class RingWriter;

// Fixed capacity byte ring shared by exactly one writer and one reader. The
// storage is only reachable through the two halves returned by Create(), and
// each half must stay on a single thread. Neither side ever blocks or
// allocates after construction, so either half is safe to use from the
// pipewire realtime thread.
class RingBuffer final
{
public:
   // Throws std::bad_alloc if the storage cannot be allocated, and
   // std::invalid_argument for a zero capacity.
   static std::pair<RingReader, RingWriter> Create(size_t capacity);

   RingBuffer(const RingBuffer&) = delete;
   RingBuffer& operator=(const RingBuffer&) = delete;

private:
   friend class RingReader;
   friend class RingWriter;

   explicit RingBuffer(size_t capacity);

   // Both cursors count bytes since creation and are only reduced modulo the
   // capacity when indexing, so write - read is always the occupancy.
   size_t Occupancy(std::memory_order read_order, std::memory_order write_order) const;

   const size_t m_capacity;
   std::unique_ptr<uint8_t[]> m_data;

   // Use padding to force reader/writer vars to be on their own cache lines.
   uint8_t m_padding0[64];
   std::atomic<size_t> m_read{};
   uint8_t m_padding1[64 - sizeof(std::atomic<size_t>)];
   std::atomic<size_t> m_write{};
   uint8_t m_padding2[64 - sizeof(std::atomic<size_t>)];
};


// Consuming half of a RingBuffer.
class RingReader final
{
public:
   RingReader(RingReader&&) = default;
   RingReader& operator=(RingReader&&) = default;
   RingReader(const RingReader&) = delete;
   RingReader& operator=(const RingReader&) = delete;

   size_t Capacity() const { return m_ring->m_capacity; }

   // Bytes written and not yet consumed.
   size_t ReadableBytes() const;

   // Copy up to len bytes into dest, returning how many were consumed.
   size_t Read(uint8_t* dest, size_t len);

   // Consume exactly len bytes, or nothing at all if fewer are readable.
   bool ReadExact(uint8_t* dest, size_t len);

private:
   friend class RingBuffer;
   explicit RingReader(std::shared_ptr<RingBuffer> ring): m_ring{std::move(ring)} {}

   std::shared_ptr<RingBuffer> m_ring;
};


// Producing half of a RingBuffer.
class RingWriter final
{
public:
   RingWriter(RingWriter&&) = default;
   RingWriter& operator=(RingWriter&&) = default;
   RingWriter(const RingWriter&) = delete;
   RingWriter& operator=(const RingWriter&) = delete;

   size_t Capacity() const { return m_ring->m_capacity; }

   // Free space left in the ring.
   size_t WritableBytes() const;

   // Copy data into the ring. Callers are expected to check WritableBytes()
   // first; anything that does not fit is not written. Returns the number of
   // bytes accepted.
   size_t Write(const uint8_t* data, size_t len);

private:
   friend class RingBuffer;
   explicit RingWriter(std::shared_ptr<RingBuffer> ring): m_ring{std::move(ring)} {}

   std::shared_ptr<RingBuffer> m_ring;
};

}
