#include "RingBuffer.hh"

#include <algorithm>
#include <cstring>
#include <new>
#include <stdexcept>

using namespace netaudio;


std::pair<RingReader, RingWriter> RingBuffer::Create(size_t capacity)
{
   if (capacity == 0)
      throw std::invalid_argument("ring buffer capacity must not be zero");

   std::shared_ptr<RingBuffer> ring(new RingBuffer(capacity));
   return std::make_pair(RingReader(ring), RingWriter(ring));
}


RingBuffer::RingBuffer(size_t capacity):
   m_capacity{capacity},
   m_data{new uint8_t[capacity]}
{
}


size_t RingBuffer::Occupancy(std::memory_order read_order, std::memory_order write_order) const
{
   // ...RxxW...
   size_t read = m_read.load(read_order);
   size_t write = m_write.load(write_order);
   return write - read;
}


size_t RingReader::ReadableBytes() const
{
   return m_ring->Occupancy(std::memory_order_relaxed, std::memory_order_acquire);
}


size_t RingReader::Read(uint8_t* dest, size_t len)
{
   RingBuffer& r = *m_ring;
   size_t read = r.m_read.load(std::memory_order_relaxed);
   size_t write = r.m_write.load(std::memory_order_acquire);
   len = std::min(len, write - read);

   size_t offset = read % r.m_capacity;
   size_t first = std::min(len, r.m_capacity - offset);
   memcpy(dest, r.m_data.get() + offset, first);
   memcpy(dest + first, r.m_data.get(), len - first);

   r.m_read.store(read + len, std::memory_order_release);
   return len;
}


bool RingReader::ReadExact(uint8_t* dest, size_t len)
{
   if (ReadableBytes() < len)
      return false;
   Read(dest, len);
   return true;
}


size_t RingWriter::WritableBytes() const
{
   return m_ring->m_capacity - m_ring->Occupancy(std::memory_order_acquire, std::memory_order_relaxed);
}


size_t RingWriter::Write(const uint8_t* data, size_t len)
{
   RingBuffer& r = *m_ring;
   size_t write = r.m_write.load(std::memory_order_relaxed);
   size_t read = r.m_read.load(std::memory_order_acquire);
   len = std::min(len, r.m_capacity - (write - read));

   size_t offset = write % r.m_capacity;
   size_t first = std::min(len, r.m_capacity - offset);
   memcpy(r.m_data.get() + offset, data, first);
   memcpy(r.m_data.get(), data + first, len - first);

   r.m_write.store(write + len, std::memory_order_release);
   return len;
}
