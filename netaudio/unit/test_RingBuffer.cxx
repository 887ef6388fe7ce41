#include "unit_test.hh"

#include "../RingBuffer.hh"

#include <algorithm>
#include <cstdint>
#include <new>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace netaudio;

namespace
{
   std::vector<uint8_t> Pattern(size_t len, uint8_t seed)
   {
      std::vector<uint8_t> ret(len);
      for (size_t i = 0; i < len; ++i)
         ret[i] = (uint8_t)(seed + i * 7);
      return ret;
   }
}


class test_RingBuffer
{
public:
   test_RingBuffer(): m_ring{RingBuffer::Create(CAPACITY)} {}

   RingReader& Reader() { return m_ring.first; }
   RingWriter& Writer() { return m_ring.second; }

   void test_Empty()
   {
      ASSERT_EQ(Reader().Capacity(), CAPACITY);
      ASSERT_EQ(Writer().Capacity(), CAPACITY);
      ASSERT_EQ(Reader().ReadableBytes(), 0u);
      ASSERT_EQ(Writer().WritableBytes(), CAPACITY);
   }

   void test_RoundTrip()
   {
      auto in = Pattern(700, 3);
      ASSERT_EQ(Writer().Write(in.data(), in.size()), in.size());
      ASSERT_EQ(Reader().ReadableBytes(), in.size());
      ASSERT_EQ(Writer().WritableBytes(), CAPACITY - in.size());

      std::vector<uint8_t> out(in.size());
      ASSERT_TRUE(Reader().ReadExact(out.data(), out.size()));
      ASSERT_TRUE(out == in);
      ASSERT_EQ(Reader().ReadableBytes(), 0u);
      ASSERT_EQ(Writer().WritableBytes(), CAPACITY);
   }

   void test_WrapAround()
   {
      // Push the cursors most of the way around first, so that the next write
      // straddles the end of the storage.
      std::vector<uint8_t> scratch(CAPACITY - 100);
      Writer().Write(scratch.data(), scratch.size());
      Reader().Read(scratch.data(), scratch.size());

      auto in = Pattern(480, 11);
      ASSERT_EQ(Writer().Write(in.data(), in.size()), in.size());
      std::vector<uint8_t> out(in.size());
      ASSERT_EQ(Reader().Read(out.data(), out.size()), in.size());
      ASSERT_TRUE(out == in) << "data corrupted across the wrap point";
   }

   void test_FillToCapacity()
   {
      auto in = Pattern(CAPACITY, 5);
      ASSERT_EQ(Writer().Write(in.data(), in.size()), CAPACITY);
      ASSERT_EQ(Writer().WritableBytes(), 0u);
      ASSERT_EQ(Reader().ReadableBytes(), CAPACITY);

      // A full ring accepts nothing more.
      uint8_t extra[4] = {1, 2, 3, 4};
      ASSERT_EQ(Writer().Write(extra, sizeof(extra)), 0u);

      std::vector<uint8_t> out(CAPACITY);
      ASSERT_TRUE(Reader().ReadExact(out.data(), out.size()));
      ASSERT_TRUE(out == in);
   }

   void test_WriteClampsToFreeSpace()
   {
      auto in = Pattern(CAPACITY + 50, 9);
      ASSERT_EQ(Writer().Write(in.data(), in.size()), CAPACITY);
      std::vector<uint8_t> out(CAPACITY);
      Reader().Read(out.data(), out.size());
      ASSERT_TRUE(std::equal(out.begin(), out.end(), in.begin()));
   }

   void test_ReadExactShort()
   {
      auto in = Pattern(100, 1);
      Writer().Write(in.data(), in.size());

      std::vector<uint8_t> out(101, 0xee);
      ASSERT_TRUE(!Reader().ReadExact(out.data(), out.size()));
      ASSERT_EQ(Reader().ReadableBytes(), 100u) << "a failed ReadExact consumed data";
      ASSERT_EQ(out[0], 0xee);

      // Read() takes what's there.
      ASSERT_EQ(Reader().Read(out.data(), out.size()), 100u);
      ASSERT_TRUE(std::equal(in.begin(), in.end(), out.begin()));
   }

   void test_FifoAcrossManyWrites()
   {
      // Odd sized chunks so that the wrap point moves around.
      std::vector<uint8_t> expected;
      std::vector<uint8_t> actual;
      for (size_t i = 0; i < 200; ++i)
      {
         auto in = Pattern(37 + i % 300, (uint8_t)i);
         if (Writer().WritableBytes() < in.size())
         {
            std::vector<uint8_t> out(Reader().ReadableBytes());
            Reader().Read(out.data(), out.size());
            actual.insert(actual.end(), out.begin(), out.end());
         }
         Writer().Write(in.data(), in.size());
         expected.insert(expected.end(), in.begin(), in.end());
      }
      std::vector<uint8_t> out(Reader().ReadableBytes());
      Reader().Read(out.data(), out.size());
      actual.insert(actual.end(), out.begin(), out.end());
      ASSERT_TRUE(actual == expected);
   }

   void test_Threaded()
   {
      // One producer and one consumer hammering the ring at the same time
      // must still see one unbroken byte stream.
      static constexpr size_t TOTAL = 4 * 1024 * 1024;
      std::thread producer([this]() {
         uint8_t chunk[333];
         size_t sent = 0;
         while (sent < TOTAL)
         {
            size_t len = std::min(sizeof(chunk), TOTAL - sent);
            if (Writer().WritableBytes() < len)
            {
               std::this_thread::yield();
               continue;
            }
            for (size_t i = 0; i < len; ++i)
               chunk[i] = (uint8_t)((sent + i) % 251);
            Writer().Write(chunk, len);
            sent += len;
         }
      });

      uint8_t chunk[480];
      size_t received = 0;
      bool ok = true;
      while (received < TOTAL && ok)
      {
         size_t len = Reader().Read(chunk, sizeof(chunk));
         if (len == 0)
            std::this_thread::yield();
         for (size_t i = 0; i < len && ok; ++i)
            ok = chunk[i] == (uint8_t)((received + i) % 251);
         received += len;
      }
      producer.join();
      ASSERT_TRUE(ok) << "byte stream corrupted near offset " << received;
      ASSERT_EQ(received, TOTAL);
   }

   static void test_InvalidCapacity()
   {
      bool threw = false;
      try
      {
         RingBuffer::Create(0);
      }
      catch (const std::invalid_argument&)
      {
         threw = true;
      }
      ASSERT_TRUE(threw);
   }

private:
   static constexpr size_t CAPACITY = 4096;
   std::pair<RingReader, RingWriter> m_ring;
};


int main()
{
   test_RingBuffer().test_Empty();
   test_RingBuffer().test_RoundTrip();
   test_RingBuffer().test_WrapAround();
   test_RingBuffer().test_FillToCapacity();
   test_RingBuffer().test_WriteClampsToFreeSpace();
   test_RingBuffer().test_ReadExactShort();
   test_RingBuffer().test_FifoAcrossManyWrites();
   test_RingBuffer().test_Threaded();
   test_RingBuffer::test_InvalidCapacity();

   return 0;
}
