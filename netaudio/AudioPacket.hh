#pragma once

#include <cstdint>
#include <cstddef>

namespace netaudio
{

// One UDP datagram of raw interleaved stereo float samples. There is no
// header, sequence number or checksum. Loss shows up as silence.
struct AudioPacket
{
   static constexpr size_t SIZE_BYTES = 480;
   static constexpr size_t SAMPLE_COUNT = SIZE_BYTES / sizeof(float);
   static constexpr size_t FRAME_COUNT = SAMPLE_COUNT / 2;

   uint8_t data[SIZE_BYTES];
};

static_assert(sizeof(AudioPacket) == AudioPacket::SIZE_BYTES);
static_assert(AudioPacket::FRAME_COUNT == 60);

// Default capacity of the ring between the pipewire thread and the network
// thread, in bytes.
static constexpr size_t DEFAULT_RING_SIZE = 16384;

// Largest cycle the processors accept, counting left and right samples
// together. Pipewire normally asks for far less than this.
static constexpr size_t MAX_CYCLE_SAMPLES = 16384;

// Sample rate requested from pipewire unless configured otherwise. Both ends
// must agree, nothing on the wire describes it.
static constexpr uint32_t DEFAULT_RATE = 48000;

}
