/**
 * RingBuffer.cpp - Lock-free SPSC implementation
 * Note: Most logic is in header (template class)
 */

#include "parley/audio/RingBuffer.hpp"

#include <cstdint>

namespace parley::audio {

// Explicit instantiation for the sample types we play and capture
template class RingBuffer<float>;
template class RingBuffer<int16_t>;

} // namespace parley::audio
