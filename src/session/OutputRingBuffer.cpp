#include "OutputRingBuffer.hpp"

namespace pd {
OutputRingBuffer::OutputRingBuffer(size_t _capacity)
    : capacity(_capacity), bufferLength(0) {
  if (capacity == 0) {
    STFATAL << "Output ring buffer needs a positive capacity";
  }
}

void OutputRingBuffer::push(const string& chunk) {
  if (chunk.empty()) {
    return;
  }
  chunks.push_back(chunk);
  bufferLength += chunk.length();
  while (chunks.size() > capacity) {
    bufferLength -= chunks.front().length();
    chunks.pop_front();
  }
}

string OutputRingBuffer::joined() const {
  string s;
  s.reserve(bufferLength);
  for (const auto& it : chunks) {
    s.append(it);
  }
  return s;
}

void OutputRingBuffer::clear() {
  chunks.clear();
  bufferLength = 0;
}
}  // namespace pd
