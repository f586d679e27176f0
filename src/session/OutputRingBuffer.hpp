#ifndef __PD_OUTPUT_RING_BUFFER__
#define __PD_OUTPUT_RING_BUFFER__

#include "Headers.hpp"

namespace pd {
/**
 * @brief Bounded FIFO of raw output chunks used to replay recent history to
 * viewers that attach mid-session.
 *
 * Not synchronized; the owning `SessionRecord` guards it.
 */
class OutputRingBuffer {
 public:
  explicit OutputRingBuffer(size_t _capacity);

  /** @brief Appends a chunk, evicting the oldest ones beyond capacity. */
  void push(const string& chunk);
  /** @brief All buffered chunks concatenated, oldest first. */
  string joined() const;
  inline const deque<string>& getChunks() const { return chunks; }
  inline size_t size() const { return chunks.size(); }
  inline bool empty() const { return chunks.empty(); }
  inline size_t getCapacity() const { return capacity; }
  /** @brief Total bytes currently buffered. */
  inline int64_t byteLength() const { return bufferLength; }
  void clear();

 protected:
  size_t capacity;
  deque<string> chunks;
  /** @brief Running length of the buffered data. */
  int64_t bufferLength;
};
}  // namespace pd

#endif  // __PD_OUTPUT_RING_BUFFER__
