#ifndef MODIFICATION_LOG_HPP
#define MODIFICATION_LOG_HPP

#include "kvstore/Modification.hpp"

#include <cstdint>
#include <cstddef>
#include <deque>
#include <vector>

using Head = uint32_t;

struct LogBatch {
  Head head;                                // Head produced by the append
  std::vector<Modification> modifications;  // In application order
};

// Bounded history of recent batches, newest at the front.
class ModificationLog {
public:
    // initialHead is the head reported before the first record
    explicit ModificationLog(size_t capacity = 1000, Head initialHead = 0);

    // Tags the batch with the next head, evicting the oldest batch when full.
    Head record(std::vector<Modification> modifications);

    // Head of the newest batch, 0 before anything was recorded
    Head getCurrentHead() const { return currentHead; }

    // Modifications of every retained batch newer than `head`, oldest batch
    // first. When `head` is not retained the whole log is returned.
    std::vector<Modification> diffSince(Head head) const;

    bool contains(Head head) const;
    Head getOldestHead() const;
    const LogBatch& getBatch(size_t position) const;
    size_t size() const { return batches.size(); }
    size_t capacity() const { return maxBatches; }
    bool empty() const { return batches.empty(); }

private:
    std::deque<LogBatch> batches;
    size_t maxBatches;
    Head currentHead;
};
#endif // !MODIFICATION_LOG_HPP
