#include "replication/ModificationLog.hpp"
#include <stdexcept>
#include <string>
#include <utility>


ModificationLog::ModificationLog(size_t capacity, Head initialHead)
: maxBatches(capacity), currentHead(initialHead) {
    if (capacity == 0) {
        throw std::invalid_argument("Modification log capacity must be positive");
    }
}

// Methods

Head ModificationLog::record(std::vector<Modification> modifications) {
    // Unsigned arithmetic: the successor of UINT32_MAX is 0.
    Head newHead = static_cast<Head>(currentHead + 1u);

    batches.push_front(LogBatch{newHead, std::move(modifications)});
    if (batches.size() > maxBatches) {
        batches.pop_back();
    }
    currentHead = newHead;
    return newHead;
}

std::vector<Modification> ModificationLog::diffSince(Head head) const {
    // Walk newest to oldest until the caller's batch is found, then emit the
    // collected batches in the order they were appended.
    size_t newer = 0;
    while (newer < batches.size() && batches[newer].head != head) {
        ++newer;
    }

    std::vector<Modification> diff;
    for (size_t i = newer; i > 0; --i) {
        const auto& batch = batches[i - 1];
        diff.insert(diff.end(), batch.modifications.begin(), batch.modifications.end());
    }
    return diff;
}

bool ModificationLog::contains(Head head) const {
    for (const auto& batch : batches) {
        if (batch.head == head) {
            return true;
        }
    }
    return false;
}

Head ModificationLog::getOldestHead() const {
    if (batches.empty()) {
        return 0;
    }
    return batches.back().head;
}

const LogBatch& ModificationLog::getBatch(size_t position) const {
    if (position >= batches.size()) {
        throw std::out_of_range("Log position " + std::to_string(position) + " out of range");
    }
    return batches[position];
}
