#pragma once
#include <set>
#include <vector>
#include <string>
#include "result.hpp"

namespace printerhub {

/**
 * Hands out camera proxy ports from a fixed inclusive range.
 *
 * Allocation walks a round-robin cursor: the port after the last one handed
 * out is tried first, wrapping at the end of the range. A released port is
 * free again immediately and is returned once the cursor reaches it, so the
 * sequence is fully deterministic for a given call history.
 *
 * Only allocate()/release()/reset() mutate the free/used sets.
 */
class PortAllocator {
public:
    struct Info {
        int start_port = 0;
        int end_port = 0;
        int total_ports = 0;
        int allocated_count = 0;
        int available_count = 0;
        std::vector<int> allocated_ports;
    };

    // Throws std::invalid_argument for start > end or ports outside 1-65535
    PortAllocator(int start_port, int end_port);

    // ResourceExhausted when every port in range is in use
    Result<int> allocate();

    // false if the port was not allocated
    bool release(int port);

    bool isAllocated(int port) const;
    int allocatedCount() const { return static_cast<int>(allocated_.size()); }
    int availableCount() const { return totalPorts() - allocatedCount(); }
    int totalPorts() const { return end_port_ - start_port_ + 1; }
    std::vector<int> allocatedPorts() const;  // ascending

    // Release everything and rewind the cursor to start_port
    void reset();

    Info info() const;

private:
    const int start_port_;
    const int end_port_;
    int next_port_;
    std::set<int> allocated_;
};

} // namespace printerhub
