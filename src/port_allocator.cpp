#include "port_allocator.hpp"
#include "printerhub_log.hpp"
#include <stdexcept>

namespace printerhub {

PortAllocator::PortAllocator(int start_port, int end_port)
    : start_port_(start_port), end_port_(end_port), next_port_(start_port) {
    if (start_port < 1 || start_port > 65535 || end_port < 1 || end_port > 65535) {
        throw std::invalid_argument("Port numbers must be in range 1-65535");
    }
    if (start_port > end_port) {
        throw std::invalid_argument("Invalid port range: " + std::to_string(start_port) +
                                    " > " + std::to_string(end_port));
    }
}

Result<int> PortAllocator::allocate() {
    const int total = totalPorts();
    int candidate = next_port_;

    for (int i = 0; i < total; i++) {
        if (allocated_.count(candidate) == 0) {
            allocated_.insert(candidate);
            next_port_ = (candidate == end_port_) ? start_port_ : candidate + 1;
            PHLOG_DEBUG("Ports", "Allocated %d (%d/%d in use)", candidate, allocatedCount(), total);
            return candidate;
        }
        candidate = (candidate == end_port_) ? start_port_ : candidate + 1;
    }

    PHLOG_WARN("Ports", "No available ports in range %d-%d", start_port_, end_port_);
    return Err<int>(ErrorKind::ResourceExhausted,
                    "No available ports in range " + std::to_string(start_port_) +
                    "-" + std::to_string(end_port_));
}

bool PortAllocator::release(int port) {
    if (allocated_.erase(port) == 0) {
        PHLOG_DEBUG("Ports", "Release of unallocated port %d ignored", port);
        return false;
    }
    PHLOG_DEBUG("Ports", "Released %d", port);
    return true;
}

bool PortAllocator::isAllocated(int port) const {
    return allocated_.count(port) > 0;
}

std::vector<int> PortAllocator::allocatedPorts() const {
    return std::vector<int>(allocated_.begin(), allocated_.end());
}

void PortAllocator::reset() {
    allocated_.clear();
    next_port_ = start_port_;
}

PortAllocator::Info PortAllocator::info() const {
    Info i;
    i.start_port = start_port_;
    i.end_port = end_port_;
    i.total_ports = totalPorts();
    i.allocated_count = allocatedCount();
    i.available_count = availableCount();
    i.allocated_ports = allocatedPorts();
    return i;
}

} // namespace printerhub
