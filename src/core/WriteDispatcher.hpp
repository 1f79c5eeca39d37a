#pragma once
#include <usb-power/Types.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace usb_power {

class PrivilegeBroker;

// Runs broker batches on one worker thread in submission order, so at most
// one elevation is in flight and the caller's thread never blocks on it.
// Every accepted submission gets exactly one completion call, made on the
// worker thread.
class WriteDispatcher {
public:
    using Completion = std::function<void(uint64_t ticket, std::vector<WriteResult> results)>;

    explicit WriteDispatcher(PrivilegeBroker& broker);
    ~WriteDispatcher();

    WriteDispatcher(const WriteDispatcher&) = delete;
    WriteDispatcher& operator=(const WriteDispatcher&) = delete;

    uint64_t submit(std::vector<WriteOp> operations, Completion completion);

    // Queued plus in flight.
    size_t outstanding() const;

private:
    struct Task {
        uint64_t ticket;
        std::vector<WriteOp> operations;
        Completion completion;
    };

    void workerLoop();

    PrivilegeBroker& m_broker;
    mutable std::mutex m_mutex;
    std::condition_variable m_cv;
    std::deque<Task> m_tasks;
    uint64_t m_nextTicket{1};
    bool m_busy{false};
    bool m_stopping{false};
    std::thread m_worker;
};

}
