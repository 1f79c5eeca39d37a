#include "WriteDispatcher.hpp"
#include "Logger.hpp"
#include "../broker/PrivilegeBroker.hpp"

namespace usb_power {

WriteDispatcher::WriteDispatcher(PrivilegeBroker& broker)
    : m_broker(broker)
    , m_worker(&WriteDispatcher::workerLoop, this) {
}

WriteDispatcher::~WriteDispatcher() {
    size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
        dropped = m_tasks.size();
        m_tasks.clear();
    }
    m_cv.notify_all();

    if (dropped > 0) {
        LOG_WARNING("Discarding " + std::to_string(dropped) + " queued write request(s) on shutdown");
    }
    if (m_worker.joinable()) {
        m_worker.join();
    }
}

uint64_t WriteDispatcher::submit(std::vector<WriteOp> operations, Completion completion) {
    uint64_t ticket;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ticket = m_nextTicket++;
        m_tasks.push_back(Task{ticket, std::move(operations), std::move(completion)});
    }
    m_cv.notify_one();
    return ticket;
}

size_t WriteDispatcher::outstanding() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size() + (m_busy ? 1 : 0);
}

void WriteDispatcher::workerLoop() {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]() { return m_stopping || !m_tasks.empty(); });
            if (m_stopping) {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop_front();
            m_busy = true;
        }

        std::vector<WriteResult> results;
        try {
            results = m_broker.requestWrite(task.operations);
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("Write request failed: ") + e.what());
            results.clear();
            for (const auto& op : task.operations) {
                results.push_back({op, WriteOutcome::failed(FailureReason::WriteError, e.what())});
            }
        }

        if (task.completion) {
            task.completion(task.ticket, std::move(results));
        }

        std::lock_guard<std::mutex> lock(m_mutex);
        m_busy = false;
    }
}

} // namespace usb_power
