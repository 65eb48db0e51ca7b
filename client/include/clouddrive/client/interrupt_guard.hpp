#pragma once

#include <asio.hpp>

#include <atomic>
#include <string>
#include <thread>

#include "clouddrive/client/logger.hpp"

namespace clouddrive::client
{

    // Catches SIGINT/SIGTERM while alive. The first signal prints the resume hint and raises
    // the flag polled between chunks; a second one terminates the process with status 130.
    class InterruptGuard
    {
    public:
        InterruptGuard(std::string resume_hint, Logger logger);
        ~InterruptGuard();

        InterruptGuard(const InterruptGuard &) = delete;
        InterruptGuard &operator=(const InterruptGuard &) = delete;

        bool interrupted() const noexcept { return interrupted_.load(); }

    private:
        void arm();
        void handle_signal(int signal_number);

        asio::io_context io_context_;
        asio::signal_set signals_;
        std::atomic<bool> interrupted_{false};
        std::string resume_hint_;
        Logger logger_;
        std::thread worker_;
    };

} // namespace clouddrive::client
