#include "clouddrive/client/interrupt_guard.hpp"

#include <csignal>
#include <cstdlib>
#include <iostream>

namespace clouddrive::client
{

    InterruptGuard::InterruptGuard(std::string resume_hint, Logger logger)
        : signals_(io_context_),
          resume_hint_(std::move(resume_hint)),
          logger_(std::move(logger))
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        arm();
        worker_ = std::thread([this]
                              { io_context_.run(); });
    }

    InterruptGuard::~InterruptGuard()
    {
        io_context_.stop();
        if (worker_.joinable())
        {
            worker_.join();
        }
    }

    void InterruptGuard::arm()
    {
        signals_.async_wait([this](const std::error_code &ec, int signal_number)
                            {
            if (!ec)
            {
                handle_signal(signal_number);
            } });
    }

    void InterruptGuard::handle_signal(int signal_number)
    {
        if (interrupted_.exchange(true))
        {
            std::cerr << "\nAborting immediately." << std::endl;
            std::_Exit(130);
        }
        logger_.log("signal", "received signal ", signal_number, ", stopping after the current chunk");
        std::cerr << "\nInterrupted. Finishing the current chunk; " << resume_hint_ << std::endl;
        arm();
    }

} // namespace clouddrive::client
