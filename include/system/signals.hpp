#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <functional>

namespace filetar {

// Delivers SIGINT/SIGTERM to on_signal on the io_context thread. Stop() must
// be called once the work is done, or io_context::run() keeps waiting.
class CancelSignals {
public:
    CancelSignals(boost::asio::io_context& io, std::function<void(int)> on_signal);

    void Stop();

private:
    void Arm();

    boost::asio::signal_set signals_;
    std::function<void(int)> on_signal_;
    bool stopped_ = false;
};

} // namespace filetar
