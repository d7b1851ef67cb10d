// signals.cpp - Routes termination signals into the io_context.

#include "system/signals.hpp"

#include <csignal>

namespace filetar {

CancelSignals::CancelSignals(boost::asio::io_context& io, std::function<void(int)> on_signal)
    : signals_(io, SIGINT, SIGTERM), on_signal_(std::move(on_signal)) {
    Arm();
}

void CancelSignals::Arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signo) {
        if (ec || stopped_) return;
        if (on_signal_) on_signal_(signo);
        Arm();
    });
}

void CancelSignals::Stop() {
    if (stopped_) return;
    stopped_ = true;
    boost::system::error_code ec;
    signals_.cancel(ec);
}

} // namespace filetar
