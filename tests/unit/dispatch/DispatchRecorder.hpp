#pragma once

#include <handleguard/dispatch/DispatchState.hpp>
#include <handleguard/dispatch/Router.hpp>
#include <handleguard/dispatch/WindowProc.hpp>
#include <handleguard/log/TaggedLogger.hpp>

#include <sys/wait.h>
#include <unistd.h>

#include <csignal>
#include <cstdint>
#include <cstdio>
#include <functional>
#include <utility>
#include <vector>

namespace HG::Testing {

struct ObservedCall {
    Native::MessageId message    = 0;
    bool              subclassed = false;
    std::uint32_t     depth      = 0;
};

// Shared record of what a RecordingProc saw; outlives the proc itself.
struct Recorder {
    std::vector<ObservedCall>                                  calls;
    int                                                        destroyed = 0;
    std::function<Native::LResult(Dispatch::DispatchCall const&)> on_message;

    [[nodiscard]] auto saw(Native::MessageId message) const -> bool {
        for (auto const& call : calls) {
            if (call.message == message) {
                return true;
            }
        }
        return false;
    }
};

class RecordingProc final : public Dispatch::WindowProc {
public:
    explicit RecordingProc(Recorder& recorder) : recorder(recorder) {}
    ~RecordingProc() override { ++recorder.destroyed; }

    auto handle_message(Dispatch::DispatchCall const& call) -> Native::LResult override {
        recorder.calls.push_back(ObservedCall{call.message, call.subclassed, call.depth});
        if (recorder.on_message) {
            return recorder.on_message(call);
        }
        return call.forward();
    }

private:
    Recorder& recorder;
};

// Reaches the entry counter, which no dispatch path can drive near its limit.
struct DispatchStateAccess {
    static auto seed_entries(Dispatch::DispatchState& state, std::uint32_t entries) -> void { state.entryCount = entries; }
};

// Runs `body` in a forked child and reports whether the child died of
// SIGABRT. The child leaves through _exit when `body` returns, so a child
// that survives never runs the parent's test teardown.
inline auto abortsInChild(std::function<void()> const& body) -> bool {
    // The logger's worker does not survive the fork; let it go idle first.
    logger().flush();
    std::fflush(nullptr);
    pid_t const pid = fork();
    if (pid < 0) {
        return false;
    }
    if (pid == 0) {
        body();
        _exit(0);
    }
    int status = 0;
    if (waitpid(pid, &status, 0) != pid) {
        return false;
    }
    return WIFSIGNALED(status) && WTERMSIG(status) == SIGABRT;
}

// Installs a fault observer for the scope and restores the previous one.
class FaultCapture {
public:
    FaultCapture()
        : previous(Dispatch::SetFaultObserver([this](Dispatch::FaultReport const& report) { reports.push_back(report); })) {}
    ~FaultCapture() { Dispatch::SetFaultObserver(std::move(previous)); }

    FaultCapture(FaultCapture const&)            = delete;
    FaultCapture& operator=(FaultCapture const&) = delete;

    std::vector<Dispatch::FaultReport> reports;

private:
    Dispatch::FaultObserver previous;
};

} // namespace HG::Testing
