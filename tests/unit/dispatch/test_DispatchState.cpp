#include <handleguard/dispatch/DispatchState.hpp>

#include "DispatchRecorder.hpp"

#include <handleguard/dispatch/CreatedWindow.hpp>
#include <handleguard/native/HeadlessRuntime.hpp>

#include <doctest/doctest.h>

#include <limits>
#include <memory>
#include <stdexcept>

using namespace HG;
using namespace HG::Dispatch;
using HG::Testing::abortsInChild;
using HG::Testing::DispatchStateAccess;
using HG::Testing::Recorder;
using HG::Testing::RecordingProc;

namespace {

constexpr std::uint32_t kMaxEntries = std::numeric_limits<std::uint32_t>::max();
constexpr Native::MessageId kThrow  = Native::Msg::kUser + 7;

} // namespace

TEST_SUITE("dispatch.state") {
    TEST_CASE("Counter tracks nested frames") {
        Recorder recorder;
        auto  cell = std::make_shared<HandleCell>();
        DispatchState state{cell, std::make_unique<RecordingProc>(recorder)};

        CHECK(state.entries() == 0);
        CHECK(state.enter() == 1);
        CHECK(state.enter() == 2);
        CHECK_FALSE(state.leave());
        CHECK(state.entries() == 1);
        CHECK_FALSE(state.leave());
        CHECK(state.entries() == 0);
    }

    TEST_CASE("Release is requested only by the last frame with teardown pending") {
        Recorder recorder;
        DispatchState state{std::make_shared<HandleCell>(), std::make_unique<RecordingProc>(recorder)};

        state.enter();
        state.enter();
        state.schedule_teardown();
        CHECK(state.teardown_pending());
        CHECK_FALSE(state.leave());
        CHECK(state.leave());
    }

    TEST_CASE("Live count follows allocation and the proc dies with the state") {
        Recorder      recorder;
        auto const baseline = DispatchState::live_count();
        auto       cell     = std::make_shared<HandleCell>();
        {
            auto state = std::make_unique<DispatchState>(cell, std::make_unique<RecordingProc>(recorder));
            CHECK(DispatchState::live_count() == baseline + 1);
            CHECK(&state->cell() == cell.get());
        }
        CHECK(DispatchState::live_count() == baseline);
        CHECK(recorder.destroyed == 1);
    }

    TEST_CASE("Unadopted pending state is released with its block") {
        Recorder      recorder;
        auto const baseline = DispatchState::live_count();
        {
            PendingAdoption pending{std::make_unique<DispatchState>(std::make_shared<HandleCell>(), std::make_unique<RecordingProc>(recorder))};
            CHECK(DispatchState::live_count() == baseline + 1);
        }
        CHECK(DispatchState::live_count() == baseline);
        CHECK(recorder.destroyed == 1);
    }

    TEST_CASE("Counter reaches its last value without aborting") {
        Recorder      recorder;
        DispatchState state{std::make_shared<HandleCell>(), std::make_unique<RecordingProc>(recorder)};

        DispatchStateAccess::seed_entries(state, kMaxEntries - 1);
        CHECK(state.enter() == kMaxEntries);
        CHECK_FALSE(state.leave());
        CHECK(state.entries() == kMaxEntries - 1);
        DispatchStateAccess::seed_entries(state, 0);
    }

    TEST_CASE("Entering past the counter limit aborts the process") {
        bool const aborted = abortsInChild([] {
            Recorder      recorder;
            DispatchState state{std::make_shared<HandleCell>(), std::make_unique<RecordingProc>(recorder)};
            DispatchStateAccess::seed_entries(state, kMaxEntries);
            (void)state.enter();
        });
        CHECK(aborted);
    }

    TEST_CASE("A fault observer that throws aborts the process") {
        auto     runtime = std::make_shared<Native::HeadlessRuntime>();
        Recorder recorder;
        recorder.on_message = [](DispatchCall const& call) -> Native::LResult {
            if (call.message == kThrow) {
                throw std::runtime_error("callback failed");
            }
            return call.forward();
        };
        auto created = CreatedWindow::Create(runtime, std::make_unique<RecordingProc>(recorder), WindowSpec{});
        REQUIRE(created.has_value());
        auto const handle = (*created)->handle();

        bool const aborted = abortsInChild([&] {
            SetFaultObserver([](FaultReport const&) { throw std::logic_error("observer failed"); });
            runtime->send_message(handle, kThrow, 0, 0);
        });
        CHECK(aborted);

        // The parent never saw the fault.
        CHECK((*created)->live());
        CHECK_FALSE(recorder.saw(kThrow));
        REQUIRE((*created)->destroy());
    }
}
