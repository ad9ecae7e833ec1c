#include "ttimer/term/event-loop.h"

#include <fcntl.h>

#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "absl/cleanup/cleanup.h"
#include "absl/strings/string_view.h"
#include "boost/asio/io_context.hpp"
#include "boost/asio/posix/stream_descriptor.hpp"
#include "boost/asio/signal_set.hpp"
#include "boost/asio/steady_timer.hpp"
#include "ttimer/errors/human-error.h"
#include "ttimer/log/spdlog.h"
#include "ttimer/posix/signal-mask.h"

namespace ttimer {
namespace {

constexpr char kDeveloperHint[] = "Try notifying the developer";
constexpr size_t kReadChunkSize = 64;

absl::Status Dispatch(TimerLoop* timer, const LoopEvent& ev) {
  switch (ev.kind) {
    case LoopEvent::kTick:
      return timer->OnTick();
    case LoopEvent::kInput:
      return timer->OnInput(ev.input);
    case LoopEvent::kInterrupt:
      return timer->OnInterrupt();
    case LoopEvent::kError:
      return ev.error;
  }
  return absl::OkStatus();
}

}  // namespace

LoopEvent PopNextEvent(std::deque<LoopEvent>* pending) {
  for (auto it = pending->begin(); it != pending->end(); ++it) {
    if (it->kind != LoopEvent::kTick) {
      LoopEvent ev = std::move(*it);
      pending->erase(it);
      return ev;
    }
  }
  LoopEvent ev = std::move(pending->front());
  pending->pop_front();
  return ev;
}

absl::Status RunEventLoop(TimerLoop* timer, const EventLoopOptions& options) {
  auto logger = MakeLogger("event-loop");

  absl::Status st = timer->Start();
  if (!st.ok()) {
    return st;
  }

  std::deque<LoopEvent> pending;
  try {
    boost::asio::io_context io;
    boost::asio::steady_timer ticker(io);
    boost::asio::signal_set signals(io);
    for (int signo : options.interrupt_signals) {
      signals.add(signo);
    }
    sigset_t saved_mask;
    st = UnblockSignals(options.interrupt_signals, &saved_mask);
    if (!st.ok()) {
      return SystemErrorWithInternal("Failed to wait for signals", kDeveloperHint,
                                     st.ToString());
    }
    absl::Cleanup restore_mask = [&logger, &saved_mask] {
      absl::Status mask_st = SetSignalMask(saved_mask);
      if (!mask_st.ok()) {
        SPDLOG_LOGGER_WARN(&logger, "{}", mask_st.ToString());
      }
    };

    std::unique_ptr<boost::asio::posix::stream_descriptor> input;
    int saved_input_flags = -1;
    if (options.input_fd >= 0) {
      saved_input_flags = fcntl(options.input_fd, F_GETFL);
      input = std::make_unique<boost::asio::posix::stream_descriptor>(io);
      boost::system::error_code ec;
      input->assign(options.input_fd, ec);
      if (ec) {
        SPDLOG_LOGGER_WARN(&logger, "cannot watch fd {} for input, keys are ignored: {}",
                           options.input_fd, ec.message());
        input.reset();
      }
    }
    std::array<char, kReadChunkSize> read_buf;
    // Bytes read but not decoded yet: at most a trailing ESC that may start an
    // escape sequence split across reads.
    std::string undecoded;
    boost::asio::steady_timer escape_timer(io);
    uint64_t escape_generation = 0;
    // The fd belongs to the caller: hand it back unclosed and blocking as before.
    absl::Cleanup release_input = [&input, &options, saved_input_flags] {
      if (input != nullptr) {
        input->release();
      }
      if (saved_input_flags != -1) {
        fcntl(options.input_fd, F_SETFL, saved_input_flags);
      }
    };

    std::function<void()> tick_loop = [&] {
      ticker.expires_after(absl::ToChronoNanoseconds(options.tick_period));
      ticker.async_wait([&](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          pending.push_back(LoopEvent::Error(SystemErrorWithInternal(
              "Failed to wait for the next tick", kDeveloperHint, ec.message())));
          return;
        }
        pending.push_back(LoopEvent::Tick());
        tick_loop();  // re-arm relative to now; drift is accepted
      });
    };

    std::function<void()> signal_loop = [&] {
      signals.async_wait([&](const boost::system::error_code& ec, int signo) {
        if (ec == boost::asio::error::operation_aborted) {
          return;
        }
        if (ec) {
          pending.push_back(LoopEvent::Error(SystemErrorWithInternal(
              "Failed to wait for signals", kDeveloperHint, ec.message())));
          return;
        }
        SPDLOG_LOGGER_INFO(&logger, "got signal {}", signo);
        pending.push_back(LoopEvent::Interrupt());
        signal_loop();
      });
    };

    auto flush_undecoded = [&] {
      for (const InputEvent& e : DecodeInput(undecoded)) {
        pending.push_back(LoopEvent::Input(e));
      }
      undecoded.clear();
    };

    // A timer completion that was already queued when new bytes arrived must
    // not flush them; the generation tells the two apart.
    auto arm_escape_timer = [&] {
      uint64_t generation = ++escape_generation;
      escape_timer.expires_after(absl::ToChronoNanoseconds(options.escape_timeout));
      escape_timer.async_wait([&, generation](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted || generation != escape_generation) {
          return;
        }
        if (ec) {
          pending.push_back(LoopEvent::Error(SystemErrorWithInternal(
              "Failed to wait for the next key", kDeveloperHint, ec.message())));
          return;
        }
        flush_undecoded();
      });
    };

    std::function<void()> read_loop = [&] {
      input->async_read_some(
          boost::asio::buffer(read_buf),
          [&](const boost::system::error_code& ec, size_t transferred) {
            if (ec == boost::asio::error::operation_aborted) {
              return;
            }
            ++escape_generation;
            escape_timer.cancel();
            undecoded.append(read_buf.data(), transferred);
            std::vector<InputEvent> events;
            undecoded.erase(0, DecodeInputPrefix(undecoded, &events));
            for (const InputEvent& e : events) {
              pending.push_back(LoopEvent::Input(e));
            }
            if (ec == boost::asio::error::eof) {
              flush_undecoded();
              pending.push_back(LoopEvent::Input(InputEvent::Closed()));
              return;
            }
            if (ec) {
              pending.push_back(LoopEvent::Error(SystemErrorWithInternal(
                  "Failed to read the event stream", kDeveloperHint, ec.message())));
              return;
            }
            if (!undecoded.empty()) {
              arm_escape_timer();
            }
            read_loop();
          });
    };

    tick_loop();
    signal_loop();
    if (input != nullptr) {
      read_loop();
    }

    while (!timer->done()) {
      if (pending.empty()) {
        io.run_one();
      }
      io.poll();
      if (pending.empty()) {
        if (io.stopped()) {
          return SystemErrorWithInternal("Failed to wait for events", kDeveloperHint,
                                         "event loop ran out of work");
        }
        continue;
      }
      LoopEvent ev = PopNextEvent(&pending);
      SPDLOG_LOGGER_TRACE(&logger, "handle event kind {} ({} more pending)",
                          static_cast<int>(ev.kind),
                          pending.size());
      st = Dispatch(timer, ev);
      if (!st.ok()) {
        SPDLOG_LOGGER_ERROR(&logger, "abort loop: {}", st.ToString());
        return st;
      }
    }
    SPDLOG_LOGGER_INFO(&logger, "timer is {}", ToString(timer->countdown().state()));
  } catch (const boost::system::system_error& e) {
    return SystemErrorWithInternal("Failed to build the runtime", kDeveloperHint,
                                   e.what());
  }
  return absl::OkStatus();
}

}  // namespace ttimer
