#pragma once

#include <ripple/ui/backend.hpp>
#include <ripple/ui/diff.hpp>
#include <ripple/ui/edit_script.hpp>
#include <ripple/ui/patch.hpp>
#include <ripple/ui/spec.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <thread>
#include <utility>
#include <vector>

namespace ripple::ui {

// Host-supplied wake-up primitive. The loop asks for exactly one frame at a
// time and asks again when that frame is done.
struct FramePacer {
  using Frame = std::function<void()>;

  virtual ~FramePacer() = default;
  virtual void request_frame(Frame frame) = 0;
};

// Runs the requested frame only when the host says so.
class ManualPacer final : public FramePacer {
public:
  void request_frame(Frame frame) override { pending_ = std::move(frame); }

  bool pending() const { return static_cast<bool>(pending_); }

  bool run_frame() {
    if (!pending_) {
      return false;
    }
    auto frame = std::exchange(pending_, nullptr);
    frame();
    return true;
  }

private:
  Frame pending_{};
};

class FixedRatePacer final : public FramePacer {
public:
  explicit FixedRatePacer(
      std::chrono::milliseconds interval = std::chrono::milliseconds{16})
      : interval_{interval} {}

  void request_frame(Frame frame) override { pending_ = std::move(frame); }

  // Runs up to `frames` frames, one per interval. `before_frame` gets the
  // frame index and runs ahead of the loop's own work. Returns the number of
  // frames that ran.
  std::size_t run(std::size_t frames,
                  const std::function<void(std::size_t)> &before_frame = {}) {
    auto next = std::chrono::steady_clock::now();
    std::size_t ran = 0;
    for (; ran < frames && pending_; ++ran) {
      next += interval_;
      std::this_thread::sleep_until(next);
      if (before_frame) {
        before_frame(ran);
      }
      auto frame = std::exchange(pending_, nullptr);
      frame();
    }
    return ran;
  }

  std::chrono::milliseconds interval() const { return interval_; }

private:
  std::chrono::milliseconds interval_;
  Frame pending_{};
};

struct MountOptions {
  std::ostream *trace{};
  bool trace_scripts{};
};

struct CycleResult {
  bool drew{};
  std::size_t messages{};
  std::vector<EditScript> scripts;
};

template <typename State>
class MountContext
    : public std::enable_shared_from_this<MountContext<State>> {
public:
  using Update =
      std::function<State(State, const Message &, const Enqueue &)>;
  using View = std::function<SpecList(const State &)>;

  MountContext(Backend &backend, NodeHandle root, State initial, Update update,
               View view, FramePacer &pacer, MountOptions options)
      : backend_{backend}, root_{root}, state_{std::move(initial)},
        update_{std::move(update)}, view_{std::move(view)}, pacer_{pacer},
        options_{options} {}

  MountContext(const MountContext &) = delete;
  MountContext &operator=(const MountContext &) = delete;

  void start() {
    std::weak_ptr<MountContext> weak = this->shared_from_this();
    enqueue_ = [weak](Message m) {
      if (auto self = weak.lock()) {
        self->enqueue(std::move(m));
      }
    };
    draw();
    schedule();
  }

  void enqueue(Message m) { queue_.push_back(std::move(m)); }

  const Enqueue &enqueuer() const { return enqueue_; }

  CycleResult tick() {
    CycleResult result;
    if (queue_.empty()) {
      return result;
    }

    std::vector<Message> msgs;
    msgs.swap(queue_);
    ++cycles_;
    result.messages = msgs.size();
    if (options_.trace) {
      *options_.trace << "[ripple] cycle " << cycles_ << ": " << msgs.size()
                      << " message(s)\n";
    }

    for (const auto &m : msgs) {
      state_ = update_(state_, m, enqueue_);
    }

    result.scripts = draw();
    result.drew = true;
    return result;
  }

  const State &state() const { return state_; }

  const SpecList &spec() const { return spec_; }

  std::size_t pending_messages() const { return queue_.size(); }

  std::uint64_t cycles() const { return cycles_; }

  NodeHandle root() const { return root_; }

private:
  std::vector<EditScript> draw() {
    auto next = view_(state_);
    auto scripts = diff_list(spec_, next);
    if (options_.trace && options_.trace_scripts) {
      dump_edit_scripts(*options_.trace, scripts, 2);
    }
    apply_diff(backend_, enqueue_, root_, scripts);
    spec_ = std::move(next);
    return scripts;
  }

  void schedule() {
    auto self = this->shared_from_this();
    pacer_.request_frame([self]() {
      self->tick();
      self->schedule();
    });
  }

  Backend &backend_;
  NodeHandle root_;
  State state_;
  Update update_;
  View view_;
  FramePacer &pacer_;
  MountOptions options_;
  Enqueue enqueue_{};
  SpecList spec_{};
  std::vector<Message> queue_{};
  std::uint64_t cycles_{};
};

template <typename State> class MountHandle {
public:
  explicit MountHandle(std::shared_ptr<MountContext<State>> ctx)
      : ctx_{std::move(ctx)} {}

  void enqueue(Message m) const { ctx_->enqueue(std::move(m)); }

  // A copy that may outlive the handle; it does nothing once the mount is gone.
  Enqueue enqueuer() const { return ctx_->enqueuer(); }

  CycleResult tick() const { return ctx_->tick(); }

  const State &state() const { return ctx_->state(); }

  const SpecList &spec() const { return ctx_->spec(); }

  std::size_t pending_messages() const { return ctx_->pending_messages(); }

  std::uint64_t cycles() const { return ctx_->cycles(); }

private:
  std::shared_ptr<MountContext<State>> ctx_;
};

// Builds the first live tree under `root` right away, then hands the loop to
// `pacer`. There is no unmount; the loop lives as long as the pacer keeps
// running its frames.
template <typename State, typename UpdateFn, typename ViewFn>
MountHandle<State> mount(Backend &backend, NodeHandle root, State initial,
                         UpdateFn &&update, ViewFn &&view, FramePacer &pacer,
                         MountOptions options = {}) {
  auto ctx = std::make_shared<MountContext<State>>(
      backend, root, std::move(initial),
      typename MountContext<State>::Update{std::forward<UpdateFn>(update)},
      typename MountContext<State>::View{std::forward<ViewFn>(view)}, pacer,
      options);
  ctx->start();
  return MountHandle<State>{std::move(ctx)};
}

} // namespace ripple::ui
