/*
 * Copyright 2025 LiveKit
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an “AS IS” BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace meetbridge {

class CancellationToken {
public:
  void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
  bool cancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

private:
  std::atomic<bool> cancelled_{false};
};

/**
 * Pull side of a remote media track.
 *
 * Every frame returned by acquire() must be handed back to release()
 * exactly once, whether it was processed, dropped, or the stage failed.
 */
template <typename Frame> class FrameSource {
public:
  virtual ~FrameSource() = default;

  /// Next frame, or std::nullopt when none is ready yet.
  virtual std::optional<Frame> acquire() = 0;
  virtual void release(Frame &frame) = 0;
  /// True once the source will never produce another frame.
  virtual bool ended() const = 0;
};

/// Releases its frame back to the source when it goes out of scope.
template <typename Frame> class FrameGuard {
public:
  FrameGuard(FrameSource<Frame> &source, Frame frame)
      : source_(source), frame_(std::move(frame)) {}
  ~FrameGuard() { source_.release(frame_); }

  FrameGuard(const FrameGuard &) = delete;
  FrameGuard &operator=(const FrameGuard &) = delete;

  Frame &frame() noexcept { return frame_; }

private:
  FrameSource<Frame> &source_;
  Frame frame_;
};

/**
 * Cooperative per-track transform loop on an io_context.
 *
 * Each pump pulls at most `batch_size` frames, runs `stage` on each, then
 * re-posts itself so other handlers get a turn. When the source has no
 * frame ready the pump sleeps for `idle_poll`. cancel() stops the loop at
 * the next frame boundary.
 *
 * Create through std::make_shared; queued handlers keep the pipeline
 * alive.
 */
template <typename Frame>
class FramePipeline : public std::enable_shared_from_this<FramePipeline<Frame>> {
public:
  using Stage = std::function<void(Frame &)>;

  FramePipeline(boost::asio::io_context &io, std::string name,
                std::shared_ptr<FrameSource<Frame>> source, Stage stage,
                std::size_t batch_size = 8,
                std::chrono::milliseconds idle_poll =
                    std::chrono::milliseconds(10))
      : io_(io), idle_timer_(io), name_(std::move(name)),
        source_(std::move(source)), stage_(std::move(stage)),
        batch_size_(batch_size == 0 ? 1 : batch_size), idle_poll_(idle_poll) {
  }

  FramePipeline(const FramePipeline &) = delete;
  FramePipeline &operator=(const FramePipeline &) = delete;

  void start() {
    auto self = this->shared_from_this();
    boost::asio::post(io_, [self]() { self->pump(); });
  }

  void cancel() {
    token_.cancel();
    idle_timer_.cancel();
  }

  bool cancelled() const noexcept { return token_.cancelled(); }
  bool finished() const noexcept { return finished_; }
  const std::string &name() const noexcept { return name_; }
  std::uint64_t processed() const noexcept { return processed_; }
  std::uint64_t errors() const noexcept { return errors_; }

  /// Run one batch synchronously. Returns false once the pipeline is done.
  bool pumpOnce() {
    if (finished_) {
      return false;
    }
    drained_ = false;
    for (std::size_t i = 0; i < batch_size_; ++i) {
      if (token_.cancelled()) {
        finish("cancelled");
        return false;
      }
      std::optional<Frame> next = source_->acquire();
      if (!next) {
        drained_ = true;
        break;
      }
      FrameGuard<Frame> guard(*source_, std::move(*next));
      try {
        stage_(guard.frame());
        ++processed_;
      } catch (const std::exception &e) {
        ++errors_;
        std::cerr << "[FramePipeline] " << name_
                  << " error processing frame: " << e.what() << std::endl;
      }
    }
    if (token_.cancelled()) {
      finish("cancelled");
      return false;
    }
    if (source_->ended()) {
      finish("source ended");
      return false;
    }
    return true;
  }

private:
  void pump() {
    if (!pumpOnce()) {
      return;
    }
    auto self = this->shared_from_this();
    if (!drained_) {
      boost::asio::post(io_, [self]() { self->pump(); });
      return;
    }
    idle_timer_.expires_after(idle_poll_);
    idle_timer_.async_wait([self](const boost::system::error_code &ec) {
      if (ec) {
        return;
      }
      self->pump();
    });
  }

  void finish(const char *why) {
    if (!finished_) {
      finished_ = true;
      std::cout << "[FramePipeline] " << name_ << " stopped (" << why << ")"
                << std::endl;
    }
  }

  boost::asio::io_context &io_;
  boost::asio::steady_timer idle_timer_;
  std::string name_;
  std::shared_ptr<FrameSource<Frame>> source_;
  Stage stage_;
  std::size_t batch_size_;
  std::chrono::milliseconds idle_poll_;
  CancellationToken token_;
  bool finished_ = false;
  // Last batch stopped because the source had nothing ready.
  bool drained_ = false;
  std::uint64_t processed_ = 0;
  std::uint64_t errors_ = 0;
};

} // namespace meetbridge
