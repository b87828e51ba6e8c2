// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#pragma once

#include <atomic>
#include <condition_variable>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <rl/command/actuator_encoder.hpp>
#include <rl/command/actuator_link.hpp>
#include <rl/common/backoff.hpp>
#include <rl/messages/control_frame.hpp>
#include <rl/messages/status_report.hpp>

namespace rl {

struct CommandRouterOptions
{
  real_t write_rate_hz = 20.0;
  //! No accepted input for longer than this writes one zero command.
  int64_t watchdog_ms = 300;
  //! Clamp out-of-range axes instead of rejecting the frame.
  bool clamp_axes = false;
  //! Consecutive write failures that count as link down.
  int link_down_threshold = 3;
  int64_t retry_base_ms = 100;
  int64_t retry_cap_ms = 2000;
  //! A latched controller silent for this long loses the latch. 0: never.
  int64_t controller_lease_ms = 0;
  real_t max_duty = 0.5;
  //! Speed that maps to full throttle for maneuvers.
  real_t max_speed_mps = 1.0;
  //! Longest accepted maneuver, distance over velocity.
  real_t max_maneuver_s = 600.0;
  int log_stats_interval_s = 5;
};

enum class SubmitResult
{
  Accepted,
  RejectedOutOfRange,
  RejectedStale,
  RejectedUnauthorized
};

const char* submitResultName(SubmitResult result);

//! Rolling health of the actuator link, updated after every write attempt.
struct LinkHealth
{
  TimestampNs last_success_ns = 0;
  int consecutive_failures = 0;
  bool link_down = false;
};

struct CommandRouterStats
{
  uint64_t accepted = 0;
  uint64_t clamped = 0;
  uint64_t rejected_out_of_range = 0;
  uint64_t rejected_stale = 0;
  uint64_t rejected_unauthorized = 0;
  //! Accepted frames replaced by a newer one before being written.
  uint64_t coalesced = 0;
  uint64_t writes = 0;
  uint64_t write_failures = 0;
  uint64_t watchdog_stops = 0;
  uint64_t maneuvers = 0;
  uint64_t maneuvers_rejected = 0;
};

//! Validates control input, coalesces it to the write cadence and writes it
//! to the actuator link. tick() performs at most one write and must only be
//! called from one thread at a time; submit() and friends may be called from
//! any thread.
class CommandRouter
{
public:
  CommandRouter(ActuatorLink::Ptr link,
                ActuatorEncoder::Ptr encoder,
                const CommandRouterOptions& options = CommandRouterOptions(),
                StatusSink status_sink = StatusSink());
  ~CommandRouter();

  CommandRouter(const CommandRouter&) = delete;
  CommandRouter& operator=(const CommandRouter&) = delete;

  //! Starts the watchdog clock. Called by startTicker().
  void start(TimestampNs now_ns);

  //! Range check, then stale sequence per origin, then controller latch.
  SubmitResult submit(const ControlFrame& frame);

  //! Moves the latch from `from` (must be the current controller) to `to`.
  //! An empty `to` releases it.
  bool handover(const std::string& from, const std::string& to);

  //! Timed drive; rejected if invalid or not from the controller while one
  //! is latched. Accepting a maneuver never latches.
  bool submitManeuver(const ManeuverRequest& request);

  //! Forgets the peer's sequence state and releases its latch.
  void onPeerLeft(const std::string& identity);

  //! One cadence tick.
  void tick(TimestampNs now_ns);

  //! Runs tick() on a dedicated thread at the write rate.
  void startTicker();
  void stopTicker();

  //! Stops the ticker, drops pending input and maneuvers, and writes one
  //! final zero command. Later calls do nothing. Returns the write result.
  bool stop();

  int64_t tickPeriodNs() const;
  std::string controller() const;
  LinkHealth linkHealth() const;
  CommandRouterStats stats() const;
  bool maneuverActive() const;

  //! Latest accepted frame, written or not.
  bool lastAccepted(ControlFrame* out) const;
  //! Last command written successfully.
  bool lastWritten(ActuatorCommand* out) const;

private:
  enum class WriteReason
  {
    Input,
    Maneuver,
    ManeuverEnd,
    Watchdog,
    Retry
  };

  static const char* writeReasonName(WriteReason reason);

  bool validateAxes(ControlFrame* frame);
  void releaseLatch(const std::string& why);
  void applyWriteResult(bool ok, const ActuatorCommand& cmd, TimestampNs now_ns);
  //! Queues a status; flushStatus() delivers it outside the lock.
  void emitStatus(const std::string& event, const std::string& detail);
  void flushStatus();
  void tickerLoop();
  void logStats(double elapsed_s);

  const CommandRouterOptions options_;
  const ActuatorLink::Ptr link_;
  const ActuatorEncoder::Ptr encoder_;
  const StatusSink status_sink_;

  mutable std::mutex mutex_;
  std::map<std::string, uint64_t> last_seq_;
  std::string controller_;
  TimestampNs controller_last_ns_ = 0;

  bool has_accepted_ = false;
  ControlFrame last_accepted_;
  bool input_pending_ = false;
  TimestampNs last_input_ns_ = 0;
  bool zero_suppressed_ = false;

  bool maneuver_active_ = false;
  ActuatorCommand maneuver_cmd_;
  TimestampNs maneuver_end_ns_ = 0;

  bool retry_pending_ = false;
  ActuatorCommand retry_cmd_;
  TimestampNs next_retry_ns_ = 0;
  ExponentialBackoff retry_backoff_;

  LinkHealth health_;
  bool has_written_ = false;
  ActuatorCommand last_written_;
  CommandRouterStats stats_;
  bool started_ = false;
  bool stopped_ = false;
  std::vector<StatusReport> pending_status_;

  std::atomic<bool> ticker_running_{false};
  std::thread ticker_thread_;
  std::mutex ticker_mutex_;
  std::condition_variable ticker_cv_;
  CommandRouterStats last_logged_;
};

} // namespace rl
