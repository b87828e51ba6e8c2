// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/command/command_router.hpp>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>

#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>

namespace rl {

const char* submitResultName(const SubmitResult result)
{
  switch (result)
  {
  case SubmitResult::Accepted: return "accepted";
  case SubmitResult::RejectedOutOfRange: return "out_of_range";
  case SubmitResult::RejectedStale: return "stale";
  case SubmitResult::RejectedUnauthorized: return "unauthorized";
  }
  return "unknown";
}

const char* CommandRouter::writeReasonName(const WriteReason reason)
{
  switch (reason)
  {
  case WriteReason::Input: return "input";
  case WriteReason::Maneuver: return "maneuver";
  case WriteReason::ManeuverEnd: return "maneuver end";
  case WriteReason::Watchdog: return "watchdog";
  case WriteReason::Retry: return "retry";
  }
  return "unknown";
}

CommandRouter::CommandRouter(ActuatorLink::Ptr link,
                             ActuatorEncoder::Ptr encoder,
                             const CommandRouterOptions& options,
                             StatusSink status_sink)
  : options_(options)
  , link_(std::move(link))
  , encoder_(std::move(encoder))
  , status_sink_(std::move(status_sink))
  , retry_backoff_(options.retry_base_ms, options.retry_cap_ms)
{
  CHECK(link_) << "CommandRouter needs an actuator link.";
  CHECK(encoder_) << "CommandRouter needs an encoder.";
  CHECK_GT(options_.write_rate_hz, 0.0);
  CHECK_GT(options_.watchdog_ms, 0);
  CHECK_GT(options_.link_down_threshold, 0);
  CHECK_GT(options_.max_duty, 0.0);
  CHECK_GT(options_.max_speed_mps, 0.0);
  CHECK_GT(options_.max_maneuver_s, 0.0);
}

CommandRouter::~CommandRouter()
{
  stopTicker();
}

void CommandRouter::start(const TimestampNs now_ns)
{
  std::lock_guard<std::mutex> lock(mutex_);
  started_ = true;
  last_input_ns_ = now_ns;
}

int64_t CommandRouter::tickPeriodNs() const
{
  return static_cast<int64_t>(std::llround(kNanosPerSecond / options_.write_rate_hz));
}

// -----------------------------------------------------------------------------
// Input.

bool CommandRouter::validateAxes(ControlFrame* frame)
{
  bool clamped = false;
  for (int i = 0; i < frame->axes.size(); ++i)
  {
    real_t& v = frame->axes(i);
    if (!std::isfinite(v))
    {
      return false;
    }
    if (v < -1.0 || v > 1.0)
    {
      if (!options_.clamp_axes)
      {
        return false;
      }
      v = v < 0.0 ? -1.0 : 1.0;
      clamped = true;
    }
  }
  if (clamped)
  {
    ++stats_.clamped;
  }
  return true;
}

SubmitResult CommandRouter::submit(const ControlFrame& frame)
{
  std::lock_guard<std::mutex> lock(mutex_);
  ControlFrame f = frame;
  if (f.arrival_ns == 0)
  {
    f.arrival_ns = steadyNowNs();
  }

  if (!validateAxes(&f))
  {
    ++stats_.rejected_out_of_range;
    return SubmitResult::RejectedOutOfRange;
  }

  auto it = last_seq_.find(f.origin);
  if (it != last_seq_.end() && f.seq <= it->second)
  {
    ++stats_.rejected_stale;
    return SubmitResult::RejectedStale;
  }

  if (controller_.empty())
  {
    controller_ = f.origin;
    LOG(INFO) << "[Router] Controller latched: '" << controller_ << "'";
  }
  else if (f.origin != controller_)
  {
    static int warned_unauthorized = 0;
    if (warned_unauthorized++ < 3)
    {
      LOG(WARNING) << "[Router] Ignoring input from '" << f.origin
                   << "'; controller is '" << controller_ << "'";
    }
    ++stats_.rejected_unauthorized;
    return SubmitResult::RejectedUnauthorized;
  }

  last_seq_[f.origin] = f.seq;
  controller_last_ns_ = f.arrival_ns;
  if (input_pending_)
  {
    ++stats_.coalesced;
  }
  if (maneuver_active_)
  {
    maneuver_active_ = false;
    LOG(INFO) << "[Router] Manual input cancels the active maneuver.";
  }
  last_accepted_ = f;
  has_accepted_ = true;
  input_pending_ = true;
  last_input_ns_ = f.arrival_ns;
  zero_suppressed_ = false;
  ++stats_.accepted;
  return SubmitResult::Accepted;
}

bool CommandRouter::handover(const std::string& from, const std::string& to)
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (controller_.empty() || from != controller_)
  {
    LOG(WARNING) << "[Router] Handover request from '" << from
                 << "' ignored; controller is '" << controller_ << "'";
    return false;
  }
  if (to.empty())
  {
    releaseLatch("released by handover");
    return true;
  }
  LOG(INFO) << "[Router] Controller handed over: '" << controller_ << "' -> '" << to << "'";
  controller_ = to;
  controller_last_ns_ = steadyNowNs();
  return true;
}

bool CommandRouter::submitManeuver(const ManeuverRequest& request)
{
  std::lock_guard<std::mutex> lock(mutex_);
  const bool valid = std::isfinite(request.distance_m) && std::isfinite(request.velocity_mps) &&
                     std::isfinite(request.steering) && request.distance_m > 0.0 &&
                     request.velocity_mps > 0.0 && std::abs(request.steering) <= 1.0;
  if (!valid)
  {
    LOG(WARNING) << "[Router] Rejecting maneuver from '" << request.origin
                 << "': distance " << request.distance_m << "m, velocity "
                 << request.velocity_mps << "m/s, steering " << request.steering;
    ++stats_.maneuvers_rejected;
    return false;
  }
  if (!controller_.empty() && request.origin != controller_)
  {
    LOG(WARNING) << "[Router] Rejecting maneuver from '" << request.origin
                 << "'; controller is '" << controller_ << "'";
    ++stats_.maneuvers_rejected;
    return false;
  }

  const real_t duration_s = request.distance_m / request.velocity_mps;
  if (!(duration_s <= options_.max_maneuver_s))
  {
    LOG(WARNING) << "[Router] Rejecting maneuver from '" << request.origin << "': "
                 << duration_s << "s exceeds the " << options_.max_maneuver_s << "s limit.";
    ++stats_.maneuvers_rejected;
    return false;
  }

  const real_t sign = request.direction == ManeuverDirection::Backward ? -1.0 : 1.0;
  const real_t throttle = sign * std::min<real_t>(request.velocity_mps / options_.max_speed_mps, 1.0);
  const TimestampNs start_ns = request.arrival_ns != 0 ? request.arrival_ns : steadyNowNs();

  maneuver_cmd_ = mixDifferentialDrive(throttle, request.steering, options_.max_duty);
  maneuver_end_ns_ = start_ns + static_cast<int64_t>(duration_s * kNanosPerSecond);
  maneuver_active_ = true;
  input_pending_ = false;
  zero_suppressed_ = false;
  ++stats_.maneuvers;
  LOG(INFO) << "[Router] Maneuver "
            << (request.direction == ManeuverDirection::Backward ? "backward " : "forward ")
            << request.distance_m << "m at " << request.velocity_mps << "m/s for "
            << std::fixed << std::setprecision(2) << duration_s << "s (L "
            << maneuver_cmd_.left() << ", R " << maneuver_cmd_.right() << ")";
  return true;
}

void CommandRouter::onPeerLeft(const std::string& identity)
{
  std::lock_guard<std::mutex> lock(mutex_);
  last_seq_.erase(identity);
  if (!controller_.empty() && controller_ == identity)
  {
    releaseLatch("peer left");
  }
}

void CommandRouter::releaseLatch(const std::string& why)
{
  LOG(INFO) << "[Router] Controller '" << controller_ << "' released (" << why << ")";
  controller_.clear();
}

// -----------------------------------------------------------------------------
// Output.

void CommandRouter::tick(const TimestampNs now_ns)
{
  ActuatorCommand cmd;
  WriteReason reason = WriteReason::Input;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
      return;
    }
    if (!started_)
    {
      started_ = true;
      last_input_ns_ = now_ns;
    }

    if (options_.controller_lease_ms > 0 && !controller_.empty() &&
        now_ns - controller_last_ns_ > millisToNanos(options_.controller_lease_ms))
    {
      releaseLatch("lease expired");
    }

    bool write = true;
    if (input_pending_)
    {
      cmd = mixControlFrame(last_accepted_, options_.max_duty);
      input_pending_ = false;
      reason = WriteReason::Input;
    }
    else if (maneuver_active_)
    {
      if (now_ns < maneuver_end_ns_)
      {
        cmd = maneuver_cmd_;
        reason = WriteReason::Maneuver;
      }
      else
      {
        maneuver_active_ = false;
        cmd = ActuatorCommand::zero();
        reason = WriteReason::ManeuverEnd;
        zero_suppressed_ = true;
        last_input_ns_ = now_ns;
        LOG(INFO) << "[Router] Maneuver complete.";
      }
    }
    else if (!zero_suppressed_ &&
             now_ns - last_input_ns_ > millisToNanos(options_.watchdog_ms))
    {
      cmd = ActuatorCommand::zero();
      reason = WriteReason::Watchdog;
      zero_suppressed_ = true;
      ++stats_.watchdog_stops;
      LOG(WARNING) << "[Router] No valid input for "
                   << nanosToMillis(now_ns - last_input_ns_) << "ms; stopping.";
    }
    else if (retry_pending_ && now_ns >= next_retry_ns_)
    {
      cmd = retry_cmd_;
      reason = WriteReason::Retry;
    }
    else
    {
      write = false;
    }

    if (!write)
    {
      return;
    }
    retry_pending_ = false;
  }

  // Only the ticker writes, so writes never overlap.
  const bool ok = link_->write(encoder_->encode(cmd));
  if (!ok)
  {
    VLOG(1) << "[Router] " << writeReasonName(reason) << " write failed.";
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    applyWriteResult(ok, cmd, now_ns);
  }
  flushStatus();
}

void CommandRouter::applyWriteResult(const bool ok, const ActuatorCommand& cmd,
                                     const TimestampNs now_ns)
{
  if (ok)
  {
    ++stats_.writes;
    health_.last_success_ns = now_ns;
    health_.consecutive_failures = 0;
    retry_backoff_.reset();
    last_written_ = cmd;
    has_written_ = true;
    if (health_.link_down)
    {
      health_.link_down = false;
      LOG(INFO) << "[Router] Actuator link " << link_->describe() << " is back.";
      emitStatus("actuator_link_up", link_->describe());
    }
    return;
  }

  ++stats_.write_failures;
  ++health_.consecutive_failures;
  if (!health_.link_down && health_.consecutive_failures >= options_.link_down_threshold)
  {
    health_.link_down = true;
    LOG(ERROR) << "[Router] Actuator link " << link_->describe() << " down after "
               << health_.consecutive_failures << " consecutive write failures.";
    emitStatus("actuator_link_down", link_->describe() + ": " +
               std::to_string(health_.consecutive_failures) + " consecutive write failures");
  }
  // Keep the command for a retry unless newer input already replaced it.
  if (!input_pending_ && !maneuver_active_)
  {
    retry_pending_ = true;
    retry_cmd_ = cmd;
    next_retry_ns_ = now_ns + millisToNanos(retry_backoff_.nextDelayMs());
  }
}

void CommandRouter::emitStatus(const std::string& event, const std::string& detail)
{
  StatusReport report;
  report.event = event;
  report.detail = detail;
  report.timestamp_ms = wallNowMs();
  report.counters["consecutive_failures"] = static_cast<uint64_t>(health_.consecutive_failures);
  report.counters["write_failures"] = stats_.write_failures;
  pending_status_.push_back(report);
}

void CommandRouter::flushStatus()
{
  std::vector<StatusReport> reports;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    reports.swap(pending_status_);
  }
  if (!status_sink_)
  {
    return;
  }
  for (const StatusReport& report : reports)
  {
    status_sink_(report);
  }
}

// -----------------------------------------------------------------------------
// Ticker.

void CommandRouter::startTicker()
{
  if (ticker_running_.exchange(true))
  {
    return;
  }
  start(steadyNowNs());
  ticker_thread_ = std::thread(&CommandRouter::tickerLoop, this);
  LOG(INFO) << "[Router] Writing to " << link_->describe() << " via " << encoder_->name()
            << " at " << options_.write_rate_hz << " Hz, watchdog " << options_.watchdog_ms
            << "ms.";
}

void CommandRouter::stopTicker()
{
  {
    std::lock_guard<std::mutex> lock(ticker_mutex_);
    ticker_running_.store(false);
  }
  ticker_cv_.notify_all();
  if (ticker_thread_.joinable())
  {
    ticker_thread_.join();
  }
}

bool CommandRouter::stop()
{
  stopTicker();
  const ActuatorCommand zero = ActuatorCommand::zero();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_)
    {
      return true;
    }
    stopped_ = true;
    input_pending_ = false;
    maneuver_active_ = false;
    retry_pending_ = false;
  }

  const bool ok = link_->write(encoder_->encode(zero));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ok)
    {
      ++stats_.writes;
      health_.last_success_ns = steadyNowNs();
      last_written_ = zero;
      has_written_ = true;
    }
    else
    {
      ++stats_.write_failures;
    }
  }
  if (ok)
  {
    LOG(INFO) << "[Router] Final stop written to " << link_->describe() << ".";
  }
  else
  {
    LOG(WARNING) << "[Router] Final stop to " << link_->describe() << " failed.";
  }
  return ok;
}

void CommandRouter::tickerLoop()
{
  const auto period = std::chrono::nanoseconds(tickPeriodNs());
  auto next = std::chrono::steady_clock::now();
  auto last_log = next;

  while (ticker_running_.load())
  {
    tick(steadyNowNs());

    const auto now = std::chrono::steady_clock::now();
    if (options_.log_stats_interval_s > 0)
    {
      const double elapsed = std::chrono::duration<double>(now - last_log).count();
      if (elapsed >= static_cast<double>(options_.log_stats_interval_s))
      {
        logStats(elapsed);
        last_log = now;
      }
    }

    next += period;
    if (next < now)
    {
      // Fell behind (slow write); do not burst to catch up.
      next = now + period;
    }
    std::unique_lock<std::mutex> lock(ticker_mutex_);
    ticker_cv_.wait_until(lock, next, [&]() { return !ticker_running_.load(); });
  }
}

void CommandRouter::logStats(const double elapsed_s)
{
  const CommandRouterStats s = stats();
  const LinkHealth health = linkHealth();
  LOG(INFO) << std::fixed << std::setprecision(1)
            << "[Router] stats accepted/s=" << (s.accepted - last_logged_.accepted) / elapsed_s
            << " writes/s=" << (s.writes - last_logged_.writes) / elapsed_s
            << " coalesced=" << s.coalesced
            << " rejected(range/stale/unauth)=" << s.rejected_out_of_range << "/"
            << s.rejected_stale << "/" << s.rejected_unauthorized
            << " write_failures=" << s.write_failures
            << " watchdog_stops=" << s.watchdog_stops
            << " link=" << (health.link_down ? "down" : "up")
            << " controller='" << controller() << "'";
  last_logged_ = s;
}

// -----------------------------------------------------------------------------
// Accessors.

std::string CommandRouter::controller() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return controller_;
}

LinkHealth CommandRouter::linkHealth() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return health_;
}

CommandRouterStats CommandRouter::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

bool CommandRouter::maneuverActive() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return maneuver_active_;
}

bool CommandRouter::lastAccepted(ControlFrame* out) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_accepted_)
  {
    return false;
  }
  *out = last_accepted_;
  return true;
}

bool CommandRouter::lastWritten(ActuatorCommand* out) const
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (!has_written_)
  {
    return false;
  }
  *out = last_written_;
  return true;
}

} // namespace rl
