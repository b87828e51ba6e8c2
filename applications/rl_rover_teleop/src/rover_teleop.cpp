// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <signal.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <memory>
#include <thread>

#include <rl/command/actuator_encoder.hpp>
#include <rl/command/serial_actuator_link.hpp>
#include <rl/common/logging.hpp>
#include <rl/common/time.hpp>
#include <rl/rover_teleop/rover_config.hpp>
#include <rl/rover_teleop/rover_teleop.hpp>
#include <rl/uplink/audio_uplink.hpp>
#include <rl/uplink/byte_stream_endpoint.hpp>
#include <rl/uplink/portaudio_capture.hpp>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitConfig = 1;
constexpr int kExitSessionFatal = 2;

volatile sig_atomic_t g_should_stop = 0;

void handle_signal(int)
{
  g_should_stop = 1;
}

inline bool stop_requested()
{
  return g_should_stop != 0;
}

}  // namespace

int main(int argc, char** argv)
{
  google::InitGoogleLogging(argv[0]);
  google::ParseCommandLineFlags(&argc, &argv, true);
  google::InstallFailureSignalHandler();
  FLAGS_alsologtostderr = true;
  FLAGS_colorlogtostderr = true;

  struct sigaction sa{};
  sa.sa_handler = handle_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGINT, &sa, nullptr);
  sigaction(SIGTERM, &sa, nullptr);

  const rl::RoverConfig config = rl::loadRoverConfigFromGflags();
  std::string error;
  if (!rl::validateRoverConfig(config, &error))
  {
    LOG(ERROR) << "[Teleop] Invalid configuration: " << error;
    return kExitConfig;
  }

  rl::RoomTransport::Ptr transport = rl::makeRoomTransport(config);
  rl::ActuatorEncoder::Ptr encoder = rl::makeActuatorEncoder(config.actuator_protocol);
  if (!transport || !encoder)
  {
    return kExitConfig;
  }
  auto link = std::make_shared<rl::SerialActuatorLink>(config.actuator_port,
                                                       config.actuator_baud);
  try
  {
    link->open();
  }
  catch (const std::exception& e)
  {
    // Not fatal: the router reports the link down and keeps retrying.
    LOG(WARNING) << "[Teleop] " << e.what();
  }

  // Destruction order: router (uses the bridge for status) before bridge.
  rl::SessionBridge bridge(transport, rl::makeSessionBridgeOptions(config),
                           [](const rl::StatusReport& report) {
                             VLOG(1) << "[Teleop] status " << report.event << " ("
                                     << report.detail << ")";
                           });
  rl::CommandRouter router(link, encoder, rl::makeCommandRouterOptions(config),
                           [&bridge](const rl::StatusReport& report) {
                             bridge.sendStatus(report);
                           });
  rl::ControlDispatcher dispatcher(router);

  rl::ControlMessageStream::Ptr controls = bridge.onControlMessages(config.control_topic);
  rl::ControlMessageStream::Ptr commands = bridge.onControlMessages(config.command_topic);
  rl::PeerEventStream::Ptr peers = bridge.onPeerEvents();
  rl::TrackStream::Ptr tracks = bridge.onTrackAvailable(rl::makeSubscribeFilter(config));

  router.startTicker();

  std::atomic<bool> pump_running{true};
  std::thread pump([&]() {
    rl::ControlMessage msg;
    rl::PeerEvent peer;
    while (pump_running.load())
    {
      // Peer departures first so a leaving controller releases the latch
      // before anything queued behind it is judged.
      while (peers->tryPop(&peer))
      {
        dispatcher.dispatchPeerEvent(peer);
      }
      while (commands->tryPop(&msg))
      {
        dispatcher.dispatch(msg);
      }
      if (controls->popFor(&msg, std::chrono::milliseconds(20)))
      {
        dispatcher.dispatch(msg);
      }
    }
  });

  rl::UplinkRelay relay(rl::makeUplinkRelayOptions(config));
  relay.start(std::make_shared<rl::TcpClientEndpoint>(config.video_host, config.video_port),
              bridge.videoSink());

  rl::AudioUplinkOptions audio_options;
  audio_options.log_stats_interval_s = config.log_stats_interval_s;
  rl::AudioUplink audio(audio_options);
  if (config.audio_uplink &&
      !audio.start(std::make_shared<rl::PortAudioCapture>(config.audio_device),
                   bridge.audioSink()))
  {
    LOG(WARNING) << "[Teleop] Continuing without audio.";
  }

  bridge.start(rl::steadyNowNs());
  LOG(INFO) << "[Teleop] Running as '" << config.local_identity << "' in room '"
            << config.room_name << "'. Press Ctrl+C to stop.";

  rl::TrackAvailable track;
  while (!stop_requested() && !bridge.fatal())
  {
    bridge.waitForEvents(50);
    bridge.spinOnce(rl::steadyNowNs());
    while (tracks->tryPop(&track))
    {
      LOG(INFO) << "[Teleop] Track '" << track.name << "' (" << track.kind << ") from '"
                << track.identity << "'" << (track.subscribed ? " subscribed" : "");
    }
  }

  const bool fatal = bridge.fatal();
  if (fatal)
  {
    LOG(ERROR) << "[Teleop] Session ended: " << bridge.fatalReason();
  }
  else
  {
    LOG(INFO) << "[Teleop] Shutting down.";
  }

  relay.stop();
  audio.stop();
  pump_running.store(false);
  pump.join();
  if (!router.stop())
  {
    LOG(WARNING) << "[Teleop] Could not write the final stop command to "
                 << link->describe();
  }
  bridge.stop();

  const rl::ControlDispatcherStats stats = dispatcher.stats();
  const rl::SessionBridgeStats bridge_stats = bridge.stats();
  LOG(INFO) << "[Teleop] Done. dispatched=" << stats.dispatched
            << " rejected=" << stats.rejected
            << " malformed=" << bridge_stats.control_malformed
            << " unknown_type=" << bridge_stats.control_unknown_type;
  return fatal ? kExitSessionFatal : kExitOk;
}
