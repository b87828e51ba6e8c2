// Copyright (c) 2015-2016, ETH Zurich, Wyss Zurich, Zurich Eye
// All rights reserved.
//
// Modified: Robotics and Perception Group

#include <rl/uplink/portaudio_capture.hpp>

#include <stdexcept>

#include <rl/common/logging.hpp>

namespace rl {

namespace {

std::string pa_error(const PaError err)
{
  return Pa_GetErrorText(err);
}

PaDeviceIndex find_input_device(const std::string& wanted, std::string* name)
{
  if (wanted.empty())
  {
    const PaDeviceIndex index = Pa_GetDefaultInputDevice();
    const PaDeviceInfo* info = index == paNoDevice ? nullptr : Pa_GetDeviceInfo(index);
    if (info)
    {
      *name = info->name;
    }
    return index;
  }

  const PaDeviceIndex count = Pa_GetDeviceCount();
  VLOG(1) << "[Audio] Checking " << count << " audio devices for '" << wanted << "'";
  for (PaDeviceIndex i = 0; i < count; ++i)
  {
    const PaDeviceInfo* info = Pa_GetDeviceInfo(i);
    if (info && info->maxInputChannels > 0 &&
        std::string(info->name).find(wanted) != std::string::npos)
    {
      *name = info->name;
      return i;
    }
  }
  return paNoDevice;
}

} // namespace

PortAudioCapture::PortAudioCapture(const std::string& device)
  : device_(device)
{
}

PortAudioCapture::~PortAudioCapture()
{
  close();
}

std::string PortAudioCapture::describe() const
{
  return "portaudio:" + (device_name_.empty() ? (device_.empty() ? "default" : device_)
                                              : device_name_);
}

void PortAudioCapture::open(const AudioCaptureFormat& format, Callback callback)
{
  close();
  std::lock_guard<std::mutex> lock(mutex_);
  format_ = format;
  callback_ = std::move(callback);

  PaError err = Pa_Initialize();
  if (err != paNoError)
  {
    throw std::runtime_error("Failed to initialize PortAudio: " + pa_error(err));
  }
  initialized_ = true;

  const PaDeviceIndex device = find_input_device(device_, &device_name_);
  if (device == paNoDevice)
  {
    Pa_Terminate();
    initialized_ = false;
    throw std::runtime_error("No audio input device " +
                             (device_.empty() ? std::string("available") : "matching '" + device_ + "'"));
  }

  PaStreamParameters params;
  params.device = device;
  params.channelCount = format_.channels;
  params.sampleFormat = paInt16;
  params.suggestedLatency = Pa_GetDeviceInfo(device)->defaultLowInputLatency;
  params.hostApiSpecificStreamInfo = nullptr;

  err = Pa_OpenStream(&stream_, &params, nullptr, format_.sample_rate,
                      static_cast<unsigned long>(format_.block_frames), paClipOff,
                      &PortAudioCapture::streamCallback, this);
  if (err == paNoError)
  {
    err = Pa_StartStream(stream_);
    if (err != paNoError)
    {
      Pa_CloseStream(stream_);
    }
  }
  if (err != paNoError)
  {
    stream_ = nullptr;
    Pa_Terminate();
    initialized_ = false;
    throw std::runtime_error("Failed to open audio input '" + device_name_ + "': " +
                             pa_error(err));
  }
  VLOG(1) << "[Audio] Opened " << describe();
}

void PortAudioCapture::close()
{
  std::lock_guard<std::mutex> lock(mutex_);
  if (stream_)
  {
    PaError err = Pa_StopStream(stream_);
    if (err != paNoError)
    {
      LOG(WARNING) << "[Audio] Failed to stop " << describe() << ": " << pa_error(err);
    }
    err = Pa_CloseStream(stream_);
    if (err != paNoError)
    {
      LOG(WARNING) << "[Audio] Failed to close " << describe() << ": " << pa_error(err);
    }
    stream_ = nullptr;
  }
  if (initialized_)
  {
    Pa_Terminate();
    initialized_ = false;
  }
}

int PortAudioCapture::streamCallback(const void* input, void* /*output*/,
                                     unsigned long frame_count,
                                     const PaStreamCallbackTimeInfo* /*time_info*/,
                                     PaStreamCallbackFlags status_flags, void* user_data)
{
  PortAudioCapture* self = static_cast<PortAudioCapture*>(user_data);
  if (status_flags & paInputOverflow)
  {
    static int warned_overflow = 0;
    if (warned_overflow++ < 3)
    {
      LOG(WARNING) << "[Audio] Input overflow on " << self->device_name_;
    }
  }
  if (input && self->callback_)
  {
    self->callback_(static_cast<const int16_t*>(input),
                    static_cast<size_t>(frame_count) * self->format_.channels);
  }
  return paContinue;
}

} // namespace rl
