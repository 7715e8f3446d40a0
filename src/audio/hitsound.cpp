// src/audio/hitsound.cpp
// Turn note crossings into sound with TinySoundFont + miniaudio.

#define TSF_IMPLEMENTATION
#define MINIAUDIO_IMPLEMENTATION
#include "miniaudio.h"
#include "tsf.h"

#include "audio/hitsound.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <string>

namespace {

constexpr int kDrumChannel = 9; // MIDI channel 10
constexpr ma_uint32 kSampleRate = 44100;

struct Hit {
  int key;
  float vel; // 0..1
};

float velocity_for(chart::NoteKind kind) {
  switch (kind) {
  case chart::NoteKind::Tap:
    return 0.9f;
  case chart::NoteKind::Drag:
    return 0.6f;
  case chart::NoteKind::Hold:
    return 1.0f;
  }
  return 0.9f;
}

inline void ensure(bool cond, const char *msg) {
  if (!cond)
    throw std::runtime_error(msg);
}

} // namespace

namespace audio {

// Shared state the audio thread uses.
struct HitsoundPlayer::Impl {
  tsf *synth = nullptr;
  ma_device device{};
  bool deviceReady = false;

  std::mutex pendingMutex;
  std::vector<Hit> pending;
  bool silenceRequested = false;

  ~Impl() {
    if (deviceReady) {
      ma_device_stop(&device);
      ma_device_uninit(&device);
    }
    if (synth)
      tsf_close(synth);
  }

  // Real-time callback: apply queued hits, then render interleaved stereo s16.
  static void data_callback(ma_device *device, void *pOutput,
                            const void * /*pInput*/, ma_uint32 frameCount) {
    auto *st = reinterpret_cast<Impl *>(device->pUserData);
    short *out = reinterpret_cast<short *>(pOutput);

    // Never block the audio thread: if the frame loop holds the lock, the
    // hits go out with the next buffer instead.
    std::unique_lock<std::mutex> lock(st->pendingMutex, std::try_to_lock);
    if (lock.owns_lock()) {
      if (st->silenceRequested) {
        tsf_note_off_all(st->synth);
        st->silenceRequested = false;
      }
      for (const Hit &h : st->pending)
        tsf_channel_note_on(st->synth, kDrumChannel, h.key, h.vel);
      st->pending.clear();
      lock.unlock();
    }

    tsf_render_short(st->synth, out, static_cast<int>(frameCount), 0);
  }
};

HitsoundPlayer::HitsoundPlayer(const std::filesystem::path &sf2Path)
    : impl_(std::make_unique<Impl>()) {
  // --- Init TinySoundFont ---
  impl_->synth = tsf_load_filename(sf2Path.string().c_str());
  ensure(impl_->synth != nullptr, "Failed to load SoundFont (.sf2)");

  tsf_set_output(impl_->synth, TSF_STEREO_INTERLEAVED,
                 static_cast<int>(kSampleRate), 0.0f);
  tsf_set_volume(impl_->synth, 0.8f); // modest headroom
  tsf_channel_set_presetnumber(impl_->synth, kDrumChannel, 0,
                               1 /*GM drum kit*/);

  // --- Miniaudio device setup ---
  ma_device_config config = ma_device_config_init(ma_device_type_playback);
  config.playback.format = ma_format_s16; // matches tsf_render_short
  config.playback.channels = 2;           // stereo
  config.sampleRate = kSampleRate;
  config.dataCallback = &Impl::data_callback;
  config.pUserData = impl_.get();

  if (ma_device_init(nullptr, &config, &impl_->device) != MA_SUCCESS)
    throw std::runtime_error("Failed to open playback device");
  impl_->deviceReady = true;

  if (ma_device_start(&impl_->device) != MA_SUCCESS)
    throw std::runtime_error("Failed to start playback device");
}

HitsoundPlayer::~HitsoundPlayer() = default;

void HitsoundPlayer::trigger(
    const std::vector<const chart::NoteEvent *> &notes) {
  if (notes.empty())
    return;
  std::lock_guard<std::mutex> lock(impl_->pendingMutex);
  for (const chart::NoteEvent *n : notes)
    impl_->pending.push_back(Hit{drum_key_for(n->kind), velocity_for(n->kind)});
}

void HitsoundPlayer::silence() {
  std::lock_guard<std::mutex> lock(impl_->pendingMutex);
  impl_->pending.clear();
  impl_->silenceRequested = true;
}

int drum_key_for(chart::NoteKind kind) {
  switch (kind) {
  case chart::NoteKind::Tap:
    return 38; // acoustic snare
  case chart::NoteKind::Drag:
    return 42; // closed hi-hat
  case chart::NoteKind::Hold:
    return 36; // bass drum
  }
  return 38;
}

} // namespace audio
