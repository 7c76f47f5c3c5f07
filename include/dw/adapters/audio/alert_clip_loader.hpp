// File: include/dw/adapters/audio/alert_clip_loader.hpp
#pragma once

#include <string>

#include "dw/core/status.hpp"
#include "dw/core/types.hpp"

namespace dw {

// Decodes any container/codec libavformat understands (mp3, wav, ogg, ...) into mono s16 at
// `sample_rate`, keeping only the first `max_duration_s` seconds.
//
// kNotFound when the file does not exist, kCorruptData when it has no audio stream or decodes
// to nothing.
Result<AudioClip> load_alert_clip(const std::string& path, double max_duration_s, int sample_rate = 48000);

}  // namespace dw
