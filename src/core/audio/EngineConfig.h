#pragma once
#include <cstdint>

#include "CrossfadeController.h"
#include "DecoderStream.h"
#include "../MusicData.h"

class Settings;

// Everything the engine needs at construction. Tests fill this in
// directly; the application maps it from Settings.
struct EngineConfig {
    int   sampleRate        = 44100;
    int   channels          = 2;
    int   bufferFrames      = 1024;

    int   crossfadeMs       = 0;
    CrossfadeCurve curve    = CrossfadeCurve::Linear;
    bool  gapless           = true;

    bool  shuffle           = false;
    RepeatMode repeat       = RepeatMode::Off;
    int   historyDepth      = 100;

    int   lookaheadFrames   = 88200;
    int   decodeBlockFrames = 1024;
    UnderrunPolicy underrunPolicy = UnderrunPolicy::Silence;
    bool  threadedDecode    = true;

    int   pollIntervalMs    = 50;   // 0: caller drives poll()
    float volume            = 0.75f;

    int64_t msToFrames(int ms) const { return int64_t(ms) * sampleRate / 1000; }

    static EngineConfig fromSettings(const Settings& settings);
};
