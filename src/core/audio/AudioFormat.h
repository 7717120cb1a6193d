#pragma once
#include <cstdint>

// Format of the PCM a decoder delivers: interleaved float32 at the
// configured output rate. totalFrames is an estimate until the stream
// has been read to the end; 0 means unknown.
struct AudioStreamFormat {
    double   sampleRate    = 44100.0;
    int      channels      = 2;
    int64_t  totalFrames   = 0;
    double   durationSecs  = 0.0;
};
