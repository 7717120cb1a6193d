#pragma once

#include <cstdint>
#include <memory>
#include <vector>
#include <QString>

class DecoderStream;

enum class CrossfadeCurve { Linear, EqualPower };

// Gains at `elapsed` frames into a window of `total` frames.
// Linear: out + in == 1. EqualPower: out^2 + in^2 == 1.
void crossfadeGains(CrossfadeCurve curve, int64_t elapsed, int64_t total,
                    float& outGain, float& inGain);

CrossfadeCurve crossfadeCurveFromString(const QString& name);
QString crossfadeCurveName(CrossfadeCurve curve);

// Owns the two streams of an in-flight transition and mixes them.
//
// Thread safety: every method assumes the caller holds the session
// lock (the render callback via try_lock, commands via lock). Nothing
// here joins threads or frees decoders; released streams are handed
// back to the caller, which retires them off the render thread.
class CrossfadeController {
public:
    struct MixResult {
        int  frames = 0;            // frames written to out
        bool completed = false;     // window done; call finish()
        bool outgoingFailed = false;
        bool incomingFailed = false;  // out holds outgoing only; call abortKeepingOutgoing()
        bool underrun = false;        // either side padded by its underrun policy
    };

    struct Handover {
        std::unique_ptr<DecoderStream> kept;
        std::unique_ptr<DecoderStream> dropped;
    };

    CrossfadeController();
    ~CrossfadeController();

    void setCurve(CrossfadeCurve curve) { m_curve = curve; }
    CrossfadeCurve curve() const { return m_curve; }

    // Pre-allocate the incoming scratch buffer (control thread)
    void preallocate(int channels, int maxFrames);

    bool isActive() const { return m_outgoing != nullptr; }

    void begin(std::unique_ptr<DecoderStream> outgoing,
               std::unique_ptr<DecoderStream> incoming,
               int64_t durationFrames);

    // May write fewer than `frames`; the caller loops.
    MixResult mix(float* out, int frames);

    // Incoming becomes current; outgoing is dropped.
    Handover finish();
    // Outgoing stays at full gain; incoming is dropped.
    Handover abortKeepingOutgoing();

    DecoderStream* outgoing() const { return m_outgoing.get(); }
    DecoderStream* incoming() const { return m_incoming.get(); }
    int64_t startPosition() const { return m_startPosition; }
    int64_t durationFrames() const { return m_totalFrames; }
    int64_t elapsedFrames() const { return m_elapsedFrames; }

private:
    void reset();

    CrossfadeCurve m_curve = CrossfadeCurve::Linear;

    std::unique_ptr<DecoderStream> m_outgoing;
    std::unique_ptr<DecoderStream> m_incoming;
    int64_t m_startPosition = 0;
    int64_t m_totalFrames = 0;
    int64_t m_elapsedFrames = 0;

    int m_channels = 2;
    std::vector<float> m_incomingBuf;
};
