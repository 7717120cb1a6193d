#include "CrossfadeController.h"
#include "DecoderStream.h"

#include <QDebug>
#include <algorithm>
#include <cmath>

#ifndef M_PI_2
#define M_PI_2 1.57079632679489661923
#endif

void crossfadeGains(CrossfadeCurve curve, int64_t elapsed, int64_t total,
                    float& outGain, float& inGain)
{
    if (total <= 0) {
        outGain = 0.0f;
        inGain = 1.0f;
        return;
    }
    double t = std::clamp(double(elapsed) / double(total), 0.0, 1.0);

    switch (curve) {
    case CrossfadeCurve::EqualPower:
        outGain = float(std::cos(t * M_PI_2));
        inGain  = float(std::sin(t * M_PI_2));
        break;
    case CrossfadeCurve::Linear:
    default:
        inGain  = float(t);
        outGain = 1.0f - inGain;
        break;
    }
}

CrossfadeCurve crossfadeCurveFromString(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("equalpower") || n == QStringLiteral("equal-power"))
        return CrossfadeCurve::EqualPower;
    return CrossfadeCurve::Linear;
}

QString crossfadeCurveName(CrossfadeCurve curve)
{
    return curve == CrossfadeCurve::EqualPower ? QStringLiteral("equalPower")
                                               : QStringLiteral("linear");
}

CrossfadeController::CrossfadeController() = default;
CrossfadeController::~CrossfadeController() = default;

void CrossfadeController::preallocate(int channels, int maxFrames)
{
    m_channels = std::max(1, channels);
    m_incomingBuf.assign(size_t(std::max(1, maxFrames)) * m_channels, 0.0f);
}

// ── Audio thread (caller holds the session lock) ─────────────────────

void CrossfadeController::begin(std::unique_ptr<DecoderStream> outgoing,
                                std::unique_ptr<DecoderStream> incoming,
                                int64_t durationFrames)
{
    m_outgoing = std::move(outgoing);
    m_incoming = std::move(incoming);
    m_startPosition = m_outgoing ? m_outgoing->position() : 0;
    m_totalFrames = std::max<int64_t>(1, durationFrames);
    m_elapsedFrames = 0;
}

CrossfadeController::MixResult CrossfadeController::mix(float* out, int frames)
{
    MixResult r;
    if (!isActive() || frames <= 0) return r;

    const int capacity = m_channels > 0 ? int(m_incomingBuf.size()) / m_channels : 0;
    int n = int(std::min<int64_t>({int64_t(frames), int64_t(capacity),
                                   m_totalFrames - m_elapsedFrames}));
    if (n <= 0) {
        r.completed = true;
        return r;
    }

    // Outgoing at full scale straight into out
    DecoderStream::ReadResult o = m_outgoing->read(out, n);
    r.underrun = o.padded > 0;
    if (o.endOfStream || o.failed) {
        // Boundary reached early: whatever outgoing delivered is the rest of the window
        n = o.frames + o.padded;
        r.outgoingFailed = o.failed;
        r.completed = true;
        if (n == 0) return r;
    }

    DecoderStream::ReadResult i = m_incoming->read(m_incomingBuf.data(), n);
    r.underrun = r.underrun || i.padded > 0;
    if (i.failed) {
        r.incomingFailed = true;
        r.frames = n;
        return r;
    }

    const float* in = m_incomingBuf.data();
    const int ch = m_channels;
    for (int f = 0; f < n; ++f) {
        float go, gi;
        crossfadeGains(m_curve, m_elapsedFrames + f, m_totalFrames, go, gi);
        for (int c = 0; c < ch; ++c) {
            const size_t s = size_t(f) * ch + c;
            out[s] = out[s] * go + in[s] * gi;
        }
    }

    m_elapsedFrames += n;
    r.frames = n;
    if (m_elapsedFrames >= m_totalFrames)
        r.completed = true;
    return r;
}

CrossfadeController::Handover CrossfadeController::finish()
{
    Handover h;
    h.kept = std::move(m_incoming);
    h.dropped = std::move(m_outgoing);
    if (h.dropped) h.dropped->requestStop();
    reset();
    return h;
}

CrossfadeController::Handover CrossfadeController::abortKeepingOutgoing()
{
    Handover h;
    h.kept = std::move(m_outgoing);
    h.dropped = std::move(m_incoming);
    if (h.dropped) h.dropped->requestStop();
    reset();
    return h;
}

void CrossfadeController::reset()
{
    m_outgoing.reset();
    m_incoming.reset();
    m_startPosition = 0;
    m_totalFrames = 0;
    m_elapsedFrames = 0;
}
