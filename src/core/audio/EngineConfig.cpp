#include "EngineConfig.h"
#include "../Settings.h"

EngineConfig EngineConfig::fromSettings(const Settings& settings)
{
    EngineConfig c;
    c.sampleRate     = settings.sampleRate();
    c.channels       = settings.channels();
    c.bufferFrames   = settings.bufferFrames();
    c.crossfadeMs    = settings.crossfadeDurationMs();
    c.curve          = crossfadeCurveFromString(settings.crossfadeCurve());
    c.gapless        = settings.gaplessPlayback();
    c.shuffle        = settings.shuffleEnabled();
    c.repeat         = static_cast<RepeatMode>(settings.repeatMode());
    c.historyDepth   = settings.historyDepth();
    c.lookaheadFrames = int(c.msToFrames(settings.lookaheadMs()));
    c.underrunPolicy = settings.underrunPolicy() == QStringLiteral("repeat")
                       ? UnderrunPolicy::RepeatLastBlock : UnderrunPolicy::Silence;
    c.volume         = settings.volume() / 100.0f;
    return c;
}
