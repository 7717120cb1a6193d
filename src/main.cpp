#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QFileInfo>
#include <QMutex>
#include <QSocketNotifier>
#include <QTextStream>
#include <cstdio>
#include <iostream>
#include <memory>
#include <unistd.h>

#include "core/MusicData.h"
#include "core/Settings.h"
#include "core/audio/AudioDecoder.h"
#include "core/audio/EngineConfig.h"
#include "core/audio/PlaybackEngine.h"
#include "platform/NullAudioOutput.h"
#include "platform/qt/QtAudioSinkOutput.h"

static RepeatMode parseRepeat(const QString& s, RepeatMode fallback)
{
    if (s == QStringLiteral("off")) return RepeatMode::Off;
    if (s == QStringLiteral("all")) return RepeatMode::All;
    if (s == QStringLiteral("one")) return RepeatMode::One;
    return fallback;
}

static const char* repeatName(RepeatMode mode)
{
    switch (mode) {
    case RepeatMode::Off: return "off";
    case RepeatMode::All: return "all";
    case RepeatMode::One: return "one";
    }
    return "off";
}

static void printStatus(const PlaybackEngine& engine)
{
    const TrackPtr t = engine.currentTrack();
    const QueueManager& q = engine.queue();
    std::cout << "[" << (q.currentIndex() + 1) << "/" << q.size() << "] "
              << (t ? t->title.toStdString() : std::string("-"))
              << "  shuffle=" << (q.shuffleEnabled() ? "on" : "off")
              << " repeat=" << repeatName(q.repeatMode())
              << " vol=" << int(engine.volume() * 100.0f + 0.5f) << std::endl;
}

// One command per stdin line
static void handleCommand(const QString& line, PlaybackEngine& engine)
{
    const QStringList parts = line.split(QLatin1Char(' '), Qt::SkipEmptyParts);
    if (parts.isEmpty()) return;

    const QString cmd = parts.first();
    PlaybackResult result;
    Settings* settings = Settings::instance();

    if (cmd == QStringLiteral("n")) {
        result = engine.skip();
    } else if (cmd == QStringLiteral("p")) {
        result = engine.previous();
    } else if (cmd == QStringLiteral("t")) {
        result = engine.togglePlayPause();
    } else if (cmd == QStringLiteral("s") && parts.size() > 1) {
        result = engine.seekTo(parts.at(1).toDouble());
    } else if (cmd == QStringLiteral("z")) {
        engine.setShuffle(!engine.queue().shuffleEnabled());
        engine.savePreferences(*settings);
    } else if (cmd == QStringLiteral("r")) {
        engine.cycleRepeat();
        engine.savePreferences(*settings);
    } else if (cmd == QStringLiteral("+") || cmd == QStringLiteral("-")) {
        const float step = cmd == QStringLiteral("+") ? 0.05f : -0.05f;
        engine.setVolume(engine.volume() + step);
        engine.savePreferences(*settings);
    } else if (cmd == QStringLiteral("c") && parts.size() > 1) {
        engine.setCrossfadeDuration(int(parts.at(1).toDouble() * 1000.0));
        engine.savePreferences(*settings);
        std::cout << "crossfade " << engine.crossfadeDurationMs() << " ms" << std::endl;
    } else if (cmd == QStringLiteral("d") && parts.size() > 1) {
        result = engine.removeFromQueue(parts.at(1).toInt() - 1);
    } else if (cmd == QStringLiteral("m") && parts.size() > 2) {
        result = engine.reorderQueue(parts.at(1).toInt() - 1, parts.at(2).toInt() - 1);
    } else if (cmd == QStringLiteral("q")) {
        engine.stop();
        QCoreApplication::quit();
        return;
    } else {
        std::cout << "commands: n p t | s <secs> | c <secs> | z r | + - | d <n> | m <from> <to> | q" << std::endl;
        return;
    }

    if (!result.ok())
        std::cout << "! " << playbackErrorName(result.error) << ": "
                  << result.message.toStdString() << std::endl;
    printStatus(engine);
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setOrganizationName("Segue");
    app.setApplicationName("segue");
    app.setApplicationVersion(APP_VERSION);

    qInstallMessageHandler([](QtMsgType, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
        fprintf(stderr, "%s", line.toUtf8().constData());
    });

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Segue: queue-driven gapless / crossfading player"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption crossfadeOpt(QStringLiteral("crossfade"),
        QStringLiteral("Crossfade length in seconds (0-12)."), QStringLiteral("secs"));
    QCommandLineOption curveOpt(QStringLiteral("curve"),
        QStringLiteral("Crossfade curve: linear or equal-power."), QStringLiteral("curve"));
    QCommandLineOption shuffleOpt(QStringLiteral("shuffle"), QStringLiteral("Start with shuffle on."));
    QCommandLineOption repeatOpt(QStringLiteral("repeat"),
        QStringLiteral("Repeat mode: off, all or one."), QStringLiteral("mode"));
    QCommandLineOption volumeOpt(QStringLiteral("volume"),
        QStringLiteral("Volume 0-100."), QStringLiteral("level"));
    QCommandLineOption seedOpt(QStringLiteral("seed"),
        QStringLiteral("Shuffle seed for a reproducible order."), QStringLiteral("n"));
    QCommandLineOption nullOpt(QStringLiteral("null-output"),
        QStringLiteral("Render on a clock instead of the sound card."));
    parser.addOptions({crossfadeOpt, curveOpt, shuffleOpt, repeatOpt, volumeOpt, seedOpt, nullOpt});
    parser.addPositionalArgument(QStringLiteral("files"), QStringLiteral("Audio files to queue."),
                                 QStringLiteral("files..."));
    parser.process(app);

    Settings* settings = Settings::instance();
    EngineConfig config = EngineConfig::fromSettings(*settings);
    if (parser.isSet(crossfadeOpt))
        config.crossfadeMs = int(parser.value(crossfadeOpt).toDouble() * 1000.0);
    if (parser.isSet(curveOpt))
        config.curve = crossfadeCurveFromString(parser.value(curveOpt));
    if (parser.isSet(shuffleOpt))
        config.shuffle = true;
    if (parser.isSet(repeatOpt))
        config.repeat = parseRepeat(parser.value(repeatOpt), config.repeat);
    if (parser.isSet(volumeOpt))
        config.volume = parser.value(volumeOpt).toInt() / 100.0f;

    QVector<TrackPtr> tracks;
    for (const QString& arg : parser.positionalArguments()) {
        QFileInfo fi(arg);
        if (!fi.exists() || !fi.isReadable()) {
            qWarning() << "[Main] Skipping unreadable file:" << arg;
            continue;
        }
        auto t = std::make_shared<Track>();
        t->id = fi.absoluteFilePath();
        t->title = fi.completeBaseName();
        t->filePath = fi.absoluteFilePath();
        tracks.append(t);
    }
    if (tracks.isEmpty()) {
        std::cerr << "segue: no playable files given" << std::endl;
        return 1;
    }

    std::unique_ptr<IAudioOutput> output;
    if (parser.isSet(nullOpt))
        output = std::make_unique<NullAudioOutput>();
    else
        output = std::make_unique<QtAudioSinkOutput>();

    DecoderFactory factory = [](const Track&) -> std::unique_ptr<IDecoder> {
        return std::make_unique<AudioDecoder>();
    };

    PlaybackEngine engine(std::move(output), factory, config);

    // Modes given on the command line become the new defaults
    if (parser.isSet(crossfadeOpt) || parser.isSet(curveOpt) || parser.isSet(shuffleOpt)
        || parser.isSet(repeatOpt) || parser.isSet(volumeOpt))
        engine.savePreferences(*settings);

    QObject::connect(&engine, &PlaybackEngine::currentTrackChanged, [&engine](const Track&) {
        printStatus(engine);
    });
    QObject::connect(&engine, &PlaybackEngine::decodeError,
                     [](const Track& t, const QString& msg) {
        std::cout << "! cannot play " << t.title.toStdString() << ": " << msg.toStdString() << std::endl;
    });
    QObject::connect(&engine, &PlaybackEngine::bufferUnderrun, [](int total) {
        qWarning() << "[Main] Buffer underruns:" << total;
    });
    QObject::connect(&engine, &PlaybackEngine::queueExhausted, &app, &QCoreApplication::quit);
    QObject::connect(&engine, &PlaybackEngine::errorOccurred, &app, [&app](const QString& msg) {
        std::cerr << "segue: " << msg.toStdString() << std::endl;
        app.exit(2);
    });

    // Seed first so the initial shuffle is reproducible
    if (parser.isSet(seedOpt))
        engine.setRandomSeed(parser.value(seedOpt).toUInt());
    engine.setQueue(tracks);
    if (config.shuffle)
        engine.setShuffle(true);

    QSocketNotifier stdinNotifier(STDIN_FILENO, QSocketNotifier::Read);
    QObject::connect(&stdinNotifier, &QSocketNotifier::activated, [&engine, &stdinNotifier]() {
        std::string line;
        if (!std::getline(std::cin, line)) {
            stdinNotifier.setEnabled(false);
            return;
        }
        handleCommand(QString::fromStdString(line), engine);
    });

    PlaybackResult started = engine.play();
    if (!started.ok()) {
        std::cerr << "segue: " << playbackErrorName(started.error) << ": "
                  << started.message.toStdString() << std::endl;
        return 2;
    }

    return app.exec();
}
