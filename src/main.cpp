#include <QByteArray>
#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QStringList>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

#include "RecordedSessionPlayer.h"
#include "RunSessionOptions.h"
#include "SessionLogger.h"
#include "TunerConfig.h"
#include "TunerConfigIO.h"
#include "TuningEngine.h"
#include "TuningStatusJson.h"

namespace {

std::string formatTimestamp() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const std::time_t nowTime = clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &nowTime);
#else
    localtime_r(&nowTime, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

struct LogFileState {
    std::mutex mutex;
    std::ofstream stream;
};

LogFileState& logFileState() {
    static LogFileState state;
    return state;
}

class ScopedSigintHandler {
public:
    explicit ScopedSigintHandler(RecordedSessionPlayer& player) {
        if (g_handlerInstalled.exchange(true))
            return;
        s_player = &player;
        s_previous = std::signal(SIGINT, &ScopedSigintHandler::handleSignal);
    }

    ~ScopedSigintHandler() {
        s_player = nullptr;
        if (g_handlerInstalled.exchange(false))
            std::signal(SIGINT, s_previous);
    }

private:
    static void handleSignal(int sig) {
        if (sig != SIGINT)
            return;
        if (s_player)
            s_player->stop();
    }

    static inline std::atomic<bool> g_handlerInstalled {false};
    static inline RecordedSessionPlayer* s_player {nullptr};
    static inline __sighandler_t s_previous {SIG_DFL};
};

void appendLogEntry(const char* level,
                    const QMessageLogContext& ctx,
                    const QByteArray& message) {
    LogFileState& state = logFileState();
    if (!state.stream.is_open())
        return;
    std::lock_guard<std::mutex> lock(state.mutex);
    state.stream << formatTimestamp() << " [" << level << "] "
                 << '(' << (ctx.file ? ctx.file : "?")
                 << ':' << ctx.line << ','
                 << (ctx.function ? ctx.function : "?")
                 << ") " << message.constData() << '\n';
    state.stream.flush();
}

void installMessageHandler(const std::filesystem::path& logFile) {
    if (!logFile.empty()) {
        auto& state = logFileState();
        std::error_code ec;
        const auto parent = logFile.parent_path();
        if (!parent.empty())
            std::filesystem::create_directories(parent, ec);
        state.stream.open(logFile, std::ios::out | std::ios::trunc);
        if (!state.stream)
            std::cerr << "Failed to open log file '" << logFile.string() << "' for writing.\n";
    }

    static const auto handler = [](QtMsgType type, const QMessageLogContext& ctx, const QString& msg) {
        QByteArray localMsg = msg.toLocal8Bit();
        const char* level = "info";
        switch (type) {
        case QtDebugMsg: level = "debug"; break;
        case QtInfoMsg: level = "info"; break;
        case QtWarningMsg: level = "warning"; break;
        case QtCriticalMsg: level = "critical"; break;
        case QtFatalMsg: level = "fatal"; break;
        }
        fprintf(stderr, "qtmsg [%s] (%s:%u,%s): %s\n",
                level,
                ctx.file ? ctx.file : "?",
                ctx.line,
                ctx.function ? ctx.function : "?",
                localMsg.constData());
        appendLogEntry(level, ctx, localMsg);
        if (type == QtFatalMsg)
            abort();
    };
    qInstallMessageHandler(handler);
}

void logRunOptions(const RunSessionOptions& options, const TunerConfig& cfg) {
    auto& logger = SessionLogger::instance();
    logger.logf("session",
                "session='%s' path='%s' extra=%zu config='%s' tick=%dms frame=%d realtime=%d everyTick=%d",
                options.sessionName.c_str(),
                options.sessionPath.c_str(),
                options.sessionSampleFiles.size(),
                options.configPath.c_str(),
                options.tickMs,
                options.frameSize,
                options.realtime ? 1 : 0,
                options.everyTick ? 1 : 0);
    logger.logf("session", "tolerance=%.2fc confirm=%dms strategy=%s",
                cfg.toleranceCents, cfg.confirmDelayMs, pitchStrategyKey(cfg.strategy));
}

std::optional<int> positiveInt(const QString& text) {
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok || value <= 0)
        return std::nullopt;
    return value;
}

bool parseRunOptions(const QCoreApplication& app, RunSessionOptions& options, QString* error) {
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Guides a six-string guitar through standard tuning from recorded takes."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("session"), QStringLiteral("WAV take or folder of takes."), QStringLiteral("<wav-or-folder>..."));

    const QCommandLineOption configOption(QStringLiteral("config"), QStringLiteral("Load tuner settings from a JSON file."), QStringLiteral("file"));
    const QCommandLineOption saveConfigOption(QStringLiteral("save-config"), QStringLiteral("Write the effective settings to a JSON file."), QStringLiteral("file"));
    const QCommandLineOption tickOption(QStringLiteral("tick-ms"), QStringLiteral("Analysis interval in milliseconds."), QStringLiteral("ms"), QStringLiteral("100"));
    const QCommandLineOption frameOption(QStringLiteral("frame-size"), QStringLiteral("Samples analysed per tick."), QStringLiteral("samples"), QStringLiteral("4096"));
    const QCommandLineOption realtimeOption(QStringLiteral("realtime"), QStringLiteral("Pace playback at recording speed."));
    const QCommandLineOption everyTickOption(QStringLiteral("every-tick"), QStringLiteral("Print a status line on every tick, not only on changes."));
    const QCommandLineOption logFileOption(QStringLiteral("log-file"), QStringLiteral("Also write Qt messages to this file."), QStringLiteral("file"));
    parser.addOptions({configOption, saveConfigOption, tickOption, frameOption, realtimeOption, everyTickOption, logFileOption});

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        *error = QStringLiteral("No recorded session given");
        return false;
    }
    options.sessionPath = positional.first().toStdString();
    for (int i = 1; i < positional.size(); ++i)
        options.sessionSampleFiles.push_back(positional[i].toStdString());
    options.sessionName = std::filesystem::path(options.sessionPath).filename().string();

    const auto tickMs = positiveInt(parser.value(tickOption));
    if (!tickMs) {
        *error = QStringLiteral("--tick-ms must be a positive integer");
        return false;
    }
    const auto frameSize = positiveInt(parser.value(frameOption));
    if (!frameSize) {
        *error = QStringLiteral("--frame-size must be a positive integer");
        return false;
    }
    options.tickMs = *tickMs;
    options.frameSize = *frameSize;
    options.realtime = parser.isSet(realtimeOption);
    options.everyTick = parser.isSet(everyTickOption);
    options.configPath = parser.value(configOption).toStdString();
    options.saveConfigPath = parser.value(saveConfigOption).toStdString();
    options.logFilePath = parser.value(logFileOption).toStdString();
    return true;
}

void printLine(const QByteArray& line) {
    std::fwrite(line.constData(), 1, static_cast<std::size_t>(line.size()), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

}

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("stringtuner"));

    RunSessionOptions runOptions;
    QString error;
    if (!parseRunOptions(app, runOptions, &error)) {
        std::cerr << "stringtuner: " << error.toStdString() << "\n";
        return 1;
    }
    installMessageHandler(runOptions.logFilePath);

    TunerConfig config = makeDefaultTunerConfig();
    if (runOptions.hasConfig()) {
        if (!loadTunerConfig(QString::fromStdString(runOptions.configPath), config, &error)) {
            qWarning().noquote() << "config" << error;
            return 1;
        }
        qInfo() << "startup" << "config-loaded" << QString::fromStdString(runOptions.configPath);
    }
    if (!runOptions.saveConfigPath.empty()) {
        if (!saveTunerConfig(QString::fromStdString(runOptions.saveConfigPath), config, &error)) {
            qWarning().noquote() << "config" << error;
            return 1;
        }
        qInfo() << "startup" << "config-saved" << QString::fromStdString(runOptions.saveConfigPath);
    }
    logRunOptions(runOptions, config);

    TuningEngine engine(config);
    RecordedSessionPlayer player(&engine);
    QObject::connect(&player, &RecordedSessionPlayer::playbackError, [](const QString& description) {
        qWarning().noquote() << "playback" << description;
    });

    std::optional<TuningStatus> lastPrinted;
    const bool everyTick = runOptions.everyTick;
    QObject::connect(&player, &RecordedSessionPlayer::statusUpdated, [&lastPrinted, everyTick](const TuningStatus& status) {
        if (!everyTick && lastPrinted && !tuningStatusChanged(*lastPrinted, status))
            return;
        printLine(tuningStatusToJsonLine(status));
        lastPrinted = status;
    });
    QObject::connect(&player, &RecordedSessionPlayer::stringConfirmed, [](int stringIndex, qint64 timeMs) {
        qInfo() << "tuner" << "confirmed" << QString::fromStdString(targetDisplayName(stringIndex)) << "at" << timeMs << "ms";
    });
    QObject::connect(&player, &RecordedSessionPlayer::sessionCompleted, []() {
        qInfo() << "tuner" << "all-strings-tuned";
    });

    if (!player.loadSession(runOptions))
        return 1;

    ScopedSigintHandler sigintGuard(player);
    qInfo() << "startup" << "playback" << player.takeFiles().size() << "takes" << player.sampleRate() << "Hz"
            << QString::number(player.durationSec(), 'f', 2) << "sec";
    if (!player.run())
        return 1;
    return 0;
}
