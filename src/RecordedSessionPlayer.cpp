#include "RecordedSessionPlayer.h"

#include "RunSessionOptions.h"
#include "SessionLogger.h"
#include "TuningEngine.h"
#include "util.h"

#include <QDir>
#include <QElapsedTimer>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSet>
#include <QThread>
#include <QtGlobal>
#include <QDebug>
#include <algorithm>
#include <string>

namespace {
const QStringList kWavFilters {QStringLiteral("*.wav"), QStringLiteral("*.WAV")};

// Monotonic clock shared by every player in the process; only differences are used.
qint64 monotonicMs() {
    static QElapsedTimer timer;
    if (!timer.isValid())
        timer.start();
    return timer.elapsed();
}
}

RecordedSessionPlayer::RecordedSessionPlayer(TuningEngine* engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine) {
    m_debugLogging = qEnvironmentVariableIsSet("STRINGTUNER_TEST_LOG_TICKS");
    if (m_debugLogging)
        qInfo() << "RecordedPlayer" << "debug-logging" << "enabled";
}

RecordedSessionPlayer::~RecordedSessionPlayer() {
    stop();
}

double RecordedSessionPlayer::durationSec() const noexcept {
    if (m_sampleRate <= 0 || m_samples.empty())
        return 0.0;
    return static_cast<double>(m_samples.size()) / static_cast<double>(m_sampleRate);
}

double RecordedSessionPlayer::positionSec() const noexcept {
    const sf_count_t frames = m_positionFrames.load(std::memory_order_acquire);
    if (m_sampleRate <= 0 || frames <= 0)
        return 0.0;
    return static_cast<double>(frames) / static_cast<double>(m_sampleRate);
}

bool RecordedSessionPlayer::loadSession(const RunSessionOptions& options) {
    m_ready = false;
    m_samples.clear();
    m_takeFiles.clear();
    m_sampleRate = 0;
    m_positionFrames.store(0, std::memory_order_release);

    if (!m_engine) {
        emit playbackError(QStringLiteral("No tuning engine attached to the player"));
        return false;
    }
    if (options.tickMs <= 0 || options.frameSize <= 0) {
        emit playbackError(QStringLiteral("Tick (%1 ms) and frame size (%2) must be positive")
                               .arg(options.tickMs)
                               .arg(options.frameSize));
        return false;
    }
    m_tickMs = options.tickMs;
    m_frameSize = options.frameSize;
    m_realtime = options.realtime;

    QString error;
    const QStringList files = resolveTakeFiles(options, &error);
    if (files.isEmpty()) {
        emit playbackError(error.isEmpty() ? QStringLiteral("Recorded session has no WAV takes") : error);
        return false;
    }

    for (const QString& file : files) {
        if (!appendTake(file)) {
            m_samples.clear();
            m_takeFiles.clear();
            m_sampleRate = 0;
            return false;
        }
    }

    m_ready = (m_sampleRate > 0 && !m_samples.empty());
    if (!m_ready) {
        emit playbackError(QStringLiteral("Recorded session has no audio data"));
        return false;
    }

    SessionLogger::instance().logf("player", "loaded takes=%d sr=%d frames=%zu tick=%dms frame=%d",
                                   static_cast<int>(m_takeFiles.size()),
                                   m_sampleRate,
                                   m_samples.size(),
                                   m_tickMs,
                                   m_frameSize);
    if (m_debugLogging)
        qInfo() << "RecordedPlayer" << "loaded" << "sr" << m_sampleRate << "frames" << m_samples.size();
    return true;
}

QStringList RecordedSessionPlayer::resolveTakeFiles(const RunSessionOptions& options, QString* error) const {
    QStringList inputs;
    if (!options.sessionPath.empty())
        inputs.append(QString::fromStdString(options.sessionPath));
    for (const std::string& extra : options.sessionSampleFiles)
        inputs.append(QString::fromStdString(extra));

    if (inputs.isEmpty()) {
        if (error)
            *error = QStringLiteral("Recorded session path is empty");
        return {};
    }

    QStringList resolved;
    QSet<QString> used;
    for (const QString& input : inputs) {
        const QFileInfo info(input);
        QStringList candidates;
        if (info.isDir()) {
            candidates = takesInFolder(info.absoluteFilePath(), error);
            if (candidates.isEmpty())
                return {};
        } else if (info.isFile()) {
            candidates.append(info.absoluteFilePath());
        } else {
            if (error)
                *error = QStringLiteral("Recorded session '%1' not found").arg(input);
            return {};
        }

        for (const QString& candidate : candidates) {
            if (used.contains(candidate)) {
                if (error)
                    *error = QStringLiteral("Duplicate WAV take '%1'").arg(candidate);
                return {};
            }
            used.insert(candidate);
            resolved.append(candidate);
        }
    }
    return resolved;
}

QStringList RecordedSessionPlayer::takesInFolder(const QString& folder, QString* error) const {
    QDir dir(folder);
    QFile metadataFile(dir.filePath(QStringLiteral("metadata.json")));
    if (metadataFile.exists()) {
        if (!metadataFile.open(QIODevice::ReadOnly)) {
            if (error)
                *error = QStringLiteral("Unable to read '%1'").arg(metadataFile.fileName());
            return {};
        }
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(metadataFile.readAll(), &parseError);
        metadataFile.close();
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            if (error)
                *error = QStringLiteral("Invalid metadata.json in '%1'").arg(folder);
            return {};
        }
        const QJsonValue takesValue = doc.object().value(QStringLiteral("takes"));
        if (takesValue.isArray()) {
            QStringList takes;
            for (const QJsonValue& value : takesValue.toArray()) {
                const QString name = value.toString().trimmed();
                const QString path = dir.filePath(name);
                if (name.isEmpty() || !QFileInfo(path).isFile()) {
                    if (error)
                        *error = QStringLiteral("metadata.json lists missing take '%1'").arg(name);
                    return {};
                }
                takes.append(QFileInfo(path).absoluteFilePath());
            }
            if (!takes.isEmpty())
                return takes;
        }
    }

    QStringList takes;
    const QStringList wavFiles = dir.entryList(kWavFilters, QDir::Files, QDir::Name);
    for (const QString& name : wavFiles)
        takes.append(QFileInfo(dir.filePath(name)).absoluteFilePath());
    if (takes.isEmpty() && error)
        *error = QStringLiteral("No WAV takes in '%1'").arg(folder);
    return takes;
}

bool RecordedSessionPlayer::appendTake(const QString& filePath) {
    std::vector<float> take;
    float sr = 0.f;
    const QByteArray encoded = QFile::encodeName(filePath);
    if (!loadWavMono(encoded.toStdString(), take, sr)) {
        emit playbackError(QStringLiteral("Unable to open '%1' for playback").arg(filePath));
        return false;
    }

    const int takeRate = static_cast<int>(sr);
    if (m_sampleRate == 0) {
        m_sampleRate = takeRate;
    } else if (takeRate != m_sampleRate) {
        emit playbackError(QStringLiteral("Sample rate mismatch in '%1' (%2 Hz, session is %3 Hz)")
                               .arg(filePath)
                               .arg(takeRate)
                               .arg(m_sampleRate));
        return false;
    }

    SessionLogger::instance().logf("player", "take '%s' frames=%zu sr=%d",
                                   encoded.constData(), take.size(), takeRate);
    m_samples.insert(m_samples.end(), take.begin(), take.end());
    m_takeFiles.append(filePath);
    return true;
}

void RecordedSessionPlayer::paceTo(sf_count_t framePosition, qint64 startedMs) const {
    const qint64 dueMs = startedMs + static_cast<qint64>(framePosition) * 1000 / m_sampleRate;
    const qint64 waitMs = dueMs - monotonicMs();
    if (waitMs > 0)
        QThread::msleep(static_cast<unsigned long>(waitMs));
}

bool RecordedSessionPlayer::run() {
    if (!m_ready) {
        emit playbackError(QStringLiteral("No recorded session loaded"));
        return false;
    }

    m_abort.store(false, std::memory_order_release);
    m_positionFrames.store(0, std::memory_order_release);
    m_engine->reset();

    const sf_count_t total = static_cast<sf_count_t>(m_samples.size());
    const sf_count_t hop = std::max<sf_count_t>(1, static_cast<sf_count_t>(m_sampleRate) * m_tickMs / 1000);
    const qint64 startedMs = monotonicMs();
    SessionLogger::instance().logf("player", "run hop=%lld frames=%lld realtime=%d",
                                   static_cast<long long>(hop),
                                   static_cast<long long>(total),
                                   m_realtime ? 1 : 0);

    bool completed = false;
    for (sf_count_t end = std::min(hop, total); end > 0; end = std::min(end + hop, total)) {
        if (m_abort.load(std::memory_order_acquire))
            break;
        if (m_realtime)
            paceTo(end, startedMs);

        // The analyser sees the most recent frameSize samples, fewer at the very start.
        const sf_count_t begin = std::max<sf_count_t>(0, end - m_frameSize);
        const TickTime now(static_cast<TickTime::rep>(end * 1000 / m_sampleRate));
        TuningStatus status;
        std::string error;
        if (!m_engine->processTick(m_samples.data() + begin, static_cast<int>(end - begin),
                                   m_sampleRate, now, status, &error)) {
            qWarning() << "RecordedPlayer" << "tick-failed" << QString::fromStdString(error);
            emit playbackError(QString::fromStdString(error));
            return false;
        }

        m_positionFrames.store(end, std::memory_order_release);
        emit statusUpdated(status);
        if (status.confirmedThisTick && status.confirmedStringIndex)
            emit stringConfirmed(*status.confirmedStringIndex, static_cast<qint64>(now.count()));
        emit playbackProgress(positionSec(), durationSec());

        if (m_debugLogging) {
            qInfo() << "RecordedPlayer" << "tick" << now.count()
                    << "hz" << (status.smoothedHz ? *status.smoothedHz : 0.0)
                    << "phase" << tuningPhaseKey(status.phase);
        }

        if (status.sessionComplete) {
            completed = true;
            emit sessionCompleted();
            break;
        }
        if (end >= total)
            break;
    }

    SessionLogger::instance().logf("player", "finished position=%.3fs complete=%d aborted=%d",
                                   positionSec(),
                                   completed ? 1 : 0,
                                   m_abort.load(std::memory_order_acquire) ? 1 : 0);
    emit playbackFinished();
    return true;
}

void RecordedSessionPlayer::stop() {
    m_abort.store(true, std::memory_order_release);
}
