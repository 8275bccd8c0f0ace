#pragma once

#include <QObject>
#include <QString>
#include <QStringList>
#include <atomic>
#include <vector>

#include <sndfile.h>

#include "TuningStateMachine.h"

class TuningEngine;
struct RunSessionOptions;

// Replays recorded takes through a TuningEngine, one frame per tick, the way a live
// capture host would. Takes are concatenated into a single mono timeline.
class RecordedSessionPlayer : public QObject {
    Q_OBJECT
public:
    explicit RecordedSessionPlayer(TuningEngine* engine, QObject* parent = nullptr);
    ~RecordedSessionPlayer() override;

    bool loadSession(const RunSessionOptions& options);
    bool isReady() const noexcept { return m_ready; }

    // Blocks until the takes run out, every string is confirmed or stop() is called.
    // False when a tick fails.
    bool run();
    // Safe from any thread; observed between ticks.
    void stop();

    int sampleRate() const noexcept { return m_sampleRate; }
    const QStringList& takeFiles() const noexcept { return m_takeFiles; }
    double durationSec() const noexcept;
    double positionSec() const noexcept;

signals:
    void statusUpdated(const TuningStatus& status);
    void stringConfirmed(int stringIndex, qint64 timeMs);
    void sessionCompleted();
    void playbackProgress(double positionSec, double durationSec);
    void playbackFinished();
    void playbackError(const QString& description);

private:
    QStringList resolveTakeFiles(const RunSessionOptions& options, QString* error) const;
    QStringList takesInFolder(const QString& folder, QString* error) const;
    bool appendTake(const QString& filePath);
    void paceTo(sf_count_t framePosition, qint64 startedMs) const;

    TuningEngine* m_engine {nullptr};
    std::vector<float> m_samples;
    QStringList m_takeFiles;
    int m_sampleRate {0};
    int m_tickMs {100};
    int m_frameSize {4096};
    bool m_realtime {false};
    std::atomic<bool> m_abort {false};
    std::atomic<sf_count_t> m_positionFrames {0};
    bool m_ready {false};
    bool m_debugLogging {false};
};
