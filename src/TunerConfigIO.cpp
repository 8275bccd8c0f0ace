#include "TunerConfigIO.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>
#include <QSaveFile>
#include <QDebug>

#include <cmath>
#include <optional>
#include <string>

namespace {

constexpr const char* kStrategyKey = "pitchStrategy";
constexpr const char* kNoteMatchKey = "requireNoteMatch";

bool fail(QString* error, const QString& message) {
    if (error)
        *error = message;
    return false;
}

}

QJsonObject tunerConfigToJson(const TunerConfig& cfg) {
    QJsonObject obj;
    for (const auto& desc : parameterDescriptors()) {
        const QString key = QString::fromStdString(desc.key);
        if (desc.id == TunerParameter::ConfirmDelayMs)
            obj.insert(key, cfg.confirmDelayMs);
        else
            obj.insert(key, parameterValue(cfg, desc.id));
    }
    obj.insert(QLatin1String(kStrategyKey), QString::fromUtf8(pitchStrategyKey(cfg.strategy)));
    obj.insert(QLatin1String(kNoteMatchKey), cfg.requireNoteMatch);
    return obj;
}

bool tunerConfigFromJson(const QJsonObject& obj, TunerConfig& cfg, QString* error) {
    TunerConfig next = cfg;

    for (const auto& desc : parameterDescriptors()) {
        const QString key = QString::fromStdString(desc.key);
        if (!obj.contains(key))
            continue;
        const QJsonValue value = obj.value(key);
        if (!value.isDouble())
            return fail(error, QStringLiteral("'%1' must be a number").arg(key));
        const double number = value.toDouble();
        if (!std::isfinite(number) || number < desc.minValue || number > desc.maxValue) {
            return fail(error, QStringLiteral("'%1'=%2 is outside [%3, %4]")
                                   .arg(key)
                                   .arg(number)
                                   .arg(desc.minValue)
                                   .arg(desc.maxValue));
        }
        setParameterValue(next, desc.id, number);
    }

    if (obj.contains(QLatin1String(kStrategyKey))) {
        const QJsonValue value = obj.value(QLatin1String(kStrategyKey));
        std::optional<PitchStrategy> strategy;
        if (value.isString())
            strategy = pitchStrategyFromKey(value.toString().toStdString());
        if (!strategy)
            return fail(error, QStringLiteral("'%1' must be \"autocorrelation\" or \"hybrid\"").arg(QLatin1String(kStrategyKey)));
        next.strategy = *strategy;
    }

    if (obj.contains(QLatin1String(kNoteMatchKey))) {
        const QJsonValue value = obj.value(QLatin1String(kNoteMatchKey));
        if (!value.isBool())
            return fail(error, QStringLiteral("'%1' must be true or false").arg(QLatin1String(kNoteMatchKey)));
        next.requireNoteMatch = value.toBool();
    }

    std::string validation;
    if (!validateTunerConfig(next, &validation))
        return fail(error, QString::fromStdString(validation));

    cfg = next;
    return true;
}

bool loadTunerConfig(const QString& path, TunerConfig& cfg, QString* error) {
    QFile file(path);
    if (!file.exists())
        return fail(error, QStringLiteral("Config file '%1' not found").arg(path));
    if (!file.open(QIODevice::ReadOnly))
        return fail(error, QStringLiteral("Unable to open config '%1': %2").arg(path, file.errorString()));

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, QStringLiteral("Invalid JSON in '%1': %2").arg(path, parseError.errorString()));
    if (!doc.isObject())
        return fail(error, QStringLiteral("Config '%1' must contain a JSON object").arg(path));

    QString reason;
    if (!tunerConfigFromJson(doc.object(), cfg, &reason))
        return fail(error, QStringLiteral("Config '%1': %2").arg(path, reason));
    return true;
}

bool saveTunerConfig(const QString& path, const TunerConfig& cfg, QString* error) {
    const QFileInfo info(path);
    QDir dir = info.absoluteDir();
    if (!dir.exists() && !dir.mkpath(QStringLiteral(".")))
        return fail(error, QStringLiteral("Unable to create '%1'").arg(dir.absolutePath()));

    QSaveFile file(info.absoluteFilePath());
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        qWarning() << "config" << "save-open-failed" << file.fileName();
        return fail(error, QStringLiteral("Unable to write '%1': %2").arg(path, file.errorString()));
    }
    file.write(QJsonDocument(tunerConfigToJson(cfg)).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        qWarning() << "config" << "save-commit-failed" << file.fileName();
        return fail(error, QStringLiteral("Unable to commit '%1': %2").arg(path, file.errorString()));
    }
    return true;
}
