#pragma once

#include "TunerConfig.h"

#include <QJsonObject>
#include <QString>

QJsonObject tunerConfigToJson(const TunerConfig& cfg);

// Overlays the keys present in obj onto cfg. Unknown keys are ignored; a value of the
// wrong type or outside its descriptor range fails with a message naming the key.
bool tunerConfigFromJson(const QJsonObject& obj, TunerConfig& cfg, QString* error = nullptr);

bool loadTunerConfig(const QString& path, TunerConfig& cfg, QString* error = nullptr);
bool saveTunerConfig(const QString& path, const TunerConfig& cfg, QString* error = nullptr);
