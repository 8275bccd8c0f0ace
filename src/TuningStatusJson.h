#pragma once

#include "TuningStateMachine.h"

#include <QByteArray>
#include <QJsonObject>

QJsonObject tuningStatusToJson(const TuningStatus& status);

// Single-line JSON, no trailing newline.
QByteArray tuningStatusToJsonLine(const TuningStatus& status);

// True when two statuses would print differently apart from the timestamp.
bool tuningStatusChanged(const TuningStatus& previous, const TuningStatus& current);
