#include "TuningStatusJson.h"

#include <QJsonDocument>
#include <QJsonValue>
#include <QString>

#include <cmath>

namespace {
// Readout precision: 0.01 Hz / 0.01 cents.
double rounded(double value) {
  return std::round(value * 100.0) / 100.0;
}

QJsonValue optionalNumber(const std::optional<double>& value) {
  if (!value)
    return QJsonValue(QJsonValue::Null);
  return QJsonValue(rounded(*value));
}
} // namespace

QJsonObject tuningStatusToJson(const TuningStatus& status) {
  QJsonObject obj;
  obj.insert("string", QString::fromUtf8(status.target.label));
  obj.insert("stringNumber", status.target.stringNumber);
  obj.insert("note", QString::fromUtf8(status.target.note));
  obj.insert("targetHz", status.target.frequencyHz);
  obj.insert("phase", QString::fromUtf8(tuningPhaseKey(status.phase)));
  obj.insert("frequencyHz", optionalNumber(status.smoothedHz));
  obj.insert("cents", optionalNumber(status.cents));
  obj.insert("detectedNote", QString::fromStdString(status.detectedNote));
  obj.insert("inTolerance", status.inTolerance);
  obj.insert("confirmed", status.confirmedThisTick);
  if (status.confirmedStringIndex)
    obj.insert("confirmedString", *status.confirmedStringIndex);
  else
    obj.insert("confirmedString", QJsonValue(QJsonValue::Null));
  obj.insert("complete", status.sessionComplete);
  obj.insert("needle", rounded(status.needlePosition));
  obj.insert("timeMs", static_cast<qint64>(status.time.count()));
  return obj;
}

QByteArray tuningStatusToJsonLine(const TuningStatus& status) {
  return QJsonDocument(tuningStatusToJson(status)).toJson(QJsonDocument::Compact);
}

bool tuningStatusChanged(const TuningStatus& previous, const TuningStatus& current) {
  QJsonObject a = tuningStatusToJson(previous);
  QJsonObject b = tuningStatusToJson(current);
  a.remove("timeMs");
  b.remove("timeMs");
  return a != b;
}
