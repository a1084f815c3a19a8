#include "TrimmerConfig.h"
#include "Logging.h"
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QJsonValue>

static constexpr int ConfigVersion = 1;

TrimmerConfig::TrimmerConfig(QObject* parent) : QObject(parent) {}
TrimmerConfig::~TrimmerConfig() = default;

bool TrimmerConfig::save(const QString& filePath, const TrimmerSettings& settings) {
    QJsonObject root;
    root["version"] = ConfigVersion;
    root["trimmer"] = settingsToJson(settings);

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        m_error = QString("Cannot write to: %1").arg(filePath);
        qCWarning(lcConfig) << m_error;
        return false;
    }

    file.write(QJsonDocument(root).toJson());
    return true;
}

bool TrimmerConfig::load(const QString& filePath, TrimmerSettings& settings) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_error = QString("Cannot read: %1").arg(filePath);
        qCWarning(lcConfig) << m_error;
        return false;
    }

    QJsonParseError parseError;
    auto doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        m_error = QString("Invalid config format: %1").arg(parseError.errorString());
        qCWarning(lcConfig) << m_error;
        return false;
    }

    auto root = doc.object();
    int version = root["version"].toInt(ConfigVersion);
    if (version > ConfigVersion) {
        m_error = QString("Unsupported config version %1").arg(version);
        qCWarning(lcConfig) << m_error;
        return false;
    }

    settings = settingsFromJson(root["trimmer"].toObject());
    qCDebug(lcConfig) << "Loaded trimmer settings from" << filePath;
    return true;
}

QJsonObject TrimmerConfig::settingsToJson(const TrimmerSettings& settings) {
    QJsonObject obj;
    obj["handleWidth"] = settings.handleWidth;
    obj["minDuration"] = settings.minDuration;
    obj["positionBarAnimationDuration"] = settings.positionBarAnimationDuration;
    obj["positionBarWidth"] = settings.positionBarWidth;
    obj["maxDuration"] = settings.maxDuration ? QJsonValue(*settings.maxDuration)
                                              : QJsonValue(QJsonValue::Null);
    return obj;
}

TrimmerSettings TrimmerConfig::settingsFromJson(const QJsonObject& obj) {
    TrimmerSettings defaults;
    TrimmerSettings cfg;
    cfg.handleWidth = obj["handleWidth"].toDouble(defaults.handleWidth);
    cfg.minDuration = obj["minDuration"].toDouble(defaults.minDuration);
    cfg.positionBarAnimationDuration =
        obj["positionBarAnimationDuration"].toDouble(defaults.positionBarAnimationDuration);
    cfg.positionBarWidth = obj["positionBarWidth"].toDouble(defaults.positionBarWidth);
    if (obj["maxDuration"].isDouble()) {
        cfg.maxDuration = obj["maxDuration"].toDouble();
    }
    return cfg;
}
