#pragma once

#include <QObject>
#include <QString>
#include <QJsonObject>
#include "TrimmerSettings.h"

class TrimmerConfig : public QObject {
    Q_OBJECT
public:
    explicit TrimmerConfig(QObject* parent = nullptr);
    ~TrimmerConfig();

    bool save(const QString& filePath, const TrimmerSettings& settings);
    bool load(const QString& filePath, TrimmerSettings& settings);

    static QJsonObject settingsToJson(const TrimmerSettings& settings);
    static TrimmerSettings settingsFromJson(const QJsonObject& obj);

    QString errorString() const { return m_error; }

private:
    QString m_error;
};
