#pragma once

#include <QObject>
#include <QString>
#include "MediaTime.h"

struct AssetInfo {
    QString filePath;
    QString containerFormat;
    MediaTime duration{0, MediaTime::DefaultTimescale};
    int videoWidth = 0;
    int videoHeight = 0;
    double videoFps = 0.0;
    QString videoCodec;
    bool hasVideo = false;
    bool hasAudio = false;

    double durationSeconds() const { return duration.seconds(); }
};

// Reads the container and stream headers of a media file, enough to drive
// the trimmer: duration with its native timescale and basic video format.
class MediaProbe : public QObject {
    Q_OBJECT
public:
    explicit MediaProbe(QObject* parent = nullptr);
    ~MediaProbe();

    bool probe(const QString& filePath);
    const AssetInfo& info() const { return m_info; }
    QString errorString() const { return m_error; }

private:
    AssetInfo m_info;
    QString m_error;
};
