#pragma once

#include <QMainWindow>
#include <QString>
#include <memory>
#include "MediaTime.h"

class TrimmerWidget;
class MediaProbe;
class QLabel;

class MainWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit MainWindow(QWidget* parent = nullptr);
    ~MainWindow();

    void loadSettings(const QString& configPath);

private slots:
    void onMediaSelected(const QString& path);
    void onLimitDuration();
    void onMarkSelection();
    void onClearMarks();
    void onPositionChanged(const MediaTime& time);
    void onPositionSettled(const MediaTime& time);

private:
    void setupUi();
    void setupMenuBar();
    void connectSignals();
    void updateRangeLabel();

    TrimmerWidget* m_trimmerWidget = nullptr;
    QLabel* m_rangeLabel = nullptr;
    std::unique_ptr<MediaProbe> m_probe;
};
