#include "MainWindow.h"
#include "AppConstants.h"
#include "TrimmerWidget.h"
#include "TrimmerController.h"
#include "TrimmerConfig.h"
#include "MediaProbe.h"
#include "TimeUtil.h"
#include "Logging.h"

#include <QMenuBar>
#include <QMenu>
#include <QAction>
#include <QStatusBar>
#include <QFileDialog>
#include <QFileInfo>
#include <QInputDialog>
#include <QMessageBox>
#include <QLabel>
#include <QVBoxLayout>

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_probe(std::make_unique<MediaProbe>())
{
    setWindowTitle(QString("%1 v%2").arg(AppConstants::AppName, AppConstants::AppVersion));
    resize(AppConstants::DefaultWindowWidth, AppConstants::DefaultWindowHeight);

    setupUi();
    setupMenuBar();
    connectSignals();

    statusBar()->showMessage("Open a video to start trimming");
}

MainWindow::~MainWindow() = default;

void MainWindow::loadSettings(const QString& configPath) {
    if (!QFileInfo::exists(configPath)) return;

    TrimmerConfig config;
    TrimmerSettings settings;
    if (!config.load(configPath, settings)) {
        statusBar()->showMessage(config.errorString());
        return;
    }
    m_trimmerWidget->controller()->setSettings(settings);
}

void MainWindow::setupUi() {
    auto* central = new QWidget(this);
    auto* layout = new QVBoxLayout(central);

    m_trimmerWidget = new TrimmerWidget(central);
    m_trimmerWidget->setMinimumHeight(70);
    m_rangeLabel = new QLabel(central);

    layout->addWidget(m_trimmerWidget);
    layout->addWidget(m_rangeLabel);
    layout->addStretch();
    setCentralWidget(central);

    updateRangeLabel();
}

void MainWindow::setupMenuBar() {
    auto* fileMenu = menuBar()->addMenu("&File");

    auto* openVideoAction = fileMenu->addAction("Open &Video...");
    connect(openVideoAction, &QAction::triggered, this, [this]() {
        QString path = QFileDialog::getOpenFileName(this, "Open Video File", {},
            "Video Files (*.mp4 *.avi *.mkv *.mov *.wmv);;All Files (*)");
        if (!path.isEmpty()) onMediaSelected(path);
    });

    fileMenu->addSeparator();

    auto* exitAction = fileMenu->addAction("E&xit");
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    auto* editMenu = menuBar()->addMenu("&Edit");
    auto* limitAction = editMenu->addAction("&Limit Duration...");
    connect(limitAction, &QAction::triggered, this, &MainWindow::onLimitDuration);
    auto* markAction = editMenu->addAction("&Mark Selection");
    connect(markAction, &QAction::triggered, this, &MainWindow::onMarkSelection);
    auto* clearMarksAction = editMenu->addAction("&Clear Marks");
    connect(clearMarksAction, &QAction::triggered, this, &MainWindow::onClearMarks);

    auto* viewMenu = menuBar()->addMenu("&View");
    auto addToggle = [this, viewMenu](const QString& text, auto setter) {
        QAction* action = viewMenu->addAction(text);
        action->setCheckable(true);
        action->setChecked(true);
        connect(action, &QAction::toggled, this, [this, setter](bool visible) {
            (m_trimmerWidget->*setter)(!visible);
        });
    };
    addToggle("Trim &Handles", &TrimmerWidget::setHandlesHidden);
    addToggle("&Marks", &TrimmerWidget::setMarksHidden);
    addToggle("&Position Bar", &TrimmerWidget::setPositionBarHidden);

    auto* helpMenu = menuBar()->addMenu("&Help");
    auto* aboutAction = helpMenu->addAction("&About");
    connect(aboutAction, &QAction::triggered, this, [this]() {
        QMessageBox::about(this, "About ClipTrimmer",
            QString("<h3>ClipTrimmer v%1</h3>"
                    "<p>Select a trimmed range of a video clip.</p>")
            .arg(AppConstants::AppVersion));
    });
}

void MainWindow::connectSignals() {
    TrimmerController* controller = m_trimmerWidget->controller();
    connect(controller, &TrimmerController::positionChanged, this, &MainWindow::onPositionChanged);
    connect(controller, &TrimmerController::positionSettled, this, &MainWindow::onPositionSettled);
    connect(controller, &TrimmerController::boundsChanged, this, &MainWindow::updateRangeLabel);
}

// --- Slots ---

void MainWindow::onMediaSelected(const QString& path) {
    if (!m_probe->probe(path)) {
        QMessageBox::warning(this, "Open Video", m_probe->errorString());
        return;
    }

    const AssetInfo& info = m_probe->info();
    m_trimmerWidget->setAsset(info);

    QString details = QString("%1, %2").arg(info.containerFormat,
                                            TimeUtil::secondsToHMS(info.durationSeconds()));
    if (info.hasVideo) {
        details += QString(", %1x%2 @ %3 fps %4")
            .arg(info.videoWidth)
            .arg(info.videoHeight)
            .arg(info.videoFps, 0, 'f', 2)
            .arg(info.videoCodec);
    }
    if (!info.hasAudio) {
        details += ", no audio";
    }
    statusBar()->showMessage(QString("Loaded %1 (%2)").arg(QFileInfo(path).fileName(), details));
}

void MainWindow::onLimitDuration() {
    TrimmerController* controller = m_trimmerWidget->controller();
    bool ok = false;
    double current = controller->maxDuration().value_or(0.0);
    double seconds = QInputDialog::getDouble(this, "Limit Duration",
        "Maximum selected duration in seconds (0 = no limit):",
        current, 0.0, 86400.0, 2, &ok);
    if (!ok) return;

    if (seconds <= 0.0) {
        controller->clearMaxDuration();
        statusBar()->showMessage("Duration limit removed");
    } else if (!controller->setMaxDuration(seconds)) {
        statusBar()->showMessage(QString("Limit must be at least %1 s")
            .arg(controller->settings().minDuration));
    }
}

void MainWindow::onMarkSelection() {
    TrimmerController* controller = m_trimmerWidget->controller();
    auto start = controller->startTime();
    auto end = controller->endTime();
    if (!start || !end) return;
    controller->setMarkedTime(start->seconds(), end->seconds());
}

void MainWindow::onClearMarks() {
    m_trimmerWidget->controller()->setMarkedTime(0.0, 0.0);
}

void MainWindow::onPositionChanged(const MediaTime& time) {
    statusBar()->showMessage(QString("Position %1").arg(TimeUtil::secondsToHMS(time.seconds())));
}

void MainWindow::onPositionSettled(const MediaTime& time) {
    statusBar()->showMessage(QString("Position %1 (settled)").arg(TimeUtil::secondsToHMS(time.seconds())));
    updateRangeLabel();
}

void MainWindow::updateRangeLabel() {
    TrimmerController* controller = m_trimmerWidget->controller();
    m_rangeLabel->setText(QString("Trim %1 - %2    Marks %3 - %4")
        .arg(TimeUtil::formatTime(controller->startTime()),
             TimeUtil::formatTime(controller->endTime()),
             TimeUtil::formatTime(controller->startMarkTime()),
             TimeUtil::formatTime(controller->endMarkTime())));
}
