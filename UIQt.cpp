#include "UIQt.hpp"
#include "DeviceActions.hpp"
#include <QtWidgets/QApplication>
#include <QtWidgets/QTableWidgetItem>
#include <QVBoxLayout>
#include <QHBoxLayout>
#include <QHeaderView>
#include <QFileDialog>
#include <QMessageBox>

UIQt::UIQt(const Discovery& discovery, const Options& options, QWidget* parent)
    : QMainWindow(parent), discovery_(discovery), options_(options) {
    buildUi();
    setWindowTitle("OrviboLAN");
    rediscover();
}

UIQt::~UIQt() {}

void UIQt::buildUi() {
    QWidget* central = new QWidget(this);
    setCentralWidget(central);
    auto* layout = new QVBoxLayout(central);

    devicesTable_ = new QTableWidget(0, 3, this);
    devicesTable_->setHorizontalHeaderLabels({"IP", "MAC", "Type"});
    devicesTable_->horizontalHeader()->setSectionResizeMode(QHeaderView::Stretch);
    devicesTable_->setSelectionBehavior(QAbstractItemView::SelectRows);
    devicesTable_->setSelectionMode(QAbstractItemView::SingleSelection);
    devicesTable_->setEditTriggers(QAbstractItemView::NoEditTriggers);
    layout->addWidget(devicesTable_);

    statusLabel_ = new QLabel(this);
    layout->addWidget(statusLabel_);

    auto* h = new QHBoxLayout();
    discoverBtn_ = new QPushButton("Discover", this);
    onBtn_ = new QPushButton("Switch on", this);
    offBtn_ = new QPushButton("Switch off", this);
    stateBtn_ = new QPushButton("Power state", this);
    learnBtn_ = new QPushButton("Learn signal...", this);
    emitBtn_ = new QPushButton("Emit signal...", this);
    h->addWidget(discoverBtn_);
    h->addWidget(onBtn_);
    h->addWidget(offBtn_);
    h->addWidget(stateBtn_);
    h->addWidget(learnBtn_);
    h->addWidget(emitBtn_);
    layout->addLayout(h);

    connect(devicesTable_, &QTableWidget::itemSelectionChanged, [this]() { updateButtons(); });
    connect(discoverBtn_, &QPushButton::clicked, [this]() { rediscover(); });

    auto switchTo = [this](bool on) {
        const DeviceIdentity* device = selectedDevice();
        if (!device) return;
        showStatus(QString("Switching %1 %2...").arg(QString(on ? "on" : "off"), QString::fromStdString(device->address.ip)));
        auto outcome = DeviceActions::switch_power(*device, on, options_.connected);
        showStatus(QString::fromStdString(outcome.message));
        if (!succeeded(outcome.status)) QMessageBox::warning(this, "Switch", QString::fromStdString(outcome.message));
    };
    connect(onBtn_, &QPushButton::clicked, [switchTo]() { switchTo(true); });
    connect(offBtn_, &QPushButton::clicked, [switchTo]() { switchTo(false); });

    connect(stateBtn_, &QPushButton::clicked, [this]() {
        const DeviceIdentity* device = selectedDevice();
        if (!device) return;
        auto outcome = DeviceActions::query_power(*device, options_.connected);
        showStatus(QString::fromStdString(outcome.message));
    });

    connect(learnBtn_, &QPushButton::clicked, [this]() {
        const DeviceIdentity* device = selectedDevice();
        if (!device) return;
        QString path = QFileDialog::getSaveFileName(this, "Save learned signal", QString(), "Signals (*.ir *.rf);;All files (*)");
        if (path.isEmpty()) return;
        showStatus("Point the remote at the device and press a button...");
        auto outcome = DeviceActions::learn_to_file(*device, path.toStdString(), options_.signal_kind,
                                                    options_.learn_timeout_s, options_.connected);
        showStatus(QString::fromStdString(outcome.message));
        if (outcome.status != Status::Ok) QMessageBox::warning(this, "Learn", QString::fromStdString(outcome.message));
    });

    connect(emitBtn_, &QPushButton::clicked, [this]() {
        const DeviceIdentity* device = selectedDevice();
        if (!device) return;
        QString path = QFileDialog::getOpenFileName(this, "Select signal to emit", QString(), "Signals (*.ir *.rf);;All files (*)");
        if (path.isEmpty()) return;
        auto outcome = DeviceActions::emit_from_file(*device, path.toStdString(), options_.signal_kind,
                                                     options_.connected);
        showStatus(QString::fromStdString(outcome.message));
        if (outcome.status != Status::Ok) QMessageBox::warning(this, "Emit", QString::fromStdString(outcome.message));
    });

    updateButtons();
}

void UIQt::showStatus(const QString& text) {
    statusLabel_->setText(text);
    // the command below blocks the event loop, get the text painted first
    QApplication::processEvents();
}

const DeviceIdentity* UIQt::selectedDevice() const {
    int row = devicesTable_->currentRow();
    if (row < 0 || static_cast<size_t>(row) >= devices_.size()) return nullptr;
    return &devices_[static_cast<size_t>(row)];
}

void UIQt::updateButtons() {
    const DeviceIdentity* device = selectedDevice();
    bool socket = device && device->device_class == DeviceClass::Socket;
    bool blaster = device && device->device_class == DeviceClass::InfraredBlaster;
    onBtn_->setEnabled(socket);
    offBtn_->setEnabled(socket);
    stateBtn_->setEnabled(socket);
    learnBtn_->setEnabled(blaster);
    emitBtn_->setEnabled(blaster);
}

void UIQt::rediscover() {
    showStatus("Discovering...");
    DeviceMap found = discovery_.discover_all();

    devices_.clear();
    devicesTable_->setRowCount(0);
    int r = 0;
    for (const auto& [ip, device] : found) {
        devices_.push_back(device);
        devicesTable_->insertRow(r);
        devicesTable_->setItem(r, 0, new QTableWidgetItem(QString::fromStdString(ip)));
        devicesTable_->setItem(r, 1, new QTableWidgetItem(QString::fromStdString(format_hardware_id(device.hardware_id))));
        devicesTable_->setItem(r, 2, new QTableWidgetItem(QString::fromStdString(device_class_name(device.device_class))));
        ++r;
    }
    showStatus(QString("%1 device(s) found.").arg(static_cast<int>(devices_.size())));
    updateButtons();
}
