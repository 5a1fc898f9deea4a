#ifndef UIQT_HPP
#define UIQT_HPP

#include <QMainWindow>
#include <QTableWidget>
#include <QPushButton>
#include <QLabel>
#include <vector>
#include "Discovery.hpp"
#include "Options.hpp"

class UIQt : public QMainWindow {
public:
    UIQt(const Discovery& discovery, const Options& options, QWidget* parent = nullptr);
    ~UIQt();

private:
    const Discovery& discovery_;
    const Options& options_;
    std::vector<DeviceIdentity> devices_;

    QTableWidget* devicesTable_;
    QLabel* statusLabel_;
    QPushButton* discoverBtn_;
    QPushButton* onBtn_;
    QPushButton* offBtn_;
    QPushButton* stateBtn_;
    QPushButton* learnBtn_;
    QPushButton* emitBtn_;

    void buildUi();
    void rediscover();
    void updateButtons();
    void showStatus(const QString& text);
    const DeviceIdentity* selectedDevice() const;
};

#endif // UIQT_HPP
