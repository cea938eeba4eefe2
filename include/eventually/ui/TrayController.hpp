#pragma once

#include <QDateTime>
#include <QFileSystemWatcher>
#include <QMenu>
#include <QObject>
#include <QSystemTrayIcon>
#include <QTimer>
#include <vector>

#include "eventually/ui/models/MenuModel.hpp"
#include "eventually/ui/viewmodels/StatusMenuViewModel.hpp"

class QAction;
class TrayControllerTest;

namespace eventually {
namespace core {
class AppContext;
}

namespace ui {

// Owns the tray icon and its menu. Every refresh rebuilds the menu from the
// view model's row descriptors.
class TrayController : public QObject
{
    Q_OBJECT

public:
    explicit TrayController(core::AppContext &context, QObject *parent = nullptr);
    ~TrayController() override;

    void show();
    void handleAction(const MenuAction &action);

private slots:
    void refresh();
    void applyViewModel();
    void onRefreshTimer();
    void onCalendarFileChanged(const QString &path);

private:
    friend class ::TrayControllerTest;

    // Returns true when the gap since the previous tick means the machine slept.
    bool tick(const QDateTime &now);
    void populateMenu(const std::vector<MenuRow> &rows);
    QAction *addRow(const MenuRow &row);
    void updateTrayTitle(const QString &title);
    void watchCalendarFiles();
    void openUrl(const MenuAction &action);

    core::AppContext &m_context;
    StatusMenuViewModel m_viewModel;
    QMenu m_menu;
    QSystemTrayIcon m_trayIcon;
    QTimer m_refreshTimer;
    QFileSystemWatcher m_watcher;
    QDateTime m_lastTick;
};

} // namespace ui
} // namespace eventually
