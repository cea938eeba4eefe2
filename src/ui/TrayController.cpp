#include "eventually/ui/TrayController.hpp"

#include "eventually/core/AppContext.hpp"
#include "eventually/core/DismissedSet.hpp"
#include "eventually/core/Logging.hpp"
#include "eventually/data/EventSource.hpp"
#include "eventually/ui/Icons.hpp"
#include "eventually/ui/widgets/MenuRowWidget.hpp"

#include <QAction>
#include <QApplication>
#include <QDesktopServices>
#include <QFileInfo>
#include <QKeySequence>
#include <QPalette>
#include <QWidgetAction>

namespace eventually {
namespace ui {

TrayController::TrayController(core::AppContext &context, QObject *parent)
    : QObject(parent)
    , m_context(context)
    , m_viewModel(context.eventSource(), context.dismissedSet(), context.settings().titleFormat)
{
    m_trayIcon.setIcon(QIcon(QStringLiteral(":/icons/app-icon.svg")));
    m_trayIcon.setContextMenu(&m_menu);

    connect(&m_viewModel, &StatusMenuViewModel::changed, this, &TrayController::applyViewModel);

    m_refreshTimer.setInterval(context.settings().refreshIntervalSeconds * 1000);
    connect(&m_refreshTimer, &QTimer::timeout, this, &TrayController::onRefreshTimer);

    connect(&m_watcher, &QFileSystemWatcher::fileChanged, this, &TrayController::onCalendarFileChanged);
    watchCalendarFiles();
}

TrayController::~TrayController() = default;

void TrayController::show()
{
    refresh();
    m_trayIcon.show();
    m_lastTick = QDateTime::currentDateTime();
    m_refreshTimer.start();
}

void TrayController::refresh()
{
    m_viewModel.refresh();
}

void TrayController::applyViewModel()
{
    updateTrayTitle(m_viewModel.statusTitle());
    populateMenu(m_viewModel.rows());
}

void TrayController::onRefreshTimer()
{
    tick(QDateTime::currentDateTime());
    refresh();
}

bool TrayController::tick(const QDateTime &now)
{
    const bool woke = m_lastTick.isValid() && m_lastTick.secsTo(now) > 2 * m_context.settings().refreshIntervalSeconds;
    m_lastTick = now;
    if (!woke) {
        return false;
    }
    qCInfo(EVENTUALLY_UI_LOG) << "TrayController::tick: wake from sleep detected, re-watching calendar files";
    // Calendar files synced while asleep are often replaced rather than edited.
    watchCalendarFiles();
    return true;
}

void TrayController::onCalendarFileChanged(const QString &path)
{
    qCDebug(EVENTUALLY_UI_LOG) << "TrayController: calendar changed" << path;
    // Editors that save by rename drop the file from the watcher.
    if (!m_watcher.files().contains(path) && QFileInfo::exists(path)) {
        m_watcher.addPath(path);
    }
    refresh();
}

void TrayController::handleAction(const MenuAction &action)
{
    switch (action.kind) {
    case MenuActionKind::JoinCall:
    case MenuActionKind::OpenEvent:
        openUrl(action);
        break;
    case MenuActionKind::DismissEvent:
        qCInfo(EVENTUALLY_UI_LOG) << "TrayController: dismissing" << action.payload;
        m_viewModel.dismiss(action.payload);
        break;
    case MenuActionKind::Quit:
        QCoreApplication::quit();
        break;
    case MenuActionKind::None:
        break;
    }
}

void TrayController::openUrl(const MenuAction &action)
{
    const auto url = targetUrl(action);
    if (!url) {
        return;
    }
    if (!QDesktopServices::openUrl(*url)) {
        qCWarning(EVENTUALLY_UI_LOG) << "TrayController: could not open" << url->toString();
    }
}

void TrayController::populateMenu(const std::vector<MenuRow> &rows)
{
    m_menu.clear();
    for (const MenuRow &row : rows) {
        addRow(row);
    }
}

QAction *TrayController::addRow(const MenuRow &row)
{
    if (row.kind == MenuRowKind::Separator) {
        return m_menu.addSeparator();
    }

    QAction *action = nullptr;
    if (row.spans.empty() && !row.dotColor) {
        action = m_menu.addAction(loadIcon(row.iconKey), row.label);
        if (!row.shortcut.isEmpty()) {
            action->setShortcut(QKeySequence(row.shortcut));
        }
    } else {
        auto *widgetAction = new QWidgetAction(&m_menu);
        auto *widget = new MenuRowWidget(row);
        widgetAction->setDefaultWidget(widget);
        connect(widget, &MenuRowWidget::clicked, widgetAction, &QAction::trigger);
        m_menu.addAction(widgetAction);
        action = widgetAction;
    }
    action->setEnabled(row.enabled);

    if (row.action.kind != MenuActionKind::None) {
        const MenuAction menuAction = row.action;
        connect(action, &QAction::triggered, this, [this, menuAction]() {
            m_menu.hide();
            // The menu is rebuilt by some actions; let the trigger unwind first.
            QMetaObject::invokeMethod(this, [this, menuAction]() { handleAction(menuAction); }, Qt::QueuedConnection);
        });
    }
    return action;
}

void TrayController::updateTrayTitle(const QString &title)
{
    m_trayIcon.setToolTip(title);
    if (!m_context.settings().showTitleInTray) {
        return;
    }
    const QColor textColor = QApplication::palette().color(QPalette::WindowText);
    m_trayIcon.setIcon(QIcon(renderStatusTitle(title, QApplication::font(), textColor)));
}

void TrayController::watchCalendarFiles()
{
    const QStringList watched = m_watcher.files();
    for (const QString &path : m_context.eventSource().watchedPaths()) {
        if (watched.contains(path) || !QFileInfo::exists(path)) {
            continue;
        }
        if (!m_watcher.addPath(path)) {
            qCWarning(EVENTUALLY_UI_LOG) << "TrayController: cannot watch" << path;
        }
    }
}

} // namespace ui
} // namespace eventually
