#pragma once

#include <QColor>
#include <QString>
#include <QWidget>
#include <vector>

#include "eventually/ui/models/MenuModel.hpp"

class QLabel;

namespace eventually {
namespace ui {

// Menu entry with styled text, used inside a QWidgetAction because plain
// QAction text cannot carry per-range colors.
class MenuRowWidget : public QWidget
{
    Q_OBJECT

public:
    explicit MenuRowWidget(const MenuRow &row, QWidget *parent = nullptr);

    QString richText() const;

    static QString toRichText(const QString &label,
                              const std::vector<TextSpan> &spans,
                              const QColor &secondary,
                              const QColor &tertiary);

signals:
    void clicked();

protected:
    void enterEvent(QEvent *event) override;
    void leaveEvent(QEvent *event) override;
    void mouseReleaseEvent(QMouseEvent *event) override;

private:
    void setHighlighted(bool highlighted);

    QLabel *m_iconLabel = nullptr;
    QLabel *m_textLabel = nullptr;
    bool m_clickable = true;
};

} // namespace ui
} // namespace eventually
