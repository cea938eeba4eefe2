#include "eventually/ui/widgets/MenuRowWidget.hpp"

#include "eventually/ui/Icons.hpp"

#include <QHBoxLayout>
#include <QLabel>
#include <QMouseEvent>
#include <QPalette>
#include <QStringList>

namespace eventually {
namespace ui {

namespace {
QColor blend(const QColor &foreground, const QColor &background, qreal amount)
{
    return QColor::fromRgbF(foreground.redF() * amount + background.redF() * (1.0 - amount),
                            foreground.greenF() * amount + background.greenF() * (1.0 - amount),
                            foreground.blueF() * amount + background.blueF() * (1.0 - amount));
}

enum class TextColor {
    Default,
    Secondary,
    Tertiary
};

struct CharacterStyle
{
    bool bold = false;
    TextColor color = TextColor::Default;

    bool operator==(const CharacterStyle &other) const { return bold == other.bold && color == other.color; }
    bool operator!=(const CharacterStyle &other) const { return !(*this == other); }
};
} // namespace

MenuRowWidget::MenuRowWidget(const MenuRow &row, QWidget *parent)
    : QWidget(parent)
    , m_clickable(row.enabled && row.action.kind != MenuActionKind::None)
{
    auto *layout = new QHBoxLayout(this);
    layout->setContentsMargins(8, 3, 12, 3);
    layout->setSpacing(6);

    m_iconLabel = new QLabel(this);
    m_iconLabel->setFixedSize(16, 16);
    if (row.dotColor) {
        m_iconLabel->setPixmap(calendarDot(*row.dotColor, 16));
    } else {
        const QIcon icon = loadIcon(row.iconKey);
        if (!icon.isNull()) {
            m_iconLabel->setPixmap(icon.pixmap(16, 16));
        }
    }
    layout->addWidget(m_iconLabel);

    const QPalette pal = palette();
    const QColor secondary = pal.color(QPalette::Disabled, QPalette::WindowText);
    const QColor tertiary = blend(secondary, pal.color(QPalette::Window), 0.6);

    m_textLabel = new QLabel(this);
    m_textLabel->setTextFormat(Qt::RichText);
    m_textLabel->setText(toRichText(row.label, row.spans, secondary, tertiary));
    layout->addWidget(m_textLabel, 1);

    setEnabled(row.enabled);
    setAutoFillBackground(false);
}

QString MenuRowWidget::richText() const
{
    return m_textLabel->text();
}

QString MenuRowWidget::toRichText(const QString &label,
                                  const std::vector<TextSpan> &spans,
                                  const QColor &secondary,
                                  const QColor &tertiary)
{
    // Spans are applied in order, later colors override earlier ones.
    std::vector<CharacterStyle> styles(static_cast<std::size_t>(label.size()));
    for (const TextSpan &span : spans) {
        const int begin = qBound(0, span.start, label.size());
        const int end = qBound(begin, span.start + span.length, label.size());
        for (int i = begin; i < end; ++i) {
            auto &style = styles[static_cast<std::size_t>(i)];
            switch (span.style) {
            case TextStyle::Bold:
                style.bold = true;
                break;
            case TextStyle::Secondary:
                style.color = TextColor::Secondary;
                break;
            case TextStyle::Tertiary:
                style.color = TextColor::Tertiary;
                break;
            }
        }
    }

    QString html;
    int runStart = 0;
    auto flushRun = [&](int runEnd) {
        if (runEnd <= runStart) {
            return;
        }
        const CharacterStyle &style = styles[static_cast<std::size_t>(runStart)];
        const QString text = label.mid(runStart, runEnd - runStart).toHtmlEscaped();
        QStringList css;
        if (style.bold) {
            css << QStringLiteral("font-weight:600");
        }
        if (style.color == TextColor::Secondary) {
            css << QStringLiteral("color:%1").arg(secondary.name());
        } else if (style.color == TextColor::Tertiary) {
            css << QStringLiteral("color:%1").arg(tertiary.name());
        }
        if (css.isEmpty()) {
            html += text;
        } else {
            html += QStringLiteral("<span style=\"%1\">%2</span>").arg(css.join(';'), text);
        }
    };

    for (int i = 1; i < label.size(); ++i) {
        if (styles[static_cast<std::size_t>(i)] != styles[static_cast<std::size_t>(runStart)]) {
            flushRun(i);
            runStart = i;
        }
    }
    flushRun(label.size());
    return html;
}

void MenuRowWidget::enterEvent(QEvent *event)
{
    QWidget::enterEvent(event);
    setHighlighted(m_clickable);
}

void MenuRowWidget::leaveEvent(QEvent *event)
{
    QWidget::leaveEvent(event);
    setHighlighted(false);
}

void MenuRowWidget::mouseReleaseEvent(QMouseEvent *event)
{
    if (m_clickable && event->button() == Qt::LeftButton && rect().contains(event->pos())) {
        emit clicked();
        event->accept();
        return;
    }
    QWidget::mouseReleaseEvent(event);
}

void MenuRowWidget::setHighlighted(bool highlighted)
{
    setAutoFillBackground(highlighted);
    if (highlighted) {
        QPalette pal = palette();
        pal.setColor(QPalette::Window, pal.color(QPalette::Highlight));
        setPalette(pal);
    } else {
        setPalette(QPalette());
    }
}

} // namespace ui
} // namespace eventually
