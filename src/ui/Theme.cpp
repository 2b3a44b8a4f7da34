#include "desktodo/ui/Theme.hpp"

#include <QApplication>
#include <QStyle>
#include <QStyleFactory>
#include <memory>

#include "desktodo/core/Logging.hpp"

namespace desktodo {
namespace ui {

QPalette lightPalette()
{
    const std::unique_ptr<QStyle> fusion(QStyleFactory::create(QStringLiteral("Fusion")));
    return fusion ? fusion->standardPalette() : QPalette();
}

QPalette darkPalette()
{
    QPalette palette;
    const QColor window(0x2b, 0x2b, 0x2b);
    const QColor base(0x3c, 0x3c, 0x3c);
    const QColor text(0xe6, 0xe6, 0xe6);
    const QColor highlight(0x2f, 0x6f, 0xb3);

    palette.setColor(QPalette::Window, window);
    palette.setColor(QPalette::WindowText, text);
    palette.setColor(QPalette::Base, base);
    palette.setColor(QPalette::AlternateBase, window);
    palette.setColor(QPalette::ToolTipBase, base);
    palette.setColor(QPalette::ToolTipText, text);
    palette.setColor(QPalette::Text, text);
    palette.setColor(QPalette::Button, QColor(0x40, 0x40, 0x40));
    palette.setColor(QPalette::ButtonText, text);
    palette.setColor(QPalette::BrightText, Qt::white);
    palette.setColor(QPalette::Highlight, highlight);
    palette.setColor(QPalette::HighlightedText, Qt::white);
    palette.setColor(QPalette::PlaceholderText, QColor(0x9a, 0x9a, 0x9a));
    palette.setColor(QPalette::Disabled, QPalette::Text, QColor(0x80, 0x80, 0x80));
    palette.setColor(QPalette::Disabled, QPalette::ButtonText, QColor(0x80, 0x80, 0x80));
    palette.setColor(QPalette::Disabled, QPalette::WindowText, QColor(0x80, 0x80, 0x80));
    return palette;
}

void applyTheme(bool dark)
{
    if (!qApp) {
        return;
    }
    QApplication::setStyle(QStyleFactory::create(QStringLiteral("Fusion")));
    QApplication::setPalette(dark ? darkPalette() : lightPalette());
    qCDebug(lcUi) << "Applied" << (dark ? "dark" : "light") << "theme";
}

QColor completedTaskColor(bool dark)
{
    return dark ? QColor(0x8a, 0x8a, 0x8a) : QColor(130, 130, 130);
}

} // namespace ui
} // namespace desktodo
