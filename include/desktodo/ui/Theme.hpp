#pragma once

#include <QColor>
#include <QPalette>

namespace desktodo {
namespace ui {

QPalette lightPalette();
QPalette darkPalette();

// Switches the application palette; both variants use the Fusion style.
void applyTheme(bool dark);
QColor completedTaskColor(bool dark);

} // namespace ui
} // namespace desktodo
