#pragma once
#include "tc/ids/Id.hpp"

#include <string>
#include <vector>

namespace tc {

struct Theme {
  std::string name;

  // Background (host clear color)
  float backgroundColor[4] = {0.07f, 0.09f, 0.13f, 1.0f};

  // Candle colors
  float candleUp[4] = {0.15f, 0.65f, 0.6f, 1.0f};
  float candleDown[4] = {0.94f, 0.33f, 0.31f, 1.0f};

  // Line / area main series
  float lineColor[4] = {0.16f, 0.38f, 1.0f, 1.0f};
  float areaFill[4] = {0.16f, 0.38f, 1.0f, 0.25f};
  float lineWidth{2.0f};

  // SMA-20 / SMA-50 / SMA-200 overlays
  float smaColors[3][4] = {
    {1.0f, 0.6f, 0.0f, 1.0f},    // amber
    {0.13f, 0.59f, 0.95f, 1.0f}, // blue
    {0.61f, 0.15f, 0.69f, 1.0f}  // purple
  };
  float overlayLineWidth{1.5f};

  // RSI line
  float rsiColor[4] = {0.49f, 0.34f, 0.76f, 1.0f};

  // Volume
  float volumeUp[4] = {0.15f, 0.65f, 0.6f, 0.5f};
  float volumeDown[4] = {0.94f, 0.33f, 0.31f, 0.5f};

  // Drawing tools
  float annotationColor[4] = {0.16f, 0.38f, 1.0f, 1.0f};
  float annotationLineWidth{2.0f};

  // Text (host-drawn labels)
  float textColor[4] = {0.82f, 0.83f, 0.85f, 1.0f};
};

// Built-in presets
Theme darkTheme();
Theme lightTheme();

// "dark" / "light" (case-insensitive). Returns false for unknown names.
bool themeByName(const std::string& name, Theme& out);

// ---------- ThemeApplier ----------

// Which scene resources each theme category should target. 0 = not present.
struct ThemeTarget {
  std::vector<Id> candleDrawItemIds;
  std::vector<Id> volumeDrawItemIds;
  std::vector<Id> lineDrawItemIds;       // main close line / area outline
  std::vector<Id> areaFillDrawItemIds;
  Id smaDrawItemIds[3] = {0, 0, 0};
  Id rsiDrawItemId{0};
  Id annotationDrawItemId{0};
};

// JSON command strings suitable for CommandProcessor::applyJsonText().
std::vector<std::string> generateThemeCommands(const Theme& theme, const ThemeTarget& target);

} // namespace tc
