#include "tc/style/Theme.hpp"
#include "tc/recipe/Recipe.hpp"

#include <algorithm>
#include <cctype>
#include <string>

namespace tc {

static void setColor(float dst[4], float r, float g, float b, float a) {
  dst[0] = r; dst[1] = g; dst[2] = b; dst[3] = a;
}

// -------------------- Built-in presets --------------------

Theme darkTheme() {
  Theme t;
  t.name = "Dark";
  // All fields already carry the dark-theme defaults from the struct initializers.
  return t;
}

Theme lightTheme() {
  Theme t;
  t.name = "Light";

  setColor(t.backgroundColor, 1.0f, 1.0f, 1.0f, 1.0f);
  setColor(t.candleUp, 0.03f, 0.6f, 0.51f, 1.0f);
  setColor(t.candleDown, 0.95f, 0.21f, 0.27f, 1.0f);
  setColor(t.volumeUp, 0.03f, 0.6f, 0.51f, 0.4f);
  setColor(t.volumeDown, 0.95f, 0.21f, 0.27f, 0.4f);
  setColor(t.areaFill, 0.16f, 0.38f, 1.0f, 0.15f);
  setColor(t.textColor, 0.07f, 0.09f, 0.13f, 1.0f);
  return t;
}

bool themeByName(const std::string& name, Theme& out) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "dark") { out = darkTheme(); return true; }
  if (lower == "light") { out = lightTheme(); return true; }
  return false;
}

// -------------------- Command generation --------------------

std::vector<std::string> generateThemeCommands(const Theme& theme, const ThemeTarget& target) {
  std::vector<std::string> cmds;

  for (Id id : target.candleDrawItemIds) {
    cmds.push_back(makeUpDownStyleCmd(id, theme.candleUp, theme.candleDown));
  }
  for (Id id : target.volumeDrawItemIds) {
    cmds.push_back(makeUpDownStyleCmd(id, theme.volumeUp, theme.volumeDown));
  }
  for (Id id : target.lineDrawItemIds) {
    cmds.push_back(makeColorStyleCmd(id, theme.lineColor, theme.lineWidth));
  }
  for (Id id : target.areaFillDrawItemIds) {
    cmds.push_back(makeColorStyleCmd(id, theme.areaFill, 1.0f));
  }
  for (int i = 0; i < 3; ++i) {
    if (target.smaDrawItemIds[i] != 0) {
      cmds.push_back(makeColorStyleCmd(target.smaDrawItemIds[i], theme.smaColors[i],
                                       theme.overlayLineWidth));
    }
  }
  if (target.rsiDrawItemId != 0) {
    cmds.push_back(makeColorStyleCmd(target.rsiDrawItemId, theme.rsiColor,
                                     theme.overlayLineWidth));
  }
  if (target.annotationDrawItemId != 0) {
    cmds.push_back(makeColorStyleCmd(target.annotationDrawItemId, theme.annotationColor,
                                     theme.annotationLineWidth));
  }

  return cmds;
}

} // namespace tc
