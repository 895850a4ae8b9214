#include "ChartThemeRegistry.hpp"
#include "DarkChartTheme.hpp"
#include "CandleViewLogging.hpp"

ChartThemeRegistry::ChartThemeRegistry() {
    registerTheme(std::make_unique<DarkChartTheme>());
}

void ChartThemeRegistry::registerTheme(std::unique_ptr<IChartTheme> theme) {
    if (!theme) {
        cvLog_Warning("ChartThemeRegistry: Ignoring null chart theme");
        return;
    }

    const QString id = theme->id();
    const QString name = theme->name();
    const bool replaced = !m_themes.insert_or_assign(id, std::move(theme)).second;
    if (replaced) {
        cvLog_Warning("ChartThemeRegistry: Chart theme" << id << "replaced by" << name);
    } else {
        cvLog_Debug("ChartThemeRegistry: Chart theme" << id << "(" << name << ") available");
    }
}

const IChartTheme& ChartThemeRegistry::resolve(const QString& themeId) const {
    auto it = m_themes.find(themeId);
    if (it != m_themes.end()) return *it->second;

    cvLog_Warning("ChartThemeRegistry: No chart theme" << themeId << "among" << availableThemes()
                  << "- falling back to" << kDefaultThemeId);
    return *m_themes.at(QString::fromLatin1(kDefaultThemeId));
}

bool ChartThemeRegistry::contains(const QString& themeId) const {
    return m_themes.find(themeId) != m_themes.end();
}

QStringList ChartThemeRegistry::availableThemes() const {
    QStringList ids;
    ids.reserve(static_cast<qsizetype>(m_themes.size()));
    for (const auto& entry : m_themes) {
        ids.append(entry.first);
    }
    return ids;
}
