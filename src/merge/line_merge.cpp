#include "merge/line_merge.hpp"

#include <QSet>
#include <QStringList>

namespace quire::merge {

QString resolve_keep_ours(const QString& ours, const QString& /*theirs*/) {
    return ours;
}

QString resolve_line_set_union(const QString& ours, const QString& theirs) {
    QStringList lines;
    QSet<QString> seen;
    for (const auto* side : {&ours, &theirs}) {
        const auto split = side->split(QLatin1Char('\n'), Qt::SkipEmptyParts);
        for (const auto& line : split) {
            if (!seen.contains(line)) {
                seen.insert(line);
                lines.append(line);
            }
        }
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace quire::merge
