#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string_view>
#include <vector>

#include "core/result.hpp"

namespace quire::merge {

enum class ResolverTag {
    KeepOurs,
    SetUnion,
    IdKeyedArrayMerge,
    TimestampKeyedRecordMerge,
    StructuredCellMerge,
    ProjectMetadataMerge,
    SettingsThreeWayMerge,
};

[[nodiscard]] std::string_view resolver_name(ResolverTag tag);
[[nodiscard]] std::optional<ResolverTag> parse_resolver_name(std::string_view name);

struct StrategyRule {
    enum class Match {
        // Whole normalized path.
        Exact,
        // Last path segment.
        FileName,
        Suffix,
        Contains,
    };

    Match match{Match::Suffix};
    QString pattern;
    ResolverTag tag{ResolverTag::KeepOurs};

    [[nodiscard]] bool matches(const QString& normalized_path) const;
};

[[nodiscard]] std::string_view match_kind_name(StrategyRule::Match match);
[[nodiscard]] std::optional<StrategyRule::Match> parse_match_kind(std::string_view name);

// Backslashes become '/', leading slashes and "./" segments are dropped.
[[nodiscard]] QString normalize_path(const QString& path);

/**
 * Ordered path-pattern → resolver mapping. Rules are tried in order and the
 * first match wins; a path no rule matches gets `fallback`.
 */
class StrategyTable {
public:
    StrategyTable() = default;
    StrategyTable(std::vector<StrategyRule> rules, ResolverTag fallback);

    [[nodiscard]] static StrategyTable defaults();

    /**
     * Builds a table from `{ "extendDefaults", "fallback", "rules": [...] }`.
     * When extending, the given rules are tried before the default ones.
     */
    [[nodiscard]] static Result<StrategyTable> from_json(const QJsonObject& json);
    [[nodiscard]] static Result<StrategyTable> from_file(const QString& path);

    [[nodiscard]] ResolverTag select(const QString& path) const;

    [[nodiscard]] const std::vector<StrategyRule>& rules() const { return rules_; }
    [[nodiscard]] ResolverTag fallback() const { return fallback_; }

private:
    std::vector<StrategyRule> rules_;
    ResolverTag fallback_{ResolverTag::KeepOurs};
};

// Selection over the default table.
[[nodiscard]] ResolverTag select_strategy(const QString& path);

} // namespace quire::merge
