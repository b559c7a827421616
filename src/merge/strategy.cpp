#include "merge/strategy.hpp"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

#include <array>
#include <utility>

#include "merge/log.hpp"

namespace quire::merge {
namespace {

constexpr std::array<std::pair<ResolverTag, std::string_view>, 7> kResolverNames{{
    {ResolverTag::KeepOurs, "keep-ours"},
    {ResolverTag::SetUnion, "set-union"},
    {ResolverTag::IdKeyedArrayMerge, "id-keyed-array-merge"},
    {ResolverTag::TimestampKeyedRecordMerge, "timestamp-keyed-record-merge"},
    {ResolverTag::StructuredCellMerge, "structured-cell-merge"},
    {ResolverTag::ProjectMetadataMerge, "project-metadata-merge"},
    {ResolverTag::SettingsThreeWayMerge, "settings-three-way-merge"},
}};

constexpr std::array<std::pair<StrategyRule::Match, std::string_view>, 4> kMatchNames{{
    {StrategyRule::Match::Exact, "exact"},
    {StrategyRule::Match::FileName, "file-name"},
    {StrategyRule::Match::Suffix, "suffix"},
    {StrategyRule::Match::Contains, "contains"},
}};

Error config_error(std::string message) {
    return Error(std::move(message), ErrorCode::ConfigError);
}

Result<StrategyRule> parse_rule(const QJsonValue& json, qsizetype index) {
    const auto where = "strategy rule " + std::to_string(index);
    if (!json.isObject()) {
        return Result<StrategyRule>::err(config_error(where + " is not an object"));
    }
    const auto obj = json.toObject();

    const auto match = parse_match_kind(obj.value(QStringLiteral("match")).toString().toStdString());
    if (!match) {
        return Result<StrategyRule>::err(config_error(where + " has an unknown match kind"));
    }
    const auto pattern = obj.value(QStringLiteral("pattern")).toString();
    if (pattern.isEmpty()) {
        return Result<StrategyRule>::err(config_error(where + " has no pattern"));
    }
    const auto tag = parse_resolver_name(obj.value(QStringLiteral("resolver")).toString().toStdString());
    if (!tag) {
        return Result<StrategyRule>::err(config_error(where + " names an unknown resolver"));
    }
    return Result<StrategyRule>::ok(StrategyRule{*match, pattern, *tag});
}

} // namespace

std::string_view resolver_name(ResolverTag tag) {
    for (const auto& [candidate, name] : kResolverNames) {
        if (candidate == tag) return name;
    }
    return "keep-ours";
}

std::optional<ResolverTag> parse_resolver_name(std::string_view name) {
    for (const auto& [tag, candidate] : kResolverNames) {
        if (candidate == name) return tag;
    }
    return std::nullopt;
}

std::string_view match_kind_name(StrategyRule::Match match) {
    for (const auto& [candidate, name] : kMatchNames) {
        if (candidate == match) return name;
    }
    return "suffix";
}

std::optional<StrategyRule::Match> parse_match_kind(std::string_view name) {
    for (const auto& [match, candidate] : kMatchNames) {
        if (candidate == name) return match;
    }
    return std::nullopt;
}

QString normalize_path(const QString& path) {
    QString out = path;
    out.replace(QLatin1Char('\\'), QLatin1Char('/'));
    while (out.startsWith(QLatin1Char('/')) || out.startsWith(QStringLiteral("./"))) {
        out.remove(0, out.startsWith(QLatin1Char('/')) ? 1 : 2);
    }
    return out;
}

bool StrategyRule::matches(const QString& normalized_path) const {
    switch (match) {
        case Match::Exact:
            return normalized_path == pattern;
        case Match::FileName:
            return normalized_path.section(QLatin1Char('/'), -1) == pattern;
        case Match::Suffix:
            return normalized_path.endsWith(pattern);
        case Match::Contains:
            return normalized_path.contains(pattern);
    }
    return false;
}

StrategyTable::StrategyTable(std::vector<StrategyRule> rules, ResolverTag fallback)
    : rules_(std::move(rules)), fallback_(fallback) {}

StrategyTable StrategyTable::defaults() {
    using M = StrategyRule::Match;
    using T = ResolverTag;
    return StrategyTable(
        {
            {M::Suffix, QStringLiteral(".codex"), T::StructuredCellMerge},
            {M::Suffix, QStringLiteral(".source"), T::StructuredCellMerge},
            {M::Exact, QStringLiteral(".project/comments.json"), T::IdKeyedArrayMerge},
            {M::FileName, QStringLiteral("file-comments.json"), T::IdKeyedArrayMerge},
            {M::Suffix, QStringLiteral(".dictionary"), T::SetUnion},
            {M::Suffix, QStringLiteral(".jsonl"), T::SetUnion},
            {M::FileName, QStringLiteral("smart_edits.json"), T::TimestampKeyedRecordMerge},
            {M::Exact, QStringLiteral("metadata.json"), T::ProjectMetadataMerge},
            {M::Exact, QStringLiteral(".vscode/settings.json"), T::SettingsThreeWayMerge},
            {M::Suffix, QStringLiteral(".sqlite"), T::KeepOurs},
        },
        T::KeepOurs);
}

Result<StrategyTable> StrategyTable::from_json(const QJsonObject& json) {
    using R = Result<StrategyTable>;

    auto fallback = ResolverTag::KeepOurs;
    if (json.contains(QStringLiteral("fallback"))) {
        const auto parsed = parse_resolver_name(json.value(QStringLiteral("fallback")).toString().toStdString());
        if (!parsed) {
            return R::err(config_error("strategy table fallback names an unknown resolver"));
        }
        fallback = *parsed;
    }

    const auto rules_json = json.value(QStringLiteral("rules"));
    if (!rules_json.isUndefined() && !rules_json.isArray()) {
        return R::err(config_error("strategy table rules is not an array"));
    }

    std::vector<StrategyRule> rules;
    const auto array = rules_json.toArray();
    for (qsizetype i = 0; i < array.size(); ++i) {
        auto rule = parse_rule(array.at(i), i);
        if (rule.is_err()) {
            return R::err(rule.unwrap_err());
        }
        rules.push_back(std::move(rule).unwrap());
    }

    if (json.value(QStringLiteral("extendDefaults")).toBool(true)) {
        const auto builtin = defaults();
        rules.insert(rules.end(), builtin.rules().begin(), builtin.rules().end());
    }
    qCDebug(quireConfigLog) << "strategy table has" << rules.size() << "rules, fallback"
                            << resolver_name(fallback).data();
    return R::ok(StrategyTable(std::move(rules), fallback));
}

Result<StrategyTable> StrategyTable::from_file(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return Result<StrategyTable>::err(
            config_error("cannot open strategy table " + path.toStdString() + ": " +
                         file.errorString().toStdString()));
    }

    QJsonParseError err{};
    const auto doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return Result<StrategyTable>::err(
            config_error("strategy table " + path.toStdString() + " is not a JSON object"));
    }
    return from_json(doc.object());
}

ResolverTag StrategyTable::select(const QString& path) const {
    const auto normalized = normalize_path(path);
    for (const auto& rule : rules_) {
        if (rule.matches(normalized)) {
            return rule.tag;
        }
    }
    return fallback_;
}

ResolverTag select_strategy(const QString& path) {
    static const StrategyTable table = StrategyTable::defaults();
    return table.select(path);
}

} // namespace quire::merge
