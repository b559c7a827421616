#include <catch2/catch_test_macros.hpp>
#include "merge/line_merge.hpp"

#include <QSet>
#include <QStringList>

using namespace quire::merge;

TEST_CASE("resolve_keep_ours ignores theirs", "[unit][line_merge]") {
    REQUIRE(resolve_keep_ours(QStringLiteral("mine"), QStringLiteral("yours")) == QStringLiteral("mine"));
    REQUIRE(resolve_keep_ours(QString(), QStringLiteral("yours")).isEmpty());
}

TEST_CASE("resolve_line_set_union keeps every distinct line once", "[unit][line_merge]") {
    const auto merged = resolve_line_set_union(QStringLiteral("a\nb"), QStringLiteral("b\nc"));
    const auto lines = merged.split(QLatin1Char('\n'));

    REQUIRE(lines.size() == 3);
    REQUIRE(QSet<QString>(lines.begin(), lines.end()) == QSet<QString>{"a", "b", "c"});
}

TEST_CASE("resolve_line_set_union drops empty lines", "[unit][line_merge]") {
    const auto merged = resolve_line_set_union(QStringLiteral("a\n\n\nb\n"), QStringLiteral("\n"));
    REQUIRE(merged == QStringLiteral("a\nb"));
}

TEST_CASE("resolve_line_set_union of empty inputs is empty", "[unit][line_merge]") {
    REQUIRE(resolve_line_set_union(QString(), QString()).isEmpty());
}

TEST_CASE("resolve_line_set_union keeps JSON lines verbatim", "[unit][line_merge]") {
    const auto ours = QStringLiteral(R"({"word":"logos","count":1})");
    const auto theirs = QStringLiteral("{\"word\":\"logos\",\"count\":1}\n{\"word\":\"rhema\",\"count\":2}");

    const auto merged = resolve_line_set_union(ours, theirs);
    REQUIRE(merged.split(QLatin1Char('\n')).size() == 2);
}
