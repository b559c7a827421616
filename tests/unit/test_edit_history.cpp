#include <catch2/catch_test_macros.hpp>
#include "merge/edit_history.hpp"

#include <QJsonDocument>

using namespace quire;
using namespace quire::merge;

namespace {

Edit make_edit(const QString& value, qint64 timestamp,
               QStringList path = {QStringLiteral("value")}) {
    Edit edit;
    edit.value = value;
    edit.timestamp = timestamp;
    edit.target_path = std::move(path);
    return edit;
}

QJsonObject object_from(const char* json) {
    return QJsonDocument::fromJson(QByteArray(json)).object();
}

} // namespace

TEST_CASE("parse_edit reads the modelled fields", "[unit][edit_history]") {
    const auto parsed = parse_edit(object_from(R"({
        "value": "hello", "timestamp": 1700, "editMap": ["value"],
        "type": "llm-generation", "author": "ana", "preview": true
    })"));

    REQUIRE(parsed.is_ok());
    const auto& edit = parsed.unwrap();
    REQUIRE(edit.value.toString() == QStringLiteral("hello"));
    REQUIRE(edit.timestamp == 1700);
    REQUIRE(edit.target_path == QStringList{QStringLiteral("value")});
    REQUIRE(edit.kind == EditKind::Generated);
    REQUIRE(edit.author == QStringLiteral("ana"));
    REQUIRE(edit.extra.value(QStringLiteral("preview")).toBool());
}

TEST_CASE("parse_edit migrates legacy cellValue edits", "[unit][edit_history]") {
    const auto parsed = parse_edit(object_from(R"({"cellValue": "old text", "timestamp": 5})"));

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().value.toString() == QStringLiteral("old text"));
    REQUIRE(parsed.unwrap().target_path == QStringList{QStringLiteral("value")});
    REQUIRE(parsed.unwrap().kind == EditKind::UserEdit);

    const auto json = edit_to_json(parsed.unwrap());
    REQUIRE(json.value(QStringLiteral("value")).toString() == QStringLiteral("old text"));
    REQUIRE_FALSE(json.contains(QStringLiteral("cellValue")));
}

TEST_CASE("parse_edit rejects malformed edits", "[unit][edit_history]") {
    SECTION("missing timestamp") {
        const auto parsed = parse_edit(object_from(R"({"value": "x"})"));
        REQUIRE(parsed.is_err());
        REQUIRE(parsed.unwrap_err().code == ErrorCode::ParseError);
    }
    SECTION("fractional timestamp") {
        REQUIRE(parse_edit(object_from(R"({"value": "x", "timestamp": 1700.5})")).is_err());
    }
    SECTION("timestamp beyond the 64-bit range") {
        REQUIRE(parse_edit(object_from(R"({"value": "x", "timestamp": 1e19})")).is_err());
    }
    SECTION("unknown type") {
        REQUIRE(parse_edit(object_from(R"({"value": "x", "timestamp": 1, "type": "telepathy"})")).is_err());
    }
    SECTION("non-string editMap segment") {
        REQUIRE(parse_edit(object_from(R"({"value": "x", "timestamp": 1, "editMap": ["value", 3]})")).is_err());
    }
    SECTION("malformed validation entry") {
        REQUIRE(parse_edit(object_from(R"({"value": "x", "timestamp": 1, "validatedBy": [{"username": "a"}]})"))
                    .is_err());
    }
}

TEST_CASE("parse_validations stamps legacy username entries", "[unit][edit_history]") {
    const auto parsed = parse_validations(QJsonArray{QStringLiteral("ana")}, 42);

    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.unwrap().size() == 1);
    REQUIRE(parsed.unwrap()[0] == ValidationEntry{QStringLiteral("ana"), 42, 42, false});
}

TEST_CASE("merge_validations keeps the newest entry per user", "[unit][edit_history]") {
    const std::vector<ValidationEntry> ours{{QStringLiteral("bo"), 10, 20, false},
                                            {QStringLiteral("ana"), 5, 5, false}};
    const std::vector<ValidationEntry> theirs{{QStringLiteral("bo"), 12, 30, true}};

    const auto merged = merge_validations(ours, theirs);

    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].username == QStringLiteral("ana"));
    REQUIRE(merged[1] == ValidationEntry{QStringLiteral("bo"), 10, 30, true});
}

TEST_CASE("merge_edit_histories unions, dedups and sorts", "[unit][edit_history]") {
    const EditList a{make_edit("one", 1), make_edit("three", 3)};
    const EditList b{make_edit("two", 2), make_edit("three", 3)};

    const auto merged = merge_edit_histories(a, b);

    REQUIRE(merged.size() == 3);
    REQUIRE(merged[0].timestamp == 1);
    REQUIRE(merged[1].timestamp == 2);
    REQUIRE(merged[2].timestamp == 3);
}

TEST_CASE("merge_edit_histories keeps same-timestamp edits with different values", "[unit][edit_history]") {
    const auto merged = merge_edit_histories({make_edit("mine", 7)}, {make_edit("yours", 7)});

    REQUIRE(merged.size() == 2);
    REQUIRE(merged[0].value.toString() == QStringLiteral("mine"));
    REQUIRE(merged[1].value.toString() == QStringLiteral("yours"));
}

TEST_CASE("merge_edit_histories keeps same-timestamp, same-value edits of different fields", "[unit][edit_history]") {
    const auto label_path = QStringList{QStringLiteral("metadata"), QStringLiteral("cellLabel")};
    const auto merged = merge_edit_histories({make_edit("1", 5)}, {make_edit("1", 5, label_path)});

    REQUIRE(merged.size() == 2);
    REQUIRE(effective_target_path(merged[0]) == QStringList{QStringLiteral("value")});
    REQUIRE(effective_target_path(merged[1]) == label_path);
}

TEST_CASE("merge_edit_histories treats an empty path as the value path", "[unit][edit_history]") {
    const auto merged = merge_edit_histories({make_edit("1", 5)}, {make_edit("1", 5, {})});
    REQUIRE(merged.size() == 1);
}

TEST_CASE("merge_edit_histories folds validations of duplicate edits", "[unit][edit_history]") {
    auto ours = make_edit("text", 4);
    ours.validated_by = {{QStringLiteral("ana"), 4, 4, false}};
    auto theirs = make_edit("text", 4);
    theirs.validated_by = {{QStringLiteral("bo"), 6, 6, false}};

    const auto merged = merge_edit_histories({ours}, {theirs});

    REQUIRE(merged.size() == 1);
    REQUIRE(merged[0].validated_by.size() == 2);
}

TEST_CASE("select_winning_value with both histories empty uses the fallback", "[unit][edit_history]") {
    const auto value = select_winning_value({}, {}, {}, QStringLiteral(""), QStringLiteral("theirs"));
    REQUIRE(value.toString() == QStringLiteral(""));
    REQUIRE(value.isString());
}

TEST_CASE("select_winning_value with only their history takes their current value", "[unit][edit_history]") {
    const EditList theirs{make_edit("from history", 9)};
    const auto value = select_winning_value({}, theirs, theirs, QStringLiteral("ours"),
                                            QStringLiteral("their current"));
    REQUIRE(value.toString() == QStringLiteral("their current"));
}

TEST_CASE("select_winning_value with only our history follows it", "[unit][edit_history]") {
    const EditList ours{make_edit("a", 1), make_edit("b", 2)};
    const auto value = select_winning_value(ours, {}, ours, QStringLiteral("stale"), QStringLiteral("x"));
    REQUIRE(value.toString() == QStringLiteral("b"));
}

TEST_CASE("select_winning_value with disjoint histories takes the latest edit", "[unit][edit_history]") {
    const EditList ours{make_edit("mine", 5)};
    const EditList theirs{make_edit("yours", 8)};
    const auto merged = merge_edit_histories(ours, theirs);

    const auto value = select_winning_value(ours, theirs, merged, QStringLiteral("mine"), QStringLiteral("yours"));
    REQUIRE(value.toString() == QStringLiteral("yours"));
}

TEST_CASE("select_winning_value with a shared winning edit returns its value", "[unit][edit_history]") {
    const EditList ours{make_edit("base", 1), make_edit("final", 10)};
    const EditList theirs{make_edit("base", 1), make_edit("final", 10)};
    const auto merged = merge_edit_histories(ours, theirs);

    const auto value = select_winning_value(ours, theirs, merged, QStringLiteral("x"), QStringLiteral("y"));
    REQUIRE(value.toString() == QStringLiteral("final"));
}

TEST_CASE("select_winning_value prefers ours on equal timestamps", "[unit][edit_history]") {
    const EditList ours{make_edit("same", 3)};
    const EditList theirs{make_edit("same", 3)};
    const auto merged = merge_edit_histories(ours, theirs);

    const auto value = select_winning_value(ours, theirs, merged, QStringLiteral("fallback"),
                                            QStringLiteral("their current"));
    REQUIRE(value.toString() == QStringLiteral("same"));
}

TEST_CASE("select_winning_value falls back when no side produced the latest value", "[unit][edit_history]") {
    const EditList ours{make_edit("mine", 1)};
    const EditList theirs{make_edit("yours", 2)};
    const EditList merged{make_edit("mine", 1), make_edit("elsewhere", 3)};

    const auto value = select_winning_value(ours, theirs, merged, QStringLiteral("fallback"), QStringLiteral("y"));
    REQUIRE(value.toString() == QStringLiteral("fallback"));
}
