#include <catch2/catch_test_macros.hpp>
#include "merge/cell_merge.hpp"

#include <QJsonArray>
#include <QJsonDocument>

using namespace quire;
using namespace quire::merge;

namespace {

Edit value_edit(const QString& value, qint64 timestamp) {
    Edit edit;
    edit.value = value;
    edit.timestamp = timestamp;
    edit.target_path = {QStringLiteral("value")};
    return edit;
}

Cell make_cell(const QString& id, const QString& value, EditList edits = {}) {
    Cell cell;
    cell.id = id;
    cell.value = value;
    cell.kind = QStringLiteral("text");
    cell.edits = std::move(edits);
    return cell;
}

Document make_document(const QStringList& ids) {
    Document doc;
    for (const auto& id : ids) {
        doc.cells.push_back(make_cell(id, id.toLower(), {value_edit(id.toLower(), 1)}));
    }
    return doc;
}

QStringList ids_of(const Document& doc) {
    QStringList out;
    for (const auto& cell : doc.cells) {
        out.append(cell.id);
    }
    return out;
}

const Cell& cell_by_id(const Document& doc, const QString& id) {
    for (const auto& cell : doc.cells) {
        if (cell.id == id) return cell;
    }
    FAIL("no cell " << id.toStdString());
    return doc.cells.front();
}

} // namespace

TEST_CASE("merge_documents places a single insert next to its neighbour", "[unit][cell_merge]") {
    const auto merged = merge_documents(make_document({"A", "B", "C"}), make_document({"A", "X", "B", "C"}));
    REQUIRE(ids_of(merged) == QStringList{"A", "X", "B", "C"});
}

TEST_CASE("merge_documents keeps consecutive inserts together", "[unit][cell_merge]") {
    const auto merged = merge_documents(make_document({"A", "B"}), make_document({"A", "X", "Y", "B"}));
    REQUIRE(ids_of(merged) == QStringList{"A", "X", "Y", "B"});
}

TEST_CASE("merge_documents follows our order for shared cells", "[unit][cell_merge]") {
    const auto merged = merge_documents(make_document({"B", "A", "C"}), make_document({"A", "B", "C", "D"}));
    REQUIRE(ids_of(merged) == QStringList{"B", "A", "C", "D"});
}

TEST_CASE("merge_documents keeps cells only we have", "[unit][cell_merge]") {
    const auto merged = merge_documents(make_document({"A", "L", "B"}), make_document({"A", "B"}));
    REQUIRE(ids_of(merged) == QStringList{"A", "L", "B"});
}

TEST_CASE("merge_documents drops incoming cells without an id", "[unit][cell_merge]") {
    auto theirs = make_document({"A"});
    theirs.cells.push_back(make_cell(QString(), QStringLiteral("orphan")));

    const auto merged = merge_documents(make_document({"A"}), theirs);
    REQUIRE(merged.cells.size() == 1);
}

TEST_CASE("merge_documents keeps our document metadata", "[unit][cell_merge]") {
    auto ours = make_document({"A"});
    ours.metadata.insert(QStringLiteral("owner"), QStringLiteral("ours"));
    auto theirs = make_document({"A"});
    theirs.metadata.insert(QStringLiteral("owner"), QStringLiteral("theirs"));

    const auto merged = merge_documents(ours, theirs);
    REQUIRE(merged.metadata.value(QStringLiteral("owner")).toString() == QStringLiteral("ours"));
}

TEST_CASE("merge_matched_cells of an unmodified cell unions histories", "[unit][cell_merge]") {
    const auto ours = make_cell("A", "same", {value_edit("draft", 1), value_edit("same", 5)});
    const auto theirs = make_cell("A", "same", {value_edit("same", 5), value_edit("other draft", 2)});

    const auto merged = merge_matched_cells(ours, theirs);

    REQUIRE(merged.value == QStringLiteral("same"));
    REQUIRE(merged.edits.size() == 3);
    REQUIRE(merged.edits[0].timestamp == 1);
    REQUIRE(merged.edits[1].timestamp == 2);
    REQUIRE(merged.edits[2].timestamp == 5);
}

TEST_CASE("merge_matched_cells takes the later edit's value", "[unit][cell_merge]") {
    const auto ours = make_cell("A", "mine", {value_edit("base", 1), value_edit("mine", 5)});
    const auto theirs = make_cell("A", "yours", {value_edit("base", 1), value_edit("yours", 9)});

    REQUIRE(merge_matched_cells(ours, theirs).value == QStringLiteral("yours"));
    REQUIRE(merge_matched_cells(theirs, ours).value == QStringLiteral("yours"));
}

TEST_CASE("merge_matched_cells with no local history takes their value", "[unit][cell_merge]") {
    const auto ours = make_cell("A", "imported");
    const auto theirs = make_cell("A", "translated", {value_edit("translated", 3)});

    REQUIRE(merge_matched_cells(ours, theirs).value == QStringLiteral("translated"));
}

TEST_CASE("merge_matched_cells keeps an intentional empty value", "[unit][cell_merge]") {
    const auto ours = make_cell("A", "");
    const auto theirs = make_cell("A", "");

    REQUIRE(merge_matched_cells(ours, theirs).value == QStringLiteral(""));
}

TEST_CASE("merge_matched_cells resolves each edited field separately", "[unit][cell_merge]") {
    Edit label;
    label.value = QStringLiteral("1a");
    label.timestamp = 20;
    label.target_path = {QStringLiteral("metadata"), QStringLiteral("cellLabel")};

    auto ours = make_cell("A", "mine", {value_edit("mine", 10)});
    ours.label = QStringLiteral("1");
    auto theirs = make_cell("A", "mine", {value_edit("mine", 10), label});
    theirs.label = QStringLiteral("1a");

    const auto merged = merge_matched_cells(ours, theirs);

    // The label edit is newer but must not overwrite the text.
    REQUIRE(merged.value == QStringLiteral("mine"));
    REQUIRE(merged.label == QStringLiteral("1a"));
    REQUIRE(merged.edits.size() == 2);
}

TEST_CASE("merge_matched_cells keeps same-time imports of different fields apart", "[unit][cell_merge]") {
    Edit label;
    label.value = QStringLiteral("1");
    label.timestamp = 5;
    label.target_path = {QStringLiteral("metadata"), QStringLiteral("cellLabel")};

    const auto ours = make_cell("A", "1", {value_edit("1", 5)});
    auto theirs = make_cell("A", "1", {label});
    theirs.label = QStringLiteral("1");

    const auto merged = merge_matched_cells(ours, theirs);

    REQUIRE(merged.edits.size() == 2);
    REQUIRE(merged.value == QStringLiteral("1"));
    REQUIRE(merged.label == QStringLiteral("1"));
}

TEST_CASE("merge_attachments prefers the later update and merges validations", "[unit][cell_merge]") {
    const auto ours = QJsonDocument::fromJson(R"({
        "a1": {"type": "audio", "url": "old.webm", "updatedAt": 10,
               "validatedBy": [{"username": "ana", "creationTimestamp": 1, "updatedTimestamp": 1, "isDeleted": false}]},
        "a2": {"type": "audio", "url": "mine.webm", "updatedAt": 5}
    })").object();
    const auto theirs = QJsonDocument::fromJson(R"({
        "a1": {"type": "audio", "url": "new.webm", "updatedAt": 20,
               "validatedBy": [{"username": "bo", "creationTimestamp": 2, "updatedTimestamp": 2, "isDeleted": false}]},
        "a3": {"type": "audio", "url": "theirs.webm", "updatedAt": 7}
    })").object();

    const auto merged = merge_attachments(ours, theirs);

    REQUIRE(merged.size() == 3);
    const auto a1 = merged.value(QStringLiteral("a1")).toObject();
    REQUIRE(a1.value(QStringLiteral("url")).toString() == QStringLiteral("new.webm"));
    REQUIRE(a1.value(QStringLiteral("validatedBy")).toArray().size() == 2);
}

TEST_CASE("merge_matched_cells keeps a valid newer audio selection", "[unit][cell_merge]") {
    const auto attachments = QJsonDocument::fromJson(R"({
        "a1": {"type": "audio", "updatedAt": 1},
        "a2": {"type": "audio", "updatedAt": 1, "isDeleted": true}
    })").object();

    auto ours = make_cell("A", "x");
    ours.metadata_extra.insert(QStringLiteral("attachments"), attachments);
    ours.metadata_extra.insert(QStringLiteral("selectedAudioId"), QStringLiteral("a1"));
    ours.metadata_extra.insert(QStringLiteral("selectionTimestamp"), 10);

    SECTION("their selection is newer and valid") {
        auto theirs = ours;
        auto extra = theirs.metadata_extra.value(QStringLiteral("attachments")).toObject();
        extra.insert(QStringLiteral("a3"), QJsonObject{{QStringLiteral("type"), QStringLiteral("audio")}});
        theirs.metadata_extra.insert(QStringLiteral("attachments"), extra);
        theirs.metadata_extra.insert(QStringLiteral("selectedAudioId"), QStringLiteral("a3"));
        theirs.metadata_extra.insert(QStringLiteral("selectionTimestamp"), 20);

        const auto merged = merge_matched_cells(ours, theirs);
        REQUIRE(merged.metadata_extra.value(QStringLiteral("selectedAudioId")).toString() == QStringLiteral("a3"));
    }

    SECTION("their newer selection points at a deleted attachment") {
        auto theirs = ours;
        theirs.metadata_extra.insert(QStringLiteral("selectedAudioId"), QStringLiteral("a2"));
        theirs.metadata_extra.insert(QStringLiteral("selectionTimestamp"), 20);

        const auto merged = merge_matched_cells(ours, theirs);
        REQUIRE(merged.metadata_extra.value(QStringLiteral("selectedAudioId")).toString() == QStringLiteral("a1"));
        REQUIRE(merged.metadata_extra.value(QStringLiteral("selectionTimestamp")).toInt() == 10);
    }
}

TEST_CASE("resolve_structured_cells merges document text", "[unit][cell_merge]") {
    const auto ours = QStringLiteral(R"({"cells": [
        {"value": "a", "metadata": {"id": "A", "type": "text", "edits": [{"value": "a", "timestamp": 1, "editMap": ["value"]}]}}
    ], "metadata": {}})");
    const auto theirs = QStringLiteral(R"({"cells": [
        {"value": "a2", "metadata": {"id": "A", "type": "text", "edits": [
            {"value": "a", "timestamp": 1, "editMap": ["value"]},
            {"value": "a2", "timestamp": 2, "editMap": ["value"]}
        ]}},
        {"value": "b", "metadata": {"id": "B", "type": "text"}}
    ], "metadata": {}})");

    const auto resolved = resolve_structured_cells(ours, theirs);
    REQUIRE(resolved.is_ok());

    const auto doc = parse_document(resolved.unwrap());
    REQUIRE(doc.is_ok());
    REQUIRE(doc.unwrap().cells.size() == 2);
    REQUIRE(cell_by_id(doc.unwrap(), "A").value == QStringLiteral("a2"));
    REQUIRE(cell_by_id(doc.unwrap(), "A").edits.size() == 2);
}

TEST_CASE("resolve_structured_cells short-circuits empty sides", "[unit][cell_merge]") {
    const auto doc = QStringLiteral(R"({"cells": [], "metadata": {}})");

    REQUIRE(resolve_structured_cells(QStringLiteral("  \n"), doc).unwrap() == doc);
    REQUIRE(resolve_structured_cells(doc, QString()).unwrap() == doc);
}

TEST_CASE("resolve_structured_cells propagates parse errors", "[unit][cell_merge]") {
    const auto doc = QStringLiteral(R"({"cells": [], "metadata": {}})");

    const auto bad_theirs = resolve_structured_cells(doc, QStringLiteral("{not json"));
    REQUIRE(bad_theirs.is_err());
    REQUIRE(bad_theirs.unwrap_err().code == ErrorCode::ParseError);
    REQUIRE(bad_theirs.unwrap_err().message.rfind("theirs:", 0) == 0);

    const auto bad_ours = resolve_structured_cells(QStringLiteral("[1, 2]"), doc);
    REQUIRE(bad_ours.is_err());
    REQUIRE(bad_ours.unwrap_err().message.rfind("ours:", 0) == 0);
}
