#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "polyglot/core/KeyEncoder.hpp"
#include "polyglot/engine/EngineRegistry.hpp"
#include "polyglot/model/TypeRegistry.hpp"
#include "polyglot/model/Widget.hpp"
#include "support/TempDirectory.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

using namespace polyglot;
using model::Widget;

namespace {

struct Fixture {
    model::TypeRegistry types;
    std::unique_ptr<engine::TranslationEngine> engine;

    Fixture() {
        types.declareWidget("Form", {"Caption"});
        types.declareWidget("Panel", {"Hint"});
        types.declareWidget("Button", {"Caption"});
        types.declareWidget("ListBox", {}, {"Items"});

        engine::EngineRegistry engines;
        engine::registerBuiltinEngines(engines);
        engine = engines.create(core::PersistenceFormat::Json);
    }

    std::unique_ptr<Widget> makeTree() const {
        auto root = std::make_unique<Widget>(types.get("Form"), "Form1");
        root->setText("Caption", "Main");
        auto &panel = root->add<Widget>(types.get("Panel"), "Panel1");
        panel.setText("Hint", "Group");
        auto &button = panel.add<Widget>(types.get("Button"), "Button1");
        button.setText("Caption", "OK");
        auto &list = root->add<Widget>(types.get("ListBox"), "ListBox1");
        list.setList("Items", {"first", "multi\nline", "with \xC2\xA7 sign"});
        return root;
    }
};

Widget &child(Widget &root, const std::string &name) {
    auto *found = dynamic_cast<Widget *>(root.findDescendant(name));
    REQUIRE(found != nullptr);
    return *found;
}

nlohmann::json readJson(const std::filesystem::path &file) {
    return nlohmann::json::parse(testing::TempDirectory::read(file));
}

} // namespace

TEST_CASE("JSON engine nests one object per component") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json");
    const auto file = directory.path() / "Form1.json";

    const auto tree = fixture.makeTree();
    REQUIRE(fixture.engine->save(*tree, file).succeeded());

    const auto json = readJson(file);
    REQUIRE(json.contains("Form1"));
    CHECK(json["Form1"]["Caption"] == "Main");
    CHECK(json["Form1"]["Panel1"]["Hint"] == "Group");
    CHECK(json["Form1"]["Panel1"]["Button1"]["Caption"] == "OK");
    CHECK_FALSE(json["Form1"]["Panel1"]["Button1"].contains("Name"));
    CHECK(json["Form1"]["ListBox1"]["Items"] == "first\xC2\xA7multi[LF]line\xC2\xA7with [SECT] sign");
}

TEST_CASE("JSON engine restores attributes and lists") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_load");
    const auto file = directory.path() / "Form1.json";

    const auto source = fixture.makeTree();
    REQUIRE(fixture.engine->save(*source, file).succeeded());

    auto target = fixture.makeTree();
    child(*target, "Button1").setText("Caption", "");
    child(*target, "ListBox1").setList("Items", {});
    target->setText("Caption", "");

    REQUIRE(fixture.engine->load(target.get(), file).succeeded());
    CHECK(target->text("Caption") == "Main");
    CHECK(child(*target, "Button1").text("Caption") == "OK");
    CHECK(child(*target, "ListBox1").list("Items") ==
          std::vector<std::string>{"first", "multi\nline", "with \xC2\xA7 sign"});
}

TEST_CASE("JSON engine reads runtime strings and keeps them on save") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_strings");
    const auto key = core::KeyEncoder::makeKey("Hello");
    const auto file = directory.write("Form1.json", R"({"Strings": {")" + key +
                                                        R"(": "Hallo"}, "Form1": {"Panel1": {"Button1": {"Caption": "Ja"}}}})");

    auto tree = fixture.makeTree();
    core::TranslationStore store;
    REQUIRE(fixture.engine->load(tree.get(), file, &store).succeeded());
    CHECK(*store.tryGet("Hello") == "Hallo");
    CHECK(fixture.engine->translate("Hello") == "Hallo");
    CHECK(child(*tree, "Button1").text("Caption") == "Ja");

    REQUIRE(fixture.engine->save(*tree, file).succeeded());
    const auto json = readJson(file);
    CHECK(json["Strings"][key] == "Hallo");
    CHECK(json["Form1"]["Panel1"]["Button1"]["Caption"] == "Ja");
}

TEST_CASE("JSON engine keeps unrelated top-level objects on save") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_foreign");
    const auto file = directory.write(
        "Form1.json", R"({"Notes": {"author": "x"}, "Strings": {"abc": "Hallo"}, "Form1": {"Caption": "Old"}})");

    const auto tree = fixture.makeTree();
    REQUIRE(fixture.engine->save(*tree, file).succeeded());
    const auto json = readJson(file);
    CHECK(json["Notes"]["author"] == "x");
    CHECK(json["Strings"]["abc"] == "Hallo");
    CHECK(json["Form1"]["Caption"] == "Main");
}

TEST_CASE("JSON engine stores an empty list and a single empty item alike") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_empty_list");
    const auto file = directory.path() / "Form1.json";

    auto tree = fixture.makeTree();
    child(*tree, "ListBox1").setList("Items", {""});
    REQUIRE(fixture.engine->save(*tree, file).succeeded());
    CHECK(readJson(file)["Form1"]["ListBox1"]["Items"] == "");

    child(*tree, "ListBox1").setList("Items", {});
    REQUIRE(fixture.engine->save(*tree, file).succeeded());
    CHECK(readJson(file)["Form1"]["ListBox1"]["Items"] == "");

    child(*tree, "ListBox1").setList("Items", {"stale"});
    REQUIRE(fixture.engine->load(tree.get(), file).succeeded());
    CHECK(child(*tree, "ListBox1").list("Items").empty());
}

TEST_CASE("JSON engine skips the subtree of an excluded type") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_excluded");
    const auto file = directory.write(
        "Form1.json", R"({"Form1": {"Caption": "New", "Panel1": {"Hint": "X", "Button1": {"Caption": "Y"}}}})");

    fixture.engine->options().excludedTypes = {"Panel"};
    auto tree = fixture.makeTree();
    REQUIRE(fixture.engine->load(tree.get(), file).succeeded());
    CHECK(tree->text("Caption") == "New");
    CHECK(child(*tree, "Panel1").text("Hint") == "Group");
    CHECK(child(*tree, "Button1").text("Caption") == "OK");

    REQUIRE(fixture.engine->save(*tree, file).succeeded());
    CHECK_FALSE(readJson(file)["Form1"].contains("Panel1"));
}

TEST_CASE("JSON engine propagates parse failures") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_json_invalid");
    const auto broken = directory.write("broken.json", "{ not json");
    const auto array = directory.write("array.json", "[1, 2]");

    auto tree = fixture.makeTree();
    CHECK_THROWS_AS(static_cast<void>(fixture.engine->load(tree.get(), broken)), nlohmann::json::parse_error);
    CHECK_THROWS_AS(static_cast<void>(fixture.engine->load(tree.get(), array)), std::runtime_error);
}
