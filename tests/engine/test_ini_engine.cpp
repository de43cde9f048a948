#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "polyglot/core/KeyEncoder.hpp"
#include "polyglot/engine/EngineRegistry.hpp"
#include "polyglot/engine/IniDocument.hpp"
#include "polyglot/model/TypeRegistry.hpp"
#include "polyglot/model/Widget.hpp"
#include "support/TempDirectory.hpp"

#include <memory>
#include <string>

using namespace polyglot;
using model::Widget;

namespace {

struct Fixture {
    model::TypeRegistry types;
    engine::EngineRegistry engines;

    Fixture() {
        types.declareWidget("Form", {"Caption"});
        types.declareWidget("Button", {"Caption", "Hint"});
        types.declareWidget("Action", {"Caption"});
        types.declareWidget("ListBox", {"Hint"}, {"Items"});
        engine::registerBuiltinEngines(engines);
    }

    std::unique_ptr<Widget> makeTree(const std::string &caption = "OK") const {
        auto root = std::make_unique<Widget>(types.get("Form"), "Form1");
        root->setText("Caption", "Main");
        auto &button = root->add<Widget>(types.get("Button"), "Button1");
        button.setText("Caption", caption);
        button.setText("Hint", "Line one\nLine two");
        auto &list = root->add<Widget>(types.get("ListBox"), "ListBox1");
        list.setList("Items", {"a", "b"});
        return root;
    }
};

Widget &child(Widget &root, const std::string &name) {
    auto *found = dynamic_cast<Widget *>(root.findDescendant(name));
    REQUIRE(found != nullptr);
    return *found;
}

} // namespace

TEST_CASE("Hierarchical INI writes one section per qualified name and reloads it") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini");
    const auto file = directory.path() / "fr" / "Form1.lng";
    std::filesystem::create_directories(file.parent_path());

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    const auto tree = fixture.makeTree();
    REQUIRE(engine->save(*tree, file).succeeded());

    const auto document = engine::IniDocument::fromFile(file);
    CHECK(document.readString("Form1.Button1", "Caption") == "OK");
    CHECK(document.readString("Form1.Button1", "Hint") == "Line one~~Line two");
    CHECK(document.readString("Form1", "Caption") == "Main");
    CHECK_FALSE(document.read("Form1.ListBox1", "Items").has_value());
    CHECK_FALSE(document.read("Form1.Button1", "Name").has_value());

    auto fresh = fixture.makeTree("");
    child(*fresh, "Button1").setText("Hint", "");
    REQUIRE(engine->load(fresh.get(), file).succeeded());
    CHECK(child(*fresh, "Button1").text("Caption") == "OK");
    CHECK(child(*fresh, "Button1").text("Hint") == "Line one\nLine two");
}

TEST_CASE("Flat INI stores qualified keys in a single section") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_flat");
    const auto file = directory.path() / "Form1.clng";

    auto engine = fixture.engines.create(core::PersistenceFormat::IniFlat);
    const auto tree = fixture.makeTree();
    REQUIRE(engine->save(*tree, file).succeeded());

    const auto document = engine::IniDocument::fromFile(file);
    REQUIRE(document.sections().size() == 1);
    CHECK(document.sections().front() == "UIElements");
    CHECK(document.readString("UIElements", "Form1.Button1.Caption") == "OK");
    CHECK(document.readString("UIElements", "Form1.Caption") == "Main");

    auto fresh = fixture.makeTree("changed");
    REQUIRE(engine->load(fresh.get(), file).succeeded());
    CHECK(child(*fresh, "Button1").text("Caption") == "OK");
}

TEST_CASE("INI runtime strings are loaded into the store and kept on save") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_strings");
    const auto file = directory.write("Form1.lng", "[Strings]\n" + core::KeyEncoder::makeKey("Hello") +
                                                       "=Bonjour~~tout le monde\n");

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    core::TranslationStore store;
    const auto tree = fixture.makeTree();
    REQUIRE(engine->load(tree.get(), file, &store).succeeded());

    REQUIRE(store.tryGet("Hello").has_value());
    CHECK(*store.tryGet("Hello") == "Bonjour\ntout le monde");
    CHECK(engine->translate("Hello") == "Bonjour\ntout le monde");
    CHECK(engine->translate("Unknown") == "Unknown");
    CHECK(engine->runtimeStrings().size() == 1);

    REQUIRE(engine->save(*tree, file).succeeded());
    const auto document = engine::IniDocument::fromFile(file);
    CHECK(document.hasSection("strings"));
    CHECK(document.hasSection("Form1.Button1"));
}

TEST_CASE("Action-bound captions are saved but not overwritten when excluded") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_action");
    const auto file = directory.path() / "Form1.lng";

    auto tree = fixture.makeTree("Saved");
    auto &action = tree->add<Widget>(fixture.types.get("Action"), "actOpen");
    child(*tree, "Button1").setAction(&action);

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    engine->options().excludeOnAction = true;
    REQUIRE(engine->save(*tree, file).succeeded());
    CHECK(engine::IniDocument::fromFile(file).readString("Form1.Button1", "Caption") == "Saved");

    child(*tree, "Button1").setText("Caption", "From action");
    REQUIRE(engine->load(tree.get(), file).succeeded());
    CHECK(child(*tree, "Button1").text("Caption") == "From action");
    CHECK(child(*tree, "Button1").text("Hint") == "Line one\nLine two");

    engine->options().excludeOnAction = false;
    REQUIRE(engine->load(tree.get(), file).succeeded());
    CHECK(child(*tree, "Button1").text("Caption") == "Saved");
}

TEST_CASE("Excluded types and attributes are neither saved nor loaded") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_exclusions");
    const auto file = directory.path() / "Form1.lng";

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    engine->options().excludedTypes = {"button"};
    engine->options().excludedAttributes = {"Hint"};

    const auto tree = fixture.makeTree();
    REQUIRE(engine->save(*tree, file).succeeded());
    const auto document = engine::IniDocument::fromFile(file);
    CHECK_FALSE(document.hasSection("Form1.Button1"));
    CHECK(document.hasSection("Form1"));

    directory.write("Form1.lng", "[Form1.Button1]\nCaption=Loaded\nHint=Loaded\n");
    engine->options().excludedTypes.clear();
    REQUIRE(engine->load(tree.get(), file).succeeded());
    CHECK(child(*tree, "Button1").text("Caption") == "Loaded");
    CHECK(child(*tree, "Button1").text("Hint") == "Line one\nLine two");
}

TEST_CASE("Separator values are never written") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_separator");
    const auto file = directory.path() / "Form1.lng";

    auto tree = fixture.makeTree("-");
    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    REQUIRE(engine->save(*tree, file).succeeded());
    CHECK_FALSE(engine::IniDocument::fromFile(file).read("Form1.Button1", "Caption").has_value());
}

TEST_CASE("Unknown qualified names fall back to a search by leaf name") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_fallback");
    const auto file = directory.write("Form1.lng", "[OldForm.Panel.Button1]\nCaption=Moved\n"
                                                   "[Nowhere.Missing]\nCaption=Ignored\n");

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    auto tree = fixture.makeTree();
    REQUIRE(engine->load(tree.get(), file).succeeded());
    CHECK(child(*tree, "Button1").text("Caption") == "Moved");
    CHECK(tree->text("Caption") == "Main");
}

TEST_CASE("Load reports a missing file unless auto-create is enabled") {
    Fixture fixture;
    testing::TempDirectory directory("polyglot_ini_missing");
    const auto file = directory.path() / "de" / "Form1.lng";

    auto engine = fixture.engines.create(core::PersistenceFormat::Ini);
    auto tree = fixture.makeTree();

    const auto missing = engine->load(tree.get(), file);
    CHECK(missing.failure == core::FailureKind::Domain);
    CHECK_FALSE(std::filesystem::exists(file));

    CHECK(engine->load(tree.get(), {}).failure == core::FailureKind::Configuration);

    engine->options().createIfMissing = true;
    REQUIRE(engine->load(tree.get(), file).succeeded());
    REQUIRE(std::filesystem::exists(file));
    CHECK(engine::IniDocument::fromFile(file).readString("Form1.Button1", "Caption") == "OK");
    CHECK(child(*tree, "Button1").text("Caption") == "OK");
}
