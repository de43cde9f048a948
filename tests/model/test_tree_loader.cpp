#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "polyglot/model/TreeLoader.hpp"
#include "polyglot/model/Widget.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

using namespace polyglot::model;

TEST_CASE("TreeLoader builds a widget tree with attributes, lists and actions") {
    TypeRegistry registry;
    TreeLoader loader(registry);

    const auto root = loader.loadFromString(R"({
        "types": {
            "Form": ["Caption"],
            "Button": ["Caption", "Hint"],
            "ListBox": {"text": ["Hint"], "lists": ["Items"]},
            "Action": ["Caption"]
        },
        "root": {
            "type": "Form", "name": "Form1", "attributes": {"Caption": "Main"},
            "children": [
                {"type": "Action", "name": "actOpen", "attributes": {"Caption": "Open"}},
                {"type": "Button", "name": "Button1", "action": "actOpen",
                 "attributes": {"Caption": "OK", "Hint": "Confirm"}},
                {"type": "ListBox", "name": "ListBox1", "attributes": {"Items": ["one", "two"]}}
            ]
        }
    })");

    REQUIRE(root != nullptr);
    CHECK(root->name() == "Form1");
    CHECK(root->typeName() == "Form");
    REQUIRE(root->components().size() == 3);

    auto *button = dynamic_cast<Widget *>(root->findComponent("Button1"));
    REQUIRE(button != nullptr);
    CHECK(button->text("Caption") == "OK");
    CHECK(button->action() == root->findComponent("actOpen"));

    auto *list = dynamic_cast<Widget *>(root->findComponent("ListBox1"));
    REQUIRE(list != nullptr);
    CHECK(list->list("Items") == std::vector<std::string>{"one", "two"});

    const auto lines = describeAttributes(*root);
    CHECK(lines.front() == "Form1.Caption=Main");
    CHECK(std::find(lines.begin(), lines.end(), "Form1.Button1.Hint=Confirm") != lines.end());
    CHECK(std::find(lines.begin(), lines.end(), "Form1.ListBox1.Items=one|two") != lines.end());
}

TEST_CASE("TreeLoader declares unknown node types without attributes") {
    TypeRegistry registry;
    TreeLoader loader(registry);

    const auto root = loader.loadFromString(R"({"root": {"type": "Frame", "name": "Frame1"}})");
    CHECK(registry.contains("Frame"));
    CHECK(root->type().attributes.size() == 1);
}

TEST_CASE("TreeLoader reports invalid documents") {
    TypeRegistry registry;
    TreeLoader loader(registry);

    CHECK_THROWS_WITH_AS(loader.loadFromString(R"({"types": {}})"), doctest::Contains("\"root\""),
                         std::runtime_error);
    CHECK_THROWS_WITH_AS(loader.loadFromString(R"({"root": {"type": "Form"}})"),
                         doctest::Contains("non-empty name"), std::runtime_error);
    CHECK_THROWS_WITH_AS(loader.loadFromString(R"({"root": {"type": 5, "name": "Form1"}})"),
                         doctest::Contains("\"type\" must be a string"), std::runtime_error);
    CHECK_THROWS_WITH_AS(loader.loadFromString(R"({"root": {"type": "Form", "name": ["Form1"]}})"),
                         doctest::Contains("\"name\" must be a string"), std::runtime_error);
    CHECK_THROWS_WITH_AS(
        loader.loadFromString(R"({"types": {"Form": []}, "root": {"type": "Form", "name": "F", "attributes": {"Caption": "x"}}})"),
        doctest::Contains("undeclared attribute"), std::runtime_error);
    CHECK_THROWS_WITH_AS(
        loader.loadFromString(R"({"root": {"type": "Form", "name": "F", "children": [{"type": "B", "name": "b", "action": "nope"}]}})"),
        doctest::Contains("unknown action"), std::runtime_error);
}
