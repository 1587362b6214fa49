#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <sdkgate/schema/schema.hpp>
#include <sdkgate/schema/codec.hpp>

#include <filesystem>
#include <fstream>
#include "../test_main.cpp"

using namespace sdkgate;
using namespace sdkgate::schema;
using namespace sdkgate::test;
using Catch::Matchers::ContainsSubstring;

TEST_CASE("ast_schema loads calls and types", "[schema]") {
    auto api = test_schema();

    const auto* get_user = api->lookup_call("getUser");
    REQUIRE(get_user != nullptr);
    REQUIRE(get_user->name == "getUser");
    REQUIRE(get_user->arg_type == json{{"id", "UserId"}});
    REQUIRE(get_user->ret_type == "User");
    REQUIRE(get_user->declared_errors == std::vector<std::string>{"NotFound"});
    REQUIRE(get_user->declares("NotFound"));
    REQUIRE_FALSE(get_user->declares("Other"));

    REQUIRE(api->lookup_call("ping")->declared_errors.empty());
    REQUIRE(api->lookup_call("nope") == nullptr);

    REQUIRE(api->type_table().contains("Color"));
    REQUIRE(api->errors() == std::vector<std::string>{"NotFound", "Other", "Fatal"});
    REQUIRE(api->description() == test_ast());
}

TEST_CASE("ast_schema rejects malformed documents", "[schema]") {
    SECTION("not an object") {
        REQUIRE_THROWS_AS(ast_schema::from_json(json::array()), schema_error);
    }

    SECTION("missing function table") {
        REQUIRE_THROWS_AS(ast_schema::from_json(json{{"typeTable", json::object()}}), schema_error);
    }

    SECTION("function without args") {
        auto doc = json::parse(R"({"functionTable": {"f": {"ret": "void"}}})");
        REQUIRE_THROWS_WITH(ast_schema::from_json(doc), ContainsSubstring("'f'"));
    }

    SECTION("bad type definition") {
        auto doc = json::parse(R"({"typeTable": {"T": 5}, "functionTable": {}})");
        REQUIRE_THROWS_AS(ast_schema::from_json(doc), schema_error);
    }

    SECTION("throws annotation without a name") {
        auto doc = json::parse(R"({
            "functionTable": {"f": {"args": {}, "ret": "void"}},
            "annotations": {"fn.f": [{"type": "throws"}]}
        })");
        REQUIRE_THROWS_AS(ast_schema::from_json(doc), schema_error);
    }
}

TEST_CASE("ast_schema accepts error pairs and defaults the type table", "[schema]") {
    auto doc = json::parse(R"({
        "functionTable": {"f": {"args": {}, "ret": "void"}},
        "errors": [["NotFound", "json"], "Fatal"]
    })");
    auto api = ast_schema::from_json(doc);
    REQUIRE(api->errors() == std::vector<std::string>{"NotFound", "Fatal"});
    REQUIRE(api->type_table().is_object());
    REQUIRE(api->type_table().empty());
}

TEST_CASE("ast_schema from_file", "[schema]") {
    auto path = std::filesystem::temp_directory_path() / "sdkgate_test_ast.json";

    SECTION("valid file") {
        {
            std::ofstream out(path);
            out << test_ast().dump();
        }
        auto api = ast_schema::from_file(path);
        REQUIRE(api->lookup_call("echo") != nullptr);
    }

    SECTION("invalid json") {
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_WITH(ast_schema::from_file(path), ContainsSubstring("invalid AST file"));
    }

    SECTION("missing file") {
        REQUIRE_THROWS_WITH(ast_schema::from_file(path.string() + ".missing"),
                            ContainsSubstring("cannot open AST file"));
    }

    std::error_code ec;
    std::filesystem::remove(path, ec);
}

TEST_CASE("codec primitives", "[codec]") {
    json types = json::object();

    REQUIRE(decode(types, "p", "string", "x") == "x");
    REQUIRE(decode(types, "p", "bool", true) == true);
    REQUIRE(decode(types, "p", "int", 3.0) == 3);
    REQUIRE(decode(types, "p", "float", 1.5) == 1.5);
    REQUIRE(decode(types, "p", "uint", 0) == 0);
    REQUIRE(decode(types, "p", "json", json{{"any", 1}}) == json{{"any", 1}});
    REQUIRE(decode(types, "p", "void", nullptr).is_null());
    REQUIRE(decode(types, "p", "hex", "ABcd") == "abcd");
    REQUIRE(decode(types, "p", "uuid", "123E4567-E89B-12D3-A456-426614174000") ==
            "123e4567-e89b-12d3-a456-426614174000");
    REQUIRE(decode(types, "p", "date", "2024-02-29") == "2024-02-29");
    REQUIRE(decode(types, "p", "datetime", "2024-01-01T10:00:00.123Z") == "2024-01-01T10:00:00.123Z");
    REQUIRE(decode(types, "p", "email", "a@b.co") == "a@b.co");
    REQUIRE(decode(types, "p", "url", "https://example.com/x") == "https://example.com/x");
    REQUIRE(decode(types, "p", "base64", "aGk=") == "aGk=");

    REQUIRE_THROWS_AS(decode(types, "p", "int", 1.5), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "uint", -1), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "string", 1), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "hex", "abc"), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "date", "2023-02-29"), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "email", "nope"), codec_error);
    REQUIRE_THROWS_AS(decode(types, "p", "void", 1), codec_error);
}

TEST_CASE("codec error message names the path", "[codec]") {
    auto types = test_ast()["typeTable"];

    try {
        decode(types, "getUser.args", json{{"id", "UserId"}}, json{{"id", 42}});
        FAIL("expected codec_error");
    } catch (const codec_error& e) {
        REQUIRE(std::string(e.what()) == "Invalid type at 'getUser.args.id', expected uuid, got 42");
        REQUIRE(e.path() == "getUser.args.id");
        REQUIRE(e.type() == "Fatal");
    }
}

TEST_CASE("codec named types", "[codec]") {
    auto types = test_ast()["typeTable"];

    SECTION("struct drops unknown fields and keeps optional nulls") {
        json user = {
            {"id", "123e4567-e89b-12d3-a456-426614174000"},
            {"name", "Ana"},
            {"tags", {"a", "b"}},
            {"extra", true},
        };
        auto out = encode(types, "getUser.ret", "User", user);
        REQUIRE_FALSE(out.contains("extra"));
        REQUIRE(out["tags"] == json{"a", "b"});
        REQUIRE(out["nickname"].is_null());
    }

    SECTION("missing required field") {
        json user = {{"id", "123e4567-e89b-12d3-a456-426614174000"}, {"tags", json::array()}};
        REQUIRE_THROWS_WITH(decode(types, "u", "User", user),
                            "Invalid type at 'u.name', expected string, got null");
    }

    SECTION("array element path") {
        json user = {{"id", "123e4567-e89b-12d3-a456-426614174000"}, {"name", "x"}, {"tags", {"a", 1}}};
        REQUIRE_THROWS_WITH(decode(types, "u", "User", user), ContainsSubstring("'u.tags[1]'"));
    }

    SECTION("enum") {
        REQUIRE(decode(types, "c", "Color", "red") == "red");
        REQUIRE_THROWS_WITH(decode(types, "c", "Color", "pink"),
                            "Invalid type at 'c', expected Color, got \"pink\"");
    }

    SECTION("alias and optional") {
        REQUIRE(decode(types, "i", "UserId?", nullptr).is_null());
        REQUIRE_THROWS_AS(decode(types, "i", "UserId", "not-a-uuid"), codec_error);
    }

    SECTION("unknown type name") {
        REQUIRE_THROWS_WITH(decode(types, "x", "Missing", 1), ContainsSubstring("Unknown type 'Missing'"));
    }

    SECTION("void return encodes as null") {
        REQUIRE(encode(types, "paint.ret", "void", json("ignored")).is_null());
    }
}
