/* Copyright (c) 2025 Stormfire Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE JsonReaderTest
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <filesystem>
#include <fstream>
#include <system_error>

using namespace Stormfire;

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TestBasicTypes) {
  JsonValue nullVal;
  BOOST_CHECK(nullVal.isNull());
  BOOST_CHECK_EQUAL(nullVal.getType(), JsonType::Null);

  JsonValue trueVal(true);
  BOOST_CHECK(trueVal.isBool());
  BOOST_CHECK_EQUAL(trueVal.asBool(), true);

  JsonValue intVal(42);
  JsonValue doubleVal(3.14);
  BOOST_CHECK(intVal.isNumber());
  BOOST_CHECK_EQUAL(intVal.asNumber(), 42.0);
  BOOST_CHECK_CLOSE(doubleVal.asNumber(), 3.14, 0.001);

  JsonValue stringVal("hello");
  BOOST_CHECK(stringVal.isString());
  BOOST_CHECK_EQUAL(stringVal.asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestObjectOperations) {
  JsonObject obj;
  obj["rain_count"] = JsonValue(800);
  obj["initial"] = JsonValue("rain");
  obj["vsync"] = JsonValue(true);

  JsonValue objectVal(obj);
  BOOST_CHECK(objectVal.isObject());
  BOOST_CHECK_EQUAL(objectVal.size(), 3u);
  BOOST_CHECK(objectVal.hasKey("rain_count"));
  BOOST_CHECK(!objectVal.hasKey("missing"));
  BOOST_CHECK_EQUAL(objectVal["rain_count"].asNumber(), 800.0);
  BOOST_CHECK_EQUAL(objectVal["initial"].asString(), "rain");
}

BOOST_AUTO_TEST_CASE(TestMissingLookupsYieldNull) {
  JsonValue number(5);
  BOOST_CHECK(number["anything"].isNull());
  BOOST_CHECK(number[3].isNull());
  BOOST_CHECK(number["a"]["b"]["c"].isNull());
  BOOST_CHECK_EQUAL(number.size(), 0u);
}

BOOST_AUTO_TEST_CASE(TestSafeAccessors) {
  JsonValue stringVal("test");
  JsonValue numberVal(42);

  BOOST_CHECK(stringVal.tryAsString().has_value());
  BOOST_CHECK_EQUAL(stringVal.tryAsString().value(), "test");
  BOOST_CHECK(numberVal.tryAsNumber().has_value());
  BOOST_CHECK_EQUAL(numberVal.tryAsNumber().value(), 42.0);

  BOOST_CHECK(!stringVal.tryAsNumber().has_value());
  BOOST_CHECK(!numberVal.tryAsString().has_value());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBasicParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("null"));
  BOOST_CHECK(reader.getRoot().isNull());

  BOOST_CHECK(reader.parse("false"));
  BOOST_CHECK_EQUAL(reader.getRoot().asBool(), false);

  BOOST_CHECK(reader.parse("-123"));
  BOOST_CHECK_EQUAL(reader.getRoot().asNumber(), -123.0);

  BOOST_CHECK(reader.parse("1.5e2"));
  BOOST_CHECK_CLOSE(reader.getRoot().asNumber(), 150.0, 0.001);

  BOOST_CHECK(reader.parse("\"hello\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello");
}

BOOST_AUTO_TEST_CASE(TestStringEscapes) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("\"hello\\nworld\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "hello\nworld");

  BOOST_CHECK(reader.parse("\"quote\\\"here\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "quote\"here");

  BOOST_CHECK(reader.parse("\"\\u0041\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "A");

  // Two-byte UTF-8
  BOOST_CHECK(reader.parse("\"\\u00e9\""));
  BOOST_CHECK_EQUAL(reader.getRoot().asString(), "\xC3\xA9");
}

BOOST_AUTO_TEST_CASE(TestArrayParsing) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("[]"));
  BOOST_CHECK(reader.getRoot().isArray());
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 0u);

  BOOST_CHECK(reader.parse("[1, \"hello\", true, null]"));
  const auto &mixed = reader.getRoot();
  BOOST_CHECK_EQUAL(mixed.size(), 4u);
  BOOST_CHECK_EQUAL(mixed[0].asNumber(), 1.0);
  BOOST_CHECK_EQUAL(mixed[1].asString(), "hello");
  BOOST_CHECK_EQUAL(mixed[2].asBool(), true);
  BOOST_CHECK(mixed[3].isNull());
}

BOOST_AUTO_TEST_CASE(TestSettingsDocument) {
  JsonReader reader;

  BOOST_CHECK(reader.parse(R"({
        "display": { "width": 1280, "height": 720, "vsync": true },
        "missiles": { "damage": 120, "explosion_duration": 0.6 },
        "ground_fire": { "radius_scale": 0.8 }
    })"));
  const auto &root = reader.getRoot();

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 3u);
  BOOST_CHECK_EQUAL(root["display"]["width"].asNumber(), 1280.0);
  BOOST_CHECK_EQUAL(root["display"]["vsync"].asBool(), true);
  BOOST_CHECK_CLOSE(root["missiles"]["explosion_duration"].asNumber(), 0.6, 0.001);
  BOOST_CHECK_CLOSE(root["ground_fire"]["radius_scale"].asNumber(), 0.8, 0.001);
}

BOOST_AUTO_TEST_CASE(TestWhitespace) {
  JsonReader reader;

  BOOST_CHECK(reader.parse("  \t\n  42  \r\n  "));
  BOOST_CHECK_EQUAL(reader.getRoot().asNumber(), 42.0);

  BOOST_CHECK(reader.parse("[\n  1,\n  2,\n  3\n]"));
  BOOST_CHECK_EQUAL(reader.getRoot().size(), 3u);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestInvalidJSON) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("hello"));
  BOOST_CHECK(!reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("{\"key\": \"value\",}"));
  BOOST_CHECK(!reader.parse("[1, 2, 3,]"));
  BOOST_CHECK(!reader.parse("{\"key\": \"value\""));
  BOOST_CHECK(!reader.parse("[1, 2, 3"));
  BOOST_CHECK(!reader.parse("123."));
  BOOST_CHECK(!reader.parse("\"hello"));
  BOOST_CHECK(!reader.parse("\"hello\\x\""));
  BOOST_CHECK(!reader.parse("42 43"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestMalformedStructures) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\"key\" \"value\"}"));
  BOOST_CHECK(!reader.parse("{42: \"value\"}"));
  BOOST_CHECK(!reader.parse("{\"key1\": 1 \"key2\": 2}"));
  BOOST_CHECK(!reader.parse("[1 2 3]"));
  BOOST_CHECK(!reader.parse("truee"));
  BOOST_CHECK(!reader.parse("nul"));
}

BOOST_AUTO_TEST_CASE(TestErrorReportsPosition) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"a\": 1,\n  \"b\" 2\n}"));
  BOOST_CHECK_NE(reader.getLastError().find("line 3"), std::string::npos);
  BOOST_CHECK(reader.getRoot().isNull());
}

BOOST_AUTO_TEST_CASE(TestSuccessfulParseClearsError) {
  JsonReader reader;
  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(reader.parse("{}"));
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_CASE(TestNestingLimit) {
  JsonReader reader;
  std::string deep(100, '[');
  deep += std::string(100, ']');
  BOOST_CHECK(!reader.parse(deep));

  std::string shallow(10, '[');
  shallow += std::string(10, ']');
  BOOST_CHECK(reader.parse(shallow));
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(TestFileLoading) {
  const std::string filename =
      (std::filesystem::temp_directory_path() / "stormfire_json_reader.json").string();
  {
    std::ofstream file(filename);
    file << R"({ "atmosphere": { "rain_count": 800, "initial": "snow" } })";
  }

  JsonReader reader;
  BOOST_CHECK(reader.loadFromFile(filename));
  const auto &root = reader.getRoot();
  BOOST_CHECK_EQUAL(root["atmosphere"]["rain_count"].asNumber(), 800.0);
  BOOST_CHECK_EQUAL(root["atmosphere"]["initial"].asString(), "snow");

  std::error_code ec;
  std::filesystem::remove(filename, ec);
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  JsonReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_file.json"));
  BOOST_CHECK(!reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()
