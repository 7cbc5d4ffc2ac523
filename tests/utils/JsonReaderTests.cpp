/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#define BOOST_TEST_MODULE JsonReaderTests
#include "utils/JsonReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>
#include <string>
#include <utility>
#include <vector>

using namespace Lookout;

namespace {

// Parses or fails the test with the reader's message
const JsonValue& parseOrFail(JsonReader& reader, const std::string& json) {
  BOOST_REQUIRE_MESSAGE(reader.parse(json), reader.getLastError());
  return reader.getRoot();
}

// A trimmed res/lookout.json
const char* const SESSION_DOCUMENT = R"({
  "graphics": { "window_width": 1280, "vsync": true, "font_path": "res/fonts/DejaVuSansMono.ttf" },
  "world": { "width": 360, "height": 90, "wrap": true },
  "fires": { "base_interval": 6.0, "interval_jitter": 0.0, "far_layer_chance": 0.5 },
  "weather": {
    "min_duration": 60,
    "table": {
      "Hot":   { "spawn": 0.6, "lifetime": 0.7 },
      "Rainy": { "spawn": 2.5, "lifetime": 1.6 }
    }
  },
  "detection": { "radius": 6.0 },
  "history": [ "Clear", "Hot", null, -12.5e-1 ]
})";

} // namespace

// ============================================================================
// JsonValue
// ============================================================================

BOOST_AUTO_TEST_SUITE(JsonValueTests)

BOOST_AUTO_TEST_CASE(TypeFollowsConstructor) {
  BOOST_CHECK_EQUAL(JsonValue().getType(), JsonType::Null);
  BOOST_CHECK_EQUAL(JsonValue(false).getType(), JsonType::Boolean);
  BOOST_CHECK_EQUAL(JsonValue(6.0).getType(), JsonType::Number);
  BOOST_CHECK_EQUAL(JsonValue(std::string("Windy")).getType(), JsonType::String);
  BOOST_CHECK_EQUAL(JsonValue(JsonArray{}).getType(), JsonType::Array);
  BOOST_CHECK_EQUAL(JsonValue(JsonObject{}).getType(), JsonType::Object);
}

BOOST_AUTO_TEST_CASE(MemberLookupOnBuiltObject) {
  JsonObject scales;
  scales.emplace("spawn", JsonValue(0.75));
  scales.emplace("lifetime", JsonValue(0.8));
  const JsonValue windy(std::move(scales));

  BOOST_CHECK_EQUAL(windy.size(), 2u);
  BOOST_CHECK(windy.hasKey("spawn"));
  BOOST_CHECK(!windy.hasKey("Spawn"));
  BOOST_CHECK_CLOSE(windy["lifetime"].asNumber(), 0.8, 0.001);

  // Unknown members and members of non-objects read as null
  BOOST_CHECK(windy["duration"].isNull());
  BOOST_CHECK(windy["spawn"]["nested"].isNull());
  BOOST_CHECK_EQUAL(JsonValue(3.0).size(), 0u);
}

BOOST_AUTO_TEST_CASE(TryAccessorsRejectOtherTypes) {
  const JsonValue name(std::string("Rainy"));
  const JsonValue radius(6.5);
  const JsonValue wrap(true);

  BOOST_REQUIRE(name.tryAsString() != nullptr);
  BOOST_CHECK_EQUAL(*name.tryAsString(), "Rainy");
  BOOST_CHECK(!name.tryAsNumber());
  BOOST_CHECK(name.tryAsObject() == nullptr);

  BOOST_CHECK_EQUAL(radius.tryAsNumber().value(), 6.5);
  BOOST_CHECK(radius.tryAsString() == nullptr);
  BOOST_CHECK(!radius.tryAsBool());

  BOOST_CHECK_EQUAL(wrap.tryAsBool().value(), true);
  BOOST_CHECK(!wrap.tryAsNumber());
}

BOOST_AUTO_TEST_CASE(TryAsIntNeedsWholeNumberInRange) {
  BOOST_CHECK_EQUAL(JsonValue(1280.0).tryAsInt().value(), 1280);
  BOOST_CHECK_EQUAL(JsonValue(-20.0).tryAsInt().value(), -20);
  BOOST_CHECK(!JsonValue(16.5).tryAsInt());
  BOOST_CHECK(!JsonValue(4e10).tryAsInt());
  BOOST_CHECK(!JsonValue(std::string("16")).tryAsInt());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Parsing
// ============================================================================

BOOST_AUTO_TEST_SUITE(JsonReaderParsingTests)

BOOST_AUTO_TEST_CASE(SessionDocumentReadsBack) {
  JsonReader reader;
  const JsonValue& root = parseOrFail(reader, SESSION_DOCUMENT);

  BOOST_CHECK(root.isObject());
  BOOST_CHECK_EQUAL(root.size(), 6u);
  BOOST_CHECK_EQUAL(root["graphics"]["window_width"].asInt(), 1280);
  BOOST_CHECK(root["graphics"]["vsync"].asBool());
  BOOST_CHECK_EQUAL(root["graphics"]["font_path"].asString(), "res/fonts/DejaVuSansMono.ttf");
  BOOST_CHECK(root["world"]["wrap"].asBool());
  BOOST_CHECK_CLOSE(root["fires"]["far_layer_chance"].asNumber(), 0.5, 0.001);
  BOOST_CHECK_EQUAL(root["fires"]["interval_jitter"].asNumber(), 0.0);
  BOOST_CHECK_CLOSE(root["weather"]["table"]["Rainy"]["spawn"].asNumber(), 2.5, 0.001);
  BOOST_CHECK_CLOSE(root["weather"]["table"]["Hot"]["lifetime"].asNumber(), 0.7, 0.001);

  const JsonArray& history = root["history"].asArray();
  BOOST_REQUIRE_EQUAL(history.size(), 4u);
  BOOST_CHECK_EQUAL(history[1].asString(), "Hot");
  BOOST_CHECK(history[2].isNull());
  BOOST_CHECK_CLOSE(history[3].asNumber(), -1.25, 0.001);
}

BOOST_AUTO_TEST_CASE(ScalarRoots) {
  JsonReader reader;

  BOOST_CHECK(parseOrFail(reader, "null").isNull());
  BOOST_CHECK(!parseOrFail(reader, "false").asBool());
  BOOST_CHECK_EQUAL(parseOrFail(reader, "-0").asNumber(), 0.0);
  BOOST_CHECK_CLOSE(parseOrFail(reader, "2.5E+1").asNumber(), 25.0, 0.001);
  BOOST_CHECK_EQUAL(parseOrFail(reader, "\"\"").asString(), "");
}

BOOST_AUTO_TEST_CASE(EmptyContainers) {
  JsonReader reader;

  const JsonValue& table = parseOrFail(reader, R"({ "table": {}, "fires": [] })");
  BOOST_CHECK(table["table"].isObject());
  BOOST_CHECK_EQUAL(table["table"].size(), 0u);
  BOOST_CHECK(table["fires"].isArray());
  BOOST_CHECK_EQUAL(table["fires"].size(), 0u);
}

BOOST_AUTO_TEST_CASE(EscapesDecodeToUtf8) {
  JsonReader reader;

  BOOST_CHECK_EQUAL(parseOrFail(reader, R"("Azimuth 100\u00b0")").asString(), "Azimuth 100\xC2\xB0");
  BOOST_CHECK_EQUAL(parseOrFail(reader, R"("line\tone\nline two")").asString(), "line\tone\nline two");
  BOOST_CHECK_EQUAL(parseOrFail(reader, R"("res\/fonts\\a \"b\"")").asString(), "res/fonts\\a \"b\"");

  // Pair above the Basic Multilingual Plane
  BOOST_CHECK_EQUAL(parseOrFail(reader, R"("\ud83d\udd25")").asString(), "\xF0\x9F\x94\xA5");
}

BOOST_AUTO_TEST_CASE(WhitespaceAroundTokens) {
  JsonReader reader;

  const JsonValue& root = parseOrFail(reader, "\r\n\t{ \"radius\" :\n 6 ,\t\"wrap\" : true }  \n");
  BOOST_CHECK_EQUAL(root["radius"].asInt(), 6);
  BOOST_CHECK(root["wrap"].asBool());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Rejected input
// ============================================================================

BOOST_AUTO_TEST_SUITE(JsonReaderErrorTests)

BOOST_AUTO_TEST_CASE(MalformedDocumentsAreRejected) {
  const std::vector<std::pair<std::string, std::string>> cases = {
      {R"({ "radius": 6, })", "Expected string key"},
      {R"([0.6, 0.7,])", "Unexpected character"},
      {R"({ "radius": 6 )", "Expected ',' or '}'"},
      {R"({ "radius" 6 })", "Expected ':'"},
      {R"([1 2])", "Expected ',' or ']'"},
      {R"("Clear)", "Unterminated string"},
      {R"("Cl\ear")", "Invalid escape"},
      {R"("\u00g0")", "four hex digits"},
      {"\"tab\there\"", "control character"},
      {"6.", "digit after decimal point"},
      {"6e", "digit in exponent"},
      {"-", "digit in number"},
      {"6 7", "after JSON value"},
      {"Clear", "Unexpected character"},
      {"tru", "Unexpected"},
      {"nulll", "after JSON value"},
      {"", "end of input"},
  };

  JsonReader reader;
  for (const auto& [input, fragment] : cases) {
    BOOST_TEST_CONTEXT("input: " << input) {
      BOOST_CHECK(!reader.parse(input));
      BOOST_CHECK_MESSAGE(reader.getLastError().find(fragment) != std::string::npos,
                          reader.getLastError());
      BOOST_CHECK(reader.getRoot().isNull());
    }
  }
}

BOOST_AUTO_TEST_CASE(DuplicateKeyIsAnError) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(R"({ "detection": { "radius": 6, "radius": 8 } })"));
  BOOST_CHECK(reader.getLastError().find("Duplicate key \"radius\"") != std::string::npos);

  // The same key in sibling objects is fine
  BOOST_CHECK(reader.parse(R"({ "Hot": { "spawn": 1 }, "Rainy": { "spawn": 2 } })"));
}

BOOST_AUTO_TEST_CASE(NumbersOutsideStrictGrammar) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("060"));
  BOOST_CHECK(!reader.parse("+6"));
  BOOST_CHECK(!reader.parse(".5"));
  BOOST_CHECK(!reader.parse("1e400"));
  BOOST_CHECK(reader.getLastError().find("out of range") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(LoneSurrogatesAreRejected) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse(R"("\ud83d")"));
  BOOST_CHECK(!reader.parse(R"("\udd25\ud83d")"));
  BOOST_CHECK(reader.getLastError().find("surrogate") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(NestingDepthIsBounded) {
  JsonReader reader;
  const auto nested = [](size_t depth) {
    return std::string(depth, '[') + std::string(depth, ']');
  };

  BOOST_CHECK(reader.parse(nested(JsonReader::MAX_DEPTH)));
  BOOST_CHECK(!reader.parse(nested(JsonReader::MAX_DEPTH + 1)));
  BOOST_CHECK(reader.getLastError().find("Nesting deeper") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(ErrorNamesLineAndColumn) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{\n  \"world\": {\n    \"wrap\": yes\n  }\n}"));
  BOOST_CHECK(reader.getLastError().starts_with("Line 3, Column 13:"));
}

BOOST_AUTO_TEST_CASE(ErrorStateResets) {
  JsonReader reader;

  BOOST_CHECK(!reader.parse("{"));
  BOOST_CHECK(!reader.getLastError().empty());
  BOOST_CHECK(reader.parse("{}"));
  BOOST_CHECK(reader.getLastError().empty());

  BOOST_CHECK(!reader.parse("["));
  reader.clearError();
  BOOST_CHECK(reader.getLastError().empty());
}

BOOST_AUTO_TEST_SUITE_END()

// ============================================================================
// Files
// ============================================================================

BOOST_AUTO_TEST_SUITE(JsonReaderFileTests)

BOOST_AUTO_TEST_CASE(LoadsDocumentFromDisk) {
  const std::string path = "json_reader_session_test.json";
  {
    std::ofstream out(path);
    out << SESSION_DOCUMENT;
  }

  JsonReader reader;
  const bool loaded = reader.loadFromFile(path);
  std::remove(path.c_str());

  BOOST_REQUIRE_MESSAGE(loaded, reader.getLastError());
  BOOST_CHECK_CLOSE(reader.getRoot()["detection"]["radius"].asNumber(), 6.0, 0.001);
}

BOOST_AUTO_TEST_CASE(MissingFileNamesThePath) {
  JsonReader reader;

  BOOST_CHECK(!reader.loadFromFile("no_such_lookout_config.json"));
  BOOST_CHECK(reader.getLastError().find("no_such_lookout_config.json") != std::string::npos);
}

BOOST_AUTO_TEST_SUITE_END()
