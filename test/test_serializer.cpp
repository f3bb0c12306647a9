#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "retrace/retrace.hpp"
#include <cstdio>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

using namespace retrace;
using retrace::serialization::TransitionSerializer;

TEST_CASE("Serializer: running transition has no elapsed time") {
    dom::Transition transition(dom::ElementEvent{"#submit-btn", "click"}, dom::Options{{"value", std::string("x")}});

    CHECK(TransitionSerializer::serialize(transition) ==
          R"({"element": "#submit-btn", "event": "click", "options": {"value": "x"}, "elapsed": null})");
}

TEST_CASE("Serializer: completed transition exports elapsed seconds") {
    dom::Transition transition(dom::ElementEvent{"#a", "click"}, {}, [] {});
    auto json = TransitionSerializer::serialize(transition);

    CHECK(json.find(R"("element": "#a")") != std::string::npos);
    CHECK(json.find(R"("options": {})") != std::string::npos);
    CHECK(json.find(R"("elapsed": null)") == std::string::npos);
    CHECK(json.find(R"("elapsed": )") != std::string::npos);
}

TEST_CASE("Serializer: option values") {
    dom::Options options;
    options.set("checked", false);
    options.set("count", 3);
    options.set("none", std::monostate{});
    options.set("ratio", 0.5);
    options.set("invalid", std::numeric_limits<double>::quiet_NaN());

    dom::TransitionRecord record{"#a", dom::Event::change(), options, std::nullopt};

    CHECK(TransitionSerializer::serialize(record) ==
          R"({"element": "#a", "event": "change", "options": {"checked": false, "count": 3, "invalid": null, )"
          R"("none": null, "ratio": 0.5}, "elapsed": null})");
}

TEST_CASE("Serializer: option doubles keep their precision") {
    dom::Options options;
    options.set("x", 0.1234567891);
    options.set("y", 1234567.25);

    auto text = TransitionSerializer::serialize(dom::TransitionRecord{"#a", dom::Event::input(), options, std::nullopt});

    CHECK(text.find("\"x\": 0.1234567891") != std::string::npos);
    CHECK(text.find("\"y\": 1234567.25") != std::string::npos);
}

TEST_CASE("Serializer: strings are escaped") {
    CHECK(TransitionSerializer::escape(R"(a"b\c)") == R"(a\"b\\c)");
    CHECK(TransitionSerializer::escape("line\nbreak\t") == R"(line\nbreak\t)");
    CHECK(TransitionSerializer::escape(std::string("\x01", 1)) == R"(\u0001)");

    dom::Transition transition(dom::ElementEvent{R"(input[name="q"])", "input"});
    CHECK(TransitionSerializer::serialize(transition).find(R"("element": "input[name=\"q\"]")") != std::string::npos);
}

TEST_CASE("Serializer: replay log") {
    dom::ReplayLog log;
    CHECK(TransitionSerializer::serialize(log) == "[]\n");

    log.push(dom::Transition(dom::ElementEvent{"http://test.com/", "load"}));
    log.push(dom::Transition(dom::ElementEvent{"#a", "click"}));

    CHECK(TransitionSerializer::serialize(log) ==
          "[\n"
          R"(  {"element": "http://test.com/", "event": "load", "options": {}, "elapsed": null},)"
          "\n"
          R"(  {"element": "#a", "event": "click", "options": {}, "elapsed": null})"
          "\n]\n");
}

TEST_CASE("Serializer: save to file") {
    dom::ReplayLog log;
    log.push(dom::Transition(dom::ElementEvent{"#a", "click"}));

    const std::string path = "retrace_serializer_test.json";
    REQUIRE(TransitionSerializer::saveToFile(log, path));

    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    CHECK(buffer.str() == TransitionSerializer::serialize(log));
    file.close();
    std::remove(path.c_str());

    CHECK_FALSE(TransitionSerializer::saveToFile(log, "/nonexistent-dir/replay.json"));
}
