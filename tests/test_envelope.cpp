#include <catch2/catch_test_macros.hpp>
#include "engine/envelope.hpp"
#include "encoding/encoders.hpp"

using namespace textshield;

TEST_CASE("Envelope: validation result layout", "[envelope]") {
    ValidationResult r;
    r.valid = true;
    r.normalized_value = "+15551234567";
    r.attributes["digits"] = "11";
    CHECK(to_json(r) ==
          R"({"valid":true,"normalized_value":"+15551234567","attributes":{"digits":"11"}})");

    CHECK(to_json(ValidationResult{}) == R"({"valid":false,"normalized_value":null,"attributes":{}})");
}

TEST_CASE("Envelope: transform result escapes output", "[envelope]") {
    auto r = TransformResult::from("a\"b", "line1\nline2 \"q\" \\");
    r.metadata["note"] = "tab\there";
    CHECK(to_json(r) ==
          R"({"output":"line1\nline2 \"q\" \\","original_length":3,"final_length":17,"metadata":{"note":"tab\there"}})");
}

TEST_CASE("Envelope: control characters use unicode escapes", "[envelope]") {
    const auto r = TransformResult::from("x", std::string("\x01", 1));
    CHECK(to_json(r).find(R"("output":"\u0001")") != std::string::npos);
}

TEST_CASE("Envelope: ill-formed UTF-8 becomes replacement characters", "[envelope]") {
    const auto decoded = encoding::url_decode("%FF");
    REQUIRE(decoded == "\xFF");
    CHECK(to_json(TransformResult::from("%FF", decoded)) ==
          R"({"output":"\ufffd","original_length":3,"final_length":1,"metadata":{}})");

    // Truncated sequence followed by ASCII, and a lone continuation byte
    const auto r = TransformResult::from("x", std::string("a\xC3" "b\x80", 4));
    CHECK(to_json(r).find(R"("output":"a\ufffdb\ufffd")") != std::string::npos);
}

TEST_CASE("Envelope: well-formed UTF-8 passes through", "[envelope]") {
    const auto r = TransformResult::from("x", "h\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80");
    CHECK(to_json(r).find("\"output\":\"h\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x98\x80\"") != std::string::npos);
}

TEST_CASE("Envelope: policy result layout", "[envelope]") {
    PolicyResult r;
    r.sanitized_content = "abcde";
    r.violations = {"Content exceeds maximum length of 5"};
    r.compliant = false;
    r.original_length = 8;
    r.final_length = 5;
    CHECK(to_json(r) ==
          R"({"sanitized_content":"abcde","violations":["Content exceeds maximum length of 5"],)"
          R"("compliant":false,"original_length":8,"final_length":5})");
}

TEST_CASE("Envelope: batch items carry result or error", "[envelope]") {
    BatchResult b;
    b.operation = "url_encode";
    b.total = 2;
    b.successful = 1;
    b.failed = 1;

    BatchItemResult ok;
    ok.index = 0;
    ok.success = true;
    ok.input = "a b";
    ok.result = TransformResult::from("a b", "a%20b");

    BatchItemResult bad;
    bad.index = 1;
    bad.error = "Item must be a string, got number";

    b.items = {ok, bad};
    CHECK(to_json(b) ==
          R"({"operation":"url_encode","total":2,"successful":1,"failed":1,"results":[)"
          R"({"index":0,"status":"success","input":"a b","result":{"output":"a%20b","original_length":3,"final_length":5,"metadata":{}}},)"
          R"({"index":1,"status":"error","input":"","error":"Item must be a string, got number"}]})");
}

TEST_CASE("Envelope: success and error envelopes", "[envelope]") {
    Envelope ok;
    ok.success = true;
    ok.operation = "escape_html";
    ok.result = Payload(TransformResult::from("<", "&lt;"));
    ok.processing_time_seconds = 0.00025;
    ok.timestamp = "2026-01-02T03:04:05.006+0000";
    CHECK(to_json(ok) ==
          R"({"status":"success","operation":"escape_html","result":{"output":"&lt;","original_length":1,"final_length":4,"metadata":{}},)"
          R"("processing_time_seconds":0.000250,"timestamp":"2026-01-02T03:04:05.006+0000","error":null})");

    Envelope err;
    err.operation = "nope";
    err.error = "Unknown operation: nope";
    err.timestamp = "t";
    CHECK(to_json(err) ==
          R"({"status":"error","operation":"nope","result":null,"processing_time_seconds":0.000000,)"
          R"("timestamp":"t","error":"Unknown operation: nope"})");
}
