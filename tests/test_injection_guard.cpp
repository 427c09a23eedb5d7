#include <catch2/catch_test_macros.hpp>
#include "security/injection_guard.hpp"
#include "core/error.hpp"

#include <algorithm>
#include <cctype>

using namespace textshield;

namespace {

InjectionGuard make_guard() {
    return InjectionGuard(PatternLibrary::shared_default());
}

bool contains(const std::vector<std::string>& names, const std::string& name) {
    return std::find(names.begin(), names.end(), name) != names.end();
}

} // namespace

// ============================================================================
// XSS
// ============================================================================

TEST_CASE("InjectionGuard: script and handler vectors are removed then escaped", "[xss]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_xss("<script>alert(1)</script><img src=x onerror=alert(1)>");
    CHECK(r.output == "&lt;img src=x alert(1)&gt;");
    CHECK(r.metadata.at("vectors") == "script_tag,event_handler");
}

TEST_CASE("InjectionGuard: prevent_xss output never contains a script tag", "[xss]") {
    const auto guard = make_guard();
    for (const std::string payload : {
             "<script>alert(1)</script>",
             "<SCRIPT SRC=//evil.example/x.js></SCRIPT>",
             "<scr<script>x</script>ipt>alert(1)</script>",
             "<iframe src=\"javascript:alert(1)\"></iframe>",
             "<object data=x></object><embed src=y></embed>",
             "<script>unclosed"}) {
        const auto r = guard.prevent_xss(payload);
        std::string lower = r.output;
        std::transform(lower.begin(), lower.end(), lower.begin(),
            [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        CHECK(lower.find("<script") == std::string::npos);
        CHECK(lower.find('<') == std::string::npos);
    }
}

TEST_CASE("InjectionGuard: javascript scheme, link and meta", "[xss]") {
    const auto guard = make_guard();
    auto r = guard.prevent_xss("javascript:alert(1)");
    CHECK(r.output == "alert(1)");
    CHECK(r.metadata.at("vectors") == "javascript_scheme");

    r = guard.prevent_xss("<link rel=stylesheet href=x><meta http-equiv=refresh>hi");
    CHECK(r.output == "hi");
    CHECK(r.metadata.at("vectors") == "link_tag,meta_tag");
}

TEST_CASE("InjectionGuard: benign text is only escaped", "[xss]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_xss("fish & chips 'n' \"peas\"");
    CHECK(r.output == "fish &amp; chips &#x27;n&#x27; &quot;peas&quot;");
    CHECK(r.metadata.at("vectors").empty());
}

// ============================================================================
// SQL injection
// ============================================================================

TEST_CASE("InjectionGuard: string tautology is removed and quotes doubled", "[sql]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_sql_injection("1' OR '1'='1");
    CHECK(r.output == "1'' ");
    CHECK(r.metadata.at("vectors") == "string_tautology");
}

TEST_CASE("InjectionGuard: stacked DROP statement is neutralized", "[sql]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_sql_injection("'; DROP TABLE users; --");
    CHECK(r.output.find("DROP") == std::string::npos);
    CHECK(r.output.find("--") == std::string::npos);
    CHECK(r.output.find(';') == std::string::npos);
    CHECK(r.output == "''  TABLE users ");
    CHECK(r.metadata.at("vectors") == "sql_keyword,comment_marker,statement_separator");
}

TEST_CASE("InjectionGuard: numeric tautology", "[sql]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_sql_injection("x OR 1=1");
    CHECK(r.output == "x ");
    CHECK(r.metadata.at("vectors") == "numeric_tautology");
}

TEST_CASE("InjectionGuard: keywords are matched case-insensitively as whole words", "[sql]") {
    const auto guard = make_guard();
    CHECK(guard.prevent_sql_injection("union select").output == " ");
    CHECK(guard.prevent_sql_injection("selection").output == "selection");
}

TEST_CASE("InjectionGuard: plain apostrophes are only doubled", "[sql]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_sql_injection("O'Brien");
    CHECK(r.output == "O''Brien");
    CHECK(r.metadata.at("vectors").empty());
}

// ============================================================================
// Path traversal
// ============================================================================

TEST_CASE("InjectionGuard: reject mode fails on traversal", "[path]") {
    const auto guard = make_guard();
    CHECK_THROWS_AS(guard.prevent_path_traversal("../etc/passwd", PathTraversalMode::REJECT),
                    SanitizationError);
    CHECK_THROWS_AS(guard.prevent_path_traversal("%2e%2e%2fetc/passwd", PathTraversalMode::REJECT),
                    SanitizationError);
    CHECK_THROWS_AS(guard.prevent_path_traversal("%252e%252e%252fetc", PathTraversalMode::REJECT),
                    SanitizationError);
    CHECK_THROWS_AS(guard.prevent_path_traversal("a/b/..", PathTraversalMode::REJECT),
                    SanitizationError);
}

TEST_CASE("InjectionGuard: reject mode names the vectors", "[path]") {
    const auto guard = make_guard();
    try {
        (void)guard.prevent_path_traversal("..\\windows\\system32", PathTraversalMode::REJECT);
        FAIL("expected SanitizationError");
    } catch (const SanitizationError& e) {
        CHECK(std::string(e.what()).find("dot_dot_backslash") != std::string::npos);
    }
}

TEST_CASE("InjectionGuard: reject mode normalizes clean paths", "[path]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_path_traversal("docs/./reports/q1.pdf", PathTraversalMode::REJECT);
    CHECK(r.output == "docs/reports/q1.pdf");
    CHECK(r.metadata.at("mode") == "reject");
    CHECK(r.metadata.at("vectors").empty());
}

TEST_CASE("InjectionGuard: detection sees through repeated encoding", "[path]") {
    const auto guard = make_guard();
    const auto fired = guard.detect_path_traversal("%252e%252e%252fsecret");
    CHECK(contains(fired, "double_encoded_dot_dot_slash"));
    CHECK(contains(fired, "encoded_dot_dot_slash"));
    CHECK(contains(fired, "dot_dot_slash"));
    CHECK(guard.detect_path_traversal("images/logo.png").empty());
}

TEST_CASE("InjectionGuard: rewrite mode strips traversal", "[path]") {
    const auto guard = make_guard();
    auto r = guard.prevent_path_traversal("../../etc/passwd", PathTraversalMode::REWRITE);
    CHECK(r.output == "etc/passwd");
    CHECK(r.metadata.at("mode") == "rewrite");
    CHECK(r.metadata.at("vectors").find("dot_dot_slash") != std::string::npos);

    r = guard.prevent_path_traversal("uploads/%2e%2e%2fsecret.txt", PathTraversalMode::REWRITE);
    CHECK(r.output == "uploads/secret.txt");
}

TEST_CASE("InjectionGuard: rewrite mode reaches a fixpoint", "[path]") {
    const auto guard = make_guard();
    const auto r = guard.prevent_path_traversal("....//etc/passwd", PathTraversalMode::REWRITE);
    CHECK(r.output == "etc/passwd");
    CHECK(r.output.find("..") == std::string::npos);
}

TEST_CASE("InjectionGuard: normalize_path is lexical", "[path]") {
    CHECK(InjectionGuard::normalize_path("a\\b\\..\\c") == "a/c");
    CHECK(InjectionGuard::normalize_path("./x/./y") == "x/y");
    CHECK(InjectionGuard::normalize_path("../../x") == "x");
    CHECK(InjectionGuard::normalize_path("").empty());
}

TEST_CASE("InjectionGuard: path traversal mode names", "[path]") {
    CHECK(parse_path_traversal_mode("REJECT") == PathTraversalMode::REJECT);
    CHECK(parse_path_traversal_mode("rewrite") == PathTraversalMode::REWRITE);
    CHECK_FALSE(parse_path_traversal_mode("ignore").has_value());
    CHECK(std::string(path_traversal_mode_to_string(PathTraversalMode::REWRITE)) == "rewrite");
}

// ============================================================================
// Filenames
// ============================================================================

TEST_CASE("InjectionGuard: separators and reserved characters become underscores", "[filename]") {
    const auto guard = make_guard();
    CHECK(guard.sanitize_filename("../../etc/passwd").output == ".._.._etc_passwd");
    CHECK(guard.sanitize_filename("my<file>:name?.txt").output == "my_file__name_.txt");
    CHECK(guard.sanitize_filename("a\\b|c*d\"e").output == "a_b_c_d_e");
}

TEST_CASE("InjectionGuard: control characters are dropped", "[filename]") {
    const auto guard = make_guard();
    CHECK(guard.sanitize_filename("a\x01" "b\x7F" "c\n.txt").output == "abc.txt");
    CHECK(guard.sanitize_filename("a\xC2\x85" "b").output == "ab");     // U+0085
    CHECK(guard.sanitize_filename("caf\xC3\xA9.txt").output == "caf\xC3\xA9.txt");
}

TEST_CASE("InjectionGuard: long names keep their extension", "[filename]") {
    const auto guard = make_guard();
    const auto r = guard.sanitize_filename(std::string(300, 'a') + ".txt");
    CHECK(r.output.size() == InjectionGuard::kMaxFilenameBytes);
    CHECK(r.output.ends_with(".txt"));
    CHECK(r.metadata.at("truncated") == "true");
}

TEST_CASE("InjectionGuard: truncation respects UTF-8 boundaries", "[filename]") {
    const auto guard = make_guard();
    std::string name;
    for (int i = 0; i < 200; ++i) name += "\xC3\xA9";
    const auto r = guard.sanitize_filename(name);
    CHECK(r.output.size() == 254);
    CHECK(r.final_length == 127);
}

TEST_CASE("InjectionGuard: ordinary names pass through", "[filename]") {
    const auto guard = make_guard();
    const auto r = guard.sanitize_filename("report-2024_v2.pdf");
    CHECK(r.output == "report-2024_v2.pdf");
    CHECK(r.metadata.at("truncated") == "false");
}
