#include <benchmark/benchmark.h>

#include "core/masking.hpp"
#include "engine/dispatcher.hpp"
#include "filter/content_filter.hpp"
#include "security/injection_guard.hpp"
#include "transform/html_sanitizer.hpp"

#include <iterator>
#include <string>
#include <vector>

using namespace textshield;

// ============================================================================
// Helpers
// ============================================================================

namespace {

const std::string kPlainText =
    "The quarterly report is attached. Please review the figures before Friday.";
const std::string kCommentHtml =
    "<p>Thanks for the <b>update</b>! See <a href=\"https://example.com\">this</a>.</p>";
const std::string kXssPayload =
    "<p onclick=\"steal()\">Hi</p><script>document.location='//evil.example'</script>"
    "<img src=x onerror=alert(1)><iframe src=\"javascript:alert(2)\"></iframe>";
const std::string kSensitiveText =
    "Customer 123-45-6789 paid with 4111 1111 1111 1111, call back on 555-123-4567.";

const std::vector<std::string> kInputs = {kPlainText, kCommentHtml, kXssPayload, kSensitiveText};

// Repeats text until it reaches at least `bytes`
std::string grow(const std::string& text, size_t bytes) {
    std::string out;
    out.reserve(bytes + text.size());
    while (out.size() < bytes) out += text;
    return out;
}

HtmlSanitizer make_sanitizer() {
    return HtmlSanitizer(PatternLibrary::shared_default(),
        {std::begin(HtmlSanitizer::kDefaultAllowedTags), std::end(HtmlSanitizer::kDefaultAllowedTags)});
}

} // anonymous namespace

// ============================================================================
// Category A: Single Operations
// ============================================================================

// A1: XSS prevention over each sample input
static void BM_PreventXss(benchmark::State& state) {
    const InjectionGuard guard(PatternLibrary::shared_default());
    const auto& input = kInputs[static_cast<size_t>(state.range(0))];
    for (auto _ : state) {
        auto r = guard.prevent_xss(input);
        benchmark::DoNotOptimize(r);
    }
    state.SetLabel("len=" + std::to_string(input.size()));
}
BENCHMARK(BM_PreventXss)->DenseRange(0, 3);

// A2: HTML sanitizer with the default allow-list
static void BM_SanitizeHtml(benchmark::State& state) {
    const auto sanitizer = make_sanitizer();
    for (auto _ : state) {
        auto r = sanitizer.sanitize_html(kXssPayload, std::nullopt);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_SanitizeHtml);

// A3: Sensitive data placeholders
static void BM_FilterSensitiveData(benchmark::State& state) {
    const ContentFilter filter(PatternLibrary::shared_default());
    for (auto _ : state) {
        auto r = filter.filter_sensitive_data(kSensitiveText);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_FilterSensitiveData);

// A4: SQL injection neutralization
static void BM_PreventSqlInjection(benchmark::State& state) {
    const InjectionGuard guard(PatternLibrary::shared_default());
    const std::string input = "name' OR '1'='1'; DROP TABLE users; --";
    for (auto _ : state) {
        auto r = guard.prevent_sql_injection(input);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_PreventSqlInjection);

// A5: Masking without regex
static void BM_MaskCreditCard(benchmark::State& state) {
    for (auto _ : state) {
        auto r = MaskingEngine::mask_credit_card("4111 1111 1111 1234", "*");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_MaskCreditCard);

// ============================================================================
// Category B: Input Size Scaling
// ============================================================================

// B1: prevent_xss cost as content grows toward the input ceiling
static void BM_PreventXss_InputSize(benchmark::State& state) {
    const InjectionGuard guard(PatternLibrary::shared_default());
    const auto input = grow(kXssPayload, static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto r = guard.prevent_xss(input);
        benchmark::DoNotOptimize(r);
    }
    state.SetBytesProcessed(state.iterations() * static_cast<int64_t>(input.size()));
}
BENCHMARK(BM_PreventXss_InputSize)->Arg(256)->Arg(4096)->Arg(65536);

// ============================================================================
// Category C: Dispatcher and Batch
// ============================================================================

// C1: Full request path through the dispatcher
static void BM_Dispatcher_Execute(benchmark::State& state) {
    const Dispatcher dispatcher;
    const auto params = JsonValue::parse(R"({"content": "<b>hello</b> world"})");
    for (auto _ : state) {
        auto e = dispatcher.execute(Operation::SANITIZE_HTML, params);
        benchmark::DoNotOptimize(e);
    }
}
BENCHMARK(BM_Dispatcher_Execute);

// C2: Batch throughput, sequential vs parallel
static void BM_Batch_Workers(benchmark::State& state) {
    EngineConfig config;
    config.batch.parallel_threshold = 1;
    config.batch.max_workers = static_cast<size_t>(state.range(0));
    const Dispatcher dispatcher(config);

    std::string items = "[";
    for (int i = 0; i < 1000; ++i) {
        if (i > 0) items += ',';
        items += "\"<script>x</script>row " + std::to_string(i) + "\"";
    }
    items += "]";
    const auto params = JsonValue::parse(
        R"({"batch_operation": "prevent_xss", "items": )" + items + "}");

    for (auto _ : state) {
        auto e = dispatcher.execute(Operation::BATCH_SANITIZE, params);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations() * 1000);
}
BENCHMARK(BM_Batch_Workers)->Arg(1)->Arg(2)->Arg(4)->Arg(8);

// C3: Concurrent callers sharing one dispatcher
static void BM_Dispatcher_Throughput(benchmark::State& state) {
    static const Dispatcher dispatcher;
    const auto params = JsonValue::parse(R"({"content": "Call 555-123-4567 re: 123-45-6789"})");
    for (auto _ : state) {
        auto e = dispatcher.execute(Operation::FILTER_SENSITIVE_DATA, params);
        benchmark::DoNotOptimize(e);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_Dispatcher_Throughput)->Threads(1)->Threads(2)->Threads(4)->Threads(8);
