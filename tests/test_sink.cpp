#include "test_common.h"
#include "warden/audit.h"
#include "warden/gate.h"
#include "warden/http.h"
#include "warden/log.h"
#include "warden/log_sink.h"
#include "warden/sanitizer.h"
#include "warden/secret.h"
#include "warden/sink.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <variant>
#include <vector>

using namespace warden;
namespace fs = std::filesystem;

// Authorized context granted exactly the given actions.
static AuthorizedContext authorize(const std::vector<std::string>& actions) {
    FunctionAuthorizationProvider allow_all([](const Principal&, const std::string&) { return true; });
    PolicyGate gate(RequestMetadata{"req-sink", Principal{"u-9", "Dana"}}, allow_all);
    for (const auto& a : actions) gate.require(PolicyRequirement::authorized_for(a));
    auto r = std::move(gate).build();
    return expect_holds<AuthorizedContext>(r, "test gate should authorize");
}

static VerifiedValue<std::string> verified(const std::string& s) {
    auto r = StringSanitizer(256).sanitize(Untrusted<std::string>(s));
    return expect_holds<VerifiedValue<std::string>>(r, "test input should sanitize");
}

static std::string read_all(const fs::path& p) {
    std::ifstream f(p);
    return std::string((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
}

static void test_memory_sink_scenario() {
    auto ctx = authorize({"log"});
    MemorySink sink;
    auto err = sink.consume(*ctx.log(), verified("  hello world  "));
    expect_true(!err.has_value(), "consume with log token succeeds");
    auto values = sink.values();
    expect_eq_ll((long long)values.size(), 1, "one value recorded");
    expect_eq_str(values[0], "hello world", "trimmed value recorded");

    expect_true(!sink.consume(*ctx.log(), verified("second")).has_value(), "second consume succeeds");
    values = sink.values();
    expect_true(values.size() == 2 && values[1] == "second", "values kept in call order");
    sink.clear();
    expect_true(sink.empty(), "clear empties the record");
}

// MemorySink picks its kind at runtime; a wrong token is reported.
static void test_capability_mismatch() {
    auto ctx = authorize({"log", "http", "audit"});
    MemorySink log_sink(CapabilityKind::LOG);
    MemorySink http_sink(CapabilityKind::HTTP);

    auto e1 = log_sink.consume(*ctx.http(), verified("x"));
    expect_true(e1.has_value() && e1->kind == SinkErrorKind::CAPABILITY_MISMATCH, "http token on log sink");
    auto e2 = log_sink.consume(*ctx.audit(), verified("x"));
    expect_true(e2.has_value() && e2->kind == SinkErrorKind::CAPABILITY_MISMATCH, "audit token on log sink");
    auto e3 = http_sink.consume(*ctx.log(), verified("x"));
    expect_true(e3.has_value() && e3->kind == SinkErrorKind::CAPABILITY_MISMATCH, "log token on http sink");
    expect_true(log_sink.empty() && http_sink.empty(), "mismatched calls have no effect");
    expect_true(e3->to_string().find("capability mismatch") != std::string::npos, "error text names the kind");

    expect_true(!http_sink.consume(*ctx.http(), verified("x")).has_value(), "matching token succeeds");
}

static void test_memory_sink_capacity() {
    auto ctx = authorize({"log"});
    MemorySink sink(CapabilityKind::LOG, 1);
    expect_true(!sink.consume(*ctx.log(), verified("a")).has_value(), "first fits");
    auto err = sink.consume(*ctx.log(), verified("b"));
    expect_true(err.has_value() && err->kind == SinkErrorKind::UNAVAILABLE, "full sink is UNAVAILABLE");
    expect_eq_ll((long long)sink.size(), 1, "rejected value not stored");
}

static void test_log_sink_writes_event() {
    fs::path dir = fs::temp_directory_path() / "warden_test_sink";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    auto ctx = authorize({"log"});
    JsonlLogger log((dir / "events.jsonl").string(), "dev", true);
    expect_true(log.ok(), "logger opens");
    LogSink sink(log, ctx.request_id());
    expect_true(!sink.consume(*ctx.log(), verified("user said hi")).has_value(), "log sink accepts");
    expect_eq_ll((long long)log.events_written(), 1, "one event written");

    std::string text = read_all(dir / "events.jsonl");
    expect_true(text.find("\"event\":\"policy_log\"") != std::string::npos, "event name");
    expect_true(text.find("\"message\":\"user said hi\"") != std::string::npos, "message payload");
    expect_true(text.find("\"request_id\":\"req-sink\"") != std::string::npos, "request id payload");

    fs::remove_all(dir, ec);
}

static void test_log_sink_unavailable() {
    auto ctx = authorize({"log"});
    JsonlLogger log("/nonexistent-dir/warden/events.jsonl");
    LogSink sink(log, ctx.request_id());
    auto err = sink.consume(*ctx.log(), verified("x"));
    expect_true(err.has_value() && err->kind == SinkErrorKind::UNAVAILABLE, "closed log is UNAVAILABLE");
}

static void test_http_recorder() {
    auto ctx = authorize({"http"});
    HttpRecorder http;
    auto url = verified("https://api.example.com/items");
    auto body = verified("{\"name\":\"widget\"}");

    expect_true(!http.get(*ctx.http(), url).has_value(), "GET");
    expect_true(!http.post(*ctx.http(), url, body).has_value(), "POST");
    expect_true(!http.put(*ctx.http(), url, body).has_value(), "PUT");
    expect_true(!http.del(*ctx.http(), url).has_value(), "DELETE");
    expect_true(!http.patch(*ctx.http(), url, body).has_value(), "PATCH");
    expect_true(!http.consume(*ctx.http(), url).has_value(), "consume is a GET");

    auto reqs = http.requests();
    expect_eq_ll((long long)reqs.size(), 6, "six requests recorded");
    expect_true(reqs[1].method == HttpMethod::POST, "POST recorded");
    expect_eq_ll((long long)reqs[1].body_len, (long long)body->size(), "body length recorded");
    expect_eq_ll((long long)reqs[0].body_len, 0, "GET has no body");
    expect_true(reqs[5].method == HttpMethod::GET, "consume recorded as GET");
    expect_true(reqs[3].method == HttpMethod::DEL, "DELETE recorded");
    expect_eq_str(http_method_name(reqs[3].method), "DELETE", "method name");
    expect_true(http.required_capability() == CapabilityKind::HTTP, "recorder needs http");
}

static void test_audit_trail() {
    fs::path dir = fs::temp_directory_path() / "warden_test_audit";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    auto ctx = authorize({"audit"});
    JsonlLogger log((dir / "audit.jsonl").string(), "prod", true);
    AuditTrail trail(&log);

    trail.record(*ctx.audit(), AuditEvent(ctx.request_id(), ctx.principal().id,
                                          AuditEventKind::AUTHORIZATION, AuditOutcome::SUCCESS)
                                   .with_action("log"));
    trail.record(*ctx.audit(), AuditEvent(ctx.request_id(), std::nullopt,
                                          AuditEventKind::RESOURCE_ACCESS, AuditOutcome::DENIED)
                                   .with_method("GET")
                                   .with_redacted_url(redact_url("https://u:p@h.example/x?key=s3cr3t"))
                                   .with_body_len(0));

    auto events = trail.events();
    expect_eq_ll((long long)events.size(), 2, "two events recorded");
    expect_eq_str(events[0].to_string(),
                  "AuditEvent[kind=authorization, outcome=success, request_id=req-sink, principal=u-9, action=log]",
                  "display of first event");
    expect_true(events[1].to_string().find("principal=<none>") != std::string::npos, "absent principal");
    expect_eq_ll((long long)trail.mirror_failures(), 0, "both mirrored");

    std::string text = read_all(dir / "audit.jsonl");
    expect_true(text.find("\"event\":\"audit\"") != std::string::npos, "audit lines written");
    expect_true(text.find("s3cr3t") == std::string::npos, "query secret not written");
    expect_true(text.find("\"profile\":\"prod\"") != std::string::npos, "profile recorded");

    trail.clear();
    expect_true(trail.empty(), "trail cleared");
    fs::remove_all(dir, ec);
}

static void test_audit_log_follows_trail_order() {
    fs::path dir = fs::temp_directory_path() / "warden_test_audit_order";
    std::error_code ec;
    fs::remove_all(dir, ec);
    fs::create_directories(dir, ec);

    auto ctx = authorize({"audit"});
    const AuditToken cap = *ctx.audit();
    JsonlLogger log((dir / "audit.jsonl").string(), "dev", true);
    AuditTrail trail(&log);

    const int kThreads = 4;
    const int kPerThread = 50;
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; t++) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < kPerThread; i++) {
                trail.record(cap, AuditEvent("req-order", std::nullopt, AuditEventKind::STATE_CHANGE,
                                             AuditOutcome::SUCCESS)
                                      .with_resource_id("t" + std::to_string(t) + "-" + std::to_string(i)));
            }
        });
    }
    for (auto& w : workers) w.join();

    auto events = trail.events();
    expect_eq_ll((long long)events.size(), kThreads * kPerThread, "all events recorded");

    std::ifstream in(dir / "audit.jsonl");
    std::vector<std::string> logged;
    const std::string key = "\"resource_id\":\"";
    for (std::string line; std::getline(in, line);) {
        size_t p = line.find(key);
        expect_true(p != std::string::npos, "audit line carries resource id");
        p += key.size();
        logged.push_back(line.substr(p, line.find('"', p) - p));
    }
    expect_eq_ll((long long)logged.size(), (long long)events.size(), "one line per event");
    for (size_t i = 0; i < events.size(); i++) {
        expect_eq_str(logged[i], *events[i].resource_id, "log line " + std::to_string(i) + " in trail order");
    }

    fs::remove_all(dir, ec);
}

int main() {
    test_memory_sink_scenario();
    test_capability_mismatch();
    test_memory_sink_capacity();
    test_log_sink_writes_event();
    test_log_sink_unavailable();
    test_http_recorder();
    test_audit_trail();
    test_audit_log_follows_trail_order();

    std::cerr << "test_sink: ALL PASSED" << std::endl;
    return 0;
}
