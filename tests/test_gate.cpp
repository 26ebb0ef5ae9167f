#include "test_common.h"
#include "warden/authz.h"
#include "warden/gate.h"

#include <map>
#include <string>
#include <variant>
#include <vector>

using namespace warden;

// Counts every decision so tests can check how often the gate asks.
class CountingProvider : public AuthorizationProvider {
public:
    explicit CountingProvider(std::vector<std::string> allowed) : allowed_(std::move(allowed)) {}

    bool decide(const Principal&, const std::string& action) const override {
        calls_[action]++;
        for (const auto& a : allowed_) {
            if (a == action) return true;
        }
        return false;
    }

    int calls(const std::string& action) const {
        auto it = calls_.find(action);
        return it == calls_.end() ? 0 : it->second;
    }
    int total_calls() const {
        int n = 0;
        for (const auto& kv : calls_) n += kv.second;
        return n;
    }

private:
    std::vector<std::string> allowed_;
    mutable std::map<std::string, int> calls_;
};

static RequestMetadata meta(std::optional<Principal> p) {
    return RequestMetadata{"req-gate", std::move(p)};
}

static Principal bob() { return Principal{"u-2", "Bob"}; }

static std::vector<std::string> texts(const std::vector<Violation>& vs) {
    std::vector<std::string> out;
    for (const auto& v : vs) out.push_back(v.to_string());
    return out;
}

static void test_missing_principal_reported_once() {
    CountingProvider authz(std::vector<std::string>{"log"});
    auto r = PolicyGate(meta(std::nullopt), authz)
                 .require(PolicyRequirement::authenticated())
                 .require(PolicyRequirement::authorized_for("log"))
                 .require(PolicyRequirement::authenticated())
                 .build();
    const auto& vs = expect_holds<std::vector<Violation>>(r, "no principal should fail");
    expect_eq_ll((long long)vs.size(), 1, "exactly one violation");
    expect_true(vs[0].kind == ViolationKind::MISSING_PRINCIPAL, "MISSING_PRINCIPAL");
    expect_eq_ll(authz.total_calls(), 0, "provider is not consulted without a principal");
}

static void test_authorized_with_principal() {
    CountingProvider authz(std::vector<std::string>{"log"});
    auto r = PolicyGate(meta(bob()), authz)
                 .require(PolicyRequirement::authenticated())
                 .require(PolicyRequirement::authorized_for("log"))
                 .require(PolicyRequirement::authenticated())
                 .build();
    const auto& ctx = expect_holds<AuthorizedContext>(r, "allowed principal should pass");
    expect_true(ctx.log().has_value(), "log token minted");
    expect_true(!ctx.http().has_value(), "http token not minted");
    expect_true(!ctx.audit().has_value(), "audit token not minted");
    expect_eq_str(ctx.principal().id, "u-2", "principal carried into context");
    expect_eq_ll(authz.calls("log"), 1, "provider asked once for log");
}

static void test_require_is_idempotent() {
    CountingProvider authz(std::vector<std::string>{"log"});
    PolicyGate once(meta(bob()), authz);
    once.require(PolicyRequirement::authorized_for("log"));

    PolicyGate twice(meta(bob()), authz);
    twice.require(PolicyRequirement::authorized_for("log")).require(PolicyRequirement::authorized_for("log"));

    expect_true(once.requirements() == twice.requirements(), "duplicate requirement is dropped");
    expect_eq_ll((long long)twice.requirements().size(), 1, "one requirement kept");

    auto r = std::move(twice).build();
    expect_true(std::holds_alternative<AuthorizedContext>(r), "deduplicated gate builds");
    expect_eq_ll(authz.calls("log"), 1, "provider asked once per distinct requirement");

    // Different actions are different requirements
    PolicyGate two(meta(bob()), authz);
    two.require(PolicyRequirement::authorized_for("log")).require(PolicyRequirement::authorized_for("http"));
    expect_eq_ll((long long)two.requirements().size(), 2, "distinct actions both kept");
}

static void test_order_independence() {
    const std::vector<std::vector<PolicyRequirement>> orders = {
        {PolicyRequirement::authorized_for("http"), PolicyRequirement::authorized_for("log"),
         PolicyRequirement::authorized_for("BAD!"), PolicyRequirement::authorized_for("audit")},
        {PolicyRequirement::authorized_for("audit"), PolicyRequirement::authorized_for("BAD!"),
         PolicyRequirement::authorized_for("log"), PolicyRequirement::authorized_for("http")},
    };

    // Failure case: same batch in both orders
    std::vector<std::vector<std::string>> failures;
    for (const auto& order : orders) {
        CountingProvider authz(std::vector<std::string>{"log"});
        PolicyGate gate(meta(bob()), authz);
        for (const auto& r : order) gate.require(r);
        auto res = std::move(gate).build();
        failures.push_back(texts(expect_holds<std::vector<Violation>>(res, "denied actions should fail")));
    }
    expect_true(failures[0] == failures[1], "violation batch independent of order");
    expect_eq_ll((long long)failures[0].size(), 3, "malformed + two denials");

    // Success case: same granted kinds in both orders
    std::vector<std::vector<CapabilityKind>> granted;
    for (int i = 0; i < 2; i++) {
        CountingProvider authz(std::vector<std::string>{"log", "http", "audit"});
        PolicyGate gate(meta(bob()), authz);
        for (const auto& r : orders[i]) {
            if (r.action != "BAD!") gate.require(r);
        }
        auto res = std::move(gate).build();
        granted.push_back(expect_holds<AuthorizedContext>(res, "all allowed should pass").granted());
    }
    expect_true(granted[0] == granted[1], "granted kinds independent of order");
    expect_eq_ll((long long)granted[0].size(), 3, "all three kinds granted");
}

static void test_violations_are_batched() {
    CountingProvider authz(std::vector<std::string>{});
    auto r = PolicyGate(meta(bob()), authz)
                 .require(PolicyRequirement::authorized_for("log"))
                 .require(PolicyRequirement::authorized_for("http"))
                 .require(PolicyRequirement::authorized_for(""))
                 .build();
    const auto& vs = expect_holds<std::vector<Violation>>(r, "all denied should fail");
    expect_eq_ll((long long)vs.size(), 3, "every failure reported");
    expect_true(vs[0].kind == ViolationKind::POLICY_DENIED, "denials first");
    expect_true(vs[1].kind == ViolationKind::POLICY_DENIED, "second denial");
    expect_true(vs[2].kind == ViolationKind::MALFORMED, "malformed last");
    expect_eq_ll(authz.calls(""), 0, "malformed action never reaches the provider");
    for (const auto& v : vs) {
        expect_true(v.message.find("u-2") == std::string::npos, "messages do not name the principal");
    }
}

static void test_missing_principal_with_malformed() {
    CountingProvider authz(std::vector<std::string>{});
    auto r = PolicyGate(meta(std::nullopt), authz)
                 .require(PolicyRequirement::authorized_for("Not Valid"))
                 .build();
    const auto& vs = expect_holds<std::vector<Violation>>(r, "should fail");
    expect_eq_ll((long long)vs.size(), 2, "missing principal and malformed action");
    expect_true(vs[0].kind == ViolationKind::MISSING_PRINCIPAL, "missing principal first");
    expect_true(vs[1].kind == ViolationKind::MALFORMED, "malformed second");
}

static void test_empty_gate() {
    CountingProvider authz(std::vector<std::string>{});
    auto ok = PolicyGate(meta(bob()), authz).build();
    const auto& ctx = expect_holds<AuthorizedContext>(ok, "no requirements with principal passes");
    expect_true(ctx.granted().empty(), "no capabilities without authorized actions");

    auto fail = PolicyGate(meta(std::nullopt), authz).build();
    const auto& vs = expect_holds<std::vector<Violation>>(fail, "no principal never reaches Authorized");
    expect_true(vs.size() == 1 && vs[0].kind == ViolationKind::MISSING_PRINCIPAL, "single MISSING_PRINCIPAL");
}

static void test_non_capability_action() {
    CountingProvider authz(std::vector<std::string>{"export"});
    auto r = PolicyGate(meta(bob()), authz).require(PolicyRequirement::authorized_for("export")).build();
    const auto& ctx = expect_holds<AuthorizedContext>(r, "allowed plain action passes");
    expect_true(ctx.granted().empty(), "plain actions mint nothing");
    expect_eq_ll(authz.calls("export"), 1, "plain action still validated");
}

static void test_gate_is_single_use() {
    CountingProvider authz(std::vector<std::string>{"log"});
    PolicyGate gate(meta(bob()), authz);
    gate.require(PolicyRequirement::authorized_for("log"));
    PolicyGate moved(std::move(gate));

    auto stale = std::move(gate).build();
    const auto& vs = expect_holds<std::vector<Violation>>(stale, "moved-from gate should not build");
    expect_true(vs.size() == 1 && vs[0].kind == ViolationKind::MALFORMED, "moved-from gate is MALFORMED");

    auto fresh = std::move(moved).build();
    expect_true(std::holds_alternative<AuthorizedContext>(fresh), "move target builds");
    auto again = std::move(moved).build();
    expect_true(std::holds_alternative<std::vector<Violation>>(again), "second build fails");
}

static void test_static_provider() {
    StaticAuthorizationProvider authz;
    authz.grant("u-2", "log");
    authz.grant("*", "http");
    authz.grant("u-3", "*");
    expect_eq_ll((long long)authz.grant_count(), 3, "three grants");

    expect_true(authz.decide(bob(), "log"), "direct grant");
    expect_true(authz.decide(bob(), "http"), "wildcard principal");
    expect_true(!authz.decide(bob(), "audit"), "no grant");
    expect_true(authz.decide(Principal{"u-3", "Carol"}, "audit"), "wildcard action");

    authz.set_allow_wildcard(false);
    expect_true(!authz.decide(bob(), "http"), "wildcards ignored when disabled");
    expect_true(!authz.decide(Principal{"u-3", "Carol"}, "audit"), "action wildcard ignored");
    expect_true(authz.decide(bob(), "log"), "direct grant still honored");

    authz.revoke("u-2", "log");
    expect_true(!authz.decide(bob(), "log"), "revoked");
    expect_true(!authz.decide(Principal{"", "anon"}, "log"), "empty principal id never allowed");

    FunctionAuthorizationProvider fn([](const Principal& p, const std::string& a) {
        return p.id == "u-2" && a == "log";
    });
    expect_true(fn.decide(bob(), "log"), "function provider allows");
    expect_true(!fn.decide(bob(), "http"), "function provider denies");
}

static void test_action_names() {
    expect_true(is_well_formed_action("log"), "log");
    expect_true(is_well_formed_action("billing.export-v2_x"), "dots dashes underscores digits");
    expect_true(!is_well_formed_action(""), "empty");
    expect_true(!is_well_formed_action("Log"), "uppercase");
    expect_true(!is_well_formed_action("a b"), "space");
    expect_true(!is_well_formed_action(std::string(65, 'a')), "too long");
    expect_eq_str(PolicyRequirement::authorized_for("log").to_string(), "authorized_for(log)", "display");
}

int main() {
    test_missing_principal_reported_once();
    test_authorized_with_principal();
    test_require_is_idempotent();
    test_order_independence();
    test_violations_are_batched();
    test_missing_principal_with_malformed();
    test_empty_gate();
    test_non_capability_action();
    test_gate_is_single_use();
    test_static_provider();
    test_action_names();

    std::cerr << "test_gate: ALL PASSED" << std::endl;
    return 0;
}
