// ============================================================================
// smtsym/test.hpp - Lightweight selftest framework
// ============================================================================
//
// Defines a minimal test harness: register test functions, run them,
// and report pass/fail counts.
//
// Usage:
//   void test_foo(TestContext& ctx) {
//       ctx.check(st.next_node_id() == 3, "fresh context starts at 3");
//   }
//   // in run_selftests():  runner.run("foo", test_foo);
//
// ============================================================================

#ifndef SMTSYM_TEST_HPP
#define SMTSYM_TEST_HPP

#include <functional>
#include <string>

namespace smtsym {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with expected/actual output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    int total() const noexcept { return total_; }
    int failed() const noexcept { return failed_; }

private:
    int total_  = 0;
    int failed_ = 0;
    std::string current_test_;

    friend class TestRunner;
};

// ── TestRunner ──────────────────────────────────────────────────────────────

class TestRunner {
public:
    using TestFunc = std::function<void(TestContext&)>;

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    int tests_run_     = 0;
    int tests_failed_  = 0;
    int checks_total_  = 0;
    int checks_failed_ = 0;
};

/// Entry point: run all built-in self-tests.
/// Returns 0 on success, 1 on failure.
int run_selftests();

}  // namespace smtsym

#endif  // SMTSYM_TEST_HPP
