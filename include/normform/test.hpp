// ============================================================================
// normform/test.hpp — Lightweight selftest framework
// ============================================================================
//
// Defines a minimal test harness: register test functions, run them,
// and report pass/fail counts.  No external dependencies.
//
// Usage:
//   void test_foo(TestContext& ctx) {
//       ctx.check_eq(convert_to_string("a && a", NormalForm::Cnf), "a", "dedup");
//       ctx.check_throws<ParseError>([] { ... }, "dangling operator");
//   }
//   // in run_selftests():  runner.section("simplifier");
//   //                      runner.run("foo", test_foo);
//
// ============================================================================

#ifndef NORMFORM_TEST_HPP
#define NORMFORM_TEST_HPP

#include <functional>
#include <string>

namespace normform {

// ── TestContext ──────────────────────────────────────────────────────────────

class TestContext {
public:
    /// Record a check.  If `condition` is false, logs a failure.
    void check(bool condition, const std::string& description);

    /// Record a string-equality check with nice diff output.
    void check_eq(const std::string& actual, const std::string& expected,
                  const std::string& description);

    /// Record a substring check; the failure shows the whole text.
    void check_contains(const std::string& text, const std::string& needle,
                        const std::string& description);

    /// Record a check that `fn` throws an exception of type E.
    /// Returns the caught message (what()), or "" if nothing matching was thrown.
    template <typename E, typename F>
    std::string check_throws(F&& fn, const std::string& description) {
        try {
            fn();
        } catch (const E& e) {
            check(true, description);
            return e.what();
        }
        check(false, description + " (no exception)");
        return "";
    }

    /// Total checks so far.
    int total() const noexcept { return total_; }

    /// Failed checks so far.
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

    /// Print a heading for the tests that follow.
    void section(const std::string& title);

    /// Register and immediately run a named test.
    void run(const std::string& name, TestFunc func);

    /// Print summary and return exit code (0 = all pass, 1 = failures).
    int summarise() const;

private:
    int tests_run_    = 0;
    int tests_failed_ = 0;
    int checks_total_ = 0;
    int checks_failed_ = 0;
};

/// Entry point: run all built-in self-tests.
/// Returns 0 on success, 1 on failure.
int run_selftests();

}  // namespace normform

#endif  // NORMFORM_TEST_HPP
