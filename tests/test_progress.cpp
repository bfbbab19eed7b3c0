#include <catch2/catch.hpp>
#include "test_helpers.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace conz;

// ============================================================================
// Normal completion and explicit banners
// ============================================================================

TEST_CASE("Body completing normally prints one success banner", "[progress]") {
    ConsoleHarness h;
    bool ran = false;

    Outcome outcome = h.console.progress("Waiting", [&](Progress&) { ran = true; });

    REQUIRE(ran);
    REQUIRE(outcome == Outcome::succeeded);
    REQUIRE(h.out.str() == "Waiting...DONE\n");
    REQUIRE(h.err.str().empty());
}

TEST_CASE("succeed() stops the body", "[progress]") {
    ConsoleHarness h;
    bool after = false;

    Outcome outcome = h.console.progress("Step", [&](Progress& step) {
        step.succeed("OK");
        after = true;
    });

    REQUIRE_FALSE(after);
    REQUIRE(outcome == Outcome::succeeded);
    REQUIRE(h.out.str() == "Step...OK\n");
}

TEST_CASE("abort() prints one abort banner and re-raises", "[progress]") {
    ConsoleHarness h;

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress& step) { step.abort(); }),
                      ProgressAbort);
    REQUIRE(h.out.str() == "Step...FAIL\n");
    REQUIRE(count_of(h.out.str(), "FAIL") == 1);
    REQUIRE(h.err.str().empty());
}

TEST_CASE("abort() without re-raise returns the aborted outcome", "[progress]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.reraise = false;

    Outcome outcome = h.console.progress("Step", [](Progress& step) { step.abort(); }, options);

    REQUIRE(outcome == Outcome::aborted);
    REQUIRE(h.out.str() == "Step...FAIL\n");
}

TEST_CASE("Banner text and separator can be customized", "[progress]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.separator = ": ";
    options.done = "finished";

    h.console.progress("Copy", [](Progress&) {}, options);

    REQUIRE(h.out.str() == "Copy: finished\n");
}

TEST_CASE("Banners are colored green and red", "[progress][colors]") {
    Config config = ConsoleHarness::plain_config();
    config.color = ColorMode::always;

    ConsoleHarness ok("", config);
    ok.console.progress("A", [](Progress&) {});
    REQUIRE(ok.out.str() == "A...\033[32mDONE\033[0m\n");

    ConsoleHarness failed("", config);
    REQUIRE_THROWS_AS(failed.console.progress("B", [](Progress& step) { step.abort(); }),
                      ProgressAbort);
    REQUIRE(failed.out.str() == "B...\033[31mFAIL\033[0m\n");
}

// ============================================================================
// Ticks, post callbacks and no_signal
// ============================================================================

TEST_CASE("Ticks are printed without line breaks", "[progress]") {
    ConsoleHarness h;

    h.console.progress("Progressing", [](Progress& step) {
        for (int i = 0; i < 3; ++i) {
            step.tick();
        }
        step.tick("#");
    });

    REQUIRE(h.out.str() == "Progressing......#DONE\n");
}

TEST_CASE("post runs after the banner and before the signal", "[progress]") {
    ConsoleHarness h;
    std::string seen;

    h.console.progress("Step", [&](Progress& step) {
        step.succeed("", [&]() { seen = h.out.str(); });
    });

    REQUIRE(seen == "Step...DONE\n");
}

TEST_CASE("no_signal announces success and keeps running", "[progress]") {
    ConsoleHarness h;
    bool after = false;

    Outcome outcome = h.console.progress("Step", [&](Progress& step) {
        step.succeed("", {}, true);
        REQUIRE(step.state() == Progress::State::succeeded);
        after = true;
    });

    REQUIRE(after);
    REQUIRE(outcome == Outcome::succeeded);
    REQUIRE(h.out.str() == "Step...DONE\n");
}

TEST_CASE("no_signal abort still ends the step as aborted", "[progress]") {
    ConsoleHarness h;
    bool after = false;

    REQUIRE_THROWS_AS(h.console.progress("Step", [&](Progress& step) {
        step.abort("", {}, true);
        after = true;
    }), ProgressAbort);

    REQUIRE(after);
    REQUIRE(h.out.str() == "Step...FAIL\n");
}

TEST_CASE("Success signal after a no_signal abort keeps the step aborted", "[progress]") {
    ConsoleHarness h;

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress& step) {
        step.abort("", {}, true);
        throw ProgressOK();
    }), ProgressAbort);
    REQUIRE(h.out.str() == "Step...FAIL\n");

    ProgressOptions options;
    options.reraise = false;
    Outcome outcome = h.console.progress("Again", [](Progress& step) {
        step.abort("", {}, true);
        throw ProgressOK();
    }, options);

    REQUIRE(outcome == Outcome::aborted);
    REQUIRE(count_of(h.out.str(), "DONE") == 0);
}

TEST_CASE("Resolving a step twice is a programming error", "[progress][errors]") {
    ConsoleHarness h;

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress& step) {
        step.succeed("", {}, true);
        step.abort();
    }), ProgressMisuse);
    REQUIRE(count_of(h.out.str(), "DONE") == 1);
    REQUIRE(count_of(h.out.str(), "FAIL") == 0);
}

TEST_CASE("Verbosity hides banners but not behavior", "[progress]") {
    Config config = ConsoleHarness::plain_config();
    config.verbose = false;
    ConsoleHarness h("", config);
    bool ran = false;

    Outcome outcome = h.console.progress("Hidden", [&](Progress& step) {
        step.tick();
        ran = true;
    });

    REQUIRE(ran);
    REQUIRE(outcome == Outcome::succeeded);
    REQUIRE(h.out.str().empty());
}

// ============================================================================
// Intercepted failures
// ============================================================================

TEST_CASE("Intercepted failure prints abort banner, calls handler once, re-raises", "[progress][errors]") {
    ConsoleHarness h;
    int calls = 0;
    std::string message;
    ProgressOptions options;
    options.on_error = ErrorHandler([&](const std::exception_ptr& error) {
        ++calls;
        try {
            std::rethrow_exception(error);
        } catch (const std::runtime_error& e) {
            message = e.what();
        }
    });

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress&) {
        throw std::runtime_error("disk full");
    }, options), ProgressAbort);

    REQUIRE(calls == 1);
    REQUIRE(message == "disk full");
    REQUIRE(h.out.str() == "Step...FAIL\n");
}

TEST_CASE("Default handler prints the error template", "[progress][errors]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.reraise = false;

    Outcome outcome = h.console.progress("Step", [](Progress&) {
        throw std::runtime_error("boom");
    }, options);

    REQUIRE(outcome == Outcome::aborted);
    REQUIRE(h.err.str() == "Program error: boom\n");
}

TEST_CASE("A message given as handler uses the default formatter", "[progress][errors]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.reraise = false;
    options.on_error = std::string("Could not copy ({err})");

    h.console.progress("Copy", [](Progress&) { throw std::runtime_error("no space"); }, options);

    REQUIRE(h.err.str() == "Could not copy (no space)\n");
}

TEST_CASE("Failure outside the interception set propagates untouched", "[progress][errors]") {
    ConsoleHarness h;
    bool handled = false;
    ProgressOptions options;
    options.intercept = {catches<std::invalid_argument>()};
    options.on_error = ErrorHandler([&](const std::exception_ptr&) { handled = true; });

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress&) {
        throw std::out_of_range("index");
    }, options), std::out_of_range);

    REQUIRE_FALSE(handled);
    REQUIRE(h.out.str() == "Step...");
    REQUIRE(h.err.str().empty());
}

TEST_CASE("catches_anything intercepts non-standard exceptions", "[progress][errors]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.intercept = {catches_anything()};
    options.reraise = false;

    Outcome outcome = h.console.progress("Step", [](Progress&) { throw 42; }, options);

    REQUIRE(outcome == Outcome::aborted);
    REQUIRE(h.out.str() == "Step...FAIL\n");
    REQUIRE(h.err.str() == "Program error: unknown error\n");
}

TEST_CASE("Interrupts are never intercepted", "[progress][signals]") {
    ConsoleHarness h;
    bool handled = false;
    ProgressOptions options;
    options.intercept = {catches_anything()};
    options.on_error = ErrorHandler([&](const std::exception_ptr&) { handled = true; });

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress&) { throw Interrupted(); }, options),
                      Interrupted);

    REQUIRE_FALSE(handled);
    REQUIRE(h.out.str() == "Step...");
}

TEST_CASE("Programming errors propagate as-is", "[progress][errors]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.intercept = {catches_anything()};

    REQUIRE_THROWS_AS(h.console.progress("Step", [&](Progress&) {
        h.console.color().color("x", "pink");
    }, options), LookupError);
    REQUIRE(h.out.str() == "Step...");
}

TEST_CASE("Helper misuse inside a step is not reported as a failure", "[progress][errors]") {
    ConsoleHarness h("1\n");
    MenuOptions<std::string> menu_options;
    menu_options.numerator = [](std::size_t) { return std::vector<std::string>{"1"}; };
    const std::vector<MenuChoice<std::string>> choices = {{"a", "A"}, {"b", "B"}};

    REQUIRE_THROWS_AS(h.console.progress("Menu", [&](Progress&) {
        h.console.menu(choices, menu_options);
    }), UsageError);
    REQUIRE(h.out.str() == "Menu...");
    REQUIRE(h.err.str().empty());

    REQUIRE_THROWS_AS(h.console.progress("Pipe", [&](Progress&) {
        h.console.read_pipe(0, [](const std::vector<std::string>&) {});
    }), ProgrammingError);
    REQUIRE(h.err.str().empty());
}

TEST_CASE("Signals pass through std::exception handlers in the body", "[progress]") {
    ConsoleHarness h;
    bool swallowed = false;

    h.console.progress("Step", [&](Progress& step) {
        try {
            step.succeed();
        } catch (const std::exception&) {
            swallowed = true;
        }
    });

    REQUIRE_FALSE(swallowed);
    REQUIRE(h.out.str() == "Step...DONE\n");
}

TEST_CASE("Failure after announced success keeps a single banner", "[progress][errors]") {
    ConsoleHarness h;

    REQUIRE_THROWS_AS(h.console.progress("Step", [](Progress& step) {
        step.succeed("", {}, true);
        throw std::runtime_error("late");
    }), ProgressAbort);

    REQUIRE(h.out.str() == "Step...DONE\n");
    REQUIRE(h.err.str() == "Program error: late\n");
}

// ============================================================================
// Debug traces
// ============================================================================

TEST_CASE("Debug mode writes the trace after the handler output", "[progress][debug]") {
    Config config = ConsoleHarness::plain_config();
    config.debug = true;
    ConsoleHarness h("", config);
    ProgressOptions options;
    options.reraise = false;

    h.console.progress("Step", [](Progress&) {
        try {
            throw std::runtime_error("socket closed");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("sync failed"));
        }
    }, options);

    const std::string err = h.err.str();
    size_t handler_pos = err.find("Program error: sync failed");
    size_t trace_pos = err.find("Traceback");
    REQUIRE(handler_pos != std::string::npos);
    REQUIRE(trace_pos != std::string::npos);
    REQUIRE(handler_pos < trace_pos);
    REQUIRE(err.find("[progress]") != std::string::npos);
    REQUIRE(err.find("  sync failed\n") != std::string::npos);
    REQUIRE(err.find("    socket closed\n") != std::string::npos);
}

TEST_CASE("No trace without debug mode", "[progress][debug]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.reraise = false;

    h.console.progress("Step", [](Progress&) { throw std::runtime_error("x"); }, options);

    REQUIRE(h.err.str().find("Traceback") == std::string::npos);
}

// ============================================================================
// Sequences and nesting
// ============================================================================

TEST_CASE("Multi-step sequence stops at the failing step", "[progress]") {
    ConsoleHarness h;
    bool step4 = false;

    try {
        h.console.progress("Step 1", [](Progress&) {});
        h.console.progress("Step 2", [](Progress&) { throw std::runtime_error("Intentional failure"); });
        h.console.progress("Step 3", [&](Progress&) { step4 = true; });
    } catch (const ProgressAbort&) {
        h.console.perr("Something went wrong during one of the steps");
    }

    REQUIRE_FALSE(step4);
    REQUIRE(h.out.str() == "Step 1...DONE\nStep 2...FAIL\n");
    REQUIRE(h.err.str() == "Program error: Intentional failure\n"
                           "Something went wrong during one of the steps\n");
}

TEST_CASE("Nested abort ends the enclosing step too", "[progress]") {
    ConsoleHarness h;

    REQUIRE_THROWS_AS(h.console.progress("Outer", [&](Progress&) {
        h.console.progress("Inner", [](Progress& inner) { inner.abort(); });
    }), ProgressAbort);

    REQUIRE(h.out.str() == "Outer...Inner...FAIL\nFAIL\n");
}

TEST_CASE("Nested step that does not re-raise leaves the outer step running", "[progress]") {
    ConsoleHarness h;
    ProgressOptions quiet;
    quiet.reraise = false;

    Outcome outer = h.console.progress("Outer", [&](Progress&) {
        Outcome inner = h.console.progress("Inner", [](Progress& step) { step.abort(); }, quiet);
        REQUIRE(inner == Outcome::aborted);
    });

    REQUIRE(outer == Outcome::succeeded);
    REQUIRE(h.out.str() == "Outer...Inner...FAIL\nDONE\n");
}

// ============================================================================
// Error handler factory
// ============================================================================

TEST_CASE("error() replaces every placeholder", "[progress][errors]") {
    ConsoleHarness h;
    ErrorHandler handler = h.console.error("{err} / {err}");

    handler(std::make_exception_ptr(std::runtime_error("bad")));

    REQUIRE(h.err.str() == "bad / bad\n");
}

TEST_CASE("error() with an empty message prints nothing but still runs", "[progress][errors]") {
    ConsoleHarness h;
    ProgressOptions options;
    options.reraise = false;
    options.on_error = h.console.error("");

    Outcome outcome = h.console.progress("Step", [](Progress&) {
        throw std::runtime_error("x");
    }, options);

    REQUIRE(outcome == Outcome::aborted);
    REQUIRE(h.err.str().empty());
}

TEST_CASE("Configured error template is the default", "[progress][errors]") {
    Config config = ConsoleHarness::plain_config();
    config.error_template = "E: {err}";
    ConsoleHarness h("", config);

    h.console.error()(std::make_exception_ptr(std::logic_error("oops")));

    REQUIRE(h.err.str() == "E: oops\n");
}
