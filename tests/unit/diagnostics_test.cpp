#include <axground/core/diagnostics.h>

#include <gtest/gtest.h>

#include <sstream>
#include <string>
#include <vector>

using namespace axground::core;

TEST(DiagnosticEmitterTest, RecordsEventsInOrder) {
    DiagnosticEmitter emitter;
    emitter.info("tree_builder", "build", "first");
    emitter.warn("snapshot_reader", "viewport", "second");
    emitter.error("selection", "occlusion", "third");

    ASSERT_EQ(emitter.events().size(), 3u);
    EXPECT_EQ(emitter.events()[0].message, "first");
    EXPECT_EQ(emitter.events()[1].severity, Severity::Warning);
    EXPECT_EQ(emitter.events()[2].module, "selection");
    EXPECT_TRUE(emitter.has_errors());
}

TEST(DiagnosticEmitterTest, DropsEventsBelowMinimumSeverity) {
    DiagnosticEmitter emitter;
    emitter.debug("visibility", "walk", "hidden by default");
    EXPECT_TRUE(emitter.events().empty());

    emitter.set_min_severity(Severity::Debug);
    emitter.debug("visibility", "walk", "now kept");
    EXPECT_EQ(emitter.events().size(), 1u);

    emitter.set_min_severity(Severity::Warning);
    emitter.info("pipeline", "roles", "dropped");
    emitter.error("batch", "dataset", "kept");
    ASSERT_EQ(emitter.events().size(), 2u);
    EXPECT_EQ(emitter.events()[1].severity, Severity::Error);
}

TEST(DiagnosticEmitterTest, CountsBySeverity) {
    DiagnosticEmitter emitter;
    emitter.info("tree_builder", "build", "a");
    emitter.warn("tree_builder", "resolve", "b");
    emitter.warn("snapshot_reader", "viewport", "c");

    EXPECT_EQ(emitter.count(Severity::Warning), 2u);
    EXPECT_EQ(emitter.count(Severity::Info), 1u);
    EXPECT_FALSE(emitter.has_errors());
}

TEST(DiagnosticEmitterTest, StampsCorrelationId) {
    DiagnosticEmitter emitter;
    emitter.set_correlation_id(7);
    emitter.info("pipeline", "roles", "tagged");
    EXPECT_EQ(emitter.events()[0].correlation_id, 7u);
}

TEST(DiagnosticEmitterTest, ObserversSeeKeptEvents) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& e) { seen.push_back(e.message); });
    emitter.debug("m", "s", "filtered");
    emitter.info("m", "s", "kept");
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "kept");
}

TEST(FormatDiagnosticTest, Layout) {
    DiagnosticEvent event;
    event.severity = Severity::Warning;
    event.module = "tree_builder";
    event.stage = "resolve";
    event.message = "node '4' references missing child '9'";
    EXPECT_EQ(format_diagnostic(event),
              "[warning] tree_builder/resolve: node '4' references missing child '9'");

    event.correlation_id = 3;
    EXPECT_EQ(format_diagnostic(event),
              "[warning] tree_builder/resolve (snapshot:3): node '4' references missing child '9'");
}

TEST(FormatDiagnosticTest, StreamObserverWritesLines) {
    std::ostringstream out;
    DiagnosticEmitter emitter;
    emitter.add_observer(make_stream_observer(out));
    emitter.info("pipeline", "roles", "2 nodes with unmapped roles");
    EXPECT_EQ(out.str(), "[info] pipeline/roles: 2 nodes with unmapped roles\n");
}

TEST(FormatDiagnosticTest, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Debug), "debug");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}
