#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "capture/capture.hpp"
#include "common/models.hpp"
#include "common/settings.hpp"
#include "engine/assertion_coordinator.hpp"
#include "engine/snapshot_store.hpp"

// QtTest integration. Inside a test slot:
//
//     KEEPSAKE_ASSERT_YAML_SNAPSHOT("user", user);
//     KEEPSAKE_ASSERT_JSON_SNAPSHOT_REDACTED("login", response,
//                                            {".token", "[token]"},
//                                            {"**.id", 0});
//
// The name may be empty, in which case the running test function (plus the
// data tag of data-driven tests) names the snapshot. Failures are reported
// through QTest::qFail and return from the test function, like QVERIFY.
// Wrap values containing top-level commas in parentheses.

namespace keepsake::harness {

struct RedactionArg {
    template <typename T>
    RedactionArg(std::string selectorText, const T &value)
        : redaction{std::move(selectorText), capture(value)}
    {
    }

    Redaction redaction;
};

// Settings are read from the environment on first use and stay fixed for the
// process unless configure() replaces them. configure() may run while other
// threads assert: each assertion holds on to the settings and store it
// started with.
RunSettings settings();
void configure(const RunSettings &settings);

// Process-wide store. Its sequence counter is never reset implicitly; the
// test function name in each identity keeps tests apart.
std::shared_ptr<SnapshotStore> store();

SnapshotIdentity callSite(const char *file,
                          int line,
                          const std::string &name,
                          const char *expression);

bool checkSnapshot(const SnapshotIdentity &identity,
                   const std::function<Content()> &captureValue,
                   const std::vector<RedactionArg> &redactions,
                   SnapshotFormat format);

bool checkText(const SnapshotIdentity &identity, const std::string &text);

} // namespace keepsake::harness

#define KEEPSAKE_ASSERT_SNAPSHOT_IMPL(format, name, value, ...) \
    do { \
        if (!::keepsake::harness::checkSnapshot( \
                ::keepsake::harness::callSite(__FILE__, __LINE__, (name), #value), \
                [&]() { return ::keepsake::capture(value); }, \
                std::vector<::keepsake::harness::RedactionArg>{__VA_ARGS__}, \
                (format))) { \
            return; \
        } \
    } while (false)

#define KEEPSAKE_ASSERT_JSON_SNAPSHOT(name, value) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Json, name, value, )
#define KEEPSAKE_ASSERT_YAML_SNAPSHOT(name, value) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Yaml, name, value, )
#define KEEPSAKE_ASSERT_RON_SNAPSHOT(name, value) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Ron, name, value, )

#define KEEPSAKE_ASSERT_JSON_SNAPSHOT_REDACTED(name, value, ...) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Json, name, value, __VA_ARGS__)
#define KEEPSAKE_ASSERT_YAML_SNAPSHOT_REDACTED(name, value, ...) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Yaml, name, value, __VA_ARGS__)
#define KEEPSAKE_ASSERT_RON_SNAPSHOT_REDACTED(name, value, ...) \
    KEEPSAKE_ASSERT_SNAPSHOT_IMPL(::keepsake::SnapshotFormat::Ron, name, value, __VA_ARGS__)

#define KEEPSAKE_ASSERT_TEXT_SNAPSHOT(name, text) \
    do { \
        if (!::keepsake::harness::checkText( \
                ::keepsake::harness::callSite(__FILE__, __LINE__, (name), #text), \
                (text))) { \
            return; \
        } \
    } while (false)
