#include <string>
#include <gtest/gtest.h>
#include "core/errors/security_error.hpp"
#include "protocol/gate_request.hpp"
#include "runtime/gate_runner.hpp"

namespace {

using warden::core::errors::ErrorCode;
using warden::protocol::CheckKind;
using warden::protocol::GateRequest;
using warden::runtime::GateRunner;

GateRequest make_request(CheckKind kind, const std::string& subject) {
    GateRequest req;
    req.kind = kind;
    req.subject = subject;
    req.workspace_root = "/tmp/ws";
    return req;
}

TEST(GateRunnerTest, CommandReportIncludesSanitizedPreview) {
    GateRunner runner("/tmp/ws");
    const auto report = runner.run(make_request(CheckKind::Command, "ls -la; pwd"));
    EXPECT_TRUE(report.valid);
    EXPECT_EQ(report.check, CheckKind::Command);
    ASSERT_TRUE(report.sanitized.has_value());
    EXPECT_EQ(report.sanitized.value(), "ls -la pwd");
    EXPECT_FALSE(report.normalized.has_value());
}

TEST(GateRunnerTest, RejectedCommandStillReportsSanitizedForm) {
    GateRunner runner("/tmp/ws");
    const auto report = runner.run(make_request(CheckKind::Command, "cat ../../etc/passwd"));
    EXPECT_FALSE(report.valid);
    ASSERT_TRUE(report.error.has_value());
    EXPECT_EQ(report.error->code, ErrorCode::PathTraversal);
    EXPECT_EQ(report.sanitized.value(), "cat ../../etc/passwd");
}

TEST(GateRunnerTest, ExecutionUsesWorkingDirectory) {
    GateRunner runner("/tmp/ws");
    auto req = make_request(CheckKind::Execution, "make test");
    req.working_dir = "build";
    EXPECT_TRUE(runner.run(req).valid);

    req.subject = "shutdown now";
    const auto report = runner.run(req);
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error->code, ErrorCode::DangerousCommand);
}

TEST(GateRunnerTest, PathReportIncludesNormalizedForm) {
    GateRunner runner("/tmp/ws");
    const auto ok = runner.run(make_request(CheckKind::Path, "./foo.txt"));
    EXPECT_TRUE(ok.valid);
    EXPECT_EQ(ok.normalized.value(), "/tmp/ws/foo.txt");

    const auto escaped = runner.run(make_request(CheckKind::Path, "../../etc/passwd"));
    EXPECT_FALSE(escaped.valid);
    EXPECT_EQ(escaped.error->code, ErrorCode::PathOutOfBounds);
    EXPECT_EQ(escaped.normalized.value(), "/");
}

TEST(GateRunnerTest, FileCheckValidatesPathThenName) {
    GateRunner runner("/tmp/ws");
    EXPECT_TRUE(runner.run(make_request(CheckKind::File, "docs/readme.md")).valid);

    const auto executable = runner.run(make_request(CheckKind::File, "./bin/payload.exe"));
    EXPECT_FALSE(executable.valid);
    EXPECT_EQ(executable.error->code, ErrorCode::DangerousExtension);
    EXPECT_EQ(executable.normalized.value(), "/tmp/ws/bin/payload.exe");

    const auto outside = runner.run(make_request(CheckKind::File, "/etc/payload.exe"));
    EXPECT_FALSE(outside.valid);
    EXPECT_EQ(outside.error->code, ErrorCode::PathOutOfBounds);

    const auto reserved = runner.run(make_request(CheckKind::File, "logs/AUX.log"));
    EXPECT_FALSE(reserved.valid);
    EXPECT_EQ(reserved.error->code, ErrorCode::ReservedFilename);
}

TEST(GateRunnerTest, FileCheckResolvesDotDotBeforeContainment) {
    GateRunner runner("/tmp/ws");
    const auto escaped = runner.run(make_request(CheckKind::File, "sub/../../../etc/passwd"));
    EXPECT_FALSE(escaped.valid);
    EXPECT_EQ(escaped.error->code, ErrorCode::PathOutOfBounds);
    EXPECT_EQ(escaped.normalized.value(), "/etc/passwd");

    const auto dotted = runner.run(make_request(CheckKind::File, "./a/../../../root/.ssh/id_rsa"));
    EXPECT_FALSE(dotted.valid);
    EXPECT_EQ(dotted.error->code, ErrorCode::PathOutOfBounds);

    const auto inside = runner.run(make_request(CheckKind::File, "src/../docs/notes.md"));
    EXPECT_TRUE(inside.valid);
    EXPECT_EQ(inside.normalized.value(), "/tmp/ws/docs/notes.md");
}

TEST(GateRunnerTest, FilenameCheckUsesPathValidator) {
    GateRunner runner("/tmp/ws");
    EXPECT_TRUE(runner.run(make_request(CheckKind::Filename, "notes.txt")).valid);

    const auto report = runner.run(make_request(CheckKind::Filename, "CON.txt"));
    EXPECT_FALSE(report.valid);
    EXPECT_EQ(report.error->code, ErrorCode::ReservedFilename);
}

TEST(GateRunnerTest, SanitizeFilenameValidatesSanitizedName) {
    GateRunner runner("/tmp/ws");
    const auto cleaned = runner.run(make_request(CheckKind::SanitizeFilename, "re:port?.txt"));
    EXPECT_TRUE(cleaned.valid);
    EXPECT_EQ(cleaned.sanitized.value(), "re_port_.txt");

    const auto reserved = runner.run(make_request(CheckKind::SanitizeFilename, "con.txt"));
    EXPECT_FALSE(reserved.valid);
    EXPECT_EQ(reserved.sanitized.value(), "con.txt");
    EXPECT_EQ(reserved.error->code, ErrorCode::ReservedFilename);
}

}  // namespace
