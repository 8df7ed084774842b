#include <gtest/gtest.h>

#include <string>

#include "mutator/common/diagnostic/diagnostic.hpp"
#include "mutator/common/diagnostic/diagnostic_sink.hpp"
#include "mutator/common/internal_error.hpp"

namespace mutator {
namespace {

class DiagnosticTest : public ::testing::Test {};

TEST_F(DiagnosticTest, FormatsLocations) {
  EXPECT_EQ(
      FormatLocation(InstrLocation{.procedure = "Decrypt", .index = 4}),
      "Decrypt@4");
  EXPECT_EQ(
      FormatLocation(FileLocation{.path = "a.mil", .line = 12}), "a.mil:12");
  EXPECT_EQ(FormatLocation(FileLocation{.path = "a.mil", .line = 0}), "a.mil");
  EXPECT_EQ(FormatLocation(UnknownLocation{}), "");
}

TEST_F(DiagnosticTest, ErrorCarriesCode) {
  Diagnostic diag =
      Diagnostic::Error(
          ErrorCode::kTraceFailure,
          InstrLocation{.procedure = "P", .index = 0}, "failed")
          .WithNote("detail");
  EXPECT_EQ(diag.Code(), ErrorCode::kTraceFailure);
  ASSERT_EQ(diag.notes.size(), 1U);
  EXPECT_EQ(diag.notes[0].kind, DiagKind::kNote);
  EXPECT_EQ(diag.notes[0].message, "detail");
  EXPECT_EQ(std::string(ToString(ErrorCode::kTraceFailure)), "trace-failure");
}

TEST_F(DiagnosticTest, HostErrorHasNoCode) {
  Diagnostic diag = Diagnostic::HostError("cannot open");
  EXPECT_EQ(diag.primary.kind, DiagKind::kHostError);
  EXPECT_FALSE(diag.Code().has_value());
}

TEST_F(DiagnosticTest, SinkCountsByKind) {
  DiagnosticSink sink;
  InstrLocation loc{.procedure = "P", .index = 1};
  sink.Warning(loc, "no value configured for KeyI3");
  EXPECT_FALSE(sink.HasErrors());

  sink.Error(ErrorCode::kUnexpectedMarkerUse, loc, "unexpected");
  sink.Report(
      Diagnostic::ConfigError(ErrorCode::kMissingProcessor, "no processor"));
  EXPECT_TRUE(sink.HasErrors());
  EXPECT_EQ(sink.ErrorCount(), 2U);
  EXPECT_EQ(sink.WarningCount(), 1U);

  ASSERT_EQ(sink.GetDiagnostics().size(), 3U);
  EXPECT_EQ(sink.GetDiagnostics()[0].primary.kind, DiagKind::kWarning);
  EXPECT_EQ(
      sink.GetDiagnostics()[1].Code(), ErrorCode::kUnexpectedMarkerUse);
}

TEST_F(DiagnosticTest, InternalErrorNamesComponent) {
  try {
    common::ThrowInternalError("SpliceBody", "range [{}, {})", 3, 9);
    FAIL() << "expected InternalError";
  } catch (const common::InternalError& e) {
    EXPECT_EQ(e.Component(), "SpliceBody");
    EXPECT_EQ(
        std::string(e.what()), "internal error in SpliceBody: range [3, 9)");
  }
}

}  // namespace
}  // namespace mutator
