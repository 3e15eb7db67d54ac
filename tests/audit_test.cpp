#include "audit.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <fstream>
#include <sstream>

namespace {

std::string audit(const Store& store, AuditRequest req) {
  std::ostringstream os;
  EXPECT_EQ(run_audit(store, req, os), 0);
  return os.str();
}

AuditRequest cmd(const std::string& name) {
  AuditRequest r;
  r.command = name;
  return r;
}

} // namespace

class AuditTest : public ::testing::Test {
protected:
  void SetUp() override {
    file_id = seed_file(store, "lib/core.py", {{1, 4, "function", "def parse(text):\n    return text"}});
    Symbol a, b;
    a.file_id = b.file_id = file_id;
    a.name = "parse";
    b.name = "helper";
    a.kind = b.kind = "function";
    auto ids = store.add_symbols({a, b});
    sym_a = ids[0];
    store.add_edges({{ids[0], ids[1], EdgeType::Calls}, {ids[1], ids[0], EdgeType::Imports}});

    ReportVersion rv;
    rv.content = "# Report\n- Parses text [lib/core.py:1-4]";
    rv.created_at = "2024-01-01T00:00:00Z";
    report_id = store.add_report_version(rv);
    Claim c;
    c.report_version = report_id;
    c.text = "- Parses text [lib/core.py:1-4]";
    c.citation_refs = {"lib/core.py:1-4"};
    c.status = ClaimStatus::Supported;
    c.severity = Severity::Low;
    store.replace_claims(report_id, {c});

    IterationMetrics m;
    m.iteration = 1;
    m.coverage = 1.0;
    store.log_iteration_status(report_id, m);
    store.log_iteration_issues(report_id, 1, {{Severity::High, "claim unresolved", "cite it"}});
    store.log_retrieval_event(report_id, 1, "describe parsing", store.chunks_for_file(file_id), {}, {}, {});
  }
  Store store;
  int64_t file_id = 0, sym_a = 0, report_id = 0;
};

TEST_F(AuditTest, ListingsShowStoredRows) {
  EXPECT_NE(audit(store, cmd("list-files")).find("lib/core.py\tpython"), std::string::npos);
  EXPECT_NE(audit(store, cmd("list-reports")).find("id=" + std::to_string(report_id)), std::string::npos);

  auto claims = cmd("list-claims");
  claims.report_id = report_id;
  auto out = audit(store, claims);
  EXPECT_NE(out.find("status=supported severity=low citations=[lib/core.py:1-4]"), std::string::npos);

  auto it = audit(store, cmd("list-iterations"));
  EXPECT_NE(it.find("iter=1 cov=1.00"), std::string::npos);
  auto issues = audit(store, cmd("list-issues"));
  EXPECT_NE(issues.find("severity=high desc=claim unresolved hint=cite it"), std::string::npos);
  auto events = audit(store, cmd("list-retrieval-events"));
  EXPECT_NE(events.find("prompt=describe parsing"), std::string::npos);
}

TEST_F(AuditTest, ShowAndExportReport) {
  auto show = cmd("show-report");
  show.id = report_id;
  EXPECT_EQ(audit(store, show), "# Report\n- Parses text [lib/core.py:1-4]\n");

  show.id = 9999;
  std::ostringstream os;
  EXPECT_EQ(run_audit(store, show, os), 1);
  EXPECT_EQ(os.str(), "Not found\n");

  TempTree tmp;
  auto exp = cmd("export-report");
  exp.id = report_id;
  EXPECT_THROW(audit(store, exp), FormatError);
  exp.out = tmp.file("report.md");
  audit(store, exp);
  std::ifstream in(exp.out);
  std::stringstream content;
  content << in.rdbuf();
  EXPECT_EQ(content.str(), "# Report\n- Parses text [lib/core.py:1-4]");
}

TEST_F(AuditTest, SymbolNeighboursFilterByEdgeType) {
  auto req = cmd("symbol-neighbors");
  req.symbol_id = sym_a;
  auto all = audit(store, req);
  EXPECT_NE(all.find("-[calls]->"), std::string::npos);
  EXPECT_NE(all.find("-[imports]->"), std::string::npos);
  req.edge_type = "calls";
  auto only = audit(store, req);
  EXPECT_EQ(only.find("-[imports]->"), std::string::npos);
}

TEST_F(AuditTest, SearchAndSymbols) {
  auto search = cmd("search-chunks");
  search.query = "parse";
  EXPECT_NE(audit(store, search).find("[1-4] def parse(text):"), std::string::npos);

  auto syms = cmd("list-symbols");
  syms.file_id = file_id;
  auto out = audit(store, syms);
  EXPECT_NE(out.find("name=parse"), std::string::npos);
  EXPECT_NE(out.find("name=helper"), std::string::npos);
}

TEST_F(AuditTest, BadRequestsThrow) {
  EXPECT_THROW(audit(store, cmd("list-claims")), FormatError);
  EXPECT_THROW(audit(store, cmd("search-chunks")), FormatError);
  EXPECT_THROW(audit(store, cmd("frobnicate")), FormatError);
  auto bad = cmd("list-summaries");
  bad.level = "galaxy";
  EXPECT_THROW(audit(store, bad), FormatError);
  EXPECT_EQ(audit_commands().size(), 12u);
}
