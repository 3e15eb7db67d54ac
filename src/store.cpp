#include "store.hpp"
#include "errors.hpp"
#include "text_util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <unistd.h>
#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <set>

using json = nlohmann::json;
namespace fs = std::filesystem;

struct Store::Impl {
  sqlite3* db = nullptr;
  std::string path;
  bool persist = false;
  int savepoint_seq = 0;
};

namespace {

const char* SCHEMA_SQL = R"SQL(
CREATE TABLE IF NOT EXISTS files (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  path TEXT UNIQUE NOT NULL,
  hash TEXT NOT NULL,
  lang TEXT NOT NULL,
  size INTEGER NOT NULL,
  mtime TEXT NOT NULL,
  parsed INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS symbols (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
  name TEXT NOT NULL,
  kind TEXT NOT NULL,
  signature TEXT,
  start_line INTEGER NOT NULL,
  end_line INTEGER NOT NULL,
  doc TEXT,
  parent_symbol_id INTEGER REFERENCES symbols(id) ON DELETE CASCADE,
  CHECK (start_line >= 1 AND end_line >= start_line)
);

CREATE TABLE IF NOT EXISTS chunks (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
  start_line INTEGER NOT NULL,
  end_line INTEGER NOT NULL,
  kind TEXT NOT NULL,
  text TEXT NOT NULL,
  hash TEXT NOT NULL,
  symbol_id INTEGER REFERENCES symbols(id) ON DELETE SET NULL,
  CHECK (start_line >= 1 AND end_line >= start_line)
);
CREATE INDEX IF NOT EXISTS chunks_file_idx ON chunks(file_id, start_line);

CREATE TABLE IF NOT EXISTS edges (
  src_symbol_id INTEGER NOT NULL REFERENCES symbols(id) ON DELETE CASCADE,
  dst_symbol_id INTEGER NOT NULL REFERENCES symbols(id) ON DELETE CASCADE,
  edge_type TEXT NOT NULL CHECK (edge_type IN ('imports','imports-resolved','calls',
                                               'inherits','member-of','implements','exports')),
  UNIQUE (src_symbol_id, dst_symbol_id, edge_type)
);

CREATE TABLE IF NOT EXISTS pending_edges (
  src_symbol_id INTEGER NOT NULL REFERENCES symbols(id) ON DELETE CASCADE,
  file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
  dst_name TEXT NOT NULL,
  edge_type TEXT NOT NULL CHECK (edge_type IN ('imports','imports-resolved','calls',
                                               'inherits','member-of','implements','exports')),
  UNIQUE (src_symbol_id, dst_name, edge_type)
);

CREATE TABLE IF NOT EXISTS packages (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  path TEXT UNIQUE NOT NULL,
  name TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS modules (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  path TEXT UNIQUE NOT NULL,
  name TEXT NOT NULL,
  package_id INTEGER REFERENCES packages(id) ON DELETE SET NULL
);

CREATE TABLE IF NOT EXISTS module_files (
  module_id INTEGER NOT NULL REFERENCES modules(id) ON DELETE CASCADE,
  file_id INTEGER NOT NULL REFERENCES files(id) ON DELETE CASCADE,
  PRIMARY KEY (module_id, file_id)
);

CREATE TABLE IF NOT EXISTS summaries (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  level TEXT NOT NULL CHECK (level IN ('chunk','file','module','package')),
  target_id INTEGER NOT NULL,
  text TEXT NOT NULL,
  confidence REAL NOT NULL CHECK (confidence >= 0.0 AND confidence <= 1.0),
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS report_versions (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  content TEXT NOT NULL,
  created_at TEXT NOT NULL,
  coverage_score REAL NOT NULL,
  citation_score REAL NOT NULL,
  issues_high INTEGER NOT NULL,
  issues_med INTEGER NOT NULL,
  issues_low INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS claims (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  report_version INTEGER NOT NULL REFERENCES report_versions(id) ON DELETE CASCADE,
  text TEXT NOT NULL,
  citation_refs TEXT NOT NULL,
  status TEXT NOT NULL CHECK (status IN ('supported','contradicted','uncertain','missing')),
  severity TEXT NOT NULL CHECK (severity IN ('high','medium','low')),
  rationale TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS chunk_embeddings (
  chunk_id INTEGER PRIMARY KEY REFERENCES chunks(id) ON DELETE CASCADE,
  vector BLOB NOT NULL,
  dim INTEGER NOT NULL CHECK (dim > 0)
);

CREATE TABLE IF NOT EXISTS symbol_embeddings (
  symbol_id INTEGER PRIMARY KEY REFERENCES symbols(id) ON DELETE CASCADE,
  vector BLOB NOT NULL,
  dim INTEGER NOT NULL CHECK (dim > 0)
);

CREATE TABLE IF NOT EXISTS retrieval_events (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  report_version INTEGER NOT NULL REFERENCES report_versions(id) ON DELETE CASCADE,
  iteration INTEGER NOT NULL,
  prompt TEXT NOT NULL,
  chunks TEXT NOT NULL,
  summaries TEXT NOT NULL,
  symbols TEXT NOT NULL,
  edges TEXT NOT NULL,
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS iteration_status (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  report_version INTEGER NOT NULL REFERENCES report_versions(id) ON DELETE CASCADE,
  iteration INTEGER NOT NULL,
  coverage REAL NOT NULL,
  support_rate REAL NOT NULL,
  citation_rate REAL NOT NULL,
  issues_high INTEGER NOT NULL,
  issues_med INTEGER NOT NULL,
  issues_low INTEGER NOT NULL,
  missing_citations INTEGER NOT NULL,
  created_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS iteration_issues (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  report_version INTEGER NOT NULL REFERENCES report_versions(id) ON DELETE CASCADE,
  iteration INTEGER NOT NULL,
  severity TEXT NOT NULL,
  description TEXT NOT NULL,
  fix_hint TEXT,
  created_at TEXT NOT NULL
);

CREATE VIRTUAL TABLE IF NOT EXISTS chunks_fts USING fts5(
  text, content='chunks', content_rowid='id'
);
CREATE TRIGGER IF NOT EXISTS chunks_ai AFTER INSERT ON chunks BEGIN
  INSERT INTO chunks_fts(rowid, text) VALUES (new.id, new.text);
END;
CREATE TRIGGER IF NOT EXISTS chunks_ad AFTER DELETE ON chunks BEGIN
  INSERT INTO chunks_fts(chunks_fts, rowid, text) VALUES ('delete', old.id, old.text);
  DELETE FROM summaries WHERE level = 'chunk' AND target_id = old.id;
END;
CREATE TRIGGER IF NOT EXISTS chunks_au AFTER UPDATE OF text ON chunks BEGIN
  INSERT INTO chunks_fts(chunks_fts, rowid, text) VALUES ('delete', old.id, old.text);
  INSERT INTO chunks_fts(rowid, text) VALUES (new.id, new.text);
END;

CREATE VIRTUAL TABLE IF NOT EXISTS summaries_fts USING fts5(
  text, content='summaries', content_rowid='id'
);
CREATE TRIGGER IF NOT EXISTS summaries_ai AFTER INSERT ON summaries BEGIN
  INSERT INTO summaries_fts(rowid, text) VALUES (new.id, new.text);
END;
CREATE TRIGGER IF NOT EXISTS summaries_ad AFTER DELETE ON summaries BEGIN
  INSERT INTO summaries_fts(summaries_fts, rowid, text) VALUES ('delete', old.id, old.text);
END;
CREATE TRIGGER IF NOT EXISTS summaries_au AFTER UPDATE OF text ON summaries BEGIN
  INSERT INTO summaries_fts(summaries_fts, rowid, text) VALUES ('delete', old.id, old.text);
  INSERT INTO summaries_fts(rowid, text) VALUES (new.id, new.text);
END;

CREATE TRIGGER IF NOT EXISTS summaries_target_bi BEFORE INSERT ON summaries
WHEN (new.level = 'chunk' AND NOT EXISTS (SELECT 1 FROM chunks WHERE id = new.target_id))
  OR (new.level = 'file' AND NOT EXISTS (SELECT 1 FROM files WHERE id = new.target_id))
  OR (new.level = 'module' AND NOT EXISTS (SELECT 1 FROM modules WHERE id = new.target_id))
  OR (new.level = 'package' AND NOT EXISTS (SELECT 1 FROM packages WHERE id = new.target_id))
BEGIN
  SELECT RAISE(ABORT, 'summary target does not exist');
END;
CREATE TRIGGER IF NOT EXISTS summaries_target_bu BEFORE UPDATE OF level, target_id ON summaries
WHEN (new.level = 'chunk' AND NOT EXISTS (SELECT 1 FROM chunks WHERE id = new.target_id))
  OR (new.level = 'file' AND NOT EXISTS (SELECT 1 FROM files WHERE id = new.target_id))
  OR (new.level = 'module' AND NOT EXISTS (SELECT 1 FROM modules WHERE id = new.target_id))
  OR (new.level = 'package' AND NOT EXISTS (SELECT 1 FROM packages WHERE id = new.target_id))
BEGIN
  SELECT RAISE(ABORT, 'summary target does not exist');
END;
CREATE TRIGGER IF NOT EXISTS files_ad_summaries AFTER DELETE ON files BEGIN
  DELETE FROM summaries WHERE level = 'file' AND target_id = old.id;
END;
CREATE TRIGGER IF NOT EXISTS modules_ad_summaries AFTER DELETE ON modules BEGIN
  DELETE FROM summaries WHERE level = 'module' AND target_id = old.id;
END;
CREATE TRIGGER IF NOT EXISTS packages_ad_summaries AFTER DELETE ON packages BEGIN
  DELETE FROM summaries WHERE level = 'package' AND target_id = old.id;
END;
)SQL";

[[noreturn]] void throw_sqlite(sqlite3* db, int rc, const std::string& what) {
  std::string msg = what + ": " + sqlite3_errmsg(db);
  if ((rc & 0xff) == SQLITE_CONSTRAINT) throw IntegrityError(msg);
  throw StoreError(msg);
}

void exec_sql(sqlite3* db, const std::string& sql) {
  char* err = nullptr;
  int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string e = err ? err : "unknown";
    sqlite3_free(err);
    if ((rc & 0xff) == SQLITE_CONSTRAINT) throw IntegrityError("sqlite: " + e);
    throw StoreError("sqlite: " + e);
  }
}

// Prepared statement owned for one scope.
class Stmt {
public:
  Stmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db, sql, -1, &st_, nullptr) != SQLITE_OK)
      throw StoreError(std::string("sqlite prepare failed: ") + sqlite3_errmsg(db));
  }
  ~Stmt() { if (st_) sqlite3_finalize(st_); }
  Stmt(const Stmt&) = delete;
  Stmt& operator=(const Stmt&) = delete;

  Stmt& bind_int(int i, int64_t v) { sqlite3_bind_int64(st_, i, (sqlite3_int64)v); return *this; }
  Stmt& bind_double(int i, double v) { sqlite3_bind_double(st_, i, v); return *this; }
  Stmt& bind_text(int i, const std::string& v) {
    sqlite3_bind_text(st_, i, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    return *this;
  }
  Stmt& bind_opt(int i, const std::optional<int64_t>& v) {
    if (v) sqlite3_bind_int64(st_, i, (sqlite3_int64)*v);
    else sqlite3_bind_null(st_, i);
    return *this;
  }
  Stmt& bind_opt_text(int i, const std::string& v) {
    if (v.empty()) sqlite3_bind_null(st_, i);
    else bind_text(i, v);
    return *this;
  }
  Stmt& bind_floats(int i, const std::vector<float>& v) {
    sqlite3_bind_blob(st_, i, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
    return *this;
  }

  // true while rows are available
  bool step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw_sqlite(db_, rc, "sqlite step failed");
  }
  void run() { while (step()) {} }
  void reset() { sqlite3_reset(st_); sqlite3_clear_bindings(st_); }

  int64_t col_int(int i) const { return (int64_t)sqlite3_column_int64(st_, i); }
  double col_double(int i) const { return sqlite3_column_double(st_, i); }
  bool col_null(int i) const { return sqlite3_column_type(st_, i) == SQLITE_NULL; }
  std::string col_text(int i) const {
    auto p = reinterpret_cast<const char*>(sqlite3_column_text(st_, i));
    return p ? std::string(p, (size_t)sqlite3_column_bytes(st_, i)) : std::string();
  }
  std::optional<int64_t> col_opt(int i) const {
    if (col_null(i)) return std::nullopt;
    return col_int(i);
  }
  std::vector<float> col_floats(int i) const {
    const void* p = sqlite3_column_blob(st_, i);
    int n = sqlite3_column_bytes(st_, i);
    std::vector<float> v((size_t)n / sizeof(float));
    if (p && !v.empty()) std::memcpy(v.data(), p, v.size() * sizeof(float));
    return v;
  }

private:
  sqlite3* db_;
  sqlite3_stmt* st_ = nullptr;
};

const char* CHUNK_COLS = "id, file_id, start_line, end_line, kind, text, hash, symbol_id";
const char* SYMBOL_COLS =
  "id, file_id, name, kind, signature, start_line, end_line, doc, parent_symbol_id";
const char* FILE_COLS = "id, path, hash, lang, size, mtime, parsed";
const char* SUMMARY_COLS = "id, level, target_id, text, confidence, created_at";
const char* REPORT_COLS =
  "id, content, created_at, coverage_score, citation_score, issues_high, issues_med, issues_low";

std::string sql(const std::string& head, const char* cols, const std::string& tail) {
  return head + cols + tail;
}

FileRecord read_file(const Stmt& st) {
  FileRecord f;
  f.id = st.col_int(0);
  f.path = st.col_text(1);
  f.hash = st.col_text(2);
  f.lang = st.col_text(3);
  f.size = st.col_int(4);
  f.mtime = st.col_text(5);
  f.parsed = st.col_int(6) != 0;
  return f;
}

Chunk read_chunk(const Stmt& st, int off = 0) {
  Chunk c;
  c.id = st.col_int(off + 0);
  c.file_id = st.col_int(off + 1);
  c.start_line = (int)st.col_int(off + 2);
  c.end_line = (int)st.col_int(off + 3);
  c.kind = st.col_text(off + 4);
  c.text = st.col_text(off + 5);
  c.hash = st.col_text(off + 6);
  c.symbol_id = st.col_opt(off + 7);
  return c;
}

Symbol read_symbol(const Stmt& st) {
  Symbol s;
  s.id = st.col_int(0);
  s.file_id = st.col_int(1);
  s.name = st.col_text(2);
  s.kind = st.col_text(3);
  s.signature = st.col_text(4);
  s.start_line = (int)st.col_int(5);
  s.end_line = (int)st.col_int(6);
  s.doc = st.col_text(7);
  s.parent_symbol_id = st.col_opt(8);
  return s;
}

Summary read_summary(const Stmt& st) {
  Summary s;
  s.id = st.col_int(0);
  s.level = summary_level_from_string(st.col_text(1));
  s.target_id = st.col_int(2);
  s.text = st.col_text(3);
  s.confidence = st.col_double(4);
  s.created_at = st.col_text(5);
  return s;
}

ReportVersion read_report(const Stmt& st) {
  ReportVersion r;
  r.id = st.col_int(0);
  r.content = st.col_text(1);
  r.created_at = st.col_text(2);
  r.coverage_score = st.col_double(3);
  r.citation_score = st.col_double(4);
  r.issues_high = (int)st.col_int(5);
  r.issues_med = (int)st.col_int(6);
  r.issues_low = (int)st.col_int(7);
  return r;
}

// OR of quoted tokens; empty when the query has no usable words.
std::string fts_query(const std::string& q) {
  std::set<std::string> seen;
  std::string out;
  for (auto& tok : word_tokens(q, 2)) {
    if (!seen.insert(tok).second) continue;
    if (!out.empty()) out += " OR ";
    out += "\"" + tok + "\"";
  }
  return out;
}

std::string like_escape(const std::string& s) {
  std::string out;
  for (char c : s) {
    if (c == '%' || c == '_' || c == '\\') out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

std::string make_temp_path() {
  std::string tmpl = (fs::temp_directory_path() / "docgate-XXXXXX.db").string();
  std::vector<char> buf(tmpl.begin(), tmpl.end());
  buf.push_back('\0');
  int fd = mkstemps(buf.data(), 3);
  if (fd < 0) throw StoreError("cannot create temporary store file in " + tmpl);
  ::close(fd);
  std::string p(buf.data());
  std::error_code ec;
  fs::remove(p, ec);  // sqlite recreates it
  return p;
}

} // namespace

Store::Store() : Store(Options{}) {}

Store::Store(const Options& o) : impl_(nullptr) {
  std::string path = o.path;
  bool persist = o.persist || o.read_only;
  if (path.empty()) {
    path = make_temp_path();
  } else if (fs::exists(path)) {
    if (!o.allow_existing && !o.read_only)
      throw StoreError("refusing to reuse existing store at " + path +
                       " (pass allow_existing to override)");
  } else if (o.read_only) {
    throw StoreError("store not found: " + path);
  }

  sqlite3* db = nullptr;
  int flags = o.read_only ? SQLITE_OPEN_READONLY : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
  if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
    std::string e = db ? sqlite3_errmsg(db) : "out of memory";
    sqlite3_close(db);
    throw StoreError("sqlite open failed: " + e);
  }
  try {
    exec_sql(db, "PRAGMA foreign_keys=ON;");
    if (!o.read_only) {
      exec_sql(db, "PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL; PRAGMA temp_store=MEMORY;");
      exec_sql(db, SCHEMA_SQL);
    }
  } catch (const std::exception&) {
    sqlite3_close(db);
    if (!persist) {
      std::error_code ec;
      fs::remove(path, ec);
    }
    throw;
  }
  impl_ = new Impl;
  impl_->db = db;
  impl_->path = path;
  impl_->persist = persist;
}

Store::~Store() {
  close();
  delete impl_;
}

void Store::close() {
  if (!impl_ || !impl_->db) return;
  if (sqlite3_close(impl_->db) != SQLITE_OK)
    std::cerr << "warning: sqlite close: " << sqlite3_errmsg(impl_->db) << "\n";
  impl_->db = nullptr;
  if (!impl_->persist) {
    std::error_code ec;
    fs::remove(impl_->path, ec);
    fs::remove(impl_->path + "-wal", ec);
    fs::remove(impl_->path + "-shm", ec);
  }
}

const std::string& Store::path() const { return impl_->path; }

Store::Transaction::Transaction(Store& store) : store_(store), done_(false) {
  if (!store.impl_->db) throw StoreError("store is closed");
  name_ = "sp" + std::to_string(++store.impl_->savepoint_seq);
  exec_sql(store.impl_->db, "SAVEPOINT " + name_ + ";");
}

Store::Transaction::~Transaction() {
  if (done_ || !store_.impl_->db) return;
  std::string s = "ROLLBACK TO " + name_ + "; RELEASE " + name_ + ";";
  char* err = nullptr;
  if (sqlite3_exec(store_.impl_->db, s.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::cerr << "warning: rollback of " << name_ << " failed: " << (err ? err : "unknown") << "\n";
  }
  sqlite3_free(err);
}

void Store::Transaction::commit() {
  exec_sql(store_.impl_->db, "RELEASE " + name_ + ";");
  done_ = true;
}

// --- files ---

int64_t Store::add_file(const FileRecord& f) {
  Stmt st(impl_->db,
    "INSERT INTO files(path, hash, lang, size, mtime, parsed) VALUES (?, ?, ?, ?, ?, ?)");
  st.bind_text(1, f.path).bind_text(2, f.hash).bind_text(3, f.lang)
    .bind_int(4, f.size).bind_text(5, f.mtime).bind_int(6, f.parsed ? 1 : 0);
  st.run();
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

void Store::update_file(const FileRecord& f) {
  Stmt st(impl_->db,
    "UPDATE files SET hash=?, lang=?, size=?, mtime=?, parsed=? WHERE id=?");
  st.bind_text(1, f.hash).bind_text(2, f.lang).bind_int(3, f.size)
    .bind_text(4, f.mtime).bind_int(5, f.parsed ? 1 : 0).bind_int(6, f.id);
  st.run();
}

void Store::clear_file_contents(int64_t file_id) {
  Transaction tx(*this);
  {
    Stmt st(impl_->db, "DELETE FROM chunks WHERE file_id=?");
    st.bind_int(1, file_id).run();
  }
  {
    Stmt st(impl_->db, "DELETE FROM symbols WHERE file_id=?");
    st.bind_int(1, file_id).run();
  }
  tx.commit();
}

std::optional<FileRecord> Store::file_by_path(const std::string& path) const {
  Stmt st(impl_->db, sql("SELECT ", FILE_COLS, " FROM files WHERE path=?").c_str());
  st.bind_text(1, path);
  if (!st.step()) return std::nullopt;
  return read_file(st);
}

std::optional<FileRecord> Store::file_by_id(int64_t id) const {
  Stmt st(impl_->db, sql("SELECT ", FILE_COLS, " FROM files WHERE id=?").c_str());
  st.bind_int(1, id);
  if (!st.step()) return std::nullopt;
  return read_file(st);
}

std::vector<FileRecord> Store::files() const {
  Stmt st(impl_->db, sql("SELECT ", FILE_COLS, " FROM files ORDER BY path").c_str());
  std::vector<FileRecord> out;
  while (st.step()) out.push_back(read_file(st));
  return out;
}

// --- chunks ---

std::vector<int64_t> Store::add_chunks(const std::vector<Chunk>& chunks) {
  Transaction tx(*this);
  Stmt st(impl_->db,
    "INSERT INTO chunks(file_id, start_line, end_line, kind, text, hash, symbol_id) "
    "VALUES (?, ?, ?, ?, ?, ?, ?)");
  std::vector<int64_t> ids;
  ids.reserve(chunks.size());
  for (auto& c : chunks) {
    st.bind_int(1, c.file_id).bind_int(2, c.start_line).bind_int(3, c.end_line)
      .bind_text(4, c.kind).bind_text(5, c.text).bind_text(6, c.hash).bind_opt(7, c.symbol_id);
    st.run();
    st.reset();
    ids.push_back((int64_t)sqlite3_last_insert_rowid(impl_->db));
  }
  tx.commit();
  return ids;
}

std::optional<Chunk> Store::chunk_by_id(int64_t id) const {
  Stmt st(impl_->db, sql("SELECT ", CHUNK_COLS, " FROM chunks WHERE id=?").c_str());
  st.bind_int(1, id);
  if (!st.step()) return std::nullopt;
  return read_chunk(st);
}

std::vector<Chunk> Store::chunks_for_file(int64_t file_id) const {
  Stmt st(impl_->db,
    sql("SELECT ", CHUNK_COLS, " FROM chunks WHERE file_id=? ORDER BY start_line, id").c_str());
  st.bind_int(1, file_id);
  std::vector<Chunk> out;
  while (st.step()) out.push_back(read_chunk(st));
  return out;
}

std::vector<Chunk> Store::chunks_for_symbol(int64_t symbol_id) const {
  Stmt st(impl_->db,
    sql("SELECT ", CHUNK_COLS, " FROM chunks WHERE symbol_id=? ORDER BY start_line, id").c_str());
  st.bind_int(1, symbol_id);
  std::vector<Chunk> out;
  while (st.step()) out.push_back(read_chunk(st));
  return out;
}

std::vector<Chunk> Store::chunks_of_kind(const std::string& kind, int limit) const {
  Stmt st(impl_->db,
    sql("SELECT ", CHUNK_COLS, " FROM chunks WHERE kind=? ORDER BY id LIMIT ?").c_str());
  st.bind_text(1, kind).bind_int(2, limit);
  std::vector<Chunk> out;
  while (st.step()) out.push_back(read_chunk(st));
  return out;
}

std::optional<Chunk> Store::first_chunk() const {
  Stmt st(impl_->db, sql("SELECT ", CHUNK_COLS, " FROM chunks ORDER BY id LIMIT 1").c_str());
  if (!st.step()) return std::nullopt;
  return read_chunk(st);
}

std::optional<Chunk> Store::find_chunk_covering(int64_t file_id, int start, int end) const {
  Stmt st(impl_->db,
    sql("SELECT ", CHUNK_COLS,
        " FROM chunks WHERE file_id=? AND start_line<=? AND end_line>=? ORDER BY id LIMIT 1").c_str());
  st.bind_int(1, file_id).bind_int(2, start).bind_int(3, end);
  if (!st.step()) return std::nullopt;
  return read_chunk(st);
}

std::vector<Chunk> Store::search_chunks(const std::string& query, int limit) const {
  std::vector<Chunk> out;
  std::string match = fts_query(query);
  if (match.empty() || limit <= 0) return out;
  try {
    Stmt st(impl_->db,
      "SELECT c.id, c.file_id, c.start_line, c.end_line, c.kind, c.text, c.hash, c.symbol_id "
      "FROM chunks_fts JOIN chunks c ON c.id = chunks_fts.rowid "
      "WHERE chunks_fts MATCH ? ORDER BY bm25(chunks_fts), c.id LIMIT ?");
    st.bind_text(1, match).bind_int(2, limit);
    while (st.step()) out.push_back(read_chunk(st));
    return out;
  } catch (const StoreError& e) {
    std::cerr << "warning: full-text search failed (" << e.what() << "), using LIKE\n";
  }
  out.clear();
  Stmt st(impl_->db,
    sql("SELECT ", CHUNK_COLS, " FROM chunks WHERE text LIKE ? ESCAPE '\\' ORDER BY id LIMIT ?").c_str());
  st.bind_text(1, "%" + like_escape(query) + "%").bind_int(2, limit);
  while (st.step()) out.push_back(read_chunk(st));
  return out;
}

int64_t Store::chunk_count() const {
  Stmt st(impl_->db, "SELECT COUNT(*) FROM chunks");
  st.step();
  return st.col_int(0);
}

// --- symbols & edges ---

std::vector<int64_t> Store::add_symbols(const std::vector<Symbol>& symbols) {
  Transaction tx(*this);
  Stmt st(impl_->db,
    "INSERT INTO symbols(file_id, name, kind, signature, start_line, end_line, doc, parent_symbol_id) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
  std::vector<int64_t> ids;
  ids.reserve(symbols.size());
  for (auto& s : symbols) {
    st.bind_int(1, s.file_id).bind_text(2, s.name).bind_text(3, s.kind)
      .bind_opt_text(4, s.signature).bind_int(5, s.start_line).bind_int(6, s.end_line)
      .bind_opt_text(7, s.doc).bind_opt(8, s.parent_symbol_id);
    st.run();
    st.reset();
    ids.push_back((int64_t)sqlite3_last_insert_rowid(impl_->db));
  }
  tx.commit();
  return ids;
}

void Store::set_symbol_parent(int64_t symbol_id, std::optional<int64_t> parent_id) {
  Stmt st(impl_->db, "UPDATE symbols SET parent_symbol_id=? WHERE id=?");
  st.bind_opt(1, parent_id).bind_int(2, symbol_id).run();
}

std::optional<Symbol> Store::symbol_by_id(int64_t id) const {
  Stmt st(impl_->db, sql("SELECT ", SYMBOL_COLS, " FROM symbols WHERE id=?").c_str());
  st.bind_int(1, id);
  if (!st.step()) return std::nullopt;
  return read_symbol(st);
}

std::vector<Symbol> Store::symbols_for_file(int64_t file_id) const {
  Stmt st(impl_->db,
    sql("SELECT ", SYMBOL_COLS, " FROM symbols WHERE file_id=? ORDER BY start_line, id").c_str());
  st.bind_int(1, file_id);
  std::vector<Symbol> out;
  while (st.step()) out.push_back(read_symbol(st));
  return out;
}

std::vector<Symbol> Store::symbols() const {
  Stmt st(impl_->db, sql("SELECT ", SYMBOL_COLS, " FROM symbols ORDER BY id").c_str());
  std::vector<Symbol> out;
  while (st.step()) out.push_back(read_symbol(st));
  return out;
}

std::vector<Symbol> Store::search_symbols(const std::string& fragment, int limit,
                                          bool include_imports) const {
  std::string q = sql("SELECT ", SYMBOL_COLS,
                      " FROM symbols WHERE lower(name) LIKE ? ESCAPE '\\'");
  if (!include_imports) q += " AND kind != 'import'";
  q += " ORDER BY length(name), id LIMIT ?";
  Stmt st(impl_->db, q.c_str());
  st.bind_text(1, "%" + like_escape(to_lower(fragment)) + "%").bind_int(2, limit);
  std::vector<Symbol> out;
  while (st.step()) out.push_back(read_symbol(st));
  return out;
}

void Store::add_edges(const std::vector<Edge>& edges) {
  Transaction tx(*this);
  Stmt st(impl_->db,
    "INSERT INTO edges(src_symbol_id, dst_symbol_id, edge_type) VALUES (?, ?, ?) "
    "ON CONFLICT(src_symbol_id, dst_symbol_id, edge_type) DO NOTHING");
  for (auto& e : edges) {
    st.bind_int(1, e.src_symbol_id).bind_int(2, e.dst_symbol_id).bind_text(3, to_string(e.type));
    st.run();
    st.reset();
  }
  tx.commit();
}

void Store::add_pending_edges(const std::vector<PendingEdge>& edges) {
  Transaction tx(*this);
  Stmt st(impl_->db,
    "INSERT INTO pending_edges(src_symbol_id, file_id, dst_name, edge_type) VALUES (?, ?, ?, ?) "
    "ON CONFLICT(src_symbol_id, dst_name, edge_type) DO NOTHING");
  for (auto& e : edges) {
    st.bind_int(1, e.src_symbol_id).bind_int(2, e.file_id).bind_text(3, e.dst_name)
      .bind_text(4, to_string(e.type));
    st.run();
    st.reset();
  }
  tx.commit();
}

std::vector<PendingEdge> Store::pending_edges() const {
  Stmt st(impl_->db,
    "SELECT src_symbol_id, file_id, dst_name, edge_type FROM pending_edges ORDER BY rowid");
  std::vector<PendingEdge> out;
  while (st.step()) {
    PendingEdge e;
    e.src_symbol_id = st.col_int(0);
    e.file_id = st.col_int(1);
    e.dst_name = st.col_text(2);
    e.type = edge_type_from_string(st.col_text(3));
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<Edge> Store::edges_for_symbol(int64_t symbol_id) const {
  Stmt st(impl_->db,
    "SELECT src_symbol_id, dst_symbol_id, edge_type FROM edges "
    "WHERE src_symbol_id=? OR dst_symbol_id=? ORDER BY rowid");
  st.bind_int(1, symbol_id).bind_int(2, symbol_id);
  std::vector<Edge> out;
  while (st.step()) {
    Edge e;
    e.src_symbol_id = st.col_int(0);
    e.dst_symbol_id = st.col_int(1);
    e.type = edge_type_from_string(st.col_text(2));
    out.push_back(e);
  }
  return out;
}

int64_t Store::edge_count() const {
  Stmt st(impl_->db, "SELECT COUNT(*) FROM edges");
  st.step();
  return st.col_int(0);
}

// --- modules, packages, summaries ---

int64_t Store::add_package(const std::string& path, const std::string& name) {
  {
    Stmt st(impl_->db, "INSERT INTO packages(path, name) VALUES (?, ?) ON CONFLICT(path) DO NOTHING");
    st.bind_text(1, path).bind_text(2, name).run();
  }
  Stmt st(impl_->db, "SELECT id FROM packages WHERE path=?");
  st.bind_text(1, path);
  if (!st.step()) throw StoreError("package row vanished: " + path);
  return st.col_int(0);
}

int64_t Store::add_module(const std::string& path, const std::string& name,
                          std::optional<int64_t> package_id) {
  {
    Stmt st(impl_->db,
      "INSERT INTO modules(path, name, package_id) VALUES (?, ?, ?) ON CONFLICT(path) DO NOTHING");
    st.bind_text(1, path).bind_text(2, name).bind_opt(3, package_id).run();
  }
  Stmt st(impl_->db, "SELECT id FROM modules WHERE path=?");
  st.bind_text(1, path);
  if (!st.step()) throw StoreError("module row vanished: " + path);
  return st.col_int(0);
}

void Store::link_module_file(int64_t module_id, int64_t file_id) {
  Stmt st(impl_->db,
    "INSERT INTO module_files(module_id, file_id) VALUES (?, ?) "
    "ON CONFLICT(module_id, file_id) DO NOTHING");
  st.bind_int(1, module_id).bind_int(2, file_id).run();
}

std::vector<int64_t> Store::files_for_module(int64_t module_id) const {
  Stmt st(impl_->db, "SELECT file_id FROM module_files WHERE module_id=? ORDER BY file_id");
  st.bind_int(1, module_id);
  std::vector<int64_t> out;
  while (st.step()) out.push_back(st.col_int(0));
  return out;
}

std::vector<int64_t> Store::modules_for_package(int64_t package_id) const {
  Stmt st(impl_->db, "SELECT id FROM modules WHERE package_id=? ORDER BY id");
  st.bind_int(1, package_id);
  std::vector<int64_t> out;
  while (st.step()) out.push_back(st.col_int(0));
  return out;
}

int64_t Store::add_summary(const Summary& s) {
  Stmt st(impl_->db,
    "INSERT INTO summaries(level, target_id, text, confidence, created_at) VALUES (?, ?, ?, ?, ?)");
  st.bind_text(1, to_string(s.level)).bind_int(2, s.target_id).bind_text(3, s.text)
    .bind_double(4, s.confidence)
    .bind_text(5, s.created_at.empty() ? utc_timestamp() : s.created_at);
  st.run();
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

int64_t Store::replace_summary(const Summary& s) {
  Transaction tx(*this);
  {
    Stmt st(impl_->db, "DELETE FROM summaries WHERE level=? AND target_id=?");
    st.bind_text(1, to_string(s.level)).bind_int(2, s.target_id).run();
  }
  int64_t id = add_summary(s);
  tx.commit();
  return id;
}

std::vector<Summary> Store::summaries(std::optional<SummaryLevel> level) const {
  std::string q = sql("SELECT ", SUMMARY_COLS, " FROM summaries");
  if (level) q += " WHERE level=?";
  q += " ORDER BY id";
  Stmt st(impl_->db, q.c_str());
  if (level) st.bind_text(1, to_string(*level));
  std::vector<Summary> out;
  while (st.step()) out.push_back(read_summary(st));
  return out;
}

std::vector<Summary> Store::search_summaries(const std::string& query, int limit) const {
  std::vector<Summary> out;
  std::string match = fts_query(query);
  if (match.empty() || limit <= 0) return out;
  try {
    Stmt st(impl_->db,
      "SELECT s.id, s.level, s.target_id, s.text, s.confidence, s.created_at "
      "FROM summaries_fts JOIN summaries s ON s.id = summaries_fts.rowid "
      "WHERE summaries_fts MATCH ? ORDER BY bm25(summaries_fts), s.id LIMIT ?");
    st.bind_text(1, match).bind_int(2, limit);
    while (st.step()) out.push_back(read_summary(st));
    return out;
  } catch (const StoreError& e) {
    std::cerr << "warning: summary search failed (" << e.what() << "), using LIKE\n";
  }
  out.clear();
  Stmt st(impl_->db,
    sql("SELECT ", SUMMARY_COLS,
        " FROM summaries WHERE text LIKE ? ESCAPE '\\' ORDER BY confidence DESC LIMIT ?").c_str());
  st.bind_text(1, "%" + like_escape(query) + "%").bind_int(2, limit);
  while (st.step()) out.push_back(read_summary(st));
  return out;
}

// --- reports & claims ---

int64_t Store::add_report_version(const ReportVersion& rv) {
  Stmt st(impl_->db,
    "INSERT INTO report_versions(content, created_at, coverage_score, citation_score, "
    "issues_high, issues_med, issues_low) VALUES (?, ?, ?, ?, ?, ?, ?)");
  st.bind_text(1, rv.content)
    .bind_text(2, rv.created_at.empty() ? utc_timestamp() : rv.created_at)
    .bind_double(3, rv.coverage_score).bind_double(4, rv.citation_score)
    .bind_int(5, rv.issues_high).bind_int(6, rv.issues_med).bind_int(7, rv.issues_low);
  st.run();
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

void Store::update_report_version(const ReportVersion& rv) {
  Stmt st(impl_->db,
    "UPDATE report_versions SET content=?, coverage_score=?, citation_score=?, "
    "issues_high=?, issues_med=?, issues_low=? WHERE id=?");
  st.bind_text(1, rv.content).bind_double(2, rv.coverage_score).bind_double(3, rv.citation_score)
    .bind_int(4, rv.issues_high).bind_int(5, rv.issues_med).bind_int(6, rv.issues_low)
    .bind_int(7, rv.id);
  st.run();
  if (sqlite3_changes(impl_->db) == 0)
    throw IntegrityError("report version " + std::to_string(rv.id) + " does not exist");
}

std::optional<ReportVersion> Store::report_version(int64_t id) const {
  Stmt st(impl_->db, sql("SELECT ", REPORT_COLS, " FROM report_versions WHERE id=?").c_str());
  st.bind_int(1, id);
  if (!st.step()) return std::nullopt;
  return read_report(st);
}

std::vector<ReportVersion> Store::report_versions() const {
  Stmt st(impl_->db, sql("SELECT ", REPORT_COLS, " FROM report_versions ORDER BY id").c_str());
  std::vector<ReportVersion> out;
  while (st.step()) out.push_back(read_report(st));
  return out;
}

std::vector<int64_t> Store::replace_claims(int64_t report_version, const std::vector<Claim>& claims) {
  Transaction tx(*this);
  {
    Stmt del(impl_->db, "DELETE FROM claims WHERE report_version=?");
    del.bind_int(1, report_version).run();
  }
  Stmt st(impl_->db,
    "INSERT INTO claims(report_version, text, citation_refs, status, severity, rationale) "
    "VALUES (?, ?, ?, ?, ?, ?)");
  std::vector<int64_t> ids;
  for (auto& c : claims) {
    json refs = c.citation_refs;
    st.bind_int(1, report_version).bind_text(2, c.text).bind_text(3, refs.dump())
      .bind_text(4, to_string(c.status)).bind_text(5, to_string(c.severity))
      .bind_text(6, c.rationale);
    st.run();
    st.reset();
    ids.push_back((int64_t)sqlite3_last_insert_rowid(impl_->db));
  }
  tx.commit();
  return ids;
}

std::vector<Claim> Store::claims_for_report(int64_t report_version) const {
  Stmt st(impl_->db,
    "SELECT id, report_version, text, citation_refs, status, severity, rationale "
    "FROM claims WHERE report_version=? ORDER BY id");
  st.bind_int(1, report_version);
  std::vector<Claim> out;
  while (st.step()) {
    Claim c;
    c.id = st.col_int(0);
    c.report_version = st.col_int(1);
    c.text = st.col_text(2);
    auto refs = json::parse(st.col_text(3), nullptr, false);
    if (refs.is_array())
      for (auto& r : refs) if (r.is_string()) c.citation_refs.push_back(r.get<std::string>());
    c.status = claim_status_from_string(st.col_text(4));
    c.severity = severity_from_string(st.col_text(5));
    c.rationale = st.col_text(6);
    out.push_back(std::move(c));
  }
  return out;
}

// --- embeddings ---

static void insert_embeddings(Store& store, sqlite3* db, const char* q,
                              const std::vector<Embedding>& items) {
  Store::Transaction tx(store);
  Stmt st(db, q);
  for (auto& e : items) {
    if (e.vector.empty()) throw FormatError("empty embedding for owner " + std::to_string(e.owner_id));
    st.bind_int(1, e.owner_id).bind_floats(2, e.vector).bind_int(3, (int64_t)e.vector.size());
    st.run();
    st.reset();
  }
  tx.commit();
}

void Store::add_chunk_embeddings(const std::vector<Embedding>& e) {
  insert_embeddings(*this, impl_->db,
    "INSERT OR REPLACE INTO chunk_embeddings(chunk_id, vector, dim) VALUES (?, ?, ?)", e);
}

void Store::add_symbol_embeddings(const std::vector<Embedding>& e) {
  insert_embeddings(*this, impl_->db,
    "INSERT OR REPLACE INTO symbol_embeddings(symbol_id, vector, dim) VALUES (?, ?, ?)", e);
}

std::vector<Embedding> Store::chunk_embeddings() const {
  Stmt st(impl_->db, "SELECT chunk_id, vector, dim FROM chunk_embeddings ORDER BY chunk_id");
  std::vector<Embedding> out;
  while (st.step()) {
    Embedding e;
    e.owner_id = st.col_int(0);
    e.vector = st.col_floats(1);
    if ((int64_t)e.vector.size() != st.col_int(2)) continue;  // corrupt row
    out.push_back(std::move(e));
  }
  return out;
}

bool Store::has_chunk_embeddings() const {
  Stmt st(impl_->db, "SELECT EXISTS(SELECT 1 FROM chunk_embeddings)");
  st.step();
  return st.col_int(0) != 0;
}

// --- audit log ---

int64_t Store::log_retrieval_event(int64_t report_version, int iteration, const std::string& prompt,
                                   const std::vector<Chunk>& chunks,
                                   const std::vector<Summary>& summaries,
                                   const std::vector<Symbol>& symbols,
                                   const std::vector<Edge>& edges) {
  json jc = json::array(), js = json::array(), jy = json::array(), je = json::array();
  for (auto& c : chunks)
    jc.push_back({{"id", c.id}, {"file_id", c.file_id}, {"start", c.start_line},
                  {"end", c.end_line}, {"kind", c.kind}});
  for (auto& s : summaries)
    js.push_back({{"id", s.id}, {"level", to_string(s.level)}, {"target_id", s.target_id}});
  for (auto& s : symbols)
    jy.push_back({{"id", s.id}, {"file_id", s.file_id}, {"name", s.name}, {"kind", s.kind}});
  for (auto& e : edges)
    je.push_back({{"src", e.src_symbol_id}, {"dst", e.dst_symbol_id}, {"type", to_string(e.type)}});

  Stmt st(impl_->db,
    "INSERT INTO retrieval_events(report_version, iteration, prompt, chunks, summaries, symbols, "
    "edges, created_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)");
  st.bind_int(1, report_version).bind_int(2, iteration).bind_text(3, prompt)
    .bind_text(4, jc.dump()).bind_text(5, js.dump()).bind_text(6, jy.dump())
    .bind_text(7, je.dump()).bind_text(8, utc_timestamp());
  st.run();
  return (int64_t)sqlite3_last_insert_rowid(impl_->db);
}

std::vector<RetrievalEventRow> Store::retrieval_events(std::optional<int64_t> report_version) const {
  std::string q = "SELECT id, report_version, iteration, prompt, chunks, created_at FROM retrieval_events";
  if (report_version) q += " WHERE report_version=?";
  q += " ORDER BY id";
  Stmt st(impl_->db, q.c_str());
  if (report_version) st.bind_int(1, *report_version);
  std::vector<RetrievalEventRow> out;
  while (st.step()) {
    RetrievalEventRow r;
    r.id = st.col_int(0);
    r.report_version = st.col_int(1);
    r.iteration = (int)st.col_int(2);
    r.prompt = st.col_text(3);
    r.chunks_json = st.col_text(4);
    r.created_at = st.col_text(5);
    out.push_back(std::move(r));
  }
  return out;
}

void Store::log_iteration_status(int64_t report_version, const IterationMetrics& m) {
  Stmt st(impl_->db,
    "INSERT INTO iteration_status(report_version, iteration, coverage, support_rate, citation_rate, "
    "issues_high, issues_med, issues_low, missing_citations, created_at) "
    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)");
  st.bind_int(1, report_version).bind_int(2, m.iteration).bind_double(3, m.coverage)
    .bind_double(4, m.support_rate).bind_double(5, m.citation_rate)
    .bind_int(6, m.issues_high).bind_int(7, m.issues_med).bind_int(8, m.issues_low)
    .bind_int(9, m.missing_citations).bind_text(10, utc_timestamp());
  st.run();
}

void Store::log_iteration_issues(int64_t report_version, int iteration,
                                 const std::vector<Issue>& issues) {
  if (issues.empty()) return;
  Transaction tx(*this);
  Stmt st(impl_->db,
    "INSERT INTO iteration_issues(report_version, iteration, severity, description, fix_hint, "
    "created_at) VALUES (?, ?, ?, ?, ?, ?)");
  std::string now = utc_timestamp();
  for (auto& i : issues) {
    st.bind_int(1, report_version).bind_int(2, iteration).bind_text(3, to_string(i.severity))
      .bind_text(4, i.description).bind_opt_text(5, i.fix_hint).bind_text(6, now);
    st.run();
    st.reset();
  }
  tx.commit();
}

std::vector<IterationStatusRow> Store::iteration_status(std::optional<int64_t> report_version) const {
  std::string q =
    "SELECT report_version, iteration, coverage, support_rate, citation_rate, issues_high, "
    "issues_med, issues_low, missing_citations, created_at FROM iteration_status";
  if (report_version) q += " WHERE report_version=?";
  q += " ORDER BY id";
  Stmt st(impl_->db, q.c_str());
  if (report_version) st.bind_int(1, *report_version);
  std::vector<IterationStatusRow> out;
  while (st.step()) {
    IterationStatusRow r;
    r.report_version = st.col_int(0);
    r.metrics.iteration = (int)st.col_int(1);
    r.metrics.coverage = st.col_double(2);
    r.metrics.support_rate = st.col_double(3);
    r.metrics.citation_rate = st.col_double(4);
    r.metrics.issues_high = (int)st.col_int(5);
    r.metrics.issues_med = (int)st.col_int(6);
    r.metrics.issues_low = (int)st.col_int(7);
    r.metrics.missing_citations = (int)st.col_int(8);
    r.created_at = st.col_text(9);
    out.push_back(r);
  }
  return out;
}

std::vector<IterationIssueRow> Store::iteration_issues(std::optional<int64_t> report_version) const {
  std::string q =
    "SELECT report_version, iteration, severity, description, fix_hint, created_at "
    "FROM iteration_issues";
  if (report_version) q += " WHERE report_version=?";
  q += " ORDER BY id";
  Stmt st(impl_->db, q.c_str());
  if (report_version) st.bind_int(1, *report_version);
  std::vector<IterationIssueRow> out;
  while (st.step()) {
    IterationIssueRow r;
    r.report_version = st.col_int(0);
    r.iteration = (int)st.col_int(1);
    r.issue.severity = severity_from_string(st.col_text(2));
    r.issue.description = st.col_text(3);
    r.issue.fix_hint = st.col_text(4);
    r.created_at = st.col_text(5);
    out.push_back(std::move(r));
  }
  return out;
}
