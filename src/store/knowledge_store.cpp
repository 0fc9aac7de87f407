#include "noteweave/store/knowledge_store.hpp"

#include "noteweave/common/fs.hpp"
#include "noteweave/common/json_util.hpp"
#include "noteweave/common/time.hpp"
#include "noteweave/permalink/permalink.hpp"

#include <sstream>
#include <variant>

namespace noteweave::store {

namespace {

constexpr const char *kEntityColumns =
    "e.id, e.project_id, e.title, e.permalink, e.file_path, e.entity_type, e.content_type, "
    "e.checksum, e.frontmatter, e.tags, e.mtime, e.size, e.created_at, e.updated_at";
constexpr int kEntityColumnCount = 14;

constexpr const char *kRelationColumns =
    "id, project_id, from_entity_id, to_entity_id, target_title, relation_type, context";

using Bind = std::variant<std::string, std::int64_t>;

class Statement {
public:
  Statement(sqlite3 *db, const std::string &sql) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &stmt_, nullptr);
  }
  ~Statement() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
    }
  }

  Statement(const Statement &) = delete;
  Statement &operator=(const Statement &) = delete;

  [[nodiscard]] bool ok() const { return rc_ == SQLITE_OK && stmt_ != nullptr; }
  [[nodiscard]] sqlite3_stmt *get() const { return stmt_; }

  void bind(const int index, const std::string &value) {
    sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
  }
  void bind(const int index, const std::int64_t value) { sqlite3_bind_int64(stmt_, index, value); }
  void bind(const int index, const std::optional<std::string> &value) {
    if (value.has_value()) {
      bind(index, *value);
    } else {
      sqlite3_bind_null(stmt_, index);
    }
  }
  void bind_all(const std::vector<Bind> &binds) {
    int index = 1;
    for (const auto &value : binds) {
      std::visit([&](const auto &v) { bind(index, v); }, value);
      ++index;
    }
  }

  int step() { return sqlite3_step(stmt_); }

private:
  sqlite3_stmt *stmt_ = nullptr;
  int rc_ = SQLITE_ERROR;
};

common::Status sqlite_error(sqlite3 *db, const std::string &context) {
  const int code = sqlite3_extended_errcode(db) & 0xFF;
  common::ErrorCode kind = common::ErrorCode::Store;
  if (code == SQLITE_CONSTRAINT) {
    kind = common::ErrorCode::Conflict;
  } else if (code == SQLITE_BUSY || code == SQLITE_LOCKED) {
    kind = common::ErrorCode::Io;
  }
  return common::Status::error(kind, context + ": " + sqlite3_errmsg(db));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(common::ErrorCode::Store, msg);
  }
  return common::Status::success();
}

/// Rolls back on scope exit unless committed.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {}
  ~Transaction() {
    if (active_) {
      sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
  }

  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] common::Status begin() {
    if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK) {
      return sqlite_error(db_, "begin transaction");
    }
    active_ = true;
    return common::Status::success();
  }

  [[nodiscard]] common::Status commit() {
    if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
      return sqlite_error(db_, "commit");
    }
    active_ = false;
    return common::Status::success();
  }

private:
  sqlite3 *db_;
  bool active_ = false;
};

std::string column_text(sqlite3_stmt *stmt, const int index) {
  const auto *text = sqlite3_column_text(stmt, index);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

std::optional<std::string> column_optional_text(sqlite3_stmt *stmt, const int index) {
  if (sqlite3_column_type(stmt, index) == SQLITE_NULL) {
    return std::nullopt;
  }
  return column_text(stmt, index);
}

Entity row_to_entity(sqlite3_stmt *stmt) {
  Entity entity;
  entity.id = sqlite3_column_int64(stmt, 0);
  entity.project_id = sqlite3_column_int64(stmt, 1);
  entity.title = column_text(stmt, 2);
  entity.permalink = column_text(stmt, 3);
  entity.file_path = column_text(stmt, 4);
  entity.entity_type = column_text(stmt, 5);
  entity.content_type = column_text(stmt, 6);
  entity.checksum = column_text(stmt, 7);
  entity.frontmatter = column_text(stmt, 8);
  entity.tags = common::json_parse_string_array(column_text(stmt, 9));
  entity.mtime = sqlite3_column_int64(stmt, 10);
  entity.size = sqlite3_column_int64(stmt, 11);
  entity.created_at = column_text(stmt, 12);
  entity.updated_at = column_text(stmt, 13);
  return entity;
}

Relation row_to_relation(sqlite3_stmt *stmt) {
  Relation relation;
  relation.id = sqlite3_column_int64(stmt, 0);
  relation.project_id = sqlite3_column_int64(stmt, 1);
  relation.from_entity_id = sqlite3_column_int64(stmt, 2);
  if (sqlite3_column_type(stmt, 3) != SQLITE_NULL) {
    relation.to_entity_id = sqlite3_column_int64(stmt, 3);
  }
  relation.target_title = column_text(stmt, 4);
  relation.relation_type = column_text(stmt, 5);
  relation.context = column_optional_text(stmt, 6);
  return relation;
}

Project row_to_project(sqlite3_stmt *stmt) {
  Project project;
  project.id = sqlite3_column_int64(stmt, 0);
  project.name = column_text(stmt, 1);
  project.permalink = column_text(stmt, 2);
  project.root_path = column_text(stmt, 3);
  project.is_default = sqlite3_column_int(stmt, 4) != 0;
  project.created_at = column_text(stmt, 5);
  return project;
}

std::string like_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    if (ch == '%' || ch == '_' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  return out;
}

// Each whitespace-separated term becomes a quoted prefix query: "term"*
std::string build_fts_query(const std::string &text) {
  std::istringstream words(text);
  std::string word;
  std::string query;
  while (words >> word) {
    std::string escaped;
    for (const char ch : word) {
      if (ch == '"') {
        escaped += "\"\"";
      } else if (ch != '*') {
        escaped.push_back(ch);
      }
    }
    if (escaped.empty()) {
      continue;
    }
    if (!query.empty()) {
      query.push_back(' ');
    }
    query += "\"" + escaped + "\"*";
  }
  return query;
}

void append_filters(std::string &sql, std::vector<Bind> &binds, const SearchFilters &filters) {
  if (!filters.entity_types.empty()) {
    sql += " AND e.entity_type IN (";
    for (std::size_t i = 0; i < filters.entity_types.size(); ++i) {
      sql += i == 0 ? "?" : ", ?";
      binds.emplace_back(filters.entity_types[i]);
    }
    sql += ")";
  }
  for (const auto &tag : filters.tags) {
    std::string clean = tag;
    while (!clean.empty() && clean.front() == '#') {
      clean.erase(clean.begin());
    }
    sql += " AND (e.tags LIKE ? ESCAPE '\\' OR EXISTS (SELECT 1 FROM observations o "
           "WHERE o.entity_id = e.id AND o.tags LIKE ? ESCAPE '\\'))";
    const std::string pattern = "%\"" + like_escape(clean) + "\"%";
    binds.emplace_back(pattern);
    binds.emplace_back(pattern);
  }
  if (filters.after_date.has_value()) {
    sql += " AND e.updated_at >= ?";
    binds.emplace_back(*filters.after_date);
  }
  if (filters.permalink_glob.has_value()) {
    sql += " AND e.permalink GLOB ?";
    binds.emplace_back(*filters.permalink_glob);
  }
  if (filters.folder.has_value()) {
    std::string folder = *filters.folder;
    while (!folder.empty() && folder.back() == '/') {
      folder.pop_back();
    }
    if (!folder.empty()) {
      sql += " AND e.file_path LIKE ? ESCAPE '\\'";
      binds.emplace_back(like_escape(folder) + "/%");
    }
  }
}

std::string page_clause(const Pagination &pagination) {
  return " LIMIT " + std::to_string(pagination.size() + 1) + " OFFSET " + std::to_string(pagination.offset());
}

SearchPage finish_page(std::vector<SearchResult> rows, const Pagination &pagination) {
  SearchPage page;
  page.page = pagination.number();
  page.page_size = pagination.size();
  if (rows.size() > page.page_size) {
    page.has_more = true;
    rows.resize(page.page_size);
  }
  page.results = std::move(rows);
  return page;
}

} // namespace

KnowledgeStore::KnowledgeStore(std::filesystem::path db_path) : db_path_(std::move(db_path)) {}

KnowledgeStore::~KnowledgeStore() {
  if (read_db_ != nullptr) {
    sqlite3_close(read_db_);
  }
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status KnowledgeStore::open() {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }

  if (!db_path_.parent_path().empty()) {
    auto dir = common::ensure_dir(db_path_.parent_path());
    if (!dir.ok()) {
      return dir.status();
    }
  }

  if (sqlite3_open_v2(db_path_.string().c_str(), &db_,
                      SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                      nullptr) != SQLITE_OK) {
    const std::string msg = db_ == nullptr ? "out of memory" : sqlite3_errmsg(db_);
    sqlite3_close(db_);
    db_ = nullptr;
    return common::Status::error(common::ErrorCode::Store, "failed to open store: " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);

  auto status = init_schema();
  if (!status.ok()) {
    return status;
  }

  if (sqlite3_open_v2(db_path_.string().c_str(), &read_db_,
                      SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX, nullptr) != SQLITE_OK) {
    sqlite3_close(read_db_);
    read_db_ = nullptr;
    return common::Status::error(common::ErrorCode::Store, "failed to open read connection");
  }
  sqlite3_busy_timeout(read_db_, 5000);
  return common::Status::success();
}

bool KnowledgeStore::health_check() {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (read_db_ == nullptr) {
    return false;
  }
  Statement stmt(read_db_, "SELECT COUNT(*) FROM projects");
  return stmt.ok() && stmt.step() == SQLITE_ROW;
}

common::Status KnowledgeStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, "PRAGMA foreign_keys=ON;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS projects (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  name TEXT NOT NULL,
  permalink TEXT NOT NULL UNIQUE,
  root_path TEXT NOT NULL,
  is_default INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
CREATE UNIQUE INDEX IF NOT EXISTS idx_projects_name ON projects(name COLLATE NOCASE);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS entities (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  project_id INTEGER NOT NULL REFERENCES projects(id) ON DELETE CASCADE,
  title TEXT NOT NULL,
  permalink TEXT NOT NULL,
  file_path TEXT NOT NULL,
  entity_type TEXT NOT NULL DEFAULT 'note',
  content_type TEXT NOT NULL DEFAULT 'text/markdown',
  checksum TEXT NOT NULL,
  frontmatter TEXT NOT NULL DEFAULT '',
  tags TEXT NOT NULL DEFAULT '[]',
  body TEXT NOT NULL DEFAULT '',
  mtime INTEGER NOT NULL DEFAULT 0,
  size INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  UNIQUE(project_id, permalink),
  UNIQUE(project_id, file_path)
);
CREATE INDEX IF NOT EXISTS idx_entities_title ON entities(project_id, title COLLATE NOCASE);
CREATE INDEX IF NOT EXISTS idx_entities_checksum ON entities(project_id, checksum);
CREATE INDEX IF NOT EXISTS idx_entities_updated ON entities(project_id, updated_at);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS observations (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  entity_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,
  category TEXT NOT NULL DEFAULT 'note',
  content TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '[]',
  context TEXT,
  position INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_observations_entity ON observations(entity_id);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS relations (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  project_id INTEGER NOT NULL REFERENCES projects(id) ON DELETE CASCADE,
  from_entity_id INTEGER NOT NULL REFERENCES entities(id) ON DELETE CASCADE,
  to_entity_id INTEGER REFERENCES entities(id) ON DELETE SET NULL,
  target_title TEXT NOT NULL,
  relation_type TEXT NOT NULL,
  context TEXT,
  UNIQUE(from_entity_id, relation_type, target_title)
);
CREATE INDEX IF NOT EXISTS idx_relations_from ON relations(from_entity_id);
CREATE INDEX IF NOT EXISTS idx_relations_to ON relations(to_entity_id);
CREATE INDEX IF NOT EXISTS idx_relations_dangling ON relations(project_id, to_entity_id);
)");
  if (!status.ok()) {
    return status;
  }

  // Row ids of search_index mirror entity ids.
  status = exec_sql(db_, R"(
CREATE VIRTUAL TABLE IF NOT EXISTS search_index USING fts5(
  title, content, tags, permalink,
  tokenize = 'unicode61 remove_diacritics 2'
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TRIGGER IF NOT EXISTS entities_ad AFTER DELETE ON entities BEGIN
  DELETE FROM search_index WHERE rowid = old.id;
END;
)");
}

common::Status KnowledgeStore::reject_foreign_entity(sqlite3 *db, const ProjectId project_id,
                                                     const EntityId entity_id) {
  Statement owner(db, "SELECT project_id FROM entities WHERE id = ?1");
  if (!owner.ok()) {
    return sqlite_error(db, "entity owner");
  }
  owner.bind(1, entity_id);
  if (owner.step() == SQLITE_ROW && sqlite3_column_int64(owner.get(), 0) != project_id) {
    return common::Status::error(common::ErrorCode::CrossProject,
                                 "entity " + std::to_string(entity_id) +
                                     " belongs to another project");
  }
  return common::Status::success();
}

common::Status KnowledgeStore::ensure_project(sqlite3 *db, const ProjectId project_id) {
  Statement stmt(db, "SELECT 1 FROM projects WHERE id = ?1");
  if (!stmt.ok()) {
    return sqlite_error(db, "project lookup");
  }
  stmt.bind(1, project_id);
  if (stmt.step() != SQLITE_ROW) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "unknown project id " + std::to_string(project_id));
  }
  return common::Status::success();
}

common::Result<Project> KnowledgeStore::add_project(const std::string &name,
                                                    const std::string &root_path,
                                                    const bool set_default) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (db_ == nullptr) {
    return common::Result<Project>::failure(common::ErrorCode::Store, "store is not open");
  }

  const std::string clean_name = common::trim(name);
  if (clean_name.empty()) {
    return common::Result<Project>::failure(common::ErrorCode::InvalidArgument,
                                            "project name must not be empty");
  }
  std::string project_permalink = permalink::slugify(clean_name);
  if (project_permalink.empty()) {
    project_permalink = "project";
  }

  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return common::Result<Project>::failure(status);
  }

  {
    Statement existing(db_, "SELECT id FROM projects WHERE name = ?1 COLLATE NOCASE OR permalink = ?2");
    if (!existing.ok()) {
      return common::Result<Project>::failure(sqlite_error(db_, "project lookup"));
    }
    existing.bind(1, clean_name);
    existing.bind(2, project_permalink);
    if (existing.step() == SQLITE_ROW) {
      return common::Result<Project>::failure(common::ErrorCode::Conflict,
                                              "project already exists: " + clean_name);
    }
  }

  bool make_default = set_default;
  {
    Statement count(db_, "SELECT COUNT(*) FROM projects");
    if (count.ok() && count.step() == SQLITE_ROW && sqlite3_column_int64(count.get(), 0) == 0) {
      make_default = true;
    }
  }
  if (make_default) {
    if (auto status = exec_sql(db_, "UPDATE projects SET is_default = 0"); !status.ok()) {
      return common::Result<Project>::failure(status);
    }
  }

  const std::string now = common::now_rfc3339();
  Statement insert(db_, "INSERT INTO projects(name, permalink, root_path, is_default, created_at, "
                        "updated_at) VALUES(?1, ?2, ?3, ?4, ?5, ?5)");
  if (!insert.ok()) {
    return common::Result<Project>::failure(sqlite_error(db_, "insert project"));
  }
  insert.bind(1, clean_name);
  insert.bind(2, project_permalink);
  insert.bind(3, root_path);
  insert.bind(4, static_cast<std::int64_t>(make_default ? 1 : 0));
  insert.bind(5, now);
  if (insert.step() != SQLITE_DONE) {
    return common::Result<Project>::failure(sqlite_error(db_, "insert project"));
  }

  Project project;
  project.id = sqlite3_last_insert_rowid(db_);
  project.name = clean_name;
  project.permalink = project_permalink;
  project.root_path = root_path;
  project.is_default = make_default;
  project.created_at = now;

  if (auto status = txn.commit(); !status.ok()) {
    return common::Result<Project>::failure(status);
  }
  return common::Result<Project>::success(std::move(project));
}

common::Status KnowledgeStore::remove_project(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Statement stmt(db_, "DELETE FROM projects WHERE id = ?1");
  if (!stmt.ok()) {
    return sqlite_error(db_, "remove project");
  }
  stmt.bind(1, project_id);
  if (stmt.step() != SQLITE_DONE) {
    return sqlite_error(db_, "remove project");
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "unknown project id " + std::to_string(project_id));
  }
  return common::Status::success();
}

common::Result<std::vector<Project>> KnowledgeStore::list_projects() {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, "SELECT id, name, permalink, root_path, is_default, created_at "
                           "FROM projects ORDER BY name COLLATE NOCASE");
  if (!stmt.ok()) {
    return common::Result<std::vector<Project>>::failure(sqlite_error(read_db_, "list projects"));
  }
  std::vector<Project> projects;
  while (stmt.step() == SQLITE_ROW) {
    projects.push_back(row_to_project(stmt.get()));
  }
  return common::Result<std::vector<Project>>::success(std::move(projects));
}

common::Result<std::optional<Project>> KnowledgeStore::find_project(const std::string &name) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, "SELECT id, name, permalink, root_path, is_default, created_at "
                           "FROM projects WHERE name = ?1 COLLATE NOCASE OR permalink = ?2 "
                           "ORDER BY id LIMIT 1");
  if (!stmt.ok()) {
    return common::Result<std::optional<Project>>::failure(sqlite_error(read_db_, "find project"));
  }
  stmt.bind(1, common::trim(name));
  stmt.bind(2, permalink::slugify(name));
  if (stmt.step() == SQLITE_ROW) {
    return common::Result<std::optional<Project>>::success(row_to_project(stmt.get()));
  }
  return common::Result<std::optional<Project>>::success(std::nullopt);
}

common::Result<std::optional<Project>> KnowledgeStore::default_project() {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, "SELECT id, name, permalink, root_path, is_default, created_at "
                           "FROM projects WHERE is_default = 1 LIMIT 1");
  if (!stmt.ok()) {
    return common::Result<std::optional<Project>>::failure(
        sqlite_error(read_db_, "default project"));
  }
  if (stmt.step() == SQLITE_ROW) {
    return common::Result<std::optional<Project>>::success(row_to_project(stmt.get()));
  }
  return common::Result<std::optional<Project>>::success(std::nullopt);
}

common::Status KnowledgeStore::set_default_project(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return status;
  }
  if (auto status = ensure_project(db_, project_id); !status.ok()) {
    return status;
  }
  Statement stmt(db_, "UPDATE projects SET is_default = (id = ?1)");
  if (!stmt.ok()) {
    return sqlite_error(db_, "set default project");
  }
  stmt.bind(1, project_id);
  if (stmt.step() != SQLITE_DONE) {
    return sqlite_error(db_, "set default project");
  }
  return txn.commit();
}

common::Result<std::optional<Entity>> KnowledgeStore::find_one(sqlite3 *db, const char *sql,
                                                               const ProjectId project_id,
                                                               const std::string &value) {
  Statement stmt(db, std::string("SELECT ") + kEntityColumns + " FROM entities e " + sql);
  if (!stmt.ok()) {
    return common::Result<std::optional<Entity>>::failure(sqlite_error(db, "entity lookup"));
  }
  stmt.bind(1, project_id);
  stmt.bind(2, value);
  const int rc = stmt.step();
  if (rc == SQLITE_ROW) {
    return common::Result<std::optional<Entity>>::success(row_to_entity(stmt.get()));
  }
  if (rc != SQLITE_DONE) {
    return common::Result<std::optional<Entity>>::failure(sqlite_error(db, "entity lookup"));
  }
  return common::Result<std::optional<Entity>>::success(std::nullopt);
}

common::Result<std::optional<Entity>>
KnowledgeStore::resolve_link_on(sqlite3 *db, const ProjectId project_id, const std::string &target) {
  const std::string clean = markdown::normalize_link_target(target);
  if (clean.empty()) {
    return common::Result<std::optional<Entity>>::success(std::nullopt);
  }

  static const char *lookups[] = {
      "WHERE e.project_id = ?1 AND e.permalink = ?2",
      "WHERE e.project_id = ?1 AND e.title = ?2 COLLATE NOCASE ORDER BY e.id LIMIT 1",
      "WHERE e.project_id = ?1 AND e.file_path = ?2",
      "WHERE e.project_id = ?1 AND e.file_path = ?2 || '.md'",
  };
  for (const char *where : lookups) {
    auto found = find_one(db, where, project_id, clean);
    if (!found.ok() || found.value().has_value()) {
      return found;
    }
  }
  return common::Result<std::optional<Entity>>::success(std::nullopt);
}

common::Status KnowledgeStore::refresh_search_entry(const EntityId entity_id) {
  Statement remove(db_, "DELETE FROM search_index WHERE rowid = ?1");
  if (!remove.ok()) {
    return sqlite_error(db_, "search index delete");
  }
  remove.bind(1, entity_id);
  if (remove.step() != SQLITE_DONE) {
    return sqlite_error(db_, "search index delete");
  }

  Statement insert(db_, R"(
INSERT INTO search_index(rowid, title, content, tags, permalink)
SELECT e.id, e.title, e.body,
       e.tags || ' ' || COALESCE((SELECT group_concat(o.tags, ' ') FROM observations o
                                  WHERE o.entity_id = e.id), ''),
       e.permalink
FROM entities e WHERE e.id = ?1
)");
  if (!insert.ok()) {
    return sqlite_error(db_, "search index insert");
  }
  insert.bind(1, entity_id);
  if (insert.step() != SQLITE_DONE) {
    return sqlite_error(db_, "search index insert");
  }
  return common::Status::success();
}

common::Result<std::size_t> KnowledgeStore::resolve_inbound(const Entity &entity) {
  Statement stmt(db_, R"(
UPDATE relations SET to_entity_id = ?1
WHERE project_id = ?2 AND to_entity_id IS NULL AND from_entity_id != ?1
  AND (target_title = ?3 OR target_title = ?4 COLLATE NOCASE OR target_title = ?5
       OR target_title || '.md' = ?5)
)");
  if (!stmt.ok()) {
    return common::Result<std::size_t>::failure(sqlite_error(db_, "resolve inbound"));
  }
  stmt.bind(1, entity.id);
  stmt.bind(2, entity.project_id);
  stmt.bind(3, entity.permalink);
  stmt.bind(4, entity.title);
  stmt.bind(5, entity.file_path);
  if (stmt.step() != SQLITE_DONE) {
    return common::Result<std::size_t>::failure(sqlite_error(db_, "resolve inbound"));
  }
  return common::Result<std::size_t>::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Result<UpsertOutcome> KnowledgeStore::upsert_entity(const ProjectId project_id,
                                                            const EntityDraft &draft) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (db_ == nullptr) {
    return common::Result<UpsertOutcome>::failure(common::ErrorCode::Store, "store is not open");
  }
  if (draft.file_path.empty()) {
    return common::Result<UpsertOutcome>::failure(common::ErrorCode::InvalidArgument,
                                                  "entity draft has no file path");
  }

  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return common::Result<UpsertOutcome>::failure(status);
  }
  if (auto status = ensure_project(db_, project_id); !status.ok()) {
    return common::Result<UpsertOutcome>::failure(status);
  }

  auto existing = find_one(db_, "WHERE e.project_id = ?1 AND e.file_path = ?2", project_id,
                           draft.file_path);
  if (!existing.ok()) {
    return common::Result<UpsertOutcome>::failure(existing.status());
  }
  const std::optional<Entity> &current = existing.value();

  auto taken = [&](const std::string &candidate) {
    Statement stmt(db_, "SELECT id FROM entities WHERE project_id = ?1 AND permalink = ?2");
    if (!stmt.ok()) {
      return false;
    }
    stmt.bind(1, project_id);
    stmt.bind(2, candidate);
    if (stmt.step() != SQLITE_ROW) {
      return false;
    }
    return !(current.has_value() && sqlite3_column_int64(stmt.get(), 0) == current->id);
  };

  UpsertOutcome outcome;
  Entity &entity = outcome.entity;
  const std::string now = common::now_rfc3339();

  if (current.has_value()) {
    entity = *current;
    if (draft.permalink.has_value() && *draft.permalink != entity.permalink &&
        !taken(*draft.permalink)) {
      entity.permalink = *draft.permalink;
    }
  } else {
    outcome.created = true;
    entity.project_id = project_id;
    entity.file_path = draft.file_path;
    entity.created_at = now;
    entity.permalink = permalink::resolve(draft.title, draft.permalink, taken);
  }

  entity.title = draft.title;
  entity.entity_type = draft.entity_type;
  entity.content_type = draft.content_type;
  entity.checksum = draft.checksum;
  entity.frontmatter = draft.frontmatter;
  entity.tags = draft.tags;
  entity.mtime = draft.mtime;
  entity.size = draft.size;
  entity.updated_at = now;

  {
    const char *sql = outcome.created
                          ? "INSERT INTO entities(title, permalink, entity_type, content_type, "
                            "checksum, frontmatter, tags, body, mtime, size, updated_at, "
                            "project_id, file_path, created_at) "
                            "VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14)"
                          : "UPDATE entities SET title = ?1, permalink = ?2, entity_type = ?3, "
                            "content_type = ?4, checksum = ?5, frontmatter = ?6, tags = ?7, "
                            "body = ?8, mtime = ?9, size = ?10, updated_at = ?11 WHERE id = ?12";
    Statement stmt(db_, sql);
    if (!stmt.ok()) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "write entity"));
    }
    stmt.bind(1, entity.title);
    stmt.bind(2, entity.permalink);
    stmt.bind(3, entity.entity_type);
    stmt.bind(4, entity.content_type);
    stmt.bind(5, entity.checksum);
    stmt.bind(6, entity.frontmatter);
    stmt.bind(7, common::json_string_array(entity.tags));
    stmt.bind(8, draft.body);
    stmt.bind(9, entity.mtime);
    stmt.bind(10, entity.size);
    stmt.bind(11, entity.updated_at);
    if (outcome.created) {
      stmt.bind(12, project_id);
      stmt.bind(13, entity.file_path);
      stmt.bind(14, entity.created_at);
    } else {
      stmt.bind(12, entity.id);
    }
    if (stmt.step() != SQLITE_DONE) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "write entity"));
    }
    if (outcome.created) {
      entity.id = sqlite3_last_insert_rowid(db_);
    }
  }

  {
    Statement clear(db_, "DELETE FROM observations WHERE entity_id = ?1");
    if (!clear.ok()) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "clear observations"));
    }
    clear.bind(1, entity.id);
    if (clear.step() != SQLITE_DONE) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "clear observations"));
    }
  }

  std::int64_t position = 0;
  for (const auto &observation : draft.observations) {
    Statement stmt(db_, "INSERT INTO observations(entity_id, category, content, tags, context, "
                        "position) VALUES(?1, ?2, ?3, ?4, ?5, ?6)");
    if (!stmt.ok()) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "insert observation"));
    }
    stmt.bind(1, entity.id);
    stmt.bind(2, observation.category);
    stmt.bind(3, observation.content);
    stmt.bind(4, common::json_string_array(observation.tags));
    stmt.bind(5, observation.context);
    stmt.bind(6, position++);
    if (stmt.step() != SQLITE_DONE) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "insert observation"));
    }
  }

  {
    Statement clear(db_, "DELETE FROM relations WHERE from_entity_id = ?1");
    if (!clear.ok()) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "clear relations"));
    }
    clear.bind(1, entity.id);
    if (clear.step() != SQLITE_DONE) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "clear relations"));
    }
  }

  for (const auto &relation : draft.relations) {
    auto target = resolve_link_on(db_, project_id, relation.target);
    if (!target.ok()) {
      return common::Result<UpsertOutcome>::failure(target.status());
    }
    if (target.value().has_value() && target.value()->id == entity.id) {
      continue; // self reference
    }

    Statement stmt(db_, "INSERT OR IGNORE INTO relations(project_id, from_entity_id, "
                        "to_entity_id, target_title, relation_type, context) "
                        "VALUES(?1, ?2, ?3, ?4, ?5, ?6)");
    if (!stmt.ok()) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "insert relation"));
    }
    stmt.bind(1, project_id);
    stmt.bind(2, entity.id);
    if (target.value().has_value()) {
      stmt.bind(3, target.value()->id);
    } else {
      sqlite3_bind_null(stmt.get(), 3);
    }
    stmt.bind(4, relation.target);
    stmt.bind(5, relation.relation_type);
    stmt.bind(6, relation.context);
    if (stmt.step() != SQLITE_DONE) {
      return common::Result<UpsertOutcome>::failure(sqlite_error(db_, "insert relation"));
    }
  }

  auto inbound = resolve_inbound(entity);
  if (!inbound.ok()) {
    return common::Result<UpsertOutcome>::failure(inbound.status());
  }
  outcome.inbound_resolved = inbound.value();

  if (auto status = refresh_search_entry(entity.id); !status.ok()) {
    return common::Result<UpsertOutcome>::failure(status);
  }

  if (auto status = txn.commit(); !status.ok()) {
    return common::Result<UpsertOutcome>::failure(status);
  }
  return common::Result<UpsertOutcome>::success(std::move(outcome));
}

common::Status KnowledgeStore::delete_entity(const ProjectId project_id, const EntityId entity_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return status;
  }

  {
    Statement owner(db_, "SELECT project_id FROM entities WHERE id = ?1");
    if (!owner.ok()) {
      return sqlite_error(db_, "delete entity");
    }
    owner.bind(1, entity_id);
    if (owner.step() != SQLITE_ROW) {
      return common::Status::error(common::ErrorCode::NotFound,
                                   "unknown entity id " + std::to_string(entity_id));
    }
    if (sqlite3_column_int64(owner.get(), 0) != project_id) {
      return common::Status::error(common::ErrorCode::CrossProject,
                                   "entity " + std::to_string(entity_id) +
                                       " belongs to another project");
    }
  }

  // Observations and outbound relations cascade; inbound relations become dangling.
  Statement stmt(db_, "DELETE FROM entities WHERE id = ?1");
  if (!stmt.ok()) {
    return sqlite_error(db_, "delete entity");
  }
  stmt.bind(1, entity_id);
  if (stmt.step() != SQLITE_DONE) {
    return sqlite_error(db_, "delete entity");
  }
  return txn.commit();
}

common::Result<bool> KnowledgeStore::delete_entity_by_path(const ProjectId project_id,
                                                           const std::string &file_path) {
  auto found = find_by_path(project_id, file_path);
  if (!found.ok()) {
    return common::Result<bool>::failure(found.status());
  }
  if (!found.value().has_value()) {
    return common::Result<bool>::success(false);
  }
  auto status = delete_entity(project_id, found.value()->id);
  if (!status.ok()) {
    return common::Result<bool>::failure(status);
  }
  return common::Result<bool>::success(true);
}

common::Result<Entity> KnowledgeStore::move_entity(const ProjectId project_id,
                                                   const EntityId entity_id,
                                                   const std::string &new_file_path,
                                                   const bool regenerate_permalink) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return common::Result<Entity>::failure(status);
  }

  Statement lookup(db_, std::string("SELECT ") + kEntityColumns + " FROM entities e WHERE e.id = ?1");
  if (!lookup.ok()) {
    return common::Result<Entity>::failure(sqlite_error(db_, "move entity"));
  }
  lookup.bind(1, entity_id);
  if (lookup.step() != SQLITE_ROW) {
    return common::Result<Entity>::failure(common::ErrorCode::NotFound,
                                           "unknown entity id " + std::to_string(entity_id));
  }
  Entity entity = row_to_entity(lookup.get());
  if (entity.project_id != project_id) {
    return common::Result<Entity>::failure(common::ErrorCode::CrossProject,
                                           "entity " + std::to_string(entity_id) +
                                               " belongs to another project");
  }

  auto occupant = find_one(db_, "WHERE e.project_id = ?1 AND e.file_path = ?2", project_id,
                           new_file_path);
  if (!occupant.ok()) {
    return common::Result<Entity>::failure(occupant.status());
  }
  if (occupant.value().has_value() && occupant.value()->id != entity_id) {
    return common::Result<Entity>::failure(common::ErrorCode::Conflict,
                                           "destination already indexed: " + new_file_path);
  }

  entity.file_path = new_file_path;
  if (regenerate_permalink) {
    auto taken = [&](const std::string &candidate) {
      Statement stmt(db_, "SELECT id FROM entities WHERE project_id = ?1 AND permalink = ?2");
      if (!stmt.ok()) {
        return false;
      }
      stmt.bind(1, project_id);
      stmt.bind(2, candidate);
      return stmt.step() == SQLITE_ROW && sqlite3_column_int64(stmt.get(), 0) != entity_id;
    };
    const std::string stem = std::filesystem::path(new_file_path).stem().string();
    entity.permalink = permalink::resolve(stem, std::nullopt, taken);
  }
  entity.updated_at = common::now_rfc3339();

  Statement update(db_, "UPDATE entities SET file_path = ?1, permalink = ?2, updated_at = ?3 "
                        "WHERE id = ?4");
  if (!update.ok()) {
    return common::Result<Entity>::failure(sqlite_error(db_, "move entity"));
  }
  update.bind(1, entity.file_path);
  update.bind(2, entity.permalink);
  update.bind(3, entity.updated_at);
  update.bind(4, entity_id);
  if (update.step() != SQLITE_DONE) {
    return common::Result<Entity>::failure(sqlite_error(db_, "move entity"));
  }

  if (auto inbound = resolve_inbound(entity); !inbound.ok()) {
    return common::Result<Entity>::failure(inbound.status());
  }
  if (auto status = refresh_search_entry(entity_id); !status.ok()) {
    return common::Result<Entity>::failure(status);
  }
  if (auto status = txn.commit(); !status.ok()) {
    return common::Result<Entity>::failure(status);
  }
  return common::Result<Entity>::success(std::move(entity));
}

common::Result<std::size_t> KnowledgeStore::resolve_relations(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }

  std::vector<Relation> pending;
  {
    Statement stmt(db_, std::string("SELECT ") + kRelationColumns +
                            " FROM relations WHERE project_id = ?1 AND to_entity_id IS NULL");
    if (!stmt.ok()) {
      return common::Result<std::size_t>::failure(sqlite_error(db_, "resolve relations"));
    }
    stmt.bind(1, project_id);
    while (stmt.step() == SQLITE_ROW) {
      pending.push_back(row_to_relation(stmt.get()));
    }
  }

  std::size_t resolved = 0;
  for (const auto &relation : pending) {
    auto target = resolve_link_on(db_, project_id, relation.target_title);
    if (!target.ok()) {
      return common::Result<std::size_t>::failure(target.status());
    }
    if (!target.value().has_value() || target.value()->id == relation.from_entity_id) {
      continue;
    }
    Statement update(db_, "UPDATE relations SET to_entity_id = ?1 WHERE id = ?2");
    if (!update.ok()) {
      return common::Result<std::size_t>::failure(sqlite_error(db_, "resolve relations"));
    }
    update.bind(1, target.value()->id);
    update.bind(2, relation.id);
    if (update.step() != SQLITE_DONE) {
      return common::Result<std::size_t>::failure(sqlite_error(db_, "resolve relations"));
    }
    ++resolved;
  }

  if (resolved == 0) {
    // Nothing changed; the destructor rolls the empty transaction back.
    return common::Result<std::size_t>::success(0);
  }
  if (auto status = txn.commit(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  return common::Result<std::size_t>::success(resolved);
}

common::Status KnowledgeStore::rebuild_search_index(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  Transaction txn(db_);
  if (auto status = txn.begin(); !status.ok()) {
    return status;
  }
  if (auto status = ensure_project(db_, project_id); !status.ok()) {
    return status;
  }

  std::vector<EntityId> ids;
  {
    Statement stmt(db_, "SELECT id FROM entities WHERE project_id = ?1");
    if (!stmt.ok()) {
      return sqlite_error(db_, "rebuild search index");
    }
    stmt.bind(1, project_id);
    while (stmt.step() == SQLITE_ROW) {
      ids.push_back(sqlite3_column_int64(stmt.get(), 0));
    }
  }
  for (const EntityId id : ids) {
    if (auto status = refresh_search_entry(id); !status.ok()) {
      return status;
    }
  }
  return txn.commit();
}

common::Result<std::optional<Entity>> KnowledgeStore::get_entity(const ProjectId project_id,
                                                                 const EntityId entity_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_,
                 std::string("SELECT ") + kEntityColumns + " FROM entities e WHERE e.id = ?1");
  if (!stmt.ok()) {
    return common::Result<std::optional<Entity>>::failure(sqlite_error(read_db_, "get entity"));
  }
  stmt.bind(1, entity_id);
  if (stmt.step() != SQLITE_ROW) {
    return common::Result<std::optional<Entity>>::success(std::nullopt);
  }
  Entity entity = row_to_entity(stmt.get());
  if (entity.project_id != project_id) {
    return common::Result<std::optional<Entity>>::failure(
        common::ErrorCode::CrossProject,
        "entity " + std::to_string(entity_id) + " belongs to another project");
  }
  return common::Result<std::optional<Entity>>::success(std::move(entity));
}

common::Result<std::optional<Entity>>
KnowledgeStore::find_by_permalink(const ProjectId project_id, const std::string &permalink) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  return find_one(read_db_, "WHERE e.project_id = ?1 AND e.permalink = ?2", project_id, permalink);
}

common::Result<std::optional<Entity>> KnowledgeStore::find_by_path(const ProjectId project_id,
                                                                   const std::string &file_path) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  return find_one(read_db_, "WHERE e.project_id = ?1 AND e.file_path = ?2", project_id, file_path);
}

common::Result<std::optional<Entity>> KnowledgeStore::resolve_link(const ProjectId project_id,
                                                                   const std::string &target) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  return resolve_link_on(read_db_, project_id, target);
}

common::Result<std::vector<Entity>> KnowledgeStore::find_by_pattern(const ProjectId project_id,
                                                                    const std::string &glob,
                                                                    const Pagination &pagination) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, std::string("SELECT ") + kEntityColumns +
                               " FROM entities e WHERE e.project_id = ?1 AND "
                               "(e.permalink GLOB ?2 OR e.file_path GLOB ?2) "
                               "ORDER BY e.permalink LIMIT ?3 OFFSET ?4");
  if (!stmt.ok()) {
    return common::Result<std::vector<Entity>>::failure(sqlite_error(read_db_, "pattern lookup"));
  }
  stmt.bind(1, project_id);
  stmt.bind(2, glob);
  stmt.bind(3, static_cast<std::int64_t>(pagination.size()));
  stmt.bind(4, static_cast<std::int64_t>(pagination.offset()));
  std::vector<Entity> entities;
  while (stmt.step() == SQLITE_ROW) {
    entities.push_back(row_to_entity(stmt.get()));
  }
  return common::Result<std::vector<Entity>>::success(std::move(entities));
}

common::Result<std::vector<Observation>> KnowledgeStore::observations_for(const ProjectId project_id,
                                                                          const EntityId entity_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (auto status = reject_foreign_entity(read_db_, project_id, entity_id); !status.ok()) {
    return common::Result<std::vector<Observation>>::failure(status);
  }
  Statement stmt(read_db_, "SELECT o.id, o.entity_id, o.category, o.content, o.tags, o.context "
                           "FROM observations o JOIN entities e ON e.id = o.entity_id "
                           "WHERE o.entity_id = ?1 AND e.project_id = ?2 ORDER BY o.position");
  if (!stmt.ok()) {
    return common::Result<std::vector<Observation>>::failure(
        sqlite_error(read_db_, "observations"));
  }
  stmt.bind(1, entity_id);
  stmt.bind(2, project_id);
  std::vector<Observation> observations;
  while (stmt.step() == SQLITE_ROW) {
    Observation observation;
    observation.id = sqlite3_column_int64(stmt.get(), 0);
    observation.entity_id = sqlite3_column_int64(stmt.get(), 1);
    observation.category = column_text(stmt.get(), 2);
    observation.content = column_text(stmt.get(), 3);
    observation.tags = common::json_parse_string_array(column_text(stmt.get(), 4));
    observation.context = column_optional_text(stmt.get(), 5);
    observations.push_back(std::move(observation));
  }
  return common::Result<std::vector<Observation>>::success(std::move(observations));
}

common::Result<std::vector<Relation>> KnowledgeStore::relations_from(const ProjectId project_id,
                                                             const EntityId entity_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (auto status = reject_foreign_entity(read_db_, project_id, entity_id); !status.ok()) {
    return common::Result<std::vector<Relation>>::failure(status);
  }
  Statement stmt(read_db_, std::string("SELECT ") + kRelationColumns +
                               " FROM relations WHERE from_entity_id = ?1 AND project_id = ?2 ORDER BY id");
  if (!stmt.ok()) {
    return common::Result<std::vector<Relation>>::failure(sqlite_error(read_db_, "relations"));
  }
  stmt.bind(1, entity_id);
  stmt.bind(2, project_id);
  std::vector<Relation> relations;
  while (stmt.step() == SQLITE_ROW) {
    relations.push_back(row_to_relation(stmt.get()));
  }
  return common::Result<std::vector<Relation>>::success(std::move(relations));
}

common::Result<std::vector<Relation>> KnowledgeStore::relations_to(const ProjectId project_id,
                                                             const EntityId entity_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  if (auto status = reject_foreign_entity(read_db_, project_id, entity_id); !status.ok()) {
    return common::Result<std::vector<Relation>>::failure(status);
  }
  Statement stmt(read_db_, std::string("SELECT ") + kRelationColumns +
                               " FROM relations WHERE to_entity_id = ?1 AND project_id = ?2 ORDER BY id");
  if (!stmt.ok()) {
    return common::Result<std::vector<Relation>>::failure(sqlite_error(read_db_, "relations"));
  }
  stmt.bind(1, entity_id);
  stmt.bind(2, project_id);
  std::vector<Relation> relations;
  while (stmt.step() == SQLITE_ROW) {
    relations.push_back(row_to_relation(stmt.get()));
  }
  return common::Result<std::vector<Relation>>::success(std::move(relations));
}

common::Result<std::vector<Relation>> KnowledgeStore::dangling_relations(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, std::string("SELECT ") + kRelationColumns +
                               " FROM relations WHERE project_id = ?1 AND to_entity_id IS NULL "
                               "ORDER BY id");
  if (!stmt.ok()) {
    return common::Result<std::vector<Relation>>::failure(sqlite_error(read_db_, "relations"));
  }
  stmt.bind(1, project_id);
  std::vector<Relation> relations;
  while (stmt.step() == SQLITE_ROW) {
    relations.push_back(row_to_relation(stmt.get()));
  }
  return common::Result<std::vector<Relation>>::success(std::move(relations));
}

common::Result<std::vector<FileState>> KnowledgeStore::file_states(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, "SELECT id, file_path, checksum, mtime, size FROM entities "
                           "WHERE project_id = ?1 ORDER BY file_path");
  if (!stmt.ok()) {
    return common::Result<std::vector<FileState>>::failure(sqlite_error(read_db_, "file states"));
  }
  stmt.bind(1, project_id);
  std::vector<FileState> states;
  while (stmt.step() == SQLITE_ROW) {
    FileState state;
    state.id = sqlite3_column_int64(stmt.get(), 0);
    state.file_path = column_text(stmt.get(), 1);
    state.checksum = column_text(stmt.get(), 2);
    state.mtime = sqlite3_column_int64(stmt.get(), 3);
    state.size = sqlite3_column_int64(stmt.get(), 4);
    states.push_back(std::move(state));
  }
  return common::Result<std::vector<FileState>>::success(std::move(states));
}

common::Result<std::size_t> KnowledgeStore::count_entities(const ProjectId project_id) {
  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, "SELECT COUNT(*) FROM entities WHERE project_id = ?1");
  if (!stmt.ok()) {
    return common::Result<std::size_t>::failure(sqlite_error(read_db_, "count entities"));
  }
  stmt.bind(1, project_id);
  if (stmt.step() != SQLITE_ROW) {
    return common::Result<std::size_t>::failure(sqlite_error(read_db_, "count entities"));
  }
  return common::Result<std::size_t>::success(
      static_cast<std::size_t>(sqlite3_column_int64(stmt.get(), 0)));
}

common::Result<SearchPage> KnowledgeStore::search(const ProjectId project_id,
                                                  const SearchFilters &filters,
                                                  const Pagination &pagination) {
  const std::string text = common::trim(filters.text);
  const std::string fts_query = build_fts_query(text);

  if (fts_query.empty()) {
    std::string sql = std::string("SELECT ") + kEntityColumns +
                      ", 0.0, substr(e.body, 1, 160) FROM entities e WHERE e.project_id = ?";
    std::vector<Bind> binds{project_id};
    append_filters(sql, binds, filters);
    sql += " ORDER BY e.updated_at DESC, e.id DESC" + page_clause(pagination);

    std::lock_guard<std::mutex> lock(read_mutex_);
    Statement stmt(read_db_, sql);
    if (!stmt.ok()) {
      return common::Result<SearchPage>::failure(sqlite_error(read_db_, "search"));
    }
    stmt.bind_all(binds);
    std::vector<SearchResult> rows;
    while (stmt.step() == SQLITE_ROW) {
      rows.push_back(SearchResult{.entity = row_to_entity(stmt.get()),
                                  .score = 0.0,
                                  .snippet = column_text(stmt.get(), kEntityColumnCount + 1)});
    }
    return common::Result<SearchPage>::success(finish_page(std::move(rows), pagination));
  }

  // Weights: title, content, tags, permalink. Exact tag hits get a further boost.
  std::string sql = std::string("SELECT ") + kEntityColumns +
                    ", (-bm25(search_index, 10.0, 1.0, 5.0, 2.0)) + "
                    "(CASE WHEN e.tags LIKE ? ESCAPE '\\' THEN 5.0 ELSE 0.0 END) AS score, "
                    "snippet(search_index, 1, '', '', '...', 16) "
                    "FROM search_index JOIN entities e ON e.id = search_index.rowid "
                    "WHERE search_index MATCH ? AND e.project_id = ?";
  std::vector<Bind> binds{"%\"" + like_escape(text) + "\"%", fts_query, project_id};
  append_filters(sql, binds, filters);
  sql += " ORDER BY score DESC, e.id" + page_clause(pagination);

  std::vector<SearchResult> rows;
  bool fts_failed = false;
  {
    std::lock_guard<std::mutex> lock(read_mutex_);
    Statement stmt(read_db_, sql);
    if (!stmt.ok()) {
      fts_failed = true;
    } else {
      stmt.bind_all(binds);
      int rc = SQLITE_ROW;
      while ((rc = stmt.step()) == SQLITE_ROW) {
        rows.push_back(SearchResult{.entity = row_to_entity(stmt.get()),
                                    .score = sqlite3_column_double(stmt.get(), kEntityColumnCount),
                                    .snippet = column_text(stmt.get(), kEntityColumnCount + 1)});
      }
      fts_failed = rc != SQLITE_DONE;
    }
  }

  if (fts_failed || (rows.empty() && pagination.offset() == 0)) {
    return search_like(project_id, filters, pagination);
  }
  return common::Result<SearchPage>::success(finish_page(std::move(rows), pagination));
}

common::Result<SearchPage> KnowledgeStore::search_like(const ProjectId project_id,
                                                       const SearchFilters &filters,
                                                       const Pagination &pagination) {
  const std::string text = common::trim(filters.text);
  const std::string pattern = "%" + like_escape(text) + "%";

  std::string sql = std::string("SELECT ") + kEntityColumns +
                    ", (CASE WHEN e.title LIKE ?1 ESCAPE '\\' THEN 3.0 ELSE 0.0 END) + "
                    "(CASE WHEN e.tags LIKE ?1 ESCAPE '\\' THEN 2.0 ELSE 0.0 END) + "
                    "(CASE WHEN e.body LIKE ?1 ESCAPE '\\' THEN 1.0 ELSE 0.0 END) AS score, "
                    "substr(e.body, max(1, instr(lower(e.body), lower(?2)) - 40), 160) "
                    "FROM entities e WHERE e.project_id = ?3 AND (e.title LIKE ?1 ESCAPE '\\' "
                    "OR e.body LIKE ?1 ESCAPE '\\' OR e.tags LIKE ?1 ESCAPE '\\' "
                    "OR e.permalink LIKE ?1 ESCAPE '\\')";
  std::vector<Bind> binds{pattern, text, project_id};
  append_filters(sql, binds, filters);
  sql += " ORDER BY score DESC, e.updated_at DESC" + page_clause(pagination);

  std::lock_guard<std::mutex> lock(read_mutex_);
  Statement stmt(read_db_, sql);
  if (!stmt.ok()) {
    return common::Result<SearchPage>::failure(sqlite_error(read_db_, "search"));
  }
  stmt.bind_all(binds);
  std::vector<SearchResult> rows;
  while (stmt.step() == SQLITE_ROW) {
    rows.push_back(SearchResult{.entity = row_to_entity(stmt.get()),
                                .score = sqlite3_column_double(stmt.get(), kEntityColumnCount),
                                .snippet = column_text(stmt.get(), kEntityColumnCount + 1)});
  }
  return common::Result<SearchPage>::success(finish_page(std::move(rows), pagination));
}

} // namespace noteweave::store
