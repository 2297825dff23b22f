#include "prompt_db.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;

namespace {

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

PromptDb::PromptDb() = default;

PromptDb::~PromptDb() {
    close();
}

bool PromptDb::open(const std::string& path) {
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_prompt_sql =
        "INSERT INTO prompts (created_at, text) VALUES (?, ?)";
    const char* insert_run_sql =
        "INSERT INTO runs (prompt_id, command, window_name, created_at) VALUES (?, ?, ?, ?)";

    if (sqlite3_prepare_v2(db_, insert_prompt_sql, -1, &insert_prompt_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert prompt failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, insert_run_sql, -1, &insert_run_stmt_, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare insert run failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    return true;
}

void PromptDb::close() {
    if (insert_prompt_stmt_) { sqlite3_finalize(insert_prompt_stmt_); insert_prompt_stmt_ = nullptr; }
    if (insert_run_stmt_) { sqlite3_finalize(insert_run_stmt_); insert_run_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::expected<PromptRecord, std::string> PromptDb::save_prompt(const std::string& text) {
    if (!insert_prompt_stmt_) return std::unexpected("prompt database is not open");

    auto created_at = now_iso8601();
    sqlite3_reset(insert_prompt_stmt_);
    sqlite3_bind_text(insert_prompt_stmt_, 1, created_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_prompt_stmt_, 2, text.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(insert_prompt_stmt_) != SQLITE_DONE) {
        std::string err = sqlite3_errmsg(db_);
        std::println(stderr, "db: insert prompt failed: {}", err);
        return std::unexpected("insert prompt failed: " + err);
    }

    return PromptRecord{
        .id = sqlite3_last_insert_rowid(db_),
        .created_at = std::move(created_at),
        .text = text,
    };
}

std::expected<PromptRecord, std::string> PromptDb::update_prompt(int64_t id, const std::string& text) {
    if (!db_) return std::unexpected("prompt database is not open");

    auto existing = get_prompt(id);
    if (!existing) {
        return std::unexpected(std::format("Prompt with id {} not found", id));
    }

    auto stmt = prepare("UPDATE prompts SET text = ? WHERE id = ?");
    if (!stmt) return std::unexpected("prepare update failed");
    sqlite3_bind_text(stmt.get(), 1, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt.get(), 2, id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        std::string err = sqlite3_errmsg(db_);
        std::println(stderr, "db: update prompt failed: {}", err);
        return std::unexpected("update prompt failed: " + err);
    }

    existing->text = text;
    return *existing;
}

std::optional<PromptRecord> PromptDb::get_prompt(int64_t id) {
    auto stmt = prepare("SELECT id, created_at, text FROM prompts WHERE id = ?");
    if (!stmt) return std::nullopt;
    sqlite3_bind_int64(stmt.get(), 1, id);

    auto rows = query_prompts(stmt.get());
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::optional<PromptRecord> PromptDb::last_prompt() {
    auto rows = list_prompts(1);
    if (rows.empty()) return std::nullopt;
    return rows.front();
}

std::vector<PromptRecord> PromptDb::list_prompts(int limit) {
    auto stmt = prepare("SELECT id, created_at, text FROM prompts ORDER BY id DESC LIMIT ?");
    if (!stmt) return {};
    sqlite3_bind_int(stmt.get(), 1, limit);
    return query_prompts(stmt.get());
}

std::expected<RunRecord, std::string> PromptDb::log_run(int64_t prompt_id, const std::string& command,
                                                        const std::string& window_name) {
    if (!insert_run_stmt_) return std::unexpected("prompt database is not open");

    auto created_at = now_iso8601();
    sqlite3_reset(insert_run_stmt_);
    sqlite3_bind_int64(insert_run_stmt_, 1, prompt_id);
    sqlite3_bind_text(insert_run_stmt_, 2, command.c_str(), -1, SQLITE_TRANSIENT);
    if (window_name.empty()) sqlite3_bind_null(insert_run_stmt_, 3);
    else sqlite3_bind_text(insert_run_stmt_, 3, window_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_run_stmt_, 4, created_at.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(insert_run_stmt_) != SQLITE_DONE) {
        std::string err = sqlite3_errmsg(db_);
        std::println(stderr, "db: insert run failed: {}", err);
        return std::unexpected("insert run failed: " + err);
    }

    return RunRecord{
        .id = sqlite3_last_insert_rowid(db_),
        .prompt_id = prompt_id,
        .command = command,
        .window_name = window_name,
        .created_at = std::move(created_at),
    };
}

std::optional<RunRecord> PromptDb::last_run_for_prompt(int64_t prompt_id) {
    auto runs = list_runs_for_prompt(prompt_id, 1);
    if (runs.empty()) return std::nullopt;
    return runs.front();
}

std::vector<RunRecord> PromptDb::list_runs(int limit) {
    auto stmt = prepare(
        "SELECT id, prompt_id, command, window_name, created_at "
        "FROM runs ORDER BY id DESC LIMIT ?");
    if (!stmt) return {};
    sqlite3_bind_int(stmt.get(), 1, limit);
    return query_runs(stmt.get());
}

std::vector<RunRecord> PromptDb::list_runs_for_prompt(int64_t prompt_id, int limit) {
    auto stmt = prepare(
        "SELECT id, prompt_id, command, window_name, created_at "
        "FROM runs WHERE prompt_id = ? ORDER BY id DESC LIMIT ?");
    if (!stmt) return {};
    sqlite3_bind_int64(stmt.get(), 1, prompt_id);
    sqlite3_bind_int(stmt.get(), 2, limit);
    return query_runs(stmt.get());
}

std::string PromptDb::now_iso8601() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}

std::string PromptDb::local_time(const std::string& created_at, bool with_date) {
    std::tm tm{};
    if (std::sscanf(created_at.c_str(), "%d-%d-%dT%d:%d:%d",
                    &tm.tm_year, &tm.tm_mon, &tm.tm_mday,
                    &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return created_at;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;

    std::time_t t = ::timegm(&tm);
    std::tm local{};
    if (t == static_cast<std::time_t>(-1) || !::localtime_r(&t, &local)) return created_at;

    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), with_date ? "%Y-%m-%d %H:%M:%S" : "%H:%M:%S", &local);
    return n ? std::string(buf, n) : created_at;
}

PromptDb::Stmt PromptDb::prepare(const char* sql) {
    if (!db_) return nullptr;

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &raw, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        sqlite3_finalize(raw);
        return nullptr;
    }
    return Stmt(raw);
}

std::vector<PromptRecord> PromptDb::query_prompts(sqlite3_stmt* stmt) {
    std::vector<PromptRecord> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(PromptRecord{
            .id = sqlite3_column_int64(stmt, 0),
            .created_at = column_text(stmt, 1),
            .text = column_text(stmt, 2),
        });
    }
    return rows;
}

std::vector<RunRecord> PromptDb::query_runs(sqlite3_stmt* stmt) {
    std::vector<RunRecord> rows;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        rows.push_back(RunRecord{
            .id = sqlite3_column_int64(stmt, 0),
            .prompt_id = sqlite3_column_int64(stmt, 1),
            .command = column_text(stmt, 2),
            .window_name = column_text(stmt, 3),
            .created_at = column_text(stmt, 4),
        });
    }
    return rows;
}

bool PromptDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS prompts (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            created_at TEXT NOT NULL,
            text TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS runs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            prompt_id INTEGER NOT NULL,
            command TEXT NOT NULL,
            window_name TEXT,
            created_at TEXT NOT NULL,
            FOREIGN KEY(prompt_id) REFERENCES prompts(id)
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
