#pragma once

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct PromptRecord {
    int64_t id = 0;
    std::string created_at; // ISO-8601 UTC, e.g. 2025-01-02T03:04:05.678Z
    std::string text;
};

struct RunRecord {
    int64_t id = 0;
    int64_t prompt_id = 0;
    std::string command;
    std::string window_name; // empty when unknown (NULL in the table)
    std::string created_at;
};

class PromptDb {
public:
    PromptDb();
    ~PromptDb();

    PromptDb(const PromptDb&) = delete;
    PromptDb& operator=(const PromptDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::expected<PromptRecord, std::string> save_prompt(const std::string& text);
    std::expected<PromptRecord, std::string> update_prompt(int64_t id, const std::string& text);
    std::optional<PromptRecord> get_prompt(int64_t id);
    std::optional<PromptRecord> last_prompt();
    std::vector<PromptRecord> list_prompts(int limit = 50);

    std::expected<RunRecord, std::string> log_run(int64_t prompt_id, const std::string& command,
                                                  const std::string& window_name);
    std::optional<RunRecord> last_run_for_prompt(int64_t prompt_id);
    std::vector<RunRecord> list_runs(int limit = 50);
    std::vector<RunRecord> list_runs_for_prompt(int64_t prompt_id, int limit = 20);

    // Current UTC time in the created_at format.
    static std::string now_iso8601();

    // created_at rendered in local time, "14:03:09" or "2025-01-02 14:03:09".
    // Unparseable input is returned unchanged.
    static std::string local_time(const std::string& created_at, bool with_date = false);

private:
    bool create_tables();

    struct StmtDeleter {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };
    using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

    Stmt prepare(const char* sql);
    std::vector<PromptRecord> query_prompts(sqlite3_stmt* stmt);
    std::vector<RunRecord> query_runs(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_prompt_stmt_ = nullptr;
    sqlite3_stmt* insert_run_stmt_ = nullptr;
};
