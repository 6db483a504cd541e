#ifndef ROUNDWATCH_PERSISTENCE_SQLITE_ROUND_STORE_H_
#define ROUNDWATCH_PERSISTENCE_SQLITE_ROUND_STORE_H_

#include <memory>
#include <string>
#include <sqlite3.h>

#include "persistence/round_store.h"

namespace Roundwatch {

/**
 * SQLite backed round store.
 *
 * Schema: rounds(source, timestamp, score, total_win, total_players) with
 * CHECK score >= 1.0 and total_players >= 0; snapshots and earnings reference
 * rounds(id). The connection runs in WAL mode with foreign keys on and
 * checkpoints the WAL when closed.
 */
class SqliteRoundStore : public RoundStore {
public:
	/// Opens or creates the database, creating parent directories. ":memory:" works.
	/// Throws PersistenceError.
	explicit SqliteRoundStore(const std::string& path);
	~SqliteRoundStore();

	SqliteRoundStore(const SqliteRoundStore&) = delete;
	SqliteRoundStore& operator=(const SqliteRoundStore&) = delete;

	void BeginBatch() override;
	void CommitBatch() override;
	void AbortBatch() override;
	void WriteGroup(const std::string& source_id, const std::vector<RoundRecord>& records) override;
	void WriteOne(const RoundRecord& record) override;
	int64_t CountRounds(const std::string& source_id = "") override;
	void Close() override;

	int64_t CountSnapshots();
	int64_t CountEarnings();
	const std::string& path() const { return path_; }

private:
	using Statement = std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)>;

	void Exec(const std::string& sql);
	Statement Prepare(const char* sql);
	void InsertRecord(const RoundRecord& record);
	// Runs fn inside a savepoint, rolling it back if fn throws.
	template <typename Fn>
	void WithSavepoint(const char* name, Fn&& fn);
	int64_t QueryCount(const char* sql, const std::string* bind_text);
	void EnsureOpen() const;
	[[noreturn]] void Fail(const std::string& context) const;

	std::string path_;
	sqlite3* db_ = nullptr;
	Statement insert_round_;
	Statement insert_snapshot_;
	Statement insert_earnings_;
};

} // namespace Roundwatch

#endif // ROUNDWATCH_PERSISTENCE_SQLITE_ROUND_STORE_H_
