#include "sqlite_round_store.h"

#include <filesystem>
#include <glog/logging.h>

#include "common/errors.h"

namespace Roundwatch {

namespace fs = std::filesystem;

namespace {

constexpr char kSchema[] = R"SQL(
CREATE TABLE IF NOT EXISTS rounds (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    source TEXT NOT NULL,
    timestamp REAL NOT NULL,
    score REAL NOT NULL CHECK (score >= 1.0),
    total_win REAL NOT NULL DEFAULT 0,
    total_players INTEGER NOT NULL CHECK (total_players >= 0)
);
CREATE INDEX IF NOT EXISTS idx_rounds_source_timestamp ON rounds(source, timestamp);
CREATE TABLE IF NOT EXISTS snapshots (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    round_id INTEGER NOT NULL REFERENCES rounds(id) ON DELETE CASCADE,
    score REAL NOT NULL,
    players INTEGER NOT NULL,
    players_win REAL NOT NULL,
    timestamp REAL NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_snapshots_round ON snapshots(round_id);
CREATE TABLE IF NOT EXISTS earnings (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    round_id INTEGER NOT NULL REFERENCES rounds(id) ON DELETE CASCADE,
    stake REAL NOT NULL,
    auto_stop REAL NOT NULL,
    balance REAL NOT NULL
);
)SQL";

constexpr char kInsertRound[] =
	"INSERT INTO rounds (source, timestamp, score, total_win, total_players) VALUES (?, ?, ?, ?, ?)";
constexpr char kInsertSnapshot[] =
	"INSERT INTO snapshots (round_id, score, players, players_win, timestamp) VALUES (?, ?, ?, ?, ?)";
constexpr char kInsertEarnings[] =
	"INSERT INTO earnings (round_id, stake, auto_stop, balance) VALUES (?, ?, ?, ?)";

} // namespace

SqliteRoundStore::SqliteRoundStore(const std::string& path):
	path_(path),
	insert_round_(nullptr, &sqlite3_finalize),
	insert_snapshot_(nullptr, &sqlite3_finalize),
	insert_earnings_(nullptr, &sqlite3_finalize){
	if (path_ != ":memory:") {
		fs::path parent = fs::path(path_).parent_path();
		std::error_code ec;
		if (!parent.empty() && !fs::exists(parent, ec)) {
			fs::create_directories(parent, ec);
			if (ec) {
				throw PersistenceError("Cannot create " + parent.string() + ": " + ec.message());
			}
		}
	}

	if (sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr) != SQLITE_OK) {
		std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
		sqlite3_close(db_);
		db_ = nullptr;
		throw PersistenceError("Cannot open database " + path_ + ": " + message);
	}

	try {
		Exec("PRAGMA journal_mode=WAL");
		Exec("PRAGMA synchronous=NORMAL");
		Exec("PRAGMA foreign_keys=ON");
		Exec(kSchema);
		insert_round_ = Prepare(kInsertRound);
		insert_snapshot_ = Prepare(kInsertSnapshot);
		insert_earnings_ = Prepare(kInsertEarnings);
	} catch (const PersistenceError&) {
		Close();
		throw;
	}
	LOG(INFO) << "[SqliteRoundStore]: Opened " << path_;
}

SqliteRoundStore::~SqliteRoundStore() {
	Close();
}

void SqliteRoundStore::Close() {
	if (!db_) {
		return;
	}
	insert_round_.reset();
	insert_snapshot_.reset();
	insert_earnings_.reset();
	if (!sqlite3_get_autocommit(db_)) {
		LOG(WARNING) << "[SqliteRoundStore]: Closing with an open transaction, rolling back";
		sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
	}
	if (sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr) != SQLITE_OK) {
		LOG(WARNING) << "[SqliteRoundStore]: WAL checkpoint failed: " << sqlite3_errmsg(db_);
	}
	if (sqlite3_close(db_) != SQLITE_OK) {
		LOG(ERROR) << "[SqliteRoundStore]: Close failed: " << sqlite3_errmsg(db_);
	}
	db_ = nullptr;
	VLOG(1) << "[SqliteRoundStore]: Closed " << path_;
}

void SqliteRoundStore::BeginBatch() {
	EnsureOpen();
	Exec("BEGIN IMMEDIATE");
}

void SqliteRoundStore::CommitBatch() {
	EnsureOpen();
	Exec("COMMIT");
}

void SqliteRoundStore::AbortBatch() {
	if (!db_ || sqlite3_get_autocommit(db_)) {
		return;
	}
	if (sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
		LOG(ERROR) << "[SqliteRoundStore]: Rollback failed: " << sqlite3_errmsg(db_);
	}
}

template <typename Fn>
void SqliteRoundStore::WithSavepoint(const char* name, Fn&& fn) {
	std::string savepoint(name);
	Exec("SAVEPOINT " + savepoint);
	try {
		fn();
	} catch (const PersistenceError&) {
		sqlite3_reset(insert_round_.get());
		sqlite3_reset(insert_snapshot_.get());
		sqlite3_reset(insert_earnings_.get());
		sqlite3_exec(db_, ("ROLLBACK TO " + savepoint).c_str(), nullptr, nullptr, nullptr);
		sqlite3_exec(db_, ("RELEASE " + savepoint).c_str(), nullptr, nullptr, nullptr);
		throw;
	}
	Exec("RELEASE " + savepoint);
}

void SqliteRoundStore::WriteGroup(const std::string& source_id, const std::vector<RoundRecord>& records) {
	EnsureOpen();
	WithSavepoint("write_group", [&] {
		for (const auto& record : records) {
			if (record.source_id != source_id) {
				throw PersistenceError("Record of " + record.source_id + " in group " + source_id);
			}
			InsertRecord(record);
		}
	});
}

void SqliteRoundStore::WriteOne(const RoundRecord& record) {
	EnsureOpen();
	WithSavepoint("write_one", [&] { InsertRecord(record); });
}

void SqliteRoundStore::InsertRecord(const RoundRecord& record) {
	sqlite3_stmt* stmt = insert_round_.get();
	sqlite3_reset(stmt);
	sqlite3_clear_bindings(stmt);
	int col = 1;
	sqlite3_bind_text(stmt, col++, record.source_id.c_str(), -1, SQLITE_TRANSIENT);
	sqlite3_bind_double(stmt, col++, record.timestamp);
	sqlite3_bind_double(stmt, col++, record.final_score);
	sqlite3_bind_double(stmt, col++, record.total_win);
	sqlite3_bind_int64(stmt, col++, record.total_player_count);
	if (sqlite3_step(stmt) != SQLITE_DONE) {
		Fail("Insert round for " + record.source_id);
	}
	sqlite3_int64 round_id = sqlite3_last_insert_rowid(db_);

	stmt = insert_snapshot_.get();
	for (const auto& snapshot : record.snapshots) {
		sqlite3_reset(stmt);
		sqlite3_clear_bindings(stmt);
		col = 1;
		sqlite3_bind_int64(stmt, col++, round_id);
		sqlite3_bind_double(stmt, col++, snapshot.score);
		sqlite3_bind_int64(stmt, col++, snapshot.players);
		sqlite3_bind_double(stmt, col++, snapshot.players_win);
		sqlite3_bind_double(stmt, col++, snapshot.timestamp);
		if (sqlite3_step(stmt) != SQLITE_DONE) {
			Fail("Insert snapshot for " + record.source_id);
		}
	}

	stmt = insert_earnings_.get();
	sqlite3_reset(stmt);
	sqlite3_clear_bindings(stmt);
	col = 1;
	sqlite3_bind_int64(stmt, col++, round_id);
	sqlite3_bind_double(stmt, col++, record.earnings.stake);
	sqlite3_bind_double(stmt, col++, record.earnings.auto_stop);
	sqlite3_bind_double(stmt, col++, record.earnings.balance);
	if (sqlite3_step(stmt) != SQLITE_DONE) {
		Fail("Insert earnings for " + record.source_id);
	}
}

int64_t SqliteRoundStore::CountRounds(const std::string& source_id) {
	if (source_id.empty()) {
		return QueryCount("SELECT COUNT(*) FROM rounds", nullptr);
	}
	return QueryCount("SELECT COUNT(*) FROM rounds WHERE source = ?", &source_id);
}

int64_t SqliteRoundStore::CountSnapshots() {
	return QueryCount("SELECT COUNT(*) FROM snapshots", nullptr);
}

int64_t SqliteRoundStore::CountEarnings() {
	return QueryCount("SELECT COUNT(*) FROM earnings", nullptr);
}

int64_t SqliteRoundStore::QueryCount(const char* sql, const std::string* bind_text) {
	EnsureOpen();
	Statement stmt = Prepare(sql);
	if (bind_text) {
		sqlite3_bind_text(stmt.get(), 1, bind_text->c_str(), -1, SQLITE_TRANSIENT);
	}
	if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
		Fail(std::string("Query '") + sql + "'");
	}
	return sqlite3_column_int64(stmt.get(), 0);
}

void SqliteRoundStore::Exec(const std::string& sql) {
	char* err = nullptr;
	if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
		std::string message = err ? err : sqlite3_errmsg(db_);
		sqlite3_free(err);
		throw PersistenceError("'" + sql.substr(0, 40) + "' failed: " + message);
	}
}

SqliteRoundStore::Statement SqliteRoundStore::Prepare(const char* sql) {
	sqlite3_stmt* stmt = nullptr;
	if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
		Fail(std::string("Prepare '") + sql + "'");
	}
	return Statement(stmt, &sqlite3_finalize);
}

void SqliteRoundStore::EnsureOpen() const {
	if (!db_) {
		throw PersistenceError("Database " + path_ + " is closed");
	}
}

void SqliteRoundStore::Fail(const std::string& context) const {
	throw PersistenceError(context + " failed: " + sqlite3_errmsg(db_));
}

} // namespace Roundwatch
