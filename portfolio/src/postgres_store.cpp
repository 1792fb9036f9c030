#include "postgres_store.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

namespace {

// Timestamps cross the wire as epoch microseconds.
int64_t to_micros(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_micros(int64_t micros) {
    return std::chrono::system_clock::time_point(
        std::chrono::duration_cast<std::chrono::system_clock::duration>(std::chrono::microseconds(micros)));
}

const char* kTransactionColumns =
    "id, user_id, account_id, symbol, type, quantity::text, price_per_share::text, "
    "total_cost::text, transaction_date::text, "
    "(EXTRACT(EPOCH FROM created_at) * 1000000)::BIGINT, COALESCE(notes, '')";

Transaction transaction_from_row(const pqxx::row& row) {
    Transaction txn;
    txn.id = row[0].as<int64_t>();
    txn.user_id = row[1].as<int64_t>();
    if (!row[2].is_null()) txn.account_id = row[2].as<int64_t>();
    txn.symbol = row[3].as<std::string>();
    auto type = parse_transaction_type(row[4].as<std::string>());
    if (!type) {
        throw std::runtime_error("Unknown transaction type in row " + std::to_string(txn.id));
    }
    txn.type = *type;
    txn.quantity = Decimal::parse(row[5].as<std::string>());
    txn.price_per_share = Decimal::parse(row[6].as<std::string>());
    if (!row[7].is_null()) txn.total_cost = Decimal::parse(row[7].as<std::string>());
    txn.transaction_date = Date::parse(row[8].as<std::string>());
    txn.created_at = from_micros(row[9].as<int64_t>());
    txn.notes = row[10].as<std::string>();
    return txn;
}

} // namespace

PostgresStore::PostgresStore(const std::string& dsn) : dsn_(dsn) {
    spdlog::info("PostgresStore initialized: {}", util::redact_dsn(dsn));
}

pqxx::connection PostgresStore::make_connection() {
    return pqxx::connection(dsn_);
}

void PostgresStore::init_schema() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        // Ledger
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS stock_transactions (
                id BIGSERIAL PRIMARY KEY,
                user_id BIGINT NOT NULL,
                account_id BIGINT,
                symbol TEXT NOT NULL,
                type TEXT NOT NULL CHECK (type IN ('BUY','SELL')),
                quantity NUMERIC(20,8) NOT NULL CHECK (quantity > 0),
                price_per_share NUMERIC(20,8) NOT NULL CHECK (price_per_share > 0),
                total_cost NUMERIC(20,8),
                transaction_date DATE NOT NULL,
                created_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                notes TEXT
            )
        )");
        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS stock_transactions_user_date
                ON stock_transactions (user_id, transaction_date, created_at, id)
        )");
        txn.exec(R"(
            CREATE INDEX IF NOT EXISTS stock_transactions_account
                ON stock_transactions (account_id)
        )");

        // Derived holdings; holdings_state marks users whose set is current
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS holdings (
                user_id BIGINT NOT NULL,
                symbol TEXT NOT NULL,
                quantity NUMERIC(20,8) NOT NULL,
                average_cost_basis NUMERIC(20,8) NOT NULL,
                realized_gain NUMERIC(20,8) NOT NULL DEFAULT 0,
                last_recalculated_at TIMESTAMPTZ NOT NULL,
                UNIQUE (user_id, symbol)
            )
        )");
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS holdings_state (
                user_id BIGINT PRIMARY KEY,
                computed_at TIMESTAMPTZ NOT NULL
            )
        )");

        // Daily balances
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS account_balance_history (
                id BIGSERIAL PRIMARY KEY,
                user_id BIGINT NOT NULL,
                account_id BIGINT NOT NULL,
                date DATE NOT NULL,
                computed_balance NUMERIC(20,8) NOT NULL,
                source TEXT NOT NULL CHECK (source IN ('COMPUTED','BACKFILLED')),
                price_substituted BOOLEAN NOT NULL DEFAULT FALSE,
                recorded_at TIMESTAMPTZ NOT NULL DEFAULT NOW(),
                UNIQUE (user_id, account_id, date)
            )
        )");

        // Price cache mirror
        txn.exec(R"(
            CREATE TABLE IF NOT EXISTS current_stock_price (
                symbol TEXT PRIMARY KEY,
                price NUMERIC(20,8) NOT NULL,
                daily_change NUMERIC(20,8),
                daily_change_percent NUMERIC(20,8),
                company_name TEXT,
                fetched_at TIMESTAMPTZ NOT NULL,
                market_open_when_fetched BOOLEAN NOT NULL DEFAULT FALSE,
                stale BOOLEAN NOT NULL DEFAULT FALSE
            )
        )");

        txn.commit();
        spdlog::info("Database schema initialized");

    } catch (const std::exception& e) {
        spdlog::error("Failed to initialize schema: {}", e.what());
        throw;
    }
}

int64_t PostgresStore::insert_transaction(const Transaction& t) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        std::optional<std::string> total_cost;
        if (t.total_cost) total_cost = t.total_cost->to_string();

        auto result = txn.exec_params(
            "INSERT INTO stock_transactions "
            "(user_id, account_id, symbol, type, quantity, price_per_share, total_cost, "
            " transaction_date, created_at, notes) "
            "VALUES ($1, $2, $3, $4, $5::numeric, $6::numeric, $7::numeric, $8::date, "
            "        (TIMESTAMPTZ 'epoch' + $9::bigint * INTERVAL '1 microsecond'), $10) "
            "RETURNING id",
            t.user_id, t.account_id, t.symbol, to_string(t.type),
            t.quantity.to_string(), t.price_per_share.to_string(), total_cost,
            t.transaction_date.to_string(), to_micros(t.created_at), t.notes
        );

        txn.commit();
        return result[0][0].as<int64_t>();

    } catch (const std::exception& e) {
        spdlog::error("Failed to insert transaction: {}", e.what());
        throw;
    }
}

bool PostgresStore::update_transaction(const Transaction& t) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        std::optional<std::string> total_cost;
        if (t.total_cost) total_cost = t.total_cost->to_string();

        auto result = txn.exec_params(
            "UPDATE stock_transactions SET "
            "account_id = $2, symbol = $3, type = $4, quantity = $5::numeric, "
            "price_per_share = $6::numeric, total_cost = $7::numeric, "
            "transaction_date = $8::date, notes = $9 "
            "WHERE id = $1",
            t.id, t.account_id, t.symbol, to_string(t.type),
            t.quantity.to_string(), t.price_per_share.to_string(), total_cost,
            t.transaction_date.to_string(), t.notes
        );

        txn.commit();
        return result.affected_rows() > 0;

    } catch (const std::exception& e) {
        spdlog::error("Failed to update transaction {}: {}", t.id, e.what());
        throw;
    }
}

bool PostgresStore::delete_transaction(int64_t id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params("DELETE FROM stock_transactions WHERE id = $1", id);

        txn.commit();
        return result.affected_rows() > 0;

    } catch (const std::exception& e) {
        spdlog::error("Failed to delete transaction {}: {}", id, e.what());
        throw;
    }
}

std::vector<Transaction> PostgresStore::query_transactions(const std::string& where,
                                                           const std::vector<int64_t>& params) {
    std::vector<Transaction> txns;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        std::string sql = std::string("SELECT ") + kTransactionColumns +
                          " FROM stock_transactions " + where +
                          " ORDER BY transaction_date, created_at, id";

        pqxx::result result = params.empty() ? txn.exec(sql) : txn.exec_params(sql, params[0]);
        for (const auto& row : result) {
            txns.push_back(transaction_from_row(row));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load transactions: {}", e.what());
        throw;
    }

    return txns;
}

std::optional<Transaction> PostgresStore::find_transaction(int64_t id) {
    auto txns = query_transactions("WHERE id = $1", {id});
    if (txns.empty()) return std::nullopt;
    return txns.front();
}

std::vector<Transaction> PostgresStore::transactions_for_user(int64_t user_id) {
    return query_transactions("WHERE user_id = $1", {user_id});
}

std::vector<Transaction> PostgresStore::all_transactions() {
    return query_transactions("", {});
}

bool PostgresStore::account_used_by_other_user(int64_t account_id, int64_t user_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT 1 FROM stock_transactions WHERE account_id = $1 AND user_id <> $2 LIMIT 1",
            account_id, user_id
        );

        txn.commit();
        return !result.empty();

    } catch (const std::exception& e) {
        spdlog::error("Failed to check owner of account {}: {}", account_id, e.what());
        throw;
    }
}

void PostgresStore::replace_holdings(int64_t user_id, const std::vector<Holding>& holdings) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params("DELETE FROM holdings WHERE user_id = $1", user_id);

        for (const auto& h : holdings) {
            txn.exec_params(
                "INSERT INTO holdings "
                "(user_id, symbol, quantity, average_cost_basis, realized_gain, last_recalculated_at) "
                "VALUES ($1, $2, $3::numeric, $4::numeric, $5::numeric, "
                "        (TIMESTAMPTZ 'epoch' + $6::bigint * INTERVAL '1 microsecond'))",
                user_id, h.symbol, h.quantity.to_string(), h.average_cost_basis.to_string(),
                h.realized_gain.to_string(), to_micros(h.last_recalculated_at)
            );
        }

        txn.exec_params(
            "INSERT INTO holdings_state (user_id, computed_at) VALUES ($1, NOW()) "
            "ON CONFLICT (user_id) DO UPDATE SET computed_at = NOW()",
            user_id
        );

        txn.commit();
        spdlog::debug("Saved {} holdings for user {}", holdings.size(), user_id);

    } catch (const std::exception& e) {
        spdlog::error("Failed to replace holdings for user {}: {}", user_id, e.what());
        throw;
    }
}

std::optional<std::vector<Holding>> PostgresStore::holdings_for(int64_t user_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto state = txn.exec_params("SELECT 1 FROM holdings_state WHERE user_id = $1", user_id);
        if (state.empty()) {
            txn.commit();
            return std::nullopt;
        }

        auto result = txn.exec_params(
            "SELECT symbol, quantity::text, average_cost_basis::text, realized_gain::text, "
            "(EXTRACT(EPOCH FROM last_recalculated_at) * 1000000)::BIGINT "
            "FROM holdings WHERE user_id = $1 ORDER BY symbol",
            user_id
        );

        std::vector<Holding> holdings;
        for (const auto& row : result) {
            Holding h;
            h.user_id = user_id;
            h.symbol = row[0].as<std::string>();
            h.quantity = Decimal::parse(row[1].as<std::string>());
            h.average_cost_basis = Decimal::parse(row[2].as<std::string>());
            h.realized_gain = Decimal::parse(row[3].as<std::string>());
            h.last_recalculated_at = from_micros(row[4].as<int64_t>());
            holdings.push_back(h);
        }

        txn.commit();
        return holdings;

    } catch (const std::exception& e) {
        spdlog::error("Failed to load holdings for user {}: {}", user_id, e.what());
        throw;
    }
}

void PostgresStore::invalidate_holdings(int64_t user_id) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params("DELETE FROM holdings_state WHERE user_id = $1", user_id);
        txn.exec_params("DELETE FROM holdings WHERE user_id = $1", user_id);

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to invalidate holdings for user {}: {}", user_id, e.what());
        throw;
    }
}

int PostgresStore::write_day(const Date& date, const std::vector<BalanceHistoryRecord>& records,
                             bool overwrite) {
    if (records.empty()) return 0;

    const char* sql = overwrite
        ? "INSERT INTO account_balance_history "
          "(user_id, account_id, date, computed_balance, source, price_substituted, recorded_at) "
          "VALUES ($1, $2, $3::date, $4::numeric, $5, $6, (TIMESTAMPTZ 'epoch' + $7::bigint * INTERVAL '1 microsecond')) "
          "ON CONFLICT (user_id, account_id, date) DO UPDATE SET "
          "computed_balance = EXCLUDED.computed_balance, source = EXCLUDED.source, "
          "price_substituted = EXCLUDED.price_substituted, recorded_at = EXCLUDED.recorded_at"
        : "INSERT INTO account_balance_history "
          "(user_id, account_id, date, computed_balance, source, price_substituted, recorded_at) "
          "VALUES ($1, $2, $3::date, $4::numeric, $5, $6, (TIMESTAMPTZ 'epoch' + $7::bigint * INTERVAL '1 microsecond')) "
          "ON CONFLICT (user_id, account_id, date) DO NOTHING";

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        int written = 0;
        for (const auto& rec : records) {
            auto result = txn.exec_params(sql,
                rec.user_id, rec.account_id, date.to_string(), rec.computed_balance.to_string(),
                to_string(rec.source), rec.price_substituted, to_micros(rec.recorded_at));
            written += static_cast<int>(result.affected_rows());
        }

        txn.commit();
        return written;

    } catch (const std::exception& e) {
        spdlog::error("Failed to write balances for {}: {}", date.to_string(), e.what());
        throw;
    }
}

std::vector<BalanceHistoryRecord> PostgresStore::records_between(int64_t user_id,
                                                                 const Date& start, const Date& end) {
    std::vector<BalanceHistoryRecord> records;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT account_id, date::text, computed_balance::text, source, price_substituted, "
            "(EXTRACT(EPOCH FROM recorded_at) * 1000000)::BIGINT "
            "FROM account_balance_history "
            "WHERE user_id = $1 AND date BETWEEN $2::date AND $3::date "
            "ORDER BY date, account_id",
            user_id, start.to_string(), end.to_string()
        );

        for (const auto& row : result) {
            BalanceHistoryRecord rec;
            rec.user_id = user_id;
            rec.account_id = row[0].as<int64_t>();
            rec.date = Date::parse(row[1].as<std::string>());
            rec.computed_balance = Decimal::parse(row[2].as<std::string>());
            rec.source = parse_snapshot_source(row[3].as<std::string>()).value_or(SnapshotSource::COMPUTED);
            rec.price_substituted = row[4].as<bool>();
            rec.recorded_at = from_micros(row[5].as<int64_t>());
            records.push_back(rec);
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load balance history for user {}: {}", user_id, e.what());
        throw;
    }

    return records;
}

std::set<Date> PostgresStore::recorded_dates(const AccountKey& account, const Date& start, const Date& end) {
    std::set<Date> dates;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "SELECT date::text FROM account_balance_history "
            "WHERE user_id = $1 AND account_id = $2 AND date BETWEEN $3::date AND $4::date",
            account.user_id, account.account_id, start.to_string(), end.to_string()
        );

        for (const auto& row : result) {
            dates.insert(Date::parse(row[0].as<std::string>()));
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load recorded dates for account {} of user {}: {}",
                      account.account_id, account.user_id, e.what());
        throw;
    }

    return dates;
}

int PostgresStore::delete_from(const AccountKey& account, const Date& from) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec_params(
            "DELETE FROM account_balance_history "
            "WHERE user_id = $1 AND account_id = $2 AND date >= $3::date",
            account.user_id, account.account_id, from.to_string()
        );

        txn.commit();
        return static_cast<int>(result.affected_rows());

    } catch (const std::exception& e) {
        spdlog::error("Failed to delete balances for account {} of user {}: {}",
                      account.account_id, account.user_id, e.what());
        throw;
    }
}

void PostgresStore::save_price(const PriceCacheEntry& entry) {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        txn.exec_params(
            "INSERT INTO current_stock_price "
            "(symbol, price, daily_change, daily_change_percent, company_name, fetched_at, "
            " market_open_when_fetched, stale) "
            "VALUES ($1, $2::numeric, $3::numeric, $4::numeric, $5, "
            "        (TIMESTAMPTZ 'epoch' + $6::bigint * INTERVAL '1 microsecond'), $7, $8) "
            "ON CONFLICT (symbol) DO UPDATE SET "
            "price = EXCLUDED.price, daily_change = EXCLUDED.daily_change, "
            "daily_change_percent = EXCLUDED.daily_change_percent, "
            "company_name = EXCLUDED.company_name, fetched_at = EXCLUDED.fetched_at, "
            "market_open_when_fetched = EXCLUDED.market_open_when_fetched, stale = EXCLUDED.stale",
            entry.symbol, entry.price.to_string(), entry.daily_change.to_string(),
            entry.daily_change_percent.to_string(), entry.company_name, to_micros(entry.fetched_at),
            entry.market_open_when_fetched, entry.stale
        );

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to save price for {}: {}", entry.symbol, e.what());
        throw;
    }
}

std::vector<PriceCacheEntry> PostgresStore::load_prices() {
    std::vector<PriceCacheEntry> entries;

    try {
        auto conn = make_connection();
        pqxx::work txn(conn);

        auto result = txn.exec(
            "SELECT symbol, price::text, COALESCE(daily_change, 0)::text, "
            "COALESCE(daily_change_percent, 0)::text, COALESCE(company_name, ''), "
            "(EXTRACT(EPOCH FROM fetched_at) * 1000000)::BIGINT, market_open_when_fetched, stale "
            "FROM current_stock_price"
        );

        for (const auto& row : result) {
            PriceCacheEntry entry;
            entry.symbol = row[0].as<std::string>();
            entry.price = Decimal::parse(row[1].as<std::string>());
            entry.daily_change = Decimal::parse(row[2].as<std::string>());
            entry.daily_change_percent = Decimal::parse(row[3].as<std::string>());
            entry.company_name = row[4].as<std::string>();
            entry.fetched_at = from_micros(row[5].as<int64_t>());
            entry.market_open_when_fetched = row[6].as<bool>();
            entry.stale = row[7].as<bool>();
            entries.push_back(entry);
        }

        txn.commit();

    } catch (const std::exception& e) {
        spdlog::error("Failed to load mirrored prices: {}", e.what());
        throw;
    }

    return entries;
}

bool PostgresStore::ping() {
    try {
        auto conn = make_connection();
        pqxx::work txn(conn);
        txn.exec("SELECT 1");
        txn.commit();
        return true;
    } catch (const std::exception& e) {
        spdlog::error("Postgres ping failed: {}", e.what());
        return false;
    }
}
