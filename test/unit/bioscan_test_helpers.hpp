#pragma once

#include "catch2/catch.hpp"
#include "duckdb.hpp"
#include "duckdb/common/string_util.hpp"
#include "bioscan_extension.hpp"

namespace duckdb {

#define REQUIRE_NO_FAIL(result) REQUIRE_NO_QUERY_ERROR(*(result))
#define REQUIRE_FAIL(result)    REQUIRE((result)->HasError())

//! Report the query error text when a statement unexpectedly fails.
#define REQUIRE_NO_QUERY_ERROR(result)                                                                                \
	do {                                                                                                               \
		INFO(((result).HasError() ? (result).GetError() : string()));                                                  \
		REQUIRE(!(result).HasError());                                                                                 \
	} while (0)

//! Fixture files are generated into test/data by scripts/generate_test_data.py;
//! tests run with the repository root as working directory.
inline string TestDataPath(const string &relative) {
	return "test/data/" + relative;
}

//! In-memory database with the extension statically loaded.
class BioscanTestDatabase {
public:
	BioscanTestDatabase() : db(nullptr) {
		db.LoadStaticExtension<BioscanExtension>();
		con = make_uniq<Connection>(db);
	}

	unique_ptr<MaterializedResult> Query(const string &sql) {
		return con->Query(sql);
	}

	//! First value of the first row; the query must succeed.
	Value Scalar(const string &sql) {
		auto result = Query(sql);
		REQUIRE_NO_FAIL(result);
		REQUIRE(result->RowCount() > 0);
		return result->GetValue(0, 0);
	}

	int64_t Count(const string &sql) {
		return Scalar("SELECT COUNT(*) FROM (" + sql + ")").GetValue<int64_t>();
	}

	//! Run a statement that must fail and return its error type.
	ExceptionType ErrorType(const string &sql) {
		auto result = Query(sql);
		REQUIRE(result->HasError());
		return result->GetErrorType();
	}

	ClientContext &Context() {
		return *con->context;
	}

	DuckDB db;
	unique_ptr<Connection> con;
};

} // namespace duckdb
