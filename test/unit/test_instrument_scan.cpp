#include "bioscan_test_helpers.hpp"

using namespace duckdb;

static vector<double> DoubleList(const Value &value) {
	vector<double> result;
	for (auto &child : ListValue::GetChildren(value)) {
		result.push_back(child.GetValue<double>());
	}
	return result;
}

TEST_CASE("mzml_scan decodes spectra and binary arrays", "[scan][mzml]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT id, \"index\", ms_level, mz, intensity, precursor_mz, precursor_charge, "
	                       "cardinality(cv_params) FROM mzml_scan('" +
	                       TestDataPath("mzml/test.mzML") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);

	// zlib-compressed 64-bit arrays
	REQUIRE(result->GetValue(0, 0) == Value("scan=1"));
	REQUIRE(result->GetValue(1, 0) == Value::INTEGER(0));
	REQUIRE(result->GetValue(2, 0) == Value::INTEGER(1));
	REQUIRE(DoubleList(result->GetValue(3, 0)) == vector<double>({100.0, 200.0, 300.5}));
	REQUIRE(DoubleList(result->GetValue(4, 0)) == vector<double>({10.0, 20.0, 30.0}));
	REQUIRE(result->GetValue(5, 0).IsNull());
	REQUIRE(result->GetValue(6, 0).IsNull());
	REQUIRE(result->GetValue(7, 0) == Value::UBIGINT(2));

	// Uncompressed 32-bit arrays and the first precursor
	REQUIRE(result->GetValue(0, 1) == Value("scan=2"));
	REQUIRE(result->GetValue(2, 1) == Value::INTEGER(2));
	REQUIRE(DoubleList(result->GetValue(3, 1)) == vector<double>({50.5, 75.25}));
	REQUIRE(DoubleList(result->GetValue(4, 1)) == vector<double>({1.5, 2.5}));
	REQUIRE(result->GetValue(5, 1) == Value::DOUBLE(445.34));
	REQUIRE(result->GetValue(6, 1) == Value::INTEGER(2));
	REQUIRE(result->GetValue(7, 1) == Value::UBIGINT(1));
}

TEST_CASE("mzml_scan feeds the peak functions", "[scan][mzml]") {
	BioscanTestDatabase db;
	auto path = TestDataPath("mzml/test.mzML");
	REQUIRE(db.Scalar("SELECT id FROM mzml_scan('" + path + "') WHERE contains_peak(mz, 200.004, 0.01)") ==
	        Value("scan=1"));
	REQUIRE(db.Count("SELECT * FROM mzml_scan('" + path + "') WHERE contains_peak(mz, 200.5, 0.01)") == 0);
	auto binned = db.Scalar("SELECT bin_vectors(mz, intensity, 100.0, 3, 100.0) FROM mzml_scan('" + path +
	                        "') WHERE ms_level = 1");
	REQUIRE(DoubleList(binned) == vector<double>({10.0, 20.0, 30.0}));
}

TEST_CASE("sdf_scan collects data fields into a struct", "[scan][sdf]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT header, atom_count, bond_count, data.MolWeight, data.Notes FROM sdf_scan('" +
	                       TestDataPath("sdf/test.sdf") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->GetValue(0, 0) == Value("Methane"));
	REQUIRE(result->GetValue(1, 0) == Value::INTEGER(1));
	REQUIRE(result->GetValue(2, 0) == Value::INTEGER(0));
	REQUIRE(result->GetValue(3, 0) == Value("16.04"));
	REQUIRE(result->GetValue(4, 0) == Value("first line\nsecond line"));

	REQUIRE(result->GetValue(1, 1) == Value::INTEGER(2));
	REQUIRE(result->GetValue(2, 1) == Value::INTEGER(1));
	REQUIRE(result->GetValue(3, 1) == Value("30.03"));
	REQUIRE(result->GetValue(4, 1).IsNull());
}

TEST_CASE("fcs_scan exposes one column per parameter", "[scan][fcs]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT * FROM fcs_scan('" + TestDataPath("fcs/test.fcs") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->ColumnCount() == 3);
	REQUIRE(result->names[0] == "FSC-A");
	REQUIRE(result->names[2] == "FL1-A");
	REQUIRE(result->types[0] == LogicalType::FLOAT);
	REQUIRE(result->RowCount() == 4);
	REQUIRE(result->GetValue(0, 0) == Value::FLOAT(1.5f));
	REQUIRE(result->GetValue(2, 3) == Value::FLOAT(300.0f));

	REQUIRE(db.Scalar("SELECT SUM(\"SSC-A\") FROM fcs_scan('" + TestDataPath("fcs/test.fcs") + "')") ==
	        Value::DOUBLE(223.0));
}

TEST_CASE("fcs_scan decodes big-endian integer data", "[scan][fcs]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT \"FSC-H\", \"Time\" FROM fcs_scan('" + TestDataPath("fcs_int/events.fcs") + "')");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 2);
	REQUIRE(result->types[0] == LogicalType::INTEGER);
	REQUIRE(result->GetValue(0, 0) == Value::INTEGER(1));
	REQUIRE(result->GetValue(1, 0) == Value::INTEGER(1000));
	// 16-bit values are unsigned
	REQUIRE(result->GetValue(0, 1) == Value::INTEGER(65535));
	REQUIRE(result->GetValue(1, 1) == Value::INTEGER(2000));
}

TEST_CASE("fcs_scan rejects non-FCS input", "[scan][fcs]") {
	BioscanTestDatabase db;
	REQUIRE(db.ErrorType("SELECT * FROM fcs_scan('" + TestDataPath("sdf/test.sdf") + "')") ==
	        ExceptionType::INVALID_INPUT);
}

TEST_CASE("fcs_scan rejects an event count larger than the DATA segment", "[scan][fcs]") {
	BioscanTestDatabase db;
	auto result = db.Query("SELECT * FROM fcs_scan('" + TestDataPath("fcs_bad/overflow.fcs") + "')");
	REQUIRE_FAIL(result);
	REQUIRE(result->GetErrorType() == ExceptionType::INVALID_INPUT);
	REQUIRE(StringUtil::Contains(result->GetError(), "shorter than"));
}

TEST_CASE("mzml_scan splits spectra that share one line", "[scan][mzml]") {
	BioscanTestDatabase db;
	auto scan = "mzml_scan('" + TestDataPath("mzml_oneline/spectra.mzML") + "')";
	REQUIRE(db.Count("SELECT * FROM " + scan) == 50);
	auto result = db.Query("SELECT id, mz[1], intensity[1] FROM " + scan + " WHERE \"index\" = 49");
	REQUIRE_NO_FAIL(result);
	REQUIRE(result->RowCount() == 1);
	REQUIRE(result->GetValue(0, 0) == Value("scan=50"));
	REQUIRE(result->GetValue(1, 0) == Value::DOUBLE(149.0));
	REQUIRE(result->GetValue(2, 0) == Value::DOUBLE(49.0));
}
