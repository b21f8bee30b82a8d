#include "bio_functions.hpp"
#include "bio_common.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/common/vector_operations/ternary_executor.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/execution/expression_executor.hpp"
#include "duckdb/function/scalar_function.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"

#include <algorithm>
#include <array>
#include <cmath>

namespace duckdb {

// ---------------------------------------------------------------------------
// List argument access
// ---------------------------------------------------------------------------

//! Unified view over a LIST(T) argument and its child vector.
template <class T>
struct ListArgument {
	ListArgument(Vector &vec, idx_t count) {
		vec.ToUnifiedFormat(count, list_format);
		auto &child = ListVector::GetEntry(vec);
		child.ToUnifiedFormat(ListVector::GetListSize(vec), child_format);
		entries = UnifiedVectorFormat::GetData<list_entry_t>(list_format);
		values = UnifiedVectorFormat::GetData<T>(child_format);
	}

	bool IsNull(idx_t row) const {
		return !list_format.validity.RowIsValid(list_format.sel->get_index(row));
	}

	const list_entry_t &Entry(idx_t row) const {
		return entries[list_format.sel->get_index(row)];
	}

	//! Child element `offset` of the list; false if the element is NULL.
	bool TryGet(idx_t offset, T &value) const {
		auto idx = child_format.sel->get_index(offset);
		if (!child_format.validity.RowIsValid(idx)) {
			return false;
		}
		value = values[idx];
		return true;
	}

	UnifiedVectorFormat list_format;
	UnifiedVectorFormat child_format;
	const list_entry_t *entries;
	const T *values;
};

//! Unified view over a scalar argument.
template <class T>
struct ScalarArgument {
	ScalarArgument(Vector &vec, idx_t count) {
		vec.ToUnifiedFormat(count, format);
		values = UnifiedVectorFormat::GetData<T>(format);
	}

	bool TryGet(idx_t row, T &value) const {
		auto idx = format.sel->get_index(row);
		if (!format.validity.RowIsValid(idx)) {
			return false;
		}
		value = values[idx];
		return true;
	}

	UnifiedVectorFormat format;
	const T *values;
};

static void FinishResult(DataChunk &args, Vector &result) {
	if (args.AllConstant()) {
		result.SetVectorType(VectorType::CONSTANT_VECTOR);
	}
}

// ---------------------------------------------------------------------------
// Quality scores
// ---------------------------------------------------------------------------

static void QualityScoresToListFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto count = args.size();
	ScalarArgument<string_t> input(args.data[0], count);
	result.SetVectorType(VectorType::FLAT_VECTOR);
	for (idx_t row = 0; row < count; row++) {
		string_t text;
		if (!input.TryGet(row, text)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		SetIntegerList(result, row, DecodePhred33(text.GetData(), text.GetSize()));
	}
	FinishResult(args, result);
}

static void QualityScoresToStringFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto count = args.size();
	ListArgument<int32_t> scores(args.data[0], count);
	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto result_data = FlatVector::GetData<string_t>(result);
	vector<int32_t> buffer;
	for (idx_t row = 0; row < count; row++) {
		if (scores.IsNull(row)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		auto &entry = scores.Entry(row);
		buffer.clear();
		for (idx_t i = 0; i < entry.length; i++) {
			int32_t score;
			if (!scores.TryGet(entry.offset + i, score)) {
				throw InvalidInputException("quality_scores_to_string: NULL quality score at position %llu",
				                            static_cast<unsigned long long>(i));
			}
			buffer.push_back(score);
		}
		result_data[row] = StringVector::AddString(result, EncodePhred33(buffer.data(), buffer.size()));
	}
	FinishResult(args, result);
}

// ---------------------------------------------------------------------------
// Mass spectrometry
// ---------------------------------------------------------------------------

static void ContainsPeakFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto count = args.size();
	ListArgument<double> mz(args.data[0], count);
	ScalarArgument<double> target(args.data[1], count);
	ScalarArgument<double> tolerance(args.data[2], count);
	result.SetVectorType(VectorType::FLAT_VECTOR);
	auto result_data = FlatVector::GetData<bool>(result);
	for (idx_t row = 0; row < count; row++) {
		double target_mz;
		double tolerance_mz;
		if (mz.IsNull(row) || !target.TryGet(row, target_mz) || !tolerance.TryGet(row, tolerance_mz)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		auto &entry = mz.Entry(row);
		bool found = false;
		for (idx_t i = 0; i < entry.length && !found; i++) {
			double value;
			if (mz.TryGet(entry.offset + i, value) && std::fabs(value - target_mz) <= tolerance_mz) {
				found = true;
			}
		}
		result_data[row] = found;
	}
	FinishResult(args, result);
}

//! Sum intensities into `bin_count` bins of width `bin_width` starting at
//! `min_mz`: bin i holds m/z in [min_mz + i * width, min_mz + (i + 1) * width).
//! Peaks outside every bin are dropped.
static vector<double> BinPeaks(const ListArgument<double> &mz, const ListArgument<double> &intensity, idx_t row,
                               double min_mz, int32_t bin_count, double bin_width) {
	auto &mz_entry = mz.Entry(row);
	auto &intensity_entry = intensity.Entry(row);
	if (mz_entry.length != intensity_entry.length) {
		throw InvalidInputException("bin_vectors: m/z list has %llu values but intensity list has %llu",
		                            static_cast<unsigned long long>(mz_entry.length),
		                            static_cast<unsigned long long>(intensity_entry.length));
	}
	vector<double> bins(static_cast<idx_t>(bin_count), 0.0);
	for (idx_t i = 0; i < mz_entry.length; i++) {
		double peak_mz;
		double peak_intensity;
		if (!mz.TryGet(mz_entry.offset + i, peak_mz) || !intensity.TryGet(intensity_entry.offset + i, peak_intensity)) {
			continue;
		}
		auto position = std::floor((peak_mz - min_mz) / bin_width);
		if (position < 0 || position >= static_cast<double>(bin_count)) {
			continue;
		}
		bins[static_cast<idx_t>(position)] += peak_intensity;
	}
	return bins;
}

static void BinVectorsFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto count = args.size();
	ListArgument<double> mz(args.data[0], count);
	ListArgument<double> intensity(args.data[1], count);
	ScalarArgument<double> min_mz(args.data[2], count);
	ScalarArgument<int32_t> bin_count(args.data[3], count);
	ScalarArgument<double> bin_width(args.data[4], count);
	result.SetVectorType(VectorType::FLAT_VECTOR);
	for (idx_t row = 0; row < count; row++) {
		double start;
		int32_t bins;
		double width;
		if (mz.IsNull(row) || intensity.IsNull(row) || !min_mz.TryGet(row, start) || !bin_count.TryGet(row, bins) ||
		    !bin_width.TryGet(row, width)) {
			FlatVector::SetNull(result, row, true);
			continue;
		}
		if (bins <= 0) {
			throw InvalidInputException("bin_vectors: bin count must be positive, got %d", bins);
		}
		if (!(width > 0)) {
			throw InvalidInputException("bin_vectors: bin width must be positive, got %f", width);
		}
		SetDoubleList(result, row, BinPeaks(mz, intensity, row, start, bins, width));
	}
	FinishResult(args, result);
}

// ---------------------------------------------------------------------------
// Region predicates
// ---------------------------------------------------------------------------

//! Constant region or interval argument, parsed once at bind time.
struct RegionFunctionData : public FunctionData {
	bool constant = false;
	RegionPredicate region;

	unique_ptr<FunctionData> Copy() const override {
		auto copy = make_uniq<RegionFunctionData>();
		copy->constant = constant;
		copy->region = region;
		return std::move(copy);
	}

	bool Equals(const FunctionData &other_p) const override {
		auto &other = other_p.Cast<RegionFunctionData>();
		return constant == other.constant && region.ToString() == other.region.ToString();
	}
};

//! Parse a constant argument at bind time so a malformed literal is a
//! BinderException before any row is read.
template <class PARSE>
static unique_ptr<FunctionData> BindConstantRegion(ClientContext &context, Expression &argument, PARSE parse) {
	auto data = make_uniq<RegionFunctionData>();
	if (argument.HasParameter() || !argument.IsFoldable()) {
		return std::move(data);
	}
	auto value = ExpressionExecutor::EvaluateScalar(context, argument);
	if (value.IsNull()) {
		return std::move(data);
	}
	try {
		data->region = parse(value.ToString());
	} catch (InvalidInputException &ex) {
		throw BinderException(ex.RawMessage());
	}
	data->constant = true;
	return std::move(data);
}

static RegionPredicate ParseRegionText(const string &text) {
	return ParseRegion(text, "region_match");
}

static RegionPredicate ParseIntervalText(const string &text) {
	RegionPredicate region;
	region.active = true;
	ParseIntervalRange(text, "interval_match", region.interval.start, region.interval.end);
	return region;
}

static unique_ptr<FunctionData> RegionMatchBind(ClientContext &context, ScalarFunction &bound_function,
                                                vector<unique_ptr<Expression>> &arguments) {
	return BindConstantRegion(context, *arguments[2], ParseRegionText);
}

static unique_ptr<FunctionData> IntervalMatchBind(ClientContext &context, ScalarFunction &bound_function,
                                                  vector<unique_ptr<Expression>> &arguments) {
	return BindConstantRegion(context, *arguments[1], ParseIntervalText);
}

//! `pos` is 1-based; the parsed interval is 0-based half-open.
static bool PositionInInterval(int64_t pos, const GenomicInterval &interval) {
	return pos - 1 >= interval.start && pos - 1 < interval.end;
}

static bool RegionContains(const RegionPredicate &region, const string_t &chrom, int64_t pos) {
	return chrom.GetString() == region.interval.reference && PositionInInterval(pos, region.interval);
}

static void RegionMatchFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &info = state.expr.Cast<BoundFunctionExpression>().bind_info->Cast<RegionFunctionData>();
	TernaryExecutor::Execute<string_t, int64_t, string_t, bool>(
	    args.data[0], args.data[1], args.data[2], result, args.size(),
	    [&](string_t chrom, int64_t pos, string_t region_text) {
		    if (info.constant) {
			    return RegionContains(info.region, chrom, pos);
		    }
		    return RegionContains(ParseRegionText(region_text.GetString()), chrom, pos);
	    });
}

static void IntervalMatchFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &info = state.expr.Cast<BoundFunctionExpression>().bind_info->Cast<RegionFunctionData>();
	BinaryExecutor::Execute<int64_t, string_t, bool>(
	    args.data[0], args.data[1], result, args.size(), [&](int64_t pos, string_t interval_text) {
		    if (info.constant) {
			    return PositionInInterval(pos, info.region.interval);
		    }
		    return PositionInInterval(pos, ParseIntervalText(interval_text.GetString()).interval);
	    });
}

static void ChromMatchFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	BinaryExecutor::Execute<string_t, string_t, bool>(args.data[0], args.data[1], result, args.size(),
	                                                  [&](string_t chrom, string_t expected) {
		                                                  return chrom == expected;
	                                                  });
}

// ---------------------------------------------------------------------------
// Sequence utilities
// ---------------------------------------------------------------------------

//! IUPAC nucleotide complement, preserving case. Returns 0 for other characters.
static char ComplementBase(char base) {
	switch (base) {
	case 'A':
		return 'T';
	case 'T':
	case 'U':
		return 'A';
	case 'G':
		return 'C';
	case 'C':
		return 'G';
	case 'R':
		return 'Y';
	case 'Y':
		return 'R';
	case 'K':
		return 'M';
	case 'M':
		return 'K';
	case 'B':
		return 'V';
	case 'V':
		return 'B';
	case 'D':
		return 'H';
	case 'H':
		return 'D';
	case 'S':
	case 'W':
	case 'N':
		return base;
	case '-':
	case '.':
		return base;
	default:
		break;
	}
	if (base >= 'a' && base <= 'z') {
		auto upper = ComplementBase(static_cast<char>(base - 'a' + 'A'));
		return upper == 0 ? 0 : static_cast<char>(upper - 'A' + 'a');
	}
	return 0;
}

static void ReverseComplementFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t sequence) {
		auto data = sequence.GetData();
		auto size = sequence.GetSize();
		string complement(size, '\0');
		for (idx_t i = 0; i < size; i++) {
			auto base = ComplementBase(data[size - 1 - i]);
			if (base == 0) {
				throw InvalidInputException("reverse_complement: invalid nucleotide '%c'", data[size - 1 - i]);
			}
			complement[i] = base;
		}
		return StringVector::AddString(result, complement);
	});
}

static void GcContentFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	UnaryExecutor::ExecuteWithNulls<string_t, double>(
	    args.data[0], result, args.size(), [&](string_t sequence, ValidityMask &mask, idx_t idx) {
		    auto data = sequence.GetData();
		    idx_t gc = 0;
		    idx_t total = 0;
		    for (idx_t i = 0; i < sequence.GetSize(); i++) {
			    auto c = data[i];
			    if (c == '-' || c == '.' || c == '*') {
				    continue;
			    }
			    total++;
			    if (c == 'G' || c == 'C' || c == 'g' || c == 'c' || c == 'S' || c == 's') {
				    gc++;
			    }
		    }
		    if (total == 0) {
			    mask.SetInvalid(idx);
			    return 0.0;
		    }
		    return static_cast<double>(gc) / static_cast<double>(total);
	    });
}

// ---------------------------------------------------------------------------
// Motif scoring
// ---------------------------------------------------------------------------

static constexpr double PSSM_PSEUDO_COUNT = 0.01;
static constexpr double PSSM_BACKGROUND = 0.25;

//! Position weights of a DNA motif, in A, C, G, T order per position.
struct PssmFunctionData : public FunctionData {
	string matrix_path;
	vector<std::array<double, 4>> weights;

	unique_ptr<FunctionData> Copy() const override {
		auto copy = make_uniq<PssmFunctionData>();
		copy->matrix_path = matrix_path;
		copy->weights = weights;
		return std::move(copy);
	}

	bool Equals(const FunctionData &other_p) const override {
		return matrix_path == other_p.Cast<PssmFunctionData>().matrix_path;
	}
};

static idx_t DnaBaseIndex(char base) {
	switch (base) {
	case 'A':
	case 'a':
		return 0;
	case 'C':
	case 'c':
		return 1;
	case 'G':
	case 'g':
		return 2;
	case 'T':
	case 't':
	case 'U':
	case 'u':
		return 3;
	default:
		return DConstants::INVALID_INDEX;
	}
}

//! Parse the first record of a JASPAR 2016 count matrix: a '>' title line
//! followed by one row per base, e.g. `A  [ 3 0 12 ]`.
static vector<vector<double>> ParseJasparCounts(const string &content, const string &path) {
	vector<vector<double>> rows(4);
	vector<bool> seen(4, false);
	bool in_record = false;
	for (auto &raw_line : SplitOn(content, '\n')) {
		auto line = TrimWhitespace(raw_line);
		if (line.empty()) {
			continue;
		}
		if (line[0] == '>') {
			if (in_record) {
				break;
			}
			in_record = true;
			continue;
		}
		auto base = DnaBaseIndex(line[0]);
		if (base == DConstants::INVALID_INDEX || seen[base]) {
			throw InvalidInputException("pssm_score: unexpected matrix row '%s' in '%s'", line, path);
		}
		seen[base] = true;
		auto values = line.substr(1);
		std::replace(values.begin(), values.end(), '[', ' ');
		std::replace(values.begin(), values.end(), ']', ' ');
		for (auto &field : SplitWhitespaceLine(values)) {
			double count;
			if (!TryParseDouble(field, count) || count < 0) {
				throw InvalidInputException("pssm_score: invalid count '%s' in '%s'", field, path);
			}
			rows[base].push_back(count);
		}
	}
	for (idx_t base = 0; base < 4; base++) {
		if (!seen[base]) {
			throw InvalidInputException("pssm_score: '%s' has no %c row", path, "ACGT"[base]);
		}
		if (rows[base].empty() || rows[base].size() != rows[0].size()) {
			throw InvalidInputException("pssm_score: matrix rows in '%s' differ in length", path);
		}
	}
	return rows;
}

//! log2 odds against a uniform background, after adding the pseudocount to
//! every count.
static vector<std::array<double, 4>> CountsToWeights(const vector<vector<double>> &rows) {
	vector<std::array<double, 4>> weights(rows[0].size());
	for (idx_t pos = 0; pos < weights.size(); pos++) {
		double total = 0;
		for (idx_t base = 0; base < 4; base++) {
			total += rows[base][pos] + PSSM_PSEUDO_COUNT;
		}
		for (idx_t base = 0; base < 4; base++) {
			auto frequency = (rows[base][pos] + PSSM_PSEUDO_COUNT) / total;
			weights[pos][base] = std::log2(frequency / PSSM_BACKGROUND);
		}
	}
	return weights;
}

static unique_ptr<FunctionData> PssmScoreBind(ClientContext &context, ScalarFunction &bound_function,
                                              vector<unique_ptr<Expression>> &arguments) {
	auto &argument = *arguments[1];
	if (argument.HasParameter() || !argument.IsFoldable()) {
		throw BinderException("pssm_score: the matrix path must be a constant");
	}
	auto value = ExpressionExecutor::EvaluateScalar(context, argument);
	if (value.IsNull()) {
		throw BinderException("pssm_score: the matrix path must not be NULL");
	}
	auto data = make_uniq<PssmFunctionData>();
	data->matrix_path = value.ToString();

	auto &fs = FileSystem::GetFileSystem(context);
	auto handle = fs.OpenFile(data->matrix_path, FileFlags::FILE_FLAGS_READ);
	auto size = handle->GetFileSize();
	string content(size, '\0');
	handle->Read((void *)content.data(), size);
	try {
		data->weights = CountsToWeights(ParseJasparCounts(content, data->matrix_path));
	} catch (InvalidInputException &ex) {
		throw BinderException(ex.RawMessage());
	}
	return std::move(data);
}

//! Score of the motif placed at the start of the sequence. N contributes 0.
static void PssmScoreFunction(DataChunk &args, ExpressionState &state, Vector &result) {
	auto &info = state.expr.Cast<BoundFunctionExpression>().bind_info->Cast<PssmFunctionData>();
	auto &weights = info.weights;
	BinaryExecutor::ExecuteWithNulls<string_t, string_t, float>(
	    args.data[0], args.data[1], result, args.size(),
	    [&](string_t sequence, string_t, ValidityMask &mask, idx_t idx) {
		    if (sequence.GetSize() < weights.size()) {
			    mask.SetInvalid(idx);
			    return 0.0f;
		    }
		    auto data = sequence.GetData();
		    double score = 0;
		    for (idx_t pos = 0; pos < weights.size(); pos++) {
			    auto c = data[pos];
			    if (c == 'N' || c == 'n') {
				    continue;
			    }
			    auto base = DnaBaseIndex(c);
			    if (base == DConstants::INVALID_INDEX) {
				    throw InvalidInputException("pssm_score: cannot score '%c' as DNA", c);
			    }
			    score += weights[pos][base];
		    }
		    return static_cast<float>(score);
	    });
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

void RegisterBioFunctions(ExtensionLoader &loader) {
	auto int_list = LogicalType::LIST(LogicalType::INTEGER);
	auto double_list = LogicalType::LIST(LogicalType::DOUBLE);

	loader.RegisterFunction(
	    ScalarFunction("quality_scores_to_list", {LogicalType::VARCHAR}, int_list, QualityScoresToListFunction));
	loader.RegisterFunction(
	    ScalarFunction("quality_scores_to_string", {int_list}, LogicalType::VARCHAR, QualityScoresToStringFunction));

	loader.RegisterFunction(ScalarFunction("contains_peak", {double_list, LogicalType::DOUBLE, LogicalType::DOUBLE},
	                                       LogicalType::BOOLEAN, ContainsPeakFunction));
	loader.RegisterFunction(ScalarFunction(
	    "bin_vectors", {double_list, double_list, LogicalType::DOUBLE, LogicalType::INTEGER, LogicalType::DOUBLE},
	    double_list, BinVectorsFunction));

	loader.RegisterFunction(ScalarFunction("region_match",
	                                       {LogicalType::VARCHAR, LogicalType::BIGINT, LogicalType::VARCHAR},
	                                       LogicalType::BOOLEAN, RegionMatchFunction, RegionMatchBind));
	loader.RegisterFunction(ScalarFunction("interval_match", {LogicalType::BIGINT, LogicalType::VARCHAR},
	                                       LogicalType::BOOLEAN, IntervalMatchFunction, IntervalMatchBind));
	loader.RegisterFunction(ScalarFunction("chrom_match", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                       LogicalType::BOOLEAN, ChromMatchFunction));

	loader.RegisterFunction(
	    ScalarFunction("reverse_complement", {LogicalType::VARCHAR}, LogicalType::VARCHAR, ReverseComplementFunction));
	loader.RegisterFunction(
	    ScalarFunction("gc_content", {LogicalType::VARCHAR}, LogicalType::DOUBLE, GcContentFunction));
	loader.RegisterFunction(ScalarFunction("pssm_score", {LogicalType::VARCHAR, LogicalType::VARCHAR},
	                                       LogicalType::FLOAT, PssmScoreFunction, PssmScoreBind));
}

} // namespace duckdb
