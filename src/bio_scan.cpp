#include "bio_scan.hpp"
#include "bio_format.hpp"
#include "bio_index.hpp"
#include "alignment_reader.hpp"

#include "duckdb/common/error_data.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/limits.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/planner/expression/bound_columnref_expression.hpp"
#include "duckdb/planner/expression/bound_comparison_expression.hpp"
#include "duckdb/planner/expression/bound_constant_expression.hpp"
#include "duckdb/planner/expression/bound_function_expression.hpp"
#include "duckdb/planner/expression/bound_operator_expression.hpp"
#include "duckdb/planner/operator/list.hpp"

#include <mutex>

namespace duckdb {

// ---------------------------------------------------------------------------
// Table function data structures
// ---------------------------------------------------------------------------

struct BioScanBindData : public TableFunctionData {
	string func_name;
	BioFormat format = BioFormat::FASTA;
	BioFormatOptions options;
	BioHeaderInfo header;
	vector<SourceFile> files;
	vector<string> partition_columns;
	idx_t data_column_count = 0;

	//! Explicit region, or a hint recorded from a pushed-down filter
	RegionPredicate region;
	//! Indexed variants fail without an index instead of scanning sequentially
	bool require_index = false;

	//! Data columns holding the record reference and 1-based position, used
	//! to recognise region filters. INVALID_INDEX for non-positional formats.
	idx_t reference_column = DConstants::INVALID_INDEX;
	idx_t position_column = DConstants::INVALID_INDEX;

	idx_t batch_size = STANDARD_VECTOR_SIZE;
	idx_t max_parallel_files = 8;
};

struct BioScanGlobalState : public GlobalTableFunctionState {
	std::mutex lock;
	idx_t next_file = 0;
	idx_t max_threads = 1;

	//! Output columns filled by the decoder
	vector<BioProjectedColumn> data_projection;
	//! Output columns filled from the file's partition values
	vector<BioProjectedColumn> partition_projection;

	idx_t MaxThreads() const override {
		return max_threads;
	}
};

//! Each thread owns the decoder of the file it claimed; dropping the state
//! closes the file.
struct BioScanLocalState : public LocalTableFunctionState {
	unique_ptr<BioRecordDecoder> decoder;
	idx_t file_idx = 0;
};

// ---------------------------------------------------------------------------
// Settings
// ---------------------------------------------------------------------------

static bool GetBooleanSetting(ClientContext &context, const string &name, bool default_value) {
	Value value;
	if (context.TryGetCurrentSetting(name, value) && !value.IsNull()) {
		return value.GetValue<bool>();
	}
	return default_value;
}

static idx_t GetCountSetting(ClientContext &context, const string &name, idx_t default_value) {
	Value value;
	if (context.TryGetCurrentSetting(name, value) && !value.IsNull()) {
		return value.GetValue<uint64_t>();
	}
	return default_value;
}

// ---------------------------------------------------------------------------
// Bind
// ---------------------------------------------------------------------------

//! Formats whose records carry a genomic position.
static bool FormatHasPosition(BioFormat format) {
	switch (format) {
	case BioFormat::SAM:
	case BioFormat::BAM:
	case BioFormat::CRAM:
	case BioFormat::VCF:
	case BioFormat::BCF:
	case BioFormat::BED:
	case BioFormat::GFF:
	case BioFormat::GTF:
		return true;
	default:
		return false;
	}
}

static void PositionColumnNames(BioFormat format, string &reference, string &position) {
	switch (format) {
	case BioFormat::SAM:
	case BioFormat::BAM:
	case BioFormat::CRAM:
		reference = "reference";
		position = "start";
		break;
	case BioFormat::VCF:
	case BioFormat::BCF:
		reference = "chrom";
		position = "pos";
		break;
	case BioFormat::BED:
		reference = "reference_sequence_name";
		position = "start";
		break;
	case BioFormat::GFF:
	case BioFormat::GTF:
		reference = "seqname";
		position = "start";
		break;
	default:
		break;
	}
}

static idx_t FindColumn(const vector<string> &names, const string &name) {
	for (idx_t i = 0; i < names.size(); i++) {
		if (names[i] == name) {
			return i;
		}
	}
	return DConstants::INVALID_INDEX;
}

//! read_bio without `format :=` infers from the location, then from the
//! first file found below it.
static BioFormat InferReadBioFormat(ClientContext &context, const string &location, const LocationOptions &options,
                                    const string &func_name) {
	BioFormat format;
	if (TryInferFormatFromPath(location, format)) {
		return format;
	}
	auto files = ResolveLocation(context, location, options, func_name);
	for (auto &file : files) {
		if (TryInferFormatFromPath(file.path, format)) {
			return format;
		}
	}
	throw BinderException("%s: cannot infer the format of '%s', pass format := '...'", func_name, location);
}

//! The schema of content-dependent formats comes from the first file whose
//! header reads cleanly. Files skipped here still fail if the scan reaches
//! them, but partition pruning may drop them first.
static BioHeaderInfo SampleBioHeader(ClientContext &context, BioFormat format, const vector<SourceFile> &files,
                                     const string &func_name) {
	if (files.empty() || !FormatHasHeaderSchema(format)) {
		return BioHeaderInfo();
	}
	ErrorData first_error;
	for (auto &file : files) {
		try {
			return ReadBioHeader(context, format, file, func_name);
		} catch (IOException &ex) {
			DUCKDB_LOG_WARN(context, "%s: skipping the header of '%s' for the schema: %s", func_name, file.path,
			                ex.what());
			if (!first_error.HasError()) {
				first_error = ErrorData(ex);
			}
		} catch (InvalidInputException &ex) {
			DUCKDB_LOG_WARN(context, "%s: skipping the header of '%s' for the schema: %s", func_name, file.path,
			                ex.what());
			if (!first_error.HasError()) {
				first_error = ErrorData(ex);
			}
		}
	}
	first_error.Throw();
}

struct BioScanKind {
	//! True for read_bio, which takes the format from a parameter or extension
	bool dispatch = false;
	BioFormat format = BioFormat::FASTA;
	bool indexed = false;
};

static string ScanFunctionName(const BioScanKind &kind) {
	if (kind.dispatch) {
		return "read_bio";
	}
	return FormatName(kind.format) + (kind.indexed ? "_indexed_scan" : "_scan");
}

static unique_ptr<FunctionData> BioScanBindInternal(ClientContext &context, TableFunctionBindInput &input,
                                                    vector<LogicalType> &return_types, vector<string> &names,
                                                    const BioScanKind &kind) {
	auto bind_data = make_uniq<BioScanBindData>();
	bind_data->func_name = ScanFunctionName(kind);
	auto &func_name = bind_data->func_name;

	if (input.inputs.empty() || input.inputs[0].IsNull()) {
		throw BinderException("%s: location must not be NULL", func_name);
	}
	auto location = input.inputs[0].GetValue<string>();

	// --- Session settings, overridden below by named parameters ---
	bind_data->options.parse_vcf_info = GetBooleanSetting(context, "bioscan_parse_vcf_info", true);
	bind_data->options.parse_vcf_formats = GetBooleanSetting(context, "bioscan_parse_vcf_formats", true);
	bind_data->options.parse_sam_tags = GetBooleanSetting(context, "bioscan_parse_sam_tags", false);
	Value sequence_type;
	if (context.TryGetCurrentSetting("bioscan_fasta_sequence_data_type", sequence_type) && !sequence_type.IsNull()) {
		bind_data->options.fasta_sequence_type =
		    FastaSequenceDataTypeFromString(sequence_type.ToString(), func_name);
	}
	auto batch_size = GetCountSetting(context, "bioscan_batch_size", 2048);
	if (batch_size == 0) {
		throw InvalidInputException("%s: bioscan_batch_size must be at least 1", func_name);
	}
	bind_data->batch_size = MinValue<idx_t>(batch_size, STANDARD_VECTOR_SIZE);
	bind_data->max_parallel_files = MaxValue<idx_t>(GetCountSetting(context, "bioscan_max_parallel_files", 8), 1);

	LocationOptions location_options;
	string region_text;
	bool has_region = false;
	string format_name;

	if (kind.indexed) {
		if (input.inputs.size() > 1 && !input.inputs[1].IsNull()) {
			region_text = input.inputs[1].GetValue<string>();
			has_region = true;
		}
	} else if (input.inputs.size() > 1 && !input.inputs[1].IsNull()) {
		location_options.compression = CompressionFromString(input.inputs[1].GetValue<string>(), func_name);
	}

	for (auto &kv : input.named_parameters) {
		if (kv.second.IsNull()) {
			continue;
		}
		if (kv.first == "compression") {
			location_options.compression = CompressionFromString(kv.second.GetValue<string>(), func_name);
		} else if (kv.first == "partition_columns") {
			for (auto &child : ListValue::GetChildren(kv.second)) {
				location_options.partition_columns.push_back(child.ToString());
			}
		} else if (kv.first == "region") {
			region_text = kv.second.GetValue<string>();
			has_region = true;
		} else if (kv.first == "parse_info") {
			bind_data->options.parse_vcf_info = kv.second.GetValue<bool>();
		} else if (kv.first == "parse_formats") {
			bind_data->options.parse_vcf_formats = kv.second.GetValue<bool>();
		} else if (kv.first == "parse_tags") {
			bind_data->options.parse_sam_tags = kv.second.GetValue<bool>();
		} else if (kv.first == "format") {
			format_name = kv.second.GetValue<string>();
		} else if (kv.first == "sequence_data_type") {
			bind_data->options.fasta_sequence_type =
			    FastaSequenceDataTypeFromString(kv.second.GetValue<string>(), func_name);
		} else if (kv.first == "reference") {
			bind_data->options.cram_reference = kv.second.GetValue<string>();
		}
	}

	if (kind.indexed && (!has_region || region_text.empty())) {
		throw BinderException("%s: a non-empty region argument is required", func_name);
	}

	// --- Format ---
	if (kind.dispatch) {
		bind_data->format = format_name.empty() ? InferReadBioFormat(context, location, location_options, func_name)
		                                        : FormatFromName(format_name, func_name);
	} else {
		bind_data->format = kind.format;
	}
	auto format = bind_data->format;

	// --- Region ---
	if (has_region) {
		if (!FormatHasPosition(format)) {
			throw InvalidInputException("%s: region filtering is not supported for %s files", func_name,
			                            FormatName(format));
		}
		bind_data->region = ParseRegion(region_text, func_name);
	}
	bind_data->require_index = kind.indexed;

	// --- Files and schema ---
	location_options.extensions = FormatExtensions(format);
	bind_data->files = ResolveLocation(context, location, location_options, func_name);
	bind_data->partition_columns = location_options.partition_columns;
	bind_data->header = SampleBioHeader(context, format, bind_data->files, func_name);

	auto schema = ComputeBioSchema(format, bind_data->options, bind_data->header);
	if (schema.names.empty()) {
		throw BinderException("%s: cannot determine the columns of '%s' (no readable file)", func_name, location);
	}
	bind_data->data_column_count = schema.names.size();

	names = schema.names;
	return_types = schema.types;
	for (auto &column : bind_data->partition_columns) {
		if (FindColumn(names, column) != DConstants::INVALID_INDEX) {
			throw BinderException("%s: partition column '%s' duplicates a data column", func_name, column);
		}
		names.push_back(column);
		return_types.push_back(LogicalType::VARCHAR);
	}

	if (FormatHasPosition(format)) {
		string reference_name;
		string position_name;
		PositionColumnNames(format, reference_name, position_name);
		bind_data->reference_column = FindColumn(schema.names, reference_name);
		bind_data->position_column = FindColumn(schema.names, position_name);
	}

	return std::move(bind_data);
}

template <BioFormat FORMAT>
static unique_ptr<FunctionData> BioScanBind(ClientContext &context, TableFunctionBindInput &input,
                                            vector<LogicalType> &return_types, vector<string> &names) {
	BioScanKind kind;
	kind.format = FORMAT;
	return BioScanBindInternal(context, input, return_types, names, kind);
}

template <BioFormat FORMAT>
static unique_ptr<FunctionData> BioIndexedScanBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names) {
	BioScanKind kind;
	kind.format = FORMAT;
	kind.indexed = true;
	return BioScanBindInternal(context, input, return_types, names, kind);
}

static unique_ptr<FunctionData> ReadBioBind(ClientContext &context, TableFunctionBindInput &input,
                                            vector<LogicalType> &return_types, vector<string> &names) {
	BioScanKind kind;
	kind.dispatch = true;
	return BioScanBindInternal(context, input, return_types, names, kind);
}

// ---------------------------------------------------------------------------
// Filter pushdown: partition pruning and region hints
// ---------------------------------------------------------------------------

//! Resolve a column reference on this scan to its table column index.
static bool TryGetScanColumn(const Expression &expr, LogicalGet &get, idx_t &column_idx) {
	if (expr.expression_class != ExpressionClass::BOUND_COLUMN_REF) {
		return false;
	}
	auto &colref = expr.Cast<BoundColumnRefExpression>();
	if (colref.binding.table_index != get.table_index) {
		return false;
	}
	auto &column_ids = get.GetColumnIds();
	if (colref.binding.column_index >= column_ids.size()) {
		return false;
	}
	column_idx = column_ids[colref.binding.column_index].GetPrimaryIndex();
	return true;
}

static bool TryGetConstantString(const Expression &expr, string &result) {
	if (expr.expression_class != ExpressionClass::BOUND_CONSTANT) {
		return false;
	}
	auto &constant = expr.Cast<BoundConstantExpression>();
	if (constant.value.IsNull()) {
		return false;
	}
	result = constant.value.ToString();
	return true;
}

//! `col = 'constant'` in either operand order.
static bool TryGetColumnEquality(const Expression &expr, LogicalGet &get, idx_t &column_idx, string &value) {
	if (expr.expression_class != ExpressionClass::BOUND_COMPARISON || expr.type != ExpressionType::COMPARE_EQUAL) {
		return false;
	}
	auto &comp = expr.Cast<BoundComparisonExpression>();
	if (TryGetScanColumn(*comp.left, get, column_idx) && TryGetConstantString(*comp.right, value)) {
		return true;
	}
	return TryGetScanColumn(*comp.right, get, column_idx) && TryGetConstantString(*comp.left, value);
}

//! Partition filter `col = 'v'` or `col IN ('v1', 'v2')`: the accepted values
//! of one partition column.
static bool TryGetPartitionFilter(const Expression &expr, LogicalGet &get, const BioScanBindData &bind_data,
                                  idx_t &partition_idx, vector<string> &values) {
	idx_t column_idx;
	string value;
	if (TryGetColumnEquality(expr, get, column_idx, value)) {
		values.push_back(value);
	} else if (expr.expression_class == ExpressionClass::BOUND_OPERATOR &&
	           expr.type == ExpressionType::COMPARE_IN) {
		auto &op = expr.Cast<BoundOperatorExpression>();
		if (op.children.size() < 2 || !TryGetScanColumn(*op.children[0], get, column_idx)) {
			return false;
		}
		for (idx_t i = 1; i < op.children.size(); i++) {
			string value;
			if (!TryGetConstantString(*op.children[i], value)) {
				return false;
			}
			values.push_back(value);
		}
	} else {
		return false;
	}
	if (column_idx < bind_data.data_column_count ||
	    column_idx >= bind_data.data_column_count + bind_data.partition_columns.size()) {
		return false;
	}
	partition_idx = column_idx - bind_data.data_column_count;
	return true;
}

//! `region_match(ref_col, pos_col, 'chr:1-100')` or `ref_col = 'chr'` on the
//! format's own position columns.
static bool TryGetRegionHint(const Expression &expr, LogicalGet &get, const BioScanBindData &bind_data,
                             RegionPredicate &region) {
	if (bind_data.reference_column == DConstants::INVALID_INDEX) {
		return false;
	}
	idx_t column_idx;
	if (expr.expression_class == ExpressionClass::BOUND_FUNCTION) {
		auto &func = expr.Cast<BoundFunctionExpression>();
		if (func.function.name != "region_match" || func.children.size() != 3) {
			return false;
		}
		if (!TryGetScanColumn(*func.children[0], get, column_idx) || column_idx != bind_data.reference_column) {
			return false;
		}
		if (!TryGetScanColumn(*func.children[1], get, column_idx) || column_idx != bind_data.position_column) {
			return false;
		}
		string region_text;
		if (!TryGetConstantString(*func.children[2], region_text)) {
			return false;
		}
		region = ParseRegion(region_text, "region_match");
		return true;
	}
	// Unmapped reads keep a reference name without a position, so equality
	// on the reference column is not a safe hint for alignments
	if (bind_data.format == BioFormat::SAM || bind_data.format == BioFormat::BAM ||
	    bind_data.format == BioFormat::CRAM) {
		return false;
	}
	string reference;
	if (!TryGetColumnEquality(expr, get, column_idx, reference) || column_idx != bind_data.reference_column ||
	    reference.empty()) {
		return false;
	}
	region.active = true;
	region.interval.reference = reference;
	region.interval.start = 0;
	region.interval.end = NumericLimits<int64_t>::Maximum();
	return true;
}

static void BioScanPushdownComplexFilter(ClientContext &context, LogicalGet &get, FunctionData *bind_data_p,
                                         vector<unique_ptr<Expression>> &filters) {
	auto &bind_data = bind_data_p->Cast<BioScanBindData>();

	// Filters stay in the list: DuckDB still evaluates them after the scan
	for (auto &expr : filters) {
		idx_t partition_idx;
		vector<string> values;
		if (!bind_data.partition_columns.empty() &&
		    TryGetPartitionFilter(*expr, get, bind_data, partition_idx, values)) {
			auto before = bind_data.files.size();
			vector<SourceFile> kept;
			for (auto &file : bind_data.files) {
				auto &file_value = file.partition_values[partition_idx];
				for (auto &value : values) {
					if (file_value == value) {
						kept.push_back(file);
						break;
					}
				}
			}
			bind_data.files = std::move(kept);
			DUCKDB_LOG_DEBUG(context, "%s: filter on partition column '%s' kept %llu of %llu files",
			                 bind_data.func_name, bind_data.partition_columns[partition_idx],
			                 static_cast<unsigned long long>(bind_data.files.size()),
			                 static_cast<unsigned long long>(before));
			continue;
		}
		RegionPredicate hint;
		if (!bind_data.region.active && TryGetRegionHint(*expr, get, bind_data, hint)) {
			bind_data.region = hint;
			DUCKDB_LOG_DEBUG(context, "%s: using filter as region hint %s", bind_data.func_name, hint.ToString());
		}
	}
}

// ---------------------------------------------------------------------------
// Init
// ---------------------------------------------------------------------------

static unique_ptr<GlobalTableFunctionState> BioScanInitGlobal(ClientContext &context, TableFunctionInitInput &input) {
	auto &bind_data = input.bind_data->Cast<BioScanBindData>();
	auto state = make_uniq<BioScanGlobalState>();

	for (idx_t out_col = 0; out_col < input.column_ids.size(); out_col++) {
		auto column_id = input.column_ids[out_col];
		if (column_id == COLUMN_IDENTIFIER_ROW_ID) {
			continue;
		}
		BioProjectedColumn col;
		col.output_idx = out_col;
		if (column_id < bind_data.data_column_count) {
			col.column_idx = column_id;
			state->data_projection.push_back(col);
		} else {
			col.column_idx = column_id - bind_data.data_column_count;
			state->partition_projection.push_back(col);
		}
	}
	state->max_threads =
	    MaxValue<idx_t>(MinValue<idx_t>(bind_data.files.size(), bind_data.max_parallel_files), 1);
	return std::move(state);
}

static unique_ptr<LocalTableFunctionState> BioScanInitLocal(ExecutionContext &context, TableFunctionInitInput &input,
                                                            GlobalTableFunctionState *global_state) {
	return make_uniq<BioScanLocalState>();
}

// ---------------------------------------------------------------------------
// File opening
// ---------------------------------------------------------------------------

static string FindFileIndex(FileSystem &fs, BioFormat format, const string &path) {
	return format == BioFormat::VCF ? FindTabixIndex(fs, path) : FindAlignmentIndex(fs, path, format);
}

static string ExpectedIndexPath(BioFormat format, const string &path) {
	switch (format) {
	case BioFormat::VCF:
		return path + ".tbi";
	case BioFormat::CRAM:
		return path + ".crai";
	default:
		return path + ".bai";
	}
}

//! Open one source file, seeking to the region through an index when one is
//! available. Returns nullptr when the index shows the region has no data.
static unique_ptr<BioRecordDecoder> OpenSourceFile(ClientContext &context, const BioScanBindData &bind_data,
                                                   const SourceFile &file) {
	auto &fs = FileSystem::GetFileSystem(context);
	auto &func_name = bind_data.func_name;
	auto format = bind_data.format;
	DUCKDB_LOG_DEBUG(context, "%s: opening '%s' (%llu bytes)", func_name, file.path,
	                 static_cast<unsigned long long>(file.byte_length));

	bool use_index = bind_data.region.active && FormatSupportsIndex(format);
	if (use_index && format == BioFormat::VCF) {
		// Text VCF is only indexable as bgzf
		use_index = bind_data.require_index || file.compression == BioCompression::GZIP ||
		            file.compression == BioCompression::BGZF;
	}
	string index_path;
	if (use_index) {
		index_path = FindFileIndex(fs, format, file.path);
		if (index_path.empty()) {
			if (bind_data.require_index) {
				throw IOException("%s: index file '%s' not found", func_name, ExpectedIndexPath(format, file.path));
			}
			use_index = false;
		}
	}
	if (use_index && format == BioFormat::VCF && !IsBgzfFile(file.path)) {
		if (bind_data.require_index) {
			throw InvalidInputException("%s: '%s' must be bgzf compressed to use index '%s'", func_name, file.path,
			                            index_path);
		}
		use_index = false;
	}

	auto decoder = OpenBioDecoder(context, format, file, bind_data.options, bind_data.header);
	if (!use_index) {
		return decoder;
	}
	if (!decoder->SeekRegion(bind_data.region.interval, index_path)) {
		DUCKDB_LOG_DEBUG(context, "%s: index '%s' has no data for region %s, skipping '%s'", func_name, index_path,
		                 bind_data.region.ToString(), file.path);
		return nullptr;
	}
	DUCKDB_LOG_DEBUG(context, "%s: reading '%s' through index '%s' for region %s", func_name, file.path, index_path,
	                 bind_data.region.ToString());
	return decoder;
}

//! Claim the next unread file for this thread. Returns false when all files
//! have been handed out.
static bool ClaimNextFile(ClientContext &context, const BioScanBindData &bind_data, BioScanGlobalState &gstate,
                          BioScanLocalState &lstate) {
	while (true) {
		idx_t file_idx;
		{
			std::lock_guard<std::mutex> guard(gstate.lock);
			if (gstate.next_file >= bind_data.files.size()) {
				return false;
			}
			file_idx = gstate.next_file++;
		}
		auto decoder = OpenSourceFile(context, bind_data, bind_data.files[file_idx]);
		if (!decoder) {
			continue;
		}
		lstate.decoder = std::move(decoder);
		lstate.file_idx = file_idx;
		return true;
	}
}

// ---------------------------------------------------------------------------
// Scan function
// ---------------------------------------------------------------------------

//! Decode up to one batch from the current file. The batch ends early at the
//! end of the file.
static idx_t DecodeBatch(const BioScanBindData &bind_data, const BioScanGlobalState &gstate,
                         BioScanLocalState &lstate, DataChunk &output) {
	auto &decoder = *lstate.decoder;
	auto &file = bind_data.files[lstate.file_idx];
	auto &region = bind_data.region;
	idx_t row = 0;
	while (row < bind_data.batch_size) {
		if (!decoder.Advance()) {
			lstate.decoder.reset();
			break;
		}
		if (region.active) {
			GenomicInterval interval;
			if (!decoder.CurrentInterval(interval)) {
				continue;
			}
			if (!region.Matches(interval)) {
				continue;
			}
		}
		decoder.Emit(output, gstate.data_projection, row);
		for (auto &col : gstate.partition_projection) {
			SetStringValue(output.data[col.output_idx], row, file.partition_values[col.column_idx]);
		}
		row++;
	}
	return row;
}

static void BioScanFunction(ClientContext &context, TableFunctionInput &data_p, DataChunk &output) {
	auto &bind_data = data_p.bind_data->Cast<BioScanBindData>();
	auto &gstate = data_p.global_state->Cast<BioScanGlobalState>();
	auto &lstate = data_p.local_state->Cast<BioScanLocalState>();

	idx_t row_count = 0;
	// Files whose region selects nothing produce empty batches; move past them
	while (row_count == 0) {
		if (!lstate.decoder && !ClaimNextFile(context, bind_data, gstate, lstate)) {
			break;
		}
		row_count = DecodeBatch(bind_data, gstate, lstate, output);
	}
	output.SetCardinality(row_count);
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

static TableFunction MakeScanFunction(const string &name, vector<LogicalType> arguments, table_function_bind_t bind) {
	TableFunction function(name, std::move(arguments), BioScanFunction, bind, BioScanInitGlobal, BioScanInitLocal);
	function.projection_pushdown = true;
	function.pushdown_complex_filter = BioScanPushdownComplexFilter;
	function.named_parameters["compression"] = LogicalType::VARCHAR;
	function.named_parameters["partition_columns"] = LogicalType::LIST(LogicalType::VARCHAR);
	function.named_parameters["region"] = LogicalType::VARCHAR;
	function.named_parameters["parse_info"] = LogicalType::BOOLEAN;
	function.named_parameters["parse_formats"] = LogicalType::BOOLEAN;
	function.named_parameters["parse_tags"] = LogicalType::BOOLEAN;
	function.named_parameters["reference"] = LogicalType::VARCHAR;
	function.named_parameters["sequence_data_type"] = LogicalType::VARCHAR;
	return function;
}

static void RegisterFormatScan(ExtensionLoader &loader, BioFormat format, table_function_bind_t bind) {
	auto name = FormatName(format) + "_scan";
	TableFunctionSet set(name);
	set.AddFunction(MakeScanFunction(name, {LogicalType::VARCHAR}, bind));
	set.AddFunction(MakeScanFunction(name, {LogicalType::VARCHAR, LogicalType::VARCHAR}, bind));
	loader.RegisterFunction(set);
}

static void RegisterIndexedScan(ExtensionLoader &loader, BioFormat format, table_function_bind_t bind) {
	auto name = FormatName(format) + "_indexed_scan";
	TableFunctionSet set(name);
	// The one-argument form exists so a missing region is a clear bind error
	set.AddFunction(MakeScanFunction(name, {LogicalType::VARCHAR}, bind));
	set.AddFunction(MakeScanFunction(name, {LogicalType::VARCHAR, LogicalType::VARCHAR}, bind));
	loader.RegisterFunction(set);
}

void RegisterBioScanFunctions(ExtensionLoader &loader) {
	RegisterFormatScan(loader, BioFormat::FASTA, BioScanBind<BioFormat::FASTA>);
	RegisterFormatScan(loader, BioFormat::FASTQ, BioScanBind<BioFormat::FASTQ>);
	RegisterFormatScan(loader, BioFormat::SAM, BioScanBind<BioFormat::SAM>);
	RegisterFormatScan(loader, BioFormat::BAM, BioScanBind<BioFormat::BAM>);
	RegisterFormatScan(loader, BioFormat::CRAM, BioScanBind<BioFormat::CRAM>);
	RegisterFormatScan(loader, BioFormat::VCF, BioScanBind<BioFormat::VCF>);
	RegisterFormatScan(loader, BioFormat::BCF, BioScanBind<BioFormat::BCF>);
	RegisterFormatScan(loader, BioFormat::BED, BioScanBind<BioFormat::BED>);
	RegisterFormatScan(loader, BioFormat::GFF, BioScanBind<BioFormat::GFF>);
	RegisterFormatScan(loader, BioFormat::GTF, BioScanBind<BioFormat::GTF>);
	RegisterFormatScan(loader, BioFormat::GENBANK, BioScanBind<BioFormat::GENBANK>);
	RegisterFormatScan(loader, BioFormat::HMMDOMTAB, BioScanBind<BioFormat::HMMDOMTAB>);
	RegisterFormatScan(loader, BioFormat::MZML, BioScanBind<BioFormat::MZML>);
	RegisterFormatScan(loader, BioFormat::SDF, BioScanBind<BioFormat::SDF>);
	RegisterFormatScan(loader, BioFormat::FCS, BioScanBind<BioFormat::FCS>);

	RegisterIndexedScan(loader, BioFormat::VCF, BioIndexedScanBind<BioFormat::VCF>);
	RegisterIndexedScan(loader, BioFormat::BAM, BioIndexedScanBind<BioFormat::BAM>);
	RegisterIndexedScan(loader, BioFormat::CRAM, BioIndexedScanBind<BioFormat::CRAM>);

	auto read_bio = MakeScanFunction("read_bio", {LogicalType::VARCHAR}, ReadBioBind);
	read_bio.named_parameters["format"] = LogicalType::VARCHAR;
	loader.RegisterFunction(read_bio);
}

} // namespace duckdb
