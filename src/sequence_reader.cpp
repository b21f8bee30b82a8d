#include "sequence_reader.hpp"

#include "duckdb/common/string_util.hpp"

namespace duckdb {

// ---------------------------------------------------------------------------
// Definition lines
// ---------------------------------------------------------------------------

//! Split a '>' or '@' definition line into the identifier (up to the first
//! whitespace) and the optional description.
static void SplitDefinitionLine(const string &line, string &id, string &description, bool &has_description) {
	auto body = line.substr(1);
	auto ws = body.find_first_of(" \t");
	if (ws == string::npos) {
		id = body;
		description.clear();
		has_description = false;
		return;
	}
	id = body.substr(0, ws);
	description = TrimWhitespace(body.substr(ws + 1));
	has_description = !description.empty();
}

// ---------------------------------------------------------------------------
// FASTA
// ---------------------------------------------------------------------------

static bool IntegerEncoded(FastaSequenceDataType type) {
	return type == FastaSequenceDataType::INTEGER_ENCODE_DNA || type == FastaSequenceDataType::INTEGER_ENCODE_PROTEIN;
}

BioSchema FastaSchema(const BioFormatOptions &options) {
	BioSchema schema;
	schema.names = {"id", "description", "sequence"};
	schema.types = {LogicalType::VARCHAR, LogicalType::VARCHAR};
	schema.types.push_back(IntegerEncoded(options.fasta_sequence_type) ? LogicalType::LIST(LogicalType::TINYINT)
	                                                                   : LogicalType::VARCHAR);
	return schema;
}

static constexpr const char *DNA_ALPHABET = "ACGTN";
static constexpr const char *PROTEIN_ALPHABET = "ACDEFGHIKLMNPQRSTVWYXBZUO*";

//! 1-based position of the residue in `alphabet`, case-insensitive; 0 if absent.
static int8_t EncodeResidue(char residue, const char *alphabet) {
	auto upper = static_cast<char>(StringUtil::CharacterToUpper(residue));
	for (int8_t i = 0; alphabet[i]; i++) {
		if (alphabet[i] == upper) {
			return static_cast<int8_t>(i + 1);
		}
	}
	return 0;
}

class FastaDecoder : public BioStreamDecoder {
public:
	FastaDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::FASTA, std::move(stream), options, header) {
	}

	bool Advance() override {
		string line;
		// Find the next definition line, skipping blank lines
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (!TrimWhitespace(line).empty()) {
				break;
			}
		}
		record_ordinal++;
		if (line[0] != '>') {
			throw DecodeError("expected '>' at start of record, found '" + line.substr(0, 20) + "'");
		}
		SplitDefinitionLine(line, id, description, has_description);

		sequence.clear();
		char next;
		while (reader.PeekByte(next) && next != '>') {
			reader.ReadLine(line);
			sequence += TrimWhitespace(line);
		}
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case 0:
				SetStringValue(vec, row, id);
				break;
			case 1:
				if (has_description) {
					SetStringValue(vec, row, description);
				} else {
					FlatVector::SetNull(vec, row, true);
				}
				break;
			case 2:
				if (IntegerEncoded(options.fasta_sequence_type)) {
					SetTinyIntList(vec, row, EncodeSequence());
				} else {
					SetStringValue(vec, row, sequence);
				}
				break;
			default:
				throw InternalException("fasta_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	vector<int8_t> EncodeSequence() const {
		auto dna = options.fasta_sequence_type == FastaSequenceDataType::INTEGER_ENCODE_DNA;
		auto alphabet = dna ? DNA_ALPHABET : PROTEIN_ALPHABET;
		vector<int8_t> codes;
		codes.reserve(sequence.size());
		for (auto residue : sequence) {
			auto code = EncodeResidue(residue, alphabet);
			if (code == 0) {
				throw DecodeError(string("cannot encode '") + residue + "' as " + (dna ? "DNA" : "protein"));
			}
			codes.push_back(code);
		}
		return codes;
	}

	string id;
	string description;
	bool has_description = false;
	string sequence;
};

unique_ptr<BioRecordDecoder> CreateFastaDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                const BioHeaderInfo &bound_header) {
	return make_uniq<FastaDecoder>(std::move(stream), options, bound_header);
}

// ---------------------------------------------------------------------------
// FASTQ
// ---------------------------------------------------------------------------

BioSchema FastqSchema() {
	BioSchema schema;
	schema.names = {"name", "description", "sequence", "quality_scores"};
	schema.types = {LogicalType::VARCHAR, LogicalType::VARCHAR, LogicalType::VARCHAR,
	                LogicalType::LIST(LogicalType::INTEGER)};
	return schema;
}

class FastqDecoder : public BioStreamDecoder {
public:
	FastqDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options, const BioHeaderInfo &header)
	    : BioStreamDecoder(BioFormat::FASTQ, std::move(stream), options, header) {
	}

	bool Advance() override {
		string line;
		while (true) {
			if (!reader.ReadLine(line)) {
				return false;
			}
			if (!TrimWhitespace(line).empty()) {
				break;
			}
		}
		record_ordinal++;
		if (line[0] != '@') {
			throw DecodeError("expected '@' at start of record");
		}
		SplitDefinitionLine(line, name, description, has_description);

		if (!reader.ReadLine(sequence)) {
			throw DecodeError("truncated record, missing sequence line");
		}
		string separator;
		if (!reader.ReadLine(separator) || separator.empty() || separator[0] != '+') {
			throw DecodeError("missing '+' separator line");
		}
		if (!reader.ReadLine(quality)) {
			throw DecodeError("truncated record, missing quality line");
		}
		if (quality.size() != sequence.size()) {
			throw DecodeError("quality length " + std::to_string(quality.size()) +
			                  " does not match sequence length " + std::to_string(sequence.size()));
		}
		return true;
	}

	void Emit(DataChunk &output, const vector<BioProjectedColumn> &projection, idx_t row) override {
		for (auto &col : projection) {
			auto &vec = output.data[col.output_idx];
			switch (col.column_idx) {
			case 0:
				SetStringValue(vec, row, name);
				break;
			case 1:
				if (has_description) {
					SetStringValue(vec, row, description);
				} else {
					FlatVector::SetNull(vec, row, true);
				}
				break;
			case 2:
				SetStringValue(vec, row, sequence);
				break;
			case 3:
				SetIntegerList(vec, row, DecodePhred33(quality.data(), quality.size()));
				break;
			default:
				throw InternalException("fastq_scan: column index %llu out of range",
				                        static_cast<unsigned long long>(col.column_idx));
			}
		}
	}

private:
	string name;
	string description;
	bool has_description = false;
	string sequence;
	string quality;
};

unique_ptr<BioRecordDecoder> CreateFastqDecoder(unique_ptr<ByteStream> stream, const BioFormatOptions &options,
                                                const BioHeaderInfo &bound_header) {
	return make_uniq<FastqDecoder>(std::move(stream), options, bound_header);
}

} // namespace duckdb
