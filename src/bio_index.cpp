#include "bio_index.hpp"

#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"

#include <cstring>

namespace duckdb {

hts_pos_t HtsRegionEnd(const GenomicInterval &region) {
	return region.end >= static_cast<int64_t>(HTS_POS_MAX) ? HTS_POS_MAX : static_cast<hts_pos_t>(region.end);
}

// ---------------------------------------------------------------------------
// TabixIndex
// ---------------------------------------------------------------------------

TabixIndex::TabixIndex(string index_path_p, TabixPtr tbx_p) : index_path(std::move(index_path_p)), tbx(std::move(tbx_p)) {
}

HtsIteratorPtr TabixIndex::Query(const GenomicInterval &region, const string &func_name) const {
	auto tid = tbx_name2id(tbx.get(), region.reference.c_str());
	if (tid < 0) {
		return nullptr;
	}
	HtsIteratorPtr itr(tbx_itr_queryi(tbx.get(), tid, region.start, HtsRegionEnd(region)));
	if (!itr) {
		throw IOException("%s: failed to query index '%s' for %s", func_name, index_path, region.reference);
	}
	return itr;
}

vector<string> TabixIndex::ReferenceNames() const {
	int count = 0;
	auto names = tbx_seqnames(tbx.get(), &count);
	vector<string> result;
	for (int i = 0; i < count; i++) {
		result.push_back(names[i]);
	}
	// The array is owned by the caller, the strings by the index
	free(names);
	return result;
}

unique_ptr<TabixIndex> LoadTabixIndex(const string &data_path, const string &index_path, const string &func_name) {
	TabixPtr tbx(tbx_index_load2(data_path.c_str(), index_path.c_str()));
	if (!tbx) {
		throw IOException("%s: failed to load tabix index '%s'", func_name, index_path);
	}
	return make_uniq<TabixIndex>(index_path, std::move(tbx));
}

// ---------------------------------------------------------------------------
// TabixRegionStream
// ---------------------------------------------------------------------------

TabixRegionStream::TabixRegionStream(const string &data_path, unique_ptr<TabixIndex> index_p,
                                     const GenomicInterval &region, const string &func_name_p)
    : ByteStream(data_path), index(std::move(index_p)), func_name(func_name_p) {
	fp = OpenHtsFile(path, func_name);
	if (hts_get_format(fp.get())->compression != bgzf) {
		throw InvalidInputException("%s: '%s' must be bgzf compressed to use index '%s'", func_name, path,
		                            index->GetPath());
	}
	itr = index->Query(region, func_name);
	finished = !itr;
}

bool TabixRegionStream::NextRecord() {
	auto ret = tbx_itr_next(fp.get(), index->Handle(), itr.get(), &line.value);
	if (ret == -1) {
		finished = true;
		return false;
	}
	if (ret < -1) {
		throw IOException("%s: failed to read indexed records from '%s'", func_name, path);
	}
	pending.assign(line.value.s, line.value.l);
	pending += '\n';
	pending_pos = 0;
	return true;
}

idx_t TabixRegionStream::Read(data_ptr_t buffer, idx_t nr_bytes) {
	idx_t total = 0;
	while (total < nr_bytes) {
		if (pending_pos >= pending.size() && (finished || !NextRecord())) {
			break;
		}
		auto to_copy = MinValue<idx_t>(nr_bytes - total, pending.size() - pending_pos);
		std::memcpy(buffer + total, pending.data() + pending_pos, to_copy);
		pending_pos += to_copy;
		total += to_copy;
	}
	return total;
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------

string FindTabixIndex(FileSystem &fs, const string &data_path) {
	return FindCompanionFile(fs, data_path, {".tbi", ".csi"});
}

string FindAlignmentIndex(FileSystem &fs, const string &data_path, BioFormat format) {
	if (format == BioFormat::CRAM) {
		return FindCompanionFile(fs, data_path, {".crai"});
	}
	auto index_path = FindCompanionFile(fs, data_path, {".bai", ".csi"});
	if (!index_path.empty()) {
		return index_path;
	}
	if (StringUtil::EndsWith(StringUtil::Lower(data_path), ".bam")) {
		auto replaced = ReplaceExtension(data_path, ".bai");
		if (fs.FileExists(replaced)) {
			return replaced;
		}
	}
	return string();
}

} // namespace duckdb
