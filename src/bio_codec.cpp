#include "bio_codec.hpp"
#include "bio_hts.hpp"

#include "duckdb/common/string_util.hpp"

#include <zlib.h>
#include <zstd.h>

#include <cstring>

namespace duckdb {

// ---------------------------------------------------------------------------
// Codec names and inference
// ---------------------------------------------------------------------------

BioCompression CompressionFromString(const string &name, const string &func_name) {
	auto lname = StringUtil::Lower(name);
	if (lname == "auto" || lname == "infer") {
		return BioCompression::AUTO;
	}
	if (lname == "none" || lname == "uncompressed" || lname.empty()) {
		return BioCompression::NONE;
	}
	if (lname == "gzip" || lname == "gz") {
		return BioCompression::GZIP;
	}
	if (lname == "zstd" || lname == "zst") {
		return BioCompression::ZSTD;
	}
	if (lname == "bgzf" || lname == "bgzip" || lname == "bgz") {
		return BioCompression::BGZF;
	}
	throw InvalidInputException("%s: unsupported compression '%s' (expected none, gzip, zstd or bgzf)", func_name,
	                            name);
}

string CompressionToString(BioCompression compression) {
	switch (compression) {
	case BioCompression::AUTO:
		return "auto";
	case BioCompression::NONE:
		return "none";
	case BioCompression::GZIP:
		return "gzip";
	case BioCompression::ZSTD:
		return "zstd";
	case BioCompression::BGZF:
		return "bgzf";
	}
	throw InternalException("unknown BioCompression value");
}

BioCompression InferCompressionFromPath(const string &path) {
	auto lpath = StringUtil::Lower(path);
	if (StringUtil::EndsWith(lpath, ".bgz")) {
		return BioCompression::BGZF;
	}
	if (StringUtil::EndsWith(lpath, ".gz") || StringUtil::EndsWith(lpath, ".gzip")) {
		return BioCompression::GZIP;
	}
	if (StringUtil::EndsWith(lpath, ".zst") || StringUtil::EndsWith(lpath, ".zstd")) {
		return BioCompression::ZSTD;
	}
	return BioCompression::NONE;
}

string StripCompressionExtension(const string &path) {
	auto lpath = StringUtil::Lower(path);
	for (auto ext : {".gz", ".gzip", ".bgz", ".zst", ".zstd"}) {
		if (StringUtil::EndsWith(lpath, ext)) {
			return path.substr(0, path.size() - strlen(ext));
		}
	}
	return path;
}

// ---------------------------------------------------------------------------
// bgzf detection
// ---------------------------------------------------------------------------

bool IsBgzfFile(const string &path) {
	BgzfPtr fp(bgzf_open(path.c_str(), "r"));
	return fp && bgzf_compression(fp.get()) == bgzf;
}

// ---------------------------------------------------------------------------
// ByteStream
// ---------------------------------------------------------------------------

//! Uncompressed passthrough.
class PlainByteStream : public ByteStream {
public:
	PlainByteStream(unique_ptr<FileHandle> handle_p, const string &path_p)
	    : ByteStream(path_p), handle(std::move(handle_p)) {
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override {
		auto bytes = handle->Read(buffer, nr_bytes);
		return bytes < 0 ? 0 : static_cast<idx_t>(bytes);
	}

	BioCompression Compression() const override {
		return BioCompression::NONE;
	}

private:
	unique_ptr<FileHandle> handle;
};

//! Sequential gzip. Concatenated members are decoded back to back, which is
//! what makes bgzf files readable without an index.
class GzipByteStream : public ByteStream {
public:
	GzipByteStream(unique_ptr<FileHandle> handle_p, const string &path_p)
	    : ByteStream(path_p), handle(std::move(handle_p)), in_buffer(IN_BUFFER_SIZE) {
		std::memset(&zstream, 0, sizeof(zstream));
		if (inflateInit2(&zstream, 16 + MAX_WBITS) != Z_OK) {
			throw IOException("failed to initialize gzip decoder for '%s'", path);
		}
	}

	~GzipByteStream() override {
		inflateEnd(&zstream);
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override {
		if (finished || nr_bytes == 0) {
			return 0;
		}
		zstream.next_out = buffer;
		zstream.avail_out = static_cast<uInt>(nr_bytes);

		while (zstream.avail_out > 0) {
			if (zstream.avail_in == 0 && !input_eof) {
				FillInput();
			}
			if (zstream.avail_in == 0 && input_eof) {
				if (member_open) {
					throw IOException("gzip stream '%s' is truncated", path);
				}
				finished = true;
				break;
			}

			member_open = true;
			auto ret = inflate(&zstream, Z_NO_FLUSH);
			if (ret == Z_STREAM_END) {
				member_open = false;
				if (zstream.avail_in == 0 && !input_eof) {
					FillInput();
				}
				if (zstream.avail_in == 0 && input_eof) {
					finished = true;
					break;
				}
				// Next member of a multi-member file
				if (inflateReset(&zstream) != Z_OK) {
					throw IOException("failed to reset gzip decoder for '%s'", path);
				}
			} else if (ret == Z_BUF_ERROR) {
				if (zstream.avail_in == 0 && input_eof) {
					throw IOException("gzip stream '%s' is truncated", path);
				}
			} else if (ret != Z_OK) {
				throw IOException("gzip decompression failed for '%s': %s", path,
				                  zstream.msg ? string(zstream.msg) : string("unknown error"));
			}
		}
		return nr_bytes - zstream.avail_out;
	}

	BioCompression Compression() const override {
		return BioCompression::GZIP;
	}

private:
	static constexpr idx_t IN_BUFFER_SIZE = 1 << 16;

	void FillInput() {
		auto bytes = handle->Read(in_buffer.data(), IN_BUFFER_SIZE);
		if (bytes <= 0) {
			input_eof = true;
			zstream.avail_in = 0;
			return;
		}
		zstream.next_in = in_buffer.data();
		zstream.avail_in = static_cast<uInt>(bytes);
	}

	unique_ptr<FileHandle> handle;
	vector<Bytef> in_buffer;
	z_stream zstream;
	bool input_eof = false;
	bool member_open = false;
	bool finished = false;
};

//! Streaming zstd.
class ZstdByteStream : public ByteStream {
public:
	ZstdByteStream(unique_ptr<FileHandle> handle_p, const string &path_p)
	    : ByteStream(path_p), handle(std::move(handle_p)), in_buffer(ZSTD_DStreamInSize()) {
		dstream = ZSTD_createDStream();
		if (!dstream) {
			throw IOException("failed to create zstd decoder for '%s'", path);
		}
		auto ret = ZSTD_initDStream(dstream);
		if (ZSTD_isError(ret)) {
			ZSTD_freeDStream(dstream);
			throw IOException("failed to initialize zstd decoder for '%s': %s", path, ZSTD_getErrorName(ret));
		}
		input.src = in_buffer.data();
		input.size = 0;
		input.pos = 0;
	}

	~ZstdByteStream() override {
		ZSTD_freeDStream(dstream);
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override {
		ZSTD_outBuffer output {buffer, nr_bytes, 0};
		while (output.pos < output.size) {
			if (input.pos == input.size && !input_eof) {
				auto bytes = handle->Read(in_buffer.data(), in_buffer.size());
				if (bytes <= 0) {
					input_eof = true;
				} else {
					input.size = static_cast<size_t>(bytes);
					input.pos = 0;
				}
			}
			if (input.pos == input.size && input_eof) {
				if (last_hint != 0 && output.pos == 0) {
					throw IOException("zstd stream '%s' is truncated", path);
				}
				break;
			}
			last_hint = ZSTD_decompressStream(dstream, &output, &input);
			if (ZSTD_isError(last_hint)) {
				throw IOException("zstd decompression failed for '%s': %s", path, ZSTD_getErrorName(last_hint));
			}
		}
		return output.pos;
	}

	BioCompression Compression() const override {
		return BioCompression::ZSTD;
	}

private:
	unique_ptr<FileHandle> handle;
	vector<char> in_buffer;
	ZSTD_DStream *dstream = nullptr;
	ZSTD_inBuffer input;
	size_t last_hint = 0;
	bool input_eof = false;
};

//! Block gzip through htslib. htslib opens the path itself, so bgzf input
//! is not read through DuckDB's file system.
class BgzfByteStream : public ByteStream {
public:
	explicit BgzfByteStream(const string &path_p) : ByteStream(path_p) {
		fp.reset(bgzf_open(path.c_str(), "r"));
		if (!fp) {
			throw IOException("failed to open bgzf file '%s'", path);
		}
		if (bgzf_compression(fp.get()) != bgzf) {
			throw IOException("'%s' is not a valid bgzf file", path);
		}
	}

	idx_t Read(data_ptr_t buffer, idx_t nr_bytes) override {
		auto bytes = bgzf_read(fp.get(), buffer, nr_bytes);
		if (bytes < 0) {
			throw IOException("bgzf decompression failed for '%s'", path);
		}
		return static_cast<idx_t>(bytes);
	}

	BioCompression Compression() const override {
		return BioCompression::BGZF;
	}

private:
	BgzfPtr fp;
};

// ---------------------------------------------------------------------------
// Factory
// ---------------------------------------------------------------------------

unique_ptr<ByteStream> OpenByteStream(unique_ptr<FileHandle> handle, const string &path, BioCompression compression) {
	if (compression == BioCompression::AUTO) {
		compression = InferCompressionFromPath(path);
	}
	switch (compression) {
	case BioCompression::NONE:
		return make_uniq<PlainByteStream>(std::move(handle), path);
	case BioCompression::GZIP:
		return make_uniq<GzipByteStream>(std::move(handle), path);
	case BioCompression::ZSTD:
		return make_uniq<ZstdByteStream>(std::move(handle), path);
	case BioCompression::BGZF:
		// htslib reads bgzf by path
		handle.reset();
		return make_uniq<BgzfByteStream>(path);
	default:
		throw InternalException("OpenByteStream: unresolved compression for '%s'", path);
	}
}

unique_ptr<ByteStream> OpenByteStream(ClientContext &context, const string &path, BioCompression compression) {
	if (compression == BioCompression::AUTO) {
		compression = InferCompressionFromPath(path);
	}
	if (compression == BioCompression::BGZF) {
		return make_uniq<BgzfByteStream>(path);
	}
	auto &fs = FileSystem::GetFileSystem(context);
	auto handle = fs.OpenFile(path, FileFlags::FILE_FLAGS_READ);
	return OpenByteStream(std::move(handle), path, compression);
}

// ---------------------------------------------------------------------------
// In-memory inflate
// ---------------------------------------------------------------------------

string InflateZlibBuffer(const_data_ptr_t data, idx_t size, const string &what) {
	z_stream zs;
	memset(&zs, 0, sizeof(zs));
	if (inflateInit(&zs) != Z_OK) {
		throw InternalException("Failed to initialise zlib for %s", what);
	}
	zs.next_in = const_cast<Bytef *>(data);
	zs.avail_in = static_cast<uInt>(size);

	string result;
	char out[16384];
	int ret;
	do {
		zs.next_out = reinterpret_cast<Bytef *>(out);
		zs.avail_out = sizeof(out);
		ret = inflate(&zs, Z_NO_FLUSH);
		if (ret != Z_OK && ret != Z_STREAM_END) {
			inflateEnd(&zs);
			throw IOException("Corrupt zlib data in %s", what);
		}
		result.append(out, sizeof(out) - zs.avail_out);
		if (ret == Z_OK && zs.avail_in == 0 && zs.avail_out != 0) {
			inflateEnd(&zs);
			throw IOException("Truncated zlib data in %s", what);
		}
	} while (ret != Z_STREAM_END);
	inflateEnd(&zs);
	return result;
}

// ---------------------------------------------------------------------------
// BufferedByteReader
// ---------------------------------------------------------------------------

static constexpr idx_t READER_BUFFER_SIZE = 1 << 16;

BufferedByteReader::BufferedByteReader(unique_ptr<ByteStream> stream_p)
    : stream(std::move(stream_p)), buffer(READER_BUFFER_SIZE) {
}

bool BufferedByteReader::FillBuffer() {
	if (exhausted) {
		return false;
	}
	buffer_pos = 0;
	buffer_end = stream->Read(reinterpret_cast<data_ptr_t>(buffer.data()), buffer.size());
	if (buffer_end == 0) {
		exhausted = true;
		return false;
	}
	return true;
}

bool BufferedByteReader::ReadLine(string &line) {
	line.clear();
	bool read_any = false;
	while (true) {
		if (buffer_pos >= buffer_end && !FillBuffer()) {
			break;
		}
		read_any = true;
		auto start = buffer.data() + buffer_pos;
		auto newline = static_cast<const char *>(std::memchr(start, '\n', buffer_end - buffer_pos));
		if (newline) {
			line.append(start, newline - start);
			buffer_pos += (newline - start) + 1;
			if (!line.empty() && line.back() == '\r') {
				line.pop_back();
			}
			return true;
		}
		line.append(start, buffer_end - buffer_pos);
		buffer_pos = buffer_end;
	}
	if (!line.empty() && line.back() == '\r') {
		line.pop_back();
	}
	return read_any && !line.empty();
}

bool BufferedByteReader::PeekByte(char &c) {
	if (buffer_pos >= buffer_end && !FillBuffer()) {
		return false;
	}
	c = buffer[buffer_pos];
	return true;
}

idx_t BufferedByteReader::Read(data_ptr_t target, idx_t nr_bytes) {
	idx_t total = 0;
	while (total < nr_bytes) {
		if (buffer_pos >= buffer_end && !FillBuffer()) {
			break;
		}
		auto to_copy = MinValue<idx_t>(nr_bytes - total, buffer_end - buffer_pos);
		std::memcpy(target + total, buffer.data() + buffer_pos, to_copy);
		buffer_pos += to_copy;
		total += to_copy;
	}
	return total;
}

void BufferedByteReader::ReadExact(data_ptr_t target, idx_t nr_bytes, const char *what) {
	auto bytes = Read(target, nr_bytes);
	if (bytes != nr_bytes) {
		throw IOException("unexpected end of '%s' while reading %s (wanted %llu bytes, got %llu)", GetPath(), what,
		                  static_cast<unsigned long long>(nr_bytes), static_cast<unsigned long long>(bytes));
	}
}

string BufferedByteReader::ReadAll() {
	string result;
	if (buffer_pos < buffer_end) {
		result.append(buffer.data() + buffer_pos, buffer_end - buffer_pos);
		buffer_pos = buffer_end;
	}
	while (FillBuffer()) {
		result.append(buffer.data(), buffer_end);
		buffer_pos = buffer_end;
	}
	return result;
}

} // namespace duckdb
