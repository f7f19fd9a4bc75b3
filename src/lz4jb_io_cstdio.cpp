#include <sys/types.h>
#include <sys/stat.h>
#ifdef _WIN32
#include <io.h>
#include <fcntl.h>
#else
#include <unistd.h>
#endif

#include "lz4jb_io_cstdio.h"


namespace {

FILE* binaryMode(FILE* fp) {
#ifdef _WIN32
	(void) _setmode(_fileno(fp), _O_BINARY);
#endif
	return fp;
}

FILE* openFile(const std::string& filename, const char* mode) {
#if defined(_MSC_VER)
	FILE* fp = nullptr;
	return 0 == ::fopen_s(&fp, filename.c_str(), mode) ? fp : nullptr;
#else
	return ::fopen(filename.c_str(), mode);
#endif
}

// 0 on success, EOF when the stream could not be flushed or closed.
int release(FILE* fp) {
	if(!fp) {
		return 0;
	}
	if(stdin == fp) {
		return 0;
	}
	if(stdout == fp) {
		return ::fflush(fp);
	}
	return ::fclose(fp);
}

bool isConsole(FILE* fp) {
#if defined(_MSC_VER)
	return 0 != _isatty(_fileno(fp));
#else
	return 0 != isatty(fileno(fp));
#endif
}

bool isSeparator(char c) {
#ifdef _WIN32
	return '/' == c || '\\' == c;
#else
	return '/' == c;
#endif
}

} // anonymous namespace


namespace Lz4Jb { namespace Cstdio {

const std::string& stdinName() {
	static const std::string s = "stdin";
	return s;
}

const std::string& stdoutName() {
	static const std::string s = "stdout";
	return s;
}

const std::string& nullName() {
	static const std::string s = "null";
	return s;
}


Streams::Streams(Lz4JbContext* ctx)
	: ctx(ctx)
	, source(nullptr)
	, sink(nullptr)
{}


Streams::~Streams() {
	closeSource();
	closeSink();
}


bool Streams::openSource(const std::string& filename) {
	closeSource();
	source = (stdinName() == filename) ? binaryMode(stdin) : openFile(filename, "rb");
	if(!source) {
		return false;
	}
	ctx->readCtx = source;
	ctx->read = readFile;
	return true;
}


bool Streams::openSink(const std::string& filename) {
	closeSink();
	sink = (stdoutName() == filename) ? binaryMode(stdout) : openFile(filename, "wb");
	if(!sink) {
		return false;
	}
	ctx->writeCtx = sink;
	ctx->write = writeFile;
	return true;
}


void Streams::openNullSink() {
	closeSink();
	ctx->writeCtx = nullptr;
	ctx->write = writeNull;
}


void Streams::closeSource() {
	release(source);
	source = nullptr;
	ctx->readCtx = nullptr;
	ctx->read = nullptr;
}


bool Streams::closeSink() {
	const auto r = release(sink);
	sink = nullptr;
	ctx->writeCtx = nullptr;
	ctx->write = nullptr;
	return 0 == r;
}


int Streams::readFile(const Lz4JbContext* ctx, void* dst, int dstSize) {
	auto* fp = reinterpret_cast<FILE*>(ctx->readCtx);
	const auto n = ::fread(dst, 1, static_cast<size_t>(dstSize), fp);
	if(0 == n && ::ferror(fp)) {
		return -1;
	}
	return static_cast<int>(n);
}


int Streams::writeFile(const Lz4JbContext* ctx, const void* src, int srcSize) {
	auto* fp = reinterpret_cast<FILE*>(ctx->writeCtx);
	return static_cast<int>(::fwrite(src, 1, static_cast<size_t>(srcSize), fp));
}


int Streams::writeNull(const Lz4JbContext*, const void*, int srcSize) {
	return srcSize;
}


bool fileExists(const std::string& filename) {
	if(stdinName() == filename || stdoutName() == filename) {
		return false;
	}
	FILE* fp = openFile(filename, "rb");
	release(fp);
	return nullptr != fp;
}


uint64_t fileSize(const std::string& filename) {
#if defined(_MSC_VER)
	struct _stat64 s;
	if(0 != _stat64(filename.c_str(), &s) || (s.st_mode & _S_IFMT) != _S_IFREG) {
		return 0;
	}
#else
	struct stat s;
	if(0 != stat(filename.c_str(), &s) || !S_ISREG(s.st_mode)) {
		return 0;
	}
#endif
	return static_cast<uint64_t>(s.st_size);
}


bool removeFile(const std::string& filename) {
	return 0 == ::remove(filename.c_str());
}


bool isConsoleInput() {
	return isConsole(stdin);
}


bool isConsoleOutput() {
	return isConsole(stdout);
}


std::string compressedName(const std::string& filename, const std::string& extension) {
	return filename + "." + extension;
}


bool decompressedName(const std::string& filename, const std::string& extension, std::string* result) {
	size_t base = filename.size();
	while(base > 0 && !isSeparator(filename[base - 1])) {
		--base;
	}

	const auto suffix = "." + extension;
	const auto nameSize = filename.size() - base;
	if(nameSize <= suffix.size()
	   || 0 != filename.compare(filename.size() - suffix.size(), suffix.size(), suffix)
	) {
		return false;
	}

	*result = filename.substr(0, filename.size() - suffix.size());
	return true;
}

}} // namespace Cstdio, Lz4Jb
