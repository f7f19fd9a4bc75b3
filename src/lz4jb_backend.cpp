#include <string.h>
#include "lz4jb.h"
#include "lz4jb_backend.h"

#include "lz4.h"
#include "lz4hc.h"


namespace {

#if defined(LZ4JB_DEFAULT_BACKEND_LZ4HC)
const Lz4JbBackend LZ4JB_BACKEND_DEFAULT = LZ4JB_BACKEND_LZ4HC;
#else
const Lz4JbBackend LZ4JB_BACKEND_DEFAULT = LZ4JB_BACKEND_LZ4;
#endif

struct BackendName {
	Lz4JbBackend backend;
	const char* name;
};

const BackendName backendNames[] = {
	  { LZ4JB_BACKEND_LZ4,		"lz4" }
	, { LZ4JB_BACKEND_LZ4HC,	"lz4hc" }
};

} // anonymous namespace


namespace Lz4Jb { namespace Backend {

int lz4Compress(const char* src, char* dst, int isize, int maxOutputSize, int compressionLevel) {
	const int acceleration = compressionLevel > 0 ? compressionLevel : 1;
	return LZ4_compress_fast(src, dst, isize, maxOutputSize, acceleration);
}

int lz4hcCompress(const char* src, char* dst, int isize, int maxOutputSize, int compressionLevel) {
	const int level = compressionLevel > 0 ? compressionLevel : LZ4HC_CLEVEL_DEFAULT;
	return LZ4_compress_HC(src, dst, isize, maxOutputSize, level);
}

int compressBound(int isize) {
	return LZ4_compressBound(isize);
}

int decompress(const char* src, char* dst, int isize, int maxOutputSize) {
	return LZ4_decompress_safe(src, dst, isize, maxOutputSize);
}

}} // namespace Backend, Lz4Jb


extern "C" Lz4JbResult
lz4jbSetBackend(Lz4JbContext* ctx, Lz4JbBackend backend)
{
	if(!ctx) {
		return LZ4JB_RESULT_BAD_ARG;
	}

	switch(backend) {
	case LZ4JB_BACKEND_LZ4:
		ctx->compress = Lz4Jb::Backend::lz4Compress;
		break;
	case LZ4JB_BACKEND_LZ4HC:
		ctx->compress = Lz4Jb::Backend::lz4hcCompress;
		break;
	default:
		return LZ4JB_RESULT_BAD_ARG;
	}

	ctx->backend		= backend;
	ctx->compressBound	= Lz4Jb::Backend::compressBound;
	ctx->decompress		= Lz4Jb::Backend::decompress;
	return LZ4JB_RESULT_OK;
}


extern "C" const char*
lz4jbBackendToString(Lz4JbBackend backend)
{
	for(const auto& e : backendNames) {
		if(e.backend == backend) {
			return e.name;
		}
	}
	return "???";
}


extern "C" int
lz4jbBackendFromString(const char* name, Lz4JbBackend* backend)
{
	if(!name || !backend) {
		return 0;
	}
	for(const auto& e : backendNames) {
		if(0 == strcmp(e.name, name)) {
			*backend = e.backend;
			return 1;
		}
	}
	return 0;
}


extern "C" Lz4JbContext
lz4jbInitContext()
{
	Lz4JbContext e = { LZ4JB_RESULT_OK, 0 };

	e.result			= LZ4JB_RESULT_OK;
	e.readCtx			= nullptr;
	e.read				= nullptr;
	e.writeCtx			= nullptr;
	e.write				= nullptr;
	e.compress			= nullptr;
	e.compressBound		= nullptr;
	e.decompress		= nullptr;
	e.compressionLevel	= 0;

	lz4jbSetBackend(&e, LZ4JB_BACKEND_DEFAULT);

	return e;
}
