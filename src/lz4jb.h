#ifndef LZ4JB_H
#define LZ4JB_H

#include <stdint.h>
#include <stddef.h>

#if defined(__cplusplus)
extern "C" {
#endif


#define LZ4JB_BLOCK_SIZE_MIN		64
#define LZ4JB_BLOCK_SIZE_MAX		(1 << 25)
#define LZ4JB_BLOCK_SIZE_DEFAULT	(1 << 16)


struct Lz4JbContext;

typedef int (*Lz4JbRead)(
	  const struct Lz4JbContext* ctx
	, void* dst
	, int dstSize
);

typedef int (*Lz4JbWrite)(
	  const struct Lz4JbContext* ctx
	, const void* src
	, int srcSize
);

typedef int (*Lz4JbCompress)(
	  const char* src
	, char* dst
	, int isize
	, int maxOutputSize
	, int compressionLevel
);

typedef int (*Lz4JbCompressBound)(
	  int isize
);

typedef int (*Lz4JbDecompress)(
	  const char* src
	, char* dst
	, int isize
	, int maxOutputSize
);


enum Lz4JbBackend {
	  LZ4JB_BACKEND_LZ4		= 0
	, LZ4JB_BACKEND_LZ4HC
};
typedef enum Lz4JbBackend Lz4JbBackend;


enum Lz4JbResult {
	  LZ4JB_RESULT_OK = 0
	, LZ4JB_RESULT_ERROR
	, LZ4JB_RESULT_BAD_ARG
	, LZ4JB_RESULT_INVALID_MAGIC_NUMBER
	, LZ4JB_RESULT_INVALID_TOKEN
	, LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER
	, LZ4JB_RESULT_TRUNCATED
	, LZ4JB_RESULT_BLOCK_CHECKSUM_MISMATCH
	, LZ4JB_RESULT_DECOMPRESS_FAIL
	, LZ4JB_RESULT_COMPRESS_FAIL
	, LZ4JB_RESULT_STREAM_CLOSED
	, LZ4JB_RESULT_CANNOT_READ
	, LZ4JB_RESULT_CANNOT_WRITE_BLOCK
	, LZ4JB_RESULT_CANNOT_WRITE_EOS
	, LZ4JB_RESULT_CANNOT_WRITE_DECODED_BLOCK
};
typedef enum Lz4JbResult Lz4JbResult;


struct Lz4JbStreamInfo {
	uint64_t	blocks;
	uint64_t	rawBlocks;
	uint64_t	compressedSize;
	uint64_t	originalSize;
};
typedef struct Lz4JbStreamInfo Lz4JbStreamInfo;


struct Lz4JbContext {
	Lz4JbResult			result;
	void*				readCtx;
	Lz4JbRead			read;
	void*				writeCtx;
	Lz4JbWrite			write;

	Lz4JbBackend		backend;
	Lz4JbCompress		compress;
	Lz4JbCompressBound	compressBound;
	Lz4JbDecompress		decompress;
	int					compressionLevel;
};
typedef struct Lz4JbContext Lz4JbContext;


Lz4JbContext lz4jbInitContext();
Lz4JbStreamInfo lz4jbInitStreamInfo();
const char* lz4jbResultToString(Lz4JbResult result);
int lz4jbResultToExitCode(Lz4JbResult result);

Lz4JbResult lz4jbSetBackend(Lz4JbContext* ctx, Lz4JbBackend backend);
const char* lz4jbBackendToString(Lz4JbBackend backend);
int lz4jbBackendFromString(const char* name, Lz4JbBackend* backend);

Lz4JbResult lz4jbCompress(
	  Lz4JbContext* ctx
	, int blockSize
);

Lz4JbResult lz4jbDecompress(
	  Lz4JbContext* ctx
	, Lz4JbStreamInfo* info
);


#if defined (__cplusplus)
}
#endif

#endif // LZ4JB_H
