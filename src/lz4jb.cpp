#include <vector>
#include "lz4jb.h"
#include "lz4jb_block_input.h"
#include "lz4jb_block_output.h"
#include "lz4jb_header.h"


namespace {

const int LZ4JB_DECODE_BUFFER_SIZE = LZ4JB_BLOCK_SIZE_DEFAULT;

Lz4JbResult setResult(Lz4JbContext* ctx, Lz4JbResult result) {
	auto& r = ctx->result;
	if(LZ4JB_RESULT_OK == r || LZ4JB_RESULT_ERROR == r) {
		r = result;
	}
	return r;
}

} // anonymous namespace


extern "C" Lz4JbStreamInfo
lz4jbInitStreamInfo()
{
	Lz4JbStreamInfo e = { 0 };

	e.blocks			= 0;
	e.rawBlocks			= 0;
	e.compressedSize	= 0;
	e.originalSize		= 0;

	return e;
}


extern "C" Lz4JbResult
lz4jbCompress(Lz4JbContext* ctx, int blockSize)
{
	if(!ctx || !ctx->read) {
		return ctx ? setResult(ctx, LZ4JB_RESULT_BAD_ARG) : LZ4JB_RESULT_BAD_ARG;
	}

	ctx->result = LZ4JB_RESULT_OK;
	Lz4Jb::BlockOutput out(ctx, blockSize);
	if(LZ4JB_RESULT_OK != out.result()) {
		return setResult(ctx, out.result());
	}

	std::vector<char> src(static_cast<size_t>(blockSize));
	for(;;) {
		const auto readSize = ctx->read(ctx, src.data(), blockSize);
		if(readSize < 0) {
			return setResult(ctx, LZ4JB_RESULT_CANNOT_READ);
		}
		if(0 == readSize) {
			break;
		}

		const auto r = out.write(src.data(), static_cast<size_t>(readSize));
		if(LZ4JB_RESULT_OK != r) {
			return setResult(ctx, r);
		}
	}

	return setResult(ctx, out.close());
}


extern "C" Lz4JbResult
lz4jbDecompress(Lz4JbContext* ctx, Lz4JbStreamInfo* info)
{
	if(!ctx || !ctx->write) {
		return ctx ? setResult(ctx, LZ4JB_RESULT_BAD_ARG) : LZ4JB_RESULT_BAD_ARG;
	}

	ctx->result = LZ4JB_RESULT_OK;
	Lz4Jb::BlockInput in(ctx);
	std::vector<char> dst(LZ4JB_DECODE_BUFFER_SIZE);

	for(;;) {
		const auto decSize = in.read(dst.data(), static_cast<int>(dst.size()));
		if(0 == decSize) {
			break;
		}
		if(decSize != ctx->write(ctx, dst.data(), decSize)) {
			setResult(ctx, LZ4JB_RESULT_CANNOT_WRITE_DECODED_BLOCK);
			break;
		}
	}

	if(info) {
		*info = in.info();
	}

	if(LZ4JB_RESULT_OK != in.result()) {
		return setResult(ctx, in.result());
	}
	if(!in.isEnded()) {
		return setResult(ctx, LZ4JB_RESULT_ERROR);
	}
	return ctx->result;
}
