#include "lz4jb.h"


extern "C" const char*
lz4jbResultToString(Lz4JbResult result)
{
	const char* s = "???";
	switch(result) {
	case LZ4JB_RESULT_OK:
		s = "OK";
		break;
	case LZ4JB_RESULT_ERROR:
		s = "ERROR";
		break;
	case LZ4JB_RESULT_BAD_ARG:
		s = "BAD_ARG";
		break;
	case LZ4JB_RESULT_INVALID_MAGIC_NUMBER:
		s = "INVALID_MAGIC_NUMBER";
		break;
	case LZ4JB_RESULT_INVALID_TOKEN:
		s = "INVALID_TOKEN";
		break;
	case LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER:
		s = "CORRUPTED_BLOCK_HEADER";
		break;
	case LZ4JB_RESULT_TRUNCATED:
		s = "TRUNCATED";
		break;
	case LZ4JB_RESULT_BLOCK_CHECKSUM_MISMATCH:
		s = "BLOCK_CHECKSUM_MISMATCH";
		break;
	case LZ4JB_RESULT_DECOMPRESS_FAIL:
		s = "DECOMPRESS_FAIL";
		break;
	case LZ4JB_RESULT_COMPRESS_FAIL:
		s = "COMPRESS_FAIL";
		break;
	case LZ4JB_RESULT_STREAM_CLOSED:
		s = "STREAM_CLOSED";
		break;
	case LZ4JB_RESULT_CANNOT_READ:
		s = "CANNOT_READ";
		break;
	case LZ4JB_RESULT_CANNOT_WRITE_BLOCK:
		s = "CANNOT_WRITE_BLOCK";
		break;
	case LZ4JB_RESULT_CANNOT_WRITE_EOS:
		s = "CANNOT_WRITE_EOS";
		break;
	case LZ4JB_RESULT_CANNOT_WRITE_DECODED_BLOCK:
		s = "CANNOT_WRITE_DECODED_BLOCK";
		break;
	default:
		s = "Unknown code";
		break;
	}
	return s;
}


extern "C" int
lz4jbResultToExitCode(Lz4JbResult result) {
	int e = 1;
	switch(result) {
	case LZ4JB_RESULT_OK:
		e = 0;
		break;

	case LZ4JB_RESULT_ERROR:
	case LZ4JB_RESULT_BAD_ARG:
		e = 1;
		break;

	// the input is not an intact LZ4Block stream
	case LZ4JB_RESULT_INVALID_MAGIC_NUMBER:
	case LZ4JB_RESULT_INVALID_TOKEN:
	case LZ4JB_RESULT_CORRUPTED_BLOCK_HEADER:
	case LZ4JB_RESULT_TRUNCATED:
	case LZ4JB_RESULT_BLOCK_CHECKSUM_MISMATCH:
	case LZ4JB_RESULT_DECOMPRESS_FAIL:
		e = 2;
		break;

	case LZ4JB_RESULT_STREAM_CLOSED:
	case LZ4JB_RESULT_CANNOT_READ:
	case LZ4JB_RESULT_CANNOT_WRITE_BLOCK:
	case LZ4JB_RESULT_CANNOT_WRITE_EOS:
	case LZ4JB_RESULT_CANNOT_WRITE_DECODED_BLOCK:
		e = 3;
		break;

	case LZ4JB_RESULT_COMPRESS_FAIL:
		e = 4;
		break;

	default:
		e = 1;
		break;
	}
	return e;
}
