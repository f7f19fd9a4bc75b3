#include <algorithm>
#include <ctype.h>
#include <cstdlib>
#include <deque>
#include <iomanip>
#include <sstream>
#include "lz4jb_cli.h"
#include "lz4jb_header.h"
#include "lz4jb_io_cstdio.h"

#ifndef LZ4JB_VERSION
#define LZ4JB_VERSION "0.1.0"
#endif


namespace {

const char LZ4JB_DEFAULT_EXTENSION[] = "lz4";

const char welcomeMessage[] =
	"*** lz4jb " LZ4JB_VERSION " ***\n"
	"LZ4BlockOutputStream (lz4-java) compatible compressor\n"
;

const char usage[] =
	"usage :\n"
	"  ${lz4jb} [arg] [file...]\n"
	"\n"
	"file    : input filename(s)\n"
	"          with no file, read standard input and write standard output\n"
	"Arguments :\n"
	" -z     : compress (default)\n"
	" -d     : decompress\n"
	" -l     : list compressed file contents\n"
	" -t     : test compressed file integrity\n"
	" -c     : write on standard output, keep input files\n"
	" -k     : keep input files\n"
	" -f     : overwrite output files\n"
	" -h/-H  : display help/long help and exit\n"
;

const char usage_advanced[] =
	"\n"
	"Advanced arguments :\n"
	" -V     : display Version number and exit\n"
	" -v     : verbose mode\n"
	" -q     : suppress warnings; specify twice to suppress errors too\n"
	" -E ext : use extension .ext instead of .${ext}\n"
	" -b #   : block size in bytes [${bmin}-${bmax}](default : ${bdef})\n"
	" -L lib : compression library [${libs}](default : ${lib})\n"
	"\n"
	"Long arguments :\n"
	" --compress --decompress --uncompress --list --test --stdout --keep\n"
	" --force --verbose --quiet --help --version\n"
	" --extension=ext --blocksize=# --library=lib\n"
;

const char usage_longHelp[] =
	"\n"
	"Output filenames :\n"
	"  - compression   : file -> file.${ext}\n"
	"  - decompression : file.${ext} -> file\n"
	"                    input without the .${ext} extension is an error\n"
	"Input files are removed after success, unless -k or -c is given.\n"
	"\n"
	"stdin, stdout and the console :\n"
	"${lz4jb} refuses to read compressed data from the console,\n"
	"and to write compressed data to the console unless -f is given.\n"
	"\n"
	"${lz4jb} can be used in 'pure pipe mode', for example :\n"
	"          generator | ${lz4jb} | consumer\n"
	"          ${lz4jb} -d < file.${ext} > file\n"
;


std::string availableBackends() {
	std::string s;
	for(const auto b : { LZ4JB_BACKEND_LZ4, LZ4JB_BACKEND_LZ4HC }) {
		if(!s.empty()) {
			s += ", ";
		}
		s += lz4jbBackendToString(b);
	}
	return s;
}


bool isDecimal(const std::string& s) {
	return !s.empty() && std::all_of(std::begin(s), std::end(s), [](char c) {
		return 0 != isdigit(static_cast<unsigned char>(c));
	});
}


std::string formatRatio(uint64_t compressed, uint64_t original) {
	std::ostringstream os;
	os << std::fixed << std::setprecision(2);
	if(0 == original) {
		os << 100.0;
	} else {
		os << (100.0 * static_cast<double>(compressed) / static_cast<double>(original));
	}
	os << "%";
	return os.str();
}

} // anonymous namespace


namespace Lz4Jb { namespace Cli {

DisplayLevel& operator--(DisplayLevel& x) {
	if(DisplayLevel::NO_DISPLAY != x) {
		x = static_cast<DisplayLevel>(static_cast<int>(x) - 1);
	}
	return x;
}


const char* compModeToString(CompMode m) {
	switch(m) {
	case CompMode::COMPRESS:	return "compress";
	case CompMode::DECOMPRESS:	return "decompress";
	case CompMode::LIST:		return "list";
	case CompMode::TEST:		return "test";
	}
	return "???";
}


Option::Option(Output& output, int argc, const char* const argv[], Lz4JbBackend defaultBackend)
	: output(output)
	, compMode(CompMode::COMPRESS)
	, backend(defaultBackend)
	, blockSize(LZ4JB_BLOCK_SIZE_DEFAULT)
	, extension(LZ4JB_DEFAULT_EXTENSION)
	, files()
	, toStdout(false)
	, keep(false)
	, overwrite(false)
	, replaceMap()
{
	std::deque<std::string> args;
	for(int iarg = 1; iarg < argc; ++iarg) {
		args.push_back(argv[iarg]);
	}

	const std::string program = argc > 0 ? argv[0] : "lz4jb";
	replaceMap = [this, program]() -> ReplaceMap {
		ReplaceMap rm;
		rm["${lz4jb}"]	= program;
		rm["${ext}"]	= extension;
		rm["${bmin}"]	= std::to_string(LZ4JB_BLOCK_SIZE_MIN);
		rm["${bmax}"]	= std::to_string(LZ4JB_BLOCK_SIZE_MAX);
		rm["${bdef}"]	= std::to_string(LZ4JB_BLOCK_SIZE_DEFAULT);
		rm["${libs}"]	= availableBackends();
		rm["${lib}"]	= lz4jbBackendToString(backend);
		return rm;
	};

	int nModes = 0;
	bool blockSizeGiven = false;

	const auto setMode = [&](CompMode m) {
		if(0 != nModes && m != compMode) {
			output.display(DisplayLevel::ERRORS
				, "Maximum 1 amongst the following arguments: "
				  "--compress, --decompress, --list, --test\n");
			throw Exception::BadUsage();
		}
		compMode = m;
		++nModes;
	};

	const auto setBlockSize = [&](const std::string& a) {
		const auto v = isDecimal(a) && a.size() <= 9 ? std::stoi(a) : 0;
		if(!Lz4Jb::isValidBlockSize(v)) {
			output.display(DisplayLevel::ERRORS
				, "lz4jb: Bad block size [" + a + "], expected "
				  + std::to_string(LZ4JB_BLOCK_SIZE_MIN) + " to "
				  + std::to_string(LZ4JB_BLOCK_SIZE_MAX) + "\n");
			throw Exception::BadUsage();
		}
		blockSize = v;
		blockSizeGiven = true;
	};

	const auto setExtension = [&](const std::string& a) {
		const auto e = (!a.empty() && '.' == a[0]) ? a.substr(1) : a;
		if(e.empty()) {
			output.display(DisplayLevel::ERRORS, "lz4jb: Empty extension\n");
			throw Exception::BadUsage();
		}
		extension = e;
	};

	const auto setBackend = [&](const std::string& a) {
		if(!lz4jbBackendFromString(a.c_str(), &backend)) {
			output.display(DisplayLevel::ERRORS
				, "library " + a + " is not available.\n"
				  "Available values: " + availableBackends() + "\n");
			throw Exception::BadUsage();
		}
	};

	std::map<int, std::function<void()>> options;
	options['V'] = [&]() {
		output.display(welcomeMessage);
		throw Exception::ExitGracefully();
	};
	options['h'] = [&]() {
		showUsage(true);
		throw Exception::ExitGracefully();
	};
	options['H'] = [&]() {
		showUsage(true, true);
		throw Exception::ExitGracefully();
	};
	options['z'] = [&]() { setMode(CompMode::COMPRESS); };
	options['d'] = [&]() { setMode(CompMode::DECOMPRESS); };
	options['l'] = [&]() { setMode(CompMode::LIST); };
	options['t'] = [&]() { setMode(CompMode::TEST); };
	options['c'] = [&]() { toStdout = true; };
	options['k'] = [&]() { keep = true; };
	options['f'] = [&]() { overwrite = true; };
	options['v'] = [&]() { output.setDisplayLevel(DisplayLevel::MAX); };
	options['q'] = [&]() { output.decreaseDisplayLevel(); };

	std::map<int, std::function<void(const std::string&)>> valueOptions;
	valueOptions['b'] = setBlockSize;
	valueOptions['E'] = setExtension;
	valueOptions['L'] = setBackend;

	const char optdelim = '=';

	auto getOptionName = [&](const std::string& s) -> std::string {
		const auto pos = s.find(optdelim);
		if(std::string::npos != pos) {
			return s.substr(0, pos);
		} else {
			return s;
		}
	};

	auto getOptionArg = [&](const std::string& s) -> std::string {
		const auto pos = s.find(optdelim);
		if(std::string::npos != pos) {
			return s.substr(pos+1);
		} else {
			return "";
		}
	};

	std::map<std::string, std::function<void(const std::string&)>> opts;
	opts["--compress"]		= [&](const std::string&) { options['z'](); };
	opts["--decompress"]	= [&](const std::string&) { options['d'](); };
	opts["--uncompress"]	= [&](const std::string&) { options['d'](); };
	opts["--list"]			= [&](const std::string&) { options['l'](); };
	opts["--test"]			= [&](const std::string&) { options['t'](); };
	opts["--stdout"]		= [&](const std::string&) { options['c'](); };
	opts["--keep"]			= [&](const std::string&) { options['k'](); };
	opts["--force"]			= [&](const std::string&) { options['f'](); };
	opts["--verbose"]		= [&](const std::string&) { options['v'](); };
	opts["--quiet"]			= [&](const std::string&) { options['q'](); };
	opts["--help"]			= [&](const std::string&) { options['H'](); };
	opts["--version"]		= [&](const std::string&) { options['V'](); };
	opts["--extension"]		= [&](const std::string& a) { setExtension(getOptionArg(a)); };
	opts["--blocksize"]		= [&](const std::string& a) { setBlockSize(getOptionArg(a)); };
	opts["--library"]		= [&](const std::string& a) { setBackend(getOptionArg(a)); };

	bool endOfOptions = false;
	while(!args.empty()) {
		const auto a = args.front();
		args.pop_front();

		if(a.empty()) {
			continue;
		} else if(endOfOptions || '-' != a[0]) {
			files.push_back(a);
		} else if("-" == a) {
			files.push_back(Cstdio::stdinName());
		} else if("--" == a) {
			endOfOptions = true;
		} else if('-' == a[1]) {
			//	long option
			const auto it = opts.find(getOptionName(a));
			if(opts.end() == it) {
				output.display(DisplayLevel::ERRORS, "lz4jb: Bad argument [" + a + "]\n");
				throw Exception::BadUsage();
			}
			it->second(a);
		} else {
			for(size_t i = 1; i < a.size(); ++i) {
				const auto c = a[i];

				const auto it = options.find(c);
				if(options.end() != it) {
					it->second();
					continue;
				}

				const auto vit = valueOptions.find(c);
				if(valueOptions.end() != vit) {
					// -b4096 or -b 4096
					std::string value = a.substr(i+1);
					if(value.empty()) {
						if(args.empty()) {
							showBadUsage(c);
							throw Exception::BadUsage();
						}
						value = args.front();
						args.pop_front();
					}
					vit->second(value);
					break;
				}

				// Unrecognised command
				showBadUsage(c);
				throw Exception::BadUsage();
			}
		}
	}

	if(blockSizeGiven && CompMode::COMPRESS != compMode) {
		output.display(DisplayLevel::ERRORS
			, "lz4jb: block size can only be set when compressing\n");
		throw Exception::BadUsage();
	}

	output.display(DisplayLevel::INFORMATION, welcomeMessage);

	// No input filename ==> use stdin, output stdout
	if(files.empty()) {
		files.push_back(Cstdio::stdinName());
		toStdout = true;
	}

	// No warning message in pure pipe mode (stdin + stdout)
	if(toStdout && DisplayLevel::DEFAULT == output.getDisplayLevel()) {
		output.setDisplayLevel(DisplayLevel::ERRORS);
	}
}


void Option::showUsage(bool advanced, bool longHelp) {
	output.display(replace(usage));
	if(advanced) {
		output.display(replace(usage_advanced));
	}
	if(longHelp) {
		output.display(replace(usage_longHelp));
	}
}


void Option::showBadUsage(char c0) {
	output.display(DisplayLevel::ERRORS, "Incorrect parameters\n");
	if(c0) {
		output.display(DisplayLevel::ERRORS, "Wrong parameter '" + std::string(1, c0) + "'\n");
	}
	if(output.checkDisplayLevel(DisplayLevel::ERRORS)) {
		showUsage(false);
	}
}


std::string Option::replace(const std::string& s0) const {
	auto s = s0;
	const ReplaceMap rm = replaceMap();
	for(const auto& r : rm) {
		const auto& from = r.first;
		const auto& to = r.second;
		for(;;) {
			const auto pos = s.find(from);
			if(std::string::npos == pos) {
				break;
			}
			s.replace(pos, from.length(), to);
		}
	}
	return s;
}


std::string outputFilename(const Output& output, const Option& opt, const std::string& inpFilename) {
	if(!opt.writesOutput()) {
		return Cstdio::nullName();
	}

	if(opt.toStdout || Cstdio::stdinName() == inpFilename) {
		return Cstdio::stdoutName();
	}

	if(opt.isCompress()) {
		return Cstdio::compressedName(inpFilename, opt.extension);
	}

	std::string outFilename;
	if(!Cstdio::decompressedName(inpFilename, opt.extension, &outFilename)) {
		output.display(DisplayLevel::ERRORS
			, "lz4jb: " + inpFilename + ": Could not guess the output filename\n");
		throw Exception::ExitError(1);
	}
	return outFilename;
}


void processFile(Output& output, std::ostream& listStream, const Option& opt, Lz4JbContext& ctx, const std::string& inpFilename) {
	const auto outFilename = outputFilename(output, opt, inpFilename);
	const bool isStdin = Cstdio::stdinName() == inpFilename;
	const bool isStdout = Cstdio::stdoutName() == outFilename;

	output.display(DisplayLevel::INFORMATION
		, std::string("lz4jb: ") + compModeToString(opt.compMode)
		  + " [" + inpFilename + "] -> [" + outFilename + "]"
		  + (opt.isCompress() ? " blockSize=" + std::to_string(opt.blockSize) : "")
		  + " library=" + lz4jbBackendToString(ctx.backend) + "\n");

	// Check if input or output are defined as console;
	// trigger an error in this case
	if(!opt.isCompress() && isStdin && Cstdio::isConsoleInput()) {
		output.display(DisplayLevel::ERRORS, "lz4jb: refusing to read compressed data from the console\n");
		throw Exception::BadUsage();
	}
	if(opt.isCompress() && isStdout && Cstdio::isConsoleOutput() && !opt.overwrite) {
		output.display(DisplayLevel::ERRORS, "lz4jb: refusing to write compressed data to the console\n");
		throw Exception::BadUsage();
	}

	if(opt.writesOutput() && !isStdout && !opt.overwrite && Cstdio::fileExists(outFilename)) {
		output.display(DisplayLevel::ERRORS
			, "lz4jb: " + outFilename + " already exists\n");
		throw Exception::ExitError(1);
	}

	Cstdio::Streams streams(&ctx);
	if(!streams.openSource(inpFilename)) {
		output.display(DisplayLevel::ERRORS, "lz4jb: Pb opening " + inpFilename + "\n");
		throw Exception::ExitError(1);
	}

	if(!opt.writesOutput()) {
		streams.openNullSink();
	} else if(!streams.openSink(outFilename)) {
		output.display(DisplayLevel::ERRORS, "lz4jb: Pb opening " + outFilename + "\n");
		throw Exception::ExitError(1);
	}

	Lz4JbStreamInfo info = lz4jbInitStreamInfo();
	auto e = opt.isCompress()
		? lz4jbCompress(&ctx, opt.blockSize)
		: lz4jbDecompress(&ctx, &info);

	const bool closed = streams.closeSink();
	streams.closeSource();
	if(LZ4JB_RESULT_OK == e && !closed) {
		e = opt.isCompress() ? LZ4JB_RESULT_CANNOT_WRITE_BLOCK : LZ4JB_RESULT_CANNOT_WRITE_DECODED_BLOCK;
	}

	if(LZ4JB_RESULT_OK != e) {
		output.display(DisplayLevel::ERRORS
			, "lz4jb: " + inpFilename + ": " + lz4jbResultToString(e) + "\n");
		throw Exception::Lz4JbError(e);
	}

	switch(opt.compMode) {
	case CompMode::COMPRESS:
		if(!isStdin && !isStdout) {
			const auto inSize = Cstdio::fileSize(inpFilename);
			const auto outSize = Cstdio::fileSize(outFilename);
			output.display(DisplayLevel::RESULTS
				, "Compressed " + std::to_string(inSize) + " bytes into "
				  + std::to_string(outSize) + " bytes ==> "
				  + formatRatio(outSize, inSize) + "\n");
		}
		break;
	case CompMode::DECOMPRESS:
		output.display(DisplayLevel::PROGRESSION
			, "Successfully decoded " + std::to_string(info.originalSize) + " bytes\n");
		break;
	case CompMode::LIST:
		listStream
			<< std::setw(14) << info.compressedSize << ' '
			<< std::setw(14) << info.originalSize << ' '
			<< std::setw(8)  << formatRatio(info.compressedSize, info.originalSize) << ' '
			<< std::setw(8)  << info.blocks << ' '
			<< std::setw(8)  << info.rawBlocks << ' '
			<< inpFilename << std::endl;
		break;
	case CompMode::TEST:
		output.display(DisplayLevel::RESULTS, inpFilename + ": OK\n");
		break;
	}

	if(opt.writesOutput() && !opt.keep && !isStdin && !isStdout) {
		if(Cstdio::removeFile(inpFilename)) {
			output.display(DisplayLevel::INFORMATION, "lz4jb: removed " + inpFilename + "\n");
		} else {
			output.display(DisplayLevel::ERRORS, "lz4jb: cannot remove " + inpFilename + "\n");
		}
	}
}


int commandLine(Output& output, std::ostream& listStream, int argc, const char* const argv[]) {
	Lz4JbContext ctx = lz4jbInitContext();
	Option opt(output, argc, argv, ctx.backend);

	if(LZ4JB_RESULT_OK != lz4jbSetBackend(&ctx, opt.backend)) {
		throw Exception::BadUsage();
	}

	if(CompMode::LIST == opt.compMode) {
		listStream
			<< std::setw(14) << "compressed" << ' '
			<< std::setw(14) << "uncompressed" << ' '
			<< std::setw(8)  << "ratio" << ' '
			<< std::setw(8)  << "blocks" << ' '
			<< std::setw(8)  << "raw" << ' '
			<< "filename" << std::endl;
	}

	for(const auto& f : opt.files) {
		processFile(output, listStream, opt, ctx, f);
	}

	return EXIT_SUCCESS;
}


int commandLineDriver(Output& output, std::ostream& listStream, int argc, const char* const argv[]) {
	int exitCode = EXIT_FAILURE;

	try {
		exitCode = commandLine(output, listStream, argc, argv);
	} catch(Exception::ExitGracefully&) {
		exitCode = EXIT_SUCCESS;
	} catch(Exception::BadUsage&) {
		exitCode = EXIT_FAILURE;
	} catch(Exception::ExitError& e) {
		exitCode = e.errorCode;
	} catch(Exception::Lz4JbError& e) {
		exitCode = lz4jbResultToExitCode(e.lz4JbResult);
	} catch(std::exception& e) {
		output.display(DisplayLevel::ERRORS, "lz4jb: " + std::string(e.what()) + "\n");
	}

	return exitCode;
}

}} // namespace Cli, Lz4Jb
