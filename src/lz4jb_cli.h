#ifndef LZ4JB_CLI_H
#define LZ4JB_CLI_H

#include <exception>
#include <functional>
#include <map>
#include <ostream>
#include <string>
#include <vector>
#include "lz4jb.h"

namespace Lz4Jb { namespace Cli {

enum class DisplayLevel {
	  NO_DISPLAY
	, ERRORS
	, RESULTS
	, PROGRESSION
	, INFORMATION
	, MIN = NO_DISPLAY
	, MAX = INFORMATION
	, DEFAULT = RESULTS
};

DisplayLevel& operator--(DisplayLevel& x);


namespace Exception {
struct BadUsage : std::exception {
	const char* what() const throw() {
		return "";
	}
};


struct ExitError : std::exception {
	ExitError(int errorCode)
		: errorCode(errorCode)
	{}

	const char* what() const throw() {
		return "";
	}

	int errorCode;
};


struct Lz4JbError : std::exception {
	Lz4JbError(Lz4JbResult lz4JbResult)
		: lz4JbResult(lz4JbResult)
	{}

	const char* what() const throw() {
		return lz4jbResultToString(lz4JbResult);
	}

	Lz4JbResult lz4JbResult;
};


struct ExitGracefully : std::exception {
	const char* what() const throw() {
		return "";
	}
};
} // namespace Exception


enum class CompMode {
	  COMPRESS
	, DECOMPRESS
	, LIST
	, TEST
};

const char* compModeToString(CompMode m);


class Output {
public:
	typedef std::function<void(const std::string&)> OutputFunction;

	Output(OutputFunction outputFunction)
		: outputFunction(outputFunction)
		, displayLevel(DisplayLevel::DEFAULT)
	{}

	void display(const std::string& message) const {
		outputFunction(message);
	}

	void display(const std::exception& e) const {
		display(e.what());
	}

	void setDisplayLevel(DisplayLevel displayLevel) {
		this->displayLevel = displayLevel;
	}

	DisplayLevel getDisplayLevel() const {
		return displayLevel;
	}

	void decreaseDisplayLevel() {
		--displayLevel;
	}

	bool checkDisplayLevel(DisplayLevel displayLevel) const {
		return this->displayLevel >= displayLevel;
	}

	void display(DisplayLevel displayLevel, const std::string& message) const {
		if(checkDisplayLevel(displayLevel)) {
			display(message);
		}
	}

protected:
	OutputFunction outputFunction;
	DisplayLevel displayLevel;
};


typedef std::map<std::string, std::string> ReplaceMap;

// Parsed command line. Usage errors are reported through output and
// thrown as Exception::BadUsage; -h, -H and -V throw
// Exception::ExitGracefully after printing.
struct Option {
	Option(Output& output, int argc, const char* const argv[], Lz4JbBackend defaultBackend);

	bool isCompress() const {
		return CompMode::COMPRESS == compMode;
	}

	bool isDecompress() const {
		return CompMode::DECOMPRESS == compMode;
	}

	bool writesOutput() const {
		return isCompress() || isDecompress();
	}

	void showUsage(bool advanced = false, bool longHelp = false);
	void showBadUsage(char c0 = 0);
	std::string replace(const std::string& s0) const;

	Output& output;
	CompMode compMode;
	Lz4JbBackend backend;
	int blockSize;
	std::string extension;
	std::vector<std::string> files;
	bool toStdout;
	bool keep;
	bool overwrite;
	std::function<ReplaceMap()> replaceMap;

private:
	Option(const Option&);
	Option& operator=(const Option&);
};


// Output filename for inpFilename under opt. Cstdio::nullName() for modes
// that write nothing, Cstdio::stdoutName() for -c and stdin input. Throws
// Exception::ExitError when a decompressed name cannot be derived.
std::string outputFilename(const Output& output, const Option& opt, const std::string& inpFilename);

// Runs opt.compMode on one input. The --list row goes to listStream.
void processFile(Output& output, std::ostream& listStream, const Option& opt, Lz4JbContext& ctx, const std::string& inpFilename);

// Parses the arguments and processes every input. Throws on the first error.
int commandLine(Output& output, std::ostream& listStream, int argc, const char* const argv[]);

// commandLine with every exception turned into a process exit code.
int commandLineDriver(Output& output, std::ostream& listStream, int argc, const char* const argv[]);

}} // namespace Cli, Lz4Jb

#endif
