/*
 * Copyright (c) 2018 Patrick P. Frey
 *
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at http://mozilla.org/MPL/2.0/.
 */
/// \brief Program running the rules of rule files on documents
#include "strus/lib/error.hpp"
#include "strus/errorBufferInterface.hpp"
#include "strus/base/fileio.hpp"
#include "strus/versionBase.hpp"
#include "tokmatch/versionTokmatch.hpp"
#include "tokmatch/matcher.hpp"
#include "tokmatch/ruleLoader.hpp"
#include "tokmatch/document.hpp"
#include "tokmatch/errors.hpp"
#include "errorUtils.hpp"
#include "internationalization.hpp"
#include "utils.hpp"
#include <stdexcept>
#include <string>
#include <vector>
#include <cstring>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include "hs_version.h"
#include <boost/thread.hpp>
#include <boost/bind.hpp>

#undef TOKMATCH_LOWLEVEL_DEBUG

static void printUsage()
{
	std::cout << "tokmatchPatternMatch [options] <inputpath>" << std::endl;
	std::cout << "options:" << std::endl;
	std::cout << "-h|--help" << std::endl;
	std::cout << "    " << _TXT("Print this usage and do nothing else") << std::endl;
	std::cout << "-v|--version" << std::endl;
	std::cout << "    " << _TXT("Print the program version and do nothing else") << std::endl;
	std::cout << "-t|--threads <N>" << std::endl;
	std::cout << "    " << _TXT("Set <N> as number of matcher threads to use") << std::endl;
	std::cout << "-X|--ext <FILEEXT>" << std::endl;
	std::cout << "    " << _TXT("Do only process files with extension <FILEEXT>") << std::endl;
	std::cout << "-p|--program <PRG>" << std::endl;
	std::cout << "    " << _TXT("Load rule file <PRG> (JSON) with rules to match") << std::endl;
	std::cout << "-A|--allow-missing" << std::endl;
	std::cout << "    " << _TXT("Match also if documents lack annotations used by rules") << std::endl;
	std::cout << "-o|--output <FILE>" << std::endl;
	std::cout << "    " << _TXT("Write output to file (thread id is inserted before '.', if threads specified)") << std::endl;
	std::cout << "<inputpath>  : " << _TXT("input file or directory to process ('-' for stdin)") << std::endl;
	std::cout << "    " << _TXT("documents are JSON lists of token objects or plain text split by whitespace") << std::endl;
}

static strus::ErrorBufferInterface* g_errorBuffer = 0;	// error buffer

static unsigned int getUintValue( const char* arg)
{
	unsigned int rt = 0, prev = 0;
	char const* cc = arg;
	for (; *cc; ++cc)
	{
		if (*cc < '0' || *cc > '9') throw std::runtime_error( std::string( "parameter is not a non negative integer number: ") + arg);
		rt = (rt * 10) + (*cc - '0');
		if (rt < prev) throw std::runtime_error( std::string( "parameter out of range: ") + arg);
		prev = rt;
	}
	return rt;
}

static void loadFileNames( std::vector<std::string>& result, const std::string& path, const std::string& fileext)
{
	if (strus::isDir( path))
	{
		std::vector<std::string> filenames;
		unsigned int ec = strus::readDirFiles( path, fileext, filenames);
		if (ec)
		{
			throw tokmatch::runtime_error( _TXT( "could not read directory to process '%s' (errno %u)"), path.c_str(), ec);
		}
		std::vector<std::string>::const_iterator fi = filenames.begin(), fe = filenames.end();
		for (; fi != fe; ++fi)
		{
			result.push_back( path + strus::dirSeparator() + *fi);
		}
		std::vector<std::string> subdirs;
		ec = strus::readDirSubDirs( path, subdirs);
		if (ec)
		{
			throw tokmatch::runtime_error( _TXT( "could not read subdirectories to process '%s' (errno %u)"), path.c_str(), ec);
		}
		std::vector<std::string>::const_iterator si = subdirs.begin(), se = subdirs.end();
		for (; si != se; ++si)
		{
			loadFileNames( result, path + strus::dirSeparator() + *si, fileext);
		}
	}
	else
	{
		result.push_back( path);
	}
}

class GlobalContext
{
public:
	GlobalContext(
			const tokmatch::Matcher* matcher_,
			const std::string& path,
			const std::string& fileext,
			bool allowMissing_)
		:m_matcher(matcher_)
		,m_allowMissing(allowMissing_)
	{
		loadFileNames( m_files, path, fileext);
		m_fileitr = m_files.begin();
	}

	const tokmatch::Matcher* matcher() const	{return m_matcher;}
	bool allowMissing() const			{return m_allowMissing;}

	void fetchError()
	{
		if (g_errorBuffer->hasError())
		{
			tokmatch::utils::ScopedLock lock( m_mutex);
			m_errors.push_back( g_errorBuffer->fetchError());
		}
	}

	std::string fetchFile()
	{
		tokmatch::utils::ScopedLock lock( m_mutex);
		if (m_fileitr != m_files.end())
		{
			return *m_fileitr++;
		}
		return std::string();
	}

	const std::vector<std::string>& errors() const
	{
		return m_errors;
	}

private:
	tokmatch::utils::Mutex m_mutex;
	const tokmatch::Matcher* m_matcher;
	bool m_allowMissing;
	std::vector<std::string> m_errors;
	std::vector<std::string> m_files;
	std::vector<std::string>::const_iterator m_fileitr;
};

class ThreadContext
{
public:
	~ThreadContext(){}

	ThreadContext( const ThreadContext& o)
		:m_globalContext(o.m_globalContext),m_threadid(o.m_threadid),m_outputfile(o.m_outputfile),m_outputfilestream(o.m_outputfilestream),m_output(o.m_output)
	{}

	ThreadContext( GlobalContext* globalContext_, unsigned int threadid_, const std::string& outputfile_="")
		:m_globalContext(globalContext_),m_threadid(threadid_),m_outputfilestream(),m_output(0)
	{
		if (outputfile_.empty())
		{
			m_output = &std::cout;
		}
		else
		{
			if (m_threadid > 0)
			{
				std::ostringstream namebuf;
				char const* substpos = std::strchr( outputfile_.c_str(), '.');
				if (substpos)
				{
					namebuf << std::string( outputfile_.c_str(), substpos-outputfile_.c_str())
						<< m_threadid << substpos;
				}
				else
				{
					namebuf << outputfile_ << m_threadid;
				}
				m_outputfile = namebuf.str();
			}
			else
			{
				m_outputfile = outputfile_;
			}
			m_outputfilestream.reset( new std::ofstream( m_outputfile.c_str()));
			if (!*m_outputfilestream)
			{
				throw tokmatch::runtime_error(_TXT("failed to open file '%s' for output"), m_outputfile.c_str());
			}
			m_output = m_outputfilestream.get();
		}
	}

	void processDocument( const std::string& filename)
	{
		std::string content;

		unsigned int ec;
		if (filename == "-")
		{
			ec = strus::readStdin( content);
		}
		else
		{
			ec = strus::readFile( filename, content);
		}
		if (ec)
		{
			throw tokmatch::runtime_error(_TXT("error (%u) reading document %s: %s"), ec, filename.c_str(), ::strerror(ec));
		}
		tokmatch::Document document = tokmatch::loadDocument( content);
#ifdef TOKMATCH_LOWLEVEL_DEBUG
		std::cerr << "processing document " << filename << " with " << document.size() << " tokens" << std::endl;
#endif
		std::vector<tokmatch::Match> matches = m_globalContext->matcher()->match( document, m_globalContext->allowMissing());
		std::vector<tokmatch::Match>::const_iterator mi = matches.begin(), me = matches.end();
		for (; mi != me; ++mi)
		{
			(*m_output) << filename << ":" << mi->start() << ".." << mi->end() << " " << mi->key()
					<< " '" << document.spanText( mi->start(), mi->end()) << "'" << std::endl;
		}
	}

	void run()
	{
		try
		{
			for (;;)
			{
				std::string filename = m_globalContext->fetchFile();
				if (filename.empty()) break;

				processDocument( filename);
			}
		}
		CATCH_ERROR_MAP( _TXT("error processing documents: %s"), *g_errorBuffer);
		m_globalContext->fetchError();
	}

private:
	GlobalContext* m_globalContext;
	unsigned int m_threadid;
	std::string m_outputfile;
	tokmatch::utils::SharedPtr<std::ofstream> m_outputfilestream;
	std::ostream* m_output;
};


int main( int argc, const char* argv[])
{
	std::auto_ptr<strus::ErrorBufferInterface> errorBuffer;
	try
	{
		tokmatch::initMessageTextDomain();
		bool doExit = false;
		int argi = 1;
		std::string outputfile;
		std::string fileext;
		std::vector<std::string> programfiles;
		unsigned int nofThreads = 0;
		bool allowMissing = false;

		// Parsing arguments:
		for (; argi < argc; ++argi)
		{
			if (0==std::strcmp( argv[argi], "-h") || 0==std::strcmp( argv[argi], "--help"))
			{
				printUsage();
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-v") || 0==std::strcmp( argv[argi], "--version"))
			{
				std::cerr << _TXT("tokmatch version ") << TOKMATCH_VERSION_STRING << std::endl;
				std::cerr << _TXT("strus base version ") << STRUS_BASE_VERSION_STRING << std::endl;
				std::cerr << _TXT("hyperscan version ") << HS_VERSION_STRING << std::endl;
				std::cerr << "\tCopyright (c) 2015, Intel Corporation" << std::endl;
				doExit = true;
			}
			else if (0==std::strcmp( argv[argi], "-X") || 0==std::strcmp( argv[argi], "--ext"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw tokmatch::runtime_error( _TXT("no argument given to option --ext"));
				}
				++argi;
				if (!fileext.empty())
				{
					throw tokmatch::runtime_error( _TXT("file extension option --ext specified twice"));
				}
				fileext = argv[argi];
			}
			else if (0==std::strcmp( argv[argi], "-p") || 0==std::strcmp( argv[argi], "--program"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw tokmatch::runtime_error( _TXT("no argument given to option --program"));
				}
				++argi;
				programfiles.push_back( argv[argi]);
			}
			else if (0==std::strcmp( argv[argi], "-A") || 0==std::strcmp( argv[argi], "--allow-missing"))
			{
				allowMissing = true;
			}
			else if (0==std::strcmp( argv[argi], "-t") || 0==std::strcmp( argv[argi], "--threads"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw tokmatch::runtime_error( _TXT("no argument given to option --threads"));
				}
				++argi;
				if (nofThreads)
				{
					throw tokmatch::runtime_error( _TXT("number of threads option --threads specified twice"));
				}
				nofThreads = getUintValue( argv[argi]);
				if (!nofThreads)
				{
					throw tokmatch::runtime_error( _TXT("number of threads option --threads is 0"));
				}
			}
			else if (0==std::strcmp( argv[argi], "-o") || 0==std::strcmp( argv[argi], "--output"))
			{
				if (argi+1 == argc || argv[argi+1][0] == '-')
				{
					throw tokmatch::runtime_error( _TXT("no argument given to option --output"));
				}
				++argi;
				if (!outputfile.empty())
				{
					throw tokmatch::runtime_error( _TXT("output file option --output specified twice"));
				}
				outputfile = argv[argi];
			}
			else if (argv[argi][0] == '-' && argv[argi][1] == '-' && !argv[argi][2])
			{
				++argi;
				break;
			}
			else if (argv[argi][0] == '-' && !argv[argi][1])
			{
				break;
			}
			else if (argv[argi][0] == '-')
			{
				throw tokmatch::runtime_error(_TXT("unknown option %s"), argv[ argi]);
			}
			else
			{
				break;
			}
		}
		if (doExit) return 0;
		if (argc - argi < 1)
		{
			printUsage();
			throw tokmatch::runtime_error( _TXT("too few arguments (given %u, required %u)"), argc - argi, 1);
		}
		if (argc - argi > 1)
		{
			printUsage();
			throw tokmatch::runtime_error( _TXT("too many arguments (given %u, required %u)"), argc - argi, 1);
		}
		if (programfiles.empty())
		{
			throw tokmatch::runtime_error( _TXT("no rule file specified (option --program)"));
		}
		errorBuffer.reset( strus::createErrorBuffer_standard( 0, nofThreads+1));
		if (!errorBuffer.get())
		{
			throw tokmatch::runtime_error( _TXT("failed to create error buffer"));
		}
		g_errorBuffer = errorBuffer.get();

		tokmatch::Matcher matcher( g_errorBuffer);
		std::cerr << "loading rules ..." << std::endl;
		std::vector<std::string>::const_iterator pi = programfiles.begin(), pe = programfiles.end();
		for (; pi != pe; ++pi)
		{
			std::string programsrc;
			unsigned int ec = strus::readFile( *pi, programsrc);
			if (ec)
			{
				throw tokmatch::runtime_error(_TXT("error (%u) reading rule file %s: %s"), ec, pi->c_str(), ::strerror(ec));
			}
			try
			{
				tokmatch::loadRules( matcher, programsrc);
			}
			catch (const tokmatch::runtime_error& err)
			{
				throw tokmatch::runtime_error(_TXT("error loading rule file %s: %s"), pi->c_str(), err.what());
			}
		}
		std::string inputpath( argv[ argi]);
		GlobalContext globalContext( &matcher, inputpath, fileext, allowMissing);

		std::cerr << "start matching ..." << std::endl;
		if (nofThreads)
		{
			fprintf( stderr, _TXT("starting %u threads for evaluation ...\n"), nofThreads);

			std::vector<ThreadContext> ctxar;
			for (unsigned int ti=0; ti<nofThreads; ++ti)
			{
				ctxar.push_back( ThreadContext( &globalContext, ti+1, outputfile));
			}
			{
				boost::thread_group tgroup;
				for (unsigned int ti=0; ti<nofThreads; ++ti)
				{
					tgroup.create_thread( boost::bind( &ThreadContext::run, &ctxar[ti]));
				}
				tgroup.join_all();
			}
		}
		else
		{
			ThreadContext ctx( &globalContext, 0, outputfile);
			ctx.run();
		}
		if (!globalContext.errors().empty())
		{
			std::vector<std::string>::const_iterator
				ei = globalContext.errors().begin(), ee = globalContext.errors().end();
			for (; ei != ee; ++ei)
			{
				std::cerr << _TXT("error in thread: ") << *ei << std::endl;
			}
			throw tokmatch::runtime_error( _TXT("error processing documents"));
		}
		if (g_errorBuffer->hasError())
		{
			throw tokmatch::runtime_error( _TXT("error matching documents"));
		}
		std::cerr << _TXT("OK done") << std::endl;
		return 0;
	}
	catch (const std::exception& e)
	{
		const char* errormsg = g_errorBuffer?g_errorBuffer->fetchError():0;
		if (errormsg)
		{
			std::cerr << e.what() << ": " << errormsg << std::endl;
		}
		else
		{
			std::cerr << e.what() << std::endl;
		}
	}
	return -1;
}

