// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.h"

#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/program_options/detail/config_file.hpp>
#include <boost/program_options/parsers.hpp>
#include <boost/thread.hpp>
#include <boost/thread/mutex.hpp>

#include <stdio.h>
#include <string.h>
#include <time.h>

#ifdef __linux__
#include <sys/prctl.h>
#endif

#include <set>
#include <typeinfo>

using namespace std;

map<string, string> mapArgs;
map<string, vector<string> > mapMultiArgs;
bool fDebug = false;
bool fDebugMining = false;
bool fPrintToConsole = false;
bool fPrintToDebugLog = true;

static boost::mutex mutexDebugLog;
static FILE* fileout = NULL;
static boost::filesystem::path pathDebugLog;

static boost::mutex mutexDataDir;
static boost::filesystem::path pathCached;
static bool fCachedPath = false;


string vstrprintf(const char* format, va_list ap)
{
    char buffer[50000];
    char* p = buffer;
    int limit = sizeof(buffer);
    int ret;
    while (true)
    {
        va_list arg_ptr;
        va_copy(arg_ptr, ap);
        ret = vsnprintf(p, limit, format, arg_ptr);
        va_end(arg_ptr);
        if (ret >= 0 && ret < limit)
        {
            break;
        }
        if (p != buffer)
        {
            delete[] p;
        }
        limit = (ret < 0) ? (limit * 2) : (ret + 1);
        p = new char[limit];
    }
    string str(p, p + ret);
    if (p != buffer)
    {
        delete[] p;
    }
    return str;
}

string strprintf(const char* format, ...)
{
    va_list arg_ptr;
    va_start(arg_ptr, format);
    string str = vstrprintf(format, arg_ptr);
    va_end(arg_ptr);
    return str;
}

int LogPrintf(const char* pszFormat, ...)
{
    va_list arg_ptr;
    va_start(arg_ptr, pszFormat);
    string strMessage = vstrprintf(pszFormat, arg_ptr);
    va_end(arg_ptr);

    int ret = 0;
    if (fPrintToConsole)
    {
        ret = fwrite(strMessage.data(), 1, strMessage.size(), stdout);
        fflush(stdout);
    }

    if (!fPrintToDebugLog)
    {
        return ret;
    }

    static bool fStartedNewLine = true;

    boost::mutex::scoped_lock scoped_lock(mutexDebugLog);

    // the data directory can change between test runs, follow it
    boost::filesystem::path pathLog = GetDataDir() / "debug.log";
    if (fileout && pathLog != pathDebugLog)
    {
        fclose(fileout);
        fileout = NULL;
    }
    if (!fileout)
    {
        ShrinkDebugFile();
        pathDebugLog = pathLog;
        fileout = fopen(pathDebugLog.string().c_str(), "a");
        if (fileout)
        {
            setbuf(fileout, NULL);  // unbuffered
        }
    }
    if (!fileout)
    {
        return ret;
    }

    // debug log timestamps only at the beginning of a line
    if (fStartedNewLine)
    {
        ret += fprintf(fileout, "%s ",
                       DateTimeStrFormat("%Y-%m-%d %H:%M:%S",
                                         GetTime()).c_str());
    }
    fStartedNewLine = (!strMessage.empty() &&
                       strMessage[strMessage.size() - 1] == '\n');

    ret += fwrite(strMessage.data(), 1, strMessage.size(), fileout);

    return ret;
}

bool error(const char* format, ...)
{
    va_list arg_ptr;
    va_start(arg_ptr, format);
    string str = vstrprintf(format, arg_ptr);
    va_end(arg_ptr);
    LogPrintf("ERROR: %s\n", str.c_str());
    return false;
}

string FormatException(exception* pex, const char* pszThread)
{
    if (pex)
    {
        return strprintf("EXCEPTION: %s       \n%s       \n%s in %s       \n",
                         typeid(*pex).name(), pex->what(), "cosmo", pszThread);
    }
    return strprintf("UNKNOWN EXCEPTION       \n%s in %s       \n",
                     "cosmo", pszThread);
}

void PrintException(exception* pex, const char* pszThread)
{
    string message = FormatException(pex, pszThread);
    LogPrintf("\n\n************************\n%s\n", message.c_str());
    fprintf(stderr, "\n\n************************\n%s\n", message.c_str());
}


static void InterpretNegativeSetting(string name, map<string, string>& mapSettingsRet)
{
    // interpret -nofoo as -foo=0 (and -nofoo=0 as -foo=1) as long as -foo not set
    if (name.find("-no") == 0)
    {
        string positive("-");
        positive.append(name.begin() + 3, name.end());
        if (mapSettingsRet.count(positive) == 0)
        {
            bool value = !GetBoolArg(name);
            mapSettingsRet[positive] = (value ? "1" : "0");
        }
    }
}

void ParseParameters(int argc, const char* const argv[])
{
    mapArgs.clear();
    mapMultiArgs.clear();
    for (int i = 1; i < argc; i++)
    {
        string str(argv[i]);
        string strValue;
        size_t is_index = str.find('=');
        if (is_index != string::npos)
        {
            strValue = str.substr(is_index + 1);
            str = str.substr(0, is_index);
        }

        if (str[0] != '-')
        {
            break;
        }

        // interpret --foo as -foo
        if (str.length() > 1 && str[1] == '-')
        {
            str = str.substr(1);
        }

        mapArgs[str] = strValue;
        mapMultiArgs[str].push_back(strValue);
    }

    // New 0.6 features:
    map<string, string>::const_iterator it;
    for (it = mapArgs.begin(); it != mapArgs.end(); ++it)
    {
        string name = it->first;
        InterpretNegativeSetting(name, mapArgs);
    }

    fDebug = GetBoolArg("-debug");
    fDebugMining = fDebug || GetBoolArg("-debugmining");
    fPrintToConsole = GetBoolArg("-printtoconsole");

    boost::mutex::scoped_lock lock(mutexDataDir);
    fCachedPath = false;
}

void ClearParameters()
{
    mapArgs.clear();
    mapMultiArgs.clear();
    fDebug = false;
    fDebugMining = false;
    fPrintToConsole = false;

    boost::mutex::scoped_lock lock(mutexDataDir);
    fCachedPath = false;
}

string GetArg(const string& strArg, const string& strDefault)
{
    if (mapArgs.count(strArg))
    {
        return mapArgs[strArg];
    }
    return strDefault;
}

int64_t GetArg(const string& strArg, int64_t nDefault)
{
    if (mapArgs.count(strArg))
    {
        return atoi64(mapArgs[strArg]);
    }
    return nDefault;
}

bool GetBoolArg(const string& strArg, bool fDefault)
{
    if (mapArgs.count(strArg))
    {
        if (mapArgs[strArg].empty())
        {
            return true;
        }
        return (atoi(mapArgs[strArg].c_str()) != 0);
    }
    return fDefault;
}


const boost::filesystem::path& GetDataDir()
{
    namespace fs = boost::filesystem;

    boost::mutex::scoped_lock lock(mutexDataDir);

    if (fCachedPath)
    {
        return pathCached;
    }

    fs::path path;
    if (mapArgs.count("-datadir"))
    {
        path = fs::system_complete(mapArgs["-datadir"]);
        if (!fs::is_directory(path))
        {
            fs::create_directories(path);
        }
    }
    else
    {
        path = fs::current_path();
    }

    pathCached = path;
    fCachedPath = true;
    return pathCached;
}

boost::filesystem::path GetConfigFile()
{
    boost::filesystem::path pathConfigFile(GetArg("-conf", "cosmo.conf"));
    if (!pathConfigFile.is_complete())
    {
        pathConfigFile = GetDataDir() / pathConfigFile;
    }
    return pathConfigFile;
}

void ReadConfigFile(map<string, string>& mapSettingsRet,
                    map<string, vector<string> >& mapMultiSettingsRet)
{
    boost::filesystem::ifstream streamConfig(GetConfigFile());
    if (!streamConfig.good())
    {
        return;  // No cosmo.conf file is OK
    }

    set<string> setOptions;
    setOptions.insert("*");

    for (boost::program_options::detail::config_file_iterator it(streamConfig, setOptions), end;
         it != end; ++it)
    {
        // Don't overwrite existing settings so command line settings override cosmo.conf
        string strKey = string("-") + it->string_key;
        if (mapSettingsRet.count(strKey) == 0)
        {
            mapSettingsRet[strKey] = it->value[0];
            // interpret nofoo=1 as foo=0 (and nofoo=0 as foo=1) as long as foo not set)
            InterpretNegativeSetting(strKey, mapSettingsRet);
        }
        mapMultiSettingsRet[strKey].push_back(it->value[0]);
    }

    fDebug = GetBoolArg("-debug");
    fDebugMining = fDebug || GetBoolArg("-debugmining");
    fPrintToConsole = GetBoolArg("-printtoconsole");
}

void ShrinkDebugFile()
{
    // Scroll debug.log if it's getting too big
    boost::filesystem::path pathLog = GetDataDir() / "debug.log";
    FILE* file = fopen(pathLog.string().c_str(), "r");
    if (file && boost::filesystem::file_size(pathLog) > 10 * 1000000)
    {
        // Restart the file with some of the end
        char pch[200000];
        fseek(file, -((long)sizeof(pch)), SEEK_END);
        int nBytes = fread(pch, 1, sizeof(pch), file);
        fclose(file);

        file = fopen(pathLog.string().c_str(), "w");
        if (file)
        {
            fwrite(pch, 1, nBytes, file);
            fclose(file);
        }
    }
    else if (file != NULL)
    {
        fclose(file);
    }
}


int64_t GetTime()
{
    return time(NULL);
}

int64_t GetTimeMillis()
{
    return (boost::posix_time::ptime(boost::posix_time::microsec_clock::universal_time()) -
            boost::posix_time::ptime(boost::gregorian::date(1970,1,1))).total_milliseconds();
}

void MilliSleep(int64_t n)
{
    boost::this_thread::sleep_for(boost::chrono::milliseconds(n));
}

string DateTimeStrFormat(const char* pszFormat, int64_t nTime)
{
    time_t n = nTime;
    struct tm tmTime;
    gmtime_r(&n, &tmTime);
    char pszTime[200];
    strftime(pszTime, sizeof(pszTime), pszFormat, &tmTime);
    return pszTime;
}

void RenameThread(const char* name)
{
#if defined(PR_SET_NAME)
    // Only the first 15 characters are used (16 - NUL terminator)
    ::prctl(PR_SET_NAME, name, 0, 0, 0);
#else
    // Prevent warnings for unused parameters...
    (void)name;
#endif
}
