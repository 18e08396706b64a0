// Copyright (c) 2024 The Cosmo Developers
// Distributed under the MIT/X11 software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef COSMO_UTIL_H
#define COSMO_UTIL_H

#include <boost/filesystem/path.hpp>

#include <inttypes.h>
#include <stdarg.h>
#include <stdint.h>
#include <stdlib.h>

#include <exception>
#include <map>
#include <string>
#include <vector>


/* Format characters for (s)size_t */
#define PRIszx    "zx"
#define PRIszu    "zu"
#define PRIszd    "zd"

#ifdef __GNUC__
#define ATTR_WARN_PRINTF(X,Y) __attribute__((format(printf,X,Y)))
#else
#define ATTR_WARN_PRINTF(X,Y)
#endif


extern std::map<std::string, std::string> mapArgs;
extern std::map<std::string, std::vector<std::string> > mapMultiArgs;
extern bool fDebug;
extern bool fDebugMining;
extern bool fPrintToConsole;
extern bool fPrintToDebugLog;


int LogPrintf(const char* pszFormat, ...) ATTR_WARN_PRINTF(1,2);

std::string vstrprintf(const char* format, va_list ap);
std::string strprintf(const char* format, ...) ATTR_WARN_PRINTF(1,2);

// logs the message prefixed with "ERROR: " and returns false
bool error(const char* format, ...) ATTR_WARN_PRINTF(1,2);

void PrintException(std::exception* pex, const char* pszThread);
std::string FormatException(std::exception* pex, const char* pszThread);

void ParseParameters(int argc, const char* const argv[]);
void ReadConfigFile(std::map<std::string, std::string>& mapSettingsRet,
                    std::map<std::string, std::vector<std::string> >& mapMultiSettingsRet);
void ClearParameters();

const boost::filesystem::path& GetDataDir();
boost::filesystem::path GetConfigFile();
void ShrinkDebugFile();

int64_t GetTime();
int64_t GetTimeMillis();
void MilliSleep(int64_t n);
std::string DateTimeStrFormat(const char* pszFormat, int64_t nTime);

void RenameThread(const char* name);


inline std::string i64tostr(int64_t n)
{
    return strprintf("%" PRId64, n);
}

inline int64_t atoi64(const std::string& str)
{
    return strtoll(str.c_str(), NULL, 10);
}

/**
 * Return string argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. "1")
 * @return command-line argument or default value
 */
std::string GetArg(const std::string& strArg, const std::string& strDefault);

/**
 * Return integer argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (e.g. 1)
 * @return command-line argument (0 if invalid number) or default value
 */
int64_t GetArg(const std::string& strArg, int64_t nDefault);

/**
 * Return boolean argument or default value
 *
 * @param strArg Argument to get (e.g. "-foo")
 * @param default (true or false)
 * @return command-line argument or default value
 */
bool GetBoolArg(const std::string& strArg, bool fDefault=false);

#endif  // COSMO_UTIL_H
