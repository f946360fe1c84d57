// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ERROR_H_4471903826510983
#define FILE_ERROR_H_4471903826510983

#include "sys_error.h" //we'll need this later anyway!


namespace sshb
{
class FileError //A high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::string& msg) : msg_(msg) {}
    FileError(const std::string& msg, const std::string& details) : msg_(msg + "\n\n" + details) {}
    virtual ~FileError() {}

    const std::string& toString() const { return msg_; }

private:
    std::string msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public sshb::FileError { X(const std::string& msg) : FileError(msg) {} X(const std::string& msg, const std::string& descr) : FileError(msg, descr) {} };


//CAVEAT: errno is easily overwritten => evaluate *before* making any (indirect) system calls
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const sshb::ErrorCode ecInternal = sshb::getLastError(); throw sshb::FileError(msg, sshb::formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::string for error messages --------------------

inline std::string fmtPath(const std::string& displayPath) { return '"' + displayPath + '"'; }
inline std::string fmtPath(const char* displayPath) { return fmtPath(std::string(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_4471903826510983
