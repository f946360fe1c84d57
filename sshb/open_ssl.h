// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef OPEN_SSL_H_3389021745866120
#define OPEN_SSL_H_3389021745866120

#include <string_view>
#include "sys_error.h"


namespace sshb
{
//init OpenSSL before use!
void openSslInit();

enum class DigestAlgorithm
{
    sha1,
    sha224,
    sha256,
    sha384,
    sha512,
};

std::string getDigestName(DigestAlgorithm algo); //e.g. "SHA256"

//raw digest bytes
std::string calculateDigest(std::string_view message, DigestAlgorithm algo); //throw SysError

//hash a stream of unknown size block by block
class DigestCalculator
{
public:
    explicit DigestCalculator(DigestAlgorithm algo); //throw SysError
    ~DigestCalculator();

    void update(std::string_view block); //throw SysError
    std::string finalize(); //throw SysError; no update() afterwards!

private:
    DigestCalculator           (const DigestCalculator&) = delete;
    DigestCalculator& operator=(const DigestCalculator&) = delete;

    struct Impl;
    const std::unique_ptr<Impl> pimpl_;
};

//"SHA256:" + lower-case hex
std::string formatDigest(std::string_view digest, DigestAlgorithm algo);

//MIME base64 without line breaks
std::string stringEncodeBase64(std::string_view str);
std::string stringDecodeBase64(std::string_view str); //throw SysError
}

#endif //OPEN_SSL_H_3389021745866120
