// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "open_ssl.h"
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/ssl.h>

using namespace sshb;


static_assert(OPENSSL_VERSION_NUMBER >= 0x30000000L, "OpenSSL version is too old!");


namespace
{
std::string formatOpenSSLError(const char* functionName, unsigned long ec)
{
    char errorBuf[256] = {}; //== buffer size used by ERR_error_string(); err.c: it seems the message uses at most ~200 bytes
    ::ERR_error_string_n(ec, errorBuf, sizeof(errorBuf)); //includes null-termination

    return formatSystemError(functionName, replaceCpy(_("Error code %x"), "%x", numberTo<std::string>(ec)), errorBuf);
}


std::string formatLastOpenSSLError(const char* functionName)
{
    const auto ec = ::ERR_peek_last_error(); //"returns latest error code from the thread's error queue without modifying it" - unlike ERR_get_error()
    ::ERR_clear_error(); //clean up for next OpenSSL operation on this thread
    return formatOpenSSLError(functionName, ec);
}


const EVP_MD* getEvpType(DigestAlgorithm algo)
{
    switch (algo)
    {
        case DigestAlgorithm::sha1:
            return ::EVP_sha1();
        case DigestAlgorithm::sha224:
            return ::EVP_sha224();
        case DigestAlgorithm::sha256:
            return ::EVP_sha256();
        case DigestAlgorithm::sha384:
            return ::EVP_sha384();
        case DigestAlgorithm::sha512:
            return ::EVP_sha512();
    }
    throw SSHB_CONTRACT_VIOLATION();
}
}


void sshb::openSslInit()
{
    //official Wiki: https://wiki.openssl.org/index.php/Library_Initialization
    //explicitly init OpenSSL on main thread: libssh2 relies on it, too
    if (::OPENSSL_init_ssl(OPENSSL_INIT_SSL_DEFAULT | OPENSSL_INIT_NO_LOAD_CONFIG, nullptr) != 1)
        logExtraError(_("Error during process initialization.") + "\n\n" + formatLastOpenSSLError("OPENSSL_init_ssl"));
}


std::string sshb::getDigestName(DigestAlgorithm algo)
{
    switch (algo)
    {
        case DigestAlgorithm::sha1:
            return "SHA1";
        case DigestAlgorithm::sha224:
            return "SHA224";
        case DigestAlgorithm::sha256:
            return "SHA256";
        case DigestAlgorithm::sha384:
            return "SHA384";
        case DigestAlgorithm::sha512:
            return "SHA512";
    }
    throw SSHB_CONTRACT_VIOLATION();
}


std::string sshb::calculateDigest(std::string_view message, DigestAlgorithm algo) //throw SysError
{
    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    //https://www.openssl.org/docs/manmaster/man3/EVP_Digest.html
    if (::EVP_Digest(message.data(),  //const void* data
                     message.size(),  //size_t count
                     reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                     &bytesWritten,   //unsigned int* size
                     getEvpType(algo), //const EVP_MD* type
                     nullptr) != 1)   //ENGINE* impl
        throw SysError(formatLastOpenSSLError("EVP_Digest"));

    output.resize(bytesWritten);
    return output;
}


struct DigestCalculator::Impl
{
    EVP_MD_CTX* mdctx = nullptr;
    bool finalized = false;
};


DigestCalculator::DigestCalculator(DigestAlgorithm algo) : pimpl_(std::make_unique<Impl>()) //throw SysError
{
    pimpl_->mdctx = ::EVP_MD_CTX_new();
    if (!pimpl_->mdctx)
        throw SysError(formatSystemError("EVP_MD_CTX_new", "", "No more error details.")); //no more error details
    SSHB_ON_SCOPE_FAIL(::EVP_MD_CTX_free(pimpl_->mdctx));

    if (::EVP_DigestInit(pimpl_->mdctx,          //EVP_MD_CTX* ctx
                         getEvpType(algo)) != 1) //const EVP_MD* type
        throw SysError(formatLastOpenSSLError("EVP_DigestInit"));
}


DigestCalculator::~DigestCalculator() { ::EVP_MD_CTX_free(pimpl_->mdctx); }


void DigestCalculator::update(std::string_view block) //throw SysError
{
    if (pimpl_->finalized)
        throw SSHB_CONTRACT_VIOLATION();

    if (::EVP_DigestUpdate(pimpl_->mdctx,      //EVP_MD_CTX* ctx
                           block.data(),       //const void*
                           block.size()) != 1) //size_t cnt
        throw SysError(formatLastOpenSSLError("EVP_DigestUpdate"));
}


std::string DigestCalculator::finalize() //throw SysError
{
    if (pimpl_->finalized)
        throw SSHB_CONTRACT_VIOLATION();
    pimpl_->finalized = true;

    std::string output(EVP_MAX_MD_SIZE, '\0');
    unsigned int bytesWritten = 0;

    if (::EVP_DigestFinal_ex(pimpl_->mdctx,                                   //EVP_MD_CTX* ctx
                             reinterpret_cast<unsigned char*>(output.data()), //unsigned char* md
                             &bytesWritten) != 1)                             //unsigned int* s
        throw SysError(formatLastOpenSSLError("EVP_DigestFinal_ex"));

    output.resize(bytesWritten);
    return output;
}


std::string sshb::formatDigest(std::string_view digest, DigestAlgorithm algo)
{
    return getDigestName(algo) + ':' + formatAsHexString(digest);
}


std::string sshb::stringEncodeBase64(std::string_view str)
{
    std::string output(4 * ((str.size() + 2) / 3) + 1, '\0'); //+ null-termination

    //https://www.openssl.org/docs/manmaster/man3/EVP_EncodeBlock.html
    const int bytesWritten = ::EVP_EncodeBlock(reinterpret_cast<unsigned char*>(output.data()),    //unsigned char* t
                                               reinterpret_cast<const unsigned char*>(str.data()), //const unsigned char* f
                                               static_cast<int>(str.size()));                      //int n
    output.resize(bytesWritten);
    return output;
}


std::string sshb::stringDecodeBase64(std::string_view str) //throw SysError
{
    const std::string input = trimCpy(str);
    if (input.size() % 4 != 0)
        throw SysError(formatSystemError("EVP_DecodeBlock", "", _("Invalid base64 encoding.")));

    std::string output(3 * (input.size() / 4), '\0');

    const int bytesWritten = ::EVP_DecodeBlock(reinterpret_cast<unsigned char*>(output.data()),      //unsigned char* t
                                               reinterpret_cast<const unsigned char*>(input.data()), //const unsigned char* f
                                               static_cast<int>(input.size()));                      //int n
    if (bytesWritten < 0)
        throw SysError(formatLastOpenSSLError("EVP_DecodeBlock"));

    //EVP_DecodeBlock() keeps the zero bytes generated by padding
    size_t padding = 0;
    for (auto it = input.rbegin(); it != input.rend() && *it == '=' && padding < 2; ++it)
        ++padding;

    output.resize(bytesWritten - padding);
    return output;
}
