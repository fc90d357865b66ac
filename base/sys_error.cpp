// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sys_error.h"

using namespace ferry;


namespace
{
std::wstring formatSystemErrorCode(ErrorCode ec)
{
    switch (ec)
    {
            //local files
            FERRY_CHECK_CASE_FOR_CONSTANT(EPERM);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EIO);
            FERRY_CHECK_CASE_FOR_CONSTANT(EBADF);
            FERRY_CHECK_CASE_FOR_CONSTANT(EACCES);
            FERRY_CHECK_CASE_FOR_CONSTANT(EBUSY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EEXIST);
            FERRY_CHECK_CASE_FOR_CONSTANT(EXDEV);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTDIR);
            FERRY_CHECK_CASE_FOR_CONSTANT(EISDIR);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EMFILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EFBIG);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOSPC);
            FERRY_CHECK_CASE_FOR_CONSTANT(EROFS);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENAMETOOLONG);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTEMPTY);
            FERRY_CHECK_CASE_FOR_CONSTANT(ELOOP);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESTALE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EDQUOT);

            //sockets
            FERRY_CHECK_CASE_FOR_CONSTANT(EPIPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTSOCK);
            FERRY_CHECK_CASE_FOR_CONSTANT(EMSGSIZE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EPROTO);
            FERRY_CHECK_CASE_FOR_CONSTANT(EPROTONOSUPPORT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAFNOSUPPORT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EADDRINUSE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EADDRNOTAVAIL);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETUNREACH);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENETRESET);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNABORTED);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNRESET);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECONNREFUSED);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOBUFS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EISCONN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTCONN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ESHUTDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ETIMEDOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EHOSTDOWN);
            FERRY_CHECK_CASE_FOR_CONSTANT(EHOSTUNREACH);
            FERRY_CHECK_CASE_FOR_CONSTANT(EALREADY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EINPROGRESS);

            //either
            FERRY_CHECK_CASE_FOR_CONSTANT(EINTR);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOMEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(EFAULT);
            FERRY_CHECK_CASE_FOR_CONSTANT(EINVAL);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOSYS);
            FERRY_CHECK_CASE_FOR_CONSTANT(ENOTSUP);
            FERRY_CHECK_CASE_FOR_CONSTANT(ECANCELED);
            FERRY_CHECK_CASE_FOR_CONSTANT(EILSEQ);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}


std::wstring formatGlibConvertErrorCode(int ec)
{
    switch (ec)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_NO_CONVERSION);
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_ILLEGAL_SEQUENCE);
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_PARTIAL_INPUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_BAD_URI);
            FERRY_CHECK_CASE_FOR_CONSTANT(G_CONVERT_ERROR_NOT_ABSOLUTE_PATH);
        default:
            return replaceCpy<std::wstring>(L"GConvert error %x", L"%x", numberTo<std::wstring>(ec));
    }
}
}


//only g_convert() reports a GError in Ferry; other domains show as "<domain> <code>"
std::wstring ferry::formatGlibError(const std::string& functionName, GError* error)
{
    if (!error)
        return formatSystemError(functionName, L"", _("Error description not available.") + L" null GError");

    const std::wstring errorMsg = utfTo<std::wstring>(error->message ? error->message : "");

    if (error->domain == G_CONVERT_ERROR)
        return formatSystemError(functionName, formatGlibConvertErrorCode(error->code), errorMsg);

    if (error->domain == G_FILE_ERROR) //"values corresponding to errno codes"
        return formatSystemError(functionName, error->code);

    std::wstring domain = utfTo<std::wstring>(::g_quark_to_string(error->domain)); //e.g. "g-convert-error-quark"
    if (endsWith(domain, L"-quark"))
        domain = beforeLast(domain, L"-", IfNotFoundReturn::none);

    return formatSystemError(functionName, domain + L' ' + numberTo<std::wstring>(error->code), errorMsg);
}


std::wstring ferry::getSystemErrorDescription(ErrorCode ec) //return empty string on error
{
    const ErrorCode ecCurrent = getLastError(); //not necessarily == ec
    FERRY_ON_SCOPE_EXIT(errno = ecCurrent);

    std::wstring errorMsg = utfTo<std::wstring>(::g_strerror(ec)); //thread-safe, unlike strerror()
    trim(errorMsg);
    return errorMsg;
}


std::wstring ferry::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatSystemErrorCode(ec), getSystemErrorDescription(ec));
}


std::wstring ferry::formatSystemError(const std::string& functionName, const std::wstring& errorCode, const std::wstring& errorMsg)
{
    std::wstring output = trimCpy(errorCode);

    const std::wstring errorMsgFmt = trimCpy(errorMsg);
    if (!output.empty() && !errorMsgFmt.empty())
        output += L": ";

    output += errorMsgFmt;

    if (!functionName.empty())
        output += L" [" + utfTo<std::wstring>(functionName) + L']';

    return trimCpy(output);
}
