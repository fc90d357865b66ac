// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "connection.h"
#include "ftp_common.h"

using namespace ferry;


namespace
{
const char ftpPrefix [] = "ftp:";
const char sftpPrefix[] = "sftp:";


std::string getSchemePrefix(Protocol protocol)
{
    switch (protocol)
    {
        case Protocol::ftp:
            return ftpPrefix;
        case Protocol::sftp:
            return sftpPrefix;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::string getServerPort(const ConnectionDescriptor& conn)
{
    std::string serverPort = conn.getHost();
    if (conn.getPort() > 0 && conn.getPort() != getDefaultPort(conn.getProtocol()))
        serverPort += ':' + numberTo<std::string>(conn.getPort());
    return serverPort;
}
}


ConnectionDescriptor::ConnectionDescriptor(Protocol protocol, const std::string& host, int port,
                                           const std::string& username, const Credential& secret) : //throw ErrorInvalidArgument
    protocol_(protocol),
    host_(host),
    port_(port),
    username_(username),
    secret_(secret)
{
    if (trimCpy(host_).empty())
        throw ErrorInvalidArgument(_("Server name must not be empty."));

    if (port_ < 0 || port_ > 65535)
        throw ErrorInvalidArgument(replaceCpy(_("Invalid port number %x."), L"%x", numberTo<std::wstring>(port_)));
}


bool ConnectionDescriptor::operator==(const ConnectionDescriptor& other) const
{
    return protocol_    == other.protocol_ &&
           host_        == other.host_     &&
           getEffectivePort(*this) == getEffectivePort(other) &&
           username_    == other.username_ &&
           secret_      == other.secret_   &&
           workingPath_ == other.workingPath_ &&
           options      == other.options;
}


int ferry::getDefaultPort(Protocol protocol)
{
    switch (protocol)
    {
        case Protocol::ftp:
            return DEFAULT_PORT_FTP;
        case Protocol::sftp:
            return DEFAULT_PORT_SFTP;
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


int ferry::getEffectivePort(const ConnectionDescriptor& conn)
{
    if (conn.getPort() > 0)
        return conn.getPort();
    return getDefaultPort(conn.getProtocol());
}


std::wstring ferry::getProtocolName(Protocol protocol)
{
    switch (protocol)
    {
        case Protocol::ftp:
            return L"FTP";
        case Protocol::sftp:
            return L"SFTP";
    }
    throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
}


std::wstring ferry::getDisplayPath(const ConnectionDescriptor& conn, const std::string& itemName)
{
    std::string displayPath = getSchemePrefix(conn.getProtocol()) + "//";

    if (!conn.getUsername().empty()) //show username, but never the password!
        displayPath += conn.getUsername() + '@';

    displayPath += getServerPort(conn);

    split(conn.getWorkingPath(), '/', [&](std::string_view comp)
    {
        if (!comp.empty())
            displayPath += '/' + std::string(comp);
    });

    if (!itemName.empty())
        displayPath += '/' + itemName;

    return utfTo<std::wstring>(displayPath);
}


ConnectionDescriptor ferry::parseConnectionPhrase(std::string_view phrase) //throw ErrorInvalidArgument
{
    std::string pathPhrase = trimCpy(std::string(phrase));

    Protocol protocol = Protocol::ftp;
    if (startsWithAsciiNoCase(pathPhrase, ftpPrefix))
        pathPhrase = pathPhrase.substr(std::string_view(ftpPrefix).size());
    else if (startsWithAsciiNoCase(pathPhrase, sftpPrefix))
    {
        protocol = Protocol::sftp;
        pathPhrase = pathPhrase.substr(std::string_view(sftpPrefix).size());
    }
    else
        throw ErrorInvalidArgument(replaceCpy(_("Invalid connection phrase %x."), L"%x", fmtPath(utfTo<std::wstring>(phrase))),
                                   _("Expected prefix \"ftp://\" or \"sftp://\"."));

    if (!startsWith(pathPhrase, "//"))
        throw ErrorInvalidArgument(replaceCpy(_("Invalid connection phrase %x."), L"%x", fmtPath(utfTo<std::wstring>(phrase))),
                                   _("Expected prefix \"ftp://\" or \"sftp://\"."));
    pathPhrase = pathPhrase.substr(2);

    const std::string fullPathOpt = beforeFirst(pathPhrase, '|', IfNotFoundReturn::all);
    const std::string options     =  afterFirst(pathPhrase, '|', IfNotFoundReturn::none);

    //credentials end at the last '@' before the path: '@' inside the path is legal
    const std::string authority = beforeFirst(fullPathOpt, '/', IfNotFoundReturn::all);
    const std::string path      = decodeUriComponent(afterFirst(fullPathOpt, '/', IfNotFoundReturn::none));

    const std::string credentials = beforeLast(authority, '@', IfNotFoundReturn::none);
    const std::string serverPort  =  afterLast(authority, '@', IfNotFoundReturn::all);

    const std::string username = decodeUriComponent(beforeFirst(credentials, ':', IfNotFoundReturn::all));
    std::string       password = decodeUriComponent(afterFirst(credentials, ':', IfNotFoundReturn::none));

    const std::string server = beforeLast(serverPort, ':', IfNotFoundReturn::all);
    const std::string port   =  afterLast(serverPort, ':', IfNotFoundReturn::none);

    if (!port.empty() && (!std::all_of(port.begin(), port.end(), [](char c) { return isDigit(c); }) || port.size() > 5))
        throw ErrorInvalidArgument(replaceCpy(_("Invalid port number %x."), L"%x", utfTo<std::wstring>(port)));

    TransportOptions transportOptions;
    split(options, '|', [&](std::string_view optPhrase)
    {
        const std::string opt = trimCpy(std::string(optPhrase));
        if (!opt.empty())
        {
            if (startsWith(opt, "timeout="))
                transportOptions.timeoutSec = stringTo<int>(afterFirst(opt, '=', IfNotFoundReturn::none));
            else if (opt == "ssl")
                transportOptions.useTls = true;
            else if (opt == "zlib")
                transportOptions.allowZlib = true;
            else if (startsWith(opt, "pass64="))
                password = decodePasswordBase64(afterFirst(opt, '=', IfNotFoundReturn::none)); //takes precedence over inline password
            else
                logExtraWarning(replaceCpy(_("Unknown connection option %x."), L"%x", fmtPath(utfTo<std::wstring>(opt))));
        }
    });

    if (transportOptions.timeoutSec <= 0)
        transportOptions.timeoutSec = DEFAULT_TIMEOUT_SEC;

    ConnectionDescriptor conn(protocol, server, stringTo<int>(port), username, Credential(password)); //throw ErrorInvalidArgument
    conn.setWorkingPath(path);
    conn.options = transportOptions;
    return conn;
}


std::string ferry::formatConnectionPhrase(const ConnectionDescriptor& conn)
{
    std::string username;
    if (!conn.getUsername().empty())
        username = encodeFtpUsername(conn.getUsername()) + '@';

    std::string relPath;
    if (!conn.getWorkingPath().empty())
        relPath = '/' + encodeFtpPath(conn.getWorkingPath());

    std::string options;
    if (conn.options.timeoutSec != TransportOptions().timeoutSec)
        options += "|timeout=" + numberTo<std::string>(conn.options.timeoutSec);

    if (conn.options.useTls)
        options += "|ssl";

    if (conn.options.allowZlib)
        options += "|zlib";

    if (const std::string password = conn.getSecret().plainText();
        !password.empty()) //password always last => visually truncated by input fields
        options += "|pass64=" + encodePasswordBase64(password);

    return getSchemePrefix(conn.getProtocol()) + "//" + username + getServerPort(conn) + relPath + options;
}
