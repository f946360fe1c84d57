// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "file_attributes.h"
#include <sshb/i18n.h>

using namespace sshb;


namespace
{
std::string formatTimeStamp(time_t t)
{
    std::tm utcTime = {};
    if (!::gmtime_r(&t, &utcTime))
        return numberTo<std::string>(t);

    char buffer[32] = {};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S UTC", &utcTime);
    return buffer;
}
}


std::string sshb::formatPermissions(uint32_t mode)
{
    std::string output(10, '-');

    switch (mode & SFTP_MODE_TYPE_MASK)
    {
        case SFTP_MODE_DIRECTORY:
            output[0] = 'd';
            break;
        case SFTP_MODE_SYMLINK:
            output[0] = 'l';
            break;
        case SFTP_MODE_REGULAR:
        default:
            break;
    }

    const char* const rwx = "rwxrwxrwx";
    for (int i = 0; i < 9; ++i)
        if (mode & (0400 >> i))
            output[i + 1] = rwx[i];

    if (mode & 04000) output[3] = (mode & 0100) ? 's' : 'S'; //set-user-ID
    if (mode & 02000) output[6] = (mode & 0010) ? 's' : 'S'; //set-group-ID
    if (mode & 01000) output[9] = (mode & 0001) ? 't' : 'T'; //sticky

    return output;
}


std::string sshb::formatFileAttributes(const FileAttributes& attr)
{
    std::string output;
    const auto addLine = [&](const std::string& label, const std::string& value) { output += label + ": " + value + '\n'; };

    if (attr.fileSize)
        addLine(_("Size"), _P("1 byte", "%x bytes", *attr.fileSize));
    if (attr.permissions)
        addLine(_("Permissions"), formatPermissions(*attr.permissions) + " (" + printNumber("%04o", *attr.permissions & SFTP_MODE_PERM_MASK) + ')');
    if (attr.uid)
        addLine(_("Owner"), numberTo<std::string>(*attr.uid));
    if (attr.gid)
        addLine(_("Group"), numberTo<std::string>(*attr.gid));
    if (attr.accessTime)
        addLine(_("Last access"), formatTimeStamp(*attr.accessTime));
    if (attr.modTime)
        addLine(_("Last modified"), formatTimeStamp(*attr.modTime));

    return output;
}
