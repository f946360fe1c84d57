// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef FILE_ATTRIBUTES_H_2395018764431095
#define FILE_ATTRIBUTES_H_2395018764431095

#include <cstdint>
#include <ctime>
#include <optional>
#include <string>


namespace sshb
{
//permission bits are masked by the server's umask
const long SFTP_DEFAULT_PERMISSION_FILE   = 0666; //S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH
const long SFTP_DEFAULT_PERMISSION_FOLDER = 0777; //S_IRWXU | S_IRWXG | S_IRWXO

//mode bits: same values as POSIX <sys/stat.h>, independent from the local platform
const uint32_t SFTP_MODE_TYPE_MASK = 0170000;
const uint32_t SFTP_MODE_DIRECTORY = 0040000;
const uint32_t SFTP_MODE_REGULAR   = 0100000;
const uint32_t SFTP_MODE_SYMLINK   = 0120000;
const uint32_t SFTP_MODE_PERM_MASK = 07777;


//snapshot of a remote object's metadata: each member is only set if reported by the server
struct FileAttributes
{
    std::optional<uint64_t> fileSize;
    std::optional<uint32_t> uid;
    std::optional<uint32_t> gid;
    std::optional<uint32_t> permissions; //including file type bits
    std::optional<time_t>   accessTime;
    std::optional<time_t>   modTime;

    bool isDirectory  () const { return permissions && (*permissions & SFTP_MODE_TYPE_MASK) == SFTP_MODE_DIRECTORY; }
    bool isRegularFile() const { return permissions && (*permissions & SFTP_MODE_TYPE_MASK) == SFTP_MODE_REGULAR; }
    bool isSymlink    () const { return permissions && (*permissions & SFTP_MODE_TYPE_MASK) == SFTP_MODE_SYMLINK; }

    bool operator==(const FileAttributes&) const = default;
};


struct DirEntry
{
    std::string name;
    std::string longEntry; //"ls -l"-style rendering by the server
    FileAttributes attributes;
};


//"statvfs@openssh.com" reply
struct FsStats
{
    uint64_t blockSize         = 0; //f_bsize: file system block size
    uint64_t fragmentSize      = 0; //f_frsize: fundamental block size
    uint64_t blocks            = 0; //f_blocks: size of fs in f_frsize units
    uint64_t blocksFree        = 0; //f_bfree
    uint64_t blocksAvailable   = 0; //f_bavail: free blocks for non-root
    uint64_t inodes            = 0; //f_files
    uint64_t inodesFree        = 0; //f_ffree
    uint64_t inodesAvailable   = 0; //f_favail
    uint64_t fileSystemId      = 0; //f_fsid
    uint64_t mountFlags        = 0; //f_flag: SSH_FXE_STATVFS_ST_RDONLY, SSH_FXE_STATVFS_ST_NOSUID
    uint64_t maxNameLength     = 0; //f_namemax

    uint64_t getTotalBytes    () const { return blocks          * fragmentSize; }
    uint64_t getFreeBytes     () const { return blocksFree      * fragmentSize; }
    uint64_t getAvailableBytes() const { return blocksAvailable * fragmentSize; }
    bool     isReadOnly       () const { return (mountFlags & 0x1) != 0; }
};


std::string formatPermissions(uint32_t mode); //"drwxr-xr-x"
std::string formatFileAttributes(const FileAttributes& attr); //human-readable multi-line summary
}

#endif //FILE_ATTRIBUTES_H_2395018764431095
